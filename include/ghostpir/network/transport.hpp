#pragma once

#include "ghostpir/core/config.hpp"
#include "ghostpir/core/types.hpp"
#include "ghostpir/network/http.hpp"
#include <memory>
#include <string>

namespace ghostpir::retrieval {
class RetrievalObserver;
}

namespace ghostpir::network {

// ============================================================================
// Transport Interface
// ============================================================================

/// The three collaborator calls the retrieval engine depends on.
/// Implementations throw NetworkError (or a subtype) on any failure and
/// ProtocolError on malformed bodies.
class PirTransport {
public:
    virtual ~PirTransport() = default;

    /// POST /session
    virtual std::string create_session(const std::string& ghost_id) = 0;

    /// GET /catalog
    virtual Catalog fetch_catalog() = 0;

    /// POST /kpir. Consumes the vector set.
    virtual ChunkResponse query(const std::string& token,
                                QueryVectorSet vectors,
                                size_t chunk_index) = 0;
};

// ============================================================================
// HTTP Transport
// ============================================================================

/// PirTransport over HTTP/1.1 with JSON bodies
class HttpPirTransport : public PirTransport {
private:
    HttpClient client_;
    size_t chunk_size_;
    std::shared_ptr<retrieval::RetrievalObserver> observer_;

public:
    explicit HttpPirTransport(const ClientConfig& config,
                              std::shared_ptr<retrieval::RetrievalObserver> observer = nullptr);

    std::string create_session(const std::string& ghost_id) override;
    Catalog fetch_catalog() override;
    ChunkResponse query(const std::string& token,
                        QueryVectorSet vectors,
                        size_t chunk_index) override;

    const HttpClient& client() const { return client_; }

private:
    /// Send and report traffic; throws for non-2xx
    HttpResponse exchange(const std::string& endpoint,
                          const HttpRequest& request,
                          std::optional<size_t> chunk_index);
};

} // namespace ghostpir::network
