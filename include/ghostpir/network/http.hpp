#pragma once

#include "ghostpir/core/config.hpp"
#include "ghostpir/network/connection.hpp"
#include <chrono>
#include <map>
#include <string>

namespace ghostpir::network {

// ============================================================================
// HTTP/1.1 Messages
// ============================================================================

struct HttpRequest {
    std::string method;                         ///< GET or POST
    std::string path;                           ///< e.g. /kpir
    std::map<std::string, std::string> headers; ///< Lower-case names when parsed
    std::string body;
};

struct HttpResponse {
    int status = 0;
    std::string reason;
    std::map<std::string, std::string> headers; ///< Lower-case names
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// ============================================================================
// Beast Message Conversion
// ============================================================================

/// Beast request with Host, Content-Length and Connection: close set.
/// Throws SendError for an unknown method.
StringRequest to_wire(const HttpRequest& request, const Endpoint& endpoint);

/// Beast response framed by Content-Length
StringResponse to_wire(const HttpResponse& response);

/// Header names are lower-cased
HttpRequest from_wire(StringRequest message);
HttpResponse from_wire(StringResponse message);

// ============================================================================
// HTTP Client
// ============================================================================

/// One-request-per-connection HTTP client
class HttpClient {
private:
    Endpoint endpoint_;
    std::chrono::milliseconds timeout_;
    bool verbose_;

    // Statistics
    size_t bytes_sent_;
    size_t bytes_received_;

public:
    HttpClient(Endpoint endpoint, std::chrono::milliseconds timeout, bool verbose = false);

    /// Perform one exchange. Throws ConnectionError/SendError/ReceiveError;
    /// a non-2xx status is returned, not thrown.
    HttpResponse send(const HttpRequest& request);

    const Endpoint& endpoint() const { return endpoint_; }

    // Statistics
    size_t bytes_sent() const { return bytes_sent_; }
    size_t bytes_received() const { return bytes_received_; }
};

} // namespace ghostpir::network
