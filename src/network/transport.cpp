#include "ghostpir/network/transport.hpp"
#include "ghostpir/network/message.hpp"
#include "ghostpir/retrieval/observer.hpp"
#include <chrono>

namespace ghostpir::network {

namespace {

retrieval::TrafficCategory category_for(const std::string& endpoint) {
    if (endpoint == "/kpir") return retrieval::TrafficCategory::PIR;
    if (endpoint == "/session") return retrieval::TrafficCategory::Auth;
    if (endpoint == "/catalog") return retrieval::TrafficCategory::Catalog;
    return retrieval::TrafficCategory::Other;
}

} // anonymous namespace

// ============================================================================
// HttpPirTransport Implementation
// ============================================================================

HttpPirTransport::HttpPirTransport(const ClientConfig& config,
                                   std::shared_ptr<retrieval::RetrievalObserver> observer)
    : client_(Endpoint::parse(config.base_url), config.io_timeout, config.verbose),
      chunk_size_(config.chunk_size),
      observer_(std::move(observer)) {}

HttpResponse HttpPirTransport::exchange(const std::string& endpoint,
                                        const HttpRequest& request,
                                        std::optional<size_t> chunk_index) {
    size_t sent_before = client_.bytes_sent();
    size_t received_before = client_.bytes_received();
    auto start = std::chrono::steady_clock::now();

    HttpResponse response;
    try {
        response = client_.send(request);
    } catch (NetworkError& e) {
        e.annotate(endpoint, chunk_index);
        throw;
    }

    if (observer_) {
        retrieval::TrafficEvent event;
        event.category = category_for(endpoint);
        event.method = request.method;
        event.path = request.path;
        event.request_bytes = client_.bytes_sent() - sent_before;
        event.response_bytes = client_.bytes_received() - received_before;
        event.status = response.status;
        event.duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start);
        observer_->on_traffic(event);
    }

    if (!response.ok()) {
        if (endpoint == "/kpir" && (response.status == 401 || response.status == 403)) {
            throw SessionExpired(endpoint, response.status, chunk_index);
        }
        throw HttpError(endpoint, response.status, chunk_index);
    }

    return response;
}

std::string HttpPirTransport::create_session(const std::string& ghost_id) {
    HttpRequest request;
    request.method = "POST";
    request.path = "/session";
    request.headers["Content-Type"] = "application/json";
    request.body = SessionRequestMessage{ghost_id}.to_json();

    auto response = exchange("/session", request, std::nullopt);
    return SessionResponseMessage::from_json(response.body).token;
}

Catalog HttpPirTransport::fetch_catalog() {
    HttpRequest request;
    request.method = "GET";
    request.path = "/catalog";
    request.headers["Accept"] = "application/json";

    auto response = exchange("/catalog", request, std::nullopt);
    return CatalogMessage::from_json(response.body).catalog;
}

ChunkResponse HttpPirTransport::query(const std::string& token,
                                      QueryVectorSet vectors,
                                      size_t chunk_index) {
    HttpRequest request;
    request.method = "POST";
    request.path = "/kpir";
    request.headers["Content-Type"] = "application/json";
    request.body = KpirRequestMessage(token, vectors, chunk_index).to_json();

    auto response = exchange("/kpir", request, chunk_index);
    return KpirResponseMessage::from_json(response.body, chunk_size_).response;
}

} // namespace ghostpir::network
