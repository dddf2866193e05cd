#include "ghostpir/network/http.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace ghostpir::network {

namespace {

constexpr size_t kMaxResponseBytes = 256u * 1024 * 1024;

std::string as_string(beast::string_view view) {
    return std::string(view.data(), view.size());
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template <bool IsRequest>
std::map<std::string, std::string> collect_headers(const http::header<IsRequest>& header) {
    std::map<std::string, std::string> headers;
    for (const auto& field : header) {
        headers[to_lower(as_string(field.name_string()))] = as_string(field.value());
    }
    return headers;
}

} // anonymous namespace

// ============================================================================
// Beast Message Conversion
// ============================================================================

StringRequest to_wire(const HttpRequest& request, const Endpoint& endpoint) {
    http::verb verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw SendError("Unsupported HTTP method: " + request.method);
    }

    StringRequest message{verb, request.path, 11};
    message.set(http::field::host, endpoint.host + ":" + std::to_string(endpoint.port));
    message.set(http::field::user_agent, "ghostpir/0.1");
    for (const auto& [name, value] : request.headers) {
        message.set(name, value);
    }
    message.keep_alive(false);
    message.body() = request.body;
    message.prepare_payload();
    return message;
}

StringResponse to_wire(const HttpResponse& response) {
    StringResponse message{static_cast<http::status>(response.status), 11};
    if (!response.reason.empty()) {
        message.reason(response.reason);
    }
    for (const auto& [name, value] : response.headers) {
        message.set(name, value);
    }
    message.keep_alive(false);
    message.body() = response.body;
    message.prepare_payload();
    return message;
}

HttpRequest from_wire(StringRequest message) {
    HttpRequest request;
    request.method = as_string(message.method_string());
    request.path = as_string(message.target());
    request.headers = collect_headers(message.base());
    request.body = std::move(message.body());
    return request;
}

HttpResponse from_wire(StringResponse message) {
    HttpResponse response;
    response.status = static_cast<int>(message.result_int());
    response.reason = as_string(message.reason());
    response.headers = collect_headers(message.base());
    response.body = std::move(message.body());
    return response;
}

// ============================================================================
// HttpClient Implementation
// ============================================================================

HttpClient::HttpClient(Endpoint endpoint, std::chrono::milliseconds timeout, bool verbose)
    : endpoint_(std::move(endpoint)), timeout_(timeout), verbose_(verbose),
      bytes_sent_(0), bytes_received_(0) {}

HttpResponse HttpClient::send(const HttpRequest& request) {
    StringRequest message = to_wire(request, endpoint_);

    TCPConnection conn(timeout_);
    conn.connect(endpoint_.host, endpoint_.port);
    conn.send(message);
    HttpResponse response = from_wire(conn.receive(kMaxResponseBytes));

    bytes_sent_ += conn.bytes_sent();
    bytes_received_ += conn.bytes_received();
    conn.close();

    if (verbose_) {
        std::cout << "[http] " << request.method << " " << request.path
                  << " -> " << response.status
                  << " (" << response.body.size() << " bytes)" << std::endl;
    }

    return response;
}

} // namespace ghostpir::network
