#pragma once

#include "ghostpir/core/types.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ghostpir::network {

namespace beast = boost::beast;
namespace http = boost::beast::http;

using StringRequest = http::request<http::string_body>;
using StringResponse = http::response<http::string_body>;

// ============================================================================
// Network Exceptions
// ============================================================================

/// Any failed exchange with a collaborator service.
/// status is the HTTP status, or 0 when no response was received.
class NetworkError : public GhostPirError {
private:
    std::string endpoint_;
    int status_;
    std::optional<size_t> chunk_index_;

public:
    explicit NetworkError(const std::string& msg,
                          std::string endpoint = "",
                          int status = 0,
                          std::optional<size_t> chunk_index = std::nullopt)
        : GhostPirError(msg), endpoint_(std::move(endpoint)),
          status_(status), chunk_index_(chunk_index) {}

    const std::string& endpoint() const { return endpoint_; }
    int status() const { return status_; }
    const std::optional<size_t>& chunk_index() const { return chunk_index_; }

    /// Attach request context to an error raised below the request layer
    void annotate(const std::string& endpoint, std::optional<size_t> chunk_index) {
        if (endpoint_.empty()) endpoint_ = endpoint;
        if (!chunk_index_) chunk_index_ = chunk_index;
    }
};

class ConnectionError : public NetworkError {
public:
    explicit ConnectionError(const std::string& msg) : NetworkError(msg) {}
};

class SendError : public NetworkError {
public:
    explicit SendError(const std::string& msg) : NetworkError(msg) {}
};

class ReceiveError : public NetworkError {
public:
    explicit ReceiveError(const std::string& msg) : NetworkError(msg) {}
};

/// Non-success HTTP status
class HttpError : public NetworkError {
public:
    HttpError(const std::string& endpoint, int status, std::optional<size_t> chunk_index)
        : NetworkError(endpoint + " failed: HTTP " + std::to_string(status) +
                       (chunk_index ? " on chunk " + std::to_string(*chunk_index) : ""),
                       endpoint, status, chunk_index) {}
};

/// Token rejected by the responder despite proactive refresh
class SessionExpired : public NetworkError {
public:
    SessionExpired(const std::string& endpoint, int status, std::optional<size_t> chunk_index)
        : NetworkError("Session rejected by " + endpoint + " (HTTP " +
                       std::to_string(status) + ")", endpoint, status, chunk_index) {}
};

// ============================================================================
// TCP Connection
// ============================================================================

/// One HTTP/1.1 exchange stream. Every operation runs against a deadline of
/// `timeout` (zero disables it); expiry surfaces as the operation's error type.
class TCPConnection {
private:
    boost::asio::io_context ioc_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::chrono::milliseconds timeout_;
    bool connected_;

    // Statistics
    size_t bytes_sent_;
    size_t bytes_received_;

public:
    explicit TCPConnection(std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
    ~TCPConnection();

    TCPConnection(const TCPConnection&) = delete;
    TCPConnection& operator=(const TCPConnection&) = delete;

    /// Resolve host and connect. Throws ConnectionError
    void connect(const std::string& host, uint16_t port);

    /// Serialize a request. Throws SendError
    void send(StringRequest& request);

    /// Read one response, any framing. Throws ReceiveError
    StringResponse receive(size_t body_limit);

    void close();

    bool is_connected() const { return connected_; }

    // Statistics
    size_t bytes_sent() const { return bytes_sent_; }
    size_t bytes_received() const { return bytes_received_; }

private:
    void arm_deadline();

    /// Drive the pending operation to completion
    void run_pending();
};

} // namespace ghostpir::network
