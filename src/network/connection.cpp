#include "ghostpir/network/connection.hpp"
#include <boost/asio/ip/tcp.hpp>

namespace ghostpir::network {

using tcp = boost::asio::ip::tcp;

namespace {

std::string describe(const beast::error_code& ec) {
    if (ec == beast::error::timeout) {
        return "timed out";
    }
    return ec.message();
}

} // anonymous namespace

// ============================================================================
// TCPConnection Implementation
// ============================================================================

TCPConnection::TCPConnection(std::chrono::milliseconds timeout)
    : stream_(ioc_), timeout_(timeout), connected_(false),
      bytes_sent_(0), bytes_received_(0) {}

TCPConnection::~TCPConnection() {
    close();
}

void TCPConnection::arm_deadline() {
    if (timeout_.count() > 0) {
        stream_.expires_after(timeout_);
    } else {
        stream_.expires_never();
    }
}

void TCPConnection::run_pending() {
    ioc_.restart();
    ioc_.run();
}

void TCPConnection::connect(const std::string& host, uint16_t port) {
    if (connected_) {
        throw ConnectionError("Already connected");
    }

    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw ConnectionError("Cannot resolve " + host + ": " + ec.message());
    }

    // Deadline covers the handshake
    arm_deadline();
    stream_.async_connect(results, [&ec](beast::error_code result, const tcp::endpoint&) {
        ec = result;
    });
    run_pending();

    if (ec) {
        stream_.close();
        throw ConnectionError("Failed to connect to " + host + ":" + std::to_string(port) +
                              " - " + describe(ec));
    }

    stream_.socket().set_option(tcp::no_delay(true), ec);
    if (ec) {
        stream_.close();
        throw ConnectionError("Failed to set TCP_NODELAY: " + ec.message());
    }

    connected_ = true;
}

void TCPConnection::send(StringRequest& request) {
    if (!connected_) {
        throw SendError("Not connected");
    }

    beast::error_code ec;
    size_t written = 0;
    arm_deadline();
    http::async_write(stream_, request, [&](beast::error_code result, size_t n) {
        ec = result;
        written = n;
    });
    run_pending();

    if (ec) {
        throw SendError("Send failed: " + describe(ec));
    }
    bytes_sent_ += written;
}

StringResponse TCPConnection::receive(size_t body_limit) {
    if (!connected_) {
        throw ReceiveError("Not connected");
    }

    http::response_parser<http::string_body> parser;
    parser.body_limit(body_limit);

    beast::error_code ec;
    size_t consumed = 0;
    arm_deadline();
    http::async_read(stream_, buffer_, parser, [&](beast::error_code result, size_t n) {
        ec = result;
        consumed = n;
    });
    run_pending();

    if (ec == http::error::body_limit) {
        throw ReceiveError("HTTP response exceeds " + std::to_string(body_limit) + " bytes");
    }
    if (ec) {
        throw ReceiveError("Receive failed: " + describe(ec));
    }

    bytes_received_ += consumed;
    return parser.release();
}

void TCPConnection::close() {
    if (connected_) {
        // The peer may already have closed; shutdown errors carry no information
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        connected_ = false;
    }
    stream_.close();
}

} // namespace ghostpir::network
