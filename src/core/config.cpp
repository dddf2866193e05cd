#include "ghostpir/core/config.hpp"
#include <cstdlib>
#include <limits>

namespace ghostpir {

// ============================================================================
// Endpoint Implementation
// ============================================================================

Endpoint Endpoint::parse(const std::string& url) {
    std::string rest = url;

    const std::string http_scheme = "http://";
    if (rest.rfind("https://", 0) == 0) {
        throw ConfigError("TLS endpoints are not supported: " + url);
    }
    if (rest.rfind(http_scheme, 0) == 0) {
        rest = rest.substr(http_scheme.size());
    }

    // Drop any path component
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }

    if (rest.empty()) {
        throw ConfigError("Empty host in base URL: " + url);
    }

    Endpoint ep;
    auto colon = rest.rfind(':');
    if (colon == std::string::npos) {
        ep.host = rest;
        return ep;
    }

    ep.host = rest.substr(0, colon);
    std::string port_str = rest.substr(colon + 1);
    if (ep.host.empty() || port_str.empty()) {
        throw ConfigError("Malformed base URL: " + url);
    }

    unsigned long port = 0;
    for (char c : port_str) {
        if (c < '0' || c > '9') {
            throw ConfigError("Invalid port in base URL: " + url);
        }
        port = port * 10 + static_cast<unsigned long>(c - '0');
        if (port > std::numeric_limits<uint16_t>::max()) {
            throw ConfigError("Port out of range in base URL: " + url);
        }
    }
    if (port == 0) {
        throw ConfigError("Port out of range in base URL: " + url);
    }

    ep.port = static_cast<uint16_t>(port);
    return ep;
}

std::string Endpoint::to_string() const {
    return host + ":" + std::to_string(port);
}

// ============================================================================
// ClientConfig Implementation
// ============================================================================

ClientConfig ClientConfig::from_environment() {
    ClientConfig config;

    if (const char* url = std::getenv("GHOSTPIR_API_URL")) {
        config.base_url = url;
    }

    if (const char* chunk = std::getenv("GHOSTPIR_CHUNK_SIZE")) {
        char* end = nullptr;
        unsigned long long value = std::strtoull(chunk, &end, 10);
        if (end == chunk || *end != '\0' || value == 0) {
            throw ConfigError("GHOSTPIR_CHUNK_SIZE is not a positive integer");
        }
        config.chunk_size = static_cast<size_t>(value);
    }

    if (const char* verbose = std::getenv("GHOSTPIR_VERBOSE")) {
        std::string v = verbose;
        config.verbose = !(v.empty() || v == "0" || v == "false");
    }

    return config;
}

void ClientConfig::validate() const {
    // Throws on malformed URL
    Endpoint::parse(base_url);

    if (chunk_size == 0) {
        throw ConfigError("chunk_size must be positive");
    }

    if (session_ttl.count() <= 0 || refresh_margin.count() <= 0) {
        throw ConfigError("Session TTL and refresh margin must be positive");
    }

    if (refresh_margin >= session_ttl) {
        throw ConfigError("Refresh margin must be shorter than the session TTL");
    }

    if (io_timeout.count() <= 0) {
        throw ConfigError("io_timeout must be positive");
    }
}

} // namespace ghostpir
