#pragma once

#include "ghostpir/core/types.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace ghostpir {

// ============================================================================
// Endpoint
// ============================================================================

/// Parsed http://host[:port] base URL
struct Endpoint {
    std::string host;
    uint16_t port = 80;

    /// Parse "http://host:port" (scheme optional, trailing slash tolerated).
    /// Throws ConfigError on https or malformed input.
    static Endpoint parse(const std::string& url);

    std::string to_string() const;
};

// ============================================================================
// Client Configuration
// ============================================================================

struct ClientConfig {
    std::string base_url;                       ///< Catalog/session/responder service
    std::string identity;                       ///< Ghost id presented to POST /session
    size_t chunk_size;                          ///< Server-fixed chunk size
    std::chrono::milliseconds session_ttl;      ///< Server-side token lifetime
    std::chrono::milliseconds refresh_margin;   ///< Refresh once this much has elapsed
    std::chrono::milliseconds io_timeout;       ///< Socket send/receive timeout
    bool verbose;                               ///< Console logging of HTTP traffic

    ClientConfig()
        : base_url("http://127.0.0.1:8000"),
          chunk_size(kDefaultChunkSize),
          session_ttl(std::chrono::seconds(60)),
          refresh_margin(std::chrono::seconds(45)),
          io_timeout(std::chrono::seconds(30)),
          verbose(false) {}

    /// Defaults overridden by GHOSTPIR_API_URL, GHOSTPIR_CHUNK_SIZE and
    /// GHOSTPIR_VERBOSE when set
    static ClientConfig from_environment();

    /// Throws ConfigError if any field is unusable
    void validate() const;
};

} // namespace ghostpir
