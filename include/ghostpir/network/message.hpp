#pragma once

#include "ghostpir/core/types.hpp"
#include <array>
#include <optional>
#include <string>

namespace ghostpir::network {

// ============================================================================
// JSON Wire Messages
// ============================================================================
//
// Each message converts between a domain value and the JSON body of one
// collaborator endpoint. Decoding validates counts, lengths and byte ranges
// and throws ProtocolError on any violation, so nothing past this boundary
// sees unchecked wire data.

/// POST /session request body
struct SessionRequestMessage {
    std::string ghost_id;

    std::string to_json() const;
    static SessionRequestMessage from_json(const std::string& json);
};

/// POST /session response body
struct SessionResponseMessage {
    std::string token;

    std::string to_json() const;
    static SessionResponseMessage from_json(const std::string& json);
};

/// GET /catalog response body
struct CatalogMessage {
    Catalog catalog;

    std::string to_json() const;
    static CatalogMessage from_json(const std::string& json);
};

/// POST /kpir request body
struct KpirRequestMessage {
    std::string token;
    std::array<ShareVector, kShareCount> vectors;
    size_t chunk_index = 0;

    KpirRequestMessage() = default;
    KpirRequestMessage(std::string t, const QueryVectorSet& set, size_t chunk)
        : token(std::move(t)), vectors(set.vectors()), chunk_index(chunk) {}

    std::string to_json() const;

    /// expected_length: catalog size the vectors must match, if known
    static KpirRequestMessage from_json(const std::string& json,
                                        std::optional<size_t> expected_length = std::nullopt);
};

/// POST /kpir response body
struct KpirResponseMessage {
    ChunkResponse response;

    std::string to_json() const;

    /// expected_length: server chunk size every share must match
    static KpirResponseMessage from_json(const std::string& json, size_t expected_length);
};

} // namespace ghostpir::network
