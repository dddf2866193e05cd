#pragma once

#include "ghostpir/core/types.hpp"
#include <optional>
#include <string>

namespace ghostpir::retrieval {

// ============================================================================
// Retriever States
// ============================================================================

enum class RetrieverState : uint8_t {
    Idle,
    FetchingCatalog,
    Downloading,      ///< Paired with the next chunk index
    Decompressing,
    Ready,
    Error
};

const char* to_string(RetrieverState state);

// ============================================================================
// Structured Errors
// ============================================================================

enum class ErrorKind : uint8_t {
    IndexOutOfRange,
    Network,
    SessionExpired,
    Protocol,
    Integrity,
    Decompression,
    ModuleNotFound,
    CatalogPin,
    Randomness,
    Config,
    Busy,
    Cancelled
};

const char* to_string(ErrorKind kind);

/// What a failed download reports to its caller
struct RetrievalError {
    ErrorKind kind = ErrorKind::Protocol;
    std::string endpoint;               ///< /session, /catalog or /kpir when network-related
    std::optional<size_t> chunk_index;  ///< Chunk being fetched, if any
    int status = 0;                     ///< HTTP status, 0 if none
    std::string message;

    /// Integrity and decompression failures reproduce on retry
    bool retryable() const {
        return kind != ErrorKind::Integrity && kind != ErrorKind::Decompression &&
               kind != ErrorKind::IndexOutOfRange && kind != ErrorKind::Cancelled;
    }

    /// Map a library exception to its structured form.
    /// chunk_index is used when the exception does not carry one.
    static RetrievalError from_exception(const GhostPirError& e,
                                         std::optional<size_t> chunk_index = std::nullopt);
};

// ============================================================================
// Fetch Result
// ============================================================================

/// Either a complete artifact or an error; never partial
struct FetchResult {
    std::optional<ModuleArtifact> artifact;
    std::optional<RetrievalError> error;
    bool from_cache = false;

    bool ok() const { return artifact.has_value(); }

    static FetchResult success(ModuleArtifact a, bool cached = false) {
        FetchResult r;
        r.artifact = std::move(a);
        r.from_cache = cached;
        return r;
    }

    static FetchResult failure(RetrievalError e) {
        FetchResult r;
        r.error = std::move(e);
        return r;
    }
};

} // namespace ghostpir::retrieval
