#pragma once

#include <cstdint>
#include <array>
#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <stdexcept>

namespace ghostpir {

// ============================================================================
// Protocol Constants
// ============================================================================

/// Number of additive shares (one per responder view)
inline constexpr size_t kShareCount = 3;

/// Default server-fixed chunk size in bytes
inline constexpr size_t kDefaultChunkSize = 4096;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// ============================================================================
// Byte Vectors
// ============================================================================

/// Fixed-length vector of Z_256 elements (query share or response share)
class ShareVector {
private:
    std::vector<uint8_t> bytes_;

public:
    ShareVector() = default;
    explicit ShareVector(size_t n) : bytes_(n, 0) {}
    explicit ShareVector(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    uint8_t& operator[](size_t i) { return bytes_[i]; }
    uint8_t operator[](size_t i) const { return bytes_[i]; }

    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

    std::span<const uint8_t> bytes() const { return bytes_; }
    std::span<uint8_t> bytes() { return bytes_; }

    /// Release the underlying buffer
    std::vector<uint8_t> take() && { return std::move(bytes_); }

    bool operator==(const ShareVector& other) const = default;
};

/// The k query vectors for one chunk request.
/// Move-only: a set is consumed by exactly one request.
class QueryVectorSet {
private:
    std::array<ShareVector, kShareCount> vectors_;
    size_t target_index_;

public:
    QueryVectorSet(std::array<ShareVector, kShareCount> vectors, size_t target_index)
        : vectors_(std::move(vectors)), target_index_(target_index) {}

    QueryVectorSet(const QueryVectorSet&) = delete;
    QueryVectorSet& operator=(const QueryVectorSet&) = delete;
    QueryVectorSet(QueryVectorSet&&) noexcept = default;
    QueryVectorSet& operator=(QueryVectorSet&&) noexcept = default;

    const ShareVector& operator[](size_t i) const { return vectors_[i]; }
    const std::array<ShareVector, kShareCount>& vectors() const { return vectors_; }

    /// Length n of each vector (catalog size)
    size_t length() const { return vectors_[0].size(); }

    /// Client-side only; never serialized
    size_t target_index() const { return target_index_; }
};

/// The k response shares for one chunk
struct ChunkResponse {
    std::array<ShareVector, kShareCount> shares;
};

// ============================================================================
// Catalog
// ============================================================================

struct ModuleDescriptor {
    std::string id;
    std::string title;
    std::string topic;
    int32_t tier = 1;
    size_t chunk_count = 0;
    size_t compressed_size = 0;
    std::optional<std::string> filename;

    /// Check (chunk_count-1)*chunk_size < compressed_size <= chunk_count*chunk_size
    bool size_consistent(size_t chunk_size) const;
};

/// Ordered catalog; position is the PIR address
class Catalog {
private:
    std::vector<ModuleDescriptor> modules_;

public:
    Catalog() = default;
    explicit Catalog(std::vector<ModuleDescriptor> modules)
        : modules_(std::move(modules)) {}

    size_t size() const { return modules_.size(); }
    bool empty() const { return modules_.empty(); }

    const ModuleDescriptor& at(size_t index) const { return modules_.at(index); }
    const std::vector<ModuleDescriptor>& modules() const { return modules_; }

    /// Position of the module with the given id, if present
    std::optional<size_t> position_of(const std::string& module_id) const;
};

// ============================================================================
// Session
// ============================================================================

struct SessionToken {
    std::string value;
    TimePoint issued_at;

    bool empty() const { return value.empty(); }
};

// ============================================================================
// Recovered Artifact
// ============================================================================

struct ModuleArtifact {
    ModuleDescriptor descriptor;
    std::vector<uint8_t> content;   ///< Inflated bytes
    std::string mime_type;
    std::string filename;
};

// ============================================================================
// Error Types
// ============================================================================

/// Exception hierarchy
class GhostPirError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

class IndexOutOfRange : public GhostPirError {
public:
    IndexOutOfRange(size_t index, size_t n)
        : GhostPirError("Target index " + std::to_string(index) +
                        " outside catalog of size " + std::to_string(n)) {}
};

class ProtocolError : public GhostPirError {
    using GhostPirError::GhostPirError;
};

class IntegrityError : public GhostPirError {
    using GhostPirError::GhostPirError;
};

class DecompressionError : public GhostPirError {
    using GhostPirError::GhostPirError;
};

class ModuleNotFound : public GhostPirError {
public:
    explicit ModuleNotFound(const std::string& module_id)
        : GhostPirError("Module " + module_id + " not found in catalog") {}
};

class CatalogPinError : public GhostPirError {
    using GhostPirError::GhostPirError;
};

class ConfigError : public GhostPirError {
    using GhostPirError::GhostPirError;
};

class RandomnessError : public GhostPirError {
public:
    RandomnessError() : GhostPirError("CSPRNG failed to produce bytes") {}
};

class BusyError : public GhostPirError {
public:
    BusyError() : GhostPirError("A download is already in progress on this fetcher") {}
};

} // namespace ghostpir
