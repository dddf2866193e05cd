#pragma once

#include "ghostpir/core/types.hpp"
#include <span>
#include <string>
#include <vector>

namespace ghostpir::pir {

// ============================================================================
// Content Type Sniffing
// ============================================================================

/// image/jpeg, image/png, application/pdf or application/octet-stream
/// from leading magic bytes
std::string sniff_mime_type(std::span<const uint8_t> content);

/// Same classes, from a file name extension
std::string mime_type_for_filename(const std::string& filename);

/// jpg, png, pdf or bin
std::string extension_for_mime_type(const std::string& mime_type);

// ============================================================================
// Artifact Decoder (integrity check + gzip inflate)
// ============================================================================

class ArtifactDecoder {
public:
    static constexpr uint8_t kGzipMagic0 = 0x1F;
    static constexpr uint8_t kGzipMagic1 = 0x8B;

    /// Upper bound on inflated size (guards against decompression bombs)
    static constexpr size_t kDefaultMaxOutput = size_t{1} << 30;

    explicit ArtifactDecoder(size_t max_output = kDefaultMaxOutput)
        : max_output_(max_output) {}

    /// Throws IntegrityError unless the stream starts with 1F 8B
    static void validate_header(std::span<const uint8_t> stream);

    /// Inflate a gzip stream (one or more members).
    /// Throws DecompressionError on any zlib failure or truncation.
    std::vector<uint8_t> inflate(std::span<const uint8_t> stream) const;

    /// Header check, inflate and content-type resolution
    ModuleArtifact decode(const ModuleDescriptor& descriptor,
                          std::span<const uint8_t> stream) const;

private:
    size_t max_output_;
};

} // namespace ghostpir::pir
