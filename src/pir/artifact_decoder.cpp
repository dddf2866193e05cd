#include "ghostpir/pir/artifact_decoder.hpp"
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <climits>

namespace ghostpir::pir {

// ============================================================================
// Content Type Sniffing
// ============================================================================

std::string sniff_mime_type(std::span<const uint8_t> content) {
    if (content.size() >= 3 &&
        content[0] == 0xFF && content[1] == 0xD8 && content[2] == 0xFF) {
        return "image/jpeg";
    }
    if (content.size() >= 4 &&
        content[0] == 0x89 && content[1] == 0x50 && content[2] == 0x4E && content[3] == 0x47) {
        return "image/png";
    }
    if (content.size() >= 4 &&
        content[0] == 0x25 && content[1] == 0x50 && content[2] == 0x44 && content[3] == 0x46) {
        return "application/pdf";
    }
    return "application/octet-stream";
}

std::string mime_type_for_filename(const std::string& filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string::npos) {
        return "application/octet-stream";
    }

    std::string ext = filename.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "png") return "image/png";
    if (ext == "pdf") return "application/pdf";
    return "application/octet-stream";
}

std::string extension_for_mime_type(const std::string& mime_type) {
    if (mime_type == "image/jpeg") return "jpg";
    if (mime_type == "image/png") return "png";
    if (mime_type == "application/pdf") return "pdf";
    return "bin";
}

// ============================================================================
// ArtifactDecoder Implementation
// ============================================================================

void ArtifactDecoder::validate_header(std::span<const uint8_t> stream) {
    if (stream.size() < 2 || stream[0] != kGzipMagic0 || stream[1] != kGzipMagic1) {
        throw IntegrityError("Compressed data header invalid. Expected gzip (0x1F 0x8B).");
    }
}

namespace {

/// Owns a z_stream for the lifetime of one inflate call
class InflateStream {
public:
    InflateStream() {
        stream_.zalloc = Z_NULL;
        stream_.zfree = Z_NULL;
        stream_.opaque = Z_NULL;
        stream_.next_in = Z_NULL;
        stream_.avail_in = 0;

        // 16 + MAX_WBITS: expect a gzip wrapper
        if (inflateInit2(&stream_, 16 + MAX_WBITS) != Z_OK) {
            throw DecompressionError("inflateInit2 failed");
        }
    }

    ~InflateStream() { inflateEnd(&stream_); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    z_stream* get() { return &stream_; }

private:
    z_stream stream_{};
};

} // anonymous namespace

std::vector<uint8_t> ArtifactDecoder::inflate(std::span<const uint8_t> stream) const {
    if (stream.size() > UINT_MAX) {
        throw DecompressionError("Compressed stream too large");
    }

    InflateStream zs;
    z_stream* strm = zs.get();

    strm->next_in = const_cast<Bytef*>(stream.data());
    strm->avail_in = static_cast<uInt>(stream.size());

    std::vector<uint8_t> output;
    uint8_t buffer[16384];

    while (true) {
        strm->next_out = buffer;
        strm->avail_out = sizeof(buffer);

        int ret = ::inflate(strm, Z_NO_FLUSH);

        size_t produced = sizeof(buffer) - strm->avail_out;
        if (output.size() + produced > max_output_) {
            throw DecompressionError("Inflated size exceeds limit of " +
                                     std::to_string(max_output_) + " bytes");
        }
        output.insert(output.end(), buffer, buffer + produced);

        if (ret == Z_STREAM_END) {
            if (strm->avail_in == 0) {
                break;
            }
            // Concatenated gzip member
            if (strm->avail_in >= 2 &&
                strm->next_in[0] == kGzipMagic0 && strm->next_in[1] == kGzipMagic1) {
                if (inflateReset(strm) != Z_OK) {
                    throw DecompressionError("inflateReset failed");
                }
                continue;
            }
            throw DecompressionError("Trailing garbage after gzip stream (" +
                                     std::to_string(strm->avail_in) + " bytes)");
        }

        if (ret == Z_BUF_ERROR) {
            // No progress possible: input exhausted before end of stream
            if (strm->avail_in == 0) {
                throw DecompressionError("Truncated gzip stream");
            }
            continue;
        }

        if (ret != Z_OK) {
            std::string reason = strm->msg ? strm->msg : "zlib error " + std::to_string(ret);
            throw DecompressionError("Inflate failed: " + reason);
        }

        if (strm->avail_in == 0 && strm->avail_out != 0) {
            throw DecompressionError("Truncated gzip stream");
        }
    }

    return output;
}

ModuleArtifact ArtifactDecoder::decode(const ModuleDescriptor& descriptor,
                                       std::span<const uint8_t> stream) const {
    validate_header(stream);

    ModuleArtifact artifact;
    artifact.descriptor = descriptor;
    artifact.content = inflate(stream);

    if (descriptor.filename && !descriptor.filename->empty()) {
        artifact.filename = *descriptor.filename;
        artifact.mime_type = mime_type_for_filename(artifact.filename);
    } else {
        artifact.mime_type = sniff_mime_type(artifact.content);
        artifact.filename = "recovered_file." + extension_for_mime_type(artifact.mime_type);
    }

    return artifact;
}

} // namespace ghostpir::pir
