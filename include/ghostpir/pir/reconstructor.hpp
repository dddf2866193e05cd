#pragma once

#include "ghostpir/core/types.hpp"
#include <vector>

namespace ghostpir::pir {

// ============================================================================
// Reconstructor
// ============================================================================

/// Combines the k response shares of one chunk into plaintext:
/// plaintext[j] = (r0[j] + r1[j] + r2[j]) mod 256
class Reconstructor {
private:
    size_t chunk_size_;

public:
    explicit Reconstructor(size_t chunk_size) : chunk_size_(chunk_size) {}

    /// Throws ProtocolError if the share lengths differ from each other
    /// or from the expected chunk size
    std::vector<uint8_t> recover(const ShareVector& r0,
                                 const ShareVector& r1,
                                 const ShareVector& r2) const;

    std::vector<uint8_t> recover(const ChunkResponse& response) const {
        return recover(response.shares[0], response.shares[1], response.shares[2]);
    }

    size_t chunk_size() const { return chunk_size_; }
};

} // namespace ghostpir::pir
