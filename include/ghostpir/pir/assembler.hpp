#pragma once

#include "ghostpir/core/types.hpp"
#include <map>
#include <vector>

namespace ghostpir::pir {

// ============================================================================
// Assembler
// ============================================================================

/// Ordered chunk buffer for one module download
class Assembler {
private:
    size_t chunk_count_;
    size_t chunk_size_;
    size_t compressed_size_;
    std::map<size_t, std::vector<uint8_t>> chunks_;

public:
    /// Throws ProtocolError if the descriptor violates
    /// (chunk_count-1)*chunk_size < compressed_size <= chunk_count*chunk_size
    Assembler(const ModuleDescriptor& descriptor, size_t chunk_size);

    /// Store one recovered chunk. Duplicate, out-of-range or
    /// wrong-length chunks throw ProtocolError.
    void add(size_t chunk_index, std::vector<uint8_t> plaintext);

    /// Concatenate chunks 0..chunk_count-1 and trim padding to
    /// compressed_size. A missing chunk throws ProtocolError.
    std::vector<uint8_t> assemble() const;

    size_t received() const { return chunks_.size(); }
    bool complete() const { return chunks_.size() == chunk_count_; }
    void clear() { chunks_.clear(); }
};

} // namespace ghostpir::pir
