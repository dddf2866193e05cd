#include "ghostpir/core/types.hpp"

namespace ghostpir {

// ============================================================================
// ModuleDescriptor Implementation
// ============================================================================

bool ModuleDescriptor::size_consistent(size_t chunk_size) const {
    if (chunk_count == 0 || chunk_size == 0) {
        return false;
    }

    // Guard the upper bound against overflow for hostile descriptors
    if (chunk_count > SIZE_MAX / chunk_size) {
        return false;
    }

    size_t upper = chunk_count * chunk_size;
    size_t lower = (chunk_count - 1) * chunk_size;
    return compressed_size > lower && compressed_size <= upper;
}

// ============================================================================
// Catalog Implementation
// ============================================================================

std::optional<size_t> Catalog::position_of(const std::string& module_id) const {
    for (size_t i = 0; i < modules_.size(); ++i) {
        if (modules_[i].id == module_id) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace ghostpir
