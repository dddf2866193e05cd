#include "ghostpir/pir/vector_generator.hpp"
#include "ghostpir/algebra/z256.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <climits>

namespace ghostpir::pir {

// ============================================================================
// OpenSSLRandomSource Implementation
// ============================================================================

void OpenSSLRandomSource::fill(std::span<uint8_t> out) {
    // RAND_bytes takes an int length; split very large requests
    size_t offset = 0;
    while (offset < out.size()) {
        size_t len = std::min(out.size() - offset, static_cast<size_t>(INT_MAX));
        if (RAND_bytes(out.data() + offset, static_cast<int>(len)) != 1) {
            throw RandomnessError();
        }
        offset += len;
    }
}

// ============================================================================
// VectorGenerator Implementation
// ============================================================================

VectorGenerator::VectorGenerator()
    : random_(std::make_shared<OpenSSLRandomSource>()) {}

VectorGenerator::VectorGenerator(std::shared_ptr<RandomSource> random)
    : random_(std::move(random)) {
    if (!random_) {
        throw ConfigError("VectorGenerator requires a random source");
    }
}

QueryVectorSet VectorGenerator::generate(size_t target_index, size_t n) {
    if (n == 0 || target_index >= n) {
        throw IndexOutOfRange(target_index, n);
    }

    std::array<ShareVector, kShareCount> shares;

    // Uniform shares v_0 .. v_{k-2}
    for (size_t k = 0; k + 1 < kShareCount; ++k) {
        shares[k] = ShareVector(n);
        random_->fill(shares[k].bytes());
    }

    // v_{k-1}[i] = ((t(i) - sum_{k<K-1} v_k[i]) mod 256 + 512) mod 256
    ShareVector last(n);
    for (size_t i = 0; i < n; ++i) {
        int value = (i == target_index) ? 1 : 0;
        for (size_t k = 0; k + 1 < kShareCount; ++k) {
            value -= shares[k][i];
        }
        last[i] = static_cast<uint8_t>(((value % 256) + 512) % 256);
    }
    shares[kShareCount - 1] = std::move(last);

    return QueryVectorSet(std::move(shares), target_index);
}

ShareVector combine(const QueryVectorSet& set) {
    ShareVector sum(set.length());
    for (const auto& share : set.vectors()) {
        algebra::add_into(sum.bytes(), share.bytes());
    }
    return sum;
}

} // namespace ghostpir::pir
