#pragma once

#include "ghostpir/core/types.hpp"
#include <memory>
#include <span>

namespace ghostpir::pir {

// ============================================================================
// Randomness Source
// ============================================================================

/// Source of uniform random bytes for share generation
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Fill the buffer with uniform bytes; throws RandomnessError on failure
    virtual void fill(std::span<uint8_t> out) = 0;
};

/// OpenSSL RAND_bytes (OS-seeded CSPRNG)
class OpenSSLRandomSource : public RandomSource {
public:
    void fill(std::span<uint8_t> out) override;
};

// ============================================================================
// Vector Generator
// ============================================================================

/// Splits the one-hot indicator e_target in Z_256^n into kShareCount
/// additive shares. The first k-1 shares are uniform; the last one is
/// e_target minus their sum, so any k-1 shares are jointly uniform and
/// independent of the target.
class VectorGenerator {
private:
    std::shared_ptr<RandomSource> random_;

public:
    /// Uses OpenSSLRandomSource
    VectorGenerator();

    explicit VectorGenerator(std::shared_ptr<RandomSource> random);

    /// Fresh share set for target_index in a catalog of size n.
    /// Throws IndexOutOfRange unless 0 <= target_index < n.
    QueryVectorSet generate(size_t target_index, size_t n);
};

/// (sum_k v_k[i]) mod 256 for every position
ShareVector combine(const QueryVectorSet& set);

} // namespace ghostpir::pir
