#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include <concepts>

namespace ghostpir::algebra {

// ============================================================================
// Z_256 Byte Ring
// ============================================================================

/// Ring Z_{2^8} using native uint8_t wraparound
class Z256 {
private:
    uint8_t value_;

public:
    constexpr Z256() : value_(0) {}

    constexpr explicit Z256(uint8_t v) : value_(v) {}

    template<std::integral T>
    constexpr explicit Z256(T v) : value_(static_cast<uint8_t>(v & 0xFF)) {}

    constexpr Z256 operator+(const Z256& other) const {
        return Z256(static_cast<uint8_t>(value_ + other.value_));
    }

    constexpr Z256& operator+=(const Z256& other) {
        value_ = static_cast<uint8_t>(value_ + other.value_);
        return *this;
    }

    constexpr Z256 operator-(const Z256& other) const {
        return Z256(static_cast<uint8_t>(value_ - other.value_));
    }

    constexpr Z256& operator-=(const Z256& other) {
        value_ = static_cast<uint8_t>(value_ - other.value_);
        return *this;
    }

    constexpr Z256 operator*(const Z256& other) const {
        return Z256(static_cast<uint8_t>(value_ * other.value_));
    }

    constexpr Z256& operator*=(const Z256& other) {
        *this = *this * other;
        return *this;
    }

    // Additive inverse
    constexpr Z256 operator-() const {
        return Z256(static_cast<uint8_t>(~value_ + 1));
    }

    static constexpr Z256 zero() { return Z256(uint8_t{0}); }
    static constexpr Z256 one() { return Z256(uint8_t{1}); }

    constexpr uint8_t value() const { return value_; }

    constexpr bool operator==(const Z256& other) const = default;
};

// ============================================================================
// Share-vector operations over Z_256
// ============================================================================
//
// All functions require equal-length operands and throw std::invalid_argument
// otherwise.

/// acc[i] = acc[i] + x[i] mod 256
void add_into(std::span<uint8_t> acc, std::span<const uint8_t> x);

/// acc[i] = acc[i] - x[i] mod 256
void sub_into(std::span<uint8_t> acc, std::span<const uint8_t> x);

/// Element-wise sum of any number of shares mod 256
std::vector<uint8_t> sum_shares(std::span<const std::span<const uint8_t>> shares);

/// sum_i a[i] * b[i] mod 256
uint8_t inner_product(std::span<const uint8_t> a, std::span<const uint8_t> b);

/// Row-selection product y = q^T M over Z_256.
/// M is n rows of row_len bytes stored row-major; q has n entries.
/// This is the responder-side computation of one share.
std::vector<uint8_t> select_rows(
    std::span<const uint8_t> q,
    std::span<const uint8_t> M,
    size_t n, size_t row_len
);

} // namespace ghostpir::algebra
