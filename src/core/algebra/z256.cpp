#include "ghostpir/algebra/z256.hpp"
#include <stdexcept>
#include <string>

namespace ghostpir::algebra {

namespace {

void check_lengths(size_t a, size_t b, const char* op) {
    if (a != b) {
        throw std::invalid_argument(std::string(op) + ": length mismatch (" +
                                    std::to_string(a) + " vs " + std::to_string(b) + ")");
    }
}

} // anonymous namespace

// ============================================================================
// Vector Operations
// ============================================================================
//
// uint8_t arithmetic promotes to int; the cast back truncates, which is
// exactly reduction mod 256.

void add_into(std::span<uint8_t> acc, std::span<const uint8_t> x) {
    check_lengths(acc.size(), x.size(), "add_into");
    for (size_t i = 0; i < acc.size(); ++i) {
        acc[i] = static_cast<uint8_t>(acc[i] + x[i]);
    }
}

void sub_into(std::span<uint8_t> acc, std::span<const uint8_t> x) {
    check_lengths(acc.size(), x.size(), "sub_into");
    for (size_t i = 0; i < acc.size(); ++i) {
        acc[i] = static_cast<uint8_t>(acc[i] - x[i]);
    }
}

std::vector<uint8_t> sum_shares(std::span<const std::span<const uint8_t>> shares) {
    if (shares.empty()) {
        return {};
    }

    std::vector<uint8_t> result(shares[0].begin(), shares[0].end());
    for (size_t k = 1; k < shares.size(); ++k) {
        add_into(result, shares[k]);
    }
    return result;
}

uint8_t inner_product(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    check_lengths(a.size(), b.size(), "inner_product");

    // 32-bit accumulator; only the low byte matters
    uint32_t acc = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        acc += static_cast<uint32_t>(a[i]) * static_cast<uint32_t>(b[i]);
    }
    return static_cast<uint8_t>(acc & 0xFF);
}

std::vector<uint8_t> select_rows(
    std::span<const uint8_t> q,
    std::span<const uint8_t> M,
    size_t n, size_t row_len
) {
    check_lengths(q.size(), n, "select_rows");
    check_lengths(M.size(), n * row_len, "select_rows");

    std::vector<uint32_t> acc(row_len, 0);
    for (size_t row = 0; row < n; ++row) {
        uint32_t coeff = q[row];
        if (coeff == 0) {
            continue;
        }
        const uint8_t* row_ptr = M.data() + row * row_len;
        for (size_t j = 0; j < row_len; ++j) {
            acc[j] += coeff * row_ptr[j];
        }
    }

    std::vector<uint8_t> y(row_len);
    for (size_t j = 0; j < row_len; ++j) {
        y[j] = static_cast<uint8_t>(acc[j] & 0xFF);
    }
    return y;
}

} // namespace ghostpir::algebra
