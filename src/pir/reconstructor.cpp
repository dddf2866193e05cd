#include "ghostpir/pir/reconstructor.hpp"
#include "ghostpir/algebra/z256.hpp"

namespace ghostpir::pir {

std::vector<uint8_t> Reconstructor::recover(const ShareVector& r0,
                                            const ShareVector& r1,
                                            const ShareVector& r2) const {
    if (r0.size() != r1.size() || r0.size() != r2.size()) {
        throw ProtocolError("Response share lengths differ (" +
                            std::to_string(r0.size()) + ", " +
                            std::to_string(r1.size()) + ", " +
                            std::to_string(r2.size()) + ")");
    }

    if (r0.size() != chunk_size_) {
        throw ProtocolError("Response share length " + std::to_string(r0.size()) +
                            " does not match chunk size " + std::to_string(chunk_size_));
    }

    auto first = r0.bytes();
    std::vector<uint8_t> plaintext(first.begin(), first.end());
    algebra::add_into(plaintext, r1.bytes());
    algebra::add_into(plaintext, r2.bytes());
    return plaintext;
}

} // namespace ghostpir::pir
