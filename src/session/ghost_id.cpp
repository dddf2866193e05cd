#include "ghostpir/session/ghost_id.hpp"
#include "ghostpir/core/types.hpp"
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <memory>

namespace ghostpir::session {

std::string derive_ghost_id(const std::string& username, const std::string& password) {
    std::string input = username + password + kGhostSalt;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(),
                                                                  &EVP_MD_CTX_free);
    if (!mdctx) {
        throw GhostPirError("EVP_MD_CTX_new failed");
    }

    uint8_t hash[SHA256_DIGEST_LENGTH];
    unsigned int hash_len = 0;
    if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(mdctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
        throw GhostPirError("SHA-256 digest failed");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex.push_back(kHex[hash[i] >> 4]);
        hex.push_back(kHex[hash[i] & 0x0F]);
    }
    return hex;
}

} // namespace ghostpir::session
