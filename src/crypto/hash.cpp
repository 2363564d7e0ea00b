// src/crypto/hash.cpp

#include "shroud/crypto/hash.hpp"
#include <blake3.h>
#include "shroud/core/error.hpp"

namespace shroud {
namespace crypto {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        throw ShroudError(ErrorCode::UNKNOWN_ERROR, "Failed to initialize SHA-256", "Sha256");
    }
}

Sha256& Sha256::update(const uint8_t* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        throw ShroudError(ErrorCode::UNKNOWN_ERROR, "SHA-256 update failed", "Sha256");
    }
    return *this;
}

Hash32 Sha256::finish() {
    Hash32 out{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &out_len) != 1 || out_len != out.size()) {
        throw ShroudError(ErrorCode::UNKNOWN_ERROR, "SHA-256 finalize failed", "Sha256");
    }
    return out;
}

Hash32 sha256(const uint8_t* data, size_t len) {
    return Sha256().update(data, len).finish();
}

Hash32 sha256(const Bytes& data) {
    return sha256(data.data(), data.size());
}

Hash32 sha256(const std::string& data) {
    return sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Hash32 blake3(const uint8_t* data, size_t len) {
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    Hash32 out{};
    blake3_hasher_finalize(&hasher, out.data(), out.size());
    return out;
}

}  // namespace crypto
}  // namespace shroud
