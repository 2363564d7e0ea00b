// include/shroud/crypto/hash.hpp
#pragma once

#include <openssl/evp.h>
#include <memory>
#include <string>
#include "shroud/core/types.hpp"

namespace shroud {
namespace crypto {

/**
 * @brief Incremental SHA-256 over EVP
 *
 * Throws ShroudError only if OpenSSL itself fails to initialize a digest.
 */
class Sha256 {
public:
    Sha256();

    Sha256& update(const uint8_t* data, size_t len);
    Sha256& update(const Bytes& data) {
        return update(data.data(), data.size());
    }
    Sha256& update(const std::string& data) {
        return update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }
    template <size_t N>
    Sha256& update(const std::array<uint8_t, N>& data) {
        return update(data.data(), N);
    }

    Hash32 finish();

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const {
            EVP_MD_CTX_free(ctx);
        }
    };
    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
};

Hash32 sha256(const uint8_t* data, size_t len);
Hash32 sha256(const Bytes& data);
Hash32 sha256(const std::string& data);

/**
 * @brief BLAKE3 with the default 32-byte output; the order commitment hash
 */
Hash32 blake3(const uint8_t* data, size_t len);

}  // namespace crypto
}  // namespace shroud
