// include/shroud/crypto/ecies.hpp
#pragma once

#include <memory>
#include "shroud/core/error.hpp"
#include "shroud/core/types.hpp"
#include "shroud/crypto/secure_random.hpp"

namespace shroud {
namespace crypto {

/**
 * @brief secp256k1 keypair (raw scalar and uncompressed SEC1 point)
 */
struct Secp256k1Keypair {
    Bytes private_key;  // 32 bytes big-endian
    Bytes public_key;   // 65 bytes, 0x04 prefix
};

/**
 * @brief ECIES over secp256k1 with HKDF-SHA256 and AES-256-GCM
 *
 * Envelope layout: ephemeral public key (65) | nonce (16) | tag (16) | ciphertext.
 * The symmetric key is HKDF-SHA256(ephemeral_pub || shared_point) with an
 * empty salt and info. Constructed once per process and shared.
 */
class EciesCipher {
public:
    static constexpr size_t PUBLIC_KEY_UNCOMPRESSED_LEN = 65;
    static constexpr size_t PUBLIC_KEY_COMPRESSED_LEN = 33;
    static constexpr size_t PRIVATE_KEY_LEN = 32;
    static constexpr size_t NONCE_LEN = 16;
    static constexpr size_t TAG_LEN = 16;
    static constexpr size_t OVERHEAD = PUBLIC_KEY_UNCOMPRESSED_LEN + NONCE_LEN + TAG_LEN;

    EciesCipher();
    ~EciesCipher();

    EciesCipher(const EciesCipher&) = delete;
    EciesCipher& operator=(const EciesCipher&) = delete;

    /**
     * @brief Encrypt to a SEC1-encoded recipient key (33 or 65 bytes)
     * @param random Supplies the GCM nonce
     * @return Envelope bytes, or ENCRYPTION_ERROR / VALIDATION_ERROR
     */
    Result<Bytes> encrypt(const Bytes& recipient_public_key, const Bytes& plaintext,
                          RandomSource& random) const;

    /**
     * @brief Open an envelope with a 32-byte private scalar
     * @return Plaintext, or DECRYPTION_ERROR on any malformed input or auth failure
     */
    Result<Bytes> decrypt(const Bytes& private_key, const Bytes& envelope) const;

    /**
     * @brief True if the bytes are a SEC1 point on secp256k1
     */
    bool is_valid_public_key(const Bytes& public_key) const;

    /**
     * @brief Generate a fresh keypair
     */
    Result<Secp256k1Keypair> generate_keypair() const;

    /**
     * @brief Uncompressed public key for a private scalar
     */
    Result<Bytes> public_key_for(const Bytes& private_key) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace crypto
}  // namespace shroud
