// include/shroud/order/order_codec.hpp
#pragma once

#include <string>
#include "shroud/crypto/ecies.hpp"
#include "shroud/crypto/secure_random.hpp"
#include "shroud/order/order_payload.hpp"

namespace shroud {
namespace order {

/**
 * @brief Output of OrderCodec::encrypt
 */
struct EncryptedPayload {
    Bytes ciphertext;
    Hash32 order_hash{};
    uint8_t version{1};
    OrderPayload order;  // with the salt that was actually used
};

/**
 * @brief Canonical encoding, commitment hash and encryption of private orders
 *
 * The cipher and random source are constructed once by the caller and
 * injected; the codec holds references only.
 */
class OrderCodec {
public:
    static constexpr uint8_t VERSION = 1;

    OrderCodec(const crypto::EciesCipher& cipher, crypto::RandomSource& random);

    /**
     * @brief Fixed 144-byte little-endian encoding
     * @return VALIDATION_ERROR if the order has no salt
     */
    Result<Bytes> encode(const OrderPayload& order) const;

    /**
     * @brief Inverse of encode; rejects buffers shorter than the used prefix
     */
    Result<OrderPayload> decode(const Bytes& buffer) const;

    /**
     * @brief BLAKE3 over the used prefix of the canonical encoding
     */
    Result<Hash32> hash(const OrderPayload& order) const;
    Hash32 hash_encoded(const Bytes& encoded) const;

    Result<Salt16> generate_salt() const;

    /**
     * @brief True only for a 33-byte (02/03) or 65-byte (04) hex point on secp256k1
     */
    bool validate_public_key(const std::string& hex) const;

    /**
     * @brief Fill the salt if absent, encode, hash and encrypt to the executor key
     * @return VALIDATION_ERROR for a bad key or non-positive price/amount,
     *         ENCRYPTION_ERROR if the cipher fails
     */
    Result<EncryptedPayload> encrypt(const OrderPayload& order,
                                     const std::string& recipient_public_key_hex) const;

    /**
     * @brief Decrypt and decode; DECRYPTION_ERROR on any failure
     */
    Result<OrderPayload> decrypt(const Bytes& ciphertext, const Bytes& private_key) const;

private:
    const crypto::EciesCipher& cipher_;
    crypto::RandomSource& random_;
};

}  // namespace order
}  // namespace shroud
