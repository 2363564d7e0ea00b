// src/order/order_codec.cpp

#include "shroud/order/order_codec.hpp"
#include <algorithm>
#include "shroud/core/encoding.hpp"
#include "shroud/crypto/hash.hpp"

namespace shroud {
namespace order {

OrderCodec::OrderCodec(const crypto::EciesCipher& cipher, crypto::RandomSource& random)
    : cipher_(cipher), random_(random) {}

Result<Bytes> OrderCodec::encode(const OrderPayload& order) const {
    if (!order.salt) {
        return make_error<Bytes>(ErrorCode::VALIDATION_ERROR,
                                 "Order salt must be set before encoding", "OrderCodec");
    }
    Bytes out;
    out.reserve(OrderPayload::ENCODED_LEN);
    LayoutWriter writer(out);
    Salt16 salt = *order.salt;
    describe_order_layout(writer, order, salt);
    writer.pad(OrderPayload::ENCODED_LEN - writer.position());
    return out;
}

Result<OrderPayload> OrderCodec::decode(const Bytes& buffer) const {
    if (buffer.size() < OrderPayload::USED_LEN) {
        return make_error<OrderPayload>(ErrorCode::PARSE_ERROR,
                                        "Order buffer too short: " +
                                            std::to_string(buffer.size()) + " bytes",
                                        "OrderCodec");
    }
    OrderPayload order;
    Salt16 salt{};
    LayoutReader reader(buffer);
    describe_order_layout(reader, order, salt);
    if (!reader.ok()) {
        return make_error<OrderPayload>(ErrorCode::PARSE_ERROR, "Order buffer truncated",
                                        "OrderCodec");
    }
    if (static_cast<uint8_t>(order.trigger_condition) > 1 ||
        static_cast<uint8_t>(order.side) > 1) {
        return make_error<OrderPayload>(ErrorCode::PARSE_ERROR,
                                        "Order buffer has an unknown condition or side",
                                        "OrderCodec");
    }
    order.salt = salt;
    return order;
}

Hash32 OrderCodec::hash_encoded(const Bytes& encoded) const {
    const size_t len = std::min(encoded.size(), OrderPayload::USED_LEN);
    return crypto::blake3(encoded.data(), len);
}

Result<Hash32> OrderCodec::hash(const OrderPayload& order) const {
    auto encoded = encode(order);
    if (encoded.is_error()) {
        return forward_error<Hash32>(encoded);
    }
    return hash_encoded(encoded.value());
}

Result<Salt16> OrderCodec::generate_salt() const {
    Salt16 salt{};
    auto filled = random_.fill(salt.data(), salt.size());
    if (filled.is_error()) {
        return forward_error<Salt16>(filled);
    }
    return salt;
}

bool OrderCodec::validate_public_key(const std::string& hex) const {
    auto decoded = encoding::from_hex(hex);
    if (decoded.is_error()) {
        return false;
    }
    const Bytes& key = decoded.value();
    const bool compressed = key.size() == crypto::EciesCipher::PUBLIC_KEY_COMPRESSED_LEN &&
                            (key[0] == 0x02 || key[0] == 0x03);
    const bool uncompressed = key.size() == crypto::EciesCipher::PUBLIC_KEY_UNCOMPRESSED_LEN &&
                              key[0] == 0x04;
    if (!compressed && !uncompressed) {
        return false;
    }
    return cipher_.is_valid_public_key(key);
}

Result<EncryptedPayload> OrderCodec::encrypt(const OrderPayload& order,
                                             const std::string& recipient_public_key_hex) const {
    if (!validate_public_key(recipient_public_key_hex)) {
        return make_error<EncryptedPayload>(ErrorCode::VALIDATION_ERROR,
                                            "Executor public key is not a secp256k1 point",
                                            "OrderCodec");
    }
    if (order.trigger_price <= 0) {
        return make_error<EncryptedPayload>(ErrorCode::VALIDATION_ERROR,
                                            "Trigger price must be positive", "OrderCodec");
    }
    if (order.base_asset_amount == 0) {
        return make_error<EncryptedPayload>(ErrorCode::VALIDATION_ERROR,
                                            "Base asset amount must be positive", "OrderCodec");
    }

    EncryptedPayload out;
    out.order = order;
    if (!out.order.salt) {
        auto salt = generate_salt();
        if (salt.is_error()) {
            return forward_error<EncryptedPayload>(salt);
        }
        out.order.salt = salt.value();
    }

    auto encoded = encode(out.order);
    if (encoded.is_error()) {
        return forward_error<EncryptedPayload>(encoded);
    }
    out.order_hash = hash_encoded(encoded.value());

    auto key = encoding::from_hex(recipient_public_key_hex);
    if (key.is_error()) {
        return forward_error<EncryptedPayload>(key);
    }
    auto ciphertext = cipher_.encrypt(key.value(), encoded.value(), random_);
    if (ciphertext.is_error()) {
        return make_error<EncryptedPayload>(ErrorCode::ENCRYPTION_ERROR,
                                            ciphertext.error()->what(), "OrderCodec");
    }
    if (ciphertext.value().size() > OrderPayload::MAX_CIPHERTEXT_LEN) {
        return make_error<EncryptedPayload>(ErrorCode::ENCRYPTION_ERROR,
                                            "Ciphertext exceeds account capacity", "OrderCodec");
    }
    out.ciphertext = ciphertext.value();
    out.version = VERSION;
    return out;
}

Result<OrderPayload> OrderCodec::decrypt(const Bytes& ciphertext, const Bytes& private_key) const {
    auto plaintext = cipher_.decrypt(private_key, ciphertext);
    if (plaintext.is_error()) {
        return make_error<OrderPayload>(ErrorCode::DECRYPTION_ERROR, plaintext.error()->what(),
                                        "OrderCodec");
    }
    if (plaintext.value().size() != OrderPayload::ENCODED_LEN) {
        return make_error<OrderPayload>(ErrorCode::DECRYPTION_ERROR,
                                        "Decrypted order has unexpected length " +
                                            std::to_string(plaintext.value().size()),
                                        "OrderCodec");
    }
    auto decoded = decode(plaintext.value());
    if (decoded.is_error()) {
        return make_error<OrderPayload>(ErrorCode::DECRYPTION_ERROR, decoded.error()->what(),
                                        "OrderCodec");
    }
    return decoded.value();
}

}  // namespace order
}  // namespace shroud
