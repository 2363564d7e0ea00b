// src/crypto/ecies.cpp

#include "shroud/crypto/ecies.hpp"
#include <openssl/core_names.h>
#include <openssl/obj_mac.h>
#include <openssl/params.h>
#include <algorithm>
#include <array>
#include "openssl_handles.hpp"

namespace shroud {
namespace crypto {

using detail::BnCtxPtr;
using detail::BnPtr;
using detail::CipherCtxPtr;
using detail::EcGroupPtr;
using detail::EcPointPtr;
using detail::KdfCtxPtr;
using detail::KdfPtr;

namespace {

constexpr size_t SYMMETRIC_KEY_LEN = 32;

}  // namespace

struct EciesCipher::Impl {
    EcGroupPtr group;

    Result<EcPointPtr> parse_point(const Bytes& encoded, BN_CTX* ctx) const {
        EcPointPtr point(EC_POINT_new(group.get()));
        if (!point) {
            return make_error<EcPointPtr>(ErrorCode::UNKNOWN_ERROR, "EC_POINT_new failed",
                                          "EciesCipher");
        }
        if (encoded.empty() ||
            EC_POINT_oct2point(group.get(), point.get(), encoded.data(), encoded.size(), ctx) !=
                1 ||
            EC_POINT_is_at_infinity(group.get(), point.get()) == 1) {
            return make_error<EcPointPtr>(ErrorCode::VALIDATION_ERROR,
                                          "Not a valid secp256k1 public key", "EciesCipher");
        }
        return std::move(point);
    }

    Result<BnPtr> parse_scalar(const Bytes& private_key) const {
        if (private_key.size() != PRIVATE_KEY_LEN) {
            return make_error<BnPtr>(ErrorCode::VALIDATION_ERROR,
                                     "Private key must be 32 bytes", "EciesCipher");
        }
        BnPtr scalar(BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()), nullptr));
        if (!scalar || BN_is_zero(scalar.get()) ||
            BN_cmp(scalar.get(), EC_GROUP_get0_order(group.get())) >= 0) {
            return make_error<BnPtr>(ErrorCode::VALIDATION_ERROR,
                                     "Private key out of range", "EciesCipher");
        }
        return std::move(scalar);
    }

    Result<Bytes> encode_point(const EC_POINT* point, BN_CTX* ctx) const {
        Bytes out(PUBLIC_KEY_UNCOMPRESSED_LEN);
        size_t written = EC_POINT_point2oct(group.get(), point, POINT_CONVERSION_UNCOMPRESSED,
                                            out.data(), out.size(), ctx);
        if (written != PUBLIC_KEY_UNCOMPRESSED_LEN) {
            return make_error<Bytes>(ErrorCode::UNKNOWN_ERROR, "EC_POINT_point2oct failed",
                                     "EciesCipher");
        }
        return out;
    }

    Result<Bytes> multiply(const EC_POINT* point, const BIGNUM* scalar, BN_CTX* ctx) const {
        EcPointPtr product(EC_POINT_new(group.get()));
        if (!product ||
            EC_POINT_mul(group.get(), product.get(), nullptr, point, scalar, ctx) != 1) {
            return make_error<Bytes>(ErrorCode::UNKNOWN_ERROR, "EC_POINT_mul failed",
                                     "EciesCipher");
        }
        return encode_point(product.get(), ctx);
    }

    Result<Bytes> derive_key(const Bytes& ephemeral_public, const Bytes& shared_point) const {
        Bytes ikm;
        ikm.reserve(ephemeral_public.size() + shared_point.size());
        ikm.insert(ikm.end(), ephemeral_public.begin(), ephemeral_public.end());
        ikm.insert(ikm.end(), shared_point.begin(), shared_point.end());

        KdfPtr kdf(EVP_KDF_fetch(nullptr, "HKDF", nullptr));
        if (!kdf) {
            return make_error<Bytes>(ErrorCode::UNKNOWN_ERROR, "HKDF unavailable",
                                     "EciesCipher");
        }
        KdfCtxPtr kctx(EVP_KDF_CTX_new(kdf.get()));
        if (!kctx) {
            return make_error<Bytes>(ErrorCode::UNKNOWN_ERROR, "EVP_KDF_CTX_new failed",
                                     "EciesCipher");
        }

        char digest_name[] = "SHA256";
        OSSL_PARAM params[] = {
            OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, digest_name, 0),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_KEY, ikm.data(), ikm.size()),
            OSSL_PARAM_construct_end()};

        Bytes key(SYMMETRIC_KEY_LEN);
        if (EVP_KDF_derive(kctx.get(), key.data(), key.size(), params) != 1) {
            return make_error<Bytes>(ErrorCode::UNKNOWN_ERROR, "HKDF derive failed",
                                     "EciesCipher");
        }
        return key;
    }
};

EciesCipher::EciesCipher() : impl_(std::make_unique<Impl>()) {
    impl_->group.reset(EC_GROUP_new_by_curve_name(NID_secp256k1));
    if (!impl_->group) {
        throw ShroudError(ErrorCode::NOT_INITIALIZED, "secp256k1 group unavailable",
                          "EciesCipher");
    }
}

EciesCipher::~EciesCipher() = default;

bool EciesCipher::is_valid_public_key(const Bytes& public_key) const {
    if (public_key.size() != PUBLIC_KEY_COMPRESSED_LEN &&
        public_key.size() != PUBLIC_KEY_UNCOMPRESSED_LEN) {
        return false;
    }
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        return false;
    }
    return impl_->parse_point(public_key, ctx.get()).is_ok();
}

Result<Secp256k1Keypair> EciesCipher::generate_keypair() const {
    BnCtxPtr ctx(BN_CTX_new());
    BnPtr scalar(BN_new());
    if (!ctx || !scalar) {
        return make_error<Secp256k1Keypair>(ErrorCode::UNKNOWN_ERROR, "Allocation failed",
                                            "EciesCipher");
    }
    do {
        if (BN_priv_rand_range(scalar.get(), EC_GROUP_get0_order(impl_->group.get())) != 1) {
            return make_error<Secp256k1Keypair>(ErrorCode::ENCRYPTION_ERROR,
                                                "Failed to generate scalar", "EciesCipher");
        }
    } while (BN_is_zero(scalar.get()));

    Secp256k1Keypair pair;
    pair.private_key.assign(PRIVATE_KEY_LEN, 0);
    if (BN_bn2binpad(scalar.get(), pair.private_key.data(), PRIVATE_KEY_LEN) !=
        static_cast<int>(PRIVATE_KEY_LEN)) {
        return make_error<Secp256k1Keypair>(ErrorCode::UNKNOWN_ERROR, "BN_bn2binpad failed",
                                            "EciesCipher");
    }
    auto pub = impl_->multiply(EC_GROUP_get0_generator(impl_->group.get()), scalar.get(),
                               ctx.get());
    if (pub.is_error()) {
        return forward_error<Secp256k1Keypair>(pub);
    }
    pair.public_key = pub.value();
    return pair;
}

Result<Bytes> EciesCipher::public_key_for(const Bytes& private_key) const {
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        return make_error<Bytes>(ErrorCode::UNKNOWN_ERROR, "Allocation failed", "EciesCipher");
    }
    auto scalar = impl_->parse_scalar(private_key);
    if (scalar.is_error()) {
        return forward_error<Bytes>(scalar);
    }
    return impl_->multiply(EC_GROUP_get0_generator(impl_->group.get()), scalar.value().get(),
                           ctx.get());
}

Result<Bytes> EciesCipher::encrypt(const Bytes& recipient_public_key, const Bytes& plaintext,
                                   RandomSource& random) const {
    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        return make_error<Bytes>(ErrorCode::ENCRYPTION_ERROR, "Allocation failed",
                                 "EciesCipher");
    }

    auto recipient = impl_->parse_point(recipient_public_key, ctx.get());
    if (recipient.is_error()) {
        return forward_error<Bytes>(recipient);
    }

    auto ephemeral = generate_keypair();
    if (ephemeral.is_error()) {
        return forward_error<Bytes>(ephemeral);
    }
    auto ephemeral_scalar = impl_->parse_scalar(ephemeral.value().private_key);
    if (ephemeral_scalar.is_error()) {
        return forward_error<Bytes>(ephemeral_scalar);
    }

    auto shared = impl_->multiply(recipient.value().get(), ephemeral_scalar.value().get(),
                                  ctx.get());
    if (shared.is_error()) {
        return forward_error<Bytes>(shared);
    }
    auto key = impl_->derive_key(ephemeral.value().public_key, shared.value());
    if (key.is_error()) {
        return forward_error<Bytes>(key);
    }

    std::array<uint8_t, NONCE_LEN> nonce{};
    auto filled = random.fill(nonce.data(), nonce.size());
    if (filled.is_error()) {
        return make_error<Bytes>(ErrorCode::ENCRYPTION_ERROR,
                                 std::string("Failed to generate nonce: ") + filled.error()->what(),
                                 "EciesCipher");
    }

    CipherCtxPtr cipher(EVP_CIPHER_CTX_new());
    Bytes ciphertext(plaintext.size());
    std::array<uint8_t, TAG_LEN> tag{};
    int out_len = 0;
    int final_len = 0;
    bool ok = cipher &&
              EVP_EncryptInit_ex(cipher.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) ==
                  1 &&
              EVP_CIPHER_CTX_ctrl(cipher.get(), EVP_CTRL_GCM_SET_IVLEN,
                                  static_cast<int>(NONCE_LEN), nullptr) == 1 &&
              EVP_EncryptInit_ex(cipher.get(), nullptr, nullptr, key.value().data(),
                                 nonce.data()) == 1 &&
              EVP_EncryptUpdate(cipher.get(), ciphertext.data(), &out_len, plaintext.data(),
                                static_cast<int>(plaintext.size())) == 1 &&
              EVP_EncryptFinal_ex(cipher.get(), ciphertext.data() + out_len, &final_len) == 1 &&
              EVP_CIPHER_CTX_ctrl(cipher.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_LEN),
                                  tag.data()) == 1;
    if (!ok) {
        return make_error<Bytes>(ErrorCode::ENCRYPTION_ERROR, "AES-256-GCM encryption failed",
                                 "EciesCipher");
    }

    Bytes envelope;
    envelope.reserve(OVERHEAD + plaintext.size());
    envelope.insert(envelope.end(), ephemeral.value().public_key.begin(),
                    ephemeral.value().public_key.end());
    envelope.insert(envelope.end(), nonce.begin(), nonce.end());
    envelope.insert(envelope.end(), tag.begin(), tag.end());
    envelope.insert(envelope.end(), ciphertext.begin(),
                    ciphertext.begin() + out_len + final_len);
    return envelope;
}

Result<Bytes> EciesCipher::decrypt(const Bytes& private_key, const Bytes& envelope) const {
    if (envelope.size() < OVERHEAD) {
        return make_error<Bytes>(ErrorCode::DECRYPTION_ERROR,
                                 "Envelope shorter than ECIES overhead", "EciesCipher");
    }

    BnCtxPtr ctx(BN_CTX_new());
    if (!ctx) {
        return make_error<Bytes>(ErrorCode::DECRYPTION_ERROR, "Allocation failed",
                                 "EciesCipher");
    }

    auto scalar = impl_->parse_scalar(private_key);
    if (scalar.is_error()) {
        return make_error<Bytes>(ErrorCode::DECRYPTION_ERROR, scalar.error()->what(),
                                 "EciesCipher");
    }

    Bytes ephemeral_public(envelope.begin(), envelope.begin() + PUBLIC_KEY_UNCOMPRESSED_LEN);
    auto ephemeral = impl_->parse_point(ephemeral_public, ctx.get());
    if (ephemeral.is_error()) {
        return make_error<Bytes>(ErrorCode::DECRYPTION_ERROR,
                                 "Envelope carries an invalid ephemeral key", "EciesCipher");
    }

    auto shared = impl_->multiply(ephemeral.value().get(), scalar.value().get(), ctx.get());
    if (shared.is_error()) {
        return make_error<Bytes>(ErrorCode::DECRYPTION_ERROR, shared.error()->what(),
                                 "EciesCipher");
    }
    auto key = impl_->derive_key(ephemeral_public, shared.value());
    if (key.is_error()) {
        return make_error<Bytes>(ErrorCode::DECRYPTION_ERROR, key.error()->what(),
                                 "EciesCipher");
    }

    const uint8_t* nonce = envelope.data() + PUBLIC_KEY_UNCOMPRESSED_LEN;
    const uint8_t* tag = nonce + NONCE_LEN;
    const uint8_t* body = tag + TAG_LEN;
    const size_t body_len = envelope.size() - OVERHEAD;

    std::array<uint8_t, TAG_LEN> tag_copy{};
    std::copy(tag, tag + TAG_LEN, tag_copy.begin());

    CipherCtxPtr cipher(EVP_CIPHER_CTX_new());
    Bytes plaintext(body_len);
    int out_len = 0;
    int final_len = 0;
    bool ok = cipher &&
              EVP_DecryptInit_ex(cipher.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) ==
                  1 &&
              EVP_CIPHER_CTX_ctrl(cipher.get(), EVP_CTRL_GCM_SET_IVLEN,
                                  static_cast<int>(NONCE_LEN), nullptr) == 1 &&
              EVP_DecryptInit_ex(cipher.get(), nullptr, nullptr, key.value().data(), nonce) ==
                  1 &&
              EVP_DecryptUpdate(cipher.get(), plaintext.data(), &out_len, body,
                                static_cast<int>(body_len)) == 1 &&
              EVP_CIPHER_CTX_ctrl(cipher.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_LEN),
                                  tag_copy.data()) == 1 &&
              EVP_DecryptFinal_ex(cipher.get(), plaintext.data() + out_len, &final_len) == 1;
    if (!ok) {
        return make_error<Bytes>(ErrorCode::DECRYPTION_ERROR,
                                 "Authentication failed: wrong key or corrupted ciphertext",
                                 "EciesCipher");
    }
    plaintext.resize(static_cast<size_t>(out_len + final_len));
    return plaintext;
}

}  // namespace crypto
}  // namespace shroud
