// src/crypto/ed25519.cpp

#include "shroud/crypto/ed25519.hpp"
#include <cstring>
#include "openssl_handles.hpp"

namespace shroud {
namespace crypto {

using detail::BnCtxPtr;
using detail::BnPtr;
using detail::MdCtxPtr;
using detail::PkeyPtr;

namespace {

PkeyPtr load_private(const Ed25519Seed& seed) {
    return PkeyPtr(
        EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
}

// Field constants for 2^255 - 19
struct CurveConstants {
    BnPtr p;
    BnPtr d;
    BnPtr euler_exponent;  // (p - 1) / 2
};

bool load_curve_constants(CurveConstants& c, BN_CTX* ctx) {
    c.p.reset(BN_new());
    c.d.reset(BN_new());
    c.euler_exponent.reset(BN_new());
    BnPtr tmp(BN_new());
    BnPtr inv(BN_new());
    if (!c.p || !c.d || !c.euler_exponent || !tmp || !inv) {
        return false;
    }

    // p = 2^255 - 19
    if (BN_one(c.p.get()) != 1 || BN_lshift(c.p.get(), c.p.get(), 255) != 1 ||
        BN_sub_word(c.p.get(), 19) != 1) {
        return false;
    }

    // d = -121665 / 121666 mod p
    if (BN_set_word(tmp.get(), 121666) != 1 ||
        BN_mod_inverse(inv.get(), tmp.get(), c.p.get(), ctx) == nullptr ||
        BN_set_word(tmp.get(), 121665) != 1 ||
        BN_mod_mul(c.d.get(), tmp.get(), inv.get(), c.p.get(), ctx) != 1 ||
        BN_sub(c.d.get(), c.p.get(), c.d.get()) != 1) {
        return false;
    }

    if (BN_copy(c.euler_exponent.get(), c.p.get()) == nullptr ||
        BN_sub_word(c.euler_exponent.get(), 1) != 1 ||
        BN_rshift1(c.euler_exponent.get(), c.euler_exponent.get()) != 1) {
        return false;
    }
    return true;
}

}  // namespace

Result<Ed25519PublicKey> ed25519_public_key(const Ed25519Seed& seed) {
    PkeyPtr pkey = load_private(seed);
    if (!pkey) {
        return make_error<Ed25519PublicKey>(ErrorCode::SIGNING_ERROR,
                                            "Failed to load Ed25519 seed", "Ed25519");
    }
    Ed25519PublicKey out{};
    size_t len = out.size();
    if (EVP_PKEY_get_raw_public_key(pkey.get(), out.data(), &len) != 1 || len != out.size()) {
        return make_error<Ed25519PublicKey>(ErrorCode::SIGNING_ERROR,
                                            "Failed to derive Ed25519 public key", "Ed25519");
    }
    return out;
}

Result<Signature64> ed25519_sign(const Ed25519Seed& seed, const Bytes& message) {
    PkeyPtr pkey = load_private(seed);
    MdCtxPtr md(EVP_MD_CTX_new());
    if (!pkey || !md) {
        return make_error<Signature64>(ErrorCode::SIGNING_ERROR,
                                       "Failed to initialize Ed25519 signer", "Ed25519");
    }
    if (EVP_DigestSignInit(md.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return make_error<Signature64>(ErrorCode::SIGNING_ERROR, "EVP_DigestSignInit failed",
                                       "Ed25519");
    }
    Signature64 sig{};
    size_t sig_len = sig.size();
    if (EVP_DigestSign(md.get(), sig.data(), &sig_len, message.data(), message.size()) != 1 ||
        sig_len != sig.size()) {
        return make_error<Signature64>(ErrorCode::SIGNING_ERROR, "EVP_DigestSign failed",
                                       "Ed25519");
    }
    return sig;
}

bool ed25519_verify(const Ed25519PublicKey& public_key, const Bytes& message,
                    const Signature64& signature) {
    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(),
                                             public_key.size()));
    MdCtxPtr md(EVP_MD_CTX_new());
    if (!pkey || !md) {
        return false;
    }
    if (EVP_DigestVerifyInit(md.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(md.get(), signature.data(), signature.size(), message.data(),
                            message.size()) == 1;
}

bool is_on_ed25519_curve(const uint8_t* compressed) {
    BnCtxPtr ctx(BN_CTX_new());
    CurveConstants c;
    if (!ctx || !load_curve_constants(c, ctx.get())) {
        throw ShroudError(ErrorCode::UNKNOWN_ERROR, "Failed to load curve constants",
                          "Ed25519");
    }

    uint8_t y_bytes[32];
    std::memcpy(y_bytes, compressed, sizeof(y_bytes));
    y_bytes[31] &= 0x7f;  // drop the x sign bit

    BnPtr y(BN_lebin2bn(y_bytes, sizeof(y_bytes), nullptr));
    BnPtr y2(BN_new());
    BnPtr u(BN_new());
    BnPtr v(BN_new());
    BnPtr w(BN_new());
    BnPtr chi(BN_new());
    if (!y || !y2 || !u || !v || !w || !chi) {
        throw ShroudError(ErrorCode::UNKNOWN_ERROR, "BIGNUM allocation failed", "Ed25519");
    }

    // u = y^2 - 1, v = d*y^2 + 1; on the curve iff u/v is a square mod p
    bool ok = BN_nnmod(y.get(), y.get(), c.p.get(), ctx.get()) == 1 &&
              BN_mod_sqr(y2.get(), y.get(), c.p.get(), ctx.get()) == 1 &&
              BN_copy(u.get(), y2.get()) != nullptr &&
              BN_sub_word(u.get(), 1) == 1 &&
              BN_nnmod(u.get(), u.get(), c.p.get(), ctx.get()) == 1 &&
              BN_mod_mul(v.get(), c.d.get(), y2.get(), c.p.get(), ctx.get()) == 1 &&
              BN_add_word(v.get(), 1) == 1 &&
              BN_nnmod(v.get(), v.get(), c.p.get(), ctx.get()) == 1;
    if (!ok) {
        throw ShroudError(ErrorCode::UNKNOWN_ERROR, "Curve arithmetic failed", "Ed25519");
    }

    if (BN_is_zero(u.get())) {
        return true;
    }

    ok = BN_mod_inverse(w.get(), v.get(), c.p.get(), ctx.get()) != nullptr &&
         BN_mod_mul(w.get(), u.get(), w.get(), c.p.get(), ctx.get()) == 1 &&
         BN_mod_exp(chi.get(), w.get(), c.euler_exponent.get(), c.p.get(), ctx.get()) == 1;
    if (!ok) {
        throw ShroudError(ErrorCode::UNKNOWN_ERROR, "Curve arithmetic failed", "Ed25519");
    }
    return BN_is_one(chi.get());
}

}  // namespace crypto
}  // namespace shroud
