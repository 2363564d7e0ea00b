// src/crypto/openssl_handles.hpp
#pragma once

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <memory>

namespace shroud {
namespace crypto {
namespace detail {

struct BnDeleter {
    void operator()(BIGNUM* p) const {
        BN_clear_free(p);
    }
};
struct BnCtxDeleter {
    void operator()(BN_CTX* p) const {
        BN_CTX_free(p);
    }
};
struct EcGroupDeleter {
    void operator()(EC_GROUP* p) const {
        EC_GROUP_free(p);
    }
};
struct EcPointDeleter {
    void operator()(EC_POINT* p) const {
        EC_POINT_clear_free(p);
    }
};
struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const {
        EVP_PKEY_free(p);
    }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* p) const {
        EVP_MD_CTX_free(p);
    }
};
struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* p) const {
        EVP_CIPHER_CTX_free(p);
    }
};
struct KdfDeleter {
    void operator()(EVP_KDF* p) const {
        EVP_KDF_free(p);
    }
};
struct KdfCtxDeleter {
    void operator()(EVP_KDF_CTX* p) const {
        EVP_KDF_CTX_free(p);
    }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using EcGroupPtr = std::unique_ptr<EC_GROUP, EcGroupDeleter>;
using EcPointPtr = std::unique_ptr<EC_POINT, EcPointDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;
using KdfPtr = std::unique_ptr<EVP_KDF, KdfDeleter>;
using KdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, KdfCtxDeleter>;

}  // namespace detail
}  // namespace crypto
}  // namespace shroud
