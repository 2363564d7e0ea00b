// src/chain/keypair.cpp

#include "shroud/chain/keypair.hpp"
#include <algorithm>
#include "shroud/core/encoding.hpp"

namespace shroud {
namespace chain {

Result<Keypair> Keypair::from_seed(const crypto::Ed25519Seed& seed) {
    auto pub = crypto::ed25519_public_key(seed);
    if (pub.is_error()) {
        return forward_error<Keypair>(pub);
    }
    Keypair pair;
    pair.seed_ = seed;
    pair.public_key_ = PublicKey(pub.value());
    return pair;
}

Result<Keypair> Keypair::from_secret_key(const Bytes& secret) {
    if (secret.size() != 32 && secret.size() != 64) {
        return make_error<Keypair>(ErrorCode::VALIDATION_ERROR,
                                   "Secret key must be 32 or 64 bytes, got " +
                                       std::to_string(secret.size()),
                                   "Keypair");
    }
    crypto::Ed25519Seed seed{};
    std::copy(secret.begin(), secret.begin() + 32, seed.begin());
    auto pair = from_seed(seed);
    if (pair.is_error() || secret.size() == 32) {
        return pair;
    }

    PublicKey::Bytes32 embedded{};
    std::copy(secret.begin() + 32, secret.end(), embedded.begin());
    if (PublicKey(embedded) != pair.value().public_key()) {
        return make_error<Keypair>(ErrorCode::VALIDATION_ERROR,
                                   "Secret key public half does not match its seed", "Keypair");
    }
    return pair;
}

Result<Keypair> Keypair::from_hex(const std::string& hex) {
    auto bytes = encoding::from_hex(hex);
    if (bytes.is_error()) {
        return forward_error<Keypair>(bytes);
    }
    return from_secret_key(bytes.value());
}

Result<Keypair> Keypair::generate(crypto::RandomSource& random) {
    crypto::Ed25519Seed seed{};
    auto filled = random.fill(seed.data(), seed.size());
    if (filled.is_error()) {
        return forward_error<Keypair>(filled);
    }
    return from_seed(seed);
}

Result<Signature64> Keypair::sign(const Bytes& message) const {
    return crypto::ed25519_sign(seed_, message);
}

}  // namespace chain
}  // namespace shroud
