// include/shroud/chain/keypair.hpp
#pragma once

#include <string>
#include "shroud/chain/public_key.hpp"
#include "shroud/crypto/ed25519.hpp"
#include "shroud/crypto/secure_random.hpp"

namespace shroud {
namespace chain {

/**
 * @brief Ed25519 signing keypair for transaction fee payers and executors
 */
class Keypair {
public:
    Keypair() : seed_{} {}

    static Result<Keypair> from_seed(const crypto::Ed25519Seed& seed);

    /**
     * @brief Accept a 32-byte seed or a 64-byte seed||public secret key
     * @return VALIDATION_ERROR if the embedded public half does not match the seed
     */
    static Result<Keypair> from_secret_key(const Bytes& secret);

    /**
     * @brief Hex form of from_secret_key, as supplied through the environment
     */
    static Result<Keypair> from_hex(const std::string& hex);

    static Result<Keypair> generate(crypto::RandomSource& random);

    const PublicKey& public_key() const {
        return public_key_;
    }

    Result<Signature64> sign(const Bytes& message) const;

private:
    crypto::Ed25519Seed seed_;
    PublicKey public_key_;
};

}  // namespace chain
}  // namespace shroud
