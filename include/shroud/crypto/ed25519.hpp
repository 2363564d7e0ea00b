// include/shroud/crypto/ed25519.hpp
#pragma once

#include <array>
#include "shroud/core/error.hpp"
#include "shroud/core/types.hpp"

namespace shroud {
namespace crypto {

using Ed25519Seed = std::array<uint8_t, 32>;
using Ed25519PublicKey = std::array<uint8_t, 32>;

/**
 * @brief Derive the public key for a 32-byte Ed25519 seed
 */
Result<Ed25519PublicKey> ed25519_public_key(const Ed25519Seed& seed);

/**
 * @brief Sign a message with a 32-byte Ed25519 seed
 * @return 64-byte signature, or SIGNING_ERROR
 */
Result<Signature64> ed25519_sign(const Ed25519Seed& seed, const Bytes& message);

/**
 * @brief Verify a detached Ed25519 signature
 */
bool ed25519_verify(const Ed25519PublicKey& public_key, const Bytes& message,
                    const Signature64& signature);

/**
 * @brief True if the 32 bytes decompress to a point on the Ed25519 curve
 *
 * Program-derived addresses are only valid when this returns false.
 */
bool is_on_ed25519_curve(const uint8_t* compressed);

}  // namespace crypto
}  // namespace shroud
