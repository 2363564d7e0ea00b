// include/shroud/crypto/secure_random.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include "shroud/core/error.hpp"
#include "shroud/core/types.hpp"

namespace shroud {
namespace crypto {

/**
 * @brief Source of cryptographically secure random bytes
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Fill a buffer with random bytes
     * @return ENCRYPTION_ERROR if the generator could not be seeded
     */
    virtual Result<void> fill(uint8_t* out, size_t len) = 0;

    /**
     * @brief Uniform index in [0, bound)
     */
    Result<size_t> uniform_index(size_t bound);
};

/**
 * @brief RandomSource backed by OpenSSL's RAND_bytes
 */
class OpenSslRandom : public RandomSource {
public:
    Result<void> fill(uint8_t* out, size_t len) override;
};

}  // namespace crypto
}  // namespace shroud
