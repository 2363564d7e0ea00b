// src/crypto/secure_random.cpp

#include "shroud/crypto/secure_random.hpp"
#include <openssl/rand.h>
#include <limits>

namespace shroud {
namespace crypto {

Result<size_t> RandomSource::uniform_index(size_t bound) {
    if (bound == 0) {
        return make_error<size_t>(ErrorCode::INVALID_ARGUMENT, "Empty range", "RandomSource");
    }
    // Rejection sampling keeps the distribution uniform
    const uint64_t limit = std::numeric_limits<uint64_t>::max() -
                           (std::numeric_limits<uint64_t>::max() % bound);
    while (true) {
        uint64_t sample = 0;
        auto result = fill(reinterpret_cast<uint8_t*>(&sample), sizeof(sample));
        if (result.is_error()) {
            return forward_error<size_t>(result);
        }
        if (sample < limit) {
            return static_cast<size_t>(sample % bound);
        }
    }
}

Result<void> OpenSslRandom::fill(uint8_t* out, size_t len) {
    if (len == 0) {
        return Result<void>();
    }
    if (RAND_bytes(out, static_cast<int>(len)) != 1) {
        return make_error<void>(ErrorCode::ENCRYPTION_ERROR, "RAND_bytes failed",
                                "OpenSslRandom");
    }
    return Result<void>();
}

}  // namespace crypto
}  // namespace shroud
