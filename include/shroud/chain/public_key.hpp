// include/shroud/chain/public_key.hpp
#pragma once

#include <array>
#include <functional>
#include <string>
#include <vector>
#include "shroud/core/error.hpp"
#include "shroud/core/types.hpp"

namespace shroud {
namespace chain {

/**
 * @brief 32-byte account address
 */
class PublicKey {
public:
    static constexpr size_t LENGTH = 32;
    using Bytes32 = std::array<uint8_t, LENGTH>;

    PublicKey() : bytes_{} {}
    explicit PublicKey(const Bytes32& bytes) : bytes_(bytes) {}

    /**
     * @brief Parse a base58 address
     * @return INVALID_ARGUMENT if the text is not base58 or not 32 bytes
     */
    static Result<PublicKey> from_base58(const std::string& text);

    /**
     * @brief Parse a base58 address known at build time
     * @throws ShroudError if the literal is malformed
     */
    static PublicKey from_literal(const char* text);

    std::string to_base58() const;

    const Bytes32& bytes() const {
        return bytes_;
    }
    Bytes32& bytes() {
        return bytes_;
    }

    Bytes to_bytes() const {
        return Bytes(bytes_.begin(), bytes_.end());
    }

    bool is_zero() const;

    bool operator==(const PublicKey& other) const {
        return bytes_ == other.bytes_;
    }
    bool operator!=(const PublicKey& other) const {
        return bytes_ != other.bytes_;
    }
    bool operator<(const PublicKey& other) const {
        return bytes_ < other.bytes_;
    }

private:
    Bytes32 bytes_;
};

struct PublicKeyHash {
    size_t operator()(const PublicKey& key) const noexcept;
};

/**
 * @brief Program-derived address and the bump seed that produced it
 */
struct ProgramAddress {
    PublicKey address;
    uint8_t bump{0};
};

using Seeds = std::vector<Bytes>;

/**
 * @brief Seed helpers
 */
Bytes seed(const std::string& text);
Bytes seed(const PublicKey& key);
Bytes seed(const Hash32& bytes);
Bytes seed_u16_le(uint16_t value);

/**
 * @brief sha256(seeds || program_id || "ProgramDerivedAddress"), rejected if on-curve
 * @return VALIDATION_ERROR for oversized seeds or an on-curve result
 */
Result<PublicKey> create_program_address(const Seeds& seeds, const PublicKey& program_id);

/**
 * @brief Search bumps 255..0 for the first off-curve program address
 */
Result<ProgramAddress> find_program_address(const Seeds& seeds, const PublicKey& program_id);

}  // namespace chain
}  // namespace shroud

namespace std {
template <>
struct hash<shroud::chain::PublicKey> : shroud::chain::PublicKeyHash {};
}  // namespace std
