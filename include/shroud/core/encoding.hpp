// include/shroud/core/encoding.hpp
#pragma once

#include <algorithm>
#include <array>
#include <string>
#include "shroud/core/error.hpp"
#include "shroud/core/types.hpp"

namespace shroud {
namespace encoding {

/**
 * @brief Lowercase hex encoding
 */
std::string to_hex(const uint8_t* data, size_t len);
std::string to_hex(const Bytes& data);

template <size_t N>
std::string to_hex(const std::array<uint8_t, N>& data) {
    return to_hex(data.data(), N);
}

/**
 * @brief Decode hex, accepting an optional "0x" prefix and either case
 * @return Decoded bytes, or INVALID_ARGUMENT on odd length or non-hex input
 */
Result<Bytes> from_hex(const std::string& hex);

/**
 * @brief Decode hex that must be exactly N bytes long
 */
template <size_t N>
Result<std::array<uint8_t, N>> from_hex_fixed(const std::string& hex) {
    auto decoded = from_hex(hex);
    if (decoded.is_error()) {
        return forward_error<std::array<uint8_t, N>>(decoded);
    }
    if (decoded.value().size() != N) {
        return make_error<std::array<uint8_t, N>>(
            ErrorCode::INVALID_ARGUMENT,
            "Expected " + std::to_string(N) + " bytes of hex, got " +
                std::to_string(decoded.value().size()),
            "Encoding");
    }
    std::array<uint8_t, N> out{};
    std::copy(decoded.value().begin(), decoded.value().end(), out.begin());
    return out;
}

/**
 * @brief Bitcoin-alphabet base58 (Solana addresses, signatures)
 */
std::string to_base58(const uint8_t* data, size_t len);
std::string to_base58(const Bytes& data);
Result<Bytes> from_base58(const std::string& text);

/**
 * @brief Standard padded base64 (wire transactions, RPC account data)
 */
std::string to_base64(const Bytes& data);
Result<Bytes> from_base64(const std::string& text);

}  // namespace encoding
}  // namespace shroud
