// include/shroud/core/types.hpp

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace shroud {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Variable-length byte buffer
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief 32-byte digest (order commitments, feed ids)
 */
using Hash32 = std::array<uint8_t, 32>;

/**
 * @brief 16-byte random salt carried inside every order
 */
using Salt16 = std::array<uint8_t, 16>;

/**
 * @brief Ed25519 signature
 */
using Signature64 = std::array<uint8_t, 64>;

}  // namespace shroud
