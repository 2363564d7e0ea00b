// include/shroud/order/order_payload.hpp
#pragma once

#include <cstdint>
#include <optional>
#include "shroud/chain/public_key.hpp"
#include "shroud/core/byte_layout.hpp"

namespace shroud {
namespace order {

/**
 * @brief Trigger direction: ABOVE fires at price >= trigger, BELOW at price <= trigger
 */
enum class TriggerCondition : uint8_t { ABOVE = 0, BELOW = 1 };

enum class OrderSide : uint8_t { LONG = 0, SHORT = 1 };

/**
 * @brief Scale of trigger_price and execution prices (1e6 fixed point)
 */
constexpr int64_t PRICE_PRECISION = 1000000;

/**
 * @brief Private order parameters carried inside the ciphertext
 */
struct OrderPayload {
    static constexpr size_t ENCODED_LEN = 144;
    static constexpr size_t USED_LEN = 117;
    static constexpr size_t MAX_CIPHERTEXT_LEN = 256;

    chain::PublicKey owner;
    uint64_t order_id{0};
    uint16_t market_index{0};
    int64_t trigger_price{0};  // PRICE_PRECISION scale
    TriggerCondition trigger_condition{TriggerCondition::ABOVE};
    OrderSide side{OrderSide::LONG};
    uint64_t base_asset_amount{0};
    bool reduce_only{false};
    int64_t expiry{0};  // unix seconds, 0 = never
    Hash32 feed_id{};
    std::optional<Salt16> salt;

    bool is_expired(int64_t now_seconds) const {
        return expiry > 0 && now_seconds > expiry;
    }

    /**
     * @brief Inclusive trigger check against a PRICE_PRECISION-scaled price
     */
    bool trigger_holds(int64_t price) const {
        return trigger_condition == TriggerCondition::ABOVE ? price >= trigger_price
                                                            : price <= trigger_price;
    }
};

/**
 * @brief Field order and widths of the canonical order encoding
 *
 * Shared by encode and decode. The salt must be present when encoding.
 */
template <typename IO, typename Payload>
void describe_order_layout(IO& io, Payload& p, Salt16& salt) {
    io.field(p.owner.bytes());
    io.field(p.order_id);
    io.field(p.market_index);
    io.field(p.trigger_price);
    io.enum_u8(p.trigger_condition);
    io.enum_u8(p.side);
    io.field(p.base_asset_amount);
    io.flag(p.reduce_only);
    io.field(p.expiry);
    io.field(p.feed_id);
    io.field(salt);
}

}  // namespace order
}  // namespace shroud
