// include/shroud/monitor/trigger_monitor.hpp
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "shroud/core/clock.hpp"
#include "shroud/monitor/price_source.hpp"
#include "shroud/order/order_payload.hpp"

namespace shroud {
namespace monitor {

enum class TriggerOutcome { MATCHED, NOT_MET, NO_PRICE, STALE_PRICE, EXPIRED, BAD_PRICE };

std::string trigger_outcome_to_string(TriggerOutcome outcome);

struct TriggerEvaluation {
    TriggerOutcome outcome{TriggerOutcome::NO_PRICE};
    std::optional<PriceQuote> quote;
    int64_t execution_price{0};  // PRICE_PRECISION scale, floor of the feed price

    bool matched() const {
        return outcome == TriggerOutcome::MATCHED;
    }
};

/**
 * @brief Converts a feed price to PRICE_PRECISION fixed point, rounding down
 * @return std::nullopt if the exponent is outside the oracle range or the result overflows
 */
std::optional<int64_t> to_price_precision(int64_t raw, int32_t expo);

/**
 * @brief Exact comparison of raw × 10^expo against trigger × 10^-6
 * @return negative, zero or positive like strcmp; std::nullopt if the exponent is
 *         outside the oracle range
 */
std::optional<int> compare_to_trigger(int64_t raw, int32_t expo, int64_t trigger_price);

/**
 * @brief Last-known prices per feed and trigger evaluation against them
 */
class TriggerMonitor {
public:
    TriggerMonitor(std::shared_ptr<PriceSource> source, const Clock& clock,
                   PriceFeedConfig config = PriceFeedConfig{});

    /**
     * @brief Pull fresh quotes for the given feeds; keeps the newer of old and new
     */
    Result<void> refresh(const std::vector<Hash32>& feed_ids);

    std::optional<PriceQuote> latest(const Hash32& feed_id) const;

    bool is_fresh(const PriceQuote& quote) const;

    /**
     * @brief Inclusive trigger check on the cached price
     */
    TriggerEvaluation evaluate(const order::OrderPayload& order) const;

    const PriceFeedConfig& config() const {
        return config_;
    }

private:
    std::shared_ptr<PriceSource> source_;
    const Clock& clock_;
    PriceFeedConfig config_;

    mutable std::mutex mutex_;
    std::map<Hash32, PriceQuote> prices_;
};

}  // namespace monitor
}  // namespace shroud
