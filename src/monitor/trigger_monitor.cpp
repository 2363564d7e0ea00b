// src/monitor/trigger_monitor.cpp

#include "shroud/monitor/trigger_monitor.hpp"
#include <limits>
#include "shroud/core/logger.hpp"
#include "shroud/core/time_utils.hpp"

namespace shroud {
namespace monitor {

namespace {

using int128 = __int128;

// Oracle exponents stay well inside this band; with it, |raw| < 2^63 and
// 10^18 < 2^60 keep every product below 2^123
constexpr int32_t MIN_EXPO = -18;
constexpr int32_t MAX_EXPO = 12;

int128 pow10(int n) {
    int128 v = 1;
    for (int i = 0; i < n; ++i) {
        v *= 10;
    }
    return v;
}

int128 floor_div(int128 a, int128 b) {
    int128 q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

}  // namespace

std::string trigger_outcome_to_string(TriggerOutcome outcome) {
    switch (outcome) {
        case TriggerOutcome::MATCHED:
            return "MATCHED";
        case TriggerOutcome::NOT_MET:
            return "NOT_MET";
        case TriggerOutcome::NO_PRICE:
            return "NO_PRICE";
        case TriggerOutcome::STALE_PRICE:
            return "STALE_PRICE";
        case TriggerOutcome::EXPIRED:
            return "EXPIRED";
        case TriggerOutcome::BAD_PRICE:
            return "BAD_PRICE";
        default:
            return "UNKNOWN";
    }
}

std::optional<int64_t> to_price_precision(int64_t raw, int32_t expo) {
    if (expo < MIN_EXPO || expo > MAX_EXPO) {
        return std::nullopt;
    }
    const int scale = expo + 6;
    int128 value = scale >= 0 ? static_cast<int128>(raw) * pow10(scale)
                              : floor_div(static_cast<int128>(raw), pow10(-scale));
    if (value > std::numeric_limits<int64_t>::max() ||
        value < std::numeric_limits<int64_t>::min()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

std::optional<int> compare_to_trigger(int64_t raw, int32_t expo, int64_t trigger_price) {
    if (expo < MIN_EXPO || expo > MAX_EXPO) {
        return std::nullopt;
    }
    // raw × 10^expo  vs  trigger × 10^-6, both sides scaled by 10^6
    const int scale = expo + 6;
    int128 lhs = raw;
    int128 rhs = trigger_price;
    if (scale >= 0) {
        lhs *= pow10(scale);
    } else {
        rhs *= pow10(-scale);
    }
    return lhs < rhs ? -1 : (lhs > rhs ? 1 : 0);
}

TriggerMonitor::TriggerMonitor(std::shared_ptr<PriceSource> source, const Clock& clock,
                               PriceFeedConfig config)
    : source_(std::move(source)), clock_(clock), config_(config) {}

Result<void> TriggerMonitor::refresh(const std::vector<Hash32>& feed_ids) {
    if (feed_ids.empty()) {
        return Result<void>();
    }
    auto quotes = source_->fetch_latest(feed_ids);
    if (quotes.is_error()) {
        WARN("Price refresh failed: " << quotes.error()->what());
        return make_error<void>(quotes.error()->code(), quotes.error()->what(), "TriggerMonitor");
    }

    const int64_t now_ms = clock_.now_ms();
    std::lock_guard<std::mutex> lock(mutex_);
    for (PriceQuote quote : quotes.value()) {
        quote.received_at_ms = now_ms;
        auto it = prices_.find(quote.feed_id);
        if (it != prices_.end() && it->second.publish_time > quote.publish_time) {
            continue;
        }
        prices_[quote.feed_id] = quote;
    }
    TRACE("Refreshed " << quotes.value().size() << " of " << feed_ids.size() << " feeds");
    return Result<void>();
}

std::optional<PriceQuote> TriggerMonitor::latest(const Hash32& feed_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = prices_.find(feed_id);
    if (it == prices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TriggerMonitor::is_fresh(const PriceQuote& quote) const {
    return clock_.now_seconds() - quote.publish_time <= config_.staleness_seconds;
}

TriggerEvaluation TriggerMonitor::evaluate(const order::OrderPayload& order) const {
    TriggerEvaluation eval;
    if (order.is_expired(clock_.now_seconds())) {
        eval.outcome = TriggerOutcome::EXPIRED;
        return eval;
    }

    eval.quote = latest(order.feed_id);
    if (!eval.quote) {
        eval.outcome = TriggerOutcome::NO_PRICE;
        return eval;
    }
    if (!is_fresh(*eval.quote)) {
        DEBUG("Price for order " << order.order_id << " published at "
                                 << core::format_unix_utc(eval.quote->publish_time)
                                 << " is stale");
        eval.outcome = TriggerOutcome::STALE_PRICE;
        return eval;
    }

    auto execution_price = to_price_precision(eval.quote->price, eval.quote->expo);
    if (!execution_price || eval.quote->price <= 0) {
        eval.outcome = TriggerOutcome::BAD_PRICE;
        return eval;
    }
    eval.execution_price = *execution_price;

    const auto cmp = compare_to_trigger(eval.quote->price, eval.quote->expo, order.trigger_price);
    if (!cmp) {
        eval.outcome = TriggerOutcome::BAD_PRICE;
        return eval;
    }
    const bool hit =
        order.trigger_condition == order::TriggerCondition::ABOVE ? *cmp >= 0 : *cmp <= 0;
    eval.outcome = hit ? TriggerOutcome::MATCHED : TriggerOutcome::NOT_MET;
    return eval;
}

}  // namespace monitor
}  // namespace shroud
