#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include "../core/test_base.hpp"
#include "../mocks/fakes.hpp"
#include "shroud/core/clock.hpp"
#include "shroud/monitor/trigger_monitor.hpp"

using namespace shroud;
using namespace shroud::monitor;
using shroud::testing::FakePriceSource;
using shroud::testing::sample_order;
using shroud::testing::test_hash;
using shroud::testing::test_key;

namespace {

constexpr int64_t NOW_SECONDS = 1760000000;
constexpr int32_t PYTH_EXPO = -8;

int64_t pyth_price(int64_t dollars) {
    return dollars * 100000000;
}

}  // namespace

class TriggerMonitorTest : public shroud::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        source = std::make_shared<FakePriceSource>();
        feed = test_hash(0xef);
    }

    std::unique_ptr<TriggerMonitor> make_monitor(PriceFeedConfig config = {}) {
        return std::make_unique<TriggerMonitor>(source, clock, config);
    }

    std::shared_ptr<FakePriceSource> source;
    ManualClock clock{NOW_SECONDS * 1000};
    Hash32 feed;
};

TEST_F(TriggerMonitorTest, BelowTriggerIsInclusive) {
    auto monitor = make_monitor();
    order::OrderPayload stop = sample_order(test_key(1));

    source->set_price(feed, pyth_price(185), PYTH_EXPO, NOW_SECONDS);
    ASSERT_TRUE(monitor->refresh({feed}).is_ok());
    EXPECT_EQ(monitor->evaluate(stop).outcome, TriggerOutcome::NOT_MET);

    source->set_price(feed, pyth_price(180), PYTH_EXPO, NOW_SECONDS + 1);
    ASSERT_TRUE(monitor->refresh({feed}).is_ok());
    auto eval = monitor->evaluate(stop);
    EXPECT_EQ(eval.outcome, TriggerOutcome::MATCHED);
    EXPECT_EQ(eval.execution_price, 180 * order::PRICE_PRECISION);
}

TEST_F(TriggerMonitorTest, AboveTriggerIsInclusive) {
    auto monitor = make_monitor();
    order::OrderPayload take_profit = sample_order(test_key(1));
    take_profit.trigger_condition = order::TriggerCondition::ABOVE;

    source->set_price(feed, pyth_price(180) - 1, PYTH_EXPO, NOW_SECONDS);
    ASSERT_TRUE(monitor->refresh({feed}).is_ok());
    EXPECT_EQ(monitor->evaluate(take_profit).outcome, TriggerOutcome::NOT_MET);

    source->set_price(feed, pyth_price(180), PYTH_EXPO, NOW_SECONDS);
    ASSERT_TRUE(monitor->refresh({feed}).is_ok());
    EXPECT_TRUE(monitor->evaluate(take_profit).matched());
}

TEST_F(TriggerMonitorTest, SubPrecisionDifferenceStillCompares) {
    // 180.000000001 with expo -9 is above 180.000000 even though it floors to it
    auto monitor = make_monitor();
    order::OrderPayload stop = sample_order(test_key(1));
    source->set_price(feed, 180000000001LL, -9, NOW_SECONDS);
    ASSERT_TRUE(monitor->refresh({feed}).is_ok());

    auto eval = monitor->evaluate(stop);
    EXPECT_EQ(eval.outcome, TriggerOutcome::NOT_MET);
    EXPECT_EQ(eval.execution_price, 180 * order::PRICE_PRECISION);
}

TEST_F(TriggerMonitorTest, StaleMissingAndExpired) {
    auto monitor = make_monitor();
    order::OrderPayload stop = sample_order(test_key(1));
    EXPECT_EQ(monitor->evaluate(stop).outcome, TriggerOutcome::NO_PRICE);

    source->set_price(feed, pyth_price(170), PYTH_EXPO, NOW_SECONDS - 60);
    ASSERT_TRUE(monitor->refresh({feed}).is_ok());
    EXPECT_TRUE(monitor->evaluate(stop).matched());

    clock.advance_ms(1000);
    EXPECT_EQ(monitor->evaluate(stop).outcome, TriggerOutcome::STALE_PRICE);

    order::OrderPayload expired = stop;
    expired.expiry = NOW_SECONDS - 10;
    EXPECT_EQ(monitor->evaluate(expired).outcome, TriggerOutcome::EXPIRED);
}

TEST_F(TriggerMonitorTest, NonPositivePriceIsRejected) {
    auto monitor = make_monitor();
    source->set_price(feed, 0, PYTH_EXPO, NOW_SECONDS);
    ASSERT_TRUE(monitor->refresh({feed}).is_ok());
    EXPECT_EQ(monitor->evaluate(sample_order(test_key(1))).outcome, TriggerOutcome::BAD_PRICE);
}

TEST_F(TriggerMonitorTest, OlderQuoteDoesNotReplaceNewer) {
    auto monitor = make_monitor();
    source->set_price(feed, pyth_price(190), PYTH_EXPO, NOW_SECONDS);
    ASSERT_TRUE(monitor->refresh({feed}).is_ok());
    source->set_price(feed, pyth_price(150), PYTH_EXPO, NOW_SECONDS - 5);
    ASSERT_TRUE(monitor->refresh({feed}).is_ok());

    auto quote = monitor->latest(feed);
    ASSERT_TRUE(quote.has_value());
    EXPECT_EQ(quote->price, pyth_price(190));
    EXPECT_EQ(quote->received_at_ms, NOW_SECONDS * 1000);
}

TEST_F(TriggerMonitorTest, RefreshFailureKeepsCache) {
    auto monitor = make_monitor();
    source->set_price(feed, pyth_price(170), PYTH_EXPO, NOW_SECONDS);
    ASSERT_TRUE(monitor->refresh({feed}).is_ok());

    source->fail = true;
    auto result = monitor->refresh({feed});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONNECTION_ERROR);
    EXPECT_TRUE(monitor->latest(feed).has_value());
}

TEST_F(TriggerMonitorTest, EmptyRefreshSkipsSource) {
    auto monitor = make_monitor();
    ASSERT_TRUE(monitor->refresh({}).is_ok());
    EXPECT_EQ(source->calls, 0);
}

TEST_F(TriggerMonitorTest, StalenessComesFromFeedConfig) {
    PriceFeedConfig config;
    config.staleness_seconds = 5;
    auto monitor = make_monitor(config);
    order::OrderPayload stop = sample_order(test_key(1));

    source->set_price(feed, pyth_price(170), PYTH_EXPO, NOW_SECONDS - 5);
    ASSERT_TRUE(monitor->refresh({feed}).is_ok());
    EXPECT_TRUE(monitor->evaluate(stop).matched());

    clock.advance_ms(1000);
    EXPECT_EQ(monitor->evaluate(stop).outcome, TriggerOutcome::STALE_PRICE);
}

TEST_F(TriggerMonitorTest, OutOfRangeExponentIsBadPrice) {
    auto monitor = make_monitor();
    source->set_price(feed, 9000000000000000000LL, 20, NOW_SECONDS);
    ASSERT_TRUE(monitor->refresh({feed}).is_ok());
    EXPECT_EQ(monitor->evaluate(sample_order(test_key(1))).outcome, TriggerOutcome::BAD_PRICE);
}

TEST(PricePrecisionTest, ScalesAndFloors) {
    EXPECT_EQ(to_price_precision(18512345678LL, -8).value(), 185123456);
    EXPECT_EQ(to_price_precision(-15, -7).value(), -2);
    EXPECT_EQ(to_price_precision(42, 0).value(), 42000000);
    EXPECT_FALSE(to_price_precision(1, 40).has_value());
    EXPECT_FALSE(to_price_precision(std::numeric_limits<int64_t>::max(), 0).has_value());
}

TEST(PricePrecisionTest, HugeExponentsAreRejectedBeforeScaling) {
    EXPECT_FALSE(to_price_precision(9000000000000000000LL, 20).has_value());
    EXPECT_FALSE(to_price_precision(std::numeric_limits<int64_t>::min(), 24).has_value());
    EXPECT_FALSE(to_price_precision(1, -40).has_value());
    EXPECT_FALSE(compare_to_trigger(9000000000000000000LL, 20, 180000000).has_value());
    EXPECT_FALSE(compare_to_trigger(1, -30, 180000000).has_value());

    // Largest accepted exponent still fits
    EXPECT_FALSE(to_price_precision(std::numeric_limits<int64_t>::max(), 12).has_value());
    EXPECT_EQ(compare_to_trigger(std::numeric_limits<int64_t>::max(), 12, 1).value(), 1);
    EXPECT_EQ(compare_to_trigger(std::numeric_limits<int64_t>::min(), 12, 1).value(), -1);
}

TEST(PricePrecisionTest, CompareUsesFullPrecision) {
    EXPECT_EQ(compare_to_trigger(18000000000LL, -8, 180000000).value(), 0);
    EXPECT_EQ(compare_to_trigger(18000000001LL, -8, 180000000).value(), 1);
    EXPECT_EQ(compare_to_trigger(17999999999LL, -8, 180000000).value(), -1);
}
