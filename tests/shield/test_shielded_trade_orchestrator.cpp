#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>
#include "../core/test_base.hpp"
#include "../mocks/fakes.hpp"
#include "shroud/core/byte_layout.hpp"
#include "shroud/program/program_ids.hpp"
#include "shroud/shield/shielded_trade_orchestrator.hpp"

using namespace shroud;
using namespace shroud::shield;
using shroud::testing::FakePerpSource;
using shroud::testing::FakePrivacySource;
using shroud::testing::FakeRelay;
using shroud::testing::FakeRpcClient;

class ShieldedTradeOrchestratorTest : public shroud::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        rpc = std::make_shared<FakeRpcClient>();
        relay = std::make_shared<FakeRelay>();
        privacy = std::make_shared<FakePrivacySource>();
        perps = std::make_shared<FakePerpSource>();

        bundle::BundleConfig bundle_config;
        bundle_config.poll_interval_ms = 0;
        bundle_config.poll_attempts = 2;
        bundle_config.max_retries = 1;
        bundles = std::make_shared<bundle::BundleSubmitter>(rpc, relay, random, bundle_config);

        crypto::Ed25519Seed seed{};
        seed.fill(0x31);
        owner = chain::Keypair::from_seed(seed).value();

        pending_file = (std::filesystem::temp_directory_path() / "shroud_pending_test.json").string();
        std::remove(pending_file.c_str());
    }

    void TearDown() override {
        std::remove(pending_file.c_str());
        TestBase::TearDown();
    }

    std::unique_ptr<ShieldedTradeOrchestrator> make(ShieldConfig config = ShieldConfig{}) {
        auto orchestrator =
            std::make_unique<ShieldedTradeOrchestrator>(bundles, privacy, perps, clock, config);
        EXPECT_TRUE(orchestrator->initialize().is_ok());
        return orchestrator;
    }

    // One-byte tags of the fake instructions in the last simulated transaction
    std::vector<uint8_t> last_tags() const {
        std::vector<uint8_t> tags;
        if (rpc->simulated.empty()) {
            return tags;
        }
        for (const auto& ix : rpc->simulated.back().message().instructions()) {
            if (ix.data.size() == 1) {
                tags.push_back(ix.data[0]);
            }
        }
        return tags;
    }

    ClosePositionRequest close_request(int64_t collateral, int64_t pnl) const {
        ClosePositionRequest request;
        request.position.market_index = 0;
        request.position.base_asset_amount = 1000000000;
        request.position.collateral = collateral;
        request.position.unrealized_pnl = pnl;
        return request;
    }

    std::shared_ptr<FakeRpcClient> rpc;
    std::shared_ptr<FakeRelay> relay;
    std::shared_ptr<FakePrivacySource> privacy;
    std::shared_ptr<FakePerpSource> perps;
    crypto::OpenSslRandom random;
    std::shared_ptr<bundle::BundleSubmitter> bundles;
    ManualClock clock{1760000000000};
    chain::Keypair owner;
    std::string pending_file;
};

TEST_F(ShieldedTradeOrchestratorTest, OpenBundlesAllStepsInOrder) {
    auto orchestrator = make();
    OpenPositionRequest request;
    request.base_asset_amount = 1000000000;
    request.collateral_amount = 50000000;

    ShieldResult result = orchestrator->open_position(owner, request);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.phase, ShieldPhase::COMPRESS);
    EXPECT_EQ(relay->bundles.size(), 1u);

    std::vector<uint8_t> expected{FakePrivacySource::DECOMPRESS_TAG, FakePerpSource::DEPOSIT_TAG,
                                  FakePerpSource::OPEN_TAG, FakePrivacySource::COMPRESS_TAG};
    EXPECT_EQ(last_tags(), expected);
    ASSERT_EQ(privacy->decompress_amounts.size(), 1u);
    EXPECT_EQ(privacy->decompress_amounts[0], 50000000u);
}

TEST_F(ShieldedTradeOrchestratorTest, OpenProceedsWithOnePrivacyStep) {
    auto orchestrator = make();
    privacy->decompress_available = false;
    OpenPositionRequest request;
    request.base_asset_amount = 1;
    request.collateral_amount = 10;

    ShieldResult result = orchestrator->open_position(owner, request);
    ASSERT_TRUE(result.success);
    std::vector<uint8_t> expected{FakePerpSource::DEPOSIT_TAG, FakePerpSource::OPEN_TAG,
                                  FakePrivacySource::COMPRESS_TAG};
    EXPECT_EQ(last_tags(), expected);
}

TEST_F(ShieldedTradeOrchestratorTest, OpenRefusedWithoutPrivacy) {
    auto orchestrator = make();
    privacy->decompress_available = false;
    privacy->compress_available = false;
    OpenPositionRequest request;
    request.base_asset_amount = 1;
    request.collateral_amount = 10;

    ShieldResult result = orchestrator->open_position(owner, request);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.phase, ShieldPhase::DECOMPRESS);
    EXPECT_TRUE(rpc->simulated.empty());
    EXPECT_TRUE(relay->bundles.empty());
}

TEST_F(ShieldedTradeOrchestratorTest, OpenValidatesAmounts) {
    auto orchestrator = make();
    ShieldResult result = orchestrator->open_position(owner, OpenPositionRequest{});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_code, ErrorCode::VALIDATION_ERROR);
}

TEST_F(ShieldedTradeOrchestratorTest, CloseWithdrawsAndCompressesRemainingValue) {
    auto orchestrator = make();
    ShieldResult result = orchestrator->close_position(owner, close_request(1000, -200));
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.phase, ShieldPhase::COMPRESS);
    EXPECT_EQ(result.settled_amount, 800u);
    EXPECT_EQ(result.realized_loss, 200u);
    EXPECT_FALSE(result.pending_settlement);

    std::vector<uint8_t> expected{FakePerpSource::CLOSE_TAG, FakePerpSource::WITHDRAW_TAG,
                                  FakePrivacySource::COMPRESS_TAG};
    EXPECT_EQ(last_tags(), expected);
    EXPECT_FALSE(orchestrator->has_pending_settlement(owner.public_key()));
}

TEST_F(ShieldedTradeOrchestratorTest, PartialCloseWithdrawsShare) {
    auto orchestrator = make();
    ClosePositionRequest request = close_request(1000, 200);
    request.percentage = 25;

    ShieldResult result = orchestrator->close_position(owner, request);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(perps->withdraw_amounts.size(), 1u);
    EXPECT_EQ(perps->withdraw_amounts[0], 300u);
    EXPECT_EQ(result.realized_loss, 0u);

    request.percentage = 101;
    EXPECT_FALSE(orchestrator->close_position(owner, request).success);
}

TEST_F(ShieldedTradeOrchestratorTest, WipedOutPositionSkipsWithdraw) {
    auto orchestrator = make();
    ShieldResult result = orchestrator->close_position(owner, close_request(500, -700));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.settled_amount, 0u);
    EXPECT_EQ(result.realized_loss, 700u);
    EXPECT_TRUE(perps->withdraw_amounts.empty());
    EXPECT_EQ(last_tags(), std::vector<uint8_t>{FakePerpSource::CLOSE_TAG});
    EXPECT_FALSE(result.pending_settlement);
}

TEST_F(ShieldedTradeOrchestratorTest, CloseWithoutCompressRecordsPendingSettlement) {
    auto orchestrator = make();
    privacy->compress_available = false;

    ShieldResult first = orchestrator->close_position(owner, close_request(1000, 0));
    ASSERT_TRUE(first.success);
    EXPECT_EQ(first.phase, ShieldPhase::WITHDRAW);
    EXPECT_TRUE(first.pending_settlement);
    EXPECT_EQ(first.pending_settlement_amount, 1000u);

    // Gaps for the same owner accumulate
    ShieldResult second = orchestrator->close_position(owner, close_request(500, 0));
    ASSERT_TRUE(second.success);
    auto pending = orchestrator->pending_settlement(owner.public_key());
    ASSERT_TRUE(pending.has_value());
    EXPECT_EQ(pending->amount, 1500u);
    EXPECT_EQ(pending->created_at_ms, clock.now_ms());
    EXPECT_EQ(orchestrator->pending_settlements().size(), 1u);
}

TEST_F(ShieldedTradeOrchestratorTest, SettleClearsPendingAmount) {
    auto orchestrator = make();
    privacy->compress_available = false;
    ASSERT_TRUE(orchestrator->close_position(owner, close_request(1000, 0)).success);

    // Still unavailable: the gap is reported and kept
    ShieldResult blocked = orchestrator->settle_pending(owner);
    EXPECT_FALSE(blocked.success);
    EXPECT_EQ(blocked.error_code, ErrorCode::SETTLEMENT_GAP);
    EXPECT_TRUE(blocked.pending_settlement);
    EXPECT_TRUE(orchestrator->has_pending_settlement(owner.public_key()));

    privacy->compress_available = true;
    ShieldResult settled = orchestrator->settle_pending(owner);
    ASSERT_TRUE(settled.success) << settled.error;
    EXPECT_EQ(settled.settled_amount, 1000u);
    EXPECT_EQ(settled.phase, ShieldPhase::COMPRESS);
    EXPECT_FALSE(orchestrator->has_pending_settlement(owner.public_key()));
    ASSERT_FALSE(privacy->compress_amounts.empty());
    EXPECT_EQ(privacy->compress_amounts.back(), 1000u);

    const size_t simulations = rpc->simulated.size();
    ShieldResult nothing = orchestrator->settle_pending(owner);
    EXPECT_TRUE(nothing.success);
    EXPECT_EQ(nothing.settled_amount, 0u);
    EXPECT_TRUE(nothing.signature.empty());
    EXPECT_EQ(rpc->simulated.size(), simulations);
}

TEST_F(ShieldedTradeOrchestratorTest, FailedSettlementBundleKeepsGap) {
    auto orchestrator = make();
    privacy->compress_available = false;
    ASSERT_TRUE(orchestrator->close_position(owner, close_request(1000, 0)).success);

    privacy->compress_available = true;
    relay->default_status = bundle::BundleStatus::FAILED;
    ShieldResult result = orchestrator->settle_pending(owner);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_code, ErrorCode::SETTLEMENT_GAP);
    EXPECT_EQ(orchestrator->pending_settlement(owner.public_key())->amount, 1000u);
}

TEST_F(ShieldedTradeOrchestratorTest, FailedCloseBundleRecordsNothing) {
    auto orchestrator = make();
    privacy->compress_available = false;
    relay->default_status = bundle::BundleStatus::FAILED;

    ShieldResult result = orchestrator->close_position(owner, close_request(1000, 0));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.phase, ShieldPhase::TRADE);
    EXPECT_FALSE(orchestrator->has_pending_settlement(owner.public_key()));
}

TEST_F(ShieldedTradeOrchestratorTest, WithdrawBuildFailureStopsClose) {
    auto orchestrator = make();
    perps->fail_withdraw = true;

    ShieldResult result = orchestrator->close_position(owner, close_request(1000, 0));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.phase, ShieldPhase::WITHDRAW);
    EXPECT_TRUE(relay->bundles.empty());
}

TEST_F(ShieldedTradeOrchestratorTest, PrefundNeedsDecompress) {
    auto orchestrator = make();
    ShieldResult funded = orchestrator->prefund(owner, 2500);
    ASSERT_TRUE(funded.success);
    EXPECT_EQ(funded.settled_amount, 2500u);
    std::vector<uint8_t> expected{FakePrivacySource::DECOMPRESS_TAG, FakePerpSource::DEPOSIT_TAG};
    EXPECT_EQ(last_tags(), expected);

    privacy->decompress_available = false;
    ShieldResult refused = orchestrator->prefund(owner, 2500);
    EXPECT_FALSE(refused.success);
    EXPECT_EQ(refused.phase, ShieldPhase::DECOMPRESS);
}

TEST_F(ShieldedTradeOrchestratorTest, PendingSettlementsSurviveRestart) {
    ShieldConfig config;
    config.pending_settlement_file = pending_file;
    {
        auto orchestrator = make(config);
        privacy->compress_available = false;
        ASSERT_TRUE(orchestrator->close_position(owner, close_request(750, 0)).success);
    }

    auto restored = make(config);
    auto pending = restored->pending_settlement(owner.public_key());
    ASSERT_TRUE(pending.has_value());
    EXPECT_EQ(pending->amount, 750u);
    EXPECT_EQ(pending->mint.to_base58(), config.collateral_mint);
}

TEST_F(ShieldedTradeOrchestratorTest, LoadRejectsMalformedFile) {
    auto orchestrator = make();
    {
        std::ofstream out(pending_file);
        out << "{\"not\": \"an array\"}";
    }
    auto loaded = orchestrator->load_pending(pending_file);
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error()->code(), ErrorCode::JSON_PARSE_ERROR);

    auto missing = orchestrator->load_pending(pending_file + ".missing");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::FILE_IO_ERROR);
}

TEST_F(ShieldedTradeOrchestratorTest, InitializeRejectsBadMint) {
    ShieldConfig config;
    config.collateral_mint = "not-a-key";
    ShieldedTradeOrchestrator orchestrator(bundles, privacy, perps, clock, config);
    auto result = orchestrator.initialize();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

class DriftPerpInstructionSourceTest : public shroud::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        rpc = std::make_shared<FakeRpcClient>();
        Bytes market(96, 0);
        auto oracle = shroud::testing::test_key(0x0c).to_bytes();
        std::copy(oracle.begin(), oracle.end(),
                  market.begin() + program::drift::PERP_MARKET_ORACLE_OFFSET);
        rpc->set_account(program::drift::perp_market_address(0).value(),
                         program::drift_program_id(), market);
        source = std::make_unique<DriftPerpInstructionSource>(
            std::make_shared<program::DriftAccountResolver>(rpc), shroud::testing::test_key(0xcc));
    }

    std::shared_ptr<FakeRpcClient> rpc;
    std::unique_ptr<DriftPerpInstructionSource> source;
    chain::PublicKey owner = shroud::testing::test_key(0x01);
};

TEST_F(DriftPerpInstructionSourceTest, CloseIsReduceOnlyOnOppositeSide) {
    PositionSnapshot position;
    position.side = order::OrderSide::LONG;
    position.base_asset_amount = 1000;

    auto ix = source->close_position(owner, position, 40);
    ASSERT_TRUE(ix.is_ok());
    const Bytes& data = ix.value().data;
    ASSERT_EQ(data.size(), 8u + 1 + 1 + 2 + 8 + 8 + 3);
    EXPECT_EQ(data[9], static_cast<uint8_t>(order::OrderSide::SHORT));

    LayoutReader reader(data, 12);
    uint64_t amount = 0;
    reader.field(amount);
    ASSERT_TRUE(reader.ok());
    EXPECT_EQ(amount, 400u);
    EXPECT_EQ(data[28], 1);

    EXPECT_EQ(ix.value().accounts[5].pubkey, shroud::testing::test_key(0x0c));
    EXPECT_TRUE(source->close_position(owner, position, 0).is_error());
}

TEST_F(DriftPerpInstructionSourceTest, OpenNeedsKnownMarket) {
    OpenPositionRequest request;
    request.market_index = 0;
    request.base_asset_amount = 10;
    auto open = source->open_position(owner, request);
    ASSERT_TRUE(open.is_ok());
    EXPECT_EQ(open.value().program_id, program::drift_program_id());
    EXPECT_EQ(open.value().data[28], 0);

    request.market_index = 7;
    auto unknown = source->open_position(owner, request);
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::CHAIN_READ_ERROR);
}

TEST_F(DriftPerpInstructionSourceTest, CollateralMovesThroughTokenAccount) {
    auto deposit = source->deposit(owner, 500);
    auto withdraw = source->withdraw(owner, 500);
    ASSERT_TRUE(deposit.is_ok());
    ASSERT_TRUE(withdraw.is_ok());
    EXPECT_EQ(deposit.value().program_id, program::drift_program_id());
    EXPECT_NE(deposit.value().data, withdraw.value().data);
}
