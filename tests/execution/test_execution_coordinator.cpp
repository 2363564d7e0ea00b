#include <gtest/gtest.h>
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "../core/test_base.hpp"
#include "../mocks/fakes.hpp"
#include "shroud/chain/transaction_sender.hpp"
#include "shroud/core/encoding.hpp"
#include "shroud/core/state_manager.hpp"
#include "shroud/execution/execution_coordinator.hpp"

using namespace shroud;
using namespace shroud::execution;
using shroud::testing::FakePriceSource;
using shroud::testing::FakeRelay;
using shroud::testing::FakeRpcClient;
using shroud::testing::sample_order;
using shroud::testing::test_key;

namespace {

constexpr int64_t NOW_SECONDS = 1760000000;
constexpr int32_t EXPO = -8;

chain::Keypair keypair_from(uint8_t fill) {
    crypto::Ed25519Seed seed{};
    seed.fill(fill);
    return chain::Keypair::from_seed(seed).value();
}

}  // namespace

class ExecutionCoordinatorTest : public shroud::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        rpc = std::make_shared<FakeRpcClient>();
        relay = std::make_shared<FakeRelay>();
        prices = std::make_shared<FakePriceSource>();
        codec = std::make_shared<order::OrderCodec>(cipher, random);

        owner = keypair_from(0x11);
        executor = keypair_from(0x22);

        auto recipient = cipher.generate_keypair();
        ASSERT_TRUE(recipient.is_ok());
        decryption_key = recipient.value().private_key;
        recipient_hex = encoding::to_hex(recipient.value().public_key);

        // Perp market 0 with its oracle at the fixed offset
        Bytes market(96, 0);
        auto oracle = test_key(0x0c).to_bytes();
        std::copy(oracle.begin(), oracle.end(),
                  market.begin() + program::drift::PERP_MARKET_ORACLE_OFFSET);
        rpc->set_account(program::drift::perp_market_address(0).value(),
                         program::drift_program_id(), market);

        set_authority(true);
    }

    void TearDown() override {
        coordinator.reset();
        TestBase::TearDown();
    }

    void set_authority(bool authorize_executor) {
        program::ExecutorAuthorityAccount authority;
        authority.owner = owner.public_key();
        if (authorize_executor) {
            ASSERT_TRUE(authority.authorize_executor(executor.public_key()).is_ok());
        }
        rpc->set_account(program.executor_authority_address(owner.public_key()).value().address,
                         program::order_program_id(),
                         program::serialize_executor_authority(authority));
    }

    /**
     * @brief Encrypt the order and store its account the way the program would
     */
    chain::PublicKey place_order(const order::OrderPayload& payload,
                                 const std::string& recipient = "") {
        auto encrypted = codec->encrypt(payload, recipient.empty() ? recipient_hex : recipient);
        EXPECT_TRUE(encrypted.is_ok());

        program::EncryptedOrderAccount account;
        account.owner = payload.owner;
        account.order_hash = encrypted.value().order_hash;
        account.executor_authority =
            program.executor_authority_address(payload.owner).value().address;
        const Bytes& ciphertext = encrypted.value().ciphertext;
        std::copy(ciphertext.begin(), ciphertext.end(), account.encrypted_data.begin());
        account.data_len = static_cast<uint16_t>(ciphertext.size());
        account.feed_id = payload.feed_id;
        account.created_at = NOW_SECONDS;
        account.status = program::OrderStatus::ACTIVE;

        const chain::PublicKey address =
            program.encrypted_order_address(payload.owner, account.order_hash).value().address;
        rpc->set_account(address, program::order_program_id(),
                         program::serialize_encrypted_order(account));
        accounts[address] = account;
        return address;
    }

    void set_status(const chain::PublicKey& address, program::OrderStatus status) {
        accounts[address].status = status;
        rpc->set_account(address, program::order_program_id(),
                         program::serialize_encrypted_order(accounts[address]));
    }

    void set_price(double price) {
        clock.advance_ms(1000);
        prices->set_price(sample_order(owner.public_key()).feed_id,
                          static_cast<int64_t>(price * 100000000.0), EXPO, clock.now_seconds());
    }

    void build(CoordinatorConfig config = CoordinatorConfig{}) {
        config.poll_interval_ms = 10;

        bundle::BundleConfig bundle_config;
        bundle_config.priority = bundle::PriorityLevel::LOW;
        bundle_config.poll_interval_ms = 0;
        bundle_config.poll_attempts = 2;
        bundle_config.max_retries = 1;

        CoordinatorDependencies deps;
        deps.rpc = rpc;
        deps.monitor = std::make_shared<monitor::TriggerMonitor>(prices, clock);
        deps.bundles =
            std::make_shared<bundle::BundleSubmitter>(rpc, relay, random, bundle_config);
        deps.drift = std::make_shared<program::DriftAccountResolver>(rpc);
        deps.codec = codec;
        if (er_rpc) {
            chain::SendOptions options;
            options.confirm_attempts = 2;
            options.confirm_interval = std::chrono::milliseconds(0);
            deps.er_rpc = er_rpc;
            deps.er_sender = std::make_shared<chain::TransactionSender>(er_rpc, options);
        }

        coordinator = std::make_unique<ExecutionCoordinator>(std::move(deps), executor,
                                                             decryption_key, config);
        ASSERT_TRUE(coordinator->initialize().is_ok());
    }

    size_t executions() const {
        return rpc->count_simulated(program::instruction_discriminator("trigger_and_execute"));
    }

    /**
     * @brief Rewrite the order with its delegation flag; a delegated copy also moves
     *        to the rollup and the base account is handed to the delegation program
     */
    void set_delegated(const chain::PublicKey& address, bool delegated, bool move_to_rollup) {
        accounts[address].is_delegated = delegated;
        const Bytes data = program::serialize_encrypted_order(accounts[address]);
        if (move_to_rollup) {
            rpc->set_account(address, program::delegation_program_id(), data);
            er_rpc->set_account(address, program::order_program_id(), data);
        } else {
            rpc->set_account(address, program::order_program_id(), data);
            if (er_rpc) {
                er_rpc->accounts.erase(address);
            }
        }
    }

    size_t rollup_executions() const {
        const auto disc = program::instruction_discriminator("trigger_and_execute");
        size_t n = 0;
        for (const auto& tx : er_rpc->sent) {
            for (const auto& ix : tx.message().instructions()) {
                if (shroud::testing::has_discriminator(ix.data, disc)) {
                    ++n;
                }
            }
        }
        return n;
    }

    crypto::EciesCipher cipher;
    crypto::OpenSslRandom random;
    ManualClock clock{NOW_SECONDS * 1000};

    std::shared_ptr<FakeRpcClient> rpc;
    std::shared_ptr<FakeRpcClient> er_rpc;  // set before build() to enable the rollup lane
    std::shared_ptr<FakeRelay> relay;
    std::shared_ptr<FakePriceSource> prices;
    std::shared_ptr<order::OrderCodec> codec;
    program::OrderProgramClient program;

    chain::Keypair owner;
    chain::Keypair executor;
    Bytes decryption_key;
    std::string recipient_hex;
    std::map<chain::PublicKey, program::EncryptedOrderAccount> accounts;

    std::unique_ptr<ExecutionCoordinator> coordinator;
};

TEST_F(ExecutionCoordinatorTest, ExecutesOnceWhenPriceCrossesTrigger) {
    build();
    const chain::PublicKey address = place_order(sample_order(owner.public_key()));
    ASSERT_TRUE(coordinator->add_order(address).is_ok());

    set_price(185.0);
    auto first = coordinator->run_tick();
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().decrypted, 1u);
    EXPECT_EQ(first.value().matched, 0u);

    set_price(182.0);
    ASSERT_TRUE(coordinator->run_tick().is_ok());
    EXPECT_EQ(executions(), 0u);

    set_price(179.0);
    auto crossed = coordinator->run_tick();
    ASSERT_TRUE(crossed.is_ok());
    EXPECT_EQ(crossed.value().matched, 1u);
    EXPECT_EQ(crossed.value().executed, 1u);
    EXPECT_EQ(crossed.value().removed, 1u);
    EXPECT_EQ(executions(), 1u);
    EXPECT_EQ(relay->bundles.size(), 1u);
    EXPECT_TRUE(coordinator->get_monitored_orders().empty());

    // Nothing left to execute
    ASSERT_TRUE(coordinator->run_tick().is_ok());
    EXPECT_EQ(executions(), 1u);
}

TEST_F(ExecutionCoordinatorTest, PriceExactlyAtTriggerExecutes) {
    build();
    ASSERT_TRUE(coordinator->add_order(place_order(sample_order(owner.public_key()))).is_ok());

    set_price(180.0);
    auto summary = coordinator->run_tick();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().executed, 1u);
}

TEST_F(ExecutionCoordinatorTest, CallbacksFireForTriggerAndExecution) {
    build();
    const chain::PublicKey address = place_order(sample_order(owner.public_key()));
    ASSERT_TRUE(coordinator->add_order(address).is_ok());

    int triggered = 0;
    int64_t triggered_price = 0;
    std::string executed_signature;
    coordinator->set_on_order_triggered(
        [&](const chain::PublicKey& key, const order::OrderPayload& payload, int64_t price) {
            EXPECT_EQ(key, address);
            EXPECT_EQ(payload.order_id, 42u);
            triggered_price = price;
            ++triggered;
        });
    coordinator->set_on_order_executed(
        [&](const chain::PublicKey&, const std::string& signature) {
            executed_signature = signature;
        });

    set_price(179.0);
    ASSERT_TRUE(coordinator->run_tick().is_ok());
    EXPECT_EQ(triggered, 1);
    EXPECT_EQ(triggered_price, 179 * order::PRICE_PRECISION);
    EXPECT_FALSE(executed_signature.empty());
}

TEST_F(ExecutionCoordinatorTest, ThrowingCallbackDoesNotStopExecution) {
    build();
    ASSERT_TRUE(coordinator->add_order(place_order(sample_order(owner.public_key()))).is_ok());
    coordinator->set_on_order_triggered(
        [](const chain::PublicKey&, const order::OrderPayload&, int64_t) {
            throw std::runtime_error("listener failed");
        });

    set_price(179.0);
    auto summary = coordinator->run_tick();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().executed, 1u);
}

TEST_F(ExecutionCoordinatorTest, TwoPhaseMarksReadyBeforeExecuting) {
    CoordinatorConfig config;
    config.two_phase = true;
    build(config);
    const chain::PublicKey address = place_order(sample_order(owner.public_key()));
    ASSERT_TRUE(coordinator->add_order(address).is_ok());

    int ready = 0;
    coordinator->set_on_order_ready_for_execution(
        [&](const chain::PublicKey&, const order::OrderPayload&) { ++ready; });

    set_price(179.0);
    auto first = coordinator->run_tick();
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().marked_ready, 1u);
    EXPECT_EQ(first.value().executed, 0u);
    EXPECT_EQ(ready, 1);
    EXPECT_EQ(rpc->count_simulated(program::instruction_discriminator("mark_ready")), 1u);
    EXPECT_EQ(executions(), 0u);

    auto watched = coordinator->get_monitored_orders();
    ASSERT_EQ(watched.size(), 1u);
    EXPECT_EQ(watched[0].phase, WatchPhase::TRIGGERED);
    EXPECT_EQ(watched[0].triggered_price, 179 * order::PRICE_PRECISION);

    auto second = coordinator->run_tick();
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().executed, 1u);
    EXPECT_EQ(executions(), 1u);
    EXPECT_EQ(ready, 1);
}

TEST_F(ExecutionCoordinatorTest, TwoPhaseRechecksStalenessBeforeExecuting) {
    CoordinatorConfig config;
    config.two_phase = true;
    build(config);
    ASSERT_TRUE(coordinator->add_order(place_order(sample_order(owner.public_key()))).is_ok());

    set_price(179.0);
    auto first = coordinator->run_tick();
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().marked_ready, 1u);

    // No newer quote arrives and the ready price ages out
    clock.advance_ms(61 * 1000);
    auto stale = coordinator->run_tick();
    ASSERT_TRUE(stale.is_ok());
    EXPECT_EQ(stale.value().matched, 0u);
    EXPECT_EQ(stale.value().executed, 0u);
    EXPECT_EQ(executions(), 0u);
    auto watched = coordinator->get_monitored_orders();
    ASSERT_EQ(watched.size(), 1u);
    EXPECT_EQ(watched[0].phase, WatchPhase::TRIGGERED);

    set_price(179.0);
    auto fresh = coordinator->run_tick();
    ASSERT_TRUE(fresh.is_ok());
    EXPECT_EQ(fresh.value().executed, 1u);
    EXPECT_EQ(executions(), 1u);
    EXPECT_EQ(rpc->count_simulated(program::instruction_discriminator("mark_ready")), 1u);
}

TEST_F(ExecutionCoordinatorTest, DelegatedOrderExecutesOnRollupLane) {
    er_rpc = std::make_shared<FakeRpcClient>();
    build();
    const chain::PublicKey address = place_order(sample_order(owner.public_key()));
    set_delegated(address, true, true);
    ASSERT_TRUE(coordinator->add_order(address).is_ok());

    set_price(179.0);
    auto summary = coordinator->run_tick();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().executed, 1u);
    EXPECT_EQ(rollup_executions(), 1u);
    EXPECT_EQ(executions(), 0u);
    EXPECT_TRUE(relay->bundles.empty());

    // Redelegation flag is the last byte of the instruction data
    const chain::Transaction& tx = er_rpc->sent.back();
    const Bytes& data = tx.message().instructions().back().data;
    ASSERT_FALSE(data.empty());
    EXPECT_EQ(data.back(), 1);
}

TEST_F(ExecutionCoordinatorTest, UndelegatedOrderMovesBackToBundles) {
    er_rpc = std::make_shared<FakeRpcClient>();
    build();
    const chain::PublicKey address = place_order(sample_order(owner.public_key()));
    set_delegated(address, true, true);
    ASSERT_TRUE(coordinator->add_order(address).is_ok());

    set_price(185.0);
    ASSERT_TRUE(coordinator->run_tick().is_ok());
    auto watched = coordinator->get_monitored_orders();
    ASSERT_EQ(watched.size(), 1u);
    EXPECT_TRUE(watched[0].delegated);

    set_delegated(address, false, false);
    set_price(179.0);
    auto summary = coordinator->run_tick();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().executed, 1u);
    EXPECT_EQ(executions(), 1u);
    EXPECT_EQ(relay->bundles.size(), 1u);
    EXPECT_EQ(rollup_executions(), 0u);
}

TEST_F(ExecutionCoordinatorTest, ClearedDelegationFlagIsNotSticky) {
    // No rollup lane configured: a delegated order cannot execute here
    build();
    const chain::PublicKey address = place_order(sample_order(owner.public_key()));
    accounts[address].is_delegated = true;
    rpc->set_account(address, program::order_program_id(),
                     program::serialize_encrypted_order(accounts[address]));
    ASSERT_TRUE(coordinator->add_order(address).is_ok());

    set_price(185.0);
    ASSERT_TRUE(coordinator->run_tick().is_ok());
    ASSERT_EQ(coordinator->get_monitored_orders().size(), 1u);
    EXPECT_TRUE(coordinator->get_monitored_orders()[0].delegated);

    accounts[address].is_delegated = false;
    rpc->set_account(address, program::order_program_id(),
                     program::serialize_encrypted_order(accounts[address]));
    set_price(179.0);
    auto summary = coordinator->run_tick();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().executed, 1u);
    EXPECT_EQ(summary.value().errors, 0u);
    EXPECT_EQ(executions(), 1u);
}

TEST_F(ExecutionCoordinatorTest, DelegatedOrderWithoutRollupLaneIsNotBundled) {
    build();
    const chain::PublicKey address = place_order(sample_order(owner.public_key()));
    accounts[address].is_delegated = true;
    rpc->set_account(address, program::order_program_id(),
                     program::serialize_encrypted_order(accounts[address]));
    ASSERT_TRUE(coordinator->add_order(address).is_ok());

    set_price(179.0);
    auto summary = coordinator->run_tick();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().executed, 0u);
    EXPECT_EQ(summary.value().errors, 1u);
    EXPECT_TRUE(relay->bundles.empty());
    EXPECT_EQ(executions(), 0u);
    ASSERT_EQ(coordinator->get_monitored_orders().size(), 1u);
    EXPECT_NE(coordinator->get_monitored_orders()[0].last_error.find("rollup"), std::string::npos);
}

TEST_F(ExecutionCoordinatorTest, ExecutedOrCancelledOrdersAreDropped) {
    build();
    const chain::PublicKey executed = place_order(sample_order(owner.public_key()));
    order::OrderPayload other = sample_order(owner.public_key());
    other.order_id = 43;
    const chain::PublicKey cancelled = place_order(other);

    ASSERT_TRUE(coordinator->add_order(executed).is_ok());
    ASSERT_TRUE(coordinator->add_order(cancelled).is_ok());
    set_status(executed, program::OrderStatus::EXECUTED);
    set_status(cancelled, program::OrderStatus::CANCELLED);

    set_price(179.0);
    auto summary = coordinator->run_tick();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().removed, 2u);
    EXPECT_EQ(executions(), 0u);
    EXPECT_TRUE(coordinator->get_monitored_orders().empty());
}

TEST_F(ExecutionCoordinatorTest, ClosedAccountIsDropped) {
    build();
    const chain::PublicKey address = place_order(sample_order(owner.public_key()));
    ASSERT_TRUE(coordinator->add_order(address).is_ok());
    rpc->accounts.erase(address);

    auto summary = coordinator->run_tick();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().removed, 1u);
}

TEST_F(ExecutionCoordinatorTest, TriggeredOnChainIsLeftAlone) {
    build();
    const chain::PublicKey address = place_order(sample_order(owner.public_key()));
    ASSERT_TRUE(coordinator->add_order(address).is_ok());
    set_status(address, program::OrderStatus::TRIGGERED);

    set_price(179.0);
    auto summary = coordinator->run_tick();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().matched, 0u);
    EXPECT_EQ(coordinator->get_monitored_orders().size(), 1u);
}

TEST_F(ExecutionCoordinatorTest, AddOrderIsIdempotent) {
    build();
    const chain::PublicKey address = place_order(sample_order(owner.public_key()));
    ASSERT_TRUE(coordinator->add_order(address).is_ok());
    ASSERT_TRUE(coordinator->add_order(address).is_ok());
    EXPECT_EQ(coordinator->get_monitored_orders().size(), 1u);
    EXPECT_TRUE(coordinator->add_order(chain::PublicKey()).is_error());

    EXPECT_TRUE(coordinator->remove_order(address));
    EXPECT_FALSE(coordinator->remove_order(address));
}

TEST_F(ExecutionCoordinatorTest, UnauthorizedExecutorDoesNotSubmit) {
    set_authority(false);
    build();
    const chain::PublicKey address = place_order(sample_order(owner.public_key()));
    ASSERT_TRUE(coordinator->add_order(address).is_ok());

    std::vector<ErrorCode> errors;
    coordinator->set_on_order_error(
        [&](const chain::PublicKey&, const ShroudError& error) { errors.push_back(error.code()); });

    set_price(179.0);
    auto summary = coordinator->run_tick();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().matched, 1u);
    EXPECT_EQ(summary.value().executed, 0u);
    EXPECT_EQ(summary.value().errors, 1u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], ErrorCode::VALIDATION_ERROR);
    EXPECT_TRUE(rpc->simulated.empty());

    auto watched = coordinator->get_monitored_orders();
    ASSERT_EQ(watched.size(), 1u);
    EXPECT_EQ(watched[0].execution_failures, 1);
    EXPECT_NE(watched[0].last_error.find("not authorized"), std::string::npos);
}

TEST_F(ExecutionCoordinatorTest, OwnerMayExecuteWithoutAuthorization) {
    set_authority(false);
    executor = owner;
    build();
    ASSERT_TRUE(coordinator->add_order(place_order(sample_order(owner.public_key()))).is_ok());

    set_price(179.0);
    auto summary = coordinator->run_tick();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().executed, 1u);
}

TEST_F(ExecutionCoordinatorTest, UndecryptableOrderIsSkipped) {
    build();
    auto stranger = cipher.generate_keypair();
    ASSERT_TRUE(stranger.is_ok());
    const chain::PublicKey address =
        place_order(sample_order(owner.public_key()), encoding::to_hex(stranger.value().public_key));
    ASSERT_TRUE(coordinator->add_order(address).is_ok());

    set_price(179.0);
    auto summary = coordinator->run_tick();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().decrypt_failures, 1u);
    EXPECT_EQ(summary.value().matched, 0u);
    EXPECT_TRUE(rpc->simulated.empty());

    auto watched = coordinator->get_monitored_orders();
    ASSERT_EQ(watched.size(), 1u);
    EXPECT_FALSE(watched[0].payload.has_value());
    EXPECT_EQ(watched[0].decrypt_failures, 1);
}

TEST_F(ExecutionCoordinatorTest, CommitmentMismatchIsRejected) {
    build();
    const chain::PublicKey address = place_order(sample_order(owner.public_key()));
    accounts[address].order_hash[0] ^= 0xff;
    set_status(address, program::OrderStatus::ACTIVE);
    ASSERT_TRUE(coordinator->add_order(address).is_ok());

    set_price(179.0);
    auto summary = coordinator->run_tick();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().decrypt_failures, 1u);
    EXPECT_TRUE(rpc->simulated.empty());
}

TEST_F(ExecutionCoordinatorTest, FailedSimulationKeepsOrderForRetry) {
    build();
    const chain::PublicKey address = place_order(sample_order(owner.public_key()));
    ASSERT_TRUE(coordinator->add_order(address).is_ok());
    rpc->simulation.success = false;
    rpc->simulation.error = "slippage";

    set_price(179.0);
    auto failed = coordinator->run_tick();
    ASSERT_TRUE(failed.is_ok());
    EXPECT_EQ(failed.value().errors, 1u);
    EXPECT_TRUE(relay->bundles.empty());
    ASSERT_EQ(coordinator->get_monitored_orders().size(), 1u);

    rpc->simulation.success = true;
    auto retried = coordinator->run_tick();
    ASSERT_TRUE(retried.is_ok());
    EXPECT_EQ(retried.value().executed, 1u);
}

TEST_F(ExecutionCoordinatorTest, StalePriceDoesNotTrigger) {
    build();
    ASSERT_TRUE(coordinator->add_order(place_order(sample_order(owner.public_key()))).is_ok());

    set_price(179.0);
    clock.advance_ms(61 * 1000);
    auto summary = coordinator->run_tick();
    ASSERT_TRUE(summary.is_ok());
    EXPECT_EQ(summary.value().matched, 0u);
}

TEST_F(ExecutionCoordinatorTest, TriggerCapDefersExtraOrders) {
    CoordinatorConfig config;
    config.max_triggers_per_tick = 1;
    build(config);
    for (uint64_t id : {1u, 2u}) {
        order::OrderPayload payload = sample_order(owner.public_key());
        payload.order_id = id;
        ASSERT_TRUE(coordinator->add_order(place_order(payload)).is_ok());
    }

    set_price(179.0);
    auto first = coordinator->run_tick();
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().executed, 1u);
    EXPECT_EQ(coordinator->get_monitored_orders().size(), 1u);

    auto second = coordinator->run_tick();
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().executed, 1u);
    EXPECT_TRUE(coordinator->get_monitored_orders().empty());
}

TEST_F(ExecutionCoordinatorTest, DiscoverOrdersFiltersActiveAccounts) {
    build();
    chain::KeyedAccount keyed;
    keyed.address = test_key(0x61);
    rpc->program_accounts = {keyed};

    auto added = coordinator->discover_orders();
    ASSERT_TRUE(added.is_ok());
    EXPECT_EQ(added.value(), 1u);
    ASSERT_TRUE(rpc->last_filter.data_size.has_value());
    EXPECT_EQ(*rpc->last_filter.data_size, program::EncryptedOrderAccount::LEN);
    ASSERT_EQ(rpc->last_filter.memcmp.size(), 1u);
    EXPECT_EQ(rpc->last_filter.memcmp[0].offset, program::EncryptedOrderAccount::LEN - 3);

    EXPECT_EQ(coordinator->discover_orders().value(), 0u);
}

TEST_F(ExecutionCoordinatorTest, InitializeValidatesKeyAndRegisters) {
    build();
    auto info = StateManager::instance().get_state("execution_coordinator");
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().state, ComponentState::INITIALIZED);

    CoordinatorDependencies deps;
    ExecutionCoordinator missing(deps, executor, decryption_key);
    auto result = missing.initialize();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::NOT_INITIALIZED);
    EXPECT_TRUE(missing.start().is_error());
}

TEST_F(ExecutionCoordinatorTest, WorkerThreadStartsAndStops) {
    build();
    ASSERT_TRUE(coordinator->start().is_ok());
    EXPECT_TRUE(coordinator->is_running());
    ASSERT_TRUE(coordinator->stop().is_ok());
    EXPECT_FALSE(coordinator->is_running());
    EXPECT_EQ(StateManager::instance().get_state("execution_coordinator").value().state,
              ComponentState::STOPPED);
}
