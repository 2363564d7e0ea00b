#include <gtest/gtest.h>
#include <memory>
#include "../core/test_base.hpp"
#include "../mocks/fakes.hpp"
#include "shroud/core/byte_layout.hpp"
#include "shroud/program/order_program_client.hpp"

using namespace shroud;
using namespace shroud::program;
using shroud::testing::sample_order;
using shroud::testing::test_hash;
using shroud::testing::test_key;

class OrderProgramClientTest : public shroud::testing::TestBase {
protected:
    OrderProgramClient client;
};

TEST_F(OrderProgramClientTest, AddressesAreDeterministicPerOwnerAndHash) {
    auto a = client.encrypted_order_address(test_key(1), test_hash(2));
    auto b = client.encrypted_order_address(test_key(1), test_hash(2));
    auto c = client.encrypted_order_address(test_key(1), test_hash(3));
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    ASSERT_TRUE(c.is_ok());
    EXPECT_EQ(a.value().address, b.value().address);
    EXPECT_NE(a.value().address, c.value().address);

    auto executor = client.executor_authority_address(test_key(1));
    ASSERT_TRUE(executor.is_ok());
    EXPECT_NE(executor.value().address, a.value().address);
}

TEST_F(OrderProgramClientTest, TriggerAndExecuteRevealsOrderFields) {
    TriggerExecuteParams params;
    params.payer = test_key(0x09);
    params.order_address = test_key(0x0a);
    params.order = sample_order(test_key(0x01));
    Salt16 salt{};
    salt.fill(0x33);
    params.order.salt = salt;
    params.redelegate_after = true;

    auto ix = client.trigger_and_execute(params);
    ASSERT_TRUE(ix.is_ok());
    const chain::Instruction& instruction = ix.value();

    EXPECT_EQ(instruction.program_id, order_program_id());
    ASSERT_EQ(instruction.accounts.size(), 12u);
    EXPECT_TRUE(instruction.accounts[0].is_signer);
    EXPECT_EQ(instruction.accounts[1].pubkey, test_key(0x0a));

    ASSERT_EQ(instruction.data.size(), 8u + 16 + 8 + 2 + 8 + 1 + 1 + 8 + 1 + 8 + 1);
    EXPECT_TRUE(shroud::testing::has_discriminator(
        instruction.data, instruction_discriminator("trigger_and_execute")));

    LayoutReader reader(instruction.data, 8);
    Salt16 read_salt{};
    uint64_t order_id = 0;
    uint16_t market = 0;
    int64_t trigger_price = 0;
    reader.field(read_salt);
    reader.field(order_id);
    reader.field(market);
    reader.field(trigger_price);
    ASSERT_TRUE(reader.ok());
    EXPECT_EQ(read_salt, salt);
    EXPECT_EQ(order_id, 42u);
    EXPECT_EQ(trigger_price, 180 * order::PRICE_PRECISION);
    EXPECT_EQ(instruction.data.back(), 1);
}

TEST_F(OrderProgramClientTest, TriggerAndExecuteNeedsSalt) {
    TriggerExecuteParams params;
    params.order = sample_order(test_key(0x01));
    auto ix = client.trigger_and_execute(params);
    ASSERT_TRUE(ix.is_error());
    EXPECT_EQ(ix.error()->code(), ErrorCode::VALIDATION_ERROR);
}

TEST_F(OrderProgramClientTest, MarkReadyTargetsCrankProgram) {
    chain::Instruction ix = client.mark_ready(test_key(0x09), test_key(0x0a), 179000000);
    EXPECT_EQ(ix.program_id, crank_program_id());
    ASSERT_EQ(ix.data.size(), 16u);
    EXPECT_TRUE(
        shroud::testing::has_discriminator(ix.data, instruction_discriminator("mark_ready")));

    LayoutReader reader(ix.data, 8);
    int64_t price = 0;
    reader.field(price);
    EXPECT_EQ(price, 179000000);
}

TEST_F(OrderProgramClientTest, CreateEncryptedOrderPadsCiphertext) {
    Bytes ciphertext(190, 0xab);
    auto ix = client.create_encrypted_order(test_key(1), test_hash(2), ciphertext, test_hash(3));
    ASSERT_TRUE(ix.is_ok());
    // disc + hash + padded data + length + feed
    ASSERT_EQ(ix.value().data.size(), 8u + 32 + 256 + 2 + 32);
    EXPECT_EQ(ix.value().data[8 + 32 + 189], 0xab);
    EXPECT_EQ(ix.value().data[8 + 32 + 190], 0x00);
    EXPECT_EQ(ix.value().data[8 + 32 + 256], 190);

    EXPECT_TRUE(client.create_encrypted_order(test_key(1), test_hash(2), Bytes{}, test_hash(3))
                    .is_error());
    EXPECT_TRUE(client
                    .create_encrypted_order(test_key(1), test_hash(2), Bytes(257, 1), test_hash(3))
                    .is_error());
}

TEST_F(OrderProgramClientTest, DelegationStateIsChecked) {
    ExecutorAuthorityAccount authority;
    authority.owner = test_key(1);

    EXPECT_TRUE(client.delegate_executor(authority).is_ok());
    EXPECT_TRUE(client.undelegate_executor(test_key(1), authority).is_error());

    authority.is_delegated = true;
    EXPECT_TRUE(client.delegate_executor(authority).is_error());
    EXPECT_TRUE(client.undelegate_executor(test_key(1), authority).is_ok());
}

TEST_F(OrderProgramClientTest, AuthorizeExecutorEncodesFlag) {
    auto ix = client.authorize_executor(test_key(1), test_key(5), false);
    ASSERT_TRUE(ix.is_ok());
    ASSERT_EQ(ix.value().data.size(), 8u + 32 + 1);
    EXPECT_EQ(ix.value().data[8], 5);
    EXPECT_EQ(ix.value().data.back(), 0);
}

class DriftAccountResolverTest : public shroud::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        rpc = std::make_shared<shroud::testing::FakeRpcClient>();
    }

    std::shared_ptr<shroud::testing::FakeRpcClient> rpc;
};

TEST_F(DriftAccountResolverTest, ReadsOracleFromPerpMarket) {
    auto market = drift::perp_market_address(0);
    ASSERT_TRUE(market.is_ok());
    Bytes data(96, 0);
    auto oracle = test_key(0x7e).to_bytes();
    std::copy(oracle.begin(), oracle.end(), data.begin() + drift::PERP_MARKET_ORACLE_OFFSET);
    rpc->set_account(market.value(), drift_program_id(), data);

    DriftAccountResolver resolver(rpc);
    auto accounts = resolver.resolve(test_key(1), 0);
    ASSERT_TRUE(accounts.is_ok());
    EXPECT_EQ(accounts.value().oracle, test_key(0x7e));
    EXPECT_EQ(accounts.value().perp_market, market.value());
    EXPECT_EQ(accounts.value().authority, test_key(1));
    EXPECT_EQ(accounts.value().user, drift::user_address(test_key(1)).value());
}

TEST_F(DriftAccountResolverTest, MissingMarketIsChainReadError) {
    DriftAccountResolver resolver(rpc);
    auto accounts = resolver.resolve(test_key(1), 3);
    ASSERT_TRUE(accounts.is_error());
    EXPECT_EQ(accounts.error()->code(), ErrorCode::CHAIN_READ_ERROR);

    rpc->fail_reads = true;
    EXPECT_EQ(resolver.resolve(test_key(1), 0).error()->code(), ErrorCode::CHAIN_READ_ERROR);
}

TEST(DriftInstructionTest, PerpOrderNeedsAmount) {
    DriftExecutionAccounts accounts;
    drift::PerpOrderParams params;
    params.base_asset_amount = 0;
    EXPECT_TRUE(drift::place_perp_order(accounts, params).is_error());
}
