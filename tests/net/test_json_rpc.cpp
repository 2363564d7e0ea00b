#include <gtest/gtest.h>
#include <memory>
#include "../core/test_base.hpp"
#include "../mocks/fakes.hpp"
#include "shroud/chain/rpc_client.hpp"
#include "shroud/chain/system_instructions.hpp"
#include "shroud/net/json_rpc.hpp"

using namespace shroud;
using shroud::testing::FakeHttpClient;
using shroud::testing::test_key;

namespace {

const char* ZERO_KEY = "11111111111111111111111111111111";

}  // namespace

class JsonRpcTransportTest : public shroud::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        http = std::make_shared<FakeHttpClient>();
    }

    std::shared_ptr<FakeHttpClient> http;
};

TEST_F(JsonRpcTransportTest, RequestEnvelopeAndResult) {
    http->queue(200, R"({"jsonrpc":"2.0","result":{"slot":7},"id":1})");
    net::JsonRpcTransport transport(http, "https://rpc.example");

    auto result = transport.call("getSlot", nlohmann::json::array(), ErrorCode::CHAIN_READ_ERROR);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value()["slot"], 7);

    ASSERT_EQ(http->requests.size(), 1u);
    EXPECT_EQ(http->requests[0].url, "https://rpc.example");
    auto body = nlohmann::json::parse(http->requests[0].body);
    EXPECT_EQ(body["jsonrpc"], "2.0");
    EXPECT_EQ(body["method"], "getSlot");
    EXPECT_TRUE(body["params"].is_array());
}

TEST_F(JsonRpcTransportTest, RequestIdsIncrease) {
    http->queue(200, R"({"result":1})");
    http->queue(200, R"({"result":2})");
    net::JsonRpcTransport transport(http, "https://rpc.example");
    ASSERT_TRUE(transport.call("a", nlohmann::json::array(), ErrorCode::CHAIN_READ_ERROR).is_ok());
    ASSERT_TRUE(transport.call("b", nlohmann::json::array(), ErrorCode::CHAIN_READ_ERROR).is_ok());

    auto first = nlohmann::json::parse(http->requests[0].body);
    auto second = nlohmann::json::parse(http->requests[1].body);
    EXPECT_LT(first["id"].get<uint64_t>(), second["id"].get<uint64_t>());
}

TEST_F(JsonRpcTransportTest, ThrottlingAndServerErrorsAreRetried) {
    http->queue(429, "slow down");
    http->queue(503, "unavailable");
    http->queue(200, R"({"result":"ok"})");
    net::JsonRpcTransport transport(http, "https://rpc.example");

    auto result = transport.call("getHealth", nlohmann::json::array(), ErrorCode::CHAIN_READ_ERROR);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), "ok");
    EXPECT_EQ(http->requests.size(), 3u);
}

TEST_F(JsonRpcTransportTest, GivesUpAfterMaxAttempts) {
    http->queue_error(ErrorCode::TIMEOUT_ERROR, "timed out");
    http->queue_error(ErrorCode::TIMEOUT_ERROR, "timed out");
    net::JsonRpcTransport transport(http, "https://rpc.example", 2);

    auto result = transport.call("getHealth", nlohmann::json::array(), ErrorCode::CHAIN_READ_ERROR);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::TIMEOUT_ERROR);
    EXPECT_NE(std::string(result.error()->what()).find("after 2 attempts"), std::string::npos);
}

TEST_F(JsonRpcTransportTest, RpcErrorUsesCallerCodeWithoutRetry) {
    http->queue(200, R"({"error":{"code":-32002,"message":"Blockhash not found"},"id":1})");
    net::JsonRpcTransport transport(http, "https://rpc.example");

    auto result =
        transport.call("sendTransaction", nlohmann::json::array(), ErrorCode::SUBMISSION_ERROR);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::SUBMISSION_ERROR);
    EXPECT_NE(std::string(result.error()->what()).find("Blockhash not found"), std::string::npos);
    EXPECT_EQ(http->requests.size(), 1u);
}

TEST_F(JsonRpcTransportTest, MalformedResponses) {
    http->queue(400, "bad request");
    http->queue(200, "<html>");
    http->queue(200, R"({"jsonrpc":"2.0","id":1})");
    net::JsonRpcTransport transport(http, "https://rpc.example");

    auto rejected = transport.call("m", nlohmann::json::array(), ErrorCode::CHAIN_READ_ERROR);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error()->code(), ErrorCode::CHAIN_READ_ERROR);

    auto not_json = transport.call("m", nlohmann::json::array(), ErrorCode::CHAIN_READ_ERROR);
    ASSERT_TRUE(not_json.is_error());
    EXPECT_EQ(not_json.error()->code(), ErrorCode::JSON_PARSE_ERROR);

    auto no_result = transport.call("m", nlohmann::json::array(), ErrorCode::CHAIN_READ_ERROR);
    ASSERT_TRUE(no_result.is_error());
    EXPECT_EQ(no_result.error()->code(), ErrorCode::PARSE_ERROR);
}

class JsonRpcClientTest : public JsonRpcTransportTest {
protected:
    chain::JsonRpcClient client() {
        return chain::JsonRpcClient(http, "https://rpc.example", "confirmed", 1);
    }
};

TEST_F(JsonRpcClientTest, AccountInfoDecodesBase64Data) {
    http->queue(200, std::string(R"({"result":{"context":{"slot":1},"value":{"owner":")") +
                         ZERO_KEY +
                         R"(","lamports":5,"data":["AQID","base64"],"executable":false}}})");
    auto rpc = client();

    auto account = rpc.get_account_info(test_key(0x01));
    ASSERT_TRUE(account.is_ok());
    ASSERT_TRUE(account.value().has_value());
    EXPECT_EQ(account.value()->owner, chain::system_program_id());
    EXPECT_EQ(account.value()->lamports, 5u);
    EXPECT_EQ(account.value()->data, (Bytes{1, 2, 3}));

    auto body = nlohmann::json::parse(http->requests[0].body);
    EXPECT_EQ(body["params"][0], test_key(0x01).to_base58());
    EXPECT_EQ(body["params"][1]["encoding"], "base64");
    EXPECT_EQ(body["params"][1]["commitment"], "confirmed");
}

TEST_F(JsonRpcClientTest, MissingAccountIsEmpty) {
    http->queue(200, R"({"result":{"context":{"slot":1},"value":null}})");
    auto rpc = client();
    auto account = rpc.get_account_info(test_key(0x01));
    ASSERT_TRUE(account.is_ok());
    EXPECT_FALSE(account.value().has_value());
}

TEST_F(JsonRpcClientTest, ProgramAccountFiltersAreEncoded) {
    http->queue(200, std::string(R"({"result":[{"pubkey":")") + ZERO_KEY +
                         R"(","account":{"owner":")" + ZERO_KEY +
                         R"(","lamports":1,"data":["","base64"]}}]})");
    auto rpc = client();

    chain::ProgramAccountsFilter filter;
    filter.data_size = 421;
    filter.memcmp.push_back(chain::MemcmpFilter{418, Bytes{0}});
    auto accounts = rpc.get_program_accounts(test_key(0x02), filter);
    ASSERT_TRUE(accounts.is_ok());
    ASSERT_EQ(accounts.value().size(), 1u);
    EXPECT_TRUE(accounts.value()[0].account.data.empty());

    auto body = nlohmann::json::parse(http->requests[0].body);
    const auto& filters = body["params"][1]["filters"];
    ASSERT_EQ(filters.size(), 2u);
    EXPECT_EQ(filters[0]["dataSize"], 421);
    EXPECT_EQ(filters[1]["memcmp"]["offset"], 418);
    EXPECT_EQ(filters[1]["memcmp"]["bytes"], "1");
}

TEST_F(JsonRpcClientTest, LatestBlockhashDecodes) {
    http->queue(200, std::string(R"({"result":{"value":{"blockhash":")") + ZERO_KEY +
                         R"(","lastValidBlockHeight":99}}})");
    auto rpc = client();
    auto info = rpc.get_latest_blockhash();
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().blockhash, Hash32{});
    EXPECT_EQ(info.value().last_valid_block_height, 99u);
}

TEST_F(JsonRpcClientTest, SimulationErrorIsAResultNotAFailure) {
    http->queue(200,
                R"({"result":{"value":{"err":{"InstructionError":[0,{"Custom":1}]},)"
                R"("logs":["Program log: slippage"],"unitsConsumed":1234}}})");
    auto rpc = client();

    chain::Instruction ix = chain::transfer(test_key(0x01), test_key(0x02), 1);
    auto message = chain::Message::compile_legacy(test_key(0x01), {ix}, Hash32{});
    ASSERT_TRUE(message.is_ok());
    chain::Transaction tx(message.value());

    auto sim = rpc.simulate_transaction(tx, false, true);
    ASSERT_TRUE(sim.is_ok());
    EXPECT_FALSE(sim.value().success);
    EXPECT_NE(sim.value().error.find("Custom"), std::string::npos);
    ASSERT_EQ(sim.value().logs.size(), 1u);
    EXPECT_EQ(sim.value().units_consumed, 1234u);

    auto body = nlohmann::json::parse(http->requests[0].body);
    EXPECT_EQ(body["params"][1]["sigVerify"], false);
    EXPECT_EQ(body["params"][1]["replaceRecentBlockhash"], true);
}

TEST_F(JsonRpcClientTest, SignatureStatusesMapConfirmation) {
    http->queue(200,
                R"({"result":{"value":[null,{"confirmationStatus":"finalized","err":null},)"
                R"({"confirmationStatus":"processed","err":{"InstructionError":[0,"X"]}}]}})");
    auto rpc = client();

    auto statuses = rpc.get_signature_statuses({"a", "b", "c"});
    ASSERT_TRUE(statuses.is_ok());
    ASSERT_EQ(statuses.value().size(), 3u);
    EXPECT_FALSE(statuses.value()[0].found);
    EXPECT_TRUE(statuses.value()[1].found);
    EXPECT_EQ(statuses.value()[1].confirmation, chain::ConfirmationStatus::FINALIZED);
    EXPECT_TRUE(statuses.value()[1].error.empty());
    EXPECT_EQ(statuses.value()[2].confirmation, chain::ConfirmationStatus::PROCESSED);
    EXPECT_FALSE(statuses.value()[2].error.empty());
}

TEST_F(JsonRpcClientTest, MalformedAccountIsReadError) {
    nlohmann::json value = {{"owner", ZERO_KEY}, {"data", "not-an-array"}};
    auto parsed = chain::parse_account_json(value);
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error()->code(), ErrorCode::CHAIN_READ_ERROR);

    nlohmann::json no_owner = {{"data", {"", "base64"}}};
    EXPECT_TRUE(chain::parse_account_json(no_owner).is_error());
}
