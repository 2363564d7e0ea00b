// src/chain/rpc_client.cpp

#include "shroud/chain/rpc_client.hpp"
#include "shroud/core/encoding.hpp"

namespace shroud {
namespace chain {

ConfirmationStatus confirmation_from_string(const std::string& text) {
    if (text == "processed")
        return ConfirmationStatus::PROCESSED;
    if (text == "confirmed")
        return ConfirmationStatus::CONFIRMED;
    if (text == "finalized")
        return ConfirmationStatus::FINALIZED;
    return ConfirmationStatus::UNKNOWN;
}

Result<AccountInfo> parse_account_json(const nlohmann::json& value) {
    try {
        AccountInfo info;
        auto owner = PublicKey::from_base58(value.at("owner").get<std::string>());
        if (owner.is_error()) {
            return forward_error<AccountInfo>(owner);
        }
        info.owner = owner.value();
        info.lamports = value.value("lamports", static_cast<uint64_t>(0));
        info.executable = value.value("executable", false);

        // data is ["<base64>", "base64"]
        const auto& data = value.at("data");
        if (!data.is_array() || data.empty() || !data[0].is_string()) {
            return make_error<AccountInfo>(ErrorCode::CHAIN_READ_ERROR,
                                           "Account data is not base64-encoded", "RpcClient");
        }
        auto decoded = encoding::from_base64(data[0].get<std::string>());
        if (decoded.is_error()) {
            return make_error<AccountInfo>(ErrorCode::CHAIN_READ_ERROR,
                                           decoded.error()->what(), "RpcClient");
        }
        info.data = decoded.value();
        return info;
    } catch (const nlohmann::json::exception& e) {
        return make_error<AccountInfo>(ErrorCode::CHAIN_READ_ERROR,
                                       std::string("Malformed account: ") + e.what(),
                                       "RpcClient");
    }
}

JsonRpcClient::JsonRpcClient(std::shared_ptr<net::HttpClient> http, const std::string& url,
                             std::string commitment, int max_attempts)
    : transport_(std::move(http), url, max_attempts), commitment_(std::move(commitment)) {}

Result<std::optional<AccountInfo>> JsonRpcClient::get_account_info(const PublicKey& address) {
    using Out = std::optional<AccountInfo>;
    nlohmann::json params = nlohmann::json::array(
        {address.to_base58(), {{"encoding", "base64"}, {"commitment", commitment_}}});
    auto result = transport_.call("getAccountInfo", params, ErrorCode::CHAIN_READ_ERROR);
    if (result.is_error()) {
        return forward_error<Out>(result);
    }
    const auto& body = result.value();
    if (!body.contains("value") || body["value"].is_null()) {
        return Out{};
    }
    auto account = parse_account_json(body["value"]);
    if (account.is_error()) {
        return forward_error<Out>(account);
    }
    return Out{account.value()};
}

Result<std::vector<KeyedAccount>> JsonRpcClient::get_program_accounts(
    const PublicKey& program_id, const ProgramAccountsFilter& filter) {
    using Out = std::vector<KeyedAccount>;
    nlohmann::json filters = nlohmann::json::array();
    if (filter.data_size) {
        filters.push_back({{"dataSize", *filter.data_size}});
    }
    for (const auto& m : filter.memcmp) {
        filters.push_back(
            {{"memcmp", {{"offset", m.offset}, {"bytes", encoding::to_base58(m.bytes)}}}});
    }
    nlohmann::json config = {{"encoding", "base64"}, {"commitment", commitment_}};
    if (!filters.empty()) {
        config["filters"] = filters;
    }
    auto result = transport_.call("getProgramAccounts",
                                  nlohmann::json::array({program_id.to_base58(), config}),
                                  ErrorCode::CHAIN_READ_ERROR);
    if (result.is_error()) {
        return forward_error<Out>(result);
    }

    Out accounts;
    try {
        for (const auto& entry : result.value()) {
            auto address = PublicKey::from_base58(entry.at("pubkey").get<std::string>());
            if (address.is_error()) {
                return forward_error<Out>(address);
            }
            auto account = parse_account_json(entry.at("account"));
            if (account.is_error()) {
                return forward_error<Out>(account);
            }
            accounts.push_back(KeyedAccount{address.value(), account.value()});
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<Out>(ErrorCode::CHAIN_READ_ERROR,
                               std::string("Malformed program accounts: ") + e.what(),
                               "RpcClient");
    }
    return accounts;
}

Result<BlockhashInfo> JsonRpcClient::get_latest_blockhash() {
    auto result = transport_.call("getLatestBlockhash",
                                  nlohmann::json::array({{{"commitment", commitment_}}}),
                                  ErrorCode::CHAIN_READ_ERROR);
    if (result.is_error()) {
        return forward_error<BlockhashInfo>(result);
    }
    try {
        const auto& value = result.value().at("value");
        auto decoded = encoding::from_base58(value.at("blockhash").get<std::string>());
        if (decoded.is_error() || decoded.value().size() != 32) {
            return make_error<BlockhashInfo>(ErrorCode::CHAIN_READ_ERROR,
                                             "Malformed blockhash", "RpcClient");
        }
        BlockhashInfo info;
        std::copy(decoded.value().begin(), decoded.value().end(), info.blockhash.begin());
        info.last_valid_block_height = value.value("lastValidBlockHeight", uint64_t{0});
        return info;
    } catch (const nlohmann::json::exception& e) {
        return make_error<BlockhashInfo>(ErrorCode::CHAIN_READ_ERROR,
                                         std::string("Malformed blockhash response: ") + e.what(),
                                         "RpcClient");
    }
}

Result<SimulationResult> JsonRpcClient::simulate_transaction(const Transaction& tx,
                                                             bool sig_verify,
                                                             bool replace_recent_blockhash) {
    nlohmann::json config = {{"encoding", "base64"},
                             {"commitment", commitment_},
                             {"sigVerify", sig_verify},
                             {"replaceRecentBlockhash", replace_recent_blockhash}};
    auto result = transport_.call("simulateTransaction",
                                  nlohmann::json::array({tx.to_base64(), config}),
                                  ErrorCode::SIMULATION_ERROR);
    if (result.is_error()) {
        return forward_error<SimulationResult>(result);
    }

    SimulationResult sim;
    try {
        const auto& value = result.value().at("value");
        if (value.contains("err") && !value["err"].is_null()) {
            sim.success = false;
            sim.error = value["err"].dump();
        } else {
            sim.success = true;
        }
        if (value.contains("logs") && value["logs"].is_array()) {
            for (const auto& line : value["logs"]) {
                sim.logs.push_back(line.get<std::string>());
            }
        }
        if (value.contains("unitsConsumed") && value["unitsConsumed"].is_number()) {
            sim.units_consumed = value["unitsConsumed"].get<uint64_t>();
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<SimulationResult>(ErrorCode::SIMULATION_ERROR,
                                            std::string("Malformed simulation: ") + e.what(),
                                            "RpcClient");
    }
    return sim;
}

Result<std::string> JsonRpcClient::send_transaction(const Transaction& tx, bool skip_preflight) {
    nlohmann::json config = {{"encoding", "base64"},
                             {"skipPreflight", skip_preflight},
                             {"preflightCommitment", commitment_}};
    auto result = transport_.call("sendTransaction",
                                  nlohmann::json::array({tx.to_base64(), config}),
                                  ErrorCode::SUBMISSION_ERROR);
    if (result.is_error()) {
        return forward_error<std::string>(result);
    }
    if (!result.value().is_string()) {
        return make_error<std::string>(ErrorCode::SUBMISSION_ERROR,
                                       "sendTransaction returned no signature", "RpcClient");
    }
    return result.value().get<std::string>();
}

Result<std::vector<SignatureStatus>> JsonRpcClient::get_signature_statuses(
    const std::vector<std::string>& signatures) {
    using Out = std::vector<SignatureStatus>;
    auto result = transport_.call(
        "getSignatureStatuses",
        nlohmann::json::array({signatures, {{"searchTransactionHistory", false}}}),
        ErrorCode::CHAIN_READ_ERROR);
    if (result.is_error()) {
        return forward_error<Out>(result);
    }

    Out statuses;
    try {
        const auto& values = result.value().at("value");
        for (size_t i = 0; i < signatures.size() && i < values.size(); ++i) {
            SignatureStatus status;
            status.signature = signatures[i];
            const auto& entry = values[i];
            if (!entry.is_null()) {
                status.found = true;
                if (entry.contains("confirmationStatus") &&
                    entry["confirmationStatus"].is_string()) {
                    status.confirmation =
                        confirmation_from_string(entry["confirmationStatus"].get<std::string>());
                }
                if (entry.contains("err") && !entry["err"].is_null()) {
                    status.error = entry["err"].dump();
                }
            }
            statuses.push_back(status);
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<Out>(ErrorCode::CHAIN_READ_ERROR,
                               std::string("Malformed signature statuses: ") + e.what(),
                               "RpcClient");
    }
    return statuses;
}

}  // namespace chain
}  // namespace shroud
