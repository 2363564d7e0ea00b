// include/shroud/chain/rpc_client.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "shroud/chain/transaction.hpp"
#include "shroud/net/json_rpc.hpp"

namespace shroud {
namespace chain {

struct AccountInfo {
    PublicKey owner;
    Bytes data;
    uint64_t lamports{0};
    bool executable{false};
};

struct KeyedAccount {
    PublicKey address;
    AccountInfo account;
};

struct MemcmpFilter {
    size_t offset{0};
    Bytes bytes;
};

struct ProgramAccountsFilter {
    std::optional<size_t> data_size;
    std::vector<MemcmpFilter> memcmp;
};

struct BlockhashInfo {
    Hash32 blockhash{};
    uint64_t last_valid_block_height{0};
};

struct SimulationResult {
    bool success{false};
    std::string error;
    std::vector<std::string> logs;
    uint64_t units_consumed{0};
};

enum class ConfirmationStatus { UNKNOWN, PROCESSED, CONFIRMED, FINALIZED };

struct SignatureStatus {
    std::string signature;
    bool found{false};
    ConfirmationStatus confirmation{ConfirmationStatus::UNKNOWN};
    std::string error;  // empty when the transaction succeeded
};

/**
 * @brief Solana JSON-RPC surface used by the pipeline
 *
 * Read failures surface as CHAIN_READ_ERROR, simulation RPC failures as
 * SIMULATION_ERROR and send failures as SUBMISSION_ERROR.
 */
class RpcClient {
public:
    virtual ~RpcClient() = default;

    /**
     * @brief Fetch one account; an empty optional means it does not exist
     */
    virtual Result<std::optional<AccountInfo>> get_account_info(const PublicKey& address) = 0;

    virtual Result<std::vector<KeyedAccount>> get_program_accounts(
        const PublicKey& program_id, const ProgramAccountsFilter& filter) = 0;

    virtual Result<BlockhashInfo> get_latest_blockhash() = 0;

    /**
     * @brief Simulate a (possibly unsigned) transaction
     *
     * A program error is reported through SimulationResult::success, not as an
     * error result.
     */
    virtual Result<SimulationResult> simulate_transaction(const Transaction& tx, bool sig_verify,
                                                          bool replace_recent_blockhash) = 0;

    /**
     * @brief Send a signed transaction and return its signature
     */
    virtual Result<std::string> send_transaction(const Transaction& tx, bool skip_preflight) = 0;

    virtual Result<std::vector<SignatureStatus>> get_signature_statuses(
        const std::vector<std::string>& signatures) = 0;
};

/**
 * @brief RpcClient over JsonRpcTransport with base64 account and transaction encoding
 */
class JsonRpcClient : public RpcClient {
public:
    JsonRpcClient(std::shared_ptr<net::HttpClient> http, const std::string& url,
                  std::string commitment = "confirmed", int max_attempts = 3);

    Result<std::optional<AccountInfo>> get_account_info(const PublicKey& address) override;
    Result<std::vector<KeyedAccount>> get_program_accounts(
        const PublicKey& program_id, const ProgramAccountsFilter& filter) override;
    Result<BlockhashInfo> get_latest_blockhash() override;
    Result<SimulationResult> simulate_transaction(const Transaction& tx, bool sig_verify,
                                                  bool replace_recent_blockhash) override;
    Result<std::string> send_transaction(const Transaction& tx, bool skip_preflight) override;
    Result<std::vector<SignatureStatus>> get_signature_statuses(
        const std::vector<std::string>& signatures) override;

private:
    net::JsonRpcTransport transport_;
    std::string commitment_;
};

/**
 * @brief Parse the "value" of a base64 getAccountInfo response
 */
Result<AccountInfo> parse_account_json(const nlohmann::json& value);

ConfirmationStatus confirmation_from_string(const std::string& text);

}  // namespace chain
}  // namespace shroud
