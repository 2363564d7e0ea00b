// include/shroud/chain/transaction_sender.hpp
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "shroud/chain/rpc_client.hpp"

namespace shroud {
namespace chain {

struct SendOptions {
    bool skip_preflight{false};
    int confirm_attempts{30};
    std::chrono::milliseconds confirm_interval{std::chrono::milliseconds(500)};
};

/**
 * @brief Direct sign-send-confirm path used outside of bundles
 *
 * Used for the ephemeral rollup lane, where orders are already delegated
 * and bundles do not apply.
 */
class TransactionSender {
public:
    explicit TransactionSender(std::shared_ptr<RpcClient> rpc, SendOptions options = SendOptions{});

    /**
     * @brief Compile against a fresh blockhash, sign, send and wait for confirmation
     * @return Transaction signature, SUBMISSION_ERROR if it failed on-chain,
     *         TIMEOUT_ERROR if confirmation never arrived
     */
    Result<std::string> send_and_confirm(const std::vector<Instruction>& instructions,
                                         const Keypair& payer);

private:
    std::shared_ptr<RpcClient> rpc_;
    SendOptions options_;
};

}  // namespace chain
}  // namespace shroud
