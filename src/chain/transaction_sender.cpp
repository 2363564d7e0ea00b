// src/chain/transaction_sender.cpp

#include "shroud/chain/transaction_sender.hpp"
#include <thread>
#include "shroud/core/logger.hpp"

namespace shroud {
namespace chain {

TransactionSender::TransactionSender(std::shared_ptr<RpcClient> rpc, SendOptions options)
    : rpc_(std::move(rpc)), options_(options) {}

Result<std::string> TransactionSender::send_and_confirm(
    const std::vector<Instruction>& instructions, const Keypair& payer) {
    auto blockhash = rpc_->get_latest_blockhash();
    if (blockhash.is_error()) {
        return forward_error<std::string>(blockhash);
    }

    auto message =
        Message::compile_legacy(payer.public_key(), instructions, blockhash.value().blockhash);
    if (message.is_error()) {
        return forward_error<std::string>(message);
    }

    Transaction tx(message.value());
    auto signed_result = tx.sign({&payer});
    if (signed_result.is_error()) {
        return forward_error<std::string>(signed_result);
    }

    auto sent = rpc_->send_transaction(tx, options_.skip_preflight);
    if (sent.is_error()) {
        return forward_error<std::string>(sent);
    }
    const std::string signature = sent.value();
    DEBUG("Sent transaction " << signature);

    for (int attempt = 0; attempt < options_.confirm_attempts; ++attempt) {
        auto statuses = rpc_->get_signature_statuses({signature});
        if (statuses.is_ok() && !statuses.value().empty()) {
            const SignatureStatus& status = statuses.value().front();
            if (status.found && !status.error.empty()) {
                return make_error<std::string>(ErrorCode::SUBMISSION_ERROR,
                                               "Transaction " + signature +
                                                   " failed: " + status.error,
                                               "TransactionSender");
            }
            if (status.found && (status.confirmation == ConfirmationStatus::CONFIRMED ||
                                 status.confirmation == ConfirmationStatus::FINALIZED)) {
                return signature;
            }
        } else if (statuses.is_error()) {
            DEBUG("Status poll for " << signature << " failed: " << statuses.error()->what());
        }
        if (options_.confirm_interval.count() > 0) {
            std::this_thread::sleep_for(options_.confirm_interval);
        }
    }

    return make_error<std::string>(ErrorCode::TIMEOUT_ERROR,
                                   "Transaction " + signature + " not confirmed after " +
                                       std::to_string(options_.confirm_attempts) + " polls",
                                   "TransactionSender");
}

}  // namespace chain
}  // namespace shroud
