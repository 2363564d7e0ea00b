// src/bundle/bundle_submitter.cpp

#include "shroud/bundle/bundle_submitter.hpp"
#include <algorithm>
#include <cmath>
#include <thread>
#include "shroud/chain/system_instructions.hpp"
#include "shroud/core/logger.hpp"

namespace shroud {
namespace bundle {

namespace {

BundleResult failure(const std::string& phase, ErrorCode code, const std::string& message,
                     uint64_t tip) {
    BundleResult result;
    result.success = false;
    result.phase = phase;
    result.error_code = code;
    result.error = message;
    result.final_tip = tip;
    result.attempts = 1;
    return result;
}

std::string last_logs(const std::vector<std::string>& logs, size_t count = 5) {
    std::string out;
    size_t start = logs.size() > count ? logs.size() - count : 0;
    for (size_t i = start; i < logs.size(); ++i) {
        out += "\n  " + logs[i];
    }
    return out;
}

}  // namespace

std::string landing_status_to_string(LandingStatus status) {
    switch (status) {
        case LandingStatus::LANDED:
            return "LANDED";
        case LandingStatus::FAILED:
            return "FAILED";
        case LandingStatus::TIMEOUT:
            return "TIMEOUT";
        default:
            return "UNKNOWN";
    }
}

BundleSubmitter::BundleSubmitter(std::shared_ptr<chain::RpcClient> rpc,
                                 std::shared_ptr<BundleRelay> relay,
                                 crypto::RandomSource& random, BundleConfig config)
    : rpc_(std::move(rpc)), relay_(std::move(relay)), random_(random), config_(std::move(config)) {
    for (const auto& text : config_.tip_accounts) {
        auto key = chain::PublicKey::from_base58(text);
        if (key.is_error()) {
            WARN("Ignoring invalid tip account " << text);
            continue;
        }
        tip_accounts_.push_back(key.value());
    }
}

Result<void> BundleSubmitter::initialize() {
    if (config_.lookup_table_address.empty()) {
        return Result<void>();
    }
    auto key = chain::PublicKey::from_base58(config_.lookup_table_address);
    if (key.is_error()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid lookup table address: " + config_.lookup_table_address,
                                "BundleSubmitter");
    }
    auto account = rpc_->get_account_info(key.value());
    if (account.is_error()) {
        return forward_error<void>(account);
    }
    if (!account.value()) {
        return make_error<void>(ErrorCode::CHAIN_READ_ERROR,
                                "Lookup table " + config_.lookup_table_address + " not found",
                                "BundleSubmitter");
    }
    auto table = chain::parse_lookup_table(key.value(), account.value()->data);
    if (table.is_error()) {
        return forward_error<void>(table);
    }
    INFO("Loaded lookup table " << config_.lookup_table_address << " with "
                                << table.value().addresses.size() << " addresses");
    lookup_table_ = table.value();
    return Result<void>();
}

uint64_t BundleSubmitter::estimate_tip(PriorityLevel level) const {
    return std::max(MINIMUM_TIP_LAMPORTS, base_tip_lamports(level));
}

uint64_t BundleSubmitter::escalate_tip(uint64_t tip) const {
    const double next = std::floor(static_cast<double>(tip) * config_.tip_escalation);
    return std::min(static_cast<uint64_t>(next), config_.max_tip_lamports);
}

Result<chain::Instruction> BundleSubmitter::tip_instruction(const chain::PublicKey& payer,
                                                            uint64_t lamports) {
    if (tip_accounts_.empty()) {
        return make_error<chain::Instruction>(ErrorCode::NOT_INITIALIZED,
                                              "No tip accounts configured", "BundleSubmitter");
    }
    auto index = random_.uniform_index(tip_accounts_.size());
    if (index.is_error()) {
        return forward_error<chain::Instruction>(index);
    }
    return chain::transfer(payer, tip_accounts_[index.value()], lamports);
}

Result<chain::Message> BundleSubmitter::build_atomic_bundle(
    const std::vector<chain::Instruction>& instructions, const chain::PublicKey& payer,
    uint64_t tip, const Hash32& recent_blockhash) {
    if (instructions.empty()) {
        return make_error<chain::Message>(ErrorCode::VALIDATION_ERROR, "No instructions provided",
                                          "BundleSubmitter");
    }

    std::vector<chain::Instruction> all;
    all.reserve(instructions.size() + 3);
    all.push_back(chain::set_compute_unit_limit(config_.compute_unit_limit));
    all.push_back(chain::set_compute_unit_price(priority_fee_micro_lamports(config_.priority)));
    all.insert(all.end(), instructions.begin(), instructions.end());
    if (tip > 0) {
        auto tip_ix = tip_instruction(payer, tip);
        if (tip_ix.is_error()) {
            return forward_error<chain::Message>(tip_ix);
        }
        all.push_back(tip_ix.value());
    }

    auto legacy = chain::Message::compile_legacy(payer, all, recent_blockhash);
    size_t legacy_size = 0;
    if (legacy.is_ok()) {
        legacy_size = chain::serialized_transaction_size(legacy.value());
        if (legacy_size <= config_.lookup_table_threshold_bytes) {
            return legacy;
        }
    }

    if (lookup_table_) {
        auto versioned = chain::Message::compile_v0(payer, all, recent_blockhash, {*lookup_table_});
        if (versioned.is_error()) {
            return versioned;
        }
        const size_t size = chain::serialized_transaction_size(versioned.value());
        if (size > chain::MAX_TRANSACTION_SIZE) {
            return make_error<chain::Message>(
                ErrorCode::VALIDATION_ERROR,
                "Transaction is " + std::to_string(size) + " bytes even with lookup table",
                "BundleSubmitter");
        }
        DEBUG("Compiled v0 message: " << size << " bytes (legacy " << legacy_size << ")");
        return versioned;
    }

    if (legacy.is_error()) {
        return legacy;
    }
    if (legacy_size > chain::MAX_TRANSACTION_SIZE) {
        return make_error<chain::Message>(ErrorCode::VALIDATION_ERROR,
                                          "Transaction is " + std::to_string(legacy_size) +
                                              " bytes and no lookup table is configured",
                                          "BundleSubmitter");
    }
    return legacy;
}

BundleResult BundleSubmitter::submit(const std::vector<chain::Instruction>& instructions,
                                     const chain::Keypair& payer, uint64_t tip,
                                     const std::vector<const chain::Keypair*>& extra_signers) {
    auto blockhash = rpc_->get_latest_blockhash();
    if (blockhash.is_error()) {
        return failure("blockhash", blockhash.error()->code(), blockhash.error()->what(), tip);
    }

    auto message =
        build_atomic_bundle(instructions, payer.public_key(), tip, blockhash.value().blockhash);
    if (message.is_error()) {
        return failure("build", message.error()->code(), message.error()->what(), tip);
    }

    chain::Transaction tx(message.value());
    auto simulation = rpc_->simulate_transaction(tx, false, true);
    if (simulation.is_error()) {
        return failure("simulate", ErrorCode::SIMULATION_ERROR, simulation.error()->what(), tip);
    }
    if (!simulation.value().success) {
        ERROR("Bundle simulation failed: " << simulation.value().error
                                           << last_logs(simulation.value().logs));
        return failure("simulate", ErrorCode::SIMULATION_ERROR,
                       "Transaction simulation failed: " + simulation.value().error, tip);
    }
    DEBUG("Simulation passed, units consumed " << simulation.value().units_consumed);

    std::vector<const chain::Keypair*> signers{&payer};
    signers.insert(signers.end(), extra_signers.begin(), extra_signers.end());
    auto signed_result = tx.sign(signers);
    if (signed_result.is_error()) {
        return failure("sign", signed_result.error()->code(), signed_result.error()->what(), tip);
    }

    return finish({tx.to_base64()}, tx.signature(), tip);
}

BundleResult BundleSubmitter::submit_multi(const std::vector<BundleTransaction>& transactions,
                                           const chain::Keypair& payer, uint64_t tip) {
    if (transactions.empty()) {
        return failure("build", ErrorCode::VALIDATION_ERROR, "No transactions provided", tip);
    }
    if (transactions.size() > config_.max_transactions) {
        return failure("build", ErrorCode::VALIDATION_ERROR,
                       "Bundle can contain at most " + std::to_string(config_.max_transactions) +
                           " transactions",
                       tip);
    }

    auto blockhash = rpc_->get_latest_blockhash();
    if (blockhash.is_error()) {
        return failure("blockhash", blockhash.error()->code(), blockhash.error()->what(), tip);
    }

    std::vector<chain::Transaction> compiled;
    compiled.reserve(transactions.size());
    for (size_t i = 0; i < transactions.size(); ++i) {
        const bool last = i + 1 == transactions.size();
        auto message = build_atomic_bundle(transactions[i].instructions, payer.public_key(),
                                           last ? tip : 0, blockhash.value().blockhash);
        if (message.is_error()) {
            return failure("build", message.error()->code(),
                           "Transaction " + std::to_string(i + 1) + ": " +
                               message.error()->what(),
                           tip);
        }
        chain::Transaction tx(message.value());
        auto simulation = rpc_->simulate_transaction(tx, false, true);
        if (simulation.is_error() || !simulation.value().success) {
            const std::string reason = simulation.is_error() ? simulation.error()->what()
                                                             : simulation.value().error;
            ERROR("Bundle transaction " << (i + 1) << " simulation failed: " << reason);
            return failure("simulate", ErrorCode::SIMULATION_ERROR,
                           "Transaction " + std::to_string(i + 1) +
                               " simulation failed: " + reason,
                           tip);
        }
        compiled.push_back(std::move(tx));
    }

    std::vector<std::string> encoded;
    for (size_t i = 0; i < compiled.size(); ++i) {
        std::vector<const chain::Keypair*> signers{&payer};
        signers.insert(signers.end(), transactions[i].extra_signers.begin(),
                       transactions[i].extra_signers.end());
        auto signed_result = compiled[i].sign(signers);
        if (signed_result.is_error()) {
            return failure("sign", signed_result.error()->code(), signed_result.error()->what(),
                           tip);
        }
        encoded.push_back(compiled[i].to_base64());
    }

    return finish(std::move(encoded), compiled.front().signature(), tip);
}

BundleResult BundleSubmitter::finish(std::vector<std::string> encoded, std::string signature,
                                     uint64_t tip) {
    auto bundle_id = relay_->send_bundle(encoded);
    if (bundle_id.is_error()) {
        return failure("submit", ErrorCode::SUBMISSION_ERROR, bundle_id.error()->what(), tip);
    }
    INFO("Submitted bundle " << bundle_id.value() << " (" << encoded.size()
                             << " tx, tip " << tip << ")");

    BundleResult result;
    result.bundle_id = bundle_id.value();
    result.signature = std::move(signature);
    result.final_tip = tip;
    result.attempts = 1;

    const LandingStatus landing = poll_landing(result.bundle_id);
    if (landing == LandingStatus::LANDED) {
        result.success = true;
        return result;
    }
    result.phase = "landing";
    if (landing == LandingStatus::FAILED) {
        result.error_code = ErrorCode::SUBMISSION_ERROR;
        result.error = "Bundle " + result.bundle_id + " failed";
    } else {
        result.error_code = ErrorCode::TIMEOUT_ERROR;
        result.error = "Bundle " + result.bundle_id + " confirmation timeout";
    }
    WARN(result.error);
    return result;
}

LandingStatus BundleSubmitter::poll_landing(const std::string& bundle_id) {
    for (int attempt = 1; attempt <= config_.poll_attempts; ++attempt) {
        if (config_.poll_interval_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.poll_interval_ms));
        }
        auto status = relay_->get_bundle_status(bundle_id);
        if (status.is_error()) {
            DEBUG("Status check " << attempt << " for " << bundle_id
                                  << " failed: " << status.error()->what());
            continue;
        }
        if (status.value() == BundleStatus::LANDED) {
            return LandingStatus::LANDED;
        }
        if (status.value() == BundleStatus::FAILED) {
            return LandingStatus::FAILED;
        }
    }
    return LandingStatus::TIMEOUT;
}

template <typename Attempt>
BundleResult BundleSubmitter::retry_loop(uint64_t initial_tip, Attempt attempt) {
    const int max_attempts = std::max(1, config_.max_retries);
    uint64_t tip = initial_tip;
    BundleResult last;
    for (int n = 1; n <= max_attempts; ++n) {
        INFO("Bundle attempt " << n << "/" << max_attempts << ", tip " << tip << " lamports");
        last = attempt(tip);
        last.attempts = n;
        last.final_tip = tip;
        if (last.success || !last.retryable()) {
            return last;
        }
        if (n < max_attempts) {
            tip = escalate_tip(tip);
        }
    }
    last.error = "Bundle failed after " + std::to_string(max_attempts) +
                 " attempts: " + last.error;
    return last;
}

BundleResult BundleSubmitter::submit_with_retry(
    const std::vector<chain::Instruction>& instructions, const chain::Keypair& payer,
    std::optional<uint64_t> initial_tip, const std::vector<const chain::Keypair*>& extra_signers) {
    const uint64_t tip = initial_tip ? *initial_tip : estimate_tip(config_.priority);
    return retry_loop(tip, [&](uint64_t current) {
        return submit(instructions, payer, current, extra_signers);
    });
}

BundleResult BundleSubmitter::submit_multi_with_retry(
    const std::vector<BundleTransaction>& transactions, const chain::Keypair& payer,
    std::optional<uint64_t> initial_tip) {
    const uint64_t tip = initial_tip ? *initial_tip : estimate_tip(config_.priority);
    return retry_loop(tip, [&](uint64_t current) {
        return submit_multi(transactions, payer, current);
    });
}

}  // namespace bundle
}  // namespace shroud
