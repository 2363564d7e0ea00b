// src/shield/shielded_trade_orchestrator.cpp

#include "shroud/shield/shielded_trade_orchestrator.hpp"
#include <fstream>
#include <iomanip>
#include "shroud/core/logger.hpp"

namespace shroud {
namespace shield {

namespace {

constexpr const char* COMPONENT = "ShieldedTradeOrchestrator";

}  // namespace

std::string shield_phase_to_string(ShieldPhase phase) {
    switch (phase) {
        case ShieldPhase::NONE:
            return "none";
        case ShieldPhase::DECOMPRESS:
            return "decompress";
        case ShieldPhase::DEPOSIT:
            return "deposit";
        case ShieldPhase::TRADE:
            return "trade";
        case ShieldPhase::WITHDRAW:
            return "withdraw";
        case ShieldPhase::COMPRESS:
            return "compress";
        default:
            return "unknown";
    }
}

nlohmann::json ShieldConfig::to_json() const {
    nlohmann::json j;
    j["collateral_mint"] = collateral_mint;
    j["collateral_spot_market"] = collateral_spot_market;
    j["priority"] = bundle::priority_level_to_string(priority);
    j["pending_settlement_file"] = pending_settlement_file;
    return j;
}

void ShieldConfig::from_json(const nlohmann::json& j) {
    if (j.contains("collateral_mint"))
        collateral_mint = j.at("collateral_mint").get<std::string>();
    if (j.contains("collateral_spot_market"))
        collateral_spot_market = j.at("collateral_spot_market").get<uint16_t>();
    if (j.contains("priority")) {
        bundle::PriorityLevel level;
        if (bundle::priority_level_from_string(j.at("priority").get<std::string>(), level)) {
            priority = level;
        }
    }
    if (j.contains("pending_settlement_file"))
        pending_settlement_file = j.at("pending_settlement_file").get<std::string>();
}

nlohmann::json PendingSettlement::to_json() const {
    nlohmann::json j;
    j["owner"] = owner.to_base58();
    j["mint"] = mint.to_base58();
    j["amount"] = amount;
    j["created_at_ms"] = created_at_ms;
    return j;
}

Result<PendingSettlement> PendingSettlement::from_json(const nlohmann::json& j) {
    try {
        PendingSettlement pending;
        auto owner = chain::PublicKey::from_base58(j.at("owner").get<std::string>());
        if (owner.is_error()) {
            return forward_error<PendingSettlement>(owner);
        }
        auto mint = chain::PublicKey::from_base58(j.at("mint").get<std::string>());
        if (mint.is_error()) {
            return forward_error<PendingSettlement>(mint);
        }
        pending.owner = owner.value();
        pending.mint = mint.value();
        pending.amount = j.at("amount").get<uint64_t>();
        pending.created_at_ms = j.value("created_at_ms", int64_t{0});
        return pending;
    } catch (const nlohmann::json::exception& e) {
        return make_error<PendingSettlement>(ErrorCode::JSON_PARSE_ERROR,
                                             std::string("Bad pending settlement: ") + e.what(),
                                             COMPONENT);
    }
}

ShieldedTradeOrchestrator::ShieldedTradeOrchestrator(
    std::shared_ptr<bundle::BundleSubmitter> bundles,
    std::shared_ptr<PrivacyInstructionSource> privacy,
    std::shared_ptr<PerpInstructionSource> perps, const Clock& clock, ShieldConfig config)
    : bundles_(std::move(bundles)),
      privacy_(std::move(privacy)),
      perps_(std::move(perps)),
      clock_(clock),
      config_(std::move(config)) {}

Result<void> ShieldedTradeOrchestrator::initialize() {
    if (!bundles_ || !privacy_ || !perps_) {
        return make_error<void>(ErrorCode::NOT_INITIALIZED,
                                "Orchestrator is missing a required dependency", COMPONENT);
    }
    auto mint = chain::PublicKey::from_base58(config_.collateral_mint);
    if (mint.is_error()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Invalid collateral mint: " + config_.collateral_mint, COMPONENT);
    }
    mint_ = mint.value();

    if (!config_.pending_settlement_file.empty()) {
        std::ifstream existing(config_.pending_settlement_file);
        if (existing.good()) {
            auto loaded = load_pending(config_.pending_settlement_file);
            if (loaded.is_error()) {
                return loaded;
            }
        }
    }
    return Result<void>();
}

ShieldResult ShieldedTradeOrchestrator::fail(ShieldPhase phase, ErrorCode code,
                                             const std::string& message) const {
    ShieldResult result;
    result.success = false;
    result.phase = phase;
    result.error_code = code;
    result.error = message;
    ERROR("Shielded flow failed at " << shield_phase_to_string(phase) << ": " << message);
    return result;
}

ShieldResult ShieldedTradeOrchestrator::fail(ShieldPhase phase, const ShroudError& error) const {
    return fail(phase, error.code(), error.what());
}

ShieldResult ShieldedTradeOrchestrator::submit(const std::vector<chain::Instruction>& instructions,
                                               const chain::Keypair& owner,
                                               ShieldPhase success_phase) {
    INFO("Submitting shielded bundle with " << instructions.size() << " instruction(s)");
    bundle::BundleResult sent = bundles_->submit_with_retry(
        instructions, owner, bundles_->estimate_tip(config_.priority));

    ShieldResult result;
    result.signature = sent.signature;
    result.bundle_id = sent.bundle_id;
    if (!sent.success) {
        // The bundle is atomic, so nothing past the trade took effect
        ShieldResult failed = fail(ShieldPhase::TRADE,
                                   sent.error_code == ErrorCode::NONE ? ErrorCode::SUBMISSION_ERROR
                                                                      : sent.error_code,
                                   sent.phase + ": " + sent.error);
        failed.bundle_id = sent.bundle_id;
        return failed;
    }
    result.success = true;
    result.phase = success_phase;
    return result;
}

ShieldResult ShieldedTradeOrchestrator::open_position(const chain::Keypair& owner,
                                                      const OpenPositionRequest& request) {
    ScopedLogComponent log_component(COMPONENT);
    if (request.collateral_amount == 0 || request.base_asset_amount == 0) {
        return fail(ShieldPhase::DEPOSIT, ErrorCode::VALIDATION_ERROR,
                    "Collateral and position size must be positive");
    }
    const chain::PublicKey& key = owner.public_key();
    std::vector<chain::Instruction> instructions;

    auto decompress = privacy_->build_decompress(key, request.collateral_amount, mint_);
    if (decompress.is_error()) {
        WARN("Decompress instruction unavailable: " << decompress.error()->what());
    } else {
        instructions.push_back(decompress.value());
    }

    auto deposit = perps_->deposit(key, request.collateral_amount);
    if (deposit.is_error()) {
        return fail(ShieldPhase::DEPOSIT, *deposit.error());
    }
    instructions.push_back(deposit.value());

    auto open = perps_->open_position(key, request);
    if (open.is_error()) {
        return fail(ShieldPhase::TRADE, *open.error());
    }
    instructions.push_back(open.value());

    auto compress = privacy_->build_compress(key, request.collateral_amount, mint_);
    if (compress.is_error()) {
        WARN("Compress instruction unavailable: " << compress.error()->what());
    } else {
        instructions.push_back(compress.value());
    }

    if (decompress.is_error() && compress.is_error()) {
        return fail(ShieldPhase::DECOMPRESS, ErrorCode::VALIDATION_ERROR,
                    "Privacy layer unavailable, refusing to trade publicly");
    }

    ShieldResult result = submit(instructions, owner,
                                 compress.is_ok() ? ShieldPhase::COMPRESS : ShieldPhase::TRADE);
    if (result.success) {
        INFO("Shielded open landed on market " << request.market_index << " (" << result.signature
                                               << ")");
    }
    return result;
}

ShieldResult ShieldedTradeOrchestrator::close_position(const chain::Keypair& owner,
                                                       const ClosePositionRequest& request) {
    ScopedLogComponent log_component(COMPONENT);
    if (request.percentage == 0 || request.percentage > 100) {
        return fail(ShieldPhase::TRADE, ErrorCode::VALIDATION_ERROR,
                    "Close percentage must be 1..100");
    }
    const chain::PublicKey& key = owner.public_key();
    std::vector<chain::Instruction> instructions;

    auto close = perps_->close_position(key, request.position, request.percentage);
    if (close.is_error()) {
        return fail(ShieldPhase::TRADE, *close.error());
    }
    instructions.push_back(close.value());

    const int64_t pnl = request.position.unrealized_pnl;
    const int64_t total = request.position.collateral + pnl;
    const uint64_t realized_loss = pnl < 0 ? static_cast<uint64_t>(-pnl) : 0;

    uint64_t withdraw_amount = 0;
    bool compress_included = false;
    if (total > 0) {
        withdraw_amount = request.percentage < 100
                              ? static_cast<uint64_t>(total) * request.percentage / 100
                              : static_cast<uint64_t>(total);
        auto withdraw = perps_->withdraw(key, withdraw_amount);
        if (withdraw.is_error()) {
            return fail(ShieldPhase::WITHDRAW, *withdraw.error());
        }
        instructions.push_back(withdraw.value());

        auto compress = privacy_->build_compress(key, withdraw_amount, mint_);
        if (compress.is_error()) {
            WARN("Compress instruction unavailable, settlement will be deferred: "
                 << compress.error()->what());
        } else {
            instructions.push_back(compress.value());
            compress_included = true;
        }
    } else {
        INFO("Position has no remaining value, closing without withdraw");
    }

    ShieldResult result = submit(
        instructions, owner, compress_included ? ShieldPhase::COMPRESS : ShieldPhase::WITHDRAW);
    result.realized_loss = realized_loss;
    if (!result.success) {
        return result;
    }
    result.settled_amount = withdraw_amount;

    if (!compress_included && withdraw_amount > 0) {
        record_pending(key, withdraw_amount);
        result.pending_settlement = true;
        result.pending_settlement_amount = withdraw_amount;
        WARN("Close landed without compress, " << withdraw_amount
                                               << " pending settlement for " << key.to_base58());
    } else {
        INFO("Shielded close landed (" << result.signature << ")");
    }
    return result;
}

ShieldResult ShieldedTradeOrchestrator::prefund(const chain::Keypair& owner, uint64_t amount) {
    ScopedLogComponent log_component(COMPONENT);
    if (amount == 0) {
        return fail(ShieldPhase::DEPOSIT, ErrorCode::VALIDATION_ERROR,
                    "Prefund amount must be positive");
    }
    const chain::PublicKey& key = owner.public_key();

    auto decompress = privacy_->build_decompress(key, amount, mint_);
    if (decompress.is_error()) {
        return fail(ShieldPhase::DECOMPRESS, *decompress.error());
    }
    auto deposit = perps_->deposit(key, amount);
    if (deposit.is_error()) {
        return fail(ShieldPhase::DEPOSIT, *deposit.error());
    }

    ShieldResult result = submit({decompress.value(), deposit.value()}, owner,
                                 ShieldPhase::DEPOSIT);
    if (result.success) {
        result.settled_amount = amount;
    } else {
        result.phase = ShieldPhase::DEPOSIT;
    }
    return result;
}

ShieldResult ShieldedTradeOrchestrator::settle_pending(const chain::Keypair& owner) {
    ScopedLogComponent log_component(COMPONENT);
    const chain::PublicKey& key = owner.public_key();

    std::optional<PendingSettlement> pending = pending_settlement(key);
    if (!pending || pending->amount == 0) {
        DEBUG("No pending settlement for " << key.to_base58());
        ShieldResult result;
        result.success = true;
        return result;
    }
    INFO("Attempting settlement of " << pending->amount << " for " << key.to_base58());

    auto compress = privacy_->build_compress(key, pending->amount, pending->mint);
    if (compress.is_error()) {
        ShieldResult result = fail(ShieldPhase::COMPRESS, ErrorCode::SETTLEMENT_GAP,
                                   compress.error()->what());
        result.pending_settlement = true;
        result.pending_settlement_amount = pending->amount;
        return result;
    }

    ShieldResult result = submit({compress.value()}, owner, ShieldPhase::COMPRESS);
    if (!result.success) {
        result.phase = ShieldPhase::COMPRESS;
        result.error_code = ErrorCode::SETTLEMENT_GAP;
        result.pending_settlement = true;
        result.pending_settlement_amount = pending->amount;
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(key);
        if (it != pending_.end()) {
            // A close may have added to the gap while this settlement was in flight
            if (it->second.amount > pending->amount) {
                it->second.amount -= pending->amount;
            } else {
                pending_.erase(it);
            }
        }
    }
    persist_pending();

    result.settled_amount = pending->amount;
    INFO("Settled " << pending->amount << " for " << key.to_base58() << " ("
                    << result.signature << ")");
    return result;
}

void ShieldedTradeOrchestrator::record_pending(const chain::PublicKey& owner, uint64_t amount) {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(owner);
        if (it == pending_.end()) {
            PendingSettlement pending;
            pending.owner = owner;
            pending.mint = mint_;
            pending.amount = amount;
            pending.created_at_ms = clock_.now_ms();
            pending_.emplace(owner, pending);
        } else {
            it->second.amount += amount;
        }
    }
    persist_pending();
}

bool ShieldedTradeOrchestrator::has_pending_settlement(const chain::PublicKey& owner) const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(owner);
    return it != pending_.end() && it->second.amount > 0;
}

std::optional<PendingSettlement> ShieldedTradeOrchestrator::pending_settlement(
    const chain::PublicKey& owner) const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(owner);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PendingSettlement> ShieldedTradeOrchestrator::pending_settlements() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    std::vector<PendingSettlement> out;
    for (const auto& entry : pending_) {
        out.push_back(entry.second);
    }
    return out;
}

Result<void> ShieldedTradeOrchestrator::save_pending(const std::string& path) const {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& pending : pending_settlements()) {
        j.push_back(pending.to_json());
    }
    std::ofstream file(path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for writing: " + path, COMPONENT);
    }
    file << std::setw(4) << j << std::endl;
    return Result<void>();
}

Result<void> ShieldedTradeOrchestrator::load_pending(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open file for reading: " + path, COMPONENT);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                std::string("Error loading pending settlements: ") + e.what(),
                                COMPONENT);
    }
    if (!j.is_array()) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Pending settlements file must hold an array", COMPONENT);
    }

    std::map<chain::PublicKey, PendingSettlement> loaded;
    for (const auto& entry : j) {
        auto pending = PendingSettlement::from_json(entry);
        if (pending.is_error()) {
            return forward_error<void>(pending);
        }
        loaded[pending.value().owner] = pending.value();
    }

    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_ = std::move(loaded);
    INFO("Restored " << pending_.size() << " pending settlement(s) from " << path);
    return Result<void>();
}

void ShieldedTradeOrchestrator::persist_pending() const {
    if (config_.pending_settlement_file.empty()) {
        return;
    }
    auto saved = save_pending(config_.pending_settlement_file);
    if (saved.is_error()) {
        ERROR("Could not persist pending settlements: " << saved.error()->what());
    }
}

}  // namespace shield
}  // namespace shroud
