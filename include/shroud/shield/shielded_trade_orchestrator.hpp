// include/shroud/shield/shielded_trade_orchestrator.hpp
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "shroud/bundle/bundle_submitter.hpp"
#include "shroud/core/clock.hpp"
#include "shroud/core/config_base.hpp"
#include "shroud/shield/instruction_sources.hpp"

namespace shroud {
namespace shield {

enum class ShieldPhase { NONE, DECOMPRESS, DEPOSIT, TRADE, WITHDRAW, COMPRESS };

std::string shield_phase_to_string(ShieldPhase phase);

struct ShieldConfig : public ConfigBase {
    std::string collateral_mint{"EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v"};
    uint16_t collateral_spot_market{0};
    bundle::PriorityLevel priority{bundle::PriorityLevel::HIGH};
    std::string pending_settlement_file;  // empty: kept in memory only

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Withdrawn value that landed publicly and still has to be compressed
 */
struct PendingSettlement {
    chain::PublicKey owner;
    chain::PublicKey mint;
    uint64_t amount{0};
    int64_t created_at_ms{0};

    nlohmann::json to_json() const;
    static Result<PendingSettlement> from_json(const nlohmann::json& j);
};

/**
 * @brief Outcome of a shielded flow; on failure phase names the failing step
 */
struct ShieldResult {
    bool success{false};
    std::string signature;
    std::string bundle_id;
    std::string error;
    ErrorCode error_code{ErrorCode::NONE};
    ShieldPhase phase{ShieldPhase::NONE};
    uint64_t settled_amount{0};
    uint64_t realized_loss{0};
    bool pending_settlement{false};
    uint64_t pending_settlement_amount{0};
};

struct ClosePositionRequest {
    PositionSnapshot position;
    uint32_t percentage{100};
};

/**
 * @brief Wraps perp trades in private-balance decompress and compress steps
 *
 * Every flow is one atomic bundle. When a close lands but its compress step
 * could not be built, the withdrawn amount is recorded as a pending
 * settlement for the owner and folded back later by settle_pending().
 */
class ShieldedTradeOrchestrator {
public:
    ShieldedTradeOrchestrator(std::shared_ptr<bundle::BundleSubmitter> bundles,
                              std::shared_ptr<PrivacyInstructionSource> privacy,
                              std::shared_ptr<PerpInstructionSource> perps, const Clock& clock,
                              ShieldConfig config = ShieldConfig{});

    /**
     * @brief Validate config and restore pending settlements from disk
     */
    Result<void> initialize();

    /**
     * @brief decompress, deposit, open, compress
     *
     * Refused before submission when neither privacy instruction is available.
     */
    ShieldResult open_position(const chain::Keypair& owner, const OpenPositionRequest& request);

    /**
     * @brief close, withdraw, compress
     */
    ShieldResult close_position(const chain::Keypair& owner, const ClosePositionRequest& request);

    /**
     * @brief decompress and deposit only
     */
    ShieldResult prefund(const chain::Keypair& owner, uint64_t amount);

    /**
     * @brief Compress the owner's pending settlement; safe to retry
     *
     * A no-op that succeeds with settled_amount 0 when nothing is pending.
     */
    ShieldResult settle_pending(const chain::Keypair& owner);

    bool has_pending_settlement(const chain::PublicKey& owner) const;
    std::optional<PendingSettlement> pending_settlement(const chain::PublicKey& owner) const;
    std::vector<PendingSettlement> pending_settlements() const;

    Result<void> save_pending(const std::string& path) const;
    Result<void> load_pending(const std::string& path);

private:
    ShieldResult fail(ShieldPhase phase, ErrorCode code, const std::string& message) const;
    ShieldResult fail(ShieldPhase phase, const ShroudError& error) const;
    ShieldResult submit(const std::vector<chain::Instruction>& instructions,
                        const chain::Keypair& owner, ShieldPhase success_phase);
    void record_pending(const chain::PublicKey& owner, uint64_t amount);
    void persist_pending() const;

    std::shared_ptr<bundle::BundleSubmitter> bundles_;
    std::shared_ptr<PrivacyInstructionSource> privacy_;
    std::shared_ptr<PerpInstructionSource> perps_;
    const Clock& clock_;
    ShieldConfig config_;
    chain::PublicKey mint_;

    mutable std::mutex pending_mutex_;
    std::map<chain::PublicKey, PendingSettlement> pending_;
};

}  // namespace shield
}  // namespace shroud
