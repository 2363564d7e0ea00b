// include/shroud/shield/instruction_sources.hpp
#pragma once

#include <memory>
#include "shroud/chain/instruction.hpp"
#include "shroud/order/order_payload.hpp"
#include "shroud/program/drift_accounts.hpp"

namespace shroud {
namespace shield {

/**
 * @brief Builds instructions that move value between the private balance and
 * the public token account
 *
 * An error means the instruction is unavailable right now (no proof service,
 * no compressed balance); callers decide whether the trade may proceed.
 */
class PrivacyInstructionSource {
public:
    virtual ~PrivacyInstructionSource() = default;

    virtual Result<chain::Instruction> build_decompress(const chain::PublicKey& owner,
                                                        uint64_t amount,
                                                        const chain::PublicKey& mint) = 0;

    virtual Result<chain::Instruction> build_compress(const chain::PublicKey& owner,
                                                      uint64_t amount,
                                                      const chain::PublicKey& mint) = 0;
};

struct OpenPositionRequest {
    uint16_t market_index{0};
    order::OrderSide side{order::OrderSide::LONG};
    uint64_t base_asset_amount{0};
    uint64_t collateral_amount{0};
};

/**
 * @brief Caller's view of an open position, quote amounts in collateral units
 */
struct PositionSnapshot {
    uint16_t market_index{0};
    order::OrderSide side{order::OrderSide::LONG};
    uint64_t base_asset_amount{0};
    int64_t collateral{0};
    int64_t unrealized_pnl{0};
};

/**
 * @brief Venue instructions used by the shielded flows
 */
class PerpInstructionSource {
public:
    virtual ~PerpInstructionSource() = default;

    virtual Result<chain::Instruction> deposit(const chain::PublicKey& owner, uint64_t amount) = 0;
    virtual Result<chain::Instruction> withdraw(const chain::PublicKey& owner, uint64_t amount) = 0;
    virtual Result<chain::Instruction> open_position(const chain::PublicKey& owner,
                                                     const OpenPositionRequest& request) = 0;

    /**
     * @param percentage 1..100 of the position's base amount
     */
    virtual Result<chain::Instruction> close_position(const chain::PublicKey& owner,
                                                      const PositionSnapshot& position,
                                                      uint32_t percentage) = 0;
};

/**
 * @brief PerpInstructionSource over the Drift program
 *
 * Collateral moves through the owner's associated token account for the
 * configured mint and spot market.
 */
class DriftPerpInstructionSource : public PerpInstructionSource {
public:
    DriftPerpInstructionSource(std::shared_ptr<program::DriftAccountResolver> resolver,
                               chain::PublicKey collateral_mint,
                               uint16_t collateral_spot_market = 0);

    Result<chain::Instruction> deposit(const chain::PublicKey& owner, uint64_t amount) override;
    Result<chain::Instruction> withdraw(const chain::PublicKey& owner, uint64_t amount) override;
    Result<chain::Instruction> open_position(const chain::PublicKey& owner,
                                             const OpenPositionRequest& request) override;
    Result<chain::Instruction> close_position(const chain::PublicKey& owner,
                                              const PositionSnapshot& position,
                                              uint32_t percentage) override;

private:
    std::shared_ptr<program::DriftAccountResolver> resolver_;
    chain::PublicKey collateral_mint_;
    uint16_t collateral_spot_market_;
};

}  // namespace shield
}  // namespace shroud
