// src/shield/instruction_sources.cpp

#include "shroud/shield/instruction_sources.hpp"
#include "shroud/chain/system_instructions.hpp"

namespace shroud {
namespace shield {

DriftPerpInstructionSource::DriftPerpInstructionSource(
    std::shared_ptr<program::DriftAccountResolver> resolver, chain::PublicKey collateral_mint,
    uint16_t collateral_spot_market)
    : resolver_(std::move(resolver)),
      collateral_mint_(collateral_mint),
      collateral_spot_market_(collateral_spot_market) {}

Result<chain::Instruction> DriftPerpInstructionSource::deposit(const chain::PublicKey& owner,
                                                               uint64_t amount) {
    auto token_account = chain::associated_token_address(owner, collateral_mint_);
    if (token_account.is_error()) {
        return forward_error<chain::Instruction>(token_account);
    }
    return program::drift::deposit(owner, token_account.value(), collateral_spot_market_, amount);
}

Result<chain::Instruction> DriftPerpInstructionSource::withdraw(const chain::PublicKey& owner,
                                                                uint64_t amount) {
    auto token_account = chain::associated_token_address(owner, collateral_mint_);
    if (token_account.is_error()) {
        return forward_error<chain::Instruction>(token_account);
    }
    return program::drift::withdraw(owner, token_account.value(), collateral_spot_market_,
                                    amount);
}

Result<chain::Instruction> DriftPerpInstructionSource::open_position(
    const chain::PublicKey& owner, const OpenPositionRequest& request) {
    auto accounts = resolver_->resolve(owner, request.market_index);
    if (accounts.is_error()) {
        return forward_error<chain::Instruction>(accounts);
    }
    program::drift::PerpOrderParams params;
    params.market_index = request.market_index;
    params.side = request.side;
    params.base_asset_amount = request.base_asset_amount;
    return program::drift::place_perp_order(accounts.value(), params);
}

Result<chain::Instruction> DriftPerpInstructionSource::close_position(
    const chain::PublicKey& owner, const PositionSnapshot& position, uint32_t percentage) {
    if (percentage == 0 || percentage > 100) {
        return make_error<chain::Instruction>(ErrorCode::VALIDATION_ERROR,
                                              "Close percentage must be 1..100",
                                              "DriftPerpInstructionSource");
    }
    auto accounts = resolver_->resolve(owner, position.market_index);
    if (accounts.is_error()) {
        return forward_error<chain::Instruction>(accounts);
    }

    // Closing is a reduce-only order on the opposite side
    program::drift::PerpOrderParams params;
    params.market_index = position.market_index;
    params.side = position.side == order::OrderSide::LONG ? order::OrderSide::SHORT
                                                          : order::OrderSide::LONG;
    params.base_asset_amount = percentage == 100
                                   ? position.base_asset_amount
                                   : position.base_asset_amount * percentage / 100;
    params.reduce_only = true;
    return program::drift::place_perp_order(accounts.value(), params);
}

}  // namespace shield
}  // namespace shroud
