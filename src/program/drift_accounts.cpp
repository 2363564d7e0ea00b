// src/program/drift_accounts.cpp

#include "shroud/program/drift_accounts.hpp"
#include "shroud/chain/system_instructions.hpp"
#include "shroud/core/byte_layout.hpp"
#include "shroud/core/logger.hpp"
#include "shroud/program/accounts.hpp"
#include "shroud/program/program_ids.hpp"

namespace shroud {
namespace program {

namespace drift {

namespace {

constexpr uint8_t ORDER_TYPE_MARKET = 0;

Result<chain::PublicKey> derive(const chain::Seeds& seeds) {
    auto pda = chain::find_program_address(seeds, drift_program_id());
    if (pda.is_error()) {
        return forward_error<chain::PublicKey>(pda);
    }
    return pda.value().address;
}

// Shared body of deposit and withdraw
Bytes spot_transfer_data(const char* name, uint16_t spot_market_index, uint64_t amount) {
    Bytes data;
    LayoutWriter w(data);
    w.field(instruction_discriminator(name));
    w.field(spot_market_index);
    w.field(amount);
    w.flag(false);
    return data;
}

}  // namespace

Result<chain::PublicKey> state_address() {
    return derive({chain::seed("drift_state")});
}

Result<chain::PublicKey> signer_address() {
    return derive({chain::seed("drift_signer")});
}

Result<chain::PublicKey> user_address(const chain::PublicKey& authority, uint16_t sub_account) {
    return derive({chain::seed("user"), chain::seed(authority), chain::seed_u16_le(sub_account)});
}

Result<chain::PublicKey> user_stats_address(const chain::PublicKey& authority) {
    return derive({chain::seed("user_stats"), chain::seed(authority)});
}

Result<chain::PublicKey> perp_market_address(uint16_t market_index) {
    return derive({chain::seed("perp_market"), chain::seed_u16_le(market_index)});
}

Result<chain::PublicKey> spot_market_address(uint16_t market_index) {
    return derive({chain::seed("spot_market"), chain::seed_u16_le(market_index)});
}

Result<chain::PublicKey> spot_market_vault_address(uint16_t market_index) {
    return derive({chain::seed("spot_market_vault"), chain::seed_u16_le(market_index)});
}

Result<chain::PublicKey> oracle_from_perp_market(const Bytes& perp_market_data) {
    if (perp_market_data.size() < PERP_MARKET_ORACLE_OFFSET + chain::PublicKey::LENGTH) {
        return make_error<chain::PublicKey>(ErrorCode::PARSE_ERROR,
                                            "Perp market account too short for oracle",
                                            "DriftAccounts");
    }
    chain::PublicKey oracle;
    LayoutReader reader(perp_market_data, PERP_MARKET_ORACLE_OFFSET);
    reader.field(oracle.bytes());
    return oracle;
}

Result<chain::Instruction> deposit(const chain::PublicKey& authority,
                                   const chain::PublicKey& user_token_account,
                                   uint16_t spot_market_index, uint64_t amount) {
    auto state = state_address();
    auto user = user_address(authority);
    auto stats = user_stats_address(authority);
    auto vault = spot_market_vault_address(spot_market_index);
    auto market = spot_market_address(spot_market_index);
    for (const Result<chain::PublicKey>* r : {&state, &user, &stats, &vault, &market}) {
        if (r->is_error()) {
            return forward_error<chain::Instruction>(*r);
        }
    }

    chain::Instruction ix;
    ix.program_id = drift_program_id();
    ix.accounts = {
        chain::AccountMeta::readonly(state.value()),
        chain::AccountMeta::writable(user.value()),
        chain::AccountMeta::writable(stats.value()),
        chain::AccountMeta::readonly(authority, true),
        chain::AccountMeta::writable(vault.value()),
        chain::AccountMeta::writable(user_token_account),
        chain::AccountMeta::writable(market.value()),
        chain::AccountMeta::readonly(chain::token_program_id()),
    };
    ix.data = spot_transfer_data("deposit", spot_market_index, amount);
    return ix;
}

Result<chain::Instruction> withdraw(const chain::PublicKey& authority,
                                    const chain::PublicKey& user_token_account,
                                    uint16_t spot_market_index, uint64_t amount) {
    auto state = state_address();
    auto user = user_address(authority);
    auto stats = user_stats_address(authority);
    auto vault = spot_market_vault_address(spot_market_index);
    auto signer = signer_address();
    auto market = spot_market_address(spot_market_index);
    for (const Result<chain::PublicKey>* r : {&state, &user, &stats, &vault, &signer, &market}) {
        if (r->is_error()) {
            return forward_error<chain::Instruction>(*r);
        }
    }

    chain::Instruction ix;
    ix.program_id = drift_program_id();
    ix.accounts = {
        chain::AccountMeta::readonly(state.value()),
        chain::AccountMeta::writable(user.value()),
        chain::AccountMeta::writable(stats.value()),
        chain::AccountMeta::readonly(authority, true),
        chain::AccountMeta::writable(vault.value()),
        chain::AccountMeta::readonly(signer.value()),
        chain::AccountMeta::writable(user_token_account),
        chain::AccountMeta::writable(market.value()),
        chain::AccountMeta::readonly(chain::token_program_id()),
    };
    ix.data = spot_transfer_data("withdraw", spot_market_index, amount);
    return ix;
}

Result<chain::Instruction> place_perp_order(const DriftExecutionAccounts& accounts,
                                            const PerpOrderParams& params) {
    if (params.base_asset_amount == 0) {
        return make_error<chain::Instruction>(ErrorCode::VALIDATION_ERROR,
                                              "Perp order amount must be positive",
                                              "DriftAccounts");
    }
    chain::Instruction ix;
    ix.program_id = drift_program_id();
    ix.accounts = {
        chain::AccountMeta::readonly(accounts.state),
        chain::AccountMeta::writable(accounts.user),
        chain::AccountMeta::writable(accounts.user_stats),
        chain::AccountMeta::readonly(accounts.authority, true),
        chain::AccountMeta::writable(accounts.perp_market),
        chain::AccountMeta::readonly(accounts.oracle),
    };

    LayoutWriter w(ix.data);
    w.field(instruction_discriminator("place_perp_order"));
    w.field(ORDER_TYPE_MARKET);
    w.enum_u8(params.side);
    w.field(params.market_index);
    w.field(params.base_asset_amount);
    w.field(params.price);
    w.flag(params.reduce_only);
    w.flag(false);  // post_only
    w.flag(false);  // immediate_or_cancel
    return ix;
}

}  // namespace drift

DriftAccountResolver::DriftAccountResolver(std::shared_ptr<chain::RpcClient> rpc)
    : rpc_(std::move(rpc)) {}

Result<DriftExecutionAccounts> DriftAccountResolver::resolve(const chain::PublicKey& authority,
                                                             uint16_t market_index) {
    DriftExecutionAccounts accounts;
    accounts.authority = authority;

    auto state = drift::state_address();
    auto user = drift::user_address(authority);
    auto stats = drift::user_stats_address(authority);
    auto market = drift::perp_market_address(market_index);
    for (const Result<chain::PublicKey>* r : {&state, &user, &stats, &market}) {
        if (r->is_error()) {
            return forward_error<DriftExecutionAccounts>(*r);
        }
    }
    accounts.state = state.value();
    accounts.user = user.value();
    accounts.user_stats = stats.value();
    accounts.perp_market = market.value();

    auto info = rpc_->get_account_info(accounts.perp_market);
    if (info.is_error()) {
        return make_error<DriftExecutionAccounts>(ErrorCode::CHAIN_READ_ERROR,
                                                  info.error()->what(), "DriftAccountResolver");
    }
    if (!info.value()) {
        return make_error<DriftExecutionAccounts>(
            ErrorCode::CHAIN_READ_ERROR,
            "Perp market " + std::to_string(market_index) + " not found",
            "DriftAccountResolver");
    }
    auto oracle = drift::oracle_from_perp_market(info.value()->data);
    if (oracle.is_error()) {
        return make_error<DriftExecutionAccounts>(ErrorCode::CHAIN_READ_ERROR,
                                                  oracle.error()->what(), "DriftAccountResolver");
    }
    accounts.oracle = oracle.value();
    DEBUG("Resolved perp market " << market_index << " oracle " << accounts.oracle.to_base58());
    return accounts;
}

}  // namespace program
}  // namespace shroud
