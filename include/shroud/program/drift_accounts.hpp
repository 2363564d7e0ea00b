// include/shroud/program/drift_accounts.hpp
#pragma once

#include <memory>
#include "shroud/chain/instruction.hpp"
#include "shroud/chain/rpc_client.hpp"
#include "shroud/order/order_payload.hpp"

namespace shroud {
namespace program {

/**
 * @brief Accounts the perpetuals venue needs to place an order for one user
 */
struct DriftExecutionAccounts {
    chain::PublicKey state;
    chain::PublicKey user;
    chain::PublicKey user_stats;
    chain::PublicKey authority;
    chain::PublicKey perp_market;
    chain::PublicKey oracle;
};

namespace drift {

constexpr size_t PERP_MARKET_ORACLE_OFFSET = 40;
constexpr uint16_t DEFAULT_SUB_ACCOUNT = 0;

Result<chain::PublicKey> state_address();
Result<chain::PublicKey> signer_address();
Result<chain::PublicKey> user_address(const chain::PublicKey& authority,
                                      uint16_t sub_account = DEFAULT_SUB_ACCOUNT);
Result<chain::PublicKey> user_stats_address(const chain::PublicKey& authority);
Result<chain::PublicKey> perp_market_address(uint16_t market_index);
Result<chain::PublicKey> spot_market_address(uint16_t market_index);
Result<chain::PublicKey> spot_market_vault_address(uint16_t market_index);

/**
 * @brief Oracle key stored in a perp market account
 * @return PARSE_ERROR if the account is shorter than the oracle field
 */
Result<chain::PublicKey> oracle_from_perp_market(const Bytes& perp_market_data);

/**
 * @brief deposit(spot_market_index, amount, reduce_only)
 */
Result<chain::Instruction> deposit(const chain::PublicKey& authority,
                                   const chain::PublicKey& user_token_account,
                                   uint16_t spot_market_index, uint64_t amount);

/**
 * @brief withdraw(spot_market_index, amount, reduce_only)
 */
Result<chain::Instruction> withdraw(const chain::PublicKey& authority,
                                    const chain::PublicKey& user_token_account,
                                    uint16_t spot_market_index, uint64_t amount);

struct PerpOrderParams {
    uint16_t market_index{0};
    order::OrderSide side{order::OrderSide::LONG};
    uint64_t base_asset_amount{0};
    uint64_t price{0};  // 0 = market
    bool reduce_only{false};
};

/**
 * @brief place_perp_order with a market order type
 */
Result<chain::Instruction> place_perp_order(const DriftExecutionAccounts& accounts,
                                            const PerpOrderParams& params);

}  // namespace drift

/**
 * @brief Resolves venue accounts for an order owner at execution time
 *
 * The oracle is read from the perp market account on every call.
 */
class DriftAccountResolver {
public:
    explicit DriftAccountResolver(std::shared_ptr<chain::RpcClient> rpc);

    /**
     * @return CHAIN_READ_ERROR if the perp market cannot be read
     */
    Result<DriftExecutionAccounts> resolve(const chain::PublicKey& authority,
                                           uint16_t market_index);

private:
    std::shared_ptr<chain::RpcClient> rpc_;
};

}  // namespace program
}  // namespace shroud
