// include/shroud/program/order_program_client.hpp
#pragma once

#include "shroud/chain/instruction.hpp"
#include "shroud/order/order_payload.hpp"
#include "shroud/program/accounts.hpp"
#include "shroud/program/drift_accounts.hpp"
#include "shroud/program/program_ids.hpp"

namespace shroud {
namespace program {

/**
 * @brief Delegation-program accounts for one delegated PDA
 */
struct DelegationAccounts {
    chain::PublicKey buffer;
    chain::PublicKey record;
    chain::PublicKey metadata;
};

/**
 * @brief Arguments of trigger_and_execute; the order fields must match the
 *        committed hash or the program rejects the call
 */
struct TriggerExecuteParams {
    chain::PublicKey payer;
    chain::PublicKey order_address;
    order::OrderPayload order;
    DriftExecutionAccounts drift;
    bool redelegate_after{false};
};

/**
 * @brief PDA derivation and instruction encoding for the encrypted-order program
 */
class OrderProgramClient {
public:
    explicit OrderProgramClient(const chain::PublicKey& program_id = order_program_id(),
                                const chain::PublicKey& crank_program = crank_program_id());

    const chain::PublicKey& program_id() const {
        return program_id_;
    }

    Result<chain::ProgramAddress> executor_authority_address(const chain::PublicKey& owner) const;
    Result<chain::ProgramAddress> encrypted_order_address(const chain::PublicKey& owner,
                                                          const Hash32& order_hash) const;

    /**
     * @brief Price-update account ["pyth_price", feed_id] under the oracle receiver
     */
    Result<chain::PublicKey> price_feed_address(const Hash32& feed_id) const;

    Result<DelegationAccounts> delegation_accounts(const chain::PublicKey& delegated) const;

    Result<chain::Instruction> init_executor(const chain::PublicKey& owner) const;

    /**
     * @brief Delegate the executor authority to the ephemeral rollup
     * @return VALIDATION_ERROR if it is already delegated
     */
    Result<chain::Instruction> delegate_executor(const ExecutorAuthorityAccount& current) const;

    /**
     * @brief Commit and undelegate the executor authority
     * @return VALIDATION_ERROR if it is not delegated
     */
    Result<chain::Instruction> undelegate_executor(const chain::PublicKey& payer,
                                                   const ExecutorAuthorityAccount& current) const;

    /**
     * @brief create_encrypted_order(hash, padded ciphertext, length, feed id)
     * @return VALIDATION_ERROR for an empty or oversized ciphertext
     */
    Result<chain::Instruction> create_encrypted_order(const chain::PublicKey& owner,
                                                      const Hash32& order_hash,
                                                      const Bytes& ciphertext,
                                                      const Hash32& feed_id) const;

    Result<chain::Instruction> delegate_encrypted_order(const chain::PublicKey& owner,
                                                        const Hash32& order_hash) const;
    Result<chain::Instruction> cancel_encrypted_order(const chain::PublicKey& owner,
                                                      const Hash32& order_hash) const;
    Result<chain::Instruction> close_encrypted_order(const chain::PublicKey& owner,
                                                     const Hash32& order_hash) const;
    Result<chain::Instruction> authorize_executor(const chain::PublicKey& owner,
                                                  const chain::PublicKey& executor,
                                                  bool authorize) const;

    /**
     * @brief Reveal the order and place it on the perpetuals venue
     */
    Result<chain::Instruction> trigger_and_execute(const TriggerExecuteParams& params) const;

    /**
     * @brief Crank program: record the trigger and execution price (phase one)
     */
    chain::Instruction mark_ready(const chain::PublicKey& payer,
                                  const chain::PublicKey& order_address,
                                  int64_t execution_price) const;

private:
    chain::PublicKey program_id_;
    chain::PublicKey crank_program_;
};

}  // namespace program
}  // namespace shroud
