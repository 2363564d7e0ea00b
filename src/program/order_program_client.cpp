// src/program/order_program_client.cpp

#include "shroud/program/order_program_client.hpp"
#include "shroud/chain/system_instructions.hpp"
#include "shroud/core/byte_layout.hpp"

namespace shroud {
namespace program {

namespace {

Bytes data_with(const char* instruction) {
    Bytes data;
    LayoutWriter w(data);
    w.field(instruction_discriminator(instruction));
    return data;
}

}  // namespace

OrderProgramClient::OrderProgramClient(const chain::PublicKey& program_id,
                                       const chain::PublicKey& crank_program)
    : program_id_(program_id), crank_program_(crank_program) {}

Result<chain::ProgramAddress> OrderProgramClient::executor_authority_address(
    const chain::PublicKey& owner) const {
    return chain::find_program_address({chain::seed("executor"), chain::seed(owner)}, program_id_);
}

Result<chain::ProgramAddress> OrderProgramClient::encrypted_order_address(
    const chain::PublicKey& owner, const Hash32& order_hash) const {
    return chain::find_program_address(
        {chain::seed("encrypted_order"), chain::seed(owner), chain::seed(order_hash)},
        program_id_);
}

Result<chain::PublicKey> OrderProgramClient::price_feed_address(const Hash32& feed_id) const {
    auto pda = chain::find_program_address({chain::seed("pyth_price"), chain::seed(feed_id)},
                                           pyth_receiver_program_id());
    if (pda.is_error()) {
        return forward_error<chain::PublicKey>(pda);
    }
    return pda.value().address;
}

Result<DelegationAccounts> OrderProgramClient::delegation_accounts(
    const chain::PublicKey& delegated) const {
    auto buffer =
        chain::find_program_address({chain::seed("buffer"), chain::seed(delegated)}, program_id_);
    auto record = chain::find_program_address({chain::seed("delegation"), chain::seed(delegated)},
                                              delegation_program_id());
    auto metadata = chain::find_program_address(
        {chain::seed("delegation-metadata"), chain::seed(delegated)}, delegation_program_id());
    for (const Result<chain::ProgramAddress>* r : {&buffer, &record, &metadata}) {
        if (r->is_error()) {
            return forward_error<DelegationAccounts>(*r);
        }
    }
    return DelegationAccounts{buffer.value().address, record.value().address,
                              metadata.value().address};
}

Result<chain::Instruction> OrderProgramClient::init_executor(const chain::PublicKey& owner) const {
    auto executor = executor_authority_address(owner);
    if (executor.is_error()) {
        return forward_error<chain::Instruction>(executor);
    }
    chain::Instruction ix;
    ix.program_id = program_id_;
    ix.accounts = {
        chain::AccountMeta::writable(owner, true),
        chain::AccountMeta::writable(executor.value().address),
        chain::AccountMeta::readonly(chain::system_program_id()),
    };
    ix.data = data_with("init_executor");
    return ix;
}

Result<chain::Instruction> OrderProgramClient::delegate_executor(
    const ExecutorAuthorityAccount& current) const {
    if (current.is_delegated) {
        return make_error<chain::Instruction>(ErrorCode::VALIDATION_ERROR,
                                              "Executor authority is already delegated",
                                              "OrderProgramClient");
    }
    auto executor = executor_authority_address(current.owner);
    if (executor.is_error()) {
        return forward_error<chain::Instruction>(executor);
    }
    auto delegation = delegation_accounts(executor.value().address);
    if (delegation.is_error()) {
        return forward_error<chain::Instruction>(delegation);
    }

    const auto& d = delegation.value();
    chain::Instruction ix;
    ix.program_id = program_id_;
    ix.accounts = {
        chain::AccountMeta::writable(current.owner, true),
        chain::AccountMeta::readonly(executor.value().address),
        chain::AccountMeta::writable(executor.value().address),
        chain::AccountMeta::writable(d.buffer),
        chain::AccountMeta::writable(d.record),
        chain::AccountMeta::writable(d.metadata),
        chain::AccountMeta::readonly(chain::system_program_id()),
    };
    ix.data = data_with("delegate_executor");
    return ix;
}

Result<chain::Instruction> OrderProgramClient::undelegate_executor(
    const chain::PublicKey& payer, const ExecutorAuthorityAccount& current) const {
    if (!current.is_delegated) {
        return make_error<chain::Instruction>(ErrorCode::VALIDATION_ERROR,
                                              "Executor authority is not delegated",
                                              "OrderProgramClient");
    }
    auto executor = executor_authority_address(current.owner);
    if (executor.is_error()) {
        return forward_error<chain::Instruction>(executor);
    }
    chain::Instruction ix;
    ix.program_id = program_id_;
    ix.accounts = {
        chain::AccountMeta::writable(payer, true),
        chain::AccountMeta::writable(executor.value().address),
        chain::AccountMeta::readonly(magic_context_id()),
        chain::AccountMeta::readonly(magic_program_id()),
    };
    ix.data = data_with("undelegate_executor");
    return ix;
}

Result<chain::Instruction> OrderProgramClient::create_encrypted_order(
    const chain::PublicKey& owner, const Hash32& order_hash, const Bytes& ciphertext,
    const Hash32& feed_id) const {
    if (ciphertext.empty()) {
        return make_error<chain::Instruction>(ErrorCode::VALIDATION_ERROR,
                                              "Encrypted order data is empty",
                                              "OrderProgramClient");
    }
    if (ciphertext.size() > EncryptedOrderAccount::MAX_ENCRYPTED_DATA) {
        return make_error<chain::Instruction>(
            ErrorCode::VALIDATION_ERROR,
            "Encrypted order data is " + std::to_string(ciphertext.size()) +
                " bytes, limit is 256",
            "OrderProgramClient");
    }

    auto executor = executor_authority_address(owner);
    if (executor.is_error()) {
        return forward_error<chain::Instruction>(executor);
    }
    auto order_pda = encrypted_order_address(owner, order_hash);
    if (order_pda.is_error()) {
        return forward_error<chain::Instruction>(order_pda);
    }

    chain::Instruction ix;
    ix.program_id = program_id_;
    ix.accounts = {
        chain::AccountMeta::writable(owner, true),
        chain::AccountMeta::writable(executor.value().address),
        chain::AccountMeta::writable(order_pda.value().address),
        chain::AccountMeta::readonly(chain::system_program_id()),
    };

    ix.data = data_with("create_encrypted_order");
    LayoutWriter w(ix.data);
    w.field(order_hash);
    w.raw(ciphertext);
    w.pad(EncryptedOrderAccount::MAX_ENCRYPTED_DATA - ciphertext.size());
    w.field(static_cast<uint16_t>(ciphertext.size()));
    w.field(feed_id);
    return ix;
}

Result<chain::Instruction> OrderProgramClient::delegate_encrypted_order(
    const chain::PublicKey& owner, const Hash32& order_hash) const {
    auto executor = executor_authority_address(owner);
    if (executor.is_error()) {
        return forward_error<chain::Instruction>(executor);
    }
    auto order_pda = encrypted_order_address(owner, order_hash);
    if (order_pda.is_error()) {
        return forward_error<chain::Instruction>(order_pda);
    }
    auto delegation = delegation_accounts(order_pda.value().address);
    if (delegation.is_error()) {
        return forward_error<chain::Instruction>(delegation);
    }

    const auto& d = delegation.value();
    chain::Instruction ix;
    ix.program_id = program_id_;
    ix.accounts = {
        chain::AccountMeta::writable(owner, true),
        chain::AccountMeta::writable(order_pda.value().address),
        chain::AccountMeta::writable(executor.value().address),
        chain::AccountMeta::writable(d.buffer),
        chain::AccountMeta::writable(d.record),
        chain::AccountMeta::writable(d.metadata),
        chain::AccountMeta::readonly(chain::system_program_id()),
    };
    ix.data = data_with("delegate_encrypted_order");
    LayoutWriter(ix.data).field(order_hash);
    return ix;
}

Result<chain::Instruction> OrderProgramClient::cancel_encrypted_order(
    const chain::PublicKey& owner, const Hash32& order_hash) const {
    auto executor = executor_authority_address(owner);
    if (executor.is_error()) {
        return forward_error<chain::Instruction>(executor);
    }
    auto order_pda = encrypted_order_address(owner, order_hash);
    if (order_pda.is_error()) {
        return forward_error<chain::Instruction>(order_pda);
    }
    chain::Instruction ix;
    ix.program_id = program_id_;
    ix.accounts = {
        chain::AccountMeta::writable(owner, true),
        chain::AccountMeta::writable(order_pda.value().address),
        chain::AccountMeta::writable(executor.value().address),
    };
    ix.data = data_with("cancel_encrypted_order");
    return ix;
}

Result<chain::Instruction> OrderProgramClient::close_encrypted_order(
    const chain::PublicKey& owner, const Hash32& order_hash) const {
    auto order_pda = encrypted_order_address(owner, order_hash);
    if (order_pda.is_error()) {
        return forward_error<chain::Instruction>(order_pda);
    }
    chain::Instruction ix;
    ix.program_id = program_id_;
    ix.accounts = {
        chain::AccountMeta::writable(owner, true),
        chain::AccountMeta::writable(order_pda.value().address),
    };
    ix.data = data_with("close_encrypted_order");
    return ix;
}

Result<chain::Instruction> OrderProgramClient::authorize_executor(const chain::PublicKey& owner,
                                                                  const chain::PublicKey& executor,
                                                                  bool authorize) const {
    auto authority = executor_authority_address(owner);
    if (authority.is_error()) {
        return forward_error<chain::Instruction>(authority);
    }
    chain::Instruction ix;
    ix.program_id = program_id_;
    ix.accounts = {
        chain::AccountMeta::writable(owner, true),
        chain::AccountMeta::writable(authority.value().address),
    };
    ix.data = data_with("authorize_executor");
    LayoutWriter w(ix.data);
    w.field(executor.bytes());
    w.flag(authorize);
    return ix;
}

Result<chain::Instruction> OrderProgramClient::trigger_and_execute(
    const TriggerExecuteParams& params) const {
    const order::OrderPayload& order = params.order;
    if (!order.salt) {
        return make_error<chain::Instruction>(ErrorCode::VALIDATION_ERROR,
                                              "Order salt is required to reveal the order",
                                              "OrderProgramClient");
    }
    auto executor = executor_authority_address(order.owner);
    if (executor.is_error()) {
        return forward_error<chain::Instruction>(executor);
    }
    auto price_feed = price_feed_address(order.feed_id);
    if (price_feed.is_error()) {
        return forward_error<chain::Instruction>(price_feed);
    }

    const Salt16& salt = *order.salt;

    const DriftExecutionAccounts& drift = params.drift;
    chain::Instruction ix;
    ix.program_id = program_id_;
    ix.accounts = {
        chain::AccountMeta::writable(params.payer, true),
        chain::AccountMeta::writable(params.order_address),
        chain::AccountMeta::writable(executor.value().address),
        chain::AccountMeta::readonly(price_feed.value()),
        chain::AccountMeta::readonly(drift.state),
        chain::AccountMeta::writable(drift.user),
        chain::AccountMeta::writable(drift.user_stats),
        chain::AccountMeta::readonly(drift.authority),
        chain::AccountMeta::writable(drift.perp_market),
        chain::AccountMeta::readonly(drift.oracle),
        chain::AccountMeta::readonly(magic_context_id()),
        chain::AccountMeta::readonly(magic_program_id()),
    };

    ix.data = data_with("trigger_and_execute");
    LayoutWriter w(ix.data);
    w.field(salt);
    w.field(order.order_id);
    w.field(order.market_index);
    w.field(order.trigger_price);
    w.enum_u8(order.trigger_condition);
    w.enum_u8(order.side);
    w.field(order.base_asset_amount);
    w.flag(order.reduce_only);
    w.field(order.expiry);
    w.flag(params.redelegate_after);
    return ix;
}

chain::Instruction OrderProgramClient::mark_ready(const chain::PublicKey& payer,
                                                  const chain::PublicKey& order_address,
                                                  int64_t execution_price) const {
    chain::Instruction ix;
    ix.program_id = crank_program_;
    ix.accounts = {
        chain::AccountMeta::writable(payer, true),
        chain::AccountMeta::writable(order_address),
    };
    ix.data = data_with("mark_ready");
    LayoutWriter(ix.data).field(execution_price);
    return ix;
}

}  // namespace program
}  // namespace shroud
