// src/chain/system_instructions.cpp

#include "shroud/chain/system_instructions.hpp"
#include "shroud/core/byte_layout.hpp"

namespace shroud {
namespace chain {

namespace {

constexpr uint32_t SYSTEM_TRANSFER = 2;
constexpr uint8_t COMPUTE_UNIT_LIMIT = 2;
constexpr uint8_t COMPUTE_UNIT_PRICE = 3;

}  // namespace

const PublicKey& system_program_id() {
    static const PublicKey id = PublicKey::from_literal("11111111111111111111111111111111");
    return id;
}

const PublicKey& compute_budget_program_id() {
    static const PublicKey id =
        PublicKey::from_literal("ComputeBudget111111111111111111111111111111");
    return id;
}

const PublicKey& token_program_id() {
    static const PublicKey id =
        PublicKey::from_literal("TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA");
    return id;
}

const PublicKey& associated_token_program_id() {
    static const PublicKey id =
        PublicKey::from_literal("ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL");
    return id;
}

Instruction transfer(const PublicKey& from, const PublicKey& to, uint64_t lamports) {
    Instruction ix;
    ix.program_id = system_program_id();
    ix.accounts = {AccountMeta::writable(from, true), AccountMeta::writable(to)};
    LayoutWriter w(ix.data);
    w.field(SYSTEM_TRANSFER);
    w.field(lamports);
    return ix;
}

Instruction set_compute_unit_limit(uint32_t units) {
    Instruction ix;
    ix.program_id = compute_budget_program_id();
    LayoutWriter w(ix.data);
    w.field(COMPUTE_UNIT_LIMIT);
    w.field(units);
    return ix;
}

Instruction set_compute_unit_price(uint64_t micro_lamports) {
    Instruction ix;
    ix.program_id = compute_budget_program_id();
    LayoutWriter w(ix.data);
    w.field(COMPUTE_UNIT_PRICE);
    w.field(micro_lamports);
    return ix;
}

Result<PublicKey> associated_token_address(const PublicKey& owner, const PublicKey& mint) {
    auto pda = find_program_address({seed(owner), seed(token_program_id()), seed(mint)},
                                    associated_token_program_id());
    if (pda.is_error()) {
        return forward_error<PublicKey>(pda);
    }
    return pda.value().address;
}

}  // namespace chain
}  // namespace shroud
