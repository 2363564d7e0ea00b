// include/shroud/chain/system_instructions.hpp
#pragma once

#include "shroud/chain/instruction.hpp"

namespace shroud {
namespace chain {

const PublicKey& system_program_id();
const PublicKey& compute_budget_program_id();
const PublicKey& token_program_id();
const PublicKey& associated_token_program_id();

/**
 * @brief SystemProgram transfer of lamports
 */
Instruction transfer(const PublicKey& from, const PublicKey& to, uint64_t lamports);

/**
 * @brief ComputeBudget SetComputeUnitLimit
 */
Instruction set_compute_unit_limit(uint32_t units);

/**
 * @brief ComputeBudget SetComputeUnitPrice (micro-lamports per unit)
 */
Instruction set_compute_unit_price(uint64_t micro_lamports);

/**
 * @brief Associated token account for (owner, mint)
 */
Result<PublicKey> associated_token_address(const PublicKey& owner, const PublicKey& mint);

}  // namespace chain
}  // namespace shroud
