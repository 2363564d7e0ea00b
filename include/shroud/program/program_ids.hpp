// include/shroud/program/program_ids.hpp
#pragma once

#include "shroud/chain/public_key.hpp"

namespace shroud {
namespace program {

// Encrypted-order program and its crank companion
const chain::PublicKey& order_program_id();
const chain::PublicKey& crank_program_id();

// Ephemeral rollup delegation
const chain::PublicKey& delegation_program_id();
const chain::PublicKey& magic_program_id();
const chain::PublicKey& magic_context_id();

// Perpetuals venue and its oracle receiver
const chain::PublicKey& drift_program_id();
const chain::PublicKey& pyth_receiver_program_id();

}  // namespace program
}  // namespace shroud
