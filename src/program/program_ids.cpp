// src/program/program_ids.cpp

#include "shroud/program/program_ids.hpp"

namespace shroud {
namespace program {

const chain::PublicKey& order_program_id() {
    static const chain::PublicKey id =
        chain::PublicKey::from_literal("8w95bQ7UzKHKa4NYvyVeAVGN3dMgwshJhhTinPfabMLA");
    return id;
}

const chain::PublicKey& crank_program_id() {
    static const chain::PublicKey id =
        chain::PublicKey::from_literal("7VvD7j99AE7q9PC9atpJeMEUeEzZ5ZYH7WqSzGdmvsqv");
    return id;
}

const chain::PublicKey& delegation_program_id() {
    static const chain::PublicKey id =
        chain::PublicKey::from_literal("DELeGGvXpWV2fqJUhqcF5ZSYMS4JTLjteaAMARRSaeSh");
    return id;
}

const chain::PublicKey& magic_program_id() {
    static const chain::PublicKey id =
        chain::PublicKey::from_literal("Magic11111111111111111111111111111111111111");
    return id;
}

const chain::PublicKey& magic_context_id() {
    static const chain::PublicKey id =
        chain::PublicKey::from_literal("MagicContext1111111111111111111111111111111");
    return id;
}

const chain::PublicKey& drift_program_id() {
    static const chain::PublicKey id =
        chain::PublicKey::from_literal("dRiftyHA39MWEi3m9aunc5MzRF1JYuBsbn6VPcn33UH");
    return id;
}

const chain::PublicKey& pyth_receiver_program_id() {
    static const chain::PublicKey id =
        chain::PublicKey::from_literal("rec5EKMGg6MxZYaMdyBfgwp4d5rB9T1VQH5pJv5LtFJ");
    return id;
}

}  // namespace program
}  // namespace shroud
