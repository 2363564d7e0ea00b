// include/shroud/chain/instruction.hpp
#pragma once

#include <vector>
#include "shroud/chain/public_key.hpp"

namespace shroud {
namespace chain {

struct AccountMeta {
    PublicKey pubkey;
    bool is_signer{false};
    bool is_writable{false};

    static AccountMeta writable(const PublicKey& key, bool signer = false) {
        return AccountMeta{key, signer, true};
    }
    static AccountMeta readonly(const PublicKey& key, bool signer = false) {
        return AccountMeta{key, signer, false};
    }
};

struct Instruction {
    PublicKey program_id;
    std::vector<AccountMeta> accounts;
    Bytes data;
};

}  // namespace chain
}  // namespace shroud
