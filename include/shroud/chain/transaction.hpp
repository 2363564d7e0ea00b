// include/shroud/chain/transaction.hpp
#pragma once

#include <string>
#include <vector>
#include "shroud/chain/instruction.hpp"
#include "shroud/chain/keypair.hpp"

namespace shroud {
namespace chain {

/**
 * @brief On-chain address lookup table contents used for v0 compilation
 */
struct AddressLookupTable {
    PublicKey key;
    std::vector<PublicKey> addresses;
};

/**
 * @brief Decode lookup table account data (56-byte header, then 32-byte addresses)
 * @return PARSE_ERROR for short or misaligned data
 */
Result<AddressLookupTable> parse_lookup_table(const PublicKey& key, const Bytes& data);

struct MessageHeader {
    uint8_t num_required_signatures{0};
    uint8_t num_readonly_signed{0};
    uint8_t num_readonly_unsigned{0};
};

struct CompiledInstruction {
    uint8_t program_id_index{0};
    std::vector<uint8_t> account_indexes;
    Bytes data;
};

struct LookupTableUse {
    PublicKey table;
    std::vector<uint8_t> writable_indexes;
    std::vector<uint8_t> readonly_indexes;
};

/**
 * @brief Compiled transaction message (legacy or v0)
 */
class Message {
public:
    Message() = default;

    /**
     * @brief Compile a legacy message; the payer is always the first key
     * @return VALIDATION_ERROR for empty instructions or more than 256 keys
     */
    static Result<Message> compile_legacy(const PublicKey& payer,
                                          const std::vector<Instruction>& instructions,
                                          const Hash32& recent_blockhash);

    /**
     * @brief Compile a v0 message, loading non-signer, non-program keys from tables
     */
    static Result<Message> compile_v0(const PublicKey& payer,
                                      const std::vector<Instruction>& instructions,
                                      const Hash32& recent_blockhash,
                                      const std::vector<AddressLookupTable>& tables);

    Bytes serialize() const;

    bool is_versioned() const {
        return versioned_;
    }
    const MessageHeader& header() const {
        return header_;
    }
    const std::vector<PublicKey>& static_keys() const {
        return static_keys_;
    }
    const std::vector<CompiledInstruction>& instructions() const {
        return instructions_;
    }
    const std::vector<LookupTableUse>& lookups() const {
        return lookups_;
    }
    const Hash32& recent_blockhash() const {
        return recent_blockhash_;
    }

    /**
     * @brief Keys that must sign, in signature order
     */
    std::vector<PublicKey> signer_keys() const;

private:
    bool versioned_{false};
    MessageHeader header_;
    std::vector<PublicKey> static_keys_;
    Hash32 recent_blockhash_{};
    std::vector<CompiledInstruction> instructions_;
    std::vector<LookupTableUse> lookups_;
};

/**
 * @brief Message plus its signatures
 */
class Transaction {
public:
    Transaction() = default;
    explicit Transaction(Message message);

    /**
     * @brief Sign with every required signer
     * @return SIGNING_ERROR if a required signer is missing from the list
     */
    Result<void> sign(const std::vector<const Keypair*>& signers);

    Bytes serialize() const;
    std::string to_base64() const;

    /**
     * @brief Base58 of the fee payer signature (the transaction id)
     */
    std::string signature() const;

    bool is_signed() const;

    const Message& message() const {
        return message_;
    }

private:
    Message message_;
    std::vector<Signature64> signatures_;
};

/**
 * @brief Compact-u16 length prefix used throughout the wire format
 */
void write_compact_u16(Bytes& out, uint16_t value);

/**
 * @brief Wire size of a signed transaction for the given message
 */
size_t serialized_transaction_size(const Message& message);

// Largest transaction the network accepts
constexpr size_t MAX_TRANSACTION_SIZE = 1232;

}  // namespace chain
}  // namespace shroud
