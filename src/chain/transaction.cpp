// src/chain/transaction.cpp

#include "shroud/chain/transaction.hpp"
#include <algorithm>
#include <unordered_map>
#include "shroud/core/encoding.hpp"

namespace shroud {
namespace chain {

namespace {

constexpr size_t MAX_ACCOUNT_KEYS = 256;
constexpr uint8_t VERSION_0_PREFIX = 0x80;

struct KeyFlags {
    bool signer{false};
    bool writable{false};
    bool invoked{false};
};

// Keys in first-seen order with merged privileges
class KeyCollector {
public:
    void add(const PublicKey& key, bool signer, bool writable, bool invoked = false) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            index_[key] = keys_.size();
            keys_.push_back(key);
            flags_.push_back(KeyFlags{signer, writable, invoked});
            return;
        }
        KeyFlags& f = flags_[it->second];
        f.signer = f.signer || signer;
        f.writable = f.writable || writable;
        f.invoked = f.invoked || invoked;
    }

    const std::vector<PublicKey>& keys() const {
        return keys_;
    }
    const KeyFlags& flags(size_t i) const {
        return flags_[i];
    }

private:
    std::vector<PublicKey> keys_;
    std::vector<KeyFlags> flags_;
    std::unordered_map<PublicKey, size_t> index_;
};

}  // namespace

void write_compact_u16(Bytes& out, uint16_t value) {
    uint32_t rem = value;
    while (true) {
        uint8_t byte = static_cast<uint8_t>(rem & 0x7f);
        rem >>= 7;
        if (rem == 0) {
            out.push_back(byte);
            return;
        }
        out.push_back(byte | 0x80);
    }
}

namespace {

// Static keys must be grouped: signer+writable, signer+readonly,
// writable, readonly. Within a group, first-seen order is kept.
Result<void> compile_message_impl(const PublicKey& payer,
                                  const std::vector<Instruction>& instructions,
                                  const std::vector<AddressLookupTable>* tables, bool versioned,
                                  MessageHeader& header, std::vector<PublicKey>& static_keys,
                                  std::vector<CompiledInstruction>& compiled,
                                  std::vector<LookupTableUse>& lookups) {
    if (instructions.empty()) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "Transaction needs at least one instruction", "Message");
    }

    KeyCollector collector;
    collector.add(payer, true, true);
    for (const auto& ix : instructions) {
        for (const auto& meta : ix.accounts) {
            collector.add(meta.pubkey, meta.is_signer, meta.is_writable);
        }
        collector.add(ix.program_id, false, false, true);
    }

    std::vector<size_t> buckets[4];
    std::vector<std::pair<size_t, size_t>> loaded_writable;  // (table, key index)
    std::vector<std::pair<size_t, size_t>> loaded_readonly;
    lookups.clear();
    if (versioned && tables) {
        for (const auto& table : *tables) {
            lookups.push_back(LookupTableUse{table.key, {}, {}});
        }
    }

    const auto& keys = collector.keys();
    for (size_t i = 0; i < keys.size(); ++i) {
        const KeyFlags& f = collector.flags(i);
        if (!f.signer && !f.invoked && versioned && tables) {
            bool loaded = false;
            for (size_t t = 0; t < tables->size() && !loaded; ++t) {
                const auto& addrs = (*tables)[t].addresses;
                auto pos = std::find(addrs.begin(), addrs.end(), keys[i]);
                if (pos == addrs.end() || pos - addrs.begin() > 255) {
                    continue;
                }
                uint8_t table_index = static_cast<uint8_t>(pos - addrs.begin());
                if (f.writable) {
                    lookups[t].writable_indexes.push_back(table_index);
                    loaded_writable.emplace_back(t, i);
                } else {
                    lookups[t].readonly_indexes.push_back(table_index);
                    loaded_readonly.emplace_back(t, i);
                }
                loaded = true;
            }
            if (loaded) {
                continue;
            }
        }
        int bucket = f.signer ? (f.writable ? 0 : 1) : (f.writable ? 2 : 3);
        buckets[bucket].push_back(i);
    }

    static_keys.clear();
    for (const auto& bucket : buckets) {
        for (size_t i : bucket) {
            static_keys.push_back(keys[i]);
        }
    }

    // Loaded keys follow static keys: all writable (table order), then all readonly
    auto by_table = [](const std::pair<size_t, size_t>& a, const std::pair<size_t, size_t>& b) {
        return a.first < b.first;
    };
    std::stable_sort(loaded_writable.begin(), loaded_writable.end(), by_table);
    std::stable_sort(loaded_readonly.begin(), loaded_readonly.end(), by_table);

    std::vector<PublicKey> all_keys = static_keys;
    for (const auto& entry : loaded_writable) {
        all_keys.push_back(keys[entry.second]);
    }
    for (const auto& entry : loaded_readonly) {
        all_keys.push_back(keys[entry.second]);
    }

    if (all_keys.size() > MAX_ACCOUNT_KEYS) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "Transaction references " + std::to_string(all_keys.size()) +
                                    " accounts, limit is 256",
                                "Message");
    }

    // Drop tables that ended up unused
    lookups.erase(std::remove_if(lookups.begin(), lookups.end(),
                                 [](const LookupTableUse& use) {
                                     return use.writable_indexes.empty() &&
                                            use.readonly_indexes.empty();
                                 }),
                  lookups.end());

    header = MessageHeader{};
    header.num_required_signatures =
        static_cast<uint8_t>(buckets[0].size() + buckets[1].size());
    header.num_readonly_signed = static_cast<uint8_t>(buckets[1].size());
    header.num_readonly_unsigned = static_cast<uint8_t>(buckets[3].size());

    std::unordered_map<PublicKey, uint8_t> position;
    for (size_t i = 0; i < all_keys.size(); ++i) {
        position[all_keys[i]] = static_cast<uint8_t>(i);
    }

    compiled.clear();
    for (const auto& ix : instructions) {
        CompiledInstruction c;
        c.program_id_index = position.at(ix.program_id);
        for (const auto& meta : ix.accounts) {
            c.account_indexes.push_back(position.at(meta.pubkey));
        }
        c.data = ix.data;
        compiled.push_back(std::move(c));
    }

    return Result<void>();
}

}  // namespace

std::vector<PublicKey> Message::signer_keys() const {
    return std::vector<PublicKey>(static_keys_.begin(),
                                  static_keys_.begin() + header_.num_required_signatures);
}

Result<Message> Message::compile_legacy(const PublicKey& payer,
                                        const std::vector<Instruction>& instructions,
                                        const Hash32& recent_blockhash) {
    Message message;
    auto result = compile_message_impl(payer, instructions, nullptr, false, message.header_,
                                       message.static_keys_, message.instructions_,
                                       message.lookups_);
    if (result.is_error()) {
        return forward_error<Message>(result);
    }
    message.versioned_ = false;
    message.recent_blockhash_ = recent_blockhash;
    return message;
}

Result<Message> Message::compile_v0(const PublicKey& payer,
                                    const std::vector<Instruction>& instructions,
                                    const Hash32& recent_blockhash,
                                    const std::vector<AddressLookupTable>& tables) {
    Message message;
    auto result = compile_message_impl(payer, instructions, &tables, true, message.header_,
                                       message.static_keys_, message.instructions_,
                                       message.lookups_);
    if (result.is_error()) {
        return forward_error<Message>(result);
    }
    message.versioned_ = true;
    message.recent_blockhash_ = recent_blockhash;
    return message;
}

Bytes Message::serialize() const {
    Bytes out;
    if (versioned_) {
        out.push_back(VERSION_0_PREFIX);
    }
    out.push_back(header_.num_required_signatures);
    out.push_back(header_.num_readonly_signed);
    out.push_back(header_.num_readonly_unsigned);

    write_compact_u16(out, static_cast<uint16_t>(static_keys_.size()));
    for (const auto& key : static_keys_) {
        out.insert(out.end(), key.bytes().begin(), key.bytes().end());
    }
    out.insert(out.end(), recent_blockhash_.begin(), recent_blockhash_.end());

    write_compact_u16(out, static_cast<uint16_t>(instructions_.size()));
    for (const auto& ix : instructions_) {
        out.push_back(ix.program_id_index);
        write_compact_u16(out, static_cast<uint16_t>(ix.account_indexes.size()));
        out.insert(out.end(), ix.account_indexes.begin(), ix.account_indexes.end());
        write_compact_u16(out, static_cast<uint16_t>(ix.data.size()));
        out.insert(out.end(), ix.data.begin(), ix.data.end());
    }

    if (versioned_) {
        write_compact_u16(out, static_cast<uint16_t>(lookups_.size()));
        for (const auto& use : lookups_) {
            out.insert(out.end(), use.table.bytes().begin(), use.table.bytes().end());
            write_compact_u16(out, static_cast<uint16_t>(use.writable_indexes.size()));
            out.insert(out.end(), use.writable_indexes.begin(), use.writable_indexes.end());
            write_compact_u16(out, static_cast<uint16_t>(use.readonly_indexes.size()));
            out.insert(out.end(), use.readonly_indexes.begin(), use.readonly_indexes.end());
        }
    }
    return out;
}

Transaction::Transaction(Message message)
    : message_(std::move(message)),
      signatures_(message_.header().num_required_signatures, Signature64{}) {}

Result<void> Transaction::sign(const std::vector<const Keypair*>& signers) {
    const Bytes payload = message_.serialize();
    const auto required = message_.signer_keys();
    for (size_t i = 0; i < required.size(); ++i) {
        auto it = std::find_if(signers.begin(), signers.end(), [&](const Keypair* k) {
            return k && k->public_key() == required[i];
        });
        if (it == signers.end()) {
            return make_error<void>(ErrorCode::SIGNING_ERROR,
                                    "Missing signer " + required[i].to_base58(), "Transaction");
        }
        auto sig = (*it)->sign(payload);
        if (sig.is_error()) {
            return make_error<void>(sig.error()->code(), sig.error()->what(), "Transaction");
        }
        signatures_[i] = sig.value();
    }
    return Result<void>();
}

Bytes Transaction::serialize() const {
    Bytes out;
    write_compact_u16(out, static_cast<uint16_t>(signatures_.size()));
    for (const auto& sig : signatures_) {
        out.insert(out.end(), sig.begin(), sig.end());
    }
    Bytes body = message_.serialize();
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

std::string Transaction::to_base64() const {
    return encoding::to_base64(serialize());
}

std::string Transaction::signature() const {
    if (signatures_.empty()) {
        return "";
    }
    return encoding::to_base58(signatures_.front().data(), signatures_.front().size());
}

bool Transaction::is_signed() const {
    return !signatures_.empty() &&
           std::none_of(signatures_.begin(), signatures_.end(), [](const Signature64& s) {
               return std::all_of(s.begin(), s.end(), [](uint8_t b) { return b == 0; });
           });
}

Result<AddressLookupTable> parse_lookup_table(const PublicKey& key, const Bytes& data) {
    constexpr size_t HEADER_LEN = 56;
    if (data.size() < HEADER_LEN || (data.size() - HEADER_LEN) % PublicKey::LENGTH != 0) {
        return make_error<AddressLookupTable>(ErrorCode::PARSE_ERROR,
                                              "Lookup table account has invalid length " +
                                                  std::to_string(data.size()),
                                              "LookupTable");
    }
    AddressLookupTable table;
    table.key = key;
    for (size_t offset = HEADER_LEN; offset < data.size(); offset += PublicKey::LENGTH) {
        PublicKey::Bytes32 bytes{};
        std::copy(data.begin() + offset, data.begin() + offset + PublicKey::LENGTH,
                  bytes.begin());
        table.addresses.emplace_back(bytes);
    }
    return table;
}

size_t serialized_transaction_size(const Message& message) {
    Bytes prefix;
    write_compact_u16(prefix, message.header().num_required_signatures);
    return prefix.size() + 64 * static_cast<size_t>(message.header().num_required_signatures) +
           message.serialize().size();
}

}  // namespace chain
}  // namespace shroud
