// include/shroud/program/accounts.hpp
#pragma once

#include <algorithm>
#include <array>
#include <string>
#include "shroud/chain/public_key.hpp"
#include "shroud/core/byte_layout.hpp"
#include "shroud/core/error.hpp"

namespace shroud {
namespace program {

using Discriminator = std::array<uint8_t, 8>;

/**
 * @brief First 8 bytes of SHA-256("global:<name>")
 */
Discriminator instruction_discriminator(const std::string& name);

/**
 * @brief First 8 bytes of SHA-256("account:<Name>")
 */
Discriminator account_discriminator(const std::string& name);

enum class OrderStatus : uint8_t { ACTIVE = 0, TRIGGERED = 1, EXECUTED = 2, CANCELLED = 3 };

std::string order_status_to_string(OrderStatus status);

/**
 * @brief Fixed-capacity slot array with a count, mirroring on-chain storage
 */
template <typename T, size_t N>
class FixedSlots {
public:
    static constexpr size_t CAPACITY = N;

    size_t size() const {
        return count_;
    }
    bool full() const {
        return count_ >= N;
    }
    const T& operator[](size_t i) const {
        return slots_[i];
    }

    bool contains(const T& value) const {
        return std::find(slots_.begin(), slots_.begin() + count_, value) !=
               slots_.begin() + count_;
    }

    /**
     * @brief Append; VALIDATION_ERROR when full or already present
     */
    Result<void> push(const T& value) {
        if (full()) {
            return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                    "Capacity of " + std::to_string(N) + " reached",
                                    "FixedSlots");
        }
        if (contains(value)) {
            return make_error<void>(ErrorCode::VALIDATION_ERROR, "Entry already present",
                                    "FixedSlots");
        }
        slots_[count_++] = value;
        return Result<void>();
    }

    /**
     * @brief Remove and shift later entries down
     * @return false if the value was not present
     */
    bool remove(const T& value) {
        auto end = slots_.begin() + count_;
        auto it = std::find(slots_.begin(), end, value);
        if (it == end) {
            return false;
        }
        std::move(it + 1, end, it);
        slots_[--count_] = T{};
        return true;
    }

    template <typename IO, typename Self>
    static void describe(IO& io, Self& self) {
        for (auto& slot : self.slots_) {
            io.field(slot_bytes(slot));
        }
        io.field(self.count_);
    }

    // Layout access for parsers: count read from chain may exceed N
    uint8_t raw_count() const {
        return count_;
    }

private:
    static Hash32& slot_bytes(Hash32& v) {
        return v;
    }
    static const Hash32& slot_bytes(const Hash32& v) {
        return v;
    }
    static chain::PublicKey::Bytes32& slot_bytes(chain::PublicKey& v) {
        return v.bytes();
    }
    static const chain::PublicKey::Bytes32& slot_bytes(const chain::PublicKey& v) {
        return v.bytes();
    }

    std::array<T, N> slots_{};
    uint8_t count_{0};
};

using OrderHashHistory = FixedSlots<Hash32, 16>;
using AuthorizedExecutors = FixedSlots<chain::PublicKey, 4>;

/**
 * @brief Decoded EncryptedOrder account
 */
struct EncryptedOrderAccount {
    static constexpr size_t LEN = 421;
    static constexpr size_t MAX_ENCRYPTED_DATA = 256;
    static constexpr const char* NAME = "EncryptedOrder";

    chain::PublicKey owner;
    Hash32 order_hash{};
    chain::PublicKey executor_authority;
    std::array<uint8_t, MAX_ENCRYPTED_DATA> encrypted_data{};
    uint16_t data_len{0};
    Hash32 feed_id{};
    int64_t created_at{0};
    int64_t triggered_at{0};
    int64_t execution_price{0};
    OrderStatus status{OrderStatus::ACTIVE};
    bool is_delegated{false};
    uint8_t bump{0};

    /**
     * @brief The used prefix of encrypted_data
     */
    Bytes ciphertext() const {
        size_t len = std::min<size_t>(data_len, MAX_ENCRYPTED_DATA);
        return Bytes(encrypted_data.begin(), encrypted_data.begin() + len);
    }

    template <typename IO, typename Self>
    static void describe(IO& io, Self& a) {
        io.field(a.owner.bytes());
        io.field(a.order_hash);
        io.field(a.executor_authority.bytes());
        io.field(a.encrypted_data);
        io.field(a.data_len);
        io.field(a.feed_id);
        io.field(a.created_at);
        io.field(a.triggered_at);
        io.field(a.execution_price);
        io.enum_u8(a.status);
        io.flag(a.is_delegated);
        io.field(a.bump);
    }
};

/**
 * @brief Decoded ExecutorAuthority account
 */
struct ExecutorAuthorityAccount {
    static constexpr size_t LEN = 692;
    static constexpr const char* NAME = "ExecutorAuthority";

    chain::PublicKey owner;
    uint64_t order_count{0};
    bool is_delegated{false};
    uint8_t bump{0};
    OrderHashHistory order_hashes;
    AuthorizedExecutors authorized_executors;

    /**
     * @brief Record a new order; bumps order_count
     */
    Result<void> add_order_hash(const Hash32& hash);

    /**
     * @brief Drop an order; VALIDATION_ERROR if unknown
     */
    Result<void> remove_order_hash(const Hash32& hash);

    /**
     * @brief Idempotent; VALIDATION_ERROR once all 4 slots are used
     */
    Result<void> authorize_executor(const chain::PublicKey& executor);
    void revoke_executor(const chain::PublicKey& executor);

    /**
     * @brief Owner or one of the authorized executors
     */
    bool can_execute(const chain::PublicKey& signer) const {
        return signer == owner || authorized_executors.contains(signer);
    }

    template <typename IO, typename Self>
    static void describe(IO& io, Self& a) {
        io.field(a.owner.bytes());
        io.field(a.order_count);
        io.flag(a.is_delegated);
        io.field(a.bump);
        OrderHashHistory::describe(io, a.order_hashes);
        AuthorizedExecutors::describe(io, a.authorized_executors);
    }
};

/**
 * @brief Parse account data including its 8-byte discriminator
 * @return PARSE_ERROR for short buffers, wrong discriminator or bad counts
 */
Result<EncryptedOrderAccount> parse_encrypted_order(const Bytes& data);
Result<ExecutorAuthorityAccount> parse_executor_authority(const Bytes& data);

/**
 * @brief Serialize an account with its discriminator (fixtures and local replays)
 */
Bytes serialize_encrypted_order(const EncryptedOrderAccount& account);
Bytes serialize_executor_authority(const ExecutorAuthorityAccount& account);

}  // namespace program
}  // namespace shroud
