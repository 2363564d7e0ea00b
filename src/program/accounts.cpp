// src/program/accounts.cpp

#include "shroud/program/accounts.hpp"
#include <cstring>
#include "shroud/crypto/hash.hpp"

namespace shroud {
namespace program {

namespace {

Discriminator prefix8(const Hash32& digest) {
    Discriminator out{};
    std::copy(digest.begin(), digest.begin() + out.size(), out.begin());
    return out;
}

Result<void> check_header(const Bytes& data, size_t expected_len, const char* name) {
    if (data.size() < expected_len) {
        return make_error<void>(ErrorCode::PARSE_ERROR,
                                std::string(name) + " account too short: " +
                                    std::to_string(data.size()) + " < " +
                                    std::to_string(expected_len),
                                "Accounts");
    }
    const Discriminator expected = account_discriminator(name);
    if (std::memcmp(data.data(), expected.data(), expected.size()) != 0) {
        return make_error<void>(ErrorCode::PARSE_ERROR,
                                std::string("Account is not a ") + name, "Accounts");
    }
    return Result<void>();
}

}  // namespace

Discriminator instruction_discriminator(const std::string& name) {
    return prefix8(crypto::sha256("global:" + name));
}

Discriminator account_discriminator(const std::string& name) {
    return prefix8(crypto::sha256("account:" + name));
}

std::string order_status_to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::ACTIVE:
            return "ACTIVE";
        case OrderStatus::TRIGGERED:
            return "TRIGGERED";
        case OrderStatus::EXECUTED:
            return "EXECUTED";
        case OrderStatus::CANCELLED:
            return "CANCELLED";
        default:
            return "UNKNOWN";
    }
}

Result<void> ExecutorAuthorityAccount::add_order_hash(const Hash32& hash) {
    auto pushed = order_hashes.push(hash);
    if (pushed.is_error()) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                std::string("Cannot record order hash: ") + pushed.error()->what(),
                                "ExecutorAuthority");
    }
    ++order_count;
    return Result<void>();
}

Result<void> ExecutorAuthorityAccount::remove_order_hash(const Hash32& hash) {
    if (!order_hashes.remove(hash)) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR, "Order hash not found",
                                "ExecutorAuthority");
    }
    return Result<void>();
}

Result<void> ExecutorAuthorityAccount::authorize_executor(const chain::PublicKey& executor) {
    if (authorized_executors.full()) {
        return make_error<void>(ErrorCode::VALIDATION_ERROR,
                                "Maximum number of authorized executors reached",
                                "ExecutorAuthority");
    }
    if (authorized_executors.contains(executor)) {
        return Result<void>();
    }
    return authorized_executors.push(executor);
}

void ExecutorAuthorityAccount::revoke_executor(const chain::PublicKey& executor) {
    authorized_executors.remove(executor);
}

Result<EncryptedOrderAccount> parse_encrypted_order(const Bytes& data) {
    auto header = check_header(data, EncryptedOrderAccount::LEN, EncryptedOrderAccount::NAME);
    if (header.is_error()) {
        return forward_error<EncryptedOrderAccount>(header);
    }
    EncryptedOrderAccount account;
    LayoutReader reader(data, 8);
    EncryptedOrderAccount::describe(reader, account);
    if (!reader.ok()) {
        return make_error<EncryptedOrderAccount>(ErrorCode::PARSE_ERROR,
                                                 "EncryptedOrder truncated", "Accounts");
    }
    if (static_cast<uint8_t>(account.status) > static_cast<uint8_t>(OrderStatus::CANCELLED)) {
        return make_error<EncryptedOrderAccount>(
            ErrorCode::PARSE_ERROR,
            "Unknown order status " + std::to_string(static_cast<int>(account.status)),
            "Accounts");
    }
    if (account.data_len > EncryptedOrderAccount::MAX_ENCRYPTED_DATA) {
        return make_error<EncryptedOrderAccount>(ErrorCode::PARSE_ERROR,
                                                 "Encrypted data length exceeds 256", "Accounts");
    }
    return account;
}

Result<ExecutorAuthorityAccount> parse_executor_authority(const Bytes& data) {
    auto header =
        check_header(data, ExecutorAuthorityAccount::LEN, ExecutorAuthorityAccount::NAME);
    if (header.is_error()) {
        return forward_error<ExecutorAuthorityAccount>(header);
    }
    ExecutorAuthorityAccount account;
    LayoutReader reader(data, 8);
    ExecutorAuthorityAccount::describe(reader, account);
    if (!reader.ok()) {
        return make_error<ExecutorAuthorityAccount>(ErrorCode::PARSE_ERROR,
                                                    "ExecutorAuthority truncated", "Accounts");
    }
    if (account.order_hashes.raw_count() > OrderHashHistory::CAPACITY ||
        account.authorized_executors.raw_count() > AuthorizedExecutors::CAPACITY) {
        return make_error<ExecutorAuthorityAccount>(ErrorCode::PARSE_ERROR,
                                                    "ExecutorAuthority slot count out of range",
                                                    "Accounts");
    }
    return account;
}

Bytes serialize_encrypted_order(const EncryptedOrderAccount& account) {
    Bytes out;
    out.reserve(EncryptedOrderAccount::LEN);
    LayoutWriter writer(out);
    writer.field(account_discriminator(EncryptedOrderAccount::NAME));
    EncryptedOrderAccount::describe(writer, account);
    return out;
}

Bytes serialize_executor_authority(const ExecutorAuthorityAccount& account) {
    Bytes out;
    out.reserve(ExecutorAuthorityAccount::LEN);
    LayoutWriter writer(out);
    writer.field(account_discriminator(ExecutorAuthorityAccount::NAME));
    ExecutorAuthorityAccount::describe(writer, account);
    return out;
}

}  // namespace program
}  // namespace shroud
