// src/chain/public_key.cpp

#include "shroud/chain/public_key.hpp"
#include <algorithm>
#include <cstring>
#include "shroud/core/encoding.hpp"
#include "shroud/crypto/ed25519.hpp"
#include "shroud/crypto/hash.hpp"

namespace shroud {
namespace chain {

namespace {

constexpr size_t MAX_SEEDS = 16;
constexpr size_t MAX_SEED_LEN = 32;
const char PDA_MARKER[] = "ProgramDerivedAddress";

}  // namespace

Result<PublicKey> PublicKey::from_base58(const std::string& text) {
    auto decoded = encoding::from_base58(text);
    if (decoded.is_error()) {
        return forward_error<PublicKey>(decoded);
    }
    if (decoded.value().size() != LENGTH) {
        return make_error<PublicKey>(ErrorCode::INVALID_ARGUMENT,
                                     "Address '" + text + "' decodes to " +
                                         std::to_string(decoded.value().size()) + " bytes",
                                     "PublicKey");
    }
    Bytes32 bytes{};
    std::copy(decoded.value().begin(), decoded.value().end(), bytes.begin());
    return PublicKey(bytes);
}

PublicKey PublicKey::from_literal(const char* text) {
    auto parsed = from_base58(text);
    if (parsed.is_error()) {
        throw ShroudError(ErrorCode::INVALID_ARGUMENT, parsed.error()->what(), "PublicKey");
    }
    return parsed.value();
}

std::string PublicKey::to_base58() const {
    return encoding::to_base58(bytes_.data(), bytes_.size());
}

bool PublicKey::is_zero() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

size_t PublicKeyHash::operator()(const PublicKey& key) const noexcept {
    size_t h = 0;
    std::memcpy(&h, key.bytes().data(), sizeof(h));
    return h;
}

Bytes seed(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

Bytes seed(const PublicKey& key) {
    return key.to_bytes();
}

Bytes seed(const Hash32& bytes) {
    return Bytes(bytes.begin(), bytes.end());
}

Bytes seed_u16_le(uint16_t value) {
    return Bytes{static_cast<uint8_t>(value & 0xff), static_cast<uint8_t>(value >> 8)};
}

Result<PublicKey> create_program_address(const Seeds& seeds, const PublicKey& program_id) {
    if (seeds.size() > MAX_SEEDS) {
        return make_error<PublicKey>(ErrorCode::VALIDATION_ERROR, "Too many seeds",
                                     "ProgramAddress");
    }
    crypto::Sha256 hasher;
    for (const auto& s : seeds) {
        if (s.size() > MAX_SEED_LEN) {
            return make_error<PublicKey>(ErrorCode::VALIDATION_ERROR,
                                         "Seed longer than 32 bytes", "ProgramAddress");
        }
        hasher.update(s);
    }
    hasher.update(program_id.bytes());
    hasher.update(reinterpret_cast<const uint8_t*>(PDA_MARKER), sizeof(PDA_MARKER) - 1);
    Hash32 digest = hasher.finish();

    if (crypto::is_on_ed25519_curve(digest.data())) {
        return make_error<PublicKey>(ErrorCode::VALIDATION_ERROR,
                                     "Derived address lies on the curve", "ProgramAddress");
    }
    return PublicKey(digest);
}

Result<ProgramAddress> find_program_address(const Seeds& seeds, const PublicKey& program_id) {
    if (seeds.size() >= MAX_SEEDS) {
        return make_error<ProgramAddress>(ErrorCode::VALIDATION_ERROR,
                                          "Too many seeds to append a bump", "ProgramAddress");
    }
    for (const auto& s : seeds) {
        if (s.size() > MAX_SEED_LEN) {
            return make_error<ProgramAddress>(ErrorCode::VALIDATION_ERROR,
                                              "Seed longer than 32 bytes", "ProgramAddress");
        }
    }

    Seeds with_bump = seeds;
    with_bump.push_back(Bytes{0});
    for (int bump = 255; bump >= 0; --bump) {
        with_bump.back()[0] = static_cast<uint8_t>(bump);
        auto candidate = create_program_address(with_bump, program_id);
        if (candidate.is_ok()) {
            return ProgramAddress{candidate.value(), static_cast<uint8_t>(bump)};
        }
    }
    return make_error<ProgramAddress>(ErrorCode::VALIDATION_ERROR,
                                      "No viable bump seed for program address",
                                      "ProgramAddress");
}

}  // namespace chain
}  // namespace shroud
