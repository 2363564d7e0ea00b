// src/core/encoding.cpp

#include "shroud/core/encoding.hpp"
#include <openssl/evp.h>
#include <algorithm>

namespace shroud {
namespace encoding {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";
constexpr char BASE58_ALPHABET[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

int base58_value(char c) {
    const char* pos = std::char_traits<char>::find(BASE58_ALPHABET, 58, c);
    return pos ? static_cast<int>(pos - BASE58_ALPHABET) : -1;
}

}  // namespace

std::string to_hex(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0f]);
    }
    return out;
}

std::string to_hex(const Bytes& data) {
    return to_hex(data.data(), data.size());
}

Result<Bytes> from_hex(const std::string& hex) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }
    if ((hex.size() - start) % 2 != 0) {
        return make_error<Bytes>(ErrorCode::INVALID_ARGUMENT, "Hex string has odd length",
                                 "Encoding");
    }

    Bytes out;
    out.reserve((hex.size() - start) / 2);
    for (size_t i = start; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return make_error<Bytes>(ErrorCode::INVALID_ARGUMENT,
                                     "Invalid hex character at position " + std::to_string(i),
                                     "Encoding");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::string to_base58(const uint8_t* data, size_t len) {
    size_t zeros = 0;
    while (zeros < len && data[zeros] == 0) {
        ++zeros;
    }

    // log(256) / log(58) ~= 1.37
    std::vector<uint8_t> digits((len - zeros) * 138 / 100 + 1, 0);
    size_t digits_len = 0;
    for (size_t i = zeros; i < len; ++i) {
        uint32_t carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < digits_len) && it != digits.rend();
             ++it, ++j) {
            carry += 256u * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        digits_len = j;
    }

    std::string out(zeros, '1');
    auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - digits_len);
    while (it != digits.end() && *it == 0) {
        ++it;
    }
    for (; it != digits.end(); ++it) {
        out.push_back(BASE58_ALPHABET[*it]);
    }
    return out;
}

std::string to_base58(const Bytes& data) {
    return to_base58(data.data(), data.size());
}

Result<Bytes> from_base58(const std::string& text) {
    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') {
        ++zeros;
    }

    // log(58) / log(256) ~= 0.733
    std::vector<uint8_t> bytes((text.size() - zeros) * 733 / 1000 + 1, 0);
    size_t bytes_len = 0;
    for (size_t i = zeros; i < text.size(); ++i) {
        int value = base58_value(text[i]);
        if (value < 0) {
            return make_error<Bytes>(ErrorCode::INVALID_ARGUMENT,
                                     "Invalid base58 character '" + std::string(1, text[i]) + "'",
                                     "Encoding");
        }
        uint32_t carry = static_cast<uint32_t>(value);
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < bytes_len) && it != bytes.rend();
             ++it, ++j) {
            carry += 58u * (*it);
            *it = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        bytes_len = j;
    }

    Bytes out(zeros, 0);
    auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - bytes_len);
    while (it != bytes.end() && *it == 0) {
        ++it;
    }
    out.insert(out.end(), it, bytes.end());
    return out;
}

std::string to_base64(const Bytes& data) {
    if (data.empty()) {
        return "";
    }
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                                  static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

Result<Bytes> from_base64(const std::string& text) {
    if (text.empty()) {
        return Bytes{};
    }
    if (text.size() % 4 != 0) {
        return make_error<Bytes>(ErrorCode::INVALID_ARGUMENT,
                                 "Base64 length is not a multiple of 4", "Encoding");
    }
    Bytes out(3 * text.size() / 4);
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        return make_error<Bytes>(ErrorCode::INVALID_ARGUMENT, "Invalid base64 input",
                                 "Encoding");
    }
    // EVP_DecodeBlock keeps the bytes produced by '=' padding
    size_t padding = 0;
    if (text[text.size() - 1] == '=')
        ++padding;
    if (text[text.size() - 2] == '=')
        ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

}  // namespace encoding
}  // namespace shroud
