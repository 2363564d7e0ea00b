// include/shroud/core/byte_layout.hpp
#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include "shroud/core/types.hpp"

namespace shroud {

/**
 * @brief Little-endian field writer for fixed binary layouts
 *
 * Layouts are described once as a template `describe(io, fields)` and
 * driven by either LayoutWriter or LayoutReader, so encode and decode can
 * never disagree on field order or width.
 */
class LayoutWriter {
public:
    explicit LayoutWriter(Bytes& out) : out_(out) {}

    void field(const uint8_t& v) {
        out_.push_back(v);
    }
    void field(const uint16_t& v) {
        put_le(static_cast<uint64_t>(v), 2);
    }
    void field(const uint32_t& v) {
        put_le(static_cast<uint64_t>(v), 4);
    }
    void field(const uint64_t& v) {
        put_le(v, 8);
    }
    void field(const int64_t& v) {
        put_le(static_cast<uint64_t>(v), 8);
    }
    void field(const int32_t& v) {
        put_le(static_cast<uint64_t>(static_cast<uint32_t>(v)), 4);
    }

    template <size_t N>
    void field(const std::array<uint8_t, N>& v) {
        out_.insert(out_.end(), v.begin(), v.end());
    }

    void flag(const bool& v) {
        out_.push_back(v ? 1 : 0);
    }

    template <typename E>
    void enum_u8(const E& v) {
        static_assert(std::is_enum<E>::value, "enum_u8 requires an enum");
        out_.push_back(static_cast<uint8_t>(v));
    }

    void raw(const uint8_t* data, size_t len) {
        out_.insert(out_.end(), data, data + len);
    }

    void raw(const Bytes& data) {
        out_.insert(out_.end(), data.begin(), data.end());
    }

    void raw(const std::string& data) {
        out_.insert(out_.end(), data.begin(), data.end());
    }

    void pad(size_t n) {
        out_.insert(out_.end(), n, 0);
    }

    bool ok() const {
        return true;
    }

    size_t position() const {
        return out_.size();
    }

private:
    void put_le(uint64_t v, size_t width) {
        for (size_t i = 0; i < width; ++i) {
            out_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
        }
    }

    Bytes& out_;
};

/**
 * @brief Little-endian field reader; latches a failure flag on overrun
 */
class LayoutReader {
public:
    LayoutReader(const uint8_t* data, size_t size, size_t offset = 0)
        : data_(data), size_(size), pos_(offset) {}

    explicit LayoutReader(const Bytes& data, size_t offset = 0)
        : LayoutReader(data.data(), data.size(), offset) {}

    void field(uint8_t& v) {
        v = static_cast<uint8_t>(get_le(1));
    }
    void field(uint16_t& v) {
        v = static_cast<uint16_t>(get_le(2));
    }
    void field(uint32_t& v) {
        v = static_cast<uint32_t>(get_le(4));
    }
    void field(uint64_t& v) {
        v = get_le(8);
    }
    void field(int64_t& v) {
        v = static_cast<int64_t>(get_le(8));
    }
    void field(int32_t& v) {
        v = static_cast<int32_t>(static_cast<uint32_t>(get_le(4)));
    }

    template <size_t N>
    void field(std::array<uint8_t, N>& v) {
        if (!take(N)) {
            v.fill(0);
            return;
        }
        std::memcpy(v.data(), data_ + pos_ - N, N);
    }

    void flag(bool& v) {
        v = get_le(1) != 0;
    }

    template <typename E>
    void enum_u8(E& v) {
        static_assert(std::is_enum<E>::value, "enum_u8 requires an enum");
        v = static_cast<E>(get_le(1));
    }

    void raw(uint8_t* out, size_t len) {
        if (!take(len)) {
            std::memset(out, 0, len);
            return;
        }
        std::memcpy(out, data_ + pos_ - len, len);
    }

    void pad(size_t n) {
        take(n);
    }

    bool ok() const {
        return ok_;
    }

    size_t position() const {
        return pos_;
    }

    size_t remaining() const {
        return pos_ <= size_ ? size_ - pos_ : 0;
    }

private:
    bool take(size_t n) {
        if (!ok_ || n > size_ - std::min(pos_, size_)) {
            ok_ = false;
            return false;
        }
        pos_ += n;
        return true;
    }

    uint64_t get_le(size_t width) {
        if (!take(width)) {
            return 0;
        }
        uint64_t v = 0;
        const uint8_t* p = data_ + pos_ - width;
        for (size_t i = 0; i < width; ++i) {
            v |= static_cast<uint64_t>(p[i]) << (8 * i);
        }
        return v;
    }

    const uint8_t* data_;
    size_t size_;
    size_t pos_;
    bool ok_{true};
};

}  // namespace shroud
