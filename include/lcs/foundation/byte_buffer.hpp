#pragma once

/// @file byte_buffer.hpp
/// @brief Little-endian binary writer/reader used by the lobby wire codec.
///
/// Strings are encoded as a u32 byte length followed by the raw bytes.
/// Readers never throw: every read reports success and leaves the output
/// untouched on truncation.

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace lcs::foundation {

/// Append-only binary encoder.
class ByteWriter {
public:
    ByteWriter() { buf_.reserve(64); }

    template <typename T>
    ByteWriter& write(T val) {
        static_assert(std::is_arithmetic_v<T>, "write() takes arithmetic types");
        if constexpr (std::is_same_v<T, bool>) {
            uint8_t b = val ? 1 : 0;
            writeBytes(&b, 1);
        } else {
            // Byte-wise little-endian so the encoding is host independent.
            using U = std::make_unsigned_t<std::conditional_t<
                std::is_floating_point_v<T>,
                std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>, T>>;
            U raw{};
            std::memcpy(&raw, &val, sizeof(T));
            for (std::size_t i = 0; i < sizeof(T); ++i) {
                buf_.push_back(static_cast<uint8_t>(raw >> (8 * i)));
            }
        }
        return *this;
    }

    ByteWriter& writeString(std::string_view val) {
        write(static_cast<uint32_t>(val.size()));
        writeBytes(val.data(), val.size());
        return *this;
    }

    [[nodiscard]] const std::vector<uint8_t>& bytes() const& noexcept { return buf_; }
    [[nodiscard]] std::vector<uint8_t> bytes() && noexcept { return std::move(buf_); }

private:
    void writeBytes(const void* data, std::size_t n) {
        const auto* p = static_cast<const uint8_t*>(data);
        buf_.insert(buf_.end(), p, p + n);
    }

    std::vector<uint8_t> buf_;
};

/// Sequential binary decoder over a borrowed byte span.
struct ByteReader {
    std::span<const uint8_t> data;
    std::size_t pos = 0;

    [[nodiscard]] bool canRead(std::size_t n) const {
        return n <= data.size() && pos <= data.size() - n;
    }

    [[nodiscard]] bool atEnd() const { return pos >= data.size(); }

    template <typename T>
    bool read(T& val) {
        static_assert(std::is_arithmetic_v<T>, "read() takes arithmetic types");
        if constexpr (std::is_same_v<T, bool>) {
            if (!canRead(1)) return false;
            val = data[pos++] != 0;
            return true;
        } else {
            using U = std::make_unsigned_t<std::conditional_t<
                std::is_floating_point_v<T>,
                std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>, T>>;
            if (!canRead(sizeof(T))) return false;
            U raw{};
            for (std::size_t i = 0; i < sizeof(T); ++i) {
                raw |= static_cast<U>(static_cast<U>(data[pos + i]) << (8 * i));
            }
            std::memcpy(&val, &raw, sizeof(T));
            pos += sizeof(T);
            return true;
        }
    }

    bool readString(std::string& val) {
        uint32_t len = 0;
        auto start = pos;
        if (!read(len)) return false;
        if (!canRead(len)) {
            pos = start;
            return false;
        }
        val.assign(reinterpret_cast<const char*>(data.data() + pos), len);
        pos += len;
        return true;
    }
};

}  // namespace lcs::foundation
