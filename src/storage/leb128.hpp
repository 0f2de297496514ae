#pragma once

// Unsigned LEB128 varints and a bounds-checked reader for index snapshots.
// Internal header — not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace xpoint_cpp::storage {

// Encode a uint64 as unsigned LEB128, appending bytes to output.
inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& output) {
    do {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;
        if (value != 0) {
            byte |= std::byte{0x80};  // more bytes follow
        }
        output.push_back(byte);
    } while (value != 0);
}

// Append a length-prefixed string.
inline void encode_string(std::string_view s, std::vector<std::byte>& output) {
    encode_uleb128(s.size(), output);
    for (auto c : s) output.push_back(static_cast<std::byte>(c));
}

struct DecodeResult {
    std::uint64_t value;
    std::size_t bytes_read;
};

// Decode an unsigned LEB128 value from the front of a byte span.
// Returns nullopt if the input is truncated or the value overflows 64 bits.
inline auto decode_uleb128(std::span<const std::byte> input) -> std::optional<DecodeResult> {
    auto value = std::uint64_t{0};
    auto shift = 0u;

    for (std::size_t i = 0; i < input.size(); ++i) {
        const auto bits = static_cast<std::uint64_t>(input[i]) & 0x7F;
        if (shift == 63 && bits > 1) return std::nullopt;  // overflow
        value |= bits << shift;

        if ((input[i] & std::byte{0x80}) == std::byte{0}) {
            return DecodeResult{.value = value, .bytes_read = i + 1};
        }
        shift += 7;
        if (shift > 63) return std::nullopt;
    }

    return std::nullopt;  // truncated input
}

// Sequential reader over a snapshot body. Every read is bounds-checked;
// a failed read leaves the cursor where it was.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::byte> data) : data_{data} {}

    auto read_uleb() -> std::optional<std::uint64_t> {
        auto decoded = decode_uleb128(data_.subspan(pos_));
        if (!decoded) return std::nullopt;
        pos_ += decoded->bytes_read;
        return decoded->value;
    }

    auto read_string() -> std::optional<std::string> {
        const auto start = pos_;
        auto len = read_uleb();
        if (!len || *len > remaining()) {
            pos_ = start;
            return std::nullopt;
        }
        auto bytes = data_.subspan(pos_, static_cast<std::size_t>(*len));
        pos_ += bytes.size();
        return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
    }

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto at_end() const -> bool { return pos_ == data_.size(); }

private:
    std::span<const std::byte> data_;
    std::size_t pos_{0};
};

}  // namespace xpoint_cpp::storage
