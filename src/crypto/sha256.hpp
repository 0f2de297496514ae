#pragma once

// Incremental SHA-256 (FIPS 180-4).
// Content hashes are built from several parts fed one after another,
// so the hasher buffers a partial block between update() calls.
// Internal header — not installed.

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>

namespace xpoint_cpp::crypto {

namespace detail {

inline constexpr std::uint32_t k[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

inline constexpr auto rotr(std::uint32_t x, unsigned n) -> std::uint32_t {
    return (x >> n) | (x << (32 - n));
}

inline auto load_be32(const std::byte* p) -> std::uint32_t {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           (static_cast<std::uint32_t>(p[3]));
}

inline void store_be32(std::byte* p, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        p[i] = static_cast<std::byte>(v >> (24 - 8 * i));
    }
}

}  // namespace detail

/// Streaming SHA-256 hasher.
///
/// @code
/// auto h = Sha256{};
/// h.update("3:");
/// h.update("abc");
/// auto digest = h.finish();
/// @endcode
class Sha256 {
public:
    static constexpr std::size_t digest_size = 32;
    using Digest = std::array<std::byte, digest_size>;

    void update(std::span<const std::byte> data) {
        total_len_ += data.size();
        auto remaining = data;

        if (buffered_ > 0) {
            auto take = std::min(remaining.size(), block_.size() - buffered_);
            std::memcpy(block_.data() + buffered_, remaining.data(), take);
            buffered_ += take;
            remaining = remaining.subspan(take);
            if (buffered_ < block_.size()) return;
            compress(block_.data());
            buffered_ = 0;
        }

        while (remaining.size() >= block_.size()) {
            compress(remaining.data());
            remaining = remaining.subspan(block_.size());
        }

        if (!remaining.empty()) {
            std::memcpy(block_.data(), remaining.data(), remaining.size());
            buffered_ = remaining.size();
        }
    }

    void update(std::string_view text) {
        update(std::as_bytes(std::span<const char>{text.data(), text.size()}));
    }

    /// Pad, process the final block(s) and return the digest.
    /// The hasher must not be updated afterwards.
    auto finish() -> Digest {
        const auto bit_len = static_cast<std::uint64_t>(total_len_) * 8;

        block_[buffered_++] = std::byte{0x80};
        if (buffered_ > block_.size() - 8) {
            std::memset(block_.data() + buffered_, 0, block_.size() - buffered_);
            compress(block_.data());
            buffered_ = 0;
        }
        std::memset(block_.data() + buffered_, 0, block_.size() - 8 - buffered_);
        for (int i = 0; i < 8; ++i) {
            block_[56 + i] = static_cast<std::byte>(bit_len >> (56 - 8 * i));
        }
        compress(block_.data());

        auto out = Digest{};
        for (std::size_t i = 0; i < state_.size(); ++i) {
            detail::store_be32(out.data() + i * 4, state_[i]);
        }
        return out;
    }

private:
    void compress(const std::byte* block) {
        auto w = std::array<std::uint32_t, 64>{};
        for (std::size_t i = 0; i < 16; ++i) {
            w[i] = detail::load_be32(block + i * 4);
        }
        for (std::size_t i = 16; i < 64; ++i) {
            const auto s0 = detail::rotr(w[i - 15], 7) ^ detail::rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
            const auto s1 = detail::rotr(w[i - 2], 17) ^ detail::rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
            w[i] = w[i - 16] + s0 + w[i - 7] + s1;
        }

        auto v = state_;
        for (std::size_t i = 0; i < 64; ++i) {
            const auto [a, b, c, d, e, f, g, h] = v;
            const auto t1 = h + (detail::rotr(e, 6) ^ detail::rotr(e, 11) ^ detail::rotr(e, 25)) +
                            ((e & f) ^ (~e & g)) + detail::k[i] + w[i];
            const auto t2 = (detail::rotr(a, 2) ^ detail::rotr(a, 13) ^ detail::rotr(a, 22)) +
                            ((a & b) ^ (a & c) ^ (b & c));
            v = {t1 + t2, a, b, c, d + t1, e, f, g};
        }

        for (std::size_t i = 0; i < state_.size(); ++i) {
            state_[i] += v[i];
        }
    }

    std::array<std::uint32_t, 8> state_{
        0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
        0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
    };
    std::array<std::byte, 64> block_{};
    std::size_t buffered_{0};
    std::size_t total_len_{0};
};

/// One-shot digest of a byte span.
inline auto sha256(std::span<const std::byte> input) -> Sha256::Digest {
    auto h = Sha256{};
    h.update(input);
    return h.finish();
}

}  // namespace xpoint_cpp::crypto
