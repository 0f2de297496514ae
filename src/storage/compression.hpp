#pragma once

// Raw DEFLATE (no zlib/gzip header) for index snapshot bodies.
//
// Bodies larger than the configured threshold are compressed; a flag in
// the snapshot header records whether the body is deflated.
//
// Internal header — not installed.

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace xpoint_cpp::storage {

namespace detail {

// Owns an initialized z_stream and ends it on scope exit.
template <bool Inflate>
class ZStream {
public:
    ZStream() = default;
    ZStream(const ZStream&) = delete;
    auto operator=(const ZStream&) -> ZStream& = delete;

    ~ZStream() {
        if (!initialized_) return;
        if constexpr (Inflate) {
            ::inflateEnd(&stream_);
        } else {
            ::deflateEnd(&stream_);
        }
    }

    // windowBits = -15 selects raw deflate (negative = no header)
    auto init() -> bool {
        if constexpr (Inflate) {
            initialized_ = ::inflateInit2(&stream_, -15) == Z_OK;
        } else {
            initialized_ = ::deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                                          -15, 8, Z_DEFAULT_STRATEGY) == Z_OK;
        }
        return initialized_;
    }

    auto get() -> z_stream* { return &stream_; }

private:
    z_stream stream_{};
    bool initialized_{false};
};

}  // namespace detail

inline auto deflate_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {

    if (input.empty()) return std::vector<std::byte>{};

    auto stream = detail::ZStream<false>{};
    if (!stream.init()) return std::nullopt;
    auto* zs = stream.get();

    const auto bound = ::deflateBound(zs, static_cast<uLong>(input.size()));
    auto output = std::vector<std::byte>(bound);

    zs->next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    zs->avail_in = static_cast<uInt>(input.size());
    zs->next_out = reinterpret_cast<Bytef*>(output.data());
    zs->avail_out = static_cast<uInt>(bound);

    if (::deflate(zs, Z_FINISH) != Z_STREAM_END) return std::nullopt;

    output.resize(zs->total_out);
    return output;
}

// max_output_size limits decompressed output to prevent memory bombs.
inline auto deflate_decompress(std::span<const std::byte> input,
                               std::size_t max_output_size = std::size_t{64} * 1024 * 1024)
    -> std::optional<std::vector<std::byte>> {

    if (input.empty()) return std::vector<std::byte>{};

    auto stream = detail::ZStream<true>{};
    if (!stream.init()) return std::nullopt;
    auto* zs = stream.get();

    // Start with 4x the input size, grow if needed
    auto output_size = std::min(input.size() * 4, max_output_size);
    auto output = std::vector<std::byte>(output_size);

    zs->next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    zs->avail_in = static_cast<uInt>(input.size());
    zs->next_out = reinterpret_cast<Bytef*>(output.data());
    zs->avail_out = static_cast<uInt>(output_size);

    auto ret = ::inflate(zs, Z_FINISH);
    while ((ret == Z_BUF_ERROR || ret == Z_OK) && zs->avail_out == 0 && output_size < max_output_size) {
        const auto written = static_cast<std::size_t>(zs->total_out);
        output_size = std::min(output_size * 2, max_output_size);
        output.resize(output_size);
        zs->next_out = reinterpret_cast<Bytef*>(output.data() + written);
        zs->avail_out = static_cast<uInt>(output_size - written);
        ret = ::inflate(zs, Z_FINISH);
    }

    // Bytes after the end of the stream are corruption, not padding.
    if (ret != Z_STREAM_END || zs->avail_in != 0) return std::nullopt;

    output.resize(zs->total_out);
    return output;
}

}  // namespace xpoint_cpp::storage
