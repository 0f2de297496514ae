// Fuzz target for parse_position(). Anything accepted must serialize back
// to a string that parses to the same encoding.

#include <xpoint-cpp/encoding.hpp>
#include <xpoint-cpp/ordering.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};

    auto pos = xpoint_cpp::parse_position(input);
    if (!pos) return 0;

    auto again = xpoint_cpp::parse_position(xpoint_cpp::serialize_position(*pos));
    if (!again || *again != *pos) std::abort();
    if (xpoint_cpp::compare_positions(*pos, *again) != xpoint_cpp::Ordering::equal) std::abort();
    return 0;
}
