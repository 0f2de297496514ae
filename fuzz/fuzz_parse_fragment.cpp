// Fuzz target for parse_fragment(). Parsed trees are walked and indexed,
// which must not crash.

#include <xpoint-cpp/document.hpp>
#include <xpoint-cpp/position_index.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto markup = std::string_view{reinterpret_cast<const char*>(data), size};

    auto fragment = xpoint_cpp::parse_fragment(markup, "fuzz.xhtml", {.max_depth = 64});
    if (fragment) {
        auto fragments = std::span<const xpoint_cpp::DocumentFragment>{&*fragment, 1};
        auto index = xpoint_cpp::build_position_index("fuzz", fragments);
        (void)index;
    }
    return 0;
}
