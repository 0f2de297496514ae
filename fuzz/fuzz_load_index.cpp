// Fuzz target for PositionIndex::load(). Any snapshot that loads must save
// and load again to an equal index.

#include <xpoint-cpp/position_index.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto index = xpoint_cpp::PositionIndex::load(span);
    if (index) {
        auto reloaded = xpoint_cpp::PositionIndex::load(index->save());
        if (!reloaded || *reloaded != *index) std::abort();
    }
    return 0;
}
