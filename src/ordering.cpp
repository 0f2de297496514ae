#include <xpoint-cpp/ordering.hpp>

#include <algorithm>
#include <cstddef>
#include <utility>

namespace xpoint_cpp {

namespace {

template <typename T>
constexpr auto order_of(const T& a, const T& b) noexcept -> Ordering {
    if (a < b) return Ordering::less;
    if (b < a) return Ordering::greater;
    return Ordering::equal;
}

}  // anonymous namespace

auto compare_positions(const PositionEncoding& a, const PositionEncoding& b) noexcept -> Ordering {
    if (auto frag = order_of(a.effective_fragment(), b.effective_fragment());
        frag != Ordering::equal) {
        return frag;
    }

    const auto common = std::min(a.path.size(), b.path.size());
    for (std::size_t i = 0; i < common; ++i) {
        const auto& sa = a.path[i];
        const auto& sb = b.path[i];
        if (sa.name != sb.name) return Ordering::incomparable;
        if (sa.index != sb.index) return order_of(sa.index, sb.index);
    }

    // An ancestor precedes its descendants.
    if (a.path.size() != b.path.size()) return order_of(a.path.size(), b.path.size());

    if (auto text = order_of(a.text_node_index, b.text_node_index); text != Ordering::equal) {
        return text;
    }
    return order_of(a.char_offset, b.char_offset);
}

auto PositionRange::make(PositionEncoding start, PositionEncoding end) -> Result<PositionRange> {
    if (compare_positions(start, end) == Ordering::greater) {
        return Error{ErrorKind::invalid_range,
                     "range start " + serialize_position(start) +
                     " is after range end " + serialize_position(end)};
    }
    return PositionRange{std::move(start), std::move(end)};
}

auto PositionRange::parse(std::string_view start, std::string_view end) -> Result<PositionRange> {
    auto s = parse_position(start);
    if (!s) return s.error();
    auto e = parse_position(end);
    if (!e) return e.error();
    return make(std::move(*s), std::move(*e));
}

auto PositionRange::contains(const PositionEncoding& point) const noexcept -> bool {
    const auto lower = compare_positions(start_, point);
    if (lower != Ordering::less && lower != Ordering::equal) return false;
    const auto upper = compare_positions(point, end_);
    return upper == Ordering::less || upper == Ordering::equal;
}

}  // namespace xpoint_cpp
