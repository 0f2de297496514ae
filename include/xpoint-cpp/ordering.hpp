/// @file ordering.hpp
/// @brief Partial ordering of position encodings and closed ranges over them.

#pragma once

#include <xpoint-cpp/encoding.hpp>
#include <xpoint-cpp/error.hpp>

#include <cstdint>
#include <string_view>
#include <utility>

namespace xpoint_cpp {

/// Outcome of comparing two position encodings.
///
/// `incomparable` is a normal result, not an error: same-name sibling
/// indices carry no information about how differently-named siblings
/// interleave, so `div[1]/p[3]` and `div[1]/blockquote[1]` cannot be
/// ordered without the document itself.
enum class Ordering : std::uint8_t {
    less,
    equal,
    greater,
    incomparable,
};

/// Convert an Ordering to its string representation.
constexpr auto to_string_view(Ordering ord) noexcept -> std::string_view {
    switch (ord) {
        case Ordering::less:         return "less";
        case Ordering::equal:        return "equal";
        case Ordering::greater:      return "greater";
        case Ordering::incomparable: return "incomparable";
    }
    return "unknown";
}

/// The ordering of (b, a) given the ordering of (a, b).
constexpr auto reverse(Ordering ord) noexcept -> Ordering {
    switch (ord) {
        case Ordering::less:    return Ordering::greater;
        case Ordering::greater: return Ordering::less;
        default:                return ord;
    }
}

/// Compare two encodings in document order.
///
/// 1. Effective fragment index (absent counts as 1).
/// 2. Path steps pairwise; at the first divergence, same-named steps
///    compare by index and differently-named steps are incomparable.
/// 3. If one path is a strict prefix of the other, the ancestor comes first.
/// 4. Text node index, then character offset.
auto compare_positions(const PositionEncoding& a, const PositionEncoding& b) noexcept -> Ordering;

/// A closed range [start, end] of positions.
///
/// Construction rejects ranges whose start is provably after their end.
/// Ranges whose endpoints are incomparable are accepted, since only the
/// document can settle their order.
class PositionRange {
public:
    /// Build a range, failing with invalid_range if start > end.
    static auto make(PositionEncoding start, PositionEncoding end) -> Result<PositionRange>;

    /// Parse both endpoints and build a range.
    static auto parse(std::string_view start, std::string_view end) -> Result<PositionRange>;

    auto start() const noexcept -> const PositionEncoding& { return start_; }
    auto end() const noexcept -> const PositionEncoding& { return end_; }

    /// True only if start <= point <= end is provable from the encodings.
    /// Returns false when either comparison is incomparable; callers must
    /// read false as "unknown or outside", never as proof of exclusion.
    auto contains(const PositionEncoding& point) const noexcept -> bool;

    auto operator==(const PositionRange&) const -> bool = default;

private:
    PositionRange(PositionEncoding start, PositionEncoding end)
        : start_{std::move(start)}, end_{std::move(end)} {}

    PositionEncoding start_;
    PositionEncoding end_;
};

/// Free-function form of PositionRange::contains.
inline auto range_contains(const PositionRange& range, const PositionEncoding& point) noexcept -> bool {
    return range.contains(point);
}

}  // namespace xpoint_cpp
