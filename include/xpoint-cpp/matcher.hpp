/// @file matcher.hpp
/// @brief Linking highlights to the reading sessions they were made in.

#pragma once

#include <xpoint-cpp/encoding.hpp>
#include <xpoint-cpp/ordering.hpp>
#include <xpoint-cpp/position_index.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace xpoint_cpp {

/// Where a highlight sits: nowhere known, a single point, or a range.
using HighlightLocation = std::variant<std::monostate, PositionEncoding, PositionRange>;

/// The fields of a highlight the matcher needs.
struct Highlight {
    std::string id;
    HighlightLocation location;
    std::optional<std::uint32_t> page;

    /// The point used for matching: the encoding itself, or a range's start.
    /// @return nullptr if the highlight has no location.
    auto anchor() const -> const PositionEncoding* {
        if (auto* point = std::get_if<PositionEncoding>(&location)) return point;
        if (auto* range = std::get_if<PositionRange>(&location)) return &range->start();
        return nullptr;
    }

    auto operator==(const Highlight&) const -> bool = default;
};

/// The fields of a reading session the matcher needs.
struct ReadingSession {
    std::string id;
    std::optional<PositionRange> range;
    std::optional<std::uint32_t> start_page;
    std::optional<std::uint32_t> end_page;

    auto operator==(const ReadingSession&) const -> bool = default;
};

/// Which evidence decided a pair.
enum class MatchBasis : std::uint8_t {
    position_index,  ///< Resolved document-order indices.
    page_range,      ///< Page numbers.
    encoding_range,  ///< Structural comparison of the encodings.
};

/// Convert a MatchBasis to its string representation.
constexpr auto to_string_view(MatchBasis basis) noexcept -> std::string_view {
    switch (basis) {
        case MatchBasis::position_index: return "position_index";
        case MatchBasis::page_range:     return "page_range";
        case MatchBasis::encoding_range: return "encoding_range";
    }
    return "unknown";
}

/// Whether a highlight falls inside a session.
enum class Containment : std::uint8_t {
    contained,
    not_contained,
    undetermined,  ///< The available evidence cannot decide.
};

/// Convert a Containment to its string representation.
constexpr auto to_string_view(Containment c) noexcept -> std::string_view {
    switch (c) {
        case Containment::contained:     return "contained";
        case Containment::not_contained: return "not_contained";
        case Containment::undetermined:  return "undetermined";
    }
    return "unknown";
}

/// Decision for one (session, highlight) pair.
struct PairDecision {
    Containment containment{Containment::undetermined};
    std::optional<MatchBasis> basis;  ///< Unset when undetermined for lack of data.

    auto operator==(const PairDecision&) const -> bool = default;
};

/// Decide whether a highlight lies within a session.
///
/// The first applicable method decides:
/// 1. Position index: session start, session end and the highlight anchor
///    all resolve, and start <= anchor <= end on integers.
/// 2. Pages: session start/end pages and the highlight page are present.
/// 3. Encoding range: session range and anchor are present and
///    range_contains() holds. If either comparison is incomparable the
///    pair is undetermined rather than not contained.
/// 4. Otherwise the pair is undetermined.
/// @param index Snapshot of the book's index, or nullptr if none.
auto evaluate_pair(const ReadingSession& session, const Highlight& highlight,
                   const PositionIndex* index) -> PairDecision;

/// A highlight linked to a session.
struct MatchedHighlight {
    std::string highlight_id;
    MatchBasis basis{MatchBasis::encoding_range};
    std::optional<DocumentPosition> position;  ///< Set when the anchor resolved.
    std::optional<std::uint32_t> page;

    auto operator==(const MatchedHighlight&) const -> bool = default;
};

/// Result of matching one session.
struct SessionMatch {
    std::string session_id;
    std::vector<MatchedHighlight> matched;   ///< In reading order.
    std::vector<std::string> undetermined;   ///< Highlight ids that could not be decided.

    auto operator==(const SessionMatch&) const -> bool = default;
};

/// Link every candidate highlight that lies within the session.
///
/// Matched highlights are returned in reading order: first those with an
/// index position by (index, char_offset), then those with a page by
/// page, then the rest by the anchor's serialized form. Ties are broken
/// by highlight id, so the order is deterministic.
auto match_highlights_to_session(const ReadingSession& session,
                                 std::span<const Highlight> candidates,
                                 const PositionIndex* index = nullptr) -> SessionMatch;

/// Match many sessions against one index snapshot, in parallel.
/// @return One SessionMatch per session, in input order.
auto match_sessions(std::span<const ReadingSession> sessions,
                    std::span<const Highlight> candidates,
                    const PositionIndex* index = nullptr) -> std::vector<SessionMatch>;

/// A table-of-contents entry's boundaries in the book.
///
/// A chapter runs from its start up to the next chapter's start; the
/// final chapter, or one whose target could not be placed, has no end.
struct ChapterBoundary {
    std::string id;
    std::optional<PositionEncoding> start;
    std::optional<PositionEncoding> end;

    auto operator==(const ChapterBoundary&) const -> bool = default;
};

/// Fill each chapter's missing end with the start of the next chapter
/// that has one. Chapters are taken in table-of-contents order.
auto link_chapter_ends(std::vector<ChapterBoundary> chapters) -> std::vector<ChapterBoundary>;

/// Resolved document positions for stored annotations.
struct PositionBackfill {
    struct HighlightPosition {
        std::string id;
        DocumentPosition position;

        auto operator==(const HighlightPosition&) const -> bool = default;
    };
    struct SessionPositions {
        std::string id;
        DocumentPosition start;
        DocumentPosition end;

        auto operator==(const SessionPositions&) const -> bool = default;
    };

    struct ChapterPositions {
        std::string id;
        std::optional<DocumentPosition> start;
        std::optional<DocumentPosition> end;

        auto operator==(const ChapterPositions&) const -> bool = default;
    };

    std::vector<HighlightPosition> highlights;  ///< Highlights whose anchor resolved.
    std::vector<SessionPositions> sessions;     ///< Sessions whose endpoints both resolved.
    std::vector<ChapterPositions> chapters;     ///< Chapters with at least one resolved boundary.

    auto operator==(const PositionBackfill&) const -> bool = default;
};

/// Recompute document positions against a (new) index.
///
/// Items that do not resolve are skipped. A chapter boundary resolves on
/// its own, so a chapter may come back with only a start or only an end.
/// Running it twice against the same index yields the same result.
auto backfill_positions(const PositionIndex& index,
                        std::span<const Highlight> highlights,
                        std::span<const ReadingSession> sessions,
                        std::span<const ChapterBoundary> chapters = {}) -> PositionBackfill;

}  // namespace xpoint_cpp
