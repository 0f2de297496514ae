#include <xpoint-cpp/matcher.hpp>

#include "executor.hpp"
#include "log.hpp"

#include <algorithm>
#include <tuple>

namespace xpoint_cpp {

namespace {

auto is_at_most(Ordering ord) -> bool {
    return ord == Ordering::less || ord == Ordering::equal;
}

auto by_index(const ReadingSession& session, const PositionEncoding& anchor,
              const PositionIndex& index) -> std::optional<PairDecision> {
    auto start = index.locate(session.range->start());
    auto end = index.locate(session.range->end());
    auto point = index.locate(anchor);
    if (!start || !end || !point) return std::nullopt;

    const bool inside = start->index <= point->index && point->index <= end->index;
    return PairDecision{inside ? Containment::contained : Containment::not_contained,
                        MatchBasis::position_index};
}

auto by_pages(std::uint32_t start, std::uint32_t end, std::uint32_t page) -> PairDecision {
    const bool inside = start <= page && page <= end;
    return PairDecision{inside ? Containment::contained : Containment::not_contained,
                        MatchBasis::page_range};
}

auto by_encodings(const PositionRange& range, const PositionEncoding& anchor) -> PairDecision {
    const auto after_start = compare_positions(range.start(), anchor);
    const auto before_end = compare_positions(anchor, range.end());
    if (after_start == Ordering::incomparable || before_end == Ordering::incomparable) {
        return PairDecision{Containment::undetermined, MatchBasis::encoding_range};
    }
    const bool inside = is_at_most(after_start) && is_at_most(before_end);
    return PairDecision{inside ? Containment::contained : Containment::not_contained,
                        MatchBasis::encoding_range};
}

// Matched highlight with the key that places it in reading order.
struct Ranked {
    MatchedHighlight match;
    std::string anchor_text;

    auto tier() const -> int {
        if (match.position) return 0;
        if (match.page) return 1;
        return 2;
    }
};

auto reading_order(const Ranked& a, const Ranked& b) -> bool {
    if (a.tier() != b.tier()) return a.tier() < b.tier();
    switch (a.tier()) {
        case 0:
            if (*a.match.position != *b.match.position) return *a.match.position < *b.match.position;
            break;
        case 1:
            if (*a.match.page != *b.match.page) return *a.match.page < *b.match.page;
            break;
        default:
            if (a.anchor_text != b.anchor_text) return a.anchor_text < b.anchor_text;
            break;
    }
    return a.match.highlight_id < b.match.highlight_id;
}

}  // anonymous namespace

auto evaluate_pair(const ReadingSession& session, const Highlight& highlight,
                   const PositionIndex* index) -> PairDecision {
    const auto* anchor = highlight.anchor();

    if (index && session.range && anchor) {
        if (auto decision = by_index(session, *anchor, *index)) return *decision;
    }
    if (session.start_page && session.end_page && highlight.page) {
        return by_pages(*session.start_page, *session.end_page, *highlight.page);
    }
    if (session.range && anchor) {
        return by_encodings(*session.range, *anchor);
    }
    return PairDecision{};
}

auto match_highlights_to_session(const ReadingSession& session,
                                 std::span<const Highlight> candidates,
                                 const PositionIndex* index) -> SessionMatch {
    auto result = SessionMatch{session.id, {}, {}};
    auto ranked = std::vector<Ranked>{};

    for (const auto& highlight : candidates) {
        const auto decision = evaluate_pair(session, highlight, index);
        if (decision.containment == Containment::undetermined) {
            result.undetermined.push_back(highlight.id);
            continue;
        }
        if (decision.containment == Containment::not_contained) continue;

        const auto* anchor = highlight.anchor();
        auto entry = Ranked{MatchedHighlight{highlight.id, *decision.basis, std::nullopt, highlight.page}, {}};
        if (anchor) {
            if (index) entry.match.position = index->locate(*anchor);
            entry.anchor_text = serialize_position(*anchor);
        }
        ranked.push_back(std::move(entry));
    }

    std::ranges::sort(ranked, reading_order);
    result.matched.reserve(ranked.size());
    for (auto& r : ranked) result.matched.push_back(std::move(r.match));

    detail::logger().debug("session '{}': {} matched, {} undetermined of {} candidates",
                           session.id, result.matched.size(), result.undetermined.size(),
                           candidates.size());
    return result;
}

auto match_sessions(std::span<const ReadingSession> sessions,
                    std::span<const Highlight> candidates,
                    const PositionIndex* index) -> std::vector<SessionMatch> {
    auto results = std::vector<SessionMatch>(sessions.size());

    detail::parallel_for(sessions.size(), [&](std::size_t i) {
        results[i] = match_highlights_to_session(sessions[i], candidates, index);
    });

    return results;
}

auto link_chapter_ends(std::vector<ChapterBoundary> chapters) -> std::vector<ChapterBoundary> {
    auto next_start = std::optional<PositionEncoding>{};
    for (auto it = chapters.rbegin(); it != chapters.rend(); ++it) {
        if (!it->end) it->end = next_start;
        if (it->start) next_start = it->start;
    }
    return chapters;
}

auto backfill_positions(const PositionIndex& index,
                        std::span<const Highlight> highlights,
                        std::span<const ReadingSession> sessions,
                        std::span<const ChapterBoundary> chapters) -> PositionBackfill {
    auto result = PositionBackfill{};

    for (const auto& highlight : highlights) {
        const auto* anchor = highlight.anchor();
        if (!anchor) continue;
        if (auto position = index.locate(*anchor)) {
            result.highlights.push_back({highlight.id, *position});
        }
    }

    for (const auto& session : sessions) {
        if (!session.range) continue;
        auto start = index.locate(session.range->start());
        auto end = index.locate(session.range->end());
        if (start && end) result.sessions.push_back({session.id, *start, *end});
    }

    for (const auto& chapter : chapters) {
        auto start = chapter.start ? index.locate(*chapter.start) : std::nullopt;
        auto end = chapter.end ? index.locate(*chapter.end) : std::nullopt;
        if (start || end) result.chapters.push_back({chapter.id, start, end});
    }

    detail::logger().info("backfilled book '{}': {}/{} highlights, {}/{} sessions, {}/{} chapters",
                          index.book_id(), result.highlights.size(), highlights.size(),
                          result.sessions.size(), sessions.size(),
                          result.chapters.size(), chapters.size());
    return result;
}

}  // namespace xpoint_cpp
