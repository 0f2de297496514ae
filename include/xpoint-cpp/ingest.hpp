/// @file ingest.hpp
/// @brief Batch ingestion of uploaded highlights and reading sessions.

#pragma once

#include <xpoint-cpp/config.hpp>
#include <xpoint-cpp/content_hash.hpp>
#include <xpoint-cpp/error.hpp>
#include <xpoint-cpp/matcher.hpp>
#include <xpoint-cpp/ordering.hpp>
#include <xpoint-cpp/position_index.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace xpoint_cpp {

/// A highlight as uploaded by a reader device.
struct HighlightRecord {
    std::string text;
    std::optional<std::string> note;
    std::optional<std::string> start_xpoint;
    std::optional<std::string> end_xpoint;
    std::optional<std::int64_t> page;

    auto operator==(const HighlightRecord&) const -> bool = default;
};

/// A reading session as uploaded by a reader device. Times are Unix seconds.
struct SessionRecord {
    std::int64_t start_time{0};
    std::int64_t end_time{0};
    std::optional<std::string> start_xpoint;
    std::optional<std::string> end_xpoint;
    std::optional<std::int64_t> start_page;
    std::optional<std::int64_t> end_page;
    std::optional<std::string> device_id;

    auto operator==(const SessionRecord&) const -> bool = default;
};

/// What happened to one uploaded record.
enum class RecordStatus : std::uint8_t {
    accepted,   ///< New; the caller should store it.
    duplicate,  ///< Already stored, or repeated earlier in the batch.
    filtered,   ///< Valid but dropped by an ingestion rule.
    rejected,   ///< Invalid; see the error.
};

/// Convert a RecordStatus to its string representation.
constexpr auto to_string_view(RecordStatus status) noexcept -> std::string_view {
    switch (status) {
        case RecordStatus::accepted:  return "accepted";
        case RecordStatus::duplicate: return "duplicate";
        case RecordStatus::filtered:  return "filtered";
        case RecordStatus::rejected:  return "rejected";
    }
    return "unknown";
}

/// Per-record outcome, in input order.
struct RecordOutcome {
    std::size_t index{0};
    RecordStatus status{RecordStatus::accepted};
    std::optional<ContentHash> hash;  ///< Set for accepted and duplicate records.
    std::optional<Error> error;       ///< Set for rejected records.
    std::string reason;               ///< Why a record was filtered.

    auto operator==(const RecordOutcome&) const -> bool = default;
};

/// A validated highlight ready to store.
struct IngestedHighlight {
    std::size_t record_index{0};
    ContentHash hash;
    std::string text;
    std::optional<std::string> note;
    HighlightLocation location;
    std::optional<std::uint32_t> page;

    /// The matcher's view of this highlight under a stored id.
    auto to_highlight(std::string id) const -> Highlight {
        return Highlight{std::move(id), location, page};
    }

    auto operator==(const IngestedHighlight&) const -> bool = default;
};

/// A validated reading session ready to store.
struct IngestedSession {
    std::size_t record_index{0};
    ContentHash hash;
    std::int64_t start_time{0};
    std::int64_t end_time{0};
    std::optional<PositionRange> range;
    std::optional<std::uint32_t> start_page;
    std::optional<std::uint32_t> end_page;
    std::optional<std::string> device_id;
    std::optional<DocumentPosition> start_position;  ///< Set when an index resolved the range.
    std::optional<DocumentPosition> end_position;

    /// The matcher's view of this session under a stored id.
    auto to_session(std::string id) const -> ReadingSession {
        return ReadingSession{std::move(id), range, start_page, end_page};
    }

    auto operator==(const IngestedSession&) const -> bool = default;
};

/// Outcomes for a whole upload plus the records to store.
template <typename T>
struct IngestReport {
    std::vector<RecordOutcome> outcomes;  ///< One per input record.
    std::vector<T> accepted;              ///< Accepted records, in input order.

    /// Number of records with the given status.
    auto count(RecordStatus status) const -> std::size_t {
        return static_cast<std::size_t>(std::ranges::count_if(outcomes,
            [status](const RecordOutcome& o) { return o.status == status; }));
    }
};

/// Validate, hash and deduplicate uploaded highlights.
///
/// Both xpoints present make a range, a start alone makes a point. A
/// malformed xpoint, a start after the end, an end without a start, a
/// negative page or empty text rejects that record only. The hash is
/// taken over the highlight text.
/// @param existing Hashes of highlights already stored for the book.
auto ingest_highlights(std::span<const HighlightRecord> records,
                       const std::unordered_set<ContentHash>& existing)
    -> IngestReport<IngestedHighlight>;

/// Validate, filter, hash and deduplicate uploaded reading sessions.
///
/// Sessions whose start and end are the same point (same xpoints and same
/// pages) or which are shorter than Config::minimum_session_duration_seconds
/// are filtered. The hash covers book, user, start time and device.
/// @param existing Hashes of sessions already stored.
/// @param index The book's index, or nullptr; used to resolve positions.
auto ingest_sessions(std::span<const SessionRecord> records,
                     std::string_view book_id,
                     std::string_view user_id,
                     const std::unordered_set<ContentHash>& existing,
                     const PositionIndex* index = nullptr,
                     const Config& config = {}) -> IngestReport<IngestedSession>;

}  // namespace xpoint_cpp
