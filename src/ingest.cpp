#include <xpoint-cpp/ingest.hpp>

#include "log.hpp"

#include <limits>

namespace xpoint_cpp {

namespace {

auto record_error(std::size_t index, const std::string& reason) -> Error {
    return Error{ErrorKind::invalid_record, "record " + std::to_string(index) + ": " + reason};
}

auto prefixed(std::size_t index, const Error& error) -> Error {
    return Error{error.kind, "record " + std::to_string(index) + ": " + error.message};
}

auto to_page(std::size_t index, std::optional<std::int64_t> page, std::string_view field)
    -> Result<std::optional<std::uint32_t>> {
    if (!page) return std::optional<std::uint32_t>{};
    if (*page < 0) return record_error(index, std::string{field} + " must not be negative");
    if (*page > std::numeric_limits<std::uint32_t>::max()) {
        return record_error(index, std::string{field} + " is out of range");
    }
    return std::optional<std::uint32_t>{static_cast<std::uint32_t>(*page)};
}

auto rejected(std::size_t index, Error error) -> RecordOutcome {
    detail::logger().debug("rejected {}", error.message);
    return RecordOutcome{index, RecordStatus::rejected, std::nullopt, std::move(error), {}};
}

auto filtered(std::size_t index, std::string reason) -> RecordOutcome {
    return RecordOutcome{index, RecordStatus::filtered, std::nullopt, std::nullopt, std::move(reason)};
}

// Accept the record unless its hash is stored or already seen in this batch.
template <typename T>
void admit(IngestReport<T>& report, std::unordered_set<ContentHash>& seen,
           const std::unordered_set<ContentHash>& existing, T item) {
    const auto hash = item.hash;
    if (existing.contains(hash) || !seen.insert(hash).second) {
        report.outcomes.push_back(RecordOutcome{item.record_index, RecordStatus::duplicate, hash, std::nullopt, {}});
        return;
    }
    report.outcomes.push_back(RecordOutcome{item.record_index, RecordStatus::accepted, hash, std::nullopt, {}});
    report.accepted.push_back(std::move(item));
}

auto highlight_location(std::size_t index, const HighlightRecord& record) -> Result<HighlightLocation> {
    if (record.start_xpoint && record.end_xpoint) {
        auto range = PositionRange::parse(*record.start_xpoint, *record.end_xpoint);
        if (!range) return prefixed(index, range.error());
        return HighlightLocation{std::move(*range)};
    }
    if (record.end_xpoint) return record_error(index, "end xpoint without a start xpoint");
    if (record.start_xpoint) {
        auto point = parse_position(*record.start_xpoint);
        if (!point) return prefixed(index, point.error());
        return HighlightLocation{std::move(*point)};
    }
    return HighlightLocation{};
}

}  // anonymous namespace

auto ingest_highlights(std::span<const HighlightRecord> records,
                       const std::unordered_set<ContentHash>& existing)
    -> IngestReport<IngestedHighlight> {
    auto report = IngestReport<IngestedHighlight>{};
    auto seen = std::unordered_set<ContentHash>{};

    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];

        auto location = highlight_location(i, record);
        if (!location) {
            report.outcomes.push_back(rejected(i, location.error()));
            continue;
        }
        auto page = to_page(i, record.page, "page");
        if (!page) {
            report.outcomes.push_back(rejected(i, page.error()));
            continue;
        }
        auto hash = compute_from_text(record.text);
        if (!hash) {
            report.outcomes.push_back(rejected(i, prefixed(i, hash.error())));
            continue;
        }

        admit(report, seen, existing,
              IngestedHighlight{i, *hash, record.text, record.note, std::move(*location), *page});
    }

    detail::logger().info("ingested {} highlights: {} accepted, {} duplicate, {} rejected",
                          records.size(), report.count(RecordStatus::accepted),
                          report.count(RecordStatus::duplicate), report.count(RecordStatus::rejected));
    return report;
}

auto ingest_sessions(std::span<const SessionRecord> records,
                     std::string_view book_id,
                     std::string_view user_id,
                     const std::unordered_set<ContentHash>& existing,
                     const PositionIndex* index,
                     const Config& config) -> IngestReport<IngestedSession> {
    auto report = IngestReport<IngestedSession>{};
    auto seen = std::unordered_set<ContentHash>{};

    for (std::size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];

        if (record.end_time < record.start_time) {
            report.outcomes.push_back(rejected(i, record_error(i, "session ends before it starts")));
            continue;
        }
        auto start_page = to_page(i, record.start_page, "start page");
        auto end_page = to_page(i, record.end_page, "end page");
        if (!start_page || !end_page) {
            report.outcomes.push_back(rejected(i, !start_page ? start_page.error() : end_page.error()));
            continue;
        }
        if (*start_page && *end_page && **end_page < **start_page) {
            report.outcomes.push_back(rejected(i, record_error(i, "end page precedes start page")));
            continue;
        }
        if (record.start_xpoint.has_value() != record.end_xpoint.has_value()) {
            report.outcomes.push_back(rejected(i, record_error(i, "session needs both xpoints or neither")));
            continue;
        }

        auto range = std::optional<PositionRange>{};
        if (record.start_xpoint) {
            auto parsed = PositionRange::parse(*record.start_xpoint, *record.end_xpoint);
            if (!parsed) {
                report.outcomes.push_back(rejected(i, prefixed(i, parsed.error())));
                continue;
            }
            range = std::move(*parsed);
        }

        if (record.start_xpoint == record.end_xpoint && record.start_page == record.end_page) {
            report.outcomes.push_back(filtered(i, "start and end are the same point"));
            continue;
        }
        // end_time >= start_time here, so the unsigned difference cannot wrap.
        const auto duration = static_cast<std::uint64_t>(record.end_time) -
                              static_cast<std::uint64_t>(record.start_time);
        if (config.minimum_session_duration_seconds > 0 &&
            duration < static_cast<std::uint64_t>(config.minimum_session_duration_seconds)) {
            report.outcomes.push_back(filtered(i,
                "shorter than " + std::to_string(config.minimum_session_duration_seconds) + "s"));
            continue;
        }

        auto hash = hash_content({book_id, user_id, std::to_string(record.start_time),
                                  record.device_id.value_or("")});
        if (!hash) {
            report.outcomes.push_back(rejected(i, prefixed(i, hash.error())));
            continue;
        }

        auto session = IngestedSession{i, *hash, record.start_time, record.end_time, std::move(range),
                                       *start_page, *end_page, record.device_id,
                                       std::nullopt, std::nullopt};
        if (index && session.range) {
            session.start_position = index->locate(session.range->start());
            session.end_position = index->locate(session.range->end());
        }
        admit(report, seen, existing, std::move(session));
    }

    detail::logger().info("ingested {} sessions for book '{}': {} accepted, {} duplicate, {} filtered, {} rejected",
                          records.size(), book_id, report.count(RecordStatus::accepted),
                          report.count(RecordStatus::duplicate), report.count(RecordStatus::filtered),
                          report.count(RecordStatus::rejected));
    return report;
}

}  // namespace xpoint_cpp
