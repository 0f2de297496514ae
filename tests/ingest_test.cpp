#include <xpoint-cpp/ingest.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace xpoint_cpp;

namespace {

auto hash_of(std::string_view hex) -> ContentHash {
    auto h = ContentHash::from_hex(hex);
    EXPECT_TRUE(h.has_value());
    return h.value_or(ContentHash{});
}

constexpr auto quick_brown_fox = "7a0ed9ed603c092f20304ba26b063e0f2d15972252a634f49971caeb9448cd73";
constexpr auto kobo_session = "66563a89dfbb991ed02f913cecebc793e65873fd61f39029b800b6a673bfa223";

constexpr auto p1 = "/body/DocFragment[1]/body/p[1]/text().0";
constexpr auto p2 = "/body/DocFragment[1]/body/p[2]/text().12";

auto session(std::int64_t start, std::int64_t end) -> SessionRecord {
    return SessionRecord{start, end, p1, p2, 10, 12, "kobo"};
}

}  // namespace

// =============================================================================
// Highlights
// =============================================================================

TEST(IngestHighlights, accepts_range_point_and_unplaced_highlights) {
    const auto records = std::vector<HighlightRecord>{
        {"The quick brown fox", "a note", p1, p2, 4},
        {"jumps over", std::nullopt, p2, std::nullopt, std::nullopt},
        {"the lazy dog", std::nullopt, std::nullopt, std::nullopt, 7},
    };

    const auto report = ingest_highlights(records, {});

    ASSERT_EQ(report.outcomes.size(), 3u);
    EXPECT_EQ(report.count(RecordStatus::accepted), 3u);
    ASSERT_EQ(report.accepted.size(), 3u);

    const auto& first = report.accepted[0];
    EXPECT_EQ(first.record_index, 0u);
    EXPECT_EQ(first.hash, hash_of(quick_brown_fox));
    EXPECT_EQ(report.outcomes[0].hash, hash_of(quick_brown_fox));
    EXPECT_EQ(first.note, "a note");
    EXPECT_EQ(first.page, 4u);
    ASSERT_TRUE(std::holds_alternative<PositionRange>(first.location));
    EXPECT_EQ(serialize_position(std::get<PositionRange>(first.location).end()), p2);

    EXPECT_TRUE(std::holds_alternative<PositionEncoding>(report.accepted[1].location));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(report.accepted[2].location));

    const auto highlight = first.to_highlight("hl-1");
    EXPECT_EQ(highlight.id, "hl-1");
    ASSERT_NE(highlight.anchor(), nullptr);
    EXPECT_EQ(serialize_position(*highlight.anchor()), p1);
}

TEST(IngestHighlights, duplicates_by_text) {
    const auto records = std::vector<HighlightRecord>{
        {"The quick brown fox", std::nullopt, p1, std::nullopt, std::nullopt},
        {"The quick brown fox", "different note", p2, std::nullopt, 9},
        {"already stored", std::nullopt, std::nullopt, std::nullopt, std::nullopt},
    };
    const auto existing = std::unordered_set<ContentHash>{*compute_from_text("already stored")};

    const auto report = ingest_highlights(records, existing);

    EXPECT_EQ(report.outcomes[0].status, RecordStatus::accepted);
    EXPECT_EQ(report.outcomes[1].status, RecordStatus::duplicate);
    EXPECT_EQ(report.outcomes[1].hash, hash_of(quick_brown_fox));
    EXPECT_EQ(report.outcomes[2].status, RecordStatus::duplicate);
    ASSERT_EQ(report.accepted.size(), 1u);
    EXPECT_EQ(report.accepted[0].record_index, 0u);
}

TEST(IngestHighlights, rejects_invalid_records_individually) {
    const auto records = std::vector<HighlightRecord>{
        {"bad xpoint", std::nullopt, "body/p", std::nullopt, std::nullopt},
        {"end only", std::nullopt, std::nullopt, p2, std::nullopt},
        {"backwards", std::nullopt, p2, p1, std::nullopt},
        {"negative page", std::nullopt, std::nullopt, std::nullopt, -1},
        {"", std::nullopt, p1, std::nullopt, std::nullopt},
        {"fine", std::nullopt, p1, std::nullopt, std::nullopt},
    };

    const auto report = ingest_highlights(records, {});

    ASSERT_EQ(report.outcomes.size(), records.size());
    EXPECT_EQ(report.count(RecordStatus::rejected), 5u);
    EXPECT_EQ(report.outcomes[0].error->kind, ErrorKind::malformed_encoding);
    EXPECT_EQ(report.outcomes[1].error->kind, ErrorKind::invalid_record);
    EXPECT_EQ(report.outcomes[2].error->kind, ErrorKind::invalid_range);
    EXPECT_EQ(report.outcomes[3].error->kind, ErrorKind::invalid_record);
    EXPECT_EQ(report.outcomes[4].error->kind, ErrorKind::empty_content);
    EXPECT_EQ(report.outcomes[2].error->message.rfind("record 2: ", 0), 0u);
    EXPECT_FALSE(report.outcomes[0].hash.has_value());

    ASSERT_EQ(report.accepted.size(), 1u);
    EXPECT_EQ(report.accepted[0].record_index, 5u);
}

// =============================================================================
// Sessions
// =============================================================================

TEST(IngestSessions, hash_covers_book_user_start_and_device) {
    const auto records = std::vector<SessionRecord>{session(1700000000, 1700000600)};

    const auto report = ingest_sessions(records, "book-1", "user-1", {});

    ASSERT_EQ(report.accepted.size(), 1u);
    EXPECT_EQ(report.accepted[0].hash, hash_of(kobo_session));
    EXPECT_EQ(report.accepted[0].start_page, 10u);
    EXPECT_EQ(report.accepted[0].end_page, 12u);
    ASSERT_TRUE(report.accepted[0].range.has_value());
    EXPECT_FALSE(report.accepted[0].start_position.has_value());

    auto other_user = ingest_sessions(records, "book-1", "user-2", {});
    EXPECT_NE(other_user.accepted[0].hash, report.accepted[0].hash);
}

TEST(IngestSessions, same_start_time_and_device_is_a_duplicate) {
    auto later_end = session(1700000000, 1700009999);
    later_end.end_page = 40;
    auto other_device = session(1700000000, 1700000600);
    other_device.device_id = std::nullopt;

    const auto records = std::vector<SessionRecord>{session(1700000000, 1700000600), later_end, other_device};
    const auto report = ingest_sessions(records, "book-1", "user-1", {});

    EXPECT_EQ(report.outcomes[0].status, RecordStatus::accepted);
    EXPECT_EQ(report.outcomes[1].status, RecordStatus::duplicate);
    EXPECT_EQ(report.outcomes[2].status, RecordStatus::accepted);

    const auto existing = std::unordered_set<ContentHash>{hash_of(kobo_session)};
    const auto again = ingest_sessions(std::vector<SessionRecord>{session(1700000000, 1700000600)},
                                       "book-1", "user-1", existing);
    EXPECT_EQ(again.outcomes[0].status, RecordStatus::duplicate);
    EXPECT_TRUE(again.accepted.empty());
}

TEST(IngestSessions, filters_stationary_and_short_sessions) {
    auto stationary = session(1000, 5000);
    stationary.end_xpoint = stationary.start_xpoint;
    stationary.end_page = stationary.start_page;

    auto no_location = SessionRecord{1000, 5000, std::nullopt, std::nullopt, std::nullopt, std::nullopt, "kobo"};

    auto same_xpoint_new_page = stationary;
    same_xpoint_new_page.end_page = 11;

    const auto records = std::vector<SessionRecord>{
        stationary, no_location, same_xpoint_new_page, session(1000, 1119), session(2000, 2120),
    };
    const auto report = ingest_sessions(records, "book-1", "user-1", {});

    EXPECT_EQ(report.outcomes[0].status, RecordStatus::filtered);
    EXPECT_EQ(report.outcomes[0].reason, "start and end are the same point");
    EXPECT_EQ(report.outcomes[1].status, RecordStatus::filtered);
    EXPECT_EQ(report.outcomes[2].status, RecordStatus::accepted);
    EXPECT_EQ(report.outcomes[3].status, RecordStatus::filtered);
    EXPECT_EQ(report.outcomes[3].reason, "shorter than 120s");
    EXPECT_EQ(report.outcomes[4].status, RecordStatus::accepted);
    EXPECT_FALSE(report.outcomes[3].hash.has_value());
}

TEST(IngestSessions, minimum_duration_comes_from_config) {
    auto config = Config{};
    config.minimum_session_duration_seconds = 10;

    const auto records = std::vector<SessionRecord>{session(1000, 1030)};
    EXPECT_EQ(ingest_sessions(records, "book-1", "user-1", {}).outcomes[0].status, RecordStatus::filtered);
    EXPECT_EQ(ingest_sessions(records, "book-1", "user-1", {}, nullptr, config).outcomes[0].status,
              RecordStatus::accepted);
}

TEST(IngestSessions, extreme_timestamps_do_not_wrap_the_duration) {
    constexpr auto lowest = std::numeric_limits<std::int64_t>::min();
    constexpr auto highest = std::numeric_limits<std::int64_t>::max();

    const auto records = std::vector<SessionRecord>{
        session(lowest + 10, highest - 10),
        session(lowest, highest),
        session(highest - 60, highest),
    };
    const auto report = ingest_sessions(records, "book-1", "user-1", {});

    EXPECT_EQ(report.outcomes[0].status, RecordStatus::accepted);
    EXPECT_EQ(report.outcomes[1].status, RecordStatus::accepted);
    EXPECT_EQ(report.outcomes[2].status, RecordStatus::filtered);
    EXPECT_EQ(report.outcomes[2].reason, "shorter than 120s");
}

TEST(IngestSessions, zero_minimum_duration_keeps_instant_sessions) {
    auto config = Config{};
    config.minimum_session_duration_seconds = 0;

    const auto records = std::vector<SessionRecord>{session(1000, 1000)};
    const auto report = ingest_sessions(records, "book-1", "user-1", {}, nullptr, config);
    EXPECT_EQ(report.outcomes[0].status, RecordStatus::accepted);
}

TEST(IngestSessions, rejects_invalid_records_individually) {
    auto backwards_time = session(5000, 1000);
    auto negative_page = session(1000, 5000);
    negative_page.start_page = -3;
    auto backwards_pages = session(1000, 5000);
    backwards_pages.end_page = 2;
    auto one_xpoint = session(1000, 5000);
    one_xpoint.end_xpoint = std::nullopt;
    auto malformed = session(1000, 5000);
    malformed.start_xpoint = "/body/p[0]";
    auto backwards_range = session(1000, 5000);
    std::swap(backwards_range.start_xpoint, backwards_range.end_xpoint);

    const auto records = std::vector<SessionRecord>{
        backwards_time, negative_page, backwards_pages, one_xpoint, malformed, backwards_range,
    };
    const auto report = ingest_sessions(records, "book-1", "user-1", {});

    EXPECT_EQ(report.count(RecordStatus::rejected), records.size());
    EXPECT_TRUE(report.accepted.empty());
    EXPECT_EQ(report.outcomes[0].error->kind, ErrorKind::invalid_record);
    EXPECT_EQ(report.outcomes[1].error->kind, ErrorKind::invalid_record);
    EXPECT_EQ(report.outcomes[2].error->kind, ErrorKind::invalid_record);
    EXPECT_EQ(report.outcomes[3].error->kind, ErrorKind::invalid_record);
    EXPECT_EQ(report.outcomes[4].error->kind, ErrorKind::malformed_encoding);
    EXPECT_EQ(report.outcomes[5].error->kind, ErrorKind::invalid_range);
    EXPECT_EQ(report.outcomes[4].error->message.rfind("record 4: ", 0), 0u);
}

TEST(IngestSessions, resolves_positions_with_an_index) {
    auto fragments = std::vector<DocumentFragment>{
        {"ch1.xhtml", element("html", {element("body", {element("p"), element("p")})})},
    };
    const auto index = build_position_index("book-1", fragments);
    ASSERT_TRUE(index.has_value());

    auto off_index = session(2000, 5000);
    off_index.end_xpoint = "/body/DocFragment[1]/body/p[7]/text().0";

    const auto records = std::vector<SessionRecord>{session(1000, 5000), off_index};
    const auto report = ingest_sessions(records, "book-1", "user-1", {}, &*index);

    ASSERT_EQ(report.accepted.size(), 2u);
    EXPECT_EQ(report.accepted[0].start_position, (DocumentPosition{2, 0}));
    EXPECT_EQ(report.accepted[0].end_position, (DocumentPosition{3, 12}));
    EXPECT_TRUE(report.accepted[1].start_position.has_value());
    EXPECT_FALSE(report.accepted[1].end_position.has_value());

    const auto as_session = report.accepted[0].to_session("rs-1");
    EXPECT_EQ(as_session.id, "rs-1");
    EXPECT_EQ(as_session.range, report.accepted[0].range);
    EXPECT_EQ(as_session.start_page, 10u);
}
