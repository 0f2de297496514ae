// session_matching — ingest an upload and link highlights to reading sessions
//
// Demonstrates:
//   - Loading a chapter from XHTML and building its position index
//   - Ingesting uploaded highlights and sessions from JSON
//   - Matching with and without the index (the blockquote case)
//   - Backfilling document positions
//
// Build: cmake --build build -DXPOINT_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/session_matching

#include <xpoint-cpp/json.hpp>
#include <xpoint-cpp/xpoint.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace xp = xpoint_cpp;
using json = nlohmann::json;

static constexpr auto chapter_one = R"(<?xml version="1.0" encoding="utf-8"?>
<!DOCTYPE html PUBLIC "-//W3C//DTD XHTML 1.1//EN" "http://www.w3.org/TR/xhtml11/DTD/xhtml11.dtd">
<html xmlns="http://www.w3.org/1999/xhtml">
  <head><title>Chapter One</title></head>
  <body>
    <div>
      <h2>Chapter One</h2>
      <p>It was a bright cold day in April&nbsp;and the clocks were striking thirteen.</p>
      <blockquote>Who controls the past controls the future.</blockquote>
      <p>The hallway smelt of boiled cabbage and old rag mats.</p>
    </div>
    <section><p>Outside, even through the shut window-pane, the world looked cold.</p></section>
  </body>
</html>)";

static constexpr auto upload = R"({
  "highlights": [
    {"text": "bright cold day", "start_xpoint": "/body/DocFragment[1]/body/div/p[1]/text().10",
     "end_xpoint": "/body/DocFragment[1]/body/div/p[1]/text().25", "page": 1},
    {"text": "Who controls the past", "start_xpoint": "/body/DocFragment[1]/body/div/blockquote/text().0"},
    {"text": "boiled cabbage", "start_xpoint": "/body/DocFragment[1]/body/div/p[2]/text().22", "note": "smell"},
    {"text": "bright cold day", "start_xpoint": "/body/DocFragment[1]/body/div/p[1]/text().10"},
    {"text": "the world looked cold", "start_xpoint": "/body/DocFragment[1]/body/section/p/text().40"}
  ],
  "sessions": [
    {"start_time": 1700000000, "end_time": 1700000900, "device_id": "kobo",
     "start_xpoint": "/body/DocFragment[1]/body/div/h2/text().0",
     "end_xpoint": "/body/DocFragment[1]/body/div/p[2]/text().30"},
    {"start_time": 1700003000, "end_time": 1700003060, "device_id": "kobo",
     "start_xpoint": "/body/DocFragment[1]/body/section/p/text().0",
     "end_xpoint": "/body/DocFragment[1]/body/section/p/text().50"}
  ]
})";

int main() {
    // =========================================================================
    // 1. Load the chapter and build its index
    // =========================================================================
    std::printf("=== 1. Index the book ===\n");

    auto fragment = xp::parse_fragment(chapter_one, "chapter1.xhtml");
    if (!fragment) {
        std::printf("parse failed: %s\n", fragment.error().message.c_str());
        return 1;
    }
    auto fragments = std::vector<xp::DocumentFragment>{std::move(*fragment)};

    auto registry = xp::IndexRegistry{};
    auto built = registry.build("book-1", fragments);
    if (!built) {
        std::printf("index failed: %s\n", built.error().message.c_str());
        return 1;
    }
    const auto index = *built;
    for (const auto& entry : index->entries()) {
        std::printf("  %3llu  %s\n", static_cast<unsigned long long>(entry.position), entry.path.c_str());
    }

    // =========================================================================
    // 2. Ingest the upload
    // =========================================================================
    std::printf("\n=== 2. Ingest ===\n");

    const auto payload = json::parse(upload);
    const auto highlight_records = payload["highlights"].get<std::vector<xp::HighlightRecord>>();
    const auto session_records = payload["sessions"].get<std::vector<xp::SessionRecord>>();

    const auto highlights = xp::ingest_highlights(highlight_records, {});
    const auto sessions = xp::ingest_sessions(session_records, "book-1", "user-1", {}, index.get());
    std::printf("highlights: %s\n", json(highlights.outcomes).dump().c_str());
    std::printf("sessions:   %s\n", json(sessions.outcomes).dump().c_str());

    auto stored_highlights = std::vector<xp::Highlight>{};
    for (const auto& h : highlights.accepted) {
        stored_highlights.push_back(h.to_highlight("hl-" + std::to_string(h.record_index)));
    }
    auto stored_sessions = std::vector<xp::ReadingSession>{};
    for (const auto& s : sessions.accepted) {
        stored_sessions.push_back(s.to_session("rs-" + std::to_string(s.record_index)));
    }

    // =========================================================================
    // 3. Match, without and with the index
    // =========================================================================
    std::printf("\n=== 3. Match ===\n");

    const auto structural = xp::match_sessions(stored_sessions, stored_highlights);
    std::printf("without index:\n%s\n", json(structural).dump(2).c_str());

    const auto indexed = xp::match_sessions(stored_sessions, stored_highlights, index.get());
    std::printf("with index:\n%s\n", json(indexed).dump(2).c_str());

    // =========================================================================
    // 4. Backfill positions
    // =========================================================================
    std::printf("\n=== 4. Backfill ===\n");

    const auto toc = json::parse(R"([
        {"id": "chapter-one", "start_xpoint": "/body/DocFragment[1]/body/div"},
        {"id": "interlude", "start_xpoint": "/body/DocFragment[1]/body/section"}
    ])").get<std::vector<xp::ChapterBoundary>>();
    const auto chapters = xp::link_chapter_ends(toc);

    const auto backfill = xp::backfill_positions(*index, stored_highlights, stored_sessions, chapters);
    std::printf("%s\n", json(backfill).dump(2).c_str());

    return 0;
}
