// xpoint-cpp benchmarks — measures throughput of core operations.

#include <xpoint-cpp/xpoint.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace xpoint_cpp;

// A spine of `chapters` fragments, each a body of `paragraphs` paragraphs
// with a span inside every third one.
static auto make_book(std::size_t chapters, std::size_t paragraphs) -> std::vector<DocumentFragment> {
    set_log_level(LogLevel::warn);  // index builds log at info
    auto fragments = std::vector<DocumentFragment>{};
    for (std::size_t c = 0; c < chapters; ++c) {
        auto body = std::vector<DocumentNode>{};
        for (std::size_t p = 0; p < paragraphs; ++p) {
            body.push_back(p % 3 == 0 ? element("p", {element("span")}) : element("p"));
        }
        fragments.push_back({"ch" + std::to_string(c + 1) + ".xhtml",
                             element("html", {element("body", std::move(body))})});
    }
    return fragments;
}

static auto xpoint(std::size_t chapter, std::size_t paragraph, std::size_t offset) -> std::string {
    return "/body/DocFragment[" + std::to_string(chapter) + "]/body/p[" + std::to_string(paragraph) +
           "]/text()." + std::to_string(offset);
}

// =============================================================================
// Encodings
// =============================================================================

static void bm_parse_position(benchmark::State& state) {
    const auto raw = std::string{"/body/DocFragment[12]/body/div[3]/section[2]/p[41]/text()[2].187"};
    for (auto _ : state) {
        benchmark::DoNotOptimize(parse_position(raw));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_position);

static void bm_compare_positions(benchmark::State& state) {
    const auto a = *parse_position(xpoint(4, 120, 10));
    const auto b = *parse_position(xpoint(4, 121, 3));
    for (auto _ : state) {
        benchmark::DoNotOptimize(compare_positions(a, b));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_compare_positions);

static void bm_hash_content(benchmark::State& state) {
    const auto text = std::string(static_cast<std::size_t>(state.range(0)), 'x');
    for (auto _ : state) {
        benchmark::DoNotOptimize(compute_from_text(text));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_hash_content)->Range(16, 16384);

// =============================================================================
// Index
// =============================================================================

static void bm_build_index(benchmark::State& state) {
    const auto book = make_book(static_cast<std::size_t>(state.range(0)), 200);
    for (auto _ : state) {
        benchmark::DoNotOptimize(build_position_index("book", book));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0) * 268);
}
BENCHMARK(bm_build_index)->Range(1, 64);

static void bm_resolve(benchmark::State& state) {
    const auto index = *build_position_index("book", make_book(32, 200));
    const auto pos = *parse_position(xpoint(17, 150, 4));
    for (auto _ : state) {
        benchmark::DoNotOptimize(index.locate(pos));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_resolve);

static void bm_snapshot_save_load(benchmark::State& state) {
    const auto index = *build_position_index("book", make_book(32, 200));
    for (auto _ : state) {
        auto bytes = index.save();
        benchmark::DoNotOptimize(PositionIndex::load(bytes));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_snapshot_save_load);

// =============================================================================
// Matching
// =============================================================================

static void bm_match_sessions(benchmark::State& state) {
    const auto chapters = std::size_t{16};
    const auto index = *build_position_index("book", make_book(chapters, 200));

    auto highlights = std::vector<Highlight>{};
    for (std::size_t i = 0; i < 2000; ++i) {
        highlights.push_back({"h" + std::to_string(i),
                              *parse_position(xpoint(i % chapters + 1, i % 200 + 1, i % 50)),
                              std::nullopt});
    }
    auto sessions = std::vector<ReadingSession>{};
    for (std::size_t i = 0; i < static_cast<std::size_t>(state.range(0)); ++i) {
        const auto chapter = i % chapters + 1;
        sessions.push_back({"s" + std::to_string(i),
                            *PositionRange::parse(xpoint(chapter, 1, 0), xpoint(chapter, 100, 0)),
                            std::nullopt, std::nullopt});
    }

    const auto* indexed = state.range(1) ? &index : nullptr;
    for (auto _ : state) {
        benchmark::DoNotOptimize(match_sessions(sessions, highlights, indexed));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0) * 2000);
}
BENCHMARK(bm_match_sessions)->Args({8, 0})->Args({8, 1})->Args({64, 0})->Args({64, 1});
