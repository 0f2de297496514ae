// index_book — build a position index from XHTML spine files
//
// Usage: index_book [--config config.json] <book-id> <snapshot.xpix> <fragment.xhtml>...
//
// Fragments are given in spine order. The index is written as a binary
// snapshot, then reloaded and checked before a JSON summary is printed.

#include <xpoint-cpp/xpoint.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace xp = xpoint_cpp;
using json = nlohmann::json;

static auto read_file(const std::string& path) -> std::optional<std::string> {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) return std::nullopt;
    auto buffer = std::ostringstream{};
    buffer << in.rdbuf();
    return buffer.str();
}

static auto write_file(const std::string& path, const std::vector<std::byte>& data) -> bool {
    auto out = std::ofstream{path, std::ios::binary};
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(out);
}

static void usage() {
    std::fprintf(stderr,
                 "usage: index_book [--config config.json] <book-id> <snapshot.xpix> <fragment.xhtml>...\n");
}

int main(int argc, char** argv) {
    auto args = std::vector<std::string>(argv + 1, argv + argc);

    auto config = xp::Config{};
    if (args.size() >= 2 && args[0] == "--config") {
        auto loaded = xp::load_config_file(args[1]);
        if (!loaded) {
            std::fprintf(stderr, "%s\n", loaded.error().message.c_str());
            return 2;
        }
        config = *loaded;
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.size() < 3) {
        usage();
        return 2;
    }
    xp::apply_config(config);

    const auto& book_id = args[0];
    const auto& snapshot_path = args[1];

    auto fragments = std::vector<xp::DocumentFragment>{};
    for (std::size_t i = 2; i < args.size(); ++i) {
        auto markup = read_file(args[i]);
        if (!markup) {
            std::fprintf(stderr, "cannot read %s\n", args[i].c_str());
            return 1;
        }
        auto fragment = xp::parse_fragment(*markup, args[i], {.max_depth = config.max_document_depth});
        if (!fragment) {
            std::fprintf(stderr, "%s\n", fragment.error().message.c_str());
            return 1;
        }
        fragments.push_back(std::move(*fragment));
    }

    auto index = xp::build_position_index(book_id, fragments);
    if (!index) {
        std::fprintf(stderr, "%s\n", index.error().message.c_str());
        return 1;
    }

    const auto snapshot = index->save(config.snapshot_deflate_threshold);
    if (!write_file(snapshot_path, snapshot)) {
        std::fprintf(stderr, "cannot write %s\n", snapshot_path.c_str());
        return 1;
    }

    auto reloaded = xp::PositionIndex::load(snapshot);
    if (!reloaded || *reloaded != *index) {
        std::fprintf(stderr, "snapshot %s did not reload cleanly\n", snapshot_path.c_str());
        return 1;
    }

    auto per_fragment = json::array();
    for (std::uint32_t f = 1; f <= index->fragment_count(); ++f) {
        const auto count = std::count_if(index->entries().begin(), index->entries().end(),
                                         [f](const xp::IndexEntry& e) { return e.fragment_index == f; });
        per_fragment.push_back({{"fragment", f}, {"id", fragments[f - 1].id}, {"elements", count}});
    }

    const auto summary = json{
        {"book_id", index->book_id()},
        {"elements", index->size()},
        {"snapshot_bytes", snapshot.size()},
        {"fragments", std::move(per_fragment)},
    };
    std::printf("%s\n", summary.dump(2).c_str());
    return 0;
}
