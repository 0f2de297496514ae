#include <xpoint-cpp/position_index.hpp>

#include "log.hpp"
#include "storage/compression.hpp"
#include "storage/leb128.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <string_view>

namespace xpoint_cpp {

namespace {

// Snapshot layout:
//   magic "XPIX" | version (1 byte) | flags (1 byte) | body
// body (raw DEFLATE when flags & deflated):
//   uleb book_id length, book_id bytes
//   uleb fragment_count
//   uleb entry_count
//   per entry: uleb fragment_index, uleb path length, path bytes
// Entry positions are implicit: the i-th entry has position i + 1.
constexpr auto snapshot_magic = std::array{std::byte{'X'}, std::byte{'P'}, std::byte{'I'}, std::byte{'X'}};
constexpr auto snapshot_version = std::byte{1};
constexpr auto flag_deflated = std::byte{0x01};
constexpr std::size_t header_size = snapshot_magic.size() + 2;

auto make_key(std::uint32_t fragment_index, std::string_view path) -> std::string {
    auto key = std::to_string(fragment_index);
    key.append(path);
    return key;
}

// Structural check for a stored path: one or more "/name[n]" steps, each
// name non-empty and free of '/', '[' and ']', each n a decimal >= 1
// without leading zeros. Names are whatever the XML parser accepted, so
// this is deliberately wider than the xpoint name grammar.
auto is_canonical_path(std::string_view path) -> bool {
    if (path.empty()) return false;
    while (!path.empty()) {
        if (path.front() != '/') return false;
        path.remove_prefix(1);

        const auto open = path.find_first_of("/[]");
        if (open == 0 || open == std::string_view::npos || path[open] != '[') return false;
        path.remove_prefix(open + 1);

        const auto close = path.find(']');
        if (close == 0 || close == std::string_view::npos || path.front() == '0') return false;
        for (auto c : path.substr(0, close)) {
            if (c < '0' || c > '9') return false;
        }
        path.remove_prefix(close + 1);
    }
    return true;
}

}  // anonymous namespace

auto PositionIndex::add(std::uint32_t fragment_index, std::string path) -> bool {
    const auto position = static_cast<std::uint64_t>(entries_.size() + 1);
    if (!by_key_.emplace(make_key(fragment_index, path), entries_.size()).second) return false;
    entries_.push_back(IndexEntry{fragment_index, std::move(path), position});
    return true;
}

auto PositionIndex::find(std::uint32_t fragment_index, std::string_view path) const
    -> std::optional<std::uint64_t> {
    auto it = by_key_.find(make_key(fragment_index, path));
    if (it == by_key_.end()) return std::nullopt;
    return entries_[it->second].position;
}

auto PositionIndex::resolve(const PositionEncoding& pos) const -> Result<std::uint64_t> {
    const auto path = normalized_path(pos.path);
    if (auto found = find(pos.effective_fragment(), path)) return *found;
    return Error{ErrorKind::not_indexed,
                 "'" + serialize_position(pos) + "' is not in the index for book '" + book_id_ + "'"};
}

auto PositionIndex::resolve(std::string_view raw) const -> Result<std::uint64_t> {
    auto pos = parse_position(raw);
    if (!pos) return pos.error();
    return resolve(*pos);
}

auto PositionIndex::locate(const PositionEncoding& pos) const -> std::optional<DocumentPosition> {
    auto found = find(pos.effective_fragment(), normalized_path(pos.path));
    if (!found) return std::nullopt;
    return DocumentPosition{*found, pos.char_offset};
}

auto PositionIndex::save(std::size_t deflate_threshold) const -> std::vector<std::byte> {
    auto body = std::vector<std::byte>{};
    storage::encode_string(book_id_, body);
    storage::encode_uleb128(fragment_count_, body);
    storage::encode_uleb128(entries_.size(), body);
    for (const auto& entry : entries_) {
        storage::encode_uleb128(entry.fragment_index, body);
        storage::encode_string(entry.path, body);
    }

    auto flags = std::byte{0};
    if (body.size() > deflate_threshold) {
        if (auto compressed = storage::deflate_compress(body); compressed && compressed->size() < body.size()) {
            body = std::move(*compressed);
            flags |= flag_deflated;
        }
    }

    auto out = std::vector<std::byte>{};
    out.reserve(header_size + body.size());
    out.insert(out.end(), snapshot_magic.begin(), snapshot_magic.end());
    out.push_back(snapshot_version);
    out.push_back(flags);
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

auto PositionIndex::load(std::span<const std::byte> data) -> std::optional<PositionIndex> {
    if (data.size() < header_size) return std::nullopt;
    if (!std::equal(snapshot_magic.begin(), snapshot_magic.end(), data.begin())) return std::nullopt;
    if (data[4] != snapshot_version) return std::nullopt;

    const auto flags = data[5];
    if ((flags & ~flag_deflated) != std::byte{0}) return std::nullopt;

    auto body = data.subspan(header_size);
    if ((flags & flag_deflated) != std::byte{0}) {
        auto inflated = storage::deflate_decompress(body);
        if (!inflated) return std::nullopt;
        return parse_body(*inflated);
    }
    return parse_body(body);
}

auto PositionIndex::parse_body(std::span<const std::byte> body) -> std::optional<PositionIndex> {
    auto reader = storage::ByteReader{body};

    auto book_id = reader.read_string();
    auto fragment_count = reader.read_uleb();
    auto entry_count = reader.read_uleb();
    if (!book_id || !fragment_count || !entry_count) return std::nullopt;
    if (*fragment_count == 0 || *fragment_count > std::numeric_limits<std::uint32_t>::max()) return std::nullopt;
    // Every entry takes at least three bytes; reject counts the body cannot hold.
    if (*entry_count > reader.remaining() / 3) return std::nullopt;

    auto index = PositionIndex{};
    index.book_id_ = std::move(*book_id);
    index.fragment_count_ = static_cast<std::uint32_t>(*fragment_count);
    index.entries_.reserve(static_cast<std::size_t>(*entry_count));

    auto previous_fragment = std::uint64_t{1};
    for (std::uint64_t i = 0; i < *entry_count; ++i) {
        auto fragment = reader.read_uleb();
        auto path = reader.read_string();
        if (!fragment || !path) return std::nullopt;
        if (*fragment < previous_fragment || *fragment > *fragment_count) return std::nullopt;
        previous_fragment = *fragment;

        if (!is_canonical_path(*path)) return std::nullopt;
        if (!index.add(static_cast<std::uint32_t>(*fragment), std::move(*path))) return std::nullopt;
    }
    if (!reader.at_end()) return std::nullopt;
    return index;
}

auto build_position_index(std::string book_id,
                          std::span<const DocumentFragment> fragments,
                          std::stop_token stop) -> Result<PositionIndex> {
    if (fragments.empty()) {
        return Error{ErrorKind::index_build_failed, "book '" + book_id + "' has no document fragments"};
    }

    auto index = PositionIndex{};
    index.book_id_ = std::move(book_id);

    auto walked = walk_document(fragments, [&](const WalkedElement& element) {
        index.add(element.fragment_index, normalized_path(element.path));
    }, stop);

    if (!walked) {
        return Error{ErrorKind::index_build_failed,
                     "book '" + index.book_id_ + "': " + walked.error().message};
    }

    index.fragment_count_ = static_cast<std::uint32_t>(fragments.size());
    detail::logger().info("indexed book '{}': {} elements in {} fragments",
                          index.book_id_, index.size(), index.fragment_count_);
    return index;
}

}  // namespace xpoint_cpp
