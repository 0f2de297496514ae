/// @file position_index.hpp
/// @brief Total document-order index over the elements of one book.

#pragma once

#include <xpoint-cpp/document.hpp>
#include <xpoint-cpp/encoding.hpp>
#include <xpoint-cpp/error.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace xpoint_cpp {

/// A totally ordered point in a book: the element's document-order index
/// and the character offset within it.
struct DocumentPosition {
    std::uint64_t index{0};        ///< Document-order index of the element.
    std::uint64_t char_offset{0};  ///< Character offset carried over from the encoding.

    auto operator<=>(const DocumentPosition&) const = default;
};

/// One indexed element.
struct IndexEntry {
    std::uint32_t fragment_index{1};  ///< 1-based DocFragment index.
    std::string path;                 ///< Normalized element path, e.g. "/body[1]/p[2]".
    std::uint64_t position{0};        ///< Document-order index.

    auto operator==(const IndexEntry&) const -> bool = default;
};

class PositionIndex;

/// Walk a book's fragments and assign every element its document-order
/// index. Indices start at 1 and increase by one per element.
/// @param stop A stop request abandons the build.
/// @return The index, or index_build_failed if there are no fragments,
///   a fragment is invalid, or the build was cancelled.
auto build_position_index(std::string book_id,
                          std::span<const DocumentFragment> fragments,
                          std::stop_token stop = {}) -> Result<PositionIndex>;

/// Map from element addresses to their document-order index.
///
/// Built by walking a book's fragments once (see build_position_index()).
/// Lookups ignore notation: `/body/p`, `/body[1]/p[1]` and
/// `/body/DocFragment[1]/body/p` resolve to the same entry. An index is
/// immutable once built, so a shared snapshot can be read concurrently.
class PositionIndex {
public:
    PositionIndex() = default;

    /// Book the index was built for.
    auto book_id() const -> const std::string& { return book_id_; }

    /// Number of fragments walked.
    auto fragment_count() const -> std::uint32_t { return fragment_count_; }

    /// Number of indexed elements.
    auto size() const -> std::size_t { return entries_.size(); }

    /// All entries in document order.
    auto entries() const -> const std::vector<IndexEntry>& { return entries_; }

    /// Document-order index of the element an encoding addresses.
    /// Text node and offset do not affect the result.
    /// @return The index, or not_indexed if the element is unknown.
    auto resolve(const PositionEncoding& pos) const -> Result<std::uint64_t>;

    /// Parse and resolve in one step.
    /// @return The index, malformed_encoding, or not_indexed.
    auto resolve(std::string_view raw) const -> Result<std::uint64_t>;

    /// Resolve to a totally ordered (index, char_offset) pair.
    /// @return The position, or nullopt if the element is unknown.
    auto locate(const PositionEncoding& pos) const -> std::optional<DocumentPosition>;

    /// Serialize to a compact binary snapshot.
    /// @param deflate_threshold Bodies larger than this are DEFLATE-compressed.
    auto save(std::size_t deflate_threshold = 256) const -> std::vector<std::byte>;

    /// Restore an index from a snapshot produced by save().
    /// @return The index, or nullopt on any corruption.
    static auto load(std::span<const std::byte> data) -> std::optional<PositionIndex>;

    auto operator==(const PositionIndex& other) const -> bool {
        return book_id_ == other.book_id_ && fragment_count_ == other.fragment_count_ &&
               entries_ == other.entries_;
    }

private:
    friend auto build_position_index(std::string book_id,
                                     std::span<const DocumentFragment> fragments,
                                     std::stop_token stop) -> Result<PositionIndex>;

    static auto parse_body(std::span<const std::byte> body) -> std::optional<PositionIndex>;

    // False if the element is already indexed.
    auto add(std::uint32_t fragment_index, std::string path) -> bool;
    auto find(std::uint32_t fragment_index, std::string_view path) const -> std::optional<std::uint64_t>;

    std::string book_id_;
    std::uint32_t fragment_count_{0};
    std::vector<IndexEntry> entries_;
    std::unordered_map<std::string, std::size_t> by_key_;  // "<fragment><path>" -> entry
};

/// Free-function form of PositionIndex::resolve.
inline auto resolve_position(const PositionIndex& index, const PositionEncoding& pos)
    -> Result<std::uint64_t> {
    return index.resolve(pos);
}

}  // namespace xpoint_cpp
