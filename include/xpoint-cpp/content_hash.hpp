/// @file content_hash.hpp
/// @brief Content hashes and batch deduplication for annotation ingestion.

#pragma once

#include <xpoint-cpp/error.hpp>

#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace xpoint_cpp {

/// A 32-byte SHA-256 digest of an annotation's semantic content.
///
/// Two annotations with the same hash are the same annotation uploaded
/// twice. The hex form (64 lowercase characters) is what callers store.
struct ContentHash {
    static constexpr std::size_t size = 32;  ///< Fixed size in bytes.
    std::array<std::byte, size> bytes{};     ///< Raw digest bytes.

    constexpr ContentHash() = default;

    /// Construct from a digest.
    explicit constexpr ContentHash(std::array<std::byte, size> b) : bytes{b} {}

    /// Lowercase hex rendering of the digest.
    auto to_hex() const -> std::string;

    /// Parse a 64-character hex string (either case).
    /// @return The hash, or nullopt if the string is not valid hex of the right length.
    static auto from_hex(std::string_view hex) -> std::optional<ContentHash>;

    auto operator<=>(const ContentHash&) const = default;
    auto operator==(const ContentHash&) const -> bool = default;
};

}  // namespace xpoint_cpp

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<xpoint_cpp::ContentHash> {
    auto operator()(const xpoint_cpp::ContentHash& h) const noexcept -> std::size_t {
        // The leading digest bytes are already uniformly distributed
        auto result = std::size_t{0};
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            result = (result << 8) | static_cast<std::size_t>(h.bytes[i]);
        }
        return result;
    }
};

/// @endcond

namespace xpoint_cpp {

/// Hash an ordered sequence of content parts.
///
/// Each part is framed as `<byte length>:<bytes>` before hashing, so
/// ("ab", "c") and ("a", "bc") never collide, and neither does ("ab")
/// with ("a", "b"). Part order is significant; callers fix a canonical
/// field order per annotation kind.
/// @return The hash, or empty_content if there are no parts or all are empty.
auto hash_content(std::span<const std::string> parts) -> Result<ContentHash>;

/// @copydoc hash_content(std::span<const std::string>)
auto hash_content(std::initializer_list<std::string_view> parts) -> Result<ContentHash>;

/// Hash a single text field; identical to hash_content({text}).
auto compute_from_text(std::string_view text) -> Result<ContentHash>;

/// Items split into first occurrences and repeats.
template <typename T>
struct Partition {
    std::vector<T> unique;      ///< First occurrence of each new hash, in input order.
    std::vector<T> duplicates;  ///< Items whose hash was already known or seen.
};

/// Separate candidates into unique items and duplicates.
///
/// A candidate is a duplicate if its hash is in `existing` or appeared
/// earlier in the same batch. Processing follows input order, so the
/// first occurrence of a repeated hash is the one kept.
template <typename T>
auto partition_duplicates(std::vector<std::pair<T, ContentHash>> candidates,
                          const std::unordered_set<ContentHash>& existing) -> Partition<T> {
    auto result = Partition<T>{};
    auto seen_in_batch = std::unordered_set<ContentHash>{};
    seen_in_batch.reserve(candidates.size());

    for (auto& [item, hash] : candidates) {
        if (existing.contains(hash) || !seen_in_batch.insert(hash).second) {
            result.duplicates.push_back(std::move(item));
        } else {
            result.unique.push_back(std::move(item));
        }
    }
    return result;
}

/// Find repeated items within one collection, for cleanup of stored data.
///
/// Items are grouped by hash; each group of n items yields n-1 pairs of
/// neighbours in input order. Groups appear in order of first occurrence.
template <typename T>
auto find_duplicate_pairs(const std::vector<std::pair<T, ContentHash>>& items)
    -> std::vector<std::pair<T, T>> {
    auto group_of = std::unordered_map<ContentHash, std::size_t>{};
    auto groups = std::vector<std::vector<std::size_t>>{};

    for (std::size_t i = 0; i < items.size(); ++i) {
        auto [it, inserted] = group_of.try_emplace(items[i].second, groups.size());
        if (inserted) groups.emplace_back();
        groups[it->second].push_back(i);
    }

    auto pairs = std::vector<std::pair<T, T>>{};
    for (const auto& group : groups) {
        for (std::size_t j = 1; j < group.size(); ++j) {
            pairs.emplace_back(items[group[j - 1]].first, items[group[j]].first);
        }
    }
    return pairs;
}

/// Outcome of one item in a deduplicated batch.
enum class ItemStatus : std::uint8_t {
    unique,     ///< New content; the caller should store it.
    duplicate,  ///< Already stored, or repeated earlier in the batch.
    rejected,   ///< Could not be hashed; see the error.
};

/// Convert an ItemStatus to its string representation.
constexpr auto to_string_view(ItemStatus status) noexcept -> std::string_view {
    switch (status) {
        case ItemStatus::unique:    return "unique";
        case ItemStatus::duplicate: return "duplicate";
        case ItemStatus::rejected:  return "rejected";
    }
    return "unknown";
}

/// Per-item result of deduplicate_batch().
struct BatchItemOutcome {
    std::size_t index{0};              ///< Position in the input batch.
    ItemStatus status{ItemStatus::unique};
    std::optional<ContentHash> hash;   ///< Set unless rejected.
    std::optional<Error> error;        ///< Set only when rejected.

    auto operator==(const BatchItemOutcome&) const -> bool = default;
};

/// Per-item outcomes for a whole batch, in input order.
struct BatchReport {
    std::vector<BatchItemOutcome> items;

    /// Number of items with the given status.
    auto count(ItemStatus status) const -> std::size_t {
        return static_cast<std::size_t>(std::ranges::count_if(items,
            [status](const BatchItemOutcome& o) { return o.status == status; }));
    }
};

/// Hash and deduplicate a batch of items given as content parts.
///
/// Items that cannot be hashed are reported as rejected; the rest of the
/// batch is processed normally.
auto deduplicate_batch(const std::vector<std::vector<std::string>>& item_parts,
                       const std::unordered_set<ContentHash>& existing) -> BatchReport;

}  // namespace xpoint_cpp
