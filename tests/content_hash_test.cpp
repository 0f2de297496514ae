#include <xpoint-cpp/content_hash.hpp>

#include <gtest/gtest.h>

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

using namespace xpoint_cpp;

namespace {

auto hash_of(std::initializer_list<std::string_view> parts) -> ContentHash {
    auto h = hash_content(parts);
    EXPECT_TRUE(h.has_value());
    return h.value_or(ContentHash{});
}

}  // namespace

// =============================================================================
// hash_content
// =============================================================================

TEST(HashContent, pinned_digests) {
    EXPECT_EQ(hash_of({"a", "b"}).to_hex(),
              "facdde7abf1eac5b301273ab2e282f79bab0100f058833a7b8bdf9f80741e149");
    EXPECT_EQ(hash_of({"ab"}).to_hex(),
              "d1ab1a7fbf5a9552f2d01c956d30855b34ed7335751d363bd6d45a01777c0811");
    EXPECT_EQ(hash_of({"ab", "c"}).to_hex(),
              "430fb1b4ac43316eca81fab27a1930ab8eff8fef6a1dc7903dce44bbc2790dc5");
    EXPECT_EQ(hash_of({"a", "bc"}).to_hex(),
              "5310a58788781ab25d5ad7c3f85035824b4eb7bdfa394e0ac2186271472b5492");
}

TEST(HashContent, part_boundaries_are_significant) {
    EXPECT_NE(hash_of({"ab", "c"}), hash_of({"a", "bc"}));
    EXPECT_NE(hash_of({"ab"}), hash_of({"a", "b"}));
}

TEST(HashContent, part_order_is_significant) {
    EXPECT_NE(hash_of({"x", "y"}), hash_of({"y", "x"}));
}

TEST(HashContent, deterministic) {
    EXPECT_EQ(hash_of({"book-1", "user-1", "1700000000"}), hash_of({"book-1", "user-1", "1700000000"}));
}

TEST(HashContent, some_empty_parts_are_allowed) {
    auto h = hash_content({"", "x"});
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->to_hex(), "6d6d0ffa8fe1fcf741ef439fdeb5af86467a300a86dfadd184a96775d57d78c3");
}

TEST(HashContent, rejects_no_parts_or_all_empty) {
    auto none = hash_content(std::span<const std::string>{});
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().kind, ErrorKind::empty_content);

    auto empty = hash_content({"", ""});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().kind, ErrorKind::empty_content);
}

TEST(HashContent, span_and_list_overloads_agree) {
    const auto parts = std::vector<std::string>{"chapter", "7"};
    auto from_span = hash_content(parts);
    ASSERT_TRUE(from_span.has_value());
    EXPECT_EQ(*from_span, hash_of({"chapter", "7"}));
}

TEST(ComputeFromText, matches_single_part_hash) {
    auto h = compute_from_text("The quick brown fox");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->to_hex(), "7a0ed9ed603c092f20304ba26b063e0f2d15972252a634f49971caeb9448cd73");
    EXPECT_EQ(*h, hash_of({"The quick brown fox"}));
}

TEST(ComputeFromText, rejects_empty_text) {
    auto h = compute_from_text("");
    ASSERT_FALSE(h.has_value());
    EXPECT_EQ(h.error().kind, ErrorKind::empty_content);
}

// =============================================================================
// ContentHash
// =============================================================================

TEST(ContentHash, hex_round_trip_either_case) {
    const auto h = hash_of({"ab"});
    auto lower = ContentHash::from_hex(h.to_hex());
    ASSERT_TRUE(lower.has_value());
    EXPECT_EQ(*lower, h);

    auto upper = ContentHash::from_hex("D1AB1A7FBF5A9552F2D01C956D30855B34ED7335751D363BD6D45A01777C0811");
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(*upper, h);
}

TEST(ContentHash, from_hex_rejects_bad_input) {
    EXPECT_FALSE(ContentHash::from_hex("").has_value());
    EXPECT_FALSE(ContentHash::from_hex("abc").has_value());
    EXPECT_FALSE(ContentHash::from_hex(std::string(64, 'g')).has_value());
    EXPECT_FALSE(ContentHash::from_hex(std::string(66, 'a')).has_value());
}

TEST(ContentHash, usable_as_set_key) {
    auto set = std::unordered_set<ContentHash>{hash_of({"a"}), hash_of({"b"}), hash_of({"a"})};
    EXPECT_EQ(set.size(), 2u);
}

// =============================================================================
// partition_duplicates
// =============================================================================

TEST(PartitionDuplicates, first_occurrence_wins) {
    auto candidates = std::vector<std::pair<std::string, ContentHash>>{
        {"h1", hash_of({"alpha"})},
        {"h2", hash_of({"beta"})},
        {"h3", hash_of({"alpha"})},
        {"h4", hash_of({"gamma"})},
    };
    auto result = partition_duplicates(candidates, {});

    EXPECT_EQ(result.unique, (std::vector<std::string>{"h1", "h2", "h4"}));
    EXPECT_EQ(result.duplicates, (std::vector<std::string>{"h3"}));
}

TEST(PartitionDuplicates, existing_hashes_are_duplicates) {
    auto candidates = std::vector<std::pair<int, ContentHash>>{
        {1, hash_of({"stored"})},
        {2, hash_of({"fresh"})},
    };
    auto existing = std::unordered_set<ContentHash>{hash_of({"stored"})};
    auto result = partition_duplicates(candidates, existing);

    EXPECT_EQ(result.unique, (std::vector<int>{2}));
    EXPECT_EQ(result.duplicates, (std::vector<int>{1}));
}

TEST(PartitionDuplicates, idempotent_after_storing_uniques) {
    auto candidates = std::vector<std::pair<int, ContentHash>>{
        {1, hash_of({"a"})}, {2, hash_of({"b"})}, {3, hash_of({"a"})},
    };
    auto first = partition_duplicates(candidates, {});

    auto stored = std::unordered_set<ContentHash>{};
    for (const auto& [id, h] : candidates) {
        if (std::ranges::find(first.unique, id) != first.unique.end()) stored.insert(h);
    }
    auto second = partition_duplicates(candidates, stored);

    EXPECT_TRUE(second.unique.empty());
    EXPECT_EQ(second.duplicates.size(), candidates.size());
}

TEST(PartitionDuplicates, empty_batch) {
    auto result = partition_duplicates(std::vector<std::pair<int, ContentHash>>{}, {});
    EXPECT_TRUE(result.unique.empty());
    EXPECT_TRUE(result.duplicates.empty());
}

// =============================================================================
// find_duplicate_pairs
// =============================================================================

TEST(FindDuplicatePairs, pairs_neighbours_within_each_group) {
    auto items = std::vector<std::pair<int, ContentHash>>{
        {10, hash_of({"x"})},
        {11, hash_of({"y"})},
        {12, hash_of({"x"})},
        {13, hash_of({"x"})},
        {14, hash_of({"y"})},
        {15, hash_of({"z"})},
    };
    auto pairs = find_duplicate_pairs(items);

    auto expected = std::vector<std::pair<int, int>>{{10, 12}, {12, 13}, {11, 14}};
    EXPECT_EQ(pairs, expected);
}

TEST(FindDuplicatePairs, no_duplicates_no_pairs) {
    auto items = std::vector<std::pair<int, ContentHash>>{{1, hash_of({"x"})}, {2, hash_of({"y"})}};
    EXPECT_TRUE(find_duplicate_pairs(items).empty());
}

// =============================================================================
// deduplicate_batch
// =============================================================================

TEST(DeduplicateBatch, reports_every_item) {
    auto batch = std::vector<std::vector<std::string>>{
        {"first highlight"},
        {""},
        {"second highlight"},
        {"first highlight"},
        {"already stored"},
    };
    auto existing = std::unordered_set<ContentHash>{hash_of({"already stored"})};
    auto report = deduplicate_batch(batch, existing);

    ASSERT_EQ(report.items.size(), 5u);
    EXPECT_EQ(report.items[0].status, ItemStatus::unique);
    EXPECT_EQ(report.items[1].status, ItemStatus::rejected);
    ASSERT_TRUE(report.items[1].error.has_value());
    EXPECT_EQ(report.items[1].error->kind, ErrorKind::empty_content);
    EXPECT_FALSE(report.items[1].hash.has_value());
    EXPECT_EQ(report.items[2].status, ItemStatus::unique);
    EXPECT_EQ(report.items[3].status, ItemStatus::duplicate);
    EXPECT_EQ(report.items[3].hash, report.items[0].hash);
    EXPECT_EQ(report.items[4].status, ItemStatus::duplicate);

    for (std::size_t i = 0; i < report.items.size(); ++i) EXPECT_EQ(report.items[i].index, i);

    EXPECT_EQ(report.count(ItemStatus::unique), 2u);
    EXPECT_EQ(report.count(ItemStatus::duplicate), 2u);
    EXPECT_EQ(report.count(ItemStatus::rejected), 1u);
}
