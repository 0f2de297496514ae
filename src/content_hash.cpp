#include <xpoint-cpp/content_hash.hpp>

#include "crypto/sha256.hpp"

#include <string>

namespace xpoint_cpp {

namespace {

auto hex_nibble(char c) -> std::optional<std::uint8_t> {
    if (c >= '0' && c <= '9') return static_cast<std::uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<std::uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<std::uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

template <typename Parts>
auto hash_parts(const Parts& parts) -> Result<ContentHash> {
    auto total = std::size_t{0};
    for (const auto& part : parts) total += part.size();
    if (total == 0) {
        return Error{ErrorKind::empty_content,
                     parts.size() == 0 ? "no content parts to hash" : "all content parts are empty"};
    }

    auto hasher = crypto::Sha256{};
    for (const auto& part : parts) {
        hasher.update(std::to_string(part.size()));
        hasher.update(":");
        hasher.update(std::string_view{part});
    }
    return ContentHash{hasher.finish()};
}

}  // anonymous namespace

auto ContentHash::to_hex() const -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto out = std::string{};
    out.reserve(size * 2);
    for (auto b : bytes) {
        auto v = static_cast<std::uint8_t>(b);
        out.push_back(hex_chars[v >> 4]);
        out.push_back(hex_chars[v & 0x0F]);
    }
    return out;
}

auto ContentHash::from_hex(std::string_view hex) -> std::optional<ContentHash> {
    if (hex.size() != size * 2) return std::nullopt;
    auto result = ContentHash{};
    for (std::size_t i = 0; i < size; ++i) {
        auto hi = hex_nibble(hex[i * 2]);
        auto lo = hex_nibble(hex[i * 2 + 1]);
        if (!hi || !lo) return std::nullopt;
        result.bytes[i] = static_cast<std::byte>((*hi << 4) | *lo);
    }
    return result;
}

auto hash_content(std::span<const std::string> parts) -> Result<ContentHash> {
    return hash_parts(parts);
}

auto hash_content(std::initializer_list<std::string_view> parts) -> Result<ContentHash> {
    return hash_parts(parts);
}

auto compute_from_text(std::string_view text) -> Result<ContentHash> {
    return hash_content({text});
}

auto deduplicate_batch(const std::vector<std::vector<std::string>>& item_parts,
                       const std::unordered_set<ContentHash>& existing) -> BatchReport {
    auto report = BatchReport{};
    report.items.reserve(item_parts.size());
    auto seen_in_batch = std::unordered_set<ContentHash>{};

    for (std::size_t i = 0; i < item_parts.size(); ++i) {
        auto outcome = BatchItemOutcome{};
        outcome.index = i;

        auto hash = hash_content(item_parts[i]);
        if (!hash) {
            outcome.status = ItemStatus::rejected;
            outcome.error = hash.error();
        } else {
            outcome.hash = *hash;
            const bool repeat = existing.contains(*hash) || !seen_in_batch.insert(*hash).second;
            outcome.status = repeat ? ItemStatus::duplicate : ItemStatus::unique;
        }
        report.items.push_back(std::move(outcome));
    }
    return report;
}

}  // namespace xpoint_cpp
