/// @file encoding.hpp
/// @brief PositionEncoding (xpoint) value type, parser and serializer.

#pragma once

#include <xpoint-cpp/error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xpoint_cpp {

/// One step of an xpoint path: an element name and its 1-based
/// occurrence among same-named siblings under the parent.
///
/// The index counts only siblings with the same name, so `p[2]` says
/// nothing about how many `div` or `blockquote` siblings precede it.
struct PathStep {
    std::string name;             ///< Element name, e.g. "p".
    std::uint32_t index{1};       ///< Occurrence among same-named siblings.
    bool explicit_index{false};   ///< Whether the source spelled "[index]".

    auto operator==(const PathStep&) const -> bool = default;
};

/// How the text-node selector was spelled in the source string.
enum class TextSelector : std::uint8_t {
    none,     ///< No "/text()" segment.
    bare,     ///< "/text()" without an index.
    indexed,  ///< "/text()[N]".
};

/// A parsed xpoint: a structural address inside an EPUB document.
///
/// Format: `[/body/DocFragment[F]]/step[/step...][/text()[T]][.O]`,
/// for example `/body/DocFragment[12]/body/div/p[88]/text().223`.
///
/// The notation fields (`explicit_index`, `text_selector`, `has_offset`)
/// remember how optional parts were written so that serialize_position()
/// reproduces the parsed string exactly. They do not take part in
/// compare_positions(); use it for semantic comparison. operator== is
/// exact structural equality including notation.
struct PositionEncoding {
    std::optional<std::uint32_t> fragment_index;   ///< 1-based spine index; absent = 1.
    std::vector<PathStep> path;                    ///< Non-empty element path.
    std::uint32_t text_node_index{1};              ///< 1-based text node index.
    std::uint64_t char_offset{0};                  ///< Character offset in the text node.
    TextSelector text_selector{TextSelector::none};
    bool has_offset{false};

    /// Fragment index with the absent-means-first default applied.
    auto effective_fragment() const noexcept -> std::uint32_t {
        return fragment_index.value_or(1);
    }

    auto operator==(const PositionEncoding&) const -> bool = default;
};

/// Build an encoding in the source tool's canonical notation.
///
/// Every step gets an explicit index; the text selector and offset are
/// spelled only when they differ from their defaults. Fails with
/// malformed_encoding if any invariant is violated (empty path or name,
/// zero index, zero fragment or text node index).
auto make_position(std::optional<std::uint32_t> fragment_index,
                   std::vector<PathStep> path,
                   std::uint32_t text_node_index = 1,
                   std::uint64_t char_offset = 0) -> Result<PositionEncoding>;

/// Parse an xpoint string.
/// @return The encoding, or a malformed_encoding error naming the reason.
auto parse_position(std::string_view raw) -> Result<PositionEncoding>;

/// Serialize an encoding back to xpoint text.
/// For any value produced by parse_position() this returns the original string.
auto serialize_position(const PositionEncoding& pos) -> std::string;

/// Render only the element path, with every step's index made explicit,
/// e.g. "/body[1]/div[1]/p[2]". Two encodings addressing the same element
/// produce the same normalized path regardless of notation.
auto normalized_path(const std::vector<PathStep>& path) -> std::string;

}  // namespace xpoint_cpp
