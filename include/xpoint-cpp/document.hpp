/// @file document.hpp
/// @brief Document fragment trees and the document-order walker.

#pragma once

#include <xpoint-cpp/encoding.hpp>
#include <xpoint-cpp/error.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xpoint_cpp {

/// An element in a parsed document fragment. Only elements take part in
/// addressing, so text, comments and attributes are not kept.
struct DocumentNode {
    std::string name;                    ///< Element name, lower case for loaded markup.
    std::vector<DocumentNode> children;  ///< Child elements in document order.

    auto operator==(const DocumentNode&) const -> bool = default;
};

/// Convenience constructor for building trees by hand.
/// @code
/// auto body = element("body", {element("h2"), element("p"), element("p")});
/// @endcode
inline auto element(std::string name, std::vector<DocumentNode> children = {}) -> DocumentNode {
    return DocumentNode{std::move(name), std::move(children)};
}

/// One ordered unit of document content, e.g. one EPUB spine item.
///
/// A root named "html" is the addressing context rather than an addressed
/// element: reader xpoints start at "/body", so paths are taken from the
/// root's children. Any other root is addressed as the first path step.
struct DocumentFragment {
    std::string id;     ///< Caller's identifier (spine idref or href).
    DocumentNode root;  ///< Document element; an empty name means no content.

    auto operator==(const DocumentFragment&) const -> bool = default;
};

/// Options for parse_fragment().
struct ParseOptions {
    std::size_t max_depth{256};  ///< Deeper nesting is rejected.
};

/// Parse XHTML/XML markup into a fragment tree with Expat.
///
/// Element names are lower-cased. Undefined entities such as `&nbsp;` are
/// skipped rather than rejected.
/// @return The fragment, or invalid_document on malformed or too-deep markup.
auto parse_fragment(std::string_view markup, std::string id = {},
                    const ParseOptions& options = {}) -> Result<DocumentFragment>;

/// An element as seen by the walker.
struct WalkedElement {
    std::uint32_t fragment_index;        ///< 1-based position of the fragment in the walk.
    const std::vector<PathStep>& path;   ///< Address of the element, explicit indices.
    const DocumentNode& node;            ///< The element itself.
};

/// Visit every addressable element of the fragments in document order.
///
/// Fragments are visited in the given order (their 1-based position is
/// the DocFragment index). Within a fragment the walk is pre-order: a
/// parent before its children, children in order. Each step's index
/// counts preceding siblings with the same name.
/// @param stop Checked periodically; a stop request aborts the walk.
/// @return Number of elements visited, or an error for a fragment
///   without a root element or a cancelled walk.
auto walk_document(std::span<const DocumentFragment> fragments,
                   const std::function<void(const WalkedElement&)>& visit,
                   std::stop_token stop = {}) -> Result<std::size_t>;

}  // namespace xpoint_cpp
