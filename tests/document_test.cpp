#include <xpoint-cpp/document.hpp>

#include <gtest/gtest.h>

#include <stop_token>
#include <string>
#include <vector>

using namespace xpoint_cpp;

namespace {

struct Visit {
    std::uint32_t fragment;
    std::string path;
};

auto collect(const std::vector<DocumentFragment>& fragments) -> std::vector<Visit> {
    auto visits = std::vector<Visit>{};
    auto walked = walk_document(fragments, [&](const WalkedElement& e) {
        visits.push_back({e.fragment_index, normalized_path(e.path)});
    });
    EXPECT_TRUE(walked.has_value());
    if (walked) EXPECT_EQ(*walked, visits.size());
    return visits;
}

auto paths_of(const std::vector<Visit>& visits) -> std::vector<std::string> {
    auto out = std::vector<std::string>{};
    for (const auto& v : visits) out.push_back(v.path);
    return out;
}

}  // namespace

// =============================================================================
// parse_fragment
// =============================================================================

TEST(ParseFragment, builds_element_tree) {
    auto fragment = parse_fragment(
        "<html xmlns=\"http://www.w3.org/1999/xhtml\"><head><title>Ch 1</title></head>"
        "<body><h2>One</h2><p>First <em>para</em></p><p>Second</p></body></html>",
        "ch01.xhtml");
    ASSERT_TRUE(fragment.has_value()) << fragment.error().message;

    EXPECT_EQ(fragment->id, "ch01.xhtml");
    const auto& root = fragment->root;
    EXPECT_EQ(root.name, "html");
    ASSERT_EQ(root.children.size(), 2u);
    EXPECT_EQ(root.children[0].name, "head");
    const auto& body = root.children[1];
    EXPECT_EQ(body.name, "body");
    ASSERT_EQ(body.children.size(), 3u);
    EXPECT_EQ(body.children[0].name, "h2");
    EXPECT_EQ(body.children[1].name, "p");
    ASSERT_EQ(body.children[1].children.size(), 1u);
    EXPECT_EQ(body.children[1].children[0].name, "em");
}

TEST(ParseFragment, lower_cases_element_names) {
    auto fragment = parse_fragment("<HTML><BODY><P>x</P></BODY></HTML>");
    ASSERT_TRUE(fragment.has_value());
    EXPECT_EQ(fragment->root, element("html", {element("body", {element("p")})}));
}

TEST(ParseFragment, ignores_text_comments_and_processing_instructions) {
    auto fragment = parse_fragment(
        "<?xml version=\"1.0\"?><body><!-- note --><p>a<![CDATA[b]]>c</p><?pi x?></body>");
    ASSERT_TRUE(fragment.has_value());
    EXPECT_EQ(fragment->root, element("body", {element("p")}));
}

TEST(ParseFragment, skips_undeclared_html_entities) {
    auto fragment = parse_fragment("<html><body><p>a&nbsp;b&mdash;c &amp; d</p></body></html>");
    ASSERT_TRUE(fragment.has_value()) << fragment.error().message;
    EXPECT_EQ(fragment->root, element("html", {element("body", {element("p")})}));
}

TEST(ParseFragment, accepts_xhtml_doctype_without_fetching_it) {
    auto fragment = parse_fragment(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<!DOCTYPE html PUBLIC \"-//W3C//DTD XHTML 1.1//EN\" "
        "\"http://www.w3.org/TR/xhtml11/DTD/xhtml11.dtd\">\n"
        "<html xmlns=\"http://www.w3.org/1999/xhtml\"><body><p>x&nbsp;y</p></body></html>");
    ASSERT_TRUE(fragment.has_value()) << fragment.error().message;
    EXPECT_EQ(fragment->root.children.size(), 1u);
}

TEST(ParseFragment, rejects_malformed_markup) {
    auto fragment = parse_fragment("<body><p>unclosed</body>", "bad.xhtml");
    ASSERT_FALSE(fragment.has_value());
    EXPECT_EQ(fragment.error().kind, ErrorKind::invalid_document);
    EXPECT_NE(fragment.error().message.find("bad.xhtml"), std::string::npos);
}

TEST(ParseFragment, rejects_empty_markup) {
    auto fragment = parse_fragment("");
    ASSERT_FALSE(fragment.has_value());
    EXPECT_EQ(fragment.error().kind, ErrorKind::invalid_document);
}

TEST(ParseFragment, enforces_depth_limit) {
    auto markup = std::string{};
    for (int i = 0; i < 10; ++i) markup += "<div>";
    for (int i = 0; i < 10; ++i) markup += "</div>";

    EXPECT_TRUE(parse_fragment(markup, {}, ParseOptions{10}).has_value());

    auto too_deep = parse_fragment(markup, {}, ParseOptions{9});
    ASSERT_FALSE(too_deep.has_value());
    EXPECT_EQ(too_deep.error().kind, ErrorKind::invalid_document);
    EXPECT_NE(too_deep.error().message.find("depth"), std::string::npos);
}

// =============================================================================
// walk_document
// =============================================================================

TEST(WalkDocument, pre_order_with_same_name_sibling_counting) {
    auto fragments = std::vector<DocumentFragment>{
        {"ch1", element("html", {
            element("body", {
                element("div", {element("h2"), element("p"), element("blockquote"), element("p")}),
                element("div", {element("p")}),
            }),
        })},
    };

    auto visits = collect(fragments);
    EXPECT_EQ(paths_of(visits), (std::vector<std::string>{
        "/body[1]",
        "/body[1]/div[1]",
        "/body[1]/div[1]/h2[1]",
        "/body[1]/div[1]/p[1]",
        "/body[1]/div[1]/blockquote[1]",
        "/body[1]/div[1]/p[2]",
        "/body[1]/div[2]",
        "/body[1]/div[2]/p[1]",
    }));
    for (const auto& v : visits) EXPECT_EQ(v.fragment, 1u);
}

TEST(WalkDocument, fragments_are_numbered_in_order) {
    auto fragments = std::vector<DocumentFragment>{
        {"a", element("html", {element("body", {element("p")})})},
        {"b", element("html", {element("body", {element("h1")})})},
    };

    auto visits = collect(fragments);
    ASSERT_EQ(visits.size(), 4u);
    EXPECT_EQ(visits[0].fragment, 1u);
    EXPECT_EQ(visits[1].fragment, 1u);
    EXPECT_EQ(visits[2].fragment, 2u);
    EXPECT_EQ(visits[3].path, "/body[1]/h1[1]");
    EXPECT_EQ(visits[3].fragment, 2u);
}

TEST(WalkDocument, non_html_root_is_the_first_step) {
    auto fragments = std::vector<DocumentFragment>{
        {"bare", element("body", {element("p"), element("p")})},
    };
    EXPECT_EQ(paths_of(collect(fragments)), (std::vector<std::string>{
        "/body[1]", "/body[1]/p[1]", "/body[1]/p[2]",
    }));
}

TEST(WalkDocument, html_root_is_not_visited) {
    auto fragments = std::vector<DocumentFragment>{{"empty", element("html")}};
    EXPECT_TRUE(collect(fragments).empty());
}

TEST(WalkDocument, fragment_without_root_fails) {
    auto fragments = std::vector<DocumentFragment>{
        {"ok", element("html", {element("body")})},
        {"missing", DocumentNode{}},
    };
    auto walked = walk_document(fragments, [](const WalkedElement&) {});
    ASSERT_FALSE(walked.has_value());
    EXPECT_EQ(walked.error().kind, ErrorKind::invalid_document);
    EXPECT_NE(walked.error().message.find("missing"), std::string::npos);
}

TEST(WalkDocument, stop_request_cancels) {
    auto source = std::stop_source{};
    source.request_stop();

    auto fragments = std::vector<DocumentFragment>{{"ch1", element("html", {element("body")})}};
    auto walked = walk_document(fragments, [](const WalkedElement&) {}, source.get_token());
    ASSERT_FALSE(walked.has_value());
    EXPECT_EQ(walked.error().kind, ErrorKind::index_build_failed);
}

TEST(WalkDocument, stop_request_during_walk_cancels) {
    auto children = std::vector<DocumentNode>(1000, element("p"));
    auto fragments = std::vector<DocumentFragment>{{"big", element("body", std::move(children))}};

    auto source = std::stop_source{};
    auto seen = std::size_t{0};
    auto walked = walk_document(fragments, [&](const WalkedElement&) {
        if (++seen == 10) source.request_stop();
    }, source.get_token());

    ASSERT_FALSE(walked.has_value());
    EXPECT_EQ(walked.error().kind, ErrorKind::index_build_failed);
    EXPECT_LT(seen, 1001u);
}

TEST(WalkDocument, parsed_fragment_walks_like_hand_built_tree) {
    auto parsed = parse_fragment("<html><body><div><h2/><p/><blockquote/><p/></div></body></html>");
    ASSERT_TRUE(parsed.has_value());

    auto hand_built = DocumentFragment{{}, element("html", {
        element("body", {element("div", {element("h2"), element("p"), element("blockquote"), element("p")})}),
    })};

    EXPECT_EQ(paths_of(collect({*parsed})), paths_of(collect({hand_built})));
}
