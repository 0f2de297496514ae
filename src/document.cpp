#include <xpoint-cpp/document.hpp>

#include <expat.h>

#include <limits>
#include <memory>
#include <type_traits>
#include <unordered_map>

namespace xpoint_cpp {

namespace {

// How many elements the walker visits between stop-token checks.
constexpr std::size_t stop_check_interval = 256;

auto lower_ascii(const XML_Char* name) -> std::string {
    auto out = std::string{name};
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return out;
}

// Expat callbacks append elements to the tree. Only the innermost open
// element ever gains children, so pointers to open elements stay valid.
class TreeBuilder {
public:
    TreeBuilder(XML_Parser parser, std::size_t max_depth)
        : parser_{parser}, max_depth_{max_depth} {}

    static void XMLCALL on_start(void* user_data, const XML_Char* name, const XML_Char** atts) {
        auto* self = static_cast<TreeBuilder*>(user_data);
        (void)atts;

        if (self->open_.size() >= self->max_depth_) {
            self->too_deep_ = true;
            XML_StopParser(self->parser_, XML_FALSE);
            return;
        }

        if (self->open_.empty()) {
            self->root_.name = lower_ascii(name);
            self->open_.push_back(&self->root_);
            return;
        }
        auto& siblings = self->open_.back()->children;
        siblings.push_back(DocumentNode{lower_ascii(name), {}});
        self->open_.push_back(&siblings.back());
    }

    static void XMLCALL on_end(void* user_data, const XML_Char* name) {
        auto* self = static_cast<TreeBuilder*>(user_data);
        (void)name;
        if (!self->open_.empty()) self->open_.pop_back();
    }

    // Stand in an empty external subset for every DTD reference. With an
    // external subset "read", undeclared entities such as &nbsp; are
    // skipped instead of failing the parse.
    static auto XMLCALL on_external_entity(XML_Parser parser, const XML_Char* context,
                                           const XML_Char* base, const XML_Char* system_id,
                                           const XML_Char* public_id) -> int {
        (void)base;
        (void)system_id;
        (void)public_id;
        auto* external = XML_ExternalEntityParserCreate(parser, context, nullptr);
        if (!external) return XML_STATUS_ERROR;
        const auto status = XML_Parse(external, "", 0, XML_TRUE);
        XML_ParserFree(external);
        return status == XML_STATUS_OK ? XML_STATUS_OK : XML_STATUS_ERROR;
    }

    auto too_deep() const -> bool { return too_deep_; }
    auto take_root() -> DocumentNode { return std::move(root_); }
    auto has_root() const -> bool { return !root_.name.empty(); }

private:
    XML_Parser parser_;
    std::size_t max_depth_;
    DocumentNode root_;
    std::vector<DocumentNode*> open_;
    bool too_deep_{false};
};

using ParserHandle = std::unique_ptr<std::remove_pointer_t<XML_Parser>, decltype(&XML_ParserFree)>;

struct Frame {
    const DocumentNode* node;
    std::size_t next_child{0};
    std::unordered_map<std::string_view, std::uint32_t> seen;  // same-name sibling counts
    bool addressed{true};
};

auto fragment_label(const DocumentFragment& fragment, std::size_t index) -> std::string {
    auto label = "fragment " + std::to_string(index);
    if (!fragment.id.empty()) label += " ('" + fragment.id + "')";
    return label;
}

auto cancelled(std::size_t visited) -> Error {
    return Error{ErrorKind::index_build_failed,
                 "document walk cancelled after " + std::to_string(visited) + " elements"};
}

}  // anonymous namespace

auto parse_fragment(std::string_view markup, std::string id,
                    const ParseOptions& options) -> Result<DocumentFragment> {
    const auto label = id.empty() ? std::string{"fragment"} : "fragment '" + id + "'";

    if (markup.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return Error{ErrorKind::invalid_document, label + " is too large to parse"};
    }

    auto parser = ParserHandle{XML_ParserCreate(nullptr), &XML_ParserFree};
    if (!parser) return Error{ErrorKind::invalid_document, "cannot allocate XML parser"};

    auto builder = TreeBuilder{parser.get(), options.max_depth};
    XML_SetUserData(parser.get(), &builder);
    XML_SetElementHandler(parser.get(), &TreeBuilder::on_start, &TreeBuilder::on_end);
    XML_SetParamEntityParsing(parser.get(), XML_PARAM_ENTITY_PARSING_UNLESS_STANDALONE);
    XML_SetExternalEntityRefHandler(parser.get(), &TreeBuilder::on_external_entity);
    XML_UseForeignDTD(parser.get(), XML_TRUE);

    const auto status = XML_Parse(parser.get(), markup.data(), static_cast<int>(markup.size()), XML_TRUE);

    if (builder.too_deep()) {
        return Error{ErrorKind::invalid_document,
                     label + " exceeds the maximum element depth of " + std::to_string(options.max_depth)};
    }
    if (status != XML_STATUS_OK) {
        return Error{ErrorKind::invalid_document,
                     label + ": " + XML_ErrorString(XML_GetErrorCode(parser.get())) + " at line " +
                     std::to_string(XML_GetCurrentLineNumber(parser.get()))};
    }
    if (!builder.has_root()) return Error{ErrorKind::invalid_document, label + " has no root element"};

    return DocumentFragment{std::move(id), builder.take_root()};
}

auto walk_document(std::span<const DocumentFragment> fragments,
                   const std::function<void(const WalkedElement&)>& visit,
                   std::stop_token stop) -> Result<std::size_t> {
    auto visited = std::size_t{0};
    auto path = std::vector<PathStep>{};
    auto stack = std::vector<Frame>{};

    for (std::size_t f = 0; f < fragments.size(); ++f) {
        if (stop.stop_requested()) return cancelled(visited);

        const auto fragment_index = static_cast<std::uint32_t>(f + 1);
        const auto& root = fragments[f].root;
        if (root.name.empty()) {
            return Error{ErrorKind::invalid_document,
                         fragment_label(fragments[f], fragment_index) + " has no root element"};
        }

        path.clear();
        const bool address_root = root.name != "html";
        if (address_root) {
            path.push_back(PathStep{root.name, 1, true});
            visit(WalkedElement{fragment_index, path, root});
            ++visited;
        }
        stack.push_back(Frame{&root, 0, {}, address_root});

        while (!stack.empty()) {
            auto& top = stack.back();
            if (top.next_child == top.node->children.size()) {
                if (top.addressed) path.pop_back();
                stack.pop_back();
                continue;
            }

            const auto& child = top.node->children[top.next_child++];
            const auto occurrence = ++top.seen[child.name];
            path.push_back(PathStep{child.name, occurrence, true});
            visit(WalkedElement{fragment_index, path, child});

            if (++visited % stop_check_interval == 0 && stop.stop_requested()) {
                return cancelled(visited);
            }
            stack.push_back(Frame{&child, 0, {}, true});
        }
    }
    return visited;
}

}  // namespace xpoint_cpp
