#include <xpoint-cpp/encoding.hpp>

#include <charconv>
#include <cstddef>
#include <limits>
#include <string>
#include <utility>

namespace xpoint_cpp {

namespace {

constexpr std::string_view fragment_marker = "/body/DocFragment";
constexpr std::string_view text_selector_token = "/text()";

auto is_name_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto is_name_char(char c) -> bool {
    return is_name_start(c) || (c >= '0' && c <= '9') || c == '-' || c == ':';
}

auto is_digit(char c) -> bool { return c >= '0' && c <= '9'; }

// Single-pass recursive-descent parser over the xpoint grammar.
class XPointParser {
public:
    explicit XPointParser(std::string_view raw) : raw_{raw}, rest_{raw} {}

    auto run() -> Result<PositionEncoding> {
        if (raw_.empty()) return fail("empty string");

        auto pos = PositionEncoding{};

        if (at_fragment_marker()) {
            rest_.remove_prefix(fragment_marker.size());
            auto frag = read_bracket_index("DocFragment index");
            if (!frag) return frag.error();
            pos.fragment_index = *frag;
        }

        while (!rest_.empty() && rest_.front() == '/' && !rest_.starts_with(text_selector_token)) {
            rest_.remove_prefix(1);
            auto step = read_step();
            if (!step) return step.error();
            pos.path.push_back(std::move(*step));
        }
        if (pos.path.empty()) return fail("missing element path");

        if (rest_.starts_with(text_selector_token)) {
            rest_.remove_prefix(text_selector_token.size());
            if (!rest_.empty() && rest_.front() == '[') {
                auto text_index = read_bracket_index("text node index");
                if (!text_index) return text_index.error();
                pos.text_node_index = *text_index;
                pos.text_selector = TextSelector::indexed;
            } else {
                pos.text_selector = TextSelector::bare;
            }
        }

        if (!rest_.empty() && rest_.front() == '.') {
            rest_.remove_prefix(1);
            auto offset = read_number(std::numeric_limits<std::uint64_t>::max(), true,
                                      "character offset");
            if (!offset) return offset.error();
            pos.char_offset = *offset;
            pos.has_offset = true;
        }

        if (!rest_.empty()) {
            return fail("unexpected trailing characters '" + std::string{rest_} + "'");
        }
        return pos;
    }

private:
    auto fail(std::string_view reason) const -> Error {
        return Error{ErrorKind::malformed_encoding,
                     "invalid xpoint '" + std::string{raw_} + "': " + std::string{reason}};
    }

    // The DocFragment prefix only counts as a marker when an element
    // path follows it; "/body/DocFragment[3]" alone is a plain path.
    auto at_fragment_marker() const -> bool {
        if (!rest_.starts_with(fragment_marker)) return false;
        auto after = rest_.substr(fragment_marker.size());
        if (after.empty() || after.front() != '[') return false;
        auto close = after.find(']');
        if (close == std::string_view::npos) return false;
        auto tail = after.substr(close + 1);
        return tail.size() > 1 && tail.front() == '/' && !tail.starts_with(text_selector_token);
    }

    auto read_number(std::uint64_t max, bool allow_zero, std::string_view what)
        -> Result<std::uint64_t> {
        auto len = std::size_t{0};
        while (len < rest_.size() && is_digit(rest_[len])) ++len;
        if (len == 0) return fail(std::string{what} + " must be a non-negative integer");
        if (len > 1 && rest_.front() == '0') {
            return fail(std::string{what} + " has leading zeros");
        }

        auto value = std::uint64_t{0};
        const auto* first = rest_.data();
        if (std::from_chars(first, first + len, value).ec != std::errc{} || value > max) {
            return fail(std::string{what} + " is out of range");
        }
        if (!allow_zero && value == 0) return fail(std::string{what} + " must be >= 1");
        rest_.remove_prefix(len);
        return value;
    }

    auto read_bracket_index(std::string_view what) -> Result<std::uint32_t> {
        if (rest_.empty() || rest_.front() != '[') return fail("expected '[' before " + std::string{what});
        rest_.remove_prefix(1);
        auto value = read_number(std::numeric_limits<std::uint32_t>::max(), false, what);
        if (!value) return value.error();
        if (rest_.empty() || rest_.front() != ']') return fail("unterminated " + std::string{what});
        rest_.remove_prefix(1);
        return static_cast<std::uint32_t>(*value);
    }

    auto read_step() -> Result<PathStep> {
        if (rest_.empty() || !is_name_start(rest_.front())) {
            return fail("expected an element name at offset " +
                        std::to_string(raw_.size() - rest_.size()));
        }
        auto len = std::size_t{1};
        while (len < rest_.size() && is_name_char(rest_[len])) ++len;

        auto step = PathStep{std::string{rest_.substr(0, len)}, 1, false};
        rest_.remove_prefix(len);

        if (!rest_.empty() && rest_.front() == '[') {
            auto index = read_bracket_index("index of '" + step.name + "'");
            if (!index) return index.error();
            step.index = *index;
            step.explicit_index = true;
        }

        if (!rest_.empty() && rest_.front() != '/' && rest_.front() != '.') {
            return fail("unexpected character '" + std::string(1, rest_.front()) +
                        "' after '" + step.name + "'");
        }
        return step;
    }

    std::string_view raw_;
    std::string_view rest_;
};

auto valid_name(std::string_view name) -> bool {
    if (name.empty() || !is_name_start(name.front())) return false;
    for (auto c : name.substr(1)) {
        if (!is_name_char(c)) return false;
    }
    return true;
}

}  // anonymous namespace

auto make_position(std::optional<std::uint32_t> fragment_index,
                   std::vector<PathStep> path,
                   std::uint32_t text_node_index,
                   std::uint64_t char_offset) -> Result<PositionEncoding> {
    if (fragment_index && *fragment_index == 0) {
        return Error{ErrorKind::malformed_encoding, "fragment index must be >= 1"};
    }
    if (path.empty()) return Error{ErrorKind::malformed_encoding, "path must not be empty"};
    if (text_node_index == 0) {
        return Error{ErrorKind::malformed_encoding, "text node index must be >= 1"};
    }
    for (auto& step : path) {
        if (!valid_name(step.name)) {
            return Error{ErrorKind::malformed_encoding, "invalid element name '" + step.name + "'"};
        }
        if (step.index == 0) {
            return Error{ErrorKind::malformed_encoding, "index of '" + step.name + "' must be >= 1"};
        }
        step.explicit_index = true;
    }

    auto pos = PositionEncoding{};
    pos.fragment_index = fragment_index;
    pos.path = std::move(path);
    pos.text_node_index = text_node_index;
    pos.char_offset = char_offset;
    if (text_node_index != 1) {
        pos.text_selector = TextSelector::indexed;
    } else if (char_offset != 0) {
        pos.text_selector = TextSelector::bare;
    }
    pos.has_offset = text_node_index != 1 || char_offset != 0;
    return pos;
}

auto parse_position(std::string_view raw) -> Result<PositionEncoding> {
    return XPointParser{raw}.run();
}

auto serialize_position(const PositionEncoding& pos) -> std::string {
    auto out = std::string{};
    out.reserve(32 + pos.path.size() * 8);

    if (pos.fragment_index) {
        out += fragment_marker;
        out += '[';
        out += std::to_string(*pos.fragment_index);
        out += ']';
    }

    for (const auto& step : pos.path) {
        out += '/';
        out += step.name;
        if (step.explicit_index) {
            out += '[';
            out += std::to_string(step.index);
            out += ']';
        }
    }

    switch (pos.text_selector) {
        case TextSelector::none:
            break;
        case TextSelector::bare:
            out += text_selector_token;
            break;
        case TextSelector::indexed:
            out += text_selector_token;
            out += '[';
            out += std::to_string(pos.text_node_index);
            out += ']';
            break;
    }

    if (pos.has_offset) {
        out += '.';
        out += std::to_string(pos.char_offset);
    }
    return out;
}

auto normalized_path(const std::vector<PathStep>& path) -> std::string {
    auto out = std::string{};
    for (const auto& step : path) {
        out += '/';
        out += step.name;
        out += '[';
        out += std::to_string(step.index);
        out += ']';
    }
    return out;
}

}  // namespace xpoint_cpp
