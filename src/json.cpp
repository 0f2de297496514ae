#include <xpoint-cpp/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace xpoint_cpp {

namespace {

template <typename T>
auto optional_to_json(const std::optional<T>& value) -> nlohmann::json {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

// Absent keys and explicit nulls both read as nullopt.
template <typename T>
auto optional_from_json(const nlohmann::json& j, const char* key) -> std::optional<T> {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<T>();
}

auto parse_or_throw(const std::string& raw) -> PositionEncoding {
    auto pos = parse_position(raw);
    if (!pos) throw std::runtime_error{pos.error().message};
    return std::move(*pos);
}

auto location_to_json(const HighlightLocation& location) -> nlohmann::json {
    return std::visit([](const auto& loc) -> nlohmann::json {
        using T = std::decay_t<decltype(loc)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else {
            return loc;
        }
    }, location);
}

auto location_from_json(const nlohmann::json& j) -> HighlightLocation {
    if (j.is_null()) return std::monostate{};
    if (j.is_string()) return parse_or_throw(j.get<std::string>());
    if (j.is_object()) return j.get<PositionRange>();
    throw std::runtime_error{"highlight location must be null, a string or a range object"};
}

}  // anonymous namespace

// -- Positions ----------------------------------------------------------------

void to_json(nlohmann::json& j, const PositionEncoding& pos) {
    j = serialize_position(pos);
}

void from_json(const nlohmann::json& j, PositionEncoding& pos) {
    pos = parse_or_throw(j.get<std::string>());
}

void to_json(nlohmann::json& j, Ordering ord) {
    j = std::string{to_string_view(ord)};
}

void to_json(nlohmann::json& j, const DocumentPosition& pos) {
    j = nlohmann::json::array({pos.index, pos.char_offset});
}

void from_json(const nlohmann::json& j, DocumentPosition& pos) {
    if (!j.is_array() || j.size() != 2) {
        throw std::runtime_error{"document position must be [index, char_offset]"};
    }
    pos.index = j[0].get<std::uint64_t>();
    pos.char_offset = j[1].get<std::uint64_t>();
}

// -- Hashing and errors -------------------------------------------------------

void to_json(nlohmann::json& j, const ContentHash& h) {
    j = h.to_hex();
}

void from_json(const nlohmann::json& j, ContentHash& h) {
    auto parsed = ContentHash::from_hex(j.get<std::string>());
    if (!parsed) throw std::runtime_error{"content hash must be 64 hex characters"};
    h = *parsed;
}

void to_json(nlohmann::json& j, ErrorKind kind) {
    j = std::string{to_string_view(kind)};
}

void to_json(nlohmann::json& j, const Error& error) {
    j = nlohmann::json{{"kind", error.kind}, {"message", error.message}};
}

void to_json(nlohmann::json& j, ItemStatus status) {
    j = std::string{to_string_view(status)};
}

void to_json(nlohmann::json& j, const BatchItemOutcome& outcome) {
    j = nlohmann::json{{"index", outcome.index}, {"status", outcome.status}};
    if (outcome.hash) j["hash"] = *outcome.hash;
    if (outcome.error) j["error"] = *outcome.error;
}

void to_json(nlohmann::json& j, const BatchReport& report) {
    j = nlohmann::json{
        {"items", report.items},
        {"unique", report.count(ItemStatus::unique)},
        {"duplicate", report.count(ItemStatus::duplicate)},
        {"rejected", report.count(ItemStatus::rejected)},
    };
}

// -- Matching -----------------------------------------------------------------

void to_json(nlohmann::json& j, const Highlight& h) {
    j = nlohmann::json{
        {"id", h.id},
        {"location", location_to_json(h.location)},
        {"page", optional_to_json(h.page)},
    };
}

void from_json(const nlohmann::json& j, Highlight& h) {
    h.id = j.at("id").get<std::string>();
    auto it = j.find("location");
    h.location = it == j.end() ? HighlightLocation{} : location_from_json(*it);
    h.page = optional_from_json<std::uint32_t>(j, "page");
}

void to_json(nlohmann::json& j, const ReadingSession& s) {
    j = nlohmann::json{
        {"id", s.id},
        {"range", optional_to_json(s.range)},
        {"start_page", optional_to_json(s.start_page)},
        {"end_page", optional_to_json(s.end_page)},
    };
}

void from_json(const nlohmann::json& j, ReadingSession& s) {
    s.id = j.at("id").get<std::string>();
    s.range = optional_from_json<PositionRange>(j, "range");
    s.start_page = optional_from_json<std::uint32_t>(j, "start_page");
    s.end_page = optional_from_json<std::uint32_t>(j, "end_page");
}

void to_json(nlohmann::json& j, MatchBasis basis) {
    j = std::string{to_string_view(basis)};
}

void to_json(nlohmann::json& j, const MatchedHighlight& m) {
    j = nlohmann::json{
        {"highlight_id", m.highlight_id},
        {"basis", m.basis},
        {"position", optional_to_json(m.position)},
        {"page", optional_to_json(m.page)},
    };
}

void to_json(nlohmann::json& j, const SessionMatch& m) {
    j = nlohmann::json{
        {"session_id", m.session_id},
        {"matched", m.matched},
        {"undetermined", m.undetermined},
    };
}

void to_json(nlohmann::json& j, const ChapterBoundary& c) {
    j = nlohmann::json{
        {"id", c.id},
        {"start_xpoint", optional_to_json(c.start)},
        {"end_xpoint", optional_to_json(c.end)},
    };
}

void from_json(const nlohmann::json& j, ChapterBoundary& c) {
    c.id = j.at("id").get<std::string>();
    c.start = optional_from_json<PositionEncoding>(j, "start_xpoint");
    c.end = optional_from_json<PositionEncoding>(j, "end_xpoint");
}

void to_json(nlohmann::json& j, const PositionBackfill& b) {
    auto highlights = nlohmann::json::array();
    for (const auto& h : b.highlights) {
        highlights.push_back(nlohmann::json{{"id", h.id}, {"position", h.position}});
    }
    auto sessions = nlohmann::json::array();
    for (const auto& s : b.sessions) {
        sessions.push_back(nlohmann::json{{"id", s.id}, {"start", s.start}, {"end", s.end}});
    }
    auto chapters = nlohmann::json::array();
    for (const auto& c : b.chapters) {
        chapters.push_back(nlohmann::json{
            {"id", c.id}, {"start", optional_to_json(c.start)}, {"end", optional_to_json(c.end)},
        });
    }
    j = nlohmann::json{
        {"highlights", std::move(highlights)},
        {"sessions", std::move(sessions)},
        {"chapters", std::move(chapters)},
    };
}

// -- Ingestion ----------------------------------------------------------------

void to_json(nlohmann::json& j, const HighlightRecord& r) {
    j = nlohmann::json{
        {"text", r.text},
        {"note", optional_to_json(r.note)},
        {"start_xpoint", optional_to_json(r.start_xpoint)},
        {"end_xpoint", optional_to_json(r.end_xpoint)},
        {"page", optional_to_json(r.page)},
    };
}

void from_json(const nlohmann::json& j, HighlightRecord& r) {
    r.text = j.at("text").get<std::string>();
    r.note = optional_from_json<std::string>(j, "note");
    r.start_xpoint = optional_from_json<std::string>(j, "start_xpoint");
    r.end_xpoint = optional_from_json<std::string>(j, "end_xpoint");
    r.page = optional_from_json<std::int64_t>(j, "page");
}

void to_json(nlohmann::json& j, const SessionRecord& r) {
    j = nlohmann::json{
        {"start_time", r.start_time},
        {"end_time", r.end_time},
        {"start_xpoint", optional_to_json(r.start_xpoint)},
        {"end_xpoint", optional_to_json(r.end_xpoint)},
        {"start_page", optional_to_json(r.start_page)},
        {"end_page", optional_to_json(r.end_page)},
        {"device_id", optional_to_json(r.device_id)},
    };
}

void from_json(const nlohmann::json& j, SessionRecord& r) {
    r.start_time = j.at("start_time").get<std::int64_t>();
    r.end_time = j.at("end_time").get<std::int64_t>();
    r.start_xpoint = optional_from_json<std::string>(j, "start_xpoint");
    r.end_xpoint = optional_from_json<std::string>(j, "end_xpoint");
    r.start_page = optional_from_json<std::int64_t>(j, "start_page");
    r.end_page = optional_from_json<std::int64_t>(j, "end_page");
    r.device_id = optional_from_json<std::string>(j, "device_id");
}

void to_json(nlohmann::json& j, RecordStatus status) {
    j = std::string{to_string_view(status)};
}

void to_json(nlohmann::json& j, const RecordOutcome& outcome) {
    j = nlohmann::json{{"index", outcome.index}, {"status", outcome.status}};
    if (outcome.hash) j["hash"] = *outcome.hash;
    if (outcome.error) j["error"] = *outcome.error;
    if (!outcome.reason.empty()) j["reason"] = outcome.reason;
}

void to_json(nlohmann::json& j, const IngestedHighlight& h) {
    j = nlohmann::json{
        {"record_index", h.record_index},
        {"hash", h.hash},
        {"text", h.text},
        {"note", optional_to_json(h.note)},
        {"location", location_to_json(h.location)},
        {"page", optional_to_json(h.page)},
    };
}

void to_json(nlohmann::json& j, const IngestedSession& s) {
    j = nlohmann::json{
        {"record_index", s.record_index},
        {"hash", s.hash},
        {"start_time", s.start_time},
        {"end_time", s.end_time},
        {"range", optional_to_json(s.range)},
        {"start_page", optional_to_json(s.start_page)},
        {"end_page", optional_to_json(s.end_page)},
        {"device_id", optional_to_json(s.device_id)},
        {"start_position", optional_to_json(s.start_position)},
        {"end_position", optional_to_json(s.end_position)},
    };
}

}  // namespace xpoint_cpp

namespace nlohmann {

auto adl_serializer<xpoint_cpp::PositionRange>::from_json(const json& j) -> xpoint_cpp::PositionRange {
    auto range = xpoint_cpp::PositionRange::parse(j.at("start").get<std::string>(),
                                                  j.at("end").get<std::string>());
    if (!range) throw std::runtime_error{range.error().message};
    return std::move(*range);
}

void adl_serializer<xpoint_cpp::PositionRange>::to_json(json& j, const xpoint_cpp::PositionRange& range) {
    j = json{
        {"start", xpoint_cpp::serialize_position(range.start())},
        {"end", xpoint_cpp::serialize_position(range.end())},
    };
}

}  // namespace nlohmann
