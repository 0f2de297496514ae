/// @file json.hpp
/// @brief nlohmann/json interoperability for xpoint-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the library's value
/// types and for uploaded annotation records. Encodings serialize as their
/// xpoint string, hashes as lowercase hex, enums by name.
///
/// from_json follows nlohmann's convention and throws: a malformed xpoint
/// or an invalid range raises std::runtime_error, a missing or mistyped
/// field raises nlohmann::json::exception.

#pragma once

#include <xpoint-cpp/content_hash.hpp>
#include <xpoint-cpp/encoding.hpp>
#include <xpoint-cpp/error.hpp>
#include <xpoint-cpp/ingest.hpp>
#include <xpoint-cpp/matcher.hpp>
#include <xpoint-cpp/ordering.hpp>
#include <xpoint-cpp/position_index.hpp>

#include <nlohmann/json.hpp>

namespace xpoint_cpp {

// -- Positions ----------------------------------------------------------------

void to_json(nlohmann::json& j, const PositionEncoding& pos);
void from_json(const nlohmann::json& j, PositionEncoding& pos);

void to_json(nlohmann::json& j, Ordering ord);

void to_json(nlohmann::json& j, const DocumentPosition& pos);
void from_json(const nlohmann::json& j, DocumentPosition& pos);

// -- Hashing and errors -------------------------------------------------------

void to_json(nlohmann::json& j, const ContentHash& h);
void from_json(const nlohmann::json& j, ContentHash& h);

void to_json(nlohmann::json& j, ErrorKind kind);
void to_json(nlohmann::json& j, const Error& error);

void to_json(nlohmann::json& j, ItemStatus status);
void to_json(nlohmann::json& j, const BatchItemOutcome& outcome);
void to_json(nlohmann::json& j, const BatchReport& report);

// -- Matching -----------------------------------------------------------------

void to_json(nlohmann::json& j, const Highlight& h);
void from_json(const nlohmann::json& j, Highlight& h);

void to_json(nlohmann::json& j, const ReadingSession& s);
void from_json(const nlohmann::json& j, ReadingSession& s);

void to_json(nlohmann::json& j, MatchBasis basis);
void to_json(nlohmann::json& j, const MatchedHighlight& m);
void to_json(nlohmann::json& j, const SessionMatch& m);
void to_json(nlohmann::json& j, const ChapterBoundary& c);
void from_json(const nlohmann::json& j, ChapterBoundary& c);

void to_json(nlohmann::json& j, const PositionBackfill& b);

// -- Ingestion ----------------------------------------------------------------

void to_json(nlohmann::json& j, const HighlightRecord& r);
void from_json(const nlohmann::json& j, HighlightRecord& r);

void to_json(nlohmann::json& j, const SessionRecord& r);
void from_json(const nlohmann::json& j, SessionRecord& r);

void to_json(nlohmann::json& j, RecordStatus status);
void to_json(nlohmann::json& j, const RecordOutcome& outcome);
void to_json(nlohmann::json& j, const IngestedHighlight& h);
void to_json(nlohmann::json& j, const IngestedSession& s);

template <typename T>
void to_json(nlohmann::json& j, const IngestReport<T>& report) {
    j = nlohmann::json{{"outcomes", report.outcomes}, {"accepted", report.accepted}};
}

}  // namespace xpoint_cpp

/// @cond JSON_SERIALIZERS

// PositionRange has no default state, so it deserializes by value.
namespace nlohmann {

template <>
struct adl_serializer<xpoint_cpp::PositionRange> {
    static auto from_json(const json& j) -> xpoint_cpp::PositionRange;
    static void to_json(json& j, const xpoint_cpp::PositionRange& range);
};

}  // namespace nlohmann

/// @endcond
