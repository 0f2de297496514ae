/// @file xpoint.hpp
/// @brief Umbrella header for the xpoint-cpp library.
///
/// Include this single header for access to all public types:
/// PositionEncoding, PositionRange, ContentHash, DocumentFragment,
/// PositionIndex, IndexRegistry, the matcher, ingestion, Config and Error.
/// JSON interop lives in json.hpp and is included separately.

#pragma once

#include <xpoint-cpp/config.hpp>
#include <xpoint-cpp/content_hash.hpp>
#include <xpoint-cpp/document.hpp>
#include <xpoint-cpp/encoding.hpp>
#include <xpoint-cpp/error.hpp>
#include <xpoint-cpp/index_registry.hpp>
#include <xpoint-cpp/ingest.hpp>
#include <xpoint-cpp/logging.hpp>
#include <xpoint-cpp/matcher.hpp>
#include <xpoint-cpp/ordering.hpp>
#include <xpoint-cpp/position_index.hpp>
