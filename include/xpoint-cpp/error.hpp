/// @file error.hpp
/// @brief Error types and the Result wrapper for the xpoint-cpp library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace xpoint_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    malformed_encoding,  ///< An xpoint string does not match the grammar.
    empty_content,       ///< Content to hash is empty or degenerate.
    index_build_failed,  ///< A document walk failed or was cancelled.
    not_indexed,         ///< An encoding has no entry in the position index.
    invalid_range,       ///< A range's start is ordered after its end.
    invalid_document,    ///< Document markup could not be parsed.
    invalid_config,      ///< A configuration value is missing or invalid.
    invalid_record,      ///< An uploaded annotation record is inconsistent.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::malformed_encoding: return "malformed_encoding";
        case ErrorKind::empty_content:      return "empty_content";
        case ErrorKind::index_build_failed: return "index_build_failed";
        case ErrorKind::not_indexed:        return "not_indexed";
        case ErrorKind::invalid_range:      return "invalid_range";
        case ErrorKind::invalid_document:   return "invalid_document";
        case ErrorKind::invalid_config:     return "invalid_config";
        case ErrorKind::invalid_record:     return "invalid_record";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Either a value of type T or an Error.
///
/// Every fallible operation in the library reports failure through a
/// Result instead of throwing, so that batch callers can record the
/// outcome per item and carry on.
///
/// @code
/// auto pos = parse_position("/body/DocFragment[3]/body/p[2]/text().14");
/// if (!pos) {
///     log(pos.error().message);
/// }
/// @endcode
template <typename T>
class Result {
    static_assert(!std::is_same_v<T, Error>, "Result<Error> is ambiguous");

public:
    /// Construct a successful result.
    Result(T value) : inner_{std::in_place_index<0>, std::move(value)} {}

    /// Construct a failed result.
    Result(Error error) : inner_{std::in_place_index<1>, std::move(error)} {}

    /// True if this holds a value.
    auto has_value() const noexcept -> bool { return inner_.index() == 0; }

    explicit operator bool() const noexcept { return has_value(); }

    /// Access the value. Throws std::bad_variant_access if this holds an error.
    auto value() & -> T& { return std::get<0>(inner_); }
    auto value() const& -> const T& { return std::get<0>(inner_); }
    auto value() && -> T&& { return std::get<0>(std::move(inner_)); }

    /// Access the error. Throws std::bad_variant_access if this holds a value.
    auto error() const -> const Error& { return std::get<1>(inner_); }

    auto operator*() & -> T& { return value(); }
    auto operator*() const& -> const T& { return value(); }
    auto operator*() && -> T&& { return std::move(*this).value(); }

    auto operator->() -> T* { return &value(); }
    auto operator->() const -> const T* { return &value(); }

    /// The value, or a fallback when this holds an error.
    template <typename U>
    auto value_or(U&& fallback) const& -> T {
        return has_value() ? value() : static_cast<T>(std::forward<U>(fallback));
    }

    auto operator==(const Result&) const -> bool = default;

private:
    std::variant<T, Error> inner_;
};

}  // namespace xpoint_cpp
