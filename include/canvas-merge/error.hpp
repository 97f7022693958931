/// @file error.hpp
/// @brief Error types for the canvas-merge library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace canvas_merge {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    path_not_found,       ///< A patch path or from-pointer does not resolve.
    unknown_operation,    ///< A wire patch names an op outside the vocabulary.
    validation_failure,   ///< The resulting document violates the schema.
    conflict_unresolved,  ///< No strategy met the confidence threshold.
    test_failed,          ///< A test precondition did not hold.
    invalid_patch,        ///< A patch is malformed (bad pointer, missing value).
    invalid_document,     ///< Document data could not be decoded.
    node_not_found,       ///< An id lookup failed.
    limit_exceeded,       ///< A document exceeds the configured node ceiling.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::path_not_found:      return "path_not_found";
        case ErrorKind::unknown_operation:   return "unknown_operation";
        case ErrorKind::validation_failure:  return "validation_failure";
        case ErrorKind::conflict_unresolved: return "conflict_unresolved";
        case ErrorKind::test_failed:         return "test_failed";
        case ErrorKind::invalid_patch:       return "invalid_patch";
        case ErrorKind::invalid_document:    return "invalid_document";
        case ErrorKind::node_not_found:      return "node_not_found";
        case ErrorKind::limit_exceeded:      return "limit_exceeded";
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

}  // namespace canvas_merge
