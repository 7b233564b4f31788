/// @file error.hpp
/// @brief Error types for the spatch library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace spatch {

/// Categories of errors that can occur in the library.
///
/// Kinds are grouped into categories by category_of(); callers that only
/// care whether a failure came from path syntax, resolution or patch
/// application can branch on the category.
enum class ErrorKind : std::uint8_t {
    // -- parse ----------------------------------------------------------------
    missing_leading_slash,  ///< A non-empty path does not start with '/'.
    empty_segment,          ///< Two '/' with nothing between them, or a trailing '/'.
    unterminated_escape,    ///< A '~' at the end of a token.
    invalid_escape,         ///< A '~' followed by something other than '0' or '1'.
    malformed_selector,     ///< A broken "[field=value]" identity selector.

    // -- resolve --------------------------------------------------------------
    not_found,              ///< The key, index or identity does not exist.
    ambiguous,              ///< An identity selector matched more than one element.
    type_mismatch,          ///< A segment was applied to the wrong kind of value.
    invalid_use,            ///< A segment appeared where it is not allowed.

    // -- schema ---------------------------------------------------------------
    invalid_index_key,      ///< An "indexKey" declaration is malformed.

    // -- diff -----------------------------------------------------------------
    identity_conflict,      ///< Two elements of a keyed array share an identity value.

    // -- apply ----------------------------------------------------------------
    index_out_of_range,     ///< An array index is past the end of the array.
    move_into_self,         ///< A move source is a proper prefix of its target.
    test_failed,            ///< A "test" operation found a different value.

    // -- patch documents and limits -------------------------------------------
    invalid_patch,          ///< A JSON Patch document is structurally invalid.
    depth_limit_exceeded,   ///< A document is nested deeper than Options::max_depth.
};

/// Coarse grouping of ErrorKind values.
enum class ErrorCategory : std::uint8_t {
    parse,
    resolve,
    schema,
    diff,
    apply,
    patch_format,
    limits,
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::missing_leading_slash: return "missing_leading_slash";
        case ErrorKind::empty_segment:         return "empty_segment";
        case ErrorKind::unterminated_escape:   return "unterminated_escape";
        case ErrorKind::invalid_escape:        return "invalid_escape";
        case ErrorKind::malformed_selector:    return "malformed_selector";
        case ErrorKind::not_found:             return "not_found";
        case ErrorKind::ambiguous:             return "ambiguous";
        case ErrorKind::type_mismatch:         return "type_mismatch";
        case ErrorKind::invalid_use:           return "invalid_use";
        case ErrorKind::invalid_index_key:     return "invalid_index_key";
        case ErrorKind::identity_conflict:     return "identity_conflict";
        case ErrorKind::index_out_of_range:    return "index_out_of_range";
        case ErrorKind::move_into_self:        return "move_into_self";
        case ErrorKind::test_failed:           return "test_failed";
        case ErrorKind::invalid_patch:         return "invalid_patch";
        case ErrorKind::depth_limit_exceeded:  return "depth_limit_exceeded";
    }
    return "unknown";
}

/// Convert an ErrorCategory to its string representation.
constexpr auto to_string_view(ErrorCategory category) noexcept -> std::string_view {
    switch (category) {
        case ErrorCategory::parse:        return "parse";
        case ErrorCategory::resolve:      return "resolve";
        case ErrorCategory::schema:       return "schema";
        case ErrorCategory::diff:         return "diff";
        case ErrorCategory::apply:        return "apply";
        case ErrorCategory::patch_format: return "patch_format";
        case ErrorCategory::limits:       return "limits";
    }
    return "unknown";
}

/// The category an ErrorKind belongs to.
///
/// not_found and type_mismatch are shared by resolution and application;
/// they are reported under `resolve`.
constexpr auto category_of(ErrorKind kind) noexcept -> ErrorCategory {
    switch (kind) {
        case ErrorKind::missing_leading_slash:
        case ErrorKind::empty_segment:
        case ErrorKind::unterminated_escape:
        case ErrorKind::invalid_escape:
        case ErrorKind::malformed_selector:
            return ErrorCategory::parse;
        case ErrorKind::not_found:
        case ErrorKind::ambiguous:
        case ErrorKind::type_mismatch:
        case ErrorKind::invalid_use:
            return ErrorCategory::resolve;
        case ErrorKind::invalid_index_key:
            return ErrorCategory::schema;
        case ErrorKind::identity_conflict:
            return ErrorCategory::diff;
        case ErrorKind::index_out_of_range:
        case ErrorKind::move_into_self:
        case ErrorKind::test_failed:
            return ErrorCategory::apply;
        case ErrorKind::invalid_patch:
            return ErrorCategory::patch_format;
        case ErrorKind::depth_limit_exceeded:
            return ErrorCategory::limits;
    }
    return ErrorCategory::limits;
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    /// The coarse category of this error.
    auto category() const noexcept -> ErrorCategory { return category_of(kind); }

    /// "<kind>: <message>", suitable for logs and diagnostics.
    auto describe() const -> std::string {
        auto text = std::string{to_string_view(kind)};
        text += ": ";
        text += message;
        return text;
    }

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown when a failed Result is accessed as a value.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.describe()}, error_{std::move(error)} {}

    /// The error that was accessed.
    auto error() const noexcept -> const Error& { return error_; }

private:
    Error error_;
};

}  // namespace spatch
