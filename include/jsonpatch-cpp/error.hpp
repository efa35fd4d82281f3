/// @file error.hpp
/// @brief Error types for the jsonpatch-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jsonpatch_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    parse_error,        ///< An input buffer is not valid JSON.
    type_mismatch,      ///< Root kinds differ (array vs. non-array) during diff.
    not_found,          ///< A pointer resolves through a missing key or slot.
    out_of_bounds,      ///< An array index is outside the legal range.
    bad_path,           ///< A pointer is malformed or targets the root illegally.
    resource_limit,     ///< The accumulated copy size limit was exceeded.
    test_failed,        ///< A test operation did not hold.
    invalid_operation,  ///< A patch entry is malformed (missing op, path, value, from).
    internal_fault,     ///< An internal invariant was violated.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::parse_error:       return "parse_error";
        case ErrorKind::type_mismatch:     return "type_mismatch";
        case ErrorKind::not_found:         return "not_found";
        case ErrorKind::out_of_bounds:     return "out_of_bounds";
        case ErrorKind::bad_path:          return "bad_path";
        case ErrorKind::resource_limit:    return "resource_limit";
        case ErrorKind::test_failed:       return "test_failed";
        case ErrorKind::invalid_operation: return "invalid_operation";
        case ErrorKind::internal_fault:    return "internal_fault";
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

/// Exception carrying an Error. Thrown by create_patch, apply_patch,
/// parse and decode_patch; what() returns the error message.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto kind() const noexcept -> ErrorKind { return error_.kind; }
    auto error() const noexcept -> const Error& { return error_; }

private:
    Error error_;
};

}  // namespace jsonpatch_cpp
