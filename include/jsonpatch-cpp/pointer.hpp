/// @file pointer.hpp
/// @brief JSON Pointer (RFC 6901) token codec.
///
/// A pointer is either empty (the whole document) or a sequence of
/// `/`-prefixed reference tokens in which `~` is written `~0` and `/`
/// is written `~1`.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

/// The token addressing one past the last element of an array.
inline constexpr std::string_view end_token = "-";

/// Escape a reference token: `~` becomes `~0`, `/` becomes `~1`.
auto escape_token(std::string_view token) -> std::string;

/// Decode a reference token (`~1` -> `/`, `~0` -> `~`).
/// @throws Exception (bad_path) on a `~` not followed by `0` or `1`.
auto unescape_token(std::string_view token) -> std::string;

/// Compose an escaped token onto an existing pointer.
/// @code
/// append_token("", "a/b");    // "/a~1b"
/// append_token("/x", "y");    // "/x/y"
/// @endcode
auto append_token(std::string_view pointer, std::string_view token) -> std::string;

/// Compose an array index onto an existing pointer.
auto append_index(std::string_view pointer, std::size_t index) -> std::string;

/// Split a pointer into its decoded reference tokens.
/// The empty pointer yields no tokens; "/" yields one empty token.
/// @throws Exception (bad_path) if a non-empty pointer does not start
///         with `/` or contains an invalid escape.
auto split_pointer(std::string_view pointer) -> std::vector<std::string>;

/// Parse an array index token.
///
/// Accepts decimal digits without leading zeros, optionally preceded by
/// `-` for the from-the-end forms. Returns nullopt for anything else,
/// including the end token and values that do not fit in 64 bits.
auto parse_index(std::string_view token) -> std::optional<std::int64_t>;

}  // namespace jsonpatch_cpp
