/// @file json.hpp
/// @brief JSON text <-> Value conversion and nlohmann/json interoperability.
///
/// Parsing is delegated to the nlohmann/json SAX parser; the events are
/// assembled into a Value tree that keeps every number token verbatim.
/// Serialization writes number text back unchanged and object keys in
/// sorted order, so the compact dump of a Value is also its canonical
/// form.

#pragma once

#include <jsonpatch-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

// =============================================================================
// Text codec
// =============================================================================

/// Deepest container nesting accepted by parse.
inline constexpr std::size_t max_nesting_depth = 1000;

/// Parse a complete JSON document.
///
/// Number tokens keep their source text, including `-0` and values
/// outside the range of a double such as `1e400`.
///
/// @throws Exception (parse_error) on malformed input, trailing data or
///         containers nested deeper than max_nesting_depth.
auto parse(std::string_view text) -> Value;

/// Serialize a value.
/// @param indent Negative for the compact form; otherwise the number of
///               spaces per nesting level.
auto dump(const Value& value, int indent = -1) -> std::string;

/// Number of bytes in the compact serialization of a value, including
/// quotes, braces and brackets.
auto dump_size(const Value& value) -> std::size_t;

/// True if the trimmed text starts with `[` and ends with `]`.
/// Only the outer syntax is checked.
auto resembles_array(std::string_view text) -> bool;

/// Split the text of a JSON array into the raw text of its top-level
/// elements, with surrounding whitespace trimmed.
/// The text must already be known to be a valid JSON array.
auto split_array_elements(std::string_view text) -> std::vector<std::string_view>;

/// Compare two documents for JSON equality.
///
/// Object key order is irrelevant, array order is significant. Returns
/// false if either buffer fails to parse.
auto equal(std::string_view a, std::string_view b) -> bool;

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

/// Convert a Value to a nlohmann::json. Number text is re-parsed by
/// nlohmann, so values beyond double precision are rounded.
/// @throws Exception (type_mismatch) for a number outside the range of a
///         double.
void to_json(nlohmann::json& j, const Value& value);

/// Convert a nlohmann::json to a Value. Numbers take nlohmann's
/// serialization as their text.
void from_json(const nlohmann::json& j, Value& value);

}  // namespace jsonpatch_cpp
