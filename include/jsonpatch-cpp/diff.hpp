/// @file diff.hpp
/// @brief Patch generation: compute the operations turning one document
/// into another.

#pragma once

#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <string_view>

namespace jsonpatch_cpp {

/// Compute a patch transforming `original` into `modified`.
///
/// Byte-identical inputs produce an empty patch without parsing. Two
/// arrays are reconciled element-wise (detecting single-step sliding
/// windows and duplicate counts); two objects are diffed recursively.
/// Only add, remove and replace operations are produced. The order of
/// operations on different object members is unspecified; operations
/// on one array are ordered so that sequential replay is correct.
///
/// @throws Exception (parse_error) if either buffer is malformed,
///         (type_mismatch) if exactly one of them is an array, or if
///         the roots are different non-object values.
auto create_patch(std::string_view original, std::string_view modified) -> Patch;

/// Compute a patch between two parsed documents. Same rules as
/// create_patch, without the raw-text shortcuts.
auto diff(const Value& original, const Value& modified) -> Patch;

}  // namespace jsonpatch_cpp
