#pragma once

// Array-to-array reconciliation for the diff engine.
// Internal header, not installed.

#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace jsonpatch_cpp::detail {

// Reports whether original[i] and modified[j] hold the same value.
using ElementMatch = std::function<bool(std::size_t i, std::size_t j)>;

// Emits the operations turning original[i] into modified[i] at `path`.
using ElementDiff = std::function<void(std::size_t i, const std::string& path)>;

// Detects a single-step sliding window between two equal-length arrays
// of more than two elements and emits the two operations describing it.
// Returns false, emitting nothing, if neither shift direction matches.
//
//   ascending:  [a b c] -> [b c d]   remove /0, add /2 d
//   descending: [b c d] -> [a b c]   add /0 a, remove /3
auto reconcile_sliding_window(const Array& original, const Array& modified,
                              std::string_view path, const ElementMatch& matches,
                              Patch& patch) -> bool;

// Content-addressed reconciliation. Elements are bucketed by their
// canonical dump; surplus occurrences on either side become removes
// (descending index) or adds (ascending index). If the surviving
// elements would end up out of order, falls back to
// diff_index_aligned.
void reconcile_by_content(const Array& original, const Array& modified,
                          std::string_view path, const ElementDiff& diff_element,
                          Patch& patch);

// Diffs the common prefix index by index, then removes the surplus tail
// of `original` (descending) or appends the tail of `modified`.
void diff_index_aligned(const Array& original, const Array& modified,
                        std::string_view path, const ElementDiff& diff_element,
                        Patch& patch);

}  // namespace jsonpatch_cpp::detail
