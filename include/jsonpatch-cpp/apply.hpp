/// @file apply.hpp
/// @brief Patch application (RFC 6902) with bounds and resource checks.

#pragma once

#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace jsonpatch_cpp {

/// Environment variable that seeds the process-wide copy size limit.
inline constexpr auto accumulated_copy_size_limit_env = "JSONPATCH_CPP_ACCUMULATED_COPY_SIZE_LIMIT";

/// Per-call settings for apply_patch.
struct ApplyOptions {
    /// Upper bound on the total bytes copied by `copy` operations within
    /// one apply_patch call, measured as the compact serialization of
    /// each copied value. 0 means unbounded.
    std::int64_t accumulated_copy_size_limit{0};

    /// Accept negative array indices counting from the end: `-1` is the
    /// last element for remove/replace/test/from and one past the last
    /// element for add.
    bool support_negative_indices{true};

    auto operator==(const ApplyOptions&) const -> bool = default;
};

/// The process-wide default copy size limit. Initialized from
/// `JSONPATCH_CPP_ACCUMULATED_COPY_SIZE_LIMIT` on first use, else 0.
auto default_accumulated_copy_size_limit() -> std::int64_t;

/// Change the process-wide default copy size limit. Calls already in
/// progress keep the options they were started with.
void set_default_accumulated_copy_size_limit(std::int64_t limit);

/// Options built from the current process-wide defaults.
auto default_apply_options() -> ApplyOptions;

/// Apply a patch to a parsed document.
///
/// Operations run strictly in order, each against the document as left
/// by the previous one. The input is never modified: a failing
/// operation aborts the call and no partial result is produced.
///
/// @throws Exception with kind not_found, out_of_bounds, bad_path,
///         resource_limit, test_failed or invalid_operation.
auto apply_patch_value(const Value& document, const Patch& patch,
                       const ApplyOptions& options = default_apply_options()) -> Value;

/// Parse `document`, apply `patch` and serialize the result compactly.
/// @throws Exception (parse_error) on a malformed document, otherwise as
///         apply_patch_value.
auto apply_patch(std::string_view document, const Patch& patch,
                 const ApplyOptions& options = default_apply_options()) -> std::string;

/// Decode the wire form of a patch and apply it.
auto apply_patch(std::string_view document, std::string_view patch,
                 const ApplyOptions& options = default_apply_options()) -> std::string;

}  // namespace jsonpatch_cpp
