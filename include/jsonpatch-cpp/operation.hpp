/// @file operation.hpp
/// @brief JSON Patch (RFC 6902) operations and their wire encoding.

#pragma once

#include <jsonpatch-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

/// The kind of edit an operation performs.
enum class OpType : std::uint8_t {
    add,      ///< Insert into an array or create/overwrite an object member.
    remove,   ///< Delete the target.
    replace,  ///< Overwrite an existing target.
    move,     ///< Remove at `from`, then add at `path`.
    copy,     ///< Add a deep copy of the value at `from`.
    test,     ///< Assert the target equals `value`.
};

/// Convert an OpType to its wire name.
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::add:     return "add";
        case OpType::remove:  return "remove";
        case OpType::replace: return "replace";
        case OpType::move:    return "move";
        case OpType::copy:    return "copy";
        case OpType::test:    return "test";
    }
    return "unknown";
}

/// Look up an OpType by its wire name.
auto op_type_from_string(std::string_view name) -> std::optional<OpType>;

/// A single step of a patch.
///
/// `value` distinguishes an absent value (nullopt) from an explicit
/// JSON null. `from` is only meaningful for move and copy.
struct Operation {
    OpType op;                         ///< The kind of edit.
    std::string path;                  ///< Target pointer.
    std::optional<Value> value{};      ///< Payload for add/replace/test.
    std::optional<std::string> from{}; ///< Source pointer for move/copy.

    auto operator==(const Operation&) const -> bool = default;
};

/// An ordered list of operations, applied left to right.
using Patch = std::vector<Operation>;

/// Render one operation in the wire form, e.g.
/// `{"op":"replace","path":"/a","value":1}`.
auto to_string(const Operation& operation) -> std::string;

/// Encode a patch as a JSON array.
///
/// `value` is written whenever it is present, and always for add and
/// replace (as null when absent). `from` is written for move and copy.
/// Number text is written verbatim.
auto encode_patch(const Patch& patch, int indent = -1) -> std::string;

/// Decode the wire form of a patch.
/// @throws Exception (parse_error) on malformed JSON, (invalid_operation)
///         on a structurally invalid patch or entry.
auto decode_patch(std::string_view text) -> Patch;

/// Convert an already parsed patch document.
/// @throws Exception (invalid_operation) on a structurally invalid patch.
auto decode_patch_value(const Value& document) -> Patch;

/// Stable sort of a patch by path, for callers that need a
/// deterministic order. Sorting can change the result of applying a
/// patch whose operations touch the same array.
void sort_by_path(Patch& patch);

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, OpType type);
void from_json(const nlohmann::json& j, OpType& type);

void to_json(nlohmann::json& j, const Operation& operation);
void from_json(const nlohmann::json& j, Operation& operation);

}  // namespace jsonpatch_cpp
