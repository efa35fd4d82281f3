#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/json.hpp>

#include <algorithm>
#include <array>
#include <string>
#include <utility>

namespace jsonpatch_cpp {

namespace {

constexpr auto all_op_types = std::array{
    OpType::add, OpType::remove, OpType::replace,
    OpType::move, OpType::copy, OpType::test,
};

auto has_from(OpType type) -> bool {
    return type == OpType::move || type == OpType::copy;
}

auto requires_value(OpType type) -> bool {
    return type == OpType::add || type == OpType::replace;
}

auto to_value(const Operation& operation) -> Value {
    auto obj = Object{};
    obj["op"] = Value{to_string_view(operation.op)};
    obj["path"] = Value{operation.path};
    if (has_from(operation.op) && operation.from) {
        obj["from"] = Value{*operation.from};
    }
    if (operation.value) {
        obj["value"] = *operation.value;
    } else if (requires_value(operation.op)) {
        obj["value"] = Value{Null{}};
    }
    return Value{std::move(obj)};
}

[[noreturn]] void invalid_entry(std::size_t index, std::string_view what) {
    throw Exception{ErrorKind::invalid_operation,
                    "operation " + std::to_string(index) + ": " + std::string{what}};
}

auto string_member(const Object& obj, const std::string& key) -> const std::string* {
    auto it = obj.find(key);
    if (it == obj.end()) return nullptr;
    return it->second.get_if<std::string>();
}

auto decode_operation(const Value& entry, std::size_t index) -> Operation {
    const auto* obj = entry.get_if<Object>();
    if (!obj) invalid_entry(index, "not an object");

    const auto* op_name = string_member(*obj, "op");
    if (!op_name) invalid_entry(index, "missing or invalid 'op'");
    auto type = op_type_from_string(*op_name);
    if (!type) invalid_entry(index, "unknown op '" + *op_name + "'");

    const auto* path = string_member(*obj, "path");
    if (!path) invalid_entry(index, "missing or invalid 'path'");

    auto operation = Operation{.op = *type, .path = *path};

    if (has_from(*type)) {
        const auto* from = string_member(*obj, "from");
        if (!from) invalid_entry(index, "missing or invalid 'from'");
        operation.from = *from;
    }

    if (auto it = obj->find("value"); it != obj->end()) {
        operation.value = it->second;
    } else if (requires_value(*type)) {
        invalid_entry(index, "missing 'value'");
    }
    return operation;
}

}  // anonymous namespace

auto op_type_from_string(std::string_view name) -> std::optional<OpType> {
    for (auto type : all_op_types) {
        if (to_string_view(type) == name) return type;
    }
    return std::nullopt;
}

auto to_string(const Operation& operation) -> std::string {
    return dump(to_value(operation));
}

auto encode_patch(const Patch& patch, int indent) -> std::string {
    auto arr = Array{};
    arr.reserve(patch.size());
    for (const auto& operation : patch) {
        arr.push_back(to_value(operation));
    }
    return dump(Value{std::move(arr)}, indent);
}

auto decode_patch(std::string_view text) -> Patch {
    return decode_patch_value(parse(text));
}

auto decode_patch_value(const Value& document) -> Patch {
    const auto* entries = document.get_if<Array>();
    if (!entries) {
        throw Exception{ErrorKind::invalid_operation, "JSON Patch must be an array"};
    }
    auto patch = Patch{};
    patch.reserve(entries->size());
    for (std::size_t i = 0; i < entries->size(); ++i) {
        patch.push_back(decode_operation((*entries)[i], i));
    }
    return patch;
}

void sort_by_path(Patch& patch) {
    std::ranges::stable_sort(patch, {}, &Operation::path);
}

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, OpType type) {
    j = std::string{to_string_view(type)};
}

void from_json(const nlohmann::json& j, OpType& type) {
    auto parsed = op_type_from_string(j.get<std::string>());
    if (!parsed) {
        throw Exception{ErrorKind::invalid_operation,
                        "unknown op '" + j.get<std::string>() + "'"};
    }
    type = *parsed;
}

void to_json(nlohmann::json& j, const Operation& operation) {
    to_json(j, to_value(operation));
}

void from_json(const nlohmann::json& j, Operation& operation) {
    auto entry = Value{};
    from_json(j, entry);
    operation = decode_operation(entry, 0);
}

}  // namespace jsonpatch_cpp
