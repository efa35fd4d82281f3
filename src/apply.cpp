#include <jsonpatch-cpp/apply.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/pointer.hpp>

#include "logging.hpp"

#include <atomic>
#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace jsonpatch_cpp {

// =============================================================================
// Configuration
// =============================================================================

namespace {

auto limit_from_environment() -> std::int64_t {
    const char* raw = std::getenv(accumulated_copy_size_limit_env);
    if (!raw) return 0;

    auto text = std::string_view{raw};
    auto limit = std::int64_t{0};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), limit);
    if (ec != std::errc{} || ptr != text.data() + text.size() || limit < 0) {
        detail::logger()->warn("ignoring invalid {}='{}'", accumulated_copy_size_limit_env, text);
        return 0;
    }
    return limit;
}

auto default_limit() -> std::atomic<std::int64_t>& {
    static auto limit = std::atomic<std::int64_t>{limit_from_environment()};
    return limit;
}

}  // anonymous namespace

auto default_accumulated_copy_size_limit() -> std::int64_t {
    return default_limit().load();
}

void set_default_accumulated_copy_size_limit(std::int64_t limit) {
    default_limit().store(limit);
}

auto default_apply_options() -> ApplyOptions {
    return ApplyOptions{.accumulated_copy_size_limit = default_accumulated_copy_size_limit()};
}

// =============================================================================
// Executor
// =============================================================================

namespace {

enum class IndexMode {
    insert,    // [0, len], "-" allowed
    existing,  // [0, len)
};

// Applies operations to a private working document.
class PatchExecutor {
public:
    PatchExecutor(Value& document, const ApplyOptions& options)
        : document_{document}, options_{options} {}

    void apply(const Operation& operation) {
        switch (operation.op) {
            case OpType::add:
                add(operation.path, required_value(operation));
                return;
            case OpType::remove:
                remove(operation.path);
                return;
            case OpType::replace:
                replace(operation.path, required_value(operation));
                return;
            case OpType::move:
                move(required_from(operation), operation.path);
                return;
            case OpType::copy:
                copy(required_from(operation), operation.path);
                return;
            case OpType::test:
                test(operation.path, operation.value);
                return;
        }
        throw Exception{ErrorKind::internal_fault, "unknown operation type"};
    }

private:
    // -- Operations -----------------------------------------------------------

    void add(const std::string& path, Value value) {
        auto [parent, token] = resolve_parent(path);
        if (auto* obj = parent->get_if<Object>()) {
            (*obj)[token] = std::move(value);
            return;
        }
        if (auto* arr = parent->get_if<Array>()) {
            auto index = array_index(*arr, token, IndexMode::insert, path);
            arr->insert(arr->begin() + static_cast<std::ptrdiff_t>(index), std::move(value));
            return;
        }
        not_found(path);
    }

    auto remove(const std::string& path) -> Value {
        auto [parent, token] = resolve_parent(path);
        if (auto* obj = parent->get_if<Object>()) {
            auto it = obj->find(token);
            if (it == obj->end()) not_found(path);
            auto removed = std::move(it->second);
            obj->erase(it);
            return removed;
        }
        if (auto* arr = parent->get_if<Array>()) {
            auto index = array_index(*arr, token, IndexMode::existing, path);
            auto it = arr->begin() + static_cast<std::ptrdiff_t>(index);
            auto removed = std::move(*it);
            arr->erase(it);
            return removed;
        }
        not_found(path);
    }

    void replace(const std::string& path, Value value) {
        *existing(path) = std::move(value);
    }

    void move(const std::string& from, const std::string& path) {
        if (from == path) {
            existing(from);
            return;
        }
        if (path.starts_with(from + "/") || from.empty()) {
            throw Exception{ErrorKind::bad_path,
                            "cannot move " + from + " into its own child " + path};
        }
        add(path, remove(from));
    }

    void copy(const std::string& from, const std::string& path) {
        auto value = *source(from);
        copied_ += static_cast<std::int64_t>(dump_size(value));
        const auto limit = options_.accumulated_copy_size_limit;
        if (limit > 0 && copied_ > limit) {
            throw Exception{ErrorKind::resource_limit,
                            "unable to copy " + from + ": accumulated copy size " +
                            std::to_string(copied_) + " exceeds limit " + std::to_string(limit)};
        }
        add(path, std::move(value));
    }

    // A missing target is equivalent to null.
    void test(const std::string& path, const std::optional<Value>& expected) {
        const auto* actual = lookup(path);
        const auto passed = actual
            ? (expected ? *actual == *expected : actual->is_null())
            : (!expected || expected->is_null());
        if (!passed) {
            throw Exception{ErrorKind::test_failed, "testing value " + path + " failed"};
        }
    }

    // -- Resolution -----------------------------------------------------------

    struct Location {
        Value* parent;
        std::string token;
    };

    // Resolves every token but the last. The root itself has no parent
    // and is not a valid target.
    auto resolve_parent(const std::string& path) -> Location {
        auto tokens = split_pointer(path);
        if (tokens.empty()) {
            throw Exception{ErrorKind::bad_path, "the document root is not a valid target"};
        }
        auto* current = &document_;
        for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
            current = child(*current, tokens[i]);
            if (!current) not_found(path);
        }
        return Location{current, std::move(tokens.back())};
    }

    // The value at an existing non-root path.
    auto existing(const std::string& path) -> Value* {
        auto [parent, token] = resolve_parent(path);
        if (auto* obj = parent->get_if<Object>()) {
            auto it = obj->find(token);
            if (it == obj->end()) not_found(path);
            return &it->second;
        }
        if (auto* arr = parent->get_if<Array>()) {
            return &(*arr)[array_index(*arr, token, IndexMode::existing, path)];
        }
        not_found(path);
    }

    // The value at an existing path, root included.
    auto source(const std::string& path) -> Value* {
        if (path.empty()) return &document_;
        return existing(path);
    }

    // Non-throwing resolution for test: nullptr when any step is missing.
    auto lookup(const std::string& path) -> const Value* {
        auto* current = &document_;
        for (const auto& token : split_pointer(path)) {
            current = child(*current, token);
            if (!current) return nullptr;
        }
        return current;
    }

    auto child(Value& node, const std::string& token) -> Value* {
        if (auto* obj = node.get_if<Object>()) {
            auto it = obj->find(token);
            return it == obj->end() ? nullptr : &it->second;
        }
        if (auto* arr = node.get_if<Array>()) {
            auto index = normalize(*arr, token, IndexMode::existing);
            return index ? &(*arr)[*index] : nullptr;
        }
        return nullptr;
    }

    // Maps a token to an index valid for `mode`, or nullopt.
    auto normalize(const Array& arr, const std::string& token, IndexMode mode)
        -> std::optional<std::size_t> {
        const auto len = static_cast<std::int64_t>(arr.size());
        const auto upper = mode == IndexMode::insert ? len + 1 : len;
        if (token == end_token) {
            if (mode == IndexMode::insert) return arr.size();
            return std::nullopt;
        }
        auto index = parse_index(token);
        if (!index) return std::nullopt;
        if (*index < 0) {
            if (!options_.support_negative_indices || *index < -upper) return std::nullopt;
            *index += upper;
        }
        if (*index >= upper) return std::nullopt;
        return static_cast<std::size_t>(*index);
    }

    auto array_index(const Array& arr, const std::string& token, IndexMode mode,
                     const std::string& path) -> std::size_t {
        if (token != end_token && !parse_index(token)) {
            throw Exception{ErrorKind::bad_path,
                            "invalid array index '" + token + "' in " + path};
        }
        auto index = normalize(arr, token, mode);
        if (!index) {
            throw Exception{ErrorKind::out_of_bounds,
                            "array index out of bounds: " + path +
                            " (length " + std::to_string(arr.size()) + ")"};
        }
        return *index;
    }

    auto required_value(const Operation& operation) -> Value {
        if (!operation.value) {
            throw Exception{ErrorKind::invalid_operation,
                            std::string{to_string_view(operation.op)} + " " +
                            operation.path + " is missing a value"};
        }
        return *operation.value;
    }

    auto required_from(const Operation& operation) -> const std::string& {
        if (!operation.from) {
            throw Exception{ErrorKind::invalid_operation,
                            std::string{to_string_view(operation.op)} + " " +
                            operation.path + " is missing 'from'"};
        }
        return *operation.from;
    }

    [[noreturn]] void not_found(const std::string& path) {
        throw Exception{ErrorKind::not_found, "path not found: " + path};
    }

    Value& document_;
    const ApplyOptions& options_;
    std::int64_t copied_{0};
};

}  // anonymous namespace

auto apply_patch_value(const Value& document, const Patch& patch,
                       const ApplyOptions& options) -> Value {
    auto working = document;
    auto executor = PatchExecutor{working, options};

    detail::logger()->debug("apply_patch: {} operation(s)", patch.size());
    for (std::size_t i = 0; i < patch.size(); ++i) {
        try {
            executor.apply(patch[i]);
        } catch (const Exception& e) {
            detail::logger()->debug("apply_patch aborted at operation {} ({}): {}",
                                    i, to_string_view(e.kind()), e.what());
            throw;
        }
    }
    return working;
}

auto apply_patch(std::string_view document, const Patch& patch,
                 const ApplyOptions& options) -> std::string {
    return dump(apply_patch_value(parse(document), patch, options));
}

auto apply_patch(std::string_view document, std::string_view patch,
                 const ApplyOptions& options) -> std::string {
    return apply_patch(document, decode_patch(patch), options);
}

}  // namespace jsonpatch_cpp
