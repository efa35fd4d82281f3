#include <jsonpatch-cpp/diff.hpp>
#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/pointer.hpp>

#include "array_reconciler.hpp"
#include "logging.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

namespace {

// Walks two value trees in lock-step, appending operations to a patch.
class Differ {
public:
    explicit Differ(Patch& patch) : patch_{patch} {}

    // A change of kind is always a full replace; same kinds are compared
    // by handle_values.
    void diff_element(const Value& a, const Value& b, const std::string& path) {
        if (!same_kind(a, b)) {
            emit(OpType::replace, path, b);
            return;
        }
        handle_values(a, b, path);
    }

    void diff_objects(const Object& a, const Object& b, std::string_view prefix) {
        for (const auto& [key, bv] : b) {
            auto path = append_token(prefix, key);
            auto it = a.find(key);
            if (it == a.end()) {
                emit(OpType::add, path, bv);
                continue;
            }
            diff_element(it->second, bv, path);
        }
        for (const auto& [key, av] : a) {
            if (!b.contains(key)) {
                patch_.push_back(Operation{.op = OpType::remove,
                                           .path = append_token(prefix, key)});
            }
        }
    }

    void diff_arrays(const Array& a, const Array& b, const std::string& path) {
        auto diff_at = [&](std::size_t i, const std::string& element_path) {
            diff_element(a[i], b[i], element_path);
        };
        if (a.size() == b.size()) {
            detail::diff_index_aligned(a, b, path, diff_at, patch_);
        } else {
            detail::reconcile_by_content(a, b, path, diff_at, patch_);
        }
    }

    // Root arrays additionally get the sliding-window check. Elements
    // compare by raw source text first when it is available.
    void diff_root_arrays(const Array& a, const Array& b,
                          const std::vector<std::string_view>& raw_a,
                          const std::vector<std::string_view>& raw_b) {
        const auto has_raw = raw_a.size() == a.size() && raw_b.size() == b.size();
        auto raw_equal = [&](std::size_t i, std::size_t j) {
            return has_raw && raw_a[i] == raw_b[j];
        };
        auto matches = [&](std::size_t i, std::size_t j) {
            return raw_equal(i, j) || a[i] == b[j];
        };
        auto diff_at = [&](std::size_t i, const std::string& element_path) {
            if (raw_equal(i, i)) return;
            diff_element(a[i], b[i], element_path);
        };

        if (a.size() != b.size()) {
            detail::reconcile_by_content(a, b, "", diff_at, patch_);
            return;
        }
        if (a == b) return;
        if (detail::reconcile_sliding_window(a, b, "", matches, patch_)) return;
        detail::diff_index_aligned(a, b, "", diff_at, patch_);
    }

private:
    void handle_values(const Value& a, const Value& b, const std::string& path) {
        std::visit(overload{
            [&](Null) {},
            [&](bool) { replace_if_different(a, b, path); },
            [&](const Number&) { replace_if_different(a, b, path); },
            [&](const std::string&) { replace_if_different(a, b, path); },
            [&](const Array& arr) { diff_arrays(arr, std::get<Array>(b.data), path); },
            [&](const Object& obj) { diff_objects(obj, std::get<Object>(b.data), path); },
        }, a.data);
    }

    void replace_if_different(const Value& a, const Value& b, const std::string& path) {
        if (!(a == b)) emit(OpType::replace, path, b);
    }

    void emit(OpType op, const std::string& path, const Value& value) {
        patch_.push_back(Operation{.op = op, .path = path, .value = value});
    }

    Patch& patch_;
};

[[noreturn]] void mismatched_documents() {
    throw Exception{ErrorKind::type_mismatch, "mismatched JSON documents"};
}

auto diff_roots(const Value& original, const Value& modified,
                const std::vector<std::string_view>& raw_original,
                const std::vector<std::string_view>& raw_modified) -> Patch {
    auto patch = Patch{};
    auto differ = Differ{patch};

    const auto* original_array = original.get_if<Array>();
    const auto* modified_array = modified.get_if<Array>();
    if (original_array && modified_array) {
        differ.diff_root_arrays(*original_array, *modified_array,
                                raw_original, raw_modified);
        return patch;
    }
    if (original_array || modified_array) mismatched_documents();

    const auto* original_object = original.get_if<Object>();
    const auto* modified_object = modified.get_if<Object>();
    if (original_object && modified_object) {
        differ.diff_objects(*original_object, *modified_object, "");
        return patch;
    }
    // Non-object roots can only be equal: the root is not a valid
    // replace target.
    if (!(original == modified)) mismatched_documents();
    return patch;
}

}  // anonymous namespace

auto create_patch(std::string_view original, std::string_view modified) -> Patch {
    if (original == modified) return {};

    const auto original_is_array = resembles_array(original);
    const auto modified_is_array = resembles_array(modified);
    if (original_is_array != modified_is_array) mismatched_documents();

    const auto a = parse(original);
    const auto b = parse(modified);

    auto raw_a = std::vector<std::string_view>{};
    auto raw_b = std::vector<std::string_view>{};
    if (original_is_array) {
        const auto* arr_a = a.get_if<Array>();
        const auto* arr_b = b.get_if<Array>();
        raw_a = split_array_elements(original);
        raw_b = split_array_elements(modified);
        if (!arr_a || !arr_b || raw_a.size() != arr_a->size() || raw_b.size() != arr_b->size()) {
            throw Exception{ErrorKind::internal_fault,
                            "array element split disagrees with the parsed document"};
        }
    }

    auto patch = diff_roots(a, b, raw_a, raw_b);
    detail::logger()->debug("create_patch: {} operation(s)", patch.size());
    return patch;
}

auto diff(const Value& original, const Value& modified) -> Patch {
    return diff_roots(original, modified, {}, {});
}

}  // namespace jsonpatch_cpp
