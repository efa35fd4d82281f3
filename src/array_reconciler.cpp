#include "array_reconciler.hpp"

#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/pointer.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace jsonpatch_cpp::detail {

namespace {

using Buckets = std::unordered_map<std::string, std::vector<std::size_t>>;

auto content_keys(const Array& values) -> std::vector<std::string> {
    auto keys = std::vector<std::string>{};
    keys.reserve(values.size());
    for (const auto& v : values) keys.push_back(dump(v));
    return keys;
}

auto bucket(const std::vector<std::string>& keys) -> Buckets {
    auto buckets = Buckets{};
    for (std::size_t i = 0; i < keys.size(); ++i) {
        buckets[keys[i]].push_back(i);
    }
    return buckets;
}

// Collects the last (own - other) indices of every bucket that occurs
// more often in `own` than in `other`.
auto surplus(const Buckets& own, const Buckets& other) -> std::vector<std::size_t> {
    auto result = std::vector<std::size_t>{};
    for (const auto& [key, indices] : own) {
        auto it = other.find(key);
        auto matched = it == other.end() ? std::size_t{0} : it->second.size();
        if (indices.size() <= matched) continue;
        result.insert(result.end(),
                      indices.end() - static_cast<std::ptrdiff_t>(indices.size() - matched),
                      indices.end());
    }
    return result;
}

// The keys of the elements that are not in `dropped`, in array order.
auto survivors(const std::vector<std::string>& keys,
               const std::vector<std::size_t>& dropped) -> std::vector<std::string_view> {
    auto is_dropped = std::vector<bool>(keys.size(), false);
    for (auto i : dropped) is_dropped[i] = true;

    auto result = std::vector<std::string_view>{};
    result.reserve(keys.size() - dropped.size());
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (!is_dropped[i]) result.push_back(keys[i]);
    }
    return result;
}

void emit_remove(Patch& patch, std::string_view path, std::size_t index) {
    patch.push_back(Operation{.op = OpType::remove, .path = append_index(path, index)});
}

void emit_add(Patch& patch, std::string_view path, std::size_t index, const Value& value) {
    patch.push_back(Operation{
        .op = OpType::add,
        .path = append_index(path, index),
        .value = value,
    });
}

}  // anonymous namespace

auto reconcile_sliding_window(const Array& original, const Array& modified,
                              std::string_view path, const ElementMatch& matches,
                              Patch& patch) -> bool {
    const auto n = original.size();
    if (n != modified.size() || n <= 2) return false;

    auto ascending = true;
    auto descending = true;
    for (std::size_t i = 0; i + 1 < n && (ascending || descending); ++i) {
        if (ascending && !matches(i + 1, i)) ascending = false;
        if (descending && !matches(i, i + 1)) descending = false;
    }

    if (ascending) {
        emit_remove(patch, path, 0);
        emit_add(patch, path, n - 1, modified[n - 1]);
        return true;
    }
    if (descending) {
        emit_add(patch, path, 0, modified[0]);
        emit_remove(patch, path, n);
        return true;
    }
    return false;
}

void reconcile_by_content(const Array& original, const Array& modified,
                          std::string_view path, const ElementDiff& diff_element,
                          Patch& patch) {
    const auto original_keys = content_keys(original);
    const auto modified_keys = content_keys(modified);
    const auto original_buckets = bucket(original_keys);
    const auto modified_buckets = bucket(modified_keys);

    auto removes = surplus(original_buckets, modified_buckets);
    auto adds = surplus(modified_buckets, original_buckets);

    if (survivors(original_keys, removes) != survivors(modified_keys, adds)) {
        diff_index_aligned(original, modified, path, diff_element, patch);
        return;
    }

    std::ranges::sort(removes, std::greater<>{});
    std::ranges::sort(adds);
    for (auto i : removes) emit_remove(patch, path, i);
    for (auto i : adds) emit_add(patch, path, i, modified[i]);
}

void diff_index_aligned(const Array& original, const Array& modified,
                        std::string_view path, const ElementDiff& diff_element,
                        Patch& patch) {
    const auto common = std::min(original.size(), modified.size());
    for (std::size_t i = 0; i < common; ++i) {
        diff_element(i, append_index(path, i));
    }
    for (auto i = original.size(); i > common; --i) {
        emit_remove(patch, path, i - 1);
    }
    for (auto i = common; i < modified.size(); ++i) {
        emit_add(patch, path, i, modified[i]);
    }
}

}  // namespace jsonpatch_cpp::detail
