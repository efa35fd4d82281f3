// Fuzz target for create_patch(). The input is split at the first NUL byte
// into two documents. Whenever a patch is produced, replaying it against the
// first document must reproduce the second.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\0');
    if (split == std::string_view::npos) return 0;

    const auto original = input.substr(0, split);
    const auto modified = input.substr(split + 1);

    auto patch = jsonpatch_cpp::Patch{};
    try {
        patch = jsonpatch_cpp::create_patch(original, modified);
    } catch (const jsonpatch_cpp::Exception&) {
        return 0;
    }

    const auto options = jsonpatch_cpp::ApplyOptions{};
    const auto result = jsonpatch_cpp::apply_patch(original, patch, options);
    if (!jsonpatch_cpp::equal(result, modified)) std::abort();
    return 0;
}
