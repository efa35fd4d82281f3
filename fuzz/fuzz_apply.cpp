// Fuzz target for decode_patch() and apply_patch(). The input is split at the
// first NUL byte into a document and a patch; every failure must surface as
// jsonpatch_cpp::Exception.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\0');
    if (split == std::string_view::npos) return 0;

    const auto document = input.substr(0, split);
    const auto patch = input.substr(split + 1);
    // Bound copy amplification so the fuzzer does not run out of memory.
    const auto options = jsonpatch_cpp::ApplyOptions{.accumulated_copy_size_limit = 1 << 20};

    try {
        auto result = jsonpatch_cpp::apply_patch(document, patch, options);
        // Applied output must itself be a valid document
        (void)jsonpatch_cpp::parse(result);
    } catch (const jsonpatch_cpp::Exception&) {
    }
    return 0;
}
