// basic_usage - demonstrates the core jsonpatch-cpp API
//
// Computes a patch between two documents, prints its wire form, replays it,
// and shows how failures are reported.
//
// Build: cmake --build build
// Run:   ./build/basic_usage

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstdio>
#include <string>

namespace jp = jsonpatch_cpp;

int main() {
    const auto original = std::string{R"({
        "title": "Shopping List",
        "items": ["Milk", "Eggs", "Bread"],
        "config": {"theme": "dark", "lang": "en"}
    })"};
    const auto modified = std::string{R"({
        "title": "Shopping List",
        "items": ["Milk", "Eggs", "Bread", "Butter"],
        "config": {"theme": "light", "lang": "en"},
        "owner": "Alice"
    })"};

    // -- Diff -----------------------------------------------------------------
    auto patch = jp::create_patch(original, modified);
    jp::sort_by_path(patch);
    std::printf("Patch (%zu operations):\n%s\n", patch.size(),
                jp::encode_patch(patch, 2).c_str());

    // -- Apply ----------------------------------------------------------------
    const auto result = jp::apply_patch(original, patch);
    std::printf("Result: %s\n", result.c_str());
    std::printf("Matches target: %s\n", jp::equal(result, modified) ? "yes" : "no");

    // -- Hand-written patch with test and move --------------------------------
    const auto edits = std::string{R"([
        {"op": "test", "path": "/items/0", "value": "Milk"},
        {"op": "move", "from": "/items/0", "path": "/items/-"},
        {"op": "copy", "from": "/config/theme", "path": "/theme"},
        {"op": "remove", "path": "/items/-1"}
    ])"};
    std::printf("Edited: %s\n", jp::apply_patch(result, edits).c_str());

    // -- Working with parsed values -------------------------------------------
    auto doc = jp::parse(R"({"counter": 1})");
    auto bump = jp::Patch{{
        .op = jp::OpType::replace,
        .path = "/counter",
        .value = jp::Value{2},
    }};
    doc = jp::apply_patch_value(doc, bump);
    std::printf("Counter: %s\n", jp::dump(doc).c_str());

    // -- Errors ---------------------------------------------------------------
    try {
        jp::apply_patch(R"({"baz": "qux"})", R"([{"op": "test", "path": "/baz", "value": "bar"}])");
    } catch (const jp::Exception& e) {
        std::printf("Failed (%s): %s\n",
                    std::string{jp::to_string_view(e.kind())}.c_str(), e.what());
    }

    try {
        auto limited = jp::ApplyOptions{.accumulated_copy_size_limit = 8};
        jp::apply_patch(R"({"a": "0123456789"})",
                        R"([{"op": "copy", "from": "/a", "path": "/b"}])", limited);
    } catch (const jp::Exception& e) {
        std::printf("Failed (%s): %s\n",
                    std::string{jp::to_string_view(e.kind())}.c_str(), e.what());
    }

    return 0;
}
