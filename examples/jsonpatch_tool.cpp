// jsonpatch_tool - command-line front end for jsonpatch-cpp
//
// Usage:
//   jsonpatch_tool [options] diff ORIGINAL MODIFIED   print the patch
//   jsonpatch_tool [options] apply DOCUMENT PATCH     print the patched document
//   jsonpatch_tool [options] equal A B                exit 0 if equal, 1 if not
//
// Options:
//   --pretty        indent output by two spaces
//   --sort          sort diff output by path
//   --limit N       accumulated copy size limit for apply (0 = unbounded)
//   --verbose       log library activity to stderr
//
// Exit status: 0 on success, 1 for "not equal", 2 on usage or I/O errors,
// 3 when the library reports an error.

#include <jsonpatch-cpp/jsonpatch.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace jp = jsonpatch_cpp;

namespace {

struct Options {
    bool pretty{false};
    bool sort{false};
    bool verbose{false};
    jp::ApplyOptions apply{jp::default_apply_options()};
};

auto usage() -> int {
    std::fprintf(stderr,
                 "usage: jsonpatch_tool [--pretty] [--sort] [--limit N] [--verbose]\n"
                 "                      (diff ORIGINAL MODIFIED | apply DOCUMENT PATCH | equal A B)\n");
    return 2;
}

auto read_file(const std::string& path) -> std::optional<std::string> {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) return std::nullopt;
    auto buffer = std::ostringstream{};
    buffer << in.rdbuf();
    return buffer.str();
}

auto parse_limit(std::string_view text) -> std::optional<std::int64_t> {
    auto limit = std::int64_t{0};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), limit);
    if (ec != std::errc{} || ptr != text.data() + text.size() || limit < 0) return std::nullopt;
    return limit;
}

// Registers the library logger before first use so that its output goes
// through the tool's sink.
void configure_logging(bool verbose) {
    auto logger = spdlog::stderr_color_mt("jsonpatch-cpp");
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

auto run(const std::string& command, const std::string& first, const std::string& second,
         const Options& options) -> int {
    const auto a = read_file(first);
    if (!a) {
        spdlog::error("cannot read {}", first);
        return 2;
    }
    const auto b = read_file(second);
    if (!b) {
        spdlog::error("cannot read {}", second);
        return 2;
    }
    const auto indent = options.pretty ? 2 : -1;

    if (command == "diff") {
        auto patch = jp::create_patch(*a, *b);
        if (options.sort) jp::sort_by_path(patch);
        std::printf("%s\n", jp::encode_patch(patch, indent).c_str());
        return 0;
    }
    if (command == "apply") {
        auto result = jp::apply_patch(*a, *b, options.apply);
        if (options.pretty) result = jp::dump(jp::parse(result), indent);
        std::printf("%s\n", result.c_str());
        return 0;
    }
    if (command == "equal") {
        const auto same = jp::equal(*a, *b);
        std::printf("%s\n", same ? "equal" : "different");
        return same ? 0 : 1;
    }
    return usage();
}

}  // anonymous namespace

int main(int argc, char** argv) {
    auto options = Options{};
    auto positional = std::vector<std::string>{};

    for (int i = 1; i < argc; ++i) {
        const auto arg = std::string_view{argv[i]};
        if (arg == "--pretty") {
            options.pretty = true;
        } else if (arg == "--sort") {
            options.sort = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--limit") {
            if (i + 1 >= argc) return usage();
            auto limit = parse_limit(argv[++i]);
            if (!limit) {
                std::fprintf(stderr, "invalid --limit value: %s\n", argv[i]);
                return 2;
            }
            options.apply.accumulated_copy_size_limit = *limit;
        } else if (arg.starts_with("--")) {
            return usage();
        } else {
            positional.emplace_back(arg);
        }
    }
    if (positional.size() != 3) return usage();

    configure_logging(options.verbose);

    try {
        return run(positional[0], positional[1], positional[2], options);
    } catch (const jp::Exception& e) {
        spdlog::get("jsonpatch-cpp")->error("{}: {}", jp::to_string_view(e.kind()), e.what());
        return 3;
    }
}
