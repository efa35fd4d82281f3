// apply_environment_test.cpp - Tests for seeding the default copy size limit
// from the environment
//
// The process default is read once, on first use. Each case runs in a child
// process (EXPECT_EXIT) so that it sets the variable before that first read.
// Nothing in this binary may touch the default outside such a child.

#include <jsonpatch-cpp/apply.hpp>
#include <jsonpatch-cpp/error.hpp>

#include <gtest/gtest.h>

#include <cstdlib>

using namespace jsonpatch_cpp;

namespace {

auto copy_size_of_eight_fails() -> bool {
    try {
        (void)apply_patch(R"({"a":"0123456789"})", R"([{"op":"copy","from":"/a","path":"/b"}])");
    } catch (const Exception& e) {
        return e.kind() == ErrorKind::resource_limit;
    }
    return false;
}

}  // namespace

TEST(ApplyEnvironment, seeds_the_process_default) {
    EXPECT_EXIT({
        ::setenv(accumulated_copy_size_limit_env, "8", 1);
        const auto ok = default_accumulated_copy_size_limit() == 8 &&
                        default_apply_options().accumulated_copy_size_limit == 8 &&
                        copy_size_of_eight_fails();
        std::exit(ok ? 0 : 1);
    }, ::testing::ExitedWithCode(0), "");
}

TEST(ApplyEnvironment, unset_means_unbounded) {
    EXPECT_EXIT({
        ::unsetenv(accumulated_copy_size_limit_env);
        const auto ok = default_accumulated_copy_size_limit() == 0 && !copy_size_of_eight_fails();
        std::exit(ok ? 0 : 1);
    }, ::testing::ExitedWithCode(0), "");
}

TEST(ApplyEnvironment, setter_overrides_the_seed) {
    EXPECT_EXIT({
        ::setenv(accumulated_copy_size_limit_env, "8", 1);
        set_default_accumulated_copy_size_limit(0);
        std::exit(default_apply_options().accumulated_copy_size_limit == 0 ? 0 : 1);
    }, ::testing::ExitedWithCode(0), "");
}

TEST(ApplyEnvironment, invalid_value_is_ignored_with_a_warning) {
    EXPECT_EXIT({
        ::setenv(accumulated_copy_size_limit_env, "lots", 1);
        std::exit(default_accumulated_copy_size_limit() == 0 ? 0 : 1);
    }, ::testing::ExitedWithCode(0),
       "ignoring invalid JSONPATCH_CPP_ACCUMULATED_COPY_SIZE_LIMIT='lots'");
}

TEST(ApplyEnvironment, negative_value_is_ignored_with_a_warning) {
    EXPECT_EXIT({
        ::setenv(accumulated_copy_size_limit_env, "-5", 1);
        std::exit(default_accumulated_copy_size_limit() == 0 ? 0 : 1);
    }, ::testing::ExitedWithCode(0),
       "ignoring invalid JSONPATCH_CPP_ACCUMULATED_COPY_SIZE_LIMIT='-5'");
}
