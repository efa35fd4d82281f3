#pragma once

// Library logger. Internal header, not installed.

#include <spdlog/spdlog.h>

#include <memory>

namespace jsonpatch_cpp::detail {

inline constexpr auto logger_name = "jsonpatch-cpp";

// The logger registered under logger_name. Applications that register
// their own logger under that name before first use receive all output;
// otherwise a stderr logger at warn level is created.
auto logger() -> std::shared_ptr<spdlog::logger>;

}  // namespace jsonpatch_cpp::detail
