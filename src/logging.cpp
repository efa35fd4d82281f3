#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace jsonpatch_cpp::detail {

auto logger() -> std::shared_ptr<spdlog::logger> {
    static auto mutex = std::mutex{};
    auto lock = std::lock_guard{mutex};

    if (auto existing = spdlog::get(logger_name)) {
        return existing;
    }
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto created = std::make_shared<spdlog::logger>(logger_name, sink);
    created->set_level(spdlog::level::warn);
    spdlog::register_logger(created);
    return created;
}

}  // namespace jsonpatch_cpp::detail
