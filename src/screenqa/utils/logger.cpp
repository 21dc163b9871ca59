#include "logger.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <utility>

namespace screenqa {

namespace {
    // Custom logger instance defined by the user, if any
    std::shared_ptr<spdlog::logger>& get_shared_logger()
    {
        static std::shared_ptr<spdlog::logger> logger;
        return logger;
    }

    std::shared_ptr<spdlog::logger> default_logger()
    {
        // A host application may already have registered this name.
        if (auto existing = spdlog::get("screenqa")) {
            return existing;
        }
        // SPDLOG_LEVEL (e.g. "screenqa=debug") is applied on top.
        auto created = spdlog::stdout_color_mt("screenqa");
        spdlog::cfg::load_env_levels();
        return created;
    }
} // namespace

spdlog::logger& logger()
{
    if (get_shared_logger()) {
        return *get_shared_logger();
    }
    // Looked up on every call so that a logger registered later by the host
    // (or re-registered after spdlog::drop) is picked up. The registry keeps
    // it alive.
    return *default_logger();
}

void set_logger(std::shared_ptr<spdlog::logger> x)
{
    get_shared_logger() = std::move(x);
}

} // namespace screenqa
