#include "unitgraph/logging.h"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace unitgraph {

namespace {

constexpr const char* logger_name = "unitgraph";

std::shared_ptr<spdlog::logger> make_logger() {
    auto existing = spdlog::get(logger_name);
    if (existing) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(logger_name, spdlog::color_mode::automatic);
    created->set_level(spdlog::level::warn);
    return created;
}

}

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] { instance = make_logger(); });
    return instance;
}

void configure_logging() {
    logger();
    spdlog::cfg::load_env_levels();
}

}
