#pragma once

#include <memory>

#include <spdlog/logger.h>

namespace unitgraph {

// Library logger "unitgraph". Created on first use with level warn.
std::shared_ptr<spdlog::logger> logger();

// Routes the library logger to stderr and applies SPDLOG_LEVEL from the environment.
void configure_logging();

}
