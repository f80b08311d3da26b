/* Logging setup for the engine (spdlog default logger). */
#pragma once

#include <string_view>

#include <spdlog/common.h>

namespace pathviz::core {

// Installs the "pathviz" console logger as spdlog's default logger if it is
// not installed yet. Safe to call repeatedly.
void init_logging();

void set_log_level(spdlog::level::level_enum level);

// Accepts spdlog level names ("trace", "debug", "info", "warn", "err",
// "critical", "off"). Throws InvalidArgument for anything else.
void set_log_level(std::string_view level);

// Applies levels from the SPDLOG_LEVEL environment variable, if set.
void configure_logging_from_env();

} // namespace pathviz::core
