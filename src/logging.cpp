#include "pathviz/core/logging.hpp"

#include <iostream>
#include <string>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "pathviz/core/error.hpp"

namespace pathviz::core {

void init_logging() {
  if (spdlog::get("pathviz")) return;
  try {
    auto logger = spdlog::stderr_color_mt("pathviz");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
  }
}

void set_log_level(spdlog::level::level_enum level) {
  init_logging();
  spdlog::set_level(level);
}

void set_log_level(std::string_view level) {
  const std::string name(level);
  auto parsed = spdlog::level::from_str(name);
  // from_str falls back to "off" for unknown names.
  if (parsed == spdlog::level::off && name != "off") {
    throw InvalidArgument("unknown log level '" + name + "'");
  }
  set_log_level(parsed);
}

void configure_logging_from_env() {
  init_logging();
  spdlog::cfg::load_env_levels();
}

} // namespace pathviz::core
