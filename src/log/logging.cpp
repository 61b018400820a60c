#include "logging.h"

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace gridlink {
namespace logging {

namespace {

bool toLevel(const std::string& name, spdlog::level::level_enum& out) {
  if (name == "trace")   { out = spdlog::level::trace; return true; }
  if (name == "debug")   { out = spdlog::level::debug; return true; }
  if (name == "info")    { out = spdlog::level::info; return true; }
  if (name == "warn" || name == "warning") { out = spdlog::level::warn; return true; }
  if (name == "error")   { out = spdlog::level::err; return true; }
  if (name == "off")     { out = spdlog::level::off; return true; }
  return false;
}

}  // namespace

bool isValidLevel(const std::string& level) {
  spdlog::level::level_enum unused;
  return toLevel(level, unused);
}

bool init(const std::string& level) {
  std::shared_ptr<spdlog::logger> logger = spdlog::get(LOGGER_NAME);
  if (!logger) {
    logger = spdlog::stderr_color_mt(LOGGER_NAME);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
  }

  spdlog::level::level_enum parsed = spdlog::level::info;
  const bool known = toLevel(level, parsed);
  logger->set_level(parsed);
  if (!known) {
    spdlog::warn("Unknown log level '{}', using info", level);
  }
  return known;
}

}  // namespace logging
}  // namespace gridlink
