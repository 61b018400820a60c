#ifndef GRIDLINK_LOGGING_H
#define GRIDLINK_LOGGING_H

#include <string>

namespace gridlink {
namespace logging {

constexpr const char LOGGER_NAME[] = "gridlink";

// Valid names: trace, debug, info, warn, error, off.
bool isValidLevel(const std::string& level);

/**
 * @brief Install the "gridlink" coloured stderr logger as spdlog default.
 *
 * Safe to call more than once; later calls only change the level.
 * @return false for an unknown level name (the level is left at info).
 */
bool init(const std::string& level);

}  // namespace logging
}  // namespace gridlink

#endif  // GRIDLINK_LOGGING_H
