#ifndef GRIDLINK_MESSAGE_LOG_H
#define GRIDLINK_MESSAGE_LOG_H

#include <string>
#include <vector>

#include "gridlink_error.h"

namespace gridlink {
namespace storage {

// One recorded message. The file form is a JSON array of
// {"topic": ..., "payload": ..., "timestamp": seconds}; "data" is accepted
// as an alias of "payload" when reading.
struct LoggedMessage {
  std::string topic;
  std::string payload;
  double timestamp;

  LoggedMessage() : topic(), payload(), timestamp(0.0) {}
};

/**
 * @brief Read a recorded message log.
 *
 * Entries that are not objects or lack a topic are skipped with a warning.
 * A non-string payload is kept as its compact JSON text.
 *
 * @return false with IO when unreadable, PAYLOAD_PARSE when the file is not
 *         a JSON array.
 */
bool loadMessageLog(const std::string& path, std::vector<LoggedMessage>& out, Error& error);

bool saveMessageLog(const std::string& path, const std::vector<LoggedMessage>& messages,
                    Error& error);

}  // namespace storage
}  // namespace gridlink

#endif  // GRIDLINK_MESSAGE_LOG_H
