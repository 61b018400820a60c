#include "session_scheduler.h"

#include <time.h>

namespace gridlink {
namespace scheduler {

uint64_t monotonicMillis() {
  struct timespec ts;
  if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
    return 0;
  }
  return static_cast<uint64_t>(ts.tv_sec) * 1000ULL +
         static_cast<uint64_t>(ts.tv_nsec) / 1000000ULL;
}

uint64_t unixSeconds() {
  return static_cast<uint64_t>(time(nullptr));
}

}  // namespace scheduler
}  // namespace gridlink
