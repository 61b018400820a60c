#ifndef GRIDLINK_SESSION_SCHEDULER_H
#define GRIDLINK_SESSION_SCHEDULER_H

#include <stdint.h>
#include "etl/array.h"
#include "etl/algorithm.h"

namespace gridlink {
namespace scheduler {

// Millisecond clock. Injectable so tests drive time explicitly.
typedef uint64_t (*MillisFn)();

// CLOCK_MONOTONIC in milliseconds.
uint64_t monotonicMillis();

// Seconds since the Unix epoch, for default artifact names.
uint64_t unixSeconds();

// IDs for the session timer system
enum TimerId : uint8_t {
  TIMER_SESSION_DEADLINE = 0,
  TIMER_DISCOVERY_WINDOW = 1,
  NUMBER_OF_TIMERS = 2
};

class TimerHandler {
public:
  virtual ~TimerHandler() {}
  virtual void on_timer(TimerId id) = 0;
};

class TimerService {
public:
    struct TimerEntry {
        TimerHandler* handler;
        TimerId id;
        uint64_t period;
        uint64_t counter;
        bool active;
        bool repeating;
    };

    TimerService() {
        clear();
    }

    void clear() {
        etl::for_each(timers_.begin(), timers_.end(), [](TimerEntry& t) {
            t.handler = nullptr;
            t.active = false;
        });
    }

    void register_timer(TimerHandler* handler, TimerId id, uint64_t period, bool repeating) {
        if (id >= NUMBER_OF_TIMERS) return;
        TimerEntry& t = timers_[id];
        t.handler = handler;
        t.id = id;
        t.period = period;
        t.counter = 0;
        t.active = true;
        t.repeating = repeating;
    }

    void unregister_timer(TimerId id) {
        if (id >= NUMBER_OF_TIMERS) return;
        timers_[id].active = false;
    }

    bool is_active(TimerId id) const {
        return id < NUMBER_OF_TIMERS && timers_[id].active;
    }

    // Milliseconds until the timer fires, 0 when inactive or due.
    uint64_t remaining(TimerId id) const {
        if (!is_active(id)) return 0;
        const TimerEntry& t = timers_[id];
        return t.counter >= t.period ? 0 : t.period - t.counter;
    }

    void tick(uint64_t delta_ms) {
        etl::for_each(timers_.begin(), timers_.end(), [delta_ms](TimerEntry& t) {
            if (t.active) {
                t.counter += delta_ms;
                if (t.counter >= t.period) {
                    if (t.repeating) {
                        t.counter = 0;
                    } else {
                        t.active = false;
                    }
                    if (t.handler) {
                        t.handler->on_timer(t.id);
                    }
                }
            }
        });
    }

private:
    etl::array<TimerEntry, NUMBER_OF_TIMERS> timers_;
};

/**
 * Converts absolute clock readings into TimerService ticks.
 *
 * The watchdog polls at a bounded interval rather than sleeping until the
 * deadline, so a stuck message stream cannot delay the verdict.
 */
class ClockTicker {
public:
    explicit ClockTicker(MillisFn clock) : clock_(clock), last_(clock()) {}

    void reset() { last_ = clock_(); }

    uint64_t now() const { return clock_(); }

    void advance(TimerService& timers) {
        const uint64_t current = clock_();
        const uint64_t delta = current >= last_ ? current - last_ : 0;
        last_ = current;
        timers.tick(delta);
    }

private:
    MillisFn clock_;
    uint64_t last_;
};

} // namespace scheduler
} // namespace gridlink

#endif // GRIDLINK_SESSION_SCHEDULER_H
