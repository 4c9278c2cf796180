#ifndef CRON_SPEC_HPP
#define CRON_SPEC_HPP

#include <cstdint>
#include <ctime>

// "minute hour * * days" restricted to what an alarm needs:
// one local wall-clock minute on a set of weekdays.
struct CronSpec {
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint8_t days = 0;   // DayMask bits

    bool isValid() const;

    // True when t (local time) falls inside the spec's minute
    bool matches(time_t t) const;

    // First matching instant strictly after `after`, seconds = 0.
    // Returns -1 if the spec is invalid or the clock library fails.
    time_t nextFireAfter(time_t after) const;
};

#endif // CRON_SPEC_HPP
