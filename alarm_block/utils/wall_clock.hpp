// Local wall-clock helpers used by the scheduler and its logs.
#ifndef WALL_CLOCK_HPP
#define WALL_CLOCK_HPP

#include <cstddef>
#include <ctime>

namespace WallClock {
    // Install a POSIX TZ string so localtime_r/mktime resolve local alarm times
    void applyTimezone(const char* tz);

    // True once the clock has been set (RTC restored or synced by the host)
    bool isValid(time_t now);

    // Current time, or 0 if the clock is unset
    time_t now();

    // "YYYY-MM-DD HH:MM:SS" in local time; always null-terminates when out_size > 0
    void formatLocal(time_t t, char* out, std::size_t out_size);
}

#endif // WALL_CLOCK_HPP
