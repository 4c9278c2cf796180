#ifndef ALARM_HPP
#define ALARM_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <alarm_block/models/validation_error.hpp>

// Which named schedule an alarm belongs to
enum class ScheduleTag : uint8_t { A = 0, B = 1 };

// Globally selected schedule; OFF silences every alarm
enum class GlobalMode : uint8_t { A = 0, B = 1, OFF = 2 };

// Weekday bits, Monday = bit 0 ... Sunday = bit 6
namespace DayMask {
    static constexpr uint8_t MONDAY    = 1u << 0;
    static constexpr uint8_t TUESDAY   = 1u << 1;
    static constexpr uint8_t WEDNESDAY = 1u << 2;
    static constexpr uint8_t THURSDAY  = 1u << 3;
    static constexpr uint8_t FRIDAY    = 1u << 4;
    static constexpr uint8_t SATURDAY  = 1u << 5;
    static constexpr uint8_t SUNDAY    = 1u << 6;

    static constexpr uint8_t WEEKDAYS = MONDAY | TUESDAY | WEDNESDAY | THURSDAY | FRIDAY;
    static constexpr uint8_t WEEKEND  = SATURDAY | SUNDAY;
    static constexpr uint8_t DAILY    = 0x7F;

    inline uint8_t fromDay(int day) {
        return (day >= 0 && day <= 6) ? static_cast<uint8_t>(1u << day) : 0;
    }

    inline bool contains(uint8_t mask, int day) {
        return (mask & fromDay(day)) != 0;
    }

    // tm_wday counts from Sunday; our days count from Monday
    inline int fromTmWeekday(int tm_wday) {
        return (tm_wday + 6) % 7;
    }
}

struct Alarm {
    std::string id;
    uint8_t hour = 0;        // 0-23, local time
    uint8_t minute = 0;      // 0-59
    uint8_t days = 0;        // DayMask bits, never empty once validated
    ScheduleTag schedule = ScheduleTag::A;
    bool active = true;      // inactive alarms stay scheduled but stay silent

    bool operator==(const Alarm& other) const {
        return id == other.id && hour == other.hour && minute == other.minute &&
               days == other.days && schedule == other.schedule && active == other.active;
    }
    bool operator!=(const Alarm& other) const { return !(*this == other); }
};

const char* scheduleTagName(ScheduleTag tag);
bool parseScheduleTag(const char* text, ScheduleTag* out);

const char* globalModeName(GlobalMode mode);
bool parseGlobalMode(const char* text, GlobalMode* out);

// True when the global mode selects this alarm's schedule
inline bool modeMatches(GlobalMode mode, ScheduleTag tag) {
    return static_cast<uint8_t>(mode) == static_cast<uint8_t>(tag);
}

// Day list (0=Monday..6=Sunday) -> mask. Duplicates collapse; false on any out-of-range day.
bool daysToMask(const std::vector<int>& days, uint8_t* out_mask);
std::vector<int> maskToDays(uint8_t mask);

// First invariant the alarm breaks, or NONE
ValidationError validateAlarm(const Alarm& alarm);

// Random RFC 4122 version 4 UUID from the hardware RNG
std::string generateAlarmId();

// "07:30 Mon,Tue,Wed (schedule a, active)" for logs
void describeAlarm(const Alarm& alarm, char* out, std::size_t out_size);

#endif // ALARM_HPP
