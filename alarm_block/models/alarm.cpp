#include <alarm_block/models/alarm.hpp>
#include <alarm_block/config/config.hpp>
#include <esp_random.h>
#include <cstdio>
#include <cstring>

namespace {
    static const char* const DAY_ABBREVS[7] = { "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun" };
}

const char* scheduleTagName(ScheduleTag tag) {
    return tag == ScheduleTag::B ? "b" : "a";
}

bool parseScheduleTag(const char* text, ScheduleTag* out) {
    if (text == nullptr) {
        return false;
    }
    if (std::strcmp(text, "a") == 0) {
        *out = ScheduleTag::A;
        return true;
    }
    if (std::strcmp(text, "b") == 0) {
        *out = ScheduleTag::B;
        return true;
    }
    return false;
}

const char* globalModeName(GlobalMode mode) {
    switch (mode) {
        case GlobalMode::A:   return "a";
        case GlobalMode::B:   return "b";
        case GlobalMode::OFF: return "off";
    }
    return "off";
}

bool parseGlobalMode(const char* text, GlobalMode* out) {
    if (text == nullptr) {
        return false;
    }
    if (std::strcmp(text, "a") == 0)   { *out = GlobalMode::A;   return true; }
    if (std::strcmp(text, "b") == 0)   { *out = GlobalMode::B;   return true; }
    if (std::strcmp(text, "off") == 0) { *out = GlobalMode::OFF; return true; }
    return false;
}

bool daysToMask(const std::vector<int>& days, uint8_t* out_mask) {
    uint8_t mask = 0;
    for (int day : days) {
        uint8_t bit = DayMask::fromDay(day);
        if (bit == 0) {
            return false;
        }
        mask |= bit;
    }
    *out_mask = mask;
    return true;
}

std::vector<int> maskToDays(uint8_t mask) {
    std::vector<int> days;
    for (int day = 0; day < 7; ++day) {
        if (DayMask::contains(mask, day)) {
            days.push_back(day);
        }
    }
    return days;
}

ValidationError validateAlarm(const Alarm& alarm) {
    if (alarm.id.empty() || alarm.id.size() > Config::Alarms::id_max_len) {
        return ValidationError::ID;
    }
    if (alarm.hour > 23) {
        return ValidationError::HOUR;
    }
    if (alarm.minute > 59) {
        return ValidationError::MINUTE;
    }
    if (alarm.days == 0 || (alarm.days & ~DayMask::DAILY) != 0) {
        return ValidationError::DAYS;
    }
    if (alarm.schedule != ScheduleTag::A && alarm.schedule != ScheduleTag::B) {
        return ValidationError::SCHEDULE;
    }
    return ValidationError::NONE;
}

std::string generateAlarmId() {
    uint8_t bytes[16];
    esp_fill_random(bytes, sizeof(bytes));
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    char out[37];
    std::snprintf(out, sizeof(out),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(out);
}

void describeAlarm(const Alarm& alarm, char* out, std::size_t out_size) {
    if (out_size == 0) {
        return;
    }
    char days[32] = "";
    int off = 0;
    for (int day = 0; day < 7; ++day) {
        if (!DayMask::contains(alarm.days, day)) {
            continue;
        }
        off += std::snprintf(days + off, sizeof(days) - off, "%s%s", off == 0 ? "" : ",", DAY_ABBREVS[day]);
        if (off >= static_cast<int>(sizeof(days))) {
            break;
        }
    }
    std::snprintf(out, out_size, "%02u:%02u %s (schedule %s, %s)",
                  static_cast<unsigned>(alarm.hour), static_cast<unsigned>(alarm.minute),
                  off == 0 ? "never" : days, scheduleTagName(alarm.schedule),
                  alarm.active ? "active" : "inactive");
}
