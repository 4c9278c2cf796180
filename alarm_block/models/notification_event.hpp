#ifndef NOTIFICATION_EVENT_HPP
#define NOTIFICATION_EVENT_HPP

#include <cstdint>
#include <alarm_block/config/config.hpp>
#include <alarm_block/models/alarm.hpp>

enum class NotificationType : uint8_t {
    ALARM_STATUS = 0,    // value: 1 playing, 0 stopped
    AMBIENT_STATUS = 1,  // value: 1 playing, 0 stopped
    AMBIENT_VOLUME = 2,  // value: 0-100
    ALARM_VOLUME = 3,    // value: 0-100
    SCHEDULE_MODE = 4,   // value: GlobalMode
    ALARM_LIST = 5       // value: alarm_count, records in alarms[]
};

// Flat copy of an Alarm for queue transport
struct AlarmRecord {
    char id[Config::Alarms::id_max_len + 1];
    uint8_t hour;
    uint8_t minute;
    uint8_t days;
    ScheduleTag schedule;
    bool active;
};

// Fixed-size queue item; only ALARM_LIST uses the record table
struct NotificationEvent {
    NotificationType type;
    int32_t value;
    uint8_t alarm_count;
    AlarmRecord alarms[Config::Alarms::max_alarms];
};

#endif // NOTIFICATION_EVENT_HPP
