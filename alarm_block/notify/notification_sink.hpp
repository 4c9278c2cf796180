#ifndef NOTIFICATION_SINK_HPP
#define NOTIFICATION_SINK_HPP

#include <vector>
#include <alarm_block/models/alarm.hpp>

// Outbound state-change broadcasts. Each call returns whether the
// notification was delivered (or accepted for delivery); coordinators
// never treat false as a failure of their own operation.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual bool notifyAlarmStatus(bool playing) = 0;
    virtual bool notifyAmbientStatus(bool playing) = 0;
    // Ambient volume
    virtual bool notifyVolume(int volume) = 0;
    virtual bool notifyAlarmVolume(int volume) = 0;
    virtual bool notifyScheduleMode(GlobalMode mode) = 0;
    virtual bool notifyAlarmList(const std::vector<Alarm>& alarms) = 0;
};

#endif // NOTIFICATION_SINK_HPP
