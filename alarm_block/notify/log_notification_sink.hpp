#ifndef LOG_NOTIFICATION_SINK_HPP
#define LOG_NOTIFICATION_SINK_HPP

#include <alarm_block/notify/notification_sink.hpp>

// Default on-device sink: every broadcast becomes an INFO log line
class LogNotificationSink : public NotificationSink {
public:
    bool notifyAlarmStatus(bool playing) override;
    bool notifyAmbientStatus(bool playing) override;
    bool notifyVolume(int volume) override;
    bool notifyAlarmVolume(int volume) override;
    bool notifyScheduleMode(GlobalMode mode) override;
    bool notifyAlarmList(const std::vector<Alarm>& alarms) override;
};

#endif // LOG_NOTIFICATION_SINK_HPP
