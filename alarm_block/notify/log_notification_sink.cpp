#include <alarm_block/notify/log_notification_sink.hpp>
#include <alarm_block/utils/logger.hpp>

static const char* TAG = "BROADCAST";

bool LogNotificationSink::notifyAlarmStatus(bool playing) {
    LOG_INFO(TAG, "alarm_status: %s", playing ? "playing" : "stopped");
    return true;
}

bool LogNotificationSink::notifyAmbientStatus(bool playing) {
    LOG_INFO(TAG, "white_noise_status: %s", playing ? "playing" : "stopped");
    return true;
}

bool LogNotificationSink::notifyVolume(int volume) {
    LOG_INFO(TAG, "volume: %d", volume);
    return true;
}

bool LogNotificationSink::notifyAlarmVolume(int volume) {
    LOG_INFO(TAG, "alarm_volume: %d", volume);
    return true;
}

bool LogNotificationSink::notifyScheduleMode(GlobalMode mode) {
    LOG_INFO(TAG, "global_schedule: %s", globalModeName(mode));
    return true;
}

bool LogNotificationSink::notifyAlarmList(const std::vector<Alarm>& alarms) {
    LOG_INFO(TAG, "alarms: %u entries", static_cast<unsigned>(alarms.size()));
    char line[96];
    for (const Alarm& alarm : alarms) {
        describeAlarm(alarm, line, sizeof(line));
        LOG_DEBUG(TAG, "  %s %s", alarm.id.c_str(), line);
    }
    return true;
}
