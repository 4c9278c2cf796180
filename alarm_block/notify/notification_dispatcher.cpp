#include <alarm_block/notify/notification_dispatcher.hpp>
#include <alarm_block/utils/logger.hpp>
#include <freertos/task.h>

#include <cstring>
#include <mutex>

static const char* TAG = "NOTIFY";

namespace {
    const char* typeName(NotificationType type) {
        switch (type) {
            case NotificationType::ALARM_STATUS:   return "alarm_status";
            case NotificationType::AMBIENT_STATUS: return "ambient_status";
            case NotificationType::AMBIENT_VOLUME: return "volume";
            case NotificationType::ALARM_VOLUME:   return "alarm_volume";
            case NotificationType::SCHEDULE_MODE:  return "schedule_mode";
            case NotificationType::ALARM_LIST:     return "alarm_list";
        }
        return "unknown";
    }

    void toRecord(const Alarm& alarm, AlarmRecord* out) {
        std::memset(out, 0, sizeof(*out));
        std::strncpy(out->id, alarm.id.c_str(), sizeof(out->id) - 1);
        out->hour = alarm.hour;
        out->minute = alarm.minute;
        out->days = alarm.days;
        out->schedule = alarm.schedule;
        out->active = alarm.active;
    }

    Alarm fromRecord(const AlarmRecord& record) {
        Alarm alarm;
        alarm.id = record.id;
        alarm.hour = record.hour;
        alarm.minute = record.minute;
        alarm.days = record.days;
        alarm.schedule = record.schedule;
        alarm.active = record.active;
        return alarm;
    }
}

NotificationDispatcher::NotificationDispatcher(NotificationSink& target, std::size_t queue_depth)
    : target_(target) {
    queue_ = xQueueCreate(queue_depth, sizeof(NotificationEvent));
    exit_sem_ = xSemaphoreCreateBinary();
    if (queue_ == nullptr || exit_sem_ == nullptr) {
        LOG_ERROR(TAG, "%s", "Out of memory creating notification queue");
    }
}

NotificationDispatcher::~NotificationDispatcher() {
    running_.store(false);
    if (task_alive_.load() && !joinTask(portMAX_DELAY)) {
        LOG_ERROR(TAG, "%s", "Notifier task never exited");
    }
    if (queue_ != nullptr) {
        vQueueDelete(queue_);
    }
    if (exit_sem_ != nullptr) {
        vSemaphoreDelete(exit_sem_);
    }
}

bool NotificationDispatcher::start() {
    if (running_.load()) {
        return true;
    }
    if (queue_ == nullptr || exit_sem_ == nullptr) {
        return false;
    }
    if (task_alive_.load() && !joinTask(pdMS_TO_TICKS(1000))) {
        LOG_ERROR(TAG, "%s", "Previous notifier task is still running");
        return false;
    }
    running_.store(true);
    if (xTaskCreate(&NotificationDispatcher::taskEntry, "notifier",
                    Config::Tasks::Notifier::stack_bytes / sizeof(StackType_t),
                    this, Config::TaskPriorities::NORMAL, nullptr) != pdPASS) {
        LOG_ERROR(TAG, "%s", "Failed to create notifier task");
        running_.store(false);
        return false;
    }
    task_alive_.store(true);
    LOG_INFO(TAG, "%s", "Notification dispatcher started");
    return true;
}

bool NotificationDispatcher::stop() {
    running_.store(false);
    if (!task_alive_.load()) {
        return true;
    }
    if (!joinTask(pdMS_TO_TICKS(1000))) {
        LOG_WARN(TAG, "%s", "Notifier task did not exit in time");
        return false;
    }
    return true;
}

bool NotificationDispatcher::joinTask(TickType_t wait) {
    if (xSemaphoreTake(exit_sem_, wait) != pdTRUE) {
        return false;
    }
    task_alive_.store(false);
    return true;
}

std::size_t NotificationDispatcher::dispatchPending() {
    std::size_t delivered = 0;
    std::lock_guard<RtosMutex> lock(rx_mutex_);
    while (queue_ != nullptr && xQueueReceive(queue_, &rx_event_, 0) == pdTRUE) {
        deliver(rx_event_);
        ++delivered;
    }
    return delivered;
}

bool NotificationDispatcher::post(NotificationType type, int32_t value, const std::vector<Alarm>* alarms) {
    std::lock_guard<RtosMutex> lock(tx_mutex_);
    tx_event_.type = type;
    tx_event_.value = value;
    tx_event_.alarm_count = 0;
    if (alarms != nullptr) {
        if (alarms->size() > Config::Alarms::max_alarms) {
            LOG_WARN(TAG, "Alarm list of %u truncated to %u", static_cast<unsigned>(alarms->size()),
                     static_cast<unsigned>(Config::Alarms::max_alarms));
        }
        for (const Alarm& alarm : *alarms) {
            if (tx_event_.alarm_count >= Config::Alarms::max_alarms) {
                break;
            }
            toRecord(alarm, &tx_event_.alarms[tx_event_.alarm_count++]);
        }
        tx_event_.value = tx_event_.alarm_count;
    }

    if (queue_ == nullptr || xQueueSend(queue_, &tx_event_, 0) != pdTRUE) {
        dropped_.fetch_add(1);
        LOG_WARN(TAG, "Notification queue full, %s dropped", typeName(type));
        return false;
    }
    return true;
}

void NotificationDispatcher::deliver(const NotificationEvent& event) {
    bool ok = false;
    switch (event.type) {
        case NotificationType::ALARM_STATUS:
            ok = target_.notifyAlarmStatus(event.value != 0);
            break;
        case NotificationType::AMBIENT_STATUS:
            ok = target_.notifyAmbientStatus(event.value != 0);
            break;
        case NotificationType::AMBIENT_VOLUME:
            ok = target_.notifyVolume(event.value);
            break;
        case NotificationType::ALARM_VOLUME:
            ok = target_.notifyAlarmVolume(event.value);
            break;
        case NotificationType::SCHEDULE_MODE:
            ok = target_.notifyScheduleMode(static_cast<GlobalMode>(event.value));
            break;
        case NotificationType::ALARM_LIST: {
            std::vector<Alarm> alarms;
            alarms.reserve(event.alarm_count);
            for (uint8_t i = 0; i < event.alarm_count; ++i) {
                alarms.push_back(fromRecord(event.alarms[i]));
            }
            ok = target_.notifyAlarmList(alarms);
            break;
        }
    }

    if (!ok) {
        failed_.fetch_add(1);
        LOG_WARN(TAG, "Delivery of %s failed", typeName(event.type));
    }
}

void NotificationDispatcher::taskEntry(void* arg) {
    static_cast<NotificationDispatcher*>(arg)->run();
}

void NotificationDispatcher::run() {
    while (running_.load()) {
        std::lock_guard<RtosMutex> lock(rx_mutex_);
        if (xQueueReceive(queue_, &rx_event_, pdMS_TO_TICKS(100)) == pdTRUE) {
            deliver(rx_event_);
        }
    }
    xSemaphoreGive(exit_sem_);
    vTaskDelete(nullptr);
}

bool NotificationDispatcher::notifyAlarmStatus(bool playing) {
    return post(NotificationType::ALARM_STATUS, playing ? 1 : 0);
}

bool NotificationDispatcher::notifyAmbientStatus(bool playing) {
    return post(NotificationType::AMBIENT_STATUS, playing ? 1 : 0);
}

bool NotificationDispatcher::notifyVolume(int volume) {
    return post(NotificationType::AMBIENT_VOLUME, volume);
}

bool NotificationDispatcher::notifyAlarmVolume(int volume) {
    return post(NotificationType::ALARM_VOLUME, volume);
}

bool NotificationDispatcher::notifyScheduleMode(GlobalMode mode) {
    return post(NotificationType::SCHEDULE_MODE, static_cast<int32_t>(mode));
}

bool NotificationDispatcher::notifyAlarmList(const std::vector<Alarm>& alarms) {
    return post(NotificationType::ALARM_LIST, 0, &alarms);
}
