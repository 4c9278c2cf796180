#ifndef NOTIFICATION_DISPATCHER_HPP
#define NOTIFICATION_DISPATCHER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/semphr.h>
#include <alarm_block/config/config.hpp>
#include <alarm_block/models/notification_event.hpp>
#include <alarm_block/notify/notification_sink.hpp>
#include <alarm_block/utils/rtos_mutex.hpp>

// NotificationSink that only enqueues. A dispatcher task forwards each
// event to the target sink, so a slow or failing target never holds up
// the code that changed state. Posting never blocks; a full queue drops
// the event and counts it.
class NotificationDispatcher : public NotificationSink {
public:
    explicit NotificationDispatcher(NotificationSink& target,
                                    std::size_t queue_depth = Config::Notifications::queue_depth);
    ~NotificationDispatcher() override;

    NotificationDispatcher(const NotificationDispatcher&) = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    bool start();
    // False if the task did not exit within a second; the destructor
    // still waits for it before releasing the queue.
    bool stop();

    // Deliver everything queued on the calling thread. Returns events delivered.
    std::size_t dispatchPending();

    uint32_t droppedCount() const { return dropped_.load(); }
    uint32_t failedCount() const { return failed_.load(); }

    bool notifyAlarmStatus(bool playing) override;
    bool notifyAmbientStatus(bool playing) override;
    bool notifyVolume(int volume) override;
    bool notifyAlarmVolume(int volume) override;
    bool notifyScheduleMode(GlobalMode mode) override;
    bool notifyAlarmList(const std::vector<Alarm>& alarms) override;

private:
    bool post(NotificationType type, int32_t value, const std::vector<Alarm>* alarms = nullptr);
    void deliver(const NotificationEvent& event);
    bool joinTask(TickType_t wait);
    static void taskEntry(void* arg);
    void run();

    NotificationSink& target_;
    QueueHandle_t queue_ = nullptr;
    SemaphoreHandle_t exit_sem_ = nullptr;
    std::atomic<bool> running_{false};
    std::atomic<bool> task_alive_{false};

    // Events are too large for caller stacks; stage them here
    RtosMutex tx_mutex_;
    NotificationEvent tx_event_{};
    RtosMutex rx_mutex_;
    NotificationEvent rx_event_{};
    std::atomic<uint32_t> dropped_{0};
    std::atomic<uint32_t> failed_{0};
};

#endif // NOTIFICATION_DISPATCHER_HPP
