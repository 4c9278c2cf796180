#ifndef TRIGGER_SCHEDULER_HPP
#define TRIGGER_SCHEDULER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/semphr.h>
#include <alarm_block/config/config.hpp>
#include <alarm_block/models/alarm.hpp>
#include <alarm_block/scheduling/cron_spec.hpp>
#include <alarm_block/utils/rtos_mutex.hpp>

struct SchedulerOptions {
    uint32_t misfire_grace_s = Config::Scheduler::misfire_grace_s;
    uint32_t tick_ms = Config::Scheduler::tick_ms;
    uint8_t worker_count = Config::Scheduler::worker_count;
    std::size_t fire_queue_depth = Config::Scheduler::fire_queue_depth;
    bool use_watchdog = true;
};

// One recurring job per alarm id, re-armed after every fire.
//
// A tick task compares the wall clock with each job's next fire instant and
// pushes due jobs onto a bounded queue; worker tasks pop them and call the
// fire handler. Fires therefore never run inside schedule() or on the
// caller's thread.
class TriggerScheduler {
public:
    using FireHandler = std::function<void(const std::string& alarm_id)>;
    using Clock = time_t (*)();

    explicit TriggerScheduler(Clock clock = nullptr, SchedulerOptions options = SchedulerOptions());
    ~TriggerScheduler();

    TriggerScheduler(const TriggerScheduler&) = delete;
    TriggerScheduler& operator=(const TriggerScheduler&) = delete;

    // Must be set before start()
    void setFireHandler(FireHandler handler);

    bool start();
    // False if a task did not exit in time; the destructor still waits
    // for every task before releasing the queue.
    bool stop();
    bool isRunning() const { return running_.load(); }

    // Replace any job for alarm.id. False (and no job) if the spec is malformed.
    bool schedule(const Alarm& alarm);
    // Absent id is fine
    void unschedule(const std::string& id);
    // Drop every job and schedule each alarm; one bad alarm does not stop the rest.
    // Returns the number of jobs installed.
    std::size_t rescheduleAll(const std::vector<Alarm>& alarms);

    bool hasJob(const std::string& id) const;
    std::size_t jobCount() const;
    // -1 if there is no job or it is waiting for a valid clock
    time_t nextFireTime(const std::string& id) const;

    // Tick body: queue every job due at `now` and re-arm it. Returns fires queued.
    std::size_t dispatchDue(time_t now);
    // Drain queued fires on the calling thread (workers not running)
    std::size_t runQueuedFires();

    uint32_t misfireCount() const { return misfires_.load(); }
    uint32_t droppedCount() const { return dropped_.load(); }

private:
    struct Job {
        CronSpec spec;
        time_t next_fire;  // -1 until a valid clock reading arms it
    };

    struct FireRequest {
        char alarm_id[Config::Alarms::id_max_len + 1];
        time_t due;
    };

    static void tickEntry(void* arg);
    static void workerEntry(void* arg);
    void tickLoop();
    void workerLoop();
    void deliver(const FireRequest& req);
    time_t readClock() const;
    // Wait for every started task to exit
    bool joinTasks(TickType_t wait);

    Clock clock_;
    SchedulerOptions options_;
    FireHandler handler_;

    mutable RtosMutex mutex_;
    std::map<std::string, Job> jobs_;

    QueueHandle_t fire_queue_ = nullptr;
    SemaphoreHandle_t exit_sem_ = nullptr;
    std::atomic<bool> running_{false};
    // Tasks created and not yet joined
    uint8_t tasks_started_ = 0;
    std::atomic<uint32_t> misfires_{0};
    std::atomic<uint32_t> dropped_{0};
};

#endif // TRIGGER_SCHEDULER_HPP
