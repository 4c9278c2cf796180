#include <alarm_block/scheduling/trigger_scheduler.hpp>
#include <alarm_block/utils/logger.hpp>
#include <alarm_block/utils/wall_clock.hpp>
#include <alarm_block/utils/watchdog.hpp>
#include <freertos/task.h>

#include <cstdio>
#include <cstring>
#include <mutex>
#include <utility>

namespace {
    static const char* TAG = "SCHEDULER";
    static constexpr uint8_t MAX_WORKERS = 8;
}

TriggerScheduler::TriggerScheduler(Clock clock, SchedulerOptions options)
    : clock_(clock != nullptr ? clock : &WallClock::now), options_(options) {
    if (options_.worker_count == 0) {
        options_.worker_count = 1;
    } else if (options_.worker_count > MAX_WORKERS) {
        options_.worker_count = MAX_WORKERS;
    }
    fire_queue_ = xQueueCreate(options_.fire_queue_depth, sizeof(FireRequest));
    exit_sem_ = xSemaphoreCreateCounting(MAX_WORKERS + 1, 0);
    if (fire_queue_ == nullptr || exit_sem_ == nullptr) {
        LOG_ERROR(TAG, "%s", "Out of memory creating scheduler queue");
    }
}

TriggerScheduler::~TriggerScheduler() {
    running_.store(false);
    if (!joinTasks(portMAX_DELAY)) {
        LOG_ERROR(TAG, "%s", "Scheduler tasks never exited");
    }
    if (fire_queue_ != nullptr) {
        vQueueDelete(fire_queue_);
    }
    if (exit_sem_ != nullptr) {
        vSemaphoreDelete(exit_sem_);
    }
}

void TriggerScheduler::setFireHandler(FireHandler handler) {
    handler_ = std::move(handler);
}

time_t TriggerScheduler::readClock() const {
    return clock_();
}

bool TriggerScheduler::start() {
    if (running_.load()) {
        return true;
    }
    if (fire_queue_ == nullptr || exit_sem_ == nullptr) {
        return false;
    }
    if (!joinTasks(pdMS_TO_TICKS(1000))) {
        LOG_ERROR(TAG, "%s", "Previous scheduler tasks are still running");
        return false;
    }
    running_.store(true);

    if (xTaskCreate(&TriggerScheduler::tickEntry, "sched_tick",
                    Config::Tasks::SchedulerTick::stack_bytes / sizeof(StackType_t),
                    this, Config::TaskPriorities::HIGH, nullptr) != pdPASS) {
        LOG_ERROR(TAG, "%s", "Failed to create tick task");
        running_.store(false);
        return false;
    }
    ++tasks_started_;

    for (uint8_t i = 0; i < options_.worker_count; ++i) {
        char name[16];
        std::snprintf(name, sizeof(name), "sched_wrk%u", static_cast<unsigned>(i));
        if (xTaskCreate(&TriggerScheduler::workerEntry, name,
                        Config::Tasks::SchedulerWorker::stack_bytes / sizeof(StackType_t),
                        this, Config::TaskPriorities::CRITICAL, nullptr) != pdPASS) {
            LOG_ERROR(TAG, "Failed to create worker %u", static_cast<unsigned>(i));
            break;
        }
        ++tasks_started_;
    }

    LOG_INFO(TAG, "Scheduler started: %u workers, %lu ms tick, %lu s misfire grace",
             static_cast<unsigned>(tasks_started_ - 1), static_cast<unsigned long>(options_.tick_ms),
             static_cast<unsigned long>(options_.misfire_grace_s));
    return tasks_started_ > 1;
}

bool TriggerScheduler::stop() {
    const bool was_running = running_.exchange(false);
    if (!joinTasks(pdMS_TO_TICKS(options_.tick_ms * 2 + 500))) {
        LOG_WARN(TAG, "%u scheduler tasks did not exit in time", static_cast<unsigned>(tasks_started_));
        return false;
    }
    if (was_running) {
        LOG_INFO(TAG, "%s", "Scheduler stopped");
    }
    return true;
}

bool TriggerScheduler::joinTasks(TickType_t wait) {
    while (tasks_started_ > 0) {
        if (xSemaphoreTake(exit_sem_, wait) != pdTRUE) {
            return false;
        }
        --tasks_started_;
    }
    return true;
}

bool TriggerScheduler::schedule(const Alarm& alarm) {
    CronSpec spec;
    spec.hour = alarm.hour;
    spec.minute = alarm.minute;
    spec.days = alarm.days;

    std::lock_guard<RtosMutex> lock(mutex_);
    jobs_.erase(alarm.id);

    if (!spec.isValid()) {
        LOG_ERROR(TAG, "Rejected job %s: malformed spec %u:%u days=0x%02x", alarm.id.c_str(),
                  static_cast<unsigned>(alarm.hour), static_cast<unsigned>(alarm.minute),
                  static_cast<unsigned>(alarm.days));
        return false;
    }

    time_t now = readClock();
    Job job{spec, -1};
    if (WallClock::isValid(now)) {
        job.next_fire = spec.nextFireAfter(now);
        if (job.next_fire < 0) {
            LOG_ERROR(TAG, "Rejected job %s: no next fire time", alarm.id.c_str());
            return false;
        }
        char when[24];
        WallClock::formatLocal(job.next_fire, when, sizeof(when));
        LOG_INFO(TAG, "Scheduled %s at %02u:%02u, next %s", alarm.id.c_str(),
                 static_cast<unsigned>(spec.hour), static_cast<unsigned>(spec.minute), when);
    } else {
        LOG_INFO(TAG, "Scheduled %s at %02u:%02u, armed once the clock is set", alarm.id.c_str(),
                 static_cast<unsigned>(spec.hour), static_cast<unsigned>(spec.minute));
    }
    jobs_[alarm.id] = job;
    return true;
}

void TriggerScheduler::unschedule(const std::string& id) {
    std::lock_guard<RtosMutex> lock(mutex_);
    if (jobs_.erase(id) > 0) {
        LOG_INFO(TAG, "Removed job %s", id.c_str());
    } else {
        LOG_DEBUG(TAG, "No job for %s", id.c_str());
    }
}

std::size_t TriggerScheduler::rescheduleAll(const std::vector<Alarm>& alarms) {
    {
        std::lock_guard<RtosMutex> lock(mutex_);
        jobs_.clear();
    }
    std::size_t installed = 0;
    for (const Alarm& alarm : alarms) {
        if (schedule(alarm)) {
            ++installed;
        } else {
            LOG_ERROR(TAG, "Alarm %s left unscheduled", alarm.id.c_str());
        }
    }
    LOG_INFO(TAG, "Rescheduled %u of %u alarms", static_cast<unsigned>(installed),
             static_cast<unsigned>(alarms.size()));
    return installed;
}

bool TriggerScheduler::hasJob(const std::string& id) const {
    std::lock_guard<RtosMutex> lock(mutex_);
    return jobs_.count(id) != 0;
}

std::size_t TriggerScheduler::jobCount() const {
    std::lock_guard<RtosMutex> lock(mutex_);
    return jobs_.size();
}

time_t TriggerScheduler::nextFireTime(const std::string& id) const {
    std::lock_guard<RtosMutex> lock(mutex_);
    auto it = jobs_.find(id);
    return it == jobs_.end() ? -1 : it->second.next_fire;
}

std::size_t TriggerScheduler::dispatchDue(time_t now) {
    std::vector<FireRequest> due;
    {
        std::lock_guard<RtosMutex> lock(mutex_);
        for (auto& entry : jobs_) {
            Job& job = entry.second;
            if (job.next_fire < 0) {
                job.next_fire = job.spec.nextFireAfter(now);
                continue;
            }
            if (job.next_fire > now) {
                continue;
            }
            const time_t late_s = now - job.next_fire;
            if (late_s <= static_cast<time_t>(options_.misfire_grace_s)) {
                FireRequest req{};
                std::strncpy(req.alarm_id, entry.first.c_str(), sizeof(req.alarm_id) - 1);
                req.due = job.next_fire;
                due.push_back(req);
            } else {
                misfires_.fetch_add(1);
                LOG_WARN(TAG, "Job %s missed by %ld s (grace %lu s), skipped", entry.first.c_str(),
                         static_cast<long>(late_s), static_cast<unsigned long>(options_.misfire_grace_s));
            }
            job.next_fire = job.spec.nextFireAfter(now);
        }
    }

    std::size_t queued = 0;
    for (const FireRequest& req : due) {
        if (xQueueSend(fire_queue_, &req, 0) == pdTRUE) {
            ++queued;
        } else {
            dropped_.fetch_add(1);
            LOG_ERROR(TAG, "Fire queue full, dropped fire for %s", req.alarm_id);
        }
    }
    return queued;
}

std::size_t TriggerScheduler::runQueuedFires() {
    std::size_t ran = 0;
    FireRequest req;
    while (xQueueReceive(fire_queue_, &req, 0) == pdTRUE) {
        deliver(req);
        ++ran;
    }
    return ran;
}

void TriggerScheduler::deliver(const FireRequest& req) {
    if (!handler_) {
        LOG_WARN(TAG, "No fire handler, dropping %s", req.alarm_id);
        return;
    }
    LOG_DEBUG(TAG, "Firing %s", req.alarm_id);
    handler_(std::string(req.alarm_id));
    LOG_DEBUG(TAG, "Job completed: %s", req.alarm_id);
}

void TriggerScheduler::tickEntry(void* arg) {
    static_cast<TriggerScheduler*>(arg)->tickLoop();
}

void TriggerScheduler::workerEntry(void* arg) {
    static_cast<TriggerScheduler*>(arg)->workerLoop();
}

void TriggerScheduler::tickLoop() {
    const bool watched = options_.use_watchdog && Watchdog::subscribe();
    const TickType_t period = pdMS_TO_TICKS(options_.tick_ms);
    bool warned_clock = false;

    while (running_.load()) {
        if (watched) {
            Watchdog::feed();
        }
        time_t now = readClock();
        if (WallClock::isValid(now)) {
            warned_clock = false;
            (void)dispatchDue(now);
        } else if (!warned_clock) {
            LOG_WARN(TAG, "%s", "Wall clock not set, holding all jobs");
            warned_clock = true;
        }
        vTaskDelay(period);
    }

    if (watched) {
        Watchdog::unsubscribe();
    }
    xSemaphoreGive(exit_sem_);
    vTaskDelete(nullptr);
}

void TriggerScheduler::workerLoop() {
    FireRequest req;
    while (running_.load()) {
        if (xQueueReceive(fire_queue_, &req, pdMS_TO_TICKS(100)) == pdTRUE) {
            deliver(req);
        }
    }
    xSemaphoreGive(exit_sem_);
    vTaskDelete(nullptr);
}
