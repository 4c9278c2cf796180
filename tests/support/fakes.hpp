#ifndef TEST_FAKES_HPP
#define TEST_FAKES_HPP

#include <cstdio>
#include <ctime>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>
#include <alarm_block/models/alarm.hpp>
#include <alarm_block/notify/notification_sink.hpp>
#include <alarm_block/state/settings_provider.hpp>
#include <alarm_block/utils/rtos_mutex.hpp>

// In-memory settings; fail_writes makes every setter report a failed commit
class FakeSettingsProvider : public SettingsProvider {
public:
    GlobalMode mode = GlobalMode::A;
    int volume = 25;
    int alarm_volume = 75;
    bool fail_writes = false;
    int writes = 0;

    GlobalMode getGlobalSchedule() const override { return mode; }
    bool setGlobalSchedule(GlobalMode m) override {
        mode = m;
        ++writes;
        return !fail_writes;
    }
    int getVolume() const override { return volume; }
    bool setVolume(int v) override {
        if (!isVolumeInRange(v)) {
            return false;
        }
        volume = v;
        ++writes;
        return !fail_writes;
    }
    int getAlarmVolume() const override { return alarm_volume; }
    bool setAlarmVolume(int v) override {
        if (!isVolumeInRange(v)) {
            return false;
        }
        alarm_volume = v;
        ++writes;
        return !fail_writes;
    }
};

// Records every notification in arrival order
class RecordingSink : public NotificationSink {
public:
    struct Event {
        std::string kind;
        int value;
    };

    bool accept = true;

    bool notifyAlarmStatus(bool playing) override { return record("alarm_status", playing ? 1 : 0); }
    bool notifyAmbientStatus(bool playing) override { return record("ambient_status", playing ? 1 : 0); }
    bool notifyVolume(int volume) override { return record("volume", volume); }
    bool notifyAlarmVolume(int volume) override { return record("alarm_volume", volume); }
    bool notifyScheduleMode(GlobalMode mode) override { return record("schedule_mode", static_cast<int>(mode)); }
    bool notifyAlarmList(const std::vector<Alarm>& alarms) override {
        {
            std::lock_guard<RtosMutex> lock(mutex_);
            last_list_ = alarms;
        }
        return record("alarm_list", static_cast<int>(alarms.size()));
    }

    std::vector<Event> events() const {
        std::lock_guard<RtosMutex> lock(mutex_);
        return events_;
    }

    std::vector<Alarm> lastList() const {
        std::lock_guard<RtosMutex> lock(mutex_);
        return last_list_;
    }

    std::size_t count(const std::string& kind) const {
        std::lock_guard<RtosMutex> lock(mutex_);
        std::size_t n = 0;
        for (const Event& e : events_) {
            if (e.kind == kind) {
                ++n;
            }
        }
        return n;
    }

    void clear() {
        std::lock_guard<RtosMutex> lock(mutex_);
        events_.clear();
        last_list_.clear();
    }

private:
    bool record(const char* kind, int value) {
        std::lock_guard<RtosMutex> lock(mutex_);
        events_.push_back(Event{kind, value});
        return accept;
    }

    mutable RtosMutex mutex_;
    std::vector<Event> events_;
    std::vector<Alarm> last_list_;
};

// Settable clock for TriggerScheduler
namespace FakeClock {
    inline time_t& current() {
        static time_t t = 0;
        return t;
    }
    inline time_t now() { return current(); }
    inline void set(time_t t) { current() = t; }
}

// Local time in the active TZ
inline time_t localTime(int year, int month, int day, int hour, int minute, int second = 0) {
    struct tm t = {};
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    t.tm_hour = hour;
    t.tm_min = minute;
    t.tm_sec = second;
    t.tm_isdst = -1;
    return mktime(&t);
}

inline Alarm makeAlarm(const std::string& id, int hour, int minute, uint8_t days,
                       ScheduleTag tag = ScheduleTag::A, bool active = true) {
    Alarm a;
    a.id = id;
    a.hour = static_cast<uint8_t>(hour);
    a.minute = static_cast<uint8_t>(minute);
    a.days = days;
    a.schedule = tag;
    a.active = active;
    return a;
}

// Fresh snapshot path under /tmp for one test
inline std::string tempSnapshotPath(const char* name) {
    std::string path = std::string("/tmp/alarm_block_") + name + ".json";
    std::remove(path.c_str());
    std::remove((path + ".tmp").c_str());
    return path;
}

// Runs each body on its own FreeRTOS task and waits for all of them.
// False if a task could not be created or did not finish in time.
namespace TestTasks {
    struct Caller {
        std::function<void()> body;
        SemaphoreHandle_t done;
    };

    inline void callerEntry(void* arg) {
        Caller* caller = static_cast<Caller*>(arg);
        caller->body();
        xSemaphoreGive(caller->done);
        vTaskDelete(nullptr);
    }

    inline bool runConcurrently(const std::vector<std::function<void()>>& bodies, uint32_t timeout_ms = 10000) {
        SemaphoreHandle_t done = xSemaphoreCreateCounting(bodies.size(), 0);
        if (done == nullptr) {
            return false;
        }
        std::unique_ptr<std::vector<Caller>> callers(new std::vector<Caller>());
        callers->reserve(bodies.size());
        for (const auto& body : bodies) {
            callers->push_back(Caller{body, done});
        }

        std::size_t started = 0;
        for (Caller& caller : *callers) {
            if (xTaskCreate(&callerEntry, "test_caller", 8192 / sizeof(StackType_t), &caller,
                            tskIDLE_PRIORITY + 2, nullptr) != pdPASS) {
                break;
            }
            ++started;
        }

        bool finished = true;
        for (std::size_t i = 0; i < started; ++i) {
            if (xSemaphoreTake(done, pdMS_TO_TICKS(timeout_ms)) != pdTRUE) {
                finished = false;
                break;
            }
        }
        if (!finished) {
            // Stuck callers still reference these
            (void)callers.release();
            return false;
        }
        vSemaphoreDelete(done);
        return started == bodies.size();
    }
}

#endif // TEST_FAKES_HPP
