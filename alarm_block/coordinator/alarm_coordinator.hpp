#ifndef ALARM_COORDINATOR_HPP
#define ALARM_COORDINATOR_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <alarm_block/coordinator/audio_coordinator.hpp>
#include <alarm_block/models/alarm.hpp>
#include <alarm_block/models/validation_error.hpp>
#include <alarm_block/notify/notification_sink.hpp>
#include <alarm_block/scheduling/trigger_scheduler.hpp>
#include <alarm_block/state/settings_provider.hpp>
#include <alarm_block/storage/alarm_store.hpp>
#include <alarm_block/utils/rtos_mutex.hpp>

// Outcome of one scheduler fire
enum class GateDecision : uint8_t {
    PLAY = 0,
    BLOCKED_OFF,        // global mode is off
    BLOCKED_SCHEDULE,   // alarm belongs to the other schedule
    BLOCKED_INACTIVE,   // alarm disabled
    NOT_FOUND           // alarm deleted before its fire ran
};

const char* gateDecisionName(GateDecision decision);

// Alarm bookkeeping and trigger gating.
//
// Mutations keep store, scheduler and snapshot file in step under one
// recursive lock. A fire copies the alarm under that lock and releases it
// before calling into AudioCoordinator, so the two locks are never held
// together by this class.
class AlarmCoordinator {
public:
    AlarmCoordinator(AlarmStore& store, TriggerScheduler& scheduler, AudioCoordinator& audio,
                     SettingsProvider& settings, NotificationSink& sink);

    AlarmCoordinator(const AlarmCoordinator&) = delete;
    AlarmCoordinator& operator=(const AlarmCoordinator&) = delete;

    // Load the snapshot and schedule every alarm in it. Returns alarms loaded.
    std::size_t restore();

    // Insert or replace by id. An empty id gets a generated one, written to
    // assigned_id when given. Nothing changes unless NONE is returned.
    ValidationError setAlarm(const Alarm& alarm, std::string* assigned_id = nullptr);
    // True when every id was found; found ids are removed either way
    bool removeAlarms(const std::vector<std::string>& ids);
    std::vector<Alarm> getAlarms() const;

    ValidationError setGlobalMode(const char* mode);
    void setGlobalMode(GlobalMode mode);
    GlobalMode globalMode() const;

    // Scheduler fire handler
    GateDecision onTrigger(const std::string& alarm_id);

    static GateDecision evaluateGate(GlobalMode mode, const Alarm& alarm);

private:
    AlarmStore& store_;
    TriggerScheduler& scheduler_;
    AudioCoordinator& audio_;
    SettingsProvider& settings_;
    NotificationSink& sink_;

    mutable RecursiveMutex mutex_;
};

#endif // ALARM_COORDINATOR_HPP
