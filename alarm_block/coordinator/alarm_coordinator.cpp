#include <alarm_block/coordinator/alarm_coordinator.hpp>
#include <alarm_block/config/config.hpp>
#include <alarm_block/utils/logger.hpp>

#include <map>
#include <mutex>

static const char* TAG = "ALARM_COORD";

const char* gateDecisionName(GateDecision decision) {
    switch (decision) {
        case GateDecision::PLAY:             return "play";
        case GateDecision::BLOCKED_OFF:      return "blocked: schedule off";
        case GateDecision::BLOCKED_SCHEDULE: return "blocked: other schedule";
        case GateDecision::BLOCKED_INACTIVE: return "blocked: inactive";
        case GateDecision::NOT_FOUND:        return "not found";
    }
    return "unknown";
}

AlarmCoordinator::AlarmCoordinator(AlarmStore& store, TriggerScheduler& scheduler, AudioCoordinator& audio,
                                   SettingsProvider& settings, NotificationSink& sink)
    : store_(store), scheduler_(scheduler), audio_(audio), settings_(settings), sink_(sink) {
    scheduler_.setFireHandler([this](const std::string& alarm_id) { (void)onTrigger(alarm_id); });
}

std::size_t AlarmCoordinator::restore() {
    std::lock_guard<RecursiveMutex> lock(mutex_);
    std::map<std::string, Alarm> loaded = store_.load();
    std::size_t scheduled = scheduler_.rescheduleAll(store_.getAll());
    if (scheduled != loaded.size()) {
        LOG_ERROR(TAG, "Only %u of %u alarms scheduled", static_cast<unsigned>(scheduled),
                  static_cast<unsigned>(loaded.size()));
    }
    LOG_INFO(TAG, "Restored %u alarms, global schedule %s", static_cast<unsigned>(loaded.size()),
             globalModeName(settings_.getGlobalSchedule()));
    return loaded.size();
}

ValidationError AlarmCoordinator::setAlarm(const Alarm& alarm, std::string* assigned_id) {
    Alarm candidate = alarm;
    if (candidate.id.empty()) {
        candidate.id = generateAlarmId();
    }

    ValidationError err = validateAlarm(candidate);
    if (err != ValidationError::NONE) {
        LOG_WARN(TAG, "Rejected alarm %s: invalid %s", candidate.id.c_str(), validationFieldName(err));
        return err;
    }

    std::lock_guard<RecursiveMutex> lock(mutex_);
    if (!store_.contains(candidate.id) && store_.size() >= Config::Alarms::max_alarms) {
        LOG_WARN(TAG, "Rejected alarm %s: limit of %u reached", candidate.id.c_str(),
                 static_cast<unsigned>(Config::Alarms::max_alarms));
        return ValidationError::ID;
    }

    store_.upsert(candidate);
    if (!scheduler_.schedule(candidate)) {
        LOG_ERROR(TAG, "Alarm %s stored but not scheduled", candidate.id.c_str());
    }
    if (!store_.save()) {
        LOG_ERROR(TAG, "Alarm %s not persisted, keeping it in memory", candidate.id.c_str());
    }

    char line[96];
    describeAlarm(candidate, line, sizeof(line));
    LOG_INFO(TAG, "Set alarm %s: %s", candidate.id.c_str(), line);

    if (assigned_id != nullptr) {
        *assigned_id = candidate.id;
    }
    (void)sink_.notifyAlarmList(store_.getAll());
    return ValidationError::NONE;
}

bool AlarmCoordinator::removeAlarms(const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return true;
    }

    std::lock_guard<RecursiveMutex> lock(mutex_);
    bool all_found = true;
    std::size_t removed = 0;
    for (const std::string& id : ids) {
        if (store_.remove(id)) {
            scheduler_.unschedule(id);
            ++removed;
            LOG_INFO(TAG, "Removed alarm %s", id.c_str());
        } else {
            all_found = false;
            LOG_WARN(TAG, "Cannot remove %s: no such alarm", id.c_str());
        }
    }

    if (removed > 0) {
        if (!store_.save()) {
            LOG_ERROR(TAG, "%s", "Removal not persisted, keeping it in memory");
        }
        (void)sink_.notifyAlarmList(store_.getAll());
    }
    return all_found;
}

std::vector<Alarm> AlarmCoordinator::getAlarms() const {
    std::lock_guard<RecursiveMutex> lock(mutex_);
    return store_.getAll();
}

ValidationError AlarmCoordinator::setGlobalMode(const char* mode) {
    GlobalMode parsed;
    if (!parseGlobalMode(mode, &parsed)) {
        LOG_WARN(TAG, "Rejected global schedule '%s'", mode != nullptr ? mode : "(null)");
        return ValidationError::SCHEDULE;
    }
    setGlobalMode(parsed);
    return ValidationError::NONE;
}

void AlarmCoordinator::setGlobalMode(GlobalMode mode) {
    std::lock_guard<RecursiveMutex> lock(mutex_);
    if (!settings_.setGlobalSchedule(mode)) {
        LOG_ERROR(TAG, "Global schedule %s not persisted", globalModeName(mode));
    }
    LOG_INFO(TAG, "Global schedule is now %s", globalModeName(mode));
    (void)sink_.notifyScheduleMode(mode);
}

GlobalMode AlarmCoordinator::globalMode() const {
    return settings_.getGlobalSchedule();
}

GateDecision AlarmCoordinator::evaluateGate(GlobalMode mode, const Alarm& alarm) {
    if (mode == GlobalMode::OFF) {
        return GateDecision::BLOCKED_OFF;
    }
    if (!modeMatches(mode, alarm.schedule)) {
        return GateDecision::BLOCKED_SCHEDULE;
    }
    if (!alarm.active) {
        return GateDecision::BLOCKED_INACTIVE;
    }
    return GateDecision::PLAY;
}

GateDecision AlarmCoordinator::onTrigger(const std::string& alarm_id) {
    Alarm alarm;
    GlobalMode mode;
    {
        std::lock_guard<RecursiveMutex> lock(mutex_);
        if (!store_.find(alarm_id, &alarm)) {
            LOG_INFO(TAG, "Alarm %s fired after removal, ignoring", alarm_id.c_str());
            return GateDecision::NOT_FOUND;
        }
        mode = settings_.getGlobalSchedule();
    }

    GateDecision decision = evaluateGate(mode, alarm);
    if (decision != GateDecision::PLAY) {
        LOG_INFO(TAG, "Alarm %s (schedule %s) %s, global schedule %s", alarm_id.c_str(),
                 scheduleTagName(alarm.schedule), gateDecisionName(decision), globalModeName(mode));
        return decision;
    }

    LOG_INFO(TAG, "Alarm %s triggered", alarm_id.c_str());
    if (!audio_.playAlarm()) {
        LOG_WARN(TAG, "Alarm %s could not start playback", alarm_id.c_str());
    }
    return decision;
}
