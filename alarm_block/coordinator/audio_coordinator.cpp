#include <alarm_block/coordinator/audio_coordinator.hpp>
#include <alarm_block/config/config.hpp>
#include <alarm_block/utils/logger.hpp>
#include <esp_random.h>

#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

static const char* TAG = "AUDIO_COORD";

namespace {
    int sanitizeVolume(int volume, int fallback) {
        return isVolumeInRange(volume) ? volume : fallback;
    }
}

AudioCoordinator::AudioCoordinator(SoundSource& source, SettingsProvider& settings, NotificationSink& sink)
    : source_(source), settings_(settings), sink_(sink),
      ambient_volume_(sanitizeVolume(settings.getVolume(), Config::Audio::default_ambient_volume)),
      alarm_volume_(sanitizeVolume(settings.getAlarmVolume(), Config::Audio::default_alarm_volume)),
      pre_alarm_ambient_volume_(ambient_volume_) {}

int AudioCoordinator::duckedLevel(int volume) const {
    return std::min(volume, static_cast<int>(Config::Audio::duck_ceiling_percent));
}

void AudioCoordinator::duckAmbientLocked() {
    if (!ambient_playing_ || ambient_ducked_) {
        return;
    }
    pre_alarm_ambient_volume_ = ambient_volume_;
    ambient_ducked_ = true;
    if (!source_.setVolume(ambient_channel_, duckedLevel(ambient_volume_))) {
        LOG_WARN(TAG, "Could not duck ambient channel %d", ambient_channel_);
    }
}

void AudioCoordinator::restoreAmbientLocked() {
    if (!ambient_ducked_) {
        return;
    }
    ambient_ducked_ = false;
    ambient_volume_ = pre_alarm_ambient_volume_;
    if (ambient_playing_ && !source_.setVolume(ambient_channel_, ambient_volume_)) {
        LOG_WARN(TAG, "Could not restore ambient channel %d", ambient_channel_);
    }
}

bool AudioCoordinator::playAlarm() {
    bool stopped_edge = false;
    bool started_edge = false;
    bool ok = false;
    {
        std::lock_guard<RecursiveMutex> lock(mutex_);
        const bool restart = alarm_playing_;

        std::vector<std::string> pool = source_.alarmSounds();
        if (pool.empty()) {
            LOG_ERROR(TAG, "%s", "No alarm sounds available");
            return false;
        }
        const std::string& key = pool[esp_random() % pool.size()];

        if (restart) {
            // Ambient stays ducked across the restart
            source_.stop(alarm_channel_);
            alarm_channel_ = NO_CHANNEL;
        } else {
            duckAmbientLocked();
        }

        ChannelHandle channel = source_.acquireChannel();
        if (channel == NO_CHANNEL) {
            LOG_WARN(TAG, "%s", "No free channel for the alarm");
        } else if (!source_.setVolume(channel, alarm_volume_) || !source_.play(channel, key, true)) {
            LOG_WARN(TAG, "Alarm sound %s failed to start", key.c_str());
            source_.stop(channel);
        } else {
            alarm_channel_ = channel;
            alarm_playing_ = true;
            started_edge = !restart;
            ok = true;
            LOG_INFO(TAG, "Alarm %s: %s on channel %d at volume %d",
                     restart ? "restarted" : "started", key.c_str(), channel, alarm_volume_);
        }

        if (!ok) {
            alarm_playing_ = false;
            stopped_edge = restart;
            restoreAmbientLocked();
        }
    }

    if (started_edge) {
        (void)sink_.notifyAlarmStatus(true);
    } else if (stopped_edge) {
        (void)sink_.notifyAlarmStatus(false);
    }
    return ok;
}

void AudioCoordinator::stopAlarm() {
    {
        std::lock_guard<RecursiveMutex> lock(mutex_);
        if (!alarm_playing_) {
            LOG_DEBUG(TAG, "%s", "Alarm already stopped");
            return;
        }
        source_.stop(alarm_channel_);
        alarm_channel_ = NO_CHANNEL;
        alarm_playing_ = false;
        restoreAmbientLocked();
        LOG_INFO(TAG, "%s", "Alarm stopped");
    }
    (void)sink_.notifyAlarmStatus(false);
}

bool AudioCoordinator::playAmbientLocked(bool* started) {
    *started = false;
    if (ambient_playing_) {
        return true;
    }
    if (!source_.hasAmbientSound()) {
        LOG_ERROR(TAG, "%s", "No ambient sound available");
        return false;
    }
    const std::string key = source_.ambientSound();

    ChannelHandle channel = source_.acquireChannel();
    if (channel == NO_CHANNEL) {
        LOG_WARN(TAG, "%s", "No free channel for ambient sound");
        return false;
    }
    const int level = alarm_playing_ ? duckedLevel(ambient_volume_) : ambient_volume_;
    if (!source_.setVolume(channel, level) || !source_.play(channel, key, true)) {
        LOG_WARN(TAG, "Ambient sound %s failed to start", key.c_str());
        source_.stop(channel);
        return false;
    }

    ambient_channel_ = channel;
    ambient_playing_ = true;
    if (alarm_playing_) {
        pre_alarm_ambient_volume_ = ambient_volume_;
        ambient_ducked_ = true;
    }
    *started = true;
    LOG_INFO(TAG, "Ambient started on channel %d at volume %d%s", channel, level,
             ambient_ducked_ ? " (ducked)" : "");
    return true;
}

bool AudioCoordinator::stopAmbientLocked() {
    if (!ambient_playing_) {
        LOG_DEBUG(TAG, "%s", "Ambient already stopped");
        return false;
    }
    source_.stop(ambient_channel_);
    ambient_channel_ = NO_CHANNEL;
    ambient_playing_ = false;
    if (ambient_ducked_) {
        ambient_ducked_ = false;
        ambient_volume_ = pre_alarm_ambient_volume_;
    }
    LOG_INFO(TAG, "%s", "Ambient stopped");
    return true;
}

bool AudioCoordinator::playAmbient() {
    bool started = false;
    bool ok = false;
    {
        std::lock_guard<RecursiveMutex> lock(mutex_);
        ok = playAmbientLocked(&started);
    }
    if (started) {
        (void)sink_.notifyAmbientStatus(true);
    }
    return ok;
}

void AudioCoordinator::stopAmbient() {
    bool stopped = false;
    {
        std::lock_guard<RecursiveMutex> lock(mutex_);
        stopped = stopAmbientLocked();
    }
    if (stopped) {
        (void)sink_.notifyAmbientStatus(false);
    }
}

bool AudioCoordinator::toggleAmbient() {
    bool started = false;
    bool stopped = false;
    bool playing = false;
    {
        std::lock_guard<RecursiveMutex> lock(mutex_);
        if (ambient_playing_) {
            stopped = stopAmbientLocked();
        } else {
            (void)playAmbientLocked(&started);
        }
        playing = ambient_playing_;
    }
    if (started) {
        (void)sink_.notifyAmbientStatus(true);
    } else if (stopped) {
        (void)sink_.notifyAmbientStatus(false);
    }
    return playing;
}

ValidationError AudioCoordinator::setAmbientVolume(int volume) {
    if (!isVolumeInRange(volume)) {
        LOG_WARN(TAG, "Rejected ambient volume %d", volume);
        return ValidationError::VOLUME;
    }
    std::lock_guard<RtosMutex> persist(persist_mutex_);
    {
        std::lock_guard<RecursiveMutex> lock(mutex_);
        ambient_volume_ = volume;
        if (ambient_ducked_) {
            pre_alarm_ambient_volume_ = volume;
        }
        if (ambient_playing_) {
            const int level = ambient_ducked_ ? duckedLevel(volume) : volume;
            if (!source_.setVolume(ambient_channel_, level)) {
                LOG_WARN(TAG, "Could not apply ambient volume to channel %d", ambient_channel_);
            }
        }
    }
    if (!settings_.setVolume(volume)) {
        LOG_ERROR(TAG, "Ambient volume %d not persisted", volume);
    }
    (void)sink_.notifyVolume(volume);
    return ValidationError::NONE;
}

ValidationError AudioCoordinator::setAlarmVolume(int volume) {
    if (!isVolumeInRange(volume)) {
        LOG_WARN(TAG, "Rejected alarm volume %d", volume);
        return ValidationError::VOLUME;
    }
    std::lock_guard<RtosMutex> persist(persist_mutex_);
    {
        std::lock_guard<RecursiveMutex> lock(mutex_);
        alarm_volume_ = volume;
        if (alarm_playing_ && !source_.setVolume(alarm_channel_, volume)) {
            LOG_WARN(TAG, "Could not apply alarm volume to channel %d", alarm_channel_);
        }
    }
    if (!settings_.setAlarmVolume(volume)) {
        LOG_ERROR(TAG, "Alarm volume %d not persisted", volume);
    }
    (void)sink_.notifyAlarmVolume(volume);
    return ValidationError::NONE;
}

bool AudioCoordinator::isAlarmPlaying() const {
    std::lock_guard<RecursiveMutex> lock(mutex_);
    return alarm_playing_;
}

bool AudioCoordinator::isAmbientPlaying() const {
    std::lock_guard<RecursiveMutex> lock(mutex_);
    return ambient_playing_;
}

int AudioCoordinator::getAmbientVolume() const {
    std::lock_guard<RecursiveMutex> lock(mutex_);
    return ambient_volume_;
}

int AudioCoordinator::getAlarmVolume() const {
    std::lock_guard<RecursiveMutex> lock(mutex_);
    return alarm_volume_;
}

int AudioCoordinator::getEffectiveAmbientVolume() const {
    std::lock_guard<RecursiveMutex> lock(mutex_);
    if (!ambient_playing_) {
        return 0;
    }
    return ambient_ducked_ ? duckedLevel(ambient_volume_) : ambient_volume_;
}

void AudioCoordinator::shutdown() {
    LOG_INFO(TAG, "%s", "Stopping all audio");
    stopAlarm();
    stopAmbient();
}
