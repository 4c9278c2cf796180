#ifndef AUDIO_COORDINATOR_HPP
#define AUDIO_COORDINATOR_HPP

#include <alarm_block/audio/sound_source.hpp>
#include <alarm_block/models/validation_error.hpp>
#include <alarm_block/notify/notification_sink.hpp>
#include <alarm_block/state/settings_provider.hpp>
#include <alarm_block/utils/rtos_mutex.hpp>

// Owns the alarm and ambient channels.
//
// The alarm always wins: while it sounds, ambient keeps playing but is
// clamped to Config::Audio::duck_ceiling_percent, and stopping the alarm
// puts ambient back at exactly the level it had before. Play/stop calls are
// idempotent and notify only when a channel actually changes state.
//
// Every method takes one recursive lock. Nothing here blocks on I/O other
// than the sound source's fail-fast channel calls; settings writes and
// notifications happen after the lock is released. Volume setters hold
// persist_mutex_ (always taken before mutex_) across the in-memory update
// and the settings write, so the stored volume matches the live one.
class AudioCoordinator {
public:
    AudioCoordinator(SoundSource& source, SettingsProvider& settings, NotificationSink& sink);

    AudioCoordinator(const AudioCoordinator&) = delete;
    AudioCoordinator& operator=(const AudioCoordinator&) = delete;

    // Start (or restart with a freshly picked sound) the alarm.
    // False if there is no sound or no free channel.
    bool playAlarm();
    void stopAlarm();

    bool playAmbient();
    void stopAmbient();
    // Returns whether ambient is playing afterwards
    bool toggleAmbient();

    ValidationError setAmbientVolume(int volume);
    ValidationError setAlarmVolume(int volume);

    bool isAlarmPlaying() const;
    bool isAmbientPlaying() const;
    int getAmbientVolume() const;
    int getAlarmVolume() const;
    // Level actually applied to the ambient channel, 0 when it is idle
    int getEffectiveAmbientVolume() const;

    void shutdown();

private:
    int duckedLevel(int volume) const;
    void duckAmbientLocked();
    void restoreAmbientLocked();
    // *started is set when ambient goes from idle to playing
    bool playAmbientLocked(bool* started);
    // True when ambient was playing and is now stopped
    bool stopAmbientLocked();

    SoundSource& source_;
    SettingsProvider& settings_;
    NotificationSink& sink_;

    RtosMutex persist_mutex_;
    mutable RecursiveMutex mutex_;
    bool alarm_playing_ = false;
    bool ambient_playing_ = false;
    bool ambient_ducked_ = false;
    ChannelHandle alarm_channel_ = NO_CHANNEL;
    ChannelHandle ambient_channel_ = NO_CHANNEL;
    int ambient_volume_;
    int alarm_volume_;
    int pre_alarm_ambient_volume_;
};

#endif // AUDIO_COORDINATOR_HPP
