#ifndef SPEAKER_SOUND_SOURCE_HPP
#define SPEAKER_SOUND_SOURCE_HPP

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>
#include <alarm_block/audio/sound_source.hpp>
#include <alarm_block/audio/tone_track.hpp>
#include <alarm_block/config/config.hpp>
#include <alarm_block/hardware/speaker.hpp>
#include <alarm_block/utils/rtos_mutex.hpp>

// One LEDC speaker per channel. Each playing channel has its own task
// stepping through a ToneTrack until stop() asks it to exit.
class SpeakerSoundSource : public SoundSource {
public:
    SpeakerSoundSource();
    ~SpeakerSoundSource() override;

    SpeakerSoundSource(const SpeakerSoundSource&) = delete;
    SpeakerSoundSource& operator=(const SpeakerSoundSource&) = delete;

    bool init() override;

    std::vector<std::string> alarmSounds() const override;
    bool hasAmbientSound() const override;
    std::string ambientSound() const override;

    ChannelHandle acquireChannel() override;
    bool play(ChannelHandle channel, const std::string& key, bool loop) override;
    void stop(ChannelHandle channel) override;
    bool setVolume(ChannelHandle channel, int percent) override;
    bool isBusy(ChannelHandle channel) const override;

private:
    static constexpr std::size_t CHANNELS = Config::Hardware::Audio::speaker_count;

    struct Channel {
        std::unique_ptr<Speaker> speaker;
        bool ready = false;
        bool acquired = false;
        const ToneTrack* track = nullptr;
        bool loop = false;
        TaskHandle_t task = nullptr;
        SemaphoreHandle_t done = nullptr;
        std::atomic<bool> stop_requested{false};
    };

    static bool isValid(ChannelHandle channel);
    static void playbackEntry(void* arg);
    void stopTask(Channel& ch);

    mutable RtosMutex mutex_;
    Channel channels_[CHANNELS];
};

#endif // SPEAKER_SOUND_SOURCE_HPP
