#ifndef SIMULATED_SOUND_SOURCE_HPP
#define SIMULATED_SOUND_SOURCE_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <alarm_block/audio/sound_source.hpp>
#include <alarm_block/utils/rtos_mutex.hpp>

// Channel table in RAM with no audio output. Used on boards without a
// speaker and by tests, which can inspect every channel.
class SimulatedSoundSource : public SoundSource {
public:
    SimulatedSoundSource(std::size_t channel_count,
                         std::vector<std::string> alarm_sounds,
                         std::string ambient_sound);

    bool init() override;

    std::vector<std::string> alarmSounds() const override;
    bool hasAmbientSound() const override;
    std::string ambientSound() const override;

    ChannelHandle acquireChannel() override;
    bool play(ChannelHandle channel, const std::string& key, bool loop) override;
    void stop(ChannelHandle channel) override;
    bool setVolume(ChannelHandle channel, int percent) override;
    bool isBusy(ChannelHandle channel) const override;

    // Inspection
    bool isPlaying(ChannelHandle channel) const;
    int volumeOf(ChannelHandle channel) const;
    std::string trackOf(ChannelHandle channel) const;
    std::size_t busyCount() const;
    std::size_t channelCount() const { return channels_.size(); }

private:
    struct Channel {
        bool acquired = false;
        bool playing = false;
        bool loop = false;
        int volume = 0;
        std::string track;
    };

    bool isValid(ChannelHandle channel) const;
    bool isKnownTrack(const std::string& key) const;

    mutable RtosMutex mutex_;
    std::vector<Channel> channels_;
    std::vector<std::string> alarm_sounds_;
    std::string ambient_sound_;
};

#endif // SIMULATED_SOUND_SOURCE_HPP
