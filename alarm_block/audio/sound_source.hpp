#ifndef SOUND_SOURCE_HPP
#define SOUND_SOURCE_HPP

#include <string>
#include <vector>

using ChannelHandle = int;
static constexpr ChannelHandle NO_CHANNEL = -1;

// Playback backend: a pool of looping alarm tracks, one ambient track and a
// fixed set of channels. Implementations are picked once at startup.
class SoundSource {
public:
    virtual ~SoundSource() = default;

    virtual bool init() = 0;

    virtual std::vector<std::string> alarmSounds() const = 0;
    virtual bool hasAmbientSound() const = 0;
    virtual std::string ambientSound() const = 0;

    // Free channel, or NO_CHANNEL immediately when all are taken
    virtual ChannelHandle acquireChannel() = 0;
    virtual bool play(ChannelHandle channel, const std::string& key, bool loop) = 0;
    // Silences and releases the channel
    virtual void stop(ChannelHandle channel) = 0;
    virtual bool setVolume(ChannelHandle channel, int percent) = 0;
    virtual bool isBusy(ChannelHandle channel) const = 0;
};

#endif // SOUND_SOURCE_HPP
