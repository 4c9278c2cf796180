#include <alarm_block/audio/simulated_sound_source.hpp>
#include <alarm_block/utils/logger.hpp>

#include <algorithm>
#include <mutex>
#include <utility>

static const char* TAG = "SIM_AUDIO";

SimulatedSoundSource::SimulatedSoundSource(std::size_t channel_count,
                                           std::vector<std::string> alarm_sounds,
                                           std::string ambient_sound)
    : channels_(channel_count),
      alarm_sounds_(std::move(alarm_sounds)),
      ambient_sound_(std::move(ambient_sound)) {}

bool SimulatedSoundSource::init() {
    LOG_INFO(TAG, "Simulated audio: %u channels, %u alarm sounds, ambient %s",
             static_cast<unsigned>(channels_.size()), static_cast<unsigned>(alarm_sounds_.size()),
             ambient_sound_.empty() ? "(none)" : ambient_sound_.c_str());
    return true;
}

std::vector<std::string> SimulatedSoundSource::alarmSounds() const {
    return alarm_sounds_;
}

bool SimulatedSoundSource::hasAmbientSound() const {
    return !ambient_sound_.empty();
}

std::string SimulatedSoundSource::ambientSound() const {
    return ambient_sound_;
}

bool SimulatedSoundSource::isValid(ChannelHandle channel) const {
    return channel >= 0 && static_cast<std::size_t>(channel) < channels_.size();
}

bool SimulatedSoundSource::isKnownTrack(const std::string& key) const {
    return key == ambient_sound_ ||
           std::find(alarm_sounds_.begin(), alarm_sounds_.end(), key) != alarm_sounds_.end();
}

ChannelHandle SimulatedSoundSource::acquireChannel() {
    std::lock_guard<RtosMutex> lock(mutex_);
    for (std::size_t i = 0; i < channels_.size(); ++i) {
        if (!channels_[i].acquired) {
            channels_[i] = Channel();
            channels_[i].acquired = true;
            return static_cast<ChannelHandle>(i);
        }
    }
    return NO_CHANNEL;
}

bool SimulatedSoundSource::play(ChannelHandle channel, const std::string& key, bool loop) {
    std::lock_guard<RtosMutex> lock(mutex_);
    if (!isValid(channel) || !channels_[channel].acquired) {
        LOG_ERROR(TAG, "Play on unacquired channel %d", channel);
        return false;
    }
    if (key.empty() || !isKnownTrack(key)) {
        LOG_ERROR(TAG, "Unknown track '%s'", key.c_str());
        return false;
    }
    Channel& ch = channels_[channel];
    ch.playing = true;
    ch.loop = loop;
    ch.track = key;
    LOG_DEBUG(TAG, "Channel %d playing %s%s", channel, key.c_str(), loop ? " (loop)" : "");
    return true;
}

void SimulatedSoundSource::stop(ChannelHandle channel) {
    std::lock_guard<RtosMutex> lock(mutex_);
    if (!isValid(channel)) {
        return;
    }
    channels_[channel] = Channel();
    LOG_DEBUG(TAG, "Channel %d released", channel);
}

bool SimulatedSoundSource::setVolume(ChannelHandle channel, int percent) {
    std::lock_guard<RtosMutex> lock(mutex_);
    if (!isValid(channel) || !channels_[channel].acquired) {
        return false;
    }
    channels_[channel].volume = std::max(0, std::min(100, percent));
    return true;
}

bool SimulatedSoundSource::isBusy(ChannelHandle channel) const {
    std::lock_guard<RtosMutex> lock(mutex_);
    return isValid(channel) && channels_[channel].acquired;
}

bool SimulatedSoundSource::isPlaying(ChannelHandle channel) const {
    std::lock_guard<RtosMutex> lock(mutex_);
    return isValid(channel) && channels_[channel].playing;
}

int SimulatedSoundSource::volumeOf(ChannelHandle channel) const {
    std::lock_guard<RtosMutex> lock(mutex_);
    return isValid(channel) ? channels_[channel].volume : -1;
}

std::string SimulatedSoundSource::trackOf(ChannelHandle channel) const {
    std::lock_guard<RtosMutex> lock(mutex_);
    return isValid(channel) ? channels_[channel].track : std::string();
}

std::size_t SimulatedSoundSource::busyCount() const {
    std::lock_guard<RtosMutex> lock(mutex_);
    std::size_t n = 0;
    for (const Channel& ch : channels_) {
        if (ch.acquired) {
            ++n;
        }
    }
    return n;
}
