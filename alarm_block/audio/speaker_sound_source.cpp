#include <alarm_block/audio/speaker_sound_source.hpp>
#include <alarm_block/utils/logger.hpp>
#include <esp_random.h>

#include <cstdio>
#include <mutex>

static const char* TAG = "SPEAKER_AUDIO";

SpeakerSoundSource::SpeakerSoundSource() {
    using namespace Config::Hardware::Audio;
    for (std::size_t i = 0; i < CHANNELS; ++i) {
        channels_[i].speaker.reset(new Speaker(static_cast<gpio_num_t>(speaker_gpio[i]),
                                               static_cast<ledc_channel_t>(ledc_channel[i]),
                                               static_cast<ledc_timer_t>(ledc_timer[i]),
                                               active_high, max_duty_percent));
        channels_[i].done = xSemaphoreCreateBinary();
    }
}

SpeakerSoundSource::~SpeakerSoundSource() {
    for (std::size_t i = 0; i < CHANNELS; ++i) {
        stop(static_cast<ChannelHandle>(i));
        if (channels_[i].done != nullptr) {
            vSemaphoreDelete(channels_[i].done);
        }
    }
}

bool SpeakerSoundSource::init() {
    std::size_t ready = 0;
    for (std::size_t i = 0; i < CHANNELS; ++i) {
        Channel& ch = channels_[i];
        ch.ready = ch.done != nullptr && ch.speaker->init();
        if (ch.ready) {
            ++ready;
        } else {
            LOG_ERROR(TAG, "Speaker %u failed to initialise", static_cast<unsigned>(i));
        }
    }
    LOG_INFO(TAG, "%u of %u speaker channels ready", static_cast<unsigned>(ready),
             static_cast<unsigned>(CHANNELS));
    return ready > 0;
}

std::vector<std::string> SpeakerSoundSource::alarmSounds() const {
    std::size_t count = 0;
    const ToneTrack* tracks = ToneTracks::alarmTracks(&count);
    std::vector<std::string> keys;
    keys.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        keys.emplace_back(tracks[i].key);
    }
    return keys;
}

bool SpeakerSoundSource::hasAmbientSound() const {
    return true;
}

std::string SpeakerSoundSource::ambientSound() const {
    return ToneTracks::ambientTrack().key;
}

bool SpeakerSoundSource::isValid(ChannelHandle channel) {
    return channel >= 0 && static_cast<std::size_t>(channel) < CHANNELS;
}

ChannelHandle SpeakerSoundSource::acquireChannel() {
    std::lock_guard<RtosMutex> lock(mutex_);
    for (std::size_t i = 0; i < CHANNELS; ++i) {
        if (channels_[i].ready && !channels_[i].acquired) {
            channels_[i].acquired = true;
            return static_cast<ChannelHandle>(i);
        }
    }
    return NO_CHANNEL;
}

bool SpeakerSoundSource::play(ChannelHandle channel, const std::string& key, bool loop) {
    const ToneTrack* track = ToneTracks::find(key.c_str());
    if (track == nullptr) {
        LOG_ERROR(TAG, "Unknown track '%s'", key.c_str());
        return false;
    }

    std::lock_guard<RtosMutex> lock(mutex_);
    if (!isValid(channel) || !channels_[channel].acquired) {
        LOG_ERROR(TAG, "Play on unacquired channel %d", channel);
        return false;
    }
    Channel& ch = channels_[channel];
    stopTask(ch);

    ch.track = track;
    ch.loop = loop;
    ch.stop_requested.store(false);
    (void)xSemaphoreTake(ch.done, 0);

    char name[16];
    std::snprintf(name, sizeof(name), "play%d", channel);
    if (xTaskCreate(&SpeakerSoundSource::playbackEntry, name,
                    Config::Tasks::Playback::stack_bytes / sizeof(StackType_t),
                    &ch, Config::TaskPriorities::HIGH, &ch.task) != pdPASS) {
        LOG_ERROR(TAG, "Failed to create playback task for channel %d", channel);
        ch.task = nullptr;
        ch.track = nullptr;
        return false;
    }
    LOG_DEBUG(TAG, "Channel %d playing %s%s", channel, track->key, loop ? " (loop)" : "");
    return true;
}

void SpeakerSoundSource::stopTask(Channel& ch) {
    if (ch.task == nullptr) {
        return;
    }
    ch.stop_requested.store(true);
    xTaskNotifyGive(ch.task);
    if (xSemaphoreTake(ch.done, pdMS_TO_TICKS(500)) != pdTRUE) {
        LOG_WARN(TAG, "%s", "Playback task did not exit in time");
    }
    ch.task = nullptr;
    ch.track = nullptr;
    ch.speaker->toneOff();
}

void SpeakerSoundSource::stop(ChannelHandle channel) {
    std::lock_guard<RtosMutex> lock(mutex_);
    if (!isValid(channel)) {
        return;
    }
    Channel& ch = channels_[channel];
    stopTask(ch);
    ch.acquired = false;
}

bool SpeakerSoundSource::setVolume(ChannelHandle channel, int percent) {
    std::lock_guard<RtosMutex> lock(mutex_);
    if (!isValid(channel) || !channels_[channel].acquired) {
        return false;
    }
    if (percent < 0) {
        percent = 0;
    } else if (percent > 100) {
        percent = 100;
    }
    channels_[channel].speaker->setVolume(static_cast<uint8_t>(percent));
    return true;
}

bool SpeakerSoundSource::isBusy(ChannelHandle channel) const {
    std::lock_guard<RtosMutex> lock(mutex_);
    return isValid(channel) && channels_[channel].acquired;
}

void SpeakerSoundSource::playbackEntry(void* arg) {
    Channel* ch = static_cast<Channel*>(arg);
    const ToneTrack* track = ch->track;
    Speaker& speaker = *ch->speaker;
    const uint32_t noise_span = ToneTracks::noise_max_hz - ToneTracks::noise_min_hz;

    bool finished = false;
    while (!ch->stop_requested.load()) {
        if (!finished) {
            for (std::size_t i = 0; i < track->step_count && !ch->stop_requested.load(); ++i) {
                const ToneStep& step = track->steps[i];
                uint32_t freq = step.freq_hz;
                if (track->noise) {
                    freq = ToneTracks::noise_min_hz + esp_random() % noise_span;
                }
                if (freq == 0 || !speaker.setFrequency(freq)) {
                    speaker.toneOff();
                } else {
                    speaker.toneOn();
                }
                // Sleeps for the step, wakes early on stop
                (void)ulTaskNotifyTake(pdTRUE, pdMS_TO_TICKS(step.duration_ms));
            }
            if (!ch->loop) {
                speaker.toneOff();
                finished = true;
            }
        } else {
            (void)ulTaskNotifyTake(pdTRUE, portMAX_DELAY);
        }
    }

    speaker.toneOff();
    xSemaphoreGive(ch->done);
    vTaskDelete(nullptr);
}
