#ifndef SPEAKER_HPP
#define SPEAKER_HPP

#include <atomic>
#include <cstdint>
#include <driver/gpio.h>
#include <driver/ledc.h>
#include <freertos/FreeRTOS.h>

// LEDC square-wave speaker with adjustable pitch and loudness
class Speaker {
public:
    // active_high: true if driving GPIO high turns the speaker ON
    // max_duty_percent: duty at volume 100
    Speaker(gpio_num_t pin, ledc_channel_t channel, ledc_timer_t timer,
            bool active_high = true, uint8_t max_duty_percent = 50);

    bool init();

    bool setFrequency(uint32_t freq_hz);
    // 0-100, applied on the next toneOn() and immediately if sounding
    void setVolume(uint8_t percent);
    uint8_t volume() const { return volume_.load(); }

    void toneOn();
    void toneOff();

private:
    uint32_t dutyFor(uint8_t percent) const;

    gpio_num_t pin_;
    ledc_channel_t channel_;
    ledc_timer_t timer_;
    bool active_high_;
    uint8_t max_duty_percent_;
    std::atomic<uint8_t> volume_{0};
    std::atomic<bool> sounding_{false};
};

#endif // SPEAKER_HPP
