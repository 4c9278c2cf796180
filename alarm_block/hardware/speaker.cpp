#include <alarm_block/hardware/speaker.hpp>
#include <alarm_block/utils/logger.hpp>
#include <driver/ledc.h>

static const char* TAG = "SPEAKER";

namespace {
    static constexpr uint32_t INITIAL_FREQ_HZ = 1000;
    static constexpr uint32_t MAX_DUTY = (1u << LEDC_TIMER_10_BIT) - 1;
}

Speaker::Speaker(gpio_num_t pin, ledc_channel_t channel, ledc_timer_t timer,
                 bool active_high, uint8_t max_duty_percent)
    : pin_(pin), channel_(channel), timer_(timer), active_high_(active_high),
      max_duty_percent_(max_duty_percent > 100 ? 100 : max_duty_percent) {}

bool Speaker::init() {
    ledc_timer_config_t timer_conf = {};
    timer_conf.speed_mode = LEDC_LOW_SPEED_MODE;
    timer_conf.duty_resolution = LEDC_TIMER_10_BIT; // 10-bit duty (0-1023)
    timer_conf.timer_num = timer_;
    timer_conf.freq_hz = INITIAL_FREQ_HZ;
    timer_conf.clk_cfg = LEDC_AUTO_CLK;
    esp_err_t err = ledc_timer_config(&timer_conf);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "LEDC timer %d config failed: %d", static_cast<int>(timer_), static_cast<int>(err));
        return false;
    }

    ledc_channel_config_t channel_conf = {};
    channel_conf.gpio_num = pin_;
    channel_conf.speed_mode = LEDC_LOW_SPEED_MODE;
    channel_conf.channel = channel_;
    channel_conf.intr_type = LEDC_INTR_DISABLE;
    channel_conf.timer_sel = timer_;
    channel_conf.duty = 0; // start off
    channel_conf.hpoint = 0;
    err = ledc_channel_config(&channel_conf);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "LEDC channel %d config failed: %d", static_cast<int>(channel_), static_cast<int>(err));
        return false;
    }

    toneOff();
    return true;
}

bool Speaker::setFrequency(uint32_t freq_hz) {
    return ledc_set_freq(LEDC_LOW_SPEED_MODE, timer_, freq_hz) == ESP_OK;
}

uint32_t Speaker::dutyFor(uint8_t percent) const {
    uint32_t duty = (MAX_DUTY * max_duty_percent_ / 100) * percent / 100;
    if (!active_high_) {
        duty = MAX_DUTY - duty;
    }
    return duty;
}

void Speaker::setVolume(uint8_t percent) {
    volume_.store(percent > 100 ? 100 : percent);
    if (sounding_.load()) {
        toneOn();
    }
}

void Speaker::toneOn() {
    sounding_.store(true);
    ledc_set_duty(LEDC_LOW_SPEED_MODE, channel_, dutyFor(volume_.load()));
    ledc_update_duty(LEDC_LOW_SPEED_MODE, channel_);
}

void Speaker::toneOff() {
    sounding_.store(false);
    ledc_set_duty(LEDC_LOW_SPEED_MODE, channel_, active_high_ ? 0 : MAX_DUTY);
    ledc_update_duty(LEDC_LOW_SPEED_MODE, channel_);
}
