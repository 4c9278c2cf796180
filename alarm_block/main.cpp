#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <alarm_block/config/config.hpp>
#include <alarm_block/utils/logger.hpp>
#include <alarm_block/utils/wall_clock.hpp>
#include <alarm_block/utils/watchdog.hpp>
#include <alarm_block/storage/flash_fs.hpp>
#include <alarm_block/storage/alarm_store.hpp>
#include <alarm_block/state/nvs_settings.hpp>
#include <alarm_block/scheduling/trigger_scheduler.hpp>
#include <alarm_block/notify/log_notification_sink.hpp>
#include <alarm_block/notify/notification_dispatcher.hpp>
#include <alarm_block/audio/simulated_sound_source.hpp>
#include <alarm_block/audio/speaker_sound_source.hpp>
#include <alarm_block/coordinator/audio_coordinator.hpp>
#include <alarm_block/coordinator/alarm_coordinator.hpp>
#include <nvs_flash.h>

static const char* TAG = "MAIN";

static SoundSource& selectSoundSource() {
    if (Config::Features::use_simulated_audio) {
        static SimulatedSoundSource simulated(Config::Audio::channel_count,
                                              {"chime", "beacon", "klaxon"}, "white_noise");
        return simulated;
    }
    static SpeakerSoundSource speakers;
    return speakers;
}

extern "C" void app_main(void)
{
    Logger::setLevel(Logger::parseLevel(Config::Logging::level, LogLevel::INFO));
    LOG_INFO(TAG, "---Alarm block started (log level %s)---", Logger::levelName(Logger::getLevel()));

    // NVS holds the settings blob
    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        ESP_ERROR_CHECK(nvs_flash_erase());
        err = nvs_flash_init();
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "NVS init failed: %d", static_cast<int>(err));
    }

    if (!FlashFs::mount()) {
        LOG_ERROR(TAG, "%s", "Alarm snapshot storage unavailable, alarms will not survive a reboot");
    }

    WallClock::applyTimezone(Config::Time::timezone);
    Watchdog::init();

    static NvsSettings settings;
    settings.init();

    SoundSource& sound = selectSoundSource();
    if (!sound.init()) {
        LOG_ERROR(TAG, "%s", "Sound source failed to initialise, alarms will be silent");
    }

    static LogNotificationSink log_sink;
    static NotificationDispatcher notifier(log_sink);
    if (!notifier.start()) {
        LOG_ERROR(TAG, "%s", "Notification dispatcher not running");
    }

    static AlarmStore store(Config::Storage::alarms_path);
    static TriggerScheduler scheduler;
    static AudioCoordinator audio(sound, settings, notifier);
    static AlarmCoordinator alarms(store, scheduler, audio, settings, notifier);

    const std::size_t restored = alarms.restore();
    if (!scheduler.start()) {
        LOG_ERROR(TAG, "%s", "Scheduler failed to start, alarms will not fire");
    }

    LOG_INFO(TAG, "Ready: %u alarms, schedule %s, volume %d, alarm volume %d",
             static_cast<unsigned>(restored), globalModeName(alarms.globalMode()),
             audio.getAmbientVolume(), audio.getAlarmVolume());

    // Main task has nothing to do after initialization - block forever
    for (;;) {
        vTaskDelay(portMAX_DELAY);
    }
}
