#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace Config {
namespace Logging {
    // Parsed with Logger::parseLevel at boot
    static constexpr const char* level = "info";
}

namespace Time {
    // POSIX TZ for America/New_York; alarms are evaluated in local time
    static constexpr const char* timezone = "EST5EDT,M3.2.0,M11.1.0";
    // Anything before 2025-01-01 00:00:00 UTC means the RTC was never set
    static constexpr time_t valid_epoch_s = 1735689600;
}

namespace Storage {
    static constexpr const char* base_path = "/data";
    static constexpr const char* partition_label = "storage";
    static constexpr std::size_t max_open_files = 4;
    static constexpr const char* alarms_path = "/data/alarms.json";
    // Snapshots above this size are treated as corrupt
    static constexpr std::size_t max_snapshot_bytes = 16 * 1024;
}

namespace Alarms {
    static constexpr std::size_t id_max_len = 40;
    static constexpr std::size_t max_alarms = 32;
}

namespace Scheduler {
    // A job that is late by at most this much still fires
    static constexpr uint32_t misfire_grace_s = 60;
    static constexpr uint32_t tick_ms = 500;
    static constexpr uint8_t worker_count = 2;
    static constexpr std::size_t fire_queue_depth = 8;
}

namespace Notifications {
    static constexpr std::size_t queue_depth = 16;
}

namespace Audio {
    static constexpr uint8_t default_ambient_volume = 25;
    static constexpr uint8_t default_alarm_volume = 75;
    // Ambient is clamped to this level while the alarm sounds
    static constexpr uint8_t duck_ceiling_percent = 10;
    static constexpr std::size_t channel_count = 4;
}

namespace Hardware {
namespace Audio {
    // One speaker per playback channel, each on its own LEDC timer so the
    // two channels can play different pitches at once
    static constexpr std::size_t speaker_count = 2;
    static constexpr int speaker_gpio[speaker_count] = { 25, 26 };
    static constexpr int ledc_channel[speaker_count] = { 0, 1 };
    static constexpr int ledc_timer[speaker_count] = { 0, 1 };
    // Duty at 100% volume; a square wave is loudest at 50%
    static constexpr uint8_t max_duty_percent = 50;
    static constexpr bool active_high = true;
}
}

// Task priority levels (higher number = higher priority, can preempt lower)
namespace TaskPriorities {
    // Fired alarms must not wait behind bookkeeping
    static constexpr UBaseType_t CRITICAL = tskIDLE_PRIORITY + 3;

    // Scheduler tick and sound playback need steady timing
    static constexpr UBaseType_t HIGH     = tskIDLE_PRIORITY + 2;

    // Notification delivery can tolerate latency
    static constexpr UBaseType_t NORMAL   = tskIDLE_PRIORITY + 1;
}

namespace Tasks {
namespace SchedulerTick {
    static constexpr uint32_t stack_bytes = 4096;
}
namespace SchedulerWorker {
    static constexpr uint32_t stack_bytes = 4096;
}
namespace Notifier {
    static constexpr uint32_t stack_bytes = 4096;
}
namespace Playback {
    static constexpr uint32_t stack_bytes = 3072;
}
}

namespace Watchdog {
    static constexpr uint32_t timeout_ms = 8000;
}

// Subsystem selection, read once in app_main
namespace Features {
    // true: in-memory channels (bench boards without a speaker)
    static constexpr bool use_simulated_audio = false;
}
}

#endif // CONFIG_HPP
