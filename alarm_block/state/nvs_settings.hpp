#ifndef NVS_SETTINGS_HPP
#define NVS_SETTINGS_HPP

#include <cstdint>
#include <alarm_block/state/settings_provider.hpp>
#include <alarm_block/utils/rtos_mutex.hpp>

// SettingsProvider backed by a single NVS blob.
// Reads are served from RAM; every accepted write goes through to flash.
class NvsSettings : public SettingsProvider {
public:
    explicit NvsSettings(const char* nvs_namespace = "settings");

    // Load from NVS, or fall back to Config::Audio defaults and store them
    void init();

    GlobalMode getGlobalSchedule() const override;
    bool setGlobalSchedule(GlobalMode mode) override;

    int getVolume() const override;
    bool setVolume(int volume) override;

    int getAlarmVolume() const override;
    bool setAlarmVolume(int volume) override;

private:
    struct SettingsData {
        uint8_t version;
        uint8_t mode;
        uint8_t volume;
        uint8_t alarm_volume;
    };

    void loadDefaults();
    bool loadFromNvs();
    bool saveToNvs();

    const char* namespace_;
    mutable RtosMutex mutex_;
    RtosMutex write_mutex_;  // orders flash writes, never held with mutex_ across I/O
    SettingsData data_;
    bool initialized_ = false;
};

#endif // NVS_SETTINGS_HPP
