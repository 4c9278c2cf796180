#include <alarm_block/state/nvs_settings.hpp>
#include <alarm_block/config/config.hpp>
#include <alarm_block/utils/logger.hpp>
#include <nvs_flash.h>
#include <nvs.h>

#include <mutex>

static const char* TAG = "SETTINGS";

namespace {
    static constexpr uint8_t SETTINGS_VERSION = 1;
    static const char* BLOB_KEY = "data";
}

NvsSettings::NvsSettings(const char* nvs_namespace) : namespace_(nvs_namespace) {
    loadDefaults();
}

void NvsSettings::loadDefaults() {
    data_.version = SETTINGS_VERSION;
    data_.mode = static_cast<uint8_t>(GlobalMode::A);
    data_.volume = static_cast<uint8_t>(Config::Audio::default_ambient_volume);
    data_.alarm_volume = static_cast<uint8_t>(Config::Audio::default_alarm_volume);
}

bool NvsSettings::loadFromNvs() {
    nvs_handle_t handle;
    esp_err_t err = nvs_open(namespace_, NVS_READONLY, &handle);
    if (err != ESP_OK) {
        return false;
    }

    SettingsData stored;
    size_t required_size = sizeof(SettingsData);
    err = nvs_get_blob(handle, BLOB_KEY, &stored, &required_size);
    nvs_close(handle);

    if (err != ESP_OK || required_size != sizeof(SettingsData) || stored.version != SETTINGS_VERSION) {
        return false;
    }
    if (stored.mode > static_cast<uint8_t>(GlobalMode::OFF) ||
        !isVolumeInRange(stored.volume) || !isVolumeInRange(stored.alarm_volume)) {
        LOG_WARN(TAG, "%s", "Stored settings out of range, using defaults");
        return false;
    }

    std::lock_guard<RtosMutex> lock(mutex_);
    data_ = stored;
    return true;
}

bool NvsSettings::saveToNvs() {
    std::lock_guard<RtosMutex> write_lock(write_mutex_);
    SettingsData snapshot;
    {
        std::lock_guard<RtosMutex> lock(mutex_);
        snapshot = data_;
    }

    nvs_handle_t handle;
    esp_err_t err = nvs_open(namespace_, NVS_READWRITE, &handle);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "NVS open failed: %d", static_cast<int>(err));
        return false;
    }

    err = nvs_set_blob(handle, BLOB_KEY, &snapshot, sizeof(SettingsData));
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "NVS set_blob failed: %d", static_cast<int>(err));
        nvs_close(handle);
        return false;
    }

    err = nvs_commit(handle);
    nvs_close(handle);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "NVS commit failed: %d", static_cast<int>(err));
        return false;
    }
    return true;
}

void NvsSettings::init() {
    if (initialized_) {
        return;
    }

    if (loadFromNvs()) {
        LOG_INFO(TAG, "Loaded settings: schedule %s, volume %d, alarm volume %d",
                 globalModeName(getGlobalSchedule()), getVolume(), getAlarmVolume());
    } else {
        LOG_INFO(TAG, "%s", "Using default settings (NVS not found or empty)");
        (void)saveToNvs();
    }

    initialized_ = true;
}

GlobalMode NvsSettings::getGlobalSchedule() const {
    std::lock_guard<RtosMutex> lock(mutex_);
    return static_cast<GlobalMode>(data_.mode);
}

bool NvsSettings::setGlobalSchedule(GlobalMode mode) {
    {
        std::lock_guard<RtosMutex> lock(mutex_);
        data_.mode = static_cast<uint8_t>(mode);
    }
    LOG_INFO(TAG, "Global schedule set to %s", globalModeName(mode));
    return saveToNvs();
}

int NvsSettings::getVolume() const {
    std::lock_guard<RtosMutex> lock(mutex_);
    return data_.volume;
}

bool NvsSettings::setVolume(int volume) {
    if (!isVolumeInRange(volume)) {
        LOG_WARN(TAG, "Rejected ambient volume %d", volume);
        return false;
    }
    {
        std::lock_guard<RtosMutex> lock(mutex_);
        data_.volume = static_cast<uint8_t>(volume);
    }
    return saveToNvs();
}

int NvsSettings::getAlarmVolume() const {
    std::lock_guard<RtosMutex> lock(mutex_);
    return data_.alarm_volume;
}

bool NvsSettings::setAlarmVolume(int volume) {
    if (!isVolumeInRange(volume)) {
        LOG_WARN(TAG, "Rejected alarm volume %d", volume);
        return false;
    }
    {
        std::lock_guard<RtosMutex> lock(mutex_);
        data_.alarm_volume = static_cast<uint8_t>(volume);
    }
    return saveToNvs();
}
