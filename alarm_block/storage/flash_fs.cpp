#include <alarm_block/storage/flash_fs.hpp>
#include <alarm_block/config/config.hpp>
#include <alarm_block/utils/logger.hpp>
#include <esp_spiffs.h>

namespace {
    static const char* TAG = "FLASH_FS";
    static bool s_mounted = false;
}

namespace FlashFs {
    bool mount() {
        if (s_mounted) {
            return true;
        }
        esp_vfs_spiffs_conf_t conf = {
            .base_path = Config::Storage::base_path,
            .partition_label = Config::Storage::partition_label,
            .max_files = Config::Storage::max_open_files,
            .format_if_mount_failed = true
        };
        esp_err_t err = esp_vfs_spiffs_register(&conf);
        if (err != ESP_OK) {
            LOG_ERROR(TAG, "SPIFFS mount at %s failed: %s", Config::Storage::base_path, esp_err_to_name(err));
            return false;
        }

        size_t total = 0;
        size_t used = 0;
        if (esp_spiffs_info(Config::Storage::partition_label, &total, &used) == ESP_OK) {
            LOG_INFO(TAG, "SPIFFS mounted at %s: %u/%u bytes used", Config::Storage::base_path,
                     static_cast<unsigned>(used), static_cast<unsigned>(total));
        }
        s_mounted = true;
        return true;
    }
}
