#ifndef FLASH_FS_HPP
#define FLASH_FS_HPP

namespace FlashFs {
    // Mount the SPIFFS data partition at Config::Storage::base_path.
    // Formats the partition if it cannot be mounted. Returns false if the
    // filesystem is unusable; the caller keeps running without persistence.
    bool mount();
}

#endif // FLASH_FS_HPP
