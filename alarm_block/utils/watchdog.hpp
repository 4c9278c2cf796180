#ifndef WATCHDOG_HPP
#define WATCHDOG_HPP

#include <esp_task_wdt.h>

namespace Watchdog {
    // Configure the TWDT (call once from app_main before tasks start)
    void init();
    // Subscribe the calling task; false if the TWDT refused it
    bool subscribe();
    // Detach the calling task before it deletes itself
    void unsubscribe();
    // Reset the calling task's timer - call in task loop
    void feed();
}

#endif // WATCHDOG_HPP
