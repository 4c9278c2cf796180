#ifndef RTOS_MUTEX_HPP
#define RTOS_MUTEX_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

// FreeRTOS mutexes with statically allocated control blocks.
// Both satisfy BasicLockable, so std::lock_guard works with them.

class RtosMutex {
public:
    RtosMutex() : handle_(xSemaphoreCreateMutexStatic(&storage_)) {}
    ~RtosMutex() { vSemaphoreDelete(handle_); }

    RtosMutex(const RtosMutex&) = delete;
    RtosMutex& operator=(const RtosMutex&) = delete;

    void lock() { (void)xSemaphoreTake(handle_, portMAX_DELAY); }
    void unlock() { (void)xSemaphoreGive(handle_); }

private:
    StaticSemaphore_t storage_;
    SemaphoreHandle_t handle_;
};

// Re-entrant: the owning task may lock again without deadlocking
class RecursiveMutex {
public:
    RecursiveMutex() : handle_(xSemaphoreCreateRecursiveMutexStatic(&storage_)) {}
    ~RecursiveMutex() { vSemaphoreDelete(handle_); }

    RecursiveMutex(const RecursiveMutex&) = delete;
    RecursiveMutex& operator=(const RecursiveMutex&) = delete;

    void lock() { (void)xSemaphoreTakeRecursive(handle_, portMAX_DELAY); }
    void unlock() { (void)xSemaphoreGiveRecursive(handle_); }

private:
    StaticSemaphore_t storage_;
    SemaphoreHandle_t handle_;
};

#endif // RTOS_MUTEX_HPP
