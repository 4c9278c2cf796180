// Test runner: the linux-target firmware image whose app_main runs Catch2
// inside the FreeRTOS simulator, so queues, tasks and mutexes are real.
#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <alarm_block/utils/logger.hpp>
#include <alarm_block/utils/wall_clock.hpp>

#include <cstdlib>

extern "C" void app_main(void)
{
    Logger::setLevel(LogLevel::WARN);
    WallClock::applyTimezone("UTC0");

    static char program[] = "alarm_block_tests";
    char* argv[] = { program, nullptr };
    int result = Catch::Session().run(1, argv);

    std::exit(result < 0xff ? result : 0xff);
}
