#include <alarm_block/utils/wall_clock.hpp>
#include <alarm_block/config/config.hpp>
#include <alarm_block/utils/logger.hpp>

#include <cstdlib>
#include <cstring>
#include <ctime>

namespace {
    static const char* TAG = "WALL_CLOCK";
}

namespace WallClock {
    void applyTimezone(const char* tz) {
        if (tz == nullptr || tz[0] == '\0') {
            LOG_WARN(TAG, "%s", "Empty timezone; keeping UTC");
            return;
        }
        setenv("TZ", tz, 1);
        tzset();
        LOG_INFO(TAG, "Timezone set to %s", tz);
    }

    bool isValid(time_t t) {
        return t >= Config::Time::valid_epoch_s;
    }

    time_t now() {
        time_t t = 0;
        time(&t);
        return isValid(t) ? t : 0;
    }

    void formatLocal(time_t t, char* out, std::size_t out_size) {
        if (out_size == 0) {
            return;
        }
        struct tm tm_local;
        if (localtime_r(&t, &tm_local) == nullptr ||
            strftime(out, out_size, "%Y-%m-%d %H:%M:%S", &tm_local) == 0) {
            std::strncpy(out, "????-??-?? ??:??:??", out_size - 1);
            out[out_size - 1] = '\0';
        }
    }
}
