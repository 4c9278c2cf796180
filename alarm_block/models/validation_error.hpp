#ifndef VALIDATION_ERROR_HPP
#define VALIDATION_ERROR_HPP

#include <cstdint>

// Rejected input, reported to the caller before any state changes.
// NONE means the input was accepted.
enum class ValidationError : uint8_t {
    NONE = 0,
    ID,
    HOUR,
    MINUTE,
    DAYS,
    SCHEDULE,
    VOLUME
};

// Name of the offending field ("" for NONE)
inline const char* validationFieldName(ValidationError err) {
    switch (err) {
        case ValidationError::NONE:     return "";
        case ValidationError::ID:       return "id";
        case ValidationError::HOUR:     return "hour";
        case ValidationError::MINUTE:   return "minute";
        case ValidationError::DAYS:     return "days";
        case ValidationError::SCHEDULE: return "schedule_tag";
        case ValidationError::VOLUME:   return "volume";
    }
    return "unknown";
}

inline bool isVolumeInRange(int volume) {
    return volume >= 0 && volume <= 100;
}

#endif // VALIDATION_ERROR_HPP
