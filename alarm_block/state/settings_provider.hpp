#ifndef SETTINGS_PROVIDER_HPP
#define SETTINGS_PROVIDER_HPP

#include <alarm_block/models/alarm.hpp>

// Persisted user settings the coordinators read and write.
// Volumes are percentages; setters reject values outside [0, 100].
class SettingsProvider {
public:
    virtual ~SettingsProvider() = default;

    virtual GlobalMode getGlobalSchedule() const = 0;
    virtual bool setGlobalSchedule(GlobalMode mode) = 0;

    // Ambient volume
    virtual int getVolume() const = 0;
    virtual bool setVolume(int volume) = 0;

    virtual int getAlarmVolume() const = 0;
    virtual bool setAlarmVolume(int volume) = 0;
};

#endif // SETTINGS_PROVIDER_HPP
