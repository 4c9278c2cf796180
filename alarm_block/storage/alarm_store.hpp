#ifndef ALARM_STORE_HPP
#define ALARM_STORE_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include <alarm_block/models/alarm.hpp>

// In-memory alarm table backed by a JSON snapshot on flash.
//
// Not internally locked: the owner (AlarmCoordinator) serialises every call.
// get_all() returns copies, so callers never see a half-applied mutation.
class AlarmStore {
public:
    explicit AlarmStore(std::string path);

    // Replace the in-memory table with the snapshot on disk.
    // Missing file -> the complete temp file left by an interrupted save, else empty.
    // Unreadable/corrupt file -> empty (logged).
    // Malformed records are skipped individually.
    std::map<std::string, Alarm> load();

    // Write the given set atomically (temp file + rename). False on I/O error;
    // the previous snapshot is left intact in that case.
    bool save(const std::vector<Alarm>& alarms);
    bool save();

    void upsert(const Alarm& alarm);
    bool remove(const std::string& id);
    bool contains(const std::string& id) const;
    bool find(const std::string& id, Alarm* out) const;
    std::vector<Alarm> getAll() const;
    std::size_t size() const { return alarms_.size(); }

    const std::string& path() const { return path_; }

    // Snapshot codec, exposed for tests
    static std::string encode(const std::vector<Alarm>& alarms);
    static std::map<std::string, Alarm> decode(const char* json, int len);

private:
    bool readFile(const std::string& path, std::string* out, bool* missing) const;
    bool recoverTemp(std::string* out) const;

    std::string path_;
    std::map<std::string, Alarm> alarms_;
};

#endif // ALARM_STORE_HPP
