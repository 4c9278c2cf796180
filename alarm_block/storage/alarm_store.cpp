#include <alarm_block/storage/alarm_store.hpp>
#include <alarm_block/config/config.hpp>
#include <alarm_block/utils/logger.hpp>
#include <mjson.h>

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <utility>

namespace {
    static const char* TAG = "ALARM_STORE";

    static bool getInteger(const char* json, int len, const char* path, int min, int max, int* out) {
        double value = 0.0;
        if (mjson_get_number(json, len, path, &value) != 1) {
            return false;
        }
        if (std::floor(value) != value || value < min || value > max) {
            return false;
        }
        *out = static_cast<int>(value);
        return true;
    }

    static bool getDays(const char* json, int len, uint8_t* out_mask) {
        const char* days_tok = nullptr;
        int days_len = 0;
        if (mjson_find(json, len, "$.days", &days_tok, &days_len) != MJSON_TOK_ARRAY) {
            return false;
        }
        std::vector<int> days;
        char path[16];
        for (int i = 0;; ++i) {
            std::snprintf(path, sizeof(path), "$[%d]", i);
            const char* tok = nullptr;
            int tok_len = 0;
            if (mjson_find(days_tok, days_len, path, &tok, &tok_len) == MJSON_TOK_INVALID) {
                break;
            }
            int day = 0;
            if (!getInteger(days_tok, days_len, path, 0, 6, &day)) {
                return false;
            }
            days.push_back(day);
        }
        uint8_t mask = 0;
        if (days.empty() || !daysToMask(days, &mask)) {
            return false;
        }
        *out_mask = mask;
        return true;
    }

    // One array element -> Alarm. Returns the name of the bad field, or nullptr on success.
    static const char* decodeRecord(const char* json, int len, Alarm* out) {
        Alarm alarm;

        const char* tok = nullptr;
        int tok_len = 0;
        int id_type = mjson_find(json, len, "$.id", &tok, &tok_len);
        if (id_type == MJSON_TOK_INVALID) {
            alarm.id = generateAlarmId();
            LOG_WARN(TAG, "Record without id, assigned %s", alarm.id.c_str());
        } else {
            char id[Config::Alarms::id_max_len + 1];
            int n = mjson_get_string(json, len, "$.id", id, sizeof(id));
            if (id_type != MJSON_TOK_STRING || n <= 0) {
                return "id";
            }
            alarm.id.assign(id, static_cast<std::size_t>(n));
        }

        int hour = 0;
        int minute = 0;
        if (!getInteger(json, len, "$.hour", 0, 23, &hour)) {
            return "hour";
        }
        if (!getInteger(json, len, "$.minute", 0, 59, &minute)) {
            return "minute";
        }
        alarm.hour = static_cast<uint8_t>(hour);
        alarm.minute = static_cast<uint8_t>(minute);

        if (!getDays(json, len, &alarm.days)) {
            return "days";
        }

        const char* key = "$.schedule";
        if (mjson_find(json, len, key, &tok, &tok_len) == MJSON_TOK_INVALID) {
            key = "$.schedule_tag";
        }
        if (mjson_find(json, len, key, &tok, &tok_len) != MJSON_TOK_INVALID) {
            char tag[8];
            if (mjson_get_string(json, len, key, tag, sizeof(tag)) <= 0 ||
                !parseScheduleTag(tag, &alarm.schedule)) {
                return "schedule";
            }
        }

        if (mjson_find(json, len, "$.active", &tok, &tok_len) != MJSON_TOK_INVALID) {
            int active = 1;
            if (mjson_get_bool(json, len, "$.active", &active) != 1) {
                return "active";
            }
            alarm.active = active != 0;
        }

        ValidationError err = validateAlarm(alarm);
        if (err != ValidationError::NONE) {
            return validationFieldName(err);
        }
        *out = std::move(alarm);
        return nullptr;
    }
}

AlarmStore::AlarmStore(std::string path) : path_(std::move(path)) {}

std::map<std::string, Alarm> AlarmStore::load() {
    alarms_.clear();

    std::string contents;
    bool missing = false;
    if (!readFile(path_, &contents, &missing)) {
        if (!missing || !recoverTemp(&contents)) {
            return alarms_;
        }
    }
    alarms_ = decode(contents.data(), static_cast<int>(contents.size()));
    LOG_INFO(TAG, "Loaded %u alarms from %s", static_cast<unsigned>(alarms_.size()), path_.c_str());
    return alarms_;
}

bool AlarmStore::recoverTemp(std::string* out) const {
    // save() on SPIFFS unlinks the snapshot before renaming the temp file
    // over it, so a reset in between leaves only the temp file behind.
    const std::string tmp_path = path_ + ".tmp";
    std::string contents;
    bool missing = false;
    if (!readFile(tmp_path, &contents, &missing)) {
        if (missing) {
            LOG_INFO(TAG, "No alarm snapshot at %s, starting empty", path_.c_str());
        }
        return false;
    }

    const char* tok = nullptr;
    int tok_len = 0;
    if (mjson_find(contents.data(), static_cast<int>(contents.size()), "$", &tok, &tok_len) !=
        MJSON_TOK_ARRAY) {
        LOG_WARN(TAG, "Discarding incomplete snapshot %s", tmp_path.c_str());
        (void)std::remove(tmp_path.c_str());
        return false;
    }

    LOG_WARN(TAG, "Recovering alarm snapshot from %s", tmp_path.c_str());
    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        LOG_ERROR(TAG, "Rename %s -> %s failed: errno %d", tmp_path.c_str(), path_.c_str(), errno);
    }
    *out = std::move(contents);
    return true;
}

bool AlarmStore::readFile(const std::string& path, std::string* out, bool* missing) const {
    *missing = false;
    FILE* f = std::fopen(path.c_str(), "rb");
    if (f == nullptr) {
        if (errno == ENOENT) {
            *missing = true;
        } else {
            LOG_ERROR(TAG, "Cannot open %s: errno %d", path.c_str(), errno);
        }
        return false;
    }

    char chunk[256];
    std::size_t n = 0;
    bool ok = true;
    while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0) {
        if (out->size() + n > Config::Storage::max_snapshot_bytes) {
            LOG_ERROR(TAG, "Snapshot %s exceeds %u bytes, ignoring it", path.c_str(),
                      static_cast<unsigned>(Config::Storage::max_snapshot_bytes));
            ok = false;
            break;
        }
        out->append(chunk, n);
    }
    if (ok && std::ferror(f)) {
        LOG_ERROR(TAG, "Read error on %s", path.c_str());
        ok = false;
    }
    std::fclose(f);
    return ok;
}

std::map<std::string, Alarm> AlarmStore::decode(const char* json, int len) {
    std::map<std::string, Alarm> result;

    const char* tok = nullptr;
    int tok_len = 0;
    if (mjson_find(json, len, "$", &tok, &tok_len) != MJSON_TOK_ARRAY) {
        LOG_ERROR(TAG, "%s", "Snapshot is not a JSON array, ignoring it");
        return result;
    }

    char path[16];
    int skipped = 0;
    for (int i = 0;; ++i) {
        std::snprintf(path, sizeof(path), "$[%d]", i);
        const char* rec = nullptr;
        int rec_len = 0;
        int type = mjson_find(json, len, path, &rec, &rec_len);
        if (type == MJSON_TOK_INVALID) {
            break;
        }
        if (type != MJSON_TOK_OBJECT) {
            LOG_WARN(TAG, "Skipping record %d: not an object", i);
            ++skipped;
            continue;
        }
        Alarm alarm;
        const char* bad_field = decodeRecord(rec, rec_len, &alarm);
        if (bad_field != nullptr) {
            LOG_WARN(TAG, "Skipping record %d: invalid %s", i, bad_field);
            ++skipped;
            continue;
        }
        if (result.count(alarm.id) != 0) {
            LOG_WARN(TAG, "Duplicate alarm id %s, keeping the later record", alarm.id.c_str());
        }
        result[alarm.id] = alarm;
    }
    if (skipped > 0) {
        LOG_WARN(TAG, "Skipped %d malformed alarm records", skipped);
    }
    return result;
}

std::string AlarmStore::encode(const std::vector<Alarm>& alarms) {
    char* buf = nullptr;
    mjson_printf(mjson_print_dynamic_buf, &buf, "[");
    for (std::size_t i = 0; i < alarms.size(); ++i) {
        const Alarm& a = alarms[i];
        mjson_printf(mjson_print_dynamic_buf, &buf, "%s{%Q:%Q,%Q:%d,%Q:%d,%Q:[",
                     i == 0 ? "" : ",",
                     "id", a.id.c_str(),
                     "hour", static_cast<int>(a.hour),
                     "minute", static_cast<int>(a.minute),
                     "days");
        std::vector<int> days = maskToDays(a.days);
        for (std::size_t d = 0; d < days.size(); ++d) {
            mjson_printf(mjson_print_dynamic_buf, &buf, "%s%d", d == 0 ? "" : ",", days[d]);
        }
        mjson_printf(mjson_print_dynamic_buf, &buf, "],%Q:%Q,%Q:%B}",
                     "schedule", scheduleTagName(a.schedule),
                     "active", a.active ? 1 : 0);
    }
    mjson_printf(mjson_print_dynamic_buf, &buf, "]");

    std::string out = buf != nullptr ? std::string(buf) : std::string("[]");
    std::free(buf);
    return out;
}

bool AlarmStore::save() {
    return save(getAll());
}

bool AlarmStore::save(const std::vector<Alarm>& alarms) {
    const std::string json = encode(alarms);
    const std::string tmp_path = path_ + ".tmp";

    FILE* f = std::fopen(tmp_path.c_str(), "wb");
    if (f == nullptr) {
        LOG_ERROR(TAG, "Cannot create %s: errno %d", tmp_path.c_str(), errno);
        return false;
    }
    bool ok = std::fwrite(json.data(), 1, json.size(), f) == json.size();
    ok = ok && std::fflush(f) == 0;
    ok = ok && fsync(fileno(f)) == 0;
    if (std::fclose(f) != 0) {
        ok = false;
    }
    if (!ok) {
        LOG_ERROR(TAG, "Write to %s failed: errno %d", tmp_path.c_str(), errno);
        (void)std::remove(tmp_path.c_str());
        return false;
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        // FAT and SPIFFS refuse to rename over an existing file
        if (unlink(path_.c_str()) != 0 && errno != ENOENT) {
            LOG_ERROR(TAG, "Cannot replace %s: errno %d", path_.c_str(), errno);
            (void)std::remove(tmp_path.c_str());
            return false;
        }
        if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
            LOG_ERROR(TAG, "Rename %s -> %s failed: errno %d", tmp_path.c_str(), path_.c_str(), errno);
            return false;
        }
    }

    LOG_INFO(TAG, "Saved %u alarms to %s", static_cast<unsigned>(alarms.size()), path_.c_str());
    return true;
}

void AlarmStore::upsert(const Alarm& alarm) {
    alarms_[alarm.id] = alarm;
}

bool AlarmStore::remove(const std::string& id) {
    return alarms_.erase(id) > 0;
}

bool AlarmStore::contains(const std::string& id) const {
    return alarms_.count(id) != 0;
}

bool AlarmStore::find(const std::string& id, Alarm* out) const {
    auto it = alarms_.find(id);
    if (it == alarms_.end()) {
        return false;
    }
    if (out != nullptr) {
        *out = it->second;
    }
    return true;
}

std::vector<Alarm> AlarmStore::getAll() const {
    std::vector<Alarm> out;
    out.reserve(alarms_.size());
    for (const auto& entry : alarms_) {
        out.push_back(entry.second);
    }
    return out;
}
