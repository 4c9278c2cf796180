#include <catch2/catch.hpp>

#include <alarm_block/storage/alarm_store.hpp>
#include "../support/fakes.hpp"

#include <cstdio>
#include <cstring>
#include <string>

namespace {
    void writeFile(const std::string& path, const char* contents) {
        FILE* f = std::fopen(path.c_str(), "wb");
        REQUIRE(f != nullptr);
        std::fwrite(contents, 1, std::strlen(contents), f);
        std::fclose(f);
    }

    std::string readFile(const std::string& path) {
        std::string out;
        FILE* f = std::fopen(path.c_str(), "rb");
        if (f == nullptr) {
            return out;
        }
        char buf[256];
        std::size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) {
            out.append(buf, n);
        }
        std::fclose(f);
        return out;
    }
}

TEST_CASE("AlarmStore: saved alarms load back equal", "[store]") {
    const std::string path = tempSnapshotPath("roundtrip");
    AlarmStore store(path);

    std::vector<Alarm> alarms = {
        makeAlarm("wake", 6, 45, DayMask::WEEKDAYS),
        makeAlarm("weekend", 9, 0, DayMask::WEEKEND, ScheduleTag::B, false),
        makeAlarm("single", 0, 0, DayMask::SUNDAY),
    };
    REQUIRE(store.save(alarms));

    AlarmStore reopened(path);
    std::map<std::string, Alarm> loaded = reopened.load();
    REQUIRE(loaded.size() == 3);
    for (const Alarm& a : alarms) {
        REQUIRE(loaded.count(a.id) == 1);
        REQUIRE(loaded[a.id] == a);
    }
    REQUIRE(reopened.size() == 3);
    REQUIRE(readFile(path + ".tmp").empty());
}

TEST_CASE("AlarmStore: snapshot uses the schedule key and day lists", "[store]") {
    std::string json = AlarmStore::encode({makeAlarm("a1", 7, 30, DayMask::MONDAY | DayMask::TUESDAY)});
    REQUIRE(json == "[{\"id\":\"a1\",\"hour\":7,\"minute\":30,\"days\":[0,1],\"schedule\":\"a\",\"active\":true}]");
    REQUIRE(AlarmStore::encode({}) == "[]");
}

TEST_CASE("AlarmStore: missing file loads empty", "[store]") {
    AlarmStore store(tempSnapshotPath("missing"));
    REQUIRE(store.load().empty());
    REQUIRE(store.size() == 0);
}

TEST_CASE("AlarmStore: a save interrupted after unlink recovers from the temp file", "[store]") {
    const std::string path = tempSnapshotPath("interrupted");
    writeFile(path + ".tmp", AlarmStore::encode({makeAlarm("survivor", 6, 30, DayMask::WEEKDAYS)}).c_str());

    AlarmStore store(path);
    std::map<std::string, Alarm> loaded = store.load();
    REQUIRE(loaded.size() == 1);
    REQUIRE(loaded["survivor"] == makeAlarm("survivor", 6, 30, DayMask::WEEKDAYS));

    // The temp file has been moved into place
    REQUIRE(readFile(path + ".tmp").empty());
    AlarmStore reopened(path);
    REQUIRE(reopened.load().size() == 1);
}

TEST_CASE("AlarmStore: a truncated temp file is discarded", "[store]") {
    const std::string path = tempSnapshotPath("truncated");
    writeFile(path + ".tmp", "[{\"id\":\"half\",\"hour\":6,\"min");

    AlarmStore store(path);
    REQUIRE(store.load().empty());
    REQUIRE(readFile(path + ".tmp").empty());
}

TEST_CASE("AlarmStore: an existing snapshot wins over a stale temp file", "[store]") {
    const std::string path = tempSnapshotPath("stale_tmp");
    writeFile(path, AlarmStore::encode({makeAlarm("current", 7, 0, DayMask::DAILY)}).c_str());
    writeFile(path + ".tmp", AlarmStore::encode({makeAlarm("pending", 8, 0, DayMask::DAILY)}).c_str());

    AlarmStore store(path);
    std::map<std::string, Alarm> loaded = store.load();
    REQUIRE(loaded.size() == 1);
    REQUIRE(loaded.count("current") == 1);
}

TEST_CASE("AlarmStore: malformed records are skipped individually", "[store]") {
    const std::string path = tempSnapshotPath("malformed");
    writeFile(path,
              "["
              "{\"id\":\"good\",\"hour\":7,\"minute\":0,\"days\":[0]},"
              "{\"id\":\"bad_hour\",\"hour\":25,\"minute\":0,\"days\":[0]},"
              "{\"id\":\"bad_days\",\"hour\":7,\"minute\":0,\"days\":[]},"
              "{\"id\":\"day_range\",\"hour\":7,\"minute\":0,\"days\":[9]},"
              "{\"id\":\"no_minute\",\"hour\":7,\"days\":[1]},"
              "{\"id\":\"fraction\",\"hour\":7.5,\"minute\":0,\"days\":[1]},"
              "{\"id\":\"bad_tag\",\"hour\":7,\"minute\":0,\"days\":[1],\"schedule\":\"z\"},"
              "42,"
              "{\"id\":\"also_good\",\"hour\":22,\"minute\":15,\"days\":[5,6],\"schedule\":\"b\",\"active\":false}"
              "]");

    AlarmStore store(path);
    std::map<std::string, Alarm> loaded = store.load();
    REQUIRE(loaded.size() == 2);
    REQUIRE(loaded.count("good") == 1);
    REQUIRE(loaded["also_good"] == makeAlarm("also_good", 22, 15, DayMask::WEEKEND, ScheduleTag::B, false));
}

TEST_CASE("AlarmStore: optional fields take their defaults", "[store]") {
    const char* json = "[{\"hour\":8,\"minute\":10,\"days\":[3,3,4]},"
                       "{\"id\":\"legacy\",\"hour\":8,\"minute\":0,\"days\":[2],\"schedule_tag\":\"b\"}]";
    std::map<std::string, Alarm> loaded = AlarmStore::decode(json, static_cast<int>(std::strlen(json)));
    REQUIRE(loaded.size() == 2);

    REQUIRE(loaded.count("legacy") == 1);
    REQUIRE(loaded["legacy"].schedule == ScheduleTag::B);

    loaded.erase("legacy");
    const Alarm& generated = loaded.begin()->second;
    REQUIRE(generated.id.size() == 36);
    REQUIRE(generated.days == (DayMask::THURSDAY | DayMask::FRIDAY));
    REQUIRE(generated.schedule == ScheduleTag::A);
    REQUIRE(generated.active);
}

TEST_CASE("AlarmStore: a non-array snapshot loads empty", "[store]") {
    const std::string path = tempSnapshotPath("object");
    writeFile(path, "{\"id\":\"x\",\"hour\":1,\"minute\":1,\"days\":[1]}");
    AlarmStore store(path);
    REQUIRE(store.load().empty());

    writeFile(path, "not json at all");
    REQUIRE(store.load().empty());
}

TEST_CASE("AlarmStore: load replaces the in-memory table", "[store]") {
    const std::string path = tempSnapshotPath("replace");
    AlarmStore store(path);
    store.upsert(makeAlarm("memory_only", 1, 2, DayMask::DAILY));
    REQUIRE(store.contains("memory_only"));

    REQUIRE(store.load().empty());
    REQUIRE_FALSE(store.contains("memory_only"));
}

TEST_CASE("AlarmStore: save overwrites an existing snapshot", "[store]") {
    const std::string path = tempSnapshotPath("overwrite");
    AlarmStore store(path);
    store.upsert(makeAlarm("one", 5, 0, DayMask::DAILY));
    store.upsert(makeAlarm("two", 6, 0, DayMask::DAILY));
    REQUIRE(store.save());

    REQUIRE(store.remove("one"));
    REQUIRE_FALSE(store.remove("one"));
    REQUIRE(store.save());

    AlarmStore reopened(path);
    std::map<std::string, Alarm> loaded = reopened.load();
    REQUIRE(loaded.size() == 1);
    REQUIRE(loaded.count("two") == 1);
}

TEST_CASE("AlarmStore: save into a missing directory fails and keeps memory", "[store]") {
    AlarmStore store("/tmp/alarm_block_no_such_dir/alarms.json");
    store.upsert(makeAlarm("kept", 5, 0, DayMask::DAILY));
    REQUIRE_FALSE(store.save());
    REQUIRE(store.contains("kept"));
}

TEST_CASE("AlarmStore: get_all returns copies", "[store]") {
    AlarmStore store(tempSnapshotPath("copies"));
    store.upsert(makeAlarm("a", 5, 0, DayMask::DAILY));
    std::vector<Alarm> snapshot = store.getAll();
    snapshot[0].hour = 9;

    Alarm stored;
    REQUIRE(store.find("a", &stored));
    REQUIRE(stored.hour == 5);
}
