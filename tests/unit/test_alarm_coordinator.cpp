#include <catch2/catch.hpp>

#include <alarm_block/audio/simulated_sound_source.hpp>
#include <alarm_block/config/config.hpp>
#include <alarm_block/coordinator/alarm_coordinator.hpp>
#include <alarm_block/coordinator/audio_coordinator.hpp>
#include <alarm_block/scheduling/trigger_scheduler.hpp>
#include <alarm_block/storage/alarm_store.hpp>
#include "../support/fakes.hpp"

#include <atomic>
#include <cstdio>
#include <string>

namespace {
    SchedulerOptions manualOptions() {
        SchedulerOptions options;
        options.use_watchdog = false;
        return options;
    }

    struct CoordinatorFixture {
        explicit CoordinatorFixture(const char* name)
            : store(tempSnapshotPath(name)),
              scheduler(&FakeClock::now, manualOptions()),
              audio(source, settings, sink),
              alarms(store, scheduler, audio, settings, sink) {
            FakeClock::set(localTime(2026, 1, 5, 6, 0));
        }

        SimulatedSoundSource source{4, {"chime"}, "white_noise"};
        FakeSettingsProvider settings;
        RecordingSink sink;
        AlarmStore store;
        TriggerScheduler scheduler;
        AudioCoordinator audio;
        AlarmCoordinator alarms;
    };

    bool savedOnDisk(const AlarmStore& store, const std::string& id) {
        AlarmStore reader(store.path());
        return reader.load().count(id) == 1;
    }
}

TEST_CASE("AlarmCoordinator: gating matrix", "[coordinator][gate]") {
    const Alarm a_active = makeAlarm("x", 7, 0, DayMask::DAILY, ScheduleTag::A, true);
    const Alarm b_active = makeAlarm("x", 7, 0, DayMask::DAILY, ScheduleTag::B, true);
    const Alarm a_inactive = makeAlarm("x", 7, 0, DayMask::DAILY, ScheduleTag::A, false);

    REQUIRE(AlarmCoordinator::evaluateGate(GlobalMode::OFF, a_active) == GateDecision::BLOCKED_OFF);
    REQUIRE(AlarmCoordinator::evaluateGate(GlobalMode::OFF, b_active) == GateDecision::BLOCKED_OFF);
    REQUIRE(AlarmCoordinator::evaluateGate(GlobalMode::OFF, a_inactive) == GateDecision::BLOCKED_OFF);
    REQUIRE(AlarmCoordinator::evaluateGate(GlobalMode::A, a_active) == GateDecision::PLAY);
    REQUIRE(AlarmCoordinator::evaluateGate(GlobalMode::A, b_active) == GateDecision::BLOCKED_SCHEDULE);
    REQUIRE(AlarmCoordinator::evaluateGate(GlobalMode::A, a_inactive) == GateDecision::BLOCKED_INACTIVE);
    REQUIRE(AlarmCoordinator::evaluateGate(GlobalMode::B, b_active) == GateDecision::PLAY);
}

TEST_CASE("AlarmCoordinator: a passing gate starts the alarm", "[coordinator][gate]") {
    CoordinatorFixture f("gate_play");
    REQUIRE(f.alarms.setAlarm(makeAlarm("wake", 7, 0, DayMask::DAILY)) == ValidationError::NONE);

    REQUIRE(f.alarms.onTrigger("wake") == GateDecision::PLAY);
    REQUIRE(f.audio.isAlarmPlaying());
}

TEST_CASE("AlarmCoordinator: blocked triggers stay silent", "[coordinator][gate]") {
    CoordinatorFixture f("gate_blocked");
    REQUIRE(f.alarms.setAlarm(makeAlarm("b_alarm", 7, 0, DayMask::DAILY, ScheduleTag::B)) == ValidationError::NONE);
    REQUIRE(f.alarms.setAlarm(makeAlarm("off_alarm", 7, 0, DayMask::DAILY, ScheduleTag::A, false)) ==
            ValidationError::NONE);

    REQUIRE(f.alarms.onTrigger("b_alarm") == GateDecision::BLOCKED_SCHEDULE);
    REQUIRE(f.alarms.onTrigger("off_alarm") == GateDecision::BLOCKED_INACTIVE);

    f.settings.mode = GlobalMode::OFF;
    REQUIRE(f.alarms.onTrigger("b_alarm") == GateDecision::BLOCKED_OFF);

    REQUIRE_FALSE(f.audio.isAlarmPlaying());
    REQUIRE(f.sink.count("alarm_status") == 0);
}

TEST_CASE("AlarmCoordinator: a trigger for a deleted alarm is a no-op", "[coordinator][gate]") {
    CoordinatorFixture f("gate_missing");
    REQUIRE(f.alarms.onTrigger("ghost") == GateDecision::NOT_FOUND);
    REQUIRE_FALSE(f.audio.isAlarmPlaying());
}

TEST_CASE("AlarmCoordinator: scheduler fires run through the gate", "[coordinator][gate]") {
    CoordinatorFixture f("scheduler_fire");
    REQUIRE(f.alarms.setAlarm(makeAlarm("wake", 7, 0, DayMask::DAILY)) == ValidationError::NONE);

    REQUIRE(f.scheduler.dispatchDue(localTime(2026, 1, 5, 7, 0)) == 1);
    REQUIRE(f.scheduler.runQueuedFires() == 1);
    REQUIRE(f.audio.isAlarmPlaying());
}

TEST_CASE("AlarmCoordinator: set_alarm stores, schedules, saves and notifies", "[coordinator]") {
    CoordinatorFixture f("set_alarm");
    Alarm wake = makeAlarm("wake", 7, 30, DayMask::WEEKDAYS);

    REQUIRE(f.alarms.setAlarm(wake) == ValidationError::NONE);
    REQUIRE(f.scheduler.hasJob("wake"));
    REQUIRE(f.scheduler.nextFireTime("wake") == localTime(2026, 1, 5, 7, 30));
    REQUIRE(savedOnDisk(f.store, "wake"));
    REQUIRE(f.sink.count("alarm_list") == 1);
    REQUIRE(f.sink.lastList().size() == 1);

    std::vector<Alarm> listed = f.alarms.getAlarms();
    REQUIRE(listed.size() == 1);
    REQUIRE(listed[0] == wake);
}

TEST_CASE("AlarmCoordinator: set_alarm replaces by id", "[coordinator]") {
    CoordinatorFixture f("replace");
    REQUIRE(f.alarms.setAlarm(makeAlarm("wake", 7, 30, DayMask::WEEKDAYS)) == ValidationError::NONE);
    REQUIRE(f.alarms.setAlarm(makeAlarm("wake", 9, 0, DayMask::WEEKEND)) == ValidationError::NONE);

    std::vector<Alarm> listed = f.alarms.getAlarms();
    REQUIRE(listed.size() == 1);
    REQUIRE(listed[0].hour == 9);
    REQUIRE(f.scheduler.jobCount() == 1);
    REQUIRE(f.scheduler.nextFireTime("wake") == localTime(2026, 1, 10, 9, 0));
}

TEST_CASE("AlarmCoordinator: inactive alarms stay scheduled", "[coordinator]") {
    CoordinatorFixture f("inactive");
    REQUIRE(f.alarms.setAlarm(makeAlarm("quiet", 7, 0, DayMask::DAILY, ScheduleTag::A, false)) ==
            ValidationError::NONE);
    REQUIRE(f.scheduler.hasJob("quiet"));
}

TEST_CASE("AlarmCoordinator: invalid alarms change nothing", "[coordinator]") {
    CoordinatorFixture f("invalid");

    REQUIRE(f.alarms.setAlarm(makeAlarm("bad", 24, 0, DayMask::DAILY)) == ValidationError::HOUR);
    REQUIRE(f.alarms.setAlarm(makeAlarm("bad", 7, 60, DayMask::DAILY)) == ValidationError::MINUTE);
    REQUIRE(f.alarms.setAlarm(makeAlarm("bad", 7, 0, 0)) == ValidationError::DAYS);

    REQUIRE(f.alarms.getAlarms().empty());
    REQUIRE(f.scheduler.jobCount() == 0);
    REQUIRE(f.sink.events().empty());
    FILE* snapshot = std::fopen(f.store.path().c_str(), "rb");
    REQUIRE(snapshot == nullptr);
}

TEST_CASE("AlarmCoordinator: an empty id gets a generated one", "[coordinator]") {
    CoordinatorFixture f("generated");
    std::string assigned;
    REQUIRE(f.alarms.setAlarm(makeAlarm("", 6, 0, DayMask::DAILY), &assigned) == ValidationError::NONE);
    REQUIRE(assigned.size() == 36);
    REQUIRE(f.scheduler.hasJob(assigned));
    REQUIRE(f.alarms.getAlarms()[0].id == assigned);
}

TEST_CASE("AlarmCoordinator: the alarm limit rejects new ids only", "[coordinator]") {
    CoordinatorFixture f("limit");
    for (std::size_t i = 0; i < Config::Alarms::max_alarms; ++i) {
        REQUIRE(f.alarms.setAlarm(makeAlarm("a" + std::to_string(i), 7, 0, DayMask::DAILY)) ==
                ValidationError::NONE);
    }
    REQUIRE(f.alarms.setAlarm(makeAlarm("one_more", 7, 0, DayMask::DAILY)) == ValidationError::ID);
    REQUIRE(f.alarms.setAlarm(makeAlarm("a0", 8, 0, DayMask::DAILY)) == ValidationError::NONE);
    REQUIRE(f.alarms.getAlarms().size() == Config::Alarms::max_alarms);
}

TEST_CASE("AlarmCoordinator: set then remove leaves no job behind", "[coordinator]") {
    CoordinatorFixture f("set_remove");
    Alarm a = makeAlarm("temp", 7, 0, DayMask::DAILY);

    REQUIRE(f.alarms.setAlarm(a) == ValidationError::NONE);
    REQUIRE(f.alarms.removeAlarms({a.id}));
    REQUIRE_FALSE(f.scheduler.hasJob(a.id));
    REQUIRE(f.alarms.getAlarms().empty());
    REQUIRE_FALSE(savedOnDisk(f.store, a.id));
}

TEST_CASE("AlarmCoordinator: partial removal reports false", "[coordinator]") {
    CoordinatorFixture f("partial");
    REQUIRE(f.alarms.setAlarm(makeAlarm("exists", 7, 0, DayMask::DAILY)) == ValidationError::NONE);
    REQUIRE(f.alarms.setAlarm(makeAlarm("keeper", 8, 0, DayMask::DAILY)) == ValidationError::NONE);
    f.sink.clear();

    REQUIRE_FALSE(f.alarms.removeAlarms({"exists", "missing"}));
    REQUIRE_FALSE(f.scheduler.hasJob("exists"));
    REQUIRE(f.scheduler.hasJob("keeper"));
    REQUIRE(f.alarms.getAlarms().size() == 1);
    REQUIRE_FALSE(savedOnDisk(f.store, "exists"));
    REQUIRE(f.sink.count("alarm_list") == 1);
}

TEST_CASE("AlarmCoordinator: removing nothing succeeds quietly", "[coordinator]") {
    CoordinatorFixture f("remove_none");
    REQUIRE(f.alarms.removeAlarms({}));
    REQUIRE_FALSE(f.alarms.removeAlarms({"missing"}));
    REQUIRE(f.sink.events().empty());
}

TEST_CASE("AlarmCoordinator: restore reloads and reschedules", "[coordinator]") {
    const std::string path = tempSnapshotPath("restore");
    {
        AlarmStore seed(path);
        REQUIRE(seed.save({makeAlarm("one", 7, 0, DayMask::DAILY), makeAlarm("two", 8, 0, DayMask::WEEKEND)}));
    }

    FakeClock::set(localTime(2026, 1, 5, 6, 0));
    SimulatedSoundSource source(4, {"chime"}, "white_noise");
    FakeSettingsProvider settings;
    RecordingSink sink;
    AlarmStore store(path);
    TriggerScheduler scheduler(&FakeClock::now, manualOptions());
    AudioCoordinator audio(source, settings, sink);
    AlarmCoordinator alarms(store, scheduler, audio, settings, sink);

    REQUIRE(alarms.restore() == 2);
    REQUIRE(scheduler.jobCount() == 2);
    REQUIRE(scheduler.nextFireTime("two") == localTime(2026, 1, 10, 8, 0));
    REQUIRE(alarms.getAlarms().size() == 2);
}

TEST_CASE("AlarmCoordinator: global mode persists and notifies", "[coordinator]") {
    CoordinatorFixture f("mode");
    REQUIRE(f.alarms.setGlobalMode("b") == ValidationError::NONE);
    REQUIRE(f.alarms.globalMode() == GlobalMode::B);
    REQUIRE(f.settings.mode == GlobalMode::B);
    REQUIRE(f.sink.count("schedule_mode") == 1);

    REQUIRE(f.alarms.setGlobalMode("sometimes") == ValidationError::SCHEDULE);
    REQUIRE(f.alarms.globalMode() == GlobalMode::B);
    REQUIRE(f.sink.count("schedule_mode") == 1);
}

TEST_CASE("AlarmCoordinator: triggers racing set and remove keep store, jobs and snapshot in step",
          "[coordinator][tasks]") {
    CoordinatorFixture f("race");
    REQUIRE(f.scheduler.start());
    const time_t seven = localTime(2026, 1, 5, 7, 0);
    const Alarm wake = makeAlarm("wake", 7, 0, DayMask::DAILY);

    // Catch2 assertions are not thread safe; callers only count failures
    std::atomic<int> failures{0};
    std::atomic<int> played{0};

    auto editor = [&]() {
        for (int i = 0; i < 30; ++i) {
            if (f.alarms.setAlarm(wake) != ValidationError::NONE) {
                failures.fetch_add(1);
            }
            taskYIELD();
            if (!f.alarms.removeAlarms({"wake"})) {
                failures.fetch_add(1);
            }
        }
        if (f.alarms.setAlarm(wake) != ValidationError::NONE) {
            failures.fetch_add(1);
        }
    };
    auto trigger = [&]() {
        for (int i = 0; i < 60; ++i) {
            GateDecision d = f.alarms.onTrigger("wake");
            if (d == GateDecision::PLAY) {
                played.fetch_add(1);
            } else if (d != GateDecision::NOT_FOUND) {
                failures.fetch_add(1);
            }
            taskYIELD();
        }
    };
    // Fires handed to the scheduler's worker tasks
    auto ticker = [&]() {
        for (int i = 0; i < 60; ++i) {
            (void)f.scheduler.dispatchDue(seven);
            vTaskDelay(1);
        }
    };

    REQUIRE(TestTasks::runConcurrently({editor, trigger, ticker}));
    REQUIRE(f.scheduler.stop());
    REQUIRE(failures.load() == 0);

    std::vector<Alarm> alarms = f.alarms.getAlarms();
    REQUIRE(alarms.size() == 1);
    REQUIRE(alarms[0] == wake);
    REQUIRE(f.scheduler.hasJob("wake"));
    REQUIRE(f.scheduler.jobCount() == 1);
    REQUIRE(savedOnDisk(f.store, "wake"));
    REQUIRE(f.sink.lastList().size() == 1);
    if (played.load() > 0) {
        REQUIRE(f.audio.isAlarmPlaying());
    }
}
