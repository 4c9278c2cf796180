#include <alarm_block/audio/tone_track.hpp>
#include <cstring>

namespace {
    static const ToneStep CHIME_STEPS[] = {
        {1047, 180}, {1319, 180}, {1568, 180}, {2093, 360}, {0, 600},
    };

    static const ToneStep BEACON_STEPS[] = {
        {2500, 120}, {0, 80}, {2500, 120}, {0, 80}, {2500, 120}, {0, 700},
    };

    static const ToneStep KLAXON_STEPS[] = {
        {880, 400}, {660, 400},
    };

    static const ToneStep NOISE_STEPS[] = {
        {0, 12},
    };

    static const ToneTrack ALARM_TRACKS[] = {
        {"chime", CHIME_STEPS, sizeof(CHIME_STEPS) / sizeof(CHIME_STEPS[0]), false},
        {"beacon", BEACON_STEPS, sizeof(BEACON_STEPS) / sizeof(BEACON_STEPS[0]), false},
        {"klaxon", KLAXON_STEPS, sizeof(KLAXON_STEPS) / sizeof(KLAXON_STEPS[0]), false},
    };

    static const ToneTrack AMBIENT_TRACK = {
        "white_noise", NOISE_STEPS, sizeof(NOISE_STEPS) / sizeof(NOISE_STEPS[0]), true,
    };
}

namespace ToneTracks {
    const ToneTrack* alarmTracks(std::size_t* count) {
        *count = sizeof(ALARM_TRACKS) / sizeof(ALARM_TRACKS[0]);
        return ALARM_TRACKS;
    }

    const ToneTrack& ambientTrack() {
        return AMBIENT_TRACK;
    }

    const ToneTrack* find(const char* key) {
        if (key == nullptr) {
            return nullptr;
        }
        if (std::strcmp(key, AMBIENT_TRACK.key) == 0) {
            return &AMBIENT_TRACK;
        }
        for (const ToneTrack& track : ALARM_TRACKS) {
            if (std::strcmp(key, track.key) == 0) {
                return &track;
            }
        }
        return nullptr;
    }
}
