#ifndef TONE_TRACK_HPP
#define TONE_TRACK_HPP

#include <cstddef>
#include <cstdint>

// One step of a square-wave melody. freq_hz == 0 is a rest.
struct ToneStep {
    uint16_t freq_hz;
    uint16_t duration_ms;
};

// Built-in tracks for the speaker backend. A noise track ignores its step
// frequencies and draws a random pitch in [noise_min_hz, noise_max_hz]
// for every step.
struct ToneTrack {
    const char* key;
    const ToneStep* steps;
    std::size_t step_count;
    bool noise;
};

namespace ToneTracks {
    static constexpr uint16_t noise_min_hz = 200;
    static constexpr uint16_t noise_max_hz = 4000;

    const ToneTrack* alarmTracks(std::size_t* count);
    const ToneTrack& ambientTrack();
    // nullptr for an unknown key
    const ToneTrack* find(const char* key);
}

#endif // TONE_TRACK_HPP
