#pragma once

#include "cue/playback/PlaybackConfig.hpp"

#include <cstdint>

namespace cue::playback {

// Integer microseconds
using TimeUS = std::int64_t;

constexpr TimeUS kMicrosPerSecond = 1000000;

// Round half away from zero
TimeUS toTimeUS(double seconds);
double toSeconds(TimeUS micros);

// elapsed * rate, rounded once to the nearest microsecond
TimeUS scaleByRate(TimeUS elapsed, double rate);

// Hardware-clock reading taken when the current episode began
struct PlaybackAnchor {
    double clockAtStart{0.0};
};

// Buffer position for a running episode.
// Loop mode plays up to loopStart once, then wraps within [loopStart, loopEnd).
TimeUS positionUS(TimeUS elapsed, const PlaybackConfig& config);

double position(double clockNow, const PlaybackConfig& config, const PlaybackAnchor& anchor);

}  // namespace cue::playback
