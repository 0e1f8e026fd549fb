#include "cue/playback/TimeModel.hpp"

#include <cmath>

namespace cue::playback {

namespace {

// Stand-in span for an empty or inverted loop region
constexpr TimeUS kFallbackLoopSpan = kMicrosPerSecond;

}  // namespace

TimeUS toTimeUS(double seconds) {
    // llround rounds half away from zero
    return static_cast<TimeUS>(std::llround(seconds * static_cast<double>(kMicrosPerSecond)));
}

double toSeconds(TimeUS micros) {
    return static_cast<double>(micros) / static_cast<double>(kMicrosPerSecond);
}

TimeUS scaleByRate(TimeUS elapsed, double rate) {
    // Single rounding; doubles hold every microsecond count below 2^53
    return static_cast<TimeUS>(std::llround(static_cast<double>(elapsed) * rate));
}

TimeUS positionUS(TimeUS elapsed, const PlaybackConfig& config) {
    const TimeUS start = toTimeUS(config.startOffset);
    const TimeUS scaled = scaleByRate(elapsed, config.rate);

    if (!config.loop) {
        return start + scaled;
    }

    const TimeUS loopStart = toTimeUS(config.loopStart);
    const TimeUS gapToLoop = loopStart - start;
    TimeUS loopSpan = toTimeUS(config.loopEnd) - loopStart;
    if (loopSpan <= 0) {
        loopSpan = kFallbackLoopSpan;
    }

    if (scaled < gapToLoop) {
        return start + scaled;
    }
    // % keeps the dividend's sign
    return (scaled - gapToLoop) % loopSpan + loopStart;
}

double position(double clockNow, const PlaybackConfig& config, const PlaybackAnchor& anchor) {
    const TimeUS elapsed = toTimeUS(clockNow) - toTimeUS(anchor.clockAtStart);
    return toSeconds(positionUS(elapsed, config));
}

}  // namespace cue::playback
