#pragma once

#include "cue/playback/PlaybackConfig.hpp"

namespace cue::playback {

class ConfigStore {
public:
    const PlaybackConfig& config() const { return m_config; }

    // Merge a patch and return every field that was assigned. A field counts as
    // assigned when present, even if the value is unchanged. Non-finite values,
    // rate <= 0 and gain < 0 are dropped with a warning.
    ConfigFields apply(const ConfigPatch& patch);

    // New buffer: play the whole of it
    void resetForDuration(double duration);

    // True when the change set affects timing and needs a fresh graph.
    // config is the state after the update.
    static bool requiresRestart(ConfigFields changed, const PlaybackConfig& config);

private:
    PlaybackConfig m_config;
};

}  // namespace cue::playback
