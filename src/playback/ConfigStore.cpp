#include "cue/playback/ConfigStore.hpp"

#include "Logging.hpp"

#include <cmath>

namespace cue::playback {

namespace {

bool acceptNumber(const char* field, const std::optional<double>& value) {
    if (!value) {
        return false;
    }
    if (!std::isfinite(*value)) {
        qCWarning(cuePlayback, "Ignoring non-finite %s", field);
        return false;
    }
    return true;
}

}  // namespace

ConfigFields ConfigStore::apply(const ConfigPatch& patch) {
    PlaybackConfig next = m_config;
    ConfigFields changed;

    if (patch.loop) {
        next.loop = *patch.loop;
        changed |= ConfigField::Loop;
    }
    if (acceptNumber("rate", patch.rate)) {
        if (*patch.rate > 0.0) {
            next.rate = *patch.rate;
            changed |= ConfigField::Rate;
        } else {
            qCWarning(cuePlayback, "Ignoring rate %g: must be positive", *patch.rate);
        }
    }
    if (acceptNumber("gain", patch.gain)) {
        if (*patch.gain >= 0.0) {
            next.gain = *patch.gain;
            changed |= ConfigField::Gain;
        } else {
            qCWarning(cuePlayback, "Ignoring gain %g: must not be negative", *patch.gain);
        }
    }
    if (acceptNumber("startOffset", patch.startOffset)) {
        next.startOffset = *patch.startOffset;
        changed |= ConfigField::StartOffset;
    }
    if (acceptNumber("endOffset", patch.endOffset)) {
        next.endOffset = *patch.endOffset;
        changed |= ConfigField::EndOffset;
    }
    if (acceptNumber("loopStart", patch.loopStart)) {
        next.loopStart = *patch.loopStart;
        changed |= ConfigField::LoopStart;
    }
    if (acceptNumber("loopEnd", patch.loopEnd)) {
        next.loopEnd = *patch.loopEnd;
        changed |= ConfigField::LoopEnd;
    }

    m_config = next;
    return changed;
}

void ConfigStore::resetForDuration(double duration) {
    PlaybackConfig next = m_config;
    next.startOffset = 0.0;
    next.endOffset = duration;
    next.loopStart = 0.0;
    next.loopEnd = duration;
    m_config = next;
}

bool ConfigStore::requiresRestart(ConfigFields changed, const PlaybackConfig& config) {
    const ConfigFields timing = ConfigFields(ConfigField::Rate) | ConfigField::Loop |
                                ConfigField::StartOffset | ConfigField::LoopStart | ConfigField::LoopEnd;
    if (changed.testAnyFlags(timing)) {
        return true;
    }
    // endOffset is inert while looping
    return !config.loop && changed.testFlag(ConfigField::EndOffset);
}

}  // namespace cue::playback
