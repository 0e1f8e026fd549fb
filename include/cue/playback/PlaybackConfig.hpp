#pragma once

#include <QFlags>
#include <QJsonObject>

#include <optional>

namespace cue::playback {

// Playback parameters. Offsets are seconds into the buffer.
// endOffset only applies when loop is off, loopStart/loopEnd only when it is on.
struct PlaybackConfig {
    bool loop{false};
    double rate{1.0};
    double gain{1.0};
    double startOffset{0.0};
    double endOffset{0.0};
    double loopStart{0.0};
    double loopEnd{0.0};

    QJsonObject toJson() const;
};

enum class ConfigField : unsigned {
    Loop = 1u << 0,
    Rate = 1u << 1,
    Gain = 1u << 2,
    StartOffset = 1u << 3,
    EndOffset = 1u << 4,
    LoopStart = 1u << 5,
    LoopEnd = 1u << 6,
};
Q_DECLARE_FLAGS(ConfigFields, ConfigField)
Q_DECLARE_OPERATORS_FOR_FLAGS(ConfigFields)

// Partial update. Absent fields leave the stored value untouched.
struct ConfigPatch {
    std::optional<bool> loop;
    std::optional<double> rate;
    std::optional<double> gain;
    std::optional<double> startOffset;
    std::optional<double> endOffset;
    std::optional<double> loopStart;
    std::optional<double> loopEnd;

    // Picks up "loop" when it is a JSON bool and the other keys when they are
    // JSON numbers; anything else is skipped.
    static ConfigPatch fromJson(const QJsonObject& object);
};

enum class ConfigError {
    None,
    StartAfterLoopEnd,
    LoopStartAfterLoopEnd,
    StartAfterEnd,
};

const char* configErrorToString(ConfigError error);

// Ordering checks run before every transition into running.
ConfigError validate(const PlaybackConfig& config);

}  // namespace cue::playback
