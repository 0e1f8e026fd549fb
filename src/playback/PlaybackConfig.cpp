#include "cue/playback/PlaybackConfig.hpp"

#include <QJsonValue>

namespace cue::playback {

namespace {

void readNumber(const QJsonObject& object, const char* key, std::optional<double>& out) {
    const QJsonValue value = object.value(QLatin1String(key));
    if (value.isDouble()) {
        out = value.toDouble();
    }
}

}  // namespace

QJsonObject PlaybackConfig::toJson() const {
    QJsonObject object;
    object.insert(QStringLiteral("loop"), loop);
    object.insert(QStringLiteral("rate"), rate);
    object.insert(QStringLiteral("gain"), gain);
    object.insert(QStringLiteral("startOffset"), startOffset);
    object.insert(QStringLiteral("endOffset"), endOffset);
    object.insert(QStringLiteral("loopStart"), loopStart);
    object.insert(QStringLiteral("loopEnd"), loopEnd);
    return object;
}

ConfigPatch ConfigPatch::fromJson(const QJsonObject& object) {
    ConfigPatch patch;
    const QJsonValue loop = object.value(QStringLiteral("loop"));
    if (loop.isBool()) {
        patch.loop = loop.toBool();
    }
    readNumber(object, "rate", patch.rate);
    readNumber(object, "gain", patch.gain);
    readNumber(object, "startOffset", patch.startOffset);
    readNumber(object, "endOffset", patch.endOffset);
    readNumber(object, "loopStart", patch.loopStart);
    readNumber(object, "loopEnd", patch.loopEnd);
    return patch;
}

const char* configErrorToString(ConfigError error) {
    switch (error) {
        case ConfigError::None: return "none";
        case ConfigError::StartAfterLoopEnd: return "startOffset must not exceed loopEnd";
        case ConfigError::LoopStartAfterLoopEnd: return "loopStart must not exceed loopEnd";
        case ConfigError::StartAfterEnd: return "startOffset must not exceed endOffset";
    }
    return "unknown";
}

ConfigError validate(const PlaybackConfig& config) {
    if (config.loop) {
        if (config.startOffset > config.loopEnd) {
            return ConfigError::StartAfterLoopEnd;
        }
        if (config.loopStart > config.loopEnd) {
            return ConfigError::LoopStartAfterLoopEnd;
        }
        return ConfigError::None;
    }
    if (config.startOffset > config.endOffset) {
        return ConfigError::StartAfterEnd;
    }
    return ConfigError::None;
}

}  // namespace cue::playback
