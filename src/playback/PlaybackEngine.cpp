#include "cue/playback/PlaybackEngine.hpp"

#include "Logging.hpp"

#include <exception>

Q_LOGGING_CATEGORY(cuePlayback, "cue.playback")

namespace cue::playback {

const char* transportStateToString(TransportState state) {
    switch (state) {
        case TransportState::Stopped: return "stopped";
        case TransportState::Running: return "running";
        case TransportState::Paused: return "paused";
        case TransportState::Ended: return "ended";
    }
    return "unknown";
}

PlaybackEngine::PlaybackEngine(std::unique_ptr<aop::AudioContext> context)
    : m_graph(std::move(context)) {
}

PlaybackEngine::~PlaybackEngine() = default;

std::unique_ptr<PlaybackEngine> PlaybackEngine::create(const aop::AopConfig& config) {
    aop::AopOpenReport report;
    std::unique_ptr<aop::AudioOutput> output = aop::AudioOutput::Open(config, &report);
    if (!output) {
        qCWarning(cuePlayback, "Cannot open audio output: %s", report.device_name.c_str());
        return nullptr;
    }
    qCInfo(cuePlayback, "Audio output %s: %d Hz, %d channels, %d ms buffer",
           report.device_name.c_str(), report.actual_sample_rate, report.actual_channels,
           report.actual_buffer_ms);
    return std::make_unique<PlaybackEngine>(std::move(output));
}

bool PlaybackEngine::ensureAlive(const char* operation) const {
    if (m_destroyed) {
        qCWarning(cuePlayback, "%s() called on a destroyed engine", operation);
        return false;
    }
    return true;
}

void PlaybackEngine::setState(TransportState next) {
    m_state = next;
    if (!m_onStateChange) {
        return;
    }
    try {
        m_onStateChange(next);
    } catch (const std::exception& ex) {
        qCWarning(cuePlayback, "State subscriber threw on %s: %s", transportStateToString(next), ex.what());
    } catch (...) {
        qCWarning(cuePlayback, "State subscriber threw a non-exception on %s", transportStateToString(next));
    }
}

void PlaybackEngine::setOnStateChange(StateCallback callback) {
    m_onStateChange = std::move(callback);
}

double PlaybackEngine::duration() const {
    return m_buffer ? m_buffer->duration_seconds() : 0.0;
}

double PlaybackEngine::livePosition() const {
    return position(m_graph.context()->CurrentTime(), m_store.config(), m_anchor);
}

double PlaybackEngine::currentTime() const {
    if (m_state == TransportState::Running && !m_destroyed) {
        return livePosition();
    }
    return m_frozenPosition;
}

void PlaybackEngine::setBuffer(std::shared_ptr<const abp::SampleBuffer> buffer) {
    if (!ensureAlive("setBuffer")) {
        return;
    }
    const TransportState previous = m_state;
    m_buffer = std::move(buffer);
    m_store.resetForDuration(duration());
    stopTransport();
    restartIfRunning(previous);
}

void PlaybackEngine::setConfig(const QJsonObject& patch) {
    setConfig(ConfigPatch::fromJson(patch));
}

void PlaybackEngine::setConfig(const ConfigPatch& patch) {
    if (!ensureAlive("setConfig")) {
        return;
    }
    const TransportState previous = m_state;
    const ConfigFields changed = m_store.apply(patch);
    const PlaybackConfig& config = m_store.config();

    if (changed.testFlag(ConfigField::Gain)) {
        m_graph.setGain(config.gain);
    }
    if (ConfigStore::requiresRestart(changed, config)) {
        stopTransport();
        restartIfRunning(previous);
    }
}

void PlaybackEngine::restartIfRunning(TransportState previous) {
    if (previous == TransportState::Running) {
        play();
    }
}

void PlaybackEngine::play() {
    if (!ensureAlive("play")) {
        return;
    }
    if (!m_buffer) {
        qCWarning(cuePlayback) << "play() without a buffer";
        return;
    }
    const PlaybackConfig config = m_store.config();
    const ConfigError error = validate(config);
    if (error != ConfigError::None) {
        qCWarning(cuePlayback, "Invalid playback range: %s", configErrorToString(error));
        return;
    }

    aop::AudioContext* context = m_graph.context();

    // Same episode, same node: just let the clock run again
    if (m_state == TransportState::Paused && m_graph.hasActiveNode()) {
        const std::uint64_t episode = m_episode;
        context->Resume([this, episode]() {
            if (episode != m_episode || m_state != TransportState::Paused) {
                return;
            }
            setState(TransportState::Running);
        });
        return;
    }

    m_graph.stop();
    const std::uint64_t episode = ++m_episode;

    // Left suspended by a pause that was followed by stop
    if (context->State() == aop::ContextState::Suspended) {
        context->Resume(nullptr);
    }

    m_anchor.clockAtStart = context->CurrentTime();
    const GraphHandle handle = m_graph.start(m_buffer, config, [this, episode](GraphHandle) {
        handleNaturalEnd(episode);
    });
    if (handle == kNoGraph) {
        qCWarning(cuePlayback) << "Could not start playback graph";
        return;
    }
    setState(TransportState::Running);
}

void PlaybackEngine::pause(Done done) {
    if (!ensureAlive("pause") || m_state != TransportState::Running) {
        if (done) {
            done();
        }
        return;
    }

    const std::uint64_t episode = m_episode;
    aop::AudioContext* context = m_graph.context();
    context->Suspend([this, episode, context, done]() {
        if (episode != m_episode) {
            // A newer episode started while suspending; keep its clock going
            if (m_state == TransportState::Running && !m_destroyed) {
                context->Resume(nullptr);
            }
        } else if (m_state == TransportState::Running) {
            m_frozenPosition = livePosition();
            setState(TransportState::Paused);
        }
        if (done) {
            done();
        }
    });
}

void PlaybackEngine::stopTransport() {
    const bool hadGraph = m_graph.hasActiveNode();
    m_graph.stop();
    ++m_episode;
    m_frozenPosition = m_store.config().startOffset;
    if (hadGraph || m_state != TransportState::Stopped) {
        setState(TransportState::Stopped);
    }
}

void PlaybackEngine::stop() {
    if (!ensureAlive("stop")) {
        return;
    }
    stopTransport();
}

void PlaybackEngine::handleNaturalEnd(std::uint64_t episode) {
    if (m_destroyed || episode != m_episode || m_state != TransportState::Running) {
        return;
    }
    m_frozenPosition = m_store.config().endOffset;
    setState(TransportState::Ended);
}

void PlaybackEngine::destroy(Done done) {
    if (!ensureAlive("destroy")) {
        if (done) {
            done();
        }
        return;
    }
    stopTransport();
    m_destroyed = true;
    m_graph.dispose(std::move(done));
}

}  // namespace cue::playback
