#pragma once

#include "cue/playback/ConfigStore.hpp"
#include "cue/playback/PlaybackGraph.hpp"
#include "cue/playback/TimeModel.hpp"

#include <audio_buffer_platform/abp_buffer.h>
#include <audio_output_platform/aop.h>

#include <QJsonObject>

#include <cstdint>
#include <functional>
#include <memory>

namespace cue::playback {

enum class TransportState {
    Stopped,
    Running,
    Paused,
    Ended,
};

const char* transportStateToString(TransportState state);

// Region playback on top of single-use source nodes: bounded ranges, looped
// sub-regions, rate and gain, with a position derived from the context clock.
// Not thread-safe; use from the thread that owns the context.
class PlaybackEngine {
public:
    using StateCallback = std::function<void(TransportState)>;
    using Done = std::function<void()>;

    explicit PlaybackEngine(std::unique_ptr<aop::AudioContext> context);
    ~PlaybackEngine();

    PlaybackEngine(const PlaybackEngine&) = delete;
    PlaybackEngine& operator=(const PlaybackEngine&) = delete;

    // Engine on the default output device; nullptr when none can be opened
    static std::unique_ptr<PlaybackEngine> create(const aop::AopConfig& config = aop::default_config());

    // Swap the buffer; resets the play and loop ranges to the whole buffer
    void setBuffer(std::shared_ptr<const abp::SampleBuffer> buffer);
    std::shared_ptr<const abp::SampleBuffer> buffer() const { return m_buffer; }

    // Seconds into the buffer
    double currentTime() const;

    // Buffer duration, 0 without a buffer
    double duration() const;

    TransportState state() const { return m_state; }
    PlaybackConfig getConfig() const { return m_store.config(); }

    void setConfig(const ConfigPatch& patch);
    void setConfig(const QJsonObject& patch);

    void play();
    void pause(Done done = {});
    void stop();

    // Stop, then release the context. The engine ignores every later call.
    void destroy(Done done = {});
    bool isDestroyed() const { return m_destroyed; }

    // Single subscriber; an empty callback clears it
    void setOnStateChange(StateCallback callback);

    GraphHandle activeGraph() const { return m_graph.activeHandle(); }

private:
    bool ensureAlive(const char* operation) const;
    void setState(TransportState next);
    void stopTransport();
    void restartIfRunning(TransportState previous);
    void handleNaturalEnd(std::uint64_t episode);
    double livePosition() const;

    ConfigStore m_store;
    PlaybackGraph m_graph;
    std::shared_ptr<const abp::SampleBuffer> m_buffer;
    TransportState m_state{TransportState::Stopped};
    PlaybackAnchor m_anchor;
    double m_frozenPosition{0.0};
    std::uint64_t m_episode{0};
    StateCallback m_onStateChange;
    bool m_destroyed{false};
};

}  // namespace cue::playback
