#pragma once

#include "cue/playback/PlaybackConfig.hpp"

#include <audio_buffer_platform/abp_buffer.h>
#include <audio_output_platform/aop.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace cue::playback {

// Identifies one started source node; 0 means none
using GraphHandle = std::uint64_t;

constexpr GraphHandle kNoGraph = 0;

// Owns the audio context, the persistent gain node and at most one
// single-use source node.
class PlaybackGraph {
public:
    using EndedCallback = std::function<void(GraphHandle)>;

    explicit PlaybackGraph(std::unique_ptr<aop::AudioContext> context);
    ~PlaybackGraph();

    PlaybackGraph(const PlaybackGraph&) = delete;
    PlaybackGraph& operator=(const PlaybackGraph&) = delete;

    // Replace any current node with a fresh one playing buffer under config.
    // onNaturalEnd fires once if the node runs out while still current.
    // Returns kNoGraph when the context cannot create a node.
    GraphHandle start(std::shared_ptr<const abp::SampleBuffer> buffer,
                      const PlaybackConfig& config,
                      EndedCallback onNaturalEnd);

    // Idempotent
    void stop();

    void setGain(double gain);

    // Stop and close the context; done runs once the context has closed
    void dispose(std::function<void()> done);

    GraphHandle activeHandle() const { return m_active; }
    bool hasActiveNode() const { return m_source != nullptr; }
    bool isDisposed() const { return m_disposed; }

    aop::AudioContext* context() const { return m_context.get(); }

private:
    void ensureGainNode(double initial);

    // Declaration order matters: nodes are released before their context
    std::unique_ptr<aop::AudioContext> m_context;
    std::unique_ptr<aop::GainNode> m_gain;
    std::unique_ptr<aop::BufferSourceNode> m_source;
    GraphHandle m_active{kNoGraph};
    GraphHandle m_nextHandle{1};
    std::optional<double> m_pendingGain;
    bool m_disposed{false};
};

}  // namespace cue::playback
