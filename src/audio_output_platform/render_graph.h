#pragma once

#include "aop.h"

#include <QMutex>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>

namespace aop {

// Hands a closure to whichever thread owns the graph's nodes
using Dispatcher = std::function<void(Completion)>;

// Software mixer behind AudioOutput: buffer sources -> gain nodes -> device.
// Node handles are used from the owning thread, Render() from the device
// thread; all shared state sits behind one mutex.
class RenderGraph {
public:
    RenderGraph(int32_t sample_rate, int32_t channels);
    ~RenderGraph();

    // Default (unset) dispatcher runs ended notifications inline in Render()
    void SetDispatcher(Dispatcher dispatcher);

    std::unique_ptr<BufferSourceNode> CreateSource(std::shared_ptr<const abp::SampleBuffer> buffer);
    std::unique_ptr<GainNode> CreateGain();

    // Overwrite out (frames * channels() interleaved floats) with the mix of
    // every started source and advance the clock by frames
    void Render(float* out, int64_t frames);

    int64_t FramesRendered() const;
    double CurrentTime() const;

    int32_t sample_rate() const { return m_sample_rate; }
    int32_t channels() const { return m_channels; }

    // Sources started and not yet stopped or finished
    size_t ActiveSourceCount() const;

private:
    friend class RenderSource;
    friend class RenderGain;

    struct SourceState {
        std::shared_ptr<const abp::SampleBuffer> buffer;
        double rate = 1.0;
        bool loop = false;
        double loop_start = 0.0;
        double loop_end = 0.0;
        uint64_t gain_id = 0;              // 0 = disconnected
        bool started = false;
        bool stopped = false;
        bool finished = false;
        double position = 0.0;             // Playhead in buffer frames
        std::optional<double> remaining;   // Buffer frames left when a duration was given
        Completion on_ended;
    };

    // Returns true when the source ran out during this block
    bool render_source(SourceState& src, float* out, int64_t frames, float gain);
    void deliver_ended(uint64_t source_id);

    const int32_t m_sample_rate;
    const int32_t m_channels;

    mutable QMutex m_mutex;
    std::map<uint64_t, SourceState> m_sources;
    std::map<uint64_t, float> m_gains;
    uint64_t m_next_id = 1;
    Dispatcher m_dispatcher;
    std::atomic<int64_t> m_frames_rendered{0};
};

} // namespace aop
