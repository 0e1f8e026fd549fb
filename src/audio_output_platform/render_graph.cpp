#include "render_graph.h"

#include <QMutexLocker>

#include <algorithm>
#include <cmath>
#include <vector>

namespace aop {

// Handle for one SourceState entry; removes it on destruction
class RenderSource : public BufferSourceNode {
public:
    RenderSource(RenderGraph* graph, uint64_t id) : m_graph(graph), m_id(id) {}

    ~RenderSource() override {
        QMutexLocker lock(&m_graph->m_mutex);
        m_graph->m_sources.erase(m_id);
    }

    void SetPlaybackRate(double rate) override {
        QMutexLocker lock(&m_graph->m_mutex);
        state().rate = std::isfinite(rate) ? std::max(rate, 0.0) : 0.0;
    }

    void SetLoop(bool loop, double loop_start, double loop_end) override {
        QMutexLocker lock(&m_graph->m_mutex);
        auto& src = state();
        src.loop = loop;
        src.loop_start = loop_start;
        src.loop_end = loop_end;
    }

    void Connect(GainNode* destination) override;

    void Disconnect() override {
        QMutexLocker lock(&m_graph->m_mutex);
        state().gain_id = 0;
    }

    void SetOnEnded(Completion on_ended) override {
        QMutexLocker lock(&m_graph->m_mutex);
        state().on_ended = std::move(on_ended);
    }

    void Start(double offset, std::optional<double> duration) override {
        QMutexLocker lock(&m_graph->m_mutex);
        auto& src = state();
        if (src.started) {
            return;  // Single use
        }
        const double buffer_rate = src.buffer->sample_rate();
        const double length = static_cast<double>(src.buffer->frames());
        src.position = std::clamp(offset * buffer_rate, 0.0, length);
        if (duration) {
            src.remaining = std::max(*duration, 0.0) * buffer_rate;
        }
        src.started = true;
    }

    void Stop() override {
        QMutexLocker lock(&m_graph->m_mutex);
        auto& src = state();
        src.stopped = true;
        src.on_ended = nullptr;
    }

private:
    // Caller holds the graph mutex
    RenderGraph::SourceState& state() { return m_graph->m_sources.at(m_id); }

    RenderGraph* m_graph;
    uint64_t m_id;
};

class RenderGain : public GainNode {
public:
    RenderGain(RenderGraph* graph, uint64_t id) : m_graph(graph), m_id(id) {}

    ~RenderGain() override {
        QMutexLocker lock(&m_graph->m_mutex);
        m_graph->m_gains.erase(m_id);
    }

    void SetGain(float gain) override {
        QMutexLocker lock(&m_graph->m_mutex);
        m_graph->m_gains[m_id] = gain;
    }

    float Gain() const override {
        QMutexLocker lock(&m_graph->m_mutex);
        return m_graph->m_gains.at(m_id);
    }

    uint64_t id() const { return m_id; }

private:
    RenderGraph* m_graph;
    uint64_t m_id;
};

void RenderSource::Connect(GainNode* destination) {
    // Only gains from the same graph can be mixed
    auto* gain = dynamic_cast<RenderGain*>(destination);
    QMutexLocker lock(&m_graph->m_mutex);
    state().gain_id = gain ? gain->id() : 0;
}

RenderGraph::RenderGraph(int32_t sample_rate, int32_t channels)
    : m_sample_rate(sample_rate > 0 ? sample_rate : 48000)
    , m_channels(channels > 0 ? channels : 2) {
}

RenderGraph::~RenderGraph() = default;

void RenderGraph::SetDispatcher(Dispatcher dispatcher) {
    QMutexLocker lock(&m_mutex);
    m_dispatcher = std::move(dispatcher);
}

std::unique_ptr<BufferSourceNode> RenderGraph::CreateSource(std::shared_ptr<const abp::SampleBuffer> buffer) {
    if (!buffer) {
        return nullptr;
    }
    QMutexLocker lock(&m_mutex);
    const uint64_t id = m_next_id++;
    SourceState state;
    state.buffer = std::move(buffer);
    m_sources.emplace(id, std::move(state));
    return std::make_unique<RenderSource>(this, id);
}

std::unique_ptr<GainNode> RenderGraph::CreateGain() {
    QMutexLocker lock(&m_mutex);
    const uint64_t id = m_next_id++;
    m_gains.emplace(id, 1.0f);
    return std::make_unique<RenderGain>(this, id);
}

int64_t RenderGraph::FramesRendered() const {
    return m_frames_rendered.load(std::memory_order_relaxed);
}

double RenderGraph::CurrentTime() const {
    return static_cast<double>(FramesRendered()) / m_sample_rate;
}

size_t RenderGraph::ActiveSourceCount() const {
    QMutexLocker lock(&m_mutex);
    return static_cast<size_t>(std::count_if(m_sources.begin(), m_sources.end(), [](const auto& entry) {
        const SourceState& src = entry.second;
        return src.started && !src.stopped && !src.finished;
    }));
}

void RenderGraph::Render(float* out, int64_t frames) {
    std::vector<uint64_t> ended;
    Dispatcher dispatcher;
    {
        QMutexLocker lock(&m_mutex);
        std::fill(out, out + frames * m_channels, 0.0f);

        for (auto& [id, src] : m_sources) {
            if (!src.started || src.stopped || src.finished) {
                continue;
            }

            // Disconnected sources keep advancing but are not heard
            auto gain_it = m_gains.find(src.gain_id);
            float* target = gain_it != m_gains.end() ? out : nullptr;
            float gain = gain_it != m_gains.end() ? gain_it->second : 0.0f;

            if (render_source(src, target, frames, gain)) {
                src.finished = true;
                ended.push_back(id);
            }
        }
        dispatcher = m_dispatcher;
    }

    m_frames_rendered.fetch_add(frames, std::memory_order_relaxed);

    for (uint64_t id : ended) {
        if (dispatcher) {
            dispatcher([this, id]() { deliver_ended(id); });
        } else {
            deliver_ended(id);
        }
    }
}

bool RenderGraph::render_source(SourceState& src, float* out, int64_t frames, float gain) {
    const abp::SampleBuffer& buffer = *src.buffer;
    const int64_t length = buffer.frames();
    const int32_t buffer_channels = buffer.channels();
    const double step = src.rate * buffer.sample_rate() / m_sample_rate;

    // Out-of-range loop points fall back to the whole buffer
    double loop_start = std::clamp(src.loop_start * buffer.sample_rate(), 0.0, static_cast<double>(length));
    double loop_end = src.loop_end * buffer.sample_rate();
    if (loop_end <= 0.0 || loop_end > length) {
        loop_end = static_cast<double>(length);
    }
    if (loop_start >= loop_end) {
        loop_start = 0.0;
        loop_end = static_cast<double>(length);
    }
    const bool looping = src.loop && loop_end > loop_start;

    auto ran_out = [&]() {
        return !looping && (src.position >= length || (src.remaining && *src.remaining <= 0.0));
    };

    for (int64_t f = 0; f < frames; ++f) {
        if (looping && src.position >= loop_end) {
            src.position = loop_start + std::fmod(src.position - loop_start, loop_end - loop_start);
        }
        if (ran_out()) {
            return true;
        }

        if (out) {
            const int64_t i0 = static_cast<int64_t>(src.position);
            const float frac = static_cast<float>(src.position - static_cast<double>(i0));
            int64_t i1 = i0 + 1;
            if (looping && i1 >= static_cast<int64_t>(loop_end)) {
                i1 = static_cast<int64_t>(loop_start);
            }

            float* frame_out = out + f * m_channels;
            for (int32_t oc = 0; oc < m_channels; ++oc) {
                float s0 = 0.0f;
                float s1 = 0.0f;
                if (m_channels == 1 && buffer_channels > 1) {
                    // Downmix to mono
                    for (int32_t c = 0; c < buffer_channels; ++c) {
                        s0 += buffer.sample(i0, c);
                        s1 += buffer.sample(i1, c);
                    }
                    s0 /= static_cast<float>(buffer_channels);
                    s1 /= static_cast<float>(buffer_channels);
                } else {
                    // Mono sources feed every output channel
                    int32_t c = buffer_channels == 1 ? 0 : oc;
                    s0 = buffer.sample(i0, c);
                    s1 = buffer.sample(i1, c);
                }
                frame_out[oc] += (s0 + (s1 - s0) * frac) * gain;
            }
        }

        src.position += step;
        if (src.remaining) {
            *src.remaining -= step;
        }
    }

    return ran_out();
}

void RenderGraph::deliver_ended(uint64_t source_id) {
    Completion on_ended;
    {
        QMutexLocker lock(&m_mutex);
        auto it = m_sources.find(source_id);
        if (it == m_sources.end() || it->second.stopped) {
            return;  // Node released or stopped since it ran out
        }
        on_ended = std::move(it->second.on_ended);
        it->second.on_ended = nullptr;
    }
    if (on_ended) {
        on_ended();
    }
}

} // namespace aop
