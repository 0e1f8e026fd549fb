#include "cue/playback/PlaybackGraph.hpp"
#include "cue/playback/TimeModel.hpp"

#include "Logging.hpp"

#include <cassert>

namespace cue::playback {

PlaybackGraph::PlaybackGraph(std::unique_ptr<aop::AudioContext> context)
    : m_context(std::move(context)) {
    assert(m_context && "PlaybackGraph needs an audio context");
}

PlaybackGraph::~PlaybackGraph() {
    stop();
}

void PlaybackGraph::ensureGainNode(double initial) {
    if (m_gain) {
        return;
    }
    m_gain = m_context->CreateGain();
    if (!m_gain) {
        qCWarning(cuePlayback) << "Audio context refused to create a gain node";
        return;
    }
    m_gain->SetGain(static_cast<float>(m_pendingGain.value_or(initial)));
    m_pendingGain.reset();
}

GraphHandle PlaybackGraph::start(std::shared_ptr<const abp::SampleBuffer> buffer,
                                 const PlaybackConfig& config,
                                 EndedCallback onNaturalEnd) {
    stop();
    if (m_disposed || !buffer) {
        return kNoGraph;
    }

    ensureGainNode(config.gain);
    if (!m_gain) {
        return kNoGraph;
    }

    m_source = m_context->CreateBufferSource(std::move(buffer));
    if (!m_source) {
        qCWarning(cuePlayback) << "Audio context refused to create a source node";
        return kNoGraph;
    }

    const GraphHandle handle = m_nextHandle++;
    m_active = handle;

    m_source->SetPlaybackRate(config.rate);
    m_source->Connect(m_gain.get());
    m_source->SetOnEnded([this, handle, onNaturalEnd]() {
        if (handle != m_active) {
            return;
        }
        if (onNaturalEnd) {
            onNaturalEnd(handle);
        }
    });

    if (config.loop) {
        m_source->SetLoop(true, config.loopStart, config.loopEnd);
        m_source->Start(config.startOffset, std::nullopt);
    } else {
        const TimeUS span = toTimeUS(config.endOffset) - toTimeUS(config.startOffset);
        m_source->Start(config.startOffset, toSeconds(span));
    }

    qCDebug(cuePlayback) << "Graph" << handle << "started at" << config.startOffset
                         << (config.loop ? "looping" : "bounded");
    return handle;
}

void PlaybackGraph::stop() {
    m_active = kNoGraph;
    if (!m_source) {
        return;
    }
    m_source->SetOnEnded(nullptr);
    m_source->Stop();
    m_source->Disconnect();
    m_source.reset();
}

void PlaybackGraph::setGain(double gain) {
    if (m_gain) {
        m_gain->SetGain(static_cast<float>(gain));
    } else {
        m_pendingGain = gain;
    }
}

void PlaybackGraph::dispose(std::function<void()> done) {
    stop();
    if (m_disposed) {
        if (done) {
            done();
        }
        return;
    }
    m_disposed = true;
    m_context->Close(std::move(done));
}

}  // namespace cue::playback
