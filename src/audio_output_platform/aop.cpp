#include "aop.h"
#include "render_graph.h"

#include <QAudioFormat>
#include <QAudioSink>
#include <QIODevice>
#include <QLoggingCategory>
#include <QMediaDevices>
#include <QMetaObject>

#include <cassert>

Q_LOGGING_CATEGORY(cueAop, "cue.aop")

namespace aop {

const char* context_state_to_string(ContextState state) {
    switch (state) {
        case ContextState::Running: return "running";
        case ContextState::Suspended: return "suspended";
        case ContextState::Closed: return "closed";
    }
    return "unknown";
}

// QIODevice adapter for QAudioSink to pull mixed audio from the render graph
class AudioIODevice : public QIODevice {
public:
    AudioIODevice(RenderGraph* graph, QObject* parent = nullptr)
        : QIODevice(parent)
        , m_graph(graph) {
    }

    bool open(OpenMode mode) override {
        if (mode != ReadOnly) return false;
        return QIODevice::open(mode);
    }

    qint64 readData(char* data, qint64 maxlen) override {
        // float32 interleaved
        const qint64 bytes_per_frame = static_cast<qint64>(m_graph->channels()) * sizeof(float);
        const int64_t frames = maxlen / bytes_per_frame;
        if (frames <= 0) return 0;

        m_graph->Render(reinterpret_cast<float*>(data), frames);
        return frames * bytes_per_frame;
    }

    qint64 writeData(const char*, qint64) override {
        return -1;  // Not writable
    }

    qint64 bytesAvailable() const override {
        // Rendering never runs dry
        return static_cast<qint64>(m_graph->sample_rate()) * m_graph->channels() * sizeof(float)
               + QIODevice::bytesAvailable();
    }

    bool isSequential() const override { return true; }

private:
    RenderGraph* m_graph;
};

// Implementation class
class AudioOutputImpl {
public:
    AudioOutputImpl(int sample_rate, int channels, int buffer_ms)
        : m_requested_rate(sample_rate)
        , m_requested_channels(channels)
        , m_buffer_ms(buffer_ms) {
    }

    ~AudioOutputImpl() {
        close();
    }

    bool init(AopOpenReport* out_report) {
        QAudioFormat format;
        format.setSampleRate(m_requested_rate);
        format.setChannelCount(m_requested_channels);
        format.setSampleFormat(QAudioFormat::Float);

        QAudioDevice device = QMediaDevices::defaultAudioOutput();
        if (device.isNull()) {
            if (out_report) out_report->device_name = "No audio device";
            qCWarning(cueAop) << "No default audio output device";
            return false;
        }

        if (!device.isFormatSupported(format)) {
            // Fall back to the device's own rate and layout, still float32
            QAudioFormat nearest = device.preferredFormat();
            nearest.setSampleFormat(QAudioFormat::Float);
            if (!device.isFormatSupported(nearest)) {
                if (out_report) out_report->device_name = "Format not supported";
                qCWarning(cueAop) << "Float32 output not supported by" << device.description();
                return false;
            }
            format = nearest;
        }

        m_graph = std::make_unique<RenderGraph>(format.sampleRate(), format.channelCount());
        m_io_device = std::make_unique<AudioIODevice>(m_graph.get());
        m_sink = std::make_unique<QAudioSink>(device, format);

        const qsizetype bytes_per_second =
            static_cast<qsizetype>(format.sampleRate()) * format.channelCount() * sizeof(float);
        m_sink->setBufferSize(bytes_per_second * m_buffer_ms / 1000);

        QObject::connect(m_sink.get(), &QAudioSink::stateChanged, m_sink.get(), [this](QAudio::State) {
            if (m_sink->error() == QAudio::UnderrunError) {
                qCDebug(cueAop) << "Audio sink underrun";
            }
        });

        m_io_device->open(QIODevice::ReadOnly);
        m_sink->start(m_io_device.get());
        if (m_sink->error() != QAudio::NoError) {
            if (out_report) out_report->device_name = "Failed to start output";
            qCWarning(cueAop) << "Audio sink failed to start, error" << m_sink->error();
            return false;
        }
        m_state = ContextState::Running;

        if (out_report) {
            out_report->actual_sample_rate = format.sampleRate();
            out_report->actual_channels = format.channelCount();
            out_report->actual_buffer_ms = static_cast<int32_t>(
                (static_cast<int64_t>(m_sink->bufferSize()) * 1000) / bytes_per_second);
            out_report->device_name = device.description().toStdString();
        }

        qCDebug(cueAop) << "Opened" << device.description() << format.sampleRate() << "Hz"
                        << format.channelCount() << "ch";
        return true;
    }

    void suspend() {
        if (m_state != ContextState::Running) return;
        m_sink->suspend();
        m_state = ContextState::Suspended;
    }

    void resume() {
        if (m_state != ContextState::Suspended) return;
        m_sink->resume();
        m_state = ContextState::Running;
    }

    void close() {
        if (m_state == ContextState::Closed) return;
        if (m_sink) {
            m_sink->stop();
        }
        if (m_io_device) {
            m_io_device->close();
        }
        m_state = ContextState::Closed;
    }

    RenderGraph* graph() const { return m_graph.get(); }
    ContextState state() const { return m_state; }

private:
    int m_requested_rate;
    int m_requested_channels;
    int m_buffer_ms;
    std::unique_ptr<RenderGraph> m_graph;
    std::unique_ptr<AudioIODevice> m_io_device;
    std::unique_ptr<QAudioSink> m_sink;
    ContextState m_state = ContextState::Closed;
};

// AudioOutput implementation

AudioOutput::AudioOutput(std::unique_ptr<AudioOutputImpl> impl)
    : m_impl(std::move(impl)) {
    assert(m_impl && "AudioOutput impl cannot be null");

    // Ended notifications come from the device thread
    m_impl->graph()->SetDispatcher([this](Completion fn) { post(std::move(fn)); });
}

AudioOutput::~AudioOutput() {
    m_impl->close();
}

std::unique_ptr<AudioOutput> AudioOutput::Open(const AopConfig& config, AopOpenReport* out_report) {
    int sample_rate = config.sample_rate > 0 ? config.sample_rate : 48000;
    int channels = config.channels > 0 ? config.channels : 2;
    int buffer_ms = config.target_buffer_ms > 0 ? config.target_buffer_ms : 100;

    auto impl = std::make_unique<AudioOutputImpl>(sample_rate, channels, buffer_ms);

    if (!impl->init(out_report)) {
        return nullptr;
    }

    return std::make_unique<AudioOutput>(std::move(impl));
}

void AudioOutput::post(Completion fn) {
    if (!fn) return;
    QMetaObject::invokeMethod(this, [fn = std::move(fn)]() { fn(); }, Qt::QueuedConnection);
}

double AudioOutput::CurrentTime() const {
    return m_impl->graph()->CurrentTime();
}

ContextState AudioOutput::State() const {
    return m_impl->state();
}

int32_t AudioOutput::SampleRate() const {
    return m_impl->graph()->sample_rate();
}

void AudioOutput::Suspend(Completion done) {
    m_impl->suspend();
    post(std::move(done));
}

void AudioOutput::Resume(Completion done) {
    if (m_impl->state() == ContextState::Closed) {
        qCWarning(cueAop, "Resume on a %s context", context_state_to_string(m_impl->state()));
    }
    m_impl->resume();
    post(std::move(done));
}

void AudioOutput::Close(Completion done) {
    m_impl->close();
    post(std::move(done));
}

std::unique_ptr<BufferSourceNode> AudioOutput::CreateBufferSource(
    std::shared_ptr<const abp::SampleBuffer> buffer) {
    return m_impl->graph()->CreateSource(std::move(buffer));
}

std::unique_ptr<GainNode> AudioOutput::CreateGain() {
    return m_impl->graph()->CreateGain();
}

} // namespace aop
