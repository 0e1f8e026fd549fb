#pragma once

#include <QObject>

#include <audio_buffer_platform/abp_buffer.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace aop {

// Configuration for audio output
struct AopConfig {
    int32_t sample_rate;       // Requested sample rate (default 48000)
    int32_t channels;          // Channel count (default 2, stereo)
    int32_t target_buffer_ms;  // Device buffer size in ms (default 100)
};

inline AopConfig default_config() {
    AopConfig cfg;
    cfg.sample_rate = 48000;
    cfg.channels = 2;
    cfg.target_buffer_ms = 100;
    return cfg;
}

// Report from device open
struct AopOpenReport {
    int32_t actual_sample_rate = 0;
    int32_t actual_channels = 0;
    int32_t actual_buffer_ms = 0;
    std::string device_name;
};

enum class ContextState {
    Running,
    Suspended,
    Closed
};

const char* context_state_to_string(ContextState state);

// Completion of an asynchronous context operation
using Completion = std::function<void()>;

// Persistent amplitude stage between sources and the device
class GainNode {
public:
    virtual ~GainNode() = default;

    virtual void SetGain(float gain) = 0;
    virtual float Gain() const = 0;
};

// Single-use player of one SampleBuffer.
// Configure, Start once, Stop once; never restarted.
class BufferSourceNode {
public:
    virtual ~BufferSourceNode() = default;

    // Buffer-time speed multiplier (1.0 = original pitch/speed)
    virtual void SetPlaybackRate(double rate) = 0;

    // Loop within [loop_start, loop_end) seconds once the playhead reaches loop_end
    virtual void SetLoop(bool loop, double loop_start, double loop_end) = 0;

    virtual void Connect(GainNode* destination) = 0;
    virtual void Disconnect() = 0;

    // One-shot notification when playback runs out (duration elapsed or buffer end).
    // Never fired for Stop(); delivered on the context's owning thread.
    virtual void SetOnEnded(Completion on_ended) = 0;

    // Begin at offset seconds; with a duration, stop after that much buffer time
    virtual void Start(double offset, std::optional<double> duration) = 0;

    virtual void Stop() = 0;
};

// Hardware audio context: clock plus node factory.
// CurrentTime() advances only while the context is Running.
class AudioContext {
public:
    virtual ~AudioContext() = default;

    // Seconds of audio rendered since the context was opened
    virtual double CurrentTime() const = 0;
    virtual ContextState State() const = 0;
    virtual int32_t SampleRate() const = 0;

    // Asynchronous; done runs on the owning thread once the state has changed
    virtual void Suspend(Completion done) = 0;
    virtual void Resume(Completion done) = 0;
    virtual void Close(Completion done) = 0;

    virtual std::unique_ptr<BufferSourceNode> CreateBufferSource(
        std::shared_ptr<const abp::SampleBuffer> buffer) = 0;
    virtual std::unique_ptr<GainNode> CreateGain() = 0;
};

class AudioOutputImpl;

// AudioContext backed by the default Qt Multimedia output device.
// Render callbacks may run on an audio thread; completions and ended
// notifications are posted back to the thread that opened the device.
class AudioOutput : public QObject, public AudioContext {
    Q_OBJECT

public:
    ~AudioOutput() override;

    // Open the default audio output device
    // Returns nullptr on failure (check out_report for details)
    static std::unique_ptr<AudioOutput> Open(const AopConfig& config, AopOpenReport* out_report);

    double CurrentTime() const override;
    ContextState State() const override;
    int32_t SampleRate() const override;

    void Suspend(Completion done) override;
    void Resume(Completion done) override;
    void Close(Completion done) override;

    std::unique_ptr<BufferSourceNode> CreateBufferSource(
        std::shared_ptr<const abp::SampleBuffer> buffer) override;
    std::unique_ptr<GainNode> CreateGain() override;

    // Internal constructor (public but impl is opaque)
    explicit AudioOutput(std::unique_ptr<AudioOutputImpl> impl);

private:
    // Run fn on this object's thread after the current call returns
    void post(Completion fn);

    std::unique_ptr<AudioOutputImpl> m_impl;
};

} // namespace aop
