#pragma once

#include <memory>
#include <cstdint>
#include <vector>

namespace abp {

class SampleBufferImpl;

// Fully decoded audio, interleaved float32.
// Immutable once built; shared between loaders, the engine and render nodes.
class SampleBuffer {
public:
    ~SampleBuffer();

    int32_t sample_rate() const;

    // Number of interleaved channels
    int32_t channels() const;

    // Number of sample-frames (samples per channel)
    int64_t frames() const;

    // frames() / sample_rate(), 0 for an empty buffer
    double duration_seconds() const;

    // Sample at (frame, channel); 0 outside the buffer
    float sample(int64_t frame, int32_t channel) const;

    // Build from already interleaved samples (used by the decoder and by tests)
    static std::shared_ptr<const SampleBuffer> FromInterleaved(
        int32_t sample_rate, int32_t channels, std::vector<float> interleaved);

    // Internal: Constructor is public but SampleBufferImpl is opaque
    explicit SampleBuffer(std::unique_ptr<SampleBufferImpl> impl);

private:
    std::unique_ptr<SampleBufferImpl> m_impl;
};

} // namespace abp
