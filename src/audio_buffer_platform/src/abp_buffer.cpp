#include <audio_buffer_platform/abp_buffer.h>
#include "impl/sample_buffer_impl.h"
#include <cassert>

namespace abp {

SampleBufferImpl::SampleBufferImpl(int32_t sample_rate_, int32_t channels_, std::vector<float> data_)
    : sample_rate(sample_rate_)
    , channels(channels_)
    , data(std::move(data_)) {
}

SampleBuffer::SampleBuffer(std::unique_ptr<SampleBufferImpl> impl)
    : m_impl(std::move(impl)) {
    assert(m_impl && "SampleBuffer impl cannot be null");
}

SampleBuffer::~SampleBuffer() = default;

std::shared_ptr<const SampleBuffer> SampleBuffer::FromInterleaved(
    int32_t sample_rate, int32_t channels, std::vector<float> interleaved) {
    assert(sample_rate > 0 && channels > 0);
    // Drop a trailing partial frame
    interleaved.resize(interleaved.size() - interleaved.size() % static_cast<size_t>(channels));
    auto impl = std::make_unique<SampleBufferImpl>(sample_rate, channels, std::move(interleaved));
    return std::make_shared<const SampleBuffer>(std::move(impl));
}

int32_t SampleBuffer::sample_rate() const {
    return m_impl->sample_rate;
}

int32_t SampleBuffer::channels() const {
    return m_impl->channels;
}

int64_t SampleBuffer::frames() const {
    if (m_impl->channels == 0) return 0;
    return static_cast<int64_t>(m_impl->data.size()) / m_impl->channels;
}

double SampleBuffer::duration_seconds() const {
    if (m_impl->sample_rate <= 0) return 0.0;
    return static_cast<double>(frames()) / m_impl->sample_rate;
}

float SampleBuffer::sample(int64_t frame, int32_t channel) const {
    if (frame < 0 || frame >= frames() || channel < 0 || channel >= m_impl->channels) {
        return 0.0f;
    }
    return m_impl->data[static_cast<size_t>(frame * m_impl->channels + channel)];
}

} // namespace abp
