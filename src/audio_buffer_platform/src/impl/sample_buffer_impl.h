#pragma once

#include <audio_buffer_platform/abp_buffer.h>
#include <vector>

namespace abp {

// Internal implementation of SampleBuffer
class SampleBufferImpl {
public:
    SampleBufferImpl(int32_t sample_rate, int32_t channels, std::vector<float> data);

    int32_t sample_rate;
    int32_t channels;
    std::vector<float> data;  // Interleaved float32
};

} // namespace abp
