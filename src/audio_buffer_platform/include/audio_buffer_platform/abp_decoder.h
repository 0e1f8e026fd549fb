#pragma once

#include "abp_buffer.h"
#include "abp_errors.h"
#include <cstddef>
#include <cstdint>
#include <memory>

namespace abp {

struct DecodeOptions {
    // Output sample rate; 0 keeps the source stream's rate
    int32_t sample_rate = 0;
};

// Decode an in-memory encoded file (any container/codec FFmpeg understands)
// into an interleaved float32 SampleBuffer. Channel count follows the source.
// Fails with DecodeFailed/Unsupported rather than returning an empty buffer.
Result<std::shared_ptr<const SampleBuffer>> DecodeAudio(const uint8_t* data, size_t size,
                                                        const DecodeOptions& options);

} // namespace abp
