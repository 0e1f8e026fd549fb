#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libswresample/swresample.h>
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
#include <libavutil/opt.h>
}

#include <audio_buffer_platform/abp_errors.h>
#include <cstdint>

namespace abp {
namespace impl {

// SwrContext wrapper for audio resampling
// Converts any input format to interleaved float32 at the target rate,
// keeping the source channel count
class FFmpegResampleContext {
public:
    FFmpegResampleContext() = default;
    ~FFmpegResampleContext();

    // Non-copyable
    FFmpegResampleContext(const FFmpegResampleContext&) = delete;
    FFmpegResampleContext& operator=(const FFmpegResampleContext&) = delete;

    Result<void> init(int src_sample_rate, const AVChannelLayout* src_ch_layout,
                      AVSampleFormat src_sample_fmt, int dst_sample_rate);

    // Returns number of output samples per channel, or a negative FFmpeg error
    int convert(const uint8_t* const* src_data, int src_samples,
                float* dst_data, int dst_max_samples);

    // Drain samples buffered inside the resampler
    int flush(float* dst_data, int dst_max_samples);

    // Upper bound on output samples for the given input
    int get_out_samples(int in_samples) const;

    int dst_channels() const { return m_dst_channels; }
    int dst_sample_rate() const { return m_dst_sample_rate; }

private:
    SwrContext* m_swr_ctx = nullptr;
    AVChannelLayout m_dst_layout{};
    int m_dst_sample_rate = 0;
    int m_dst_channels = 0;
};

} // namespace impl
} // namespace abp
