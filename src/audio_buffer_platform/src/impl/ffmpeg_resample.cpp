#include "ffmpeg_resample.h"
#include "ffmpeg_context.h"
#include <cassert>

namespace abp {
namespace impl {

FFmpegResampleContext::~FFmpegResampleContext() {
    if (m_swr_ctx) {
        swr_free(&m_swr_ctx);
    }
    av_channel_layout_uninit(&m_dst_layout);
}

Result<void> FFmpegResampleContext::init(int src_sample_rate, const AVChannelLayout* src_ch_layout,
                                          AVSampleFormat src_sample_fmt, int dst_sample_rate) {
    if (src_ch_layout->nb_channels <= 0) {
        return Error::decode_failed("Audio stream reports no channels");
    }

    m_dst_sample_rate = dst_sample_rate;
    m_dst_channels = src_ch_layout->nb_channels;

    // Streams without a known layout get the default layout for their channel count
    AVChannelLayout src_layout{};
    if (src_ch_layout->order == AV_CHANNEL_ORDER_UNSPEC) {
        av_channel_layout_default(&src_layout, src_ch_layout->nb_channels);
    } else {
        int ret = av_channel_layout_copy(&src_layout, src_ch_layout);
        if (ret < 0) {
            return ffmpeg_error(ret, "av_channel_layout_copy");
        }
    }

    av_channel_layout_uninit(&m_dst_layout);
    int ret = av_channel_layout_copy(&m_dst_layout, &src_layout);
    if (ret < 0) {
        av_channel_layout_uninit(&src_layout);
        return ffmpeg_error(ret, "av_channel_layout_copy");
    }

    ret = swr_alloc_set_opts2(&m_swr_ctx,
        &m_dst_layout,                                // Output: source channels
        AV_SAMPLE_FMT_FLT,                            // Output: float32 interleaved
        dst_sample_rate,
        &src_layout,
        src_sample_fmt,
        src_sample_rate,
        0, nullptr);
    av_channel_layout_uninit(&src_layout);

    if (ret < 0) {
        return ffmpeg_error(ret, "swr_alloc_set_opts2");
    }

    ret = swr_init(m_swr_ctx);
    if (ret < 0) {
        swr_free(&m_swr_ctx);
        return ffmpeg_error(ret, "swr_init");
    }

    return Result<void>();
}

int FFmpegResampleContext::convert(const uint8_t* const* src_data, int src_samples,
                                    float* dst_data, int dst_max_samples) {
    assert(m_swr_ctx && "Resample context not initialized");

    uint8_t* dst_planes[1] = { reinterpret_cast<uint8_t*>(dst_data) };
    return swr_convert(m_swr_ctx, dst_planes, dst_max_samples, src_data, src_samples);
}

int FFmpegResampleContext::flush(float* dst_data, int dst_max_samples) {
    assert(m_swr_ctx && "Resample context not initialized");

    uint8_t* dst_planes[1] = { reinterpret_cast<uint8_t*>(dst_data) };
    return swr_convert(m_swr_ctx, dst_planes, dst_max_samples, nullptr, 0);
}

int FFmpegResampleContext::get_out_samples(int in_samples) const {
    assert(m_swr_ctx && "Resample context not initialized");
    return swr_get_out_samples(m_swr_ctx, in_samples);
}

} // namespace impl
} // namespace abp
