#include <audio_buffer_platform/abp_decoder.h>
#include "impl/ffmpeg_context.h"
#include "impl/ffmpeg_resample.h"
#include "impl/sample_buffer_impl.h"
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <vector>

// Simple logging - check ABP_LOG_LEVEL env var at runtime
// 0=none (default), 1=warn, 2=debug
namespace {
inline int abp_log_level() {
    static int level = -1;
    if (level < 0) {
        const char* env = std::getenv("ABP_LOG_LEVEL");
        level = env ? std::atoi(env) : 0;
    }
    return level;
}
} // namespace

#define ABP_LOG_WARN(...) do { if (abp_log_level() >= 1) { fprintf(stderr, "[ABP WARN] "); fprintf(stderr, __VA_ARGS__); fprintf(stderr, "\n"); } } while(0)
#define ABP_LOG_DEBUG(...) do { if (abp_log_level() >= 2) { fprintf(stderr, "[ABP] "); fprintf(stderr, __VA_ARGS__); fprintf(stderr, "\n"); } } while(0)

namespace abp {

namespace {

// Decode state for one DecodeAudio call
struct AudioDecodeSession {
    impl::FFmpegMemoryInput input;
    impl::FFmpegCodecContext codec_ctx;
    impl::FFmpegResampleContext resample_ctx;
    AVPacket* pkt = nullptr;
    AVFrame* frame = nullptr;
    std::vector<float> pcm;
    int64_t total_samples = 0;

    AudioDecodeSession() {
        pkt = av_packet_alloc();
        frame = av_frame_alloc();
    }

    ~AudioDecodeSession() {
        av_packet_free(&pkt);
        av_frame_free(&frame);
    }

    // Resample the frame currently held in `frame` and append to pcm
    Result<void> append_frame() {
        const int channels = resample_ctx.dst_channels();
        int out_needed = resample_ctx.get_out_samples(frame->nb_samples);
        if (out_needed < 0) {
            return impl::ffmpeg_error(out_needed, "swr_get_out_samples");
        }

        size_t current_size = pcm.size();
        pcm.resize(current_size + static_cast<size_t>(out_needed) * static_cast<size_t>(channels));

        int out_samples = resample_ctx.convert(frame->data, frame->nb_samples,
                                               pcm.data() + current_size, out_needed);
        if (out_samples < 0) {
            pcm.resize(current_size);
            return impl::ffmpeg_error(out_samples, "swr_convert");
        }

        pcm.resize(current_size + static_cast<size_t>(out_samples) * static_cast<size_t>(channels));
        total_samples += out_samples;
        return Result<void>();
    }

    // Pull every frame the decoder has ready
    Result<void> receive_frames() {
        AVCodecContext* codec = codec_ctx.get();
        while (true) {
            int ret = avcodec_receive_frame(codec, frame);
            if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
                return Result<void>();
            }
            if (ret < 0) {
                return impl::ffmpeg_error(ret, "avcodec_receive_frame (audio)");
            }

            auto append_result = append_frame();
            av_frame_unref(frame);
            if (append_result.is_error()) {
                return append_result;
            }
        }
    }
};

} // namespace

Result<std::shared_ptr<const SampleBuffer>> DecodeAudio(const uint8_t* data, size_t size,
                                                        const DecodeOptions& options) {
    // Keep FFmpeg's own diagnostics off stderr; failures come back as Errors
    static std::once_flag s_ffmpeg_log_init;
    std::call_once(s_ffmpeg_log_init, [] {
        av_log_set_level(AV_LOG_FATAL);
    });

    if (options.sample_rate < 0) {
        return Error::invalid_arg("DecodeAudio: sample_rate must be >= 0");
    }

    AudioDecodeSession session;
    if (!session.pkt || !session.frame) {
        return Error::internal("Failed to allocate packet/frame");
    }

    auto open_result = session.input.open(data, size);
    if (open_result.is_error()) {
        ABP_LOG_WARN("open failed: %s", open_result.error().message.c_str());
        if (open_result.error().code == ErrorCode::Internal) {
            // Probe failures on arbitrary bytes surface as "not decodable"
            return Error::decode_failed(open_result.error().message);
        }
        return open_result.error();
    }

    if (session.input.find_audio_stream() < 0) {
        return Error::decode_failed("No audio stream found");
    }

    auto codec_result = session.codec_ctx.init(session.input.audio_codec_params());
    if (codec_result.is_error()) {
        return codec_result.error();
    }

    AVCodecContext* codec = session.codec_ctx.get();
    const int out_rate = options.sample_rate > 0 ? options.sample_rate : codec->sample_rate;
    if (codec->sample_rate <= 0 || out_rate <= 0) {
        return Error::decode_failed("Audio stream has no sample rate");
    }

    auto resample_result = session.resample_ctx.init(codec->sample_rate, &codec->ch_layout,
                                                     codec->sample_fmt, out_rate);
    if (resample_result.is_error()) {
        return resample_result.error();
    }

    AVFormatContext* fmt_ctx = session.input.get();
    const int stream_idx = session.input.audio_stream_index();

    while (true) {
        int ret = av_read_frame(fmt_ctx, session.pkt);
        if (ret == AVERROR_EOF) {
            break;
        }
        if (ret < 0) {
            av_packet_unref(session.pkt);
            return impl::ffmpeg_error(ret, "av_read_frame (audio)");
        }

        if (session.pkt->stream_index != stream_idx) {
            av_packet_unref(session.pkt);
            continue;  // Skip non-audio packets
        }

        ret = avcodec_send_packet(codec, session.pkt);
        av_packet_unref(session.pkt);
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            // Corrupt packets are skipped; a stream with nothing decodable fails below
            ABP_LOG_WARN("avcodec_send_packet failed (%d), skipping packet", ret);
            continue;
        }

        auto receive_result = session.receive_frames();
        if (receive_result.is_error()) {
            return receive_result.error();
        }
    }

    // Drain the decoder
    int ret = avcodec_send_packet(codec, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        return impl::ffmpeg_error(ret, "avcodec_send_packet (flush)");
    }
    auto drain_result = session.receive_frames();
    if (drain_result.is_error()) {
        return drain_result.error();
    }

    // Drain the resampler
    const int channels = session.resample_ctx.dst_channels();
    if (session.total_samples > 0) {
        constexpr int FLUSH_SAMPLES = 4096;
        size_t current_size = session.pcm.size();
        session.pcm.resize(current_size + static_cast<size_t>(FLUSH_SAMPLES) * static_cast<size_t>(channels));
        int flushed = session.resample_ctx.flush(session.pcm.data() + current_size, FLUSH_SAMPLES);
        if (flushed < 0) {
            flushed = 0;
        }
        session.pcm.resize(current_size + static_cast<size_t>(flushed) * static_cast<size_t>(channels));
        session.total_samples += flushed;
    }

    if (session.total_samples == 0) {
        return Error::decode_failed("No audio samples decoded");
    }

    ABP_LOG_DEBUG("decoded %lld frames, %d ch @ %d Hz",
                  static_cast<long long>(session.total_samples), channels, out_rate);

    auto impl = std::make_unique<SampleBufferImpl>(out_rate, channels, std::move(session.pcm));
    return std::shared_ptr<const SampleBuffer>(std::make_shared<SampleBuffer>(std::move(impl)));
}

} // namespace abp
