#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
}

#include <audio_buffer_platform/abp_errors.h>
#include <cstddef>
#include <cstdint>
#include <string>

namespace abp {
namespace impl {

// Convert FFmpeg error code to ABP Error
Error ffmpeg_error(int errnum, const std::string& context);

// Read cursor over caller-owned encoded bytes, fed to FFmpeg through AVIOContext
struct MemoryReader {
    const uint8_t* data = nullptr;
    size_t size = 0;
    size_t pos = 0;
};

// FFmpeg format context opened over an in-memory byte range
class FFmpegMemoryInput {
public:
    FFmpegMemoryInput() = default;
    ~FFmpegMemoryInput();

    // Non-copyable, non-movable (AVIOContext holds a pointer to m_reader)
    FFmpegMemoryInput(const FFmpegMemoryInput&) = delete;
    FFmpegMemoryInput& operator=(const FFmpegMemoryInput&) = delete;

    // Probe and open the bytes; data must outlive this object
    Result<void> open(const uint8_t* data, size_t size);

    // Find audio stream (returns -1 if none)
    int find_audio_stream();

    AVFormatContext* get() const { return m_fmt_ctx; }
    int audio_stream_index() const { return m_audio_stream_idx; }
    AVStream* audio_stream() const;
    AVCodecParameters* audio_codec_params() const;

private:
    void release();

    MemoryReader m_reader;
    AVIOContext* m_avio_ctx = nullptr;
    AVFormatContext* m_fmt_ctx = nullptr;
    int m_audio_stream_idx = -1;
};

// FFmpeg codec context wrapper (software audio decode)
class FFmpegCodecContext {
public:
    FFmpegCodecContext() = default;
    ~FFmpegCodecContext();

    // Non-copyable
    FFmpegCodecContext(const FFmpegCodecContext&) = delete;
    FFmpegCodecContext& operator=(const FFmpegCodecContext&) = delete;

    // Move semantics
    FFmpegCodecContext(FFmpegCodecContext&& other) noexcept;
    FFmpegCodecContext& operator=(FFmpegCodecContext&& other) noexcept;

    Result<void> init(AVCodecParameters* params);

    AVCodecContext* get() const { return m_codec_ctx; }

private:
    AVCodecContext* m_codec_ctx = nullptr;
};

} // namespace impl
} // namespace abp
