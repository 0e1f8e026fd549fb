#include "ffmpeg_context.h"
#include <algorithm>
#include <cassert>
#include <cstdio>
#include <cstring>

namespace abp {
namespace impl {

// AVIO read buffer size; FFmpeg may reallocate it
static constexpr int AVIO_BUFFER_SIZE = 32 * 1024;

Error ffmpeg_error(int errnum, const std::string& context) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errnum, errbuf, sizeof(errbuf));
    std::string msg = context + ": " + errbuf;

    // Map FFmpeg errors to ABP errors
    if (errnum == AVERROR_INVALIDDATA || errnum == AVERROR(EINVAL)) {
        return Error::decode_failed(msg);
    } else if (errnum == AVERROR_DECODER_NOT_FOUND || errnum == AVERROR_DEMUXER_NOT_FOUND) {
        return Error::unsupported("No decoder found: " + context);
    }
    return Error::internal(msg);
}

static int read_memory(void* opaque, uint8_t* buf, int buf_size) {
    auto* reader = static_cast<MemoryReader*>(opaque);
    size_t remaining = reader->size - reader->pos;
    if (remaining == 0) {
        return AVERROR_EOF;
    }
    size_t to_copy = std::min(remaining, static_cast<size_t>(buf_size));
    std::memcpy(buf, reader->data + reader->pos, to_copy);
    reader->pos += to_copy;
    return static_cast<int>(to_copy);
}

static int64_t seek_memory(void* opaque, int64_t offset, int whence) {
    auto* reader = static_cast<MemoryReader*>(opaque);
    if (whence == AVSEEK_SIZE) {
        return static_cast<int64_t>(reader->size);
    }

    int64_t base = 0;
    switch (whence & ~AVSEEK_FORCE) {
        case SEEK_SET: base = 0; break;
        case SEEK_CUR: base = static_cast<int64_t>(reader->pos); break;
        case SEEK_END: base = static_cast<int64_t>(reader->size); break;
        default: return AVERROR(EINVAL);
    }

    int64_t target = base + offset;
    if (target < 0 || target > static_cast<int64_t>(reader->size)) {
        return AVERROR(EINVAL);
    }
    reader->pos = static_cast<size_t>(target);
    return target;
}

// FFmpegMemoryInput implementation

FFmpegMemoryInput::~FFmpegMemoryInput() {
    release();
}

void FFmpegMemoryInput::release() {
    if (m_fmt_ctx) {
        avformat_close_input(&m_fmt_ctx);
    }
    // avformat_close_input leaves a custom pb alone
    if (m_avio_ctx) {
        av_freep(&m_avio_ctx->buffer);
        avio_context_free(&m_avio_ctx);
    }
    m_audio_stream_idx = -1;
}

Result<void> FFmpegMemoryInput::open(const uint8_t* data, size_t size) {
    release();

    if (!data || size == 0) {
        return Error::decode_failed("No bytes to decode");
    }

    m_reader.data = data;
    m_reader.size = size;
    m_reader.pos = 0;

    auto* avio_buffer = static_cast<unsigned char*>(av_malloc(AVIO_BUFFER_SIZE));
    if (!avio_buffer) {
        return Error::internal("Failed to allocate AVIO buffer");
    }

    m_avio_ctx = avio_alloc_context(avio_buffer, AVIO_BUFFER_SIZE, 0, &m_reader,
                                    read_memory, nullptr, seek_memory);
    if (!m_avio_ctx) {
        av_free(avio_buffer);
        return Error::internal("Failed to allocate AVIO context");
    }

    m_fmt_ctx = avformat_alloc_context();
    if (!m_fmt_ctx) {
        return Error::internal("Failed to allocate format context");
    }
    m_fmt_ctx->pb = m_avio_ctx;
    m_fmt_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

    // On failure avformat_open_input frees the context and nulls the pointer
    int ret = avformat_open_input(&m_fmt_ctx, nullptr, nullptr, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ret, "avformat_open_input(memory)");
    }

    ret = avformat_find_stream_info(m_fmt_ctx, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ret, "avformat_find_stream_info");
    }

    return Result<void>();
}

int FFmpegMemoryInput::find_audio_stream() {
    assert(m_fmt_ctx && "Format context not opened");

    m_audio_stream_idx = av_find_best_stream(m_fmt_ctx, AVMEDIA_TYPE_AUDIO,
                                              -1, -1, nullptr, 0);
    return m_audio_stream_idx;
}

AVStream* FFmpegMemoryInput::audio_stream() const {
    if (m_audio_stream_idx < 0) return nullptr;
    return m_fmt_ctx->streams[m_audio_stream_idx];
}

AVCodecParameters* FFmpegMemoryInput::audio_codec_params() const {
    AVStream* stream = audio_stream();
    return stream ? stream->codecpar : nullptr;
}

// FFmpegCodecContext implementation

FFmpegCodecContext::~FFmpegCodecContext() {
    if (m_codec_ctx) {
        avcodec_free_context(&m_codec_ctx);
    }
}

FFmpegCodecContext::FFmpegCodecContext(FFmpegCodecContext&& other) noexcept
    : m_codec_ctx(other.m_codec_ctx) {
    other.m_codec_ctx = nullptr;
}

FFmpegCodecContext& FFmpegCodecContext::operator=(FFmpegCodecContext&& other) noexcept {
    if (this != &other) {
        if (m_codec_ctx) {
            avcodec_free_context(&m_codec_ctx);
        }
        m_codec_ctx = other.m_codec_ctx;
        other.m_codec_ctx = nullptr;
    }
    return *this;
}

Result<void> FFmpegCodecContext::init(AVCodecParameters* params) {
    const AVCodec* codec = avcodec_find_decoder(params->codec_id);
    if (!codec) {
        return Error::unsupported("No decoder for codec ID " + std::to_string(params->codec_id));
    }

    m_codec_ctx = avcodec_alloc_context3(codec);
    if (!m_codec_ctx) {
        return Error::internal("Failed to allocate codec context");
    }

    int ret = avcodec_parameters_to_context(m_codec_ctx, params);
    if (ret < 0) {
        return ffmpeg_error(ret, "avcodec_parameters_to_context");
    }

    ret = avcodec_open2(m_codec_ctx, codec, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ret, "avcodec_open2");
    }

    return Result<void>();
}

} // namespace impl
} // namespace abp
