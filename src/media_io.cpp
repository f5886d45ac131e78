#include "core/media_io.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

extern "C"
{
#include <libavutil/dict.h>
#include <libavutil/error.h>
}

namespace
{
    constexpr int IO_BUFFER_SIZE = 64 * 1024;

    int readPacket(void *opaque, uint8_t *buf, int buf_size)
    {
        auto *cursor = static_cast<FdCursor *>(opaque);
        ssize_t n;
        do
        {
            n = ::pread(cursor->fd, buf, static_cast<size_t>(buf_size), cursor->position);
        } while (n < 0 && errno == EINTR);

        if (n < 0)
            return AVERROR(errno);
        if (n == 0)
            return AVERROR_EOF;
        cursor->position += n;
        return static_cast<int>(n);
    }

#if LIBAVFORMAT_VERSION_MAJOR >= 61
    int writePacket(void *opaque, const uint8_t *buf, int buf_size)
#else
    int writePacket(void *opaque, uint8_t *buf, int buf_size)
#endif
    {
        auto *cursor = static_cast<FdCursor *>(opaque);
        int written = 0;
        while (written < buf_size)
        {
            ssize_t n = ::pwrite(cursor->fd, buf + written, static_cast<size_t>(buf_size - written),
                                 cursor->position + written);
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                return AVERROR(errno);
            }
            written += static_cast<int>(n);
        }
        cursor->position += written;
        cursor->size = std::max(cursor->size, cursor->position);
        return written;
    }

    int64_t seekCursor(void *opaque, int64_t offset, int whence)
    {
        auto *cursor = static_cast<FdCursor *>(opaque);
        if (whence & AVSEEK_SIZE)
            return cursor->size;

        int64_t target;
        switch (whence & ~AVSEEK_FORCE)
        {
        case SEEK_SET:
            target = offset;
            break;
        case SEEK_CUR:
            target = cursor->position + offset;
            break;
        case SEEK_END:
            target = cursor->size + offset;
            break;
        default:
            return AVERROR(EINVAL);
        }
        if (target < 0)
            return AVERROR(EINVAL);
        cursor->position = target;
        return target;
    }

    AVIOContext *allocIoContext(FdCursor *cursor, bool writable)
    {
        auto *buffer = static_cast<unsigned char *>(av_malloc(IO_BUFFER_SIZE));
        if (!buffer)
            return nullptr;

        AVIOContext *io = avio_alloc_context(buffer, IO_BUFFER_SIZE, writable ? 1 : 0, cursor,
                                             writable ? nullptr : readPacket,
                                             writable ? writePacket : nullptr,
                                             seekCursor);
        if (!io)
            av_free(buffer);
        return io;
    }
}

std::string avErrorString(int errnum)
{
    char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
    if (av_strerror(errnum, buffer, sizeof(buffer)) < 0)
        return "FFmpeg error " + std::to_string(errnum);
    return std::string(buffer);
}

FailureKind failureFromAvError(int errnum, FailureKind fallback)
{
    if (errnum == AVERROR(ENOMEM) || errnum == AVERROR(EFBIG))
        return FailureKind::RESOURCE_EXCEEDED;
    return fallback;
}

StageResult FdIo::readAll(int fd, std::vector<uint8_t> &data, uint64_t max_bytes)
{
    struct stat st;
    if (::fstat(fd, &st) != 0)
        return StageResult::fail(FailureKind::DECODE_ERROR, std::string("fstat failed: ") + std::strerror(errno));

    uint64_t size = static_cast<uint64_t>(st.st_size);
    if (size > max_bytes)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED,
                                 "Input of " + std::to_string(size) + " bytes exceeds the in-memory limit of " +
                                     std::to_string(max_bytes) + " bytes");

    try
    {
        data.resize(static_cast<size_t>(size));
    }
    catch (const std::bad_alloc &)
    {
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate input buffer");
    }

    size_t offset = 0;
    while (offset < data.size())
    {
        ssize_t n = ::pread(fd, data.data() + offset, data.size() - offset, static_cast<off_t>(offset));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return StageResult::fail(FailureKind::DECODE_ERROR, std::string("read failed: ") + std::strerror(errno));
        }
        if (n == 0)
            break;
        offset += static_cast<size_t>(n);
    }

    if (offset != data.size())
        return StageResult::fail(FailureKind::TRUNCATED, "Input shrank while reading");
    return StageResult::ok();
}

StageResult FdIo::writeAll(int fd, const uint8_t *data, size_t size)
{
    size_t offset = 0;
    while (offset < size)
    {
        ssize_t n = ::pwrite(fd, data + offset, size - offset, static_cast<off_t>(offset));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            FailureKind kind = errno == EFBIG ? FailureKind::RESOURCE_EXCEEDED : FailureKind::ENCODE_ERROR;
            return StageResult::fail(kind, std::string("write failed: ") + std::strerror(errno));
        }
        offset += static_cast<size_t>(n);
    }

    if (::ftruncate(fd, static_cast<off_t>(size)) != 0)
        return StageResult::fail(FailureKind::ENCODE_ERROR, std::string("truncate failed: ") + std::strerror(errno));
    return StageResult::ok();
}

bool FdIo::writeFully(int fd, const std::string &data)
{
    size_t offset = 0;
    while (offset < data.size())
    {
        ssize_t n = ::write(fd, data.data() + offset, data.size() - offset);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}

bool FdIo::readFully(int fd, std::string &data, size_t max_bytes)
{
    char buffer[4096];
    while (true)
    {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        if (n == 0)
            return true;
        if (data.size() + static_cast<size_t>(n) > max_bytes)
            return false;
        data.append(buffer, static_cast<size_t>(n));
    }
}

StageResult MediaInput::open(int fd, const std::string &demuxer, const DemuxLimits &limits)
{
    const AVInputFormat *input_format = av_find_input_format(demuxer.c_str());
    if (!input_format)
        return StageResult::fail(FailureKind::UNSUPPORTED_FORMAT, "Demuxer not available: " + demuxer);

    struct stat st;
    if (::fstat(fd, &st) != 0)
        return StageResult::fail(FailureKind::DECODE_ERROR, std::string("fstat failed: ") + std::strerror(errno));
    cursor_.fd = fd;
    cursor_.position = 0;
    cursor_.size = static_cast<int64_t>(st.st_size);

    AVIOContext *io = allocIoContext(&cursor_, false);
    if (!io)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate input I/O context");
    io_.set(io);

    AVFormatContext *ctx = avformat_alloc_context();
    if (!ctx)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate demuxer context");

    ctx->pb = io;
    ctx->flags |= AVFMT_FLAG_CUSTOM_IO;
    ctx->probesize = limits.probesize;
    ctx->max_analyze_duration = limits.analyzeduration_us;
    ctx->max_streams = limits.max_streams;
    ctx->format_whitelist = av_strdup(demuxer.c_str());
    *format_.address() = ctx;

    // On failure avformat_open_input frees the context and nulls the pointer
    int ret = avformat_open_input(format_.address(), nullptr, input_format, nullptr);
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::DECODE_ERROR),
                                 "Cannot open input as " + demuxer + ": " + avErrorString(ret));

    ret = avformat_find_stream_info(format_.get(), nullptr);
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::DECODE_ERROR),
                                 "Cannot read stream info: " + avErrorString(ret));

    Logger::debug("Opened input with demuxer " + demuxer + ", streams: " +
                  std::to_string(format_.get()->nb_streams));
    return StageResult::ok();
}

int MediaInput::findStream(AVMediaType type)
{
    AVFormatContext *ctx = format_.get();
    if (!ctx)
        return -1;

    for (unsigned int i = 0; i < ctx->nb_streams; ++i)
    {
        AVStream *stream = ctx->streams[i];
        if (stream->codecpar->codec_type != type)
            continue;
        // Cover art is an embedded still image, not a video track
        if (type == AVMEDIA_TYPE_VIDEO && (stream->disposition & AV_DISPOSITION_ATTACHED_PIC))
            continue;
        return static_cast<int>(i);
    }
    return -1;
}

void MediaInput::discardUnused(const std::vector<int> &keep)
{
    AVFormatContext *ctx = format_.get();
    if (!ctx)
        return;

    for (unsigned int i = 0; i < ctx->nb_streams; ++i)
    {
        bool kept = std::find(keep.begin(), keep.end(), static_cast<int>(i)) != keep.end();
        ctx->streams[i]->discard = kept ? AVDISCARD_DEFAULT : AVDISCARD_ALL;
    }
}

StageResult MediaOutput::open(int fd, const std::string &muxer)
{
    AVFormatContext *ctx = nullptr;
    int ret = avformat_alloc_output_context2(&ctx, nullptr, muxer.c_str(), nullptr);
    if (ret < 0 || !ctx)
        return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                 "Muxer not available: " + muxer);
    *format_.address() = ctx;

    cursor_.fd = fd;
    cursor_.position = 0;
    cursor_.size = 0;

    AVIOContext *io = allocIoContext(&cursor_, true);
    if (!io)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate output I/O context");
    io_.set(io);

    ctx->pb = io;
    ctx->flags |= AVFMT_FLAG_CUSTOM_IO | AVFMT_FLAG_BITEXACT;
    return StageResult::ok();
}

bool MediaOutput::canCarry(AVCodecID codec_id) const
{
    const AVFormatContext *ctx = format_.get();
    if (!ctx)
        return false;
    return avformat_query_codec(ctx->oformat, codec_id, FF_COMPLIANCE_NORMAL) == 1;
}

StageResult MediaOutput::addStream(const AVCodecParameters *params, AVRational time_base, AVStream **stream)
{
    AVStream *out = avformat_new_stream(format_.get(), nullptr);
    if (!out)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate output stream");

    int ret = avcodec_parameters_copy(out->codecpar, params);
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                 "Cannot copy stream parameters: " + avErrorString(ret));

    // The muxer picks its own tag for the codec
    out->codecpar->codec_tag = 0;
    out->time_base = time_base;
    out->disposition = 0;
    *stream = out;
    return StageResult::ok();
}

StageResult MediaOutput::addEncodedStream(const AVCodecContext *encoder, AVStream **stream)
{
    AVStream *out = avformat_new_stream(format_.get(), nullptr);
    if (!out)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate output stream");

    int ret = avcodec_parameters_from_context(out->codecpar, encoder);
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                 "Cannot export encoder parameters: " + avErrorString(ret));
    out->time_base = encoder->time_base;
    *stream = out;
    return StageResult::ok();
}

StageResult MediaOutput::writeHeader()
{
    AVFormatContext *ctx = format_.get();
    if (!ctx)
        return StageResult::fail(FailureKind::INTERNAL_INVARIANT_VIOLATION, "Output not opened");

    av_dict_free(&ctx->metadata);
    for (unsigned int i = 0; i < ctx->nb_streams; ++i)
        av_dict_free(&ctx->streams[i]->metadata);

    AVDictionary *options = nullptr;
    av_dict_set(&options, "fflags", "+bitexact", 0);
    int ret = avformat_write_header(ctx, &options);
    av_dict_free(&options);
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                 "Cannot write container header: " + avErrorString(ret));
    header_written_ = true;
    return StageResult::ok();
}

StageResult MediaOutput::writePacket(AVPacket *packet)
{
    int ret = av_interleaved_write_frame(format_.get(), packet);
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                 "Cannot write packet: " + avErrorString(ret));
    return StageResult::ok();
}

StageResult MediaOutput::finish()
{
    if (!header_written_)
        return StageResult::fail(FailureKind::INTERNAL_INVARIANT_VIOLATION, "Trailer requested before header");

    int ret = av_write_trailer(format_.get());
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                 "Cannot write container trailer: " + avErrorString(ret));

    avio_flush(io_.get());
    if (io_.get()->error < 0)
        return StageResult::fail(failureFromAvError(io_.get()->error, FailureKind::ENCODE_ERROR),
                                 "Output write failed: " + avErrorString(io_.get()->error));

    if (::ftruncate(cursor_.fd, static_cast<off_t>(cursor_.size)) != 0)
        return StageResult::fail(FailureKind::ENCODE_ERROR, std::string("truncate failed: ") + std::strerror(errno));
    return StageResult::ok();
}

StageResult openDecoder(AVStream *stream, int max_threads, int64_t max_pixels, AVCodecContextRAII &decoder)
{
    const AVCodec *codec = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!codec)
        return StageResult::fail(FailureKind::DECODE_ERROR,
                                 std::string("No decoder for codec ") + avcodec_get_name(stream->codecpar->codec_id));

    AVCodecContext *ctx = avcodec_alloc_context3(codec);
    if (!ctx)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate decoder context");
    decoder.set(ctx);

    int ret = avcodec_parameters_to_context(ctx, stream->codecpar);
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::DECODE_ERROR),
                                 "Cannot copy codec parameters: " + avErrorString(ret));

    ctx->pkt_timebase = stream->time_base;
    ctx->thread_count = std::max(1, max_threads);

    AVDictionary *options = nullptr;
    av_dict_set_int(&options, "max_pixels", max_pixels, 0);
    ret = avcodec_open2(ctx, codec, &options);
    av_dict_free(&options);
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::DECODE_ERROR),
                                 std::string("Cannot open decoder ") + codec->name + ": " + avErrorString(ret));
    return StageResult::ok();
}
