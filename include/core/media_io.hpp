#pragma once

#include "core/external_library_wrappers.hpp"
#include "core/sanitization_types.hpp"
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief Position-tracking view of a file descriptor used by the custom AVIO callbacks
 */
struct FdCursor
{
    int fd = -1;
    int64_t position = 0;
    int64_t size = 0; // High-water mark for output cursors
};

/**
 * @brief Whole-buffer helpers over raw descriptors (EINTR-safe, positional)
 */
class FdIo
{
public:
    /**
     * @brief Read the whole file behind fd
     * @return RESOURCE_EXCEEDED when it is larger than max_bytes
     */
    static StageResult readAll(int fd, std::vector<uint8_t> &data, uint64_t max_bytes);

    /**
     * @brief Replace the contents of fd with data (pwrite from 0, then truncate)
     */
    static StageResult writeAll(int fd, const uint8_t *data, size_t size);

    // Sequential write of a whole buffer (pipes)
    static bool writeFully(int fd, const std::string &data);

    // Sequential read until EOF or max_bytes (pipes)
    static bool readFully(int fd, std::string &data, size_t max_bytes);
};

/**
 * @brief Render an FFmpeg error code
 */
std::string avErrorString(int errnum);

/**
 * @brief Map an FFmpeg error code to a failure kind
 * @param fallback Kind reported for errors without a more specific mapping
 */
FailureKind failureFromAvError(int errnum, FailureKind fallback);

/**
 * @brief Bounds applied to every demuxer
 */
struct DemuxLimits
{
    int64_t probesize = 5 * 1024 * 1024;
    int64_t analyzeduration_us = 5 * 1000000LL;
    int max_streams = 32;
};

/**
 * @brief Demuxer reading from a descriptor through a read-only custom AVIOContext
 *
 * The demuxer is forced by name and never probed, and no URL is ever opened.
 */
class MediaInput
{
public:
    MediaInput() = default;
    MediaInput(const MediaInput &) = delete;
    MediaInput &operator=(const MediaInput &) = delete;

    StageResult open(int fd, const std::string &demuxer, const DemuxLimits &limits = DemuxLimits());

    AVFormatContext *get() { return format_.get(); }

    /**
     * @brief Index of the best stream of a type, or -1; every other stream is
     *        marked AVDISCARD_ALL by discardUnused()
     */
    int findStream(AVMediaType type);
    void discardUnused(const std::vector<int> &keep);

private:
    FdCursor cursor_;
    AVIOContextRAII io_;
    AVFormatContextRAII format_;
};

/**
 * @brief Muxer writing to a descriptor through a seekable custom AVIOContext
 */
class MediaOutput
{
public:
    MediaOutput() = default;
    MediaOutput(const MediaOutput &) = delete;
    MediaOutput &operator=(const MediaOutput &) = delete;

    StageResult open(int fd, const std::string &muxer);

    AVFormatContext *get() { return format_.get(); }

    /**
     * @brief Whether the muxer can carry the codec without re-encoding
     */
    bool canCarry(AVCodecID codec_id) const;

    // New output stream with codec parameters but no metadata or dispositions
    StageResult addStream(const AVCodecParameters *params, AVRational time_base, AVStream **stream);
    StageResult addEncodedStream(const AVCodecContext *encoder, AVStream **stream);

    // Header with bitexact flags and no container metadata
    StageResult writeHeader();
    StageResult writePacket(AVPacket *packet);
    StageResult finish();

private:
    FdCursor cursor_;
    AVIOContextRAII io_;
    OutputFormatContextRAII format_;
    bool header_written_ = false;
};

/**
 * @brief Open a decoder for a stream with thread and pixel bounds
 */
StageResult openDecoder(AVStream *stream, int max_threads, int64_t max_pixels, AVCodecContextRAII &decoder);
