#pragma once
#include <unistd.h>
#include <libraw/libraw.h>

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavcodec/bsf.h>
#include <libavformat/avformat.h>
#include <libavutil/audio_fifo.h>
#include <libavutil/mem.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

// RAII wrapper for a demuxing AVFormatContext
class AVFormatContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    AVFormatContextRAII() : ctx_(nullptr) {}
    ~AVFormatContextRAII()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Disable copy
    AVFormatContextRAII(const AVFormatContextRAII &) = delete;
    AVFormatContextRAII &operator=(const AVFormatContextRAII &) = delete;

    // Allow move
    AVFormatContextRAII(AVFormatContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for a muxing AVFormatContext; the pb is owned separately
class OutputFormatContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    OutputFormatContextRAII() : ctx_(nullptr) {}
    ~OutputFormatContextRAII()
    {
        if (ctx_)
        {
            ctx_->pb = nullptr;
            avformat_free_context(ctx_);
        }
    }

    AVFormatContext *get() { return ctx_; }
    const AVFormatContext *get() const { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Disable copy
    OutputFormatContextRAII(const OutputFormatContextRAII &) = delete;
    OutputFormatContextRAII &operator=(const OutputFormatContextRAII &) = delete;

    // Allow move
    OutputFormatContextRAII(OutputFormatContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for a custom AVIOContext together with its I/O buffer
class AVIOContextRAII
{
private:
    AVIOContext *ctx_;

public:
    AVIOContextRAII() : ctx_(nullptr) {}
    ~AVIOContextRAII() { reset(); }

    AVIOContext *get() { return ctx_; }

    void set(AVIOContext *new_ctx)
    {
        reset();
        ctx_ = new_ctx;
    }

    void reset()
    {
        if (ctx_)
        {
            // The buffer may have been reallocated by FFmpeg, free the current one
            av_freep(&ctx_->buffer);
            avio_context_free(&ctx_);
        }
    }

    // Disable copy
    AVIOContextRAII(const AVIOContextRAII &) = delete;
    AVIOContextRAII &operator=(const AVIOContextRAII &) = delete;

    // Allow move
    AVIOContextRAII(AVIOContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for FFmpeg AVCodecContext
class AVCodecContextRAII
{
private:
    AVCodecContext *ctx_;

public:
    AVCodecContextRAII() : ctx_(nullptr) {}

    // Constructor that takes an existing context
    AVCodecContextRAII(AVCodecContext *existing_ctx) : ctx_(existing_ctx) {}

    ~AVCodecContextRAII()
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
    }

    AVCodecContext *get() { return ctx_; }
    AVCodecContext **address() { return &ctx_; }

    // Method to set context from allocation
    void set(AVCodecContext *new_ctx)
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
        ctx_ = new_ctx;
    }

    // Disable copy
    AVCodecContextRAII(const AVCodecContextRAII &) = delete;
    AVCodecContextRAII &operator=(const AVCodecContextRAII &) = delete;

    // Allow move
    AVCodecContextRAII(AVCodecContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for FFmpeg AVFrame
class AVFrameRAII
{
private:
    AVFrame *frame_;

public:
    AVFrameRAII() : frame_(av_frame_alloc()) {}

    ~AVFrameRAII()
    {
        if (frame_)
            av_frame_free(&frame_);
    }

    AVFrame *get() { return frame_; }
    AVFrame *operator->() { return frame_; }

    // Disable copy
    AVFrameRAII(const AVFrameRAII &) = delete;
    AVFrameRAII &operator=(const AVFrameRAII &) = delete;

    // Allow move
    AVFrameRAII(AVFrameRAII &&other) noexcept : frame_(other.frame_)
    {
        other.frame_ = nullptr;
    }
};

// RAII wrapper for FFmpeg AVPacket
class AVPacketRAII
{
private:
    AVPacket *packet_;

public:
    AVPacketRAII() : packet_(av_packet_alloc()) {}

    ~AVPacketRAII()
    {
        if (packet_)
            av_packet_free(&packet_);
    }

    AVPacket *get() { return packet_; }
    AVPacket *operator->() { return packet_; }

    // Disable copy
    AVPacketRAII(const AVPacketRAII &) = delete;
    AVPacketRAII &operator=(const AVPacketRAII &) = delete;

    // Allow move
    AVPacketRAII(AVPacketRAII &&other) noexcept : packet_(other.packet_)
    {
        other.packet_ = nullptr;
    }
};

// RAII wrapper for FFmpeg SwsContext
class SwsContextRAII
{
private:
    SwsContext *ctx_;

public:
    SwsContextRAII() : ctx_(nullptr) {}
    ~SwsContextRAII()
    {
        if (ctx_)
            sws_freeContext(ctx_);
    }

    SwsContext *get() { return ctx_; }
    void set(SwsContext *c)
    {
        if (ctx_ && ctx_ != c)
            sws_freeContext(ctx_);
        ctx_ = c;
    }

    // Disable copy
    SwsContextRAII(const SwsContextRAII &) = delete;
    SwsContextRAII &operator=(const SwsContextRAII &) = delete;

    // Allow move
    SwsContextRAII(SwsContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for FFmpeg SwrContext
class SwrContextRAII
{
private:
    SwrContext *ctx_;

public:
    SwrContextRAII() : ctx_(nullptr) {}
    ~SwrContextRAII()
    {
        if (ctx_)
            swr_free(&ctx_);
    }

    SwrContext *get() { return ctx_; }
    SwrContext **address() { return &ctx_; }

    void reset()
    {
        if (ctx_)
            swr_free(&ctx_);
    }

    // Disable copy
    SwrContextRAII(const SwrContextRAII &) = delete;
    SwrContextRAII &operator=(const SwrContextRAII &) = delete;
};

// RAII wrapper for an FFmpeg bitstream filter context
class AVBSFContextRAII
{
private:
    AVBSFContext *ctx_;

public:
    AVBSFContextRAII() : ctx_(nullptr) {}
    ~AVBSFContextRAII()
    {
        if (ctx_)
            av_bsf_free(&ctx_);
    }

    AVBSFContext *get() { return ctx_; }
    AVBSFContext **address() { return &ctx_; }

    // Disable copy
    AVBSFContextRAII(const AVBSFContextRAII &) = delete;
    AVBSFContextRAII &operator=(const AVBSFContextRAII &) = delete;
};

// RAII wrapper for FFmpeg AVAudioFifo
class AVAudioFifoRAII
{
private:
    AVAudioFifo *fifo_;

public:
    AVAudioFifoRAII() : fifo_(nullptr) {}
    ~AVAudioFifoRAII()
    {
        if (fifo_)
            av_audio_fifo_free(fifo_);
    }

    AVAudioFifo *get() { return fifo_; }
    void set(AVAudioFifo *f)
    {
        if (fifo_)
            av_audio_fifo_free(fifo_);
        fifo_ = f;
    }

    // Disable copy
    AVAudioFifoRAII(const AVAudioFifoRAII &) = delete;
    AVAudioFifoRAII &operator=(const AVAudioFifoRAII &) = delete;
};

// RAII wrapper for a decoded AVSubtitle
class AVSubtitleRAII
{
private:
    AVSubtitle sub_;
    bool valid_;

public:
    AVSubtitleRAII() : sub_{}, valid_(false) {}
    ~AVSubtitleRAII() { reset(); }

    AVSubtitle *get() { return &sub_; }
    void markValid() { valid_ = true; }

    void reset()
    {
        if (valid_)
            avsubtitle_free(&sub_);
        sub_ = AVSubtitle{};
        valid_ = false;
    }

    // Disable copy
    AVSubtitleRAII(const AVSubtitleRAII &) = delete;
    AVSubtitleRAII &operator=(const AVSubtitleRAII &) = delete;
};

// RAII wrapper for a POSIX file descriptor
class FileDescriptorRAII
{
private:
    int fd_;

public:
    FileDescriptorRAII() : fd_(-1) {}
    explicit FileDescriptorRAII(int fd) : fd_(fd) {}
    ~FileDescriptorRAII() { reset(); }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    // Give up ownership without closing
    int release()
    {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1)
    {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = fd;
    }

    // Disable copy
    FileDescriptorRAII(const FileDescriptorRAII &) = delete;
    FileDescriptorRAII &operator=(const FileDescriptorRAII &) = delete;

    // Allow move
    FileDescriptorRAII(FileDescriptorRAII &&other) noexcept : fd_(other.fd_)
    {
        other.fd_ = -1;
    }

    FileDescriptorRAII &operator=(FileDescriptorRAII &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }
};

// RAII wrapper for LibRaw
class LibRawRAII
{
private:
    LibRaw *raw_;
    libraw_processed_image_t *img_;

public:
    LibRawRAII() : raw_(nullptr), img_(nullptr) {}

    ~LibRawRAII() { cleanup(); }

    // Disable copy constructor and assignment
    LibRawRAII(const LibRawRAII &) = delete;
    LibRawRAII &operator=(const LibRawRAII &) = delete;

    // Allow move constructor
    LibRawRAII(LibRawRAII &&other) noexcept : raw_(other.raw_), img_(other.img_)
    {
        other.raw_ = nullptr;
        other.img_ = nullptr;
    }

    void cleanup()
    {
        if (img_)
        {
            LibRaw::dcraw_clear_mem(img_);
            img_ = nullptr;
        }

        if (raw_)
        {
            raw_->recycle();
            delete raw_;
            raw_ = nullptr;
        }
    }

    LibRaw *getRaw() { return raw_; }
    libraw_processed_image_t *getImg() { return img_; }
    void setRaw(LibRaw *r) { raw_ = r; }
    void setImg(libraw_processed_image_t *i) { img_ = i; }
};
