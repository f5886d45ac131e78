#include "core/reconstruction/audio_transcoder.hpp"
#include "logging/logger.hpp"
#include <algorithm>

extern "C"
{
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
}

AudioTranscoder::~AudioTranscoder()
{
    av_channel_layout_uninit(&resampler_layout_);
}

StageResult AudioTranscoder::open(AVStream *input_stream, const StreamPolicy &policy,
                                  const ReconstructionSettings &settings, MediaOutput &output)
{
    input_stream_ = input_stream;
    output_ = &output;

    StageResult opened = openDecoder(input_stream, settings.max_decoder_threads,
                                     static_cast<int64_t>(settings.max_video_pixels), decoder_);
    if (!opened.success)
        return opened;

    AVCodecContext *dec = decoder_.get();
    int channels = dec->ch_layout.nb_channels;
    if (channels <= 0)
        return StageResult::fail(FailureKind::DECODE_ERROR, "Audio stream declares no channels");

    const AVCodec *codec = avcodec_find_encoder_by_name(policy.encoder.c_str());
    if (!codec)
        return StageResult::fail(FailureKind::ENCODE_ERROR, "Encoder not available: " + policy.encoder);

    AVCodecContext *enc = avcodec_alloc_context3(codec);
    if (!enc)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate audio encoder");
    encoder_.set(enc);

    av_channel_layout_default(&enc->ch_layout, std::min(channels, MAX_OUTPUT_CHANNELS));
    enc->sample_rate = settings.audio_sample_rate;
    enc->sample_fmt = AV_SAMPLE_FMT_FLTP;
    enc->bit_rate = static_cast<int64_t>(policy.bitrate_kbps) * 1000;
    enc->time_base = AVRational{1, enc->sample_rate};
    enc->flags |= AV_CODEC_FLAG_BITEXACT;
    if (output.get()->oformat->flags & AVFMT_GLOBALHEADER)
        enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    int ret = avcodec_open2(enc, codec, nullptr);
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                 "Cannot open audio encoder " + policy.encoder + ": " + avErrorString(ret));

    int fifo_size = enc->frame_size > 0 ? enc->frame_size : 1024;
    fifo_.set(av_audio_fifo_alloc(enc->sample_fmt, enc->ch_layout.nb_channels, fifo_size));
    if (!fifo_.get())
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate audio FIFO");

    if (!decoded_.get())
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate audio frame");

    StageResult added = output.addEncodedStream(enc, &output_stream_);
    if (!added.success)
        return added;

    Logger::debug("Audio transcoder: " + std::string(avcodec_get_name(dec->codec_id)) + " " +
                  std::to_string(dec->sample_rate) + " Hz x" + std::to_string(channels) + " -> " +
                  policy.encoder + " " + std::to_string(enc->sample_rate) + " Hz x" +
                  std::to_string(enc->ch_layout.nb_channels));
    return StageResult::ok();
}

StageResult AudioTranscoder::sendPacket(AVPacket *packet)
{
    int ret = avcodec_send_packet(decoder_.get(), packet);
    if (ret < 0 && ret != AVERROR_EOF)
    {
        if (failureFromAvError(ret, FailureKind::DECODE_ERROR) == FailureKind::RESOURCE_EXCEEDED)
            return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Audio decoder: " + avErrorString(ret));
        skipped_packets_++;
        Logger::trace("Skipping undecodable audio packet: " + avErrorString(ret));
        return StageResult::ok();
    }
    return receiveDecodedFrames();
}

StageResult AudioTranscoder::receiveDecodedFrames()
{
    while (true)
    {
        int ret = avcodec_receive_frame(decoder_.get(), decoded_.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            return StageResult::ok();
        if (ret < 0)
        {
            if (failureFromAvError(ret, FailureKind::DECODE_ERROR) == FailureKind::RESOURCE_EXCEEDED)
                return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Audio decoder: " + avErrorString(ret));
            skipped_packets_++;
            return StageResult::ok();
        }

        StageResult result = sendFrame(decoded_.get());
        av_frame_unref(decoded_.get());
        if (!result.success)
            return result;
    }
}

StageResult AudioTranscoder::sendFrame(const AVFrame *frame)
{
    if (!frame || !encoder_.get())
        return StageResult::fail(FailureKind::INTERNAL_INVARIANT_VIOLATION, "Audio transcoder not opened");

    decoded_frames_++;
    StageResult result = resampleIntoFifo(frame);
    if (!result.success)
        return result;
    return encodeFromFifo(false);
}

StageResult AudioTranscoder::resampleIntoFifo(const AVFrame *frame)
{
    if (!frame)
        return resampler_.get() ? convertIntoFifo(nullptr, 0) : StageResult::ok();

    StageResult result = configureResampler(frame);
    if (!result.success)
        return result;
    return convertIntoFifo(const_cast<const uint8_t **>(frame->extended_data), frame->nb_samples);
}

StageResult AudioTranscoder::configureResampler(const AVFrame *frame)
{
    AVCodecContext *enc = encoder_.get();

    AVChannelLayout in_layout = {};
    if (frame->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC || frame->ch_layout.nb_channels <= 0)
        av_channel_layout_default(&in_layout, std::max(1, decoder_.get()->ch_layout.nb_channels));
    else if (av_channel_layout_copy(&in_layout, &frame->ch_layout) < 0)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot copy channel layout");

    if (resampler_.get())
    {
        if (frame->format == resampler_format_ && frame->sample_rate == resampler_rate_ &&
            av_channel_layout_compare(&in_layout, &resampler_layout_) == 0)
        {
            av_channel_layout_uninit(&in_layout);
            return StageResult::ok();
        }

        Logger::debug("Audio input changed mid-stream to " + std::to_string(frame->sample_rate) + " Hz x" +
                      std::to_string(in_layout.nb_channels) + ", rebuilding resampler");
        // Samples still buffered for the previous input go out first
        StageResult drained = convertIntoFifo(nullptr, 0);
        if (!drained.success)
        {
            av_channel_layout_uninit(&in_layout);
            return drained;
        }
        resampler_.reset();
    }

    int ret = swr_alloc_set_opts2(resampler_.address(), &enc->ch_layout, enc->sample_fmt, enc->sample_rate,
                                  &in_layout, static_cast<AVSampleFormat>(frame->format), frame->sample_rate,
                                  0, nullptr);
    if (ret >= 0)
        ret = swr_init(resampler_.get());
    if (ret < 0)
    {
        av_channel_layout_uninit(&in_layout);
        resampler_.reset();
        return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                 "Cannot configure resampler: " + avErrorString(ret));
    }

    av_channel_layout_uninit(&resampler_layout_);
    resampler_layout_ = in_layout;
    resampler_format_ = frame->format;
    resampler_rate_ = frame->sample_rate;
    resampler_configurations_++;
    return StageResult::ok();
}

StageResult AudioTranscoder::convertIntoFifo(const uint8_t **samples, int in_samples)
{
    AVCodecContext *enc = encoder_.get();

    int out_samples = swr_get_out_samples(resampler_.get(), in_samples);
    if (out_samples < 0)
        return StageResult::fail(FailureKind::ENCODE_ERROR, "Resampler rejected input: " + avErrorString(out_samples));
    if (out_samples == 0)
        return StageResult::ok();

    AVFrameRAII converted;
    if (!converted.get())
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate resampled frame");
    converted->format = enc->sample_fmt;
    converted->sample_rate = enc->sample_rate;
    converted->nb_samples = out_samples;
    if (av_channel_layout_copy(&converted->ch_layout, &enc->ch_layout) < 0 ||
        av_frame_get_buffer(converted.get(), 0) < 0)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate resampled samples");

    int converted_samples = swr_convert(resampler_.get(), converted->data, out_samples, samples, in_samples);
    if (converted_samples < 0)
        return StageResult::fail(failureFromAvError(converted_samples, FailureKind::DECODE_ERROR),
                                 "Resampling failed: " + avErrorString(converted_samples));

    if (converted_samples > 0 &&
        av_audio_fifo_write(fifo_.get(), reinterpret_cast<void **>(converted->data), converted_samples) < converted_samples)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot grow audio FIFO");
    return StageResult::ok();
}

StageResult AudioTranscoder::encodeFromFifo(bool flush)
{
    AVCodecContext *enc = encoder_.get();
    int frame_size = enc->frame_size > 0 ? enc->frame_size : 1024;

    while (av_audio_fifo_size(fifo_.get()) >= frame_size || (flush && av_audio_fifo_size(fifo_.get()) > 0))
    {
        int samples = std::min(av_audio_fifo_size(fifo_.get()), frame_size);

        AVFrameRAII frame;
        if (!frame.get())
            return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate encoder frame");
        frame->nb_samples = samples;
        frame->format = enc->sample_fmt;
        frame->sample_rate = enc->sample_rate;
        if (av_channel_layout_copy(&frame->ch_layout, &enc->ch_layout) < 0 ||
            av_frame_get_buffer(frame.get(), 0) < 0)
            return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate encoder samples");

        if (av_audio_fifo_read(fifo_.get(), reinterpret_cast<void **>(frame->data), samples) < samples)
            return StageResult::fail(FailureKind::INTERNAL_INVARIANT_VIOLATION, "Audio FIFO underrun");

        frame->pts = next_pts_;
        next_pts_ += samples;

        StageResult result = encodeFrame(frame.get());
        if (!result.success)
            return result;
    }
    return StageResult::ok();
}

StageResult AudioTranscoder::encodeFrame(AVFrame *frame)
{
    int ret = avcodec_send_frame(encoder_.get(), frame);
    if (ret < 0 && !(frame == nullptr && ret == AVERROR_EOF))
        return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                 "Audio encoder rejected frame: " + avErrorString(ret));

    AVPacketRAII packet;
    if (!packet.get())
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate packet");

    while (true)
    {
        ret = avcodec_receive_packet(encoder_.get(), packet.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            return StageResult::ok();
        if (ret < 0)
            return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                     "Audio encoding failed: " + avErrorString(ret));

        av_packet_rescale_ts(packet.get(), encoder_.get()->time_base, output_stream_->time_base);
        packet->stream_index = output_stream_->index;
        StageResult written = output_->writePacket(packet.get());
        if (!written.success)
            return written;
    }
}

StageResult AudioTranscoder::finish()
{
    if (!decoder_.get() || !encoder_.get())
        return StageResult::fail(FailureKind::INTERNAL_INVARIANT_VIOLATION, "Audio transcoder not opened");

    StageResult result = sendPacket(nullptr);
    if (!result.success)
        return result;

    result = resampleIntoFifo(nullptr);
    if (!result.success)
        return result;

    result = encodeFromFifo(true);
    if (!result.success)
        return result;

    return encodeFrame(nullptr);
}
