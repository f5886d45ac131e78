#include "core/reconstruction/video_reconstructor.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <opencv2/core.hpp>

extern "C"
{
#include <libavutil/opt.h>
#include <libavutil/pixdesc.h>
}

namespace
{
    const AVRational MILLISECONDS = {1, 1000};
    const AVRational ENCODER_TIME_BASE = {1, 90000};

    // Plain text to an ASS dialogue text field
    std::string toAssText(const std::string &text)
    {
        std::string out;
        out.reserve(text.size() + 8);
        for (char c : text)
        {
            switch (c)
            {
            case '\n':
                out += "\\N";
                break;
            case '\\':
                out.push_back('/');
                break;
            case '{':
                out.push_back('(');
                break;
            case '}':
                out.push_back(')');
                break;
            default:
                out.push_back(c);
            }
        }
        return out;
    }
}

const char *VideoReconstructor::MOV_TEXT_HEADER =
    "[Script Info]\r\n"
    "ScriptType: v4.00+\r\n"
    "PlayResX: 384\r\n"
    "PlayResY: 288\r\n"
    "\r\n"
    "[V4+ Styles]\r\n"
    "Format: Name, Fontname, Fontsize, PrimaryColour, SecondaryColour, OutlineColour, BackColour, "
    "Bold, Italic, Underline, StrikeOut, ScaleX, ScaleY, Spacing, Angle, BorderStyle, Outline, Shadow, "
    "Alignment, MarginL, MarginR, MarginV, Encoding\r\n"
    "Style: Default,Sans,16,&Hffffff,&Hffffff,&H0,&H0,0,0,0,0,100,100,0,0,1,1,0,2,10,10,10,0\r\n"
    "\r\n"
    "[Events]\r\n"
    "Format: Layer, Start, End, Style, Name, MarginL, MarginR, MarginV, Effect, Text\r\n";

bool VideoReconstructor::isCopyableVideoCodec(AVCodecID codec_id)
{
    return codec_id == AV_CODEC_ID_H264 || codec_id == AV_CODEC_ID_HEVC || codec_id == AV_CODEC_ID_AV1;
}

bool VideoReconstructor::isCopyableAudioCodec(AVCodecID codec_id)
{
    return codec_id == AV_CODEC_ID_AAC || codec_id == AV_CODEC_ID_MP3 || codec_id == AV_CODEC_ID_ALAC;
}

std::string VideoReconstructor::metadataUnitTypes(AVCodecID codec_id)
{
    switch (codec_id)
    {
    case AV_CODEC_ID_H264:
        return "6"; // SEI
    case AV_CODEC_ID_HEVC:
        return "39|40"; // Prefix and suffix SEI
    case AV_CODEC_ID_AV1:
        return "5"; // OBU_METADATA
    default:
        return "";
    }
}

StageResult VideoReconstructor::reconstruct(ReconstructionContext &context)
{
    const ReconstructionPlan &plan = context.plan;

    StageResult result = input_.open(context.input_fd, context.record.backend);
    if (!result.success)
        return result;

    int video_index = input_.findStream(AVMEDIA_TYPE_VIDEO);
    if (video_index < 0)
        return StageResult::fail(FailureKind::DECODE_ERROR, "No video stream in " + context.record.container + " input");
    int audio_index = plan.audio.mode != StreamMode::DROP ? input_.findStream(AVMEDIA_TYPE_AUDIO) : -1;
    int subtitle_index = plan.subtitles != SubtitlePolicy::DROP ? input_.findStream(AVMEDIA_TYPE_SUBTITLE) : -1;

    AVFormatContext *fmt = input_.get();
    video_in_ = fmt->streams[video_index];
    audio_in_ = audio_index >= 0 ? fmt->streams[audio_index] : nullptr;

    const AVCodecParameters *video_params = video_in_->codecpar;
    if (video_params->width <= 0 || video_params->height <= 0)
        return StageResult::fail(FailureKind::DECODE_ERROR, "Video stream declares no dimensions");
    uint64_t pixels = static_cast<uint64_t>(video_params->width) * static_cast<uint64_t>(video_params->height);
    if (pixels > plan.settings.max_video_pixels)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED,
                                 "Video dimensions " + std::to_string(video_params->width) + "x" +
                                     std::to_string(video_params->height) + " exceed the pixel limit");

    if (subtitle_index >= 0)
    {
        result = prepareSubtitles(context, subtitle_index);
        if (!result.success)
            return result;
    }

    result = output_.open(context.output_fd, plan.container);
    if (!result.success)
        return result;

    copy_video_ = plan.video.mode == StreamMode::COPY_OR_ENCODE && !overlay_ &&
                  isCopyableVideoCodec(video_params->codec_id) && output_.canCarry(video_params->codec_id);
    result = copy_video_ ? openVideoCopy(plan) : openVideoEncoder(plan);
    if (!result.success)
        return result;

    if (audio_in_)
    {
        result = openAudio(plan);
        if (!result.success)
            return result;
    }

    if (plan.subtitles == SubtitlePolicy::REENCODE_TEXT && subtitle_track_.isUsable())
    {
        const auto &events = subtitle_track_.getEvents();
        bool has_text = std::any_of(events.begin(), events.end(),
                                    [](const SubtitleEvent &event)
                                    { return !event.isBitmap() && !event.text.empty(); });
        if (has_text)
        {
            result = openSubtitleEncoder();
            if (!result.success)
                return result;
        }
        else if (!events.empty())
        {
            context.warnings.push_back("Bitmap subtitles cannot be re-encoded as text and were dropped");
        }
    }

    std::vector<int> keep = {video_index};
    if (audio_in_)
        keep.push_back(audio_index);
    input_.discardUnused(keep);

    result = output_.writeHeader();
    if (!result.success)
        return result;

    if (!decoded_frame_.get())
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate frame");

    AVPacketRAII packet;
    if (!packet.get())
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate packet");

    int ret;
    while ((ret = av_read_frame(fmt, packet.get())) >= 0)
    {
        if (packet->stream_index == video_index)
            result = copy_video_ ? copyVideoPacket(packet.get()) : decodeVideoPacket(packet.get());
        else if (audio_in_ && packet->stream_index == audio_index)
            result = copy_audio_ ? copyAudioPacket(packet.get()) : audio_transcoder_->sendPacket(packet.get());
        else
            result = StageResult::ok();
        av_packet_unref(packet.get());
        if (!result.success)
            return result;
    }
    if (ret != AVERROR_EOF)
    {
        if (failureFromAvError(ret, FailureKind::DECODE_ERROR) == FailureKind::RESOURCE_EXCEEDED)
            return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Demuxer: " + avErrorString(ret));
        Logger::debug("Demuxing stopped early: " + avErrorString(ret));
        context.warnings.push_back("Input ended early: " + avErrorString(ret));
    }

    result = flush();
    if (!result.success)
        return result;

    if (video_frames_ == 0)
        return StageResult::fail(FailureKind::DECODE_ERROR, "No decodable video frames");

    if (skipped_packets_ > 0)
        context.warnings.push_back("Skipped " + std::to_string(skipped_packets_) + " undecodable video packets");
    if (audio_transcoder_ && audio_transcoder_->getSkippedPackets() > 0)
        context.warnings.push_back("Skipped " + std::to_string(audio_transcoder_->getSkippedPackets()) +
                                   " undecodable audio packets");
    if (audio_transcoder_ && audio_transcoder_->getDecodedFrames() == 0)
        context.warnings.push_back("Audio stream produced no samples");

    Logger::debug("Video " + std::string(copy_video_ ? "copied" : "encoded") + ": " + std::to_string(video_frames_) +
                  (copy_video_ ? " packets" : " frames") + ", dropped " + std::to_string(dropped_frames_) +
                  " above the frame rate cap");
    return output_.finish();
}

StageResult VideoReconstructor::prepareSubtitles(ReconstructionContext &context, int subtitle_index)
{
    const ReconstructionPlan &plan = context.plan;
    bool burn_in = plan.subtitles == SubtitlePolicy::BURN_IN;

    StageResult result = subtitle_track_.collect(context.input_fd, context.record.backend, subtitle_index,
                                                 plan.settings.max_subtitle_events, burn_in,
                                                 plan.settings.max_decoder_threads);
    if (!result.success)
    {
        if (result.failure_kind == FailureKind::RESOURCE_EXCEEDED)
            return result;
        context.warnings.push_back("Subtitle stream ignored: " + result.error_message);
        return StageResult::ok();
    }

    if (!subtitle_track_.isUsable())
    {
        context.warnings.push_back("Subtitle stream could not be decoded and was dropped");
        return StageResult::ok();
    }
    if (subtitle_track_.getSkippedPackets() > 0)
        context.warnings.push_back("Skipped " + std::to_string(subtitle_track_.getSkippedPackets()) +
                                   " malformed subtitle packets");
    if (subtitle_track_.isTruncated())
        context.warnings.push_back("Subtitle events truncated at " +
                                   std::to_string(subtitle_track_.getEvents().size()));

    if (burn_in && !subtitle_track_.getEvents().empty())
    {
        int canvas_width = subtitle_track_.getCanvasWidth() > 0 ? subtitle_track_.getCanvasWidth()
                                                                : video_in_->codecpar->width;
        int canvas_height = subtitle_track_.getCanvasHeight() > 0 ? subtitle_track_.getCanvasHeight()
                                                                  : video_in_->codecpar->height;
        overlay_ = std::make_unique<SubtitleOverlay>(subtitle_track_.getEvents(), canvas_width, canvas_height);
    }
    return StageResult::ok();
}

StageResult VideoReconstructor::openMetadataFilter(const AVCodecParameters *params, AVRational time_base, bool strip)
{
    std::string types = strip ? metadataUnitTypes(params->codec_id) : "";
    const char *name = types.empty() ? "null" : "filter_units";
    const AVBitStreamFilter *filter = av_bsf_get_by_name(name);
    if (!filter)
        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED,
                                 std::string("Bitstream filter not available: ") + name);

    int ret = av_bsf_alloc(filter, video_filter_.address());
    if (ret < 0)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate bitstream filter");

    AVBSFContext *bsf = video_filter_.get();
    ret = avcodec_parameters_copy(bsf->par_in, params);
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::METADATA_STRIP_FAILED),
                                 "Cannot configure bitstream filter: " + avErrorString(ret));
    bsf->time_base_in = time_base;

    if (!types.empty())
    {
        ret = av_opt_set(bsf->priv_data, "remove_types", types.c_str(), 0);
        if (ret < 0)
            return StageResult::fail(FailureKind::METADATA_STRIP_FAILED,
                                     "Cannot set filter_units remove_types: " + avErrorString(ret));
    }

    ret = av_bsf_init(bsf);
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::METADATA_STRIP_FAILED),
                                 std::string("Cannot initialize ") + name + ": " + avErrorString(ret));
    return StageResult::ok();
}

StageResult VideoReconstructor::openVideoCopy(const ReconstructionPlan &plan)
{
    StageResult result = openMetadataFilter(video_in_->codecpar, video_in_->time_base, plan.strip_sei);
    if (!result.success)
        return result;

    AVBSFContext *bsf = video_filter_.get();
    Logger::debug("Copying " + std::string(avcodec_get_name(video_in_->codecpar->codec_id)) + " video stream");
    return output_.addStream(bsf->par_out, bsf->time_base_out, &video_out_);
}

StageResult VideoReconstructor::openVideoEncoder(const ReconstructionPlan &plan)
{
    const ReconstructionSettings &settings = plan.settings;

    StageResult result = openDecoder(video_in_, settings.max_decoder_threads,
                                     static_cast<int64_t>(settings.max_video_pixels), video_decoder_);
    if (!result.success)
        return result;

    const AVCodec *codec = avcodec_find_encoder_by_name(plan.video.encoder.c_str());
    if (!codec)
        return StageResult::fail(FailureKind::ENCODE_ERROR, "Encoder not available: " + plan.video.encoder);

    AVCodecContext *dec = video_decoder_.get();
    AVCodecContext *enc = avcodec_alloc_context3(codec);
    if (!enc)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate video encoder");
    video_encoder_.set(enc);

    // yuv420p needs even dimensions
    enc->width = std::max(2, dec->width & ~1);
    enc->height = std::max(2, dec->height & ~1);
    enc->pix_fmt = AV_PIX_FMT_YUV420P;
    if (dec->sample_aspect_ratio.num > 0 && dec->sample_aspect_ratio.den > 0)
        enc->sample_aspect_ratio = dec->sample_aspect_ratio;

    AVRational frame_rate = av_guess_frame_rate(input_.get(), video_in_, nullptr);
    if (frame_rate.num <= 0 || frame_rate.den <= 0)
        frame_rate = AVRational{25, 1};
    if (av_q2d(frame_rate) > settings.max_fps)
        frame_rate = AVRational{settings.max_fps, 1};
    enc->framerate = frame_rate;
    enc->time_base = ENCODER_TIME_BASE;
    enc->thread_count = std::max(1, settings.max_decoder_threads);
    enc->flags |= AV_CODEC_FLAG_BITEXACT;
    if (output_.get()->oformat->flags & AVFMT_GLOBALHEADER)
        enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    if (av_opt_set(enc->priv_data, "preset", settings.video_preset.c_str(), 0) < 0)
        Logger::warn("Encoder " + plan.video.encoder + " rejected preset " + settings.video_preset);
    if (av_opt_set(enc->priv_data, "crf", std::to_string(settings.video_crf).c_str(), 0) < 0)
        Logger::warn("Encoder " + plan.video.encoder + " rejected crf " + std::to_string(settings.video_crf));

    int ret = avcodec_open2(enc, codec, nullptr);
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                 "Cannot open video encoder " + plan.video.encoder + ": " + avErrorString(ret));

    min_frame_interval_ = ENCODER_TIME_BASE.den / std::max(1, settings.max_fps);

    AVFrame *frame = encoder_frame_.get();
    if (!frame)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate encoder frame");
    frame->format = enc->pix_fmt;
    frame->width = enc->width;
    frame->height = enc->height;
    ret = av_frame_get_buffer(frame, 0);
    if (ret < 0)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate encoder picture");

    AVCodecParameters *params = avcodec_parameters_alloc();
    if (!params)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate codec parameters");
    ret = avcodec_parameters_from_context(params, enc);
    if (ret >= 0)
        result = openMetadataFilter(params, enc->time_base, plan.strip_sei);
    avcodec_parameters_free(&params);
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                 "Cannot export encoder parameters: " + avErrorString(ret));
    if (!result.success)
        return result;

    Logger::debug("Encoding " + std::string(avcodec_get_name(dec->codec_id)) + " " + std::to_string(dec->width) +
                  "x" + std::to_string(dec->height) + " -> " + plan.video.encoder + " " +
                  std::to_string(enc->width) + "x" + std::to_string(enc->height) + " @ " +
                  std::to_string(av_q2d(frame_rate)) + " fps");
    return output_.addStream(video_filter_.get()->par_out, enc->time_base, &video_out_);
}

StageResult VideoReconstructor::openAudio(const ReconstructionPlan &plan)
{
    const AVCodecParameters *params = audio_in_->codecpar;
    copy_audio_ = plan.audio.mode == StreamMode::COPY_OR_ENCODE && isCopyableAudioCodec(params->codec_id) &&
                  output_.canCarry(params->codec_id);
    if (copy_audio_)
        return output_.addStream(params, audio_in_->time_base, &audio_out_);

    audio_transcoder_ = std::make_unique<AudioTranscoder>();
    return audio_transcoder_->open(audio_in_, plan.audio, plan.settings, output_);
}

StageResult VideoReconstructor::openSubtitleEncoder()
{
    const AVCodec *codec = avcodec_find_encoder(AV_CODEC_ID_MOV_TEXT);
    if (!codec)
        return StageResult::fail(FailureKind::ENCODE_ERROR, "Encoder not available: mov_text");

    AVCodecContext *enc = avcodec_alloc_context3(codec);
    if (!enc)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate subtitle encoder");
    subtitle_encoder_.set(enc);

    size_t header_size = std::strlen(MOV_TEXT_HEADER);
    enc->subtitle_header = static_cast<uint8_t *>(av_malloc(header_size + 1));
    if (!enc->subtitle_header)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate subtitle header");
    std::memcpy(enc->subtitle_header, MOV_TEXT_HEADER, header_size + 1);
    enc->subtitle_header_size = static_cast<int>(header_size);
    enc->time_base = MILLISECONDS;
    enc->width = video_in_->codecpar->width;
    enc->height = video_in_->codecpar->height;
    enc->flags |= AV_CODEC_FLAG_BITEXACT;

    int ret = avcodec_open2(enc, codec, nullptr);
    if (ret < 0)
        return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                 "Cannot open mov_text encoder: " + avErrorString(ret));
    return output_.addEncodedStream(enc, &subtitle_out_);
}

StageResult VideoReconstructor::copyVideoPacket(AVPacket *packet)
{
    packet->pos = -1;
    return drainVideoFilter(packet);
}

StageResult VideoReconstructor::copyAudioPacket(AVPacket *packet)
{
    av_packet_rescale_ts(packet, audio_in_->time_base, audio_out_->time_base);
    packet->stream_index = audio_out_->index;
    packet->pos = -1;
    return output_.writePacket(packet);
}

StageResult VideoReconstructor::drainVideoFilter(AVPacket *packet)
{
    AVBSFContext *bsf = video_filter_.get();
    int ret = av_bsf_send_packet(bsf, packet);
    if (ret < 0)
    {
        if (failureFromAvError(ret, FailureKind::DECODE_ERROR) == FailureKind::RESOURCE_EXCEEDED)
            return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Bitstream filter: " + avErrorString(ret));
        if (packet)
        {
            skipped_packets_++;
            av_packet_unref(packet);
        }
        return StageResult::ok();
    }

    AVPacketRAII filtered;
    if (!filtered.get())
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate packet");

    while (true)
    {
        ret = av_bsf_receive_packet(bsf, filtered.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            return StageResult::ok();
        if (ret < 0)
        {
            if (failureFromAvError(ret, FailureKind::DECODE_ERROR) == FailureKind::RESOURCE_EXCEEDED)
                return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Bitstream filter: " + avErrorString(ret));
            // A unit the filter cannot parse is dropped, never passed through
            skipped_packets_++;
            return StageResult::ok();
        }

        av_packet_rescale_ts(filtered.get(), bsf->time_base_out, video_out_->time_base);
        filtered->stream_index = video_out_->index;
        filtered->pos = -1;
        StageResult written = output_.writePacket(filtered.get());
        if (!written.success)
            return written;
        if (copy_video_)
            video_frames_++;
    }
}

StageResult VideoReconstructor::decodeVideoPacket(AVPacket *packet)
{
    AVCodecContext *dec = video_decoder_.get();
    int ret = avcodec_send_packet(dec, packet);
    if (ret < 0 && ret != AVERROR_EOF)
    {
        if (failureFromAvError(ret, FailureKind::DECODE_ERROR) == FailureKind::RESOURCE_EXCEEDED)
            return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Video decoder: " + avErrorString(ret));
        skipped_packets_++;
        Logger::trace("Skipping undecodable video packet: " + avErrorString(ret));
        return StageResult::ok();
    }

    while (true)
    {
        ret = avcodec_receive_frame(dec, decoded_frame_.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            return StageResult::ok();
        if (ret < 0)
        {
            if (failureFromAvError(ret, FailureKind::DECODE_ERROR) == FailureKind::RESOURCE_EXCEEDED)
                return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Video decoder: " + avErrorString(ret));
            skipped_packets_++;
            return StageResult::ok();
        }

        StageResult result = processFrame(decoded_frame_.get());
        av_frame_unref(decoded_frame_.get());
        if (!result.success)
            return result;
    }
}

StageResult VideoReconstructor::ensureScalers(const AVFrame *frame)
{
    if (frame->width == scaler_src_width_ && frame->height == scaler_src_height_ && frame->format == scaler_src_format_)
        return StageResult::ok();

    AVCodecContext *enc = video_encoder_.get();
    AVPixelFormat source_format = static_cast<AVPixelFormat>(frame->format);

    to_encoder_.set(sws_getContext(frame->width, frame->height, source_format, enc->width, enc->height,
                                   AV_PIX_FMT_YUV420P, SWS_BICUBIC, nullptr, nullptr, nullptr));
    if (!to_encoder_.get())
        return StageResult::fail(FailureKind::DECODE_ERROR, std::string("Unsupported pixel format ") +
                                                                (av_get_pix_fmt_name(source_format) ? av_get_pix_fmt_name(source_format) : "?"));

    if (overlay_)
    {
        to_bgr_.set(sws_getContext(frame->width, frame->height, source_format, enc->width, enc->height,
                                   AV_PIX_FMT_BGR24, SWS_BICUBIC, nullptr, nullptr, nullptr));
        if (!from_bgr_.get())
            from_bgr_.set(sws_getContext(enc->width, enc->height, AV_PIX_FMT_BGR24, enc->width, enc->height,
                                         AV_PIX_FMT_YUV420P, SWS_BICUBIC, nullptr, nullptr, nullptr));
        if (!to_bgr_.get() || !from_bgr_.get())
            return StageResult::fail(FailureKind::ENCODE_ERROR, "Cannot create subtitle compositing scalers");
    }

    scaler_src_width_ = frame->width;
    scaler_src_height_ = frame->height;
    scaler_src_format_ = frame->format;
    return StageResult::ok();
}

int64_t VideoReconstructor::nextSyntheticPts(int64_t last_pts, int64_t last_duration, int64_t nominal_interval)
{
    if (last_pts == AV_NOPTS_VALUE)
        return 0;
    int64_t step = last_duration > 0 ? last_duration : nominal_interval;
    return last_pts + std::max<int64_t>(1, step);
}

StageResult VideoReconstructor::processFrame(AVFrame *frame)
{
    if (frame->width <= 0 || frame->height <= 0)
    {
        skipped_packets_++;
        return StageResult::ok();
    }
    int64_t pixels = static_cast<int64_t>(frame->width) * static_cast<int64_t>(frame->height);
    if (pixels > video_decoder_.get()->max_pixels)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Decoded frame exceeds the pixel limit");

    AVCodecContext *enc = video_encoder_.get();
    int64_t duration = frame->duration > 0 ? av_rescale_q(frame->duration, video_in_->time_base, enc->time_base) : 0;
    // Synthesized steps never fall under the frame rate cap
    int64_t nominal = std::max(min_frame_interval_, av_rescale_q(1, av_inv_q(enc->framerate), enc->time_base));
    int64_t output_pts;
    int64_t time_ms;
    int64_t pts = frame->best_effort_timestamp;
    if (pts == AV_NOPTS_VALUE)
    {
        output_pts = nextSyntheticPts(last_output_pts_, last_duration_, nominal);
        time_ms = origin_ms_ + av_rescale_q(output_pts, enc->time_base, MILLISECONDS);
    }
    else
    {
        if (origin_pts_ == AV_NOPTS_VALUE)
        {
            // Frames synthesized before the first timestamp stay in front of it
            origin_pts_ = pts;
            origin_offset_ = last_output_pts_ == AV_NOPTS_VALUE ? 0 : nextSyntheticPts(last_output_pts_, last_duration_, nominal);
            origin_ms_ = av_rescale_q(pts, video_in_->time_base, MILLISECONDS) -
                         av_rescale_q(origin_offset_, enc->time_base, MILLISECONDS);
        }
        output_pts = av_rescale_q(pts - origin_pts_, video_in_->time_base, enc->time_base) + origin_offset_;
        time_ms = av_rescale_q(pts, video_in_->time_base, MILLISECONDS);
    }

    if (last_output_pts_ != AV_NOPTS_VALUE && output_pts < last_output_pts_ + min_frame_interval_)
    {
        dropped_frames_++;
        return StageResult::ok();
    }

    StageResult result = ensureScalers(frame);
    if (!result.success)
        return result;

    AVFrame *target = encoder_frame_.get();
    if (av_frame_make_writable(target) < 0)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate encoder picture");

    int scaled;
    if (overlay_ && overlay_->hasEventAt(time_ms))
    {
        cv::Mat bgr(enc->height, enc->width, CV_8UC3);
        uint8_t *bgr_planes[1] = {bgr.data};
        int bgr_strides[1] = {static_cast<int>(bgr.step)};
        scaled = sws_scale(to_bgr_.get(), frame->data, frame->linesize, 0, frame->height, bgr_planes, bgr_strides);
        if (scaled > 0)
        {
            overlay_->render(bgr, time_ms);
            const uint8_t *source_planes[1] = {bgr.data};
            scaled = sws_scale(from_bgr_.get(), source_planes, bgr_strides, 0, enc->height,
                               target->data, target->linesize);
        }
    }
    else
    {
        scaled = sws_scale(to_encoder_.get(), frame->data, frame->linesize, 0, frame->height,
                           target->data, target->linesize);
    }
    if (scaled <= 0)
        return StageResult::fail(FailureKind::ENCODE_ERROR, "Pixel conversion failed");

    target->pts = output_pts;
    last_output_pts_ = output_pts;
    last_duration_ = duration > 0 ? std::max(duration, min_frame_interval_) : 0;

    result = emitSubtitlesUntil(time_ms);
    if (!result.success)
        return result;

    result = encodeFrame(target);
    if (!result.success)
        return result;
    video_frames_++;
    return StageResult::ok();
}

StageResult VideoReconstructor::encodeFrame(AVFrame *frame)
{
    AVCodecContext *enc = video_encoder_.get();
    int ret = avcodec_send_frame(enc, frame);
    if (ret < 0 && !(frame == nullptr && ret == AVERROR_EOF))
        return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                 "Video encoder rejected frame: " + avErrorString(ret));

    AVPacketRAII packet;
    if (!packet.get())
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate packet");

    while (true)
    {
        ret = avcodec_receive_packet(enc, packet.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            return StageResult::ok();
        if (ret < 0)
            return StageResult::fail(failureFromAvError(ret, FailureKind::ENCODE_ERROR),
                                     "Video encoding failed: " + avErrorString(ret));

        StageResult result = drainVideoFilter(packet.get());
        av_packet_unref(packet.get());
        if (!result.success)
            return result;
    }
}

StageResult VideoReconstructor::emitSubtitlesUntil(int64_t time_ms)
{
    if (!subtitle_out_)
        return StageResult::ok();

    const auto &events = subtitle_track_.getEvents();
    while (next_subtitle_ < events.size() && events[next_subtitle_].start_ms <= time_ms)
    {
        const SubtitleEvent &event = events[next_subtitle_++];
        if (event.isBitmap() || event.text.empty())
            continue;

        // mov_text samples need strictly increasing timestamps
        int64_t start_ms = std::max<int64_t>(0, event.start_ms - origin_ms_);
        if (start_ms <= last_subtitle_ms_)
            start_ms = last_subtitle_ms_ + 1;
        int64_t duration_ms = std::max<int64_t>(1, event.end_ms - event.start_ms);
        last_subtitle_ms_ = start_ms;

        std::string dialogue = "0,0,Default,,0,0,0,," + toAssText(event.text);

        AVSubtitleRect rect;
        std::memset(&rect, 0, sizeof(rect));
        rect.type = SUBTITLE_ASS;
        rect.ass = &dialogue[0];
        AVSubtitleRect *rects[1] = {&rect};

        AVSubtitle subtitle;
        std::memset(&subtitle, 0, sizeof(subtitle));
        subtitle.num_rects = 1;
        subtitle.rects = rects;
        subtitle.end_display_time = static_cast<uint32_t>(std::min<int64_t>(duration_ms, UINT32_MAX - 1));
        subtitle.pts = av_rescale_q(start_ms, MILLISECONDS, AV_TIME_BASE_Q);

        std::vector<uint8_t> buffer(MAX_SUBTITLE_PACKET_BYTES);
        int size = avcodec_encode_subtitle(subtitle_encoder_.get(), buffer.data(), static_cast<int>(buffer.size()),
                                           &subtitle);
        if (size < 0)
            return StageResult::fail(FailureKind::ENCODE_ERROR, "Subtitle encoding failed: " + avErrorString(size));

        AVPacketRAII packet;
        if (!packet.get() || av_new_packet(packet.get(), size) < 0)
            return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate subtitle packet");
        std::memcpy(packet->data, buffer.data(), static_cast<size_t>(size));
        packet->pts = av_rescale_q(start_ms, MILLISECONDS, subtitle_out_->time_base);
        packet->dts = packet->pts;
        packet->duration = av_rescale_q(duration_ms, MILLISECONDS, subtitle_out_->time_base);
        packet->stream_index = subtitle_out_->index;

        StageResult written = output_.writePacket(packet.get());
        if (!written.success)
            return written;
    }
    return StageResult::ok();
}

StageResult VideoReconstructor::flush()
{
    StageResult result;
    if (copy_video_)
    {
        result = drainVideoFilter(nullptr);
    }
    else
    {
        result = decodeVideoPacket(nullptr);
        if (result.success)
            result = encodeFrame(nullptr);
        if (result.success)
            result = drainVideoFilter(nullptr);
    }
    if (!result.success)
        return result;

    if (audio_transcoder_)
    {
        result = audio_transcoder_->finish();
        if (!result.success)
            return result;
    }

    return emitSubtitlesUntil(std::numeric_limits<int64_t>::max());
}
