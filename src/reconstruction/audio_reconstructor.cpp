#include "core/reconstruction/audio_reconstructor.hpp"
#include "logging/logger.hpp"

bool AudioReconstructor::isCopyableCodec(AVCodecID codec_id)
{
    return codec_id == AV_CODEC_ID_AAC || codec_id == AV_CODEC_ID_ALAC;
}

StageResult AudioReconstructor::reconstruct(ReconstructionContext &context)
{
    const ReconstructionPlan &plan = context.plan;

    StageResult result = input_.open(context.input_fd, context.record.backend);
    if (!result.success)
        return result;

    int index = input_.findStream(AVMEDIA_TYPE_AUDIO);
    if (index < 0)
        return StageResult::fail(FailureKind::DECODE_ERROR, "No audio stream in " + context.record.container + " input");
    input_.discardUnused({index});
    audio_in_ = input_.get()->streams[index];

    result = output_.open(context.output_fd, plan.container);
    if (!result.success)
        return result;

    AVCodecID codec_id = audio_in_->codecpar->codec_id;
    bool copy = plan.audio.mode == StreamMode::COPY_OR_ENCODE && isCopyableCodec(codec_id) && output_.canCarry(codec_id);
    if (copy)
    {
        result = output_.addStream(audio_in_->codecpar, audio_in_->time_base, &audio_out_);
    }
    else
    {
        transcoder_ = std::make_unique<AudioTranscoder>();
        result = transcoder_->open(audio_in_, plan.audio, plan.settings, output_);
    }
    if (!result.success)
        return result;

    result = output_.writeHeader();
    if (!result.success)
        return result;

    AVPacketRAII packet;
    if (!packet.get())
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate packet");

    int ret;
    while ((ret = av_read_frame(input_.get(), packet.get())) >= 0)
    {
        if (packet->stream_index != index)
        {
            av_packet_unref(packet.get());
            continue;
        }

        if (copy)
        {
            av_packet_rescale_ts(packet.get(), audio_in_->time_base, audio_out_->time_base);
            packet->stream_index = audio_out_->index;
            packet->pos = -1;
            result = output_.writePacket(packet.get());
            copied_packets_++;
        }
        else
        {
            result = transcoder_->sendPacket(packet.get());
        }
        av_packet_unref(packet.get());
        if (!result.success)
            return result;
    }
    if (ret != AVERROR_EOF)
    {
        if (failureFromAvError(ret, FailureKind::DECODE_ERROR) == FailureKind::RESOURCE_EXCEEDED)
            return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Demuxer: " + avErrorString(ret));
        context.warnings.push_back("Input ended early: " + avErrorString(ret));
    }

    if (transcoder_)
    {
        result = transcoder_->finish();
        if (!result.success)
            return result;
        if (transcoder_->getDecodedFrames() == 0)
            return StageResult::fail(FailureKind::DECODE_ERROR, "No decodable audio frames");
        if (transcoder_->getSkippedPackets() > 0)
            context.warnings.push_back("Skipped " + std::to_string(transcoder_->getSkippedPackets()) +
                                       " undecodable audio packets");
    }
    else if (copied_packets_ == 0)
    {
        return StageResult::fail(FailureKind::DECODE_ERROR, "No audio packets");
    }

    Logger::debug(std::string(copy ? "Copied " : "Re-encoded ") + avcodec_get_name(codec_id) + " audio into " +
                  plan.container);
    return output_.finish();
}
