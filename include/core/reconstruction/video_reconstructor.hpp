#ifndef VIDEO_RECONSTRUCTOR_HPP
#define VIDEO_RECONSTRUCTOR_HPP

#include "core/media_io.hpp"
#include "core/reconstruction/audio_transcoder.hpp"
#include "core/reconstruction/media_reconstructor.hpp"
#include "core/reconstruction/subtitle_overlay.hpp"
#include <memory>

/**
 * @brief Rebuilds a video file as MP4 (H.264 + AAC, optional mov_text)
 *
 * Remux copies H.264/HEVC/AV1 through the filter_units bitstream filter so
 * SEI and metadata units are dropped. Transcode and Hardcore decode every
 * frame, scale it to yuv420p and encode it with libx264. Hardcore burns the
 * subtitle events into the pixels; Transcode re-encodes them as sanitized
 * mov_text.
 */
class VideoReconstructor : public MediaReconstructor
{
public:
    MediaKind getKind() const override { return MediaKind::VIDEO; }
    std::string getName() const override { return "VideoReconstructor"; }

    StageResult reconstruct(ReconstructionContext &context) override;

    // Codecs that can be copied because filter_units understands their bitstream
    static bool isCopyableVideoCodec(AVCodecID codec_id);
    static bool isCopyableAudioCodec(AVCodecID codec_id);

    /**
     * @brief filter_units remove_types for in-band metadata units of a codec
     * @return Empty string when the codec has no such units
     */
    static std::string metadataUnitTypes(AVCodecID codec_id);

    /**
     * @brief Output timestamp for a decoded frame that carries none
     * @param last_pts Previous output timestamp, AV_NOPTS_VALUE before the first frame
     * @param last_duration Duration of the previous frame in the encoder time base, 0 when unknown
     * @param nominal_interval One frame at the nominal rate in the encoder time base
     */
    static int64_t nextSyntheticPts(int64_t last_pts, int64_t last_duration, int64_t nominal_interval);

    // Minimal ASS header required by the mov_text encoder
    static const char *MOV_TEXT_HEADER;
    static constexpr size_t MAX_SUBTITLE_PACKET_BYTES = 64 * 1024;

private:
    MediaInput input_;
    MediaOutput output_;

    // Video
    AVStream *video_in_ = nullptr;
    AVStream *video_out_ = nullptr;
    bool copy_video_ = false;
    AVBSFContextRAII video_filter_;
    AVCodecContextRAII video_decoder_;
    AVCodecContextRAII video_encoder_;
    AVFrameRAII decoded_frame_;
    AVFrameRAII encoder_frame_;
    SwsContextRAII to_encoder_;
    SwsContextRAII to_bgr_;
    SwsContextRAII from_bgr_;
    int scaler_src_width_ = 0;
    int scaler_src_height_ = 0;
    int scaler_src_format_ = -1;
    int64_t min_frame_interval_ = 0;
    int64_t last_output_pts_ = AV_NOPTS_VALUE;
    int64_t origin_pts_ = AV_NOPTS_VALUE;
    int64_t origin_offset_ = 0;
    int64_t origin_ms_ = 0;
    int64_t last_duration_ = 0;
    int64_t video_frames_ = 0;
    int64_t dropped_frames_ = 0;
    int64_t skipped_packets_ = 0;

    // Audio
    AVStream *audio_in_ = nullptr;
    AVStream *audio_out_ = nullptr;
    bool copy_audio_ = false;
    std::unique_ptr<AudioTranscoder> audio_transcoder_;

    // Subtitles
    SubtitleTrack subtitle_track_;
    std::unique_ptr<SubtitleOverlay> overlay_;
    AVCodecContextRAII subtitle_encoder_;
    AVStream *subtitle_out_ = nullptr;
    size_t next_subtitle_ = 0;
    int64_t last_subtitle_ms_ = -1;

    StageResult prepareSubtitles(ReconstructionContext &context, int subtitle_index);
    StageResult openVideoCopy(const ReconstructionPlan &plan);
    StageResult openVideoEncoder(const ReconstructionPlan &plan);
    StageResult openMetadataFilter(const AVCodecParameters *params, AVRational time_base, bool strip);
    StageResult openSubtitleEncoder();
    StageResult openAudio(const ReconstructionPlan &plan);

    StageResult copyVideoPacket(AVPacket *packet);
    StageResult decodeVideoPacket(AVPacket *packet);
    StageResult processFrame(AVFrame *frame);
    StageResult encodeFrame(AVFrame *frame);
    StageResult drainVideoFilter(AVPacket *packet);
    StageResult copyAudioPacket(AVPacket *packet);
    StageResult emitSubtitlesUntil(int64_t time_ms);
    StageResult flush();

    StageResult ensureScalers(const AVFrame *frame);
};

#endif // VIDEO_RECONSTRUCTOR_HPP
