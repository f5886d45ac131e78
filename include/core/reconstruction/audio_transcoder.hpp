#ifndef AUDIO_TRANSCODER_HPP
#define AUDIO_TRANSCODER_HPP

#include "core/media_io.hpp"
#include "core/sanitization_types.hpp"

/**
 * @brief Decode -> resample -> FIFO -> encode chain for one audio stream
 *
 * Frames are resampled to the encoder's format and regrouped into
 * encoder-sized frames through an AVAudioFifo. Encoded packets go straight
 * to the output muxer.
 */
class AudioTranscoder
{
public:
    AudioTranscoder() = default;
    ~AudioTranscoder();
    AudioTranscoder(const AudioTranscoder &) = delete;
    AudioTranscoder &operator=(const AudioTranscoder &) = delete;

    /**
     * @brief Open decoder, encoder and resampler and add the output stream
     * @param policy Encoder name and bitrate
     */
    StageResult open(AVStream *input_stream, const StreamPolicy &policy, const ReconstructionSettings &settings,
                     MediaOutput &output);

    // Feed one demuxed packet of the input stream
    StageResult sendPacket(AVPacket *packet);

    /**
     * @brief Resample and encode one decoded frame
     *
     * Format, rate and layout may change between frames; the resampler is
     * drained and rebuilt for the new input.
     */
    StageResult sendFrame(const AVFrame *frame);

    // Drain decoder, resampler, FIFO and encoder
    StageResult finish();

    int64_t getDecodedFrames() const { return decoded_frames_; }
    int64_t getSkippedPackets() const { return skipped_packets_; }
    int64_t getEncodedSamples() const { return next_pts_; }
    int getResamplerConfigurations() const { return resampler_configurations_; }

    static constexpr int MAX_OUTPUT_CHANNELS = 2;

private:
    AVCodecContextRAII decoder_;
    AVCodecContextRAII encoder_;
    SwrContextRAII resampler_;
    int resampler_format_ = -1;
    int resampler_rate_ = 0;
    AVChannelLayout resampler_layout_ = {};
    int resampler_configurations_ = 0;
    AVAudioFifoRAII fifo_;
    AVFrameRAII decoded_;
    AVStream *input_stream_ = nullptr;
    AVStream *output_stream_ = nullptr;
    MediaOutput *output_ = nullptr;
    int64_t next_pts_ = 0;
    int64_t decoded_frames_ = 0;
    int64_t skipped_packets_ = 0;

    StageResult receiveDecodedFrames();
    StageResult resampleIntoFifo(const AVFrame *frame);
    StageResult configureResampler(const AVFrame *frame);
    StageResult convertIntoFifo(const uint8_t **samples, int in_samples);
    StageResult encodeFromFifo(bool flush);
    StageResult encodeFrame(AVFrame *frame);
};

#endif // AUDIO_TRANSCODER_HPP
