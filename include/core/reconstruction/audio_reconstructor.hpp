#ifndef AUDIO_RECONSTRUCTOR_HPP
#define AUDIO_RECONSTRUCTOR_HPP

#include "core/media_io.hpp"
#include "core/reconstruction/audio_transcoder.hpp"
#include "core/reconstruction/media_reconstructor.hpp"
#include <memory>

/**
 * @brief Rebuilds an audio file as AAC in M4A
 *
 * Remux copies an MP4-compatible stream as is, every other case decodes the
 * waveform and re-encodes it.
 */
class AudioReconstructor : public MediaReconstructor
{
public:
    MediaKind getKind() const override { return MediaKind::AUDIO; }
    std::string getName() const override { return "AudioReconstructor"; }

    StageResult reconstruct(ReconstructionContext &context) override;

    static bool isCopyableCodec(AVCodecID codec_id);

private:
    MediaInput input_;
    MediaOutput output_;
    AVStream *audio_in_ = nullptr;
    AVStream *audio_out_ = nullptr;
    std::unique_ptr<AudioTranscoder> transcoder_;
    int64_t copied_packets_ = 0;
};

#endif // AUDIO_RECONSTRUCTOR_HPP
