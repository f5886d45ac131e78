#ifndef IMAGE_RECONSTRUCTOR_HPP
#define IMAGE_RECONSTRUCTOR_HPP

#include "core/reconstruction/media_reconstructor.hpp"
#include <opencv2/core.hpp>

/**
 * @brief Rebuilds a still image from its decoded raster
 *
 * The decoder is chosen from the record's backend: OpenCV for the common
 * raster formats, FFmpeg for the first frame of a GIF and LibRaw for camera
 * RAW files. Pixels are normalized to 8-bit BGR or BGRA and re-encoded as
 * PNG (JPEG for the image Remux plan) with no ancillary data.
 */
class ImageReconstructor : public MediaReconstructor
{
public:
    MediaKind getKind() const override { return MediaKind::IMAGE; }
    std::string getName() const override { return "ImageReconstructor"; }

    StageResult reconstruct(ReconstructionContext &context) override;

    /**
     * @brief Reject rasters above the pixel limit (decompression bombs)
     */
    static StageResult checkPixelLimit(int width, int height, uint64_t max_pixels);

    // 8-bit BGR or BGRA copy of a decoded raster of any depth
    static StageResult normalizePixels(const cv::Mat &decoded, cv::Mat &pixels);

    // Encode to the plan's container (png or jpeg)
    static StageResult encodePixels(const cv::Mat &pixels, const ReconstructionPlan &plan,
                                    std::vector<uint8_t> &encoded);

    static constexpr uint64_t MAX_ENCODED_INPUT_BYTES = 512ULL * 1024 * 1024;

private:
    StageResult decodeWithOpenCV(ReconstructionContext &context, cv::Mat &decoded);
    StageResult decodeFirstFrame(ReconstructionContext &context, cv::Mat &decoded);
    StageResult decodeRaw(ReconstructionContext &context, cv::Mat &decoded);
};

#endif // IMAGE_RECONSTRUCTOR_HPP
