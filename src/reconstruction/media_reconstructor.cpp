#include "core/reconstruction/media_reconstructor.hpp"
#include "core/reconstruction/video_reconstructor.hpp"
#include "core/reconstruction/image_reconstructor.hpp"
#include "core/reconstruction/audio_reconstructor.hpp"
#include "core/metadata_stripper.hpp"
#include "logging/logger.hpp"
#include <opencv2/core.hpp>

StageResult MediaReconstructor::strip(ReconstructionContext &context)
{
    if (!context.plan.strip_metadata)
        return StageResult::ok();

    StripFormat format = MetadataStripper::formatForContainer(context.plan.container);
    if (format == StripFormat::UNKNOWN)
        return StageResult::fail(FailureKind::METADATA_STRIP_FAILED,
                                 "No metadata stripper for container " + context.plan.container);

    return MetadataStripper::stripDescriptor(context.output_fd, format, context.max_output_bytes);
}

StageResult MediaReconstructor::run(ReconstructionContext &context)
{
    StageResult result;
    try
    {
        Logger::debug(getName() + " reconstructing " + context.record.relative_path + " (" +
                      context.record.container + " -> " + context.plan.container + ")");
        result = reconstruct(context);
        if (!result.success)
            return result;

        result = strip(context);
        if (!result.success)
            Logger::warn("Metadata strip failed: " + result.error_message);
        return result;
    }
    catch (const std::bad_alloc &)
    {
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Memory allocation failed");
    }
    catch (const cv::Exception &e)
    {
        Logger::error("OpenCV exception in " + getName() + ": " + std::string(e.what()));
        return StageResult::fail(FailureKind::DECODE_ERROR, "OpenCV error: " + std::string(e.what()));
    }
    catch (const std::exception &e)
    {
        Logger::error("Exception in " + getName() + ": " + std::string(e.what()));
        return StageResult::fail(FailureKind::INTERNAL_INVARIANT_VIOLATION, e.what());
    }
}

std::unique_ptr<MediaReconstructor> MediaReconstructor::create(MediaKind kind)
{
    switch (kind)
    {
    case MediaKind::VIDEO:
        return std::make_unique<VideoReconstructor>();
    case MediaKind::IMAGE:
        return std::make_unique<ImageReconstructor>();
    case MediaKind::AUDIO:
        return std::make_unique<AudioReconstructor>();
    default:
        return nullptr;
    }
}
