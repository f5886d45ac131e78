#include "core/reconstruction/image_reconstructor.hpp"
#include "core/media_io.hpp"
#include "core/type_classifier.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <sys/mman.h>

namespace
{
    // Lower bound for decoding: the raster plus its normalized copy at four 8-bit channels
    StageResult reserveRaster(int width, int height)
    {
        size_t bytes = static_cast<size_t>(width) * static_cast<size_t>(height) * 8;
        void *reserved = mmap(nullptr, bytes, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
        if (reserved == MAP_FAILED)
            return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Raster of " + std::to_string(width) + "x" +
                                                                         std::to_string(height) +
                                                                         " does not fit the memory limit");
        munmap(reserved, bytes);
        return StageResult::ok();
    }
}

StageResult ImageReconstructor::checkPixelLimit(int width, int height, uint64_t max_pixels)
{
    if (width <= 0 || height <= 0)
        return StageResult::fail(FailureKind::DECODE_ERROR,
                                 "Invalid image dimensions " + std::to_string(width) + "x" + std::to_string(height));

    uint64_t pixels = static_cast<uint64_t>(width) * static_cast<uint64_t>(height);
    if (pixels > max_pixels)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED,
                                 "Decompression bomb detected: " + std::to_string(width) + "x" +
                                     std::to_string(height) + " exceeds " + std::to_string(max_pixels) + " pixels");
    return StageResult::ok();
}

StageResult ImageReconstructor::normalizePixels(const cv::Mat &decoded, cv::Mat &pixels)
{
    if (decoded.empty())
        return StageResult::fail(FailureKind::DECODE_ERROR, "Decoder produced no pixels");

    cv::Mat depth8;
    switch (decoded.depth())
    {
    case CV_8U:
        depth8 = decoded;
        break;
    case CV_16U:
        decoded.convertTo(depth8, CV_8U, 1.0 / 257.0);
        break;
    case CV_32F:
    case CV_64F:
        decoded.convertTo(depth8, CV_8U, 255.0);
        break;
    default:
        return StageResult::fail(FailureKind::DECODE_ERROR, "Unsupported pixel depth " + std::to_string(decoded.depth()));
    }

    switch (depth8.channels())
    {
    case 1:
        cv::cvtColor(depth8, pixels, cv::COLOR_GRAY2BGR);
        break;
    case 3:
    case 4:
        // Always a fresh buffer, never a view of decoder memory
        pixels = depth8.clone();
        break;
    default:
        return StageResult::fail(FailureKind::DECODE_ERROR, "Unsupported channel count " + std::to_string(depth8.channels()));
    }
    return StageResult::ok();
}

StageResult ImageReconstructor::encodePixels(const cv::Mat &pixels, const ReconstructionPlan &plan,
                                             std::vector<uint8_t> &encoded)
{
    std::vector<int> params;
    std::string extension;
    cv::Mat source = pixels;

    if (plan.container == "png")
    {
        extension = ".png";
        params = {cv::IMWRITE_PNG_COMPRESSION, plan.settings.png_compression};
    }
    else if (plan.container == "jpeg")
    {
        extension = ".jpg";
        params = {cv::IMWRITE_JPEG_QUALITY, plan.settings.jpeg_quality};
        if (pixels.channels() == 4)
            cv::cvtColor(pixels, source, cv::COLOR_BGRA2BGR);
    }
    else
    {
        return StageResult::fail(FailureKind::ENCODE_ERROR, "No image encoder for container " + plan.container);
    }

    if (!cv::imencode(extension, source, encoded, params))
        return StageResult::fail(FailureKind::ENCODE_ERROR, "OpenCV imencode failed for " + extension);
    return StageResult::ok();
}

StageResult ImageReconstructor::reconstruct(ReconstructionContext &context)
{
    const MediaRecord &record = context.record;
    const ReconstructionSettings &settings = context.plan.settings;

    // Header dimensions are checked before a single pixel is allocated
    if (record.width > 0 && record.height > 0)
    {
        StageResult bounded = checkPixelLimit(record.width, record.height, settings.max_image_pixels);
        if (!bounded.success)
            return bounded;
    }

    cv::Mat decoded;
    StageResult result;
    if (record.backend == "libraw")
        result = decodeRaw(context, decoded);
    else if (record.backend == "opencv")
        result = decodeWithOpenCV(context, decoded);
    else
        result = decodeFirstFrame(context, decoded);
    if (!result.success)
        return result;

    result = checkPixelLimit(decoded.cols, decoded.rows, settings.max_image_pixels);
    if (!result.success)
        return result;

    cv::Mat pixels;
    result = normalizePixels(decoded, pixels);
    if (!result.success)
        return result;
    decoded.release();

    std::vector<uint8_t> encoded;
    result = encodePixels(pixels, context.plan, encoded);
    if (!result.success)
        return result;

    if (encoded.size() > context.max_output_bytes)
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Encoded image exceeds the output size limit");

    Logger::debug("Re-encoded " + std::to_string(pixels.cols) + "x" + std::to_string(pixels.rows) + "x" +
                  std::to_string(pixels.channels()) + " raster as " + context.plan.container + " (" +
                  std::to_string(encoded.size()) + " bytes)");
    return FdIo::writeAll(context.output_fd, encoded.data(), encoded.size());
}

StageResult ImageReconstructor::decodeWithOpenCV(ReconstructionContext &context, cv::Mat &decoded)
{
    std::vector<uint8_t> data;
    StageResult result = FdIo::readAll(context.input_fd, data, MAX_ENCODED_INPUT_BYTES);
    if (!result.success)
        return result;

    // Dimensions come from the whole file, not the classifier prefix
    int width = 0, height = 0;
    if (!TypeClassifier::readImageDimensions(data.data(), data.size(), context.record.container, width, height))
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED,
                                 "Dimensions of " + context.record.container + " data cannot be determined before decoding");
    result = checkPixelLimit(width, height, context.plan.settings.max_image_pixels);
    if (!result.success)
        return result;

    // imdecode reports allocation failure as an empty Mat
    result = reserveRaster(width, height);
    if (!result.success)
        return result;

    // JPEG decodes through IMREAD_COLOR so the EXIF orientation is applied to the pixels
    int flags = context.record.container == "jpeg" ? cv::IMREAD_COLOR : cv::IMREAD_UNCHANGED;
    decoded = cv::imdecode(data, flags);
    if (decoded.empty())
        return StageResult::fail(FailureKind::DECODE_ERROR, "OpenCV could not decode " + context.record.container + " data");
    return StageResult::ok();
}

StageResult ImageReconstructor::decodeFirstFrame(ReconstructionContext &context, cv::Mat &decoded)
{
    const ReconstructionSettings &settings = context.plan.settings;

    MediaInput input;
    StageResult result = input.open(context.input_fd, context.record.backend);
    if (!result.success)
        return result;

    int index = input.findStream(AVMEDIA_TYPE_VIDEO);
    if (index < 0)
        return StageResult::fail(FailureKind::DECODE_ERROR, "No image stream in " + context.record.container + " input");
    input.discardUnused({index});

    AVStream *stream = input.get()->streams[index];
    result = checkPixelLimit(stream->codecpar->width, stream->codecpar->height, settings.max_image_pixels);
    if (!result.success)
        return result;

    AVCodecContextRAII decoder;
    result = openDecoder(stream, 1, static_cast<int64_t>(settings.max_image_pixels), decoder);
    if (!result.success)
        return result;

    AVPacketRAII packet;
    AVFrameRAII frame;
    if (!packet.get() || !frame.get())
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate decoder buffers");

    bool got_frame = false;
    int packets = 0;
    int ret;
    while (!got_frame && (ret = av_read_frame(input.get(), packet.get())) >= 0)
    {
        if (packet->stream_index != index)
        {
            av_packet_unref(packet.get());
            continue;
        }
        packets++;
        ret = avcodec_send_packet(decoder.get(), packet.get());
        av_packet_unref(packet.get());
        if (ret < 0)
            continue;
        got_frame = avcodec_receive_frame(decoder.get(), frame.get()) >= 0;
    }
    if (!got_frame)
    {
        if (avcodec_send_packet(decoder.get(), nullptr) >= 0)
            got_frame = avcodec_receive_frame(decoder.get(), frame.get()) >= 0;
    }
    if (!got_frame)
        return StageResult::fail(FailureKind::DECODE_ERROR, "No decodable frame in " + context.record.container + " input");

    // A further frame means the image was animated
    while (av_read_frame(input.get(), packet.get()) >= 0)
    {
        bool more = packet->stream_index == index;
        av_packet_unref(packet.get());
        if (more)
        {
            context.warnings.push_back("Animated image: only the first frame was kept");
            break;
        }
    }
    Logger::debug("Decoded first frame after " + std::to_string(packets) + " packets");

    result = checkPixelLimit(frame->width, frame->height, settings.max_image_pixels);
    if (!result.success)
        return result;

    SwsContextRAII scaler;
    scaler.set(sws_getContext(frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
                              frame->width, frame->height, AV_PIX_FMT_BGRA, SWS_POINT, nullptr, nullptr, nullptr));
    if (!scaler.get())
        return StageResult::fail(FailureKind::DECODE_ERROR, "Unsupported frame pixel format");

    decoded.create(frame->height, frame->width, CV_8UC4);
    uint8_t *planes[1] = {decoded.data};
    int strides[1] = {static_cast<int>(decoded.step)};
    if (sws_scale(scaler.get(), frame->data, frame->linesize, 0, frame->height, planes, strides) <= 0)
        return StageResult::fail(FailureKind::DECODE_ERROR, "Pixel conversion failed");
    return StageResult::ok();
}

StageResult ImageReconstructor::decodeRaw(ReconstructionContext &context, cv::Mat &decoded)
{
    const ReconstructionSettings &settings = context.plan.settings;

    std::vector<uint8_t> data;
    StageResult result = FdIo::readAll(context.input_fd, data, MAX_ENCODED_INPUT_BYTES);
    if (!result.success)
        return result;

    LibRawRAII libraw_raii;
    libraw_raii.setRaw(new LibRaw());
    LibRaw *raw = libraw_raii.getRaw();

    raw->imgdata.params.use_camera_wb = 1;
    raw->imgdata.params.use_auto_wb = 0;
    raw->imgdata.params.no_auto_bright = 1;
    raw->imgdata.params.output_bps = 8;
    raw->imgdata.params.output_color = 1; // sRGB
    raw->imgdata.params.half_size = 0;

    int rc = raw->open_buffer(data.data(), data.size());
    if (rc != LIBRAW_SUCCESS)
        return StageResult::fail(FailureKind::DECODE_ERROR, "LibRaw open_buffer failed: " + std::string(libraw_strerror(rc)));

    result = checkPixelLimit(raw->imgdata.sizes.raw_width, raw->imgdata.sizes.raw_height, settings.max_image_pixels);
    if (!result.success)
        return result;

    rc = raw->unpack();
    if (rc != LIBRAW_SUCCESS)
        return StageResult::fail(rc == LIBRAW_UNSUFFICIENT_MEMORY ? FailureKind::RESOURCE_EXCEEDED : FailureKind::DECODE_ERROR,
                                 "LibRaw unpack failed: " + std::string(libraw_strerror(rc)));

    rc = raw->dcraw_process();
    if (rc != LIBRAW_SUCCESS)
        return StageResult::fail(rc == LIBRAW_UNSUFFICIENT_MEMORY ? FailureKind::RESOURCE_EXCEEDED : FailureKind::DECODE_ERROR,
                                 "LibRaw dcraw_process failed: " + std::string(libraw_strerror(rc)));

    libraw_processed_image_t *image = raw->dcraw_make_mem_image(&rc);
    if (!image || rc != LIBRAW_SUCCESS)
        return StageResult::fail(FailureKind::DECODE_ERROR, "LibRaw dcraw_make_mem_image failed: " + std::string(libraw_strerror(rc)));
    libraw_raii.setImg(image);

    if (image->type != LIBRAW_IMAGE_BITMAP)
        return StageResult::fail(FailureKind::DECODE_ERROR, "Unsupported LibRaw image type " + std::to_string(image->type));
    if (image->colors != 3)
        return StageResult::fail(FailureKind::DECODE_ERROR, "Unsupported color channels " + std::to_string(image->colors));
    if (image->bits != 8)
        return StageResult::fail(FailureKind::DECODE_ERROR, "Unsupported bit depth " + std::to_string(image->bits));

    result = checkPixelLimit(image->width, image->height, settings.max_image_pixels);
    if (!result.success)
        return result;

    cv::Mat rgb(image->height, image->width, CV_8UC3, image->data);
    cv::cvtColor(rgb, decoded, cv::COLOR_RGB2BGR);
    return StageResult::ok();
}
