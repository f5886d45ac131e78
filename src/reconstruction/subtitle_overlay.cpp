#include "core/reconstruction/subtitle_overlay.hpp"
#include "core/media_io.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <opencv2/imgproc.hpp>

namespace
{
    // Decode one UTF-8 sequence at pos; returns the code point or -1 and advances pos
    int32_t decodeUtf8(const std::string &s, size_t &pos)
    {
        unsigned char c = static_cast<unsigned char>(s[pos]);
        int length;
        int32_t cp;
        if (c < 0x80)
        {
            pos++;
            return c;
        }
        else if ((c & 0xE0) == 0xC0)
        {
            length = 2;
            cp = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            length = 3;
            cp = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            length = 4;
            cp = c & 0x07;
        }
        else
        {
            pos++;
            return -1;
        }

        if (pos + length > s.size())
        {
            pos = s.size();
            return -1;
        }
        for (int i = 1; i < length; ++i)
        {
            unsigned char cc = static_cast<unsigned char>(s[pos + i]);
            if ((cc & 0xC0) != 0x80)
            {
                pos++;
                return -1;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        pos += length;

        // Overlong forms, surrogates and out-of-range values
        static const int32_t min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
        if (cp < min_for_length[length] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return -1;
        return cp;
    }

    bool isInvisibleFormatting(int32_t cp)
    {
        return (cp >= 0x7F && cp <= 0x9F) ||     // C1 controls
               (cp >= 0x200B && cp <= 0x200F) || // zero-width and directional marks
               (cp >= 0x202A && cp <= 0x202E) || // bidi embeddings and overrides
               (cp >= 0x2066 && cp <= 0x2069) || // bidi isolates
               cp == 0xFEFF;
    }

    std::string removeMarkup(const std::string &raw)
    {
        std::string out;
        out.reserve(raw.size());
        size_t i = 0;
        while (i < raw.size())
        {
            char c = raw[i];
            if (c == '\\' && i + 1 < raw.size() && (raw[i + 1] == 'N' || raw[i + 1] == 'n'))
            {
                out.push_back('\n');
                i += 2;
            }
            else if (c == '\\' && i + 1 < raw.size() && raw[i + 1] == 'h')
            {
                out.push_back(' ');
                i += 2;
            }
            else if (c == '{')
            {
                size_t close = raw.find('}', i);
                if (close == std::string::npos)
                    break;
                i = close + 1;
            }
            else if (c == '<')
            {
                size_t close = raw.find('>', i);
                if (close == std::string::npos)
                    break;
                i = close + 1;
            }
            else
            {
                out.push_back(c);
                i++;
            }
        }
        return out;
    }

    std::string trimLines(const std::string &text)
    {
        std::vector<std::string> lines;
        size_t start = 0;
        while (start <= text.size())
        {
            size_t end = text.find('\n', start);
            if (end == std::string::npos)
                end = text.size();
            std::string line = text.substr(start, end - start);
            size_t first = line.find_first_not_of(" \t");
            size_t last = line.find_last_not_of(" \t");
            if (first != std::string::npos)
                lines.push_back(line.substr(first, last - first + 1));
            start = end + 1;
        }

        std::string joined;
        for (size_t i = 0; i < lines.size(); ++i)
        {
            if (i > 0)
                joined.push_back('\n');
            joined += lines[i];
        }
        return joined;
    }

    cv::Mat paletteBitmapToBgra(const AVSubtitleRect *rect)
    {
        cv::Mat bgra(rect->h, rect->w, CV_8UC4);
        const uint8_t *indices = rect->data[0];
        const uint32_t *palette = reinterpret_cast<const uint32_t *>(rect->data[1]);
        int colors = std::min(rect->nb_colors, 256);

        for (int y = 0; y < rect->h; ++y)
        {
            cv::Vec4b *row = bgra.ptr<cv::Vec4b>(y);
            for (int x = 0; x < rect->w; ++x)
            {
                int index = indices[y * rect->linesize[0] + x];
                uint32_t argb = index < colors ? palette[index] : 0;
                row[x] = cv::Vec4b(static_cast<uchar>(argb & 0xFF),
                                   static_cast<uchar>((argb >> 8) & 0xFF),
                                   static_cast<uchar>((argb >> 16) & 0xFF),
                                   static_cast<uchar>((argb >> 24) & 0xFF));
            }
        }
        return bgra;
    }
}

std::string SubtitleText::sanitize(const std::string &raw, size_t max_bytes)
{
    std::string stripped = removeMarkup(raw);

    std::string clean;
    clean.reserve(stripped.size());
    size_t pos = 0;
    while (pos < stripped.size())
    {
        size_t begin = pos;
        int32_t cp = decodeUtf8(stripped, pos);
        if (cp < 0)
            continue;
        if (cp == '\r' || cp == '\t')
        {
            clean.push_back(cp == '\t' ? ' ' : '\n');
            continue;
        }
        if ((cp < 0x20 && cp != '\n') || isInvisibleFormatting(cp))
            continue;
        clean.append(stripped, begin, pos - begin);
    }

    std::string text = trimLines(clean);
    if (text.size() <= max_bytes)
        return text;

    // Cut on a character boundary
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        cut--;
    return text.substr(0, cut);
}

std::string SubtitleText::fromAssDialogue(const std::string &line)
{
    size_t pos = 0;
    for (int field = 0; field < 8; ++field)
    {
        pos = line.find(',', pos);
        if (pos == std::string::npos)
            return line;
        pos++;
    }
    return line.substr(pos);
}

std::string SubtitleText::toRenderable(const std::string &text)
{
    std::string out;
    size_t pos = 0;
    while (pos < text.size())
    {
        int32_t cp = decodeUtf8(text, pos);
        if (cp == '\n' || (cp >= 0x20 && cp < 0x7F))
            out.push_back(static_cast<char>(cp));
        else
            out.push_back('?');
    }
    return out;
}

StageResult SubtitleTrack::collect(int fd, const std::string &demuxer, int stream_index,
                                   int max_events, bool keep_bitmaps, int max_threads)
{
    events_.clear();
    skipped_packets_ = 0;
    truncated_ = false;
    usable_ = false;

    MediaInput input;
    StageResult opened = input.open(fd, demuxer);
    if (!opened.success)
        return opened;

    AVFormatContext *fmt = input.get();
    if (stream_index < 0 || stream_index >= static_cast<int>(fmt->nb_streams))
        return StageResult::fail(FailureKind::INTERNAL_INVARIANT_VIOLATION, "Subtitle stream index out of range");
    input.discardUnused({stream_index});

    AVStream *stream = fmt->streams[stream_index];
    AVCodecContextRAII decoder;
    StageResult decoder_opened = openDecoder(stream, max_threads, 4096LL * 4096LL, decoder);
    if (!decoder_opened.success)
    {
        // An undecodable subtitle stream only loses its overlay
        Logger::warn("Subtitle stream unusable: " + decoder_opened.error_message);
        return StageResult::ok();
    }
    usable_ = true;
    canvas_width_ = decoder.get()->width;
    canvas_height_ = decoder.get()->height;

    AVPacketRAII packet;
    if (!packet.get())
        return StageResult::fail(FailureKind::RESOURCE_EXCEEDED, "Cannot allocate packet");

    uint64_t bitmap_pixels = 0;
    bool open_ended = false;
    const AVRational ms = {1, 1000};

    int ret;
    while ((ret = av_read_frame(fmt, packet.get())) >= 0)
    {
        if (packet->stream_index != stream_index)
        {
            av_packet_unref(packet.get());
            continue;
        }

        AVSubtitleRAII subtitle;
        int got = 0;
        int decoded = avcodec_decode_subtitle2(decoder.get(), subtitle.get(), &got, packet.get());
        if (decoded < 0)
        {
            skipped_packets_++;
            av_packet_unref(packet.get());
            continue;
        }
        if (!got)
        {
            av_packet_unref(packet.get());
            continue;
        }
        subtitle.markValid();

        int64_t ts = packet->pts != AV_NOPTS_VALUE ? packet->pts : packet->dts;
        if (ts == AV_NOPTS_VALUE)
        {
            skipped_packets_++;
            av_packet_unref(packet.get());
            continue;
        }
        int64_t base_ms = av_rescale_q(ts, stream->time_base, ms);
        AVSubtitle *sub = subtitle.get();
        int64_t start_ms = base_ms + sub->start_display_time;

        // An empty event ends the previous open-ended one (PGS, DVB)
        if (sub->num_rects == 0)
        {
            if (open_ended && !events_.empty())
                events_.back().end_ms = std::max(events_.back().start_ms, start_ms);
            open_ended = false;
            av_packet_unref(packet.get());
            continue;
        }

        SubtitleEvent event;
        event.start_ms = start_ms;
        bool has_end = sub->end_display_time > sub->start_display_time && sub->end_display_time != UINT32_MAX;
        if (has_end)
            event.end_ms = base_ms + sub->end_display_time;
        else if (packet->duration > 0)
            event.end_ms = base_ms + av_rescale_q(packet->duration, stream->time_base, ms);
        else
            event.end_ms = start_ms + DEFAULT_EVENT_DURATION_MS;

        std::string text;
        for (unsigned int i = 0; i < sub->num_rects; ++i)
        {
            const AVSubtitleRect *rect = sub->rects[i];
            if (rect->type == SUBTITLE_ASS && rect->ass)
            {
                if (!text.empty())
                    text.push_back('\n');
                text += SubtitleText::fromAssDialogue(rect->ass);
            }
            else if (rect->type == SUBTITLE_TEXT && rect->text)
            {
                if (!text.empty())
                    text.push_back('\n');
                text += rect->text;
            }
            else if (rect->type == SUBTITLE_BITMAP && keep_bitmaps)
            {
                if (rect->w <= 0 || rect->h <= 0 || rect->w > 4096 || rect->h > 4096 || !rect->data[0] || !rect->data[1])
                    continue;
                bitmap_pixels += static_cast<uint64_t>(rect->w) * static_cast<uint64_t>(rect->h);
                if (bitmap_pixels > MAX_BITMAP_PIXELS_TOTAL)
                {
                    truncated_ = true;
                    break;
                }
                event.bitmaps.push_back(SubtitleBitmap{rect->x, rect->y, paletteBitmapToBgra(rect)});
            }
        }
        av_packet_unref(packet.get());

        if (truncated_)
            break;

        event.text = SubtitleText::sanitize(text);
        if (event.text.empty() && event.bitmaps.empty())
            continue;

        open_ended = !has_end && packet->duration <= 0;
        events_.push_back(std::move(event));
        if (static_cast<int>(events_.size()) >= max_events)
        {
            truncated_ = true;
            break;
        }
    }
    if (ret < 0 && ret != AVERROR_EOF)
        Logger::debug("Subtitle pass stopped early: " + avErrorString(ret));

    std::stable_sort(events_.begin(), events_.end(),
                     [](const SubtitleEvent &a, const SubtitleEvent &b)
                     { return a.start_ms < b.start_ms; });

    Logger::debug("Collected " + std::to_string(events_.size()) + " subtitle events, skipped " +
                  std::to_string(skipped_packets_) + " packets" + (truncated_ ? " (truncated)" : ""));
    return StageResult::ok();
}

SubtitleOverlay::SubtitleOverlay(const std::vector<SubtitleEvent> &events, int canvas_width, int canvas_height)
    : events_(events), canvas_width_(canvas_width), canvas_height_(canvas_height)
{
}

bool SubtitleOverlay::hasEventAt(int64_t time_ms) const
{
    for (const auto &event : events_)
    {
        if (event.start_ms > time_ms)
            break;
        if (time_ms < event.end_ms)
            return true;
    }
    return false;
}

void SubtitleOverlay::render(cv::Mat &frame, int64_t time_ms) const
{
    for (const auto &event : events_)
    {
        if (event.start_ms > time_ms)
            break;
        if (time_ms >= event.end_ms)
            continue;

        for (const auto &bitmap : event.bitmaps)
            renderBitmap(frame, bitmap);
        if (!event.text.empty())
            renderText(frame, event.text);
    }
}

void SubtitleOverlay::renderText(cv::Mat &frame, const std::string &text) const
{
    std::string renderable = SubtitleText::toRenderable(text);
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= renderable.size())
    {
        size_t end = renderable.find('\n', start);
        if (end == std::string::npos)
            end = renderable.size();
        lines.push_back(renderable.substr(start, end - start));
        start = end + 1;
    }

    const int font = cv::FONT_HERSHEY_SIMPLEX;
    double scale = std::max(0.4, frame.rows / 720.0 * 0.9);
    int thickness = std::max(1, static_cast<int>(scale * 2.0 + 0.5));
    int margin = std::max(4, frame.rows / 20);

    int baseline = 0;
    cv::Size line_size = cv::getTextSize("Ag", font, scale, thickness, &baseline);
    int line_height = line_size.height + baseline + thickness * 2;

    // Bottom-centred, last line nearest the bottom edge
    int y = frame.rows - margin;
    for (auto it = lines.rbegin(); it != lines.rend(); ++it)
    {
        cv::Size size = cv::getTextSize(*it, font, scale, thickness, &baseline);
        int x = std::max(0, (frame.cols - size.width) / 2);
        cv::Point origin(x, y);
        cv::putText(frame, *it, origin, font, scale, cv::Scalar(0, 0, 0), thickness + 2, cv::LINE_AA);
        cv::putText(frame, *it, origin, font, scale, cv::Scalar(255, 255, 255), thickness, cv::LINE_AA);
        y -= line_height;
        if (y < line_height)
            break;
    }
}

void SubtitleOverlay::renderBitmap(cv::Mat &frame, const SubtitleBitmap &bitmap) const
{
    double sx = canvas_width_ > 0 ? static_cast<double>(frame.cols) / canvas_width_ : 1.0;
    double sy = canvas_height_ > 0 ? static_cast<double>(frame.rows) / canvas_height_ : 1.0;

    cv::Mat source = bitmap.bgra;
    if (sx != 1.0 || sy != 1.0)
    {
        int w = std::max(1, static_cast<int>(bitmap.bgra.cols * sx));
        int h = std::max(1, static_cast<int>(bitmap.bgra.rows * sy));
        cv::resize(bitmap.bgra, source, cv::Size(w, h), 0, 0, cv::INTER_LINEAR);
    }

    cv::Rect target(static_cast<int>(bitmap.x * sx), static_cast<int>(bitmap.y * sy), source.cols, source.rows);
    cv::Rect clipped = target & cv::Rect(0, 0, frame.cols, frame.rows);
    if (clipped.empty())
        return;

    for (int y = 0; y < clipped.height; ++y)
    {
        const cv::Vec4b *src = source.ptr<cv::Vec4b>(clipped.y - target.y + y) + (clipped.x - target.x);
        cv::Vec3b *dst = frame.ptr<cv::Vec3b>(clipped.y + y) + clipped.x;
        for (int x = 0; x < clipped.width; ++x)
        {
            int alpha = src[x][3];
            if (alpha == 0)
                continue;
            for (int c = 0; c < 3; ++c)
                dst[x][c] = static_cast<uchar>((src[x][c] * alpha + dst[x][c] * (255 - alpha)) / 255);
        }
    }
}
