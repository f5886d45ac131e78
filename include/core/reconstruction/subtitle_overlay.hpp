#ifndef SUBTITLE_OVERLAY_HPP
#define SUBTITLE_OVERLAY_HPP

#include "core/sanitization_types.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

struct SubtitleBitmap
{
    int x;
    int y;
    cv::Mat bgra; // CV_8UC4, coordinates in the subtitle canvas
};

/**
 * @brief One displayable subtitle event with sanitized content
 */
struct SubtitleEvent
{
    int64_t start_ms;
    int64_t end_ms;
    std::string text;                   // Plain sanitized text, '\n' separated lines
    std::vector<SubtitleBitmap> bitmaps; // Bitmap subtitles (DVD, PGS, DVB)

    bool isBitmap() const { return !bitmaps.empty(); }
};

/**
 * @brief Reduction of subtitle markup to plain, printable text
 */
class SubtitleText
{
public:
    static constexpr size_t MAX_EVENT_TEXT_BYTES = 1024;

    /**
     * @brief Remove ASS override blocks, HTML-like tags, control and
     *        invisible formatting characters and invalid UTF-8
     * @param max_bytes Output cap, cut on a character boundary
     */
    static std::string sanitize(const std::string &raw, size_t max_bytes = MAX_EVENT_TEXT_BYTES);

    /**
     * @brief Text field of a decoded ASS dialogue line
     *        ("ReadOrder,Layer,Style,Name,MarginL,MarginR,MarginV,Effect,Text")
     */
    static std::string fromAssDialogue(const std::string &line);

    // ASCII rendition for the Hershey fonts, other characters become '?'
    static std::string toRenderable(const std::string &text);
};

/**
 * @brief Collects the events of one subtitle stream in a dedicated pass
 *
 * Malformed packets are skipped and counted, the event count is capped,
 * and a stream whose decoder cannot be opened yields no events.
 */
class SubtitleTrack
{
public:
    StageResult collect(int fd, const std::string &demuxer, int stream_index,
                        int max_events, bool keep_bitmaps, int max_threads);

    const std::vector<SubtitleEvent> &getEvents() const { return events_; }
    size_t getSkippedPackets() const { return skipped_packets_; }
    bool isTruncated() const { return truncated_; }
    bool isUsable() const { return usable_; }

    // Canvas that bitmap coordinates refer to
    int getCanvasWidth() const { return canvas_width_; }
    int getCanvasHeight() const { return canvas_height_; }

    static constexpr int64_t DEFAULT_EVENT_DURATION_MS = 5000;
    static constexpr uint64_t MAX_BITMAP_PIXELS_TOTAL = 256ULL * 1024 * 1024;

private:
    std::vector<SubtitleEvent> events_;
    size_t skipped_packets_ = 0;
    bool truncated_ = false;
    bool usable_ = false;
    int canvas_width_ = 0;
    int canvas_height_ = 0;
};

/**
 * @brief Burns subtitle events into BGR frames
 */
class SubtitleOverlay
{
public:
    SubtitleOverlay(const std::vector<SubtitleEvent> &events, int canvas_width, int canvas_height);

    bool empty() const { return events_.empty(); }
    bool hasEventAt(int64_t time_ms) const;

    /**
     * @brief Composite every event active at time_ms onto frame (CV_8UC3)
     */
    void render(cv::Mat &frame, int64_t time_ms) const;

private:
    const std::vector<SubtitleEvent> &events_;
    int canvas_width_;
    int canvas_height_;

    void renderText(cv::Mat &frame, const std::string &text) const;
    void renderBitmap(cv::Mat &frame, const SubtitleBitmap &bitmap) const;
};

#endif // SUBTITLE_OVERLAY_HPP
