#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cdr_levels.hpp"

enum class MediaKind
{
    VIDEO,
    IMAGE,
    AUDIO,
    UNKNOWN
};

/**
 * @brief Terminal failure categories of a sanitization job
 *
 * Every category is per-job: none of them aborts the batch.
 */
enum class FailureKind
{
    NONE,
    UNSUPPORTED_FORMAT,
    TRUNCATED,
    UNSUPPORTED_LEVEL,
    DECODE_ERROR,
    ENCODE_ERROR,
    METADATA_STRIP_FAILED,
    RESOURCE_EXCEEDED,
    INTERNAL_INVARIANT_VIOLATION
};

enum class JobStatus
{
    PENDING,
    RUNNING,
    SUCCEEDED,
    FAILED
};

enum class SubtitlePolicy
{
    DROP,          // No subtitle stream in the output
    REENCODE_TEXT, // Sanitized plain text re-encoded as mov_text
    BURN_IN        // Rendered into the video pixels, stream dropped
};

enum class StreamMode
{
    DROP,           // Stream is not carried into the output
    COPY_OR_ENCODE, // Copied when the codec is allowed in the target container
    ENCODE          // Always decoded and re-encoded
};

class MediaKinds
{
public:
    static std::string getName(MediaKind kind);
    static MediaKind fromString(const std::string &name);
};

class FailureKinds
{
public:
    static std::string getName(FailureKind kind);
    static FailureKind fromString(const std::string &name);

    /**
     * @brief Stable index used for worker exit codes and report ordering
     */
    static int toIndex(FailureKind kind) { return static_cast<int>(kind); }
    static FailureKind fromIndex(int index);
    static constexpr int COUNT = 9;
};

class JobStatuses
{
public:
    static std::string getName(JobStatus status);
};

/**
 * @brief One discovered input file, classified from its content
 */
struct MediaRecord
{
    std::string source_path;   // Absolute path used by the parent to open the file
    std::string relative_path; // Path relative to the input root, the file identity
    MediaKind kind;
    std::string container; // Container/codec hint from the signature (jpeg, mp4, matroska, ...)
    std::string backend;   // Decoder backend: ffmpeg demuxer name, "opencv" or "libraw"
    uint64_t size_bytes;
    int width;  // Pixel dimensions when the header exposes them, 0 otherwise
    int height;

    MediaRecord() : kind(MediaKind::UNKNOWN), size_bytes(0), width(0), height(0) {}
};

struct StreamPolicy
{
    StreamMode mode;
    std::string encoder; // FFmpeg encoder name used when re-encoding
    int bitrate_kbps;

    StreamPolicy() : mode(StreamMode::DROP), bitrate_kbps(0) {}
    StreamPolicy(StreamMode m, const std::string &enc, int kbps = 0)
        : mode(m), encoder(enc), bitrate_kbps(kbps) {}
};

/**
 * @brief Encoder and decoder parameters carried by a plan into the worker
 */
struct ReconstructionSettings
{
    int video_crf = 23;
    std::string video_preset = "fast";
    int max_fps = 60;
    int audio_sample_rate = 48000;
    int jpeg_quality = 92;
    int png_compression = 6;
    uint64_t max_image_pixels = 200000000ULL;
    uint64_t max_video_pixels = 8192ULL * 4320ULL;
    int max_decoder_threads = 2;
    int max_subtitle_events = 20000;
};

/**
 * @brief Concrete recipe for rebuilding one file
 *
 * Produced by the PolicyEngine, immutable afterwards, serialized to cross
 * into the worker process.
 */
struct ReconstructionPlan
{
    MediaKind kind = MediaKind::UNKNOWN;
    CdrLevel requested_level = CdrLevel::TRANSCODE;
    CdrLevel effective_level = CdrLevel::TRANSCODE;
    std::string container; // Output format: mp4, ipod (m4a), png, jpeg
    std::string extension; // Output file extension without dot
    StreamPolicy video;
    StreamPolicy audio;
    SubtitlePolicy subtitles = SubtitlePolicy::DROP;
    bool strip_sei = true;
    bool strip_metadata = true;
    std::string degradation_note; // Non-empty when effective_level differs from requested_level
    ReconstructionSettings settings;

    bool isDegraded() const { return !degradation_note.empty(); }
};

struct ResourceUsage
{
    int64_t user_cpu_ms = 0;
    int64_t system_cpu_ms = 0;
    int64_t peak_rss_kb = 0;
    int64_t wall_ms = 0;
    int exit_code = -1;
    int term_signal = 0;
};

/**
 * @brief Lifecycle of one file through the sandboxed executor
 */
struct SanitizationJob
{
    std::string job_id;
    MediaRecord record;
    ReconstructionPlan plan;
    JobStatus status = JobStatus::PENDING;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    ResourceUsage usage;

    /**
     * @brief Move the job forward: PENDING -> RUNNING -> SUCCEEDED|FAILED
     * @return false (and no change) for any other transition
     */
    bool advance(JobStatus next);
};

/**
 * @brief Terminal outcome of one job, immutable once produced
 */
struct SanitizationResult
{
    std::string job_id;
    std::string source_path; // Relative input path
    JobStatus status = JobStatus::FAILED;
    std::string output_path; // Only set on success
    FailureKind failure_kind = FailureKind::NONE;
    std::string error_message;
    MediaKind media_kind = MediaKind::UNKNOWN;
    std::optional<CdrLevel> requested_level;
    std::optional<CdrLevel> effective_level;
    std::string degradation_note;
    std::vector<std::string> warnings; // Non-fatal observations reported by the worker
    int64_t elapsed_ms = 0;
    ResourceUsage usage;

    bool succeeded() const { return status == JobStatus::SUCCEEDED; }

    static SanitizationResult success(const SanitizationJob &job, const std::string &output_path);
    static SanitizationResult failure(const std::string &job_id, const std::string &source_path,
                                      FailureKind kind, const std::string &message);
};

/**
 * @brief Outcome of one pipeline stage
 */
struct StageResult
{
    bool success;
    FailureKind failure_kind;
    std::string error_message;

    StageResult() : success(false), failure_kind(FailureKind::INTERNAL_INVARIANT_VIOLATION) {}
    StageResult(bool s, FailureKind kind = FailureKind::NONE, const std::string &msg = "")
        : success(s), failure_kind(s ? FailureKind::NONE : kind), error_message(msg) {}

    static StageResult ok() { return StageResult(true); }
    static StageResult fail(FailureKind kind, const std::string &msg) { return StageResult(false, kind, msg); }
};

// JSON serialization
void to_json(nlohmann::json &j, const MediaRecord &record);
void from_json(const nlohmann::json &j, MediaRecord &record);
void to_json(nlohmann::json &j, const ReconstructionPlan &plan);
void from_json(const nlohmann::json &j, ReconstructionPlan &plan);
void to_json(nlohmann::json &j, const ResourceUsage &usage);
void to_json(nlohmann::json &j, const SanitizationResult &result);
