#include "core/sanitization_types.hpp"

NLOHMANN_JSON_SERIALIZE_ENUM(SubtitlePolicy, {
                                                 {SubtitlePolicy::DROP, "drop"},
                                                 {SubtitlePolicy::REENCODE_TEXT, "reencode_text"},
                                                 {SubtitlePolicy::BURN_IN, "burn_in"},
                                             })

NLOHMANN_JSON_SERIALIZE_ENUM(StreamMode, {
                                             {StreamMode::DROP, "drop"},
                                             {StreamMode::COPY_OR_ENCODE, "copy_or_encode"},
                                             {StreamMode::ENCODE, "encode"},
                                         })

std::string MediaKinds::getName(MediaKind kind)
{
    switch (kind)
    {
    case MediaKind::VIDEO:
        return "video";
    case MediaKind::IMAGE:
        return "image";
    case MediaKind::AUDIO:
        return "audio";
    default:
        return "unknown";
    }
}

MediaKind MediaKinds::fromString(const std::string &name)
{
    if (name == "video")
        return MediaKind::VIDEO;
    else if (name == "image")
        return MediaKind::IMAGE;
    else if (name == "audio")
        return MediaKind::AUDIO;
    return MediaKind::UNKNOWN;
}

std::string FailureKinds::getName(FailureKind kind)
{
    switch (kind)
    {
    case FailureKind::NONE:
        return "None";
    case FailureKind::UNSUPPORTED_FORMAT:
        return "UnsupportedFormat";
    case FailureKind::TRUNCATED:
        return "Truncated";
    case FailureKind::UNSUPPORTED_LEVEL:
        return "UnsupportedLevel";
    case FailureKind::DECODE_ERROR:
        return "DecodeError";
    case FailureKind::ENCODE_ERROR:
        return "EncodeError";
    case FailureKind::METADATA_STRIP_FAILED:
        return "MetadataStripFailed";
    case FailureKind::RESOURCE_EXCEEDED:
        return "ResourceExceeded";
    case FailureKind::INTERNAL_INVARIANT_VIOLATION:
        return "InternalInvariantViolation";
    default:
        return "InternalInvariantViolation";
    }
}

FailureKind FailureKinds::fromString(const std::string &name)
{
    for (int i = 0; i < COUNT; ++i)
    {
        FailureKind kind = fromIndex(i);
        if (getName(kind) == name)
            return kind;
    }
    return FailureKind::INTERNAL_INVARIANT_VIOLATION;
}

FailureKind FailureKinds::fromIndex(int index)
{
    if (index < 0 || index >= COUNT)
        return FailureKind::INTERNAL_INVARIANT_VIOLATION;
    return static_cast<FailureKind>(index);
}

std::string JobStatuses::getName(JobStatus status)
{
    switch (status)
    {
    case JobStatus::PENDING:
        return "pending";
    case JobStatus::RUNNING:
        return "running";
    case JobStatus::SUCCEEDED:
        return "succeeded";
    case JobStatus::FAILED:
        return "failed";
    default:
        return "unknown";
    }
}

bool SanitizationJob::advance(JobStatus next)
{
    bool allowed = false;
    switch (status)
    {
    case JobStatus::PENDING:
        allowed = next == JobStatus::RUNNING || next == JobStatus::FAILED;
        break;
    case JobStatus::RUNNING:
        allowed = next == JobStatus::SUCCEEDED || next == JobStatus::FAILED;
        break;
    case JobStatus::SUCCEEDED:
    case JobStatus::FAILED:
        allowed = false;
        break;
    }

    if (!allowed)
        return false;

    status = next;
    if (next == JobStatus::RUNNING)
        start_time = std::chrono::system_clock::now();
    else
        end_time = std::chrono::system_clock::now();
    return true;
}

SanitizationResult SanitizationResult::success(const SanitizationJob &job, const std::string &output_path)
{
    SanitizationResult result;
    result.job_id = job.job_id;
    result.source_path = job.record.relative_path;
    result.status = JobStatus::SUCCEEDED;
    result.output_path = output_path;
    result.media_kind = job.record.kind;
    result.requested_level = job.plan.requested_level;
    result.effective_level = job.plan.effective_level;
    result.degradation_note = job.plan.degradation_note;
    result.usage = job.usage;
    result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(job.end_time - job.start_time).count();
    return result;
}

SanitizationResult SanitizationResult::failure(const std::string &job_id, const std::string &source_path,
                                               FailureKind kind, const std::string &message)
{
    SanitizationResult result;
    result.job_id = job_id;
    result.source_path = source_path;
    result.status = JobStatus::FAILED;
    result.failure_kind = kind == FailureKind::NONE ? FailureKind::INTERNAL_INVARIANT_VIOLATION : kind;
    result.error_message = message;
    return result;
}

void to_json(nlohmann::json &j, const MediaRecord &record)
{
    j = nlohmann::json{
        {"source_path", record.source_path},
        {"relative_path", record.relative_path},
        {"kind", MediaKinds::getName(record.kind)},
        {"container", record.container},
        {"backend", record.backend},
        {"size_bytes", record.size_bytes},
        {"width", record.width},
        {"height", record.height}};
}

void from_json(const nlohmann::json &j, MediaRecord &record)
{
    record.source_path = j.value("source_path", "");
    record.relative_path = j.value("relative_path", "");
    record.kind = MediaKinds::fromString(j.value("kind", "unknown"));
    record.container = j.value("container", "");
    record.backend = j.value("backend", "");
    record.size_bytes = j.value("size_bytes", static_cast<uint64_t>(0));
    record.width = j.value("width", 0);
    record.height = j.value("height", 0);
}

static nlohmann::json streamPolicyToJson(const StreamPolicy &policy)
{
    return nlohmann::json{
        {"mode", policy.mode},
        {"encoder", policy.encoder},
        {"bitrate_kbps", policy.bitrate_kbps}};
}

static StreamPolicy streamPolicyFromJson(const nlohmann::json &j)
{
    StreamPolicy policy;
    policy.mode = j.at("mode").get<StreamMode>();
    policy.encoder = j.value("encoder", "");
    policy.bitrate_kbps = j.value("bitrate_kbps", 0);
    return policy;
}

void to_json(nlohmann::json &j, const ReconstructionPlan &plan)
{
    const auto &s = plan.settings;
    j = nlohmann::json{
        {"kind", MediaKinds::getName(plan.kind)},
        {"requested_level", CdrLevels::getLevelName(plan.requested_level)},
        {"effective_level", CdrLevels::getLevelName(plan.effective_level)},
        {"container", plan.container},
        {"extension", plan.extension},
        {"video", streamPolicyToJson(plan.video)},
        {"audio", streamPolicyToJson(plan.audio)},
        {"subtitles", plan.subtitles},
        {"strip_sei", plan.strip_sei},
        {"strip_metadata", plan.strip_metadata},
        {"degradation_note", plan.degradation_note},
        {"settings",
         {{"video_crf", s.video_crf},
          {"video_preset", s.video_preset},
          {"max_fps", s.max_fps},
          {"audio_sample_rate", s.audio_sample_rate},
          {"jpeg_quality", s.jpeg_quality},
          {"png_compression", s.png_compression},
          {"max_image_pixels", s.max_image_pixels},
          {"max_video_pixels", s.max_video_pixels},
          {"max_decoder_threads", s.max_decoder_threads},
          {"max_subtitle_events", s.max_subtitle_events}}}};
}

void from_json(const nlohmann::json &j, ReconstructionPlan &plan)
{
    plan.kind = MediaKinds::fromString(j.at("kind").get<std::string>());

    auto requested = CdrLevels::fromString(j.at("requested_level").get<std::string>());
    auto effective = CdrLevels::fromString(j.at("effective_level").get<std::string>());
    if (!requested || !effective)
        throw std::invalid_argument("plan carries an unknown CDR level");
    plan.requested_level = *requested;
    plan.effective_level = *effective;

    plan.container = j.at("container").get<std::string>();
    plan.extension = j.at("extension").get<std::string>();
    plan.video = streamPolicyFromJson(j.at("video"));
    plan.audio = streamPolicyFromJson(j.at("audio"));
    plan.subtitles = j.at("subtitles").get<SubtitlePolicy>();
    plan.strip_sei = j.value("strip_sei", true);
    plan.strip_metadata = j.value("strip_metadata", true);
    plan.degradation_note = j.value("degradation_note", "");

    const auto &s = j.at("settings");
    ReconstructionSettings defaults;
    plan.settings.video_crf = s.value("video_crf", defaults.video_crf);
    plan.settings.video_preset = s.value("video_preset", defaults.video_preset);
    plan.settings.max_fps = s.value("max_fps", defaults.max_fps);
    plan.settings.audio_sample_rate = s.value("audio_sample_rate", defaults.audio_sample_rate);
    plan.settings.jpeg_quality = s.value("jpeg_quality", defaults.jpeg_quality);
    plan.settings.png_compression = s.value("png_compression", defaults.png_compression);
    plan.settings.max_image_pixels = s.value("max_image_pixels", defaults.max_image_pixels);
    plan.settings.max_video_pixels = s.value("max_video_pixels", defaults.max_video_pixels);
    plan.settings.max_decoder_threads = s.value("max_decoder_threads", defaults.max_decoder_threads);
    plan.settings.max_subtitle_events = s.value("max_subtitle_events", defaults.max_subtitle_events);
}

void to_json(nlohmann::json &j, const ResourceUsage &usage)
{
    j = nlohmann::json{
        {"user_cpu_ms", usage.user_cpu_ms},
        {"system_cpu_ms", usage.system_cpu_ms},
        {"peak_rss_kb", usage.peak_rss_kb},
        {"wall_ms", usage.wall_ms},
        {"exit_code", usage.exit_code},
        {"term_signal", usage.term_signal}};
}

void to_json(nlohmann::json &j, const SanitizationResult &result)
{
    j = nlohmann::json{
        {"job_id", result.job_id},
        {"source", result.source_path},
        {"status", JobStatuses::getName(result.status)},
        {"media_kind", MediaKinds::getName(result.media_kind)},
        {"elapsed_ms", result.elapsed_ms},
        {"resource_usage", result.usage}};

    if (result.requested_level)
        j["requested_level"] = CdrLevels::getLevelName(*result.requested_level);
    if (result.effective_level)
        j["effective_level"] = CdrLevels::getLevelName(*result.effective_level);
    if (!result.degradation_note.empty())
        j["degradation_note"] = result.degradation_note;
    if (!result.warnings.empty())
        j["warnings"] = result.warnings;

    if (result.succeeded())
    {
        j["output"] = result.output_path;
    }
    else
    {
        j["failure_kind"] = FailureKinds::getName(result.failure_kind);
        j["message"] = result.error_message;
    }
}
