#include "core/policy_engine.hpp"
#include "logging/logger.hpp"

const std::map<std::pair<MediaKind, CdrLevel>, PolicyEntry> PolicyEngine::policy_table_ = {
    // Video
    {{MediaKind::VIDEO, CdrLevel::REMUX},
     {CdrLevel::REMUX, "mp4", "mp4", StreamMode::COPY_OR_ENCODE, StreamMode::COPY_OR_ENCODE, SubtitlePolicy::DROP, ""}},
    {{MediaKind::VIDEO, CdrLevel::TRANSCODE},
     {CdrLevel::TRANSCODE, "mp4", "mp4", StreamMode::ENCODE, StreamMode::ENCODE, SubtitlePolicy::REENCODE_TEXT, ""}},
    {{MediaKind::VIDEO, CdrLevel::HARDCORE},
     {CdrLevel::HARDCORE, "mp4", "mp4", StreamMode::ENCODE, StreamMode::ENCODE, SubtitlePolicy::BURN_IN, ""}},

    // Images have no container layer to swap and no subtitle concept
    {{MediaKind::IMAGE, CdrLevel::REMUX},
     {CdrLevel::TRANSCODE, "png", "png", StreamMode::ENCODE, StreamMode::DROP, SubtitlePolicy::DROP,
      "images have no container layer; pixels are re-encoded"}},
    {{MediaKind::IMAGE, CdrLevel::TRANSCODE},
     {CdrLevel::TRANSCODE, "png", "png", StreamMode::ENCODE, StreamMode::DROP, SubtitlePolicy::DROP, ""}},
    {{MediaKind::IMAGE, CdrLevel::HARDCORE},
     {CdrLevel::TRANSCODE, "png", "png", StreamMode::ENCODE, StreamMode::DROP, SubtitlePolicy::DROP,
      "images carry no subtitles; burn-in does not apply"}},

    // Audio
    {{MediaKind::AUDIO, CdrLevel::REMUX},
     {CdrLevel::REMUX, "ipod", "m4a", StreamMode::DROP, StreamMode::COPY_OR_ENCODE, SubtitlePolicy::DROP, ""}},
    {{MediaKind::AUDIO, CdrLevel::TRANSCODE},
     {CdrLevel::TRANSCODE, "ipod", "m4a", StreamMode::DROP, StreamMode::ENCODE, SubtitlePolicy::DROP, ""}},
    {{MediaKind::AUDIO, CdrLevel::HARDCORE},
     {CdrLevel::TRANSCODE, "ipod", "m4a", StreamMode::DROP, StreamMode::ENCODE, SubtitlePolicy::DROP,
      "audio carries no subtitles; burn-in does not apply"}},
};

const PolicyEntry *PolicyEngine::getPolicyEntry(MediaKind kind, CdrLevel level)
{
    auto it = policy_table_.find(std::make_pair(kind, level));
    if (it == policy_table_.end())
        return nullptr;
    return &it->second;
}

PlanResult PolicyEngine::buildPlan(const MediaRecord &record, CdrLevel level, const PolicySettings &settings)
{
    PlanResult result;

    const PolicyEntry *entry = getPolicyEntry(record.kind, level);
    if (!entry)
    {
        result.failure_kind = FailureKind::UNSUPPORTED_LEVEL;
        result.error_message = "No reconstruction policy for " + MediaKinds::getName(record.kind) +
                               " at level " + CdrLevels::getLevelName(level);
        return result;
    }

    ReconstructionPlan &plan = result.plan;
    plan.kind = record.kind;
    plan.requested_level = level;
    plan.effective_level = entry->effective_level;
    plan.container = entry->container;
    plan.extension = entry->extension;
    plan.subtitles = entry->subtitles;
    plan.degradation_note = entry->degradation_note;
    plan.strip_sei = true;
    plan.strip_metadata = true;
    plan.settings = settings.reconstruction;

    // Image remux keeps the JPEG family, everything else lands in PNG
    if (record.kind == MediaKind::IMAGE && level == CdrLevel::REMUX && record.container == "jpeg")
    {
        plan.container = "jpeg";
        plan.extension = "jpg";
    }

    if (entry->video_mode != StreamMode::DROP)
        plan.video = StreamPolicy(entry->video_mode, record.kind == MediaKind::VIDEO ? VIDEO_ENCODER : plan.container);

    if (entry->audio_mode != StreamMode::DROP)
    {
        int bitrate = record.kind == MediaKind::AUDIO ? settings.audio_bitrate_kbps : settings.video_audio_bitrate_kbps;
        plan.audio = StreamPolicy(entry->audio_mode, AUDIO_ENCODER, bitrate);
    }

    if (plan.isDegraded())
    {
        Logger::debug("Plan for " + record.relative_path + " degraded from " +
                      CdrLevels::getLevelName(level) + " to " + CdrLevels::getLevelName(plan.effective_level) +
                      ": " + plan.degradation_note);
    }

    result.success = true;
    result.failure_kind = FailureKind::NONE;
    return result;
}

PlanResult PolicyEngine::buildPlan(const MediaRecord &record, const std::string &level_name,
                                   const PolicySettings &settings)
{
    auto level = CdrLevels::fromString(level_name);
    if (!level)
    {
        PlanResult result;
        result.failure_kind = FailureKind::UNSUPPORTED_LEVEL;
        result.error_message = "Unknown CDR level: '" + level_name + "'";
        return result;
    }
    return buildPlan(record, *level, settings);
}
