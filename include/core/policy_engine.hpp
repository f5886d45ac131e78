#pragma once

#include <map>
#include <string>
#include <utility>
#include "core/sanitization_types.hpp"

/**
 * @brief Encoder parameters the policy engine stamps into every plan
 */
struct PolicySettings
{
    ReconstructionSettings reconstruction;
    int video_audio_bitrate_kbps = 160;
    int audio_bitrate_kbps = 192;
};

/**
 * @brief Plan lookup outcome
 */
struct PlanResult
{
    bool success;
    FailureKind failure_kind;
    std::string error_message;
    ReconstructionPlan plan;

    PlanResult() : success(false), failure_kind(FailureKind::UNSUPPORTED_LEVEL) {}
};

/**
 * @brief Static policy row for one (media kind, CDR level) pair
 */
struct PolicyEntry
{
    CdrLevel effective_level;
    std::string container;
    std::string extension;
    StreamMode video_mode;
    StreamMode audio_mode;
    SubtitlePolicy subtitles;
    std::string degradation_note;
};

/**
 * @brief Maps a classified file and a CDR level to a ReconstructionPlan
 *
 * The mapping is a fixed lookup table. Whenever the effective level differs
 * from the requested one the plan says so in degradation_note.
 */
class PolicyEngine
{
public:
    /**
     * @brief Build the plan for a record at a given level
     * @param record Classified input
     * @param level Requested CDR level
     * @param settings Encoder parameters copied into the plan
     * @return PlanResult, UNSUPPORTED_LEVEL when the kind has no policy row
     */
    static PlanResult buildPlan(const MediaRecord &record, CdrLevel level, const PolicySettings &settings);

    /**
     * @brief Same as buildPlan() for a level given as text (e.g. a per-file override)
     * @return UNSUPPORTED_LEVEL when the text does not name a level
     */
    static PlanResult buildPlan(const MediaRecord &record, const std::string &level_name,
                                const PolicySettings &settings);

    /**
     * @brief Get the policy row for a media kind and level
     * @return Pointer into the static table, nullptr when no row exists
     */
    static const PolicyEntry *getPolicyEntry(MediaKind kind, CdrLevel level);

    static constexpr const char *VIDEO_ENCODER = "libx264";
    static constexpr const char *AUDIO_ENCODER = "aac";

private:
    static const std::map<std::pair<MediaKind, CdrLevel>, PolicyEntry> policy_table_;
};
