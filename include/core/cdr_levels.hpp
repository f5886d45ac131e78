#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

/**
 * @brief Reconstruction depth applied to a file
 *
 * The level is chosen once per run (or per file through an explicit override)
 * and never changes while a job runs.
 */
enum class CdrLevel
{
    REMUX,     // Container swap, streams copied where the target container allows
    TRANSCODE, // Full decode and re-encode into fixed targets
    HARDCORE   // Transcode plus subtitle burn-in
};

class CdrLevels
{
public:
    /**
     * @brief Get the level name as string
     * @param level The CDR level
     * @return Upper-case name used in configuration and reports
     */
    static std::string getLevelName(CdrLevel level)
    {
        switch (level)
        {
        case CdrLevel::REMUX:
            return "REMUX";
        case CdrLevel::TRANSCODE:
            return "TRANSCODE";
        case CdrLevel::HARDCORE:
            return "HARDCORE";
        default:
            return "UNKNOWN";
        }
    }

    /**
     * @brief Get a human-readable description of what the level does
     * @param level The CDR level
     * @return Short description
     */
    static std::string getLevelDescription(CdrLevel level)
    {
        switch (level)
        {
        case CdrLevel::REMUX:
            return "Level 1: repackage into MP4, drop metadata and subtitles";
        case CdrLevel::TRANSCODE:
            return "Level 2: decode and re-encode every stream into fixed targets";
        case CdrLevel::HARDCORE:
            return "Level 3: re-encode and burn subtitles into the picture";
        default:
            return "Unknown level";
        }
    }

    /**
     * @brief Numeric level as printed in reports (1-3)
     */
    static int getLevelNumber(CdrLevel level)
    {
        return static_cast<int>(level) + 1;
    }

    /**
     * @brief Parse a level from configuration or command line input
     * @param level_str Level name ("REMUX", "transcode", ...) or number ("1".."3")
     * @return Parsed level, std::nullopt if the value is not a known level
     */
    static std::optional<CdrLevel> fromString(const std::string &level_str)
    {
        std::string upper = level_str;
        std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

        if (upper == "REMUX" || upper == "1")
            return CdrLevel::REMUX;
        else if (upper == "TRANSCODE" || upper == "2")
            return CdrLevel::TRANSCODE;
        else if (upper == "HARDCORE" || upper == "3")
            return CdrLevel::HARDCORE;
        return std::nullopt;
    }
};
