#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

enum class LogEventType
{
    SYSTEM,
    INFO,
    SUCCESS,
    ERROR,
    SECURITY,
    WARNING,
    SKIP
};

/**
 * @brief Append-only JSON-lines audit log of one batch
 *
 * Each line is {"timestamp", "type", "message", "file"} where "file" is
 * null or an object describing the input (and output) involved.
 * Events are mirrored to the Logger so operators see them on stderr.
 */
class ProcessingLog
{
public:
    ProcessingLog() = default;
    ~ProcessingLog() = default;
    ProcessingLog(const ProcessingLog &) = delete;
    ProcessingLog &operator=(const ProcessingLog &) = delete;

    /**
     * @brief Open (append mode) the log file
     * @return false when the file cannot be opened; events are then only logged to stderr
     */
    bool open(const std::string &path);
    bool isOpen() const;

    void log(LogEventType type, const std::string &message, const nlohmann::json &file_info = nullptr);

    static std::string getTypeName(LogEventType type);
    static std::string currentTimestamp();

    // Shorthands for the "file" object
    static nlohmann::json fileInfo(const std::string &file);
    static nlohmann::json fileInfo(const std::string &input, const std::string &output);

private:
    mutable std::mutex mutex_;
    std::ofstream stream_;
};
