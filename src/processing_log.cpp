#include "core/processing_log.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

bool ProcessingLog::open(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_.is_open())
        stream_.close();

    stream_.open(path, std::ios::out | std::ios::app);
    if (!stream_.is_open())
    {
        Logger::error("Could not open processing log: " + path);
        return false;
    }
    Logger::debug("Processing log opened: " + path);
    return true;
}

bool ProcessingLog::isOpen() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_.is_open();
}

void ProcessingLog::log(LogEventType type, const std::string &message, const nlohmann::json &file_info)
{
    nlohmann::json entry = {
        {"timestamp", currentTimestamp()},
        {"type", getTypeName(type)},
        {"message", message},
        {"file", file_info}};

    std::string console_msg = "[" + getTypeName(type) + "] " + message;
    if (file_info.is_object())
    {
        if (file_info.contains("file"))
            console_msg += " : " + file_info["file"].get<std::string>();
        else if (file_info.contains("input") && file_info.contains("output"))
            console_msg += " : " + file_info["input"].get<std::string>() + " -> " + file_info["output"].get<std::string>();
    }

    switch (type)
    {
    case LogEventType::ERROR:
        Logger::error(console_msg);
        break;
    case LogEventType::SECURITY:
    case LogEventType::WARNING:
        Logger::warn(console_msg);
        break;
    case LogEventType::SKIP:
        Logger::debug(console_msg);
        break;
    default:
        Logger::info(console_msg);
        break;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!stream_.is_open())
        return;

    stream_ << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    stream_.flush();
    if (!stream_)
    {
        Logger::error("Failed to write processing log entry, disabling processing log");
        stream_.close();
    }
}

std::string ProcessingLog::getTypeName(LogEventType type)
{
    switch (type)
    {
    case LogEventType::SYSTEM:
        return "SYSTEM";
    case LogEventType::SUCCESS:
        return "SUCCESS";
    case LogEventType::ERROR:
        return "ERROR";
    case LogEventType::SECURITY:
        return "SECURITY";
    case LogEventType::WARNING:
        return "WARNING";
    case LogEventType::SKIP:
        return "SKIP";
    default:
        return "INFO";
    }
}

std::string ProcessingLog::currentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    std::ostringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

nlohmann::json ProcessingLog::fileInfo(const std::string &file)
{
    return nlohmann::json{{"file", file}};
}

nlohmann::json ProcessingLog::fileInfo(const std::string &input, const std::string &output)
{
    return nlohmann::json{{"input", input}, {"output", output}};
}
