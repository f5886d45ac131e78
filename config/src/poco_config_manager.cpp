#include "poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <functional>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;

    // Overlay the file on top of the defaults
    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    try
    {
        tmp->load(in);
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Could not parse configuration file " + path + ": " + e.displayText());
        return false;
    }

    std::stringstream defaults_ss, file_ss;
    cfg_->save(defaults_ss);
    tmp->save(file_ss);
    auto merged = nlohmann::json::parse(defaults_ss.str());
    merged.merge_patch(nlohmann::json::parse(file_ss.str()));

    std::istringstream merged_in(merged.dump());
    AutoPtr<JSONConfiguration> result = new JSONConfiguration();
    result->load(merged_in);
    cfg_ = result;
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_unsigned())
                cfg_->setUInt(prefix, static_cast<unsigned>(node.get<unsigned long long>()));
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

uint32_t PocoConfigManager::getUInt32(const std::string &key, uint32_t def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(cfg_->getUInt(key, def));
}

// Run configuration getters
std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::optional<CdrLevel> PocoConfigManager::getCdrLevel() const
{
    return CdrLevels::fromString(getString("cdr_level", "TRANSCODE"));
}

std::string PocoConfigManager::getInputDir() const
{
    return getString("paths.input_dir", "./input");
}

std::string PocoConfigManager::getOutputDir() const
{
    return getString("paths.output_dir", "./output");
}

bool PocoConfigManager::getRecursiveScan() const
{
    return getBool("scan.recursive", false);
}

// Thread configuration getters
int PocoConfigManager::getMaxJobs() const
{
    return getInt("threading.max_jobs", 4);
}

int PocoConfigManager::getQueueCapacity() const
{
    return getInt("threading.queue_capacity", 16);
}

int PocoConfigManager::getMaxDecoderThreads() const
{
    return getInt("threading.max_decoder_threads", 2);
}

std::map<std::string, std::string> PocoConfigManager::getLevelOverrides() const
{
    std::map<std::string, std::string> overrides;

    // Keys are relative paths and may contain dots, so read the raw JSON object
    auto section = getNestedConfig("overrides");
    for (auto it = section.begin(); it != section.end(); ++it)
    {
        if (it.value().is_string())
            overrides[it.key()] = it.value().get<std::string>();
        else
            overrides[it.key()] = it.value().dump();
    }
    return overrides;
}

SanitizerConfig PocoConfigManager::getSanitizerConfig() const
{
    SanitizerConfig config;
    config.log_level = getLogLevel();
    config.input_dir = getInputDir();
    config.output_dir = getOutputDir();
    config.processing_log = getString("paths.processing_log", "processing_log.json");
    config.recursive = getRecursiveScan();
    config.default_level = getCdrLevel().value_or(CdrLevel::TRANSCODE);

    config.max_jobs = getMaxJobs();
    config.queue_capacity = getQueueCapacity();
    config.max_input_bytes = static_cast<uint64_t>(getUInt32("limits.max_input_mb", 2048)) * 1024 * 1024;

    config.limits.cpu_seconds = getInt("limits.cpu_seconds", 300);
    config.limits.memory_bytes = static_cast<uint64_t>(getUInt32("limits.memory_mb", 2048)) * 1024 * 1024;
    config.limits.wall_clock_seconds = getInt("limits.wall_clock_seconds", 600);
    config.limits.max_output_bytes = static_cast<uint64_t>(getUInt32("limits.max_output_mb", 4096)) * 1024 * 1024;

    auto &reconstruction = config.policy.reconstruction;
    reconstruction.video_crf = getInt("video.crf", 23);
    reconstruction.video_preset = getString("video.preset", "fast");
    reconstruction.max_fps = getInt("video.max_fps", 60);
    reconstruction.audio_sample_rate = getInt("audio.sample_rate", 48000);
    reconstruction.jpeg_quality = getInt("image.jpeg_quality", 92);
    reconstruction.png_compression = getInt("image.png_compression", 6);
    reconstruction.max_image_pixels = getUInt32("limits.max_image_pixels", 200000000);
    reconstruction.max_video_pixels = getUInt32("limits.max_video_pixels", 8192 * 4320);
    reconstruction.max_decoder_threads = getMaxDecoderThreads();
    reconstruction.max_subtitle_events = getInt("limits.max_subtitle_events", 20000);
    config.policy.video_audio_bitrate_kbps = getInt("video.audio_bitrate_kbps", 160);
    config.policy.audio_bitrate_kbps = getInt("audio.bitrate_kbps", 192);

    config.worker_path = getString("sandbox.worker_path", "");
    config.require_filesystem_isolation = getBool("sandbox.require_filesystem_isolation", false);
    config.overrides = getLevelOverrides();
    return config;
}

// Configuration validation
bool PocoConfigManager::validateRange(const std::string &key, int value, int min, int max) const
{
    if (value < min || value > max)
    {
        Logger::error("Invalid value for " + key + ": " + std::to_string(value) +
                      " (expected " + std::to_string(min) + ".." + std::to_string(max) + ")");
        return false;
    }
    return true;
}

bool PocoConfigManager::validateConfig() const
{
    bool valid = true;

    std::string log_level = getLogLevel();
    if (!Logger::isValidLevel(log_level))
    {
        Logger::error("Invalid log_level: " + log_level);
        valid = false;
    }

    if (!getCdrLevel())
    {
        Logger::error("Invalid cdr_level: " + getString("cdr_level"));
        valid = false;
    }

    if (getInputDir().empty() || getOutputDir().empty())
    {
        Logger::error("paths.input_dir and paths.output_dir must not be empty");
        valid = false;
    }

    valid &= validateRange("threading.max_jobs", getMaxJobs(), 1, 64);
    valid &= validateRange("threading.queue_capacity", getQueueCapacity(), 1, 4096);
    valid &= validateRange("threading.max_decoder_threads", getMaxDecoderThreads(), 1, 16);
    valid &= validateRange("limits.max_input_mb", getInt("limits.max_input_mb", 2048), 1, 1024 * 1024);
    valid &= validateRange("limits.cpu_seconds", getInt("limits.cpu_seconds", 300), 1, 86400);
    valid &= validateRange("limits.memory_mb", getInt("limits.memory_mb", 2048), 64, 1024 * 1024);
    valid &= validateRange("limits.wall_clock_seconds", getInt("limits.wall_clock_seconds", 600), 1, 86400);
    valid &= validateRange("limits.max_output_mb", getInt("limits.max_output_mb", 4096), 1, 1024 * 1024);
    valid &= validateRange("limits.max_image_pixels", getInt("limits.max_image_pixels", 200000000), 1, 2000000000);
    valid &= validateRange("limits.max_video_pixels", getInt("limits.max_video_pixels", 8192 * 4320), 1, 2000000000);
    valid &= validateRange("limits.max_subtitle_events", getInt("limits.max_subtitle_events", 20000), 0, 1000000);
    valid &= validateRange("video.crf", getInt("video.crf", 23), 0, 51);
    valid &= validateRange("video.max_fps", getInt("video.max_fps", 60), 1, 240);
    valid &= validateRange("video.audio_bitrate_kbps", getInt("video.audio_bitrate_kbps", 160), 32, 512);
    valid &= validateRange("audio.bitrate_kbps", getInt("audio.bitrate_kbps", 192), 32, 512);
    valid &= validateRange("audio.sample_rate", getInt("audio.sample_rate", 48000), 8000, 96000);
    valid &= validateRange("image.jpeg_quality", getInt("image.jpeg_quality", 92), 1, 100);
    valid &= validateRange("image.png_compression", getInt("image.png_compression", 6), 0, 9);

    static const std::vector<std::string> presets = {"ultrafast", "superfast", "veryfast", "faster", "fast",
                                                     "medium", "slow", "slower", "veryslow"};
    std::string preset = getString("video.preset", "fast");
    if (std::find(presets.begin(), presets.end(), preset) == presets.end())
    {
        Logger::error("Invalid video.preset: " + preset);
        valid = false;
    }

    return valid;
}

// Utility methods
void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_->setString("log_level", "INFO");
    cfg_->setString("cdr_level", "TRANSCODE");

    // Paths
    cfg_->setString("paths.input_dir", "./input");
    cfg_->setString("paths.output_dir", "./output");
    cfg_->setString("paths.processing_log", "processing_log.json");
    cfg_->setBool("scan.recursive", false);

    // Threading defaults
    cfg_->setInt("threading.max_jobs", 4);
    cfg_->setInt("threading.queue_capacity", 16);
    cfg_->setInt("threading.max_decoder_threads", 2);

    // Per-job resource bounds
    cfg_->setUInt("limits.max_input_mb", 2048);
    cfg_->setInt("limits.cpu_seconds", 300);
    cfg_->setUInt("limits.memory_mb", 2048);
    cfg_->setInt("limits.wall_clock_seconds", 600);
    cfg_->setUInt("limits.max_output_mb", 4096);
    cfg_->setUInt("limits.max_image_pixels", 200000000);
    cfg_->setUInt("limits.max_video_pixels", 8192 * 4320);
    cfg_->setInt("limits.max_subtitle_events", 20000);

    // Encoder defaults
    cfg_->setInt("video.crf", 23);
    cfg_->setString("video.preset", "fast");
    cfg_->setInt("video.max_fps", 60);
    cfg_->setInt("video.audio_bitrate_kbps", 160);
    cfg_->setInt("audio.bitrate_kbps", 192);
    cfg_->setInt("audio.sample_rate", 48000);
    cfg_->setInt("image.jpeg_quality", 92);
    cfg_->setInt("image.png_compression", 6);

    // Sandbox
    cfg_->setString("sandbox.worker_path", "");
    cfg_->setBool("sandbox.require_filesystem_isolation", false);
}

void PocoConfigManager::resetToDefaults()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = new JSONConfiguration();
    }
    initializeDefaultConfig();
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->hasProperty(key);
}

// Helper methods for nested configuration
nlohmann::json PocoConfigManager::getNestedConfig(const std::string &prefix) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    try
    {
        // Get the full config and extract the nested section
        std::stringstream ss;
        cfg_->save(ss);
        auto full_config = nlohmann::json::parse(ss.str());

        // Navigate to the nested section
        auto keys = split(prefix, '.');
        auto current = full_config;

        for (const auto &key : keys)
        {
            if (current.contains(key) && current[key].is_object())
            {
                current = current[key];
            }
            else
            {
                return nlohmann::json::object();
            }
        }

        return current;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("Could not read configuration section " + prefix + ": " + std::string(e.what()));
        return nlohmann::json::object();
    }
}

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter))
    {
        tokens.push_back(token);
    }

    return tokens;
}
