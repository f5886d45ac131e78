#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <Poco/Exception.h>
#include <mutex>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>
#include "core/cdr_levels.hpp"
#include "core/sanitizer_config.hpp"

class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    uint32_t getUInt32(const std::string &key, uint32_t def = 0) const;

    // Run configuration getters
    std::string getLogLevel() const;
    std::optional<CdrLevel> getCdrLevel() const;
    std::string getInputDir() const;
    std::string getOutputDir() const;
    bool getRecursiveScan() const;

    // Thread configuration getters
    int getMaxJobs() const;
    int getQueueCapacity() const;
    int getMaxDecoderThreads() const;

    // Per-file level overrides (relative path -> level name)
    std::map<std::string, std::string> getLevelOverrides() const;

    /**
     * @brief Snapshot the current values into an immutable SanitizerConfig
     *
     * Call validateConfig() first; out-of-range values are not corrected here.
     */
    SanitizerConfig getSanitizerConfig() const;

    // Configuration validation
    bool validateConfig() const;

    // Utility methods
    void initializeDefaultConfig();
    void resetToDefaults();
    bool hasKey(const std::string &key) const;

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    // Helper methods for nested configuration
    nlohmann::json getNestedConfig(const std::string &prefix) const;
    bool validateRange(const std::string &key, int value, int min, int max) const;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter);
