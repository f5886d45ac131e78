#pragma once

#include "core/file_utils.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief A regular file accepted as sanitization input
 */
struct InputCandidate
{
    std::string source_path;   // Canonical path the executor opens
    std::string relative_path; // Path as enumerated, relative to the input root
    uint64_t size_bytes;
};

/**
 * @brief An input entry that is not processed, with the reason
 */
struct ExcludedEntry
{
    std::string relative_path;
    std::string reason;
    bool security_relevant; // Reported as a SECURITY event in the processing log
};

struct ScanReport
{
    std::vector<InputCandidate> candidates; // Sorted by relative path
    std::vector<ExcludedEntry> excluded;
};

void to_json(nlohmann::json &j, const ExcludedEntry &entry);

class FileScanner
{
public:
    /**
     * @param input_root Directory to enumerate
     * @param output_dir Output directory, skipped when it lies inside the input root
     */
    FileScanner(const std::string &input_root, const std::string &output_dir = "");
    ~FileScanner() = default;

    /**
     * @brief Enumerate the input root
     * @throws std::runtime_error when the root is missing or unreadable
     */
    ScanReport scanDirectory(bool recursive = false);

    // Get scan statistics
    size_t getFilesScanned() const { return files_scanned_; }
    size_t getFilesAccepted() const { return files_accepted_; }
    size_t getFilesExcluded() const { return files_excluded_; }

    // Clear statistics
    void clearStats();

private:
    fs::path input_root_;
    fs::path output_dir_;
    size_t files_scanned_;
    size_t files_accepted_;
    size_t files_excluded_;

    // Handle individual entry during scanning
    void handleEntry(const DirectoryEntry &entry, ScanReport &report);
    void handleSymlink(const fs::path &path, const std::string &relative, ScanReport &report);
    void exclude(const std::string &relative, const std::string &reason, bool security, ScanReport &report);
    std::string relativeTo(const fs::path &path) const;
};
