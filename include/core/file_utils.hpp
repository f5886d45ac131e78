#pragma once

#include <filesystem>
#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <optional>

namespace fs = std::filesystem;

// Forward declarations
template <typename T>
class SimpleObservable;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

    void subscribe(Observer onNext)
    {
        subscribe(onNext, nullptr, nullptr);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief Kind of a directory entry as seen without following symlinks
 */
enum class EntryType
{
    REGULAR,
    DIRECTORY,
    SYMLINK,
    FIFO,
    SOCKET,
    BLOCK_DEVICE,
    CHARACTER_DEVICE,
    OTHER
};

/**
 * @brief One entry emitted while walking an input tree
 */
struct DirectoryEntry
{
    std::string path; // Full path as enumerated (never resolved)
    EntryType type;
};

/**
 * @brief File utilities for input enumeration and identity
 */
class FileUtils
{
public:
    /**
     * Lists all entries in a directory as a simple observable stream.
     * Symlinks are reported as SYMLINK and never followed. In recursive mode
     * real subdirectories are descended into instead of being emitted.
     * @param dir_path Directory path to scan
     * @param recursive Whether to scan recursively
     * @param prune_dir Directory that is emitted but never descended into
     * @return SimpleObservable that emits directory entries
     */
    static SimpleObservable<DirectoryEntry> listEntriesAsObservable(const std::string &dir_path, bool recursive = false,
                                                                    const std::string &prune_dir = "");

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Whether path lies inside root (both already canonical)
     */
    static bool isWithin(const fs::path &root, const fs::path &path);

    /**
     * @brief Human-readable name of an entry type for reports
     */
    static std::string getEntryTypeName(EntryType type);

    /**
     * Computes SHA256 of a string
     * @return SHA256 hash as hexadecimal string, empty on failure
     */
    static std::string sha256Hex(const std::string &data);

    /**
     * @brief Deterministic job id for an input: the first 24 hex digits of
     *        SHA-256 over its path relative to the input root
     */
    static std::string computeJobId(const std::string &relative_path);

    static constexpr size_t JOB_ID_LENGTH = 24;

private:
    static EntryType entryTypeOf(const fs::file_status &status);
    static void scanDirectory(const fs::path &dir_path, bool recursive, const fs::path &prune_dir,
                              const std::function<void(const DirectoryEntry &)> &onNext);
};
