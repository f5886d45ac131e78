#include "core/file_utils.hpp"
#include <stdexcept>
#include "logging/logger.hpp"
#include <openssl/sha.h>
#include <sstream>
#include <iomanip>

namespace fs = std::filesystem;

SimpleObservable<DirectoryEntry> FileUtils::listEntriesAsObservable(const std::string &dir_path, bool recursive,
                                                                    const std::string &prune_dir)
{
    using Observer = std::function<void(const DirectoryEntry &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    return SimpleObservable<DirectoryEntry>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [dir_path, recursive, prune_dir](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    // Validate directory exists
                    if (!isValidDirectory(dir_path))
                    {
                        std::string msg = "Invalid directory path: " + dir_path;
                        Logger::warn(msg);
                        if (onError)
                        {
                            onError(std::runtime_error(msg));
                        }
                        return;
                    }

                    scanDirectory(fs::path(dir_path), recursive, fs::path(prune_dir), onNext);

                    if (onComplete)
                    {
                        onComplete();
                    }
                }
                catch (const std::exception &e)
                {
                    std::string msg = "Error listing entries in directory: " + dir_path + ": " + e.what();
                    Logger::warn(msg);
                    if (onError)
                    {
                        onError(std::runtime_error(msg));
                    }
                }
            }));
}

void FileUtils::scanDirectory(const fs::path &dir_path, bool recursive, const fs::path &prune_dir,
                              const std::function<void(const DirectoryEntry &)> &onNext)
{
    std::error_code ec;
    fs::directory_iterator it(dir_path, fs::directory_options::none, ec);
    if (ec)
    {
        // An unreadable subdirectory must not abort the whole scan
        Logger::warn("Error accessing directory " + dir_path.string() + ": " + ec.message());
        return;
    }

    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
        {
            Logger::warn("Error iterating directory " + dir_path.string() + ": " + ec.message());
            return;
        }

        const fs::directory_entry &entry = *it;
        std::error_code status_ec;
        fs::file_status status = entry.symlink_status(status_ec);
        if (status_ec)
        {
            Logger::warn("Skipping entry with unreadable status: " + entry.path().string() + " - " + status_ec.message());
            continue;
        }

        EntryType type = entryTypeOf(status);
        if (type == EntryType::DIRECTORY && recursive && (prune_dir.empty() || entry.path() != prune_dir))
        {
            scanDirectory(entry.path(), recursive, prune_dir, onNext);
            continue;
        }

        onNext(DirectoryEntry{entry.path().string(), type});
    }
}

EntryType FileUtils::entryTypeOf(const fs::file_status &status)
{
    switch (status.type())
    {
    case fs::file_type::regular:
        return EntryType::REGULAR;
    case fs::file_type::directory:
        return EntryType::DIRECTORY;
    case fs::file_type::symlink:
        return EntryType::SYMLINK;
    case fs::file_type::fifo:
        return EntryType::FIFO;
    case fs::file_type::socket:
        return EntryType::SOCKET;
    case fs::file_type::block:
        return EntryType::BLOCK_DEVICE;
    case fs::file_type::character:
        return EntryType::CHARACTER_DEVICE;
    default:
        return EntryType::OTHER;
    }
}

std::string FileUtils::getEntryTypeName(EntryType type)
{
    switch (type)
    {
    case EntryType::REGULAR:
        return "regular file";
    case EntryType::DIRECTORY:
        return "directory";
    case EntryType::SYMLINK:
        return "symlink";
    case EntryType::FIFO:
        return "fifo";
    case EntryType::SOCKET:
        return "socket";
    case EntryType::BLOCK_DEVICE:
        return "block device";
    case EntryType::CHARACTER_DEVICE:
        return "character device";
    default:
        return "special file";
    }
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    try
    {
        fs::path dir_path(path);
        return fs::exists(dir_path) && fs::is_directory(dir_path);
    }
    catch (const std::exception &e)
    {
        return false;
    }
}

bool FileUtils::isWithin(const fs::path &root, const fs::path &path)
{
    auto root_it = root.begin();
    auto path_it = path.begin();
    for (; root_it != root.end(); ++root_it, ++path_it)
    {
        // A trailing separator yields an empty final element
        if (root_it->empty())
            continue;
        if (path_it == path.end() || *root_it != *path_it)
            return false;
    }
    return true;
}

std::string FileUtils::sha256Hex(const std::string &data)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    if (SHA256_Init(&sha256) != 1)
        return "";
    if (SHA256_Update(&sha256, data.data(), data.size()) != 1)
        return "";
    if (SHA256_Final(hash, &sha256) != 1)
        return "";
    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return ss.str();
}

std::string FileUtils::computeJobId(const std::string &relative_path)
{
    std::string digest = sha256Hex(relative_path);
    if (digest.size() < JOB_ID_LENGTH)
        throw std::runtime_error("SHA-256 computation failed for: " + relative_path);
    return digest.substr(0, JOB_ID_LENGTH);
}
