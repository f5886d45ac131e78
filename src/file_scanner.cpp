#include "core/file_scanner.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <stdexcept>

void to_json(nlohmann::json &j, const ExcludedEntry &entry)
{
    j = nlohmann::json{{"path", entry.relative_path}, {"reason", entry.reason}};
}

FileScanner::FileScanner(const std::string &input_root, const std::string &output_dir)
    : files_scanned_(0), files_accepted_(0), files_excluded_(0)
{
    std::error_code ec;
    input_root_ = fs::canonical(input_root, ec);
    if (ec)
        input_root_ = fs::path(input_root);

    if (!output_dir.empty())
    {
        output_dir_ = fs::weakly_canonical(output_dir, ec);
        if (ec)
            output_dir_ = fs::path(output_dir);
    }
    Logger::debug("FileScanner initialized for input root: " + input_root_.string());
}

ScanReport FileScanner::scanDirectory(bool recursive)
{
    Logger::info("Starting input scan: " + input_root_.string() + " (recursive: " + (recursive ? "yes" : "no") + ")");

    // Clear previous stats
    clearStats();

    ScanReport report;
    std::string scan_error;

    auto entry_stream = FileUtils::listEntriesAsObservable(input_root_.string(), recursive, output_dir_.string());
    entry_stream.subscribe(
        [this, &report](const DirectoryEntry &entry)
        {
            this->handleEntry(entry, report);
        },
        [&scan_error](const std::exception &error)
        {
            scan_error = error.what();
        },
        [this]()
        {
            Logger::info("Input scan completed. Scanned: " + std::to_string(files_scanned_) +
                         ", Accepted: " + std::to_string(files_accepted_) +
                         ", Excluded: " + std::to_string(files_excluded_));
        });

    if (!scan_error.empty())
        throw std::runtime_error("Cannot scan input directory: " + scan_error);

    std::sort(report.candidates.begin(), report.candidates.end(),
              [](const InputCandidate &a, const InputCandidate &b)
              { return a.relative_path < b.relative_path; });
    std::sort(report.excluded.begin(), report.excluded.end(),
              [](const ExcludedEntry &a, const ExcludedEntry &b)
              { return a.relative_path < b.relative_path; });
    return report;
}

void FileScanner::clearStats()
{
    files_scanned_ = 0;
    files_accepted_ = 0;
    files_excluded_ = 0;
}

void FileScanner::handleEntry(const DirectoryEntry &entry, ScanReport &report)
{
    files_scanned_++;
    fs::path path(entry.path);
    std::string relative = relativeTo(path);

    switch (entry.type)
    {
    case EntryType::REGULAR:
    {
        std::error_code ec;
        uint64_t size = fs::file_size(path, ec);
        if (ec)
        {
            exclude(relative, "unreadable file: " + ec.message(), false, report);
            return;
        }
        report.candidates.push_back(InputCandidate{path.string(), relative, size});
        files_accepted_++;
        Logger::trace("Accepted input: " + relative);
        return;
    }
    case EntryType::DIRECTORY:
    {
        if (!output_dir_.empty() && path == output_dir_)
        {
            exclude(relative, "output directory", false, report);
            return;
        }
        exclude(relative, "directory (recursive scan disabled)", false, report);
        return;
    }
    case EntryType::SYMLINK:
        handleSymlink(path, relative, report);
        return;
    default:
        exclude(relative, FileUtils::getEntryTypeName(entry.type), false, report);
        return;
    }
}

void FileScanner::handleSymlink(const fs::path &path, const std::string &relative, ScanReport &report)
{
    std::error_code ec;
    fs::path target = fs::canonical(path, ec);
    if (ec)
    {
        exclude(relative, "broken symlink", false, report);
        return;
    }

    if (!FileUtils::isWithin(input_root_, target))
    {
        exclude(relative, "symlink escapes input root", true, report);
        return;
    }

    fs::file_status status = fs::status(target, ec);
    if (ec || !fs::is_regular_file(status))
    {
        exclude(relative, "symlink to non-regular file", false, report);
        return;
    }

    uint64_t size = fs::file_size(target, ec);
    if (ec)
    {
        exclude(relative, "unreadable symlink target: " + ec.message(), false, report);
        return;
    }

    // The identity stays the link's own path, the executor opens the resolved target
    report.candidates.push_back(InputCandidate{target.string(), relative, size});
    files_accepted_++;
    Logger::trace("Accepted symlinked input: " + relative + " -> " + target.string());
}

void FileScanner::exclude(const std::string &relative, const std::string &reason, bool security, ScanReport &report)
{
    report.excluded.push_back(ExcludedEntry{relative, reason, security});
    files_excluded_++;
    if (security)
        Logger::warn("Excluded input " + relative + ": " + reason);
    else
        Logger::debug("Excluded input " + relative + ": " + reason);
}

std::string FileScanner::relativeTo(const fs::path &path) const
{
    return path.lexically_relative(input_root_).generic_string();
}
