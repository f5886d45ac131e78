#include <gtest/gtest.h>
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <vector>
#include <string>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

class FileUtilsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");

        // Create test directory structure
        fs::create_directories("test_dir/subdir1");
        fs::create_directories("test_dir/subdir2");

        // Create test files
        std::ofstream("test_dir/file1.mp4").close();
        std::ofstream("test_dir/file2.jpg").close();
        std::ofstream("test_dir/subdir1/file3.wav").close();
        std::ofstream("test_dir/subdir2/file4.png").close();
    }

    void TearDown() override
    {
        // Clean up test directory
        fs::remove_all("test_dir");
    }

    static std::vector<DirectoryEntry> collect(const std::string &dir, bool recursive, const std::string &prune = "")
    {
        std::vector<DirectoryEntry> entries;
        bool completed = false;
        auto observable = FileUtils::listEntriesAsObservable(dir, recursive, prune);
        observable.subscribe(
            [&entries](const DirectoryEntry &entry)
            {
                entries.push_back(entry);
            },
            [](const std::exception &e)
            {
                ADD_FAILURE() << "Unexpected error in entry listing: " << e.what();
            },
            [&completed]()
            {
                completed = true;
            });
        EXPECT_TRUE(completed);
        return entries;
    }

    static size_t countType(const std::vector<DirectoryEntry> &entries, EntryType type)
    {
        size_t count = 0;
        for (const auto &entry : entries)
        {
            if (entry.type == type)
                count++;
        }
        return count;
    }
};

TEST_F(FileUtilsTest, ListEntriesNonRecursive)
{
    auto entries = collect("test_dir", false);

    // 2 files and 2 directories in the root
    EXPECT_EQ(entries.size(), 4);
    EXPECT_EQ(countType(entries, EntryType::REGULAR), 2);
    EXPECT_EQ(countType(entries, EntryType::DIRECTORY), 2);
}

TEST_F(FileUtilsTest, ListEntriesRecursive)
{
    auto entries = collect("test_dir", true);

    // Subdirectories are descended into instead of emitted
    EXPECT_EQ(entries.size(), 4);
    EXPECT_EQ(countType(entries, EntryType::REGULAR), 4);

    bool found_file3 = false, found_file4 = false;
    for (const auto &entry : entries)
    {
        if (entry.path.find("file3.wav") != std::string::npos)
            found_file3 = true;
        if (entry.path.find("file4.png") != std::string::npos)
            found_file4 = true;
    }
    EXPECT_TRUE(found_file3);
    EXPECT_TRUE(found_file4);
}

TEST_F(FileUtilsTest, PrunedDirectoryIsEmittedNotEntered)
{
    auto entries = collect("test_dir", true, "test_dir/subdir2");

    EXPECT_EQ(countType(entries, EntryType::REGULAR), 3);
    ASSERT_EQ(countType(entries, EntryType::DIRECTORY), 1);
    for (const auto &entry : entries)
    {
        EXPECT_EQ(entry.path.find("file4.png"), std::string::npos);
    }
}

TEST_F(FileUtilsTest, SymlinksAndFifosAreReportedByType)
{
    fs::create_symlink("file1.mp4", "test_dir/link.mp4");
    ASSERT_EQ(mkfifo("test_dir/pipe", 0600), 0);

    auto entries = collect("test_dir", false);
    EXPECT_EQ(countType(entries, EntryType::SYMLINK), 1);
    EXPECT_EQ(countType(entries, EntryType::FIFO), 1);
    EXPECT_EQ(countType(entries, EntryType::REGULAR), 2);
}

TEST_F(FileUtilsTest, InvalidDirectory)
{
    bool error_received = false;
    std::string error_message;

    auto observable = FileUtils::listEntriesAsObservable("nonexistent_dir", false);
    observable.subscribe(
        [](const DirectoryEntry &)
        {
            FAIL() << "Should not receive any entries for invalid directory";
        },
        [&error_received, &error_message](const std::exception &e)
        {
            error_received = true;
            error_message = e.what();
        },
        []()
        {
            FAIL() << "Should not complete successfully for invalid directory";
        });

    EXPECT_TRUE(error_received);
    EXPECT_TRUE(error_message.find("Invalid directory path") != std::string::npos);
}

TEST_F(FileUtilsTest, IsWithinComparesWholeComponents)
{
    EXPECT_TRUE(FileUtils::isWithin("/data/in", "/data/in/a.mp4"));
    EXPECT_TRUE(FileUtils::isWithin("/data/in/", "/data/in/sub/b.png"));
    EXPECT_FALSE(FileUtils::isWithin("/data/in", "/data/input/a.mp4"));
    EXPECT_FALSE(FileUtils::isWithin("/data/in", "/etc/passwd"));
}

TEST_F(FileUtilsTest, JobIdIsStableTruncatedDigest)
{
    std::string id = FileUtils::computeJobId("clips/holiday.mkv");
    EXPECT_EQ(id.size(), FileUtils::JOB_ID_LENGTH);
    EXPECT_EQ(id, FileUtils::computeJobId("clips/holiday.mkv"));
    EXPECT_NE(id, FileUtils::computeJobId("clips/holiday2.mkv"));

    // SHA-256 of the empty string
    EXPECT_EQ(FileUtils::sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(FileUtils::computeJobId(""), "e3b0c44298fc1c149afbf4c8");
}
