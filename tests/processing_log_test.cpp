#include <gtest/gtest.h>
#include "core/processing_log.hpp"
#include "test_media.hpp"
#include <fstream>

class ProcessingLogTest : public MediaTestBase
{
protected:
    std::vector<nlohmann::json> readLines(const fs::path &path)
    {
        std::vector<nlohmann::json> lines;
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line))
        {
            if (!line.empty())
                lines.push_back(nlohmann::json::parse(line));
        }
        return lines;
    }
};

TEST_F(ProcessingLogTest, WritesOneJsonObjectPerEvent)
{
    fs::path path = test_dir_ / "processing_log.json";
    ProcessingLog log;
    ASSERT_TRUE(log.open(path.string()));
    EXPECT_TRUE(log.isOpen());

    log.log(LogEventType::SYSTEM, "Sanitizer started");
    log.log(LogEventType::SUCCESS, "Sanitized image at TRANSCODE", ProcessingLog::fileInfo("a.png", "abc.png"));
    log.log(LogEventType::SECURITY, "Excluded: symlink escapes input root", ProcessingLog::fileInfo("evil.png"));

    auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0]["type"], "SYSTEM");
    EXPECT_TRUE(lines[0]["file"].is_null());
    EXPECT_EQ(lines[1]["type"], "SUCCESS");
    EXPECT_EQ(lines[1]["file"]["input"], "a.png");
    EXPECT_EQ(lines[1]["file"]["output"], "abc.png");
    EXPECT_EQ(lines[2]["type"], "SECURITY");
    EXPECT_EQ(lines[2]["file"]["file"], "evil.png");
    EXPECT_FALSE(lines[2]["timestamp"].get<std::string>().empty());
}

TEST_F(ProcessingLogTest, AppendsAcrossReopen)
{
    fs::path path = test_dir_ / "log.json";
    {
        ProcessingLog log;
        ASSERT_TRUE(log.open(path.string()));
        log.log(LogEventType::INFO, "first");
    }
    ProcessingLog log;
    ASSERT_TRUE(log.open(path.string()));
    log.log(LogEventType::INFO, "second");

    auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1]["message"], "second");
}

TEST_F(ProcessingLogTest, UnopenableLogOnlyMirrorsToLogger)
{
    ProcessingLog log;
    EXPECT_FALSE(log.open((test_dir_ / "missing" / "log.json").string()));
    EXPECT_FALSE(log.isOpen());
    log.log(LogEventType::ERROR, "still reported");
}

TEST_F(ProcessingLogTest, NonUtf8PathsAreReplaced)
{
    fs::path path = test_dir_ / "log.json";
    ProcessingLog log;
    ASSERT_TRUE(log.open(path.string()));
    log.log(LogEventType::SKIP, "Excluded: fifo", ProcessingLog::fileInfo(std::string("bad\xff.bin")));

    auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["type"], "SKIP");
}

TEST_F(ProcessingLogTest, TypeNames)
{
    EXPECT_EQ(ProcessingLog::getTypeName(LogEventType::WARNING), "WARNING");
    EXPECT_EQ(ProcessingLog::getTypeName(LogEventType::INFO), "INFO");
    EXPECT_EQ(ProcessingLog::getTypeName(LogEventType::SKIP), "SKIP");
}
