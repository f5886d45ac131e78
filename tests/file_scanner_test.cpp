#include <gtest/gtest.h>
#include "core/file_scanner.hpp"
#include "test_media.hpp"
#include <sys/stat.h>

class FileScannerTest : public MediaTestBase
{
protected:
    void SetUp() override
    {
        MediaTestBase::SetUp();
        input_ = test_dir_ / "input";
        fs::create_directories(input_ / "nested");
        TestMedia::writeFile(input_ / "b.png", TestMedia::makePng(4, 4));
        TestMedia::writeFile(input_ / "a.wav", TestMedia::makeWav(8000, 1, 0.1, "x"));
        TestMedia::writeFile(input_ / "nested" / "c.jpg", TestMedia::makeJpeg(4, 4));
    }

    static const ExcludedEntry *findExcluded(const ScanReport &report, const std::string &relative)
    {
        for (const auto &entry : report.excluded)
        {
            if (entry.relative_path == relative)
                return &entry;
        }
        return nullptr;
    }

    fs::path input_;
};

TEST_F(FileScannerTest, FlatScanExcludesSubdirectories)
{
    FileScanner scanner(input_.string());
    ScanReport report = scanner.scanDirectory(false);

    ASSERT_EQ(report.candidates.size(), 2u);
    EXPECT_EQ(report.candidates[0].relative_path, "a.wav");
    EXPECT_EQ(report.candidates[1].relative_path, "b.png");
    EXPECT_GT(report.candidates[1].size_bytes, 0u);

    const ExcludedEntry *nested = findExcluded(report, "nested");
    ASSERT_NE(nested, nullptr);
    EXPECT_FALSE(nested->security_relevant);
    EXPECT_EQ(scanner.getFilesScanned(), 3u);
    EXPECT_EQ(scanner.getFilesAccepted(), 2u);
}

TEST_F(FileScannerTest, RecursiveScanKeepsRelativePaths)
{
    FileScanner scanner(input_.string());
    ScanReport report = scanner.scanDirectory(true);

    ASSERT_EQ(report.candidates.size(), 3u);
    EXPECT_EQ(report.candidates[2].relative_path, "nested/c.jpg");
    EXPECT_TRUE(report.excluded.empty());
}

TEST_F(FileScannerTest, SpecialFilesAreExcluded)
{
    ASSERT_EQ(mkfifo((input_ / "pipe").c_str(), 0600), 0);

    FileScanner scanner(input_.string());
    ScanReport report = scanner.scanDirectory(false);

    const ExcludedEntry *pipe = findExcluded(report, "pipe");
    ASSERT_NE(pipe, nullptr);
    EXPECT_EQ(pipe->reason, "fifo");
}

TEST_F(FileScannerTest, EscapingSymlinkIsSecurityRelevant)
{
    fs::path outside = test_dir_ / "secret.png";
    TestMedia::writeFile(outside, TestMedia::makePng(4, 4));
    fs::create_symlink(outside, input_ / "escape.png");
    fs::create_symlink(input_ / "missing.png", input_ / "broken.png");

    FileScanner scanner(input_.string());
    ScanReport report = scanner.scanDirectory(false);

    const ExcludedEntry *escape = findExcluded(report, "escape.png");
    ASSERT_NE(escape, nullptr);
    EXPECT_TRUE(escape->security_relevant);

    const ExcludedEntry *broken = findExcluded(report, "broken.png");
    ASSERT_NE(broken, nullptr);
    EXPECT_FALSE(broken->security_relevant);
    EXPECT_EQ(broken->reason, "broken symlink");
}

TEST_F(FileScannerTest, InternalSymlinkResolvesToTarget)
{
    fs::create_symlink(input_ / "b.png", input_ / "alias.png");

    FileScanner scanner(input_.string());
    ScanReport report = scanner.scanDirectory(false);

    ASSERT_EQ(report.candidates.size(), 3u);
    EXPECT_EQ(report.candidates[0].relative_path, "a.wav");
    EXPECT_EQ(report.candidates[1].relative_path, "alias.png");
    EXPECT_EQ(report.candidates[1].source_path, fs::canonical(input_ / "b.png").string());
}

TEST_F(FileScannerTest, OutputInsideInputIsPruned)
{
    fs::path output = input_ / "sanitized";
    fs::create_directories(output);
    TestMedia::writeFile(output / "old.png", TestMedia::makePng(4, 4));

    FileScanner scanner(input_.string(), output.string());
    ScanReport report = scanner.scanDirectory(true);

    EXPECT_EQ(report.candidates.size(), 3u);
    const ExcludedEntry *out = findExcluded(report, "sanitized");
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(out->reason, "output directory");
}

TEST_F(FileScannerTest, MissingRootThrows)
{
    FileScanner scanner((test_dir_ / "nope").string());
    EXPECT_THROW(scanner.scanDirectory(false), std::runtime_error);
}

TEST_F(FileScannerTest, ExcludedEntryJson)
{
    nlohmann::json j = ExcludedEntry{"x/y", "fifo", false};
    EXPECT_EQ(j["path"], "x/y");
    EXPECT_EQ(j["reason"], "fifo");
}
