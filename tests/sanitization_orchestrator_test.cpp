#include <gtest/gtest.h>
#include "core/sanitization_orchestrator.hpp"
#include "core/file_utils.hpp"
#include "test_media.hpp"
#include <fstream>

class SanitizationOrchestratorTest : public MediaTestBase
{
protected:
    void SetUp() override
    {
        MediaTestBase::SetUp();
        input_dir_ = test_dir_ / "input";
        output_dir_ = test_dir_ / "output";
        fs::create_directories(input_dir_);

        config_.log_level = "WARN";
        config_.input_dir = input_dir_.string();
        config_.output_dir = output_dir_.string();
        config_.max_jobs = 2;
        config_.queue_capacity = 2;
        config_.limits.wall_clock_seconds = 10;

        // Copies the input descriptor to the output and reports success
        fs::path worker = test_dir_ / "copy_worker.sh";
        TestMedia::writeFile(worker, std::string("#!/bin/sh\n/bin/cat <&3 >&4\n"
                                                 "printf '%s' '{\"status\":\"succeeded\"}' >&5\n"));
        fs::permissions(worker, fs::perms::owner_all);
        config_.worker_path = worker.string();
    }

    InputCandidate candidate(const std::string &relative)
    {
        fs::path path = input_dir_ / relative;
        return InputCandidate{path.string(), relative, fs::file_size(path)};
    }

    std::vector<nlohmann::json> logLines()
    {
        std::vector<nlohmann::json> lines;
        std::ifstream in(output_dir_ / "processing_log.json");
        std::string line;
        while (std::getline(in, line))
            lines.push_back(nlohmann::json::parse(line));
        return lines;
    }

    fs::path input_dir_;
    fs::path output_dir_;
    SanitizerConfig config_;
};

TEST_F(SanitizationOrchestratorTest, AdmitBuildsPlanFromContent)
{
    TestMedia::writeFile(input_dir_ / "song.jpg", TestMedia::makeWav(8000, 1, 0.1, "x"));
    SanitizationOrchestrator orchestrator(config_);

    SanitizationResult rejection;
    auto job = orchestrator.admit(candidate("song.jpg"), rejection);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->job_id, FileUtils::computeJobId("song.jpg"));
    EXPECT_EQ(job->record.kind, MediaKind::AUDIO);
    EXPECT_EQ(job->record.relative_path, "song.jpg");
    EXPECT_EQ(job->plan.extension, "m4a");
    EXPECT_EQ(job->status, JobStatus::PENDING);
}

TEST_F(SanitizationOrchestratorTest, DuplicateCandidateIsRejectedUnderFullDigest)
{
    TestMedia::writeFile(input_dir_ / "a.png", TestMedia::makePng(8, 8));
    SanitizationOrchestrator orchestrator(config_);

    SanitizationResult rejection;
    ASSERT_TRUE(orchestrator.admit(candidate("a.png"), rejection).has_value());
    EXPECT_FALSE(orchestrator.admit(candidate("a.png"), rejection).has_value());
    EXPECT_EQ(rejection.failure_kind, FailureKind::INTERNAL_INVARIANT_VIOLATION);
    EXPECT_EQ(rejection.job_id, FileUtils::sha256Hex("a.png"));
}

TEST_F(SanitizationOrchestratorTest, OversizedInputIsResourceExceeded)
{
    TestMedia::writeFile(input_dir_ / "big.png", TestMedia::makePng(64, 64));
    config_.max_input_bytes = 16;
    SanitizationOrchestrator orchestrator(config_);

    SanitizationResult rejection;
    EXPECT_FALSE(orchestrator.admit(candidate("big.png"), rejection).has_value());
    EXPECT_EQ(rejection.failure_kind, FailureKind::RESOURCE_EXCEEDED);
}

TEST_F(SanitizationOrchestratorTest, OverridesSelectLevelPerFile)
{
    config_.default_level = CdrLevel::TRANSCODE;
    config_.overrides["clips/movie.mkv"] = "hardcore";
    config_.overrides["broken.png"] = "extreme";
    TestMedia::writeFile(input_dir_ / "broken.png", TestMedia::makePng(8, 8));
    SanitizationOrchestrator orchestrator(config_);

    EXPECT_EQ(orchestrator.resolveLevel("clips/movie.mkv"), "hardcore");
    EXPECT_EQ(orchestrator.resolveLevel("other.mp4"), "TRANSCODE");

    SanitizationResult rejection;
    EXPECT_FALSE(orchestrator.admit(candidate("broken.png"), rejection).has_value());
    EXPECT_EQ(rejection.failure_kind, FailureKind::UNSUPPORTED_LEVEL);
    EXPECT_EQ(rejection.media_kind, MediaKind::IMAGE);
}

TEST_F(SanitizationOrchestratorTest, BatchRecordsEveryInput)
{
    TestMedia::writeFile(input_dir_ / "photo.png", TestMedia::makePng(16, 16));
    TestMedia::writeFile(input_dir_ / "notes.txt", std::string("plain text, not media at all"));
    TestMedia::writeFile(input_dir_ / "empty.mp4", std::vector<uint8_t>());
    TestMedia::writeFile(test_dir_ / "outside.png", TestMedia::makePng(8, 8));
    fs::create_symlink(test_dir_ / "outside.png", input_dir_ / "escape.png");

    SanitizationOrchestrator orchestrator(config_);
    BatchSummary summary = orchestrator.run();

    EXPECT_EQ(summary.submitted, 3u);
    EXPECT_EQ(summary.succeeded, 1u);
    EXPECT_EQ(summary.failed, 2u);
    EXPECT_EQ(summary.failures_by_kind["UnsupportedFormat"], 1u);
    EXPECT_EQ(summary.failures_by_kind["Truncated"], 1u);
    ASSERT_EQ(summary.excluded.size(), 1u);
    EXPECT_TRUE(summary.excluded[0].security_relevant);
    EXPECT_EQ(summary.requested_level, "TRANSCODE");

    ASSERT_EQ(summary.results.size(), 3u);
    EXPECT_EQ(summary.results[0].source_path, "empty.mp4");
    EXPECT_EQ(summary.results[2].source_path, "photo.png");
    EXPECT_TRUE(summary.results[2].succeeded());
    EXPECT_TRUE(fs::exists(output_dir_ / (FileUtils::computeJobId("photo.png") + ".png")));
    EXPECT_FALSE(fs::exists(output_dir_ / (FileUtils::computeJobId("empty.mp4") + ".mp4")));

    auto lines = logLines();
    ASSERT_GE(lines.size(), 2u);
    EXPECT_EQ(lines.front()["message"], "Sanitizer started");
    EXPECT_EQ(lines.back()["message"], "Sanitization complete");
    bool security_logged = false;
    for (const auto &line : lines)
    {
        if (line["type"] == "SECURITY" && line["file"].is_object() && line["file"]["file"] == "escape.png")
            security_logged = true;
    }
    EXPECT_TRUE(security_logged);

    ASSERT_TRUE(orchestrator.writeSummary(summary));
    std::ifstream in(output_dir_ / "summary.json");
    nlohmann::json written = nlohmann::json::parse(in);
    EXPECT_EQ(written["submitted"], 3);
    EXPECT_EQ(written["cdr_level"], "TRANSCODE");
}

TEST_F(SanitizationOrchestratorTest, EmptyInputProducesEmptySummary)
{
    SanitizationOrchestrator orchestrator(config_);
    BatchSummary summary = orchestrator.run();
    EXPECT_EQ(summary.submitted, 0u);
    EXPECT_FALSE(summary.hasFailures());
}

TEST_F(SanitizationOrchestratorTest, MissingInputDirectoryThrows)
{
    config_.input_dir = (test_dir_ / "absent").string();
    SanitizationOrchestrator orchestrator(config_);
    EXPECT_THROW(orchestrator.run(), std::runtime_error);
}

TEST_F(SanitizationOrchestratorTest, MissingWorkerThrows)
{
    config_.worker_path.clear();
    SanitizationOrchestrator orchestrator(config_);
    EXPECT_THROW(orchestrator.run(), std::runtime_error);
}
