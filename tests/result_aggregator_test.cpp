#include <gtest/gtest.h>
#include "core/result_aggregator.hpp"
#include "logging/logger.hpp"
#include <thread>

class ResultAggregatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");
    }

    static SanitizationResult succeeded(const std::string &id, const std::string &source)
    {
        SanitizationJob job;
        job.job_id = id;
        job.record.relative_path = source;
        job.record.kind = MediaKind::IMAGE;
        job.plan.requested_level = CdrLevel::TRANSCODE;
        job.plan.effective_level = CdrLevel::TRANSCODE;
        job.advance(JobStatus::RUNNING);
        job.advance(JobStatus::SUCCEEDED);
        return SanitizationResult::success(job, "/out/" + id + ".png");
    }

    ResultAggregator aggregator_;
};

TEST_F(ResultAggregatorTest, CountsSuccessesAndFailuresByKind)
{
    EXPECT_TRUE(aggregator_.add(succeeded("a", "a.png")).success);
    EXPECT_TRUE(aggregator_.add(SanitizationResult::failure("b", "b.mp4", FailureKind::TRUNCATED, "empty")).success);
    EXPECT_TRUE(aggregator_.add(SanitizationResult::failure("c", "c.txt", FailureKind::UNSUPPORTED_FORMAT, "text")).success);
    EXPECT_TRUE(aggregator_.add(SanitizationResult::failure("d", "d.mp4", FailureKind::TRUNCATED, "short")).success);

    EXPECT_EQ(aggregator_.size(), 4u);
    EXPECT_EQ(aggregator_.getSucceededCount(), 1u);
    EXPECT_EQ(aggregator_.getFailedCount(), 3u);
    EXPECT_EQ(aggregator_.getFailureCount(FailureKind::TRUNCATED), 2u);
    EXPECT_EQ(aggregator_.getFailureCount(FailureKind::DECODE_ERROR), 0u);
}

TEST_F(ResultAggregatorTest, DuplicateJobIdKeepsFirstResult)
{
    ASSERT_TRUE(aggregator_.add(succeeded("same", "x.png")).success);

    auto duplicate = aggregator_.add(SanitizationResult::failure("same", "x.png", FailureKind::DECODE_ERROR, "late"));
    EXPECT_FALSE(duplicate.success);
    EXPECT_EQ(duplicate.failure_kind, FailureKind::INTERNAL_INVARIANT_VIOLATION);

    auto results = aggregator_.getResults();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].succeeded());
    EXPECT_EQ(aggregator_.getFailedCount(), 0u);
}

TEST_F(ResultAggregatorTest, ResultsAreSortedBySourcePath)
{
    aggregator_.add(succeeded("1", "zebra.png"));
    aggregator_.add(succeeded("2", "apple.png"));
    aggregator_.add(succeeded("3", "dir/mango.png"));

    auto results = aggregator_.getResults();
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].source_path, "apple.png");
    EXPECT_EQ(results[1].source_path, "dir/mango.png");
    EXPECT_EQ(results[2].source_path, "zebra.png");
}

TEST_F(ResultAggregatorTest, SummaryJsonListsOnlyOccurringKinds)
{
    aggregator_.add(succeeded("a", "a.png"));
    aggregator_.add(SanitizationResult::failure("b", "b.mp4", FailureKind::TRUNCATED, "empty"));

    std::vector<ExcludedEntry> excluded = {{"fifo", "Not a regular file", false}};
    BatchSummary summary = aggregator_.summarize(excluded, 42);
    summary.requested_level = "TRANSCODE";
    EXPECT_TRUE(summary.hasFailures());

    nlohmann::json j = summary;
    EXPECT_EQ(j["submitted"], 2);
    EXPECT_EQ(j["succeeded"], 1);
    EXPECT_EQ(j["failed"], 1);
    EXPECT_EQ(j["elapsed_ms"], 42);
    EXPECT_EQ(j["cdr_level"], "TRANSCODE");
    ASSERT_EQ(j["failures_by_kind"].size(), 1u);
    EXPECT_EQ(j["failures_by_kind"]["Truncated"], 1);
    ASSERT_EQ(j["results"].size(), 2u);
    EXPECT_EQ(j["results"][1]["failure_kind"], "Truncated");
    EXPECT_EQ(j["results"][1]["message"], "empty");
    ASSERT_EQ(j["excluded"].size(), 1u);
}

TEST_F(ResultAggregatorTest, EmptyBatchHasNoFailures)
{
    BatchSummary summary = aggregator_.summarize({}, 0);
    EXPECT_FALSE(summary.hasFailures());
    nlohmann::json j = summary;
    EXPECT_EQ(j["submitted"], 0);
    EXPECT_TRUE(j["failures_by_kind"].empty());
    EXPECT_FALSE(j.contains("cdr_level"));
}

TEST_F(ResultAggregatorTest, ConcurrentAddsAreAllRecorded)
{
    const int threads = 8;
    const int per_thread = 50;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t)
    {
        workers.emplace_back([this, t, per_thread]()
                             {
            for (int i = 0; i < per_thread; ++i)
            {
                std::string id = std::to_string(t) + "-" + std::to_string(i);
                if (i % 2 == 0)
                    aggregator_.add(succeeded(id, id + ".png"));
                else
                    aggregator_.add(SanitizationResult::failure(id, id + ".bin", FailureKind::DECODE_ERROR, "bad"));
            } });
    }
    for (auto &worker : workers)
        worker.join();

    EXPECT_EQ(aggregator_.size(), static_cast<size_t>(threads * per_thread));
    EXPECT_EQ(aggregator_.getSucceededCount(), static_cast<size_t>(threads * per_thread / 2));
    EXPECT_EQ(aggregator_.getFailureCount(FailureKind::DECODE_ERROR), static_cast<size_t>(threads * per_thread / 2));
}
