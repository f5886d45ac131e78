#include <gtest/gtest.h>
#include "core/thread_pool_manager.hpp"
#include <chrono>
#include <mutex>
#include <set>
#include <thread>

class ThreadPoolManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");
    }

    static SanitizationJob job(const std::string &id)
    {
        SanitizationJob j;
        j.job_id = id;
        return j;
    }
};

TEST_F(ThreadPoolManagerTest, RejectsOutOfRangeThreadCounts)
{
    EXPECT_THROW(ThreadPoolManager(0, 4), std::invalid_argument);
    EXPECT_THROW(ThreadPoolManager(ThreadPoolManager::MAX_THREADS + 1, 4), std::invalid_argument);
    EXPECT_TRUE(ThreadPoolManager::validateThreadCount(1));
    EXPECT_TRUE(ThreadPoolManager::validateThreadCount(ThreadPoolManager::MAX_THREADS));
    EXPECT_FALSE(ThreadPoolManager::validateThreadCount(0));
}

TEST_F(ThreadPoolManagerTest, SubmitBeforeStartFails)
{
    ThreadPoolManager pool(2, 4);
    EXPECT_FALSE(pool.submit(job("early")));
}

TEST_F(ThreadPoolManagerTest, EveryJobIsHandledExactlyOnce)
{
    ThreadPoolManager pool(4, 2);
    std::mutex mutex;
    std::multiset<std::string> seen;

    pool.start([&](SanitizationJob &j)
               {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        std::lock_guard<std::mutex> lock(mutex);
        seen.insert(j.job_id); });

    const int total = 40;
    for (int i = 0; i < total; ++i)
        ASSERT_TRUE(pool.submit(job("job-" + std::to_string(i))));
    pool.finish();

    EXPECT_EQ(pool.getCompletedJobs(), static_cast<size_t>(total));
    EXPECT_EQ(seen.size(), static_cast<size_t>(total));
    for (int i = 0; i < total; ++i)
        EXPECT_EQ(seen.count("job-" + std::to_string(i)), 1u);
}

TEST_F(ThreadPoolManagerTest, ConcurrencyNeverExceedsThreadCount)
{
    const size_t threads = 3;
    ThreadPoolManager pool(threads, 1);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    pool.start([&](SanitizationJob &)
               {
        int now = ++active;
        int previous = peak.load();
        while (now > previous && !peak.compare_exchange_weak(previous, now))
        {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        --active; });

    for (int i = 0; i < 12; ++i)
        pool.submit(job(std::to_string(i)));
    pool.finish();

    EXPECT_EQ(pool.getCompletedJobs(), 12u);
    EXPECT_GE(peak.load(), 1);
    EXPECT_LE(peak.load(), static_cast<int>(threads));
}

TEST_F(ThreadPoolManagerTest, ThrowingHandlerDoesNotStopTheLoop)
{
    ThreadPoolManager pool(2, 4);
    std::atomic<int> handled{0};

    pool.start([&](SanitizationJob &j)
               {
        if (j.job_id == "bad")
            throw std::runtime_error("boom");
        handled++; });

    pool.submit(job("a"));
    pool.submit(job("bad"));
    pool.submit(job("b"));
    pool.finish();

    EXPECT_EQ(handled.load(), 2);
    EXPECT_EQ(pool.getHandlerErrors(), 1u);
    EXPECT_EQ(pool.getCompletedJobs(), 3u);
}

TEST_F(ThreadPoolManagerTest, FinishWithoutJobsReturns)
{
    ThreadPoolManager pool(4, 4);
    pool.start([](SanitizationJob &) {});
    pool.finish();
    EXPECT_EQ(pool.getCompletedJobs(), 0u);
    EXPECT_FALSE(pool.submit(job("late")));
}
