#pragma once

#include <tbb/concurrent_queue.h>
#include <tbb/global_control.h>
#include <tbb/task_arena.h>
#include <tbb/task_group.h>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include "core/sanitization_types.hpp"
#include "logging/logger.hpp"

/**
 * @brief Fixed-size pool of job loops fed through a bounded admission queue
 *
 * start() launches one loop per pool slot inside a dedicated task_arena.
 * Each loop pops a Pending job, hands it to the handler (which blocks on the
 * job's worker process) and repeats until it pops the end-of-batch marker.
 * submit() blocks while the queue is full.
 *
 * One instance serves one batch; independent batches use independent pools.
 */
class ThreadPoolManager
{
public:
    using JobHandler = std::function<void(SanitizationJob &)>;

    /**
     * @param num_threads Parallel job loops, 1-64
     * @param queue_capacity Pending jobs admitted ahead of the loops
     * @throws std::invalid_argument for an out-of-range thread count
     */
    ThreadPoolManager(size_t num_threads, size_t queue_capacity);
    ~ThreadPoolManager();

    ThreadPoolManager(const ThreadPoolManager &) = delete;
    ThreadPoolManager &operator=(const ThreadPoolManager &) = delete;

    void start(JobHandler handler);

    /**
     * @brief Queue one job, blocking while the queue is at capacity
     * @return false when the pool is not running
     */
    bool submit(SanitizationJob job);

    /**
     * @brief Signal end of batch and wait for every loop to drain
     */
    void finish();

    size_t getThreadCount() const { return num_threads_; }
    size_t getCompletedJobs() const { return completed_jobs_.load(); }

    // Jobs whose handler threw; the handler is expected to report its own failures
    size_t getHandlerErrors() const { return handler_errors_.load(); }

    static bool validateThreadCount(size_t thread_count);

    static constexpr size_t MAX_THREADS = 64;

private:
    size_t num_threads_;
    std::unique_ptr<tbb::global_control> global_control_;
    tbb::task_arena arena_;
    tbb::task_group group_;
    tbb::concurrent_bounded_queue<std::shared_ptr<SanitizationJob>> queue_;
    JobHandler handler_;
    bool running_ = false;
    std::atomic<size_t> completed_jobs_{0};
    std::atomic<size_t> handler_errors_{0};

    void workerLoop(size_t slot);
};
