#include "core/thread_pool_manager.hpp"
#include <algorithm>
#include <stdexcept>

ThreadPoolManager::ThreadPoolManager(size_t num_threads, size_t queue_capacity)
    : num_threads_(num_threads), arena_(static_cast<int>(std::max<size_t>(1, std::min(num_threads, MAX_THREADS))), 0)
{
    if (!validateThreadCount(num_threads))
        throw std::invalid_argument("Thread count " + std::to_string(num_threads) + " is outside valid range [1-" +
                                    std::to_string(MAX_THREADS) + "]");

    // Every loop blocks on a child process and needs a thread of its own
    global_control_ = std::make_unique<tbb::global_control>(tbb::global_control::max_allowed_parallelism,
                                                            num_threads + 1);
    queue_.set_capacity(static_cast<std::ptrdiff_t>(queue_capacity > 0 ? queue_capacity : 1));
}

ThreadPoolManager::~ThreadPoolManager()
{
    if (running_)
        finish();
}

bool ThreadPoolManager::validateThreadCount(size_t thread_count)
{
    if (thread_count < 1 || thread_count > MAX_THREADS)
    {
        Logger::warn("Thread count " + std::to_string(thread_count) + " is outside valid range [1-" +
                     std::to_string(MAX_THREADS) + "]");
        return false;
    }
    return true;
}

void ThreadPoolManager::start(JobHandler handler)
{
    if (running_)
    {
        Logger::warn("Thread pool already running");
        return;
    }
    handler_ = std::move(handler);
    running_ = true;

    arena_.execute([this]()
                   {
        for (size_t slot = 0; slot < num_threads_; ++slot)
        {
            group_.run([this, slot]() { workerLoop(slot); });
        } });

    Logger::debug("Thread pool started with " + std::to_string(num_threads_) + " job loops, queue capacity " +
                  std::to_string(queue_.capacity()));
}

bool ThreadPoolManager::submit(SanitizationJob job)
{
    if (!running_)
    {
        Logger::error("Cannot submit job " + job.job_id + ": thread pool is not running");
        return false;
    }
    queue_.push(std::make_shared<SanitizationJob>(std::move(job)));
    return true;
}

void ThreadPoolManager::finish()
{
    if (!running_)
        return;

    // One end-of-batch marker per loop
    for (size_t slot = 0; slot < num_threads_; ++slot)
        queue_.push(nullptr);

    arena_.execute([this]()
                   { group_.wait(); });
    running_ = false;

    Logger::debug("Thread pool drained after " + std::to_string(completed_jobs_.load()) + " jobs");
}

void ThreadPoolManager::workerLoop(size_t slot)
{
    Logger::trace("Job loop " + std::to_string(slot) + " started");
    while (true)
    {
        std::shared_ptr<SanitizationJob> job;
        queue_.pop(job);
        if (!job)
            break;

        try
        {
            handler_(*job);
        }
        catch (const std::exception &e)
        {
            handler_errors_++;
            Logger::error("Job handler failed for " + job->job_id + ": " + std::string(e.what()));
        }
        completed_jobs_++;
    }
    Logger::trace("Job loop " + std::to_string(slot) + " finished");
}
