#include "core/result_aggregator.hpp"
#include "logging/logger.hpp"
#include <algorithm>

StageResult ResultAggregator::add(const SanitizationResult &result)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (results_.count(result.job_id) > 0)
    {
        std::string msg = "Duplicate result for job " + result.job_id + " (" + result.source_path + ")";
        Logger::error(msg);
        return StageResult::fail(FailureKind::INTERNAL_INVARIANT_VIOLATION, msg);
    }

    results_.emplace(result.job_id, result);
    if (result.succeeded())
    {
        succeeded_++;
    }
    else
    {
        failed_++;
        failures_by_kind_[FailureKinds::toIndex(result.failure_kind)]++;
    }
    return StageResult::ok();
}

size_t ResultAggregator::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

size_t ResultAggregator::getSucceededCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return succeeded_;
}

size_t ResultAggregator::getFailedCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

size_t ResultAggregator::getFailureCount(FailureKind kind) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_by_kind_[FailureKinds::toIndex(kind)];
}

bool ResultAggregator::contains(const std::string &job_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.count(job_id) > 0;
}

std::vector<SanitizationResult> ResultAggregator::getResults() const
{
    std::vector<SanitizationResult> results;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        results.reserve(results_.size());
        for (const auto &[job_id, result] : results_)
            results.push_back(result);
    }
    std::sort(results.begin(), results.end(),
              [](const SanitizationResult &a, const SanitizationResult &b)
              { return a.source_path < b.source_path; });
    return results;
}

BatchSummary ResultAggregator::summarize(const std::vector<ExcludedEntry> &excluded, int64_t elapsed_ms) const
{
    BatchSummary summary;
    summary.results = getResults();
    summary.excluded = excluded;
    summary.elapsed_ms = elapsed_ms;

    std::lock_guard<std::mutex> lock(mutex_);
    summary.submitted = results_.size();
    summary.succeeded = succeeded_;
    summary.failed = failed_;
    for (int i = 0; i < FailureKinds::COUNT; ++i)
    {
        if (failures_by_kind_[i] > 0)
            summary.failures_by_kind[FailureKinds::getName(FailureKinds::fromIndex(i))] = failures_by_kind_[i];
    }
    return summary;
}

void to_json(nlohmann::json &j, const BatchSummary &summary)
{
    j = nlohmann::json{
        {"submitted", summary.submitted},
        {"succeeded", summary.succeeded},
        {"failed", summary.failed},
        {"failures_by_kind", summary.failures_by_kind},
        {"results", summary.results},
        {"excluded", summary.excluded},
        {"elapsed_ms", summary.elapsed_ms}};
    if (!summary.requested_level.empty())
        j["cdr_level"] = summary.requested_level;
}
