#pragma once

#include "core/sanitization_types.hpp"
#include "core/file_scanner.hpp"
#include <array>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Batch-level report: counts, per-file outcomes and excluded inputs
 */
struct BatchSummary
{
    size_t submitted = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    std::map<std::string, size_t> failures_by_kind; // Only kinds that occurred
    std::vector<SanitizationResult> results;        // Sorted by source path
    std::vector<ExcludedEntry> excluded;
    int64_t elapsed_ms = 0;
    std::string requested_level;

    bool hasFailures() const { return failed > 0; }
};

void to_json(nlohmann::json &j, const BatchSummary &summary);

/**
 * @brief Thread-safe collector of exactly one SanitizationResult per job
 */
class ResultAggregator
{
public:
    ResultAggregator() = default;
    ResultAggregator(const ResultAggregator &) = delete;
    ResultAggregator &operator=(const ResultAggregator &) = delete;

    /**
     * @brief Record a terminal result
     * @return failed StageResult (InternalInvariantViolation) when the job id
     *         was already recorded; the first result is kept unchanged
     */
    StageResult add(const SanitizationResult &result);

    size_t size() const;
    size_t getSucceededCount() const;
    size_t getFailedCount() const;
    size_t getFailureCount(FailureKind kind) const;
    bool contains(const std::string &job_id) const;

    std::vector<SanitizationResult> getResults() const;

    /**
     * @brief Snapshot the collected results into a summary
     */
    BatchSummary summarize(const std::vector<ExcludedEntry> &excluded, int64_t elapsed_ms) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, SanitizationResult> results_; // job id -> result
    size_t succeeded_ = 0;
    size_t failed_ = 0;
    std::array<size_t, FailureKinds::COUNT> failures_by_kind_{};
};
