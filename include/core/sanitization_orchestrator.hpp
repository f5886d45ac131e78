#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include "core/file_scanner.hpp"
#include "core/processing_log.hpp"
#include "core/result_aggregator.hpp"
#include "core/sandboxed_executor.hpp"
#include "core/sanitizer_config.hpp"

/**
 * @brief Runs one sanitization batch from an explicit configuration
 *
 * Error handling policy:
 * - Setup errors (input directory unreadable, output directory not creatable,
 *   worker not executable) throw std::runtime_error from run().
 * - Every per-file problem becomes a failed SanitizationResult in the summary
 *   and an ERROR or SECURITY line in the processing log.
 * - Nothing is retried.
 *
 * No global state: two orchestrators with different configurations can run
 * side by side as long as their output directories differ.
 */
class SanitizationOrchestrator
{
public:
    explicit SanitizationOrchestrator(const SanitizerConfig &config);

    /**
     * @brief Scan, classify, plan, execute and aggregate the whole input directory
     * @throws std::runtime_error on setup errors
     */
    BatchSummary run();

    /**
     * @brief Write the summary to <output>/summary.json
     * @return false when the file cannot be written
     */
    bool writeSummary(const BatchSummary &summary) const;

    const SanitizerConfig &getConfig() const { return config_; }

    /**
     * @brief Job for one candidate, or the failure that stops it before execution
     *
     * Order of checks: duplicate job id, input size bound, content
     * classification, level resolution and plan.
     */
    std::optional<SanitizationJob> admit(const InputCandidate &candidate, SanitizationResult &rejection);

    // Level name for a relative path: explicit override or the batch default
    std::string resolveLevel(const std::string &relative_path) const;

private:
    SanitizerConfig config_;
    ProcessingLog processing_log_;
    ResultAggregator aggregator_;
    std::set<std::string> assigned_job_ids_;
    std::unique_ptr<SandboxedExecutor> executor_;

    void prepareDirectories();
    void reportExcluded(const std::vector<ExcludedEntry> &excluded);
    void handleJob(SanitizationJob &job);
    void record(const SanitizationResult &result);
};
