#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/sanitization_types.hpp"
#include "core/sanitizer_config.hpp"

/**
 * @brief Settings shared by every job of a batch
 */
struct ExecutorSettings
{
    std::string output_dir;
    std::string worker_path;
    std::string log_level = "INFO";
    SandboxLimits limits;
    bool require_filesystem_isolation = false;
};

/**
 * @brief What a worker process left behind
 */
struct WorkerOutcome
{
    bool started = false;
    bool timed_out = false;
    int wait_status = 0;
    std::string report; // Raw bytes read from the result pipe
    ResourceUsage usage;
    std::string error_message;
};

/**
 * @brief Runs one job in a fresh, resource-bounded worker process
 *
 * The worker gets exactly three descriptors: the input (fd 3, read-only,
 * O_NOFOLLOW), a freshly created staging file (fd 4) and the result pipe
 * (fd 5). It never sees a path. The staging file is renamed to
 * <output>/<job_id>.<ext> only after the worker reports success and the
 * output signature checks out. It is unlinked on any failure.
 *
 * Safe to use from several pool threads at once: no state is shared
 * between jobs.
 */
class SandboxedExecutor
{
public:
    explicit SandboxedExecutor(const ExecutorSettings &settings);

    /**
     * @brief Create the staging directory
     * @throws std::runtime_error when the output directory is not usable
     */
    void prepare();

    SanitizationResult execute(SanitizationJob &job);

    /**
     * @brief Spawn a worker in probe mode under the same isolation
     * @return Probe JSON, or {"error": ...} when the worker did not report
     */
    nlohmann::json runProbe();

    std::string getStagingDir() const;
    std::string stagingPath(const SanitizationJob &job) const;
    std::string outputPath(const SanitizationJob &job) const;

    /**
     * @brief Failure kind for a worker that left no usable report
     */
    static FailureKind classifyTermination(const WorkerOutcome &outcome, std::string &message);

    // Container name the classifier reports for an output container
    static std::string expectedSignature(const std::string &container);

    static constexpr int WORKER_INPUT_FD = 3;
    static constexpr int WORKER_OUTPUT_FD = 4;
    static constexpr int WORKER_RESULT_FD = 5;
    static constexpr int EXIT_FAILURE_BASE = 64;
    static constexpr int EXIT_EXEC_FAILED = 127;
    static constexpr size_t MAX_REPORT_BYTES = 1024 * 1024;

private:
    ExecutorSettings settings_;

    WorkerOutcome spawnWorker(const std::vector<std::string> &args, int input_fd, int output_fd);
    int openStaging(const std::string &path, std::string &error);
    nlohmann::json buildJobDocument(const SanitizationJob &job) const;
    SanitizationResult finishFailure(SanitizationJob &job, FailureKind kind, const std::string &message);
};
