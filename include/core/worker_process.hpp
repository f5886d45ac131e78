#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/sanitization_types.hpp"

/**
 * @brief Body of a sandboxed worker process
 *
 * Started by SandboxedExecutor with the input on fd 3, the staging output
 * on fd 4 and the result pipe on fd 5. The worker isolates itself before
 * touching a single input byte, reconstructs, writes one JSON report to
 * fd 5 and exits with 0 or 64 + the failure index.
 */
class WorkerProcess
{
public:
    /**
     * @brief Run one job described by the executor's job document
     * @return Process exit code
     */
    static int run(const std::string &job_document);

    /**
     * @brief Apply the sandbox and report which accesses are still possible
     * @return Process exit code
     */
    static int runProbe(bool require_filesystem_isolation);

    static nlohmann::json buildReport(const StageResult &result, const std::vector<std::string> &warnings,
                                      const nlohmann::json &sandbox);

    static int exitCodeFor(const StageResult &result);

private:
    static int finish(const StageResult &result, const std::vector<std::string> &warnings,
                      const nlohmann::json &sandbox);
};
