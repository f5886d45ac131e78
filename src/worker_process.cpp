#include "core/worker_process.hpp"
#include "core/media_io.hpp"
#include "core/reconstruction/media_reconstructor.hpp"
#include "core/sandbox.hpp"
#include "core/sandboxed_executor.hpp"
#include "logging/logger.hpp"

nlohmann::json WorkerProcess::buildReport(const StageResult &result, const std::vector<std::string> &warnings,
                                          const nlohmann::json &sandbox)
{
    nlohmann::json report;
    report["status"] = JobStatuses::getName(result.success ? JobStatus::SUCCEEDED : JobStatus::FAILED);
    report["failure_kind"] = FailureKinds::getName(result.failure_kind);
    report["message"] = result.error_message;
    report["warnings"] = warnings;
    report["sandbox"] = sandbox;
    return report;
}

int WorkerProcess::exitCodeFor(const StageResult &result)
{
    if (result.success)
        return 0;
    return SandboxedExecutor::EXIT_FAILURE_BASE + FailureKinds::toIndex(result.failure_kind);
}

int WorkerProcess::finish(const StageResult &result, const std::vector<std::string> &warnings,
                          const nlohmann::json &sandbox)
{
    std::string report = buildReport(result, warnings, sandbox).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (!FdIo::writeFully(SandboxedExecutor::WORKER_RESULT_FD, report))
        Logger::error("Cannot write report to the executor");
    return exitCodeFor(result);
}

int WorkerProcess::run(const std::string &job_document)
{
    ReconstructionContext context;
    context.input_fd = SandboxedExecutor::WORKER_INPUT_FD;
    context.output_fd = SandboxedExecutor::WORKER_OUTPUT_FD;

    bool require_filesystem_isolation = false;
    std::string job_id;
    try
    {
        nlohmann::json job = nlohmann::json::parse(job_document);
        job_id = job.at("job_id").get<std::string>();
        context.record = job.at("record").get<MediaRecord>();
        context.plan = job.at("plan").get<ReconstructionPlan>();
        context.max_output_bytes = job.at("max_output_bytes").get<uint64_t>();
        require_filesystem_isolation = job.value("require_filesystem_isolation", false);
    }
    catch (const std::exception &e)
    {
        return finish(StageResult::fail(FailureKind::INTERNAL_INVARIANT_VIOLATION,
                                        "Malformed job document: " + std::string(e.what())),
                      {}, nlohmann::json::object());
    }

    Logger::setContext("worker " + job_id);

    SandboxReport sandbox;
    StageResult result = Sandbox::apply(require_filesystem_isolation, sandbox);
    if (!result.success)
    {
        Logger::error("Sandbox setup failed: " + result.error_message);
        return finish(result, {}, sandbox);
    }
    Logger::debug("Sandbox active: " + sandbox.describe());

    std::unique_ptr<MediaReconstructor> reconstructor = MediaReconstructor::create(context.plan.kind);
    if (!reconstructor)
        return finish(StageResult::fail(FailureKind::UNSUPPORTED_FORMAT, "No reconstructor for media kind " +
                                                                             MediaKinds::getName(context.plan.kind)),
                      {}, sandbox);

    result = reconstructor->run(context);
    if (result.success)
        Logger::debug(reconstructor->getName() + " finished with " + std::to_string(context.warnings.size()) +
                      " warnings");
    return finish(result, context.warnings, sandbox);
}

int WorkerProcess::runProbe(bool require_filesystem_isolation)
{
    Logger::setContext("probe");

    SandboxReport sandbox;
    StageResult result = Sandbox::apply(require_filesystem_isolation, sandbox);
    nlohmann::json report = Sandbox::probe(sandbox);
    if (!result.success)
        report["error"] = result.error_message;

    if (!FdIo::writeFully(SandboxedExecutor::WORKER_RESULT_FD, report.dump()))
    {
        Logger::error("Cannot write probe report");
        return SandboxedExecutor::EXIT_FAILURE_BASE + FailureKinds::toIndex(FailureKind::INTERNAL_INVARIANT_VIOLATION);
    }
    return exitCodeFor(result);
}
