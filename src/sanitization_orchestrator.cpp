#include "core/sanitization_orchestrator.hpp"
#include "core/file_utils.hpp"
#include "core/policy_engine.hpp"
#include "core/thread_pool_manager.hpp"
#include "core/type_classifier.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <fstream>
#include <stdexcept>

SanitizationOrchestrator::SanitizationOrchestrator(const SanitizerConfig &config) : config_(config)
{
    ExecutorSettings settings;
    settings.output_dir = config_.output_dir;
    settings.worker_path = config_.worker_path;
    settings.log_level = config_.log_level;
    settings.limits = config_.limits;
    settings.require_filesystem_isolation = config_.require_filesystem_isolation;
    executor_ = std::make_unique<SandboxedExecutor>(settings);
}

void SanitizationOrchestrator::prepareDirectories()
{
    if (!FileUtils::isValidDirectory(config_.input_dir))
        throw std::runtime_error("Input directory is not readable: " + config_.input_dir);

    std::error_code ec;
    fs::create_directories(config_.output_dir, ec);
    if (ec)
        throw std::runtime_error("Cannot create output directory " + config_.output_dir + ": " + ec.message());

    if (config_.worker_path.empty())
        throw std::runtime_error("No worker executable configured");

    executor_->prepare();

    fs::path log_path(config_.processing_log);
    if (log_path.is_relative())
        log_path = fs::path(config_.output_dir) / log_path;
    if (!processing_log_.open(log_path.string()))
        Logger::warn("Continuing without processing log");
}

std::string SanitizationOrchestrator::resolveLevel(const std::string &relative_path) const
{
    auto it = config_.overrides.find(relative_path);
    if (it != config_.overrides.end())
        return it->second;
    return CdrLevels::getLevelName(config_.default_level);
}

std::optional<SanitizationJob> SanitizationOrchestrator::admit(const InputCandidate &candidate,
                                                               SanitizationResult &rejection)
{
    const std::string &relative = candidate.relative_path;
    std::string job_id = FileUtils::computeJobId(relative);

    if (!assigned_job_ids_.insert(job_id).second)
    {
        // The full digest keeps the rejected entry distinct in the summary
        rejection = SanitizationResult::failure(FileUtils::sha256Hex(relative), relative,
                                                FailureKind::INTERNAL_INVARIANT_VIOLATION,
                                                "Job id " + job_id + " is already assigned to another input");
        return std::nullopt;
    }

    if (candidate.size_bytes > config_.max_input_bytes)
    {
        processing_log_.log(LogEventType::SECURITY, "File size exceeds limit", ProcessingLog::fileInfo(relative));
        rejection = SanitizationResult::failure(job_id, relative, FailureKind::RESOURCE_EXCEEDED,
                                                "Input is " + std::to_string(candidate.size_bytes) +
                                                    " bytes, limit is " + std::to_string(config_.max_input_bytes));
        return std::nullopt;
    }

    ClassificationResult classification = TypeClassifier::classifyFile(candidate.source_path);
    if (!classification.success)
    {
        rejection = SanitizationResult::failure(job_id, relative, classification.failure_kind,
                                                classification.error_message);
        return std::nullopt;
    }
    MediaRecord media = classification.record;
    media.relative_path = relative;

    std::string level_name = resolveLevel(relative);
    PlanResult plan = PolicyEngine::buildPlan(media, level_name, config_.policy);
    if (!plan.success)
    {
        rejection = SanitizationResult::failure(job_id, relative, plan.failure_kind, plan.error_message);
        rejection.media_kind = media.kind;
        return std::nullopt;
    }

    SanitizationJob job;
    job.job_id = job_id;
    job.record = media;
    job.plan = plan.plan;
    Logger::debug("Admitted " + relative + " as " + MediaKinds::getName(media.kind) + "/" + media.container +
                  " at " + CdrLevels::getLevelName(job.plan.effective_level) + " (" + job_id + ")");
    return job;
}

void SanitizationOrchestrator::record(const SanitizationResult &result)
{
    StageResult added = aggregator_.add(result);
    if (!added.success)
    {
        processing_log_.log(LogEventType::ERROR, added.error_message, ProcessingLog::fileInfo(result.source_path));
        return;
    }

    if (result.succeeded())
    {
        std::string level = result.effective_level ? CdrLevels::getLevelName(*result.effective_level) : "";
        processing_log_.log(LogEventType::SUCCESS,
                            "Sanitized " + MediaKinds::getName(result.media_kind) + " at " + level,
                            ProcessingLog::fileInfo(result.source_path, fs::path(result.output_path).filename().string()));
        if (!result.degradation_note.empty())
            processing_log_.log(LogEventType::WARNING, result.degradation_note,
                                ProcessingLog::fileInfo(result.source_path));
        for (const auto &warning : result.warnings)
            processing_log_.log(LogEventType::WARNING, warning, ProcessingLog::fileInfo(result.source_path));
        return;
    }

    std::string message = FailureKinds::getName(result.failure_kind) + ": " + result.error_message;
    LogEventType type = LogEventType::ERROR;
    if (result.failure_kind == FailureKind::RESOURCE_EXCEEDED)
        type = LogEventType::SECURITY;
    else if (result.failure_kind == FailureKind::UNSUPPORTED_FORMAT)
        type = LogEventType::SKIP;
    processing_log_.log(type, message, ProcessingLog::fileInfo(result.source_path));
}

void SanitizationOrchestrator::handleJob(SanitizationJob &job)
{
    SanitizationResult result;
    try
    {
        result = executor_->execute(job);
    }
    catch (const std::exception &e)
    {
        Logger::error("Executor failed on " + job.record.relative_path + ": " + std::string(e.what()));
        result = SanitizationResult::failure(job.job_id, job.record.relative_path,
                                             FailureKind::INTERNAL_INVARIANT_VIOLATION, e.what());
        result.media_kind = job.record.kind;
    }
    record(result);
}

void SanitizationOrchestrator::reportExcluded(const std::vector<ExcludedEntry> &excluded)
{
    for (const auto &entry : excluded)
    {
        processing_log_.log(entry.security_relevant ? LogEventType::SECURITY : LogEventType::SKIP,
                            "Excluded: " + entry.reason, ProcessingLog::fileInfo(entry.relative_path));
    }
}

BatchSummary SanitizationOrchestrator::run()
{
    auto batch_start = std::chrono::steady_clock::now();

    prepareDirectories();
    processing_log_.log(LogEventType::SYSTEM, "Sanitizer started",
                        nlohmann::json{{"level", CdrLevels::getLevelName(config_.default_level)},
                                       {"input", config_.input_dir},
                                       {"output", config_.output_dir}});

    FileScanner scanner(config_.input_dir, config_.output_dir);
    ScanReport scan = scanner.scanDirectory(config_.recursive);
    reportExcluded(scan.excluded);

    if (scan.candidates.empty())
    {
        processing_log_.log(LogEventType::INFO, "No files found in input directory");
    }
    else
    {
        Logger::info("Sanitizing " + std::to_string(scan.candidates.size()) + " files with " +
                     std::to_string(config_.max_jobs) + " parallel jobs");

        ThreadPoolManager pool(static_cast<size_t>(config_.max_jobs), static_cast<size_t>(config_.queue_capacity));
        pool.start([this](SanitizationJob &job)
                   { handleJob(job); });

        for (const auto &candidate : scan.candidates)
        {
            SanitizationResult rejection;
            std::optional<SanitizationJob> job = admit(candidate, rejection);
            if (!job)
            {
                record(rejection);
                continue;
            }
            if (!pool.submit(std::move(*job)))
                record(SanitizationResult::failure(FileUtils::computeJobId(candidate.relative_path), candidate.relative_path,
                                                   FailureKind::INTERNAL_INVARIANT_VIOLATION, "Job pool not running"));
        }
        pool.finish();

        if (pool.getHandlerErrors() > 0)
            Logger::error(std::to_string(pool.getHandlerErrors()) + " jobs ended without a recorded result");
    }

    int64_t elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - batch_start).count();
    BatchSummary summary = aggregator_.summarize(scan.excluded, elapsed_ms);
    summary.requested_level = CdrLevels::getLevelName(config_.default_level);

    processing_log_.log(LogEventType::SYSTEM, "Sanitization complete",
                        nlohmann::json{{"submitted", summary.submitted},
                                       {"succeeded", summary.succeeded},
                                       {"failed", summary.failed},
                                       {"excluded", summary.excluded.size()}});
    return summary;
}

bool SanitizationOrchestrator::writeSummary(const BatchSummary &summary) const
{
    fs::path path = fs::path(config_.output_dir) / "summary.json";
    std::ofstream out(path);
    if (!out)
    {
        Logger::error("Cannot write summary: " + path.string());
        return false;
    }
    out << nlohmann::json(summary).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    if (!out)
    {
        Logger::error("Failed writing summary: " + path.string());
        return false;
    }
    return true;
}
