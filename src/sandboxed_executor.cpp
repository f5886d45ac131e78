#include "core/sandboxed_executor.hpp"
#include "core/sandbox.hpp"
#include "core/type_classifier.hpp"
#include "core/external_library_wrappers.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <stdexcept>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace
{
    const int WAIT_SLICE_MS = 50;

    // Only async-signal-safe calls between fork and exec
    [[noreturn]] void execWorkerChild(char *const argv[], char *const envp[], int input_fd, int output_fd,
                                      int result_fd, int devnull_fd, pid_t parent, const SandboxLimits &limits)
    {
        setpgid(0, 0);
        if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) != 0 || getppid() != parent)
            _exit(SandboxedExecutor::EXIT_EXEC_FAILED);

        // Lift every descriptor above the target slots before placing them
        int in = fcntl(input_fd, F_DUPFD, 16);
        int out = fcntl(output_fd, F_DUPFD, 16);
        int res = fcntl(result_fd, F_DUPFD, 16);
        if (in < 0 || out < 0 || res < 0)
            _exit(SandboxedExecutor::EXIT_EXEC_FAILED);

        if (dup2(devnull_fd, STDIN_FILENO) < 0 || dup2(devnull_fd, STDOUT_FILENO) < 0 ||
            dup2(in, SandboxedExecutor::WORKER_INPUT_FD) < 0 || dup2(out, SandboxedExecutor::WORKER_OUTPUT_FD) < 0 ||
            dup2(res, SandboxedExecutor::WORKER_RESULT_FD) < 0)
            _exit(SandboxedExecutor::EXIT_EXEC_FAILED);

        int first_closed = SandboxedExecutor::WORKER_RESULT_FD + 1;
        if (syscall(SYS_close_range, first_closed, ~0U, 0) != 0)
        {
            struct rlimit rl;
            int max_fd = getrlimit(RLIMIT_NOFILE, &rl) == 0 && rl.rlim_cur != RLIM_INFINITY
                             ? static_cast<int>(rl.rlim_cur)
                             : 4096;
            for (int fd = first_closed; fd < max_fd; ++fd)
                close(fd);
        }

        if (!Sandbox::applyResourceLimits(limits))
            _exit(SandboxedExecutor::EXIT_EXEC_FAILED);

        sigset_t all;
        sigemptyset(&all);
        sigprocmask(SIG_SETMASK, &all, nullptr);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);

        execve(argv[0], argv, envp);
        _exit(SandboxedExecutor::EXIT_EXEC_FAILED);
    }

    void fillUsage(ResourceUsage &usage, const struct rusage &ru)
    {
        usage.user_cpu_ms = static_cast<int64_t>(ru.ru_utime.tv_sec) * 1000 + ru.ru_utime.tv_usec / 1000;
        usage.system_cpu_ms = static_cast<int64_t>(ru.ru_stime.tv_sec) * 1000 + ru.ru_stime.tv_usec / 1000;
        usage.peak_rss_kb = ru.ru_maxrss;
    }

    void readAvailable(int fd, std::string &buffer, bool &eof)
    {
        char chunk[4096];
        while (true)
        {
            ssize_t n = read(fd, chunk, sizeof(chunk));
            if (n > 0)
            {
                size_t room = SandboxedExecutor::MAX_REPORT_BYTES - std::min(buffer.size(), SandboxedExecutor::MAX_REPORT_BYTES);
                buffer.append(chunk, std::min(static_cast<size_t>(n), room));
                continue;
            }
            if (n == 0)
                eof = true;
            else if (errno == EINTR)
                continue;
            return;
        }
    }
}

SandboxedExecutor::SandboxedExecutor(const ExecutorSettings &settings) : settings_(settings)
{
}

void SandboxedExecutor::prepare()
{
    std::error_code ec;
    std::filesystem::create_directories(getStagingDir(), ec);
    if (ec)
        throw std::runtime_error("Cannot create staging directory " + getStagingDir() + ": " + ec.message());
    if (::access(settings_.worker_path.c_str(), X_OK) != 0)
        throw std::runtime_error("Worker executable is not runnable: " + settings_.worker_path);
}

std::string SandboxedExecutor::getStagingDir() const
{
    return (std::filesystem::path(settings_.output_dir) / ".staging").string();
}

std::string SandboxedExecutor::stagingPath(const SanitizationJob &job) const
{
    return (std::filesystem::path(getStagingDir()) / (job.job_id + "." + job.plan.extension + ".part")).string();
}

std::string SandboxedExecutor::outputPath(const SanitizationJob &job) const
{
    return (std::filesystem::path(settings_.output_dir) / (job.job_id + "." + job.plan.extension)).string();
}

std::string SandboxedExecutor::expectedSignature(const std::string &container)
{
    if (container == "ipod")
        return "m4a";
    return container;
}

int SandboxedExecutor::openStaging(const std::string &path, std::string &error)
{
    int flags = O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW;
    int fd = ::open(path.c_str(), flags, 0600);
    if (fd < 0 && errno == EEXIST)
    {
        // Left over by an interrupted run
        Logger::debug("Removing stale staging file " + path);
        if (::unlink(path.c_str()) == 0)
            fd = ::open(path.c_str(), flags, 0600);
    }
    if (fd < 0)
        error = "Cannot create staging file " + path + ": " + std::strerror(errno);
    return fd;
}

nlohmann::json SandboxedExecutor::buildJobDocument(const SanitizationJob &job) const
{
    MediaRecord record = job.record;
    // The worker never learns where the file lives
    record.source_path.clear();
    return nlohmann::json{{"job_id", job.job_id},
                          {"record", record},
                          {"plan", job.plan},
                          {"max_output_bytes", settings_.limits.max_output_bytes},
                          {"require_filesystem_isolation", settings_.require_filesystem_isolation}};
}

WorkerOutcome SandboxedExecutor::spawnWorker(const std::vector<std::string> &args, int input_fd, int output_fd)
{
    WorkerOutcome outcome;

    int pipe_fds[2];
    if (pipe2(pipe_fds, O_CLOEXEC) != 0)
    {
        outcome.error_message = std::string("pipe2 failed: ") + std::strerror(errno);
        return outcome;
    }
    FileDescriptorRAII read_end(pipe_fds[0]);
    FileDescriptorRAII write_end(pipe_fds[1]);

    FileDescriptorRAII devnull(::open("/dev/null", O_RDWR | O_CLOEXEC));
    if (!devnull.valid())
    {
        outcome.error_message = std::string("Cannot open /dev/null: ") + std::strerror(errno);
        return outcome;
    }

    // argv and envp are built before fork so the child does not allocate
    std::vector<std::string> arg_storage = args;
    std::vector<char *> argv;
    for (auto &arg : arg_storage)
        argv.push_back(&arg[0]);
    argv.push_back(nullptr);
    char *envp[] = {nullptr};

    pid_t parent = getpid();
    auto started_at = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0)
    {
        outcome.error_message = std::string("fork failed: ") + std::strerror(errno);
        return outcome;
    }
    if (pid == 0)
        execWorkerChild(argv.data(), envp, input_fd, output_fd, write_end.get(), devnull.get(), parent,
                        settings_.limits);

    outcome.started = true;
    setpgid(pid, pid);
    write_end.reset();
    if (fcntl(read_end.get(), F_SETFL, O_NONBLOCK) != 0)
        Logger::warn(std::string("Cannot make result pipe non-blocking: ") + std::strerror(errno));

    auto deadline = started_at + std::chrono::seconds(settings_.limits.wall_clock_seconds);
    bool eof = false;
    struct rusage ru;
    std::memset(&ru, 0, sizeof(ru));
    int status = 0;

    while (true)
    {
        pid_t waited = wait4(pid, &status, WNOHANG, &ru);
        if (waited == pid)
        {
            readAvailable(read_end.get(), outcome.report, eof);
            break;
        }
        if (waited < 0 && errno != EINTR)
        {
            outcome.error_message = std::string("wait4 failed: ") + std::strerror(errno);
            break;
        }

        if (std::chrono::steady_clock::now() >= deadline)
        {
            outcome.timed_out = true;
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            while (wait4(pid, &status, 0, &ru) < 0 && errno == EINTR)
            {
            }
            break;
        }

        if (eof)
        {
            poll(nullptr, 0, WAIT_SLICE_MS);
            continue;
        }
        struct pollfd pfd = {read_end.get(), POLLIN, 0};
        if (poll(&pfd, 1, WAIT_SLICE_MS) > 0)
            readAvailable(read_end.get(), outcome.report, eof);
    }

    outcome.wait_status = status;
    fillUsage(outcome.usage, ru);
    outcome.usage.wall_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
    if (WIFEXITED(status))
        outcome.usage.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        outcome.usage.term_signal = WTERMSIG(status);
    return outcome;
}

FailureKind SandboxedExecutor::classifyTermination(const WorkerOutcome &outcome, std::string &message)
{
    if (!outcome.started)
    {
        message = "Worker could not be started: " + outcome.error_message;
        return FailureKind::INTERNAL_INVARIANT_VIOLATION;
    }
    if (outcome.timed_out)
    {
        message = "Wall-clock limit exceeded, worker killed";
        return FailureKind::RESOURCE_EXCEEDED;
    }

    int status = outcome.wait_status;
    if (WIFSIGNALED(status))
    {
        int sig = WTERMSIG(status);
        switch (sig)
        {
        case SIGXCPU:
            message = "CPU time limit exceeded";
            return FailureKind::RESOURCE_EXCEEDED;
        case SIGKILL:
            // The wall-clock kill is reported above, so this came from the kernel
            message = "Worker killed by the kernel after " +
                      std::to_string(outcome.usage.user_cpu_ms + outcome.usage.system_cpu_ms) +
                      " ms of CPU time (CPU hard limit or out of memory)";
            return FailureKind::RESOURCE_EXCEEDED;
        case SIGXFSZ:
            message = "Output size limit exceeded";
            return FailureKind::RESOURCE_EXCEEDED;
        case SIGSYS:
            message = "Worker violated the syscall filter";
            return FailureKind::INTERNAL_INVARIANT_VIOLATION;
        default:
            message = "Decoder crashed with signal " + std::to_string(sig) + " (" + strsignal(sig) + ")";
            return FailureKind::DECODE_ERROR;
        }
    }

    if (WIFEXITED(status))
    {
        int code = WEXITSTATUS(status);
        if (code == EXIT_EXEC_FAILED)
        {
            message = "Worker could not be executed";
            return FailureKind::INTERNAL_INVARIANT_VIOLATION;
        }
        if (code > EXIT_FAILURE_BASE && code < EXIT_FAILURE_BASE + FailureKinds::COUNT)
        {
            FailureKind kind = FailureKinds::fromIndex(code - EXIT_FAILURE_BASE);
            message = "Worker failed with " + FailureKinds::getName(kind) + " and no report";
            return kind;
        }
        message = "Worker exited with status " + std::to_string(code) + " and no report";
        return FailureKind::INTERNAL_INVARIANT_VIOLATION;
    }

    message = "Worker ended in an unknown state";
    return FailureKind::INTERNAL_INVARIANT_VIOLATION;
}

SanitizationResult SandboxedExecutor::finishFailure(SanitizationJob &job, FailureKind kind, const std::string &message)
{
    if (!job.advance(JobStatus::FAILED))
        Logger::error("Job " + job.job_id + " could not move to failed from " + JobStatuses::getName(job.status));
    job.end_time = std::chrono::system_clock::now();

    SanitizationResult result = SanitizationResult::failure(job.job_id, job.record.relative_path, kind, message);
    result.media_kind = job.record.kind;
    result.requested_level = job.plan.requested_level;
    result.effective_level = job.plan.effective_level;
    result.degradation_note = job.plan.degradation_note;
    result.usage = job.usage;
    result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(job.end_time - job.start_time).count();
    return result;
}

SanitizationResult SandboxedExecutor::execute(SanitizationJob &job)
{
    job.start_time = std::chrono::system_clock::now();
    if (!job.advance(JobStatus::RUNNING))
        return finishFailure(job, FailureKind::INTERNAL_INVARIANT_VIOLATION,
                             "Job is not pending: " + JobStatuses::getName(job.status));

    FileDescriptorRAII input(::open(job.record.source_path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC | O_NOCTTY | O_NONBLOCK));
    if (!input.valid())
        return finishFailure(job, FailureKind::INTERNAL_INVARIANT_VIOLATION,
                             "Cannot reopen input: " + std::string(std::strerror(errno)));

    // The file must still be what was classified
    ClassificationResult recheck = TypeClassifier::classifyDescriptor(input.get());
    if (!recheck.success || recheck.record.kind != job.record.kind || recheck.record.container != job.record.container)
        return finishFailure(job, FailureKind::INTERNAL_INVARIANT_VIOLATION, "Input changed since classification");

    std::string staging = stagingPath(job);
    std::string error;
    FileDescriptorRAII output(openStaging(staging, error));
    if (!output.valid())
        return finishFailure(job, FailureKind::INTERNAL_INVARIANT_VIOLATION, error);

    std::vector<std::string> args = {settings_.worker_path, "--worker", buildJobDocument(job).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                                     "--log-level", settings_.log_level};
    Logger::debug("Spawning worker for " + job.record.relative_path + " (" + job.job_id + ")");
    WorkerOutcome outcome = spawnWorker(args, input.get(), output.get());
    job.usage = outcome.usage;

    FailureKind kind = FailureKind::NONE;
    std::string message;
    std::vector<std::string> warnings;

    nlohmann::json report = nlohmann::json::parse(outcome.report, nullptr, false);
    bool clean_exit = WIFEXITED(outcome.wait_status) && WEXITSTATUS(outcome.wait_status) == 0;
    if (outcome.timed_out || !outcome.started || WIFSIGNALED(outcome.wait_status))
    {
        kind = classifyTermination(outcome, message);
    }
    else if (!report.is_object())
    {
        kind = classifyTermination(outcome, message);
    }
    else
    {
        warnings = report.value("warnings", std::vector<std::string>());
        if (report.value("status", "") == JobStatuses::getName(JobStatus::SUCCEEDED) && clean_exit)
        {
            kind = FailureKind::NONE;
        }
        else
        {
            kind = FailureKinds::fromString(report.value("failure_kind", "InternalInvariantViolation"));
            if (kind == FailureKind::NONE)
                kind = FailureKind::INTERNAL_INVARIANT_VIOLATION;
            message = report.value("message", "Worker reported failure");
        }
    }

    if (kind == FailureKind::NONE)
    {
        ClassificationResult produced = TypeClassifier::classifyDescriptor(output.get());
        if (!produced.success || produced.record.container != expectedSignature(job.plan.container))
        {
            kind = FailureKind::INTERNAL_INVARIANT_VIOLATION;
            message = "Output does not carry a " + job.plan.container + " signature";
        }
        else if (::fsync(output.get()) != 0)
        {
            kind = FailureKind::INTERNAL_INVARIANT_VIOLATION;
            message = "fsync of staging file failed: " + std::string(std::strerror(errno));
        }
    }

    std::string final_path = outputPath(job);
    if (kind == FailureKind::NONE && ::rename(staging.c_str(), final_path.c_str()) != 0)
    {
        kind = FailureKind::INTERNAL_INVARIANT_VIOLATION;
        message = "Cannot publish output: " + std::string(std::strerror(errno));
    }

    if (kind != FailureKind::NONE)
    {
        if (::unlink(staging.c_str()) != 0 && errno != ENOENT)
            Logger::warn("Cannot remove staging file " + staging + ": " + std::strerror(errno));
        SanitizationResult result = finishFailure(job, kind, message);
        result.warnings = warnings;
        return result;
    }

    if (!job.advance(JobStatus::SUCCEEDED))
        return finishFailure(job, FailureKind::INTERNAL_INVARIANT_VIOLATION, "Job left the running state early");
    job.end_time = std::chrono::system_clock::now();

    SanitizationResult result = SanitizationResult::success(job, final_path);
    result.warnings = warnings;
    return result;
}

nlohmann::json SandboxedExecutor::runProbe()
{
    FileDescriptorRAII input(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    FileDescriptorRAII output(::open("/dev/null", O_WRONLY | O_CLOEXEC));
    if (!input.valid() || !output.valid())
        return nlohmann::json{{"error", std::string("Cannot open /dev/null: ") + std::strerror(errno)}};

    std::vector<std::string> args = {settings_.worker_path, "--worker-probe", "--log-level", settings_.log_level};
    if (settings_.require_filesystem_isolation)
        args.push_back("--require-filesystem-isolation");

    WorkerOutcome outcome = spawnWorker(args, input.get(), output.get());
    nlohmann::json report = nlohmann::json::parse(outcome.report, nullptr, false);
    if (!report.is_object())
    {
        std::string message;
        classifyTermination(outcome, message);
        return nlohmann::json{{"error", message}};
    }
    return report;
}
