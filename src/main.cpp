#include "core/sanitization_orchestrator.hpp"
#include "core/sandboxed_executor.hpp"
#include "core/worker_process.hpp"
#include "logging/logger.hpp"
#include "poco_config_manager.hpp"
#include <filesystem>
#include <iostream>
#include <string>

namespace
{
    const int EXIT_OK = 0;
    const int EXIT_SETUP_ERROR = 1;
    const int EXIT_JOB_FAILURES = 2;

    void printUsage(const char *program)
    {
        std::cout << "mediacdr - content disarm and reconstruction for media files" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config <file>       JSON configuration file" << std::endl;
        std::cout << "  --input <dir>         Input directory (paths.input_dir)" << std::endl;
        std::cout << "  --output <dir>        Output directory (paths.output_dir)" << std::endl;
        std::cout << "  --level <level>       REMUX, TRANSCODE or HARDCORE (cdr_level)" << std::endl;
        std::cout << "  --jobs <n>            Parallel jobs (threading.max_jobs)" << std::endl;
        std::cout << "  --log-level <level>   TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --recursive           Scan the input directory recursively" << std::endl;
        std::cout << "  --print-config        Print the effective configuration and exit" << std::endl;
        std::cout << "  --check-sandbox       Run the isolation self-test and exit" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
    }

    std::string selfExecutable()
    {
        std::error_code ec;
        auto path = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (ec)
        {
            Logger::warn("Cannot resolve /proc/self/exe: " + ec.message());
            return "";
        }
        return path.string();
    }

    // Hidden entry points used by SandboxedExecutor
    int runWorkerMode(int argc, char *argv[])
    {
        std::string job_document;
        std::string log_level = "INFO";
        bool probe = false;
        bool require_filesystem_isolation = false;

        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            if (arg == "--worker" && i + 1 < argc)
                job_document = argv[++i];
            else if (arg == "--worker-probe")
                probe = true;
            else if (arg == "--log-level" && i + 1 < argc)
                log_level = argv[++i];
            else if (arg == "--require-filesystem-isolation")
                require_filesystem_isolation = true;
        }

        Logger::init(log_level);
        if (probe)
            return WorkerProcess::runProbe(require_filesystem_isolation);
        return WorkerProcess::run(job_document);
    }

    bool isWorkerInvocation(int argc, char *argv[])
    {
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            if (arg == "--worker" || arg == "--worker-probe")
                return true;
        }
        return false;
    }
}

int main(int argc, char *argv[])
{
    if (isWorkerInvocation(argc, argv))
        return runWorkerMode(argc, argv);

    std::string config_path;
    std::string cli_log_level;
    bool print_config = false;
    bool check_sandbox = false;
    nlohmann::json cli_patch = nlohmann::json::object();

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return EXIT_OK;
        }
        else if (arg == "--recursive")
        {
            cli_patch["scan"]["recursive"] = true;
        }
        else if (arg == "--print-config")
        {
            print_config = true;
        }
        else if (arg == "--check-sandbox")
        {
            check_sandbox = true;
        }
        else if (!has_value && (arg == "--config" || arg == "--input" || arg == "--output" || arg == "--level" ||
                                arg == "--jobs" || arg == "--log-level"))
        {
            std::cerr << "Missing value for " << arg << std::endl;
            return EXIT_SETUP_ERROR;
        }
        else if (arg == "--config")
        {
            config_path = argv[++i];
        }
        else if (arg == "--input")
        {
            cli_patch["paths"]["input_dir"] = argv[++i];
        }
        else if (arg == "--output")
        {
            cli_patch["paths"]["output_dir"] = argv[++i];
        }
        else if (arg == "--level")
        {
            cli_patch["cdr_level"] = argv[++i];
        }
        else if (arg == "--log-level")
        {
            cli_log_level = argv[++i];
            cli_patch["log_level"] = cli_log_level;
        }
        else if (arg == "--jobs")
        {
            std::string value = argv[++i];
            try
            {
                size_t consumed = 0;
                int jobs = std::stoi(value, &consumed);
                if (consumed != value.size())
                    throw std::invalid_argument(value);
                cli_patch["threading"]["max_jobs"] = jobs;
            }
            catch (const std::exception &)
            {
                std::cerr << "Invalid value for --jobs: " << value << std::endl;
                return EXIT_SETUP_ERROR;
            }
        }
        else
        {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return EXIT_SETUP_ERROR;
        }
    }

    Logger::init(cli_log_level.empty() ? "INFO" : cli_log_level);

    auto &config_manager = PocoConfigManager::getInstance();
    if (!config_path.empty() && !config_manager.load(config_path))
    {
        Logger::error("Could not load configuration file: " + config_path);
        return EXIT_SETUP_ERROR;
    }
    config_manager.update(cli_patch);

    if (!config_manager.validateConfig())
    {
        Logger::error("Configuration is invalid, aborting");
        return EXIT_SETUP_ERROR;
    }
    Logger::setLevel(config_manager.getLogLevel());

    if (print_config)
    {
        std::cout << config_manager.getAll().dump(2) << std::endl;
        return EXIT_OK;
    }

    SanitizerConfig config = config_manager.getSanitizerConfig();
    if (config.worker_path.empty())
        config.worker_path = selfExecutable();

    if (check_sandbox)
    {
        ExecutorSettings settings;
        settings.output_dir = config.output_dir;
        settings.worker_path = config.worker_path;
        settings.log_level = config.log_level;
        settings.limits = config.limits;
        settings.require_filesystem_isolation = config.require_filesystem_isolation;

        nlohmann::json probe = SandboxedExecutor(settings).runProbe();
        std::cout << probe.dump(2) << std::endl;
        bool isolated = probe.value("filesystem_blocked", false) && probe.value("network_blocked", false);
        if (!isolated)
            Logger::warn("Sandbox self-test found reachable resources");
        return isolated ? EXIT_OK : EXIT_JOB_FAILURES;
    }

    try
    {
        Logger::info("Starting sanitization of " + config.input_dir + " at level " +
                     CdrLevels::getLevelName(config.default_level));

        SanitizationOrchestrator orchestrator(config);
        BatchSummary summary = orchestrator.run();

        std::cout << nlohmann::json(summary).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
        if (!orchestrator.writeSummary(summary))
            Logger::warn("Summary was only written to stdout");

        Logger::info("Sanitization complete: " + std::to_string(summary.succeeded) + " succeeded, " +
                     std::to_string(summary.failed) + " failed, " + std::to_string(summary.excluded.size()) +
                     " excluded");
        return summary.hasFailures() ? EXIT_JOB_FAILURES : EXIT_OK;
    }
    catch (const std::exception &e)
    {
        Logger::error("Fatal: " + std::string(e.what()));
        return EXIT_SETUP_ERROR;
    }
}
