#pragma once

#include <cstdint>
#include <map>
#include <string>
#include "core/cdr_levels.hpp"
#include "core/policy_engine.hpp"

/**
 * @brief Resource bounds applied to every sandboxed job
 */
struct SandboxLimits
{
    int cpu_seconds = 300;
    uint64_t memory_bytes = 2048ULL * 1024 * 1024;
    int wall_clock_seconds = 600;
    uint64_t max_output_bytes = 4096ULL * 1024 * 1024;
    int max_open_files = 64;
};

/**
 * @brief Immutable run configuration handed to the orchestrator
 *
 * Built once from PocoConfigManager (file + command line) so that batches
 * can be parameterized independently, e.g. in tests.
 */
struct SanitizerConfig
{
    std::string log_level = "INFO";
    std::string input_dir = "./input";
    std::string output_dir = "./output";
    std::string processing_log = "processing_log.json";
    bool recursive = false;
    CdrLevel default_level = CdrLevel::TRANSCODE;

    int max_jobs = 4;
    int queue_capacity = 16;
    uint64_t max_input_bytes = 2048ULL * 1024 * 1024;

    SandboxLimits limits;
    PolicySettings policy;

    std::string worker_path; // Empty: the running executable
    bool require_filesystem_isolation = false;

    // Relative input path -> level name, parsed per file
    std::map<std::string, std::string> overrides;
};
