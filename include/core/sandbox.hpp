#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/sanitization_types.hpp"
#include "core/sanitizer_config.hpp"

/**
 * @brief Which isolation layers a worker actually obtained
 */
struct SandboxReport
{
    bool user_namespace = false;
    bool network_namespace = false;
    bool no_new_privs = false;
    bool landlock = false;
    int landlock_abi = 0;
    bool seccomp = false;

    std::string describe() const;
};

void to_json(nlohmann::json &j, const SandboxReport &report);

/**
 * @brief Process isolation for sanitizer workers
 *
 * apply() runs inside the worker before any input byte is parsed. The
 * worker must still be single-threaded: Landlock only restricts the
 * calling thread.
 *
 * Layers, in order:
 *  - unshare(CLONE_NEWUSER | CLONE_NEWNET), best effort
 *  - PR_SET_NO_NEW_PRIVS and PR_SET_DUMPABLE 0
 *  - Landlock ruleset handling every filesystem right and granting none
 *  - seccomp-BPF filter denying path opens and path mutations, exec,
 *    socket creation of every family, io_uring, ptrace, mount, unshare
 *    and setns
 */
class Sandbox
{
public:
    /**
     * @brief Apply every layer to the calling process
     * @param require_filesystem_isolation Fail when Landlock is unavailable
     *        instead of relying on seccomp alone
     * @return INTERNAL_INVARIANT_VIOLATION when a mandatory layer fails
     */
    static StageResult apply(bool require_filesystem_isolation, SandboxReport &report);

    /**
     * @brief Resource limits for a forked child, called between fork and exec
     *
     * Only setrlimit() is used, so this is async-signal-safe.
     */
    static bool applyResourceLimits(const SandboxLimits &limits);

    // Landlock ABI version supported by the kernel, 0 when unavailable
    static int landlockAbiVersion();

    /**
     * @brief Isolation self-test run inside a sandboxed worker
     * @return {"filesystem_blocked", "network_blocked", "layers"}
     */
    static nlohmann::json probe(const SandboxReport &report);

private:
    static void unshareNamespaces(SandboxReport &report);
    static bool applyLandlock(SandboxReport &report);
    static bool installSeccompFilter();
    static void prewarmLibraries();
};
