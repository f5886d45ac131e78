#include "core/sandbox.hpp"
#include "logging/logger.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <fcntl.h>
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/landlock.h>
#include <linux/seccomp.h>
#include <netinet/in.h>
#include <poll.h>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <unistd.h>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/core/ocl.hpp>

extern "C"
{
#include <libavutil/log.h>
}

#if defined(__x86_64__)
#define MEDIACDR_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
#define MEDIACDR_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
#error "No seccomp architecture defined for this target"
#endif

namespace
{
    void denySyscall(std::vector<sock_filter> &filter, long nr, int error)
    {
        filter.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, static_cast<uint32_t>(nr), 0, 1));
        filter.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (static_cast<uint32_t>(error) & SECCOMP_RET_DATA)));
    }

    uint64_t landlockFilesystemRights(int abi)
    {
        uint64_t rights = LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_READ_FILE |
                          LANDLOCK_ACCESS_FS_READ_DIR | LANDLOCK_ACCESS_FS_REMOVE_DIR | LANDLOCK_ACCESS_FS_REMOVE_FILE |
                          LANDLOCK_ACCESS_FS_MAKE_CHAR | LANDLOCK_ACCESS_FS_MAKE_DIR | LANDLOCK_ACCESS_FS_MAKE_REG |
                          LANDLOCK_ACCESS_FS_MAKE_SOCK | LANDLOCK_ACCESS_FS_MAKE_FIFO | LANDLOCK_ACCESS_FS_MAKE_BLOCK |
                          LANDLOCK_ACCESS_FS_MAKE_SYM;
        if (abi >= 2)
            rights |= LANDLOCK_ACCESS_FS_REFER;
#ifdef LANDLOCK_ACCESS_FS_TRUNCATE
        if (abi >= 3)
            rights |= LANDLOCK_ACCESS_FS_TRUNCATE;
#endif
        return rights;
    }
}

std::string SandboxReport::describe() const
{
    std::string text;
    text += std::string("userns=") + (user_namespace ? "yes" : "no");
    text += std::string(" netns=") + (network_namespace ? "yes" : "no");
    text += std::string(" no_new_privs=") + (no_new_privs ? "yes" : "no");
    text += " landlock=" + (landlock ? "abi" + std::to_string(landlock_abi) : std::string("no"));
    text += std::string(" seccomp=") + (seccomp ? "yes" : "no");
    return text;
}

void to_json(nlohmann::json &j, const SandboxReport &report)
{
    j = nlohmann::json{{"user_namespace", report.user_namespace},
                       {"network_namespace", report.network_namespace},
                       {"no_new_privs", report.no_new_privs},
                       {"landlock", report.landlock},
                       {"landlock_abi", report.landlock_abi},
                       {"seccomp", report.seccomp}};
}

int Sandbox::landlockAbiVersion()
{
    long abi = syscall(__NR_landlock_create_ruleset, nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
    return abi < 0 ? 0 : static_cast<int>(abi);
}

bool Sandbox::applyResourceLimits(const SandboxLimits &limits)
{
    struct rlimit rl;

    rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(limits.memory_bytes);
    if (setrlimit(RLIMIT_AS, &rl) != 0)
        return false;

    // Soft limit delivers SIGXCPU, the hard limit one second later SIGKILL
    rl.rlim_cur = static_cast<rlim_t>(limits.cpu_seconds);
    rl.rlim_max = static_cast<rlim_t>(limits.cpu_seconds) + 1;
    if (setrlimit(RLIMIT_CPU, &rl) != 0)
        return false;

    rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(limits.max_output_bytes);
    if (setrlimit(RLIMIT_FSIZE, &rl) != 0)
        return false;

    rl.rlim_cur = rl.rlim_max = static_cast<rlim_t>(limits.max_open_files);
    if (setrlimit(RLIMIT_NOFILE, &rl) != 0)
        return false;

    rl.rlim_cur = rl.rlim_max = 0;
    return setrlimit(RLIMIT_CORE, &rl) == 0;
}

void Sandbox::unshareNamespaces(SandboxReport &report)
{
    if (unshare(CLONE_NEWUSER | CLONE_NEWNET) == 0)
    {
        report.user_namespace = true;
        report.network_namespace = true;
        return;
    }
    Logger::debug(std::string("unshare(CLONE_NEWUSER|CLONE_NEWNET) failed: ") + std::strerror(errno));

    // Privileged workers can still get a network namespace alone
    if (unshare(CLONE_NEWNET) == 0)
        report.network_namespace = true;
}

void Sandbox::prewarmLibraries()
{
    // Anything a library would read from the filesystem on first use happens now
    cv::ocl::setUseOpenCL(false);
    cv::setNumThreads(0);
    Logger::debug("Worker sees " + std::to_string(cv::getNumberOfCPUs()) + " CPUs");
    av_log_set_level(AV_LOG_ERROR);
}

bool Sandbox::applyLandlock(SandboxReport &report)
{
    int abi = landlockAbiVersion();
    if (abi <= 0)
    {
        Logger::debug("Landlock not supported by this kernel");
        return false;
    }

    struct landlock_ruleset_attr attr;
    std::memset(&attr, 0, sizeof(attr));
    attr.handled_access_fs = landlockFilesystemRights(abi);

    int ruleset_fd = static_cast<int>(syscall(__NR_landlock_create_ruleset, &attr, sizeof(attr), 0));
    if (ruleset_fd < 0)
    {
        Logger::warn(std::string("landlock_create_ruleset failed: ") + std::strerror(errno));
        return false;
    }

    // No rule is added: every handled right is denied everywhere
    long rc = syscall(__NR_landlock_restrict_self, ruleset_fd, 0);
    int saved_errno = errno;
    close(ruleset_fd);
    if (rc != 0)
    {
        Logger::warn(std::string("landlock_restrict_self failed: ") + std::strerror(saved_errno));
        return false;
    }

    report.landlock = true;
    report.landlock_abi = abi;
    return true;
}

bool Sandbox::installSeccompFilter()
{
    std::vector<sock_filter> filter;

    filter.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    filter.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, MEDIACDR_AUDIT_ARCH, 1, 0));
    filter.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));

    filter.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));
#if defined(__x86_64__)
    // x32 ABI syscall numbers
    filter.push_back(BPF_JUMP(BPF_JMP | BPF_JGE | BPF_K, 0x40000000, 0, 1));
    filter.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | EPERM));
#endif

#ifdef __NR_open
    denySyscall(filter, __NR_open, EACCES);
#endif
#ifdef __NR_creat
    denySyscall(filter, __NR_creat, EACCES);
#endif
    denySyscall(filter, __NR_openat, EACCES);
#ifdef __NR_openat2
    denySyscall(filter, __NR_openat2, EACCES);
#endif
    denySyscall(filter, __NR_open_by_handle_at, EACCES);

    // Path mutations; inherited descriptors are the only files a worker touches
#ifdef __NR_unlink
    denySyscall(filter, __NR_unlink, EACCES);
#endif
    denySyscall(filter, __NR_unlinkat, EACCES);
#ifdef __NR_rmdir
    denySyscall(filter, __NR_rmdir, EACCES);
#endif
#ifdef __NR_rename
    denySyscall(filter, __NR_rename, EACCES);
#endif
#ifdef __NR_renameat
    denySyscall(filter, __NR_renameat, EACCES);
#endif
    denySyscall(filter, __NR_renameat2, EACCES);
#ifdef __NR_mkdir
    denySyscall(filter, __NR_mkdir, EACCES);
#endif
    denySyscall(filter, __NR_mkdirat, EACCES);
#ifdef __NR_mknod
    denySyscall(filter, __NR_mknod, EACCES);
#endif
    denySyscall(filter, __NR_mknodat, EACCES);
#ifdef __NR_symlink
    denySyscall(filter, __NR_symlink, EACCES);
#endif
    denySyscall(filter, __NR_symlinkat, EACCES);
#ifdef __NR_link
    denySyscall(filter, __NR_link, EACCES);
#endif
    denySyscall(filter, __NR_linkat, EACCES);
#ifdef __NR_chmod
    denySyscall(filter, __NR_chmod, EACCES);
#endif
    denySyscall(filter, __NR_fchmodat, EACCES);
#ifdef __NR_fchmodat2
    denySyscall(filter, __NR_fchmodat2, EACCES);
#endif
#ifdef __NR_chown
    denySyscall(filter, __NR_chown, EACCES);
#endif
#ifdef __NR_lchown
    denySyscall(filter, __NR_lchown, EACCES);
#endif
    denySyscall(filter, __NR_fchownat, EACCES);
    denySyscall(filter, __NR_truncate, EACCES);
#ifdef __NR_utimes
    denySyscall(filter, __NR_utimes, EACCES);
#endif
    denySyscall(filter, __NR_utimensat, EACCES);
    denySyscall(filter, __NR_setxattr, EACCES);
    denySyscall(filter, __NR_lsetxattr, EACCES);
    denySyscall(filter, __NR_removexattr, EACCES);
    denySyscall(filter, __NR_lremovexattr, EACCES);
    denySyscall(filter, __NR_chdir, EACCES);
    denySyscall(filter, __NR_chroot, EPERM);

    // io_uring requests run outside this filter
    denySyscall(filter, __NR_io_uring_setup, EPERM);
    denySyscall(filter, __NR_io_uring_enter, EPERM);
    denySyscall(filter, __NR_io_uring_register, EPERM);

    // No new sockets of any family
    denySyscall(filter, __NR_socket, EACCES);
    denySyscall(filter, __NR_socketpair, EACCES);
    denySyscall(filter, __NR_connect, EACCES);

    denySyscall(filter, __NR_execve, EPERM);
    denySyscall(filter, __NR_execveat, EPERM);
    denySyscall(filter, __NR_ptrace, EPERM);
    denySyscall(filter, __NR_process_vm_readv, EPERM);
    denySyscall(filter, __NR_process_vm_writev, EPERM);
    denySyscall(filter, __NR_mount, EPERM);
    denySyscall(filter, __NR_umount2, EPERM);
    denySyscall(filter, __NR_unshare, EPERM);
    denySyscall(filter, __NR_setns, EPERM);

    filter.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    struct sock_fprog program;
    program.len = static_cast<unsigned short>(filter.size());
    program.filter = filter.data();

    if (syscall(__NR_seccomp, SECCOMP_SET_MODE_FILTER, SECCOMP_FILTER_FLAG_TSYNC, &program) == 0)
        return true;
    if (errno == ENOSYS && prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &program, 0, 0) == 0)
        return true;

    Logger::error(std::string("Installing seccomp filter failed: ") + std::strerror(errno));
    return false;
}

StageResult Sandbox::apply(bool require_filesystem_isolation, SandboxReport &report)
{
    report = SandboxReport();

    unshareNamespaces(report);
    prewarmLibraries();

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0)
        return StageResult::fail(FailureKind::INTERNAL_INVARIANT_VIOLATION,
                                 std::string("PR_SET_NO_NEW_PRIVS failed: ") + std::strerror(errno));
    report.no_new_privs = true;

    if (prctl(PR_SET_DUMPABLE, 0, 0, 0, 0) != 0)
        Logger::warn(std::string("PR_SET_DUMPABLE failed: ") + std::strerror(errno));

    if (!applyLandlock(report) && require_filesystem_isolation)
        return StageResult::fail(FailureKind::INTERNAL_INVARIANT_VIOLATION,
                                 "Filesystem isolation required but Landlock is unavailable");

    if (!installSeccompFilter())
        return StageResult::fail(FailureKind::INTERNAL_INVARIANT_VIOLATION, "seccomp filter could not be installed");
    report.seccomp = true;

    Logger::debug("Sandbox applied: " + report.describe());
    return StageResult::ok();
}

nlohmann::json Sandbox::probe(const SandboxReport &report)
{
    nlohmann::json result;

    int fd = ::open("/etc/passwd", O_RDONLY | O_CLOEXEC);
    if (fd >= 0)
    {
        close(fd);
        result["filesystem_blocked"] = false;
        result["filesystem_detail"] = "opened /etc/passwd";
    }
    else
    {
        result["filesystem_blocked"] = true;
        result["filesystem_detail"] = std::string("open: ") + std::strerror(errno);
    }

    bool network_blocked = true;
    std::string network_detail;
    int sock = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (sock < 0)
    {
        network_detail = std::string("socket: ") + std::strerror(errno);
    }
    else
    {
        struct sockaddr_in address;
        std::memset(&address, 0, sizeof(address));
        address.sin_family = AF_INET;
        address.sin_port = htons(53);
        int rc = inet_pton(AF_INET, "1.1.1.1", &address.sin_addr) == 1 ? 0 : -1;
        if (rc == 0)
            rc = ::connect(sock, reinterpret_cast<struct sockaddr *>(&address), sizeof(address));
        else
            errno = EINVAL;
        if (rc == 0)
        {
            network_blocked = false;
            network_detail = "connected";
        }
        else if (errno == EINPROGRESS)
        {
            struct pollfd pfd = {sock, POLLOUT, 0};
            int ready = poll(&pfd, 1, 3000);
            int error = 0;
            socklen_t length = sizeof(error);
            if (ready > 0 && getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &length) == 0 && error == 0)
            {
                network_blocked = false;
                network_detail = "connected";
            }
            else
            {
                network_detail = ready == 0 ? "connect: timed out" : std::string("connect: ") + std::strerror(error);
            }
        }
        else
        {
            network_detail = std::string("connect: ") + std::strerror(errno);
        }
        close(sock);
    }
    result["network_blocked"] = network_blocked;
    result["network_detail"] = network_detail;
    result["layers"] = report;
    return result;
}
