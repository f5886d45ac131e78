#include <gtest/gtest.h>
#include "core/sandbox.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <fcntl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

class SandboxTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");
    }

    // Run body in a forked child and return its exit status
    template <typename Body>
    static int inChild(Body body)
    {
        pid_t pid = fork();
        if (pid == 0)
            _exit(body());
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        return status;
    }
};

TEST_F(SandboxTest, ReportDescribesEveryLayer)
{
    SandboxReport report;
    report.no_new_privs = true;
    report.landlock = true;
    report.landlock_abi = 3;
    report.seccomp = true;

    EXPECT_EQ(report.describe(), "userns=no netns=no no_new_privs=yes landlock=abi3 seccomp=yes");

    nlohmann::json j = report;
    EXPECT_EQ(j["landlock_abi"], 3);
    EXPECT_EQ(j["seccomp"], true);
    EXPECT_EQ(j["user_namespace"], false);
}

TEST_F(SandboxTest, LandlockVersionIsNeverNegative)
{
    EXPECT_GE(Sandbox::landlockAbiVersion(), 0);
}

TEST_F(SandboxTest, ResourceLimitsApplyInChild)
{
    SandboxLimits limits;
    limits.cpu_seconds = 7;
    limits.memory_bytes = 512ULL * 1024 * 1024;
    limits.max_output_bytes = 1024 * 1024;
    limits.max_open_files = 32;

    int status = inChild([&limits]()
                         {
        if (!Sandbox::applyResourceLimits(limits))
            return 2;
        struct rlimit rl;
        if (getrlimit(RLIMIT_CPU, &rl) != 0 || rl.rlim_cur != 7)
            return 3;
        if (getrlimit(RLIMIT_AS, &rl) != 0 || rl.rlim_cur != 512ULL * 1024 * 1024)
            return 4;
        if (getrlimit(RLIMIT_FSIZE, &rl) != 0 || rl.rlim_cur != 1024 * 1024)
            return 5;
        if (getrlimit(RLIMIT_NOFILE, &rl) != 0 || rl.rlim_cur != 32)
            return 6;
        if (getrlimit(RLIMIT_CORE, &rl) != 0 || rl.rlim_cur != 0)
            return 7;
        return 0; });

    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST_F(SandboxTest, AppliedSandboxBlocksPathOpens)
{
    int status = inChild([]()
                         {
        SandboxReport report;
        StageResult applied = Sandbox::apply(false, report);
        if (!applied.success)
            return 10;
        int fd = ::open("/etc/passwd", O_RDONLY | O_CLOEXEC);
        if (fd >= 0)
            return 1;
        nlohmann::json probe = Sandbox::probe(report);
        if (!probe.value("filesystem_blocked", false))
            return 2;
        if (!probe.value("network_blocked", false))
            return 3;
        return 0; });

    ASSERT_TRUE(WIFEXITED(status)) << "signal " << (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    if (WEXITSTATUS(status) == 10)
        GTEST_SKIP() << "Kernel refused a mandatory sandbox layer";
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST_F(SandboxTest, AppliedSandboxBlocksOutboundConnections)
{
    int status = inChild([]()
                         {
        SandboxReport report;
        if (!Sandbox::apply(false, report).success)
            return 10;
        int tcp = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (tcp >= 0)
            return 1;
        int unix_socket = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (unix_socket >= 0)
            return 2;
        int pair[2];
        if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, pair) == 0)
            return 3;
        nlohmann::json probe = Sandbox::probe(report);
        if (!probe.value("network_blocked", false))
            return 4;
        return 0; });

    ASSERT_TRUE(WIFEXITED(status)) << "signal " << (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    if (WEXITSTATUS(status) == 10)
        GTEST_SKIP() << "Kernel refused a mandatory sandbox layer";
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST_F(SandboxTest, AppliedSandboxBlocksPathMutations)
{
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / ("mediacdr_sandbox_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    fs::path victim = dir / "victim.txt";
    {
        std::ofstream out(victim);
        out << "keep";
    }
    fs::path renamed = dir / "renamed.txt";
    fs::path created = dir / "created";
    fs::path linked = dir / "linked";

    int status = inChild([&]()
                         {
        SandboxReport report;
        if (!Sandbox::apply(false, report).success)
            return 10;
        if (::unlink(victim.c_str()) == 0)
            return 1;
        if (::rename(victim.c_str(), renamed.c_str()) == 0)
            return 2;
        if (::mkdir(created.c_str(), 0700) == 0)
            return 3;
        if (::symlink(victim.c_str(), linked.c_str()) == 0)
            return 4;
        if (::chmod(victim.c_str(), 0777) == 0)
            return 5;
        if (::truncate(victim.c_str(), 0) == 0)
            return 6;
        if (::chdir(dir.c_str()) == 0)
            return 7;
        return 0; });

    bool intact = fs::exists(victim) && fs::file_size(victim) == 4 && !fs::exists(renamed) &&
                  !fs::exists(created) && !fs::is_symlink(linked);
    fs::remove_all(dir);

    ASSERT_TRUE(WIFEXITED(status)) << "signal " << (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    if (WEXITSTATUS(status) == 10)
        GTEST_SKIP() << "Kernel refused a mandatory sandbox layer";
    EXPECT_EQ(WEXITSTATUS(status), 0);
    EXPECT_TRUE(intact);
}

TEST_F(SandboxTest, AppliedSandboxRefusesIoUring)
{
    int status = inChild([]()
                         {
        SandboxReport report;
        if (!Sandbox::apply(false, report).success)
            return 10;
        unsigned char params[256];
        std::memset(params, 0, sizeof(params));
        long fd = syscall(__NR_io_uring_setup, 4, params);
        if (fd >= 0)
            return 1;
        if (errno != EPERM)
            return 2;
        if (syscall(__NR_io_uring_register, -1, 0, nullptr, 0) != -1 || errno != EPERM)
            return 3;
        return 0; });

    ASSERT_TRUE(WIFEXITED(status)) << "signal " << (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    if (WEXITSTATUS(status) == 10)
        GTEST_SKIP() << "Kernel refused a mandatory sandbox layer";
    EXPECT_EQ(WEXITSTATUS(status), 0);
}
