#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Privilege.h"
#include "../src/core/Logging.h"
#include "TestSupport.h"
#include <cerrno>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace ioc_sweep {

class PrivilegeTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
    }
    void TearDown() override {
        Logger::instance().set_level(LogLevel::Info);
    }

    // Runs fn in a forked child; returns the child's exit status (or -1 when killed).
    template<typename Fn>
    int in_child(Fn fn){
        pid_t pid = fork();
        if(pid == 0) _exit(fn());
        if(pid < 0) return -2;
        int status = 0;
        while(waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    }
};

TEST_F(PrivilegeTest, CapabilityNames) {
    EXPECT_STREQ(to_string(Capability::Kill), "CAP_KILL");
    EXPECT_STREQ(to_string(Capability::LinuxImmutable), "CAP_LINUX_IMMUTABLE");
    EXPECT_STREQ(to_string(Capability::DacReadSearch), "CAP_DAC_READ_SEARCH");
}

TEST_F(PrivilegeTest, HasCapabilityIsCallable) {
    EXPECT_NO_THROW(has_capability(Capability::Kill));
    EXPECT_NO_THROW(has_capability(Capability::LinuxImmutable));
}

TEST_F(PrivilegeTest, DropCapabilitiesClearsEffectiveSet) {
    int rc = in_child([]{
        drop_capabilities(false);
        return has_capability(Capability::Kill) || has_capability(Capability::LinuxImmutable) ? 1 : 0;
    });
    EXPECT_EQ(rc, 0);
}

TEST_F(PrivilegeTest, DropCapabilitiesCanKeepDacReadSearch) {
    if(geteuid() != 0) GTEST_SKIP() << "needs root to hold CAP_DAC_READ_SEARCH";
    int rc = in_child([]{
        drop_capabilities(true);
        if(has_capability(Capability::Kill)) return 1;
        return has_capability(Capability::DacReadSearch) ? 0 : 2;
    });
    EXPECT_EQ(rc, 0);
}

#ifdef IOC_SWEEP_HAVE_SECCOMP
TEST_F(PrivilegeTest, DryRunProfileDeniesFilesystemMutation) {
    testing_support::TempDir dir("ioc_sweep_seccomp");
    auto victim = dir / "victim";
    testing_support::write_file(victim, "x");
    std::string path = victim.string();
    int rc = in_child([&path]{
        if(!apply_dry_run_seccomp_profile()) return 3;
        if(unlink(path.c_str()) == 0) return 1;
        return errno == EPERM ? 0 : 2;
    });
    EXPECT_EQ(rc, 0);
    EXPECT_TRUE(std::filesystem::exists(victim));
}

TEST_F(PrivilegeTest, SeccompReportedAvailable) {
    EXPECT_TRUE(is_seccomp_available());
}
#else
TEST_F(PrivilegeTest, SeccompUnavailableWithoutLibseccomp) {
    EXPECT_FALSE(is_seccomp_available());
    EXPECT_FALSE(apply_dry_run_seccomp_profile());
}
#endif

}
