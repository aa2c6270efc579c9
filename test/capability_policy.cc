#include "temporary_directory.hh"

#include <cerrno>
#include <evalbox/capability_policy.hh>
#include <evalbox/errors.hh>
#include <evalbox/file_contents.hh>
#include <evalbox/file_descriptor.hh>
#include <evalbox/path.hh>
#include <fcntl.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

using evalbox::AccessDenied;
using evalbox::CapabilityPolicy;

namespace {

auto throws_access_denied(AccessDenied::Kind kind) {
    return testing::Throws<AccessDenied>(
        testing::Property(&AccessDenied::kind, testing::Eq(kind))
    );
}

void create_file(const std::string& path, std::string_view contents) {
    FileDescriptor fd{path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC};
    ASSERT_TRUE(fd.is_open());
    ASSERT_EQ(write_all(fd, contents), contents.size());
}

} // namespace

// NOLINTNEXTLINE
TEST(capability_policy, default_policy) {
    auto policy = CapabilityPolicy::default_policy();
    ASSERT_EQ(policy.filesystem.read_allowed.size(), 1U);
    EXPECT_EQ(policy.filesystem.read_allowed[0], path_absolute("../..", get_cwd()));
    EXPECT_TRUE(policy.filesystem.write_allowed.empty());
    EXPECT_FALSE(policy.network_allowed);
    EXPECT_FALSE(policy.process_execution_allowed);
}

// NOLINTNEXTLINE
TEST(capability_policy, default_policy_allows_reading_below_grandparent_of_cwd) {
    auto policy = CapabilityPolicy::default_policy();
    EXPECT_NO_THROW(policy.check_read("."));
    EXPECT_NO_THROW(policy.check_read("../.."));
    EXPECT_NO_THROW(policy.check_read("some/file/that/does/not/exist"));
    auto grandparent = path_absolute("../..", get_cwd());
    if (grandparent != "/") {
        EXPECT_THAT(
            [&] { policy.check_read("../../.."); }, throws_access_denied(AccessDenied::Kind::READ)
        );
    }
}

// NOLINTNEXTLINE
TEST(capability_policy, read_subtrees) {
    TemporaryDirectory tmp_dir;
    auto dir = tmp_dir.path();
    ASSERT_EQ(mkdir((dir + "/allowed").c_str(), 0755), 0);
    ASSERT_EQ(mkdir((dir + "/other").c_str(), 0755), 0);
    CapabilityPolicy policy = {
        .filesystem = {.read_allowed = {dir + "/allowed"}, .write_allowed = {}},
    };

    EXPECT_NO_THROW(policy.check_read(dir + "/allowed"));
    EXPECT_NO_THROW(policy.check_read(dir + "/allowed/file.txt"));
    EXPECT_NO_THROW(policy.check_read(dir + "/other/../allowed/x"));
    EXPECT_THAT(
        [&] { policy.check_read(dir + "/other/file.txt"); },
        throws_access_denied(AccessDenied::Kind::READ)
    );
    EXPECT_THAT(
        [&] { policy.check_read(dir + "/allowed/../other"); },
        throws_access_denied(AccessDenied::Kind::READ)
    );
    EXPECT_THAT(
        [&] { policy.check_read(dir + "/allowed_not"); },
        throws_access_denied(AccessDenied::Kind::READ)
    );
    EXPECT_THAT([&] { policy.check_read("/"); }, throws_access_denied(AccessDenied::Kind::READ));
}

// NOLINTNEXTLINE
TEST(capability_policy, symlink_escaping_subtree_is_denied) {
    TemporaryDirectory tmp_dir;
    auto dir = tmp_dir.path();
    ASSERT_EQ(mkdir((dir + "/allowed").c_str(), 0755), 0);
    ASSERT_EQ(symlink("/etc", (dir + "/allowed/escape").c_str()), 0);
    CapabilityPolicy policy = {
        .filesystem = {.read_allowed = {dir + "/allowed"}, .write_allowed = {}},
    };
    EXPECT_THAT(
        [&] { policy.check_read(dir + "/allowed/escape/passwd"); },
        testing::ThrowsMessage<AccessDenied>(
            testing::HasSubstr("read access denied: " + dir + "/allowed/escape/passwd")
        )
    );
}

// NOLINTNEXTLINE
TEST(capability_policy, parent_directory_after_symlink_is_resolved_by_filesystem) {
    TemporaryDirectory tmp_dir;
    auto dir = tmp_dir.path();
    ASSERT_EQ(mkdir((dir + "/allowed").c_str(), 0755), 0);
    ASSERT_EQ(mkdir((dir + "/outside").c_str(), 0755), 0);
    ASSERT_EQ(mkdir((dir + "/outside/sub").c_str(), 0755), 0);
    ASSERT_EQ(symlink((dir + "/outside/sub").c_str(), (dir + "/allowed/link").c_str()), 0);
    create_file(dir + "/outside/secret", "outside");
    create_file(dir + "/allowed/secret", "inside");
    CapabilityPolicy policy = {
        .filesystem = {.read_allowed = {dir + "/allowed"}, .write_allowed = {dir + "/allowed"}},
    };

    // The kernel reaches outside/secret through this path
    auto escaping = dir + "/allowed/link/../secret";
    EXPECT_THAT(
        [&] { policy.check_read(escaping); }, throws_access_denied(AccessDenied::Kind::READ)
    );
    EXPECT_THAT(
        [&] { (void)policy.open_for_reading(escaping); },
        throws_access_denied(AccessDenied::Kind::READ)
    );
    EXPECT_THAT(
        [&] { (void)policy.open_for_writing(dir + "/allowed/link/../planted"); },
        throws_access_denied(AccessDenied::Kind::WRITE)
    );
    struct stat st {};
    EXPECT_EQ(stat((dir + "/outside/planted").c_str(), &st), -1);

    auto fd = policy.open_for_reading(dir + "/allowed/link/../../allowed/secret");
    ASSERT_TRUE(fd.is_open());
    EXPECT_EQ(get_file_contents(fd), "inside");
}

// NOLINTNEXTLINE
TEST(capability_policy, opening_files) {
    TemporaryDirectory tmp_dir;
    auto dir = tmp_dir.path();
    CapabilityPolicy policy = {
        .filesystem = {.read_allowed = {dir}, .write_allowed = {dir + "/out"}},
    };
    ASSERT_EQ(mkdir((dir + "/out").c_str(), 0755), 0);
    {
        auto fd = policy.open_for_writing(dir + "/out/../out/result.txt");
        ASSERT_TRUE(fd.is_open());
        ASSERT_EQ(write_all(fd, "result"), 6U);
    }
    auto fd = policy.open_for_reading(dir + "/out/result.txt");
    ASSERT_TRUE(fd.is_open());
    EXPECT_EQ(get_file_contents(fd), "result");

    auto missing = policy.open_for_reading(dir + "/missing");
    EXPECT_FALSE(missing.is_open());
    EXPECT_EQ(errno, ENOENT);
    EXPECT_THAT(
        [&] { (void)policy.open_for_writing(dir + "/result.txt"); },
        throws_access_denied(AccessDenied::Kind::WRITE)
    );
}

// NOLINTNEXTLINE
TEST(capability_policy, write_subtrees) {
    TemporaryDirectory tmp_dir;
    auto dir = tmp_dir.path();
    CapabilityPolicy policy = {
        .filesystem = {.read_allowed = {dir}, .write_allowed = {dir + "/out"}},
    };
    EXPECT_NO_THROW(policy.check_write(dir + "/out/result.txt"));
    EXPECT_THAT(
        [&] { policy.check_write(dir + "/result.txt"); },
        throws_access_denied(AccessDenied::Kind::WRITE)
    );
    // Reading does not imply writing
    EXPECT_NO_THROW(policy.check_read(dir + "/result.txt"));
}

// NOLINTNEXTLINE
TEST(capability_policy, network_and_process_execution) {
    CapabilityPolicy denied;
    EXPECT_THAT(
        [&] { denied.check_network("connect to 127.0.0.1:80"); },
        testing::ThrowsMessage<AccessDenied>(
            testing::StrEq("network access denied: connect to 127.0.0.1:80")
        )
    );
    EXPECT_THAT(
        [&] { denied.check_process_execution("/bin/true"); },
        throws_access_denied(AccessDenied::Kind::EXECUTE)
    );

    CapabilityPolicy allowed = {.network_allowed = true, .process_execution_allowed = true};
    EXPECT_NO_THROW(allowed.check_network("listen on 0.0.0.0:8080"));
    EXPECT_NO_THROW(allowed.check_process_execution("/bin/true"));
}

// NOLINTNEXTLINE
TEST(capability_policy, seccomp_program) {
    for (bool permissive : {false, true}) {
        CapabilityPolicy policy = {
            .filesystem = {.read_allowed = {}, .write_allowed = {}},
            .network_allowed = permissive,
            .process_execution_allowed = permissive,
        };
        if (permissive) {
            policy.filesystem.write_allowed.emplace_back("/tmp");
        }
        auto fd = policy.seccomp_program();
        ASSERT_TRUE(fd.is_open());
        auto len = lseek(fd, 0, SEEK_END);
        ASSERT_GT(len, 0);
        ASSERT_EQ(len % sizeof(sock_filter), 0U);
    }
}

// NOLINTNEXTLINE
TEST(capability_policy, seccomp_program_denies_kill_but_not_tgkill) {
    auto bpf_fd = CapabilityPolicy{}.seccomp_program();
    ASSERT_TRUE(bpf_fd.is_open());
    auto len = lseek(bpf_fd, 0, SEEK_END);
    ASSERT_GT(len, 0);
    std::vector<sock_filter> program(static_cast<size_t>(len) / sizeof(sock_filter));

    pid_t pid = fork();
    ASSERT_NE(pid, -1);
    if (pid == 0) {
        if (pread(bpf_fd, program.data(), static_cast<size_t>(len), 0) != len) {
            _exit(2);
        }
        sock_fprog fprog = {
            .len = static_cast<unsigned short>(program.size()),
            .filter = program.data(),
        };
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) or
            syscall(SYS_seccomp, SECCOMP_SET_MODE_FILTER, 0, &fprog))
        {
            _exit(3);
        }
        if (kill(getppid(), 0) != -1 or errno != EPERM) {
            _exit(4);
        }
        if (kill(getpid(), 0) != -1 or errno != EPERM) {
            _exit(5);
        }
        if (syscall(SYS_tgkill, getpid(), gettid(), 0)) {
            _exit(6);
        }
        _exit(0);
    }
    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

// NOLINTNEXTLINE
TEST(capability_policy, access_denied_details) {
    AccessDenied err{AccessDenied::Kind::EXECUTE, "/bin/sh"};
    EXPECT_STREQ(err.what(), "execute access denied: /bin/sh");
    EXPECT_EQ(err.details(), "/bin/sh");
    EXPECT_EQ(AccessDenied::kind_from_byte(4), AccessDenied::Kind::NETWORK);
    EXPECT_EQ(AccessDenied::kind_from_byte(0), std::nullopt);
    EXPECT_EQ(AccessDenied::kind_from_byte(5), std::nullopt);
}
