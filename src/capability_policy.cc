#include "evalbox/capability_policy.hh"
#include "evalbox/concat_tostr.hh"
#include "evalbox/errmsg.hh"
#include "evalbox/errors.hh"
#include "evalbox/macros/throw.hh"
#include "evalbox/path.hh"
#include "evalbox/seccomp/bpf_builder.hh"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <fcntl.h>
#include <linux/sched.h>
#include <seccomp.h>
#include <unistd.h>

using evalbox::seccomp::ARG0_MASKED_EQ;
using evalbox::seccomp::ARG1_MASKED_EQ;
using evalbox::seccomp::ARG2_MASKED_EQ;
using evalbox::seccomp::BpfBuilder;

namespace {

bool is_within_any(const std::string& path, const std::vector<std::string>& subtrees) {
    return std::any_of(subtrees.begin(), subtrees.end(), [&](const std::string& subtree) {
        return path_is_within(path, evalbox::resolve_policy_path(subtree));
    });
}

// The path the kernel opened, with every symlink and .. already resolved
std::string opened_file_path(int fd) {
    auto fd_link = concat_tostr("/proc/self/fd/", fd);
    std::string res(PATH_MAX, '\0');
    auto len = readlink(fd_link.c_str(), res.data(), res.size());
    if (len < 0) {
        THROW("readlink(", fd_link, ')', errmsg());
    }
    res.resize(static_cast<size_t>(len));
    return res;
}

void deny_network(BpfBuilder& bb) {
    for (int syscall : {
             SCMP_SYS(socket),
             SCMP_SYS(socketpair),
             SCMP_SYS(connect),
             SCMP_SYS(bind),
             SCMP_SYS(listen),
             SCMP_SYS(accept),
             SCMP_SYS(accept4),
         })
    {
        bb.err_syscall(EACCES, syscall);
    }
}

void deny_process_execution(BpfBuilder& bb) {
    bb.err_syscall(EACCES, SCMP_SYS(execve));
    bb.err_syscall(EACCES, SCMP_SYS(execveat));
    bb.err_syscall(EACCES, SCMP_SYS(fork));
    bb.err_syscall(EACCES, SCMP_SYS(vfork));
    // Threads are still allowed
    bb.err_syscall(EACCES, SCMP_SYS(clone), ARG0_MASKED_EQ{.mask = CLONE_THREAD, .datum = 0});
    // clone3() arguments are behind a pointer, so make libc fall back to clone()
    bb.err_syscall(ENOSYS, SCMP_SYS(clone3));
}

void deny_filesystem_writes(BpfBuilder& bb) {
    auto deny_opening_for_writing = [&](int syscall, auto flags_arg) {
        using Arg = decltype(flags_arg);
        bb.err_syscall(EACCES, syscall, Arg{.mask = O_ACCMODE, .datum = O_WRONLY});
        bb.err_syscall(EACCES, syscall, Arg{.mask = O_ACCMODE, .datum = O_RDWR});
        bb.err_syscall(EACCES, syscall, Arg{.mask = O_CREAT, .datum = O_CREAT});
        bb.err_syscall(EACCES, syscall, Arg{.mask = O_TRUNC, .datum = O_TRUNC});
    };
    deny_opening_for_writing(SCMP_SYS(open), ARG1_MASKED_EQ{});
    deny_opening_for_writing(SCMP_SYS(openat), ARG2_MASKED_EQ{});
    // openat2() flags are behind a pointer, so make libc fall back to openat()
    bb.err_syscall(ENOSYS, SCMP_SYS(openat2));

    for (int syscall : {
             SCMP_SYS(creat),
             SCMP_SYS(mkdir),
             SCMP_SYS(mkdirat),
             SCMP_SYS(unlink),
             SCMP_SYS(unlinkat),
             SCMP_SYS(rmdir),
             SCMP_SYS(rename),
             SCMP_SYS(renameat),
             SCMP_SYS(renameat2),
             SCMP_SYS(truncate),
             SCMP_SYS(symlink),
             SCMP_SYS(symlinkat),
             SCMP_SYS(link),
             SCMP_SYS(linkat),
             SCMP_SYS(chmod),
             SCMP_SYS(fchmodat),
             SCMP_SYS(mknod),
             SCMP_SYS(mknodat),
         })
    {
        bb.err_syscall(EACCES, syscall);
    }
}

} // namespace

namespace evalbox {

std::string resolve_policy_path(std::string_view path) {
    // .. components are left to the filesystem, a symlink before one may lead anywhere
    if (path.starts_with('/')) {
        return path_resolve_existing_prefix(std::string{path});
    }
    return path_resolve_existing_prefix(concat_tostr(get_cwd(), '/', path));
}

CapabilityPolicy CapabilityPolicy::default_policy() {
    return {
        .filesystem =
            {
                .read_allowed = {path_absolute("../..", get_cwd())},
                .write_allowed = {},
            },
        .network_allowed = false,
        .process_execution_allowed = false,
    };
}

void CapabilityPolicy::check_read(std::string_view path) const {
    if (not is_within_any(resolve_policy_path(path), filesystem.read_allowed)) {
        throw AccessDenied{AccessDenied::Kind::READ, path};
    }
}

void CapabilityPolicy::check_write(std::string_view path) const {
    if (not is_within_any(resolve_policy_path(path), filesystem.write_allowed)) {
        throw AccessDenied{AccessDenied::Kind::WRITE, path};
    }
}

FileDescriptor CapabilityPolicy::open_for_reading(std::string_view path) const {
    auto resolved = resolve_policy_path(path);
    if (not is_within_any(resolved, filesystem.read_allowed)) {
        throw AccessDenied{AccessDenied::Kind::READ, path};
    }
    FileDescriptor fd{resolved.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW};
    if (fd.is_open() and not is_within_any(opened_file_path(fd), filesystem.read_allowed)) {
        throw AccessDenied{AccessDenied::Kind::READ, path};
    }
    return fd;
}

FileDescriptor CapabilityPolicy::open_for_writing(std::string_view path) const {
    auto resolved = resolve_policy_path(path);
    if (not is_within_any(resolved, filesystem.write_allowed)) {
        throw AccessDenied{AccessDenied::Kind::WRITE, path};
    }
    FileDescriptor fd{resolved.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC | O_NOFOLLOW};
    if (fd.is_open() and not is_within_any(opened_file_path(fd), filesystem.write_allowed)) {
        throw AccessDenied{AccessDenied::Kind::WRITE, path};
    }
    return fd;
}

void CapabilityPolicy::check_network(std::string_view description) const {
    if (not network_allowed) {
        throw AccessDenied{AccessDenied::Kind::NETWORK, description};
    }
}

void CapabilityPolicy::check_process_execution(std::string_view path) const {
    if (not process_execution_allowed) {
        throw AccessDenied{AccessDenied::Kind::EXECUTE, path};
    }
}

FileDescriptor CapabilityPolicy::seccomp_program() const {
    BpfBuilder bb{SCMP_ACT_ALLOW};
    // Never allowed to the evaluated program
    bb.err_syscall(EPERM, SCMP_SYS(ptrace));
    bb.err_syscall(EPERM, SCMP_SYS(process_vm_writev));
    bb.err_syscall(EPERM, SCMP_SYS(kill));

    if (not network_allowed) {
        deny_network(bb);
    }
    if (not process_execution_allowed) {
        deny_process_execution(bb);
    }
    if (filesystem.write_allowed.empty()) {
        deny_filesystem_writes(bb);
    }
    return bb.export_to_fd();
}

} // namespace evalbox
