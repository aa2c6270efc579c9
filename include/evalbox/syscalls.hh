#pragma once

#include <csignal>
#include <linux/wait.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

extern "C" struct rusage;

namespace syscalls {

#ifdef SYS_waitid
inline int
waitid(int id_type, pid_t id, siginfo_t* info, int options, struct rusage* usage) noexcept {
    return static_cast<int>(syscall(SYS_waitid, id_type, id, info, options, usage));
}
#endif

#ifdef SYS_pidfd_open
inline int pidfd_open(pid_t pid, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_open, pid, flags));
}
#endif

#ifdef SYS_pidfd_send_signal
inline int
pidfd_send_signal(int pidfd, int sig, siginfo_t* info, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_pidfd_send_signal, pidfd, sig, info, flags));
}
#endif

#ifdef SYS_close_range
inline int close_range(unsigned int first, unsigned int last, unsigned int flags) noexcept {
    return static_cast<int>(syscall(SYS_close_range, first, last, flags));
}
#endif

#ifdef SYS_seccomp
inline int seccomp(unsigned int operation, unsigned int flags, void* args) noexcept {
    return static_cast<int>(syscall(SYS_seccomp, operation, flags, args));
}
#endif

} // namespace syscalls
