#include "runtime_process.hh"
#include "evalbox/concat_tostr.hh"
#include "evalbox/debug_logger.hh"
#include "evalbox/errmsg.hh"
#include "evalbox/errors.hh"
#include "evalbox/file_contents.hh"
#include "evalbox/logger.hh"
#include "evalbox/macros/throw.hh"
#include "evalbox/pipe.hh"
#include "evalbox/syscalls.hh"
#include "runtime_main.hh"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <linux/wait.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr DebugLogger<false> debuglog{};

} // namespace

namespace evalbox {

std::string Si::description() const {
    auto signal_name = [](int signum) {
        auto abbrev = sigabbrev_np(signum);
        return abbrev ? concat_tostr("SIG", abbrev) : concat_tostr("number ", signum);
    };
    // The runtime process is only waited for with WEXITED
    switch (code) {
    case CLD_EXITED: return concat_tostr("exited with ", status);
    case CLD_KILLED: return concat_tostr("killed by signal ", signal_name(status));
    case CLD_DUMPED:
        return concat_tostr("killed by signal ", signal_name(status), " (core dumped)");
    }
    return concat_tostr("ended with si_code ", code, " and si_status ", status);
}

RuntimeProcess
RuntimeProcess::start(const CapabilityPolicy& policy, uint64_t memory_limit_in_bytes) {
    FileDescriptor seccomp_bpf_fd;
    try {
        seccomp_bpf_fd = policy.seccomp_program();
    } catch (const std::exception& e) {
        throw InitializationError{concat_tostr("building the seccomp filter: ", e.what())};
    }
    auto sock_pair = unix_socketpair(SOCK_STREAM | SOCK_CLOEXEC);
    if (not sock_pair) {
        throw InitializationError{concat_tostr("socketpair()", errmsg())};
    }
    auto sync_pipe = pipe2(O_CLOEXEC);
    if (not sync_pipe) {
        throw InitializationError{concat_tostr("pipe2()", errmsg())};
    }

    pid_t session_owner_pid = getpid();
    pid_t pid = fork();
    if (pid == -1) {
        throw InitializationError{concat_tostr("fork()", errmsg())};
    }
    if (pid == 0) {
        runtime::main({
            .session_owner_pid = session_owner_pid,
            .sock_fd = sock_pair->other_end,
            .seccomp_bpf_fd = seccomp_bpf_fd,
            .sync_fd = sync_pipe->writable,
            .memory_limit_in_bytes = memory_limit_in_bytes,
            .policy = policy,
        });
        __builtin_unreachable();
    }
    // Parent process
    debuglog("forked runtime process ", pid);
    FileDescriptor pidfd{syscalls::pidfd_open(pid, 0)};
    if (not pidfd.is_open()) {
        int errnum = errno;
        (void)::kill(pid, SIGKILL);
        siginfo_t si;
        while (syscalls::waitid(P_PID, pid, &si, WEXITED, nullptr) and errno == EINTR) {
        }
        throw InitializationError{concat_tostr("pidfd_open()", errmsg(errnum))};
    }
    // From now on the destructor takes care of the process
    RuntimeProcess rp{pid, std::move(pidfd), std::move(sock_pair->our_end)};
    (void)sock_pair->other_end.close();
    (void)sync_pipe->writable.close();
    (void)seccomp_bpf_fd.close();

    std::string sync_msg;
    try {
        sync_msg = get_file_contents(sync_pipe->readable);
    } catch (const std::runtime_error& e) {
        throw InitializationError{concat_tostr("waiting for the runtime process: ", e.what())};
    }
    if (sync_msg == std::string_view{"", 1}) {
        debuglog("runtime process ", pid, " is ready");
        return rp;
    }

    // The runtime process failed to initialize and has exited (or is about to exit)
    Si si{};
    try {
        si = rp.wait();
    } catch (const std::runtime_error& e) {
        throw InitializationError{concat_tostr("reaping the runtime process: ", e.what())};
    }
    if (sync_msg.empty()) {
        throw InitializationError{
            concat_tostr("runtime process ", si.description(), " before becoming ready")
        };
    }
    throw InitializationError{concat_tostr("runtime process: ", sync_msg)};
}

RuntimeProcess::~RuntimeProcess() {
    if (not pidfd_.is_open() or si_) {
        return; // moved-out or already reaped
    }
    try {
        kill();
        (void)wait();
    } catch (const std::exception& e) {
        errlog("runtime process ", pid_, ": ", e.what());
    }
}

bool RuntimeProcess::send_request(std::string_view program) noexcept {
    return communication::session_runtime::write_frame(
        sock_fd_, communication::session_runtime::FrameType::EVALUATE, program
    );
}

std::optional<communication::session_runtime::Frame> RuntimeProcess::receive_frame() {
    return communication::session_runtime::read_frame(sock_fd_);
}

void RuntimeProcess::kill() {
    if (syscalls::pidfd_send_signal(pidfd_, SIGKILL, nullptr, 0) and errno != ESRCH) {
        THROW("pidfd_send_signal()", errmsg());
    }
}

bool RuntimeProcess::is_running() const noexcept {
    pollfd pfd = {
        .fd = pidfd_,
        .events = POLLIN,
        .revents = 0,
    };
    for (;;) {
        int rc = poll(&pfd, 1, 0);
        if (rc == 0) {
            return true;
        }
        if (rc == 1 or errno != EINTR) {
            return false;
        }
    }
}

Si RuntimeProcess::wait() {
    if (si_) {
        return *si_;
    }
    siginfo_t si;
    while (syscalls::waitid(P_PIDFD, pidfd_, &si, WEXITED, nullptr)) {
        if (errno != EINTR) {
            THROW("waitid()", errmsg());
        }
    }
    si_ = Si{.code = si.si_code, .status = si.si_status};
    debuglog("runtime process ", pid_, ' ', si_->description());
    return *si_;
}

} // namespace evalbox
