#include "runtime_main.hh"
#include "evalbox/datalog/interpreter.hh"
#include "evalbox/errmsg.hh"
#include "evalbox/errors.hh"
#include "evalbox/file_contents.hh"
#include "evalbox/proc_status_file.hh"
#include "evalbox/syscalls.hh"
#include "runtime_protocol.hh"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <linux/securebits.h>
#include <new>
#include <string>
#include <string_view>
#include <sys/capability.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <unistd.h>
#include <utility>

namespace sr = evalbox::communication::session_runtime;

namespace {

constexpr int SOCK_FD = 3;
constexpr int SECCOMP_BPF_FD = 4;
constexpr int SYNC_FD = 5;

// Does not allocate, it is sent when there is no memory left
constexpr std::string_view out_of_memory_msg =
    "out of memory: the evaluation exceeded the memory limit of the session";

struct Runtime {
    evalbox::runtime::Args args;

    template <class... Msg>
    // NOLINTNEXTLINE(readability-make-member-function-const)
    [[noreturn]] void die(const Msg&... msg_parts) noexcept {
        static_assert(sizeof...(Msg) > 0, "error message cannot be empty");
        for (auto msg : {std::string_view{msg_parts}...}) {
            if (not msg.empty()) {
                (void)write_all(args.sync_fd, msg);
            }
        }
        _exit(42);
    }

    template <class... Msg>
    void die_if_err(bool failed, const Msg&... msg_parts) noexcept {
        static_assert(sizeof...(Msg) > 0, "Description of the cause of an error is necessary");
        if (failed) {
            die(msg_parts..., errmsg());
        }
    }

    void initialize() noexcept {
        die_if_err(prctl(PR_SET_NAME, "evalbox-runtime", 0, 0, 0), "prctl(PR_SET_NAME)");
        // PR_SET_PDEATHSIG is not used, as it fires on exit of the thread that created the
        // session. The runtime exits once the connection closes instead, which also happens when
        // the session owner dies.
        if (getppid() != args.session_owner_pid) {
            die("session owner died");
        }
    }

    void reset_signals() noexcept {
        // Signal mask is inherited from the thread that created the session
        sigset_t sigset;
        die_if_err(sigemptyset(&sigset), "sigemptyset()");
        die_if_err(sigprocmask(SIG_SETMASK, &sigset, nullptr), "sigprocmask()");
        struct sigaction sa = {};
        sa.sa_handler = SIG_IGN;
        die_if_err(sigaction(SIGPIPE, &sa, nullptr), "sigaction(SIGPIPE)");
    }

    void setup_fds() noexcept {
        // Move the kept file descriptors out of the way first, so that placing them does not
        // overwrite one another
        auto move_above_kept_range = [&](int& fd) noexcept {
            int new_fd = fcntl(fd, F_DUPFD_CLOEXEC, SYNC_FD + 1);
            die_if_err(new_fd == -1, "fcntl(F_DUPFD_CLOEXEC)");
            fd = new_fd;
        };
        move_above_kept_range(args.sync_fd);
        move_above_kept_range(args.sock_fd);
        move_above_kept_range(args.seccomp_bpf_fd);

        auto place_at = [&](int& fd, int target_fd) noexcept {
            die_if_err(dup3(fd, target_fd, O_CLOEXEC) == -1, "dup3()");
            fd = target_fd;
        };
        place_at(args.sync_fd, SYNC_FD);
        place_at(args.sock_fd, SOCK_FD);
        place_at(args.seccomp_bpf_fd, SECCOMP_BPF_FD);
        die_if_err(syscalls::close_range(SYNC_FD + 1, ~0U, 0), "close_range()");

        int null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);
        die_if_err(null_fd == -1, "open(/dev/null)");
        for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
            if (fd != null_fd) {
                die_if_err(dup3(null_fd, fd, 0) == -1, "dup3()");
            }
        }
        if (null_fd > STDERR_FILENO) {
            die_if_err(close(null_fd), "close()");
        } else {
            // The descriptor is one of the standard streams, so it has to survive exec
            die_if_err(fcntl(null_fd, F_SETFD, 0), "fcntl(F_SETFD)");
        }
    }

    void set_limits() noexcept {
        auto set_limit = [&](auto resource, rlim64_t value, const char* name) noexcept {
            rlimit64 rlim = {.rlim_cur = value, .rlim_max = value};
            die_if_err(prlimit64(0, resource, &rlim, nullptr), "prlimit(", name, ")");
        };
        set_limit(RLIMIT_CORE, 0, "RLIMIT_CORE");

        // The process inherited the address space of the session owner, the limit applies on
        // top of it
        uint64_t vm_size = 0;
        try {
            FileDescriptor status_fd = open_proc_status(0);
            die_if_err(not status_fd.is_open(), "open(/proc/self/status)");
            vm_size = proc_status_memory_in_bytes(field_from_proc_status(status_fd, "VmSize"));
        } catch (const std::exception& e) {
            die("reading VmSize: ", e.what());
        }
        auto limit = vm_size + args.memory_limit_in_bytes;
        if (limit < vm_size) {
            limit = RLIM64_INFINITY;
        }
        set_limit(RLIMIT_AS, limit, "RLIMIT_AS");
    }

    void drop_capabilities() noexcept {
        cap_t caps = cap_get_proc();
        die_if_err(caps == nullptr, "cap_get_proc()");
        cap_flag_value_t can_set_securebits = CAP_CLEAR;
        die_if_err(
            cap_get_flag(caps, CAP_SETPCAP, CAP_EFFECTIVE, &can_set_securebits), "cap_get_flag()"
        );
        die_if_err(cap_free(caps), "cap_free()");
        // Set and lock securebits while we have capabilities
        if (can_set_securebits == CAP_SET) {
            die_if_err(
                cap_set_secbits(
                    SECBIT_NOROOT | SECBIT_NOROOT_LOCKED | SECBIT_NO_CAP_AMBIENT_RAISE |
                    SECBIT_NO_CAP_AMBIENT_RAISE_LOCKED
                ),
                "cap_set_secbits()"
            );
        }
        // Drop all capabilities
        caps = cap_init();
        die_if_err(caps == nullptr, "cap_init()");
        die_if_err(cap_clear(caps), "cap_clear()");
        die_if_err(cap_set_proc(caps), "cap_set_proc()");
        die_if_err(cap_free(caps), "cap_free()");
        die_if_err(prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0), "prctl(PR_SET_NO_NEW_PRIVS)");
    }

    void install_seccomp() noexcept {
        auto fd_len = lseek64(args.seccomp_bpf_fd, 0, SEEK_END);
        die_if_err(fd_len < 0, "lseek64()");
        if (fd_len == 0 or fd_len % sizeof(sock_filter) != 0) {
            die("invalid seccomp program length");
        }
        if (static_cast<uint64_t>(fd_len) / sizeof(sock_filter) > BPF_MAXINSNS) {
            die("seccomp program is too big");
        }
        void* filter = mmap(nullptr, fd_len, PROT_READ, MAP_PRIVATE, args.seccomp_bpf_fd, 0);
        die_if_err(filter == MAP_FAILED, "mmap()");
        auto fprog = sock_fprog{
            .len = static_cast<decltype(sock_fprog::len)>(fd_len / sizeof(sock_filter)),
            .filter = static_cast<sock_filter*>(filter),
        };
        die_if_err(syscalls::seccomp(SECCOMP_SET_MODE_FILTER, 0, &fprog), "seccomp()");
        die_if_err(munmap(filter, fd_len), "munmap()");
        die_if_err(close(args.seccomp_bpf_fd), "close()");
        args.seccomp_bpf_fd = -1;
    }

    void signal_ready() noexcept {
        die_if_err(write_all(args.sync_fd, "", 1) != 1, "write(sync_fd)");
        die_if_err(close(args.sync_fd), "close(sync_fd)");
        args.sync_fd = -1;
    }

    [[noreturn]] void serve() noexcept;
};

// Nothing can be reported once the connection is broken
void send_or_exit(sr::FrameType type, std::string_view body) noexcept {
    if (not sr::write_frame(SOCK_FD, type, body)) {
        _exit(1);
    }
}

[[noreturn]] void exit_out_of_memory() noexcept {
    send_or_exit(sr::FrameType::RESOURCE_EXHAUSTED, out_of_memory_msg);
    _exit(1);
}

class SocketOutput final : public evalbox::datalog::OutputSink {
    static void send(sr::FrameType type, std::string_view data) noexcept {
        while (not data.empty()) {
            auto chunk = data.substr(0, sr::max_output_frame_body_len);
            send_or_exit(type, chunk);
            data.remove_prefix(chunk.size());
        }
    }

public:
    void write_stdout(std::string_view data) override { send(sr::FrameType::STDOUT, data); }

    void write_stderr(std::string_view data) override { send(sr::FrameType::STDERR, data); }
};

// Returns the response frame to the evaluation request
std::pair<sr::FrameType, std::string>
evaluate(evalbox::datalog::Interpreter& interpreter, std::string_view program) {
    using sr::FrameType;
    try {
        return {FrameType::OK, interpreter.evaluate(program).encode()};
    } catch (const std::bad_alloc&) {
        exit_out_of_memory();
    } catch (const evalbox::SyntaxError& e) {
        return {FrameType::SYNTAX_ERROR, e.what()};
    } catch (const evalbox::AccessDenied& e) {
        std::string body(1, static_cast<char>(e.kind()));
        body += e.details();
        return {FrameType::ACCESS_DENIED, std::move(body)};
    } catch (const std::exception& e) {
        return {FrameType::RUNTIME_ERROR, e.what()};
    }
}

void Runtime::serve() noexcept {
    try {
        SocketOutput output;
        evalbox::datalog::Interpreter interpreter{args.policy, output};
        for (;;) {
            auto request = sr::read_frame(SOCK_FD);
            if (not request) {
                _exit(0); // the session closed the connection
            }
            if (request->type != sr::FrameType::EVALUATE) {
                send_or_exit(sr::FrameType::RUNTIME_ERROR, "unexpected request frame type");
                continue;
            }
            auto [type, body] = evaluate(interpreter, request->body);
            send_or_exit(type, body);
        }
    } catch (const std::bad_alloc&) {
        exit_out_of_memory();
    } catch (const std::exception& e) {
        // The connection is unusable (e.g. a corrupted frame)
        send_or_exit(sr::FrameType::RUNTIME_ERROR, e.what());
        _exit(1);
    }
}

} // namespace

namespace evalbox::runtime {

void main(Args args) noexcept {
    Runtime rt{.args = args};
    rt.initialize();
    rt.reset_signals();
    rt.setup_fds();
    rt.set_limits();
    rt.drop_capabilities();
    rt.install_seccomp();
    rt.signal_ready();
    rt.serve();
}

} // namespace evalbox::runtime
