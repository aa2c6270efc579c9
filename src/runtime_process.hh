#pragma once

#include "evalbox/capability_policy.hh"
#include "evalbox/file_descriptor.hh"
#include "runtime_protocol.hh"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace evalbox {

struct Si {
    int code; // siginfo_t::si_code from waitid()
    int status; // siginfo_t::si_status from waitid()

    // E.g. "exited with 1", "killed by signal SIGKILL"
    [[nodiscard]] std::string description() const;
};

// Handle of the forked process that evaluates programs of one session
class RuntimeProcess {
    pid_t pid_;
    FileDescriptor pidfd_;
    FileDescriptor sock_fd_;
    std::optional<Si> si_; // set once reaped

    RuntimeProcess(pid_t pid, FileDescriptor pidfd, FileDescriptor sock_fd) noexcept
    : pid_{pid}
    , pidfd_{std::move(pidfd)}
    , sock_fd_{std::move(sock_fd)} {}

public:
    // Forks the runtime process and waits until it restricts itself. Throws InitializationError
    // if that fails.
    static RuntimeProcess start(const CapabilityPolicy& policy, uint64_t memory_limit_in_bytes);

    RuntimeProcess(const RuntimeProcess&) = delete;
    RuntimeProcess(RuntimeProcess&& other) noexcept = default;
    RuntimeProcess& operator=(const RuntimeProcess&) = delete;
    RuntimeProcess& operator=(RuntimeProcess&&) = delete;

    // Kills and reaps the process unless it is already reaped
    ~RuntimeProcess();

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    // Returns false if the process is unable to receive the request (e.g. because it died),
    // errno is set
    [[nodiscard]] bool send_request(std::string_view program) noexcept;

    // Returns std::nullopt if the process closed the connection (e.g. because it died)
    std::optional<communication::session_runtime::Frame> receive_frame();

    // Sends SIGKILL, does nothing if the process has already exited. Throws std::runtime_error
    // on error.
    void kill();

    // Checks without blocking whether the process has not exited yet
    [[nodiscard]] bool is_running() const noexcept;

    // Waits for the process to exit and reaps it. Subsequent calls return the same value. Not
    // thread-safe. Throws std::runtime_error on error.
    Si wait();
};

} // namespace evalbox
