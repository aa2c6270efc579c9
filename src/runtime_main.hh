#pragma once

#include "evalbox/capability_policy.hh"

#include <cstdint>
#include <sys/types.h>

namespace evalbox::runtime {

struct Args {
    pid_t session_owner_pid;
    int sock_fd;
    int seccomp_bpf_fd;
    int sync_fd; // receives a single null byte once initialized, or an error description
    uint64_t memory_limit_in_bytes;
    const CapabilityPolicy& policy;
};

// Body of the runtime process: restricts the process, then serves evaluation requests until the
// session closes the connection
[[noreturn]] void main(Args args) noexcept;

} // namespace evalbox::runtime
