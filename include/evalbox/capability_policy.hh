#pragma once

#include "evalbox/file_descriptor.hh"

#include <string>
#include <string_view>
#include <vector>

namespace evalbox {

// Decides which operations the evaluated program may perform. Decision functions throw
// AccessDenied on refusal.
struct CapabilityPolicy {
    struct Filesystem {
        // Subtrees that may be read; relative paths are resolved against the current working
        // directory when checked
        std::vector<std::string> read_allowed;
        // Subtrees that may be written (files created, truncated, removed, ...)
        std::vector<std::string> write_allowed;
    } filesystem;

    bool network_allowed = false;
    bool process_execution_allowed = false;

    // Reading is allowed only under the directory two levels above the current working directory,
    // everything else is denied
    static CapabilityPolicy default_policy();

    void check_read(std::string_view path) const;

    void check_write(std::string_view path) const;

    // Opens the file at @p path for reading if check_read() allows it and the file actually
    // opened lies within a readable subtree. Returns a closed descriptor with errno set if the
    // kernel refuses to open it.
    [[nodiscard]] FileDescriptor open_for_reading(std::string_view path) const;

    // Like open_for_reading(), but creates or truncates the file for writing
    [[nodiscard]] FileDescriptor open_for_writing(std::string_view path) const;

    // @p description names the attempted connection, e.g. "connect to 127.0.0.1:80"
    void check_network(std::string_view description) const;

    void check_process_execution(std::string_view path) const;

    // Returns a memfd with the seccomp filter enforcing this policy in the runtime process
    [[nodiscard]] FileDescriptor seccomp_program() const;
};

// Returns the normalized absolute path the kernel would reach through @p path: its existing
// prefix is resolved through the filesystem, the rest is appended normalized
std::string resolve_policy_path(std::string_view path);

} // namespace evalbox
