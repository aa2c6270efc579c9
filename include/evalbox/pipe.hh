#pragma once

#include "evalbox/file_descriptor.hh"

#include <optional>
#include <sys/socket.h>
#include <unistd.h>

struct Pipe {
    FileDescriptor readable;
    FileDescriptor writable;
};

// Returns std::nullopt on error with errno set appropriately
inline std::optional<Pipe> pipe2(int flags) noexcept {
    int pfd[2];
    int rc = pipe2(pfd, flags);
    if (rc) {
        return std::nullopt;
    }
    return Pipe{
        .readable = FileDescriptor{pfd[0]},
        .writable = FileDescriptor{pfd[1]},
    };
}

struct UnixSocketPair {
    FileDescriptor our_end;
    FileDescriptor other_end;
};

// Returns std::nullopt on error with errno set appropriately
inline std::optional<UnixSocketPair> unix_socketpair(int type_and_flags) noexcept {
    int sfd[2];
    if (socketpair(AF_UNIX, type_and_flags, 0, sfd)) {
        return std::nullopt;
    }
    return UnixSocketPair{
        .our_end = FileDescriptor{sfd[0]},
        .other_end = FileDescriptor{sfd[1]},
    };
}
