#include "evalbox/datalog/builtins.hh"
#include "evalbox/concat_tostr.hh"
#include "evalbox/errmsg.hh"
#include "evalbox/errors.hh"
#include "evalbox/file_contents.hh"
#include "evalbox/file_descriptor.hh"

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <limits>
#include <netinet/in.h>
#include <new>
#include <optional>
#include <spawn.h>
#include <string>
#include <sys/socket.h>
#include <sys/wait.h>

using evalbox::AccessDenied;
using evalbox::RuntimeError;
using evalbox::datalog::BuiltinContext;
using evalbox::datalog::Literal;
using evalbox::datalog::Term;

extern char** environ; // NOLINT(readability-redundant-declaration)

namespace {

// EACCES and EPERM come from the seccomp filter (or the filesystem permissions) and are reported
// as access denials of the operation's kind
[[noreturn]] void throw_os_error(AccessDenied::Kind kind, std::string_view what, int errnum) {
    if (errnum == EACCES or errnum == EPERM) {
        throw AccessDenied{kind, concat_tostr(what, errmsg(errnum))};
    }
    throw RuntimeError{concat_tostr(what, errmsg(errnum))};
}

std::string signature(const Literal& goal) {
    return concat_tostr(goal.predicate, '/', goal.args.size());
}

const Term& bound_arg(const Literal& goal, size_t idx) {
    const auto& arg = goal.args[idx];
    if (arg.is_variable()) {
        throw RuntimeError{
            concat_tostr(signature(goal), ": argument ", idx + 1, " is not bound (", arg.text, ')')
        };
    }
    return arg;
}

const std::string& string_arg(const Literal& goal, size_t idx) {
    const auto& arg = bound_arg(goal, idx);
    if (arg.kind != Term::Kind::STRING) {
        throw RuntimeError{concat_tostr(
            signature(goal), ": argument ", idx + 1, " has to be a string, got ", arg.to_string()
        )};
    }
    return arg.text;
}

int64_t integer_arg(const Literal& goal, size_t idx) {
    const auto& arg = bound_arg(goal, idx);
    if (arg.kind != Term::Kind::INTEGER) {
        throw RuntimeError{concat_tostr(
            signature(goal), ": argument ", idx + 1, " has to be an integer, got ", arg.to_string()
        )};
    }
    return arg.integer;
}

uint16_t port_arg(const Literal& goal, size_t idx) {
    auto port = integer_arg(goal, idx);
    if (port < 0 or port > std::numeric_limits<uint16_t>::max()) {
        throw RuntimeError{concat_tostr(signature(goal), ": invalid port ", port)};
    }
    return static_cast<uint16_t>(port);
}

// Binds argument @p idx to @p value if it is a variable, otherwise compares them
std::optional<Literal> unify_arg(const Literal& goal, size_t idx, Term value) {
    if (goal.args[idx].is_variable()) {
        auto res = goal;
        // The same variable may appear more than once
        auto var = goal.args[idx].text;
        for (auto& arg : res.args) {
            if (arg.is_variable() and arg.text == var) {
                arg = value;
            }
        }
        return res;
    }
    if (goal.args[idx] != value) {
        return std::nullopt;
    }
    return goal;
}

std::optional<Literal> builtin_write(const Literal& goal, BuiltinContext& ctx) {
    ctx.output.write_stdout(bound_arg(goal, 0).text_of());
    return goal;
}

std::optional<Literal> builtin_write_err(const Literal& goal, BuiltinContext& ctx) {
    ctx.output.write_stderr(bound_arg(goal, 0).text_of());
    return goal;
}

std::optional<Literal> builtin_file_contents(const Literal& goal, BuiltinContext& ctx) {
    const auto& path = string_arg(goal, 0);
    auto fd = ctx.policy.open_for_reading(path);
    if (not fd.is_open()) {
        throw_os_error(AccessDenied::Kind::READ, concat_tostr("open(\"", path, "\")"), errno);
    }
    return unify_arg(goal, 1, Term::string(get_file_contents(fd)));
}

std::optional<Literal> builtin_file_write(const Literal& goal, BuiltinContext& ctx) {
    const auto& path = string_arg(goal, 0);
    auto data = bound_arg(goal, 1).text_of();
    auto fd = ctx.policy.open_for_writing(path);
    if (not fd.is_open()) {
        throw_os_error(AccessDenied::Kind::WRITE, concat_tostr("open(\"", path, "\")"), errno);
    }
    if (write_all(fd, data) != data.size()) {
        throw_os_error(AccessDenied::Kind::WRITE, concat_tostr("write(\"", path, "\")"), errno);
    }
    if (fd.close()) {
        throw_os_error(AccessDenied::Kind::WRITE, concat_tostr("close(\"", path, "\")"), errno);
    }
    return goal;
}

FileDescriptor open_tcp_socket() {
    FileDescriptor sock{socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)};
    if (not sock.is_open()) {
        throw_os_error(AccessDenied::Kind::NETWORK, "socket()", errno);
    }
    return sock;
}

std::optional<Literal> builtin_tcp_connect(const Literal& goal, BuiltinContext& ctx) {
    const auto& host = string_arg(goal, 0);
    auto port = port_arg(goal, 1);
    ctx.policy.check_network(concat_tostr("connect to ", host, ':', port));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        throw RuntimeError{concat_tostr(signature(goal), ": invalid IPv4 address: ", host)};
    }
    auto sock = open_tcp_socket();
    if (connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr))) {
        throw_os_error(
            AccessDenied::Kind::NETWORK, concat_tostr("connect(", host, ':', port, ')'), errno
        );
    }
    return goal;
}

std::optional<Literal> builtin_tcp_listen(const Literal& goal, BuiltinContext& ctx) {
    auto port = port_arg(goal, 0);
    ctx.policy.check_network(concat_tostr("listen on 0.0.0.0:", port));

    auto sock = open_tcp_socket();
    int reuse = 1;
    if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse))) {
        throw_os_error(AccessDenied::Kind::NETWORK, "setsockopt()", errno);
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    if (bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr))) {
        throw_os_error(AccessDenied::Kind::NETWORK, concat_tostr("bind(", port, ')'), errno);
    }
    if (listen(sock, 1)) {
        throw_os_error(AccessDenied::Kind::NETWORK, "listen()", errno);
    }
    return goal;
}

std::optional<Literal> builtin_run(const Literal& goal, BuiltinContext& ctx) {
    const auto& path = string_arg(goal, 0);
    ctx.policy.check_process_execution(path);

    std::array<char*, 2> argv = {const_cast<char*>(path.c_str()), nullptr};
    pid_t pid{};
    int errnum = posix_spawn(&pid, path.c_str(), nullptr, nullptr, argv.data(), environ);
    if (errnum) {
        throw_os_error(
            AccessDenied::Kind::EXECUTE, concat_tostr("posix_spawn(\"", path, "\")"), errnum
        );
    }
    int status{};
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw RuntimeError{concat_tostr("waitpid()", errmsg())};
        }
    }
    int64_t exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    return unify_arg(goal, 1, Term::integer_of(exit_status));
}

std::optional<Literal> builtin_repeat(const Literal& goal, BuiltinContext& /*ctx*/) {
    auto text = bound_arg(goal, 0).text_of();
    auto times = integer_arg(goal, 1);
    if (times < 0) {
        throw RuntimeError{concat_tostr(signature(goal), ": negative repetition count ", times)};
    }
    auto n = static_cast<uint64_t>(times);
    if (not text.empty() and n > std::string{}.max_size() / text.size()) {
        throw std::bad_alloc{};
    }
    std::string res;
    res.reserve(text.size() * n);
    for (uint64_t i = 0; i < n; ++i) {
        res += text;
    }
    return unify_arg(goal, 2, Term::string(std::move(res)));
}

std::optional<Literal> builtin_raise(const Literal& goal, BuiltinContext& /*ctx*/) {
    throw RuntimeError{bound_arg(goal, 0).text_of()};
}

struct Builtin {
    std::string_view name;
    size_t arity;
    std::optional<Literal> (*impl)(const Literal&, BuiltinContext&);
};

constexpr std::array builtins = {
    Builtin{.name = "write", .arity = 1, .impl = builtin_write},
    Builtin{.name = "write_err", .arity = 1, .impl = builtin_write_err},
    Builtin{.name = "file_contents", .arity = 2, .impl = builtin_file_contents},
    Builtin{.name = "file_write", .arity = 2, .impl = builtin_file_write},
    Builtin{.name = "tcp_connect", .arity = 2, .impl = builtin_tcp_connect},
    Builtin{.name = "tcp_listen", .arity = 1, .impl = builtin_tcp_listen},
    Builtin{.name = "run", .arity = 2, .impl = builtin_run},
    Builtin{.name = "repeat", .arity = 3, .impl = builtin_repeat},
    Builtin{.name = "raise", .arity = 1, .impl = builtin_raise},
};

} // namespace

namespace evalbox::datalog {

bool is_builtin(std::string_view predicate) noexcept {
    for (const auto& builtin : builtins) {
        if (builtin.name == predicate) {
            return true;
        }
    }
    return false;
}

std::optional<Literal> call_builtin(const Literal& goal, BuiltinContext& ctx) {
    for (const auto& builtin : builtins) {
        if (builtin.name == goal.predicate and builtin.arity == goal.args.size()) {
            return builtin.impl(goal, ctx);
        }
    }
    throw RuntimeError{concat_tostr("unknown builtin predicate ", signature(goal))};
}

} // namespace evalbox::datalog
