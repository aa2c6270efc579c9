#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace evalbox {

// Base of every failure reported by a session
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The evaluation runtime could not be started; no session was created
class InitializationError : public Error {
public:
    using Error::Error;
};

// Malformed program; the session stays alive
class SyntaxError : public Error {
public:
    using Error::Error;
};

// The evaluated program raised an error; the session stays alive
class RuntimeError : public Error {
public:
    using Error::Error;
};

// The evaluation exceeded the memory limit; the session is dead afterwards
class ResourceExhausted : public Error {
public:
    using Error::Error;
};

// Evaluation was requested from a dead session
class TerminatedEvaluator : public Error {
public:
    using Error::Error;
};

// The evaluated program attempted an operation forbidden by the capability policy; the session
// stays alive
class AccessDenied : public Error {
public:
    enum class Kind : uint8_t {
        READ = 1,
        WRITE = 2,
        EXECUTE = 3,
        NETWORK = 4,
    };

private:
    Kind kind_;

public:
    AccessDenied(Kind kind, std::string_view details);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    // Message without the "<kind> access denied: " prefix
    [[nodiscard]] std::string_view details() const noexcept;

    [[nodiscard]] static const char* kind_name(Kind kind) noexcept;

    [[nodiscard]] static std::optional<Kind> kind_from_byte(uint8_t byte) noexcept;
};

} // namespace evalbox
