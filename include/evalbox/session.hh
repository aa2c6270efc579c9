#pragma once

#include "evalbox/capability_policy.hh"
#include "evalbox/errors.hh"
#include "evalbox/output_capture.hh"
#include "evalbox/value.hh"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace evalbox {

class SessionId {
    uint64_t id_;

public:
    explicit constexpr SessionId(uint64_t id) noexcept : id_{id} {}

    // Returns an id that no other session of this process had
    static SessionId next() noexcept;

    [[nodiscard]] constexpr uint64_t value() const noexcept { return id_; }

    // E.g. "session#7"
    [[nodiscard]] std::string to_string() const;

    friend constexpr bool operator==(SessionId, SessionId) noexcept = default;
};

struct SessionOptions {
    uint64_t memory_limit_in_bytes = 16 << 20;
    std::optional<CapabilityPolicy> policy; // CapabilityPolicy::default_policy() if not set
    size_t output_capture_capacity = OutputCapture::default_capacity;
};

// Isolated evaluation environment: a runtime process restricted by a capability policy and a
// memory limit, with its standard output and standard error captured in bounded buffers.
//
// Evaluations of one session have to be serialized by the owner. drain_stdout(), drain_stderr(),
// flush(), is_alive() and kill() may be called concurrently with evaluate().
class Session {
public:
    static constexpr uint64_t default_memory_limit = 16 << 20;

private:
    struct State;
    std::unique_ptr<State> state_;

    explicit Session(std::unique_ptr<State> state) noexcept;

    [[nodiscard]] State& state() const;

    // Kills and reaps the runtime process (at most once)
    void reap();

    // Marks the session dead after the runtime process ended on its own
    void finish() noexcept;

    [[nodiscard]] TerminatedEvaluator terminated_error() const;

public:
    // Throws InitializationError if the runtime process cannot be started
    static Session create(
        uint64_t memory_limit_in_bytes = default_memory_limit,
        std::optional<CapabilityPolicy> policy = std::nullopt
    );

    static Session create(const SessionOptions& options);

    Session(const Session&) = delete;
    Session(Session&&) noexcept;
    Session& operator=(const Session&) = delete;
    Session& operator=(Session&&) noexcept;

    // Kills the runtime process
    ~Session();

    [[nodiscard]] SessionId id() const noexcept;

    // Evaluates @p program in the runtime process, the database persists between evaluations.
    // Output of the program goes to the output captures, evaluation blocks while the respective
    // capture is full.
    //
    // Throws:
    // - SyntaxError, RuntimeError, AccessDenied: the session stays alive
    // - ResourceExhausted: the memory limit was exceeded, the session is dead afterwards
    // - TerminatedEvaluator: the session is (or became during the evaluation) dead
    Value evaluate(std::string_view program);

    // Returns and clears output gathered since the last drain
    [[nodiscard]] std::string drain_stdout();

    [[nodiscard]] std::string drain_stderr();

    // Discards the gathered output of both streams
    void flush();

    [[nodiscard]] bool is_alive() const noexcept;

    // Kills the runtime process; the gathered output remains drainable. Idempotent.
    void kill();
};

} // namespace evalbox
