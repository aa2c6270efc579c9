#include "evalbox/session.hh"
#include "evalbox/concat_tostr.hh"
#include "evalbox/debug_logger.hh"
#include "evalbox/errors.hh"
#include "evalbox/logger.hh"
#include "evalbox/macros/throw.hh"
#include "runtime_process.hh"
#include "runtime_protocol.hh"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace sr = evalbox::communication::session_runtime;

namespace {

constexpr DebugLogger<false> debuglog{};

} // namespace

namespace evalbox {

SessionId SessionId::next() noexcept {
    static std::atomic<uint64_t> last_id{0};
    return SessionId{last_id.fetch_add(1, std::memory_order_relaxed) + 1};
}

std::string SessionId::to_string() const { return concat_tostr("session#", id_); }

struct Session::State {
    const SessionId id;
    OutputCapture stdout_capture;
    OutputCapture stderr_capture;
    RuntimeProcess runtime;
    std::atomic<bool> dead{false};
    std::atomic<bool> killed_by_owner{false};
    std::mutex reap_mutex;
    std::optional<Si> si; // guarded by reap_mutex

    State(SessionId id, size_t output_capture_capacity, RuntimeProcess&& runtime)
    : id{id}
    , stdout_capture{output_capture_capacity}
    , stderr_capture{output_capture_capacity}
    , runtime{std::move(runtime)} {}
};

Session::Session(std::unique_ptr<State> state) noexcept : state_{std::move(state)} {}

Session::Session(Session&&) noexcept = default;

Session& Session::operator=(Session&& other) noexcept {
    if (this != &other) {
        Session old{std::move(state_)};
        state_ = std::move(other.state_);
    }
    return *this;
}

Session::~Session() {
    if (not state_) {
        return; // moved-out
    }
    try {
        kill();
    } catch (const std::exception& e) {
        errlog(state_->id.to_string(), ": failed to kill the runtime process: ", e.what());
    }
}

Session Session::create(uint64_t memory_limit_in_bytes, std::optional<CapabilityPolicy> policy) {
    return create(SessionOptions{
        .memory_limit_in_bytes = memory_limit_in_bytes,
        .policy = std::move(policy),
        .output_capture_capacity = OutputCapture::default_capacity,
    });
}

Session Session::create(const SessionOptions& options) {
    if (options.output_capture_capacity == 0) {
        throw InitializationError{"output capture capacity has to be positive"};
    }
    CapabilityPolicy policy;
    if (options.policy) {
        policy = *options.policy;
    } else {
        try {
            policy = CapabilityPolicy::default_policy();
        } catch (const std::runtime_error& e) {
            throw InitializationError{concat_tostr("default capability policy: ", e.what())};
        }
    }

    auto id = SessionId::next();
    auto state = std::make_unique<State>(
        id,
        options.output_capture_capacity,
        RuntimeProcess::start(policy, options.memory_limit_in_bytes)
    );
    debuglog(id.to_string(), ": runtime process ", state->runtime.pid(), " is ready");
    return Session{std::move(state)};
}

Session::State& Session::state() const {
    if (not state_) {
        THROW("use of a moved-out session");
    }
    return *state_;
}

SessionId Session::id() const noexcept { return state_ ? state_->id : SessionId{0}; }

void Session::reap() {
    auto& st = state();
    std::lock_guard lock{st.reap_mutex};
    if (st.si) {
        return;
    }
    st.runtime.kill();
    st.si = st.runtime.wait();
    debuglog(st.id.to_string(), ": runtime process ", st.si->description());
}

void Session::finish() noexcept {
    auto& st = *state_;
    st.dead = true;
    st.stdout_capture.close();
    st.stderr_capture.close();
    try {
        reap();
    } catch (const std::exception& e) {
        errlog(st.id.to_string(), ": failed to reap the runtime process: ", e.what());
    }
}

TerminatedEvaluator Session::terminated_error() const {
    auto& st = state();
    if (st.killed_by_owner) {
        return TerminatedEvaluator{concat_tostr(st.id.to_string(), ": evaluator was killed")};
    }
    std::lock_guard lock{st.reap_mutex};
    if (st.si) {
        return TerminatedEvaluator{
            concat_tostr(st.id.to_string(), ": runtime process ", st.si->description())
        };
    }
    return TerminatedEvaluator{concat_tostr(st.id.to_string(), ": evaluator is dead")};
}

Value Session::evaluate(std::string_view program) {
    auto& st = state();
    if (st.dead) {
        throw terminated_error();
    }
    if (not st.runtime.send_request(program)) {
        finish();
        throw terminated_error();
    }

    auto protocol_error = [&](auto&&... msg) {
        finish();
        return TerminatedEvaluator{
            concat_tostr(st.id.to_string(), ": runtime protocol error: ", msg...)
        };
    };
    for (;;) {
        std::optional<sr::Frame> frame;
        try {
            frame = st.runtime.receive_frame();
        } catch (const std::runtime_error& e) {
            throw protocol_error(e.what());
        }
        if (not frame) {
            finish();
            throw terminated_error();
        }

        // A response that raced with kill() is not reported
        auto throw_if_killed = [&] {
            if (st.dead) {
                throw terminated_error();
            }
        };
        switch (frame->type) {
        case sr::FrameType::STDOUT: {
            // Fails only after kill(), the runtime is dying then
            (void)st.stdout_capture.write(frame->body);
            continue;
        }
        case sr::FrameType::STDERR: {
            (void)st.stderr_capture.write(frame->body);
            continue;
        }
        case sr::FrameType::OK: {
            throw_if_killed();
            try {
                return decode_value(frame->body);
            } catch (const std::runtime_error& e) {
                throw protocol_error(e.what());
            }
        }
        case sr::FrameType::SYNTAX_ERROR: {
            throw_if_killed();
            throw SyntaxError{frame->body};
        }
        case sr::FrameType::RUNTIME_ERROR: {
            throw_if_killed();
            throw RuntimeError{frame->body};
        }
        case sr::FrameType::ACCESS_DENIED: {
            throw_if_killed();
            auto kind = frame->body.empty()
                ? std::nullopt
                : AccessDenied::kind_from_byte(static_cast<uint8_t>(frame->body[0]));
            if (not kind) {
                throw protocol_error("invalid access denied frame");
            }
            throw AccessDenied{*kind, std::string_view{frame->body}.substr(1)};
        }
        case sr::FrameType::RESOURCE_EXHAUSTED: {
            throw_if_killed();
            finish();
            throw ResourceExhausted{frame->body};
        }
        case sr::FrameType::EVALUATE: break;
        }
        throw protocol_error(
            "unexpected frame type ", static_cast<int>(static_cast<uint8_t>(frame->type))
        );
    }
}

std::string Session::drain_stdout() { return state().stdout_capture.drain(); }

std::string Session::drain_stderr() { return state().stderr_capture.drain(); }

void Session::flush() {
    auto& st = state();
    (void)st.stdout_capture.drain();
    (void)st.stderr_capture.drain();
}

bool Session::is_alive() const noexcept {
    return state_ and not state_->dead and state_->runtime.is_running();
}

void Session::kill() {
    auto& st = state();
    if (not st.dead) {
        st.killed_by_owner = true;
    }
    st.dead = true;
    // Wakes up evaluate() blocked on a full capture
    st.stdout_capture.close();
    st.stderr_capture.close();
    reap();
}

} // namespace evalbox
