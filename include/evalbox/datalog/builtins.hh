#pragma once

#include "evalbox/capability_policy.hh"
#include "evalbox/datalog/term.hh"

#include <optional>
#include <string_view>

namespace evalbox::datalog {

// Receives text written by the evaluated program
class OutputSink {
public:
    OutputSink() = default;
    OutputSink(const OutputSink&) = delete;
    OutputSink(OutputSink&&) = delete;
    OutputSink& operator=(const OutputSink&) = delete;
    OutputSink& operator=(OutputSink&&) = delete;
    virtual ~OutputSink() = default;

    virtual void write_stdout(std::string_view data) = 0;
    virtual void write_stderr(std::string_view data) = 0;
};

struct BuiltinContext {
    const CapabilityPolicy& policy;
    OutputSink& output;
};

[[nodiscard]] bool is_builtin(std::string_view predicate) noexcept;

// Calls the builtin predicate @p goal. Returns @p goal with its output arguments bound, or
// std::nullopt if the predicate does not hold. Throws RuntimeError on invalid arguments or
// failed operations, AccessDenied if @p ctx.policy forbids the operation.
std::optional<Literal> call_builtin(const Literal& goal, BuiltinContext& ctx);

} // namespace evalbox::datalog
