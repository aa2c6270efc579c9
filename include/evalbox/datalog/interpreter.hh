#pragma once

#include "evalbox/capability_policy.hh"
#include "evalbox/datalog/builtins.hh"
#include "evalbox/datalog/database.hh"
#include "evalbox/value.hh"

#include <string_view>

namespace evalbox::datalog {

// Evaluates programs against a database that persists between evaluations
class Interpreter {
    CapabilityPolicy policy_;
    OutputSink& output_;
    Database db_;

    ResultSet assert_clause(const Statement& stmt);

    ResultSet retract(const Statement& stmt);

    ResultSet query(const Statement& stmt);

public:
    Interpreter(CapabilityPolicy policy, OutputSink& output);

    // The whole program is parsed first (throws SyntaxError), then statements run in order until
    // one of them throws RuntimeError or AccessDenied; effects of the earlier statements are kept.
    // std::bad_alloc is propagated.
    Value evaluate(std::string_view program);
};

} // namespace evalbox::datalog
