#include "evalbox/datalog/interpreter.hh"
#include "evalbox/concat_tostr.hh"
#include "evalbox/datalog/parser.hh"
#include "evalbox/errors.hh"

#include <set>
#include <utility>

namespace {

[[noreturn]] void statement_error(const evalbox::datalog::Statement& stmt, std::string_view msg) {
    throw evalbox::RuntimeError{concat_tostr(stmt.line, ':', stmt.column, ": ", msg)};
}

} // namespace

namespace evalbox::datalog {

Interpreter::Interpreter(CapabilityPolicy policy, OutputSink& output)
: policy_{std::move(policy)}
, output_{output} {}

ResultSet Interpreter::assert_clause(const Statement& stmt) {
    const auto& clause = stmt.clause;
    if (is_builtin(clause.head.predicate)) {
        statement_error(
            stmt, concat_tostr("cannot define builtin predicate ", clause.head.predicate)
        );
    }
    for (const auto& lit : clause.body) {
        if (is_builtin(lit.predicate)) {
            statement_error(
                stmt,
                concat_tostr(
                    "builtin predicate ", lit.predicate, " may only be queried, not used in a rule"
                )
            );
        }
    }

    std::set<std::string_view> body_vars;
    for (const auto& lit : clause.body) {
        for (const auto& arg : lit.args) {
            if (arg.is_variable()) {
                body_vars.emplace(arg.text);
            }
        }
    }
    for (const auto& arg : clause.head.args) {
        if (arg.is_variable() and not body_vars.contains(arg.text)) {
            statement_error(
                stmt,
                concat_tostr(
                    "unsafe clause ", clause.head.to_string(), ": variable ", arg.text,
                    " does not appear in the body"
                )
            );
        }
    }

    if (clause.body.empty()) {
        db_.add_fact(clause.head);
    } else {
        db_.add_rule(clause);
    }
    return {};
}

ResultSet Interpreter::retract(const Statement& stmt) {
    const auto& fact = stmt.clause.head;
    if (not fact.is_ground()) {
        statement_error(stmt, concat_tostr("retracted fact has to be ground: ", fact.to_string()));
    }
    (void)db_.retract(fact);
    return {};
}

ResultSet Interpreter::query(const Statement& stmt) {
    const auto& pattern = stmt.clause.head;
    ResultSet res;
    if (is_builtin(pattern.predicate)) {
        BuiltinContext ctx{.policy = policy_, .output = output_};
        if (auto fact = call_builtin(pattern, ctx)) {
            res.emplace_back(fact->to_string());
        }
        return res;
    }
    for (const auto& fact : db_.query(pattern)) {
        res.emplace_back(fact.to_string());
    }
    return res;
}

Value Interpreter::evaluate(std::string_view program) {
    auto statements = parse(program);
    Value value;
    value.results.reserve(statements.size());
    for (const auto& stmt : statements) {
        switch (stmt.kind) {
        case Statement::Kind::ASSERTION: value.results.emplace_back(assert_clause(stmt)); break;
        case Statement::Kind::RETRACTION: value.results.emplace_back(retract(stmt)); break;
        case Statement::Kind::QUERY: value.results.emplace_back(query(stmt)); break;
        }
    }
    return value;
}

} // namespace evalbox::datalog
