#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace evalbox::datalog {

struct Term {
    enum class Kind : uint8_t {
        VARIABLE,
        NAME,
        STRING,
        INTEGER,
    };

    Kind kind = Kind::NAME;
    std::string text; // variable name, name or string contents
    int64_t integer = 0;

    static Term variable(std::string name) {
        return {.kind = Kind::VARIABLE, .text = std::move(name)};
    }

    static Term name(std::string name) { return {.kind = Kind::NAME, .text = std::move(name)}; }

    static Term string(std::string str) { return {.kind = Kind::STRING, .text = std::move(str)}; }

    static Term integer_of(int64_t x) { return {.kind = Kind::INTEGER, .integer = x}; }

    [[nodiscard]] bool is_variable() const noexcept { return kind == Kind::VARIABLE; }

    // How the term is written in a program, e.g. john, X, "a \"b\"", -7
    [[nodiscard]] std::string to_string() const;

    // Contents for strings, to_string() for other terms
    [[nodiscard]] std::string text_of() const;

    friend auto operator<=>(const Term&, const Term&) = default;
};

struct Literal {
    std::string predicate;
    std::vector<Term> args;

    [[nodiscard]] bool is_ground() const noexcept;

    // E.g. parent(john, douglas)
    [[nodiscard]] std::string to_string() const;

    friend auto operator<=>(const Literal&, const Literal&) = default;
};

struct Clause {
    Literal head;
    std::vector<Literal> body; // empty for facts
};

struct Statement {
    enum class Kind : uint8_t {
        ASSERTION,
        RETRACTION,
        QUERY,
    };

    Kind kind;
    Clause clause;
    size_t line;
    size_t column;
};

using Program = std::vector<Statement>;

// Variable name => bound term
using Substitution = std::map<std::string, Term>;

// Replaces bound variables in @p literal with their values
Literal substitute(const Literal& literal, const Substitution& subst);

// Extends @p subst so that @p pattern becomes equal to the ground literal @p fact. Returns false
// (and leaves @p subst in an unspecified state) if that is impossible.
[[nodiscard]] bool match(const Literal& pattern, const Literal& fact, Substitution& subst);

} // namespace evalbox::datalog
