#pragma once

#include "evalbox/datalog/term.hh"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace evalbox::datalog {

// Set of ground facts of one predicate, iterated in insertion order
class Relation {
    std::vector<Literal> facts_;
    std::set<Literal> index_;

public:
    // Returns false if @p fact is already present
    bool insert(const Literal& fact);

    bool erase(const Literal& fact);

    [[nodiscard]] const std::vector<Literal>& facts() const noexcept { return facts_; }

    [[nodiscard]] bool contains(const Literal& fact) const { return index_.contains(fact); }
};

// Asserted facts and rules with bottom-up evaluation of the rules
class Database {
    std::map<std::string, Relation> base_; // predicate key => asserted facts
    std::vector<Clause> rules_;
    // Base facts with every fact derivable by the rules, recomputed lazily
    std::optional<std::map<std::string, Relation>> derived_;

    void compute_fixpoint();

public:
    static std::string predicate_key(const Literal& lit);

    // @p fact has to be ground
    void add_fact(const Literal& fact);

    // @p rule has to be safe: every head variable appears in the body
    void add_rule(Clause rule);

    // Removes the asserted @p fact, returns whether it was present
    bool retract(const Literal& fact);

    // Returns every fact (asserted or derived) that matches @p pattern, in the order of first
    // derivation
    std::vector<Literal> query(const Literal& pattern);
};

} // namespace evalbox::datalog
