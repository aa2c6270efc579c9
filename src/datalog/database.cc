#include "evalbox/datalog/database.hh"
#include "evalbox/concat_tostr.hh"

#include <utility>

namespace evalbox::datalog {

bool Relation::insert(const Literal& fact) {
    if (not index_.emplace(fact).second) {
        return false;
    }
    facts_.emplace_back(fact);
    return true;
}

bool Relation::erase(const Literal& fact) {
    if (index_.erase(fact) == 0) {
        return false;
    }
    std::erase(facts_, fact);
    return true;
}

std::string Database::predicate_key(const Literal& lit) {
    return concat_tostr(lit.predicate, '/', lit.args.size());
}

void Database::add_fact(const Literal& fact) {
    if (base_[predicate_key(fact)].insert(fact)) {
        derived_.reset();
    }
}

void Database::add_rule(Clause rule) {
    rules_.emplace_back(std::move(rule));
    derived_.reset();
}

bool Database::retract(const Literal& fact) {
    auto it = base_.find(predicate_key(fact));
    if (it == base_.end() or not it->second.erase(fact)) {
        return false;
    }
    derived_.reset();
    return true;
}

void Database::compute_fixpoint() {
    auto facts = base_;
    // Finds every substitution satisfying body[i..] and extending subst
    auto satisfy = [&facts](
                       auto& self,
                       const std::vector<Literal>& body,
                       size_t i,
                       const Substitution& subst,
                       auto&& on_satisfied
                   ) -> void {
        if (i == body.size()) {
            on_satisfied(subst);
            return;
        }
        auto it = facts.find(predicate_key(body[i]));
        if (it == facts.end()) {
            return;
        }
        // New facts are collected aside, so the relation does not change while iterating
        for (const auto& fact : it->second.facts()) {
            auto extended = subst;
            if (match(body[i], fact, extended)) {
                self(self, body, i + 1, extended, on_satisfied);
            }
        }
    };

    bool changed = true;
    while (changed) {
        changed = false;
        std::vector<Literal> new_facts;
        for (const auto& rule : rules_) {
            satisfy(satisfy, rule.body, 0, Substitution{}, [&](const Substitution& subst) {
                auto fact = substitute(rule.head, subst);
                auto it = facts.find(predicate_key(fact));
                if (it == facts.end() or not it->second.contains(fact)) {
                    new_facts.emplace_back(std::move(fact));
                }
            });
        }
        for (auto& fact : new_facts) {
            if (facts[predicate_key(fact)].insert(fact)) {
                changed = true;
            }
        }
    }
    derived_ = std::move(facts);
}

std::vector<Literal> Database::query(const Literal& pattern) {
    if (not derived_) {
        compute_fixpoint();
    }
    std::vector<Literal> res;
    auto it = derived_->find(predicate_key(pattern));
    if (it == derived_->end()) {
        return res;
    }
    for (const auto& fact : it->second.facts()) {
        Substitution subst;
        if (match(pattern, fact, subst)) {
            res.emplace_back(fact);
        }
    }
    return res;
}

} // namespace evalbox::datalog
