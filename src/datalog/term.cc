#include "evalbox/datalog/term.hh"

#include <algorithm>

namespace evalbox::datalog {

std::string Term::to_string() const {
    switch (kind) {
    case Kind::VARIABLE:
    case Kind::NAME: return text;
    case Kind::INTEGER: return std::to_string(integer);
    case Kind::STRING: {
        std::string res = "\"";
        for (char c : text) {
            switch (c) {
            case '"': res += "\\\""; break;
            case '\\': res += "\\\\"; break;
            case '\n': res += "\\n"; break;
            case '\t': res += "\\t"; break;
            default: res += c;
            }
        }
        res += '"';
        return res;
    }
    }
    __builtin_unreachable();
}

std::string Term::text_of() const {
    if (kind == Kind::STRING) {
        return text;
    }
    return to_string();
}

bool Literal::is_ground() const noexcept {
    return std::none_of(args.begin(), args.end(), [](const Term& t) { return t.is_variable(); });
}

std::string Literal::to_string() const {
    if (args.empty()) {
        return predicate;
    }
    std::string res = predicate;
    res += '(';
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            res += ", ";
        }
        res += args[i].to_string();
    }
    res += ')';
    return res;
}

Literal substitute(const Literal& literal, const Substitution& subst) {
    Literal res = literal;
    for (auto& arg : res.args) {
        if (arg.is_variable()) {
            if (auto it = subst.find(arg.text); it != subst.end()) {
                arg = it->second;
            }
        }
    }
    return res;
}

bool match(const Literal& pattern, const Literal& fact, Substitution& subst) {
    if (pattern.predicate != fact.predicate or pattern.args.size() != fact.args.size()) {
        return false;
    }
    for (size_t i = 0; i < pattern.args.size(); ++i) {
        const auto& p = pattern.args[i];
        const auto& f = fact.args[i];
        if (not p.is_variable()) {
            if (p != f) {
                return false;
            }
            continue;
        }
        auto [it, inserted] = subst.try_emplace(p.text, f);
        if (not inserted and it->second != f) {
            return false;
        }
    }
    return true;
}

} // namespace evalbox::datalog
