#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace evalbox {

// Canonical texts of facts, e.g. "parent(john, douglas)"
using ResultSet = std::vector<std::string>;

// Result of evaluating a program: one result set per statement. Assertions and retractions yield
// an empty result set.
struct Value {
    std::vector<ResultSet> results;

    friend bool operator==(const Value&, const Value&) = default;

    // E.g. "{{}, {parent(john, douglas)}}"
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] std::string encode() const;
};

// Throws std::runtime_error on truncated or malformed input
Value decode_value(std::string_view encoded);

} // namespace evalbox
