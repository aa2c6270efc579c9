#pragma once

#include "evalbox/datalog/term.hh"

#include <string_view>

namespace evalbox::datalog {

// Parses the whole @p source. Throws SyntaxError with message "line:column: description" on the
// first error.
Program parse(std::string_view source);

} // namespace evalbox::datalog
