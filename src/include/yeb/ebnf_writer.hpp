#pragma once

#include <yeb/ebnf.hpp>

#include <ostream>
#include <string>

namespace yeb {

  // Renders `e` in the supplementary notation. A child is parenthesized iff
  // its display precedence is below what its parent context requires.
  std::string
  to_string(const ebnf::expr& e);

  // "name ::= body"
  std::string
  to_line(const ebnf::definition& def);

  namespace ebnf {

    std::ostream&
    operator<<(std::ostream& os, const expr& e);

  } // namespace ebnf

} // namespace yeb
