#pragma once

#include <yeb/ebnf.hpp>

namespace yeb {

  // Canonical form of `e`: nested alternations and sequences are flattened,
  // single-member groups are unwrapped and an empty alternative turns the
  // rest of the alternation optional. Children are normalized before their
  // parents, so a single pass reaches the fixpoint.
  //
  // Throws yeb::error (grammar kind) on a quantifier applied directly to a
  // quantified expression.
  ebnf::expr
  normalize(const ebnf::expr& e);

} // namespace yeb
