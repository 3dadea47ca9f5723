#pragma once

#include <yeb/ebnf.hpp>

#include <string_view>

namespace yeb {

  // Parses a flat list of "name ::= body ;" definitions. Every definition is
  // normalized as soon as it is read.
  //
  // Throws yeb::error: lexical for a scanning fault, syntax for a parse
  // failure, grammar for a duplicate name or double quantification.
  class ebnf_parser {
  public:
    ebnf::definition_map
    parse(std::string_view source);

    // A single body expression, normalized.
    ebnf::expr
    parse_expression(std::string_view source);
  };

} // namespace yeb
