#pragma once

#include <yeb/yacc_model.hpp>

#include <cstddef>
#include <string_view>

namespace yeb {

  // Byte range of the rules section: the text strictly between the first and
  // second "%%" marker lines. Without a second marker the section runs to the
  // end; without any marker it is the whole text.
  struct rules_section {
    std::size_t begin = 0;
    std::size_t end = 0;
  };

  rules_section
  find_rules_section(std::string_view text);

  // Parses the rules section of a YACC-style grammar. Comments and action
  // blocks are skipped; "%prec NAME" annotations and "%empty" markers are
  // dropped.
  //
  // Throws yeb::error: syntax for a parse failure (including an unmatched
  // brace or unterminated comment), grammar for a duplicate production or a
  // production with more than one empty alternative.
  class yacc_parser {
  public:
    yacc::grammar
    parse(std::string_view text);
  };

} // namespace yeb
