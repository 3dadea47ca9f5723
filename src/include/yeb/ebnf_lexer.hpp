#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace yeb {

  enum class token_kind {
    identifier,
    define,     // ::=
    pipe,       // |
    lparen,     // (
    rparen,     // )
    semicolon,  // ;
    question,   // ?
    star,       // *
    plus,       // +
    literal,    // '...' or "..."
    char_class, // [...]
    end,
    error,
  };

  std::string_view
  to_string(token_kind kind);

  // `text` is verbatim source text; for an error token it is the offending
  // excerpt.
  struct token {
    token_kind kind = token_kind::end;
    std::string text;
    std::size_t offset = 0;
  };

  // Tokenizes the supplementary EBNF notation. The result always ends with
  // either an end token or, when a lexical fault is found, a single error
  // token; nothing after the first fault is scanned.
  std::vector<token>
  tokenize_ebnf(std::string_view source);

} // namespace yeb
