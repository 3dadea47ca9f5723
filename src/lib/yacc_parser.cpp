#include <yeb/yacc_parser.hpp>

#include <yeb/combinator.hpp>
#include <yeb/error.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace yeb {

  namespace {

    template <typename T>
    using rule = pc::parser<char, T>;

    using unit = std::monostate;
    using cursor = pc::input<char>;

    constexpr std::size_t max_excerpt = 16;

    struct located_production {
      yacc::production production;
      std::size_t offset = 0;
    };

    bool
    is_name_start(char c) {
      return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
             c == '.';
    }

    bool
    is_name_char(char c) {
      return std::isalnum(static_cast<unsigned char>(c)) || c == '_' ||
             c == '.';
    }

    bool
    starts_with(cursor in, std::string_view prefix) {
      for (char c : prefix) {
        if (in.at_end() || in.peek() != c) return false;
        in = in.advance();
      }
      return true;
    }

    cursor
    skip_line(cursor in) {
      while (!in.at_end() && in.peek() != '\n')
        in = in.advance();
      return in;
    }

    // `in` is at "/*". Empty when the comment is never closed.
    std::optional<cursor>
    skip_block_comment(cursor in) {
      in = in.advance(2);
      while (!in.at_end()) {
        if (starts_with(in, "*/")) return in.advance(2);
        in = in.advance();
      }
      return std::nullopt;
    }

    // `in` is at a quote. Empty when the literal runs into a line break or
    // the end of input.
    std::optional<cursor>
    skip_quoted(cursor in) {
      char quote = in.peek();
      in = in.advance();
      while (!in.at_end()) {
        char c = in.peek();
        if (c == '\n') return std::nullopt;
        in = in.advance();
        if (c == quote) return in;
        if (c == '\\') {
          if (in.at_end() || in.peek() == '\n') return std::nullopt;
          in = in.advance();
        }
      }
      return std::nullopt;
    }

    // -------------------------------------------------------------------------
    // Scanners
    // -------------------------------------------------------------------------

    // Whitespace, block comments and line comments. Never fails except on an
    // unterminated block comment.
    rule<unit>
    spacing() {
      return rule<unit>([](const cursor& in) -> pc::reply<char, unit> {
        auto cur = in;
        while (!cur.at_end()) {
          if (std::isspace(static_cast<unsigned char>(cur.peek()))) {
            cur = cur.advance();
          } else if (starts_with(cur, "//")) {
            cur = skip_line(cur);
          } else if (starts_with(cur, "/*")) {
            auto next = skip_block_comment(cur);
            if (!next)
              return pc::failure{"'*/' closing this comment", cur.position(),
                                 true};
            cur = *next;
          } else {
            break;
          }
        }
        return pc::success<char, unit>{{}, cur};
      });
    }

    // A brace-delimited action block with balanced nesting. Braces inside
    // quoted literals and comments do not count.
    rule<unit>
    action_block() {
      return rule<unit>([](const cursor& in) -> pc::reply<char, unit> {
        if (in.at_end() || in.peek() != '{')
          return pc::failure{"action block", in.position(), false};

        int depth = 0;
        auto cur = in;
        while (!cur.at_end()) {
          char c = cur.peek();
          if (c == '\'' || c == '"') {
            // A stray apostrophe in C code is not a literal.
            auto next = skip_quoted(cur);
            cur = next ? *next : cur.advance();
            continue;
          }
          if (starts_with(cur, "//")) {
            cur = skip_line(cur);
            continue;
          }
          if (starts_with(cur, "/*")) {
            auto next = skip_block_comment(cur);
            if (!next)
              return pc::failure{"'*/' closing this comment", cur.position(),
                                 true};
            cur = *next;
            continue;
          }
          cur = cur.advance();
          if (c == '{') {
            ++depth;
          } else if (c == '}' && --depth == 0) {
            return pc::success<char, unit>{{}, cur};
          }
        }
        return pc::failure{"'}' matching this '{'", in.position(), true};
      });
    }

    rule<std::string>
    identifier() {
      return pc::seq(pc::satisfy<char>(&is_name_start, "identifier"),
                     pc::many(pc::satisfy<char>(&is_name_char, "identifier")),
                     [](char first, std::vector<char> rest) {
                       std::string s(1, first);
                       s.append(rest.begin(), rest.end());
                       return s;
                     });
    }

    // A literal delimited by `quote`, returned verbatim with its quotes.
    rule<std::string>
    quoted(char quote) {
      auto open = pc::satisfy<char>([quote](char c) { return c == quote; },
                                    "quoted literal");
      auto escape = pc::seq(
          pc::satisfy<char>([](char c) { return c == '\\'; }, "'\\'"),
          pc::satisfy<char>([](char c) { return c != '\n'; },
                            "escaped character"),
          [](char a, char b) { return std::string{a, b}; });
      auto plain = pc::map(
          pc::satisfy<char>(
              [quote](char c) { return c != quote && c != '\\' && c != '\n'; },
              "literal character"),
          [](char c) { return std::string(1, c); });
      auto body = pc::map(pc::many(pc::alt(escape, plain)),
                          [](std::vector<std::string> parts) {
                            std::string s;
                            for (const auto& p : parts)
                              s += p;
                            return s;
                          });
      auto close = pc::satisfy<char>([quote](char c) { return c == quote; },
                                     std::string("closing ") + quote);
      return pc::seq(open, pc::left(body, close),
                     [](char q, std::string text) {
                       return std::string(1, q) + text + q;
                     });
    }

    // -------------------------------------------------------------------------
    // Notation
    // -------------------------------------------------------------------------
    //
    //   grammar     := spacing production* end
    //   production  := identifier separator alternative ('|' alternative)* ';'
    //   separator   := '::=' | ':' | '='
    //   alternative := (literal | identifier | action | '%prec' identifier
    //                   | '%empty')*
    //
    // Every token swallows the spacing that follows it.

    rule<std::vector<located_production>>
    rules_grammar() {
      using item = std::optional<yacc::element>;

      auto ws = spacing();
      auto lex = [ws](auto p) { return pc::left(std::move(p), ws); };
      auto symbol = [lex](char c) {
        return lex(pc::literal(std::string(1, c)));
      };

      auto name = lex(pc::label(identifier(), "identifier"));
      auto text = lex(pc::alt(quoted('\''), quoted('"')));
      auto separator =
          lex(pc::label(pc::alt(pc::literal("::="), pc::literal(":"),
                                pc::literal("=")),
                        "':', '::=' or '='"));

      auto terminal = pc::map(text, [](std::string s) -> item {
        return yacc::element(yacc::terminal{std::move(s)});
      });
      auto nonterminal = pc::map(name, [](std::string s) -> item {
        return yacc::element(yacc::nonterminal{std::move(s)});
      });
      auto action = pc::map(lex(action_block()),
                            [](unit) -> item { return std::nullopt; });
      auto prec = pc::map(pc::right(lex(pc::literal("%prec")), name),
                          [](std::string) -> item { return std::nullopt; });
      auto empty_marker = pc::map(lex(pc::literal("%empty")),
                                  [](std::string) -> item {
                                    return std::nullopt;
                                  });

      auto element = pc::label(
          pc::alt(terminal, nonterminal, action, prec, empty_marker),
          "element");
      auto alternative =
          pc::map(pc::many(element),
                  [](std::vector<item> items) {
                    yacc::rule r;
                    for (auto& i : items)
                      if (i) r.elements.push_back(std::move(*i));
                    return r;
                  });

      auto body = pc::right(
          separator,
          pc::left(pc::sep_by1(alternative, symbol('|')), symbol(';')));

      auto production = pc::label(
          pc::seq(pc::position<char>(),
                  pc::seq(name, body,
                          [](std::string n,
                             std::vector<yacc::rule> alternatives) {
                            return yacc::production{std::move(n),
                                                    std::move(alternatives)};
                          }),
                  [](std::size_t at, yacc::production p) {
                    return located_production{std::move(p), at};
                  }),
          "production");

      return pc::right(ws, pc::left(pc::many(production),
                                    pc::end_of_input<char>()));
    }

    struct lexical_fault {
      std::size_t offset = 0;
      std::string message;
    };

    // Walks the rules section token by token and finds the first character
    // that starts no token or the first literal that never closes. Stops
    // quietly at an unterminated comment or an unmatched brace, which the
    // grammar rules report themselves.
    std::optional<lexical_fault>
    find_lexical_fault(cursor in) {
      auto actions = action_block();
      while (!in.at_end()) {
        char c = in.peek();
        if (std::isspace(static_cast<unsigned char>(c))) {
          in = in.advance();
        } else if (starts_with(in, "//")) {
          in = skip_line(in);
        } else if (starts_with(in, "/*")) {
          auto next = skip_block_comment(in);
          if (!next) return std::nullopt;
          in = *next;
        } else if (c == '{') {
          auto r = actions(in);
          if (!r.ok()) return std::nullopt;
          in = r.rest();
        } else if (c == '\'' || c == '"') {
          auto next = skip_quoted(in);
          if (!next)
            return lexical_fault{in.position(), "unterminated literal"};
          in = *next;
        } else if (is_name_start(c)) {
          while (!in.at_end() && is_name_char(in.peek()))
            in = in.advance();
        } else if (c == ':' || c == ';' || c == '|' || c == '=') {
          in = in.advance();
        } else if (starts_with(in, "%prec") || starts_with(in, "%empty")) {
          // The keyword itself scans as a name.
          in = in.advance();
        } else {
          return lexical_fault{in.position(), "unexpected input"};
        }
      }
      return std::nullopt;
    }

    std::string
    excerpt(std::string_view text, std::size_t at, std::size_t end) {
      if (at >= end) return "end of input";
      auto stop = text.find('\n', at);
      if (stop == std::string_view::npos || stop > end) stop = end;
      auto len = std::min(stop - at, max_excerpt);
      if (len == 0) return "end of line";
      return "'" + std::string(text.substr(at, len)) + "'";
    }

  } // namespace

  rules_section
  find_rules_section(std::string_view text) {
    std::optional<std::size_t> begin;
    std::size_t line_start = 0;
    for (;;) {
      auto nl = text.find('\n', line_start);
      auto line_end = nl == std::string_view::npos ? text.size() : nl;
      auto line = text.substr(line_start, line_end - line_start);
      while (!line.empty() &&
             std::isspace(static_cast<unsigned char>(line.back())))
        line.remove_suffix(1);

      if (line == "%%") {
        if (begin) return {*begin, line_start};
        begin = nl == std::string_view::npos ? text.size() : nl + 1;
      }
      if (nl == std::string_view::npos) break;
      line_start = nl + 1;
    }
    if (!begin) return {0, text.size()};
    return {*begin, text.size()};
  }

  yacc::grammar
  yacc_parser::parse(std::string_view text) {
    auto section = find_rules_section(text);
    auto rules = text.substr(section.begin, section.end - section.begin);
    cursor start(std::span<const char>(rules.data(), rules.size()));

    if (auto fault = find_lexical_fault(start)) {
      auto at = section.begin + fault->offset;
      throw error(error_kind::lexical,
                  fault->message + " " + excerpt(text, at, section.end),
                  locate(text, at));
    }

    auto result = rules_grammar()(start);
    if (!result.ok()) {
      const auto& f = result.error();
      auto at = section.begin + f.position;
      throw error(error_kind::syntax,
                  "expected " + f.expected + ", found " +
                      excerpt(text, at, section.end),
                  locate(text, at));
    }

    yacc::grammar g;
    for (auto& lp : result.take()) {
      auto at = section.begin + lp.offset;
      if (auto v = g.violation(lp.production))
        throw error(error_kind::grammar, *v, locate(text, at));
      g.add(std::move(lp.production));
    }
    return g;
  }

} // namespace yeb
