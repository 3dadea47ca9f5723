#include <yeb/error.hpp>
#include <yeb/yacc_parser.hpp>

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>

using namespace yeb;
using namespace yeb::yacc;

namespace {

  std::optional<error>
  failure_of(const std::string& source) {
    try {
      yacc_parser().parse(source);
    } catch (const error& ex) {
      return ex;
    }
    return std::nullopt;
  }

  // Names and quoted literals of one alternative, in order.
  std::vector<std::string>
  symbols(const rule& r) {
    std::vector<std::string> out;
    for (const auto& e : r.elements) {
      if (const auto* t = std::get_if<terminal>(&e))
        out.push_back(t->text);
      else
        out.push_back(std::get<nonterminal>(e).name);
    }
    return out;
  }

} // namespace

// == Rules section ===========================================================

TEST_CASE("yacc_parser: rules section between markers", "[yacc_parser]") {
  std::string text = "a\n%%\nb\n%%\nc";
  auto s = find_rules_section(text);
  CHECK(s.begin == 5);
  CHECK(s.end == 7);
}

TEST_CASE("yacc_parser: rules section without markers", "[yacc_parser]") {
  std::string text = "s : 'a' ;";
  auto s = find_rules_section(text);
  CHECK(s.begin == 0);
  CHECK(s.end == text.size());
}

TEST_CASE("yacc_parser: rules section with one marker", "[yacc_parser]") {
  std::string text = "x\n%%  \r\ny";
  auto s = find_rules_section(text);
  CHECK(s.begin == 8);
  CHECK(s.end == text.size());
}

TEST_CASE("yacc_parser: marker must be a whole line", "[yacc_parser]") {
  std::string text = "a %% b\n%%\nc";
  auto s = find_rules_section(text);
  CHECK(s.begin == 10);
}

// == Productions =============================================================

TEST_CASE("yacc_parser: declarations and trailer are ignored",
          "[yacc_parser]") {
  auto g = yacc_parser().parse(R"(%{
#include <stdio.h>
%}
%token NUMBER
%left '+'
%%
expr : expr '+' term
     | term
     ;
term : NUMBER ;
%%
int main(void) { return yyparse(); }
)");
  REQUIRE(g.size() == 2);
  const auto& expr = g.productions()[0];
  CHECK(expr.name == "expr");
  REQUIRE(expr.alternatives.size() == 2);
  std::vector<std::string> first = {"expr", "'+'", "term"};
  CHECK(symbols(expr.alternatives[0]) == first);
  std::vector<std::string> second = {"term"};
  CHECK(symbols(expr.alternatives[1]) == second);
  CHECK(std::holds_alternative<terminal>(expr.alternatives[0].elements[1]));
  CHECK(g.productions()[1].name == "term");
}

TEST_CASE("yacc_parser: empty alternative", "[yacc_parser]") {
  auto g = yacc_parser().parse("%%\nstart : 'a' start | ;\n%%\n");
  REQUIRE(g.size() == 1);
  const auto& p = g.productions()[0];
  REQUIRE(p.alternatives.size() == 2);
  CHECK(p.alternatives[1].empty());
  CHECK(p.empty_alternatives() == 1);
}

TEST_CASE("yacc_parser: alternative separators", "[yacc_parser]") {
  auto g = yacc_parser().parse("a : x ;\nb ::= y ;\nc = z ;");
  REQUIRE(g.size() == 3);
  CHECK(g.contains("a"));
  CHECK(g.contains("b"));
  CHECK(g.contains("c"));
}

TEST_CASE("yacc_parser: double quoted literals", "[yacc_parser]") {
  auto g = yacc_parser().parse(R"(s : "if" '\'' "a\"b" ;)");
  std::vector<std::string> expected = {"\"if\"", R"('\'')", R"("a\"b")"};
  CHECK(symbols(g.productions()[0].alternatives[0]) == expected);
}

TEST_CASE("yacc_parser: actions are skipped", "[yacc_parser]") {
  auto g = yacc_parser().parse(R"(
%%
e : e '+' t { $$ = $1 + $3; }
  | t { if (x) { $$ = $1; } }
  ;
s : a { puts("}"); } b { c = '}'; /* } */ } ;
%%
)");
  REQUIRE(g.size() == 2);
  std::vector<std::string> e0 = {"e", "'+'", "t"};
  CHECK(symbols(g.find("e")->alternatives[0]) == e0);
  std::vector<std::string> s0 = {"a", "b"};
  CHECK(symbols(g.find("s")->alternatives[0]) == s0);
}

TEST_CASE("yacc_parser: comments are skipped", "[yacc_parser]") {
  auto g = yacc_parser().parse(R"(
%%
/* the list */
list : item      // first
     | list item /* more */
     ;
%%
)");
  REQUIRE(g.size() == 1);
  CHECK(g.productions()[0].alternatives.size() == 2);
}

TEST_CASE("yacc_parser: precedence annotations are dropped",
          "[yacc_parser]") {
  auto g = yacc_parser().parse("e : '-' e %prec UMINUS | %empty | x ;");
  const auto& p = g.productions()[0];
  REQUIRE(p.alternatives.size() == 3);
  std::vector<std::string> first = {"'-'", "e"};
  CHECK(symbols(p.alternatives[0]) == first);
  CHECK(p.alternatives[1].empty());
}

TEST_CASE("yacc_parser: empty rules section", "[yacc_parser]") {
  CHECK(yacc_parser().parse("%token A\n%%\n%%\nint x;").size() == 0);
}

// == Failures ================================================================

TEST_CASE("yacc_parser: duplicate production", "[yacc_parser]") {
  auto err = failure_of("%%\nexpr : a ;\nexpr : b ;\n%%\n");
  REQUIRE(err.has_value());
  CHECK(err->kind() == error_kind::grammar);
  CHECK(err->detail() == "duplicate production 'expr'");
  CHECK(err->where().line == 3);
  CHECK(err->where().column == 1);
}

TEST_CASE("yacc_parser: too many empty alternatives", "[yacc_parser]") {
  auto err = failure_of("%%\ns : | 'a' | ;\n%%\n");
  REQUIRE(err.has_value());
  CHECK(err->kind() == error_kind::grammar);
  CHECK(err->detail() == "production 's' has 2 empty alternatives");
}

TEST_CASE("yacc_parser: unexpected character", "[yacc_parser]") {
  auto err = failure_of("%%\na : x ;\nb : 'y' @ ;\n%%\n");
  REQUIRE(err.has_value());
  CHECK(err->kind() == error_kind::lexical);
  CHECK(err->detail() == "unexpected input '@ ;'");
  CHECK(err->where().line == 3);
  CHECK(err->where().column == 9);
  CHECK(std::string(err->what()).rfind("3:9: ", 0) == 0);
}

TEST_CASE("yacc_parser: unterminated literal", "[yacc_parser]") {
  auto err = failure_of("%%\na : 'b ;\nc : d ;\n%%\n");
  REQUIRE(err.has_value());
  CHECK(err->kind() == error_kind::lexical);
  CHECK(err->detail() == "unterminated literal ''b ;'");
  CHECK(err->where().line == 2);
  CHECK(err->where().column == 5);
}

TEST_CASE("yacc_parser: quotes inside actions are not literals",
          "[yacc_parser]") {
  auto g = yacc_parser().parse("a : x { c = '\\''; d = \"it's\"; } ;");
  REQUIRE(g.size() == 1);
  std::vector<std::string> expected = {"x"};
  CHECK(symbols(g.productions()[0].alternatives[0]) == expected);
}

TEST_CASE("yacc_parser: unexpected symbol lists every continuation",
          "[yacc_parser]") {
  auto err = failure_of("%%\na : x ;\nb : 'y' : ;\n%%\n");
  REQUIRE(err.has_value());
  CHECK(err->kind() == error_kind::syntax);
  CHECK(err->detail() == "expected element or '|' or ';', found ': ;'");
  CHECK(err->where().line == 3);
  CHECK(err->where().column == 9);
}

TEST_CASE("yacc_parser: missing terminator at end", "[yacc_parser]") {
  auto err = failure_of("%%\na : x\n%%\n");
  REQUIRE(err.has_value());
  CHECK(err->kind() == error_kind::syntax);
  CHECK(err->detail() ==
        "expected element or '|' or ';', found end of input");
}

TEST_CASE("yacc_parser: production must start with a name",
          "[yacc_parser]") {
  auto err = failure_of("a : x ; 'b' : c ;");
  REQUIRE(err.has_value());
  CHECK(err->kind() == error_kind::syntax);
  CHECK(err->detail() ==
        "expected production or end of input, found ''b' : c ;'");
}

TEST_CASE("yacc_parser: unmatched brace", "[yacc_parser]") {
  auto err = failure_of("%%\na : x { f(); ;\n%%\n");
  REQUIRE(err.has_value());
  CHECK(err->kind() == error_kind::syntax);
  CHECK(err->detail().find("'}' matching this '{'") != std::string::npos);
  CHECK(err->where().line == 2);
  CHECK(err->where().column == 7);
}

TEST_CASE("yacc_parser: unterminated comment", "[yacc_parser]") {
  auto err = failure_of("a : x ; /* open");
  REQUIRE(err.has_value());
  CHECK(err->kind() == error_kind::syntax);
  CHECK(err->detail().find("'*/'") != std::string::npos);
}

TEST_CASE("yacc_parser: missing separator", "[yacc_parser]") {
  auto err = failure_of("a x ;");
  REQUIRE(err.has_value());
  CHECK(err->kind() == error_kind::syntax);
  CHECK(err->detail() == "expected ':', '::=' or '=', found 'x ;'");
}
