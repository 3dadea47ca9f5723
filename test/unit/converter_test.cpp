#include <yeb/converter.hpp>
#include <yeb/ebnf_parser.hpp>
#include <yeb/ebnf_writer.hpp>
#include <yeb/yacc_parser.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace yeb;
using namespace yeb::ebnf;

namespace {

  conversion
  convert(const std::string& grammar, const std::string& supplement = "",
          converter_options options = {}) {
    auto g = yacc_parser().parse(grammar);
    auto extra = ebnf_parser().parse(supplement);
    return converter(options).convert(g, extra);
  }

  std::vector<std::string>
  lines(const conversion& c) {
    std::vector<std::string> out;
    for (const auto& d : c.definitions)
      out.push_back(to_line(d));
    return out;
  }

} // namespace

// == Translation =============================================================

TEST_CASE("converter: production becomes an alternation of sequences",
          "[converter]") {
  auto g = yacc_parser().parse("e : e '+' t | t ;");
  auto body = to_ebnf(g.productions()[0]);
  CHECK(body == alt({seq({nt("e"), t("'+'"), nt("t")}), seq({nt("t")})}));
}

TEST_CASE("converter: self-recursive production with empty alternative",
          "[converter]") {
  auto c = convert("%%\nstart : 'a' start | ;\n%%\n");
  std::vector<std::string> expected = {"start ::= ('a' start)?"};
  CHECK(lines(c) == expected);
  CHECK(c.inlined.empty());
}

TEST_CASE("converter: trivial supplementary definition is inlined",
          "[converter]") {
  auto c = convert("list : item sep item ;", "sep ::= ',' | ';' ;");
  std::vector<std::string> expected = {"list ::= item (','|';') item",
                                       "sep ::= ','|';'"};
  CHECK(lines(c) == expected);
  CHECK(references(c.definitions.find("list")->body) ==
        std::vector<std::string>{"item"});
  std::vector<std::string> inlined = {"sep"};
  CHECK(c.inlined == inlined);
}

TEST_CASE("converter: definitions follow dependency order", "[converter]") {
  converter_options opts;
  opts.inline_trivial = false;
  auto c = convert("a : b ;\nb : c ;\nc : 'x' ;", "", opts);
  std::vector<std::string> expected = {"c ::= 'x'", "b ::= c", "a ::= b"};
  CHECK(lines(c) == expected);
  std::vector<dependency_graph::component> order = {{"c"}, {"b"}, {"a"}};
  CHECK(c.components == order);
}

TEST_CASE("converter: inlining runs to a fixpoint", "[converter]") {
  auto c = convert("a : b 'y' ;\nb : c c ;\nc : 'x' ;");
  CHECK(c.definitions.find("b")->body == seq({t("'x'"), t("'x'")}));
  CHECK(c.definitions.find("a")->body == seq({t("'x'"), t("'x'"), t("'y'")}));
  std::vector<std::string> inlined = {"c", "b"};
  CHECK(c.inlined == inlined);
}

TEST_CASE("converter: inlined definitions can be dropped", "[converter]") {
  converter_options opts;
  opts.drop_inlined = true;
  auto c = convert("a : b ;\nb : c ;\nc : 'x' ;", "", opts);
  std::vector<std::string> expected = {"a ::= 'x'"};
  CHECK(lines(c) == expected);
  std::vector<std::string> inlined = {"b", "c"};
  CHECK(c.inlined == inlined);
}

TEST_CASE("converter: the first production is never dropped",
          "[converter]") {
  converter_options opts;
  opts.drop_inlined = true;
  auto c = convert("top : 'x' ;\nuse : top top ;", "", opts);
  REQUIRE(c.definitions.contains("top"));
  CHECK(c.definitions.find("use")->body == seq({t("'x'"), t("'x'")}));
}

TEST_CASE("converter: recursive productions are never inlined",
          "[converter]") {
  auto c = convert("list : item | list ',' item ;\nargs : '(' list ')' ;");
  CHECK(c.definitions.find("args")->body ==
        seq({t("'('"), nt("list"), t("')'")}));
  CHECK(c.inlined.empty());
}

TEST_CASE("converter: mutually recursive productions share a component",
          "[converter]") {
  auto c = convert("a : b 'x' ;\nb : a 'y' | 'z' ;");
  std::vector<dependency_graph::component> order = {{"a", "b"}};
  CHECK(c.components == order);
  std::vector<std::string> expected = {"a ::= b 'x'", "b ::= a 'y'|'z'"};
  CHECK(lines(c) == expected);
}

TEST_CASE("converter: long sequences are not inlined", "[converter]") {
  auto c = convert("big : 'a' 'b' 'c' 'd' ;\ntop : big big ;");
  CHECK(c.definitions.find("top")->body == seq({nt("big"), nt("big")}));
}

TEST_CASE("converter: a reference under a quantifier", "[converter]") {
  auto c = convert("opt_sep : | sep ;\nopt_digits : | digits ;",
                   "sep ::= ',' | ';' ;\ndigits ::= [0-9]+ ;");
  std::vector<std::string> expected = {
      "opt_sep ::= (','|';')?", "opt_digits ::= digits?",
      "sep ::= ','|';'", "digits ::= [0-9]+"};
  CHECK(lines(c) == expected);
  std::vector<std::string> inlined = {"sep"};
  CHECK(c.inlined == inlined);
}

TEST_CASE("converter: an empty production inlined under a quantifier",
          "[converter]") {
  auto c = convert("s : x | ;\nx : ;");
  CHECK(c.definitions.find("s")->body == empty());
  std::vector<std::string> inlined = {"x"};
  CHECK(c.inlined == inlined);
}

TEST_CASE("converter: productions shadow supplementary definitions",
          "[converter]") {
  auto c = convert("s : item item ;\nitem : NAME ;", "item ::= 'x' ;");
  std::vector<std::string> expected = {"item ::= NAME", "s ::= NAME NAME"};
  CHECK(lines(c) == expected);
}

TEST_CASE("converter: empty grammar keeps supplementary definitions",
          "[converter]") {
  auto c = convert("%%\n%%\n", "a ::= b c ;");
  std::vector<std::string> expected = {"a ::= b c"};
  CHECK(lines(c) == expected);
  CHECK(c.components.empty());
}

// == Triviality ==============================================================

TEST_CASE("converter: trivial shapes", "[converter]") {
  converter conv;
  CHECK(conv.is_trivial(nt("a")));
  CHECK(conv.is_trivial(t("'a'")));
  CHECK(conv.is_trivial(empty()));
  CHECK(conv.is_trivial(alt({nt("a"), nt("b"), nt("c"), nt("d")})));
  CHECK_FALSE(conv.is_trivial(alt({nt("a"), nt("b"), nt("c"), nt("d"),
                                   nt("e")})));
  CHECK_FALSE(conv.is_trivial(alt({nt("a"), seq({nt("b"), nt("c")})})));
  CHECK(conv.is_trivial(seq({nt("a"), nt("b"), nt("c")})));
  CHECK_FALSE(conv.is_trivial(seq({nt("a"), nt("b"), nt("c"), nt("d")})));
  CHECK(conv.is_trivial(seq({nt("a"), alt({t("','"), t("';'")})})));
  CHECK(conv.is_trivial(star(nt("a"))));
  CHECK_FALSE(conv.is_trivial(star(seq({nt("a"), nt("b")}))));
  CHECK(conv.is_trivial(seq({nt("a"), star(nt("b"))})));
}

TEST_CASE("converter: thresholds are configurable", "[converter]") {
  converter_options opts;
  opts.max_alternatives = 1;
  opts.max_sequence = 5;
  converter conv(opts);
  CHECK_FALSE(conv.is_trivial(alt({nt("a"), nt("b")})));
  CHECK(conv.is_trivial(seq({nt("a"), nt("b"), nt("c"), nt("d")})));
  CHECK(conv.options().max_sequence == 5);
}
