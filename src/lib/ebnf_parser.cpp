#include <yeb/ebnf_parser.hpp>

#include <yeb/combinator.hpp>
#include <yeb/ebnf_lexer.hpp>
#include <yeb/error.hpp>
#include <yeb/normalize.hpp>

#include <algorithm>
#include <span>
#include <utility>

namespace yeb {

  namespace {

    template <typename T>
    using rule = pc::parser<token, T>;

    struct located_definition {
      ebnf::definition def;
      std::size_t offset = 0;
    };

    rule<token>
    is(token_kind kind) {
      return pc::satisfy<token>(
          [kind](const token& t) { return t.kind == kind; },
          std::string(to_string(kind)));
    }

    ebnf::quantifier
    quantifier_of(const token& t) {
      switch (t.kind) {
        case token_kind::star:
          return ebnf::quantifier::zero_or_many;
        case token_kind::plus:
          return ebnf::quantifier::one_or_many;
        default:
          return ebnf::quantifier::zero_or_one;
      }
    }

    // -------------------------------------------------------------------------
    // Notation
    // -------------------------------------------------------------------------
    //
    //   definitions := definition* end
    //   definition  := identifier '::=' body ';'
    //   body        := sequence ('|' sequence)*
    //   sequence    := quantified*
    //   quantified  := atom ('?' | '*' | '+')*
    //   atom        := identifier | literal | class | '(' body ')'
    //
    // The members reference each other, so an instance stays where it was
    // constructed.

    struct notation {
      rule<ebnf::expr> body;
      rule<ebnf::expr> sequence;
      rule<ebnf::expr> quantified;
      rule<ebnf::expr> atom;
      rule<located_definition> definition;
      rule<std::vector<located_definition>> definitions;
      rule<ebnf::expr> expression;

      notation(const notation&) = delete;
      notation&
      operator=(const notation&) = delete;

      notation() {
        auto name = pc::map(is(token_kind::identifier),
                            [](token t) { return ebnf::nt(std::move(t.text)); });
        auto text = pc::map(
            pc::alt(is(token_kind::literal), is(token_kind::char_class)),
            [](token t) { return ebnf::t(std::move(t.text)); });
        auto group = pc::right(
            is(token_kind::lparen),
            pc::left(pc::defer(&body), is(token_kind::rparen)));

        atom = pc::label(pc::alt(name, text, group), "expression");

        auto suffix = pc::alt(is(token_kind::question), is(token_kind::star),
                              is(token_kind::plus));
        quantified = pc::seq(atom, pc::many(suffix),
                             [](ebnf::expr e, std::vector<token> suffixes) {
                               for (const auto& s : suffixes)
                                 e = ebnf::expr(ebnf::quantified(
                                     std::move(e), quantifier_of(s)));
                               return e;
                             });

        sequence = pc::map(pc::many(quantified), [](std::vector<ebnf::expr> v) {
          return ebnf::seq(std::move(v));
        });

        body = pc::map(pc::sep_by1(sequence, is(token_kind::pipe)),
                       [](std::vector<ebnf::expr> v) {
                         return ebnf::alt(std::move(v));
                       });

        definition = pc::label(
            pc::seq(is(token_kind::identifier),
                    pc::right(is(token_kind::define),
                              pc::left(body, is(token_kind::semicolon))),
                    [](token n, ebnf::expr b) {
                      return located_definition{
                          ebnf::definition{std::move(n.text), std::move(b)},
                          n.offset};
                    }),
            "definition");

        definitions =
            pc::left(pc::many(definition), pc::end_of_input<token>());

        expression = pc::left(body, pc::end_of_input<token>());
      }
    };

    std::vector<token>
    scan(std::string_view source) {
      auto tokens = tokenize_ebnf(source);
      const auto& last = tokens.back();
      if (last.kind == token_kind::error)
        throw error(error_kind::lexical,
                    "unexpected input '" + last.text + "'",
                    locate(source, last.offset));
      return tokens;
    }

    // Runs `r` over every token but the trailing end marker.
    template <typename T>
    T
    run(const rule<T>& r, const std::vector<token>& tokens,
        std::string_view source) {
      std::span<const token> symbols(tokens.data(), tokens.size() - 1);
      auto result = r(pc::input<token>(symbols));
      if (!result.ok()) {
        const auto& f = result.error();
        const auto& at = tokens[std::min(f.position, tokens.size() - 1)];
        std::string found = at.kind == token_kind::end
                                ? std::string("end of input")
                                : "'" + at.text + "'";
        throw error(error_kind::syntax,
                    "expected " + f.expected + ", found " + found,
                    locate(source, at.offset));
      }
      return result.take();
    }

    ebnf::expr
    normalize_at(const ebnf::expr& e, const std::string& name,
                 std::string_view source, std::size_t offset) {
      try {
        return normalize(e);
      } catch (const error& ex) {
        throw error(ex.kind(), "definition '" + name + "': " + ex.detail(),
                    locate(source, offset));
      }
    }

  } // namespace

  ebnf::definition_map
  ebnf_parser::parse(std::string_view source) {
    const notation n;
    auto tokens = scan(source);
    auto parsed = run(n.definitions, tokens, source);

    ebnf::definition_map defs;
    for (auto& d : parsed) {
      auto body = normalize_at(d.def.body, d.def.name, source, d.offset);
      auto name = d.def.name;
      if (!defs.add(ebnf::definition{name, std::move(body)}))
        throw error(error_kind::grammar, "duplicate definition '" + name + "'",
                    locate(source, d.offset));
    }
    return defs;
  }

  ebnf::expr
  ebnf_parser::parse_expression(std::string_view source) {
    const notation n;
    auto tokens = scan(source);
    return normalize(run(n.expression, tokens, source));
  }

} // namespace yeb
