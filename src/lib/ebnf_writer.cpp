#include <yeb/ebnf_writer.hpp>

#include <type_traits>

namespace yeb {

  namespace {

    using namespace ebnf;

    void
    render(const expr& e, precedence required, std::string& out);

    void
    render_node(const expr& e, precedence required, std::string& out) {
      std::visit(
          [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, alternation>) {
              bool first = true;
              for (const auto& a : node.alternatives) {
                if (!first) out += '|';
                first = false;
                render(a, precedence::sequence, out);
              }
            } else if constexpr (std::is_same_v<T, sequence>) {
              if (node.elements.empty()) {
                if (required != precedence::alternation) out += "()";
                return;
              }
              bool first = true;
              for (const auto& s : node.elements) {
                if (!first) out += ' ';
                first = false;
                render(s, precedence::quantified, out);
              }
            } else if constexpr (std::is_same_v<T, quantified>) {
              render(*node.content, precedence::atomic, out);
              switch (node.q) {
                case quantifier::zero_or_one:
                  out += '?';
                  break;
                case quantifier::zero_or_many:
                  out += '*';
                  break;
                case quantifier::one_or_many:
                  out += '+';
                  break;
              }
            } else if constexpr (std::is_same_v<T, nonterminal>) {
              out += node.name;
            } else if constexpr (std::is_same_v<T, terminal>) {
              out += node.text;
            }
          },
          e.data());
    }

    void
    render(const expr& e, precedence required, std::string& out) {
      bool parens = precedence_of(e) < required && !is_empty(e);
      if (parens) out += '(';
      render_node(e, required, out);
      if (parens) out += ')';
    }

  } // namespace

  std::string
  to_string(const ebnf::expr& e) {
    std::string out;
    render(e, ebnf::precedence::alternation, out);
    return out;
  }

  std::string
  to_line(const ebnf::definition& def) {
    auto body = to_string(def.body);
    if (body.empty()) return def.name + " ::=";
    return def.name + " ::= " + body;
  }

  namespace ebnf {

    std::ostream&
    operator<<(std::ostream& os, const expr& e) {
      return os << yeb::to_string(e);
    }

  } // namespace ebnf

} // namespace yeb
