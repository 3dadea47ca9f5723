#include <yeb/normalize.hpp>

#include <yeb/ebnf_writer.hpp>
#include <yeb/error.hpp>

#include <algorithm>
#include <type_traits>

namespace yeb {

  namespace {

    using namespace ebnf;

    // zero_or_one applied to an already normalized expression. An optional
    // or starred expression stays as it is and one_or_many becomes
    // zero_or_many, so no quantifier ends up directly above another.
    expr
    make_optional(expr e) {
      if (!e.holds<quantified>()) return opt(std::move(e));
      const auto& q = e.get<quantified>();
      if (q.q == quantifier::one_or_many) return star(*q.content);
      return e;
    }

    expr
    normalize_alternation(const alternation& node) {
      std::vector<expr> flat;
      for (const auto& a : node.alternatives) {
        auto n = normalize(a);
        if (n.holds<alternation>()) {
          for (const auto& inner : n.get<alternation>().alternatives)
            flat.push_back(inner);
        } else {
          flat.push_back(std::move(n));
        }
      }

      auto first_empty = std::remove_if(flat.begin(), flat.end(),
                                        [](const expr& e) {
                                          return is_empty(e);
                                        });
      bool had_empty = first_empty != flat.end();
      flat.erase(first_empty, flat.end());

      expr rest;
      if (flat.size() == 1)
        rest = std::move(flat.front());
      else if (!flat.empty())
        rest = alt(std::move(flat));

      if (!had_empty || is_empty(rest)) return rest;
      return make_optional(std::move(rest));
    }

    expr
    normalize_sequence(const sequence& node) {
      std::vector<expr> flat;
      for (const auto& s : node.elements) {
        auto n = normalize(s);
        if (n.holds<sequence>()) {
          for (const auto& inner : n.get<sequence>().elements)
            flat.push_back(inner);
        } else {
          flat.push_back(std::move(n));
        }
      }
      if (flat.size() == 1) return std::move(flat.front());
      return seq(std::move(flat));
    }

    expr
    normalize_quantified(const expr& original, const quantified& node) {
      auto inner = normalize(*node.content);
      // Repeating or omitting nothing is still nothing.
      if (is_empty(inner)) return inner;
      expr partial(quantified(inner, node.q));
      if (inner.holds<quantified>())
        throw error(error_kind::grammar,
                    "illegal double quantification: " + to_string(original) +
                        " (normalized: " + to_string(partial) + ")");
      return partial;
    }

  } // namespace

  ebnf::expr
  normalize(const ebnf::expr& e) {
    return std::visit(
        [&](const auto& node) -> expr {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, alternation>) {
            return normalize_alternation(node);
          } else if constexpr (std::is_same_v<T, sequence>) {
            return normalize_sequence(node);
          } else if constexpr (std::is_same_v<T, quantified>) {
            return normalize_quantified(e, node);
          } else {
            return e;
          }
        },
        e.data());
  }

} // namespace yeb
