#include <yeb/converter.hpp>

#include <yeb/error.hpp>
#include <yeb/normalize.hpp>

#include <algorithm>
#include <set>
#include <type_traits>
#include <utility>

namespace yeb {

  namespace {

    using namespace ebnf;

    ebnf::expr
    normalize_definition(const std::string& name, const expr& body) {
      try {
        return normalize(body);
      } catch (const error& ex) {
        throw error(ex.kind(), "definition '" + name + "': " + ex.detail(),
                    ex.where());
      }
    }

    // Substitutes references to trivial definitions by copies of their
    // bodies until nothing changes.
    class inliner {
    public:
      inliner(const converter& conv, const dependency_graph& graph,
              const definition_map& available, std::set<std::string>& used)
          : conv_(conv), graph_(graph), available_(available), used_(used) {}

      expr
      run(const std::string& name, expr body) {
        for (;;) {
          std::set<std::string> hits;
          auto next = normalize_definition(name, substitute(body, hits));
          if (next == body) return body;
          used_.insert(hits.begin(), hits.end());
          body = std::move(next);
        }
      }

    private:
      const converter& conv_;
      const dependency_graph& graph_;
      const definition_map& available_;
      std::set<std::string>& used_;

      const definition*
      eligible(const std::string& name) const {
        const auto* def = available_.find(name);
        if (!def) return nullptr;
        if (graph_.is_recursive(name)) return nullptr;
        if (!conv_.is_trivial(def->body)) return nullptr;
        return def;
      }

      // `hits` collects the names substituted in the returned expression.
      expr
      substitute(const expr& e, std::set<std::string>& hits) const {
        return std::visit(
            [&](const auto& node) -> expr {
              using T = std::decay_t<decltype(node)>;
              if constexpr (std::is_same_v<T, nonterminal>) {
                const auto* def = eligible(node.name);
                if (!def) return e;
                hits.insert(node.name);
                return def->body;
              } else if constexpr (std::is_same_v<T, alternation>) {
                std::vector<expr> out;
                for (const auto& a : node.alternatives)
                  out.push_back(substitute(a, hits));
                return alt(std::move(out));
              } else if constexpr (std::is_same_v<T, sequence>) {
                std::vector<expr> out;
                for (const auto& s : node.elements)
                  out.push_back(substitute(s, hits));
                return seq(std::move(out));
              } else if constexpr (std::is_same_v<T, quantified>) {
                // Keep the original when a replacement would put one
                // quantifier directly above another.
                std::set<std::string> inner_hits;
                expr inner = substitute(*node.content, inner_hits);
                if (normalize(inner).holds<quantified>()) return e;
                hits.insert(inner_hits.begin(), inner_hits.end());
                return expr(quantified(std::move(inner), node.q));
              } else {
                return e;
              }
            },
            e.data());
      }
    };

  } // namespace

  ebnf::expr
  to_ebnf(const yacc::production& p) {
    std::vector<expr> alternatives;
    for (const auto& r : p.alternatives) {
      std::vector<expr> elements;
      for (const auto& el : r.elements) {
        std::visit(
            [&](const auto& atom) {
              using T = std::decay_t<decltype(atom)>;
              if constexpr (std::is_same_v<T, yacc::terminal>)
                elements.push_back(t(atom.text));
              else
                elements.push_back(nt(atom.name));
            },
            el);
      }
      alternatives.push_back(seq(std::move(elements)));
    }
    return alt(std::move(alternatives));
  }

  converter::converter(converter_options options)
      : options_(std::move(options)) {}

  bool
  converter::is_trivial(const ebnf::expr& body) const {
    if (is_atomic(body)) return true;
    if (body.holds<alternation>()) {
      const auto& a = body.get<alternation>().alternatives;
      return a.size() <= options_.max_alternatives &&
             std::all_of(a.begin(), a.end(),
                         [](const expr& e) { return is_atomic(e); });
    }
    if (body.holds<sequence>()) {
      const auto& s = body.get<sequence>().elements;
      return s.size() <= options_.max_sequence &&
             std::all_of(s.begin(), s.end(), [this](const expr& e) {
               return is_atomic(e) || is_trivial(e);
             });
    }
    if (body.holds<quantified>())
      return is_atomic(*body.get<quantified>().content);
    return false;
  }

  conversion
  converter::convert(const yacc::grammar& g,
                     const ebnf::definition_map& supplementary) const {
    // A production shadows a supplementary definition of the same name.
    dependency_graph graph;
    for (const auto& p : g.productions())
      graph.add_node(p.name, p.references());
    for (const auto& d : supplementary)
      if (!graph.contains(d.name))
        graph.add_node(d.name, references(d.body));

    definition_map available;
    for (const auto& d : supplementary)
      if (!g.contains(d.name)) available.put(d);

    conversion out;
    std::set<std::string> used;
    std::vector<definition> converted;

    for (const auto& c : graph.components()) {
      dependency_graph::component members;
      for (const auto& name : c)
        if (g.contains(name)) members.push_back(name);
      if (members.empty()) continue;

      for (const auto& name : members) {
        auto body = normalize_definition(name, to_ebnf(*g.find(name)));
        if (options_.inline_trivial)
          body = inliner(*this, graph, available, used).run(name, body);
        available.put(definition{name, body});
        converted.push_back(definition{name, std::move(body)});
      }
      out.components.push_back(std::move(members));
    }

    std::set<std::string> referenced;
    if (options_.drop_inlined) {
      for (const auto& d : converted)
        for (const auto& r : references(d.body))
          referenced.insert(r);
      for (const auto& d : supplementary)
        for (const auto& r : references(d.body))
          referenced.insert(r);
    }

    const std::string start =
        g.productions().empty() ? std::string() : g.productions().front().name;
    for (auto& d : converted) {
      bool drop = options_.drop_inlined && d.name != start &&
                  used.count(d.name) > 0 && referenced.count(d.name) == 0;
      if (!drop) out.definitions.put(std::move(d));
    }
    for (const auto& d : supplementary)
      if (!g.contains(d.name)) out.definitions.put(d);

    // Reported in output order.
    for (const auto& d : out.definitions)
      if (used.count(d.name)) out.inlined.push_back(d.name);
    for (const auto& name : used)
      if (!out.definitions.contains(name)) out.inlined.push_back(name);

    return out;
  }

} // namespace yeb
