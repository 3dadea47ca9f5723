#include <yeb/ebnf.hpp>

#include <yeb/dependency_graph.hpp>

#include <set>
#include <type_traits>

namespace yeb::ebnf {

  quantified::quantified(expr content, quantifier q)
      : content(std::make_unique<expr>(std::move(content))), q(q) {}

  quantified::quantified(const quantified& other)
      : content(std::make_unique<expr>(*other.content)), q(other.q) {}

  quantified&
  quantified::operator=(const quantified& other) {
    if (this != &other) {
      content = std::make_unique<expr>(*other.content);
      q = other.q;
    }
    return *this;
  }

  quantified::~quantified() = default;

  bool
  operator==(const alternation& a, const alternation& b) {
    return a.alternatives == b.alternatives;
  }

  bool
  operator==(const sequence& a, const sequence& b) {
    return a.elements == b.elements;
  }

  bool
  operator==(const quantified& a, const quantified& b) {
    if (a.q != b.q) return false;
    if (!a.content || !b.content) return a.content == b.content;
    return *a.content == *b.content;
  }

  bool
  operator==(const nonterminal& a, const nonterminal& b) {
    return a.name == b.name;
  }

  bool
  operator==(const terminal& a, const terminal& b) {
    return a.text == b.text;
  }

  precedence
  precedence_of(const expr& e) {
    return std::visit(
        [](const auto& node) {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, alternation>) {
            return precedence::alternation;
          } else if constexpr (std::is_same_v<T, sequence>) {
            return precedence::sequence;
          } else if constexpr (std::is_same_v<T, quantified>) {
            return precedence::quantified;
          } else {
            return precedence::atomic;
          }
        },
        e.data());
  }

  bool
  is_atomic(const expr& e) {
    return e.holds<nonterminal>() || e.holds<terminal>();
  }

  bool
  is_empty(const expr& e) {
    return e.holds<sequence>() && e.get<sequence>().elements.empty();
  }

  namespace {

    void
    collect_references(const expr& e, std::vector<std::string>& out,
                       std::set<std::string>& seen) {
      std::visit(
          [&](const auto& node) {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, nonterminal>) {
              if (seen.insert(node.name).second) out.push_back(node.name);
            } else if constexpr (std::is_same_v<T, alternation>) {
              for (const auto& a : node.alternatives)
                collect_references(a, out, seen);
            } else if constexpr (std::is_same_v<T, sequence>) {
              for (const auto& s : node.elements)
                collect_references(s, out, seen);
            } else if constexpr (std::is_same_v<T, quantified>) {
              collect_references(*node.content, out, seen);
            }
          },
          e.data());
    }

  } // namespace

  std::vector<std::string>
  references(const expr& e) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    collect_references(e, out, seen);
    return out;
  }

  bool
  definition::recursive() const {
    // A one-node graph: only the self edge can exist.
    dependency_graph g;
    g.add_node(name, references(body));
    return g.is_recursive(name);
  }

  bool
  operator==(const definition& a, const definition& b) {
    return a.name == b.name && a.body == b.body;
  }

  bool
  definition_map::add(definition def) {
    if (index_.count(def.name)) return false;
    index_.emplace(def.name, defs_.size());
    defs_.push_back(std::move(def));
    return true;
  }

  void
  definition_map::put(definition def) {
    auto it = index_.find(def.name);
    if (it != index_.end()) {
      defs_[it->second] = std::move(def);
      return;
    }
    index_.emplace(def.name, defs_.size());
    defs_.push_back(std::move(def));
  }

  const definition*
  definition_map::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &defs_[it->second];
  }

} // namespace yeb::ebnf
