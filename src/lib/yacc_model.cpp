#include <yeb/yacc_model.hpp>

#include <yeb/error.hpp>

#include <algorithm>
#include <set>

namespace yeb::yacc {

  bool
  operator==(const terminal& a, const terminal& b) {
    return a.text == b.text;
  }

  bool
  operator==(const nonterminal& a, const nonterminal& b) {
    return a.name == b.name;
  }

  std::size_t
  production::empty_alternatives() const {
    return static_cast<std::size_t>(
        std::count_if(alternatives.begin(), alternatives.end(),
                      [](const rule& r) { return r.empty(); }));
  }

  std::vector<std::string>
  production::references() const {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& r : alternatives) {
      for (const auto& e : r.elements) {
        if (const auto* n = std::get_if<nonterminal>(&e)) {
          if (seen.insert(n->name).second) out.push_back(n->name);
        }
      }
    }
    return out;
  }

  std::optional<std::string>
  grammar::violation(const production& p) const {
    if (contains(p.name)) return "duplicate production '" + p.name + "'";
    auto empties = p.empty_alternatives();
    if (empties > 1)
      return "production '" + p.name + "' has " + std::to_string(empties) +
             " empty alternatives";
    return std::nullopt;
  }

  void
  grammar::add(production p) {
    if (auto v = violation(p)) throw error(error_kind::grammar, *v);
    index_.emplace(p.name, productions_.size());
    productions_.push_back(std::move(p));
  }

  const production*
  grammar::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &productions_[it->second];
  }

} // namespace yeb::yacc
