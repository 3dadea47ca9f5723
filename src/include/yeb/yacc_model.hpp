#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace yeb::yacc {

  // -- Elements -----------------------------------------------------------------

  // Quoted literal, kept verbatim including the quotes.
  struct terminal {
    std::string text;
  };

  struct nonterminal {
    std::string name;
  };

  using element = std::variant<terminal, nonterminal>;

  bool
  operator==(const terminal& a, const terminal& b);
  bool
  operator==(const nonterminal& a, const nonterminal& b);

  // -- Rules and productions ----------------------------------------------------

  struct rule {
    std::vector<element> elements;

    bool
    empty() const {
      return elements.empty();
    }
  };

  struct production {
    std::string name;
    std::vector<rule> alternatives;

    std::size_t
    empty_alternatives() const;

    // Non-terminal names referenced by any alternative, first occurrence
    // order, without duplicates.
    std::vector<std::string>
    references() const;
  };

  // -- Grammar ------------------------------------------------------------------

  // Productions keyed by name, in source order. Invariants are checked before
  // each insertion: names are unique and a production has at most one empty
  // alternative.
  class grammar {
  public:
    // Description of the invariant `p` would break, if any.
    std::optional<std::string>
    violation(const production& p) const;

    // Throws yeb::error (grammar kind) when an invariant would break.
    void
    add(production p);

    const production*
    find(const std::string& name) const;

    bool
    contains(const std::string& name) const {
      return index_.count(name) > 0;
    }

    const std::vector<production>&
    productions() const {
      return productions_;
    }

    std::size_t
    size() const {
      return productions_.size();
    }

  private:
    std::vector<production> productions_;
    std::unordered_map<std::string, std::size_t> index_;
  };

} // namespace yeb::yacc
