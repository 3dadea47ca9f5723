#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace yeb::ebnf {

  class expr;

  enum class quantifier { zero_or_one, zero_or_many, one_or_many };

  // ---------------------------------------------------------------------------
  // Expression node types
  // ---------------------------------------------------------------------------

  struct alternation {
    std::vector<expr> alternatives;
  };

  // The empty sequence is the canonical "nothing".
  struct sequence {
    std::vector<expr> elements;
  };

  struct quantified {
    quantified(expr content, quantifier q);
    quantified(const quantified& other);
    quantified&
    operator=(const quantified& other);
    quantified(quantified&&) noexcept = default;
    quantified&
    operator=(quantified&&) noexcept = default;
    ~quantified();

    std::unique_ptr<expr> content;
    quantifier q = quantifier::zero_or_one;
  };

  struct nonterminal {
    std::string name;
  };

  // Literal text, kept verbatim including its quotes or brackets.
  struct terminal {
    std::string text;
  };

  bool
  operator==(const alternation& a, const alternation& b);
  bool
  operator==(const sequence& a, const sequence& b);
  bool
  operator==(const quantified& a, const quantified& b);
  bool
  operator==(const nonterminal& a, const nonterminal& b);
  bool
  operator==(const terminal& a, const terminal& b);

  // ---------------------------------------------------------------------------
  // Expression
  // ---------------------------------------------------------------------------

  class expr {
  public:
    using variant_type =
        std::variant<alternation, sequence, quantified, nonterminal, terminal>;

    expr() : data_(sequence{}) {}

    expr(variant_type v) : data_(std::move(v)) {}

    expr(alternation v) : data_(std::move(v)) {}

    expr(sequence v) : data_(std::move(v)) {}

    expr(quantified v) : data_(std::move(v)) {}

    expr(nonterminal v) : data_(std::move(v)) {}

    expr(terminal v) : data_(std::move(v)) {}

    const variant_type&
    data() const {
      return data_;
    }

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(data_);
    }

    template <typename T>
    const T&
    get() const {
      return std::get<T>(data_);
    }

    friend bool
    operator==(const expr& a, const expr& b) {
      return a.data_ == b.data_;
    }

  private:
    variant_type data_;
  };

  // ---------------------------------------------------------------------------
  // Helpers
  // ---------------------------------------------------------------------------

  inline expr
  nt(std::string name) {
    return expr(nonterminal{std::move(name)});
  }

  inline expr
  t(std::string text) {
    return expr(terminal{std::move(text)});
  }

  inline expr
  alt(std::vector<expr> alternatives) {
    return expr(alternation{std::move(alternatives)});
  }

  inline expr
  seq(std::vector<expr> elements) {
    return expr(sequence{std::move(elements)});
  }

  inline expr
  empty() {
    return expr(sequence{});
  }

  inline expr
  opt(expr content) {
    return expr(quantified(std::move(content), quantifier::zero_or_one));
  }

  inline expr
  star(expr content) {
    return expr(quantified(std::move(content), quantifier::zero_or_many));
  }

  inline expr
  plus(expr content) {
    return expr(quantified(std::move(content), quantifier::one_or_many));
  }

  // Display precedence, used only for parenthesization on output.
  enum class precedence { alternation = 0, sequence = 1, quantified = 2,
                          atomic = 3 };

  precedence
  precedence_of(const expr& e);

  bool
  is_atomic(const expr& e);

  bool
  is_empty(const expr& e);

  // Non-terminal names referenced anywhere inside `e`, first occurrence
  // order, without duplicates.
  std::vector<std::string>
  references(const expr& e);

  // ---------------------------------------------------------------------------
  // Definitions
  // ---------------------------------------------------------------------------

  struct definition {
    std::string name;
    expr body;

    // True when `name` occurs among the references of `body`.
    bool
    recursive() const;
  };

  bool
  operator==(const definition& a, const definition& b);

  // Name -> definition, in insertion order.
  class definition_map {
  public:
    // Returns false and leaves the map unchanged when the name is taken.
    bool
    add(definition def);

    // Inserts or replaces.
    void
    put(definition def);

    const definition*
    find(const std::string& name) const;

    bool
    contains(const std::string& name) const {
      return index_.count(name) > 0;
    }

    std::size_t
    size() const {
      return defs_.size();
    }

    bool
    empty() const {
      return defs_.empty();
    }

    std::vector<definition>::const_iterator
    begin() const {
      return defs_.begin();
    }

    std::vector<definition>::const_iterator
    end() const {
      return defs_.end();
    }

    const std::vector<definition>&
    definitions() const {
      return defs_;
    }

  private:
    std::vector<definition> defs_;
    std::unordered_map<std::string, std::size_t> index_;
  };

} // namespace yeb::ebnf
