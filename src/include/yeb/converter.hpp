#pragma once

#include <yeb/dependency_graph.hpp>
#include <yeb/ebnf.hpp>
#include <yeb/yacc_model.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace yeb {

  struct converter_options {
    static constexpr std::size_t default_max_alternatives = 4;
    static constexpr std::size_t default_max_sequence = 3;

    // A trivial alternation has at most this many atomic alternatives.
    std::size_t max_alternatives = default_max_alternatives;
    // A trivial sequence has at most this many top-level elements.
    std::size_t max_sequence = default_max_sequence;
    bool inline_trivial = true;
    // Omit YACC-derived definitions that no longer have any reference after
    // inlining. The first production is always kept.
    bool drop_inlined = false;
  };

  struct conversion {
    // YACC-derived definitions in dependency order, then the supplementary
    // definitions in source order.
    ebnf::definition_map definitions;
    // Components of YACC production names, dependencies first.
    std::vector<dependency_graph::component> components;
    // Definitions substituted at one or more use sites.
    std::vector<std::string> inlined;
  };

  // Alternation of sequences, one per rule; not normalized.
  ebnf::expr
  to_ebnf(const yacc::production& p);

  class converter {
  public:
    explicit converter(converter_options options = {});

    // Throws yeb::error (grammar kind) when a body cannot be normalized.
    conversion
    convert(const yacc::grammar& g,
            const ebnf::definition_map& supplementary = {}) const;

    // Shape test for an inline candidate's normalized body; recursion is
    // checked separately.
    bool
    is_trivial(const ebnf::expr& body) const;

    const converter_options&
    options() const {
      return options_;
    }

  private:
    converter_options options_;
  };

} // namespace yeb
