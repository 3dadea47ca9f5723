#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace yeb {

  // Directed graph over definition names. An edge runs from a node to every
  // node named in its reference list; names that are never added as nodes
  // carry no edge.
  class dependency_graph {
  public:
    using component = std::vector<std::string>;

    // Throws std::invalid_argument when `name` is already a node.
    void
    add_node(const std::string& name, std::vector<std::string> references);

    bool
    contains(const std::string& name) const {
      return index_.count(name) > 0;
    }

    const std::vector<std::string>&
    nodes() const {
      return names_;
    }

    // Direct successors of `name` that are nodes of the graph.
    std::vector<std::string>
    successors(const std::string& name) const;

    // True when `to` can be reached from `from` along at least one edge.
    bool
    reaches(const std::string& from, const std::string& to) const;

    bool
    is_recursive(const std::string& name) const {
      return reaches(name, name);
    }

    // Strongly connected components in topological order: no component has
    // an edge into a component listed after it. Members keep insertion
    // order.
    std::vector<component>
    components() const;

  private:
    std::vector<std::size_t>
    edges_of(std::size_t node) const;

    std::vector<std::string> names_;
    std::vector<std::vector<std::string>> references_;
    std::unordered_map<std::string, std::size_t> index_;
  };

} // namespace yeb
