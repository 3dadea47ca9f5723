#include <yeb/dependency_graph.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace yeb {

  namespace {

    // Tarjan's algorithm. A component is emitted once everything it reaches
    // has been emitted, which is exactly dependency-first order.
    class tarjan {
    public:
      explicit tarjan(std::vector<std::vector<std::size_t>> edges)
          : edges_(std::move(edges)), index_(edges_.size(), unvisited),
            lowlink_(edges_.size(), 0), on_stack_(edges_.size(), false) {}

      std::vector<std::vector<std::size_t>>
      run() {
        for (std::size_t v = 0; v < edges_.size(); ++v)
          if (index_[v] == unvisited) visit(v);
        return std::move(result_);
      }

    private:
      static constexpr std::size_t unvisited = static_cast<std::size_t>(-1);

      void
      visit(std::size_t v) {
        index_[v] = lowlink_[v] = counter_++;
        stack_.push_back(v);
        on_stack_[v] = true;

        for (auto w : edges_[v]) {
          if (index_[w] == unvisited) {
            visit(w);
            lowlink_[v] = std::min(lowlink_[v], lowlink_[w]);
          } else if (on_stack_[w]) {
            lowlink_[v] = std::min(lowlink_[v], index_[w]);
          }
        }

        if (lowlink_[v] != index_[v]) return;

        std::vector<std::size_t> members;
        std::size_t w;
        do {
          w = stack_.back();
          stack_.pop_back();
          on_stack_[w] = false;
          members.push_back(w);
        } while (w != v);
        std::sort(members.begin(), members.end());
        result_.push_back(std::move(members));
      }

      std::vector<std::vector<std::size_t>> edges_;
      std::vector<std::size_t> index_;
      std::vector<std::size_t> lowlink_;
      std::vector<bool> on_stack_;
      std::vector<std::size_t> stack_;
      std::size_t counter_ = 0;
      std::vector<std::vector<std::size_t>> result_;
    };

  } // namespace

  void
  dependency_graph::add_node(const std::string& name,
                             std::vector<std::string> references) {
    if (index_.count(name))
      throw std::invalid_argument("dependency_graph: duplicate node '" + name +
                                  "'");
    index_.emplace(name, names_.size());
    names_.push_back(name);
    references_.push_back(std::move(references));
  }

  std::vector<std::size_t>
  dependency_graph::edges_of(std::size_t node) const {
    std::vector<std::size_t> out;
    for (const auto& ref : references_[node]) {
      auto it = index_.find(ref);
      if (it != index_.end()) out.push_back(it->second);
    }
    return out;
  }

  std::vector<std::string>
  dependency_graph::successors(const std::string& name) const {
    std::vector<std::string> out;
    auto it = index_.find(name);
    if (it == index_.end()) return out;
    for (auto w : edges_of(it->second))
      out.push_back(names_[w]);
    return out;
  }

  bool
  dependency_graph::reaches(const std::string& from,
                            const std::string& to) const {
    auto src = index_.find(from);
    auto dst = index_.find(to);
    if (src == index_.end() || dst == index_.end()) return false;

    // Start from the successors so that a path needs at least one edge.
    std::vector<bool> seen(names_.size(), false);
    std::vector<std::size_t> pending = edges_of(src->second);
    while (!pending.empty()) {
      auto v = pending.back();
      pending.pop_back();
      if (v == dst->second) return true;
      if (seen[v]) continue;
      seen[v] = true;
      for (auto w : edges_of(v))
        if (!seen[w]) pending.push_back(w);
    }
    return false;
  }

  std::vector<dependency_graph::component>
  dependency_graph::components() const {
    std::vector<std::vector<std::size_t>> edges;
    edges.reserve(names_.size());
    for (std::size_t v = 0; v < names_.size(); ++v)
      edges.push_back(edges_of(v));

    std::vector<component> out;
    for (const auto& members : tarjan(std::move(edges)).run()) {
      component c;
      for (auto m : members)
        c.push_back(names_[m]);
      out.push_back(std::move(c));
    }
    return out;
  }

} // namespace yeb
