#include "dependency_graph_navigator.hpp"
#include <memory>
#include <span>
#include <utility>
#include <vector>
#include "graph_error.hpp"

using DGN = DependencyGraphNavigator;

namespace {

/**
 * Walks a list of sibling references like a database cursor: the cursor is the DependencyNode of the reference it
 * currently points to, and advancing the sequence moves the same object to the next sibling.
 */
class DependencyRefCursor final : public DependencyNode, public DependencySequence::Source {
public:
  DependencyRefCursor(const DependencyGraph &graph, std::span<const ReferenceId> references) noexcept
    : graph_{graph}, references_{references}, current_{references.empty() ? ReferenceId{} : references.front()} {}

  DependencyRefCursor(const DependencyGraph &graph, std::vector<ReferenceId> references) noexcept
    : graph_{graph}, owned_{std::move(references)}, references_{owned_},
      current_{owned_.empty() ? ReferenceId{} : owned_.front()} {}

  // Pinned to a single reference; never moves.
  DependencyRefCursor(const DependencyGraph &graph, ReferenceId current) noexcept
    : graph_{graph}, current_{current}, pinned_{true} {}

  DependencyRefCursor(const DependencyRefCursor &) = delete;
  DependencyRefCursor &operator=(const DependencyRefCursor &) = delete;

  const Identifier &id() const override { return graph_.package(current().pkg); }
  PackageLinkage linkage() const override { return current().linkage; }
  const std::vector<Issue> &issues() const override { return current().issues; }

  void visit_dependencies(const std::function<void(DependencySequence &)> &block) const override {
    DependencyRefCursor cursor{graph_, std::span<const ReferenceId>{current().dependencies}};
    DependencySequence dependencies{cursor};
    block(dependencies);
  }

  std::unique_ptr<DependencyNode> stable_reference() const override {
    return std::make_unique<DependencyRefCursor>(graph_, current_);
  }

  DependencyNode *next() override {
    if (!started_) {
      started_ = true;
      return pinned_ || !references_.empty() ? this : nullptr;
    }
    if (pinned_ || position_ + 1 >= references_.size()) return nullptr;
    current_ = references_[++position_];
    return this;
  }

private:
  const DependencyGraph &graph_;
  std::vector<ReferenceId> owned_;
  std::span<const ReferenceId> references_;
  std::size_t position_ = 0;
  ReferenceId current_;
  bool pinned_ = false;
  bool started_ = false;

  const DependencyReference &current() const noexcept { return graph_.reference(current_); }
};

}

DGN::DependencyGraphNavigator(const GraphMap &graphs) {
  if (graphs.empty())
    throw GraphError{GraphErrorCode::kNoGraphAvailable,
      "No dependency graph available to initialize DependencyGraphNavigator."};
  for (const auto &[manager, graph] : graphs)
    indexes_.try_emplace(manager, graph, manager);
}

std::set<std::string> DGN::scope_names(const Project &project) const { return project.scope_names; }

DependencySequence DGN::direct_dependencies(const Project &project, std::string_view scope_name) const {
  const auto &manager = project.manager_name();
  const auto &index = index_for_manager(manager);
  const auto &roots = index.graph().scope(DependencyGraph::qualify_scope(project.id, scope_name));
  if (roots.empty()) return {};

  const auto &refs = index.get();
  std::vector<ReferenceId> references;
  references.reserve(roots.size());
  for (auto root : roots) references.push_back(refs.resolve(root));
  return DependencySequence{std::make_unique<DependencyRefCursor>(index.graph(), std::move(references))};
}

const DependencyGraph &DGN::graph_for_manager(std::string_view manager) const {
  return index_for_manager(manager).graph();
}

const ReferenceIndex &DGN::reference_index(std::string_view manager) const {
  return index_for_manager(manager).get();
}

bool DGN::is_index_built(std::string_view manager) const noexcept {
  auto it = indexes_.find(manager);
  return it != indexes_.end() && it->second.is_built();
}

const LazyReferenceIndex &DGN::index_for_manager(std::string_view manager) const {
  auto it = indexes_.find(manager);
  if (it == indexes_.end() || it->second.graph().empty())
    throw GraphError{GraphErrorCode::kNoGraphAvailable,
      "No DependencyGraph for package manager '" + std::string{manager} + "' available."};
  return it->second;
}
