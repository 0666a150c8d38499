#include "reference_index.hpp"
#include <ranges>
#include <utility>
#include "graph_error.hpp"

ReferenceIndex::ReferenceIndex(const DependencyGraph &graph, std::string manager)
  : graph_{graph}, manager_{std::move(manager)}, buckets_(graph.package_count()) {
  std::vector<bool> visited(graph.reference_count());
  std::vector<ReferenceId> stack{graph.scope_roots().rbegin(), graph.scope_roots().rend()};
  while (!stack.empty()) {
    auto ref = stack.back();
    stack.pop_back();
    if (visited[ref]) continue;
    visited[ref] = true;
    const auto &dref = graph.reference(ref);
    buckets_[dref.pkg].push_back(ref);
    ++indexed_count_;
    for (auto dep : dref.dependencies | std::views::reverse)
      if (!visited[dep]) stack.push_back(dep);
  }
}

const std::vector<ReferenceId> &ReferenceIndex::references(PackageIndex pkg) const noexcept {
  static const std::vector<ReferenceId> kNoReferences;
  return pkg < buckets_.size() ? buckets_[pkg] : kNoReferences;
}

std::optional<ReferenceId> ReferenceIndex::find(PackageIndex pkg, Fragment fragment) const noexcept {
  for (auto ref : references(pkg))
    if (graph_.reference(ref).fragment == fragment) return ref;
  return std::nullopt;
}

ReferenceId ReferenceIndex::resolve(PackageIndex pkg, Fragment fragment) const {
  if (auto ref = find(pkg, fragment)) return *ref;
  throw GraphError{GraphErrorCode::kUnresolvedReference, "Could not resolve a DependencyReference for index = "
    + std::to_string(pkg) + " and fragment " + std::to_string(fragment) + " in the graph of package manager '"
    + manager_ + "'."};
}

const ReferenceIndex &LazyReferenceIndex::get() const {
  std::call_once(once_, [this] {
    index_.emplace(graph_, manager_);
    built_.store(true, std::memory_order_release);
  });
  return *index_;
}
