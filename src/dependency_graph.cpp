#include "dependency_graph.hpp"
#include <algorithm>
#include <string>
#include "graph_error.hpp"

using DG = DependencyGraph;

std::string DG::qualify_scope(const Identifier &project_id, std::string_view scope_name) {
  return project_id.to_coordinates().append(1, ':').append(scope_name);
}

std::string_view DG::unqualify_scope(std::string_view qualified_scope) noexcept {
  auto colon = qualified_scope.rfind(':');
  return colon == std::string_view::npos ? qualified_scope : qualified_scope.substr(colon + 1);
}

const std::vector<RootDependencyIndex> &DG::scope(std::string_view qualified_scope) const noexcept {
  static const std::vector<RootDependencyIndex> kNoRoots;
  auto it = scopes_.find(qualified_scope);
  return it != scopes_.end() ? it->second : kNoRoots;
}

ReferenceId DG::add_reference(PackageIndex pkg, Fragment fragment, PackageLinkage linkage, std::vector<Issue> issues) {
  if (pkg >= packages_.size())
    throw GraphError{GraphErrorCode::kInvalidGraph, "Package index " + std::to_string(pkg)
      + " is out of range for a catalog of " + std::to_string(packages_.size()) + " packages."};
  auto ref = static_cast<ReferenceId>(references_.size());
  references_.push_back({
    .pkg = pkg,
    .fragment = fragment,
    .linkage = linkage,
    .issues = std::move(issues),
    .dependencies = {}
  });
  return ref;
}

void DG::add_dependency(ReferenceId from, ReferenceId to) {
  check_reference(from);
  check_reference(to);
  if (from == to)
    throw GraphError{GraphErrorCode::kInvalidGraph, "Reference " + std::to_string(from) + " cannot depend on itself."};
  references_[from].dependencies.push_back(to);
}

void DG::add_root(ReferenceId root) {
  check_reference(root);
  if (std::ranges::find(scope_roots_, root) == scope_roots_.end()) scope_roots_.push_back(root);
}

void DG::add_scope(std::string_view qualified_scope, RootDependencyIndex root) {
  if (root.root >= packages_.size())
    throw GraphError{GraphErrorCode::kInvalidGraph, "Root index " + std::to_string(root.root) + " of scope '"
      + std::string{qualified_scope} + "' is out of range."};
  auto it = scopes_.find(qualified_scope);
  if (it == scopes_.end()) it = scopes_.emplace(std::string{qualified_scope}, std::vector<RootDependencyIndex>{}).first;
  it->second.push_back(root);
}

void DG::add_scope_root(std::string_view qualified_scope, ReferenceId root) {
  add_root(root);
  const auto &ref = references_[root];
  add_scope(qualified_scope, {.root = ref.pkg, .fragment = ref.fragment});
}

void DG::check_reference(ReferenceId ref) const {
  if (ref >= references_.size())
    throw GraphError{GraphErrorCode::kInvalidGraph, "Reference " + std::to_string(ref)
      + " does not exist in a graph with " + std::to_string(references_.size()) + " references."};
}

std::size_t DG::estimated_memory_usage() const noexcept {
  std::size_t total = sizeof(DependencyGraph);
  total += packages_.capacity() * sizeof(Identifier);
  for (const auto &id : packages_)
    total += id.type.capacity() + id.namespace_name.capacity() + id.name.capacity() + id.version.capacity();

  total += references_.capacity() * sizeof(DependencyReference);
  for (const auto &ref : references_) {
    total += ref.dependencies.capacity() * sizeof(ReferenceId);
    total += ref.issues.capacity() * sizeof(Issue);
    for (const auto &issue : ref.issues) total += issue.source.capacity() + issue.message.capacity();
  }

  total += scope_roots_.capacity() * sizeof(ReferenceId);
  for (const auto &[name, roots] : scopes_) {
    total += sizeof(ScopeMap::value_type) + 3 * sizeof(void *);
    total += name.capacity() + roots.capacity() * sizeof(RootDependencyIndex);
  }
  return total;
}
