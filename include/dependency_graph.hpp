#pragma once
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "config.hpp"
#include "identifier.hpp"
#include "types.hpp"

// Address of one scope root in the reference arena of a DependencyGraph.
struct RootDependencyIndex {
  PackageIndex root;
  Fragment fragment = kDefaultFragment;

  bool operator==(const RootDependencyIndex &) const = default;
};

// One occurrence of a package in the graph. Two occurrences of the same package with different transitive
// dependencies carry different fragments.
struct DependencyReference {
  PackageIndex pkg;
  Fragment fragment;
  PackageLinkage linkage;
  std::vector<Issue> issues;
  std::vector<ReferenceId> dependencies;
};

/**
 * Compact dependency information of a single package manager. The packages are stored once in a catalog; the
 * dependency trees of all scopes of all projects handled by the manager are stored as an arena of references whose
 * children are arena indices, so subtrees are shared between scopes and projects.
 */
class DependencyGraph {
public:
  using ScopeMap = std::map<std::string, std::vector<RootDependencyIndex>, std::less<>>;

  explicit DependencyGraph(std::vector<Identifier> packages = {}) noexcept : packages_{std::move(packages)} {}

  static std::string qualify_scope(const Identifier &project_id, std::string_view scope_name);
  static std::string_view unqualify_scope(std::string_view qualified_scope) noexcept;

  std::size_t package_count() const noexcept { return packages_.size(); }
  std::size_t reference_count() const noexcept { return references_.size(); }
  std::size_t scope_count() const noexcept { return scopes_.size(); }
  bool empty() const noexcept { return packages_.empty(); }

  std::size_t estimated_memory_usage() const noexcept;

  const std::vector<Identifier> &packages() const noexcept { return packages_; }
  const Identifier &package(PackageIndex pkg) const noexcept { return packages_[pkg]; }
  const DependencyReference &reference(ReferenceId ref) const noexcept { return references_[ref]; }
  const std::vector<ReferenceId> &scope_roots() const noexcept { return scope_roots_; }
  const ScopeMap &scopes() const noexcept { return scopes_; }
  const std::vector<RootDependencyIndex> &scope(std::string_view qualified_scope) const noexcept;

  ReferenceId add_reference(PackageIndex pkg, Fragment fragment = kDefaultFragment,
                            PackageLinkage linkage = PackageLinkage::kDynamic, std::vector<Issue> issues = {});
  void add_dependency(ReferenceId from, ReferenceId to);
  void add_root(ReferenceId root);
  void add_scope(std::string_view qualified_scope, RootDependencyIndex root);
  void add_scope_root(std::string_view qualified_scope, ReferenceId root);

private:
  std::vector<Identifier> packages_;
  std::vector<DependencyReference> references_;
  std::vector<ReferenceId> scope_roots_;
  ScopeMap scopes_;

  void check_reference(ReferenceId ref) const;
};
