#pragma once
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include "identifier.hpp"
#include "types.hpp"

// A node of the tree-shaped dependency model, owning its whole subtree.
struct PackageReference {
  Identifier id;
  PackageLinkage linkage = PackageLinkage::kDynamic;
  std::vector<Issue> issues;
  std::vector<PackageReference> dependencies;
};

struct Scope {
  std::string name;
  std::vector<PackageReference> dependencies;
};

/**
 * A project found by an analyzer. Projects of graph-based results only list their scope names; the dependencies are
 * stored in the DependencyGraph of the project's package manager. Projects of tree-based results carry the full
 * dependency trees in scopes, which may be an empty list.
 */
struct Project {
  Identifier id;
  std::set<std::string> scope_names;
  std::optional<std::vector<Scope>> scopes;

  const std::string &manager_name() const noexcept { return id.type; }
  bool uses_graph() const noexcept { return !scopes.has_value(); }
  const Scope *find_scope(std::string_view name) const noexcept;
};
