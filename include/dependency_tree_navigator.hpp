#pragma once
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include "dependency_navigator.hpp"
#include "project.hpp"

// A DependencyNavigator over the tree-shaped model stored directly in the scopes of a Project.
class DependencyTreeNavigator : public DependencyNavigator {
public:
  std::set<std::string> scope_names(const Project &project) const override;
  DependencySequence direct_dependencies(const Project &project, std::string_view scope_name) const override;
};

// Materializes the dependency trees a navigator exposes for a project into tree-shaped scopes.
std::vector<Scope> collect_scopes(const DependencyNavigator &navigator, const Project &project);
