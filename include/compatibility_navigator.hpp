#pragma once
#include <set>
#include <string>
#include <string_view>
#include "dependency_graph_navigator.hpp"
#include "dependency_navigator.hpp"
#include "dependency_tree_navigator.hpp"

/**
 * Serves results that mix both dependency models: projects that carry their own dependency trees are navigated with
 * a DependencyTreeNavigator, all other projects with a DependencyGraphNavigator.
 */
class CompatibilityDependencyNavigator : public DependencyNavigator {
public:
  CompatibilityDependencyNavigator(const DependencyNavigator &graph_navigator,
                                   const DependencyNavigator &tree_navigator) noexcept
    : graph_navigator_{graph_navigator}, tree_navigator_{tree_navigator} {}

  std::set<std::string> scope_names(const Project &project) const override;
  DependencySequence direct_dependencies(const Project &project, std::string_view scope_name) const override;

  const DependencyNavigator &navigator_for(const Project &project) const noexcept;

private:
  const DependencyNavigator &graph_navigator_;
  const DependencyNavigator &tree_navigator_;
};
