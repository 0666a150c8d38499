#include "compatibility_navigator.hpp"

using CDN = CompatibilityDependencyNavigator;

std::set<std::string> CDN::scope_names(const Project &project) const {
  return navigator_for(project).scope_names(project);
}

DependencySequence CDN::direct_dependencies(const Project &project, std::string_view scope_name) const {
  return navigator_for(project).direct_dependencies(project, scope_name);
}

const DependencyNavigator &CDN::navigator_for(const Project &project) const noexcept {
  return project.uses_graph() ? graph_navigator_ : tree_navigator_;
}
