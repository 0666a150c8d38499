#pragma once
#include <vector>
#include "dependency_graph_navigator.hpp"
#include "identifier.hpp"
#include "project.hpp"

// The part of an analyzer run this library works on: the projects found and the shared graphs of their managers.
struct AnalyzerResult {
  std::vector<Project> projects;
  DependencyGraphNavigator::GraphMap dependency_graphs;

  const Project *find_project(const Identifier &id) const noexcept;
};
