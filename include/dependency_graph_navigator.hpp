#pragma once
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include "config.hpp"
#include "dependency_graph.hpp"
#include "dependency_navigator.hpp"
#include "reference_index.hpp"

/**
 * A DependencyNavigator backed by the shared DependencyGraphs of an analyzer result, one graph per package manager.
 * The navigator borrows the graphs; they must outlive it. The reference index of each graph is built on first use.
 *
 * Nodes produced by this navigator are cursors: all elements of one sequence are the same object, repositioned on
 * every step.
 */
class DependencyGraphNavigator : public DependencyNavigator {
public:
  using GraphMap = std::map<std::string, DependencyGraph, std::less<>>;

  explicit DependencyGraphNavigator(const GraphMap &graphs);

  std::set<std::string> scope_names(const Project &project) const override;
  DependencySequence direct_dependencies(const Project &project, std::string_view scope_name) const override;

  // Throws GraphError if there is no graph or only an empty graph for the manager.
  const DependencyGraph &graph_for_manager(std::string_view manager) const;
  const ReferenceIndex &reference_index(std::string_view manager) const;
  bool is_index_built(std::string_view manager) const noexcept;

private:
  std::map<std::string, LazyReferenceIndex, std::less<>> indexes_;

  const LazyReferenceIndex &index_for_manager(std::string_view manager) const;
};
