#pragma once
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include "config.hpp"
#include "dependency_node.hpp"
#include "identifier.hpp"
#include "project.hpp"

using ScopeDependencies = std::map<std::string, std::set<Identifier>>;
using DependencyPath = std::vector<Identifier>;
using ScopePaths = std::map<Identifier, DependencyPath>;
using ShortestPaths = std::map<std::string, ScopePaths>;
using ProjectIssues = std::map<Identifier, std::set<Issue>>;

/**
 * Navigation through the dependencies of projects, independent of how the dependencies are stored.
 *
 * Implementations only have to provide scope_names() and direct_dependencies(); the queries are defined on top of
 * them. Depth limits count the direct dependencies of a scope as level 1: a max_depth of 0 selects nothing, a
 * negative max_depth does not restrict the traversal. A matcher decides whether a node becomes part of a result; it
 * never stops the traversal from descending into the node's dependencies.
 *
 * Overrides of the query functions must not redeclare the default arguments.
 */
class DependencyNavigator {
public:
  virtual ~DependencyNavigator() = default;

  // Flattens the scopes of a scope_dependencies() result into one set.
  static std::set<Identifier> collect_dependencies(const ScopeDependencies &scope_dependencies);

  virtual std::set<std::string> scope_names(const Project &project) const = 0;

  // The roots of the given scope in declaration order. An unknown scope yields an empty sequence.
  virtual DependencySequence direct_dependencies(const Project &project, std::string_view scope_name) const = 0;

  virtual ScopeDependencies scope_dependencies(const Project &project, DepthType max_depth = kUnlimitedDepth,
                                               const DependencyMatcher &matcher = kMatchAll) const;

  // Dependencies below every occurrence of package_id in any scope of the project. Occurrences of the package with
  // different fragments contribute their own subtrees.
  virtual std::set<Identifier> package_dependencies(const Project &project, const Identifier &package_id,
                                                    DepthType max_depth = kUnlimitedDepth,
                                                    const DependencyMatcher &matcher = kMatchAll) const;

  virtual std::set<Identifier> project_dependencies(const Project &project, DepthType max_depth = kUnlimitedDepth,
                                                    const DependencyMatcher &matcher = kMatchAll) const;

  /**
   * For each scope, maps every dependency of the scope to the identifiers on a shortest path from the scope root to
   * it, excluding the dependency itself. Direct dependencies map to an empty path.
   *
   * Throws GraphError if a dependency of a scope is not reached by the breadth-first search.
   */
  virtual ShortestPaths get_shortest_paths(const Project &project) const;

  virtual std::set<Identifier> collect_sub_projects(const Project &project) const;

  // Number of levels of the dependency tree of a scope, 0 for an empty scope.
  virtual std::size_t dependency_tree_depth(const Project &project, std::string_view scope_name) const;

  virtual ProjectIssues project_issues(const Project &project) const;

protected:
  static void collect_dependencies(DependencySequence &nodes, DepthType max_depth, const DependencyMatcher &matcher,
                                   std::set<Identifier> &ids);

private:
  ScopePaths shortest_paths_for_scope(DependencySequence direct, std::set<Identifier> pending) const;
};
