#include "dependency_navigator.hpp"
#include <algorithm>
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include "graph_error.hpp"

using DN = DependencyNavigator;

namespace {

DepthType next_depth(DepthType depth) noexcept { return depth < 0 ? depth : depth - 1; }

std::size_t tree_depth(DependencySequence &nodes) {
  std::size_t depth = 0;
  for (auto &node : nodes) {
    std::size_t below = 0;
    node.visit_dependencies([&below](DependencySequence &deps) { below = tree_depth(deps); });
    depth = std::max(depth, below + 1);
  }
  return depth;
}

void add_issues(DependencySequence &nodes, ProjectIssues &issues) {
  for (auto &node : nodes) {
    if (!node.issues().empty()) issues[node.id()].insert(node.issues().begin(), node.issues().end());
    node.visit_dependencies([&issues](DependencySequence &deps) { add_issues(deps, issues); });
  }
}

}

std::set<Identifier> DN::collect_dependencies(const ScopeDependencies &scope_dependencies) {
  std::set<Identifier> result;
  for (const auto &[_, ids] : scope_dependencies) result.insert(ids.begin(), ids.end());
  return result;
}

void DN::collect_dependencies(DependencySequence &nodes, DepthType max_depth, const DependencyMatcher &matcher,
  std::set<Identifier> &ids) {
  if (max_depth == 0) return;
  for (auto &node : nodes) {
    if (matcher(node)) ids.insert(node.id());
    node.visit_dependencies([&](DependencySequence &deps) {
      collect_dependencies(deps, next_depth(max_depth), matcher, ids);
    });
  }
}

ScopeDependencies DN::scope_dependencies(const Project &project, DepthType max_depth,
  const DependencyMatcher &matcher) const {
  ScopeDependencies result;
  for (const auto &scope : scope_names(project)) {
    auto &ids = result[scope];
    auto direct = direct_dependencies(project, scope);
    collect_dependencies(direct, max_depth, matcher, ids);
  }
  return result;
}

std::set<Identifier> DN::package_dependencies(const Project &project, const Identifier &package_id,
  DepthType max_depth, const DependencyMatcher &matcher) const {
  std::set<Identifier> result;
  std::function<void(DependencySequence &)> traverse = [&](DependencySequence &nodes) {
    for (auto &node : nodes) {
      if (node.id() == package_id)
        node.visit_dependencies([&](DependencySequence &deps) { collect_dependencies(deps, max_depth, matcher, result); });
      node.visit_dependencies(traverse);
    }
  };
  for (const auto &scope : scope_names(project)) {
    auto direct = direct_dependencies(project, scope);
    traverse(direct);
  }
  return result;
}

std::set<Identifier> DN::project_dependencies(const Project &project, DepthType max_depth,
  const DependencyMatcher &matcher) const {
  return collect_dependencies(scope_dependencies(project, max_depth, matcher));
}

ShortestPaths DN::get_shortest_paths(const Project &project) const {
  ShortestPaths result;
  auto all_dependencies = scope_dependencies(project);
  for (auto &[scope, ids] : all_dependencies)
    result.emplace(scope, shortest_paths_for_scope(direct_dependencies(project, scope), std::move(ids)));
  return result;
}

ScopePaths DN::shortest_paths_for_scope(DependencySequence direct, std::set<Identifier> pending) const {
  struct QueueItem {
    std::unique_ptr<DependencyNode> node;
    DependencyPath parents;
  };

  ScopePaths result;
  std::deque<QueueItem> queue;
  for (auto &node : direct) queue.push_back({node.stable_reference(), {}});

  while (!queue.empty()) {
    auto item = std::move(queue.front());
    queue.pop_front();
    const auto &id = item.node->id();
    if (auto it = pending.find(id); it != pending.end()) {
      result.emplace(id, item.parents);
      pending.erase(it);
    }
    auto parents = std::move(item.parents);
    parents.push_back(id);
    item.node->visit_dependencies([&](DependencySequence &deps) {
      for (auto &dep : deps) queue.push_back({dep.stable_reference(), parents});
    });
  }

  if (!pending.empty()) {
    std::string missing;
    for (const auto &id : pending) missing.append(missing.empty() ? "" : ", ").append(id.to_coordinates());
    throw GraphError{GraphErrorCode::kInconsistentShortestPaths,
      "Could not find the shortest path for these dependencies: " + missing};
  }
  return result;
}

std::set<Identifier> DN::collect_sub_projects(const Project &project) const {
  return collect_dependencies(scope_dependencies(project, kUnlimitedDepth, kMatchSubProjects));
}

std::size_t DN::dependency_tree_depth(const Project &project, std::string_view scope_name) const {
  auto direct = direct_dependencies(project, scope_name);
  return tree_depth(direct);
}

ProjectIssues DN::project_issues(const Project &project) const {
  ProjectIssues result;
  for (const auto &scope : scope_names(project)) {
    auto direct = direct_dependencies(project, scope);
    add_issues(direct, result);
  }
  return result;
}
