#pragma once
#include <map>
#include <set>
#include <vector>
#include <nlohmann/json.hpp>
#include "dependency_graph.hpp"
#include "dependency_navigator.hpp"
#include "identifier.hpp"
#include "project.hpp"
#include "types.hpp"

using json = nlohmann::ordered_json;

inline void to_json(json &j, const Identifier &id) { j = id.to_coordinates(); }

inline void to_json(json &j, const Issue &issue) {
  j["source"] = issue.source;
  j["message"] = issue.message;
  j["severity"] = to_string(issue.severity);
}

inline void to_json(json &j, const PackageReference &ref) {
  j["id"] = ref.id;
  j["linkage"] = to_string(ref.linkage);
  if (!ref.issues.empty()) j["issues"] = ref.issues;
  if (!ref.dependencies.empty()) j["dependencies"] = ref.dependencies;
}

inline void to_json(json &j, const Scope &scope) {
  j["name"] = scope.name;
  j["dependencies"] = scope.dependencies;
}

inline void to_json(json &j, const Project &project) {
  j["id"] = project.id;
  j["scope_names"] = project.scope_names;
  if (project.scopes) j["scopes"] = *project.scopes;
}

// Same layout as read by AnalyzerResultLoader: nodes in arena order, edges from the children of every node.
inline void to_json(json &j, const DependencyGraph &graph) {
  j["packages"] = graph.packages();
  auto &scopes = j["scopes"] = json::object();
  for (const auto &[name, roots] : graph.scopes()) {
    auto &raw_roots = scopes[name] = json::array();
    for (auto root : roots) raw_roots.push_back({{"root", root.root}, {"fragment", root.fragment}});
  }
  auto &nodes = j["nodes"] = json::array();
  auto &edges = j["edges"] = json::array();
  for (ReferenceId ref = 0; ref < graph.reference_count(); ++ref) {
    const auto &dref = graph.reference(ref);
    auto &node = nodes.emplace_back();
    node["pkg"] = dref.pkg;
    node["fragment"] = dref.fragment;
    node["linkage"] = to_string(dref.linkage);
    if (!dref.issues.empty()) node["issues"] = dref.issues;
    for (auto dep : dref.dependencies) edges.push_back({{"from", ref}, {"to", dep}});
  }
}

template <class T>
json identifier_map_to_json(const std::map<Identifier, T> &map) {
  auto j = json::object();
  for (const auto &[id, value] : map) j[id.to_coordinates()] = value;
  return j;
}

inline json scope_dependencies_to_json(const ScopeDependencies &scope_dependencies) {
  auto j = json::object();
  for (const auto &[scope, ids] : scope_dependencies) j[scope] = ids;
  return j;
}

inline json shortest_paths_to_json(const ShortestPaths &paths) {
  auto j = json::object();
  for (const auto &[scope, scope_paths] : paths) j[scope] = identifier_map_to_json(scope_paths);
  return j;
}

inline json project_issues_to_json(const ProjectIssues &issues) { return identifier_map_to_json(issues); }
