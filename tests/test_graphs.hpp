/**
 * @file test_graphs.hpp
 * @brief Small hand-built dependency graphs shared by the navigator tests.
 */
#pragma once
#include <string>
#include <vector>
#include "dependency_graph.hpp"
#include "dependency_graph_navigator.hpp"
#include "identifier.hpp"
#include "project.hpp"

inline Identifier maven(const std::string &name, const std::string &version = "1") {
  return {"Maven", "org.test", name, version};
}

inline Project graph_project(const std::vector<std::string> &scope_names,
                             const Identifier &id = {"Maven", "org.test", "project", "1.0"}) {
  Project project;
  project.id = id;
  project.scope_names.insert(scope_names.begin(), scope_names.end());
  return project;
}

/**
 * Catalog [A, B, C]; scope "compile" with root A#0; A#0 -> B#0 -> C#0.
 */
inline DependencyGraphNavigator::GraphMap chain_graphs(const Project &project) {
  DependencyGraph graph{{maven("A"), maven("B"), maven("C")}};
  auto a = graph.add_reference(0);
  auto b = graph.add_reference(1);
  auto c = graph.add_reference(2);
  graph.add_dependency(a, b);
  graph.add_dependency(b, c);
  graph.add_scope_root(DependencyGraph::qualify_scope(project.id, "compile"), a);
  DependencyGraphNavigator::GraphMap graphs;
  graphs.emplace("Maven", std::move(graph));
  return graphs;
}

/**
 * Catalog [A, B, C, D, E, F].
 *
 *   compile: roots A#0, B#1
 *     A#0 -> B#0, C#0
 *     B#0 -> D#0
 *     B#1 -> E#0        (second fragment of B with different dependencies)
 *     C#0 -> D#0        (diamond: D#0 is shared by B#0 and C#0)
 *     D#0 -> F#0
 *   test: root C#0      (subtree shared with compile)
 *
 * F#0 carries an issue, E#0 is a sub-project.
 */
inline DependencyGraphNavigator::GraphMap diamond_graphs(const Project &project) {
  DependencyGraph graph{{maven("A"), maven("B"), maven("C"), maven("D"), maven("E"), maven("F")}};
  auto a0 = graph.add_reference(0);
  auto b0 = graph.add_reference(1, 0);
  auto b1 = graph.add_reference(1, 1);
  auto c0 = graph.add_reference(2);
  auto d0 = graph.add_reference(3, 0, PackageLinkage::kStatic);
  auto e0 = graph.add_reference(4, 0, PackageLinkage::kProjectStatic);
  auto f0 = graph.add_reference(5, 0, PackageLinkage::kDynamic, {{"Resolver", "Unresolved license", Severity::kWarning}});
  graph.add_dependency(a0, b0);
  graph.add_dependency(a0, c0);
  graph.add_dependency(b0, d0);
  graph.add_dependency(b1, e0);
  graph.add_dependency(c0, d0);
  graph.add_dependency(d0, f0);
  auto compile = DependencyGraph::qualify_scope(project.id, "compile");
  graph.add_scope_root(compile, a0);
  graph.add_scope_root(compile, b1);
  graph.add_scope_root(DependencyGraph::qualify_scope(project.id, "test"), c0);
  DependencyGraphNavigator::GraphMap graphs;
  graphs.emplace("Maven", std::move(graph));
  return graphs;
}
