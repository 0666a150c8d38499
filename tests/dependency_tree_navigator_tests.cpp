/**
 * @file dependency_tree_navigator_tests.cpp
 * @brief Unit tests for the tree-backed navigator, collect_scopes and the compatibility navigator.
 */
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>
#include "compatibility_navigator.hpp"
#include "dependency_graph_navigator.hpp"
#include "dependency_tree_navigator.hpp"
#include "test_graphs.hpp"

namespace {

PackageReference ref(const char *name, std::vector<PackageReference> dependencies = {},
                     PackageLinkage linkage = PackageLinkage::kDynamic) {
  return {.id = maven(name), .linkage = linkage, .issues = {}, .dependencies = std::move(dependencies)};
}

// The diamond fixture as a tree-shaped project; shared subtrees are duplicated.
Project tree_project() {
  Project project;
  project.id = {"Maven", "org.test", "tree", "1.0"};
  auto f = ref("F");
  f.issues.push_back({"Resolver", "Unresolved license", Severity::kWarning});
  auto d = ref("D", {f}, PackageLinkage::kStatic);
  auto &scopes = project.scopes.emplace();
  scopes.push_back({.name = "compile",
                    .dependencies = {ref("A", {ref("B", {d}), ref("C", {d})}),
                                     ref("B", {ref("E", {}, PackageLinkage::kProjectStatic)})}});
  scopes.push_back({.name = "test", .dependencies = {ref("C", {d})}});
  for (const auto &scope : scopes) project.scope_names.insert(scope.name);
  return project;
}

}

// ============================================================================
// DependencyTreeNavigator
// ============================================================================

TEST(DependencyTreeNavigatorTests, ScopeNames_FromScopes) {
  DependencyTreeNavigator navigator;
  EXPECT_EQ(navigator.scope_names(tree_project()), (std::set<std::string>{"compile", "test"}));
}

TEST(DependencyTreeNavigatorTests, DirectDependencies_UnknownScopeIsEmpty) {
  DependencyTreeNavigator navigator;
  auto project = tree_project();
  EXPECT_TRUE(navigator.direct_dependencies(project, "runtime").ids().empty());
  EXPECT_EQ(navigator.direct_dependencies(project, "compile").ids(), (std::vector<Identifier>{maven("A"), maven("B")}));
}

TEST(DependencyTreeNavigatorTests, Queries_MatchGraphNavigator) {
  DependencyTreeNavigator tree_navigator;
  auto tree = tree_project();
  auto project = graph_project({"compile", "test"});
  auto graphs = diamond_graphs(project);
  DependencyGraphNavigator graph_navigator(graphs);

  EXPECT_EQ(tree_navigator.scope_dependencies(tree), graph_navigator.scope_dependencies(project));
  EXPECT_EQ(tree_navigator.scope_dependencies(tree, 2), graph_navigator.scope_dependencies(project, 2));
  EXPECT_EQ(tree_navigator.get_shortest_paths(tree), graph_navigator.get_shortest_paths(project));
  EXPECT_EQ(tree_navigator.collect_sub_projects(tree), graph_navigator.collect_sub_projects(project));
  EXPECT_EQ(tree_navigator.project_issues(tree), graph_navigator.project_issues(project));
  EXPECT_EQ(tree_navigator.package_dependencies(tree, maven("B")),
            graph_navigator.package_dependencies(project, maven("B")));
}

TEST(DependencyTreeNavigatorTests, StableReference_SurvivesSequence) {
  DependencyTreeNavigator navigator;
  auto project = tree_project();
  std::unique_ptr<DependencyNode> first;
  {
    auto direct = navigator.direct_dependencies(project, "compile");
    auto it = direct.begin();
    first = it->stable_reference();
    ++it;
    EXPECT_EQ(it->id(), maven("B"));
  }
  EXPECT_EQ(first->id(), maven("A"));
}

// ============================================================================
// collect_scopes
// ============================================================================

TEST(CollectScopesTests, GraphNavigator_ExpandsSharedSubtrees) {
  auto project = graph_project({"compile", "test"});
  auto graphs = diamond_graphs(project);
  DependencyGraphNavigator navigator(graphs);

  auto scopes = collect_scopes(navigator, project);
  ASSERT_EQ(scopes.size(), 2u);
  EXPECT_EQ(scopes[0].name, "compile");
  ASSERT_EQ(scopes[0].dependencies.size(), 2u);
  const auto &a = scopes[0].dependencies[0];
  ASSERT_EQ(a.dependencies.size(), 2u);
  EXPECT_EQ(a.dependencies[0].dependencies[0].id, maven("D"));
  EXPECT_EQ(a.dependencies[1].dependencies[0].id, maven("D"));
  EXPECT_EQ(a.dependencies[1].dependencies[0].linkage, PackageLinkage::kStatic);
  EXPECT_EQ(a.dependencies[1].dependencies[0].dependencies[0].issues.size(), 1u);

  Project copy = project;
  copy.scopes = std::move(scopes);
  DependencyTreeNavigator tree_navigator;
  EXPECT_EQ(tree_navigator.get_shortest_paths(copy), navigator.get_shortest_paths(project));
}

// ============================================================================
// CompatibilityDependencyNavigator
// ============================================================================

TEST(CompatibilityNavigatorTests, NavigatorFor_RoutesByModel) {
  auto graph = graph_project({"compile", "test"});
  auto graphs = diamond_graphs(graph);
  DependencyGraphNavigator graph_navigator(graphs);
  DependencyTreeNavigator tree_navigator;
  CompatibilityDependencyNavigator navigator(graph_navigator, tree_navigator);

  auto tree = tree_project();
  EXPECT_EQ(&navigator.navigator_for(graph), &graph_navigator);
  EXPECT_EQ(&navigator.navigator_for(tree), &tree_navigator);
  EXPECT_EQ(navigator.scope_dependencies(graph), navigator.scope_dependencies(tree));
  EXPECT_EQ(navigator.direct_dependencies(tree, "test").ids(), std::vector<Identifier>{maven("C")});
}

TEST(CompatibilityNavigatorTests, NavigatorFor_TreeProjectWithoutScopes) {
  auto graph = graph_project({"compile"});
  auto graphs = chain_graphs(graph);
  DependencyGraphNavigator graph_navigator(graphs);
  DependencyTreeNavigator tree_navigator;
  CompatibilityDependencyNavigator navigator(graph_navigator, tree_navigator);

  Project tree;
  tree.id = {"NPM", "", "empty", "1.0"};
  tree.scopes.emplace();
  EXPECT_FALSE(tree.uses_graph());
  EXPECT_EQ(&navigator.navigator_for(tree), &tree_navigator);
  EXPECT_TRUE(navigator.scope_dependencies(tree).empty());
  EXPECT_TRUE(navigator.direct_dependencies(tree, "dependencies").ids().empty());
  EXPECT_TRUE(navigator.get_shortest_paths(tree).empty());
}
