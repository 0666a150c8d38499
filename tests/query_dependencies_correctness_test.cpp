#include <algorithm>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <CLI/CLI11.hpp>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "dependency_graph_navigator.hpp"
#include "dependency_tree_navigator.hpp"
#include "graph_error.hpp"
#include "graph_generator.hpp"
#include "result_model.hpp"
#include "util.hpp"

constexpr std::size_t kQueriedPackages = 5;

struct Option {
  std::size_t trials;
  std::size_t max_depth;
  std::uint32_t seed;
  std::size_t packages;
  std::size_t fragments;
  std::string output_file;
};

// Returns the name of the first query whose results differ, or an empty string.
std::string compare_navigators(const DependencyNavigator &baseline, const Project &baseline_project,
                               const DependencyNavigator &test, const Project &test_project,
                               const std::vector<Identifier> &packages, std::size_t max_depth) {
  if (baseline.scope_names(baseline_project) != test.scope_names(test_project)) return "scope_names";
  for (const auto &scope : test.scope_names(test_project)) {
    if (baseline.direct_dependencies(baseline_project, scope).ids() != test.direct_dependencies(test_project, scope).ids())
      return "direct_dependencies(" + scope + ")";
    if (baseline.dependency_tree_depth(baseline_project, scope) != test.dependency_tree_depth(test_project, scope))
      return "dependency_tree_depth(" + scope + ")";
  }
  for (DepthType depth = 0; depth <= static_cast<DepthType>(max_depth); ++depth) {
    if (baseline.scope_dependencies(baseline_project, depth) != test.scope_dependencies(test_project, depth))
      return "scope_dependencies(depth=" + std::to_string(depth) + ")";
    for (const auto &id : packages)
      if (baseline.package_dependencies(baseline_project, id, depth) != test.package_dependencies(test_project, id, depth))
        return "package_dependencies(" + id.to_coordinates() + ", depth=" + std::to_string(depth) + ")";
  }
  if (baseline.scope_dependencies(baseline_project) != test.scope_dependencies(test_project))
    return "scope_dependencies(unlimited)";
  if (baseline.get_shortest_paths(baseline_project) != test.get_shortest_paths(test_project))
    return "get_shortest_paths";
  if (baseline.collect_sub_projects(baseline_project) != test.collect_sub_projects(test_project))
    return "collect_sub_projects";
  if (baseline.project_issues(baseline_project) != test.project_issues(test_project)) return "project_issues";
  return {};
}

// Minimum edge count from the roots of a scope to each package, computed on the reference arena directly.
std::map<Identifier, std::size_t> arena_distances(const DependencyGraph &graph, const std::string &qualified_scope) {
  std::map<Identifier, std::size_t> distances;
  std::deque<std::pair<ReferenceId, std::size_t>> queue;
  for (auto root : graph.scope(qualified_scope))
    for (ReferenceId ref = 0; ref < graph.reference_count(); ++ref)
      if (graph.reference(ref).pkg == root.root && graph.reference(ref).fragment == root.fragment)
        queue.emplace_back(ref, 0);
  while (!queue.empty()) {
    auto [ref, distance] = queue.front();
    queue.pop_front();
    if (!distances.try_emplace(graph.package(graph.reference(ref).pkg), distance).second) continue;
    for (auto dep : graph.reference(ref).dependencies) queue.emplace_back(dep, distance + 1);
  }
  return distances;
}

// Checks scope_dependencies and get_shortest_paths against the arena. Returns the failing query or an empty string.
std::string compare_with_arena(const DependencyNavigator &navigator, const Project &project,
                               const DependencyGraph &graph, std::size_t max_depth) {
  auto paths = navigator.get_shortest_paths(project);
  for (const auto &scope : navigator.scope_names(project)) {
    auto distances = arena_distances(graph, DependencyGraph::qualify_scope(project.id, scope));
    for (DepthType depth = 0; depth <= static_cast<DepthType>(max_depth); ++depth) {
      std::set<Identifier> expected;
      for (const auto &[id, distance] : distances)
        if (distance < static_cast<std::size_t>(depth)) expected.insert(id);
      if (navigator.scope_dependencies(project, depth).at(scope) != expected)
        return "arena scope_dependencies(" + scope + ", depth=" + std::to_string(depth) + ")";
    }
    std::set<Identifier> all;
    for (const auto &[id, _] : distances) all.insert(id);
    if (navigator.scope_dependencies(project).at(scope) != all) return "arena scope_dependencies(" + scope + ")";

    const auto &scope_paths = paths.at(scope);
    if (scope_paths.size() != distances.size()) return "arena get_shortest_paths(" + scope + ")";
    for (const auto &[id, distance] : distances) {
      auto it = scope_paths.find(id);
      if (it == scope_paths.end() || it->second.size() != distance)
        return "arena get_shortest_paths(" + scope + ", " + id.to_coordinates() + ")";
    }
  }
  return {};
}

int main(int argc, char *argv[]) {
  Option opt;
  CLI::App app;
  app.add_option("--trials", opt.trials)->default_val(kDefaultTrials)->check(CLI::PositiveNumber);
  app.add_option("--max-depth", opt.max_depth)->default_val(kDefaultMaxDepth)->check(CLI::PositiveNumber);
  app.add_option("--seed", opt.seed)->default_val(std::random_device{}());
  app.add_option("--packages", opt.packages)->default_val(kDefaultGeneratedPackages)->check(CLI::PositiveNumber);
  app.add_option("--fragments", opt.fragments)->default_val(kDefaultGeneratedFragments)->check(CLI::PositiveNumber);
  app.add_option("--output", opt.output_file)
     ->default_val("../results/query_dependencies_correctness_test_result.json");
  CLI11_PARSE(app, argc, argv);

  println("=== Query Dependencies Correctness Test ===");
  println("Testing {} generated graphs with max_depth={}, seed={}...", opt.trials, opt.max_depth, opt.seed);
  json result;
  result["title"] = "Query Dependencies Correctness Test";
  result["time"] = now_iso8601();
  result["seed"] = opt.seed;
  result["trials"] = opt.trials;
  result["max_depth"] = opt.max_depth;
  result["total_test_count"] = 0;
  result["passed_test_count"] = 0;
  result["failed_test_count"] = 0;
  result["failed_tests"] = json::array();

  GeneratorOptions gen_options;
  gen_options.packages = opt.packages;
  gen_options.fragments = opt.fragments;
  gen_options.layers = opt.max_depth;
  GraphGenerator generator(gen_options, opt.seed);
  std::mt19937 gen(opt.seed);

  std::size_t passed_cnt = 0, tested_cnt = 0;
  for (std::size_t trial = 0; trial < opt.trials; ++trial) {
    auto analyzer_result = generator.generate();
    const auto &graph = analyzer_result.dependency_graphs.at(gen_options.manager);
    DependencyGraphNavigator graph_navigator(analyzer_result.dependency_graphs);
    DependencyTreeNavigator tree_navigator;
    std::vector<Identifier> to_query;
    std::ranges::sample(graph.packages(), std::back_inserter(to_query), kQueriedPackages, gen);

    for (const auto &project : analyzer_result.projects) {
      ++tested_cnt;
      std::string reason;
      try {
        auto tree_project = project;
        tree_project.scopes = collect_scopes(graph_navigator, project);
        reason = compare_navigators(tree_navigator, tree_project, graph_navigator, project, to_query,
                                    opt.max_depth);
        if (reason.empty()) reason = compare_with_arena(graph_navigator, project, graph, opt.max_depth);
      } catch (const GraphError &e) {
        reason = std::string{"GraphError: "} + e.what();
      }

      if (reason.empty()) {
        passed_cnt++;
      } else {
        auto &failure = result["failed_tests"].emplace_back();
        failure["trial"] = trial;
        failure["project"] = project.id;
        failure["reason"] = reason;
        failure["graph"] = graph;
        println("Test failed for project: {}, trial={}: {}.", project.id.to_coordinates(), trial, reason);
      }
      if (tested_cnt % 50 == 0)
        println("Progress: {} tests completed. Passed: {}, Failed: {}.", tested_cnt, passed_cnt, tested_cnt - passed_cnt);
    }
  }

  result["total_test_count"] = tested_cnt;
  result["passed_test_count"] = passed_cnt;
  result["failed_test_count"] = tested_cnt - passed_cnt;
  println("All tests completed. Total: {}, Passed: {}, Failed: {}.", tested_cnt, passed_cnt, tested_cnt - passed_cnt);
  println("===========================================");

  auto output_dir = std::filesystem::path(opt.output_file).parent_path();
  if (!output_dir.empty()) std::filesystem::create_directories(output_dir);
  std::ofstream(opt.output_file) << result.dump(2);
  return tested_cnt - passed_cnt > 0;
}
