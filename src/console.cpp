#include <exception>
#include <iostream>
#include <string>
#include <CLI/CLI11.hpp>
#include <nlohmann/json.hpp>
#include "analyzer_result.hpp"
#include "compatibility_navigator.hpp"
#include "dependency_graph_navigator.hpp"
#include "dependency_tree_navigator.hpp"
#include "graph_error.hpp"
#include "result_loader.hpp"
#include "result_model.hpp"
#include "util.hpp"

struct Option {
  std::string input_file;
  std::string project;
  std::string query;
  std::string scope;
  std::string package;
  DepthType depth = kUnlimitedDepth;
  bool sub_projects_only = false;
  bool verbose = false;
};

json run_query(const DependencyNavigator &navigator, const Project &project, const Option &opt) {
  const auto &matcher = opt.sub_projects_only ? kMatchSubProjects : kMatchAll;
  if (opt.query == "scopes") return navigator.scope_names(project);
  if (opt.query == "direct") return navigator.direct_dependencies(project, opt.scope).ids();
  if (opt.query == "dependencies")
    return scope_dependencies_to_json(navigator.scope_dependencies(project, opt.depth, matcher));
  if (opt.query == "package")
    return navigator.package_dependencies(project, Identifier::from_coordinates(opt.package), opt.depth, matcher);
  if (opt.query == "paths") return shortest_paths_to_json(navigator.get_shortest_paths(project));
  if (opt.query == "subprojects") return navigator.collect_sub_projects(project);
  if (opt.query == "issues") return project_issues_to_json(navigator.project_issues(project));
  if (opt.query == "depth") return navigator.dependency_tree_depth(project, opt.scope);
  return collect_scopes(navigator, project);
}

int main(int argc, char *argv[]) {
  Option opt;
  CLI::App app{"Query the dependencies of a project in an analyzer result."};
  app.add_option("--input", opt.input_file)->required()->check(CLI::ExistingFile);
  app.add_option("--project", opt.project, "Project coordinates, type:namespace:name:version")->required();
  app.add_option("query", opt.query)
     ->required()
     ->check(CLI::IsMember({"scopes", "direct", "dependencies", "package", "paths", "subprojects", "issues", "depth",
                            "tree"}));
  app.add_option("--scope", opt.scope);
  app.add_option("--package", opt.package, "Package coordinates for the package query");
  app.add_option("--depth", opt.depth)->default_val(kUnlimitedDepth);
  app.add_flag("--sub-projects-only", opt.sub_projects_only);
  app.add_flag("--verbose", opt.verbose);
  CLI11_PARSE(app, argc, argv);

  if ((opt.query == "direct" || opt.query == "depth") && opt.scope.empty()) {
    println(stderr, "The {} query requires --scope.", opt.query);
    return 2;
  }
  if (opt.query == "package" && opt.package.empty()) {
    println(stderr, "The package query requires --package.");
    return 2;
  }

  try {
    AnalyzerResult result;
    AnalyzerResultLoader loader(result);
    if (!loader.load_result_file(opt.input_file, opt.verbose)) return 1;

    const auto *project = result.find_project(Identifier::from_coordinates(opt.project));
    if (!project) {
      println(stderr, "Project {} not found in {}.", opt.project, opt.input_file);
      return 1;
    }

    DependencyTreeNavigator tree_navigator;
    if (result.dependency_graphs.empty()) {
      std::cout << run_query(tree_navigator, *project, opt).dump(2) << std::endl;
      return 0;
    }
    DependencyGraphNavigator graph_navigator(result.dependency_graphs);
    CompatibilityDependencyNavigator navigator(graph_navigator, tree_navigator);
    std::cout << run_query(navigator, *project, opt).dump(2) << std::endl;
  } catch (const GraphError &e) {
    println(stderr, "Error: {}", e.what());
    return 1;
  }
  return 0;
}
