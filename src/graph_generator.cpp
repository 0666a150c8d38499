#include "graph_generator.hpp"
#include <algorithm>
#include <string>
#include <vector>

AnalyzerResult GraphGenerator::generate() {
  auto layers = std::max<std::size_t>(options_.layers, 1);
  auto package_count = std::max(options_.packages, layers);
  auto fragments = std::max<std::size_t>(options_.fragments, 1);

  std::vector<Identifier> packages;
  for (std::size_t i = 0; i < package_count; ++i)
    packages.push_back({options_.manager, "org.example", "pkg-" + std::to_string(i), "1." + std::to_string(i % 7)});
  DependencyGraph graph{std::move(packages)};

  // references_by_layer[l] lists the references of packages in layer l; package i lives in layer i % layers.
  std::vector<std::vector<ReferenceId>> references_by_layer(layers);
  for (PackageIndex pkg = 0; pkg < package_count; ++pkg) {
    auto fragment_count = 1 + random(fragments);
    for (Fragment fragment = 0; fragment < fragment_count; ++fragment) {
      auto linkage = chance(options_.project_ratio)
        ? (chance(0.5) ? PackageLinkage::kProjectDynamic : PackageLinkage::kProjectStatic)
        : (chance(0.5) ? PackageLinkage::kDynamic : PackageLinkage::kStatic);
      std::vector<Issue> issues;
      if (chance(options_.issue_ratio))
        issues.push_back({"Generator", "Issue in fragment " + std::to_string(fragment), Severity::kWarning});
      references_by_layer[pkg % layers].push_back(graph.add_reference(pkg, fragment, linkage, std::move(issues)));
    }
  }

  for (std::size_t layer = 0; layer + 1 < layers; ++layer)
    for (auto ref : references_by_layer[layer]) {
      std::vector<ReferenceId> children;
      auto child_count = random(options_.fanout + 1);
      for (std::size_t i = 0; i < child_count; ++i) {
        const auto &candidates = references_by_layer[layer + 1 + random(layers - layer - 1)];
        auto child = candidates[random(candidates.size())];
        if (std::ranges::find(children, child) != children.end()) continue;
        children.push_back(child);
        graph.add_dependency(ref, child);
      }
    }

  AnalyzerResult result;
  for (std::size_t p = 0; p < options_.projects; ++p) {
    auto &project = result.projects.emplace_back();
    project.id = {options_.manager, "org.example", "project-" + std::to_string(p), "1.0"};
    for (std::size_t s = 0; s < options_.scopes; ++s) {
      auto scope_name = "scope-" + std::to_string(s);
      project.scope_names.insert(scope_name);
      auto qualified_scope = DependencyGraph::qualify_scope(project.id, scope_name);
      auto root_count = random(options_.fanout + 1);
      std::vector<ReferenceId> roots;
      for (std::size_t i = 0; i < root_count; ++i) {
        const auto &candidates = references_by_layer[random(std::min<std::size_t>(layers, 2))];
        auto root = candidates[random(candidates.size())];
        if (std::ranges::find(roots, root) != roots.end()) continue;
        roots.push_back(root);
        graph.add_scope_root(qualified_scope, root);
      }
    }
  }
  result.dependency_graphs.emplace(options_.manager, std::move(graph));
  return result;
}
