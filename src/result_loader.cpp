#include "result_loader.hpp"
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <mio/mmap.hpp>
#include "graph_error.hpp"
#include "util.hpp"

using json = nlohmann::json;

namespace {

[[noreturn]] void invalid_input(const std::string &message) { throw GraphError{GraphErrorCode::kInvalidInput, message}; }

PackageLinkage parse_linkage_field(const json &raw) {
  if (!raw.contains("linkage")) return PackageLinkage::kDynamic;
  auto name = raw.at("linkage").get<std::string>();
  if (auto linkage = parse_linkage(name)) return *linkage;
  invalid_input("Unknown package linkage '" + name + "'.");
}

std::vector<Issue> parse_issues(const json &raw) {
  std::vector<Issue> issues;
  if (!raw.contains("issues")) return issues;
  for (const auto &raw_issue : raw.at("issues")) {
    auto &issue = issues.emplace_back();
    issue.source = raw_issue.value("source", "");
    issue.message = raw_issue.at("message").get<std::string>();
    auto severity = raw_issue.value("severity", "ERROR");
    if (auto parsed = parse_severity(severity)) issue.severity = *parsed;
    else invalid_input("Unknown issue severity '" + severity + "'.");
  }
  return issues;
}

PackageReference parse_package_reference(const json &raw) {
  PackageReference ref{
    .id = Identifier::from_coordinates(raw.at("id").get<std::string>()),
    .linkage = parse_linkage_field(raw),
    .issues = parse_issues(raw),
    .dependencies = {}
  };
  if (raw.contains("dependencies"))
    for (const auto &raw_dep : raw.at("dependencies")) ref.dependencies.push_back(parse_package_reference(raw_dep));
  return ref;
}

template <class Index>
Index parse_index(const json &raw, const char *key, std::size_t bound, std::string_view what) {
  auto value = raw.at(key).get<std::int64_t>();
  if (value < 0 || static_cast<std::size_t>(value) >= bound)
    invalid_input(std::string{what} + " " + std::to_string(value) + " is out of range [0, " + std::to_string(bound)
      + ").");
  return static_cast<Index>(value);
}

Fragment parse_fragment(const json &raw) {
  if (!raw.contains("fragment")) return kDefaultFragment;
  auto value = raw.at("fragment").get<std::int64_t>();
  if (value < 0 || value > std::numeric_limits<Fragment>::max())
    invalid_input("Fragment " + std::to_string(value) + " is out of range.");
  return static_cast<Fragment>(value);
}

// Three-colour DFS over the arena; returns a reference on a cycle if there is one.
std::optional<ReferenceId> find_cycle(const DependencyGraph &graph) {
  enum class Mark : std::uint8_t { kWhite, kGrey, kBlack };
  std::vector<Mark> marks(graph.reference_count(), Mark::kWhite);
  std::vector<std::pair<ReferenceId, std::size_t>> stack;
  for (ReferenceId start = 0; start < graph.reference_count(); ++start) {
    if (marks[start] != Mark::kWhite) continue;
    marks[start] = Mark::kGrey;
    stack.emplace_back(start, 0);
    while (!stack.empty()) {
      auto &[ref, next] = stack.back();
      const auto &dependencies = graph.reference(ref).dependencies;
      if (next == dependencies.size()) {
        marks[ref] = Mark::kBlack;
        stack.pop_back();
        continue;
      }
      auto dep = dependencies[next++];
      if (marks[dep] == Mark::kGrey) return dep;
      if (marks[dep] == Mark::kWhite) {
        marks[dep] = Mark::kGrey;
        stack.emplace_back(dep, 0);
      }
    }
  }
  return std::nullopt;
}

}

void AnalyzerResultLoader::load_project(const json &raw_project) const {
  Project project;
  project.id = Identifier::from_coordinates(raw_project.at("id").get<std::string>());
  if (raw_project.contains("scope_names"))
    for (const auto &name : raw_project.at("scope_names")) project.scope_names.insert(name.get<std::string>());
  if (raw_project.contains("scopes")) {
    auto &scopes = project.scopes.emplace();
    for (const auto &raw_scope : raw_project.at("scopes")) {
      auto &scope = scopes.emplace_back();
      scope.name = raw_scope.at("name").get<std::string>();
      if (raw_scope.contains("dependencies"))
        for (const auto &raw_dep : raw_scope.at("dependencies"))
          scope.dependencies.push_back(parse_package_reference(raw_dep));
      project.scope_names.insert(scope.name);
    }
  }
  result_.projects.push_back(std::move(project));
}

void AnalyzerResultLoader::load_graph(const std::string &manager, const json &raw_graph) const {
  if (result_.dependency_graphs.contains(manager))
    invalid_input("Duplicate dependency graph for package manager '" + manager + "'.");

  std::vector<Identifier> packages;
  for (const auto &coordinates : raw_graph.at("packages"))
    packages.push_back(Identifier::from_coordinates(coordinates.get<std::string>()));
  DependencyGraph graph{std::move(packages)};

  const auto &raw_nodes = raw_graph.value("nodes", json::array());
  for (const auto &raw_node : raw_nodes)
    graph.add_reference(parse_index<PackageIndex>(raw_node, "pkg", graph.package_count(), "Package index"),
                        parse_fragment(raw_node), parse_linkage_field(raw_node),
                        parse_issues(raw_node));

  std::vector<bool> has_parent(graph.reference_count());
  for (const auto &raw_edge : raw_graph.value("edges", json::array())) {
    auto from = parse_index<ReferenceId>(raw_edge, "from", graph.reference_count(), "Edge source");
    auto to = parse_index<ReferenceId>(raw_edge, "to", graph.reference_count(), "Edge target");
    graph.add_dependency(from, to);
    has_parent[to] = true;
  }
  if (auto ref = find_cycle(graph)) invalid_input("Dependency cycle through reference " + std::to_string(*ref) + ".");
  for (ReferenceId ref = 0; ref < graph.reference_count(); ++ref)
    if (!has_parent[ref]) graph.add_root(ref);

  if (raw_graph.contains("scopes"))
    for (const auto &[qualified_scope, raw_roots] : raw_graph.at("scopes").items())
      for (const auto &raw_root : raw_roots)
        graph.add_scope(qualified_scope, {
          .root = parse_index<PackageIndex>(raw_root, "root", graph.package_count(), "Scope root"),
          .fragment = parse_fragment(raw_root)
        });

  result_.dependency_graphs.emplace(manager, std::move(graph));
}

void AnalyzerResultLoader::load_result(const json &document) const {
  try {
    if (document.contains("projects"))
      for (const auto &raw_project : document.at("projects")) load_project(raw_project);
    if (document.contains("dependency_graphs"))
      for (const auto &[manager, raw_graph] : document.at("dependency_graphs").items()) load_graph(manager, raw_graph);
  } catch (const json::exception &e) {
    invalid_input(std::string{"Malformed analyzer result: "} + e.what());
  }
}

bool AnalyzerResultLoader::load_result(std::string_view raw_result, bool verbose) const {
  auto document = json::parse(raw_result.begin(), raw_result.end(), nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    if (verbose) println(stderr, "Failed to parse analyzer result.");
    return false;
  }
  load_result(document);
  return true;
}

bool AnalyzerResultLoader::load_result_file(const std::filesystem::path &path, bool verbose) const {
  std::error_code error;
  auto file_size = std::filesystem::file_size(path, error);
  if (error || file_size == 0) {
    if (verbose) println(stderr, "Failed to open analyzer result file: {}.", path.string());
    return false;
  }
  mio::mmap_source mmap;
  mmap.map(path.string(), error);
  if (error) {
    if (verbose) println(stderr, "Failed to map analyzer result file: {} ({}).", path.string(), error.message());
    return false;
  }

  std::size_t project_count = result_.projects.size(), graph_count = result_.dependency_graphs.size();
  std::chrono::time_point<std::chrono::high_resolution_clock> start;
  if (verbose) {
    print("Loading analyzer result from file: {}... ", path.string());
    start = std::chrono::high_resolution_clock::now();
  }
  if (!load_result(std::string_view{mmap.data(), mmap.size()}, verbose)) return false;
  if (verbose) {
    auto end = std::chrono::high_resolution_clock::now();
    auto time = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    println("Done. ({} ms)", time.count());
    std::size_t package_count = 0, reference_count = 0;
    for (const auto &[_, graph] : result_.dependency_graphs) {
      package_count += graph.package_count();
      reference_count += graph.reference_count();
    }
    println("Loaded {} projects, {} dependency graphs. Total {} packages, {} references.",
            result_.projects.size() - project_count, result_.dependency_graphs.size() - graph_count,
            package_count, reference_count);
  }
  return true;
}
