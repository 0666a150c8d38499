#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <numeric>
#include <random>
#include <string>
#include <vector>
#include <CLI/CLI11.hpp>
#include <nlohmann/json.hpp>
#include "dependency_graph_navigator.hpp"
#include "graph_generator.hpp"
#include "result_loader.hpp"
#include "result_model.hpp"
#include "util.hpp"

double analyze_times(json &result, std::vector<std::size_t> &times) {
  auto trials = times.size();
  std::ranges::sort(times);
  auto total_time = std::accumulate(times.begin(), times.end(), 0ull);
  result["avg"] = std::format("{:.3f} ms", total_time / trials / 1000.0);
  result["min"] = std::format("{:.3f} ms", times.front() / 1000.0);
  result["max"] = std::format("{:.3f} ms", times.back() / 1000.0);
  result["p50"] = std::format("{:.3f} ms", percentile(times, 500) / 1000.0);
  result["p90"] = std::format("{:.3f} ms", percentile(times, 900) / 1000.0);
  result["p99"] = std::format("{:.3f} ms", percentile(times, 990) / 1000.0);
  return total_time / trials / 1000.0;
}

struct Option {
  std::string input_file;
  std::size_t trials;
  std::size_t max_depth;
  std::size_t packages;
  std::size_t fanout;
  std::size_t fragments;
  std::uint32_t seed;
  std::string output_file;
};

int main(int argc, char *argv[]) {
  Option opt;
  CLI::App app;
  app.add_option("--input", opt.input_file, "Analyzer result to benchmark instead of a generated graph")
     ->check(CLI::ExistingFile);
  app.add_option("--trials", opt.trials)->default_val(kDefaultTrials)->check(CLI::PositiveNumber);
  app.add_option("--max-depth", opt.max_depth)->default_val(kDefaultMaxDepth)->check(CLI::PositiveNumber);
  app.add_option("--packages", opt.packages)->default_val(2000)->check(CLI::PositiveNumber);
  app.add_option("--fanout", opt.fanout)->default_val(kDefaultGeneratedFanout)->check(CLI::PositiveNumber);
  app.add_option("--fragments", opt.fragments)->default_val(kDefaultGeneratedFragments)->check(CLI::PositiveNumber);
  app.add_option("--seed", opt.seed)->default_val(std::random_device{}());
  app.add_option("--output", opt.output_file)->default_val("../results/query_dependencies_benchmark_result.json");
  CLI11_PARSE(app, argc, argv);

  AnalyzerResult analyzer_result;
  if (!opt.input_file.empty()) {
    AnalyzerResultLoader loader(analyzer_result);
    if (!loader.load_result_file(opt.input_file, true)) return 1;
  } else {
    GeneratorOptions gen_options;
    gen_options.packages = opt.packages;
    gen_options.fanout = opt.fanout;
    gen_options.fragments = opt.fragments;
    gen_options.layers = opt.max_depth;
    print("Generating graph with {} packages... ", opt.packages);
    auto [generated, time] = measure_time<std::chrono::milliseconds>([&] {
      return GraphGenerator(gen_options, opt.seed).generate();
    });
    analyzer_result = std::move(generated);
    println("Done. ({:.3f} s)", time.count() / 1000.0);
  }
  if (analyzer_result.projects.empty() || analyzer_result.dependency_graphs.empty()) {
    println("No projects or dependency graphs to benchmark.");
    return 1;
  }

  std::size_t package_count = 0, reference_count = 0, memory_usage = 0;
  for (const auto &[_, graph] : analyzer_result.dependency_graphs) {
    package_count += graph.package_count();
    reference_count += graph.reference_count();
    memory_usage += graph.estimated_memory_usage();
  }
  println("Total {} packages, {} references, estimated {}.", package_count, reference_count,
          format_bytes(memory_usage));

  DependencyGraphNavigator navigator(analyzer_result.dependency_graphs);
  const auto &project = analyzer_result.projects.front();
  print("Building reference index... ");
  auto index_time = measure_time<std::chrono::microseconds>([&] { navigator.reference_index(project.manager_name()); });
  println("Done. ({:.3f} ms)", index_time.count() / 1000.0);

  std::mt19937 gen(opt.seed);
  const auto &packages = navigator.graph_for_manager(project.manager_name()).packages();
  std::uniform_int_distribution<std::size_t> dist(0, packages.size() - 1);

  println("=== Query Dependencies Benchmark ===");
  println("Testing project {} with {} trials, max_depth={}...", project.id.to_coordinates(), opt.trials,
          opt.max_depth);
  json result;
  result["title"] = "Query Dependencies Benchmark";
  result["time"] = now_iso8601();
  result["package_count"] = package_count;
  result["reference_count"] = reference_count;
  result["estimated_memory_usage"] = format_bytes(memory_usage);
  result["index_build_time"] = std::format("{:.3f} ms", index_time.count() / 1000.0);
  result["trials"] = opt.trials;
  result["max_depth"] = opt.max_depth;
  result["scope_dependencies_results"] = json::array();
  result["package_dependencies_results"] = json::array();

  for (std::size_t depth = 1; depth <= opt.max_depth; ++depth) {
    println("Testing depth={}...", depth);
    std::vector<std::size_t> scope_times, package_times;
    for (std::size_t trial = 0; trial < opt.trials; ++trial) {
      auto [_, time] = measure_time<std::chrono::microseconds>([&] {
        return navigator.scope_dependencies(project, static_cast<DepthType>(depth));
      });
      scope_times.emplace_back(time.count());
    }
    auto &scope_result = result["scope_dependencies_results"].emplace_back();
    scope_result["depth"] = depth;
    println("Scope dependencies   completed. Average {:.3f} ms per query.", analyze_times(scope_result, scope_times));

    for (std::size_t trial = 0; trial < opt.trials; ++trial) {
      const auto &package_id = packages[dist(gen)];
      auto [_, time] = measure_time<std::chrono::microseconds>([&] {
        return navigator.package_dependencies(project, package_id, static_cast<DepthType>(depth));
      });
      package_times.emplace_back(time.count());
    }
    auto &package_result = result["package_dependencies_results"].emplace_back();
    package_result["depth"] = depth;
    println("Package dependencies completed. Average {:.3f} ms per query.",
            analyze_times(package_result, package_times));
  }

  std::vector<std::size_t> path_times;
  for (std::size_t trial = 0; trial < opt.trials; ++trial) {
    auto [_, time] = measure_time<std::chrono::microseconds>([&] { return navigator.get_shortest_paths(project); });
    path_times.emplace_back(time.count());
  }
  auto &path_result = result["shortest_paths_result"];
  println("Shortest paths       completed. Average {:.3f} ms per query.", analyze_times(path_result, path_times));
  println("All tests completed.");
  println("====================================");

  auto output_dir = std::filesystem::path(opt.output_file).parent_path();
  if (!output_dir.empty()) std::filesystem::create_directories(output_dir);
  std::ofstream(opt.output_file) << result.dump(2);
  return 0;
}
