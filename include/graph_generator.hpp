#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include "analyzer_result.hpp"
#include "config.hpp"

struct GeneratorOptions {
  std::string manager = "Gen";
  std::size_t projects = 2;
  std::size_t packages = kDefaultGeneratedPackages;
  std::size_t scopes = kDefaultGeneratedScopes;
  std::size_t fanout = kDefaultGeneratedFanout;
  std::size_t fragments = kDefaultGeneratedFragments;
  std::size_t layers = kDefaultGeneratedLayers;
  double project_ratio = 0.1;
  double issue_ratio = 0.05;
};

/**
 * Generates analyzer results whose projects share one DependencyGraph. Packages are spread over layers and only
 * depend on packages of deeper layers, so the graph is acyclic; packages get several fragments with different
 * dependencies, and references are shared between parents, which produces diamonds.
 */
class GraphGenerator {
public:
  GraphGenerator(GeneratorOptions options, std::uint32_t seed) : options_{std::move(options)}, gen_{seed} {}

  const GeneratorOptions &options() const noexcept { return options_; }

  AnalyzerResult generate();

private:
  GeneratorOptions options_;
  std::mt19937 gen_;

  std::size_t random(std::size_t bound) { return std::uniform_int_distribution<std::size_t>{0, bound - 1}(gen_); }
  bool chance(double ratio) { return std::bernoulli_distribution{ratio}(gen_); }
};
