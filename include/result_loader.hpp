#pragma once
#include <filesystem>
#include <string_view>
#include <nlohmann/json.hpp>
#include "analyzer_result.hpp"

class AnalyzerResultLoader {
public:
  AnalyzerResultLoader(AnalyzerResult &result) : result_(result) {}
  ~AnalyzerResultLoader() = default;

  // Throws GraphError if the document does not describe a consistent result.
  void load_result(const nlohmann::json &document) const;
  bool load_result(std::string_view raw_result, bool verbose = false) const;

  bool load_result_file(const std::filesystem::path &path, bool verbose = false) const;

private:
  AnalyzerResult &result_;

  void load_project(const nlohmann::json &raw_project) const;
  void load_graph(const std::string &manager, const nlohmann::json &raw_graph) const;
};
