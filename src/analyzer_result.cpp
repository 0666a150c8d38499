#include "analyzer_result.hpp"
#include <algorithm>

const Project *AnalyzerResult::find_project(const Identifier &id) const noexcept {
  auto it = std::ranges::find(projects, id, &Project::id);
  return it != projects.end() ? &*it : nullptr;
}
