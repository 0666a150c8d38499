#include "dependency_node.hpp"
#include <utility>

auto DependencySequence::Iterator::operator++() -> Iterator & {
  node_ = source_ ? source_->next() : nullptr;
  return *this;
}

DependencySequence::DependencySequence(std::unique_ptr<Source> source) noexcept
  : owned_{std::move(source)}, source_{owned_.get()} {}

DependencySequence::DependencySequence(DependencySequence &&other) noexcept
  : owned_{std::move(other.owned_)}, source_{std::exchange(other.source_, nullptr)} {}

DependencySequence &DependencySequence::operator=(DependencySequence &&other) noexcept {
  if (this == &other) return *this;
  owned_ = std::move(other.owned_);
  source_ = std::exchange(other.source_, nullptr);
  return *this;
}

auto DependencySequence::begin() -> Iterator {
  if (!source_) return {};
  return {source_, source_->next()};
}

std::vector<std::unique_ptr<DependencyNode>> DependencySequence::to_stable_nodes() {
  std::vector<std::unique_ptr<DependencyNode>> result;
  for (auto &node : *this) result.emplace_back(node.stable_reference());
  return result;
}

std::vector<Identifier> DependencySequence::ids() {
  std::vector<Identifier> result;
  for (auto &node : *this) result.emplace_back(node.id());
  return result;
}

DependencyMatcher match_linkage(std::set<PackageLinkage> linkages) {
  return [linkages = std::move(linkages)](const DependencyNode &node) { return linkages.contains(node.linkage()); };
}
