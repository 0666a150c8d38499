#pragma once
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "config.hpp"
#include "dependency_graph.hpp"

/**
 * Lookup of the references of a DependencyGraph by catalog index and fragment. The index lists every reference
 * reachable from the scope roots of the graph in the bucket of its catalog index; a bucket holds one entry per
 * fragment of the package that occurs in the graph.
 */
class ReferenceIndex {
public:
  ReferenceIndex(const DependencyGraph &graph, std::string manager);

  const std::string &manager() const noexcept { return manager_; }
  std::size_t size() const noexcept { return buckets_.size(); }
  std::size_t indexed_count() const noexcept { return indexed_count_; }

  const std::vector<ReferenceId> &references(PackageIndex pkg) const noexcept;
  std::optional<ReferenceId> find(PackageIndex pkg, Fragment fragment) const noexcept;

  // Throws GraphError if the graph contains no reachable reference for pkg and fragment.
  ReferenceId resolve(PackageIndex pkg, Fragment fragment) const;
  ReferenceId resolve(RootDependencyIndex root) const { return resolve(root.root, root.fragment); }

private:
  const DependencyGraph &graph_;
  std::string manager_;
  std::vector<std::vector<ReferenceId>> buckets_;
  std::size_t indexed_count_ = 0;
};

// Builds the ReferenceIndex of a graph on first access. Concurrent first accesses build the index exactly once.
class LazyReferenceIndex {
public:
  LazyReferenceIndex(const DependencyGraph &graph, std::string manager) noexcept
    : graph_{graph}, manager_{std::move(manager)} {}
  LazyReferenceIndex(const LazyReferenceIndex &) = delete;
  LazyReferenceIndex &operator=(const LazyReferenceIndex &) = delete;

  const DependencyGraph &graph() const noexcept { return graph_; }
  const ReferenceIndex &get() const;
  bool is_built() const noexcept { return built_.load(std::memory_order_acquire); }

private:
  const DependencyGraph &graph_;
  std::string manager_;
  mutable std::once_flag once_;
  mutable std::optional<ReferenceIndex> index_;
  mutable std::atomic<bool> built_{false};
};
