#pragma once
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <set>
#include <vector>
#include "config.hpp"
#include "identifier.hpp"
#include "types.hpp"

/**
 * A node in the dependency tree of a project scope, independent of how the tree is stored.
 *
 * Nodes handed out by a DependencySequence are views owned by the sequence. A backend may reuse one object for all
 * elements of a sequence, so a node obtained from a sequence must not be kept beyond the step it was obtained in.
 * Call stable_reference() to get a node that can be retained.
 */
class DependencyNode {
public:
  virtual ~DependencyNode() = default;

  virtual const Identifier &id() const = 0;
  virtual PackageLinkage linkage() const = 0;
  virtual const std::vector<Issue> &issues() const = 0;

  // Passes the direct dependencies of this node to block. The sequence is only valid during the call.
  virtual void visit_dependencies(const std::function<void(DependencySequence &)> &block) const = 0;

  virtual std::unique_ptr<DependencyNode> stable_reference() const = 0;
};

/**
 * A single-pass sequence of DependencyNodes. The sequence pulls nodes from a Source; the source either belongs to
 * the sequence or is borrowed from the caller that created the sequence.
 */
class DependencySequence {
public:
  class Source {
  public:
    virtual ~Source() = default;

    // Advances to the next node, returns nullptr when the sequence is exhausted.
    virtual DependencyNode *next() = 0;
  };

  class Iterator {
  public:
    using value_type = DependencyNode;
    using reference = DependencyNode &;
    using pointer = DependencyNode *;
    using difference_type = std::ptrdiff_t;
    using iterator_category = std::input_iterator_tag;

    Iterator() noexcept = default;
    Iterator(Source *source, DependencyNode *node) noexcept : source_{source}, node_{node} {}

    reference operator*() const noexcept { return *node_; }
    pointer operator->() const noexcept { return node_; }
    Iterator &operator++();
    void operator++(int) { ++*this; }
    bool operator==(std::default_sentinel_t) const noexcept { return node_ == nullptr; }

  private:
    Source *source_ = nullptr;
    DependencyNode *node_ = nullptr;
  };

  DependencySequence() noexcept = default;
  explicit DependencySequence(Source &source) noexcept : source_{&source} {}
  explicit DependencySequence(std::unique_ptr<Source> source) noexcept;
  DependencySequence(DependencySequence &&other) noexcept;
  DependencySequence &operator=(DependencySequence &&other) noexcept;
  DependencySequence(const DependencySequence &) = delete;
  DependencySequence &operator=(const DependencySequence &) = delete;
  ~DependencySequence() = default;

  // Starts consuming the sequence. Calling begin() again continues where the previous pass stopped.
  Iterator begin();
  std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

  std::vector<std::unique_ptr<DependencyNode>> to_stable_nodes();
  std::vector<Identifier> ids();

private:
  std::unique_ptr<Source> owned_;
  Source *source_ = nullptr;
};

using DependencyMatcher = std::function<bool(const DependencyNode &)>;

inline const DependencyMatcher kMatchAll = [](const DependencyNode &) { return true; };

inline const DependencyMatcher kMatchSubProjects = [](const DependencyNode &node) {
  return is_project_linkage(node.linkage());
};

DependencyMatcher match_linkage(std::set<PackageLinkage> linkages);
