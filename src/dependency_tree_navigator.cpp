#include "dependency_tree_navigator.hpp"
#include <memory>
#include <span>

using DTN = DependencyTreeNavigator;

namespace {

class PackageReferenceCursor final : public DependencyNode, public DependencySequence::Source {
public:
  explicit PackageReferenceCursor(std::span<const PackageReference> references) noexcept : references_{references} {}

  explicit PackageReferenceCursor(const PackageReference &current) noexcept
    : references_{&current, 1}, pinned_{true} {}

  const Identifier &id() const override { return current().id; }
  PackageLinkage linkage() const override { return current().linkage; }
  const std::vector<Issue> &issues() const override { return current().issues; }

  void visit_dependencies(const std::function<void(DependencySequence &)> &block) const override {
    PackageReferenceCursor cursor{std::span<const PackageReference>{current().dependencies}};
    DependencySequence dependencies{cursor};
    block(dependencies);
  }

  std::unique_ptr<DependencyNode> stable_reference() const override {
    return std::make_unique<PackageReferenceCursor>(current());
  }

  DependencyNode *next() override {
    if (!started_) {
      started_ = true;
      return references_.empty() ? nullptr : this;
    }
    if (pinned_ || position_ + 1 >= references_.size()) return nullptr;
    ++position_;
    return this;
  }

private:
  std::span<const PackageReference> references_;
  std::size_t position_ = 0;
  bool pinned_ = false;
  bool started_ = false;

  const PackageReference &current() const noexcept { return references_[position_]; }
};

PackageReference to_package_reference(const DependencyNode &node) {
  PackageReference ref{.id = node.id(), .linkage = node.linkage(), .issues = node.issues(), .dependencies = {}};
  node.visit_dependencies([&ref](DependencySequence &deps) {
    for (auto &dep : deps) ref.dependencies.push_back(to_package_reference(dep));
  });
  return ref;
}

}

std::set<std::string> DTN::scope_names(const Project &project) const {
  std::set<std::string> result;
  if (!project.scopes) return result;
  for (const auto &scope : *project.scopes) result.insert(scope.name);
  return result;
}

DependencySequence DTN::direct_dependencies(const Project &project, std::string_view scope_name) const {
  const auto *scope = project.find_scope(scope_name);
  if (!scope || scope->dependencies.empty()) return {};
  return DependencySequence{std::make_unique<PackageReferenceCursor>(std::span{scope->dependencies})};
}

std::vector<Scope> collect_scopes(const DependencyNavigator &navigator, const Project &project) {
  std::vector<Scope> scopes;
  for (const auto &name : navigator.scope_names(project)) {
    auto &scope = scopes.emplace_back(Scope{.name = name, .dependencies = {}});
    for (auto &node : navigator.direct_dependencies(project, name))
      scope.dependencies.push_back(to_package_reference(node));
  }
  return scopes;
}
