#include "project.hpp"
#include <algorithm>

const Scope *Project::find_scope(std::string_view name) const noexcept {
  if (!scopes) return nullptr;
  auto it = std::ranges::find(*scopes, name, &Scope::name);
  return it != scopes->end() ? &*it : nullptr;
}
