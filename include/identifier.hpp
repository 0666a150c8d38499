#pragma once
#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include "types.hpp"

struct Identifier {
  std::string type;
  std::string namespace_name;
  std::string name;
  std::string version;

  static Identifier from_coordinates(std::string_view coordinates);

  // type:namespace:name:version
  std::string to_coordinates() const;

  auto operator<=>(const Identifier &) const = default;
  bool operator==(const Identifier &) const = default;
};

template <>
struct std::hash<Identifier> {
  std::size_t operator()(const Identifier &id) const noexcept {
    auto h = std::hash<std::string_view>{};
    auto seed = h(id.type);
    seed = hash_combine(seed, h(id.namespace_name));
    seed = hash_combine(seed, h(id.name));
    return hash_combine(seed, h(id.version));
  }
};
