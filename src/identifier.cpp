#include "identifier.hpp"
#include <array>

Identifier Identifier::from_coordinates(std::string_view coordinates) {
  std::array<std::string_view, 4> parts{};
  std::size_t part = 0;
  while (part < parts.size() - 1) {
    auto colon = coordinates.find(':');
    if (colon == std::string_view::npos) break;
    parts[part++] = coordinates.substr(0, colon);
    coordinates.remove_prefix(colon + 1);
  }
  parts[part] = coordinates;
  return {std::string{parts[0]}, std::string{parts[1]}, std::string{parts[2]}, std::string{parts[3]}};
}

std::string Identifier::to_coordinates() const {
  std::string result;
  result.reserve(type.size() + namespace_name.size() + name.size() + version.size() + 3);
  result.append(type).append(1, ':').append(namespace_name).append(1, ':').append(name).append(1, ':').append(version);
  return result;
}
