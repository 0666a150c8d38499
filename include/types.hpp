#pragma once
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class PackageLinkage : std::uint8_t { kDynamic, kStatic, kProjectDynamic, kProjectStatic };

enum class Severity : std::uint8_t { kHint, kWarning, kError };

constexpr bool is_project_linkage(PackageLinkage linkage) noexcept {
  return linkage == PackageLinkage::kProjectDynamic || linkage == PackageLinkage::kProjectStatic;
}

std::string_view to_string(PackageLinkage linkage) noexcept;
std::string_view to_string(Severity severity) noexcept;
std::optional<PackageLinkage> parse_linkage(std::string_view name) noexcept;
std::optional<Severity> parse_severity(std::string_view name) noexcept;

struct Issue {
  std::string source;
  std::string message;
  Severity severity = Severity::kError;

  auto operator<=>(const Issue &) const = default;
  bool operator==(const Issue &) const = default;
};

inline std::size_t hash_combine(std::size_t seed, std::size_t value) noexcept {
  return seed ^ (value + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
}
