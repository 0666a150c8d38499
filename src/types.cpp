#include "types.hpp"
#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<PackageLinkage, std::string_view>, 4> kLinkageNames{{
  {PackageLinkage::kDynamic, "DYNAMIC"},
  {PackageLinkage::kStatic, "STATIC"},
  {PackageLinkage::kProjectDynamic, "PROJECT_DYNAMIC"},
  {PackageLinkage::kProjectStatic, "PROJECT_STATIC"},
}};

constexpr std::array<std::pair<Severity, std::string_view>, 3> kSeverityNames{{
  {Severity::kHint, "HINT"},
  {Severity::kWarning, "WARNING"},
  {Severity::kError, "ERROR"},
}};

}

std::string_view to_string(PackageLinkage linkage) noexcept {
  for (auto [value, name] : kLinkageNames)
    if (value == linkage) return name;
  return "UNKNOWN";
}

std::string_view to_string(Severity severity) noexcept {
  for (auto [value, name] : kSeverityNames)
    if (value == severity) return name;
  return "UNKNOWN";
}

std::optional<PackageLinkage> parse_linkage(std::string_view name) noexcept {
  for (auto [value, vname] : kLinkageNames)
    if (vname == name) return value;
  return std::nullopt;
}

std::optional<Severity> parse_severity(std::string_view name) noexcept {
  for (auto [value, vname] : kSeverityNames)
    if (vname == name) return value;
  return std::nullopt;
}
