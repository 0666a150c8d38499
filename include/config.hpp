#pragma once
#include <cstddef>
#include <cstdint>

using PackageIndex = std::uint32_t;
using Fragment = std::uint32_t;
using ReferenceId = std::uint32_t;
using DepthType = int;

class DependencyGraph;
class DependencyNode;
class DependencySequence;
class DependencyNavigator;
class DependencyGraphNavigator;
struct Identifier;
struct Project;

inline constexpr DepthType kUnlimitedDepth = -1;
inline constexpr Fragment kDefaultFragment = 0;

inline constexpr std::size_t KiB = 1024;
inline constexpr std::size_t MiB = 1024 * KiB;
inline constexpr double KiB_d = 1024.0;
inline constexpr double MiB_d = 1024.0 * KiB_d;

inline constexpr std::size_t kDefaultTrials = 100;
inline constexpr std::size_t kDefaultMaxDepth = 6;
inline constexpr std::size_t kDefaultGeneratedPackages = 40;
inline constexpr std::size_t kDefaultGeneratedScopes = 3;
inline constexpr std::size_t kDefaultGeneratedFanout = 3;
inline constexpr std::size_t kDefaultGeneratedFragments = 2;
inline constexpr std::size_t kDefaultGeneratedLayers = 5;
