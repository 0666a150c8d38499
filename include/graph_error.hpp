#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

enum class GraphErrorCode : std::uint8_t {
  kInvalidGraph,
  kNoGraphAvailable,
  kUnresolvedReference,
  kInconsistentShortestPaths,
  kInvalidInput
};

// Thrown for inconsistent or malformed dependency data. None of these conditions is transient.
class GraphError : public std::runtime_error {
public:
  GraphError(GraphErrorCode code, const std::string &message) : std::runtime_error{message}, code_{code} {}

  GraphErrorCode code() const noexcept { return code_; }

private:
  GraphErrorCode code_;
};
