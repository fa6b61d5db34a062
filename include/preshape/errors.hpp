#pragma once

#include <stdexcept>
#include <string>

namespace preshape {

// Bad input when building a transfer-function model.
class ConstructionError : public std::runtime_error {
public:
  explicit ConstructionError(const std::string& what) : std::runtime_error(what) {}
};

// Spline preconditions: at least 2 knots, strictly increasing keys.
class InterpolationError : public ConstructionError {
public:
  explicit InterpolationError(const std::string& what) : ConstructionError(what) {}
};

// Pulse, time axis and transfer-function output disagree in length.
class ShapeMismatchError : public std::runtime_error {
public:
  explicit ShapeMismatchError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace preshape
