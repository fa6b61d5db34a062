#pragma once

namespace preshape {

constexpr double pi = 3.141592653589793238462643383279502884;

// Minimum channel gain magnitude the shaper will invert.
constexpr double kDefaultScalingLimit = 0.1;

// Relative tolerance when checking that a sampled time axis is uniform.
constexpr double kUniformSpacingTol = 1e-6;

} // namespace preshape
