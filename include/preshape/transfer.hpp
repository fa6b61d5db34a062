#pragma once

#include <preshape/spline.hpp>
#include <preshape/types.hpp>

#include <vector>

namespace preshape {

// Continuous channel response built from a measured sweep.
//
// Inside the swept band, lower_limit <= |f| <= upper_limit, the value is the
// cubic spline through the samples, taken as-is for f >= 0 and conjugated
// for f < 0 so the response belongs to a real impulse response. Outside the
// band the channel is treated as fully attenuated and the value is exactly 0;
// the spline is never extrapolated.
class TransferFunctionModel {
public:
  // Samples must have strictly increasing, non-negative frequencies and
  // there must be at least 2 of them.
  static TransferFunctionModel build(const std::vector<FrequencySample>& samples);
  static TransferFunctionModel build(const std::vector<cplx>& responses,
                                     const std::vector<double>& frequencies);

  double lower_limit() const { return lower_limit_; }
  double upper_limit() const { return upper_limit_; }

  bool in_band(double f) const;

  cplx evaluate(double f) const;
  std::vector<cplx> evaluate(const std::vector<double>& f) const;

  std::vector<cplx> operator()(const std::vector<double>& f) const { return evaluate(f); }

private:
  explicit TransferFunctionModel(CubicSpline spline);

  CubicSpline spline_;
  double lower_limit_ = 0.0; // [Hz]
  double upper_limit_ = 0.0; // [Hz]
};

} // namespace preshape
