#pragma once

#include <preshape/types.hpp>

#include <cstddef>
#include <vector>

namespace preshape {

struct VerificationReport {
  double symmetry_error = 0.0;   // max |H(-f) - conj(H(f))| on the FFT grid
  bool finite = false;           // every shaped sample is finite
  double passband_error = 0.0;   // relative, see verify_shaping
  std::size_t clamped_bins = 0;
  std::size_t total_bins = 0;
  double tol = 0.0;

  bool symmetry_ok() const { return symmetry_error <= tol; }
  bool passband_ok() const { return passband_error <= tol; }
  bool all_ok() const { return finite && symmetry_ok() && passband_ok(); }
};

// Push `shaped` back through the channel and compare with the desired
// pulse restricted to the bins the clamp let through:
//   passband_error = max_k |filter(shaped)[k] - bandlimit(pulse)[k]| / max(1, max |pulse|)
VerificationReport verify_shaping(const std::vector<cplx>& pulse,
                                  const std::vector<double>& time_axis,
                                  const TransferFunction& transfer_function,
                                  const std::vector<cplx>& shaped,
                                  double scaling_limit,
                                  double tol);

} // namespace preshape
