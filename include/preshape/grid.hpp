#pragma once

#include <cstddef>
#include <vector>

namespace preshape {

// Uniform time axis t_k = t0 + k*dt, k = 0..n-1.
class TimeAxis {
public:
  TimeAxis() = default;
  TimeAxis(std::size_t n, double dt, double t0 = 0.0);

  // Wrap sampled timestamps; spacing is taken from the first two samples
  // and the rest must agree within kUniformSpacingTol.
  static TimeAxis from_samples(const std::vector<double>& t);

  std::size_t n() const { return n_; }
  double dt() const { return dt_; }
  double t0() const { return t0_; }
  double duration() const { return dt_ * static_cast<double>(n_); }

  const std::vector<double>& t() const { return t_; }

private:
  std::size_t n_ = 0;
  double dt_ = 0.0;
  double t0_ = 0.0;
  std::vector<double> t_;
};

// DFT sample frequencies [Hz] for n points spaced dt apart, in FFT bin
// order: DC, positive ascending, then negative ascending.
std::vector<double> fft_frequencies(std::size_t n, double dt);

} // namespace preshape
