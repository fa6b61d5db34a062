#include <preshape/grid.hpp>

#include <preshape/constants.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

namespace preshape {

TimeAxis::TimeAxis(std::size_t n, double dt, double t0)
    : n_(n), dt_(dt), t0_(t0) {
  if (n_ < 2) {
    throw std::invalid_argument("TimeAxis: need at least 2 samples");
  }
  if (!(dt_ > 0.0) || !std::isfinite(dt_)) {
    throw std::invalid_argument("TimeAxis: dt must be positive and finite");
  }

  t_.resize(n_);
  for (std::size_t k = 0; k < n_; ++k) {
    t_[k] = t0_ + dt_ * static_cast<double>(k);
  }
}

TimeAxis TimeAxis::from_samples(const std::vector<double>& t) {
  if (t.size() < 2) {
    throw std::invalid_argument("TimeAxis::from_samples: need at least 2 samples");
  }
  const double dt = t[1] - t[0];
  if (!(dt > 0.0) || !std::isfinite(dt)) {
    throw std::invalid_argument("TimeAxis::from_samples: timestamps must increase");
  }
  for (std::size_t k = 2; k < t.size(); ++k) {
    double step = t[k] - t[k - 1];
    if (std::fabs(step - dt) > kUniformSpacingTol * dt) {
      throw std::invalid_argument("TimeAxis::from_samples: non-uniform spacing at index " +
                                  std::to_string(k));
    }
  }
  return TimeAxis(t.size(), dt, t[0]);
}

std::vector<double> fft_frequencies(std::size_t n, double dt) {
  if (n == 0) return {};
  if (!(dt > 0.0) || !std::isfinite(dt)) {
    throw std::invalid_argument("fft_frequencies: dt must be positive and finite");
  }
  const double df = 1.0 / (static_cast<double>(n) * dt);
  const std::size_t n_pos = (n - 1) / 2 + 1; // DC and positive bins

  std::vector<double> f(n, 0.0);
  for (std::size_t k = 0; k < n_pos; ++k) {
    f[k] = df * static_cast<double>(k);
  }
  for (std::size_t k = n_pos; k < n; ++k) {
    f[k] = -df * static_cast<double>(n - k);
  }
  return f;
}

} // namespace preshape
