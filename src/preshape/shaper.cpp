#include <preshape/shaper.hpp>

#include <preshape/errors.hpp>
#include <preshape/fft.hpp>
#include <preshape/grid.hpp>

#include <cmath>
#include <stdexcept>
#include <string>

namespace preshape {

namespace {

void check_pulse_shape(std::size_t n_pulse, const std::vector<double>& time_axis,
                       const char* who) {
  if (n_pulse != time_axis.size()) {
    throw ShapeMismatchError(std::string(who) + ": pulse has " + std::to_string(n_pulse) +
                             " samples, time axis has " + std::to_string(time_axis.size()));
  }
  if (n_pulse < 2) {
    throw ShapeMismatchError(std::string(who) + ": need at least 2 samples");
  }
}

} // namespace

std::vector<bool> clamp_mask(const std::vector<cplx>& H, double scaling_limit) {
  std::vector<bool> pass(H.size(), false);
  for (std::size_t k = 0; k < H.size(); ++k) {
    pass[k] = std::abs(H[k]) > scaling_limit;
  }
  return pass;
}

std::size_t clamped_bin_count(const std::vector<cplx>& H, double scaling_limit) {
  std::size_t n = 0;
  for (bool p : clamp_mask(H, scaling_limit)) {
    if (!p) ++n;
  }
  return n;
}

std::vector<cplx> sample_transfer_function(const TransferFunction& transfer_function,
                                           const std::vector<double>& time_axis) {
  if (time_axis.size() < 2) {
    throw ShapeMismatchError("sample_transfer_function: need at least 2 samples");
  }
  const double dt = time_axis[1] - time_axis[0];
  std::vector<double> bins = fft_frequencies(time_axis.size(), dt);

  std::vector<cplx> H = transfer_function(bins);
  if (H.size() != bins.size()) {
    throw ShapeMismatchError("sample_transfer_function: transfer function returned " +
                             std::to_string(H.size()) + " gains for " +
                             std::to_string(bins.size()) + " frequencies");
  }
  return H;
}

std::vector<cplx> shape_pulse(const std::vector<cplx>& pulse,
                              const std::vector<double>& time_axis,
                              const TransferFunction& transfer_function,
                              double scaling_limit) {
  check_pulse_shape(pulse.size(), time_axis, "shape_pulse");
  if (!(scaling_limit > 0.0)) {
    throw std::invalid_argument("shape_pulse: scaling_limit must be positive");
  }

  const std::vector<cplx> H = sample_transfer_function(transfer_function, time_axis);
  const std::vector<bool> pass = clamp_mask(H, scaling_limit);

  Fft fft(pulse.size());
  std::vector<cplx> spectrum = fft.forward(pulse);
  for (std::size_t k = 0; k < spectrum.size(); ++k) {
    if (pass[k]) {
      spectrum[k] /= H[k];
    } else {
      spectrum[k] = cplx(0.0, 0.0);
    }
  }
  return fft.inverse(spectrum);
}

std::vector<cplx> shape_pulse(const std::vector<double>& pulse,
                              const std::vector<double>& time_axis,
                              const TransferFunction& transfer_function,
                              double scaling_limit) {
  return shape_pulse(to_complex(pulse), time_axis, transfer_function, scaling_limit);
}

std::vector<cplx> filter_pulse(const std::vector<cplx>& pulse,
                               const std::vector<double>& time_axis,
                               const TransferFunction& transfer_function) {
  check_pulse_shape(pulse.size(), time_axis, "filter_pulse");

  const std::vector<cplx> H = sample_transfer_function(transfer_function, time_axis);

  Fft fft(pulse.size());
  std::vector<cplx> spectrum = fft.forward(pulse);
  for (std::size_t k = 0; k < spectrum.size(); ++k) spectrum[k] *= H[k];
  return fft.inverse(spectrum);
}

std::vector<cplx> to_complex(const std::vector<double>& x) {
  std::vector<cplx> out;
  out.reserve(x.size());
  for (double v : x) out.emplace_back(v, 0.0);
  return out;
}

} // namespace preshape
