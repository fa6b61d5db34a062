#include <preshape/verify.hpp>

#include <preshape/errors.hpp>
#include <preshape/fft.hpp>
#include <preshape/grid.hpp>
#include <preshape/shaper.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace preshape {

VerificationReport verify_shaping(const std::vector<cplx>& pulse,
                                  const std::vector<double>& time_axis,
                                  const TransferFunction& transfer_function,
                                  const std::vector<cplx>& shaped,
                                  double scaling_limit,
                                  double tol) {
  if (shaped.size() != pulse.size()) {
    throw ShapeMismatchError("verify_shaping: shaped pulse length differs from desired pulse");
  }

  VerificationReport r;
  r.tol = tol;

  const std::vector<cplx> H = sample_transfer_function(transfer_function, time_axis);
  r.total_bins = H.size();
  r.clamped_bins = clamped_bin_count(H, scaling_limit);

  // Hermitian symmetry on the grid
  std::vector<double> neg = fft_frequencies(time_axis.size(), time_axis[1] - time_axis[0]);
  for (double& f : neg) f = -f;
  const std::vector<cplx> Hneg = transfer_function(neg);
  if (Hneg.size() != H.size()) {
    throw ShapeMismatchError("verify_shaping: transfer function returned the wrong number of gains");
  }
  for (std::size_t k = 0; k < H.size(); ++k) {
    r.symmetry_error = std::max(r.symmetry_error, std::abs(Hneg[k] - std::conj(H[k])));
  }

  r.finite = std::all_of(shaped.begin(), shaped.end(), [](const cplx& z) {
    return std::isfinite(z.real()) && std::isfinite(z.imag());
  });
  if (!r.finite) {
    r.passband_error = std::numeric_limits<double>::infinity();
    return r;
  }

  // Desired pulse limited to the bins that pass the clamp
  const std::vector<bool> pass = clamp_mask(H, scaling_limit);
  Fft fft(pulse.size());
  std::vector<cplx> P = fft.forward(pulse);
  for (std::size_t k = 0; k < P.size(); ++k) {
    if (!pass[k]) P[k] = cplx(0.0, 0.0);
  }
  const std::vector<cplx> target = fft.inverse(P);
  const std::vector<cplx> received = filter_pulse(shaped, time_axis, transfer_function);

  double peak = 1.0;
  for (const auto& z : pulse) peak = std::max(peak, std::abs(z));

  double err = 0.0;
  for (std::size_t k = 0; k < target.size(); ++k) {
    err = std::max(err, std::abs(received[k] - target[k]));
  }
  r.passband_error = err / peak;
  return r;
}

} // namespace preshape
