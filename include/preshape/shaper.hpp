#pragma once

#include <preshape/constants.hpp>
#include <preshape/types.hpp>

#include <cstddef>
#include <vector>

namespace preshape {

// Per-bin decision of the stability clamp: true where |H[k]| > scaling_limit,
// i.e. where the shaper divides by the channel gain. Bins that fail are
// dropped from the shaped spectrum.
std::vector<bool> clamp_mask(const std::vector<cplx>& H, double scaling_limit);

// Number of bins the clamp drops.
std::size_t clamped_bin_count(const std::vector<cplx>& H, double scaling_limit);

// Pre-distort `pulse` so that, filtered by `transfer_function`, it
// approximates `pulse`. Spectral division on the FFT grid of `time_axis`
// (dt = time_axis[1] - time_axis[0]) with bins where |H| <= scaling_limit
// set to 0. The result has the length of `pulse`; its real part is the
// waveform to transmit.
//
// Throws ShapeMismatchError if pulse and time_axis differ in length, are
// shorter than 2 samples, or the transfer function returns the wrong number
// of gains; std::invalid_argument for dt <= 0 or scaling_limit <= 0.
std::vector<cplx> shape_pulse(const std::vector<cplx>& pulse,
                              const std::vector<double>& time_axis,
                              const TransferFunction& transfer_function,
                              double scaling_limit = kDefaultScalingLimit);

std::vector<cplx> shape_pulse(const std::vector<double>& pulse,
                              const std::vector<double>& time_axis,
                              const TransferFunction& transfer_function,
                              double scaling_limit = kDefaultScalingLimit);

// Forward channel: IFFT(FFT(pulse) * H). Predicts what the far end sees.
std::vector<cplx> filter_pulse(const std::vector<cplx>& pulse,
                               const std::vector<double>& time_axis,
                               const TransferFunction& transfer_function);

// Channel gains on the FFT grid of `time_axis`, in FFT bin order.
std::vector<cplx> sample_transfer_function(const TransferFunction& transfer_function,
                                           const std::vector<double>& time_axis);

std::vector<cplx> to_complex(const std::vector<double>& x);

} // namespace preshape
