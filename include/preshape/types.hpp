#pragma once

#include <complex>
#include <functional>
#include <vector>

namespace preshape {

using cplx = std::complex<double>;

struct FrequencySample {
  double f = 0.0;       // [Hz]
  cplx response{0.0, 0.0};
};

// Any callable mapping a set of frequencies [Hz] to complex channel gains,
// one per frequency. TransferFunctionModel is one; tests use stand-ins.
using TransferFunction = std::function<std::vector<cplx>(const std::vector<double>&)>;

} // namespace preshape
