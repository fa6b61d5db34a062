#pragma once

#include <preshape/types.hpp>

#include <cstddef>
#include <vector>

#include <fftw3.h>

namespace preshape {

// Complex-to-complex DFT of a fixed length, backed by a pair of FFTW plans.
// The inverse is normalized by 1/n so that inverse(forward(x)) == x.
//
// One instance owns its work buffers; use one instance per thread.
class Fft {
public:
  explicit Fft(std::size_t n);
  ~Fft();

  Fft(const Fft&) = delete;
  Fft& operator=(const Fft&) = delete;

  std::size_t size() const { return n_; }

  std::vector<cplx> forward(const std::vector<cplx>& x);
  std::vector<cplx> inverse(const std::vector<cplx>& X);

private:
  std::vector<cplx> run(fftw_plan plan, const std::vector<cplx>& in, double scale);

  std::size_t n_ = 0;
  fftw_complex* in_ = nullptr;
  fftw_complex* out_ = nullptr;
  fftw_plan fwd_ = nullptr;
  fftw_plan inv_ = nullptr;
};

} // namespace preshape
