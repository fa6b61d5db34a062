#include <preshape/fft.hpp>

#include <preshape/errors.hpp>

#include <limits>
#include <mutex>
#include <new>
#include <stdexcept>
#include <string>

namespace preshape {

namespace {

// FFTW planning touches global state; execution does not.
std::mutex& planner_mutex() {
  static std::mutex m;
  return m;
}

} // namespace

Fft::Fft(std::size_t n) : n_(n) {
  if (n_ == 0) {
    throw std::invalid_argument("Fft: length must be positive");
  }
  if (n_ > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw std::invalid_argument("Fft: length " + std::to_string(n_) + " exceeds the FFTW plan limit");
  }

  in_ = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * n_));
  out_ = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * n_));
  if (!in_ || !out_) {
    fftw_free(in_);
    fftw_free(out_);
    throw std::bad_alloc();
  }

  {
    std::lock_guard<std::mutex> lock(planner_mutex());
    const int len = static_cast<int>(n_);
    fwd_ = fftw_plan_dft_1d(len, in_, out_, FFTW_FORWARD, FFTW_ESTIMATE);
    inv_ = fftw_plan_dft_1d(len, in_, out_, FFTW_BACKWARD, FFTW_ESTIMATE);
  }
  if (!fwd_ || !inv_) {
    std::lock_guard<std::mutex> lock(planner_mutex());
    if (fwd_) fftw_destroy_plan(fwd_);
    if (inv_) fftw_destroy_plan(inv_);
    fftw_free(in_);
    fftw_free(out_);
    throw std::runtime_error("Fft: FFTW planning failed for n=" + std::to_string(n_));
  }
}

Fft::~Fft() {
  std::lock_guard<std::mutex> lock(planner_mutex());
  fftw_destroy_plan(fwd_);
  fftw_destroy_plan(inv_);
  fftw_free(in_);
  fftw_free(out_);
}

std::vector<cplx> Fft::forward(const std::vector<cplx>& x) {
  return run(fwd_, x, 1.0);
}

std::vector<cplx> Fft::inverse(const std::vector<cplx>& X) {
  return run(inv_, X, 1.0 / static_cast<double>(n_));
}

std::vector<cplx> Fft::run(fftw_plan plan, const std::vector<cplx>& in, double scale) {
  if (in.size() != n_) {
    throw ShapeMismatchError("Fft: input length " + std::to_string(in.size()) +
                             " does not match plan length " + std::to_string(n_));
  }
  for (std::size_t k = 0; k < n_; ++k) {
    in_[k][0] = in[k].real();
    in_[k][1] = in[k].imag();
  }

  fftw_execute(plan);

  std::vector<cplx> out(n_);
  for (std::size_t k = 0; k < n_; ++k) {
    out[k] = cplx(out_[k][0] * scale, out_[k][1] * scale);
  }
  return out;
}

} // namespace preshape
