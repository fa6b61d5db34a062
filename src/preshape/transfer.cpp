#include <preshape/transfer.hpp>

#include <preshape/errors.hpp>

#include <cmath>
#include <string>
#include <utility>

namespace preshape {

TransferFunctionModel::TransferFunctionModel(CubicSpline spline)
    : spline_(std::move(spline)),
      lower_limit_(spline_.x().front()),
      upper_limit_(spline_.x().back()) {}

TransferFunctionModel TransferFunctionModel::build(const std::vector<FrequencySample>& samples) {
  std::vector<double> f;
  std::vector<cplx> h;
  f.reserve(samples.size());
  h.reserve(samples.size());
  for (const auto& s : samples) {
    f.push_back(s.f);
    h.push_back(s.response);
  }
  return build(h, f);
}

TransferFunctionModel TransferFunctionModel::build(const std::vector<cplx>& responses,
                                                   const std::vector<double>& frequencies) {
  if (responses.size() != frequencies.size()) {
    throw ConstructionError("TransferFunctionModel::build: " + std::to_string(responses.size()) +
                            " responses for " + std::to_string(frequencies.size()) +
                            " frequencies");
  }
  for (std::size_t i = 0; i < frequencies.size(); ++i) {
    if (frequencies[i] < 0.0) {
      throw ConstructionError("TransferFunctionModel::build: negative frequency at index " +
                              std::to_string(i));
    }
    if (!std::isfinite(responses[i].real()) || !std::isfinite(responses[i].imag())) {
      throw ConstructionError("TransferFunctionModel::build: non-finite response at index " +
                              std::to_string(i));
    }
  }
  // Key ordering and count are checked by the spline itself.
  return TransferFunctionModel(CubicSpline(frequencies, responses));
}

bool TransferFunctionModel::in_band(double f) const {
  double af = std::fabs(f);
  return af >= lower_limit_ && af <= upper_limit_;
}

cplx TransferFunctionModel::evaluate(double f) const {
  if (!in_band(f)) return cplx(0.0, 0.0);
  if (f < 0.0) return std::conj(spline_.eval(-f));
  return spline_.eval(f);
}

std::vector<cplx> TransferFunctionModel::evaluate(const std::vector<double>& f) const {
  std::vector<cplx> out(f.size());
  const long n = static_cast<long>(f.size());
#ifdef PRESHAPE_HAS_OPENMP
#pragma omp parallel for if (n > 4096)
#endif
  for (long k = 0; k < n; ++k) {
    out[static_cast<std::size_t>(k)] = evaluate(f[static_cast<std::size_t>(k)]);
  }
  return out;
}

} // namespace preshape
