#include <preshape/spline.hpp>

#include <preshape/errors.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace preshape {

namespace {

void require_monotonic(const std::vector<double>& x) {
  if (x.size() < 2) {
    throw InterpolationError("CubicSpline: need at least 2 points");
  }
  for (std::size_t i = 0; i < x.size(); ++i) {
    if (!std::isfinite(x[i])) {
      throw InterpolationError("CubicSpline: non-finite key at index " + std::to_string(i));
    }
    if (i > 0 && !(x[i] > x[i - 1])) {
      throw InterpolationError("CubicSpline: keys must be strictly increasing (index " +
                               std::to_string(i) + ")");
    }
  }
}

// Tridiagonal solve with a real matrix and complex right-hand side.
void thomas_solve(std::vector<double>& a, // subdiag (a[0] unused)
                  std::vector<double>& b, // diag
                  std::vector<double>& c, // superdiag (c[n-1] unused)
                  std::vector<cplx>& d    // rhs, becomes solution
) {
  const std::size_t n = b.size();
  for (std::size_t i = 1; i < n; ++i) {
    double m = a[i] / b[i - 1];
    b[i] -= m * c[i - 1];
    d[i] -= m * d[i - 1];
  }
  d[n - 1] /= b[n - 1];
  for (std::size_t i = n - 1; i-- > 0;) {
    d[i] = (d[i] - c[i] * d[i + 1]) / b[i];
  }
}

std::size_t interval_index(const std::vector<double>& x, double xq) {
  // i such that x[i] <= xq < x[i+1], clamped to [0, n-2].
  auto it = std::upper_bound(x.begin(), x.end(), xq);
  if (it == x.begin()) return 0;
  std::size_t i = static_cast<std::size_t>(it - x.begin()) - 1;
  return std::min(i, x.size() - 2);
}

} // namespace

CubicSpline::CubicSpline(std::vector<double> x_in, std::vector<cplx> y_in)
    : x_(std::move(x_in)), y_(std::move(y_in)) {
  if (x_.size() != y_.size()) {
    throw InterpolationError("CubicSpline: x and y size mismatch");
  }
  require_monotonic(x_);

  const std::size_t n = x_.size();
  std::vector<double> dx(n - 1);
  std::vector<cplx> slope(n - 1);
  for (std::size_t i = 0; i + 1 < n; ++i) {
    dx[i] = x_[i + 1] - x_[i];
    slope[i] = (y_[i + 1] - y_[i]) / dx[i];
  }

  if (n == 2) {
    s_.assign(2, slope[0]);
  } else {
    std::vector<double> a(n, 0.0);
    std::vector<double> b(n, 0.0);
    std::vector<double> c(n, 0.0);
    std::vector<cplx> d(n);

    if (n == 3) {
      // Not-a-knot at both ends of a single interior knot: one parabola.
      b[0] = 1.0;
      c[0] = 1.0;
      d[0] = 2.0 * slope[0];

      a[1] = dx[1];
      b[1] = 2.0 * (dx[0] + dx[1]);
      c[1] = dx[0];
      d[1] = 3.0 * (dx[0] * slope[1] + dx[1] * slope[0]);

      a[2] = 1.0;
      b[2] = 1.0;
      d[2] = 2.0 * slope[1];
    } else {
      // Continuity of the second derivative at interior knots.
      for (std::size_t i = 1; i + 1 < n; ++i) {
        a[i] = dx[i];
        b[i] = 2.0 * (dx[i - 1] + dx[i]);
        c[i] = dx[i - 1];
        d[i] = 3.0 * (dx[i] * slope[i - 1] + dx[i - 1] * slope[i]);
      }

      // Not-a-knot: third derivative continuous across x[1] and x[n-2].
      double w0 = x_[2] - x_[0];
      b[0] = dx[1];
      c[0] = w0;
      d[0] = ((dx[0] + 2.0 * w0) * dx[1] * slope[0] + dx[0] * dx[0] * slope[1]) / w0;

      double w1 = x_[n - 1] - x_[n - 3];
      a[n - 1] = w1;
      b[n - 1] = dx[n - 3];
      d[n - 1] = (dx[n - 2] * dx[n - 2] * slope[n - 3] +
                  (2.0 * w1 + dx[n - 2]) * dx[n - 3] * slope[n - 2]) / w1;
    }

    thomas_solve(a, b, c, d);
    s_ = std::move(d);
  }

  c2_.resize(n - 1);
  c3_.resize(n - 1);
  for (std::size_t i = 0; i + 1 < n; ++i) {
    cplx t = (s_[i] + s_[i + 1] - 2.0 * slope[i]) / dx[i];
    c3_[i] = t / dx[i];
    c2_[i] = (slope[i] - s_[i]) / dx[i] - t;
  }
}

cplx CubicSpline::eval(double xq) const {
  if (x_.empty()) {
    throw InterpolationError("CubicSpline::eval: empty spline");
  }
  std::size_t i = interval_index(x_, xq);
  double h = xq - x_[i];
  return ((c3_[i] * h + c2_[i]) * h + s_[i]) * h + y_[i];
}

std::vector<cplx> CubicSpline::eval_on(const std::vector<double>& xq) const {
  std::vector<cplx> out;
  out.reserve(xq.size());
  for (double v : xq) out.push_back(eval(v));
  return out;
}

} // namespace preshape
