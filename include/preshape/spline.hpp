#pragma once

#include <preshape/types.hpp>

#include <cstddef>
#include <vector>

namespace preshape {

// Piecewise cubic interpolant of complex values over strictly increasing
// real keys, with not-a-knot end conditions. Two knots give the straight
// line through them, three knots the parabola.
//
// Outside [x.front(), x.back()] the end polynomials are extended; callers
// that must not extrapolate check the range themselves.
class CubicSpline {
public:
  CubicSpline() = default;
  CubicSpline(std::vector<double> x_in, std::vector<cplx> y_in);

  std::size_t size() const { return x_.size(); }
  const std::vector<double>& x() const { return x_; }
  const std::vector<cplx>& y() const { return y_; }

  // dy/dx at the knots.
  const std::vector<cplx>& slopes() const { return s_; }

  cplx eval(double xq) const;
  std::vector<cplx> eval_on(const std::vector<double>& xq) const;

private:
  std::vector<double> x_;
  std::vector<cplx> y_;
  std::vector<cplx> s_;

  // Per interval i: p(h) = c3 h^3 + c2 h^2 + s_[i] h + y_[i], h = x - x_[i].
  std::vector<cplx> c2_;
  std::vector<cplx> c3_;
};

} // namespace preshape
