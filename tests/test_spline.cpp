#include <preshape/errors.hpp>
#include <preshape/spline.hpp>

#include <cmath>
#include <vector>

#include <gtest/gtest.h>

using preshape::cplx;
using preshape::CubicSpline;

TEST(CubicSpline, PassesThroughEveryKnot) {
  std::vector<double> x = {0.0, 0.3, 1.1, 1.5, 2.8, 4.0, 4.2};
  std::vector<cplx> y = {{1.0, 0.0}, {0.7, -0.2}, {0.2, -0.6}, {-0.1, -0.4},
                         {-0.3, 0.1}, {0.05, 0.3}, {0.1, 0.2}};
  CubicSpline s(x, y);
  for (std::size_t i = 0; i < x.size(); ++i) {
    cplx v = s.eval(x[i]);
    EXPECT_NEAR(v.real(), y[i].real(), 1e-12) << "knot " << i;
    EXPECT_NEAR(v.imag(), y[i].imag(), 1e-12) << "knot " << i;
  }
}

TEST(CubicSpline, TwoKnotsGiveStraightLine) {
  CubicSpline s({0.0, 2.0}, {cplx(1.0, 0.0), cplx(3.0, 2.0)});
  cplx mid = s.eval(1.0);
  EXPECT_NEAR(mid.real(), 2.0, 1e-14);
  EXPECT_NEAR(mid.imag(), 1.0, 1e-14);
  EXPECT_NEAR(s.slopes()[0].real(), 1.0, 1e-14);
  EXPECT_NEAR(s.slopes()[1].imag(), 1.0, 1e-14);
}

TEST(CubicSpline, ThreeKnotsGiveParabola) {
  // y = x^2 sampled at 0, 1, 3
  CubicSpline s({0.0, 1.0, 3.0}, {cplx(0.0), cplx(1.0), cplx(9.0)});
  EXPECT_NEAR(s.eval(2.0).real(), 4.0, 1e-12);
  EXPECT_NEAR(s.eval(0.5).real(), 0.25, 1e-12);
  EXPECT_NEAR(s.eval(2.5).imag(), 0.0, 1e-15);
}

TEST(CubicSpline, NotAKnotReproducesCubics) {
  auto f = [](double x) { return cplx(x * x * x - 2.0 * x, x * x); };
  std::vector<double> x = {0.0, 0.5, 1.3, 2.0, 3.1, 4.0};
  std::vector<cplx> y;
  for (double v : x) y.push_back(f(v));
  CubicSpline s(x, y);

  for (double q : {0.1, 0.9, 1.7, 2.55, 3.9}) {
    cplx got = s.eval(q);
    EXPECT_NEAR(got.real(), f(q).real(), 1e-10) << "x=" << q;
    EXPECT_NEAR(got.imag(), f(q).imag(), 1e-10) << "x=" << q;
  }
}

TEST(CubicSpline, GigahertzKeysStayAccurate) {
  std::vector<double> x = {0.0, 1e9, 2e9, 3e9, 4e9};
  std::vector<cplx> y = {{1.0, 0.0}, {0.8, -0.3}, {0.5, -0.5}, {0.2, -0.4}, {0.1, -0.1}};
  CubicSpline s(x, y);
  std::vector<cplx> at_knots = s.eval_on(x);
  for (std::size_t i = 0; i < x.size(); ++i) {
    EXPECT_NEAR(std::abs(at_knots[i] - y[i]), 0.0, 1e-12);
  }
}

TEST(CubicSpline, RejectsTooFewKnots) {
  EXPECT_THROW(CubicSpline({1.0}, {cplx(1.0)}), preshape::InterpolationError);
  EXPECT_THROW(CubicSpline({}, {}), preshape::InterpolationError);
}

TEST(CubicSpline, RejectsNonIncreasingKeys) {
  EXPECT_THROW(CubicSpline({0.0, 1.0, 1.0}, {cplx(0.0), cplx(1.0), cplx(2.0)}),
               preshape::InterpolationError);
  EXPECT_THROW(CubicSpline({0.0, 2.0, 1.0}, {cplx(0.0), cplx(1.0), cplx(2.0)}),
               preshape::InterpolationError);
}

TEST(CubicSpline, InterpolationErrorIsAConstructionError) {
  EXPECT_THROW(CubicSpline({0.0, 0.0}, {cplx(0.0), cplx(1.0)}), preshape::ConstructionError);
  EXPECT_THROW(CubicSpline({0.0, 1.0}, {cplx(0.0)}), preshape::ConstructionError);
}
