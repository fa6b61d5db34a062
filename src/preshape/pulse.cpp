#include <preshape/pulse.hpp>

#include <preshape/constants.hpp>
#include <preshape/io.hpp>

#include <cmath>
#include <stdexcept>

namespace preshape {

namespace {

double shape_value(const PulseSpec& spec, double t, double center) {
  const double x = t - center;
  if (spec.kind == "gaussian") {
    double u = x / spec.width;
    return spec.amplitude * std::exp(-0.5 * u * u);
  }
  if (spec.kind == "rect") {
    return (std::fabs(x) <= 0.5 * spec.width) ? spec.amplitude : 0.0;
  }
  if (spec.kind == "raised_cosine") {
    if (std::fabs(x) > spec.width) return 0.0;
    return spec.amplitude * 0.5 * (1.0 + std::cos(pi * x / spec.width));
  }
  throw std::runtime_error("Unknown pulse kind: " + spec.kind);
}

} // namespace

Pulse make_pulse(const PulseSpec& spec) {
  if (spec.kind == "file") {
    if (spec.file.empty()) throw std::runtime_error("pulse kind 'file' needs a file path");
    return read_pulse_file(spec.file);
  }

  if (!(spec.width > 0.0) && spec.kind != "impulse") {
    throw std::runtime_error("pulse width must be positive");
  }

  Pulse p;
  p.axis = TimeAxis(spec.n_samples, spec.dt, spec.t0);
  const double center = spec.center ? *spec.center : spec.t0 + 0.5 * p.axis.duration();

  p.v.assign(p.axis.n(), 0.0);
  if (spec.kind == "impulse") {
    double k = std::round((center - spec.t0) / spec.dt);
    if (k < 0.0 || k >= static_cast<double>(p.axis.n())) {
      throw std::runtime_error("impulse center lies outside the time window");
    }
    p.v[static_cast<std::size_t>(k)] = spec.amplitude;
    return p;
  }

  const std::vector<double>& t = p.axis.t();
  for (std::size_t k = 0; k < t.size(); ++k) {
    p.v[k] = shape_value(spec, t[k], center);
  }
  return p;
}

} // namespace preshape
