#pragma once

#include <preshape/grid.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace preshape {

struct PulseSpec {
  std::string kind = "gaussian"; // gaussian | rect | raised_cosine | impulse | file
  std::size_t n_samples = 1024;
  double dt = 1e-12;             // [s]
  double t0 = 0.0;               // [s]
  std::optional<double> center;  // [s]; unset => middle of the window
  double width = 20e-12;         // [s]
  double amplitude = 1.0;
  std::string file;              // kind == file
};

struct Pulse {
  TimeAxis axis;
  std::vector<double> v;
};

Pulse make_pulse(const PulseSpec& spec);

} // namespace preshape
