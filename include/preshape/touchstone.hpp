#pragma once

#include <preshape/types.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace preshape {

// Decoded Touchstone v1 sweep: S-matrices per frequency point.
struct NetworkData {
  std::size_t nports = 0;
  double z0 = 50.0;                     // reference impedance [Ohm]
  std::vector<double> f;                // [Hz]
  std::vector<std::vector<cplx>> s;     // per point, row-major nports x nports: s[k][(to-1)*nports + (from-1)]

  std::size_t size() const { return f.size(); }

  // S_{to,from} (1-based) at every frequency.
  std::vector<cplx> responses(std::size_t to, std::size_t from) const;
  std::vector<FrequencySample> parameter(std::size_t to, std::size_t from) const;
};

// Read an .sNp file; the port count comes from the extension.
NetworkData read_touchstone(const std::string& path);

// Parse Touchstone text for an nports network. `origin` names the source in
// error messages.
NetworkData parse_touchstone(const std::string& text, std::size_t nports,
                             const std::string& origin = "<string>");

// Port count from a file name such as "channel.s2p" (0 if not recognized).
std::size_t touchstone_port_count(const std::string& path);

// "S21" -> (2, 1). Throws std::runtime_error for anything else.
void parse_parameter_name(const std::string& name, std::size_t& to, std::size_t& from);

} // namespace preshape
