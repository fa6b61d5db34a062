#include <preshape/touchstone.hpp>

#include <preshape/constants.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace preshape {

namespace fs = std::filesystem;

namespace {

std::string to_upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

enum class DataFormat { RI, MA, DB };

struct OptionLine {
  double unit_scale = 1e9; // GHz
  DataFormat format = DataFormat::MA;
  double z0 = 50.0;
};

// "# [unit] [S|Y|Z|H|G] [MA|DB|RI] [R z0]", tokens in any order.
OptionLine parse_option_line(const std::string& line, const std::string& where) {
  OptionLine opt;
  std::stringstream ss(line.substr(1));
  std::string tok;
  while (ss >> tok) {
    std::string t = to_upper(tok);
    if (t == "HZ") opt.unit_scale = 1.0;
    else if (t == "KHZ") opt.unit_scale = 1e3;
    else if (t == "MHZ") opt.unit_scale = 1e6;
    else if (t == "GHZ") opt.unit_scale = 1e9;
    else if (t == "S") continue;
    else if (t == "Y" || t == "Z" || t == "H" || t == "G") {
      throw std::runtime_error("Touchstone: only S parameters are supported (got " + tok + ") at " +
                               where);
    }
    else if (t == "RI") opt.format = DataFormat::RI;
    else if (t == "MA") opt.format = DataFormat::MA;
    else if (t == "DB") opt.format = DataFormat::DB;
    else if (t == "R") {
      if (!(ss >> opt.z0)) {
        throw std::runtime_error("Touchstone: missing reference impedance after R at " + where);
      }
    }
    else {
      throw std::runtime_error("Touchstone: unrecognized option '" + tok + "' at " + where);
    }
  }
  return opt;
}

cplx decode_pair(double a, double b, DataFormat fmt) {
  switch (fmt) {
    case DataFormat::RI:
      return cplx(a, b);
    case DataFormat::MA:
      return std::polar(a, b * pi / 180.0);
    case DataFormat::DB:
      return std::polar(std::pow(10.0, a / 20.0), b * pi / 180.0);
  }
  return cplx(a, b);
}

} // namespace

std::vector<cplx> NetworkData::responses(std::size_t to, std::size_t from) const {
  if (to < 1 || to > nports || from < 1 || from > nports) {
    throw std::runtime_error("NetworkData: S" + std::to_string(to) + std::to_string(from) +
                             " out of range for " + std::to_string(nports) + "-port data");
  }
  std::vector<cplx> out;
  out.reserve(s.size());
  for (const auto& m : s) out.push_back(m[(to - 1) * nports + (from - 1)]);
  return out;
}

std::vector<FrequencySample> NetworkData::parameter(std::size_t to, std::size_t from) const {
  std::vector<cplx> h = responses(to, from);
  std::vector<FrequencySample> out(f.size());
  for (std::size_t k = 0; k < f.size(); ++k) {
    out[k].f = f[k];
    out[k].response = h[k];
  }
  return out;
}

std::size_t touchstone_port_count(const std::string& path) {
  std::string ext = to_upper(fs::path(path).extension().string());
  // ".S2P"
  if (ext.size() < 4 || ext[1] != 'S' || ext.back() != 'P') return 0;
  std::string digits = ext.substr(2, ext.size() - 3);
  if (digits.empty()) return 0;
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return 0;
  }
  return static_cast<std::size_t>(std::stoul(digits));
}

void parse_parameter_name(const std::string& name, std::size_t& to, std::size_t& from) {
  std::string n = to_upper(name);
  if (n.size() != 3 || n[0] != 'S' ||
      !std::isdigit(static_cast<unsigned char>(n[1])) ||
      !std::isdigit(static_cast<unsigned char>(n[2]))) {
    throw std::runtime_error("Invalid S-parameter name '" + name + "' (expected e.g. S21)");
  }
  to = static_cast<std::size_t>(n[1] - '0');
  from = static_cast<std::size_t>(n[2] - '0');
  if (to == 0 || from == 0) {
    throw std::runtime_error("Invalid S-parameter name '" + name + "': ports are 1-based");
  }
}

NetworkData parse_touchstone(const std::string& text, std::size_t nports,
                             const std::string& origin) {
  if (nports == 0) {
    throw std::runtime_error("Touchstone: port count must be positive for " + origin);
  }

  NetworkData net;
  net.nports = nports;

  OptionLine opt;
  bool have_option = false;
  std::vector<double> values;

  std::stringstream in(text);
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;

    auto bang = line.find('!');
    if (bang != std::string::npos) line = line.substr(0, bang);

    std::size_t i = 0;
    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) ++i;
    if (i == line.size()) continue;

    const std::string where = origin + ":" + std::to_string(lineno);
    if (line[i] == '#') {
      // Only the first option line counts, and it must precede the data.
      if (!have_option) {
        if (!values.empty()) {
          throw std::runtime_error("Touchstone: option line after data at " + where);
        }
        opt = parse_option_line(line.substr(i), where);
        have_option = true;
      }
      continue;
    }
    if (line[i] == '[') {
      throw std::runtime_error("Touchstone: version 2 keywords are not supported at " + where);
    }

    std::stringstream ss(line);
    std::string tok;
    while (ss >> tok) {
      char* end = nullptr;
      double v = std::strtod(tok.c_str(), &end);
      if (end == tok.c_str() || *end != '\0') {
        throw std::runtime_error("Touchstone: invalid number '" + tok + "' at " + where);
      }
      values.push_back(v);
    }
  }

  const std::size_t per_point = 1 + 2 * nports * nports;
  if (values.empty()) {
    throw std::runtime_error("Touchstone: no data in " + origin);
  }

  net.z0 = opt.z0;
  std::size_t pos = 0;
  while (pos < values.size()) {
    // 2-port files may end with a noise-parameter block; its frequencies
    // restart at or below the last S-parameter point.
    if (nports == 2 && !net.f.empty() && values[pos] * opt.unit_scale <= net.f.back()) break;
    if (values.size() - pos < per_point) {
      throw std::runtime_error("Touchstone: truncated record in " + origin + " (" +
                               std::to_string(values.size() - pos) + " values left, " +
                               std::to_string(per_point) + " per frequency point)");
    }
    const double* v = &values[pos];
    net.f.push_back(v[0] * opt.unit_scale);

    std::vector<cplx> m(nports * nports);
    std::size_t k = 1;
    for (std::size_t outer = 0; outer < nports; ++outer) {
      for (std::size_t inner = 0; inner < nports; ++inner) {
        // 2-port files list S11 S21 S12 S22; larger ones are row-major.
        std::size_t to = (nports <= 2) ? inner : outer;
        std::size_t from = (nports <= 2) ? outer : inner;
        m[to * nports + from] = decode_pair(v[k], v[k + 1], opt.format);
        k += 2;
      }
    }
    net.s.push_back(std::move(m));
    pos += per_point;
  }
  return net;
}

NetworkData read_touchstone(const std::string& path) {
  std::size_t nports = touchstone_port_count(path);
  if (nports == 0) {
    throw std::runtime_error("Cannot determine port count from Touchstone file name: " + path);
  }

  std::ifstream f(path);
  if (!f) throw std::runtime_error("Cannot open Touchstone file: " + path);
  std::stringstream buf;
  buf << f.rdbuf();

  return parse_touchstone(buf.str(), nports, path);
}

} // namespace preshape
