#pragma once

#include <preshape/constants.hpp>
#include <preshape/pulse.hpp>

#include <map>
#include <string>

namespace preshape {

// Parsed INI as section->(key->value).
using IniSection = std::map<std::string, std::string>;
using IniMap = std::map<std::string, IniSection>;

struct ShaperConfig {
  // [general]
  std::string output_dir = "out";
  int omp_threads = 0;                 // 0 => leave as-is

  // [channel]
  std::string touchstone;              // .sNp path, required
  std::string parameter = "S21";

  // [pulse]
  PulseSpec pulse;

  // [shaping]
  double scaling_limit = kDefaultScalingLimit;

  // [verify]
  bool verify = true;
  double verify_tol = 1e-6;

  IniMap ini_raw;
};

IniMap parse_ini_file(const std::string& path);
IniMap parse_ini_text(const std::string& text, const std::string& origin = "<string>");

ShaperConfig load_config(const std::string& ini_path);
ShaperConfig config_from_ini(const IniMap& ini);

} // namespace preshape
