#include <preshape/config.hpp>

#include <preshape/touchstone.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace preshape {

namespace fs = std::filesystem;

namespace {

std::string strip(const std::string& s) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto b = std::find_if(s.begin(), s.end(), not_space);
  auto e = std::find_if(s.rbegin(), s.rend(), not_space).base();
  return (b < e) ? std::string(b, e) : std::string();
}

std::string lower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

// Typed, defaulted access to one parsed INI. Conversion errors name the
// section and key they came from.
class Lookup {
 public:
  explicit Lookup(const IniMap& ini) : ini_(ini) {}

  const std::string* find(const std::string& sec, const std::string& key) const {
    auto s = ini_.find(sec);
    if (s == ini_.end()) return nullptr;
    auto k = s->second.find(key);
    return (k == s->second.end()) ? nullptr : &k->second;
  }

  std::string text(const std::string& sec, const std::string& key, const std::string& def) const {
    const std::string* v = find(sec, key);
    return v ? strip(*v) : def;
  }

  double number(const std::string& sec, const std::string& key, double def) const {
    const std::string* v = find(sec, key);
    return v ? to_number(sec, key, strip(*v)) : def;
  }

  std::size_t count(const std::string& sec, const std::string& key, std::size_t def) const {
    const std::string* v = find(sec, key);
    if (!v) return def;
    double d = to_number(sec, key, strip(*v));
    if (d < 0.0 || d != std::floor(d)) fail(sec, key, "expected a non-negative integer, got '" + *v + "'");
    if (d >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
      fail(sec, key, "value out of range '" + *v + "'");
    }
    return static_cast<std::size_t>(d);
  }

  int integer(const std::string& sec, const std::string& key, int def) const {
    const std::string* v = find(sec, key);
    if (!v) return def;
    double d = to_number(sec, key, strip(*v));
    if (d != std::floor(d)) fail(sec, key, "expected an integer, got '" + *v + "'");
    if (d < static_cast<double>(std::numeric_limits<int>::min()) ||
        d > static_cast<double>(std::numeric_limits<int>::max())) {
      fail(sec, key, "value out of range '" + *v + "'");
    }
    return static_cast<int>(d);
  }

  bool flag(const std::string& sec, const std::string& key, bool def) const {
    const std::string* v = find(sec, key);
    if (!v) return def;
    const std::string x = lower(strip(*v));
    if (x == "1" || x == "true" || x == "yes" || x == "on") return true;
    if (x == "0" || x == "false" || x == "no" || x == "off") return false;
    fail(sec, key, "invalid boolean '" + *v + "'");
    return def;
  }

 private:
  [[noreturn]] static void fail(const std::string& sec, const std::string& key, const std::string& what) {
    throw std::runtime_error("[" + sec + "] " + key + ": " + what);
  }

  static double to_number(const std::string& sec, const std::string& key, const std::string& x) {
    char* end = nullptr;
    double out = std::strtod(x.c_str(), &end);
    if (x.empty() || end != x.c_str() + x.size()) fail(sec, key, "invalid number '" + x + "'");
    return out;
  }

  const IniMap& ini_;
};

} // namespace

IniMap parse_ini_text(const std::string& text, const std::string& origin) {
  IniMap ini;
  std::string section = "general";
  ini[section];

  std::istringstream in(text);
  std::string raw;
  for (std::size_t lineno = 1; std::getline(in, raw); ++lineno) {
    const std::string line = strip(raw.substr(0, raw.find_first_of("#;")));
    if (line.empty()) continue;

    auto where = [&]() { return origin + ":" + std::to_string(lineno); };
    if (line.front() == '[') {
      if (line.back() != ']') throw std::runtime_error("INI parse error: unterminated section at " + where());
      section = lower(strip(line.substr(1, line.size() - 2)));
      if (section.empty()) throw std::runtime_error("INI parse error: empty section at " + where());
      ini[section];
      continue;
    }

    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      throw std::runtime_error("INI parse error: expected key=value at " + where());
    }
    const std::string key = strip(line.substr(0, eq));
    if (key.empty()) throw std::runtime_error("INI parse error: empty key at " + where());
    ini[section][key] = strip(line.substr(eq + 1));
  }
  return ini;
}

IniMap parse_ini_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open config INI: " + path);
  std::ostringstream buf;
  buf << in.rdbuf();
  return parse_ini_text(buf.str(), path);
}

ShaperConfig config_from_ini(const IniMap& ini) {
  const Lookup get(ini);
  ShaperConfig cfg;
  cfg.ini_raw = ini;

  cfg.output_dir = get.text("general", "output_dir", cfg.output_dir);
  cfg.omp_threads = get.integer("general", "omp_threads", cfg.omp_threads);

  cfg.touchstone = get.text("channel", "touchstone", cfg.touchstone);
  cfg.parameter = get.text("channel", "parameter", cfg.parameter);

  PulseSpec& p = cfg.pulse;
  p.kind = lower(get.text("pulse", "kind", p.kind));
  p.n_samples = get.count("pulse", "n_samples", p.n_samples);
  p.dt = get.number("pulse", "dt", p.dt);
  p.t0 = get.number("pulse", "t0", p.t0);
  if (get.find("pulse", "center")) p.center = get.number("pulse", "center", 0.0);
  p.width = get.number("pulse", "width", p.width);
  p.amplitude = get.number("pulse", "amplitude", p.amplitude);
  p.file = get.text("pulse", "file", p.file);

  cfg.scaling_limit = get.number("shaping", "scaling_limit", cfg.scaling_limit);

  cfg.verify = get.flag("verify", "enabled", cfg.verify);
  cfg.verify_tol = get.number("verify", "tol", cfg.verify_tol);

  // Sanity
  if (cfg.touchstone.empty()) throw std::runtime_error("[channel] touchstone must be set");
  std::size_t to = 0, from = 0;
  parse_parameter_name(cfg.parameter, to, from);

  static const char* const kinds[] = {"gaussian", "rect", "raised_cosine", "impulse", "file"};
  if (std::find(std::begin(kinds), std::end(kinds), p.kind) == std::end(kinds)) {
    throw std::runtime_error("[pulse] kind must be one of: gaussian, rect, raised_cosine, impulse, file");
  }
  if (p.kind == "file") {
    if (p.file.empty()) throw std::runtime_error("[pulse] kind=file requires file");
  } else {
    if (p.n_samples < 2) throw std::runtime_error("[pulse] n_samples must be >= 2");
    if (!(p.dt > 0.0)) throw std::runtime_error("[pulse] dt must be positive");
    if (p.kind != "impulse" && !(p.width > 0.0)) throw std::runtime_error("[pulse] width must be positive");
  }
  if (!(cfg.scaling_limit > 0.0)) throw std::runtime_error("[shaping] scaling_limit must be positive");
  if (!(cfg.verify_tol > 0.0)) throw std::runtime_error("[verify] tol must be positive");
  if (cfg.omp_threads < 0) throw std::runtime_error("[general] omp_threads must be >= 0");

  return cfg;
}

ShaperConfig load_config(const std::string& ini_path) {
  ShaperConfig cfg = config_from_ini(parse_ini_file(ini_path));

  // Data paths in the INI are relative to the INI itself.
  const fs::path base = fs::path(ini_path).parent_path();
  for (std::string* path : {&cfg.touchstone, &cfg.pulse.file}) {
    if (!path->empty() && fs::path(*path).is_relative()) *path = (base / *path).string();
  }
  return cfg;
}

} // namespace preshape
