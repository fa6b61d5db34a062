#include <preshape/io.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <json-c/json.h>

namespace preshape {

namespace fs = std::filesystem;

namespace {

json_object* json_string(const std::string& s) { return json_object_new_string(s.c_str()); }

json_object* json_string_array(const std::vector<std::string>& items) {
  json_object* arr = json_object_new_array();
  for (const auto& s : items) json_object_array_add(arr, json_string(s));
  return arr;
}

json_object* dataset_object(const DatasetMeta& meta) {
  json_object* o = json_object_new_object();
  json_object_object_add(o, "path", json_string(meta.path));
  json_object_object_add(o, "columns", json_string_array(meta.columns));
  json_object_object_add(o, "description", json_string(meta.description));
  return o;
}

} // namespace

void ensure_dir(const std::string& path) {
  if (!path.empty()) fs::create_directories(path);
}

Pulse read_pulse_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open pulse file: " + path);

  std::vector<double> t;
  std::vector<double> v;
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    std::istringstream row(line);
    std::string first;
    if (!(row >> first) || first[0] == '#' || first[0] == ';') continue;

    double tk = 0.0, vk = 0.0;
    std::istringstream pair(line);
    if (!(pair >> tk >> vk)) {
      throw std::runtime_error("Malformed pulse sample at " + path + ":" + std::to_string(lineno));
    }
    t.push_back(tk);
    v.push_back(vk);
  }

  if (t.size() < 2) throw std::runtime_error("Pulse file needs at least 2 samples: " + path);

  Pulse p;
  try {
    p.axis = TimeAxis::from_samples(t);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string(e.what()) + " in " + path);
  }
  p.v = std::move(v);
  return p;
}

void write_table(const std::string& path, const std::vector<Column>& columns,
                 const std::string& comment) {
  if (columns.empty()) throw std::runtime_error("write_table: no columns for " + path);
  const std::size_t rows = columns.front().values.size();
  for (const auto& c : columns) {
    if (c.values.size() != rows) {
      throw std::runtime_error("write_table: column '" + c.name + "' has " +
                               std::to_string(c.values.size()) + " rows, expected " +
                               std::to_string(rows));
    }
  }

  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write table: " + path);
  out << std::setprecision(12);
  if (!comment.empty()) out << "# " << comment << "\n";
  out << "#";
  for (const auto& c : columns) out << ' ' << c.name;
  out << "\n";

  for (std::size_t r = 0; r < rows; ++r) {
    const char* sep = "";
    for (const auto& c : columns) {
      out << sep << c.values[r];
      sep = " ";
    }
    out << "\n";
  }
  if (!out) throw std::runtime_error("Error while writing table: " + path);
}

std::vector<std::string> column_names(const std::vector<Column>& columns) {
  std::vector<std::string> names;
  names.reserve(columns.size());
  for (const auto& c : columns) names.push_back(c.name);
  return names;
}

void write_results_json(const std::string& output_dir, const ResultsIndex& idx) {
  ensure_dir(output_dir);
  const std::string path = (fs::path(output_dir) / "results.json").string();

  json_object* root = json_object_new_object();
  json_object_object_add(root, "schema_version", json_string(idx.schema_version));
  json_object_object_add(root, "preshape_version", json_string(idx.preshape_version));
  json_object_object_add(root, "config_used", json_string(idx.config_used));

  json_object* inputs = json_object_new_object();
  for (const auto& [key, value] : idx.inputs) {
    json_object_object_add(inputs, key.c_str(), json_string(value));
  }
  json_object_object_add(root, "inputs", inputs);

  // NaN and Inf have no JSON form; they are written as null.
  json_object* summary = json_object_new_object();
  for (const auto& [key, value] : idx.summary) {
    json_object_object_add(summary, key.c_str(),
                           std::isfinite(value) ? json_object_new_double(value) : nullptr);
  }
  json_object_object_add(root, "summary", summary);

  json_object* datasets = json_object_new_object();
  for (const auto& [name, meta] : idx.datasets) {
    json_object_object_add(datasets, name.c_str(), dataset_object(meta));
  }
  json_object_object_add(root, "datasets", datasets);

  const int rc = json_object_to_file_ext(path.c_str(), root, JSON_C_TO_STRING_PRETTY);
  json_object_put(root);
  if (rc != 0) throw std::runtime_error("Cannot write results.json: " + path);
}

void copy_file(const std::string& src, const std::string& dst) {
  std::error_code ec;
  fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
  if (ec) throw std::runtime_error("Cannot copy " + src + " to " + dst + ": " + ec.message());
}

} // namespace preshape
