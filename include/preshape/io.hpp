#pragma once

#include <preshape/pulse.hpp>

#include <map>
#include <string>
#include <vector>

namespace preshape {

struct Column {
  std::string name;
  std::vector<double> values;
};

struct DatasetMeta {
  std::string path;                  // relative to output_dir
  std::vector<std::string> columns;
  std::string description;
};

struct ResultsIndex {
  std::string schema_version = "preshape.results.v1";
  std::string preshape_version = "0.1.0";
  std::string config_used;

  std::map<std::string, std::string> inputs;   // touchstone, parameter, pulse kind
  std::map<std::string, double> summary;       // band limits, clamp counts, verification
  std::map<std::string, DatasetMeta> datasets;
};

void ensure_dir(const std::string& path);

// Two columns "t value"; blank lines and lines starting with '#' or ';' are
// skipped. Throws on malformed rows, fewer than 2 samples or uneven spacing.
Pulse read_pulse_file(const std::string& path);

// Whitespace table: optional "# comment" line, "# name ..." header, then rows.
// All columns must have the same length.
void write_table(const std::string& path, const std::vector<Column>& columns,
                 const std::string& comment = "");

std::vector<std::string> column_names(const std::vector<Column>& columns);

void write_results_json(const std::string& output_dir, const ResultsIndex& idx);

void copy_file(const std::string& src, const std::string& dst);

} // namespace preshape
