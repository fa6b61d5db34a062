#include <preshape/io.hpp>
#include <preshape/pulse.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

TEST(MakePulse, GaussianPeaksAtWindowCenter) {
  preshape::PulseSpec spec;
  spec.kind = "gaussian";
  spec.n_samples = 64;
  spec.dt = 1e-12;
  spec.width = 5e-12;
  spec.amplitude = 2.0;

  auto p = preshape::make_pulse(spec);
  ASSERT_EQ(p.v.size(), 64u);
  EXPECT_NEAR(p.v[32], 2.0, 1e-12);
  EXPECT_NEAR(p.v[37], 2.0 * std::exp(-0.5), 1e-12);
  EXPECT_NEAR(p.v[27], p.v[37], 1e-12);
}

TEST(MakePulse, RectCoversItsWidth) {
  preshape::PulseSpec spec;
  spec.kind = "rect";
  spec.n_samples = 100;
  spec.dt = 1.0;
  spec.center = 50.0;
  spec.width = 10.0;

  auto p = preshape::make_pulse(spec);
  int on = 0;
  for (double v : p.v) {
    if (v != 0.0) ++on;
  }
  EXPECT_EQ(on, 11); // t = 45 .. 55 inclusive
  EXPECT_DOUBLE_EQ(p.v[45], 1.0);
  EXPECT_DOUBLE_EQ(p.v[44], 0.0);
}

TEST(MakePulse, RaisedCosineIsCompact) {
  preshape::PulseSpec spec;
  spec.kind = "raised_cosine";
  spec.n_samples = 40;
  spec.dt = 1.0;
  spec.center = 20.0;
  spec.width = 5.0;

  auto p = preshape::make_pulse(spec);
  EXPECT_DOUBLE_EQ(p.v[20], 1.0);
  EXPECT_NEAR(p.v[25], 0.0, 1e-15);
  EXPECT_DOUBLE_EQ(p.v[26], 0.0);
  EXPECT_DOUBLE_EQ(p.v[14], 0.0);
}

TEST(MakePulse, ImpulseAtNearestSample) {
  preshape::PulseSpec spec;
  spec.kind = "impulse";
  spec.n_samples = 8;
  spec.dt = 1.0;
  spec.t0 = 10.0;
  spec.center = 13.2;

  auto p = preshape::make_pulse(spec);
  EXPECT_DOUBLE_EQ(p.axis.t0(), 10.0);
  for (std::size_t k = 0; k < 8; ++k) EXPECT_DOUBLE_EQ(p.v[k], k == 3 ? 1.0 : 0.0);

  spec.center = 30.0;
  EXPECT_THROW(preshape::make_pulse(spec), std::runtime_error);
}

TEST(MakePulse, RejectsBadSpecs) {
  preshape::PulseSpec spec;
  spec.kind = "sawtooth";
  EXPECT_THROW(preshape::make_pulse(spec), std::runtime_error);

  spec.kind = "gaussian";
  spec.width = 0.0;
  EXPECT_THROW(preshape::make_pulse(spec), std::runtime_error);

  spec.width = 1e-12;
  spec.n_samples = 1;
  EXPECT_THROW(preshape::make_pulse(spec), std::invalid_argument);
}

TEST(ReadPulseFile, ReadsUniformTable) {
  namespace fs = std::filesystem;
  fs::path dir = fs::temp_directory_path() / "preshape_pulse_test";
  fs::create_directories(dir);

  fs::path good = dir / "good.dat";
  {
    std::ofstream out(good);
    out << "# t v\n0 0\n1e-12 0.5\n2e-12 1\n; note\n3e-12 0.5\n";
  }
  preshape::PulseSpec spec;
  spec.kind = "file";
  spec.file = good.string();
  auto p = preshape::make_pulse(spec);
  ASSERT_EQ(p.v.size(), 4u);
  EXPECT_DOUBLE_EQ(p.v[2], 1.0);
  EXPECT_NEAR(p.axis.dt(), 1e-12, 1e-24);

  fs::path uneven = dir / "uneven.dat";
  {
    std::ofstream out(uneven);
    out << "0 0\n1 1\n3 0\n";
  }
  EXPECT_THROW(preshape::read_pulse_file(uneven.string()), std::runtime_error);

  fs::path tiny = dir / "tiny.dat";
  {
    std::ofstream out(tiny);
    out << "0 1\n";
  }
  EXPECT_THROW(preshape::read_pulse_file(tiny.string()), std::runtime_error);
  EXPECT_THROW(preshape::read_pulse_file((dir / "none.dat").string()), std::runtime_error);

  fs::remove_all(dir);
}

TEST(ReadPulseFile, RejectsMalformedRows) {
  namespace fs = std::filesystem;
  fs::path dir = fs::temp_directory_path() / "preshape_pulse_malformed";
  fs::create_directories(dir);
  fs::path bad = dir / "bad.dat";
  {
    std::ofstream out(bad);
    out << "0 0\n1 oops\n2 0\n";
  }
  try {
    preshape::read_pulse_file(bad.string());
    FAIL() << "expected a parse error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find(":2"), std::string::npos) << e.what();
  }
  fs::remove_all(dir);
}

TEST(WriteTable, HeaderAndRows) {
  namespace fs = std::filesystem;
  fs::path dir = fs::temp_directory_path() / "preshape_table_test";
  fs::create_directories(dir);
  fs::path path = dir / "table.dat";

  std::vector<preshape::Column> cols{{"t", {0.0, 1.0}}, {"v", {0.5, -2.0}}};
  preshape::write_table(path.string(), cols, "demo");
  EXPECT_EQ(preshape::column_names(cols), (std::vector<std::string>{"t", "v"}));

  std::ifstream in(path);
  std::string line;
  std::getline(in, line);
  EXPECT_EQ(line, "# demo");
  std::getline(in, line);
  EXPECT_EQ(line, "# t v");
  std::getline(in, line);
  EXPECT_EQ(line, "0 0.5");
  std::getline(in, line);
  EXPECT_EQ(line, "1 -2");

  cols[1].values.pop_back();
  EXPECT_THROW(preshape::write_table(path.string(), cols), std::runtime_error);
  fs::remove_all(dir);
}
