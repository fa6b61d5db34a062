#include <preshape/config.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

namespace {

preshape::ShaperConfig from_text(const std::string& text) {
  return preshape::config_from_ini(preshape::parse_ini_text(text));
}

} // namespace

TEST(IniParser, SectionsKeysAndComments) {
  auto ini = preshape::parse_ini_text(
      "top = 1\n"
      "[Channel]   ; trailing comment\n"
      "  touchstone = line.s2p   # path\n"
      "\n"
      "[pulse]\n"
      "kind=rect\n");
  EXPECT_EQ(ini.at("general").at("top"), "1");
  EXPECT_EQ(ini.at("channel").at("touchstone"), "line.s2p");
  EXPECT_EQ(ini.at("pulse").at("kind"), "rect");
}

TEST(IniParser, ReportsLineNumbers) {
  try {
    preshape::parse_ini_text("[a]\nx = 1\nnot a pair\n", "cfg.ini");
    FAIL() << "expected a parse error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("cfg.ini:3"), std::string::npos) << e.what();
  }
  EXPECT_THROW(preshape::parse_ini_text("[]\n"), std::runtime_error);
  EXPECT_THROW(preshape::parse_ini_text("[a]\n= 3\n"), std::runtime_error);
}

TEST(ShaperConfig, DefaultsApply) {
  auto cfg = from_text("[channel]\ntouchstone = line.s2p\n");
  EXPECT_EQ(cfg.output_dir, "out");
  EXPECT_EQ(cfg.parameter, "S21");
  EXPECT_DOUBLE_EQ(cfg.scaling_limit, 0.1);
  EXPECT_EQ(cfg.pulse.kind, "gaussian");
  EXPECT_EQ(cfg.pulse.n_samples, 1024u);
  EXPECT_FALSE(cfg.pulse.center.has_value());
  EXPECT_TRUE(cfg.verify);
}

TEST(ShaperConfig, ReadsEverySection) {
  auto cfg = from_text(
      "[general]\noutput_dir = results\nomp_threads = 4\n"
      "[channel]\ntouchstone = cable.s2p\nparameter = S12\n"
      "[pulse]\nkind = Raised_Cosine\nn_samples = 512\ndt = 2e-12\nt0 = -1e-10\n"
      "center = 0\nwidth = 3e-11\namplitude = 0.4\n"
      "[shaping]\nscaling_limit = 0.25\n"
      "[verify]\nenabled = no\ntol = 1e-8\n");
  EXPECT_EQ(cfg.output_dir, "results");
  EXPECT_EQ(cfg.omp_threads, 4);
  EXPECT_EQ(cfg.parameter, "S12");
  EXPECT_EQ(cfg.pulse.kind, "raised_cosine");
  EXPECT_EQ(cfg.pulse.n_samples, 512u);
  EXPECT_DOUBLE_EQ(cfg.pulse.dt, 2e-12);
  EXPECT_DOUBLE_EQ(cfg.pulse.t0, -1e-10);
  ASSERT_TRUE(cfg.pulse.center.has_value());
  EXPECT_DOUBLE_EQ(*cfg.pulse.center, 0.0);
  EXPECT_DOUBLE_EQ(cfg.pulse.width, 3e-11);
  EXPECT_DOUBLE_EQ(cfg.pulse.amplitude, 0.4);
  EXPECT_DOUBLE_EQ(cfg.scaling_limit, 0.25);
  EXPECT_FALSE(cfg.verify);
  EXPECT_DOUBLE_EQ(cfg.verify_tol, 1e-8);
}

TEST(ShaperConfig, SanityChecks) {
  EXPECT_THROW(from_text("[pulse]\nkind = rect\n"), std::runtime_error);
  EXPECT_THROW(from_text("[channel]\ntouchstone = a.s2p\nparameter = T21\n"), std::runtime_error);
  EXPECT_THROW(from_text("[channel]\ntouchstone = a.s2p\n[pulse]\nkind = triangle\n"),
               std::runtime_error);
  EXPECT_THROW(from_text("[channel]\ntouchstone = a.s2p\n[pulse]\nkind = file\n"),
               std::runtime_error);
  EXPECT_THROW(from_text("[channel]\ntouchstone = a.s2p\n[pulse]\nn_samples = 1\n"),
               std::runtime_error);
  EXPECT_THROW(from_text("[channel]\ntouchstone = a.s2p\n[pulse]\ndt = 0\n"), std::runtime_error);
  EXPECT_THROW(from_text("[channel]\ntouchstone = a.s2p\n[pulse]\nn_samples = 1e30\n"),
               std::runtime_error);
  EXPECT_THROW(from_text("[channel]\ntouchstone = a.s2p\n[pulse]\nn_samples = 2.5\n"),
               std::runtime_error);
  EXPECT_THROW(from_text("[general]\nomp_threads = 1e12\n[channel]\ntouchstone = a.s2p\n"),
               std::runtime_error);
  EXPECT_THROW(from_text("[channel]\ntouchstone = a.s2p\n[shaping]\nscaling_limit = 0\n"),
               std::runtime_error);
  EXPECT_THROW(from_text("[channel]\ntouchstone = a.s2p\n[shaping]\nscaling_limit = abc\n"),
               std::runtime_error);
  EXPECT_THROW(from_text("[channel]\ntouchstone = a.s2p\n[verify]\nenabled = maybe\n"),
               std::runtime_error);
}

TEST(ShaperConfig, ResolvesPathsAgainstIniDirectory) {
  namespace fs = std::filesystem;
  fs::path dir = fs::temp_directory_path() / "preshape_config_test";
  fs::create_directories(dir);
  fs::path ini = dir / "run.ini";
  {
    std::ofstream out(ini);
    out << "[channel]\ntouchstone = data/line.s2p\n"
        << "[pulse]\nkind = file\nfile = /abs/pulse.dat\n";
  }
  auto cfg = preshape::load_config(ini.string());
  EXPECT_EQ(fs::path(cfg.touchstone), dir / "data" / "line.s2p");
  EXPECT_EQ(cfg.pulse.file, "/abs/pulse.dat");

  EXPECT_THROW(preshape::load_config((dir / "missing.ini").string()), std::runtime_error);
  fs::remove_all(dir);
}
