#include <preshape/config.hpp>
#include <preshape/grid.hpp>
#include <preshape/io.hpp>
#include <preshape/pulse.hpp>
#include <preshape/shaper.hpp>
#include <preshape/touchstone.hpp>
#include <preshape/transfer.hpp>
#include <preshape/verify.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <numeric>
#include <stdexcept>
#include <string>

#ifdef PRESHAPE_HAS_OPENMP
#include <omp.h>
#endif

namespace {

void print_usage() {
  std::cout << "preshape (channel-inverse pulse pre-distortion)\n"
            << "Usage:\n"
            << "  preshape --config <path/to/config.ini>\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    std::string cfg_path;
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--config" && i + 1 < argc) {
        cfg_path = argv[++i];
      } else if (a == "-h" || a == "--help") {
        print_usage();
        return 0;
      } else {
        std::cerr << "Unknown argument: " << a << "\n";
        print_usage();
        return 2;
      }
    }
    if (cfg_path.empty()) {
      print_usage();
      return 2;
    }

    preshape::ShaperConfig cfg = preshape::load_config(cfg_path);

#ifdef PRESHAPE_HAS_OPENMP
    if (cfg.omp_threads > 0) {
      omp_set_num_threads(cfg.omp_threads);
    }
#endif

    namespace fs = std::filesystem;
    preshape::ensure_dir(cfg.output_dir);
    preshape::copy_file(cfg_path, (fs::path(cfg.output_dir) / "config_used.ini").string());

    // Channel
    preshape::NetworkData net = preshape::read_touchstone(cfg.touchstone);
    std::size_t to = 0, from = 0;
    preshape::parse_parameter_name(cfg.parameter, to, from);
    auto model = preshape::TransferFunctionModel::build(net.parameter(to, from));
    std::cout << "Loaded " << net.size() << " points of " << cfg.parameter << " from "
              << cfg.touchstone << " (band " << model.lower_limit() << " .. "
              << model.upper_limit() << " Hz)\n";

    // Pulse
    preshape::Pulse pulse = preshape::make_pulse(cfg.pulse);
    const std::vector<double>& t = pulse.axis.t();
    const std::vector<preshape::cplx> desired = preshape::to_complex(pulse.v);

    const double nyquist = 0.5 / pulse.axis.dt();
    if (nyquist > model.upper_limit()) {
      std::cout << "Note: pulse Nyquist " << nyquist << " Hz exceeds the measured band; "
                << "bins above " << model.upper_limit() << " Hz are dropped\n";
    }

    // Shape and predict the far-end waveform
    const std::vector<preshape::cplx> shaped =
        preshape::shape_pulse(desired, t, model, cfg.scaling_limit);
    const std::vector<preshape::cplx> received = preshape::filter_pulse(shaped, t, model);

    const std::vector<preshape::cplx> H = preshape::sample_transfer_function(model, t);
    const std::size_t clamped = preshape::clamped_bin_count(H, cfg.scaling_limit);

    // Outputs
    std::vector<preshape::Column> tf_table{{"f", {}}, {"mag", {}}, {"re", {}}, {"im", {}}};
    {
      // Transfer function on the FFT grid, ascending frequency.
      std::vector<double> bins = preshape::fft_frequencies(t.size(), pulse.axis.dt());
      std::vector<std::size_t> order(bins.size());
      std::iota(order.begin(), order.end(), 0);
      std::sort(order.begin(), order.end(),
                [&bins](std::size_t a, std::size_t b) { return bins[a] < bins[b]; });
      for (std::size_t k : order) {
        tf_table[0].values.push_back(bins[k]);
        tf_table[1].values.push_back(std::abs(H[k]));
        tf_table[2].values.push_back(H[k].real());
        tf_table[3].values.push_back(H[k].imag());
      }
    }
    preshape::write_table((fs::path(cfg.output_dir) / "transfer_function.dat").string(), tf_table,
                          cfg.parameter + " on the pulse FFT grid");

    std::vector<preshape::Column> pulse_table{
        {"t", t}, {"desired", pulse.v}, {"shaped_re", {}}, {"shaped_im", {}}, {"received_re", {}}};
    for (std::size_t k = 0; k < t.size(); ++k) {
      pulse_table[2].values.push_back(shaped[k].real());
      pulse_table[3].values.push_back(shaped[k].imag());
      pulse_table[4].values.push_back(received[k].real());
    }
    preshape::write_table((fs::path(cfg.output_dir) / "shaped_pulse.dat").string(), pulse_table,
                          "scaling_limit=" + std::to_string(cfg.scaling_limit));

    preshape::ResultsIndex idx;
    idx.config_used = "config_used.ini";
    idx.inputs["touchstone"] = cfg.touchstone;
    idx.inputs["parameter"] = cfg.parameter;
    idx.inputs["pulse_kind"] = cfg.pulse.kind;
    idx.summary["lower_limit_hz"] = model.lower_limit();
    idx.summary["upper_limit_hz"] = model.upper_limit();
    idx.summary["n_samples"] = static_cast<double>(t.size());
    idx.summary["t0_s"] = pulse.axis.t0();
    idx.summary["dt_s"] = pulse.axis.dt();
    idx.summary["scaling_limit"] = cfg.scaling_limit;
    idx.summary["clamped_bins"] = static_cast<double>(clamped);
    idx.datasets["transfer_function"] = {"transfer_function.dat", preshape::column_names(tf_table),
                                         "Channel response sampled on the pulse FFT grid"};
    idx.datasets["shaped_pulse"] = {"shaped_pulse.dat", preshape::column_names(pulse_table),
                                    "Desired, pre-distorted and predicted received pulse"};

    std::cout << "Shaped " << t.size() << " samples; " << clamped << " of " << H.size()
              << " bins clamped at |H| <= " << cfg.scaling_limit << "\n";

    if (cfg.verify) {
      auto rep = preshape::verify_shaping(desired, t, model, shaped, cfg.scaling_limit,
                                          cfg.verify_tol);
      std::cout << "[verify] symmetry error: " << rep.symmetry_error
                << " (ok=" << (rep.symmetry_ok() ? "true" : "false") << ")\n";
      std::cout << "[verify] passband error: " << rep.passband_error
                << " finite=" << (rep.finite ? "true" : "false")
                << " (ok=" << (rep.passband_ok() ? "true" : "false") << ")\n";
      idx.summary["verify_symmetry_error"] = rep.symmetry_error;
      idx.summary["verify_passband_error"] = rep.passband_error;
      idx.summary["verify_ok"] = rep.all_ok() ? 1.0 : 0.0;
    }

    preshape::write_results_json(cfg.output_dir, idx);

    std::cout << "Done. Output in: " << cfg.output_dir << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
