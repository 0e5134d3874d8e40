#include "runner_shared.hpp"

#include "outlier_detect/config/configuration.hpp"
#include "outlier_detect/core/dq_flags.hpp"
#include "outlier_detect/core/errors.hpp"
#include "outlier_detect/core/events.hpp"
#include "outlier_detect/core/utils.hpp"
#include "outlier_detect/detection/controller.hpp"
#include "outlier_detect/io/fits_io.hpp"
#include "outlier_detect/resample/resampler.hpp"

#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using namespace outlier_detect;

std::atomic<bool> g_stop{false};

void handle_sigint(int) { g_stop.store(true); }

int run_command(const std::string &config_path, const std::string &input_dir,
                const std::string &output_dir_override, const std::string &pattern,
                int max_frames) {
  const fs::path in_dir(input_dir);
  if (!fs::is_directory(in_dir)) {
    std::cerr << "Error: Input directory not found: " << input_dir << std::endl;
    return 1;
  }
  if (!fs::exists(config_path)) {
    std::cerr << "Error: Config file not found: " << config_path << std::endl;
    return 1;
  }

  config::Config cfg;
  std::string config_hash;
  try {
    cfg = config::Config::load(config_path);
    if (!output_dir_override.empty()) {
      cfg.output.output_dir = output_dir_override;
    }
    if (cfg.output.output_dir.empty()) {
      cfg.output.output_dir = (in_dir / "outlier_detect").string();
    }
    cfg.validate();
    config_hash = core::sha256_file(config_path);
  } catch (const OutlierDetectError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  const auto frames = runner::collect_inputs(in_dir, pattern, max_frames);
  if (frames.empty()) {
    std::cerr << "Error: No FITS frames found in " << input_dir << std::endl;
    return 1;
  }

  const fs::path out_dir = fs::absolute(cfg.output.output_dir);
  std::error_code ec;
  fs::create_directories(out_dir, ec);
  if (ec) {
    std::cerr << "Error: cannot create output directory " << out_dir << ": "
              << ec.message() << std::endl;
    return 1;
  }

  std::ofstream event_log_file(out_dir / "events.jsonl", std::ios::out | std::ios::trunc);
  if (!event_log_file.is_open()) {
    std::cerr << "Error: cannot open events log file: " << (out_dir / "events.jsonl")
              << std::endl;
    return 1;
  }
  runner::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_stream(&tee_buf);

  const std::string run_id = core::get_run_id();
  core::EventEmitter emitter(run_id, log_stream);
  emitter.run_start({{"config_path", config_path},
                     {"config_sha256", config_hash},
                     {"input_dir", input_dir},
                     {"output_dir", out_dir.string()},
                     {"frames_discovered", frames.size()},
                     {"input_bytes", runner::format_bytes(
                                         runner::estimate_total_file_bytes(frames))}});

  std::vector<Exposure> exposures;
  exposures.reserve(frames.size());
  try {
    for (const auto &p : frames) {
      exposures.push_back(io::read_exposure(p));
    }
  } catch (const OutlierDetectError &e) {
    std::cerr << "Error while reading inputs: " << e.what() << std::endl;
    emitter.error(e.what());
    emitter.run_end(false, "error");
    return 1;
  }

  const auto &od = cfg.outlier_detection;
  resample::WcsResampler resampler(string_to_weight_type(od.weight_type),
                                   dq::interpret_bit_flags(od.good_bits),
                                   cfg.resample.max_grid_pixels);
  resample::WcsBackProjector back_projector;
  io::FitsProductSink sink;

  detection::Collaborators collab;
  collab.resampler = &resampler;
  collab.back_projector = &back_projector;
  collab.sink = &sink;
  collab.output_path = [out_dir](const std::string &base, const std::string &suffix) {
    return runner::output_path_in(out_dir, base, suffix);
  };
  collab.events = &emitter;
  collab.stop = &g_stop;

  std::signal(SIGINT, handle_sigint);

  detection::OutlierDetection detection(cfg, collab);
  try {
    detection.detect(exposures);
  } catch (const StopRequested &e) {
    std::cerr << e.what() << std::endl;
    emitter.run_end(false, "stopped");
    return 1;
  } catch (const OutlierDetectError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(e.what());
    emitter.run_end(false, "no_reference", {{"error", e.what()}});
    return 1;
  }

  const auto &report = detection.report();
  size_t n_written = 0;
  for (size_t i = 0; i < exposures.size(); ++i) {
    if (!report.exposures[i].ok) continue;
    const std::string path =
        runner::output_path_in(out_dir, exposures[i].filename, cfg.output.suffix);
    try {
      io::write_exposure(path, exposures[i]);
      ++n_written;
    } catch (const IOError &e) {
      std::cerr << "[DONE] " << e.what() << std::endl;
      emitter.error(e.what());
    }
  }

  std::string status = report.status();
  if (status == "complete" && n_written != exposures.size()) {
    status = "partial";
  }
  emitter.run_end(status != "no_reference", status,
                  {{"n_exposures", report.n_exposures},
                   {"n_succeeded", report.n_succeeded},
                   {"n_written", n_written}});
  std::cout << "Output: " << out_dir.string() << std::endl;
  return runner::exit_code_for_status(status);
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Outlier Detection Runner"};

  std::string config_path, input_dir, output_dir;
  std::string pattern = "*.fits";
  int max_frames = 0;

  auto run_cmd = app.add_subcommand("run", "Flag outliers in a set of exposures");
  run_cmd->add_option("--config", config_path, "Path to config.yaml")->required();
  run_cmd->add_option("--input-dir", input_dir, "Input directory")->required();
  run_cmd->add_option("--output-dir", output_dir,
                      "Output directory (overrides output.output_dir)");
  run_cmd->add_option("--pattern", pattern, "Input file glob")->default_val("*.fits");
  run_cmd->add_option("--max-frames", max_frames,
                      "Limit number of exposures (0 = no limit)");

  auto schema_cmd = app.add_subcommand("schema", "Print the configuration JSON schema");

  app.require_subcommand(1);
  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_command(config_path, input_dir, output_dir, pattern, max_frames);
  }
  if (schema_cmd->parsed()) {
    std::cout << config::get_schema_json() << std::endl;
    return 0;
  }
  return 1;
}
