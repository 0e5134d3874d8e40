#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace outlier_detect::config {

namespace fs = std::filesystem;

struct OutlierDetectionConfig {
  bool resample_data = true;
  std::string weight_type = "ivm";                  // ivm | exptime | none
  std::string good_bits = "~DO_NOT_USE+NON_SCIENCE";
  float maskpt = 0.7f;
  std::string weight_rule = "pixel_median";         // pixel_median | image_mean
  std::array<float, 2> snr{5.0f, 4.0f};
  std::array<float, 2> scale{1.2f, 0.7f};
  float backg = 0.0f;
  bool save_intermediate_results = false;
  bool in_memory = true;
  bool mark_do_not_use = true;                      // also set DO_NOT_USE on outliers
};

struct ResampleConfig {
  long long max_grid_pixels = 100000000;
};

struct OutputConfig {
  std::string output_dir;
  std::string suffix = "crf";
  std::string cache_dir; // empty = <output_dir>/.outlier_cache
};

struct RuntimeConfig {
  int parallel_workers = 4;
};

struct Config {
  OutlierDetectionConfig outlier_detection;
  ResampleConfig resample;
  OutputConfig output;
  RuntimeConfig runtime;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace outlier_detect::config
