#include "outlier_detect/config/configuration.hpp"
#include "outlier_detect/core/errors.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <fstream>

namespace cfgns = outlier_detect::config;

TEST_CASE("config_defaults_are_valid") {
    cfgns::Config cfg;
    REQUIRE(cfg.outlier_detection.resample_data);
    REQUIRE(cfg.outlier_detection.weight_type == "ivm");
    REQUIRE(cfg.outlier_detection.good_bits == "~DO_NOT_USE+NON_SCIENCE");
    REQUIRE(cfg.outlier_detection.maskpt == Catch::Approx(0.7f));
    REQUIRE(cfg.outlier_detection.snr[0] == Catch::Approx(5.0f));
    REQUIRE(cfg.outlier_detection.snr[1] == Catch::Approx(4.0f));
    REQUIRE(cfg.outlier_detection.scale[0] == Catch::Approx(1.2f));
    REQUIRE(cfg.outlier_detection.scale[1] == Catch::Approx(0.7f));
    REQUIRE(cfg.output.suffix == "crf");
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_parses_outlier_detection_section") {
    YAML::Node node = YAML::Load(R"(
outlier_detection:
  resample_data: false
  weight_type: exptime
  good_bits: "~DO_NOT_USE"
  maskpt: 0.3
  weight_rule: image_mean
  snr: "6.0 3.5"
  scale: [1.0, 0.0]
  backg: 1.5
  save_intermediate_results: true
  in_memory: false
  mark_do_not_use: false
resample:
  max_grid_pixels: 5000
output:
  suffix: "cr"
runtime:
  parallel_workers: 2
)");

    auto cfg = cfgns::Config::from_yaml(node);
    const auto& od = cfg.outlier_detection;
    REQUIRE_FALSE(od.resample_data);
    REQUIRE(od.weight_type == "exptime");
    REQUIRE(od.maskpt == Catch::Approx(0.3f));
    REQUIRE(od.weight_rule == "image_mean");
    REQUIRE(od.snr[0] == Catch::Approx(6.0f));
    REQUIRE(od.snr[1] == Catch::Approx(3.5f));
    REQUIRE(od.scale[0] == Catch::Approx(1.0f));
    REQUIRE(od.scale[1] == Catch::Approx(0.0f));
    REQUIRE(od.backg == Catch::Approx(1.5f));
    REQUIRE(od.save_intermediate_results);
    REQUIRE_FALSE(od.in_memory);
    REQUIRE_FALSE(od.mark_do_not_use);
    REQUIRE(cfg.resample.max_grid_pixels == 5000);
    REQUIRE(cfg.output.suffix == "cr");
    REQUIRE(cfg.runtime.parallel_workers == 2);
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_rejects_out_of_range_values") {
    cfgns::Config cfg;
    cfg.outlier_detection.maskpt = 0.0f;
    REQUIRE_THROWS_AS(cfg.validate(), outlier_detect::ValidationError);

    cfg = cfgns::Config{};
    cfg.outlier_detection.weight_type = "wht";
    REQUIRE_THROWS_AS(cfg.validate(), outlier_detect::ValidationError);

    cfg = cfgns::Config{};
    cfg.outlier_detection.good_bits = "NOT_A_FLAG";
    REQUIRE_THROWS_AS(cfg.validate(), outlier_detect::ValidationError);

    cfg = cfgns::Config{};
    cfg.outlier_detection.snr = {0.0f, 4.0f};
    REQUIRE_THROWS_AS(cfg.validate(), outlier_detect::ValidationError);

    cfg = cfgns::Config{};
    cfg.outlier_detection.weight_rule = "mode";
    REQUIRE_THROWS_AS(cfg.validate(), outlier_detect::ValidationError);

    cfg = cfgns::Config{};
    cfg.runtime.parallel_workers = 0;
    REQUIRE_THROWS_AS(cfg.validate(), outlier_detect::ValidationError);
}

TEST_CASE("config_reports_malformed_values_as_config_error") {
    YAML::Node bad_pair = YAML::Load("outlier_detection:\n  snr: [1.0, 2.0, 3.0]\n");
    REQUIRE_THROWS_AS(cfgns::Config::from_yaml(bad_pair), outlier_detect::ConfigError);

    YAML::Node bad_type = YAML::Load("outlier_detection:\n  maskpt: high\n");
    REQUIRE_THROWS_AS(cfgns::Config::from_yaml(bad_type), outlier_detect::ConfigError);

    REQUIRE_THROWS_AS(cfgns::Config::load("/nonexistent/outlier.yaml"),
                      outlier_detect::ConfigError);
}

TEST_CASE("config_save_and_load_preserve_values") {
    outlier_detect::testing::TempDir dir;
    cfgns::Config cfg;
    cfg.outlier_detection.maskpt = 0.5f;
    cfg.outlier_detection.snr = {7.0f, 2.0f};
    cfg.outlier_detection.weight_rule = "image_mean";
    cfg.output.cache_dir = "/tmp/cache";

    const auto path = dir.path() / "config.yaml";
    cfg.save(path);
    auto loaded = cfgns::Config::load(path);

    REQUIRE(loaded.outlier_detection.maskpt == Catch::Approx(0.5f));
    REQUIRE(loaded.outlier_detection.snr[0] == Catch::Approx(7.0f));
    REQUIRE(loaded.outlier_detection.snr[1] == Catch::Approx(2.0f));
    REQUIRE(loaded.outlier_detection.weight_rule == "image_mean");
    REQUIRE(loaded.output.cache_dir == "/tmp/cache");
}

TEST_CASE("config_schema_lists_sections") {
    const std::string schema = cfgns::get_schema_json();
    REQUIRE(schema.find("\"outlier_detection\"") != std::string::npos);
    REQUIRE(schema.find("\"maskpt\"") != std::string::npos);
    REQUIRE(schema.find("\"runtime\"") != std::string::npos);
}
