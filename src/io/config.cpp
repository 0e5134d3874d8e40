#include "outlier_detect/config/configuration.hpp"
#include "outlier_detect/core/dq_flags.hpp"
#include "outlier_detect/core/errors.hpp"
#include "outlier_detect/core/utils.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace outlier_detect::config {

// Accepts either a two element sequence or a whitespace separated string
// ("5.0 4.0").
static void read_float_pair(const YAML::Node& n, const std::string& key,
                            std::array<float, 2>& out) {
    if (!n) return;
    if (n.IsSequence()) {
        if (n.size() != 2) {
            throw ConfigError(key + " must have exactly two values");
        }
        out[0] = n[0].as<float>();
        out[1] = n[1].as<float>();
        return;
    }
    if (n.IsScalar()) {
        std::istringstream iss(n.as<std::string>());
        float a = 0.0f;
        float b = 0.0f;
        std::string extra;
        if (!(iss >> a >> b) || (iss >> extra)) {
            throw ConfigError(key + " must be two numbers, got '" + n.as<std::string>() + "'");
        }
        out[0] = a;
        out[1] = b;
        return;
    }
    throw ConfigError(key + " must be a pair of numbers");
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["outlier_detection"]) {
            auto o = node["outlier_detection"];
            auto& od = cfg.outlier_detection;
            if (o["resample_data"]) od.resample_data = o["resample_data"].as<bool>();
            if (o["weight_type"]) od.weight_type = o["weight_type"].as<std::string>();
            if (o["good_bits"]) {
                od.good_bits = o["good_bits"].IsNull() ? std::string() : o["good_bits"].as<std::string>();
            }
            if (o["maskpt"]) od.maskpt = o["maskpt"].as<float>();
            if (o["weight_rule"]) od.weight_rule = o["weight_rule"].as<std::string>();
            read_float_pair(o["snr"], "outlier_detection.snr", od.snr);
            read_float_pair(o["scale"], "outlier_detection.scale", od.scale);
            if (o["backg"]) od.backg = o["backg"].as<float>();
            if (o["save_intermediate_results"]) {
                od.save_intermediate_results = o["save_intermediate_results"].as<bool>();
            }
            if (o["in_memory"]) od.in_memory = o["in_memory"].as<bool>();
            if (o["mark_do_not_use"]) od.mark_do_not_use = o["mark_do_not_use"].as<bool>();
        }

        if (node["resample"]) {
            auto r = node["resample"];
            if (r["max_grid_pixels"]) cfg.resample.max_grid_pixels = r["max_grid_pixels"].as<long long>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["output_dir"]) cfg.output.output_dir = o["output_dir"].as<std::string>();
            if (o["suffix"]) cfg.output.suffix = o["suffix"].as<std::string>();
            if (o["cache_dir"]) cfg.output.cache_dir = o["cache_dir"].as<std::string>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    const auto& od = outlier_detection;
    node["outlier_detection"]["resample_data"] = od.resample_data;
    node["outlier_detection"]["weight_type"] = od.weight_type;
    node["outlier_detection"]["good_bits"] = od.good_bits;
    node["outlier_detection"]["maskpt"] = od.maskpt;
    node["outlier_detection"]["weight_rule"] = od.weight_rule;
    node["outlier_detection"]["snr"].push_back(od.snr[0]);
    node["outlier_detection"]["snr"].push_back(od.snr[1]);
    node["outlier_detection"]["scale"].push_back(od.scale[0]);
    node["outlier_detection"]["scale"].push_back(od.scale[1]);
    node["outlier_detection"]["backg"] = od.backg;
    node["outlier_detection"]["save_intermediate_results"] = od.save_intermediate_results;
    node["outlier_detection"]["in_memory"] = od.in_memory;
    node["outlier_detection"]["mark_do_not_use"] = od.mark_do_not_use;

    node["resample"]["max_grid_pixels"] = resample.max_grid_pixels;

    node["output"]["output_dir"] = output.output_dir;
    node["output"]["suffix"] = output.suffix;
    node["output"]["cache_dir"] = output.cache_dir;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;

    return node;
}

void Config::save(const fs::path& path) const {
    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot create file: " + path.string());
    }
    YAML::Emitter emitter;
    emitter << to_yaml();
    out << emitter.c_str() << "\n";
}

void Config::validate() const {
    const auto& od = outlier_detection;

    if (od.weight_type != "ivm" && od.weight_type != "exptime" && od.weight_type != "none") {
        throw ValidationError("outlier_detection.weight_type must be 'ivm', 'exptime' or 'none'");
    }
    // Throws ValidationError on unknown mnemonics.
    (void)dq::interpret_bit_flags(od.good_bits);

    if (!(od.maskpt > 0.0f) || od.maskpt > 1.0f) {
        throw ValidationError("outlier_detection.maskpt must be in (0, 1]");
    }
    if (od.weight_rule != "pixel_median" && od.weight_rule != "image_mean") {
        throw ValidationError("outlier_detection.weight_rule must be 'pixel_median' or 'image_mean'");
    }
    if (!(od.snr[0] > 0.0f) || !(od.snr[1] > 0.0f)) {
        throw ValidationError("outlier_detection.snr values must be > 0");
    }
    if (!(od.scale[0] >= 0.0f) || !(od.scale[1] >= 0.0f)) {
        throw ValidationError("outlier_detection.scale values must be >= 0");
    }
    if (!std::isfinite(od.backg)) {
        throw ValidationError("outlier_detection.backg must be finite");
    }

    if (resample.max_grid_pixels <= 0) {
        throw ValidationError("resample.max_grid_pixels must be > 0");
    }
    if (output.suffix.empty()) {
        throw ValidationError("output.suffix must not be empty");
    }
    if (runtime.parallel_workers < 1 || runtime.parallel_workers > 256) {
        throw ValidationError("runtime.parallel_workers must be in [1,256]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "outlier_detection": {
      "type": "object",
      "properties": {
        "resample_data": {"type": "boolean"},
        "weight_type": {"type": "string", "enum": ["ivm", "exptime", "none"]},
        "good_bits": {"type": ["string", "integer", "null"]},
        "maskpt": {"type": "number", "exclusiveMinimum": 0, "maximum": 1},
        "weight_rule": {"type": "string", "enum": ["pixel_median", "image_mean"]},
        "snr": {"type": ["array", "string"], "items": {"type": "number"}, "minItems": 2, "maxItems": 2},
        "scale": {"type": ["array", "string"], "items": {"type": "number"}, "minItems": 2, "maxItems": 2},
        "backg": {"type": "number"},
        "save_intermediate_results": {"type": "boolean"},
        "in_memory": {"type": "boolean"},
        "mark_do_not_use": {"type": "boolean"}
      }
    },
    "resample": {
      "type": "object",
      "properties": {
        "max_grid_pixels": {"type": "integer", "minimum": 1}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "output_dir": {"type": "string"},
        "suffix": {"type": "string", "minLength": 1},
        "cache_dir": {"type": "string"}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 256}
      }
    }
  }
})";
}

} // namespace outlier_detect::config
