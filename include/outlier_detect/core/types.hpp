#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <string>

namespace outlier_detect {

namespace fs = std::filesystem;

// Matrix types (NumPy equivalents)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using DQMatrix = Eigen::Matrix<uint32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using BoolMatrix = Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;

// Drizzle weighting scheme
enum class WeightType {
    IVM,      // inverse read-noise variance
    EXPTIME,  // exposure time
    NONE      // unit weight
};

inline std::string weight_type_to_string(WeightType t) {
    switch (t) {
        case WeightType::IVM: return "ivm";
        case WeightType::EXPTIME: return "exptime";
        case WeightType::NONE: return "none";
        default: return "none";
    }
}

inline WeightType string_to_weight_type(const std::string& s) {
    if (s == "ivm") return WeightType::IVM;
    if (s == "exptime") return WeightType::EXPTIME;
    return WeightType::NONE;
}

// Reference weight statistic used by the median combiner
enum class WeightRule {
    PIXEL_MEDIAN,
    IMAGE_MEAN
};

inline std::string weight_rule_to_string(WeightRule r) {
    switch (r) {
        case WeightRule::PIXEL_MEDIAN: return "pixel_median";
        case WeightRule::IMAGE_MEAN: return "image_mean";
        default: return "pixel_median";
    }
}

inline WeightRule string_to_weight_rule(const std::string& s) {
    if (s == "image_mean") return WeightRule::IMAGE_MEAN;
    return WeightRule::PIXEL_MEDIAN;
}

// Pipeline phase enumeration
enum class Phase {
    WEIGHTS = 0,
    RESAMPLE = 1,
    MEDIAN = 2,
    BLOT_COMPARE = 3,
    DONE = 4
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::WEIGHTS: return "WEIGHTS";
        case Phase::RESAMPLE: return "RESAMPLE";
        case Phase::MEDIAN: return "MEDIAN";
        case Phase::BLOT_COMPARE: return "BLOT_COMPARE";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace outlier_detect
