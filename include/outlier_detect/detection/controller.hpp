#pragma once

#include "outlier_detect/astrometry/wcs.hpp"
#include "outlier_detect/config/configuration.hpp"
#include "outlier_detect/core/events.hpp"
#include "outlier_detect/core/exposure.hpp"
#include "outlier_detect/core/types.hpp"
#include "outlier_detect/detection/products.hpp"
#include "outlier_detect/resample/resampler.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace outlier_detect::detection {

class IntermediateStore;

// Non-owning; every pointer must outlive the detect() call.
struct Collaborators {
    resample::Resampler* resampler = nullptr;           // required when resampling
    resample::BackProjector* back_projector = nullptr;  // required when resampling
    ProductSink* sink = nullptr;                        // intermediate products
    OutputPathFn output_path = make_output_path;
    core::EventEmitter* events = nullptr;
    const std::atomic<bool>* stop = nullptr;
};

struct ExposureOutcome {
    std::string name;
    bool ok = false;
    int n_flagged = 0;     // pixels the comparator marked
    int n_dq_updated = 0;  // pixels whose DQ value changed
    std::string error;
};

struct DetectionReport {
    bool reference_built = false;
    size_t n_exposures = 0;
    size_t n_succeeded = 0;
    std::vector<ExposureOutcome> exposures;

    // "no_reference", "complete" or "partial"
    std::string status() const;
};

/**
 * Outlier detection over a set of exposures.
 *
 * Builds a median reference from the (optionally resampled) stack, projects
 * it back onto every exposure, and ORs the outlier flags into each
 * exposure's DQ array. Failures that compromise the reference propagate as
 * exceptions; failures of one exposure are recorded in the report and leave
 * that exposure unchanged.
 */
class OutlierDetection {
public:
    OutlierDetection(config::Config cfg, Collaborators collaborators);

    void detect(std::vector<Exposure>& exposures);

    const DetectionReport& report() const { return report_; }
    const Matrix2Df& reference() const { return reference_; }
    const astrometry::WCS& reference_grid() const { return reference_grid_; }

private:
    void stage_mosaics(const std::vector<Exposure>& exposures, IntermediateStore& store);
    Matrix2Df build_reference(const IntermediateStore& store) const;
    void flag_exposures(std::vector<Exposure>& exposures);
    ExposureOutcome flag_one(Exposure& exposure) const;

    void save_mosaic(const std::string& path, const Matrix2Df& data, const Matrix2Df& weight,
                     const astrometry::WCS& grid);
    void save_reference(const std::string& basepath);

    bool stop_requested() const;
    std::filesystem::path cache_root() const;

    config::Config cfg_;
    Collaborators collab_;
    std::optional<uint32_t> good_bits_;

    DetectionReport report_;
    Matrix2Df reference_;
    astrometry::WCS reference_grid_;
};

} // namespace outlier_detect::detection
