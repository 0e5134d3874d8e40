#include "outlier_detect/detection/controller.hpp"
#include "outlier_detect/core/dq_flags.hpp"
#include "outlier_detect/core/errors.hpp"
#include "outlier_detect/core/parallel.hpp"
#include "outlier_detect/detection/comparator.hpp"
#include "outlier_detect/detection/intermediate_store.hpp"
#include "outlier_detect/detection/mask_writer.hpp"
#include "outlier_detect/detection/median.hpp"
#include "outlier_detect/resample/weights.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace outlier_detect::detection {

namespace fs = std::filesystem;
using core::json;

namespace {

constexpr int kCombineBlockRows = 256;

} // namespace

std::string DetectionReport::status() const {
    if (!reference_built) return "no_reference";
    return n_succeeded == n_exposures ? "complete" : "partial";
}

OutlierDetection::OutlierDetection(config::Config cfg, Collaborators collaborators)
    : cfg_(std::move(cfg)), collab_(std::move(collaborators)) {
    if (!collab_.output_path) {
        collab_.output_path = make_output_path;
    }
}

bool OutlierDetection::stop_requested() const {
    return collab_.stop && collab_.stop->load();
}

fs::path OutlierDetection::cache_root() const {
    if (!cfg_.output.cache_dir.empty()) return cfg_.output.cache_dir;
    if (!cfg_.output.output_dir.empty()) return fs::path(cfg_.output.output_dir) / ".outlier_cache";
    return fs::temp_directory_path() / "outlier_detect_cache";
}

void OutlierDetection::detect(std::vector<Exposure>& exposures) {
    report_ = DetectionReport{};
    reference_ = Matrix2Df();
    reference_grid_ = astrometry::WCS{};

    cfg_.validate();
    good_bits_ = dq::interpret_bit_flags(cfg_.outlier_detection.good_bits);

    const auto& od = cfg_.outlier_detection;
    if (od.resample_data && (!collab_.resampler || !collab_.back_projector)) {
        throw ConfigError("resample_data requires a resampler and a back projector");
    }
    if (exposures.empty()) {
        throw CombineError("no exposures to process");
    }

    report_.n_exposures = exposures.size();
    for (const auto& e : exposures) {
        ExposureOutcome o;
        o.name = e.name;
        report_.exposures.push_back(std::move(o));
    }

    std::cerr << "[OUTLIER] " << exposures.size() << " exposures, resample="
              << (od.resample_data ? "on" : "off") << ", weight_rule=" << od.weight_rule
              << ", maskpt=" << od.maskpt << std::endl;

    {
        IntermediateStore store(od.in_memory, cache_root(), od.maskpt);
        stage_mosaics(exposures, store);

        if (stop_requested()) {
            throw StopRequested();
        }

        if (collab_.events) collab_.events->phase_start(Phase::MEDIAN);
        reference_ = build_reference(store);
        reference_grid_ = store.info(0).grid;
        store.release();
        report_.reference_built = true;

        int n_nan = 0;
        for (Eigen::Index i = 0; i < reference_.size(); ++i) {
            if (!std::isfinite(reference_.data()[i])) ++n_nan;
        }
        std::cerr << "[MEDIAN] reference " << reference_.cols() << "x" << reference_.rows()
                  << " from " << store.size() << " mosaics, " << n_nan
                  << " pixels without consensus" << std::endl;
        if (collab_.events) {
            collab_.events->phase_end(Phase::MEDIAN, "ok",
                                      {{"n_mosaics", store.size()},
                                       {"width", reference_.cols()},
                                       {"height", reference_.rows()},
                                       {"n_no_consensus", n_nan}});
        }
    }

    if (od.save_intermediate_results) {
        save_reference(exposures.front().filename);
    }

    flag_exposures(exposures);

    std::cerr << "[DONE] " << report_.n_succeeded << "/" << report_.n_exposures
              << " exposures processed, status=" << report_.status() << std::endl;
    if (collab_.events) {
        collab_.events->phase_start(Phase::DONE);
        collab_.events->phase_end(Phase::DONE, report_.status(),
                                  {{"n_exposures", report_.n_exposures},
                                   {"n_succeeded", report_.n_succeeded}});
    }
}

void OutlierDetection::stage_mosaics(const std::vector<Exposure>& exposures,
                                     IntermediateStore& store) {
    const auto& od = cfg_.outlier_detection;
    auto* events = collab_.events;

    if (!od.resample_data) {
        if (events) events->phase_start(Phase::WEIGHTS);
        const WeightType wt = string_to_weight_type(od.weight_type);
        for (size_t i = 0; i < exposures.size(); ++i) {
            if (stop_requested()) {
                throw StopRequested();
            }
            if (wt == WeightType::IVM && !exposures[i].has_var_rnoise()) {
                std::cerr << "[WEIGHTS] " << exposures[i].name
                          << ": no VAR_RNOISE, using unit weight" << std::endl;
                if (events) events->warning(exposures[i].name + ": no VAR_RNOISE, using unit weight");
            }
            store.add(resample::make_passthrough(exposures[i], i, wt, good_bits_));
            if (events) {
                events->frame_processed(Phase::WEIGHTS, static_cast<int>(i),
                                        static_cast<int>(exposures.size()), exposures[i].name);
            }
        }
        if (events) events->phase_end(Phase::WEIGHTS, "ok");
        return;
    }

    if (events) events->phase_start(Phase::RESAMPLE);
    const astrometry::WCS grid = collab_.resampler->output_grid(exposures);
    const auto groups = collab_.resampler->group(exposures);
    std::cerr << "[RESAMPLE] output grid " << grid.naxis1 << "x" << grid.naxis2 << ", "
              << groups.size() << " groups" << std::endl;

    for (size_t g = 0; g < groups.size(); ++g) {
        if (stop_requested()) {
            throw StopRequested();
        }
        resample::ResampledMosaic mosaic =
            collab_.resampler->resample_group(exposures, groups[g], grid);
        if (od.save_intermediate_results) {
            save_mosaic(collab_.output_path(mosaic.filename, "_outlier_s2d"), mosaic.data,
                        mosaic.weight, mosaic.grid);
        }
        const std::string name = mosaic.name;
        store.add(std::move(mosaic));
        if (events) {
            events->frame_processed(Phase::RESAMPLE, static_cast<int>(g),
                                    static_cast<int>(groups.size()), name,
                                    {{"n_members", groups[g].size()}});
        }
    }
    if (events) {
        events->phase_end(Phase::RESAMPLE, "ok",
                          {{"n_groups", groups.size()},
                           {"width", grid.naxis1},
                           {"height", grid.naxis2}});
    }
}

Matrix2Df OutlierDetection::build_reference(const IntermediateStore& store) const {
    const auto& od = cfg_.outlier_detection;
    if (store.size() == 0) {
        throw CombineError("empty mosaic stack");
    }

    CombineOptions opts;
    opts.maskpt = od.maskpt;
    opts.rule = string_to_weight_rule(od.weight_rule);
    opts.workers = cfg_.runtime.parallel_workers;
    if (opts.rule == WeightRule::IMAGE_MEAN) {
        opts.weight_thresholds = store.weight_thresholds();
    }

    const int rows = store.rows();
    Matrix2Df reference(rows, store.cols());

    std::vector<Matrix2Df> data(store.size());
    std::vector<Matrix2Df> weight(store.size());
    const int n_blocks = (rows + kCombineBlockRows - 1) / kCombineBlockRows;
    for (int b = 0; b < n_blocks; ++b) {
        const int row0 = b * kCombineBlockRows;
        const int nrows = std::min(kCombineBlockRows, rows - row0);
        for (size_t i = 0; i < store.size(); ++i) {
            store.load_block(i, row0, nrows, data[i], weight[i]);
        }
        reference.middleRows(row0, nrows) = combine(data, weight, opts);
        if (collab_.events) {
            collab_.events->phase_progress(Phase::MEDIAN, b + 1, n_blocks, "combine");
        }
    }
    return reference;
}

ExposureOutcome OutlierDetection::flag_one(Exposure& exposure) const {
    const auto& od = cfg_.outlier_detection;
    ExposureOutcome outcome;
    outcome.name = exposure.name;

    Matrix2Df native_ref;
    if (od.resample_data) {
        native_ref = collab_.back_projector->project(reference_, reference_grid_, exposure);
    } else {
        if (reference_.rows() != exposure.data.rows() ||
            reference_.cols() != exposure.data.cols()) {
            throw ValidationError("reference grid differs from the native grid of " +
                                  exposure.name);
        }
        native_ref = reference_;
    }

    CompareParams params;
    params.snr = od.snr;
    params.scale = od.scale;
    params.backg = od.backg;
    params.resample_was_used = od.resample_data;

    const BoolMatrix mask =
        compare(exposure.data, exposure.has_err() ? exposure.err : Matrix2Df(), native_ref, params);
    outcome.n_flagged = static_cast<int>(mask.count());
    outcome.n_dq_updated =
        apply_outlier_mask(exposure.dq, mask, outlier_flags(od.mark_do_not_use));
    outcome.ok = true;
    return outcome;
}

void OutlierDetection::flag_exposures(std::vector<Exposure>& exposures) {
    auto* events = collab_.events;
    if (events) events->phase_start(Phase::BLOT_COMPARE);

    const size_t n = exposures.size();
    std::atomic<int> done{0};

    core::parallel_for(n, cfg_.runtime.parallel_workers, [&](size_t i) {
        Exposure& e = exposures[i];
        ExposureOutcome& slot = report_.exposures[i];
        if (stop_requested()) {
            slot.error = "skipped: stop requested";
            return;
        }
        try {
            slot = flag_one(e);
        } catch (const std::exception& ex) {
            const PerExposureError err(e.name, ex.what());
            slot.ok = false;
            slot.error = err.what();
            std::cerr << "[BLOT_COMPARE] " << err.what() << std::endl;
            if (events) events->error(err.what());
        }

        const int k = ++done;
        if (events) {
            events->frame_processed(Phase::BLOT_COMPARE, static_cast<int>(i), static_cast<int>(n),
                                    e.name,
                                    {{"ok", slot.ok},
                                     {"n_flagged", slot.n_flagged},
                                     {"n_dq_updated", slot.n_dq_updated}});
            events->phase_progress(Phase::BLOT_COMPARE, k, static_cast<int>(n), e.name);
        }
    });

    report_.n_succeeded = static_cast<size_t>(
        std::count_if(report_.exposures.begin(), report_.exposures.end(),
                      [](const ExposureOutcome& o) { return o.ok; }));

    if (events) {
        events->phase_end(Phase::BLOT_COMPARE,
                          report_.n_succeeded == n ? "ok" : "partial",
                          {{"n_succeeded", report_.n_succeeded}, {"n_exposures", n}});
    }
}

void OutlierDetection::save_mosaic(const std::string& path, const Matrix2Df& data,
                                   const Matrix2Df& weight, const astrometry::WCS& grid) {
    if (!collab_.sink) return;
    try {
        collab_.sink->save_mosaic(path, data, weight, grid);
        std::cerr << "[RESAMPLE] saved " << path << std::endl;
    } catch (const PersistenceError& ex) {
        std::cerr << "[RESAMPLE] " << ex.what() << std::endl;
        if (collab_.events) collab_.events->warning(ex.what());
    }
}

void OutlierDetection::save_reference(const std::string& basepath) {
    if (!collab_.sink) return;
    const std::string path = collab_.output_path(basepath, "_median");
    try {
        collab_.sink->save_reference(path, reference_, reference_grid_);
        std::cerr << "[MEDIAN] saved " << path << std::endl;
    } catch (const PersistenceError& ex) {
        std::cerr << "[MEDIAN] " << ex.what() << std::endl;
        if (collab_.events) collab_.events->warning(ex.what());
    }
}

} // namespace outlier_detect::detection
