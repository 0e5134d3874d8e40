#include "outlier_detect/resample/resampler.hpp"
#include "outlier_detect/core/errors.hpp"
#include "outlier_detect/resample/weights.hpp"

#include <opencv2/opencv.hpp>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <map>

namespace outlier_detect::resample {

using astrometry::WCS;

namespace {

constexpr float kUnmapped = -1.0e6f;

WCS native_grid(const Exposure& e) {
    WCS w = e.wcs;
    w.naxis1 = e.cols();
    w.naxis2 = e.rows();
    return w;
}

// For every pixel of dst, the (x, y) position in src that lands on it.
// Pixels without a valid mapping get kUnmapped.
void build_maps(const WCS& dst, const WCS& src, cv::Mat& map_x, cv::Mat& map_y) {
    map_x.create(dst.naxis2, dst.naxis1, CV_32F);
    map_y.create(dst.naxis2, dst.naxis1, CV_32F);

    if (dst.same_grid(src)) {
        for (int y = 0; y < dst.naxis2; ++y) {
            float* mx = map_x.ptr<float>(y);
            float* my = map_y.ptr<float>(y);
            for (int x = 0; x < dst.naxis1; ++x) {
                mx[x] = static_cast<float>(x);
                my[x] = static_cast<float>(y);
            }
        }
        return;
    }

    for (int y = 0; y < dst.naxis2; ++y) {
        float* mx = map_x.ptr<float>(y);
        float* my = map_y.ptr<float>(y);
        for (int x = 0; x < dst.naxis1; ++x) {
            double ra = 0.0;
            double dec = 0.0;
            double px = 0.0;
            double py = 0.0;
            dst.pixel_to_sky(x, y, ra, dec);
            if (src.sky_to_pixel(ra, dec, px, py)) {
                mx[x] = static_cast<float>(px);
                my[x] = static_cast<float>(py);
            } else {
                mx[x] = kUnmapped;
                my[x] = kUnmapped;
            }
        }
    }
}

cv::Mat as_mat(const Matrix2Df& m) {
    return cv::Mat(static_cast<int>(m.rows()), static_cast<int>(m.cols()), CV_32F,
                   const_cast<float*>(m.data()));
}

Matrix2Df to_matrix(const cv::Mat& m) {
    Matrix2Df out(m.rows, m.cols);
    for (int y = 0; y < m.rows; ++y) {
        std::memcpy(out.data() + static_cast<size_t>(y) * static_cast<size_t>(m.cols),
                    m.ptr<float>(y), static_cast<size_t>(m.cols) * sizeof(float));
    }
    return out;
}

} // namespace

std::vector<std::vector<size_t>> Resampler::group(const std::vector<Exposure>& exposures) const {
    std::vector<std::vector<size_t>> groups;
    std::map<std::string, size_t> index_of;
    for (size_t i = 0; i < exposures.size(); ++i) {
        const std::string& key = exposures[i].group_id;
        if (key.empty()) {
            groups.push_back({i});
            continue;
        }
        auto it = index_of.find(key);
        if (it == index_of.end()) {
            index_of[key] = groups.size();
            groups.push_back({i});
        } else {
            groups[it->second].push_back(i);
        }
    }
    return groups;
}

std::vector<Mosaic> Resampler::resample(const std::vector<Exposure>& exposures) {
    const WCS grid = output_grid(exposures);
    std::vector<Mosaic> mosaics;
    for (const auto& members : group(exposures)) {
        mosaics.emplace_back(resample_group(exposures, members, grid));
    }
    return mosaics;
}

WcsResampler::WcsResampler(WeightType weight_type, std::optional<uint32_t> good_bits,
                           long long max_grid_pixels)
    : weight_type_(weight_type), good_bits_(good_bits), max_grid_pixels_(max_grid_pixels) {}

WCS WcsResampler::output_grid(const std::vector<Exposure>& exposures) {
    if (exposures.empty()) {
        throw ResampleError("no exposures to build an output grid from");
    }

    const WCS base = native_grid(exposures.front());
    if (!base.valid()) {
        throw ResampleError("invalid WCS for " + exposures.front().name);
    }

    double min_x = std::numeric_limits<double>::max();
    double min_y = std::numeric_limits<double>::max();
    double max_x = std::numeric_limits<double>::lowest();
    double max_y = std::numeric_limits<double>::lowest();

    for (const auto& e : exposures) {
        const WCS w = native_grid(e);
        if (!w.valid()) {
            throw ResampleError("invalid WCS for " + e.name);
        }
        // Pixel edges and edge midpoints of the footprint
        const double xe = w.naxis1 - 0.5;
        const double ye = w.naxis2 - 0.5;
        const double xm = 0.5 * (w.naxis1 - 1);
        const double ym = 0.5 * (w.naxis2 - 1);
        const double pts[8][2] = {
            {-0.5, -0.5}, {xe, -0.5}, {-0.5, ye}, {xe, ye},
            {xm, -0.5}, {xm, ye}, {-0.5, ym}, {xe, ym},
        };
        for (const auto& p : pts) {
            double ra = 0.0;
            double dec = 0.0;
            double ox = 0.0;
            double oy = 0.0;
            w.pixel_to_sky(p[0], p[1], ra, dec);
            if (!base.sky_to_pixel(ra, dec, ox, oy) || !std::isfinite(ox) || !std::isfinite(oy)) {
                throw ResampleError("footprint of " + e.name +
                                    " cannot be projected onto the output grid");
            }
            min_x = std::min(min_x, ox);
            min_y = std::min(min_y, oy);
            max_x = std::max(max_x, ox);
            max_y = std::max(max_y, oy);
        }
    }

    constexpr double eps = 1e-6;
    const long long x0 = static_cast<long long>(std::floor(min_x + 0.5 + eps));
    const long long y0 = static_cast<long long>(std::floor(min_y + 0.5 + eps));
    const long long x1 = static_cast<long long>(std::ceil(max_x - 0.5 - eps));
    const long long y1 = static_cast<long long>(std::ceil(max_y - 0.5 - eps));
    const long long width = x1 - x0 + 1;
    const long long height = y1 - y0 + 1;

    if (width <= 0 || height <= 0) {
        throw ResampleError("degenerate output grid");
    }
    if (width > std::numeric_limits<short>::max() || height > std::numeric_limits<short>::max() ||
        width * height > max_grid_pixels_) {
        throw ResampleError("output grid " + std::to_string(width) + "x" + std::to_string(height) +
                            " exceeds the configured limit");
    }

    return base.shifted(static_cast<int>(x0), static_cast<int>(y0),
                        static_cast<int>(width), static_cast<int>(height));
}

ResampledMosaic WcsResampler::resample_group(const std::vector<Exposure>& exposures,
                                             const std::vector<size_t>& members,
                                             const WCS& grid) {
    if (members.empty()) {
        throw ResampleError("empty exposure group");
    }
    if (!grid.valid()) {
        throw ResampleError("invalid output grid");
    }

    cv::Mat num = cv::Mat::zeros(grid.naxis2, grid.naxis1, CV_32F);
    cv::Mat den = cv::Mat::zeros(grid.naxis2, grid.naxis1, CV_32F);

    for (size_t idx : members) {
        if (idx >= exposures.size()) {
            throw ResampleError("group member index out of range");
        }
        const Exposure& e = exposures[idx];
        const WCS src = native_grid(e);
        if (!src.valid()) {
            throw ResampleError("invalid WCS for " + e.name);
        }

        Matrix2Df weight = build_weight(e, weight_type_, good_bits_);
        Matrix2Df weighted(e.rows(), e.cols());
        for (Eigen::Index i = 0; i < weighted.size(); ++i) {
            const float w = weight.data()[i];
            weighted.data()[i] = w > 0.0f ? e.data.data()[i] * w : 0.0f;
        }

        cv::Mat map_x;
        cv::Mat map_y;
        build_maps(grid, src, map_x, map_y);

        cv::Mat dw;
        cv::Mat ww;
        try {
            cv::remap(as_mat(weighted), dw, map_x, map_y, cv::INTER_LINEAR,
                      cv::BORDER_CONSTANT, cv::Scalar(0.0));
            cv::remap(as_mat(weight), ww, map_x, map_y, cv::INTER_LINEAR,
                      cv::BORDER_CONSTANT, cv::Scalar(0.0));
        } catch (const cv::Exception& ex) {
            throw ResampleError("remap failed for " + e.name + ": " + ex.what());
        }
        num += dw;
        den += ww;
    }

    ResampledMosaic mosaic;
    const Exposure& first = exposures[members.front()];
    mosaic.name = first.group_id.empty() ? first.name : first.group_id;
    mosaic.filename = first.filename;
    mosaic.grid = grid;
    mosaic.members = members;
    mosaic.weight = to_matrix(den);
    mosaic.data = to_matrix(num);
    for (Eigen::Index i = 0; i < mosaic.data.size(); ++i) {
        float& w = mosaic.weight.data()[i];
        if (w > 0.0f) {
            mosaic.data.data()[i] /= w;
        } else {
            w = 0.0f;
            mosaic.data.data()[i] = 0.0f;
        }
    }
    return mosaic;
}

Matrix2Df WcsBackProjector::project(const Matrix2Df& reference, const WCS& grid,
                                    const Exposure& target) {
    if (reference.rows() != grid.naxis2 || reference.cols() != grid.naxis1) {
        throw ValidationError("reference shape does not match its grid");
    }
    const WCS dst = native_grid(target);
    if (!dst.valid()) {
        throw ResampleError("invalid WCS for " + target.name);
    }

    cv::Mat map_x;
    cv::Mat map_y;
    build_maps(dst, grid, map_x, map_y);

    cv::Mat blotted;
    try {
        cv::remap(as_mat(reference), blotted, map_x, map_y, cv::INTER_LINEAR,
                  cv::BORDER_REPLICATE);
    } catch (const cv::Exception& ex) {
        throw ResampleError("blot failed for " + target.name + ": " + ex.what());
    }

    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float x_max = static_cast<float>(grid.naxis1) - 0.5f;
    const float y_max = static_cast<float>(grid.naxis2) - 0.5f;
    for (int y = 0; y < blotted.rows; ++y) {
        float* row = blotted.ptr<float>(y);
        const float* mx = map_x.ptr<float>(y);
        const float* my = map_y.ptr<float>(y);
        for (int x = 0; x < blotted.cols; ++x) {
            if (mx[x] < -0.5f || my[x] < -0.5f || mx[x] > x_max || my[x] > y_max) {
                row[x] = nan;
            }
        }
    }
    return to_matrix(blotted);
}

} // namespace outlier_detect::resample
