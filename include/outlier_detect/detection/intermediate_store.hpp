#pragma once

#include "outlier_detect/astrometry/wcs.hpp"
#include "outlier_detect/core/types.hpp"
#include "outlier_detect/resample/mosaic.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace outlier_detect::detection {

// Raw float32 planes on disk, one file per (slot, plane). The directory is
// removed on destruction.
class DiskPlaneCache {
public:
    DiskPlaneCache() = default;
    DiskPlaneCache(const std::filesystem::path& cache_dir, int rows, int cols);
    ~DiskPlaneCache();

    DiskPlaneCache(const DiskPlaneCache&) = delete;
    DiskPlaneCache& operator=(const DiskPlaneCache&) = delete;
    DiskPlaneCache(DiskPlaneCache&& o) noexcept;
    DiskPlaneCache& operator=(DiskPlaneCache&& o) noexcept;

    // Throw IOError when the file cannot be written or read back.
    void store(const std::string& key, const Matrix2Df& plane);
    Matrix2Df load_rows(const std::string& key, int row0, int nrows) const;

    const std::filesystem::path& dir() const { return cache_dir_; }
    void cleanup() noexcept;

private:
    std::filesystem::path plane_path(const std::string& key) const;

    std::filesystem::path cache_dir_;
    int rows_ = 0;
    int cols_ = 0;
    size_t plane_bytes_ = 0;
};

struct StoredMosaicInfo {
    std::string name;
    std::string filename;
    astrometry::WCS grid;
    bool resampled = false;
    // maskpt x clipped mean weight; used by the image_mean combine rule
    float weight_threshold = 0.0f;
};

/**
 * Holds the mosaic stack between resampling and median combination, either
 * in memory or spilled to a private cache directory. All mosaics must share
 * one grid shape. Disk storage is released on release() or destruction.
 */
class IntermediateStore {
public:
    IntermediateStore(bool in_memory, const std::filesystem::path& cache_root, float maskpt);
    ~IntermediateStore();

    IntermediateStore(const IntermediateStore&) = delete;
    IntermediateStore& operator=(const IntermediateStore&) = delete;

    void add(resample::Mosaic&& mosaic);

    size_t size() const { return info_.size(); }
    int rows() const { return rows_; }
    int cols() const { return cols_; }
    bool in_memory() const { return in_memory_; }
    bool released() const { return released_; }

    const StoredMosaicInfo& info(size_t i) const;
    std::vector<float> weight_thresholds() const;

    // Rows [row0, row0 + nrows) of mosaic i.
    void load_block(size_t i, int row0, int nrows, Matrix2Df& data, Matrix2Df& weight) const;
    void load(size_t i, Matrix2Df& data, Matrix2Df& weight) const;

    // Directory holding spilled planes, empty when in memory.
    std::filesystem::path cache_dir() const;

    void release();

private:
    bool in_memory_;
    std::filesystem::path cache_root_;
    float maskpt_;
    bool released_ = false;
    int rows_ = 0;
    int cols_ = 0;

    std::vector<StoredMosaicInfo> info_;
    std::vector<Matrix2Df> data_;
    std::vector<Matrix2Df> weight_;
    DiskPlaneCache disk_;
};

} // namespace outlier_detect::detection
