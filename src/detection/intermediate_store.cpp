#include "outlier_detect/detection/intermediate_store.hpp"
#include "outlier_detect/core/errors.hpp"
#include "outlier_detect/core/utils.hpp"
#include "outlier_detect/detection/median.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

namespace outlier_detect::detection {

namespace fs = std::filesystem;

DiskPlaneCache::DiskPlaneCache(const fs::path& cache_dir, int rows, int cols)
    : cache_dir_(cache_dir), rows_(rows), cols_(cols),
      plane_bytes_(static_cast<size_t>(rows) * static_cast<size_t>(cols) * sizeof(float)) {
    std::error_code ec;
    fs::create_directories(cache_dir_, ec);
    if (ec) {
        throw IOError("cannot create cache directory " + cache_dir_.string() + ": " + ec.message());
    }
}

DiskPlaneCache::~DiskPlaneCache() { cleanup(); }

DiskPlaneCache::DiskPlaneCache(DiskPlaneCache&& o) noexcept
    : cache_dir_(std::move(o.cache_dir_)), rows_(o.rows_), cols_(o.cols_),
      plane_bytes_(o.plane_bytes_) {
    o.cache_dir_.clear();
}

DiskPlaneCache& DiskPlaneCache::operator=(DiskPlaneCache&& o) noexcept {
    if (this != &o) {
        cleanup();
        cache_dir_ = std::move(o.cache_dir_);
        rows_ = o.rows_;
        cols_ = o.cols_;
        plane_bytes_ = o.plane_bytes_;
        o.cache_dir_.clear();
    }
    return *this;
}

void DiskPlaneCache::store(const std::string& key, const Matrix2Df& plane) {
    if (plane.rows() != rows_ || plane.cols() != cols_) {
        throw ValidationError("cached plane " + key + " does not match the cache shape");
    }
    const fs::path p = plane_path(key);
    int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
        throw IOError("cannot open " + p.string() + ": " + std::strerror(errno));
    }
    size_t written = 0;
    const char* src = reinterpret_cast<const char*>(plane.data());
    while (written < plane_bytes_) {
        ssize_t n = ::write(fd, src + written, plane_bytes_ - written);
        if (n <= 0) break;
        written += static_cast<size_t>(n);
    }
    const int write_errno = errno;
    ::close(fd);
    if (written != plane_bytes_) {
        throw IOError("short write to " + p.string() + ": " + std::strerror(write_errno));
    }
}

Matrix2Df DiskPlaneCache::load_rows(const std::string& key, int row0, int nrows) const {
    if (row0 < 0 || nrows <= 0 || row0 + nrows > rows_) {
        throw ValidationError("row block out of range");
    }
    const fs::path p = plane_path(key);
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd < 0) {
        throw IOError("cannot open " + p.string() + ": " + std::strerror(errno));
    }
    void* ptr = ::mmap(nullptr, plane_bytes_, PROT_READ, MAP_PRIVATE, fd, 0);
    ::close(fd);
    if (ptr == MAP_FAILED) {
        throw IOError("cannot map " + p.string());
    }

    const float* src = static_cast<const float*>(ptr);
    Matrix2Df out(nrows, cols_);
    std::memcpy(out.data(), src + static_cast<size_t>(row0) * static_cast<size_t>(cols_),
                static_cast<size_t>(nrows) * static_cast<size_t>(cols_) * sizeof(float));
    ::munmap(ptr, plane_bytes_);
    return out;
}

void DiskPlaneCache::cleanup() noexcept {
    if (!cache_dir_.empty()) {
        std::error_code ec;
        fs::remove_all(cache_dir_, ec);
        cache_dir_.clear();
    }
}

fs::path DiskPlaneCache::plane_path(const std::string& key) const {
    return cache_dir_ / (key + ".raw");
}

IntermediateStore::IntermediateStore(bool in_memory, const fs::path& cache_root, float maskpt)
    : in_memory_(in_memory), cache_root_(cache_root), maskpt_(maskpt) {
    if (!in_memory_ && cache_root_.empty()) {
        throw ValidationError("on-disk intermediate store needs a cache directory");
    }
}

IntermediateStore::~IntermediateStore() { release(); }

void IntermediateStore::add(resample::Mosaic&& mosaic) {
    if (released_) {
        throw ValidationError("intermediate store already released");
    }
    const Matrix2Df& data = resample::mosaic_data(mosaic);
    const Matrix2Df& weight = resample::mosaic_weight(mosaic);
    if (data.rows() != weight.rows() || data.cols() != weight.cols()) {
        throw ValidationError("mosaic " + resample::mosaic_name(mosaic) +
                              " has mismatched data and weight");
    }
    if (info_.empty()) {
        rows_ = static_cast<int>(data.rows());
        cols_ = static_cast<int>(data.cols());
        if (!in_memory_) {
            disk_ = DiskPlaneCache(cache_root_ / ("store_" + core::get_run_id()), rows_, cols_);
        }
    } else if (data.rows() != rows_ || data.cols() != cols_) {
        throw ValidationError("mosaic " + resample::mosaic_name(mosaic) +
                              " is not on the common grid");
    }

    StoredMosaicInfo info;
    info.name = resample::mosaic_name(mosaic);
    info.filename = resample::mosaic_filename(mosaic);
    info.grid = resample::mosaic_grid(mosaic);
    info.resampled = resample::is_resampled(mosaic);
    info.weight_threshold = compute_weight_threshold(weight, maskpt_);

    if (in_memory_) {
        std::visit([this](auto& m) {
            data_.push_back(std::move(m.data));
            weight_.push_back(std::move(m.weight));
        }, mosaic);
    } else {
        const std::string idx = std::to_string(info_.size());
        disk_.store(idx + "_sci", data);
        disk_.store(idx + "_wht", weight);
    }
    info_.push_back(std::move(info));
}

const StoredMosaicInfo& IntermediateStore::info(size_t i) const {
    if (i >= info_.size()) {
        throw ValidationError("mosaic index " + std::to_string(i) + " out of range");
    }
    return info_[i];
}

std::vector<float> IntermediateStore::weight_thresholds() const {
    std::vector<float> out;
    out.reserve(info_.size());
    for (const auto& i : info_) out.push_back(i.weight_threshold);
    return out;
}

void IntermediateStore::load_block(size_t i, int row0, int nrows, Matrix2Df& data,
                                   Matrix2Df& weight) const {
    if (released_) {
        throw ValidationError("intermediate store already released");
    }
    if (i >= info_.size()) {
        throw ValidationError("mosaic index " + std::to_string(i) + " out of range");
    }
    if (row0 < 0 || nrows <= 0 || row0 + nrows > rows_) {
        throw ValidationError("row block out of range");
    }
    if (in_memory_) {
        data = data_[i].middleRows(row0, nrows);
        weight = weight_[i].middleRows(row0, nrows);
    } else {
        const std::string idx = std::to_string(i);
        data = disk_.load_rows(idx + "_sci", row0, nrows);
        weight = disk_.load_rows(idx + "_wht", row0, nrows);
    }
}

void IntermediateStore::load(size_t i, Matrix2Df& data, Matrix2Df& weight) const {
    load_block(i, 0, rows_, data, weight);
}

fs::path IntermediateStore::cache_dir() const {
    return in_memory_ ? fs::path() : disk_.dir();
}

void IntermediateStore::release() {
    data_.clear();
    data_.shrink_to_fit();
    weight_.clear();
    weight_.shrink_to_fit();
    disk_.cleanup();
    released_ = true;
}

} // namespace outlier_detect::detection
