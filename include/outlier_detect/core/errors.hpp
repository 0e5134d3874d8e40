#pragma once

#include <stdexcept>
#include <string>

namespace outlier_detect {

class OutlierDetectError : public std::runtime_error {
public:
    explicit OutlierDetectError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public OutlierDetectError {
public:
    explicit ConfigError(const std::string& message)
        : OutlierDetectError("Config error: " + message) {}
};

class ValidationError : public OutlierDetectError {
public:
    explicit ValidationError(const std::string& message)
        : OutlierDetectError("Validation error: " + message) {}
};

class IOError : public OutlierDetectError {
public:
    explicit IOError(const std::string& message)
        : OutlierDetectError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class ResampleError : public OutlierDetectError {
public:
    explicit ResampleError(const std::string& message)
        : OutlierDetectError("Resample error: " + message) {}
};

class CombineError : public OutlierDetectError {
public:
    explicit CombineError(const std::string& message)
        : OutlierDetectError("Combine error: " + message) {}
};

class PersistenceError : public OutlierDetectError {
public:
    explicit PersistenceError(const std::string& message)
        : OutlierDetectError("Persistence error: " + message) {}
};

class PerExposureError : public OutlierDetectError {
public:
    PerExposureError(const std::string& exposure, const std::string& message)
        : OutlierDetectError("Exposure " + exposure + ": " + message),
          exposure_(exposure) {}

    const std::string& exposure() const { return exposure_; }

private:
    std::string exposure_;
};

class StopRequested : public OutlierDetectError {
public:
    StopRequested() : OutlierDetectError("Stop requested by user") {}
};

} // namespace outlier_detect
