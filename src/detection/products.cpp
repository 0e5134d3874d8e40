#include "outlier_detect/detection/products.hpp"
#include "outlier_detect/core/utils.hpp"

#include <array>
#include <filesystem>

namespace outlier_detect::detection {

namespace {

// Longest first so "_outlier_s2d" wins over "_s2d".
constexpr std::array<const char*, 10> kProductSuffixes = {
    "outlier_s2d", "outlier_i2d", "rateints", "calints", "median",
    "rate", "cal", "crf", "i2d", "s2d",
};

} // namespace

std::string make_output_path(const std::string& basepath, const std::string& suffix) {
    const fs::path base(basepath);
    std::string stem = base.stem().string();
    for (const char* known : kProductSuffixes) {
        const std::string tail = std::string("_") + known;
        if (stem.size() > tail.size() && core::ends_with(stem, tail)) {
            stem.erase(stem.size() - tail.size());
            break;
        }
    }

    std::string sfx = suffix;
    if (!sfx.empty() && sfx.front() != '_') {
        sfx.insert(sfx.begin(), '_');
    }
    return (base.parent_path() / (stem + sfx + ".fits")).string();
}

} // namespace outlier_detect::detection
