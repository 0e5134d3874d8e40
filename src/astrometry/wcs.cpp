#include "outlier_detect/astrometry/wcs.hpp"

#include <cmath>

namespace outlier_detect::astrometry {

WCS wcs_from_cdelt_crota(double crval1, double crval2,
                         double crpix1, double crpix2,
                         double cdelt1, double cdelt2,
                         double crota2, int naxis1, int naxis2) {
    WCS w;
    w.crval1 = crval1;
    w.crval2 = crval2;
    w.crpix1 = crpix1;
    w.crpix2 = crpix2;
    w.naxis1 = naxis1;
    w.naxis2 = naxis2;

    constexpr double D2R = M_PI / 180.0;
    double cos_r = std::cos(crota2 * D2R);
    double sin_r = std::sin(crota2 * D2R);

    w.cd1_1 =  cdelt1 * cos_r;
    w.cd1_2 = -cdelt2 * sin_r;
    w.cd2_1 =  cdelt1 * sin_r;
    w.cd2_2 =  cdelt2 * cos_r;

    return w;
}

WCS wcs_from_keywords(const std::map<std::string, double> &keys) {
    auto get = [&keys](const char *k, double fallback) {
        auto it = keys.find(k);
        return it != keys.end() ? it->second : fallback;
    };
    auto has = [&keys](const char *k) { return keys.find(k) != keys.end(); };

    const double crval1 = get("CRVAL1", 0.0);
    const double crval2 = get("CRVAL2", 0.0);
    const double crpix1 = get("CRPIX1", 0.0);
    const double crpix2 = get("CRPIX2", 0.0);
    const int naxis1 = static_cast<int>(get("NAXIS1", 0.0));
    const int naxis2 = static_cast<int>(get("NAXIS2", 0.0));

    if (has("CD1_1") || has("CD1_2") || has("CD2_1") || has("CD2_2")) {
        WCS w;
        w.crval1 = crval1;
        w.crval2 = crval2;
        w.crpix1 = crpix1;
        w.crpix2 = crpix2;
        w.naxis1 = naxis1;
        w.naxis2 = naxis2;
        w.cd1_1 = get("CD1_1", 0.0);
        w.cd1_2 = get("CD1_2", 0.0);
        w.cd2_1 = get("CD2_1", 0.0);
        w.cd2_2 = get("CD2_2", 0.0);
        return w;
    }

    const double rot = has("CROTA2") ? get("CROTA2", 0.0) : get("CROTA1", 0.0);
    return wcs_from_cdelt_crota(crval1, crval2, crpix1, crpix2,
                                get("CDELT1", 0.0), get("CDELT2", 0.0),
                                rot, naxis1, naxis2);
}

std::map<std::string, double> wcs_to_keywords(const WCS &w) {
    return {
        {"CRVAL1", w.crval1},
        {"CRVAL2", w.crval2},
        {"CRPIX1", w.crpix1},
        {"CRPIX2", w.crpix2},
        {"CD1_1", w.cd1_1},
        {"CD1_2", w.cd1_2},
        {"CD2_1", w.cd2_1},
        {"CD2_2", w.cd2_2},
    };
}

} // namespace outlier_detect::astrometry
