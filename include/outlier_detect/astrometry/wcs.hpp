#pragma once

#include <cmath>
#include <map>
#include <string>

namespace outlier_detect::astrometry {

// Gnomonic (TAN) world coordinate system with a linear CD matrix.
// Pixel coordinates passed to and returned from the methods are 0-indexed;
// CRPIX follows the 1-indexed FITS convention.
struct WCS {
    double crpix1 = 0.0;
    double crpix2 = 0.0;

    // Tangent point (degrees)
    double crval1 = 0.0;  // RA
    double crval2 = 0.0;  // Dec

    // CD matrix (degrees/pixel)
    double cd1_1 = 0.0;
    double cd1_2 = 0.0;
    double cd2_1 = 0.0;
    double cd2_2 = 0.0;

    int naxis1 = 0;  // columns
    int naxis2 = 0;  // rows

    double pixel_scale_arcsec() const {
        double s1 = std::sqrt(cd1_1 * cd1_1 + cd2_1 * cd2_1);
        double s2 = std::sqrt(cd1_2 * cd1_2 + cd2_2 * cd2_2);
        return 0.5 * (s1 + s2) * 3600.0;
    }

    double determinant() const {
        return cd1_1 * cd2_2 - cd1_2 * cd2_1;
    }

    void pixel_to_sky(double px, double py, double &ra_deg, double &dec_deg) const {
        double dx = (px + 1.0) - crpix1;
        double dy = (py + 1.0) - crpix2;

        double xi  = cd1_1 * dx + cd1_2 * dy;
        double eta = cd2_1 * dx + cd2_2 * dy;

        constexpr double D2R = M_PI / 180.0;
        double xi_r  = xi * D2R;
        double eta_r = eta * D2R;
        double ra0_r  = crval1 * D2R;
        double dec0_r = crval2 * D2R;

        double sin_dec0 = std::sin(dec0_r);
        double cos_dec0 = std::cos(dec0_r);
        double denom = cos_dec0 - eta_r * sin_dec0;

        ra_deg  = std::atan2(xi_r, denom) / D2R + crval1;
        dec_deg = std::atan2((sin_dec0 + eta_r * cos_dec0) * std::cos(ra_deg * D2R - ra0_r), denom) / D2R;

        while (ra_deg < 0.0) ra_deg += 360.0;
        while (ra_deg >= 360.0) ra_deg -= 360.0;
    }

    // Returns false when the point lies behind the tangent plane or the CD
    // matrix is singular.
    bool sky_to_pixel(double ra_deg, double dec_deg, double &px, double &py) const {
        constexpr double D2R = M_PI / 180.0;
        double ra_r   = ra_deg * D2R;
        double dec_r  = dec_deg * D2R;
        double ra0_r  = crval1 * D2R;
        double dec0_r = crval2 * D2R;

        double sin_dec  = std::sin(dec_r);
        double cos_dec  = std::cos(dec_r);
        double sin_dec0 = std::sin(dec0_r);
        double cos_dec0 = std::cos(dec0_r);
        double delta_ra = ra_r - ra0_r;
        double cos_dra  = std::cos(delta_ra);

        double denom = sin_dec * sin_dec0 + cos_dec * cos_dec0 * cos_dra;
        if (denom <= 0.0) return false;

        double xi  = (cos_dec * std::sin(delta_ra)) / denom / D2R;
        double eta = (sin_dec * cos_dec0 - cos_dec * sin_dec0 * cos_dra) / denom / D2R;

        double det = determinant();
        if (std::abs(det) < 1e-30) return false;

        double dx = ( cd2_2 * xi - cd1_2 * eta) / det;
        double dy = (-cd2_1 * xi + cd1_1 * eta) / det;

        px = dx + crpix1 - 1.0;
        py = dy + crpix2 - 1.0;
        return true;
    }

    // Same projection, pixel origin moved to (x0, y0) of this grid and
    // dimensions replaced.
    WCS shifted(int x0, int y0, int width, int height) const {
        WCS w = *this;
        w.crpix1 -= x0;
        w.crpix2 -= y0;
        w.naxis1 = width;
        w.naxis2 = height;
        return w;
    }

    bool same_grid(const WCS &o, double tol = 1e-9) const {
        return naxis1 == o.naxis1 && naxis2 == o.naxis2 &&
               std::abs(crpix1 - o.crpix1) <= tol && std::abs(crpix2 - o.crpix2) <= tol &&
               std::abs(crval1 - o.crval1) <= tol && std::abs(crval2 - o.crval2) <= tol &&
               std::abs(cd1_1 - o.cd1_1) <= tol && std::abs(cd1_2 - o.cd1_2) <= tol &&
               std::abs(cd2_1 - o.cd2_1) <= tol && std::abs(cd2_2 - o.cd2_2) <= tol;
    }

    bool valid() const {
        return naxis1 > 0 && naxis2 > 0 && std::abs(determinant()) > 1e-30;
    }
};

// Build a CD-matrix WCS from CDELT/CROTA keywords.
WCS wcs_from_cdelt_crota(double crval1, double crval2,
                         double crpix1, double crpix2,
                         double cdelt1, double cdelt2,
                         double crota2, int naxis1, int naxis2);

// Build a WCS from numeric header keywords (CRVALn, CRPIXn, CDi_j or
// CDELTn/CROTA2, NAXISn). Missing keywords leave the WCS invalid.
WCS wcs_from_keywords(const std::map<std::string, double> &keys);

// Keywords describing the WCS, suitable for writing back to a header.
std::map<std::string, double> wcs_to_keywords(const WCS &w);

} // namespace outlier_detect::astrometry
