#include "outlier_detect/detection/products.hpp"

#include <catch2/catch_test_macros.hpp>

namespace det = outlier_detect::detection;

TEST_CASE("make_output_path_replaces_product_suffix") {
    REQUIRE(det::make_output_path("/data/jw001_nrca1_cal.fits", "_median") ==
            "/data/jw001_nrca1_median.fits");
    REQUIRE(det::make_output_path("/data/jw001_nrca1_cal.fits", "crf") ==
            "/data/jw001_nrca1_crf.fits");
    REQUIRE(det::make_output_path("/data/jw001_nrca1_calints.fits", "_outlier_s2d") ==
            "/data/jw001_nrca1_outlier_s2d.fits");
}

TEST_CASE("make_output_path_strips_longest_known_suffix") {
    REQUIRE(det::make_output_path("out/jw001_outlier_s2d.fits", "_median") ==
            "out/jw001_median.fits");
    REQUIRE(det::make_output_path("jw001_rateints.fits", "_crf") == "jw001_crf.fits");
}

TEST_CASE("make_output_path_keeps_unknown_stem") {
    REQUIRE(det::make_output_path("/data/frame_0001.fits", "_median") ==
            "/data/frame_0001_median.fits");
    REQUIRE(det::make_output_path("exposure", "crf") == "exposure_crf.fits");
}
