#include "outlier_detect/core/dq_flags.hpp"
#include "outlier_detect/core/errors.hpp"
#include "outlier_detect/io/fits_io.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace io = outlier_detect::io;
namespace t = outlier_detect::testing;

TEST_CASE("write_exposure_then_read_preserves_layout") {
    t::TempDir tmp;
    auto e = t::make_exposure("jw001_nrca1", 6, 5, 3.0f, 0.5f);
    e.group_id = "obs1_visit2";
    e.exposure_time = 250.5;
    e.data(2, 3) = -7.25f;
    e.dq(1, 1) = outlier_detect::dq::OUTLIER | outlier_detect::dq::DO_NOT_USE;
    e.dq(0, 4) = outlier_detect::dq::REFERENCE_PIXEL;

    const auto path = tmp.path() / "jw001_nrca1_cal.fits";
    io::write_exposure(path, e);
    auto back = io::read_exposure(path);

    REQUIRE(back.name == "jw001_nrca1");
    REQUIRE(back.group_id == "obs1_visit2");
    REQUIRE(back.exposure_time == Catch::Approx(250.5));
    REQUIRE(back.rows() == 6);
    REQUIRE(back.cols() == 5);
    REQUIRE(back.data(2, 3) == Catch::Approx(-7.25f));
    REQUIRE(back.has_err());
    REQUIRE(back.err(0, 0) == Catch::Approx(0.5f));
    REQUIRE(back.has_var_rnoise());
    REQUIRE(back.dq == e.dq);
    REQUIRE(back.wcs.same_grid(e.wcs, 1e-9));
}

TEST_CASE("read_fits_float_reads_primary_image_with_wcs") {
    t::TempDir tmp;
    outlier_detect::Matrix2Df img(3, 4);
    for (int i = 0; i < img.size(); ++i) img.data()[i] = static_cast<float>(i) * 0.5f;
    const auto wcs = t::make_wcs(3, 4);
    io::FitsHeader header;
    header.set("BUNIT", std::string("MJy/sr"));

    const auto path = tmp.path() / "median.fits";
    io::write_fits_float(path, img, header, &wcs);
    auto [data, hdr] = io::read_fits_float(path);

    REQUIRE(data == img);
    REQUIRE(hdr.get_string("BUNIT").value() == "MJy/sr");
    REQUIRE(hdr.get_number("CRPIX1").value() == Catch::Approx(wcs.crpix1));
    REQUIRE(io::wcs_from_header(hdr, 4, 3).same_grid(wcs, 1e-9));
}

TEST_CASE("fits_product_sink_reports_persistence_error") {
    io::FitsProductSink sink;
    outlier_detect::Matrix2Df img = outlier_detect::Matrix2Df::Zero(2, 2);
    REQUIRE_THROWS_AS(sink.save_reference("/nonexistent_dir/x/median.fits", img, t::make_wcs(2, 2)),
                      outlier_detect::PersistenceError);
}

TEST_CASE("read_exposure_missing_file_raises_fits_error") {
    REQUIRE_THROWS_AS(io::read_exposure("/nonexistent_dir/none.fits"), outlier_detect::FitsError);
}
