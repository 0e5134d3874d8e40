#include "outlier_detect/core/errors.hpp"
#include "outlier_detect/detection/comparator.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

using outlier_detect::BoolMatrix;
using outlier_detect::Matrix2Df;
namespace det = outlier_detect::detection;

TEST_CASE("abs_deriv_takes_max_neighbour_difference") {
    Matrix2Df ref(3, 3);
    ref << 1.0f, 1.0f, 1.0f,
           1.0f, 5.0f, 2.0f,
           1.0f, 1.0f, 1.0f;

    auto d = det::abs_deriv(ref);
    REQUIRE(d(1, 1) == Catch::Approx(4.0f));
    REQUIRE(d(1, 2) == Catch::Approx(3.0f));
    REQUIRE(d(0, 0) == Catch::Approx(0.0f));
    REQUIRE(d(0, 1) == Catch::Approx(4.0f));
}

TEST_CASE("abs_deriv_ignores_nan_neighbours") {
    Matrix2Df ref = Matrix2Df::Constant(2, 2, 3.0f);
    ref(0, 1) = std::numeric_limits<float>::quiet_NaN();

    auto d = det::abs_deriv(ref);
    REQUIRE(d(0, 0) == 0.0f);
    REQUIRE(d(0, 1) == 0.0f);
}

TEST_CASE("noise_sigma_adds_terms_in_quadrature") {
    Matrix2Df err = Matrix2Df::Constant(2, 2, 3.0f);
    Matrix2Df flat = Matrix2Df::Zero(2, 2);
    Matrix2Df deriv = Matrix2Df::Constant(2, 2, 2.0f);

    auto s = det::noise_sigma(err, flat, deriv, {0.0f, 4.0f});
    REQUIRE(s(0, 0) == Catch::Approx(5.0f));

    auto s2 = det::noise_sigma(err, flat, deriv, {2.0f, 0.0f});
    REQUIRE(s2(1, 1) == Catch::Approx(5.0f));

    auto s3 = det::noise_sigma(Matrix2Df(), flat, Matrix2Df(), {1.0f, 0.5f});
    REQUIRE(s3(0, 1) == Catch::Approx(0.5f));

    Matrix2Df level = Matrix2Df::Constant(2, 2, 16.0f);
    level(1, 0) = -16.0f;
    level(0, 1) = std::numeric_limits<float>::quiet_NaN();
    auto s4 = det::noise_sigma(Matrix2Df(), level, Matrix2Df(), {1.0f, 3.0f});
    REQUIRE(s4(0, 0) == Catch::Approx(5.0f));
    REQUIRE(s4(1, 0) == Catch::Approx(5.0f));
    REQUIRE(s4(0, 1) == Catch::Approx(3.0f));
}

TEST_CASE("noise_sigma_grows_with_reference_level") {
    det::CompareParams p;
    p.scale = {1.2f, 0.7f};

    for (float level : {10.0f, 10000.0f}) {
        Matrix2Df ref = Matrix2Df::Constant(5, 5, level);
        Matrix2Df data = ref;
        data(2, 2) += 40.0f;

        const double expected = std::sqrt(1.44 * level + 0.49);
        auto sigma = det::noise_sigma(Matrix2Df(), ref, Matrix2Df(), p.scale);
        REQUIRE(sigma(2, 2) == Catch::Approx(expected).epsilon(1e-4));

        auto mask = det::compare(data, Matrix2Df(), ref, p);
        if (level < 100.0f) {
            REQUIRE(mask(2, 2));
            REQUIRE(mask.count() == 1);
        } else {
            REQUIRE(mask.count() == 0);
        }
    }
}

TEST_CASE("compare_flags_single_deviant_pixel") {
    Matrix2Df ref = Matrix2Df::Constant(5, 5, 10.0f);
    Matrix2Df data = ref;
    data(2, 2) = 100.0f;
    Matrix2Df err = Matrix2Df::Constant(5, 5, 2.0f);

    det::CompareParams p;
    p.snr = {5.0f, 4.0f};
    p.scale = {1.0f, 0.0f};

    BoolMatrix mask = det::compare(data, err, ref, p);
    REQUIRE(mask.count() == 1);
    REQUIRE(mask(2, 2));
}

TEST_CASE("compare_identical_images_flag_nothing") {
    Matrix2Df ref(4, 4);
    for (int i = 0; i < ref.size(); ++i) ref.data()[i] = static_cast<float>(i * i);
    Matrix2Df err = Matrix2Df::Constant(4, 4, 0.1f);

    det::CompareParams p;
    REQUIRE(det::compare(ref, err, ref, p).count() == 0);

    p.scale = {0.0f, 0.0f};
    REQUIRE(det::compare(ref, Matrix2Df(), ref, p).count() == 0);
}

TEST_CASE("compare_never_flags_non_finite_reference") {
    Matrix2Df ref = Matrix2Df::Constant(3, 3, 10.0f);
    ref(1, 1) = std::numeric_limits<float>::quiet_NaN();
    Matrix2Df data = Matrix2Df::Constant(3, 3, 10.0f);
    data(1, 1) = 1.0e6f;

    det::CompareParams p;
    auto mask = det::compare(data, Matrix2Df::Constant(3, 3, 1.0f), ref, p);
    REQUIRE_FALSE(mask(1, 1));
    REQUIRE(mask.count() == 0);
}

TEST_CASE("compare_uniform_offset_is_flagged_unless_absorbed_by_background") {
    Matrix2Df ref = Matrix2Df::Constant(6, 6, 10.0f);
    Matrix2Df data = Matrix2Df::Constant(6, 6, 60.0f);
    Matrix2Df err = Matrix2Df::Constant(6, 6, 2.0f);

    det::CompareParams p;
    p.scale = {1.0f, 0.0f};
    REQUIRE(det::compare(data, err, ref, p).count() == 36);

    p.backg = 50.0f;
    data(3, 3) = 200.0f;
    auto mask = det::compare(data, err, ref, p);
    REQUIRE(mask.count() == 1);
    REQUIRE(mask(3, 3));
}

TEST_CASE("compare_flags_every_pixel_of_extended_cluster") {
    Matrix2Df ref = Matrix2Df::Constant(9, 9, 10.0f);
    Matrix2Df data = ref;
    data.block(3, 3, 3, 3).setConstant(1000.0f);
    Matrix2Df err = Matrix2Df::Constant(9, 9, 2.0f);

    det::CompareParams p;
    p.snr = {5.0f, 4.0f};
    p.scale = {1.0f, 0.0f};

    BoolMatrix mask = det::compare(data, err, ref, p);
    REQUIRE(mask.count() == 9);
    REQUIRE(mask.block(3, 3, 3, 3).all());
    REQUIRE(mask(4, 4));
}

TEST_CASE("compare_neighbour_corroborates_marginal_hit") {
    Matrix2Df ref = Matrix2Df::Constant(7, 7, 0.0f);
    Matrix2Df err = Matrix2Df::Constant(7, 7, 2.0f);
    det::CompareParams p;
    p.snr = {5.0f, 4.0f};
    p.scale = {0.0f, 0.0f};

    // 6.25 sigma on its own: passes the primary test only.
    Matrix2Df data = ref;
    data(3, 3) = 12.5f;
    REQUIRE(det::compare(data, err, ref, p).count() == 0);

    data(3, 4) = 12.5f;
    auto mask = det::compare(data, err, ref, p);
    REQUIRE(mask.count() == 2);
    REQUIRE(mask(3, 3));
    REQUIRE(mask(3, 4));
}

TEST_CASE("compare_two_tier_is_stricter_than_primary_alone") {
    Matrix2Df ref = Matrix2Df::Constant(8, 8, 0.0f);
    Matrix2Df data(8, 8);
    for (int i = 0; i < data.size(); ++i) {
        data.data()[i] = static_cast<float>((i * 37) % 17) - 8.0f;
    }
    data(1, 1) = 60.0f;
    data(5, 5) = 11.0f;
    data.block(5, 0, 2, 2).setConstant(40.0f);
    Matrix2Df err = Matrix2Df::Constant(8, 8, 2.0f);

    det::CompareParams p;
    p.scale = {0.0f, 0.0f};
    p.snr = {5.0f, 1.0e-6f};
    const BoolMatrix primary = det::compare(data, err, ref, p);

    for (float t2 : {5.0f, 7.0f, 20.0f}) {
        p.snr = {5.0f, t2};
        const BoolMatrix both = det::compare(data, err, ref, p);
        for (Eigen::Index i = 0; i < both.size(); ++i) {
            if (both.data()[i]) REQUIRE(primary.data()[i]);
        }
        REQUIRE(both.count() < primary.count());
    }
    REQUIRE(primary(5, 5));
    p.snr = {5.0f, 5.0f};
    REQUIRE_FALSE(det::compare(data, err, ref, p)(5, 5));
}

TEST_CASE("compare_derivative_term_only_applies_after_resampling") {
    Matrix2Df ref(3, 3);
    ref << 0.0f, 0.0f, 0.0f,
           0.0f, 50.0f, 0.0f,
           0.0f, 0.0f, 0.0f;
    Matrix2Df data = ref;
    data(1, 1) = 150.0f;
    Matrix2Df err = Matrix2Df::Constant(3, 3, 1.0f);

    det::CompareParams p;
    p.snr = {5.0f, 4.0f};
    p.scale = {1.2f, 0.0f};
    p.resample_was_used = true;
    REQUIRE_FALSE(det::compare(data, err, ref, p)(1, 1));

    p.resample_was_used = false;
    REQUIRE(det::compare(data, err, ref, p)(1, 1));
}

TEST_CASE("compare_zero_sigma_flags_any_isolated_difference") {
    Matrix2Df ref = Matrix2Df::Constant(3, 3, 1.0f);
    Matrix2Df data = ref;
    data(0, 0) = 1.5f;

    det::CompareParams p;
    p.scale = {0.0f, 0.0f};
    auto mask = det::compare(data, Matrix2Df(), ref, p);
    REQUIRE(mask(0, 0));
    REQUIRE(mask.count() == 1);
}

TEST_CASE("compare_rejects_shape_mismatch") {
    det::CompareParams p;
    REQUIRE_THROWS_AS(det::compare(Matrix2Df::Zero(2, 2), Matrix2Df(), Matrix2Df::Zero(2, 3), p),
                      outlier_detect::ValidationError);
    REQUIRE_THROWS_AS(det::compare(Matrix2Df::Zero(2, 2), Matrix2Df::Zero(3, 3),
                                   Matrix2Df::Zero(2, 2), p),
                      outlier_detect::ValidationError);
}
