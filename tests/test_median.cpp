#include "outlier_detect/core/errors.hpp"
#include "outlier_detect/detection/median.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <vector>

using outlier_detect::Matrix2Df;
using outlier_detect::WeightRule;
namespace det = outlier_detect::detection;

namespace {

std::vector<Matrix2Df> pixels(const std::vector<float>& values) {
    std::vector<Matrix2Df> out;
    for (float v : values) out.push_back(Matrix2Df::Constant(1, 1, v));
    return out;
}

} // namespace

TEST_CASE("combine_outvotes_single_outlier") {
    auto data = pixels({10.0f, 10.0f, 100.0f, 10.0f});
    auto weights = pixels({1.0f, 1.0f, 1.0f, 1.0f});
    det::CombineOptions opts;
    opts.maskpt = 0.3f;

    auto ref = det::combine(data, weights, opts);
    REQUIRE(ref(0, 0) == Catch::Approx(10.0f));
}

TEST_CASE("combine_even_count_uses_mean_of_central_values") {
    auto data = pixels({4.0f, 1.0f, 3.0f, 2.0f});
    auto weights = pixels({1.0f, 1.0f, 1.0f, 1.0f});
    det::CombineOptions opts;

    auto ref = det::combine(data, weights, opts);
    REQUIRE(ref(0, 0) == Catch::Approx(2.5f));
}

TEST_CASE("combine_excludes_members_below_maskpt_fraction") {
    auto data = pixels({1.0f, 2.0f, 3.0f, 100.0f});
    auto weights = pixels({1.0f, 1.0f, 1.0f, 0.1f});
    det::CombineOptions opts;
    opts.maskpt = 0.5f;

    auto ref = det::combine(data, weights, opts);
    REQUIRE(ref(0, 0) == Catch::Approx(2.0f));
}

TEST_CASE("combine_zero_weight_everywhere_gives_nan") {
    std::vector<Matrix2Df> data(3, Matrix2Df::Constant(2, 2, 5.0f));
    std::vector<Matrix2Df> weights(3, Matrix2Df::Ones(2, 2));
    for (auto& w : weights) w(1, 0) = 0.0f;
    det::CombineOptions opts;

    auto ref = det::combine(data, weights, opts);
    REQUIRE(std::isnan(ref(1, 0)));
    REQUIRE(ref(0, 0) == 5.0f);
    REQUIRE(ref(1, 1) == 5.0f);
}

TEST_CASE("combine_zero_weight_member_excluded_only_at_that_pixel") {
    std::vector<Matrix2Df> data = {Matrix2Df::Constant(1, 2, 1.0f),
                                   Matrix2Df::Constant(1, 2, 2.0f),
                                   Matrix2Df::Constant(1, 2, 9.0f)};
    std::vector<Matrix2Df> weights(3, Matrix2Df::Ones(1, 2));
    weights[2](0, 0) = 0.0f;
    det::CombineOptions opts;

    auto ref = det::combine(data, weights, opts);
    REQUIRE(ref(0, 0) == Catch::Approx(1.5f));
    REQUIRE(ref(0, 1) == Catch::Approx(2.0f));
}

TEST_CASE("combine_rejects_empty_stack_and_shape_mismatch") {
    det::CombineOptions opts;
    REQUIRE_THROWS_AS(det::combine({}, {}, opts), outlier_detect::CombineError);

    std::vector<Matrix2Df> data = {Matrix2Df::Zero(2, 2), Matrix2Df::Zero(2, 3)};
    std::vector<Matrix2Df> weights = {Matrix2Df::Ones(2, 2), Matrix2Df::Ones(2, 3)};
    REQUIRE_THROWS_AS(det::combine(data, weights, opts), outlier_detect::CombineError);

    std::vector<Matrix2Df> one_weight = {Matrix2Df::Ones(2, 2)};
    std::vector<Matrix2Df> one_data = {Matrix2Df::Zero(2, 2), Matrix2Df::Zero(2, 2)};
    REQUIRE_THROWS_AS(det::combine(one_data, one_weight, opts), outlier_detect::CombineError);
}

TEST_CASE("combine_result_is_invariant_to_weight_scale") {
    std::vector<Matrix2Df> data;
    std::vector<Matrix2Df> weights;
    for (int k = 0; k < 5; ++k) {
        Matrix2Df d(3, 4);
        Matrix2Df w(3, 4);
        for (int i = 0; i < d.size(); ++i) {
            d.data()[i] = static_cast<float>((i * 7 + k * 13) % 11);
            w.data()[i] = static_cast<float>((i + k) % 4) * 0.25f;
        }
        data.push_back(d);
        weights.push_back(w);
    }

    for (WeightRule rule : {WeightRule::PIXEL_MEDIAN, WeightRule::IMAGE_MEAN}) {
        det::CombineOptions opts;
        opts.maskpt = 0.7f;
        opts.rule = rule;

        std::vector<Matrix2Df> scaled;
        det::CombineOptions scaled_opts = opts;
        for (const auto& w : weights) {
            scaled.push_back(w * 4.0f);
            opts.weight_thresholds.push_back(det::compute_weight_threshold(w, opts.maskpt));
            scaled_opts.weight_thresholds.push_back(
                det::compute_weight_threshold(scaled.back(), opts.maskpt));
        }

        auto a = det::combine(data, weights, opts);
        auto b = det::combine(data, scaled, scaled_opts);
        for (int i = 0; i < a.size(); ++i) {
            const float va = a.data()[i];
            const float vb = b.data()[i];
            REQUIRE(std::isnan(va) == std::isnan(vb));
            if (!std::isnan(va)) REQUIRE(va == vb);
        }
    }
}

TEST_CASE("combine_image_mean_rule_uses_per_mosaic_threshold") {
    auto data = pixels({1.0f, 2.0f, 50.0f});
    auto weights = pixels({1.0f, 1.0f, 0.2f});
    det::CombineOptions opts;
    opts.rule = WeightRule::IMAGE_MEAN;
    opts.weight_thresholds = {0.5f, 0.5f, 0.5f};

    auto ref = det::combine(data, weights, opts);
    REQUIRE(ref(0, 0) == Catch::Approx(1.5f));

    opts.weight_thresholds = {0.5f, 0.5f};
    REQUIRE_THROWS_AS(det::combine(data, weights, opts), outlier_detect::CombineError);
}

TEST_CASE("compute_weight_threshold_clips_and_ignores_zero_weights") {
    Matrix2Df w = Matrix2Df::Constant(10, 10, 2.0f);
    w(0, 0) = 0.0f;
    w(0, 1) = 0.0f;
    REQUIRE(det::compute_weight_threshold(w, 0.5f) == Catch::Approx(1.0f));

    w(5, 5) = 1000.0f;
    REQUIRE(det::compute_weight_threshold(w, 0.5f) == Catch::Approx(1.0f));

    REQUIRE(det::compute_weight_threshold(Matrix2Df::Zero(3, 3), 0.7f) == 0.0f);
}

TEST_CASE("combine_threaded_matches_single_thread") {
    std::vector<Matrix2Df> data;
    std::vector<Matrix2Df> weights;
    for (int k = 0; k < 4; ++k) {
        Matrix2Df d(37, 23);
        for (int i = 0; i < d.size(); ++i) d.data()[i] = static_cast<float>((i * 31 + k) % 17);
        data.push_back(d);
        weights.push_back(Matrix2Df::Ones(37, 23));
    }
    det::CombineOptions single;
    det::CombineOptions threaded;
    threaded.workers = 4;

    auto a = det::combine(data, weights, single);
    auto b = det::combine(data, weights, threaded);
    REQUIRE(a == b);
}
