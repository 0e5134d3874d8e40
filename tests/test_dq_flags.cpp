#include "outlier_detect/core/dq_flags.hpp"
#include "outlier_detect/core/errors.hpp"

#include <catch2/catch_test_macros.hpp>

namespace dq = outlier_detect::dq;

TEST_CASE("interpret_bit_flags_handles_empty_and_none") {
    REQUIRE_FALSE(dq::interpret_bit_flags("").has_value());
    REQUIRE_FALSE(dq::interpret_bit_flags("None").has_value());
    REQUIRE_FALSE(dq::interpret_bit_flags("  none ").has_value());
}

TEST_CASE("interpret_bit_flags_parses_integers_and_mnemonics") {
    REQUIRE(dq::interpret_bit_flags("0").value() == 0u);
    REQUIRE(dq::interpret_bit_flags("513").value() == 513u);
    REQUIRE(dq::interpret_bit_flags("DO_NOT_USE,SATURATED").value() ==
            (dq::DO_NOT_USE | dq::SATURATED));
    REQUIRE(dq::interpret_bit_flags("jump_det + dropout").value() ==
            (dq::JUMP_DET | dq::DROPOUT));
}

TEST_CASE("interpret_bit_flags_inverts_with_tilde") {
    auto good = dq::interpret_bit_flags("~DO_NOT_USE+NON_SCIENCE");
    REQUIRE(good.has_value());
    REQUIRE(*good == ~(dq::DO_NOT_USE | dq::NON_SCIENCE));
}

TEST_CASE("interpret_bit_flags_rejects_unknown_mnemonic") {
    REQUIRE_THROWS_AS(dq::interpret_bit_flags("DO_NOT_USE+BOGUS"), outlier_detect::ValidationError);
    REQUIRE_THROWS_AS(dq::interpret_bit_flags("~"), outlier_detect::ValidationError);
    REQUIRE_THROWS_AS(dq::interpret_bit_flags("99999999999"), outlier_detect::ValidationError);
}

TEST_CASE("build_good_mask_excludes_bits_outside_good_set") {
    outlier_detect::DQMatrix q = outlier_detect::DQMatrix::Zero(1, 4);
    q(0, 1) = dq::DO_NOT_USE;
    q(0, 2) = dq::SATURATED;
    q(0, 3) = dq::NON_SCIENCE | dq::DO_NOT_USE;

    auto mask = dq::build_good_mask(q, dq::interpret_bit_flags("~DO_NOT_USE+NON_SCIENCE"));
    REQUIRE(mask(0, 0) == 1.0f);
    REQUIRE(mask(0, 1) == 0.0f);
    REQUIRE(mask(0, 2) == 1.0f);
    REQUIRE(mask(0, 3) == 0.0f);

    auto all_good = dq::build_good_mask(q, std::nullopt);
    REQUIRE(all_good.sum() == 4.0f);
}
