#include <gtest/gtest.h>

#include <cmath>

#include "constant.hpp"
#include "error.hpp"
#include "expression.hpp"
#include "raw_data.hpp"

namespace {

// three points: a regular one, one with id = 0 and an invalid one
raw_data three_points() {
    raw_data r(3, 2e-6);
    r.set(0, small_signal { 1e-6, 15e-6, 0.5e-6, 0.4, 0.1, 1e-15, 0.7e-15, 0.2e-15 });
    r.set(1, small_signal { 0.0, 1e-6, 0.0, 0.4, 0.1, 1e-15, 0.7e-15, 0.2e-15 });
    r.invalidate(2);
    return r;
}

}

TEST(expression, derived_quantities) {
    raw_data r = three_points();

    EXPECT_DOUBLE_EQ(evaluate(quantity::gmid, r)(0), 15.0);
    EXPECT_DOUBLE_EQ(evaluate(quantity::gain, r)(0), 30.0);
    EXPECT_DOUBLE_EQ(evaluate(quantity::ft, r)(0), 15e-6 / (2 * c::pi * 1e-15));
    EXPECT_DOUBLE_EQ(evaluate(quantity::id_w, r)(0), 0.5);
    EXPECT_DOUBLE_EQ(evaluate(quantity::gm_w, r)(0), 7.5);
    EXPECT_DOUBLE_EQ(evaluate(quantity::cgd, r)(0), 0.2e-15);
}

TEST(expression, division_by_zero_is_not_finite) {
    raw_data r = three_points();

    EXPECT_FALSE(std::isfinite(evaluate(quantity::gmid, r)(1)));
    EXPECT_FALSE(std::isfinite(evaluate(quantity::gain, r)(1)));
}

TEST(expression, derived_quantities_need_positive_current) {
    raw_data r(2, 1e-6);
    r.set(0, small_signal { -1e-6, -1e-5, -2e-7, 0.4, 0.1, -1e-15, -0.7e-15, -0.2e-15 });
    r.set(1, small_signal { 0.0, 1e-5, 1e-8, 0.4, 0.1, 1e-15, 0.7e-15, 0.2e-15 });

    for (quantity q : all_quantities) {
        if (is_derived(q)) {
            EXPECT_TRUE(std::isnan(evaluate(q, r)(0))) << quantity_name(q);
            EXPECT_TRUE(std::isnan(evaluate(q, r)(1))) << quantity_name(q);
        }
    }

    // raw values stay as stored
    EXPECT_EQ(evaluate(quantity::id, r)(0), -1e-6);
    EXPECT_EQ(evaluate(quantity::gm, r)(1), 1e-5);
}

TEST(expression, invalid_points_are_nan) {
    raw_data r = three_points();

    for (quantity q : all_quantities) {
        EXPECT_TRUE(std::isnan(evaluate(q, r)(2))) << quantity_name(q);
    }
    EXPECT_EQ(r.n_invalid(), 1u);
}

TEST(expression, evaluation_is_deterministic) {
    raw_data r = three_points();

    for (quantity q : all_quantities) {
        arma::vec a = evaluate(q, r);
        arma::vec b = evaluate(q, r);
        ASSERT_EQ(a.n_elem, b.n_elem);
        for (arma::uword i = 0; i < a.n_elem; ++i) {
            if (std::isnan(a(i))) {
                EXPECT_TRUE(std::isnan(b(i)));
            } else {
                EXPECT_EQ(a(i), b(i));
            }
        }
    }
}

TEST(expression, names) {
    for (quantity q : all_quantities) {
        EXPECT_EQ(quantity_from_string(quantity_name(q)), q);
        EXPECT_FALSE(label(q).empty());
    }
    EXPECT_TRUE(is_derived(quantity::ft));
    EXPECT_FALSE(is_derived(quantity::cgg));
    EXPECT_THROW(quantity_from_string("beta"), configuration_error);
}

TEST(expression, admissible_samples) {
    arma::vec x = { 3.0, 0.0, -1.0, arma::datum::nan, arma::datum::inf, 2.0 };
    arma::uvec ok = admissible(x);
    ASSERT_EQ(ok.n_elem, 2u);
    EXPECT_EQ(ok(0), 0u);
    EXPECT_EQ(ok(1), 5u);

    arma::vec y = { -1.0, 1.0, 1.0, 1.0, 1.0, 1.0 };
    arma::uvec both = admissible(x, y);
    ASSERT_EQ(both.n_elem, 1u);
    EXPECT_EQ(both(0), 5u);
}

TEST(expression, admissible_max_ignores_bad_samples) {
    arma::vec x = { 3.0, arma::datum::inf, -10.0, arma::datum::nan, 2.0 };
    EXPECT_DOUBLE_EQ(admissible_max(x), 3.0);

    arma::vec none = { 0.0, -1.0, arma::datum::nan };
    EXPECT_THROW(admissible_max(none), empty_table_error);
}

TEST(expression, nearest_admissible) {
    arma::vec x = { 2.0, 5.0, 8.5, 11.0, 15.0 };
    EXPECT_EQ(nearest_admissible(x, 10.0), 3u);

    // 9 and 11 are equally close to 10, the first one wins
    arma::vec tie = { 2.0, 5.0, 9.0, 11.0, 15.0 };
    EXPECT_EQ(nearest_admissible(tie, 10.0), 2u);

    // zero, negative and nan samples are never chosen, however close
    arma::vec bad = { 0.0, -10.0, arma::datum::nan, 20.0 };
    EXPECT_EQ(nearest_admissible(bad, -10.0), 3u);

    arma::vec none = { 0.0, arma::datum::nan };
    EXPECT_THROW(nearest_admissible(none, 1.0), empty_table_error);
}
