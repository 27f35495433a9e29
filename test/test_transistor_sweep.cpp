#include <gtest/gtest.h>

#include "error.hpp"
#include "sweep_config.hpp"
#include "transistor_sweep.hpp"

TEST(transistor_sweep, size_is_product_of_axes) {
    transistor_sweep s(polarity::nmos, { 1e-6, 2e-6 }, sweep_axis(0, 1, 0.5), sweep_axis(0, 1, 0.25),
                       sweep_axis(0, -0.5, -0.5));
    EXPECT_EQ(s.size(), 2u * 3u * 5u * 2u);
}

TEST(transistor_sweep, nmos_signs) {
    sweep_axis l{ 1e-6 };
    sweep_axis pos(0, 1, 0.5);
    sweep_axis neg(0, -1, -0.5);

    EXPECT_NO_THROW(transistor_sweep(polarity::nmos, l, pos, pos, neg));
    EXPECT_THROW(transistor_sweep(polarity::nmos, l, neg, pos, neg), configuration_error);
    EXPECT_THROW(transistor_sweep(polarity::nmos, l, pos, neg, neg), configuration_error);
    EXPECT_THROW(transistor_sweep(polarity::nmos, l, pos, pos, pos), configuration_error);
}

TEST(transistor_sweep, pmos_signs) {
    sweep_axis l{ 1e-6 };
    sweep_axis pos(0, 1, 0.5);
    sweep_axis neg(0, -1, -0.5);

    EXPECT_NO_THROW(transistor_sweep(polarity::pmos, l, neg, neg, pos));
    EXPECT_THROW(transistor_sweep(polarity::pmos, l, pos, neg, pos), configuration_error);
    EXPECT_THROW(transistor_sweep(polarity::pmos, l, neg, pos, pos), configuration_error);
    EXPECT_THROW(transistor_sweep(polarity::pmos, l, neg, neg, neg), configuration_error);
}

TEST(transistor_sweep, lengths_must_be_positive) {
    sweep_axis v(0, 1, 0.5);
    EXPECT_THROW(transistor_sweep(polarity::nmos, { 0.0, 1e-6 }, v, v, { 0.0 }), configuration_error);
}

TEST(transistor_sweep, sg13_presets) {
    EXPECT_EQ(sg13_lengths.size(), 76u);
    EXPECT_NEAR(sg13_lengths.front(), 130e-9, 1e-15);
    EXPECT_NEAR(sg13_lengths.back(), 9.88e-6, 1e-12);

    EXPECT_EQ(sg13_lv_nmos_sweep.vgs.size(), 151u);
    EXPECT_EQ(sg13_lv_nmos_sweep.vds.size(), 31u);
    EXPECT_EQ(sg13_lv_nmos_sweep.vbs.size(), 13u);
    EXPECT_EQ(sg13_lv_pmos_sweep.size(), sg13_lv_nmos_sweep.size());
}

TEST(transistor_sweep, polarity_names) {
    EXPECT_EQ(polarity_from_string("nmos"), polarity::nmos);
    EXPECT_EQ(polarity_from_string("pmos"), polarity::pmos);
    EXPECT_EQ(to_string(polarity::pmos), "pmos");
    EXPECT_THROW(polarity_from_string("npn"), configuration_error);
}
