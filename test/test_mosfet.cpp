#include <gtest/gtest.h>

#include <cmath>
#include <string>

#include "error.hpp"
#include "mosfet.hpp"
#include "test_util.hpp"
#include "util/system.hpp"

namespace {

transistor_sweep chart_sweep() {
    return transistor_sweep(polarity::nmos, { 0.5e-6, 1e-6, 2e-6 }, sweep_axis(0, 1.5, 0.1), sweep_axis(0, 1.2, 0.3),
                            sweep_axis(0, -0.6, -0.2));
}

// the longest device does not converge at vgs = 1
bool device_with_hole(double l, double w, double vgs, double vds, double vbs, small_signal & out) {
    synthetic_device(l, w, vgs, vds, vbs, out);
    return !((l > 1.5e-6) && (std::abs(vgs - 1.0) < 1e-9));
}

}

TEST(mosfet, bias_snaps_to_grid) {
    lookup_table t = build_table("n", chart_sweep(), 1e-6, synthetic_device);
    mosfet m(t, -0.25, 0.65, 0.3, 1.0);

    EXPECT_EQ(m.i_vbs, 1u);
    EXPECT_EQ(m.i_vds, 2u);
    EXPECT_NEAR(m.vbs, -0.2, 1e-12);
    EXPECT_NEAR(m.vds, 0.6, 1e-12);

    // closed vgs range
    ASSERT_EQ(m.n_vgs(), 8u);
    EXPECT_EQ(m.i_vgs(0), 3u);
    EXPECT_NEAR(m.vgs(0), 0.3, 1e-12);
    EXPECT_NEAR(m.vgs(7), 1.0, 1e-12);
    EXPECT_EQ(m.n_length(), 3u);
}

TEST(mosfet, reversed_vgs_range) {
    lookup_table t = build_table("n", chart_sweep(), 1e-6, synthetic_device);
    mosfet a(t, 0, 0.6, 0.3, 1.0);
    mosfet b(t, 0, 0.6, 1.0, 0.3);
    EXPECT_TRUE(arma::all(a.i_vgs == b.i_vgs));
}

TEST(mosfet, empty_vgs_range) {
    lookup_table t = build_table("n", chart_sweep(), 1e-6, synthetic_device);
    EXPECT_THROW(mosfet m(t, 0, 0.6, 0.31, 0.39), configuration_error);
}

TEST(mosfet, slice_matches_table) {
    lookup_table t = build_table("n", chart_sweep(), 1e-6, synthetic_device);
    mosfet m(t, -0.4, 0.9, 0.2, 1.2);

    arma::mat id = m(quantity::id);
    arma::mat gain = m(quantity::gain);
    ASSERT_EQ(id.n_rows, m.n_length());
    ASSERT_EQ(id.n_cols, m.n_vgs());

    array4 table_gain = t[quantity::gain];
    for (arma::uword l = 0; l < m.n_length(); ++l) {
        for (arma::uword j = 0; j < m.n_vgs(); ++j) {
            EXPECT_EQ(id(l, j), t.point(l, m.i_vbs, m.i_vgs(j), m.i_vds).id);
            EXPECT_EQ(gain(l, j), table_gain(l, m.i_vbs, m.i_vgs(j), m.i_vds));
        }
    }
}

TEST(mosfet, statistics) {
    lookup_table t = build_table("n", chart_sweep(), 1e-6, device_with_hole);
    mosfet m(t, 0, 0.6, 0.3, 1.0);

    chart_statistics s = statistics(m);
    EXPECT_NEAR(s.gmid_min, 10.0, 1e-9);
    EXPECT_NEAR(s.gmid_max, 17.0, 1e-9);
    EXPECT_NEAR(s.ft_max, 4e9, 1e-3);
    EXPECT_NEAR(s.gain_max, 112.0, 1e-9);
    EXPECT_NEAR(s.gain_max_db, 20 * std::log10(112.0), 1e-9);
}

TEST(mosfet, statistics_need_positive_current) {
    lookup_table t = reversed_current_table();
    mosfet m(t, 0, 0.6, 0.3, 1.2);

    chart_statistics s = statistics(m);
    EXPECT_NEAR(s.gmid_min, 5.0, 1e-9);
    EXPECT_NEAR(s.gmid_max, 20.0, 1e-9);
    EXPECT_NEAR(s.gain_max, 30.0, 1e-9);
    EXPECT_NEAR(s.ft_max, 2e9, 1e-3);

    EXPECT_EQ(chart(m, quantity::gain).n_rows, 2u);
}

TEST(mosfet, statistics_without_data) {
    lookup_table t = build_table("n", chart_sweep(), 1e-6, synthetic_device);

    // vgs = 0 only: no current, no gm/ID
    mosfet m(t, 0, 0.6, 0, 0);
    EXPECT_THROW(statistics(m), empty_table_error);
}

TEST(mosfet, chart_skips_invalid_points) {
    lookup_table t = build_table("n", chart_sweep(), 1e-6, device_with_hole);
    mosfet m(t, 0, 0.6, 0.3, 1.0);

    arma::mat c = chart(m, quantity::ft);
    ASSERT_EQ(c.n_cols, 3u);
    EXPECT_EQ(c.n_rows, 3u * 8u - 1u);
    for (arma::uword i = 0; i < c.n_rows; ++i) {
        double l_um = c(i, 0) * 1e6;
        EXPECT_NEAR(c(i, 2), 1e9 / (l_um * l_um), 1e-3);
        EXPECT_GT(c(i, 1), 0);
    }
}

TEST(mosfet, save_charts) {
    lookup_table t = build_table("sg13_lv_nmos", chart_sweep(), 1e-6, device_with_hole);
    mosfet m(t, 0, 0.6, 0.3, 1.0);

    std::string folder = ::testing::TempDir() + "gmid_charts_" + now();
    save_charts(m, folder);

    for (std::string q : { "ft", "gain", "id_w", "gm_w" }) {
        arma::mat c;
        ASSERT_TRUE(c.load(folder + "/sg13_lv_nmos_" + q + "_vs_gmid.csv", arma::csv_ascii)) << q;
        EXPECT_EQ(c.n_rows, 23u);
        EXPECT_EQ(c.n_cols, 3u);
    }
}
