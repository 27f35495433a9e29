#ifndef TEST_UTIL_HPP
#define TEST_UTIL_HPP

#include <cmath>
#include <functional>
#include <stdexcept>
#include <string>

#include "constant.hpp"
#include "lookup_table.hpp"
#include "oracle.hpp"
#include "table_builder.hpp"
#include "transistor_sweep.hpp"

// oracle backed by an arbitrary function, for synthetic tables with known values
class function_oracle : public oracle {
public:
    using function = std::function<bool(double l, double w, double vgs, double vds, double vbs, small_signal & out)>;

    function f;

    function_oracle(const std::string & n, const function & fn)
        : oracle(n), f(fn) {
    }

    bool evaluate(double l, double w, double vgs, double vds, double vbs, small_signal & out) const override {
        return f(l, w, vgs, vds, vbs, out);
    }

    std::string to_string() const override {
        return "oracle  = " + name + "\n";
    }
};

// fills every raw quantity from id, gm/ID, gain and fT
static inline void fill_point(double id, double gmid, double gain, double ft, small_signal & out) {
    out.id = id;
    out.gm = gmid * id;
    out.gds = out.gm / gain;
    out.vth = 0.4;
    out.vdsat = 0.1;
    out.cgg = out.gm / (2 * c::pi * ft);
    out.cgs = 0.7 * out.cgg;
    out.cgd = 0.2 * out.cgg;
}

// synthetic device with round numbers in |vgs| and L in um, gain falls as gm/ID rises:
// ID/W = 0.1 |vgs| / L, gm/ID = 20 - 10 |vgs|, gain = 40 L (|vgs| + 0.5), fT = 1 GHz / L^2
static inline bool synthetic_device(double l, double w, double vgs, double, double, small_signal & out) {
    double g = std::abs(vgs);
    double l_um = l * 1e6;
    fill_point(w * 0.1 * g / l_um, 20 - 10 * g, 40 * l_um * (g + 0.5), 1e9 / (l_um * l_um), out);
    return true;
}

static inline lookup_table build_table(const std::string & name, const transistor_sweep & s, double width,
                                       const function_oracle::function & f) {
    function_oracle o(name, f);
    lookup_table t;
    if (!characterize<false>(o, name, s, width, 1, t)) {
        throw std::runtime_error("characterization of " + name + " stopped early");
    }
    return t;
}

// one length at L = 1um, vds = 0.6, vgs = 0.3, 0.6, 0.9, 1.2; every point converges:
// vgs = 0.3: id > 0, gm/ID = 5, gain = 30, fT = 1 GHz
// vgs = 0.6: id < 0 with gm, gds and cgg reversed as well, gm/ID = 10, gain = 50
// vgs = 0.9: id > 0, gm/ID = 20, gain = 25, fT = 2 GHz
// vgs = 1.2: id = 0 with gm > 0, gain = 1000, fT around 16 GHz
static inline lookup_table reversed_current_table() {
    transistor_sweep s(polarity::nmos, { 1e-6 }, sweep_axis(0.3, 1.2, 0.3), { 0.6 }, { 0.0 });
    return build_table("n", s, 1e-6, [] (double, double, double vgs, double, double, small_signal & out) {
        switch (std::lround(vgs / 0.3)) {
        case 1:  fill_point(1e-6, 5, 30, 1e9, out);   break;
        case 2:  fill_point(-1e-6, 10, 50, 1e9, out); break;
        case 3:  fill_point(1e-6, 20, 25, 2e9, out);  break;
        default: out = small_signal { 0.0, 1e-5, 1e-8, 0.4, 0.1, 1e-16, 0.7e-16, 0.2e-16 }; break;
        }
        return true;
    });
}

#endif
