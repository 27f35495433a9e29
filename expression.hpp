#ifndef EXPRESSION_HPP
#define EXPRESSION_HPP

#include <armadillo>
#include <cmath>
#include <string>

#include "constant.hpp"
#include "error.hpp"
#include "raw_data.hpp"

// every quantity a table can be asked for: the raw simulated ones and the derived figures of merit
enum class quantity {
    id,
    gm,
    gds,
    vth,
    vdsat,
    cgg,
    cgs,
    cgd,
    gmid, // gm / id
    ft,   // gm / (2 pi cgg)
    gain, // gm / gds
    id_w, // id / W
    gm_w  // gm / W
};

static const quantity all_quantities[] = {
    quantity::id, quantity::gm, quantity::gds, quantity::vth, quantity::vdsat, quantity::cgg, quantity::cgs,
    quantity::cgd, quantity::gmid, quantity::ft, quantity::gain, quantity::id_w, quantity::gm_w
};

static inline std::string quantity_name(quantity q);
static inline std::string label(quantity q);
static inline quantity quantity_from_string(const std::string & s);
static inline bool is_derived(quantity q);

// element-wise evaluation; invalid points and divisions by zero come out as non-finite values
static inline arma::vec evaluate(quantity q, const raw_data & r);

// a sample is admissible if it is finite and strictly positive
static inline arma::uvec admissible(const arma::vec & x);
static inline arma::uvec admissible(const arma::vec & x, const arma::vec & y);

// maximum over admissible samples, empty_table_error if there are none
static inline double admissible_max(const arma::vec & x);

// index of the admissible sample closest to target (first one on a tie), empty_table_error if there are none
static inline arma::uword nearest_admissible(const arma::vec & x, double target);

//----------------------------------------------------------------------------------------------------------------------

std::string quantity_name(quantity q) {
    switch (q) {
    case quantity::id:    return "id";
    case quantity::gm:    return "gm";
    case quantity::gds:   return "gds";
    case quantity::vth:   return "vth";
    case quantity::vdsat: return "vdsat";
    case quantity::cgg:   return "cgg";
    case quantity::cgs:   return "cgs";
    case quantity::cgd:   return "cgd";
    case quantity::gmid:  return "gmid";
    case quantity::ft:    return "ft";
    case quantity::gain:  return "gain";
    case quantity::id_w:  return "id_w";
    case quantity::gm_w:  return "gm_w";
    }
    return "";
}

std::string label(quantity q) {
    switch (q) {
    case quantity::id:    return "I_D / A";
    case quantity::gm:    return "g_m / S";
    case quantity::gds:   return "g_ds / S";
    case quantity::vth:   return "V_th / V";
    case quantity::vdsat: return "V_dsat / V";
    case quantity::cgg:   return "C_gg / F";
    case quantity::cgs:   return "C_gs / F";
    case quantity::cgd:   return "C_gd / F";
    case quantity::gmid:  return "g_m/I_D / (S/A)";
    case quantity::ft:    return "f_T / Hz";
    case quantity::gain:  return "g_m/g_ds / (V/V)";
    case quantity::id_w:  return "I_D/W / (A/m)";
    case quantity::gm_w:  return "g_m/W / (S/m)";
    }
    return "";
}

quantity quantity_from_string(const std::string & s) {
    for (quantity q : all_quantities) {
        if (quantity_name(q) == s) {
            return q;
        }
    }
    throw configuration_error("unknown quantity '" + s + "'");
}

bool is_derived(quantity q) {
    return q == quantity::gmid || q == quantity::ft || q == quantity::gain || q == quantity::id_w
        || q == quantity::gm_w;
}

arma::vec evaluate(quantity q, const raw_data & r) {
    arma::vec ret;

    switch (q) {
    case quantity::id:    ret = r.id;    break;
    case quantity::gm:    ret = r.gm;    break;
    case quantity::gds:   ret = r.gds;   break;
    case quantity::vth:   ret = r.vth;   break;
    case quantity::vdsat: ret = r.vdsat; break;
    case quantity::cgg:   ret = r.cgg;   break;
    case quantity::cgs:   ret = r.cgs;   break;
    case quantity::cgd:   ret = r.cgd;   break;
    case quantity::gmid:  ret = r.gm / r.id;                break;
    case quantity::ft:    ret = r.gm / (2 * c::pi * r.cgg); break;
    case quantity::gain:  ret = r.gm / r.gds;               break;
    case quantity::id_w:  ret = r.id / r.width;             break;
    case quantity::gm_w:  ret = r.gm / r.width;             break;
    }

    // invalid points never carry a number, whatever the arithmetic made of the nan
    ret.elem(arma::find(r.valid == 0)).fill(arma::datum::nan);

    // derived quantities need a positive drain current, a reversed one would pass every sign test
    if (is_derived(q)) {
        for (arma::uword k = 0; k < ret.n_elem; ++k) {
            if (!(std::isfinite(r.id(k)) && (r.id(k) > 0))) {
                ret(k) = arma::datum::nan;
            }
        }
    }

    return ret;
}

arma::uvec admissible(const arma::vec & x) {
    arma::uvec ret(x.n_elem);
    arma::uword n = 0;
    for (arma::uword i = 0; i < x.n_elem; ++i) {
        if (std::isfinite(x(i)) && (x(i) > 0)) {
            ret(n++) = i;
        }
    }
    ret.resize(n);
    return ret;
}

arma::uvec admissible(const arma::vec & x, const arma::vec & y) {
    arma::uvec ret(x.n_elem);
    arma::uword n = 0;
    for (arma::uword i = 0; i < x.n_elem; ++i) {
        if (std::isfinite(x(i)) && (x(i) > 0) && std::isfinite(y(i)) && (y(i) > 0)) {
            ret(n++) = i;
        }
    }
    ret.resize(n);
    return ret;
}

double admissible_max(const arma::vec & x) {
    arma::uvec ok = admissible(x);
    if (ok.is_empty()) {
        throw empty_table_error("maximum over a set without admissible samples");
    }
    return arma::max(x.elem(ok));
}

arma::uword nearest_admissible(const arma::vec & x, double target) {
    arma::uvec ok = admissible(x);
    if (ok.is_empty()) {
        throw empty_table_error("nearest neighbour in a set without admissible samples");
    }

    // ok is ascending and only a strictly smaller distance replaces the best one
    arma::uword best = ok(0);
    double d_best = std::abs(x(best) - target);
    for (arma::uword i = 1; i < ok.n_elem; ++i) {
        double d = std::abs(x(ok(i)) - target);
        if (d < d_best) {
            best = ok(i);
            d_best = d;
        }
    }
    return best;
}

#endif
