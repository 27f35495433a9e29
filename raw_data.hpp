#ifndef RAW_DATA_HPP
#define RAW_DATA_HPP

#include <armadillo>

#include "oracle.hpp"

// flat storage of all raw quantities of a set of grid points.
// invalid points hold nan in every quantity and 0 in the validity mask.
class raw_data {
public:
    double width;          // width used for every point
    arma::vec id;
    arma::vec gm;
    arma::vec gds;
    arma::vec vth;
    arma::vec vdsat;
    arma::vec cgg;
    arma::vec cgs;
    arma::vec cgd;
    arma::uchar_vec valid;

    inline raw_data();
    inline raw_data(arma::uword n, double width);

    inline arma::uword size() const;
    inline arma::uword n_invalid() const;

    inline void set(arma::uword k, const small_signal & s);
    inline void invalidate(arma::uword k);
    inline small_signal get(arma::uword k) const;

    // copy the points idx of other into consecutive slots, starting at 0
    inline void gather(const raw_data & other, const arma::uvec & idx);
};

//----------------------------------------------------------------------------------------------------------------------

raw_data::raw_data()
    : width(0) {
}

raw_data::raw_data(arma::uword n, double w)
    : width(w) {
    for (arma::vec * v : { &id, &gm, &gds, &vth, &vdsat, &cgg, &cgs, &cgd }) {
        v->set_size(n);
        v->fill(arma::datum::nan);
    }
    valid = arma::zeros<arma::uchar_vec>(n);
}

arma::uword raw_data::size() const {
    return valid.n_elem;
}

arma::uword raw_data::n_invalid() const {
    return arma::uword(arma::accu(valid == 0));
}

void raw_data::set(arma::uword k, const small_signal & s) {
    id(k)    = s.id;
    gm(k)    = s.gm;
    gds(k)   = s.gds;
    vth(k)   = s.vth;
    vdsat(k) = s.vdsat;
    cgg(k)   = s.cgg;
    cgs(k)   = s.cgs;
    cgd(k)   = s.cgd;
    valid(k) = 1;
}

void raw_data::invalidate(arma::uword k) {
    static const double nan = arma::datum::nan;
    set(k, small_signal { nan, nan, nan, nan, nan, nan, nan, nan });
    valid(k) = 0;
}

small_signal raw_data::get(arma::uword k) const {
    return small_signal { id(k), gm(k), gds(k), vth(k), vdsat(k), cgg(k), cgs(k), cgd(k) };
}

void raw_data::gather(const raw_data & other, const arma::uvec & idx) {
    width = other.width;
    id    = other.id.elem(idx);
    gm    = other.gm.elem(idx);
    gds   = other.gds.elem(idx);
    vth   = other.vth.elem(idx);
    vdsat = other.vdsat.elem(idx);
    cgg   = other.cgg.elem(idx);
    cgs   = other.cgs.elem(idx);
    cgd   = other.cgd.elem(idx);
    valid = other.valid.elem(idx);
}

#endif
