#ifndef ARRAY4_HPP
#define ARRAY4_HPP

#include <armadillo>
#include <array>

#include "constant.hpp"

using shape4 = std::array<arma::uword, 4>;

// dense 4-d array in (length, vbs, vgs, vds) order, vds running fastest
class array4 {
public:
    shape4 shape;
    arma::vec data;

    inline array4();
    inline array4(const shape4 & shape);
    inline array4(const shape4 & shape, const arma::vec & data);

    inline arma::uword size() const;

    inline arma::uword index(arma::uword l, arma::uword b, arma::uword g, arma::uword d) const;
    static inline arma::uword index(const shape4 & s, arma::uword l, arma::uword b, arma::uword g, arma::uword d);
    inline shape4 subscript(arma::uword k) const;
    static inline shape4 subscript(const shape4 & s, arma::uword k);

    inline double & operator()(arma::uword l, arma::uword b, arma::uword g, arma::uword d);
    inline const double & operator()(arma::uword l, arma::uword b, arma::uword g, arma::uword d) const;

    // all vgs points of one (length, vbs, vds) combination
    inline arma::vec gate_row(arma::uword l, arma::uword b, arma::uword d) const;

    // all vds points of one (length, vbs, vgs) combination
    inline arma::vec drain_row(arma::uword l, arma::uword b, arma::uword g) const;

    // flat indices of the (length, vgs) plane at fixed vbs and vds, length running fastest
    static inline arma::uvec plane(const shape4 & s, arma::uword b, arma::uword d, const arma::uvec & gates);
};

//----------------------------------------------------------------------------------------------------------------------

array4::array4()
    : shape({ 0, 0, 0, 0 }) {
}

array4::array4(const shape4 & s)
    : shape(s), data(s[LEN] * s[VBS] * s[VGS] * s[VDS]) {
    data.fill(arma::datum::nan);
}

array4::array4(const shape4 & s, const arma::vec & v)
    : shape(s), data(v) {
}

arma::uword array4::size() const {
    return data.n_elem;
}

arma::uword array4::index(arma::uword l, arma::uword b, arma::uword g, arma::uword d) const {
    return index(shape, l, b, g, d);
}

arma::uword array4::index(const shape4 & s, arma::uword l, arma::uword b, arma::uword g, arma::uword d) {
    return ((l * s[VBS] + b) * s[VGS] + g) * s[VDS] + d;
}

shape4 array4::subscript(arma::uword k) const {
    return subscript(shape, k);
}

shape4 array4::subscript(const shape4 & s, arma::uword k) {
    shape4 ret;
    ret[VDS] = k % s[VDS];
    k /= s[VDS];
    ret[VGS] = k % s[VGS];
    k /= s[VGS];
    ret[VBS] = k % s[VBS];
    ret[LEN] = k / s[VBS];
    return ret;
}

double & array4::operator()(arma::uword l, arma::uword b, arma::uword g, arma::uword d) {
    return data(index(l, b, g, d));
}

const double & array4::operator()(arma::uword l, arma::uword b, arma::uword g, arma::uword d) const {
    return data(index(l, b, g, d));
}

arma::vec array4::gate_row(arma::uword l, arma::uword b, arma::uword d) const {
    arma::vec ret(shape[VGS]);
    for (arma::uword g = 0; g < shape[VGS]; ++g) {
        ret(g) = data(index(l, b, g, d));
    }
    return ret;
}

arma::vec array4::drain_row(arma::uword l, arma::uword b, arma::uword g) const {
    // vds is contiguous
    return data.subvec(index(l, b, g, 0), index(l, b, g, shape[VDS] - 1));
}

arma::uvec array4::plane(const shape4 & s, arma::uword b, arma::uword d, const arma::uvec & gates) {
    arma::uvec ret(s[LEN] * gates.n_elem);
    for (arma::uword j = 0; j < gates.n_elem; ++j) {
        for (arma::uword l = 0; l < s[LEN]; ++l) {
            ret(j * s[LEN] + l) = index(s, l, b, gates(j), d);
        }
    }
    return ret;
}

#endif
