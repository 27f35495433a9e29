#ifndef MOSFET_HPP
#define MOSFET_HPP

#include <algorithm>
#include <armadillo>
#include <cmath>
#include <sstream>
#include <string>

#include "constant.hpp"
#include "error.hpp"
#include "expression.hpp"
#include "lookup_table.hpp"

// a lookup table seen at one bias point: vds and vbs fixed to their nearest grid values,
// vgs restricted to a closed range. Every quantity becomes a (length x vgs) matrix.
class mosfet {
public:
    std::string name;
    polarity type;
    double width;

    // grid values actually used for the fixed bias
    double vbs;
    double vds;
    arma::uword i_vbs;
    arma::uword i_vds;

    arma::vec length; // all lengths of the table
    arma::vec vgs;    // vgs points inside the range
    arma::uvec i_vgs; // their indices in the table

    // the (length, vgs) plane, length running fastest
    raw_data raw;

    inline mosfet(const lookup_table & t, double vbs, double vds, double vgs0, double vgs1);

    inline arma::uword n_length() const;
    inline arma::uword n_vgs() const;

    // n_length x n_vgs matrix
    inline arma::mat operator()(quantity q) const;

    inline std::string to_string() const;
};

// ranges of the design charts over admissible samples
struct chart_statistics {
    double gmid_min;
    double gmid_max;
    double ft_max;
    double gain_max;
    double gain_max_db;

    inline std::string to_string() const;
};

static inline chart_statistics statistics(const mosfet & m);

// y over gm/ID for every length; columns are length, gm/ID, y. Only admissible pairs are kept.
static inline arma::mat chart(const mosfet & m, quantity y);

// writes the fT, gain, ID/W and gm/W charts as csv files into folder
static inline void save_charts(const mosfet & m, const std::string & folder);

//----------------------------------------------------------------------------------------------------------------------

mosfet::mosfet(const lookup_table & t, double vbs_, double vds_, double vgs0, double vgs1)
    : name(t.name), type(t.type), width(t.width()), length(t.length.values) {
    // nearest grid points, no interpolation
    i_vbs = t.vbs.nearest(vbs_);
    i_vds = t.vds.nearest(vds_);
    vbs = t.vbs[i_vbs];
    vds = t.vds[i_vds];

    double lo = std::min(vgs0, vgs1) - c::grid_tol;
    double hi = std::max(vgs0, vgs1) + c::grid_tol;
    i_vgs = arma::find((t.vgs.values >= lo) && (t.vgs.values <= hi));
    if (i_vgs.is_empty()) {
        std::stringstream ss;
        ss << "(" << name << ") no vgs grid point in [" << vgs0 << ", " << vgs1 << "]";
        throw configuration_error(ss.str());
    }
    vgs = t.vgs.values.elem(i_vgs);

    raw.gather(t.raw, array4::plane(t.shape(), i_vbs, i_vds, i_vgs));
}

arma::uword mosfet::n_length() const {
    return length.n_elem;
}

arma::uword mosfet::n_vgs() const {
    return vgs.n_elem;
}

arma::mat mosfet::operator()(quantity q) const {
    return arma::reshape(evaluate(q, raw), n_length(), n_vgs());
}

std::string mosfet::to_string() const {
    using namespace std;

    stringstream ss;

    ss << "name    = " << name << endl;
    ss << "type    = " << ::to_string(type) << endl;
    ss << "width   = " << width << endl;
    ss << "vbs     = " << vbs << endl;
    ss << "vds     = " << vds << endl;
    ss << "vgs     = " << vgs(0) << " .. " << vgs(vgs.n_elem - 1) << endl;
    ss << "lengths = " << n_length() << endl;

    return ss.str();
}

std::string chart_statistics::to_string() const {
    using namespace std;

    stringstream ss;

    ss << "gmid_min    = " << gmid_min    << endl;
    ss << "gmid_max    = " << gmid_max    << endl;
    ss << "ft_max      = " << ft_max      << endl;
    ss << "gain_max    = " << gain_max    << endl;
    ss << "gain_max_db = " << gain_max_db << endl;

    return ss.str();
}

chart_statistics statistics(const mosfet & m) {
    chart_statistics s;

    arma::vec gmid = arma::vectorise(m(quantity::gmid));
    arma::uvec ok = admissible(gmid);
    if (ok.is_empty()) {
        throw empty_table_error("(" + m.name + ") no admissible gm/ID sample");
    }
    s.gmid_min = arma::min(gmid.elem(ok));
    s.gmid_max = arma::max(gmid.elem(ok));

    s.ft_max = admissible_max(arma::vectorise(m(quantity::ft)));
    s.gain_max = admissible_max(arma::vectorise(m(quantity::gain)));
    s.gain_max_db = 20 * std::log10(s.gain_max);

    return s;
}

arma::mat chart(const mosfet & m, quantity y) {
    arma::mat gmid = m(quantity::gmid);
    arma::mat Y = m(y);

    arma::mat ret(gmid.n_elem, 3);
    arma::uword n = 0;
    for (arma::uword l = 0; l < m.n_length(); ++l) {
        arma::vec x_row = gmid.row(l).t();
        arma::vec y_row = Y.row(l).t();
        arma::uvec ok = admissible(x_row, y_row);
        for (arma::uword j : ok) {
            ret(n, 0) = m.length(l);
            ret(n, 1) = x_row(j);
            ret(n, 2) = y_row(j);
            ++n;
        }
    }
    ret.resize(n, 3);
    return ret;
}

void save_charts(const mosfet & m, const std::string & folder) {
    if (!make_folder(folder)) {
        throw table_io_error("(" + m.name + ") can not create " + folder);
    }
    for (quantity y : { quantity::ft, quantity::gain, quantity::id_w, quantity::gm_w }) {
        std::string file = folder + "/" + m.name + "_" + quantity_name(y) + "_vs_gmid.csv";
        if (!chart(m, y).save(file, arma::csv_ascii)) {
            throw table_io_error("(" + m.name + ") can not write " + file);
        }
    }
}

#endif
