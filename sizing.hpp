#ifndef SIZING_HPP
#define SIZING_HPP

#include <armadillo>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "constant.hpp"
#include "error.hpp"
#include "expression.hpp"
#include "lookup_table.hpp"
#include "mosfet.hpp"

// what a single-transistor gain stage has to achieve
class design_specs {
public:
    double gmid;     // target gm/ID of the operating point
    double gain_min; // gain floor
    double bw_min;   // bandwidth floor
    double c_load;   // load capacitance
    double vdd;      // supply voltage
    double vds;      // fixed drain-source bias
    double vbs;      // fixed body-source bias
    double vgs0;     // vgs range
    double vgs1;
    double gmid_ref; // gm/ID at which the gain of each length is compared

    inline void check() const;

    // the same request with its voltages in the sign convention of type (specs are written for nmos)
    inline design_specs for_polarity(polarity type) const;

    inline std::string to_string() const;
};

// common-source amplifier: Av > 20 dB, BW > 100 MHz into 100 fF from 1.2 V
static const design_specs cs_amp_specs {
    10.0,    // gmid
    10.0,    // gain_min
    100e6,   // bw_min
    100e-15, // c_load
    1.2,     // vdd
    0.6,     // vds
    0.0,     // vbs
    0.3,     // vgs0
    1.2,     // vgs1
    10.0     // gmid_ref
};

// gain of every length over the vgs range
class length_analysis {
public:
    arma::vec length;
    arma::vec max_gain;    // maximum admissible gain
    arma::vec gain_at_ref; // gain where gm/ID is closest to the reference
    arma::uvec has_data;   // 0 if the length has no admissible sample at all

    inline length_analysis(const mosfet & m, double gmid_ref);
};

enum class selection {
    met,        // the length meets the gain floor at the reference gm/ID
    best_effort // nothing does, this is the length with the highest gain
};

struct length_choice {
    arma::uword index;
    double length;
    double gain;
    selection status;
    std::string justification;
};

struct operating_point {
    arma::uword i_length; // index into the length axis
    arma::uword i_vgs;    // index into the vgs axis of the table
    double length;
    double vgs;
    double vds;
    double vbs;

    small_signal raw;
    double gmid;
    double gain;
    double ft;
    double id_w;
    double gm_w;

    inline std::string to_string() const;
};

struct design_result {
    std::string name;
    selection status;
    bool gain_met;       // expected gain at the operating point reaches the floor
    double length;
    double width;
    double vgs;
    double vds;
    double vbs;
    double gmid;
    double gm_required;
    double id_required;
    double expected_gain;
    double expected_gain_db;
    double ft;
    double ft_margin;    // fT / BW
    double power;        // VDD * ID
    std::string justification;

    inline std::string to_string() const;
};

// step 1: smallest length whose gain at the reference gm/ID reaches gain_min, else the one with the highest gain
static inline length_choice select_length(const mosfet & m, double gain_min, double gmid_ref);

// step 2: vgs point of length i_length whose gm/ID is closest to target_gmid
static inline operating_point find_operating_point(const mosfet & m, arma::uword i_length, double target_gmid);

// step 3: width and current from the bandwidth requirement
static inline design_result dimension(const design_specs & s, const operating_point & op, const length_choice & c,
                                      const std::string & name);

// all three steps on a lookup table
template<bool verbose = true>
static inline design_result design(const lookup_table & t, const design_specs & s);

// id over vgs of every length, scaled to the designed width; columns are vgs, id(length 0), id(length 1), ...
static inline arma::mat scaled_transfer(const lookup_table & t, const design_result & d);

// id over vds of the designed length for vgs - 0.1, vgs, vgs + 0.1 and vgs + 0.2 (towards stronger inversion),
// scaled to the designed width; columns are vds, id(vgs_used(0)), ...
static inline arma::mat scaled_output(const lookup_table & t, const design_result & d, arma::vec & vgs_used);

static inline std::string to_string(selection s);

//----------------------------------------------------------------------------------------------------------------------

void design_specs::check() const {
    if (!(gmid > 0)) {
        throw configuration_error("design_specs: target gm/ID must be positive");
    }
    if (!(gmid_ref > 0)) {
        throw configuration_error("design_specs: reference gm/ID must be positive");
    }
    if (!(bw_min > 0)) {
        throw configuration_error("design_specs: bandwidth must be positive");
    }
    if (!(c_load > 0)) {
        throw configuration_error("design_specs: load capacitance must be positive");
    }
    if (!std::isfinite(gain_min) || !std::isfinite(vdd) || !std::isfinite(vds) || !std::isfinite(vbs)
        || !std::isfinite(vgs0) || !std::isfinite(vgs1)) {
        throw configuration_error("design_specs: non-finite value");
    }
}

design_specs design_specs::for_polarity(polarity type) const {
    design_specs ret = *this;
    if (type == polarity::pmos) {
        ret.vds  = -vds;
        ret.vbs  = -vbs;
        ret.vgs0 = -vgs1;
        ret.vgs1 = -vgs0;
    }
    return ret;
}

std::string design_specs::to_string() const {
    using namespace std;

    stringstream ss;

    ss << "gmid     = " << gmid     << endl;
    ss << "gain_min = " << gain_min << endl;
    ss << "bw_min   = " << bw_min   << endl;
    ss << "c_load   = " << c_load   << endl;
    ss << "vdd      = " << vdd      << endl;
    ss << "vds      = " << vds      << endl;
    ss << "vbs      = " << vbs      << endl;
    ss << "vgs0     = " << vgs0     << endl;
    ss << "vgs1     = " << vgs1     << endl;
    ss << "gmid_ref = " << gmid_ref << endl;

    return ss.str();
}

length_analysis::length_analysis(const mosfet & m, double gmid_ref)
    : length(m.length), max_gain(m.n_length()), gain_at_ref(m.n_length()), has_data(m.n_length()) {
    arma::mat gmid = m(quantity::gmid);
    arma::mat gain = m(quantity::gain);

    for (arma::uword l = 0; l < m.n_length(); ++l) {
        arma::vec gmid_row = gmid.row(l).t();
        arma::vec gain_row = gain.row(l).t();

        // samples where both gm/ID and gain make sense
        arma::uvec ok = admissible(gmid_row, gain_row);
        has_data(l) = ok.is_empty() ? 0 : 1;
        if (ok.is_empty()) {
            max_gain(l) = arma::datum::nan;
            gain_at_ref(l) = arma::datum::nan;
            continue;
        }

        arma::vec g = gain_row.elem(ok);
        max_gain(l) = arma::max(g);
        gain_at_ref(l) = g(nearest_admissible(arma::vec(gmid_row.elem(ok)), gmid_ref));
    }
}

length_choice select_length(const mosfet & m, double gain_min, double gmid_ref) {
    length_analysis a(m, gmid_ref);

    if (!arma::any(a.has_data)) {
        throw empty_table_error("(" + m.name + ") no length has an admissible gain sample");
    }

    // lengths without a single admissible sample take no part in the choice
    arma::uword n_empty = a.has_data.n_elem - arma::accu(a.has_data);
    std::string skipped;
    if (n_empty > 0) {
        skipped = "; " + std::to_string(n_empty) + " length(s) without admissible samples skipped";
    }

    std::stringstream ss;
    ss << std::setprecision(3);

    length_choice c;
    bool found = false;

    // smallest qualifying length (by value, the axis may be descending)
    for (arma::uword l = 0; l < a.length.n_elem; ++l) {
        if (a.has_data(l) && (a.gain_at_ref(l) >= gain_min) && (!found || (a.length(l) < c.length))) {
            c.index = l;
            c.length = a.length(l);
            c.gain = a.gain_at_ref(l);
            found = true;
        }
    }

    if (found) {
        c.status = selection::met;
        ss << "L=" << c.length * 1e6 << "um provides gain=" << c.gain << " at gm/ID=" << gmid_ref
           << ", meeting Av>" << gain_min << skipped;
        c.justification = ss.str();
        return c;
    }

    // fall back to the highest gain anywhere, first length on a tie
    for (arma::uword l = 0; l < a.length.n_elem; ++l) {
        if (a.has_data(l) && (!found || (a.max_gain(l) > c.gain))) {
            c.index = l;
            c.length = a.length(l);
            c.gain = a.max_gain(l);
            found = true;
        }
    }

    c.status = selection::best_effort;
    ss << "no length meets gain=" << gain_min << " at gm/ID=" << gmid_ref << ", using L=" << c.length * 1e6
       << "um (max gain " << c.gain << ")" << skipped;
    c.justification = ss.str();
    return c;
}

operating_point find_operating_point(const mosfet & m, arma::uword i_length, double target_gmid) {
    if (i_length >= m.n_length()) {
        throw configuration_error("(" + m.name + ") length index out of range");
    }

    arma::mat gmid = m(quantity::gmid);
    arma::vec gmid_row = gmid.row(i_length).t();

    arma::uword j;
    try {
        j = nearest_admissible(gmid_row, target_gmid);
    } catch (const empty_table_error &) {
        std::stringstream ss;
        ss << "(" << m.name << ") no admissible gm/ID at L=" << m.length(i_length);
        throw empty_table_error(ss.str());
    }

    // position in the flat (length, vgs) plane
    arma::uword k = j * m.n_length() + i_length;

    operating_point op;
    op.i_length = i_length;
    op.i_vgs = m.i_vgs(j);
    op.length = m.length(i_length);
    op.vgs = m.vgs(j);
    op.vds = m.vds;
    op.vbs = m.vbs;
    op.raw = m.raw.get(k);
    op.gmid = gmid_row(j);
    op.gain = m(quantity::gain)(i_length, j);
    op.ft = m(quantity::ft)(i_length, j);
    op.id_w = m(quantity::id_w)(i_length, j);
    op.gm_w = m(quantity::gm_w)(i_length, j);

    return op;
}

design_result dimension(const design_specs & s, const operating_point & op, const length_choice & c,
                        const std::string & name) {
    s.check();

    if (!std::isfinite(op.gmid) || !(op.gmid > 0)) {
        throw invalid_operating_point_error("(" + name + ") gm/ID at the operating point is not positive");
    }
    if (!std::isfinite(op.id_w) || !(op.id_w > 0)) {
        throw invalid_operating_point_error("(" + name + ") current density at the operating point is not positive");
    }

    design_result d;
    d.name = name;
    d.status = c.status;
    d.justification = c.justification;
    d.length = op.length;
    d.vgs = op.vgs;
    d.vds = op.vds;
    d.vbs = op.vbs;
    d.gmid = op.gmid;

    // single pole at the output: BW = gm / (2 pi CL)
    d.gm_required = 2 * c::pi * s.bw_min * s.c_load;
    d.id_required = d.gm_required / op.gmid;

    // density and gm/ID do not depend on the width at fixed length and bias
    d.width = d.id_required / op.id_w;

    d.expected_gain = op.gain;
    d.gain_met = std::isfinite(op.gain) && (op.gain >= s.gain_min);
    d.expected_gain_db = (std::isfinite(op.gain) && (op.gain > 0)) ? 20 * std::log10(op.gain) : -c::inf;
    d.ft = op.ft;
    d.ft_margin = op.ft / s.bw_min;
    d.power = s.vdd * d.id_required;

    return d;
}

template<bool verbose>
design_result design(const lookup_table & t, const design_specs & s) {
    using namespace std;

    s.check();

    if (verbose) {
        cout << "(" << t.name << ") [1/4] bias point vds=" << s.vds << " vbs=" << s.vbs
             << " vgs=" << s.vgs0 << ".." << s.vgs1 << endl;
    }
    mosfet m(t, s.vbs, s.vds, s.vgs0, s.vgs1);
    if (verbose && (std::abs(m.vds) > std::abs(s.vdd))) {
        cout << "(" << t.name << ") WARNING: |vds| = " << std::abs(m.vds) << " exceeds the supply " << s.vdd << endl;
    }

    if (verbose) {
        cout << "(" << t.name << ") [2/4] selecting length for gain > " << s.gain_min << endl;
    }
    length_choice c = select_length(m, s.gain_min, s.gmid_ref);
    if (verbose) {
        cout << "(" << t.name << ")       " << c.justification << endl;
    }

    if (verbose) {
        cout << "(" << t.name << ") [3/4] operating point at gm/ID = " << s.gmid << endl;
    }
    operating_point op = find_operating_point(m, c.index, s.gmid);
    if (verbose) {
        cout << op.to_string();
    }

    if (verbose) {
        cout << "(" << t.name << ") [4/4] dimensions" << endl;
    }
    design_result d = dimension(s, op, c, t.name);
    if (verbose) {
        cout << d.to_string();
        if (d.ft_margin < 10) {
            cout << "(" << t.name << ") WARNING: fT is only " << d.ft_margin << "x the bandwidth" << endl;
        }
    }

    return d;
}

arma::mat scaled_transfer(const lookup_table & t, const design_result & d) {
    arma::uword b = t.vbs.nearest(d.vbs);
    arma::uword v = t.vds.nearest(d.vds);
    double scale = d.width / t.width();

    array4 id = t[quantity::id];

    arma::mat ret(t.vgs.size(), t.length.size() + 1);
    ret.col(0) = t.vgs.values;
    for (arma::uword l = 0; l < t.length.size(); ++l) {
        ret.col(l + 1) = id.gate_row(l, b, v) * scale;
    }
    return ret;
}

arma::mat scaled_output(const lookup_table & t, const design_result & d, arma::vec & vgs_used) {
    arma::uword l = t.length.nearest(d.length);
    arma::uword b = t.vbs.nearest(d.vbs);
    double scale = d.width / t.width();

    // stronger inversion means larger |vgs|
    double s = (t.type == polarity::nmos) ? 1.0 : -1.0;
    const double steps[] = { -0.1, 0.0, 0.1, 0.2 };

    array4 id = t[quantity::id];

    arma::mat ret(t.vds.size(), 5);
    vgs_used.set_size(4);
    ret.col(0) = t.vds.values;
    for (int i = 0; i < 4; ++i) {
        arma::uword g = t.vgs.nearest(d.vgs + s * steps[i]);
        vgs_used(i) = t.vgs[g];
        ret.col(i + 1) = id.drain_row(l, b, g) * scale;
    }
    return ret;
}

std::string to_string(selection s) {
    return s == selection::met ? "met" : "best_effort";
}

std::string operating_point::to_string() const {
    using namespace std;

    stringstream ss;

    ss << "length  = " << length << endl;
    ss << "vgs     = " << vgs    << endl;
    ss << "vds     = " << vds    << endl;
    ss << "vbs     = " << vbs    << endl;
    ss << "gmid    = " << gmid   << endl;
    ss << "gain    = " << gain   << endl;
    ss << "ft      = " << ft     << endl;
    ss << "id_w    = " << id_w   << endl;
    ss << "gm_w    = " << gm_w   << endl;

    return ss.str();
}

std::string design_result::to_string() const {
    using namespace std;

    stringstream ss;

    ss << "name          = " << name                << endl;
    ss << "status        = " << ::to_string(status) << endl;
    ss << "gain_met      = " << (gain_met ? "true" : "false") << endl;
    ss << "length        = " << length           << endl;
    ss << "width         = " << width            << endl;
    ss << "vgs           = " << vgs              << endl;
    ss << "vds           = " << vds              << endl;
    ss << "vbs           = " << vbs              << endl;
    ss << "gmid          = " << gmid             << endl;
    ss << "gm            = " << gm_required      << endl;
    ss << "id            = " << id_required      << endl;
    ss << "gain          = " << expected_gain    << endl;
    ss << "gain_db       = " << expected_gain_db << endl;
    ss << "ft            = " << ft               << endl;
    ss << "ft_margin     = " << ft_margin        << endl;
    ss << "power         = " << power            << endl;
    ss << "justification = " << justification    << endl;

    return ss.str();
}

#endif
