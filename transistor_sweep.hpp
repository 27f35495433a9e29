#ifndef TRANSISTOR_SWEEP_HPP
#define TRANSISTOR_SWEEP_HPP

#include <sstream>
#include <string>

#include "error.hpp"
#include "sweep_axis.hpp"

enum class polarity {
    nmos,
    pmos
};

static inline std::string to_string(polarity p) {
    return p == polarity::nmos ? "nmos" : "pmos";
}

static inline polarity polarity_from_string(const std::string & s) {
    if (s == "nmos") {
        return polarity::nmos;
    }
    if (s == "pmos") {
        return polarity::pmos;
    }
    throw configuration_error("unknown polarity '" + s + "'");
}

// the 4-d grid of one device type; voltages keep the physical sign of the polarity
class transistor_sweep {
public:
    polarity type;
    sweep_axis length;
    sweep_axis vgs;
    sweep_axis vds;
    sweep_axis vbs;

    inline transistor_sweep(polarity type, const sweep_axis & length, const sweep_axis & vgs,
                            const sweep_axis & vds, const sweep_axis & vbs);

    // number of grid points
    inline arma::uword size() const;

    inline std::string to_string() const;

private:
    inline void check() const;
};

//----------------------------------------------------------------------------------------------------------------------

transistor_sweep::transistor_sweep(polarity t, const sweep_axis & l, const sweep_axis & g, const sweep_axis & d,
                                   const sweep_axis & b)
    : type(t), length(l), vgs(g), vds(d), vbs(b) {
    check();
}

arma::uword transistor_sweep::size() const {
    return length.size() * vbs.size() * vgs.size() * vds.size();
}

std::string transistor_sweep::to_string() const {
    using namespace std;

    stringstream ss;

    ss << "type    = " << ::to_string(type)  << endl;
    ss << "length  = " << length.to_string() << endl;
    ss << "vgs     = " << vgs.to_string()    << endl;
    ss << "vds     = " << vds.to_string()    << endl;
    ss << "vbs     = " << vbs.to_string()    << endl;

    return ss.str();
}

void transistor_sweep::check() const {
    if (arma::any(length.values <= 0)) {
        throw configuration_error("transistor_sweep: lengths must be positive");
    }

    // nmos: vgs, vds >= 0 and vbs <= 0; pmos: the reverse
    double s = (type == polarity::nmos) ? 1.0 : -1.0;
    if (arma::any(s * vgs.values < 0)) {
        throw configuration_error("transistor_sweep: vgs sign does not match " + ::to_string(type));
    }
    if (arma::any(s * vds.values < 0)) {
        throw configuration_error("transistor_sweep: vds sign does not match " + ::to_string(type));
    }
    if (arma::any(s * vbs.values > 0)) {
        throw configuration_error("transistor_sweep: vbs sign does not match " + ::to_string(type));
    }
}

#endif
