#ifndef EKV_MODEL_HPP
#define EKV_MODEL_HPP

#include <cmath>
#include <sstream>
#include <string>

#include "constant.hpp"
#include "oracle.hpp"
#include "transistor_sweep.hpp"

// parameters of a long-channel EKV model (magnitudes, the polarity takes care of the signs)
class ekv_params {
public:
    polarity type;
    double vt0;    // threshold voltage at vbs = 0
    double n;      // subthreshold slope factor
    double kp;     // transconductance parameter mu * C_ox
    double gamma;  // body effect coefficient
    double phi;    // surface potential
    double lambda; // channel length modulation, divided by L
    double t_ox;   // oxide thickness
    double c_ov;   // overlap capacitance per width
    double temp;   // temperature in degC

    inline std::string to_string() const;
};

static const ekv_params sg13_lv_nmos_ekv {
    polarity::nmos,
    0.40,     // vt0
    1.30,     // n
    350e-6,   // kp
    0.40,     // gamma
    0.85,     // phi
    0.02e-6,  // lambda
    2.6e-9,   // t_ox
    0.3e-9,   // c_ov
    27.0      // temp
};

static const ekv_params sg13_lv_pmos_ekv {
    polarity::pmos,
    0.45,     // vt0
    1.35,     // n
    90e-6,    // kp
    0.35,     // gamma
    0.85,     // phi
    0.03e-6,  // lambda
    2.6e-9,   // t_ox
    0.3e-9,   // c_ov
    27.0      // temp
};

// analytic stand-in for a circuit simulator
class ekv_oracle : public oracle {
public:
    ekv_params p;

    inline ekv_oracle(const std::string & name, const ekv_params & p);

    inline bool evaluate(double l, double w, double vgs, double vds, double vbs, small_signal & out) const override;

    inline std::string to_string() const override;

private:
    // normalized current ln^2(1 + exp(v / 2U_T)) and its derivative
    inline double F(double v) const;
    inline double dF(double v) const;
};

//----------------------------------------------------------------------------------------------------------------------

std::string ekv_params::to_string() const {
    using namespace std;

    stringstream ss;

    ss << "type    = " << ::to_string(type) << endl;
    ss << "vt0     = " << vt0    << endl;
    ss << "n       = " << n      << endl;
    ss << "kp      = " << kp     << endl;
    ss << "gamma   = " << gamma  << endl;
    ss << "phi     = " << phi    << endl;
    ss << "lambda  = " << lambda << endl;
    ss << "t_ox    = " << t_ox   << endl;
    ss << "c_ov    = " << c_ov   << endl;
    ss << "temp    = " << temp   << endl;

    return ss.str();
}

ekv_oracle::ekv_oracle(const std::string & n_, const ekv_params & p_)
    : oracle(n_), p(p_) {
}

bool ekv_oracle::evaluate(double l, double w, double vgs, double vds, double vbs, small_signal & out) const {
    // pmos is evaluated on mirrored voltages
    double s = (p.type == polarity::nmos) ? 1.0 : -1.0;
    vgs *= s;
    vds *= s;
    vbs *= s;

    // forward biased body junction beyond the surface potential
    if (p.phi - vbs <= 0) {
        return false;
    }

    double U = c::U_T(p.temp);
    double cox = c::eps_0 * c::eps_ox / p.t_ox;

    double vth = p.vt0 + p.gamma * (std::sqrt(p.phi - vbs) - std::sqrt(p.phi));
    double vp  = (vgs - vth) / p.n;
    double Is  = 2 * p.n * p.kp * (w / l) * U * U;
    double lam = p.lambda / l;
    double clm = 1 + lam * vds;

    // forward and reverse inversion coefficients
    double i_f = F(vp);
    double i_r = F(vp - vds);

    out.id  = Is * (i_f - i_r) * clm;
    out.gm  = Is * (dF(vp) - dF(vp - vds)) / p.n * clm;
    out.gds = Is * dF(vp - vds) * clm + Is * (i_f - i_r) * lam;
    out.vth = s * vth;
    out.vdsat = s * (2 * U * std::sqrt(i_f + 0.25) + 3 * U);

    // intrinsic charge-based capacitances plus overlap
    double C  = w * l * cox;
    double xf = std::sqrt(0.25 + i_f);
    double xr = std::sqrt(0.25 + i_r);
    double x2 = (xf + xr) * (xf + xr);
    double cgsi = 2.0 / 3.0 * (1 - (xr * xr + xr + 0.5 * xf) / x2);
    double cgdi = 2.0 / 3.0 * (1 - (xf * xf + xf + 0.5 * xr) / x2);
    double cgbi = (p.n - 1) / p.n * (1 - cgsi - cgdi);

    out.cgs = C * cgsi + p.c_ov * w;
    out.cgd = C * cgdi + p.c_ov * w;
    out.cgg = out.cgs + out.cgd + C * cgbi;

    return std::isfinite(out.id) && std::isfinite(out.gm) && std::isfinite(out.gds) && std::isfinite(out.cgg);
}

std::string ekv_oracle::to_string() const {
    std::stringstream ss;
    ss << "oracle  = " << name << std::endl;
    ss << p.to_string();
    return ss.str();
}

double ekv_oracle::F(double v) const {
    double u = v / (2 * c::U_T(p.temp));
    double q = (u > 30) ? u : std::log1p(std::exp(u));
    return q * q;
}

double ekv_oracle::dF(double v) const {
    double U = c::U_T(p.temp);
    double u = v / (2 * U);
    double q = (u > 30) ? u : std::log1p(std::exp(u));
    double sigma = 1 / (1 + std::exp(-u));
    return q * sigma / U;
}

#endif
