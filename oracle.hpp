#ifndef ORACLE_HPP
#define ORACLE_HPP

#include <string>

#include "error.hpp"

// raw small-signal quantities of one bias point
struct small_signal {
    double id;    // drain current
    double gm;    // transconductance
    double gds;   // output conductance
    double vth;   // threshold voltage
    double vdsat; // saturation voltage
    double cgg;   // total gate capacitance
    double cgs;   // gate-source capacitance
    double cgd;   // gate-drain capacitance
};

// simulation backend used to characterize a device.
//
// evaluate() is called concurrently from several threads and must not modify shared state.
// id, gm and gds are reported as magnitudes in the conduction direction of the device, the
// capacitances as positive values. A point that does not converge either returns false or
// throws oracle_convergence_error.
class oracle {
public:
    std::string name;

    inline oracle(const std::string & name);
    virtual ~oracle() = default;

    virtual bool evaluate(double l, double w, double vgs, double vds, double vbs, small_signal & out) const = 0;

    // all parameters that stay fixed during a sweep, as ini text
    virtual std::string to_string() const = 0;
};

//----------------------------------------------------------------------------------------------------------------------

oracle::oracle(const std::string & n)
    : name(n) {
}

#endif
