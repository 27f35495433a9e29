#ifndef CONSTANT_HPP
#define CONSTANT_HPP

#include <cmath>
#include <limits>

// axis order of every lookup table
enum {
    LEN = 0, // channel length
    VBS = 1, // body-source voltage
    VGS = 2, // gate-source voltage
    VDS = 3  // drain-source voltage
};

namespace c {
    static constexpr double pi      = M_PI;
    static constexpr double k_B     = 1.3806488e-23;   // Boltzmann constant
    static constexpr double e       = 1.602176565e-19; // elementary charge
    static constexpr double T0      = 273.15;          // 0 degC in K
    static constexpr double eps_0   = 8.854187817e-12; // vacuum permittivity
    static constexpr double eps_ox  = 3.9;             // relative permittivity of SiO2
    static constexpr double inf     = std::numeric_limits<double>::infinity();

    // thermal voltage at a given temperature in degC
    static inline double U_T(double temp) {
        return k_B * (temp + T0) / e;
    }

    // tolerance used when deciding if a range endpoint lies on the grid
    static constexpr double grid_tol = 1e-9;
}

#endif
