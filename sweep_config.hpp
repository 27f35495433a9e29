#ifndef SWEEP_CONFIG_HPP
#define SWEEP_CONFIG_HPP

#include "sweep_axis.hpp"
#include "transistor_sweep.hpp"

// IHP SG13G2 low-voltage devices: L 0.13um..10um, W 0.15um..10um, |VDS| <= 1.5V

// width of every characterized device
static constexpr double sg13_width = 10e-6;

// 76 lengths from 130nm to 9.88um in 130nm steps
static const sweep_axis sg13_lengths(130e-9, 76 * 130e-9, 130e-9);

static const transistor_sweep sg13_lv_nmos_sweep(
    polarity::nmos,
    sg13_lengths,
    sweep_axis(0,  1.5,  0.01), // vgs: 151 points
    sweep_axis(0,  1.5,  0.05), // vds: 31 points
    sweep_axis(0, -1.2, -0.1)   // vbs: 13 points
);

static const transistor_sweep sg13_lv_pmos_sweep(
    polarity::pmos,
    sg13_lengths,
    sweep_axis(0, -1.5, -0.01),
    sweep_axis(0, -1.5, -0.05),
    sweep_axis(0,  1.2,  0.1)
);

#endif
