#define ARMA_NO_DEBUG // no bound checks

#include <armadillo>
#include <fstream>
#include <iostream>
#include <omp.h>
#include <xmmintrin.h>

#include "constant.hpp"
#include "ekv_model.hpp"
#include "error.hpp"
#include "expression.hpp"
#include "lookup_table.hpp"
#include "mosfet.hpp"
#include "sizing.hpp"
#include "sweep_config.hpp"
#include "table_builder.hpp"
#include "util/system.hpp"

using namespace arma;
using namespace std;

// analytic models standing in for the circuit simulator
static const ekv_oracle nmos_oracle("sg13_lv_nmos", sg13_lv_nmos_ekv);
static const ekv_oracle pmos_oracle("sg13_lv_pmos", sg13_lv_pmos_ekv);

static int n_threads = 1;

static inline void setup() {
    //flush denormal floats to zero for massive speedup
    //(i.e. set bits 15 and 6 in SSE control register MXCSR)
    _MM_SET_DENORMALS_ZERO_MODE(_MM_DENORMALS_ZERO_ON);
    _MM_SET_FLUSH_ZERO_MODE(_MM_FLUSH_ZERO_ON);
}

static inline void write_ini(const string & file, const string & content) {
    ofstream s(file);
    s << content;
    if (!s) {
        throw table_io_error("can not write " + file);
    }
}

// creates the results folder of this run
static inline const string & open_save_folder(const string & prefix) {
    const string & folder = save_folder(true, prefix);
    if (!make_folder(folder)) {
        throw table_io_error("can not create " + folder);
    }
    cout << "saving results in " << folder << endl;
    return folder;
}

static inline void build(char ** argv) {
    // characterizes both devices and saves them as one library

    string folder(argv[3]);

    library lib;
    bool complete = characterize(nmos_oracle, "sg13_lv_nmos", sg13_lv_nmos_sweep, sg13_width, n_threads,
                                 lib["sg13_lv_nmos"]);
    complete &= characterize(pmos_oracle, "sg13_lv_pmos", sg13_lv_pmos_sweep, sg13_width, n_threads,
                             lib["sg13_lv_pmos"]);
    if (!complete) {
        cout << "characterization incomplete, nothing saved" << endl;
        return;
    }

    save_library(lib, folder);
    write_ini(folder + "/sg13_lv_nmos/oracle.ini", nmos_oracle.to_string());
    write_ini(folder + "/sg13_lv_pmos/oracle.ini", pmos_oracle.to_string());
    cout << "saved lookup tables in " << folder << endl;
}

static inline void point(char ** argv) {
    // evaluates the oracle for a single bias point

    polarity type = polarity_from_string(argv[3]);
    double l   = stod(argv[4]);
    double vgs = stod(argv[5]);
    double vds = stod(argv[6]);
    double vbs = stod(argv[7]);

    const oracle & o = (type == polarity::nmos) ? static_cast<const oracle &>(nmos_oracle) : pmos_oracle;

    small_signal s;
    if (!characterize_point(o, l, sg13_width, vgs, vds, vbs, s)) {
        cout << "(" << o.name << ") point did not converge" << endl;
        return;
    }

    cout << "id    = " << s.id    << endl;
    cout << "gm    = " << s.gm    << endl;
    cout << "gds   = " << s.gds   << endl;
    cout << "vth   = " << s.vth   << endl;
    cout << "vdsat = " << s.vdsat << endl;
    cout << "cgg   = " << s.cgg   << endl;
    cout << "cgs   = " << s.cgs   << endl;
    cout << "cgd   = " << s.cgd   << endl;
    cout << "gmid  = " << s.gm / s.id << endl;
    cout << "gain  = " << s.gm / s.gds << endl;
    cout << "ft    = " << s.gm / (2 * c::pi * s.cgg) << endl;
}

static inline void charts(char ** argv) {
    // design charts and their statistics at one bias point

    string folder(argv[3]);
    string model(argv[4]);
    double vds  = stod(argv[5]);
    double vbs  = stod(argv[6]);
    double vgs0 = stod(argv[7]);
    double vgs1 = stod(argv[8]);

    lookup_table t = lookup_table::load(folder, model);
    mosfet m(t, vbs, vds, vgs0, vgs1);

    save_charts(m, open_save_folder("gmid_charts_" + model));

    chart_statistics s = statistics(m);
    cout << m.to_string() << s.to_string();
    write_ini(save_folder() + "/parameters.ini", m.to_string() + "\n; statistics\n" + s.to_string());
}

static inline void run_design(const string & folder, const string & model, const design_specs & specs) {
    lookup_table t = lookup_table::load(folder, model);
    design_specs s = specs.for_polarity(t.type);

    open_save_folder("gmid_design_" + model);

    design_result d = design(t, s);

    mat transfer = scaled_transfer(t, d);
    vec vgs_used;
    mat output = scaled_output(t, d, vgs_used);

    bool ok = transfer.save(save_folder() + "/id_vgs.csv", csv_ascii);
    ok &= output.save(save_folder() + "/id_vds.csv", csv_ascii);
    ok &= vgs_used.save(save_folder() + "/id_vds_vgs.csv", csv_ascii);
    if (!ok) {
        throw table_io_error("can not write curves to " + save_folder());
    }

    write_ini(save_folder() + "/parameters.ini", s.to_string());
    write_ini(save_folder() + "/design.ini", d.to_string());
}

static inline void design(char ** argv) {
    // common-source amplifier preset at a chosen gm/ID

    design_specs s = cs_amp_specs;
    s.gmid = stod(argv[5]);

    run_design(argv[3], argv[4], s);
}

static inline void size_device(char ** argv) {
    // fully specified design request

    design_specs s;
    s.gmid     = stod(argv[5]);
    s.gain_min = stod(argv[6]);
    s.bw_min   = stod(argv[7]);
    s.c_load   = stod(argv[8]);
    s.vdd      = stod(argv[9]);
    s.vds      = stod(argv[10]);
    s.vbs      = stod(argv[11]);
    s.vgs0     = stod(argv[12]);
    s.vgs1     = stod(argv[13]);
    s.gmid_ref = cs_amp_specs.gmid_ref;

    // voltages are given in the sign convention of the device, do not mirror them again
    lookup_table t = lookup_table::load(argv[3], argv[4]);
    open_save_folder("gmid_design_" + t.name);

    design_result d = design(t, s);
    write_ini(save_folder() + "/parameters.ini", s.to_string());
    write_ini(save_folder() + "/design.ini", d.to_string());
}

int main(int argc, char ** argv) {
    setup();

    if (argc < 3) {
        cout << "usage: gmid <threads> <build|point|charts|design|size> ..." << endl;
        return 1;
    }

    string stype(argv[2]);
    try {
        // first argument is always the number of threads
        n_threads = thread_count(argv[1]);
        omp_set_num_threads(n_threads);

        // second argument chooses the task
        if (stype == "build" && argc == 4) {
            build(argv);
        } else if (stype == "point" && argc == 8) {
            point(argv);
        } else if (stype == "charts" && argc == 9) {
            charts(argv);
        } else if (stype == "design" && argc == 6) {
            design(argv);
        } else if (stype == "size" && argc == 14) {
            size_device(argv);
        } else {
            cout << "wrong number of arguments or unknown task" << endl;
            return 1;
        }
    } catch (const std::exception & e) {
        cerr << "error: " << e.what() << endl;
        return 1;
    }

    return 0;
}
