#ifndef TABLE_BUILDER_HPP
#define TABLE_BUILDER_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <iostream>
#include <omp.h>
#include <stdexcept>
#include <string>

#include "array4.hpp"
#include "error.hpp"
#include "lookup_table.hpp"
#include "oracle.hpp"
#include "transistor_sweep.hpp"

// characterizes a model over the whole sweep at a fixed reference width, using n_threads workers.
//
// Every grid point is evaluated once and written to its own slot, so the result does not depend on the order in
// which the workers finish. Points that do not converge are kept as invalid points. Setting *abort stops the
// build between points; the function then returns false and the skipped points stay invalid.
template<bool verbose = true>
static inline bool characterize(const oracle & o, const std::string & name, const transistor_sweep & s, double width,
                                int n_threads, lookup_table & t, const std::atomic<bool> * abort = nullptr);

// simulates one grid point, false if it did not converge or produced non-finite values
static inline bool characterize_point(const oracle & o, double l, double w, double vgs, double vds, double vbs,
                                      small_signal & out);

// worker count from a command line argument, at least one
static inline int thread_count(const std::string & arg);

//----------------------------------------------------------------------------------------------------------------------

bool characterize_point(const oracle & o, double l, double w, double vgs, double vds, double vbs, small_signal & out) {
    bool converged;
    try {
        converged = o.evaluate(l, w, vgs, vds, vbs, out);
    } catch (const oracle_convergence_error &) {
        converged = false;
    }
    if (!converged) {
        return false;
    }

    // a converged point with nan inside is no better than a diverged one
    for (double x : { out.id, out.gm, out.gds, out.vth, out.vdsat, out.cgg, out.cgs, out.cgd }) {
        if (!std::isfinite(x)) {
            return false;
        }
    }
    return true;
}

template<bool verbose>
bool characterize(const oracle & o, const std::string & name, const transistor_sweep & s, double width,
                  int n_threads, lookup_table & t, const std::atomic<bool> * abort) {
    using namespace std;

    if (n_threads < 1) {
        throw configuration_error("(" + name + ") need at least one thread");
    }

    t = lookup_table(name, s, width);
    const shape4 shape = t.shape();
    const arma::uword N = t.size();

    if (verbose) {
        cout << "(" << name << ") characterization: " << N << " points on " << n_threads << " threads" << endl;
    }
    auto t0 = chrono::steady_clock::now();

    // progress is reported in steps of 5%
    const arma::uword report = max<arma::uword>(N / 20, 1);

    arma::uword done = 0;
    arma::uword skipped = 0;

    // first unexpected failure of the oracle, rethrown on this thread after the loop
    exception_ptr error;
    atomic<bool> failed(false);

    #pragma omp parallel for schedule(dynamic, 16) num_threads(n_threads)
    for (arma::uword k = 0; k < N; ++k) {
        if ((abort && abort->load()) || failed.load()) {
            #pragma omp atomic
            ++skipped;
            continue;
        }

        shape4 i = array4::subscript(shape, k);

        small_signal out;
        bool converged = false;
        try {
            converged = characterize_point(o, t.length[i[LEN]], width, t.vgs[i[VGS]], t.vds[i[VDS]], t.vbs[i[VBS]], out);
        } catch (...) {
            #pragma omp critical(characterize_error)
            {
                if (!error) {
                    error = current_exception();
                }
            }
            failed = true;
            continue;
        }

        // slots are disjoint, no synchronization needed
        if (converged) {
            t.raw.set(k, out);
        } else {
            t.raw.invalidate(k);
        }

        arma::uword n;
        #pragma omp atomic capture
        n = ++done;

        if (verbose && (n % report == 0)) {
            #pragma omp critical(characterize_log)
            cout << "(" << name << ") thread " << omp_get_thread_num() << ": point " << n << "/" << N << " done" << endl;
        }
    }

    if (error) {
        rethrow_exception(error);
    }

    if (verbose) {
        double dt = chrono::duration<double>(chrono::steady_clock::now() - t0).count();
        cout << "(" << name << ") characterization: " << done << " points in " << dt << "s, "
             << t.raw.n_invalid() << " invalid" << (skipped ? ", ABORTED!!!" : "") << endl;
    }

    return skipped == 0;
}

int thread_count(const std::string & arg) {
    std::size_t pos = 0;
    int n;
    try {
        n = std::stoi(arg, &pos);
    } catch (const std::invalid_argument &) {
        throw configuration_error("thread count '" + arg + "' is not a number");
    } catch (const std::out_of_range &) {
        throw configuration_error("thread count '" + arg + "' is out of range");
    }
    if (pos != arg.size()) {
        throw configuration_error("thread count '" + arg + "' is not a number");
    }
    if (n < 1) {
        throw configuration_error("need at least one thread");
    }
    return n;
}

#endif
