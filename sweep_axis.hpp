#ifndef SWEEP_AXIS_HPP
#define SWEEP_AXIS_HPP

#include <armadillo>
#include <cmath>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

#include "constant.hpp"
#include "error.hpp"

// ordered, strictly monotonic sample points of one independent variable
class sweep_axis {
public:
    arma::vec values;

    inline sweep_axis();

    // explicit list of points
    inline sweep_axis(const std::vector<double> & v);
    inline sweep_axis(std::initializer_list<double> v);
    inline sweep_axis(const arma::vec & v);

    // start + i * step; stop is included if it lies on the grid, unless include_stop is false
    inline sweep_axis(double start, double stop, double step, bool include_stop = true);

    inline arma::uword size() const;
    inline double operator[](arma::uword i) const;
    inline double front() const;
    inline double back() const;
    inline bool ascending() const;

    // index of the point closest to x (first one on a tie)
    inline arma::uword nearest(double x) const;

    inline std::string to_string() const;

private:
    inline void check() const;
};

//----------------------------------------------------------------------------------------------------------------------

sweep_axis::sweep_axis() {
}

sweep_axis::sweep_axis(const std::vector<double> & v)
    : values(v) {
    check();
}

sweep_axis::sweep_axis(std::initializer_list<double> v)
    : sweep_axis(std::vector<double>(v)) {
}

sweep_axis::sweep_axis(const arma::vec & v)
    : values(v) {
    check();
}

sweep_axis::sweep_axis(double start, double stop, double step, bool include_stop) {
    if (!std::isfinite(start) || !std::isfinite(stop) || !std::isfinite(step)) {
        throw configuration_error("sweep_axis: non-finite range");
    }
    if (step == 0) {
        throw configuration_error("sweep_axis: zero step");
    }
    if ((stop - start) * step < 0) {
        std::stringstream ss;
        ss << "sweep_axis: step " << step << " never reaches " << stop << " from " << start;
        throw configuration_error(ss.str());
    }

    // number of whole steps that fit into the range
    double span = (stop - start) / step;
    double n_steps = std::floor(span + c::grid_tol);
    bool on_grid = std::abs(span - n_steps) <= c::grid_tol;

    arma::uword n = arma::uword(n_steps) + 1;
    if (!include_stop && on_grid) {
        --n;
    }
    if (n == 0) {
        throw configuration_error("sweep_axis: empty half-open range");
    }

    values = arma::vec(n);
    for (arma::uword i = 0; i < n; ++i) {
        values(i) = start + i * step;
    }

    // snap the last point onto stop to get rid of rounding noise
    if (include_stop && on_grid) {
        values(n - 1) = stop;
    }

    check();
}

arma::uword sweep_axis::size() const {
    return values.n_elem;
}

double sweep_axis::operator[](arma::uword i) const {
    return values(i);
}

double sweep_axis::front() const {
    return values(0);
}

double sweep_axis::back() const {
    return values(values.n_elem - 1);
}

bool sweep_axis::ascending() const {
    return values.n_elem < 2 || values(1) > values(0);
}

arma::uword sweep_axis::nearest(double x) const {
    arma::uword best = 0;
    for (arma::uword i = 1; i < values.n_elem; ++i) {
        if (std::abs(values(i) - x) < std::abs(values(best) - x)) {
            best = i;
        }
    }
    return best;
}

std::string sweep_axis::to_string() const {
    std::stringstream ss;
    ss << values.n_elem << " points, " << front() << " .. " << back();
    return ss.str();
}

void sweep_axis::check() const {
    if (values.is_empty()) {
        throw configuration_error("sweep_axis: no points");
    }
    if (!values.is_finite()) {
        throw configuration_error("sweep_axis: non-finite point");
    }
    if (values.n_elem < 2) {
        return;
    }

    // strictly monotonic in one direction
    arma::vec d = arma::diff(values);
    bool up = arma::all(d > 0);
    bool down = arma::all(d < 0);
    if (!up && !down) {
        throw configuration_error("sweep_axis: points are not strictly monotonic");
    }
}

#endif
