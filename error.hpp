#ifndef ERROR_HPP
#define ERROR_HPP

#include <stdexcept>
#include <string>

// malformed sweep axis, sweep or design request
class configuration_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// a single grid point did not converge (recorded as invalid, never fatal to a build)
class oracle_convergence_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// a reduction found no admissible sample at all
class empty_table_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// the selected operating point cannot be dimensioned
class invalid_operating_point_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// a persisted table could not be read or written
class table_io_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

#endif
