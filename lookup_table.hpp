#ifndef LOOKUP_TABLE_HPP
#define LOOKUP_TABLE_HPP

#include <armadillo>
#include <cmath>
#include <fstream>
#include <map>
#include <sstream>
#include <string>

#include "array4.hpp"
#include "error.hpp"
#include "expression.hpp"
#include "raw_data.hpp"
#include "transistor_sweep.hpp"
#include "util/system.hpp"

// characterization of one device model over a 4-d sweep; read-only once built
class lookup_table {
public:
    std::string name;
    polarity type;

    // axes in table order
    sweep_axis length;
    sweep_axis vbs;
    sweep_axis vgs;
    sweep_axis vds;

    // raw quantities, flat in array4 order
    raw_data raw;

    inline lookup_table();
    inline lookup_table(const std::string & name, const transistor_sweep & sweep, double width);

    inline shape4 shape() const;
    inline arma::uword size() const;
    inline double width() const;
    inline transistor_sweep sweep() const;

    // raw or derived quantity over the whole grid
    inline array4 operator[](quantity q) const;

    inline bool valid(arma::uword l, arma::uword b, arma::uword g, arma::uword d) const;
    inline small_signal point(arma::uword l, arma::uword b, arma::uword g, arma::uword d) const;

    // writes folder/<name>/
    inline void save(const std::string & folder) const;
    static inline lookup_table load(const std::string & folder, const std::string & name);

    inline std::string to_string() const;
};

// several models, keyed by model name
using library = std::map<std::string, lookup_table>;

static inline void save_library(const library & lib, const std::string & folder);
static inline library load_library(const std::string & folder);

//----------------------------------------------------------------------------------------------------------------------

lookup_table::lookup_table()
    : type(polarity::nmos) {
}

lookup_table::lookup_table(const std::string & n, const transistor_sweep & s, double w)
    : name(n), type(s.type), length(s.length), vbs(s.vbs), vgs(s.vgs), vds(s.vds), raw(s.size(), w) {
    if (!(w > 0)) {
        throw configuration_error("(" + n + ") reference width must be positive");
    }
}

shape4 lookup_table::shape() const {
    return shape4 { length.size(), vbs.size(), vgs.size(), vds.size() };
}

arma::uword lookup_table::size() const {
    return raw.size();
}

double lookup_table::width() const {
    return raw.width;
}

transistor_sweep lookup_table::sweep() const {
    return transistor_sweep(type, length, vgs, vds, vbs);
}

array4 lookup_table::operator[](quantity q) const {
    return array4(shape(), evaluate(q, raw));
}

bool lookup_table::valid(arma::uword l, arma::uword b, arma::uword g, arma::uword d) const {
    return raw.valid(array4::index(shape(), l, b, g, d)) != 0;
}

small_signal lookup_table::point(arma::uword l, arma::uword b, arma::uword g, arma::uword d) const {
    return raw.get(array4::index(shape(), l, b, g, d));
}

void lookup_table::save(const std::string & folder) const {
    std::string sub = folder + "/" + name;
    if (!make_folder(sub)) {
        throw table_io_error("(" + name + ") can not create " + sub);
    }

    arma::vec meta = { raw.width, type == polarity::nmos ? 0.0 : 1.0 };

    bool ok = true;
    ok &= meta.save(sub + "/meta.arma", arma::arma_binary);
    ok &= length.values.save(sub + "/length.arma", arma::arma_binary);
    ok &= vbs.values.save(sub + "/vbs.arma", arma::arma_binary);
    ok &= vgs.values.save(sub + "/vgs.arma", arma::arma_binary);
    ok &= vds.values.save(sub + "/vds.arma", arma::arma_binary);
    ok &= raw.id.save(sub + "/id.arma", arma::arma_binary);
    ok &= raw.gm.save(sub + "/gm.arma", arma::arma_binary);
    ok &= raw.gds.save(sub + "/gds.arma", arma::arma_binary);
    ok &= raw.vth.save(sub + "/vth.arma", arma::arma_binary);
    ok &= raw.vdsat.save(sub + "/vdsat.arma", arma::arma_binary);
    ok &= raw.cgg.save(sub + "/cgg.arma", arma::arma_binary);
    ok &= raw.cgs.save(sub + "/cgs.arma", arma::arma_binary);
    ok &= raw.cgd.save(sub + "/cgd.arma", arma::arma_binary);
    ok &= raw.valid.save(sub + "/valid.arma", arma::arma_binary);
    if (!ok) {
        throw table_io_error("(" + name + ") can not write table to " + sub);
    }

    std::ofstream params_file(sub + "/params.ini");
    params_file << to_string();
    if (!params_file) {
        throw table_io_error("(" + name + ") can not write " + sub + "/params.ini");
    }
}

lookup_table lookup_table::load(const std::string & folder, const std::string & n) {
    std::string sub = folder + "/" + n;

    auto load_vec = [&] (const std::string & file) {
        arma::vec v;
        if (!v.load(sub + "/" + file)) {
            throw table_io_error("(" + n + ") can not read " + sub + "/" + file);
        }
        return v;
    };

    lookup_table t;
    t.name = n;

    arma::vec meta = load_vec("meta.arma");
    if (meta.n_elem != 2) {
        throw table_io_error("(" + n + ") malformed meta.arma");
    }
    if (!std::isfinite(meta(0)) || !(meta(0) > 0)) {
        throw table_io_error("(" + n + ") width in meta.arma must be positive");
    }
    if ((meta(1) != 0) && (meta(1) != 1)) {
        throw table_io_error("(" + n + ") unknown polarity code in meta.arma");
    }
    t.type = (meta(1) == 0) ? polarity::nmos : polarity::pmos;

    // axes and their signs are validated again on construction
    try {
        t.length = sweep_axis(load_vec("length.arma"));
        t.vbs    = sweep_axis(load_vec("vbs.arma"));
        t.vgs    = sweep_axis(load_vec("vgs.arma"));
        t.vds    = sweep_axis(load_vec("vds.arma"));
        t.sweep();
    } catch (const configuration_error & e) {
        throw table_io_error("(" + n + ") malformed axis: " + e.what());
    }

    arma::uword N = t.length.size() * t.vbs.size() * t.vgs.size() * t.vds.size();
    t.raw = raw_data(N, meta(0));

    struct { const char * file; arma::vec * v; } arrays[] = {
        { "id.arma",    &t.raw.id    },
        { "gm.arma",    &t.raw.gm    },
        { "gds.arma",   &t.raw.gds   },
        { "vth.arma",   &t.raw.vth   },
        { "vdsat.arma", &t.raw.vdsat },
        { "cgg.arma",   &t.raw.cgg   },
        { "cgs.arma",   &t.raw.cgs   },
        { "cgd.arma",   &t.raw.cgd   }
    };
    for (const auto & a : arrays) {
        *a.v = load_vec(a.file);
        if (a.v->n_elem != N) {
            throw table_io_error("(" + n + ") " + a.file + " does not match the axes");
        }
    }

    if (!t.raw.valid.load(sub + "/valid.arma") || (t.raw.valid.n_elem != N)) {
        throw table_io_error("(" + n + ") can not read a matching " + sub + "/valid.arma");
    }

    return t;
}

std::string lookup_table::to_string() const {
    using namespace std;

    stringstream ss;

    ss << "name    = " << name    << endl;
    ss << "width   = " << raw.width << endl;
    ss << "invalid = " << raw.n_invalid() << " of " << raw.size() << endl;

    ss << endl << "; sweep" << endl;
    ss << sweep().to_string();

    return ss.str();
}

void save_library(const library & lib, const std::string & folder) {
    if (!make_folder(folder)) {
        throw table_io_error("can not create " + folder);
    }

    std::ofstream index(folder + "/models.txt");
    for (const auto & t : lib) {
        if (t.first != t.second.name) {
            throw configuration_error("library key " + t.first + " does not name table " + t.second.name);
        }
        t.second.save(folder);
        index << t.first << std::endl;
    }
    if (!index) {
        throw table_io_error("can not write " + folder + "/models.txt");
    }
}

library load_library(const std::string & folder) {
    std::ifstream index(folder + "/models.txt");
    if (!index) {
        throw table_io_error("can not read " + folder + "/models.txt");
    }

    library lib;
    std::string n;
    while (std::getline(index, n)) {
        if (!n.empty()) {
            lib[n] = lookup_table::load(folder, n);
        }
    }
    return lib;
}

#endif
