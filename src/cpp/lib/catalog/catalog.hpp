#ifndef MATROIDCORE_CATALOG_CATALOG_HPP
#define MATROIDCORE_CATALOG_CATALOG_HPP

#include "../common.hpp"
#include "../matroids/circuits_matroid.hpp"
#include <memory>
#include <string>
#include <vector>

namespace matroidcore {
namespace catalog {

/**
 * Named matroids, built from their circuits.
 */

// Uniform matroid U(r, n) on ground set {0, ..., n-1}; InvalidInputError if r > n
CircuitsMatroid uniform(Rank r, size_t n);

// Fano plane F7 on {a, ..., g}; lines abf, ace, adg, bcd, beg, cfg, def
CircuitsMatroid fano();

// Non-Fano matroid: F7 with the line def relaxed
CircuitsMatroid non_fano();

// Graphic matroid M(K4) on {a, ..., f}
CircuitsMatroid k4();

// Rank-n matroid Theta_n on {x1, ..., xn, y1, ..., yn}, n >= 2
CircuitsMatroid theta(size_t n);

// Names accepted by named_matroid()
std::vector<std::string> names();

/**
 * Look up a matroid by name: "fano", "nonfano", "k4", "theta<n>" or
 * "uniform<r>,<n>" (e.g. "theta3", "uniform2,4").
 *
 * Throws InvalidInputError for unknown names or bad parameters.
 */
std::unique_ptr<Matroid> named_matroid(const std::string& name);

} // namespace catalog
} // namespace matroidcore

#endif // MATROIDCORE_CATALOG_CATALOG_HPP
