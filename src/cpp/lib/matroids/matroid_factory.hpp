#ifndef MATROIDCORE_MATROIDS_MATROID_FACTORY_HPP
#define MATROIDCORE_MATROIDS_MATROID_FACTORY_HPP

#include "../common.hpp"
#include "matroid.hpp"
#include <memory>

namespace matroidcore {

/**
 * Rebuild a matroid from exported construction data.
 *
 * make_matroid(M.export_state()) is equal to M.
 *
 * Throws InvalidInputError if a defining set leaves the ground set.
 */
std::unique_ptr<Matroid> make_matroid(const MatroidState& state);

/**
 * Build the requested encoding of a reference matroid (pulls its circuits,
 * flats of every rank, or lattice of flats).
 */
std::unique_ptr<Matroid> convert(const Matroid& reference, Encoding encoding);

} // namespace matroidcore

#endif // MATROIDCORE_MATROIDS_MATROID_FACTORY_HPP
