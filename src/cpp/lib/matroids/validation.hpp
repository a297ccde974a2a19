#ifndef MATROIDCORE_MATROIDS_VALIDATION_HPP
#define MATROIDCORE_MATROIDS_VALIDATION_HPP

#include "../common.hpp"
#include "../sets/ranked_family.hpp"
#include "../sets/subset.hpp"

namespace matroidcore {

/**
 * Matroid axiom checks on raw defining data.
 *
 * Each check is a pure predicate that stops at the first violation. With
 * num_threads > 1 (and OpenMP available) the outer loop over defining sets
 * is split across threads; the answer does not depend on the thread count.
 */

/**
 * Circuit axioms, for circuits keyed by size:
 * - no circuit is empty
 * - no circuit is a proper subset of another
 * - for distinct C1, C2 and e in both, (C1 | C2) - e contains a circuit
 */
bool circuit_axioms_hold(const RankedFamily& circuits, size_t num_threads = 1);

/**
 * Flat axioms, for flats keyed by rank over the given ground set:
 * - some flat has rank 0 and the ground set is a flat of the top rank
 * - F strictly inside G implies rank(F) < rank(G)
 * - for F of rank i and e outside F, exactly one flat of rank i + 1
 *   contains F + e
 * - the intersection of flats of ranks i <= j is a flat of rank <= i
 */
bool flat_axioms_hold(const RankedFamily& flats, const Subset& groundset, size_t num_threads = 1);

/**
 * Rank of x from flats keyed by rank: the rank of the first flat (by
 * increasing rank) containing x, or `ceiling` when no flat contains x.
 */
Rank flat_rank(const RankedFamily& flats, const Subset& x, Rank ceiling);

// First flat containing x, or the ground set when no flat contains x
Subset flat_closure(const RankedFamily& flats, const Subset& x, const Subset& groundset);

} // namespace matroidcore

#endif // MATROIDCORE_MATROIDS_VALIDATION_HPP
