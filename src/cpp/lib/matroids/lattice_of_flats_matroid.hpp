#ifndef MATROIDCORE_MATROIDS_LATTICE_OF_FLATS_MATROID_HPP
#define MATROIDCORE_MATROIDS_LATTICE_OF_FLATS_MATROID_HPP

#include "matroid.hpp"
#include "../lattice/inclusion_lattice.hpp"
#include "../sets/ground_set.hpp"
#include "../sets/ranked_family.hpp"
#include "../sets/set_system.hpp"
#include <memory>

namespace matroidcore {

/**
 * Matroid encoded by the lattice of its flats.
 *
 * The given sets are ordered by inclusion; the rank of each set in that
 * poset is its rank as a flat, and the matroid rank is the poset rank. Rank
 * and closure queries work as for FlatsMatroid on the derived partition.
 *
 * The Moebius row of the bottom element is computed on first use and
 * published atomically, so concurrent readers may race on the first
 * computation but all observe one cached value.
 */
class LatticeOfFlatsMatroid : public Matroid {
public:
    // Pull the lattice of flats of a reference matroid
    explicit LatticeOfFlatsMatroid(const Matroid& reference);

    LatticeOfFlatsMatroid(const ElementSet& groundset,
                          const std::vector<ElementSet>& lattice,
                          const std::string& name = "");

    LatticeOfFlatsMatroid(const LatticeOfFlatsMatroid& other);

    Encoding encoding() const override { return Encoding::LATTICE_OF_FLATS; }
    const ElementSet& groundset() const override { return groundset_->elements(); }
    const std::string& name() const override { return name_; }

    Rank full_rank() const override { return matroid_rank_; }
    Rank rank(const ElementSet& x) const override;
    ElementSet closure(const ElementSet& x) const override;
    bool is_closed(const ElementSet& x) const override;

    std::vector<ElementSet> flats(Rank k) const override;
    std::vector<size_t> whitney_numbers2() const override;

    /**
     * Whitney numbers of the first kind: w_k is the sum of mu(bottom, F)
     * over the flats F of rank k. Empty when the matroid has loops (the
     * bottom flat is not the empty set) or the lattice has no bottom.
     */
    std::vector<long long> whitney_numbers() const;

    const InclusionLattice& lattice() const { return *L_; }

    bool is_valid(size_t num_threads = 1) const override;

    std::unique_ptr<Matroid> relabel(const ElementMap& mapping) const override;
    MatroidState export_state() const override;
    const SetSystem& defining_sets() const override { return all_; }

private:
    std::shared_ptr<const std::vector<long long>> bottom_mobius_row(size_t bottom) const;

    GroundSetPtr groundset_;
    std::shared_ptr<const InclusionLattice> L_;
    RankedFamily F_;            // Lattice elements by poset rank
    SetSystem all_;
    Rank matroid_rank_ = 0;
    std::string name_;
    mutable std::shared_ptr<const std::vector<long long>> mobius_cache_;
};

} // namespace matroidcore

#endif // MATROIDCORE_MATROIDS_LATTICE_OF_FLATS_MATROID_HPP
