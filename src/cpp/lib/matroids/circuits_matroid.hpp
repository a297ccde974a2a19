#ifndef MATROIDCORE_MATROIDS_CIRCUITS_MATROID_HPP
#define MATROIDCORE_MATROIDS_CIRCUITS_MATROID_HPP

#include "matroid.hpp"
#include "../sets/ground_set.hpp"
#include "../sets/ranked_family.hpp"
#include "../sets/set_system.hpp"

namespace matroidcore {

/**
 * Matroid encoded by its circuits.
 *
 * Circuits are normalised into a set system (duplicates merged) and indexed
 * by size. Independence and rank are answered by scanning circuits in
 * increasing size; the matroid rank is computed once at construction.
 * Construction does not check the circuit axioms, see is_valid().
 */
class CircuitsMatroid : public Matroid {
public:
    // Pull the circuits of a reference matroid
    explicit CircuitsMatroid(const Matroid& reference);

    // Throws InvalidInputError if a circuit has an element outside the ground set
    CircuitsMatroid(const ElementSet& groundset,
                    const std::vector<ElementSet>& circuits,
                    const std::string& name = "");

    Encoding encoding() const override { return Encoding::CIRCUITS; }
    const ElementSet& groundset() const override { return groundset_->elements(); }
    const std::string& name() const override { return name_; }

    Rank full_rank() const override { return matroid_rank_; }
    Rank rank(const ElementSet& x) const override;
    bool is_independent(const ElementSet& x) const override;
    ElementSet max_independent(const ElementSet& x) const override;
    ElementSet circuit(const ElementSet& x) const override;
    ElementSet closure(const ElementSet& x) const override;

    std::vector<ElementSet> circuits() const override;
    std::vector<ElementSet> circuits(size_t k) const;
    std::vector<ElementSet> nonspanning_circuits() const override;

    /**
     * Sets containing no broken circuit, where the broken circuit of C is C
     * minus its smallest element in ground set order. The number of such
     * sets of size k is the absolute value of the k-th Whitney number of the
     * first kind.
     */
    std::vector<ElementSet> no_broken_circuits_sets() const;

    bool is_valid(size_t num_threads = 1) const override;

    std::unique_ptr<Matroid> relabel(const ElementMap& mapping) const override;
    MatroidState export_state() const override;
    const SetSystem& defining_sets() const override { return C_; }

private:
    bool independent(const Subset& x) const;
    Subset max_independent_subset(const Subset& x) const;

    GroundSetPtr groundset_;
    SetSystem C_;               // All circuits
    RankedFamily k_C_;          // Circuits by size
    Rank matroid_rank_ = 0;
    std::string name_;
};

} // namespace matroidcore

#endif // MATROIDCORE_MATROIDS_CIRCUITS_MATROID_HPP
