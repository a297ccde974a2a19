#ifndef MATROIDCORE_SETS_SET_SYSTEM_HPP
#define MATROIDCORE_SETS_SET_SYSTEM_HPP

#include "../common.hpp"
#include "ground_set.hpp"
#include "subset.hpp"
#include <optional>
#include <unordered_set>
#include <vector>

namespace matroidcore {

/**
 * Canonical set family over a fixed ground set.
 *
 * Holds pairwise distinct subsets of the ground set. Duplicates supplied at
 * construction are merged; the first occurrence fixes the iteration order,
 * which is stable for the lifetime of the instance.
 *
 * Two set systems are equal iff their ground sets are equal and they hold
 * the same subsets (order is irrelevant).
 */
class SetSystem {
public:
    using const_iterator = std::vector<Subset>::const_iterator;

    SetSystem();
    explicit SetSystem(GroundSetPtr groundset);

    // Throws InvalidInputError if a subset has an element outside the ground set
    SetSystem(const ElementSet& groundset, const std::vector<ElementSet>& subsets);
    SetSystem(GroundSetPtr groundset, const std::vector<ElementSet>& subsets);
    SetSystem(GroundSetPtr groundset, const std::vector<Subset>& subsets);

    const GroundSet& groundset() const { return *groundset_; }
    const GroundSetPtr& groundset_ptr() const { return groundset_; }

    size_t size() const { return subsets_.size(); }
    bool empty() const { return subsets_.empty(); }

    // Returns true if the subset was not present yet
    bool insert(const Subset& subset);

    bool contains(const Subset& subset) const { return lookup_.count(subset) != 0; }
    bool contains(const ElementSet& subset) const;

    const_iterator begin() const { return subsets_.begin(); }
    const_iterator end() const { return subsets_.end(); }
    const Subset& operator[](size_t i) const { return subsets_[i]; }

    // Labelled copies of the members, sorted canonically
    std::vector<ElementSet> to_element_sets() const;

    /**
     * Find a ground set bijection f with {f(S) : S in this} == other.
     *
     * Backtracking over ground set elements ordered by the number of
     * candidate images; candidates must share the element's signature (the
     * sorted sizes of the member subsets that contain it). Every subset whose
     * last element has just been assigned is checked against the other
     * family, so a complete assignment is an isomorphism.
     *
     * @return The first bijection found, or std::nullopt if none exists
     */
    std::optional<ElementMap> isomorphism_to(const SetSystem& other) const;

    bool operator==(const SetSystem& other) const;
    bool operator!=(const SetSystem& other) const { return !(*this == other); }

private:
    // Sorted sizes of the members containing each ground set element
    std::vector<std::vector<size_t>> element_signatures() const;

    GroundSetPtr groundset_;
    std::vector<Subset> subsets_;
    std::unordered_set<Subset, SubsetHash> lookup_;
};

} // namespace matroidcore

#endif // MATROIDCORE_SETS_SET_SYSTEM_HPP
