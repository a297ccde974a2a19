#ifndef MATROIDCORE_LATTICE_INCLUSION_LATTICE_HPP
#define MATROIDCORE_LATTICE_INCLUSION_LATTICE_HPP

#include "../common.hpp"
#include "../sets/ground_set.hpp"
#include "../sets/subset.hpp"
#include <optional>
#include <unordered_map>
#include <vector>

namespace matroidcore {

/**
 * Poset of distinct subsets ordered by inclusion.
 *
 * Elements are stored sorted by cardinality, so every strict inclusion goes
 * from a lower to a higher index. The rank of an element is the length of
 * the longest chain from a minimal element below it; it coincides with the
 * lattice rank whenever the poset is graded with a bottom.
 *
 * Nothing here assumes the family is a lattice: meet() and join() return
 * std::nullopt when the bound is missing or not unique, and the is_*
 * predicates answer the lattice-theoretic questions.
 */
class InclusionLattice {
public:
    InclusionLattice(GroundSetPtr groundset, const std::vector<Subset>& elements);

    const GroundSet& groundset() const { return *groundset_; }

    size_t size() const { return elements_.size(); }
    const Subset& element(size_t i) const { return elements_[i]; }
    const std::vector<Subset>& elements() const { return elements_; }
    std::optional<size_t> find(const Subset& subset) const;

    bool leq(size_t i, size_t j) const { return elements_[i].is_subset_of(elements_[j]); }

    // Elements covering i (immediate successors)
    const std::vector<size_t>& upper_covers(size_t i) const { return upper_covers_[i]; }

    Rank rank_of(size_t i) const { return ranks_[i]; }
    Rank rank() const { return max_rank_; }

    std::optional<size_t> bottom() const;
    std::optional<size_t> top() const;
    std::optional<size_t> meet(size_t i, size_t j) const;
    std::optional<size_t> join(size_t i, size_t j) const;
    std::vector<size_t> atoms() const;

    bool is_lattice() const;
    bool is_graded() const;
    bool is_atomistic() const;
    bool is_semimodular() const;
    bool is_geometric() const;

    // Moebius function mu(i, j); zero unless element i <= element j
    long long mobius(size_t i, size_t j) const;

    // mu(i, j) for every j, computed in a single pass
    std::vector<long long> mobius_row(size_t i) const;

private:
    GroundSetPtr groundset_;
    std::vector<Subset> elements_;
    std::unordered_map<Subset, size_t, SubsetHash> index_;
    std::vector<std::vector<size_t>> upper_covers_;
    std::vector<Rank> ranks_;
    Rank max_rank_ = 0;
};

} // namespace matroidcore

#endif // MATROIDCORE_LATTICE_INCLUSION_LATTICE_HPP
