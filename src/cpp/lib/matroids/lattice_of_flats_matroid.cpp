#include "lattice_of_flats_matroid.hpp"
#include "validation.hpp"
#include <algorithm>
#include <atomic>

namespace matroidcore {

namespace {
    std::shared_ptr<const InclusionLattice> build_lattice(const GroundSetPtr& groundset,
                                                          const std::vector<ElementSet>& sets) {
        std::vector<Subset> subsets;
        subsets.reserve(sets.size());
        for (const auto& s : sets) {
            subsets.push_back(groundset->to_subset(s));
        }
        return std::make_shared<const InclusionLattice>(groundset, subsets);
    }
}

// ================================================================================
// CONSTRUCTORS
// ================================================================================

LatticeOfFlatsMatroid::LatticeOfFlatsMatroid(const Matroid& reference)
    : LatticeOfFlatsMatroid(reference.groundset(), reference.lattice_of_flats(), reference.name()) {}

LatticeOfFlatsMatroid::LatticeOfFlatsMatroid(const ElementSet& groundset,
                                             const std::vector<ElementSet>& lattice,
                                             const std::string& name)
    : groundset_(std::make_shared<const GroundSet>(groundset)),
      all_(groundset_),
      name_(name) {
    L_ = build_lattice(groundset_, lattice);
    for (size_t i = 0; i < L_->size(); ++i) {
        F_.insert(L_->rank_of(i), L_->element(i));
        all_.insert(L_->element(i));
    }
    matroid_rank_ = L_->rank();
}

LatticeOfFlatsMatroid::LatticeOfFlatsMatroid(const LatticeOfFlatsMatroid& other)
    : groundset_(other.groundset_),
      L_(other.L_),
      F_(other.F_),
      all_(other.all_),
      matroid_rank_(other.matroid_rank_),
      name_(other.name_),
      mobius_cache_(std::atomic_load(&other.mobius_cache_)) {}

// ================================================================================
// RANK ORACLE
// ================================================================================

Rank LatticeOfFlatsMatroid::rank(const ElementSet& x) const {
    return flat_rank(F_, groundset_->to_subset(x), matroid_rank_);
}

ElementSet LatticeOfFlatsMatroid::closure(const ElementSet& x) const {
    return groundset_->to_elements(flat_closure(F_, groundset_->to_subset(x), groundset_->full_subset()));
}

bool LatticeOfFlatsMatroid::is_closed(const ElementSet& x) const {
    for (const auto& e : x) {
        if (!groundset_->contains(e)) {
            return false;
        }
    }
    return F_.contains(groundset_->to_subset(x));
}

// ================================================================================
// ENUMERATION
// ================================================================================

std::vector<ElementSet> LatticeOfFlatsMatroid::flats(Rank k) const {
    std::vector<ElementSet> result;
    for (const auto& f : F_.at(k)) {
        result.push_back(groundset_->to_elements(f));
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<size_t> LatticeOfFlatsMatroid::whitney_numbers2() const {
    std::vector<size_t> counts;
    for (const auto& [rank, level] : F_.partitions()) {
        if (rank != counts.size()) {
            break;
        }
        counts.push_back(level.size());
    }
    return counts;
}

std::shared_ptr<const std::vector<long long>> LatticeOfFlatsMatroid::bottom_mobius_row(size_t bottom) const {
    auto cached = std::atomic_load(&mobius_cache_);
    if (cached) {
        return cached;
    }
    // Compute outside any lock; the first published row wins
    auto computed = std::make_shared<const std::vector<long long>>(L_->mobius_row(bottom));
    std::shared_ptr<const std::vector<long long>> expected;
    if (std::atomic_compare_exchange_strong(&mobius_cache_, &expected, computed)) {
        return computed;
    }
    return expected;
}

std::vector<long long> LatticeOfFlatsMatroid::whitney_numbers() const {
    auto bottom = L_->bottom();
    if (!bottom || !L_->element(*bottom).empty()) {
        return {};
    }
    auto mu = bottom_mobius_row(*bottom);
    std::vector<long long> w(matroid_rank_ + 1, 0);
    for (size_t i = 0; i < L_->size(); ++i) {
        w[L_->rank_of(i)] += (*mu)[i];
    }
    return w;
}

// ================================================================================
// VALIDATION, RELABELING & EXPORT
// ================================================================================

bool LatticeOfFlatsMatroid::is_valid(size_t num_threads) const {
    auto top = L_->top();
    if (!top || L_->element(*top) != groundset_->full_subset()) {
        return false;
    }
    if (!L_->is_geometric()) {
        return false;
    }
    return flat_axioms_hold(F_, groundset_->full_subset(), num_threads);
}

std::unique_ptr<Matroid> LatticeOfFlatsMatroid::relabel(const ElementMap& mapping) const {
    std::vector<ElementSet> mapped;
    for (const auto& f : all_) {
        mapped.push_back(map_elements(groundset_->to_elements(f), mapping));
    }
    return std::make_unique<LatticeOfFlatsMatroid>(map_elements(groundset(), mapping), mapped, name_);
}

MatroidState LatticeOfFlatsMatroid::export_state() const {
    MatroidState state;
    state.encoding = Encoding::LATTICE_OF_FLATS;
    state.groundset = groundset();
    state.sets = all_.to_element_sets();
    state.name = name_;
    return state;
}

} // namespace matroidcore
