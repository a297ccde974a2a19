#include "flats_matroid.hpp"
#include "validation.hpp"
#include "../lattice/inclusion_lattice.hpp"
#include <algorithm>

namespace matroidcore {

namespace {
    std::map<Rank, std::vector<ElementSet>> pull_flats(const Matroid& reference) {
        std::map<Rank, std::vector<ElementSet>> flats;
        for (Rank k = 0; k <= reference.size(); ++k) {
            auto level = reference.flats(k);
            if (!level.empty()) {
                flats[k] = std::move(level);
            }
        }
        return flats;
    }
}

// ================================================================================
// CONSTRUCTORS
// ================================================================================

FlatsMatroid::FlatsMatroid(const Matroid& reference)
    : FlatsMatroid(reference.groundset(), pull_flats(reference), reference.name()) {}

FlatsMatroid::FlatsMatroid(const ElementSet& groundset,
                           const std::map<Rank, std::vector<ElementSet>>& flats,
                           const std::string& name)
    : groundset_(std::make_shared<const GroundSet>(groundset)),
      all_(groundset_),
      name_(name) {
    for (const auto& [key, group] : flats) {
        for (const auto& f : group) {
            F_.insert(key, groundset_->to_subset(f));
        }
    }
    index_flats();
}

FlatsMatroid::FlatsMatroid(const ElementSet& groundset,
                           const std::vector<ElementSet>& flats,
                           const std::string& name)
    : groundset_(std::make_shared<const GroundSet>(groundset)),
      all_(groundset_),
      name_(name) {
    std::vector<Subset> subsets;
    for (const auto& f : flats) {
        subsets.push_back(groundset_->to_subset(f));
    }
    InclusionLattice poset(groundset_, subsets);
    for (size_t i = 0; i < poset.size(); ++i) {
        F_.insert(poset.rank_of(i), poset.element(i));
    }
    index_flats();
}

void FlatsMatroid::index_flats() {
    for (const auto& f : F_.members()) {
        all_.insert(f);
    }
    matroid_rank_ = F_.max_key().value_or(0);
}

// ================================================================================
// RANK ORACLE
// ================================================================================

Rank FlatsMatroid::rank(const ElementSet& x) const {
    return flat_rank(F_, groundset_->to_subset(x), matroid_rank_);
}

ElementSet FlatsMatroid::closure(const ElementSet& x) const {
    return groundset_->to_elements(flat_closure(F_, groundset_->to_subset(x), groundset_->full_subset()));
}

bool FlatsMatroid::is_closed(const ElementSet& x) const {
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

std::vector<ElementSet> FlatsMatroid::flats(Rank k) const {
    std::vector<ElementSet> result;
    for (const auto& f : F_.at(k)) {
        result.push_back(groundset_->to_elements(f));
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<size_t> FlatsMatroid::whitney_numbers2() const {
    // Ranks 0, 1, ... up to the first rank without flats
    std::vector<size_t> counts;
    for (const auto& [rank, level] : F_.partitions()) {
        if (rank != counts.size()) {
            break;
        }
        counts.push_back(level.size());
    }
    return counts;
}

// ================================================================================
// VALIDATION, RELABELING & EXPORT
// ================================================================================

bool FlatsMatroid::is_valid(size_t num_threads) const {
    return flat_axioms_hold(F_, groundset_->full_subset(), num_threads);
}

std::unique_ptr<Matroid> FlatsMatroid::relabel(const ElementMap& mapping) const {
    std::map<Rank, std::vector<ElementSet>> mapped;
    for (const auto& [key, group] : F_.partitions()) {
        for (const auto& f : group) {
            mapped[key].push_back(map_elements(groundset_->to_elements(f), mapping));
        }
    }
    return std::make_unique<FlatsMatroid>(map_elements(groundset(), mapping), mapped, name_);
}

MatroidState FlatsMatroid::export_state() const {
    MatroidState state;
    state.encoding = Encoding::FLATS;
    state.groundset = groundset();
    for (const auto& [key, group] : F_.partitions()) {
        state.ranked_sets[key] = flats(key);
    }
    state.name = name_;
    return state;
}

} // namespace matroidcore
