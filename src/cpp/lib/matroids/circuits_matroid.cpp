#include "circuits_matroid.hpp"
#include "validation.hpp"
#include <algorithm>

namespace matroidcore {

// ================================================================================
// CONSTRUCTORS
// ================================================================================

CircuitsMatroid::CircuitsMatroid(const Matroid& reference)
    : CircuitsMatroid(reference.groundset(), reference.circuits(), reference.name()) {}

CircuitsMatroid::CircuitsMatroid(const ElementSet& groundset,
                                 const std::vector<ElementSet>& circuits,
                                 const std::string& name)
    : groundset_(std::make_shared<const GroundSet>(groundset)),
      C_(groundset_, circuits),
      name_(name) {
    for (const auto& c : C_) {
        k_C_.insert(static_cast<Rank>(c.count()), c);
    }
    matroid_rank_ = static_cast<Rank>(max_independent_subset(groundset_->full_subset()).count());
}

// ================================================================================
// RANK ORACLE
// ================================================================================

bool CircuitsMatroid::independent(const Subset& x) const {
    return k_C_.first_subset(x, static_cast<Rank>(x.count())) == nullptr;
}

Subset CircuitsMatroid::max_independent_subset(const Subset& x) const {
    // One pass in increasing size: removing an element of a contained circuit
    // keeps the rank, and the working set only shrinks
    Subset y = x;
    for (const auto& [size, group] : k_C_.partitions()) {
        if (size == 0) {
            continue;  // An empty circuit cannot be broken by removal
        }
        if (size > y.count()) {
            break;
        }
        for (const auto& c : group) {
            if (c.is_subset_of(y)) {
                y.reset(c.indices().front());
            }
        }
    }
    return y;
}

Rank CircuitsMatroid::rank(const ElementSet& x) const {
    return static_cast<Rank>(max_independent_subset(groundset_->to_subset(x)).count());
}

bool CircuitsMatroid::is_independent(const ElementSet& x) const {
    return independent(groundset_->to_subset(x));
}

ElementSet CircuitsMatroid::max_independent(const ElementSet& x) const {
    return groundset_->to_elements(max_independent_subset(groundset_->to_subset(x)));
}

ElementSet CircuitsMatroid::circuit(const ElementSet& x) const {
    const Subset s = groundset_->to_subset(x);
    const Subset* found = k_C_.first_subset(s, static_cast<Rank>(s.count()));
    if (found == nullptr) {
        throw NoCircuitFoundError("No circuit found: the set " + format_set(x) + " is independent");
    }
    return groundset_->to_elements(*found);
}

ElementSet CircuitsMatroid::closure(const ElementSet& x) const {
    // e is spanned by x iff some circuit through e has all its other elements in x
    const Subset s = groundset_->to_subset(x);
    Subset result = s;
    for (const auto& c : C_) {
        const Subset outside = c - s;
        if (outside.count() == 1) {
            result = result | outside;
        }
    }
    return groundset_->to_elements(result);
}

// ================================================================================
// ENUMERATION
// ================================================================================

std::vector<ElementSet> CircuitsMatroid::circuits() const {
    return C_.to_element_sets();
}

std::vector<ElementSet> CircuitsMatroid::circuits(size_t k) const {
    std::vector<ElementSet> result;
    for (const auto& c : k_C_.at(static_cast<Rank>(k))) {
        result.push_back(groundset_->to_elements(c));
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<ElementSet> CircuitsMatroid::nonspanning_circuits() const {
    std::vector<ElementSet> result;
    for (const auto& [size, group] : k_C_.partitions()) {
        if (size > matroid_rank_) {
            break;
        }
        for (const auto& c : group) {
            result.push_back(groundset_->to_elements(c));
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<ElementSet> CircuitsMatroid::no_broken_circuits_sets() const {
    std::vector<Subset> broken;
    for (const auto& c : C_) {
        const auto members = c.indices();
        broken.push_back(members.empty() ? c : c.without(members.front()));
    }
    std::vector<ElementSet> result;
    for (size_t k = 0; k <= matroid_rank_; ++k) {
        for_each_subset(k, [&](const ElementSet& s) {
            const Subset candidate = groundset_->to_subset(s);
            for (const auto& b : broken) {
                if (b.is_subset_of(candidate)) {
                    return true;
                }
            }
            result.push_back(s);
            return true;
        });
    }
    return result;
}

// ================================================================================
// VALIDATION, RELABELING & EXPORT
// ================================================================================

bool CircuitsMatroid::is_valid(size_t num_threads) const {
    return circuit_axioms_hold(k_C_, num_threads);
}

std::unique_ptr<Matroid> CircuitsMatroid::relabel(const ElementMap& mapping) const {
    std::vector<ElementSet> mapped;
    for (const auto& c : C_) {
        mapped.push_back(map_elements(groundset_->to_elements(c), mapping));
    }
    return std::make_unique<CircuitsMatroid>(map_elements(groundset(), mapping), mapped, name_);
}

MatroidState CircuitsMatroid::export_state() const {
    MatroidState state;
    state.encoding = Encoding::CIRCUITS;
    state.groundset = groundset();
    state.sets = C_.to_element_sets();
    state.name = name_;
    return state;
}

} // namespace matroidcore
