#include "set_system.hpp"
#include <algorithm>
#include <limits>
#include <numeric>

namespace matroidcore {

namespace {
    constexpr size_t UNASSIGNED = std::numeric_limits<size_t>::max();
}

SetSystem::SetSystem() : groundset_(std::make_shared<const GroundSet>(ElementSet{})) {}

SetSystem::SetSystem(GroundSetPtr groundset) : groundset_(std::move(groundset)) {}

SetSystem::SetSystem(const ElementSet& groundset, const std::vector<ElementSet>& subsets)
    : SetSystem(std::make_shared<const GroundSet>(groundset), subsets) {}

SetSystem::SetSystem(GroundSetPtr groundset, const std::vector<ElementSet>& subsets)
    : groundset_(std::move(groundset)) {
    for (const auto& s : subsets) {
        insert(groundset_->to_subset(s));
    }
}

SetSystem::SetSystem(GroundSetPtr groundset, const std::vector<Subset>& subsets)
    : groundset_(std::move(groundset)) {
    for (const auto& s : subsets) {
        insert(s);
    }
}

bool SetSystem::insert(const Subset& subset) {
    if (subset.universe() != groundset_->size()) {
        throw InvalidInputError("Subset over " + std::to_string(subset.universe()) +
                                " elements does not match ground set of size " +
                                std::to_string(groundset_->size()));
    }
    if (!lookup_.insert(subset).second) {
        return false;
    }
    subsets_.push_back(subset);
    return true;
}

bool SetSystem::contains(const ElementSet& subset) const {
    for (const auto& e : subset) {
        if (!groundset_->contains(e)) {
            return false;
        }
    }
    return contains(groundset_->to_subset(subset));
}

std::vector<ElementSet> SetSystem::to_element_sets() const {
    std::vector<ElementSet> result;
    result.reserve(subsets_.size());
    for (const auto& s : subsets_) {
        result.push_back(groundset_->to_elements(s));
    }
    std::sort(result.begin(), result.end(), [](const ElementSet& a, const ElementSet& b) {
        if (a.size() != b.size()) {
            return a.size() < b.size();
        }
        return a < b;
    });
    return result;
}

bool SetSystem::operator==(const SetSystem& other) const {
    if (*groundset_ != *other.groundset_ || subsets_.size() != other.subsets_.size()) {
        return false;
    }
    for (const auto& s : subsets_) {
        if (!other.contains(s)) {
            return false;
        }
    }
    return true;
}

std::vector<std::vector<size_t>> SetSystem::element_signatures() const {
    std::vector<std::vector<size_t>> signatures(groundset_->size());
    for (const auto& s : subsets_) {
        size_t size = s.count();
        for (size_t i : s.indices()) {
            signatures[i].push_back(size);
        }
    }
    for (auto& sig : signatures) {
        std::sort(sig.begin(), sig.end());
    }
    return signatures;
}

std::optional<ElementMap> SetSystem::isomorphism_to(const SetSystem& other) const {
    const size_t n = groundset_->size();
    if (n != other.groundset_->size() || subsets_.size() != other.subsets_.size()) {
        return std::nullopt;
    }

    // The empty member touches no element, so it is matched up front
    if (contains(groundset_->empty_subset()) != other.contains(other.groundset_->empty_subset())) {
        return std::nullopt;
    }

    auto own_sigs = element_signatures();
    auto other_sigs = other.element_signatures();
    {
        auto a = own_sigs;
        auto b = other_sigs;
        std::sort(a.begin(), a.end());
        std::sort(b.begin(), b.end());
        if (a != b) {
            return std::nullopt;
        }
    }

    // Candidate images per element
    std::vector<std::vector<size_t>> candidates(n);
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (own_sigs[i] == other_sigs[j]) {
                candidates[i].push_back(j);
            }
        }
    }

    // Most constrained elements first, ties broken by degree (descending)
    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        if (candidates[a].size() != candidates[b].size()) {
            return candidates[a].size() < candidates[b].size();
        }
        return own_sigs[a].size() > own_sigs[b].size();
    });
    std::vector<size_t> position(n);
    for (size_t k = 0; k < n; ++k) {
        position[order[k]] = k;
    }

    // Members become checkable once their last element (by search order) is assigned
    std::vector<std::vector<size_t>> completed_at(n);
    for (size_t s = 0; s < subsets_.size(); ++s) {
        auto members = subsets_[s].indices();
        if (members.empty()) {
            continue;
        }
        size_t last = 0;
        for (size_t i : members) {
            last = std::max(last, position[i]);
        }
        completed_at[last].push_back(s);
    }

    std::vector<size_t> assignment(n, UNASSIGNED);
    std::vector<bool> used(n, false);
    std::vector<size_t> next_candidate(n + 1, 0);

    auto consistent = [&](size_t level) {
        for (size_t s : completed_at[level]) {
            Subset image(n);
            for (size_t i : subsets_[s].indices()) {
                image.set(assignment[i]);
            }
            if (!other.contains(image)) {
                return false;
            }
        }
        return true;
    };

    // Explicit stack: level k holds the element order[k], next_candidate[k]
    // is the resume point of its candidate list
    size_t level = 0;
    while (level < n) {
        size_t elem = order[level];
        if (assignment[elem] != UNASSIGNED) {
            used[assignment[elem]] = false;
            assignment[elem] = UNASSIGNED;
        }

        bool advanced = false;
        while (next_candidate[level] < candidates[elem].size()) {
            size_t target = candidates[elem][next_candidate[level]++];
            if (used[target]) {
                continue;
            }
            assignment[elem] = target;
            used[target] = true;
            if (consistent(level)) {
                advanced = true;
                break;
            }
            used[target] = false;
            assignment[elem] = UNASSIGNED;
        }

        if (advanced) {
            ++level;
            next_candidate[level] = 0;
        } else {
            next_candidate[level] = 0;
            if (level == 0) {
                return std::nullopt;
            }
            --level;
        }
    }

    ElementMap certificate;
    for (size_t i = 0; i < n; ++i) {
        certificate.emplace(groundset_->at(i), other.groundset_->at(assignment[i]));
    }
    return certificate;
}

} // namespace matroidcore
