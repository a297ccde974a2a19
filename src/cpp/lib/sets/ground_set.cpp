#include "ground_set.hpp"

namespace matroidcore {

GroundSet::GroundSet(const ElementSet& elements)
    : elements_(elements), ordered_(elements.begin(), elements.end()) {
    for (size_t i = 0; i < ordered_.size(); ++i) {
        index_.emplace(ordered_[i], i);
    }
}

size_t GroundSet::index_of(const Element& e) const {
    auto it = index_.find(e);
    if (it == index_.end()) {
        throw InvalidInputError("Element '" + e + "' is not in the ground set");
    }
    return it->second;
}

Subset GroundSet::to_subset(const ElementSet& set) const {
    Subset result(size());
    for (const auto& e : set) {
        result.set(index_of(e));
    }
    return result;
}

ElementSet GroundSet::to_elements(const Subset& set) const {
    ElementSet result;
    for (size_t i : set.indices()) {
        result.insert(ordered_.at(i));
    }
    return result;
}

} // namespace matroidcore
