#ifndef MATROIDCORE_SETS_GROUND_SET_HPP
#define MATROIDCORE_SETS_GROUND_SET_HPP

#include "../common.hpp"
#include "subset.hpp"
#include <memory>
#include <unordered_map>
#include <vector>

namespace matroidcore {

/**
 * Immutable, ordered ground set.
 *
 * Translates between labelled sets (ElementSet) and index bit vectors
 * (Subset). Element i is the i-th label in sorted order. Instances are
 * shared between the families of one matroid through
 * std::shared_ptr<const GroundSet>.
 */
class GroundSet {
public:
    explicit GroundSet(const ElementSet& elements);

    size_t size() const { return ordered_.size(); }
    const ElementSet& elements() const { return elements_; }
    const std::vector<Element>& ordered() const { return ordered_; }
    const Element& at(size_t i) const { return ordered_.at(i); }

    bool contains(const Element& e) const { return index_.count(e) != 0; }

    // Throws InvalidInputError if e is not in the ground set
    size_t index_of(const Element& e) const;

    // Throws InvalidInputError if any member is not in the ground set
    Subset to_subset(const ElementSet& set) const;
    ElementSet to_elements(const Subset& set) const;

    Subset empty_subset() const { return Subset(size()); }
    Subset full_subset() const { return Subset::full(size()); }

    bool operator==(const GroundSet& other) const { return elements_ == other.elements_; }
    bool operator!=(const GroundSet& other) const { return !(*this == other); }

private:
    ElementSet elements_;
    std::vector<Element> ordered_;
    std::unordered_map<Element, size_t> index_;
};

using GroundSetPtr = std::shared_ptr<const GroundSet>;

} // namespace matroidcore

#endif // MATROIDCORE_SETS_GROUND_SET_HPP
