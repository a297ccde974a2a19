#ifndef MATROIDCORE_SETS_RANKED_FAMILY_HPP
#define MATROIDCORE_SETS_RANKED_FAMILY_HPP

#include "../common.hpp"
#include "subset.hpp"
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace matroidcore {

/**
 * Family of distinct subsets partitioned by an integer key.
 *
 * Circuits are keyed by size, flats by rank. Partitions are visited in
 * increasing key order by every oracle and validator. A subset inserted a
 * second time is ignored, even under a different key.
 */
class RankedFamily {
public:
    using Partition = std::map<Rank, std::vector<Subset>>;

    RankedFamily() = default;

    // Returns true if the subset was not present yet
    bool insert(Rank key, const Subset& subset);

    const Partition& partitions() const { return parts_; }
    const std::vector<Subset>& at(Rank key) const;

    bool empty() const { return keys_.empty(); }
    size_t size() const { return keys_.size(); }
    std::optional<Rank> min_key() const;
    std::optional<Rank> max_key() const;

    bool contains(const Subset& subset) const { return keys_.count(subset) != 0; }
    std::optional<Rank> key_of(const Subset& subset) const;

    /**
     * First member (increasing key) that is a superset of x.
     *
     * @param key_out Receives the key of the member found (may be null)
     * @return Pointer to the member, or nullptr if no member contains x
     */
    const Subset* first_superset(const Subset& x, Rank* key_out = nullptr) const;

    // First member (increasing key, keys <= max_key) contained in x
    const Subset* first_subset(const Subset& x, Rank max_key) const;

    // All members in increasing key order
    std::vector<Subset> members() const;

    // Same members under the same keys
    bool operator==(const RankedFamily& other) const;
    bool operator!=(const RankedFamily& other) const { return !(*this == other); }

private:
    Partition parts_;
    std::unordered_map<Subset, Rank, SubsetHash> keys_;
};

} // namespace matroidcore

#endif // MATROIDCORE_SETS_RANKED_FAMILY_HPP
