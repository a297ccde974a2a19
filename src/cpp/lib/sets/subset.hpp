#ifndef MATROIDCORE_SETS_SUBSET_HPP
#define MATROIDCORE_SETS_SUBSET_HPP

#include "../common.hpp"
#include <sdsl/bit_vectors.hpp>
#include <cstddef>
#include <vector>

namespace matroidcore {

/**
 * Subset of a ground set of fixed size, stored as an incidence bit vector.
 *
 * Bit i is set iff the i-th ground set element (in ground set order) is a
 * member. All binary operations require both operands to live over the same
 * ground set size (the "universe"); mixing universes throws
 * std::invalid_argument.
 *
 * Ordering is by cardinality first, then by the raw words, so sorting a
 * family of subsets yields a linear extension of inclusion.
 */
class Subset {
public:
    Subset() = default;
    explicit Subset(size_t universe);
    Subset(size_t universe, const std::vector<size_t>& members);

    static Subset full(size_t universe);

    size_t universe() const { return bits_.size(); }
    bool test(size_t i) const { return bits_[i]; }
    void set(size_t i) { bits_[i] = 1; }
    void reset(size_t i) { bits_[i] = 0; }

    size_t count() const;
    bool empty() const;

    bool is_subset_of(const Subset& other) const;
    bool is_strict_subset_of(const Subset& other) const;
    bool intersects(const Subset& other) const;

    Subset operator|(const Subset& other) const;
    Subset operator&(const Subset& other) const;
    Subset operator-(const Subset& other) const;
    Subset with(size_t i) const;
    Subset without(size_t i) const;

    // Member indices in increasing order
    std::vector<size_t> indices() const;

    size_t hash() const;

    bool operator==(const Subset& other) const;
    bool operator!=(const Subset& other) const { return !(*this == other); }
    bool operator<(const Subset& other) const;

private:
    size_t num_words() const { return (bits_.size() + 63) / 64; }
    uint64_t word(size_t w) const;        // Word w with bits past the universe cleared
    void check_universe(const Subset& other) const;

    sdsl::bit_vector bits_;
};

struct SubsetHash {
    size_t operator()(const Subset& s) const { return s.hash(); }
};

} // namespace matroidcore

#endif // MATROIDCORE_SETS_SUBSET_HPP
