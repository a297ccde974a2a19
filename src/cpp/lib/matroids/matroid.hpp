#ifndef MATROIDCORE_MATROIDS_MATROID_HPP
#define MATROIDCORE_MATROIDS_MATROID_HPP

#include "../common.hpp"
#include "../sets/set_system.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace matroidcore {

/**
 * Defining data a matroid is encoded by
 */
enum class Encoding {
    CIRCUITS,           // Minimal dependent sets, partitioned by size
    FLATS,              // Closed sets, partitioned by rank
    LATTICE_OF_FLATS    // Closed sets as a poset under inclusion
};

std::string encoding_name(Encoding encoding);

// Accepts "circuits", "flats" and "lattice"; throws InvalidInputError otherwise
Encoding parse_encoding(const std::string& name);

/**
 * Construction data of a matroid (the persistence boundary).
 *
 * `sets` holds the circuits or the lattice elements, `ranked_sets` the flats
 * by rank; the field not used by `encoding` stays empty. States produced by
 * export_state() list every family in canonical order, so two equal
 * matroids export equal states.
 */
struct MatroidState {
    Encoding encoding = Encoding::CIRCUITS;
    ElementSet groundset;
    std::vector<ElementSet> sets;
    std::map<Rank, std::vector<ElementSet>> ranked_sets;
    std::string name;

    bool operator==(const MatroidState& other) const;
    bool operator!=(const MatroidState& other) const { return !(*this == other); }
};

// Image of a set under mapping; elements without a key map to themselves
ElementSet map_elements(const ElementSet& set, const ElementMap& mapping);

/**
 * Matroid interface shared by the circuits, flats and lattice-of-flats
 * encodings.
 *
 * Instances are immutable after construction. Concrete encodings answer
 * rank queries from their own defining data; the non-pure members below are
 * generic rank-oracle algorithms (exponential in the ground set size) that
 * encodings override where their data gives a direct answer.
 */
class Matroid {
public:
    virtual ~Matroid() = default;

    virtual Encoding encoding() const = 0;
    virtual const ElementSet& groundset() const = 0;
    virtual const std::string& name() const = 0;
    size_t size() const { return groundset().size(); }

    // Rank oracle
    virtual Rank full_rank() const = 0;
    virtual Rank rank(const ElementSet& x) const = 0;
    virtual bool is_independent(const ElementSet& x) const;
    virtual ElementSet max_independent(const ElementSet& x) const;
    // Throws NoCircuitFoundError if x is independent
    virtual ElementSet circuit(const ElementSet& x) const;
    virtual ElementSet closure(const ElementSet& x) const;
    virtual bool is_closed(const ElementSet& x) const;

    // Enumeration
    virtual std::vector<ElementSet> circuits() const;
    virtual std::vector<ElementSet> flats(Rank k) const;
    virtual std::vector<ElementSet> nonspanning_circuits() const;
    virtual std::vector<size_t> whitney_numbers2() const;
    std::vector<ElementSet> lattice_of_flats() const;
    std::vector<ElementSet> bases() const;
    ElementSet loops() const;
    std::optional<size_t> girth() const;
    bool is_paving() const;

    // Axiom check of the defining data; never throws on invalid data
    virtual bool is_valid(size_t num_threads = 1) const = 0;

    virtual std::unique_ptr<Matroid> relabel(const ElementMap& mapping) const = 0;
    virtual MatroidState export_state() const = 0;

    // Complete defining-set collection used for isomorphism testing
    virtual const SetSystem& defining_sets() const = 0;

    // Same ground set, rank and defining sets (names are ignored). Flats and
    // lattice façades compare by their flat families, circuits only to circuits.
    bool equals(const Matroid& other) const;
    bool is_isomorphic(const Matroid& other) const;
    std::optional<ElementMap> isomorphism(const Matroid& other) const;

    void print(std::ostream& os = std::cout) const;

protected:
    /**
     * Visit all k-element subsets of the ground set in lexicographic order.
     * The visitor returns false to stop the enumeration early.
     */
    template <typename Visitor>
    void for_each_subset(size_t k, Visitor visit) const;
};

template <typename Visitor>
void Matroid::for_each_subset(size_t k, Visitor visit) const {
    const std::vector<Element> elements(groundset().begin(), groundset().end());
    const size_t n = elements.size();
    if (k > n) {
        return;
    }
    std::vector<size_t> pick(k);
    for (size_t i = 0; i < k; ++i) {
        pick[i] = i;
    }
    while (true) {
        ElementSet subset;
        for (size_t i : pick) {
            subset.insert(elements[i]);
        }
        if (!visit(subset)) {
            return;
        }
        // Advance to the next combination
        size_t i = k;
        while (i > 0 && pick[i - 1] == n - k + i - 1) {
            --i;
        }
        if (i == 0) {
            return;
        }
        ++pick[i - 1];
        for (size_t j = i; j < k; ++j) {
            pick[j] = pick[j - 1] + 1;
        }
    }
}

} // namespace matroidcore

#endif // MATROIDCORE_MATROIDS_MATROID_HPP
