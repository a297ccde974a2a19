#include "matroid.hpp"
#include <algorithm>
#include <set>

namespace matroidcore {

namespace {
    bool canonical_less(const ElementSet& a, const ElementSet& b) {
        if (a.size() != b.size()) {
            return a.size() < b.size();
        }
        return a < b;
    }

    // Flats and lattice elements describe the same kind of family
    bool same_family_kind(Encoding a, Encoding b) {
        return (a == Encoding::CIRCUITS) == (b == Encoding::CIRCUITS);
    }
}

std::string encoding_name(Encoding encoding) {
    switch (encoding) {
        case Encoding::CIRCUITS:
            return "circuits";
        case Encoding::FLATS:
            return "flats";
        case Encoding::LATTICE_OF_FLATS:
            return "lattice";
    }
    return "unknown";
}

Encoding parse_encoding(const std::string& name) {
    if (name == "circuits") {
        return Encoding::CIRCUITS;
    }
    if (name == "flats") {
        return Encoding::FLATS;
    }
    if (name == "lattice") {
        return Encoding::LATTICE_OF_FLATS;
    }
    throw InvalidInputError("Unknown encoding: '" + name + "' (expected circuits, flats or lattice)");
}

bool MatroidState::operator==(const MatroidState& other) const {
    return encoding == other.encoding && groundset == other.groundset && sets == other.sets &&
           ranked_sets == other.ranked_sets && name == other.name;
}

ElementSet map_elements(const ElementSet& set, const ElementMap& mapping) {
    ElementSet result;
    for (const auto& e : set) {
        auto it = mapping.find(e);
        result.insert(it == mapping.end() ? e : it->second);
    }
    return result;
}

// ================================================================================
// GENERIC RANK-ORACLE ALGORITHMS
// ================================================================================

bool Matroid::is_independent(const ElementSet& x) const {
    return rank(x) == x.size();
}

ElementSet Matroid::max_independent(const ElementSet& x) const {
    ElementSet result;
    for (const auto& e : x) {
        result.insert(e);
        if (rank(result) < result.size()) {
            result.erase(e);
        }
    }
    return result;
}

ElementSet Matroid::circuit(const ElementSet& x) const {
    if (is_independent(x)) {
        throw NoCircuitFoundError("No circuit found: the set " + format_set(x) + " is independent");
    }
    // Drop every element whose removal keeps the set dependent
    ElementSet result = x;
    for (const auto& e : x) {
        ElementSet smaller = result;
        smaller.erase(e);
        if (!is_independent(smaller)) {
            result = std::move(smaller);
        }
    }
    return result;
}

ElementSet Matroid::closure(const ElementSet& x) const {
    const Rank r = rank(x);
    ElementSet result = x;
    for (const auto& e : groundset()) {
        if (x.count(e) != 0) {
            continue;
        }
        ElementSet extended = x;
        extended.insert(e);
        if (rank(extended) == r) {
            result.insert(e);
        }
    }
    return result;
}

bool Matroid::is_closed(const ElementSet& x) const {
    return closure(x) == x;
}

std::vector<ElementSet> Matroid::circuits() const {
    std::vector<ElementSet> result;
    const size_t largest = std::min<size_t>(full_rank() + 1, size());
    for (size_t k = 1; k <= largest; ++k) {
        for_each_subset(k, [&](const ElementSet& s) {
            if (rank(s) != k - 1) {
                return true;
            }
            for (const auto& e : s) {
                ElementSet smaller = s;
                smaller.erase(e);
                if (!is_independent(smaller)) {
                    return true;
                }
            }
            result.push_back(s);
            return true;
        });
    }
    return result;
}

std::vector<ElementSet> Matroid::flats(Rank k) const {
    if (k > full_rank()) {
        return {};
    }
    std::set<ElementSet> found;
    for_each_subset(k, [&](const ElementSet& s) {
        if (is_independent(s)) {
            found.insert(closure(s));
        }
        return true;
    });
    std::vector<ElementSet> result(found.begin(), found.end());
    std::sort(result.begin(), result.end(), canonical_less);
    return result;
}

std::vector<ElementSet> Matroid::nonspanning_circuits() const {
    std::vector<ElementSet> result;
    for (auto& c : circuits()) {
        if (c.size() <= full_rank()) {
            result.push_back(std::move(c));
        }
    }
    return result;
}

std::vector<size_t> Matroid::whitney_numbers2() const {
    std::vector<size_t> counts;
    for (Rank k = 0; k <= full_rank(); ++k) {
        counts.push_back(flats(k).size());
    }
    return counts;
}

std::vector<ElementSet> Matroid::lattice_of_flats() const {
    std::vector<ElementSet> result;
    for (Rank k = 0; k <= full_rank(); ++k) {
        auto level = flats(k);
        result.insert(result.end(), level.begin(), level.end());
    }
    return result;
}

std::vector<ElementSet> Matroid::bases() const {
    std::vector<ElementSet> result;
    for_each_subset(full_rank(), [&](const ElementSet& s) {
        if (is_independent(s)) {
            result.push_back(s);
        }
        return true;
    });
    return result;
}

ElementSet Matroid::loops() const {
    return closure(ElementSet{});
}

std::optional<size_t> Matroid::girth() const {
    std::optional<size_t> smallest;
    for (const auto& c : circuits()) {
        if (!smallest || c.size() < *smallest) {
            smallest = c.size();
        }
    }
    return smallest;
}

bool Matroid::is_paving() const {
    auto g = girth();
    return !g || *g >= full_rank();
}

// ================================================================================
// COMPARISON
// ================================================================================

bool Matroid::equals(const Matroid& other) const {
    if (!same_family_kind(encoding(), other.encoding()) || groundset() != other.groundset() ||
        full_rank() != other.full_rank()) {
        return false;
    }
    if (encoding() != other.encoding()) {
        // Flats against lattice elements: the flat families decide
        return defining_sets() == other.defining_sets();
    }
    MatroidState lhs = export_state();
    MatroidState rhs = other.export_state();
    lhs.name.clear();
    rhs.name.clear();
    return lhs == rhs;
}

bool Matroid::is_isomorphic(const Matroid& other) const {
    return isomorphism(other).has_value();
}

std::optional<ElementMap> Matroid::isomorphism(const Matroid& other) const {
    if (size() != other.size() || full_rank() != other.full_rank()) {
        return std::nullopt;
    }
    if (same_family_kind(encoding(), other.encoding())) {
        return defining_sets().isomorphism_to(other.defining_sets());
    }
    // Mixed encodings: compare the circuit families
    SetSystem own(groundset(), circuits());
    SetSystem theirs(other.groundset(), other.circuits());
    return own.isomorphism_to(theirs);
}

void Matroid::print(std::ostream& os) const {
    if (!name().empty()) {
        os << name() << ": ";
    }
    os << "Matroid of rank " << full_rank() << " on " << size() << " elements with "
       << defining_sets().size() << " " << (encoding() == Encoding::CIRCUITS ? "circuits" : "flats")
       << " (" << encoding_name(encoding()) << " encoding)\n";
}

} // namespace matroidcore
