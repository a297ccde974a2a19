#include "inclusion_lattice.hpp"
#include <algorithm>

namespace matroidcore {

InclusionLattice::InclusionLattice(GroundSetPtr groundset, const std::vector<Subset>& elements)
    : groundset_(std::move(groundset)), elements_(elements) {
    std::sort(elements_.begin(), elements_.end());
    elements_.erase(std::unique(elements_.begin(), elements_.end()), elements_.end());

    const size_t n = elements_.size();
    for (size_t i = 0; i < n; ++i) {
        if (elements_[i].universe() != groundset_->size()) {
            throw InvalidInputError("Lattice element does not match the ground set size");
        }
        index_.emplace(elements_[i], i);
    }

    // Longest chain lengths and cover relations; strict inclusions only go upwards in index
    ranks_.assign(n, 0);
    upper_covers_.assign(n, {});
    for (size_t j = 0; j < n; ++j) {
        std::vector<size_t> below;
        for (size_t i = 0; i < j; ++i) {
            if (elements_[i].is_strict_subset_of(elements_[j])) {
                below.push_back(i);
                ranks_[j] = std::max<Rank>(ranks_[j], ranks_[i] + 1);
            }
        }
        for (size_t i : below) {
            bool is_cover = true;
            for (size_t k : below) {
                if (k != i && elements_[i].is_strict_subset_of(elements_[k])) {
                    is_cover = false;
                    break;
                }
            }
            if (is_cover) {
                upper_covers_[i].push_back(j);
            }
        }
        max_rank_ = std::max(max_rank_, ranks_[j]);
    }
}

std::optional<size_t> InclusionLattice::find(const Subset& subset) const {
    auto it = index_.find(subset);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<size_t> InclusionLattice::bottom() const {
    if (elements_.empty()) {
        return std::nullopt;
    }
    for (size_t j = 1; j < elements_.size(); ++j) {
        if (!leq(0, j)) {
            return std::nullopt;
        }
    }
    return 0;
}

std::optional<size_t> InclusionLattice::top() const {
    if (elements_.empty()) {
        return std::nullopt;
    }
    size_t last = elements_.size() - 1;
    for (size_t i = 0; i < last; ++i) {
        if (!leq(i, last)) {
            return std::nullopt;
        }
    }
    return last;
}

std::optional<size_t> InclusionLattice::meet(size_t i, size_t j) const {
    std::vector<size_t> lower;
    for (size_t k = 0; k < elements_.size(); ++k) {
        if (leq(k, i) && leq(k, j)) {
            lower.push_back(k);
        }
    }
    if (lower.empty()) {
        return std::nullopt;
    }
    // A greatest lower bound has maximal cardinality, hence the highest index
    size_t candidate = lower.back();
    for (size_t k : lower) {
        if (!leq(k, candidate)) {
            return std::nullopt;
        }
    }
    return candidate;
}

std::optional<size_t> InclusionLattice::join(size_t i, size_t j) const {
    std::vector<size_t> upper;
    for (size_t k = 0; k < elements_.size(); ++k) {
        if (leq(i, k) && leq(j, k)) {
            upper.push_back(k);
        }
    }
    if (upper.empty()) {
        return std::nullopt;
    }
    size_t candidate = upper.front();
    for (size_t k : upper) {
        if (!leq(candidate, k)) {
            return std::nullopt;
        }
    }
    return candidate;
}

std::vector<size_t> InclusionLattice::atoms() const {
    auto b = bottom();
    if (!b) {
        return {};
    }
    return upper_covers_[*b];
}

bool InclusionLattice::is_lattice() const {
    if (elements_.empty()) {
        return false;
    }
    for (size_t i = 0; i < elements_.size(); ++i) {
        for (size_t j = i + 1; j < elements_.size(); ++j) {
            if (!meet(i, j) || !join(i, j)) {
                return false;
            }
        }
    }
    return true;
}

bool InclusionLattice::is_graded() const {
    if (!bottom()) {
        return false;
    }
    for (size_t i = 0; i < elements_.size(); ++i) {
        for (size_t j : upper_covers_[i]) {
            if (ranks_[j] != ranks_[i] + 1) {
                return false;
            }
        }
    }
    return true;
}

bool InclusionLattice::is_atomistic() const {
    auto b = bottom();
    if (!b) {
        return false;
    }
    const auto atom_list = atoms();
    for (size_t x = 0; x < elements_.size(); ++x) {
        std::optional<size_t> acc;
        for (size_t a : atom_list) {
            if (!leq(a, x)) {
                continue;
            }
            acc = acc ? join(*acc, a) : std::optional<size_t>(a);
            if (!acc) {
                return false;
            }
        }
        size_t generated = acc ? *acc : *b;
        if (generated != x) {
            return false;
        }
    }
    return true;
}

bool InclusionLattice::is_semimodular() const {
    for (size_t i = 0; i < elements_.size(); ++i) {
        for (size_t j = i + 1; j < elements_.size(); ++j) {
            auto m = meet(i, j);
            auto J = join(i, j);
            if (!m || !J) {
                return false;
            }
            if (ranks_[i] + ranks_[j] < ranks_[*J] + ranks_[*m]) {
                return false;
            }
        }
    }
    return true;
}

bool InclusionLattice::is_geometric() const {
    return is_lattice() && is_graded() && is_semimodular() && is_atomistic();
}

std::vector<long long> InclusionLattice::mobius_row(size_t i) const {
    std::vector<long long> mu(elements_.size(), 0);
    mu[i] = 1;
    for (size_t j = i + 1; j < elements_.size(); ++j) {
        if (!leq(i, j)) {
            continue;
        }
        long long sum = 0;
        for (size_t k = i; k < j; ++k) {
            if (mu[k] != 0 && leq(k, j)) {
                sum += mu[k];
            }
        }
        mu[j] = -sum;
    }
    return mu;
}

long long InclusionLattice::mobius(size_t i, size_t j) const {
    if (!leq(i, j)) {
        return 0;
    }
    return mobius_row(i)[j];
}

} // namespace matroidcore
