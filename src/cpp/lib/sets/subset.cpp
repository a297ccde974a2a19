#include "subset.hpp"
#include <functional>
#include <stdexcept>

namespace matroidcore {

Subset::Subset(size_t universe) : bits_(universe, 0) {}

Subset::Subset(size_t universe, const std::vector<size_t>& members) : bits_(universe, 0) {
    for (size_t i : members) {
        if (i >= universe) {
            throw std::invalid_argument("Subset member " + std::to_string(i) +
                                        " outside universe of size " + std::to_string(universe));
        }
        bits_[i] = 1;
    }
}

Subset Subset::full(size_t universe) {
    Subset s;
    s.bits_ = sdsl::bit_vector(universe, 1);
    return s;
}

uint64_t Subset::word(size_t w) const {
    uint64_t value = bits_.data()[w];
    size_t tail = bits_.size() % 64;
    if (w + 1 == num_words() && tail != 0) {
        value &= (uint64_t(1) << tail) - 1;
    }
    return value;
}

void Subset::check_universe(const Subset& other) const {
    if (universe() != other.universe()) {
        throw std::invalid_argument("Subset universe mismatch: " + std::to_string(universe()) +
                                    " vs " + std::to_string(other.universe()));
    }
}

size_t Subset::count() const {
    size_t total = 0;
    for (size_t w = 0; w < num_words(); ++w) {
        total += sdsl::bits::cnt(word(w));
    }
    return total;
}

bool Subset::empty() const {
    for (size_t w = 0; w < num_words(); ++w) {
        if (word(w) != 0) {
            return false;
        }
    }
    return true;
}

bool Subset::is_subset_of(const Subset& other) const {
    check_universe(other);
    for (size_t w = 0; w < num_words(); ++w) {
        if ((word(w) & ~other.word(w)) != 0) {
            return false;
        }
    }
    return true;
}

bool Subset::is_strict_subset_of(const Subset& other) const {
    return is_subset_of(other) && count() < other.count();
}

bool Subset::intersects(const Subset& other) const {
    check_universe(other);
    for (size_t w = 0; w < num_words(); ++w) {
        if ((word(w) & other.word(w)) != 0) {
            return true;
        }
    }
    return false;
}

Subset Subset::operator|(const Subset& other) const {
    check_universe(other);
    Subset result(universe());
    uint64_t* out = result.bits_.data();
    for (size_t w = 0; w < num_words(); ++w) {
        out[w] = word(w) | other.word(w);
    }
    return result;
}

Subset Subset::operator&(const Subset& other) const {
    check_universe(other);
    Subset result(universe());
    uint64_t* out = result.bits_.data();
    for (size_t w = 0; w < num_words(); ++w) {
        out[w] = word(w) & other.word(w);
    }
    return result;
}

Subset Subset::operator-(const Subset& other) const {
    check_universe(other);
    Subset result(universe());
    uint64_t* out = result.bits_.data();
    for (size_t w = 0; w < num_words(); ++w) {
        out[w] = word(w) & ~other.word(w);
    }
    return result;
}

Subset Subset::with(size_t i) const {
    Subset result(*this);
    result.set(i);
    return result;
}

Subset Subset::without(size_t i) const {
    Subset result(*this);
    result.reset(i);
    return result;
}

std::vector<size_t> Subset::indices() const {
    std::vector<size_t> members;
    for (size_t w = 0; w < num_words(); ++w) {
        uint64_t bits = word(w);
        while (bits != 0) {
            size_t bit = sdsl::bits::lo(bits);
            members.push_back(w * 64 + bit);
            bits &= bits - 1;
        }
    }
    return members;
}

size_t Subset::hash() const {
    size_t acc = std::hash<size_t>{}(universe());
    for (size_t w = 0; w < num_words(); ++w) {
        size_t h = std::hash<uint64_t>{}(word(w));
        acc ^= h + 0x9e3779b9 + (acc << 6) + (acc >> 2);
    }
    return acc;
}

bool Subset::operator==(const Subset& other) const {
    if (universe() != other.universe()) {
        return false;
    }
    for (size_t w = 0; w < num_words(); ++w) {
        if (word(w) != other.word(w)) {
            return false;
        }
    }
    return true;
}

bool Subset::operator<(const Subset& other) const {
    if (universe() != other.universe()) {
        return universe() < other.universe();
    }
    size_t lhs = count();
    size_t rhs = other.count();
    if (lhs != rhs) {
        return lhs < rhs;
    }
    for (size_t w = 0; w < num_words(); ++w) {
        uint64_t a = word(w);
        uint64_t b = other.word(w);
        if (a != b) {
            return a < b;
        }
    }
    return false;
}

} // namespace matroidcore
