#include "validation.hpp"
#include <atomic>
#include <utility>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace matroidcore {

namespace {
    /**
     * Run check(a) for a = 0..count-1 and report whether all passed.
     *
     * Sequential runs stop at the first failure. Parallel runs (OpenMP,
     * num_threads > 1) skip the remaining work once a failure is published.
     */
    template <typename Check>
    bool all_pass(size_t count, size_t num_threads, Check check) {
        if (num_threads <= 1 || count < 2) {
            for (size_t a = 0; a < count; ++a) {
                if (!check(a)) {
                    return false;
                }
            }
            return true;
        }

#ifdef _OPENMP
        std::atomic<bool> violated(false);
        #pragma omp parallel for num_threads(num_threads) schedule(dynamic)
        for (size_t a = 0; a < count; ++a) {
            if (violated.load(std::memory_order_relaxed)) {
                continue;
            }
            if (!check(a)) {
                violated.store(true, std::memory_order_relaxed);
            }
        }
        return !violated.load();
#else
        // OpenMP not available, fall back to sequential
        for (size_t a = 0; a < count; ++a) {
            if (!check(a)) {
                return false;
            }
        }
        return true;
#endif
    }
}

bool circuit_axioms_hold(const RankedFamily& circuits, size_t num_threads) {
    // Increasing size, so a circuit can only be contained in a later one
    const std::vector<Subset> all = circuits.members();

    return all_pass(all.size(), num_threads, [&](size_t a) {
        const Subset& c1 = all[a];
        if (c1.empty()) {
            return false;
        }
        for (size_t b = a + 1; b < all.size(); ++b) {
            const Subset& c2 = all[b];
            if (c1.is_subset_of(c2)) {
                return false;
            }
            const Subset both = c1 | c2;
            for (size_t e : (c1 & c2).indices()) {
                const Subset rest = both.without(e);
                if (circuits.first_subset(rest, static_cast<Rank>(rest.count())) == nullptr) {
                    return false;
                }
            }
        }
        return true;
    });
}

bool flat_axioms_hold(const RankedFamily& flats, const Subset& groundset, size_t num_threads) {
    if (flats.empty() || *flats.min_key() != 0) {
        return false;
    }
    const Rank top = *flats.max_key();
    if (flats.key_of(groundset) != top) {
        return false;
    }

    std::vector<std::pair<Rank, const Subset*>> all;
    for (const auto& [key, group] : flats.partitions()) {
        for (const auto& f : group) {
            all.emplace_back(key, &f);
        }
    }

    return all_pass(all.size(), num_threads, [&](size_t a) {
        const Rank i = all[a].first;
        const Subset& f1 = *all[a].second;

        // Covering: each extension by one element lies in exactly one flat one rank up
        const std::vector<Subset>& next = flats.at(i + 1);
        for (size_t e : (groundset - f1).indices()) {
            const Subset extended = f1.with(e);
            size_t covers = 0;
            for (const auto& f2 : next) {
                if (extended.is_subset_of(f2)) {
                    ++covers;
                }
            }
            if (covers != 1) {
                return false;
            }
        }

        for (size_t b = a + 1; b < all.size(); ++b) {
            const Rank j = all[b].first;
            const Subset& f2 = *all[b].second;

            if (f2.is_strict_subset_of(f1) || (j == i && f1.is_strict_subset_of(f2))) {
                return false;
            }

            // Meet closure
            auto meet_rank = flats.key_of(f1 & f2);
            if (!meet_rank || *meet_rank > i) {
                return false;
            }
        }
        return true;
    });
}

Rank flat_rank(const RankedFamily& flats, const Subset& x, Rank ceiling) {
    Rank key = ceiling;
    if (flats.first_superset(x, &key) == nullptr) {
        return ceiling;
    }
    return key;
}

Subset flat_closure(const RankedFamily& flats, const Subset& x, const Subset& groundset) {
    const Subset* found = flats.first_superset(x);
    return found ? *found : groundset;
}

} // namespace matroidcore
