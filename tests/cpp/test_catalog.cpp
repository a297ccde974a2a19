// Catalog tests - named matroids and agreement between the three encodings
#include "catalog/catalog.hpp"
#include "matroids/circuits_matroid.hpp"
#include "matroids/flats_matroid.hpp"
#include "matroids/lattice_of_flats_matroid.hpp"
#include "matroids/matroid_factory.hpp"
#include <iostream>
#include <cassert>

using namespace matroidcore;

// Every subset of the ground set
std::vector<ElementSet> all_subsets(const ElementSet& groundset) {
    const std::vector<Element> E(groundset.begin(), groundset.end());
    std::vector<ElementSet> result;
    for (size_t mask = 0; mask < (size_t(1) << E.size()); ++mask) {
        ElementSet x;
        for (size_t i = 0; i < E.size(); ++i) {
            if (mask & (size_t(1) << i)) {
                x.insert(E[i]);
            }
        }
        result.push_back(std::move(x));
    }
    return result;
}

void test_named_lookup() {
    std::cout << "Test 1: Catalog lookup by name... ";

    auto fano = catalog::named_matroid("fano");
    assert(fano->name() == "Fano");
    assert(fano->size() == 7);
    assert(fano->full_rank() == 3);

    auto nonfano = catalog::named_matroid("nonfano");
    assert(nonfano->name() == "NonFano");

    auto theta = catalog::named_matroid("theta4");
    assert(theta->size() == 8);
    assert(theta->full_rank() == 4);

    auto U = catalog::named_matroid("uniform2,5");
    assert(U->name() == "U(2, 5)");
    assert(U->full_rank() == 2);
    assert(U->circuits().size() == 10);

    assert(catalog::names().size() == 5);

    for (const std::string bad : {"petersen", "theta", "thetax", "uniform2", "uniform2,", "uniform,3",
                                  "uniform6,3", "uniform99999999999999999999,3"}) {
        bool caught = false;
        try {
            catalog::named_matroid(bad);
        } catch (const InvalidInputError& e) {
            caught = true;
        }
        assert(caught);
    }

    std::cout << "PASSED\n";
}

void test_uniform_edge_cases() {
    std::cout << "Test 2: Uniform matroids at the extremes... ";

    auto free_matroid = catalog::uniform(4, 4);
    assert(free_matroid.circuits().empty());
    assert(free_matroid.full_rank() == 4);
    assert(free_matroid.is_valid());

    bool caught = false;
    try {
        catalog::uniform(6, 3);
    } catch (const InvalidInputError& e) {
        caught = true;
    }
    assert(caught);

    auto loops = catalog::uniform(0, 3);
    assert(loops.full_rank() == 0);
    assert(loops.loops().size() == 3);
    assert(loops.is_valid());

    std::cout << "PASSED\n";
}

void test_catalog_validity() {
    std::cout << "Test 3: Catalog matroids satisfy the axioms in every encoding... ";

    for (const std::string name : {"fano", "nonfano", "k4", "theta3", "uniform2,4"}) {
        auto M = catalog::named_matroid(name);
        assert(M->is_valid());
        assert(convert(*M, Encoding::FLATS)->is_valid());
        assert(convert(*M, Encoding::LATTICE_OF_FLATS)->is_valid(2));
    }

    std::cout << "PASSED\n";
}

void test_rank_agreement() {
    std::cout << "Test 4: The three encodings agree on every rank and closure... ";

    for (const std::string name : {"fano", "nonfano", "k4", "uniform3,5"}) {
        auto C = catalog::named_matroid(name);
        auto F = convert(*C, Encoding::FLATS);
        auto L = convert(*F, Encoding::LATTICE_OF_FLATS);
        assert(F->full_rank() == C->full_rank());
        assert(L->full_rank() == C->full_rank());

        for (const auto& x : all_subsets(C->groundset())) {
            Rank r = C->rank(x);
            assert(F->rank(x) == r);
            assert(L->rank(x) == r);
            assert(F->closure(x) == C->closure(x));
            assert(L->closure(x) == C->closure(x));
            assert(F->is_independent(x) == C->is_independent(x));
        }

        // And round back to the same circuits
        assert(convert(*L, Encoding::CIRCUITS)->equals(*C));
    }

    std::cout << "PASSED\n";
}

void test_relabel_preserves_rank() {
    std::cout << "Test 5: Relabeling preserves ranks... ";

    ElementMap phi = {{"a", "g"}, {"b", "f"}, {"c", "e"}, {"d", "d"},
                      {"e", "c"}, {"f", "b"}, {"g", "a"}};

    auto C = catalog::named_matroid("nonfano");
    for (auto encoding : {Encoding::CIRCUITS, Encoding::FLATS, Encoding::LATTICE_OF_FLATS}) {
        auto M = convert(*C, encoding);
        auto N = M->relabel(phi);
        assert(N->encoding() == encoding);
        for (const auto& x : all_subsets(M->groundset())) {
            assert(N->rank(map_elements(x, phi)) == M->rank(x));
        }
        assert(N->is_isomorphic(*M));
    }

    std::cout << "PASSED\n";
}

void test_export_roundtrip() {
    std::cout << "Test 6: Rebuilding from an exported state gives an equal matroid... ";

    auto C = catalog::named_matroid("k4");
    for (auto encoding : {Encoding::CIRCUITS, Encoding::FLATS, Encoding::LATTICE_OF_FLATS}) {
        auto M = convert(*C, encoding);
        auto state = M->export_state();
        assert(state.encoding == encoding);
        assert(state.name == "M(K4)");

        auto rebuilt = make_matroid(state);
        assert(rebuilt->equals(*M));
        assert(rebuilt->export_state() == state);
    }

    std::cout << "PASSED\n";
}

void test_invariants() {
    std::cout << "Test 7: Invariants of the named matroids... ";

    auto fano = catalog::fano();
    assert(fano.bases().size() == 28);
    assert(*fano.girth() == 3);
    assert(fano.is_paving());
    assert(fano.nonspanning_circuits().size() == 7);
    assert(fano.loops().empty());
    assert((fano.whitney_numbers2() == std::vector<size_t>{1, 7, 7, 1}));

    auto non_fano = catalog::non_fano();
    assert(non_fano.bases().size() == 29);
    assert(non_fano.nonspanning_circuits().size() == 6);
    assert((non_fano.whitney_numbers2() == std::vector<size_t>{1, 7, 9, 1}));

    auto k4 = catalog::k4();
    assert((k4.whitney_numbers2() == std::vector<size_t>{1, 6, 7, 1}));
    assert(k4.lattice_of_flats().size() == 15);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "Running catalog tests...\n\n";

    try {
        test_named_lookup();
        test_uniform_edge_cases();
        test_catalog_validity();
        test_rank_agreement();
        test_relabel_preserves_rank();
        test_export_roundtrip();
        test_invariants();

        std::cout << "\n✓ All tests passed!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed: " << e.what() << "\n";
        return 1;
    }
}
