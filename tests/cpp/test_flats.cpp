// Flats matroid tests - rank and closure from flats, flat axioms
#include "matroids/flats_matroid.hpp"
#include "matroids/circuits_matroid.hpp"
#include "catalog/catalog.hpp"
#include <iostream>
#include <cassert>
#include <algorithm>
#include <limits>

using namespace matroidcore;

// Free matroid on {0, 1} given by its flats
FlatsMatroid free_pair() {
    return FlatsMatroid({"0", "1"}, std::map<Rank, std::vector<ElementSet>>{
                                        {0, {{}}},
                                        {1, {{"0"}, {"1"}}},
                                        {2, {{"0", "1"}}}});
}

void test_free_pair() {
    std::cout << "Test 1: Flats of the free matroid on two elements... ";

    auto M = free_pair();
    assert(M.is_valid());
    assert(M.full_rank() == 2);
    assert(M.rank({"0"}) == 1);
    assert(M.rank({"0", "1"}) == 2);
    assert(M.rank({}) == 0);
    assert(M.closure({}).empty());
    assert((M.closure({"1"}) == ElementSet{"1"}));
    assert(M.is_closed({"0"}));
    assert(M.is_closed({}));
    assert(!M.is_closed({"0", "x"}));

    std::cout << "PASSED\n";
}

void test_missing_groundset() {
    std::cout << "Test 2: Flats without the ground set are rejected... ";

    FlatsMatroid M({"0", "1"}, std::map<Rank, std::vector<ElementSet>>{
                                   {0, {{}}},
                                   {1, {{"0"}, {"1"}}}});
    assert(!M.is_valid());
    assert(!M.is_valid(4));

    // No flat contains x: the rank falls back to the matroid rank
    assert(M.rank({"0", "1"}) == 1);
    assert((M.closure({"0", "1"}) == ElementSet{"0", "1"}));

    std::cout << "PASSED\n";
}

void test_covering_violation() {
    std::cout << "Test 3: Extension must be covered by exactly one flat... ";

    // {} + c lies in no flat of rank 1; nesting, ranks and meets are all fine
    FlatsMatroid M({"a", "b", "c"}, std::map<Rank, std::vector<ElementSet>>{
                                        {0, {{}}},
                                        {1, {{"a"}, {"b"}}},
                                        {2, {{"a", "b", "c"}}}});
    assert(!M.is_valid());
    assert(!M.is_valid(4));

    std::cout << "PASSED\n";
}

void test_intersection_violation() {
    std::cout << "Test 4: Intersection of flats must be a flat... ";

    // {a,b} & {b,c} = {b} is not listed
    FlatsMatroid M({"a", "b", "c"}, std::map<Rank, std::vector<ElementSet>>{
                                        {0, {{}}},
                                        {1, {{"a", "b"}, {"b", "c"}}},
                                        {2, {{"a", "b", "c"}}}});
    assert(!M.is_valid());

    std::cout << "PASSED\n";
}

void test_rank_order_violation() {
    std::cout << "Test 5: Nested flats of equal rank are rejected... ";

    FlatsMatroid M({"a", "b"}, std::map<Rank, std::vector<ElementSet>>{
                                   {0, {{}}},
                                   {1, {{"a"}, {"a", "b"}}}});
    assert(!M.is_valid());

    std::cout << "PASSED\n";
}

void test_no_rank_zero() {
    std::cout << "Test 6: Flats without a rank-0 flat are rejected... ";

    FlatsMatroid M({"a"}, std::map<Rank, std::vector<ElementSet>>{{1, {{"a"}}}});
    assert(!M.is_valid());

    FlatsMatroid none({"a"}, std::map<Rank, std::vector<ElementSet>>{});
    assert(!none.is_valid());

    std::cout << "PASSED\n";
}

void test_from_circuits() {
    std::cout << "Test 7: Flats pulled from a circuits matroid... ";

    auto C = catalog::fano();
    FlatsMatroid F(C);
    assert(F.is_valid());
    assert(F.full_rank() == 3);
    assert((F.whitney_numbers2() == std::vector<size_t>{1, 7, 7, 1}));
    assert(F.flats(2).size() == 7);
    assert(F.flats(5).empty());
    assert((F.closure({"a", "b"}) == ElementSet{"a", "b", "f"}));
    assert(F.rank({"a", "b", "f"}) == 2);
    assert(F.rank({"a", "b", "c"}) == 3);

    // Circuits recovered from the rank oracle
    CircuitsMatroid back(F);
    assert(back.equals(C));

    std::cout << "PASSED\n";
}

void test_closure_properties() {
    std::cout << "Test 8: Closure is extensive, monotone and idempotent... ";

    FlatsMatroid F(catalog::non_fano());
    const std::vector<Element> E(F.groundset().begin(), F.groundset().end());

    // All subsets of the 7-element ground set
    for (size_t mask = 0; mask < (size_t(1) << E.size()); ++mask) {
        ElementSet x;
        for (size_t i = 0; i < E.size(); ++i) {
            if (mask & (size_t(1) << i)) {
                x.insert(E[i]);
            }
        }
        ElementSet cx = F.closure(x);
        assert(std::includes(cx.begin(), cx.end(), x.begin(), x.end()));
        assert(F.closure(cx) == cx);
        assert(F.is_closed(cx));
        assert(F.rank(cx) == F.rank(x));
        for (const auto& e : E) {
            ElementSet bigger = x;
            bigger.insert(e);
            ElementSet cb = F.closure(bigger);
            assert(std::includes(cb.begin(), cb.end(), cx.begin(), cx.end()));
        }
    }

    std::cout << "PASSED\n";
}

void test_unranked_flats() {
    std::cout << "Test 9: Flats without ranks take ranks from inclusion... ";

    FlatsMatroid M({"0", "1", "2"}, std::vector<ElementSet>{{}, {"0"}, {"1"}, {"2"}, {"0", "1", "2"}});
    assert(M.is_valid());
    assert(M.full_rank() == 2);
    assert(M.rank({"1"}) == 1);
    assert(M.rank({"0", "2"}) == 2);
    assert((M.whitney_numbers2() == std::vector<size_t>{1, 3, 1}));

    std::cout << "PASSED\n";
}

void test_relabel_and_export() {
    std::cout << "Test 10: Relabeling and state export... ";

    auto M = free_pair();
    auto N = M.relabel({{"0", "x"}, {"1", "y"}});
    assert(N->encoding() == Encoding::FLATS);
    assert(N->is_valid());
    assert(N->rank({"x"}) == 1);
    assert((N->flats(1) == std::vector<ElementSet>{{"x"}, {"y"}}));

    auto state = M.export_state();
    assert(state.encoding == Encoding::FLATS);
    assert(state.sets.empty());
    assert(state.ranked_sets.size() == 3);
    assert((state.ranked_sets.at(1) == std::vector<ElementSet>{{"0"}, {"1"}}));

    // A flat listed twice keeps its lower rank
    FlatsMatroid twice({"0", "1"}, std::map<Rank, std::vector<ElementSet>>{
                                       {0, {{}}},
                                       {1, {{"0"}, {"1"}}},
                                       {2, {{"0", "1"}, {"0"}}}});
    assert(twice.export_state() == state);

    std::cout << "PASSED\n";
}

void test_invalid_element() {
    std::cout << "Test 11: Flat outside the ground set raises InvalidInputError... ";

    bool caught = false;
    try {
        FlatsMatroid M({"a"}, std::map<Rank, std::vector<ElementSet>>{{0, {{"b"}}}});
    } catch (const InvalidInputError& e) {
        caught = true;
    }
    assert(caught);

    std::cout << "PASSED\n";
}

void test_oversized_rank_key() {
    std::cout << "Test 12: Flats listed under a huge rank... ";

    const Rank huge = std::numeric_limits<Rank>::max();
    FlatsMatroid M({"a"}, std::map<Rank, std::vector<ElementSet>>{{0, {{}}}, {huge, {{"a"}}}});
    assert(!M.is_valid());
    assert(M.full_rank() == huge);
    assert((M.whitney_numbers2() == std::vector<size_t>{1}));

    FlatsMatroid gap({"a", "b"}, std::map<Rank, std::vector<ElementSet>>{
                                     {0, {{}}},
                                     {1, {{"a"}}},
                                     {1000000000, {{"a", "b"}}}});
    assert(!gap.is_valid());
    assert((gap.whitney_numbers2() == std::vector<size_t>{1, 1}));

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "Running flats matroid tests...\n\n";

    try {
        test_free_pair();
        test_missing_groundset();
        test_covering_violation();
        test_intersection_violation();
        test_rank_order_violation();
        test_no_rank_zero();
        test_from_circuits();
        test_closure_properties();
        test_unranked_flats();
        test_relabel_and_export();
        test_invalid_element();
        test_oversized_rank_key();

        std::cout << "\n✓ All tests passed!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed: " << e.what() << "\n";
        return 1;
    }
}
