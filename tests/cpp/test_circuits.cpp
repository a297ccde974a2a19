// Circuits matroid tests - rank oracle, circuit axioms and enumeration
#include "matroids/circuits_matroid.hpp"
#include "catalog/catalog.hpp"
#include <iostream>
#include <cassert>
#include <algorithm>
#include <sstream>

using namespace matroidcore;

// U(2, 4) given by its circuits
CircuitsMatroid uniform_2_4() {
    return CircuitsMatroid({"0", "1", "2", "3"},
                           {{"0", "1", "2"}, {"0", "1", "3"}, {"0", "2", "3"}, {"1", "2", "3"}});
}

void test_uniform_rank() {
    std::cout << "Test 1: Rank of U(2, 4)... ";

    auto M = uniform_2_4();
    assert(M.is_valid());
    assert(M.full_rank() == 2);
    assert(M.size() == 4);
    assert(M.rank({"0", "1"}) == 2);
    assert(M.rank({"0", "1", "2"}) == 2);
    assert(M.rank({"3"}) == 1);
    assert(M.rank({}) == 0);
    assert(M.is_independent({"0", "3"}));
    assert(!M.is_independent({"0", "1", "3"}));

    std::cout << "PASSED\n";
}

void test_minimality_violation() {
    std::cout << "Test 2: Nested circuits are rejected... ";

    CircuitsMatroid M({"0", "1", "2"}, {{"0", "1"}, {"0", "1", "2"}});
    assert(!M.is_valid());
    assert(!M.is_valid(4));

    std::cout << "PASSED\n";
}

void test_elimination_violation() {
    std::cout << "Test 3: Circuit elimination is checked... ";

    // {a,b} and {b,c} share b, but {a,c} contains no circuit
    CircuitsMatroid M({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}});
    assert(!M.is_valid());

    // Adding {a,c} completes the rank-1 matroid on three parallel elements
    CircuitsMatroid fixed({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}, {"a", "c"}});
    assert(fixed.is_valid());
    assert(fixed.full_rank() == 1);

    std::cout << "PASSED\n";
}

void test_empty_circuit_invalid() {
    std::cout << "Test 4: Empty circuit is rejected... ";

    CircuitsMatroid M({"a", "b"}, {{}, {"a"}});
    assert(!M.is_valid());

    std::cout << "PASSED\n";
}

void test_invalid_element() {
    std::cout << "Test 5: Circuit outside the ground set raises InvalidInputError... ";

    bool caught = false;
    try {
        CircuitsMatroid M({"a", "b"}, {{"a", "z"}});
    } catch (const InvalidInputError& e) {
        caught = true;
    }
    assert(caught);

    caught = false;
    try {
        uniform_2_4().rank({"0", "9"});
    } catch (const InvalidInputError& e) {
        caught = true;
    }
    assert(caught);

    std::cout << "PASSED\n";
}

void test_max_independent_and_circuit() {
    std::cout << "Test 6: Maximal independent subsets and circuits... ";

    auto M = catalog::fano();

    ElementSet line = {"a", "b", "f"};
    ElementSet basis = M.max_independent(line);
    assert(basis.size() == 2);
    assert(M.is_independent(basis));
    for (const auto& e : basis) {
        assert(line.count(e) == 1);
    }

    assert((M.circuit({"a", "b", "c", "f"}) == ElementSet{"a", "b", "f"}));
    assert(M.max_independent({"a", "b", "c", "d", "e", "f", "g"}).size() == 3);

    bool caught = false;
    try {
        M.circuit({"a", "b", "c"});
    } catch (const NoCircuitFoundError& e) {
        caught = true;
    }
    assert(caught);

    std::cout << "PASSED\n";
}

void test_closure() {
    std::cout << "Test 7: Closure in the Fano plane... ";

    auto M = catalog::fano();
    assert(M.closure({}).empty());
    assert((M.closure({"a"}) == ElementSet{"a"}));
    assert((M.closure({"a", "b"}) == ElementSet{"a", "b", "f"}));
    assert(M.closure({"a", "b", "c"}).size() == 7);
    assert(M.is_closed({"a", "c", "e"}));
    assert(!M.is_closed({"a", "c"}));

    // Closure is extensive, monotone and idempotent
    ElementSet x = {"b", "d"};
    ElementSet cx = M.closure(x);
    assert(std::includes(cx.begin(), cx.end(), x.begin(), x.end()));
    assert(M.closure(cx) == cx);
    ElementSet y = {"b", "d", "e"};
    ElementSet cy = M.closure(y);
    assert(std::includes(cy.begin(), cy.end(), cx.begin(), cx.end()));

    std::cout << "PASSED\n";
}

void test_loops_and_parallel() {
    std::cout << "Test 8: Loops and parallel elements... ";

    // l is a loop, p and q are parallel
    CircuitsMatroid M({"l", "p", "q", "r"}, {{"l"}, {"p", "q"}});
    assert(M.is_valid());
    assert(M.full_rank() == 2);
    assert((M.loops() == ElementSet{"l"}));
    assert((M.closure({"p"}) == ElementSet{"l", "p", "q"}));
    assert(M.rank({"l", "p", "q"}) == 1);
    assert(*M.girth() == 1);
    assert(!M.is_paving());

    std::cout << "PASSED\n";
}

void test_enumeration() {
    std::cout << "Test 9: Circuit and basis enumeration... ";

    auto M = catalog::k4();
    assert(M.circuits().size() == 7);
    assert(M.circuits(3).size() == 4);
    assert(M.circuits(4).size() == 3);
    assert(M.circuits(5).empty());
    assert(M.nonspanning_circuits().size() == 4);

    // Spanning trees of K4
    assert(M.bases().size() == 16);
    assert(*M.girth() == 3);
    assert(M.is_paving());

    // Circuits come out in canonical order
    auto circuits = M.circuits();
    assert(circuits.front().size() == 3);
    assert(circuits.back().size() == 4);

    // The generic enumeration from the rank oracle agrees
    assert(M.flats(1).size() == 6);
    assert(M.flats(2).size() == 7);
    assert(M.flats(3).size() == 1);
    assert(M.flats(4).empty());

    std::cout << "PASSED\n";
}

void test_free_and_trivial() {
    std::cout << "Test 10: Free matroid and empty ground set... ";

    CircuitsMatroid free_matroid({"a", "b", "c"}, {});
    assert(free_matroid.is_valid());
    assert(free_matroid.full_rank() == 3);
    assert(!free_matroid.girth().has_value());
    assert(free_matroid.is_paving());
    assert(free_matroid.bases().size() == 1);

    CircuitsMatroid empty(ElementSet{}, {});
    assert(empty.is_valid());
    assert(empty.full_rank() == 0);
    assert(empty.size() == 0);
    assert(empty.bases().size() == 1);

    std::cout << "PASSED\n";
}

void test_no_broken_circuits() {
    std::cout << "Test 11: No-broken-circuit sets of U(2, 3)... ";

    CircuitsMatroid M({"0", "1", "2"}, {{"0", "1", "2"}});
    auto nbc = M.no_broken_circuits_sets();
    // Broken circuit {1,2}: every set avoiding it
    assert(nbc.size() == 6);
    for (const auto& s : nbc) {
        assert(!(s.count("1") && s.count("2")));
    }

    std::cout << "PASSED\n";
}

void test_relabel_and_export() {
    std::cout << "Test 12: Relabeling and state export... ";

    auto M = uniform_2_4();
    auto N = M.relabel({{"0", "a"}, {"1", "b"}});
    assert(N->encoding() == Encoding::CIRCUITS);
    assert((N->groundset() == ElementSet{"2", "3", "a", "b"}));
    assert(N->rank({"a", "b"}) == 2);
    assert(N->rank({"a", "b", "3"}) == 2);

    auto state = M.export_state();
    assert(state.encoding == Encoding::CIRCUITS);
    assert(state.sets.size() == 4);
    assert(state.ranked_sets.empty());
    assert((state.sets.front() == ElementSet{"0", "1", "2"}));

    std::cout << "PASSED\n";
}

void test_parallel_validation() {
    std::cout << "Test 13: Validation result does not depend on threads... ";

    auto valid = catalog::uniform(3, 7);
    assert(valid.is_valid(1));
    assert(valid.is_valid(4));

    CircuitsMatroid invalid({"a", "b", "c", "d"}, {{"a", "b"}, {"b", "c"}, {"c", "d"}});
    assert(!invalid.is_valid(1));
    assert(!invalid.is_valid(4));

    std::cout << "PASSED\n";
}

void test_print_output() {
    std::cout << "Test 14: Print summary... ";

    std::stringstream ss;
    catalog::k4().print(ss);
    std::string out = ss.str();
    assert(out.find("M(K4)") != std::string::npos);
    assert(out.find("rank 3") != std::string::npos);
    assert(out.find("6 elements") != std::string::npos);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "Running circuits matroid tests...\n\n";

    try {
        test_uniform_rank();
        test_minimality_violation();
        test_elimination_violation();
        test_empty_circuit_invalid();
        test_invalid_element();
        test_max_independent_and_circuit();
        test_closure();
        test_loops_and_parallel();
        test_enumeration();
        test_free_and_trivial();
        test_no_broken_circuits();
        test_relabel_and_export();
        test_parallel_validation();
        test_print_output();

        std::cout << "\n✓ All tests passed!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed: " << e.what() << "\n";
        return 1;
    }
}
