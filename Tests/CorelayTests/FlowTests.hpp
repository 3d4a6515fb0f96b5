#pragma once

#include "TestStages.hpp"
#include <cassert>
#include <iostream>

namespace flow_tests {

using namespace corelay;
using namespace test_types;

// ============================================================================
// Test: shaper
// ============================================================================

void test_shaper() {
    std::cout << "Testing shaper..." << std::endl;

    auto s = make_positional<shaper>({value(tuple_t{1, 2, tuple_t{0, 2}})});
    value data(tuple_t{1, 2, 3});
    assert((*s)(data) == value(tuple_t{2, 3, tuple_t{1, 3}}));

    // Negative indices count from the end
    auto last = make<shaper>({{"indices", tuple_t{-1, -3}}});
    assert((*last)(data) == value(tuple_t{3, 1}));

    // A single value behaves as a one-element tuple
    auto repeat = make<shaper>({{"indices", tuple_t{0, 0}}});
    assert((*repeat)(value("x")) == value(tuple_t{"x", "x"}));

    bool threw = false;
    try {
        auto out_of_range = make<shaper>({{"indices", tuple_t{3}}});
        (*out_of_range)(data);
    } catch (const type_error& e) {
        threw = std::string(e.what()).find("invalid index") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        auto not_an_index = make<shaper>({{"indices", tuple_t{0.5}}});
        (*not_an_index)(data);
    } catch (const type_error&) {
        threw = true;
    }
    assert(threw);

    // indices are mandatory
    threw = false;
    try {
        auto unset = make<shaper>();
        (*unset)(data);
    } catch (const unset_field_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Shaper test passed!" << std::endl;
}

// ============================================================================
// Test: parallel
// ============================================================================

void test_parallel() {
    std::cout << "Testing parallel..." << std::endl;

    tuple_t incrementers;
    for (int i = 0; i < 5; ++i) {
        incrementers.push_back(value(function_of(add_one())));
    }
    auto p = make_positional<parallel>({value(incrementers)});
    assert(p->children().size() == 5);

    // Element-wise
    assert((*p)(value(tuple_t{0, 1, 2, 3, 4})) == value(tuple_t{1, 2, 3, 4, 5}));

    // A single value goes to every child
    assert((*p)(value(3)) == value(tuple_t{4, 4, 4, 4, 4}));

    // broadcast hands the whole tuple to every child
    tuple_t pickers;
    for (int64_t i = 4; i >= 0; --i) {
        pickers.push_back(value(make<shaper>({{"indices", tuple_t{i}}})));
    }
    auto fan = make_positional<parallel>({value(pickers)}, {{"broadcast", true}});
    assert((*fan)(value(tuple_t{0, 1, 2, 3, 4})) ==
           value(tuple_t{tuple_t{4}, tuple_t{3}, tuple_t{2}, tuple_t{1}, tuple_t{0}}));

    bool threw = false;
    try {
        (*p)(value(tuple_t{1, 2}));
    } catch (const type_error& e) {
        threw = std::string(e.what()).find("does not match") != std::string::npos;
    }
    assert(threw);

    // children must all be stages
    threw = false;
    try {
        make_positional<parallel>({value(tuple_t{value(function_of(add_one())), 3})});
    } catch (const type_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Parallel test passed!" << std::endl;
}

// ============================================================================
// Test: sequential
// ============================================================================

void test_sequential() {
    std::cout << "Testing sequential..." << std::endl;

    auto chain = make_positional<sequential>(
        {value(tuple_t{value(function_of(add_one())), value(function_of(times_two()))})});
    assert((*chain)(value(5)) == value(12));

    // Groups nest
    auto nested = make_positional<sequential>(
        {value(tuple_t{value(chain), value(make<offset_stage>({{"offset", -2}}))})});
    assert((*nested)(value(5)) == value(10));
    assert(nested->fields().name() == "sequential");

    std::cout << "  Sequential test passed!" << std::endl;
}

} // namespace flow_tests
