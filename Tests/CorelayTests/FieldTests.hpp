#pragma once

#include "TestStages.hpp"
#include <cassert>
#include <iostream>

namespace field_tests {

using namespace corelay;
using namespace test_types;

// ============================================================================
// Test: Field descriptors
// ============================================================================

void test_field_descriptor() {
    std::cout << "Testing field descriptors..." << std::endl;

    param count(kind::integer, 3);
    assert(count.accepts(value(5)));
    assert(!count.accepts(value("five")));
    assert(count.accepts(value()));
    assert(count.describe() == "integer");

    // Mandatory drops the default
    param required(kind::integer, 3, {.mandatory = true});
    assert(required.default_value().is_none());
    assert(required.mandatory());

    bool threw = false;
    try {
        param bad(kind::integer, "three");
    } catch (const type_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        param no_type(type_set{}, 1);
    } catch (const type_error&) {
        threw = true;
    }
    assert(threw);

    // Integers widen to real, not the other way round
    param ratio(kind::real, 0.5);
    assert(!ratio.accepts(value(2)));
    assert(value(2).as_real() == 2.0);

    threw = false;
    try {
        count.check("count", value(1.5));
    } catch (const type_error& e) {
        threw = std::string(e.what()).find("'count'") != std::string::npos;
    }
    assert(threw);

    std::cout << "  Field descriptor test passed!" << std::endl;
}

// ============================================================================
// Test: Function-family widening
// ============================================================================

void test_function_family() {
    std::cout << "Testing function-family widening..." << std::endl;

    auto total = callable::builtin("sum", [](const value& x) {
        double sum = 0;
        for (double e : x.as_array().data) sum += e;
        return value(sum);
    });
    auto named = callable::method("stage_name", [](stage& self, const value&) {
        return value(self.fields().name());
    });

    auto cfg = make<hook_config>();
    cfg->set("hook", total);
    assert(cfg->get("hook").as_callable().type() == callable_kind::builtin);
    cfg->set("hook", named);
    assert(cfg->get("hook").as_callable().type() == callable_kind::method);

    // A method-only field does not take plain functions
    param method_only(kind::method);
    assert(method_only.accepts(value(named)));
    assert(!method_only.accepts(value(add_one())));

    std::cout << "  Function-family test passed!" << std::endl;
}

// ============================================================================
// Test: Value resolution
// ============================================================================

void test_value_resolution() {
    std::cout << "Testing value resolution..." << std::endl;

    auto cfg = make<base_config>({{"gamma", "g"}});
    assert(cfg->get_as<int64_t>("alpha") == 1);

    cfg->set_default("alpha", 5);
    assert(cfg->get_as<int64_t>("alpha") == 5);
    assert(cfg->default_of("alpha") == value(5));

    cfg->set("alpha", 9);
    assert(cfg->get_as<int64_t>("alpha") == 9);

    cfg->reset("alpha");
    assert(cfg->get_as<int64_t>("alpha") == 5);

    cfg->reset_default("alpha");
    assert(cfg->get_as<int64_t>("alpha") == 1);

    // fallback() is the field's own default whatever the instance default
    cfg->set_default("alpha", 6);
    assert(cfg->cell("alpha").fallback() == value(1));
    assert(cfg->cell("alpha").default_value() == value(6));
    assert(!make<base_config>()->cell("gamma").fallback().has_value());
    cfg->reset_default("alpha");

    // Setting none is the same as resetting
    cfg->set("alpha", 4);
    cfg->set("alpha", value());
    assert(cfg->get_as<int64_t>("alpha") == 1);

    // Failed assignments keep the previous value
    cfg->set("alpha", 7);
    bool threw = false;
    try {
        cfg->set("alpha", "seven");
    } catch (const type_error&) {
        threw = true;
    }
    assert(threw);
    assert(cfg->get_as<int64_t>("alpha") == 7);

    threw = false;
    try {
        cfg->set_default("beta", "wide");
    } catch (const type_error&) {
        threw = true;
    }
    assert(threw);
    assert(cfg->get("beta").as_real() == 2.5);

    // beta takes both integers and reals
    cfg->set("beta", 3);
    assert(cfg->get("beta").type() == kind::integer);
    assert(cfg->get_as<double>("beta") == 3.0);

    std::cout << "  Value resolution test passed!" << std::endl;
}

void test_unset_field() {
    std::cout << "Testing unset mandatory fields..." << std::endl;

    auto cfg = make<base_config>();
    assert(!cfg->cell("gamma").is_set());

    bool threw = false;
    try {
        cfg->get("gamma");
    } catch (const unset_field_error& e) {
        threw = std::string(e.what()).find("gamma") != std::string::npos;
    }
    assert(threw);

    // Distinguishable from a dtype mismatch, but still a type_error
    threw = false;
    try {
        cfg->get("gamma");
    } catch (const type_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        cfg->get("epsilon");
    } catch (const unknown_field_error&) {
        threw = true;
    }
    assert(threw);

    cfg->set("gamma", "now set");
    assert(cfg->get_as<std::string>("gamma") == "now set");

    std::cout << "  Unset field test passed!" << std::endl;
}

// ============================================================================
// Test: Registry
// ============================================================================

void test_registry_inheritance() {
    std::cout << "Testing registry inheritance..." << std::endl;

    const registry& base = base_config::declared();
    assert(base.name() == "base_config");
    assert((base.names() == std::vector<std::string>{"alpha", "beta", "gamma"}));

    // Redeclared names keep their position, new names append
    const registry& derived = derived_config::declared();
    assert(derived.name() == "derived_config");
    assert((derived.names() == std::vector<std::string>{"alpha", "beta", "gamma", "delta"}));
    assert(derived.get("beta")->default_value() == value(7.0));
    assert(base.get("beta")->default_value() == value(2.5));

    // Same registry instance on every call
    assert(&derived_config::declared() == &derived);

    auto cfg = make<derived_config>({{"gamma", "x"}});
    assert(&cfg->fields() == &derived);
    std::shared_ptr<base_config> as_base = cfg;
    assert(as_base->fields().name() == "derived_config");

    assert(derived.collect<param>().size() == 4);
    assert(derived.collect<task_field>().empty());

    bool threw = false;
    try {
        derived.get("omega");
    } catch (const unknown_field_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Registry inheritance test passed!" << std::endl;
}

// ============================================================================
// Test: Construction
// ============================================================================

void test_argument_assignment() {
    std::cout << "Testing argument assignment..." << std::endl;

    // alpha and delta are positional, in declaration order
    auto cfg = make_positional<derived_config>({3, false}, {{"gamma", "x"}});
    assert(cfg->get_as<int64_t>("alpha") == 3);
    assert(cfg->get_as<bool>("delta") == false);
    assert(cfg->get_as<double>("beta") == 7.0);

    bool threw = false;
    try {
        make_positional<derived_config>({3}, {{"alpha", 4}});
    } catch (const type_error& e) {
        threw = std::string(e.what()).find("multiple values") != std::string::npos;
    }
    assert(threw);

    // Repeated keywords are rejected as well
    threw = false;
    try {
        make<derived_config>({{"beta", 1.0}, {"gamma", "x"}, {"beta", 2.0}});
    } catch (const type_error& e) {
        threw = std::string(e.what()).find("multiple values for argument 'beta'") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        make_positional<derived_config>({1, true, 3});
    } catch (const type_error& e) {
        threw = std::string(e.what()).find("at most 2") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        make<base_config>({{"zeta", 1}});
    } catch (const type_error& e) {
        threw = std::string(e.what()).find("unexpected keyword argument 'zeta'") != std::string::npos;
    }
    assert(threw);

    // Type errors surface during construction
    threw = false;
    try {
        make<base_config>({{"alpha", "one"}});
    } catch (const type_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Argument assignment test passed!" << std::endl;
}

void test_at_and_defaults() {
    std::cout << "Testing at() and default updates..." << std::endl;

    auto cfg = make<base_config>({{"gamma", "g"}});
    auto copy = std::dynamic_pointer_cast<base_config>(cfg->at({{"alpha", 42}}));
    assert(copy);
    assert(copy->get_as<int64_t>("alpha") == 42);
    assert(copy->get_as<std::string>("gamma") == "g");
    assert(cfg->get_as<int64_t>("alpha") == 1);

    // at() works on the default level: explicit values still win
    cfg->set("alpha", 8);
    auto shadowed = cfg->at({{"alpha", 42}});
    assert(shadowed->get_as<int64_t>("alpha") == 8);
    shadowed->reset("alpha");
    assert(shadowed->get_as<int64_t>("alpha") == 42);

    bool threw = false;
    try {
        cfg->at({{"omega", 1}});
    } catch (const type_error& e) {
        threw = std::string(e.what()).find("base_config.at") != std::string::npos;
    }
    assert(threw);

    cfg->update_defaults({{"beta", 1.25}, {"gamma", "defaulted"}});
    assert(cfg->get_as<double>("beta") == 1.25);
    assert(cfg->get_as<std::string>("gamma") == "g");
    cfg->reset("gamma");
    assert(cfg->get_as<std::string>("gamma") == "defaulted");

    cfg->reset_defaults();
    assert(cfg->get_as<double>("beta") == 2.5);
    assert(!cfg->cell("gamma").is_set());

    mapping_t values = make<base_config>({{"gamma", "v"}})->collect_values<param>();
    assert(values.size() == 3);
    assert(values[0].first == "alpha" && values[0].second == value(1));
    assert(values[2].second == value("v"));

    std::cout << "  at() and defaults test passed!" << std::endl;
}

} // namespace field_tests
