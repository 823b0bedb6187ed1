#include "unitgraph/errors.hpp"
#include "unitgraph/graph.h"
#include <cassert>
#include <iostream>
#include <string>

#include <symengine/integer.h>
#include <symengine/pow.h>

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

}

void test_message_prefixes() {
    assert(starts_with(unitgraph::ShapeMismatch("x").what(), "ShapeMismatch: "));
    assert(starts_with(unitgraph::InvalidBaseUnit("x").what(), "InvalidBaseUnit: "));
    assert(starts_with(unitgraph::IncompatibleDimensions("x").what(), "IncompatibleDimensions: "));
    assert(starts_with(unitgraph::NonInvertibleMap("x").what(), "NonInvertibleMap: "));
    assert(starts_with(unitgraph::NonInvertibleTransform("x").what(), "NonInvertibleTransform: "));
    assert(starts_with(unitgraph::MissingCalibration("x").what(), "MissingCalibration: "));
    assert(starts_with(unitgraph::NoConversionPath("x").what(), "NoConversionPath: "));
    assert(starts_with(unitgraph::DimensionMismatch("x").what(), "DimensionMismatch: "));
    assert(starts_with(unitgraph::DuplicateEdge("x").what(), "DuplicateEdge: "));
    assert(starts_with(unitgraph::GraphFrozen("x").what(), "GraphFrozen: "));
    std::cout << "[PASS] test_message_prefixes\n";
}

void test_common_base_class() {
    bool caught = false;
    try {
        throw unitgraph::MissingCalibration("tempo");
    } catch (const unitgraph::UnitGraphError& e) {
        caught = std::string(e.what()) == "MissingCalibration: tempo";
    }
    assert(caught && "Expected MissingCalibration to derive from UnitGraphError");

    caught = false;
    try {
        throw unitgraph::NameCollision("metre");
    } catch (const std::runtime_error&) {
        caught = true;
    }
    assert(caught && "Expected UnitGraphError to derive from std::runtime_error");
    std::cout << "[PASS] test_common_base_class\n";
}

void test_zero_denominator() {
    bool caught = false;
    try {
        unitgraph::rational(1, 0);
    } catch (const unitgraph::ShapeMismatch&) {
        caught = true;
    }
    assert(caught && "Expected ShapeMismatch for zero denominator");

    caught = false;
    try {
        unitgraph::div(unitgraph::rational(3), unitgraph::rational(0));
    } catch (const unitgraph::ShapeMismatch&) {
        caught = true;
    }
    assert(caught && "Expected ShapeMismatch for division by zero");
    std::cout << "[PASS] test_zero_denominator\n";
}

void test_irrational_is_not_rational() {
    bool caught = false;
    try {
        unitgraph::to_rational(SymEngine::sqrt(SymEngine::integer(2)));
    } catch (const unitgraph::ShapeMismatch&) {
        caught = true;
    }
    assert(caught && "Expected ShapeMismatch converting a surd to a rational");
    assert(unitgraph::rational_eq(unitgraph::to_rational(SymEngine::integer(4)), unitgraph::rational(8, 2)));
    std::cout << "[PASS] test_irrational_is_not_rational\n";
}

void test_rational_arithmetic() {
    auto a = unitgraph::rational(1, 3);
    auto b = unitgraph::rational(1, 6);
    assert(unitgraph::rational_eq(unitgraph::add(a, b), unitgraph::rational(1, 2)));
    assert(unitgraph::rational_eq(unitgraph::sub(a, b), b));
    assert(unitgraph::rational_eq(unitgraph::mul(a, b), unitgraph::rational(1, 18)));
    assert(unitgraph::rational_eq(unitgraph::div(a, b), unitgraph::rational(2)));
    assert(unitgraph::to_string(*unitgraph::rational(-3, 4)) == "-3/4");
    assert(unitgraph::to_double(*unitgraph::rational(1, 4)) == 0.25);
    std::cout << "[PASS] test_rational_arithmetic\n";
}

void test_wide_rationals_print_exactly() {
    // 10^24 does not fit a long; the decimal text must still be exact.
    auto trillion = unitgraph::rational(1000000000000L);
    auto wide = unitgraph::mul(trillion, trillion);
    assert(unitgraph::to_string(*wide) == "1000000000000000000000000");
    assert(unitgraph::to_string(*unitgraph::div(wide, unitgraph::rational(7))) == "1000000000000000000000000/7");
    assert(unitgraph::to_string(*unitgraph::div(unitgraph::rational(1), wide)) == "1/1000000000000000000000000");
    std::cout << "[PASS] test_wide_rationals_print_exactly\n";
}

void test_failed_registration_leaves_graph_usable() {
    auto basis = unitgraph::Basis::standard();
    std::map<std::string, unitgraph::Unit> bases;
    bases.emplace("length", unitgraph::Unit("metre", unitgraph::Dimension::base(basis, "length")));
    bases.emplace("time", unitgraph::Unit("second", unitgraph::Dimension::base(basis, "time")));
    unitgraph::UnitSystem si("si", basis, bases);
    const auto foot = si.add_unit(unitgraph::Unit("foot", unitgraph::Dimension::base(basis, "length")));

    unitgraph::ConversionGraph g;
    try {
        g.add_edge(si.lookup("metre"), si.lookup("second"), unitgraph::Map::linear(unitgraph::rational(1)));
    } catch (const unitgraph::UnitGraphError& e) {
        std::cout << "  caught: " << e.what() << "\n";
    }
    g.add_edge(foot, si.lookup("metre"), unitgraph::Map::linear(unitgraph::rational(381, 1250)));
    assert(g.convert(si.lookup("metre"), foot) == unitgraph::Map::linear(unitgraph::rational(1250, 381)));
    std::cout << "[PASS] test_failed_registration_leaves_graph_usable\n";
}

int main() {
    std::cout << "=== Error Handling Tests ===\n";

    test_message_prefixes();
    test_common_base_class();
    test_zero_denominator();
    test_irrational_is_not_rational();
    test_rational_arithmetic();
    test_wide_rationals_print_exactly();
    test_failed_registration_leaves_graph_usable();

    std::cout << "\n[SUCCESS] All error handling tests passed\n";
    return 0;
}
