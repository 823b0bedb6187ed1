#include "unitgraph/graph.h"
#include "unitgraph/logging.h"
#include <cassert>
#include <cmath>
#include <iostream>

namespace {

unitgraph::BasisPtr standard() {
    return unitgraph::Basis::standard();
}

unitgraph::Dimension along(const std::string& component) {
    return unitgraph::Dimension::base(standard(), component);
}

struct Fixture {
    unitgraph::UnitSystem si;
    unitgraph::Unit metre;
    unitgraph::Unit second;
    unitgraph::Unit kilometre;
    unitgraph::Unit mile;
    unitgraph::Unit furlong;
    unitgraph::Unit kelvin;
    unitgraph::Unit celsius;
    unitgraph::Unit fahrenheit;
    unitgraph::Unit rankine;
};

unitgraph::UnitSystem make_si() {
    std::map<std::string, unitgraph::Unit> bases;
    bases.emplace("mass", unitgraph::Unit("kilogram", along("mass")));
    bases.emplace("length", unitgraph::Unit("metre", along("length"), {"m"}));
    bases.emplace("time", unitgraph::Unit("second", along("time"), {"s"}));
    bases.emplace("temperature", unitgraph::Unit("kelvin", along("temperature"), {"K"}));
    return unitgraph::UnitSystem("si", standard(), bases);
}

Fixture make_fixture() {
    auto si = make_si();
    // Registered with scale 1 so only graph edges relate them.
    const auto km = si.add_unit(unitgraph::Unit("kilometre", along("length"), {"km"}));
    const auto mi = si.add_unit(unitgraph::Unit("mile", along("length"), {"mi"}));
    const auto fur = si.add_unit(unitgraph::Unit("furlong", along("length")));
    const auto c = si.add_unit(unitgraph::Unit("celsius", along("temperature"), {"degC"}));
    const auto f = si.add_unit(unitgraph::Unit("fahrenheit", along("temperature"), {"degF"}));
    const auto r = si.add_unit(unitgraph::Unit("rankine", along("temperature"), {"degR"}));
    return Fixture{si, si.lookup("metre"), si.lookup("second"), km, mi, fur, si.lookup("kelvin"), c, f, r};
}

template <typename Error, typename Fn>
bool throws(Fn fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

}

void test_direct_edge_both_directions() {
    auto fx = make_fixture();
    unitgraph::ConversionGraph g;
    g.add_edge(fx.kilometre, fx.metre, unitgraph::Map::linear(unitgraph::rational(1000)));

    assert(g.unit_count() == 2);
    assert(g.edge_count() == 2);
    assert(g.has_edge(fx.kilometre, fx.metre));
    assert(g.has_edge(fx.metre, fx.kilometre));
    assert(g.convert(fx.kilometre, fx.metre).apply(2.5) == 2500.0);
    assert(g.convert(fx.metre, fx.kilometre) == unitgraph::Map::linear(unitgraph::rational(1, 1000)));
    std::cout << "[PASS] test_direct_edge_both_directions\n";
}

void test_convert_self_is_identity() {
    auto fx = make_fixture();
    unitgraph::ConversionGraph g;
    g.add_edge(fx.kilometre, fx.metre, unitgraph::Map::linear(unitgraph::rational(1000)));
    assert(g.convert(fx.metre, fx.metre).is_identity());
    assert(g.convert(fx.kilometre, fx.kilometre).is_identity());
    assert(g.conversion_path(fx.metre, fx.metre).size() == 1);
    std::cout << "[PASS] test_convert_self_is_identity\n";
}

void test_multi_hop_composition() {
    auto fx = make_fixture();
    unitgraph::ConversionGraph g;
    g.add_edge(fx.kilometre, fx.metre, unitgraph::Map::linear(unitgraph::rational(1000)));
    g.add_edge(fx.mile, fx.metre, unitgraph::Map::linear(unitgraph::rational(201168, 125)));
    g.add_edge(fx.furlong, fx.mile, unitgraph::Map::linear(unitgraph::rational(1, 8)));

    auto m = g.convert(fx.furlong, fx.kilometre);
    assert(m == unitgraph::Map::linear(unitgraph::rational(25146, 125000)));
    auto path = g.conversion_path(fx.furlong, fx.kilometre);
    assert(path.size() == 4);
    assert(path[1].same_identity(fx.mile));
    assert(path[2].same_identity(fx.metre));

    // a -> b followed by b -> a is the identity for every connected pair
    const std::vector<unitgraph::Unit> units{fx.metre, fx.kilometre, fx.mile, fx.furlong};
    for (const auto& a : units) {
        for (const auto& b : units) {
            assert((g.convert(b, a) * g.convert(a, b)).is_identity());
        }
    }
    std::cout << "[PASS] test_multi_hop_composition\n";
}

void test_affine_temperature_chain() {
    auto fx = make_fixture();
    unitgraph::ConversionGraph g;
    g.add_edge(fx.celsius, fx.kelvin, unitgraph::Map::affine(unitgraph::rational(1), unitgraph::rational(5463, 20)));
    g.add_edge(fx.fahrenheit, fx.celsius,
               unitgraph::Map::affine(unitgraph::rational(5, 9), unitgraph::rational(-160, 9)));
    g.add_edge(fx.rankine, fx.fahrenheit,
               unitgraph::Map::affine(unitgraph::rational(1), unitgraph::rational(-45967, 100)));

    auto f_to_k = g.convert(fx.fahrenheit, fx.kelvin);
    assert(f_to_k == unitgraph::Map::affine(unitgraph::rational(5, 9), unitgraph::rational(45967, 180)));
    assert(std::abs(f_to_k.apply(212.0) - 373.15) < 1e-9);

    // offsets cancel across three affine hops
    auto r_to_k = g.convert(fx.rankine, fx.kelvin);
    assert(r_to_k.is_linear());
    assert(r_to_k == unitgraph::Map::linear(unitgraph::rational(5, 9)));
    assert(g.conversion_path(fx.rankine, fx.kelvin).size() == 4);

    auto k_to_f = g.convert(fx.kelvin, fx.fahrenheit);
    assert(std::abs(k_to_f.apply(273.15) - 32.0) < 1e-9);
    std::cout << "[PASS] test_affine_temperature_chain\n";
}

void test_tie_break_by_insertion_order() {
    auto fx = make_fixture();
    auto via_mile = unitgraph::Map::linear(unitgraph::rational(2));

    unitgraph::ConversionGraph first;
    first.add_edge(fx.kilometre, fx.mile, via_mile);
    first.add_edge(fx.kilometre, fx.furlong, unitgraph::Map::linear(unitgraph::rational(3)));
    first.add_edge(fx.mile, fx.metre, unitgraph::Map::linear(unitgraph::rational(5)));
    first.add_edge(fx.furlong, fx.metre, unitgraph::Map::linear(unitgraph::rational(10, 3)));
    auto path = first.conversion_path(fx.kilometre, fx.metre);
    assert(path.size() == 3);
    assert(path[1].same_identity(fx.mile));

    unitgraph::ConversionGraph second;
    second.add_edge(fx.kilometre, fx.furlong, unitgraph::Map::linear(unitgraph::rational(3)));
    second.add_edge(fx.kilometre, fx.mile, via_mile);
    second.add_edge(fx.mile, fx.metre, unitgraph::Map::linear(unitgraph::rational(5)));
    second.add_edge(fx.furlong, fx.metre, unitgraph::Map::linear(unitgraph::rational(10, 3)));
    path = second.conversion_path(fx.kilometre, fx.metre);
    assert(path[1].same_identity(fx.furlong));

    // repeated queries are stable
    for (int i = 0; i < 5; ++i) {
        assert(first.conversion_path(fx.kilometre, fx.metre)[1].same_identity(fx.mile));
    }
    assert(first.convert(fx.kilometre, fx.metre) == second.convert(fx.kilometre, fx.metre));
    std::cout << "[PASS] test_tie_break_by_insertion_order\n";
}

void test_shortest_path_wins() {
    auto fx = make_fixture();
    unitgraph::ConversionGraph g;
    g.add_edge(fx.kilometre, fx.mile, unitgraph::Map::linear(unitgraph::rational(2)));
    g.add_edge(fx.mile, fx.furlong, unitgraph::Map::linear(unitgraph::rational(8)));
    g.add_edge(fx.furlong, fx.metre, unitgraph::Map::linear(unitgraph::rational(1, 16)));
    g.add_edge(fx.kilometre, fx.metre, unitgraph::Map::linear(unitgraph::rational(1)));
    assert(g.conversion_path(fx.kilometre, fx.metre).size() == 2);
    std::cout << "[PASS] test_shortest_path_wins\n";
}

void test_incompatible_dimensions() {
    auto fx = make_fixture();
    unitgraph::ConversionGraph g;
    assert(throws<unitgraph::IncompatibleDimensions>(
        [&] { g.add_edge(fx.metre, fx.second, unitgraph::Map::linear(unitgraph::rational(3))); }));
    assert(throws<unitgraph::IncompatibleDimensions>([&] {
        g.add_edge(fx.celsius, fx.metre, unitgraph::Map::affine(unitgraph::rational(1), unitgraph::rational(1)));
    }));
    assert(g.edge_count() == 0);
    assert(g.unit_count() == 0);
    std::cout << "[PASS] test_incompatible_dimensions\n";
}

void test_non_invertible_edge() {
    auto fx = make_fixture();
    unitgraph::ConversionGraph g;
    assert(throws<unitgraph::NonInvertibleMap>(
        [&] { g.add_edge(fx.kilometre, fx.metre, unitgraph::Map::linear(unitgraph::rational(0))); }));
    assert(g.edge_count() == 0);
    std::cout << "[PASS] test_non_invertible_edge\n";
}

void test_duplicate_edge_policy() {
    auto fx = make_fixture();
    unitgraph::ConversionGraph g;
    g.add_edge(fx.kilometre, fx.metre, unitgraph::Map::linear(unitgraph::rational(1000)));

    g.add_edge(fx.kilometre, fx.metre, unitgraph::Map::linear(unitgraph::rational(1000)));
    g.add_edge(fx.metre, fx.kilometre, unitgraph::Map::linear(unitgraph::rational(1, 1000)));
    assert(g.edge_count() == 2);

    assert(throws<unitgraph::DuplicateEdge>(
        [&] { g.add_edge(fx.kilometre, fx.metre, unitgraph::Map::linear(unitgraph::rational(999))); }));
    assert(throws<unitgraph::DuplicateEdge>(
        [&] { g.add_edge(fx.metre, fx.kilometre, unitgraph::Map::linear(unitgraph::rational(1, 999))); }));
    assert(g.convert(fx.kilometre, fx.metre) == unitgraph::Map::linear(unitgraph::rational(1000)));
    std::cout << "[PASS] test_duplicate_edge_policy\n";
}

void test_dimension_mismatch_on_convert() {
    auto fx = make_fixture();
    unitgraph::ConversionGraph g;
    g.add_edge(fx.kilometre, fx.metre, unitgraph::Map::linear(unitgraph::rational(1000)));
    assert(throws<unitgraph::DimensionMismatch>([&] { g.convert(fx.metre, fx.second); }));
    std::cout << "[PASS] test_dimension_mismatch_on_convert\n";
}

void test_no_conversion_path() {
    auto fx = make_fixture();
    unitgraph::ConversionGraph g;
    g.add_edge(fx.kilometre, fx.metre, unitgraph::Map::linear(unitgraph::rational(1000)));
    g.add_edge(fx.mile, fx.furlong, unitgraph::Map::linear(unitgraph::rational(8)));

    assert(throws<unitgraph::NoConversionPath>([&] { g.convert(fx.metre, fx.mile); }));
    assert(throws<unitgraph::NoConversionPath>([&] { g.convert(fx.kelvin, fx.celsius); }));
    assert(!g.has_unit(fx.kelvin));
    std::cout << "[PASS] test_no_conversion_path\n";
}

void test_redefined_unit_rejected() {
    auto fx = make_fixture();
    unitgraph::ConversionGraph g;
    g.add_edge(fx.kilometre, fx.metre, unitgraph::Map::linear(unitgraph::rational(1000)));

    auto si = make_si();
    const auto impostor = si.add_unit(unitgraph::Unit("kilometre", along("length"), {}, unitgraph::rational(1000)));
    assert(throws<unitgraph::NameCollision>(
        [&] { g.add_edge(impostor, fx.mile, unitgraph::Map::linear(unitgraph::rational(1))); }));
    std::cout << "[PASS] test_redefined_unit_rejected\n";
}

void test_same_name_different_definition() {
    auto fx = make_fixture();
    unitgraph::ConversionGraph g;
    g.add_edge(fx.kilometre, fx.metre, unitgraph::Map::linear(unitgraph::rational(1000)));

    unitgraph::Unit x_length("x", along("length"));
    unitgraph::Unit x_mass("x", along("mass"));
    assert(throws<unitgraph::DimensionMismatch>([&] { g.convert(x_length, x_mass); }));
    assert(throws<unitgraph::DimensionMismatch>([&] { g.conversion_path(x_length, x_mass); }));

    auto si = make_si();
    const auto impostor = si.add_unit(unitgraph::Unit("kilometre", along("length"), {}, unitgraph::rational(1000)));
    assert(!g.has_unit(impostor));
    assert(!g.has_edge(impostor, fx.metre));
    assert(throws<unitgraph::NoConversionPath>([&] { g.convert(impostor, fx.kilometre); }));
    assert(throws<unitgraph::NoConversionPath>([&] { g.conversion_path(fx.kilometre, impostor); }));
    assert(throws<unitgraph::NameCollision>(
        [&] { g.add_edge(impostor, fx.kilometre, unitgraph::Map::identity()); }));
    std::cout << "[PASS] test_same_name_different_definition\n";
}

void test_factorwise_within_registered_system() {
    auto si = make_si();
    const auto speed = along("length") - along("time");
    const auto mps = si.add_unit(unitgraph::Unit("metre_per_second", speed));
    const auto kmh = si.add_unit(unitgraph::Unit("kilometre_per_hour", speed, {"km/h"}, unitgraph::rational(5, 18)));

    unitgraph::ConversionGraph g;
    assert(throws<unitgraph::NoConversionPath>([&] { g.convert(kmh, mps); }));

    g.register_system(si);
    assert(g.has_system("si"));
    assert(g.convert(kmh, mps) == unitgraph::Map::linear(unitgraph::rational(5, 18)));
    assert(g.convert(mps, kmh) == unitgraph::Map::linear(unitgraph::rational(18, 5)));
    assert(std::abs(g.convert(kmh, mps).apply(36.0) - 10.0) < 1e-12);
    // only graph edges count as a path
    assert(throws<unitgraph::NoConversionPath>([&] { g.conversion_path(kmh, mps); }));
    std::cout << "[PASS] test_factorwise_within_registered_system (36 km/h -> 10 m/s)\n";
}

void test_factorwise_across_systems() {
    auto si = make_si();
    const auto speed = along("length") - along("time");
    const auto kmh = si.add_unit(unitgraph::Unit("kilometre_per_hour", speed, {}, unitgraph::rational(5, 18)));

    std::map<std::string, unitgraph::Unit> bases;
    bases.emplace("length", unitgraph::Unit("foot", along("length"), {"ft"}));
    bases.emplace("time", unitgraph::Unit("second", along("time")));
    unitgraph::UnitSystem imperial("imperial", standard(), bases);
    const auto mph = imperial.add_unit(unitgraph::Unit("mile_per_hour", speed, {"mph"}, unitgraph::rational(22, 15)));

    unitgraph::ConversionGraph g;
    g.add_edge(si.lookup("metre"), imperial.lookup("foot"), unitgraph::Map::linear(unitgraph::rational(1250, 381)));
    g.add_edge(si.lookup("second"), imperial.lookup("second"), unitgraph::Map::identity());
    g.register_system(si);
    g.register_system(imperial);

    // (5/18) * (1250/381) / (22/15)
    assert(g.convert(kmh, mph) == unitgraph::Map::linear(unitgraph::rational(15625, 25146)));
    assert((g.convert(mph, kmh) * g.convert(kmh, mph)).is_identity());

    // imperial has no mass unit
    const auto gram_per_metre = si.add_unit(
        unitgraph::Unit("gram_per_metre", along("mass") - along("length"), {}, unitgraph::rational(1, 1000)));
    const auto slug_per_foot = imperial.add_unit(unitgraph::Unit("slug_per_foot", along("mass") - along("length")));
    assert(throws<unitgraph::NoConversionPath>([&] { g.convert(gram_per_metre, slug_per_foot); }));
    std::cout << "[PASS] test_factorwise_across_systems (km/h -> mph)\n";
}

void test_register_system_rejects_conflicts() {
    auto si = make_si();
    unitgraph::ConversionGraph g;
    g.register_system(si);
    g.register_system(si);

    std::map<std::string, unitgraph::Unit> bases;
    bases.emplace("length", unitgraph::Unit("yard", along("length")));
    unitgraph::UnitSystem other("si", standard(), bases);
    assert(throws<unitgraph::NameCollision>([&] { g.register_system(other); }));

    g.freeze();
    assert(throws<unitgraph::GraphFrozen>([&] { g.register_system(si); }));
    std::cout << "[PASS] test_register_system_rejects_conflicts\n";
}

void test_copies_are_independent() {
    auto fx = make_fixture();
    unitgraph::ConversionGraph g;
    g.add_edge(fx.kilometre, fx.metre, unitgraph::Map::linear(unitgraph::rational(1000)));

    unitgraph::ConversionGraph copy = g;
    copy.add_edge(fx.mile, fx.metre, unitgraph::Map::linear(unitgraph::rational(201168, 125)));
    assert(copy.has_edge(fx.mile, fx.metre));
    assert(!g.has_edge(fx.mile, fx.metre));
    assert(g.edge_count() == 2);
    assert(copy.edge_count() == 4);
    std::cout << "[PASS] test_copies_are_independent\n";
}

void test_freeze() {
    auto fx = make_fixture();
    unitgraph::ConversionGraph g;
    g.add_edge(fx.kilometre, fx.metre, unitgraph::Map::linear(unitgraph::rational(1000)));
    assert(!g.frozen());
    g.freeze();
    assert(g.frozen());
    assert(throws<unitgraph::GraphFrozen>(
        [&] { g.add_edge(fx.mile, fx.metre, unitgraph::Map::linear(unitgraph::rational(1609))); }));
    assert(g.convert(fx.metre, fx.kilometre) == unitgraph::Map::linear(unitgraph::rational(1, 1000)));
    std::cout << "[PASS] test_freeze (queries still work)\n";
}

int main() {
    unitgraph::configure_logging();
    std::cout << "=== Conversion Graph Tests ===\n";

    test_direct_edge_both_directions();
    test_convert_self_is_identity();
    test_multi_hop_composition();
    test_affine_temperature_chain();
    test_tie_break_by_insertion_order();
    test_shortest_path_wins();
    test_incompatible_dimensions();
    test_non_invertible_edge();
    test_duplicate_edge_policy();
    test_dimension_mismatch_on_convert();
    test_no_conversion_path();
    test_redefined_unit_rejected();
    test_same_name_different_definition();
    test_factorwise_within_registered_system();
    test_factorwise_across_systems();
    test_register_system_rejects_conflicts();
    test_copies_are_independent();
    test_freeze();

    std::cout << "\n[SUCCESS] All conversion graph tests passed\n";
    return 0;
}
