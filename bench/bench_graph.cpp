#include <benchmark/benchmark.h>
#include "unitgraph/graph.h"

#include <memory>

namespace {

unitgraph::UnitSystem chain_system(int length) {
    auto basis = unitgraph::Basis::standard();
    std::map<std::string, unitgraph::Unit> bases;
    bases.emplace("length", unitgraph::Unit("u0", unitgraph::Dimension::base(basis, "length")));
    unitgraph::UnitSystem system("chain", basis, bases);
    for (int i = 1; i <= length; ++i) {
        system.add_unit(unitgraph::Unit("u" + std::to_string(i), unitgraph::Dimension::base(basis, "length")));
    }
    return system;
}

unitgraph::ConversionGraph chain_graph(const unitgraph::UnitSystem& system) {
    unitgraph::ConversionGraph graph;
    const auto& units = system.units();
    for (std::size_t i = 1; i < units.size(); ++i) {
        graph.add_edge(units[i - 1], units[i], unitgraph::Map::linear(unitgraph::rational(i % 2 ? 3 : 1, i % 2 ? 1 : 3)));
    }
    return graph;
}

}

static void BM_Convert_Chain(benchmark::State& state) {
    auto system = chain_system(static_cast<int>(state.range(0)));
    auto graph = chain_graph(system);
    const auto& first = system.units().front();
    const auto& last = system.units().back();
    for (auto _ : state) {
        unitgraph::Map result = graph.convert(first, last);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Convert_Chain)->Arg(8)->Arg(64)->Arg(256);

static void BM_Add_Edge_Chain(benchmark::State& state) {
    auto system = chain_system(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto graph = chain_graph(system);
        benchmark::DoNotOptimize(graph);
    }
}
BENCHMARK(BM_Add_Edge_Chain)->Arg(64);

static void BM_Connect_Systems(benchmark::State& state) {
    auto arcane = std::make_shared<const unitgraph::Basis>(
        "arcane", std::vector<std::string>{"essence", "tempo", "heft"});
    auto standard = unitgraph::Basis::standard();

    std::map<std::string, unitgraph::Unit> arcane_bases;
    arcane_bases.emplace("essence", unitgraph::Unit("mote", unitgraph::Dimension::base(arcane, "essence")));
    arcane_bases.emplace("tempo", unitgraph::Unit("pulse", unitgraph::Dimension::base(arcane, "tempo")));
    arcane_bases.emplace("heft", unitgraph::Unit("stone", unitgraph::Dimension::base(arcane, "heft")));
    unitgraph::UnitSystem src("arcane", arcane, arcane_bases);
    for (long k = 1; k <= state.range(0); ++k) {
        src.add_unit(unitgraph::Unit("mote_x" + std::to_string(k), unitgraph::Dimension::base(arcane, "essence"), {},
                                     unitgraph::rational(k)));
    }

    auto energy = unitgraph::Dimension::base(standard, "mass") +
                  unitgraph::power(unitgraph::Dimension::base(standard, "length"), unitgraph::rational(2)) -
                  unitgraph::power(unitgraph::Dimension::base(standard, "time"), unitgraph::rational(2));
    std::map<std::string, unitgraph::Unit> si_bases;
    si_bases.emplace("mass", unitgraph::Unit("kilogram", unitgraph::Dimension::base(standard, "mass")));
    si_bases.emplace("time", unitgraph::Unit("second", unitgraph::Dimension::base(standard, "time")));
    unitgraph::UnitSystem dst("si", standard, si_bases);
    dst.add_unit(unitgraph::Unit("joule", energy));
    dst.add_unit(unitgraph::Unit("hertz", unitgraph::power(unitgraph::Dimension::base(standard, "time"),
                                                           unitgraph::rational(-1))));

    unitgraph::RationalMatrix m{
        {unitgraph::rational(2), unitgraph::rational(0), unitgraph::rational(0)},
        {unitgraph::rational(1), unitgraph::rational(0), unitgraph::rational(1)},
        {unitgraph::rational(-2), unitgraph::rational(-1), unitgraph::rational(0)}};
    unitgraph::BasisTransform transform(arcane, standard, {"essence", "tempo", "heft"}, {"length", "mass", "time"}, m);
    std::vector<unitgraph::Calibration> calibrations{
        {src.lookup("mote"), dst.lookup("joule"), unitgraph::Map::linear(unitgraph::rational(42))},
        {src.lookup("pulse"), dst.lookup("hertz"), unitgraph::Map::linear(unitgraph::rational(3))},
        {src.lookup("stone"), dst.lookup("kilogram"), unitgraph::Map::linear(unitgraph::rational(6))},
    };

    for (auto _ : state) {
        unitgraph::ConversionGraph graph;
        graph.connect_systems(transform, src, dst, calibrations);
        benchmark::DoNotOptimize(graph);
    }
}
BENCHMARK(BM_Connect_Systems)->Arg(4)->Arg(32);

BENCHMARK_MAIN();
