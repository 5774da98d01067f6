#include <algorithm>
#include <climits>
#include <span>
#include <vector>

#include <benchmark/benchmark.h>

#include "stratalog/stratalog.hpp"

using namespace stratalog;

namespace {
ground_fact edge(int s, int d) { return {"Edge", {value::int32(s), value::int32(d)}}; }

function_table bench_functions() {
    function_table fns;
    fns.add("add", [](std::span<const value> a) {
        return value::int32(a[0].as_int32() + a[1].as_int32());
    });
    fns.add_predicate("dist_leq", [](std::span<const value> a) {
        return a[0].as_int32() >= a[1].as_int32();
    });
    fns.add("dist_lub", [](std::span<const value> a) {
        return value::int32(std::min(a[0].as_int32(), a[1].as_int32()));
    });
    fns.add("dist_glb", [](std::span<const value> a) {
        return value::int32(std::max(a[0].as_int32(), a[1].as_int32()));
    });
    fns.freeze();
    return fns;
}

program closure_program() {
    program p;
    p.add_relation("Edge", 2);
    p.add_relation("Path", 2);
    p.add_constraint({"path-edge", atom_head{"Path", {var("x"), var("y")}},
                      {positive_atom{"Edge", {var("x"), var("y")}}}});
    p.add_constraint({"path-step", atom_head{"Path", {var("x"), var("z")}},
                      {positive_atom{"Path", {var("x"), var("y")}},
                       positive_atom{"Edge", {var("y"), var("z")}}}});
    return p;
}
}

static void BM_TransitiveClosureChain(benchmark::State& st) {
    auto fns = bench_functions();
    auto p = closure_program();
    solver s(p, fns);
    std::vector<ground_fact> facts;
    for (int i = 0; i < st.range(0); ++i)
        facts.push_back(edge(i, i + 1));
    for (auto _ : st)
        benchmark::DoNotOptimize(s.solve(facts));
    st.SetItemsProcessed(st.range(0) * st.iterations());
}
BENCHMARK(BM_TransitiveClosureChain)->RangeMultiplier(2)->Range(16, 256);

static void BM_ShortestPathGrid(benchmark::State& st) {
    auto fns = bench_functions();
    program p;
    p.add_relation("Edge", 3);
    p.add_lattice("Dist", 2, {value::int32(INT_MAX), "dist_leq", "dist_lub", "dist_glb"});
    p.add_constraint({"relax", atom_head{"Dist", {var("y"), call("add", {var("d"), var("w")})}},
                      {positive_atom{"Dist", {var("x"), var("d")}},
                       positive_atom{"Edge", {var("x"), var("y"), var("w")}}}});
    solver s(p, fns);

    int n = static_cast<int>(st.range(0));
    std::vector<ground_fact> facts = {{"Dist", {value::int32(0), value::int32(0)}}};
    for (int r = 0; r < n; ++r)
        for (int c = 0; c < n; ++c) {
            int id = r * n + c;
            if (c + 1 < n)
                facts.push_back({"Edge", {value::int32(id), value::int32(id + 1),
                                          value::int32(1 + (id % 3))}});
            if (r + 1 < n)
                facts.push_back({"Edge", {value::int32(id), value::int32(id + n),
                                          value::int32(1 + (id % 5))}});
        }
    for (auto _ : st)
        benchmark::DoNotOptimize(s.solve(facts));
    st.SetItemsProcessed(n * n * st.iterations());
}
BENCHMARK(BM_ShortestPathGrid)->RangeMultiplier(2)->Range(4, 32);

static void BM_MinimizeCycle(benchmark::State& st) {
    auto fns = bench_functions();
    auto p = closure_program();
    p.add_constraint({"acyclic", false_head{},
                      {positive_atom{"Path", {var("x"), var("x")}}}});
    solver s(p, fns);

    int n = static_cast<int>(st.range(0));
    std::vector<ground_fact> facts;
    for (int i = 0; i < n; ++i)
        facts.push_back(edge(i, i + 1));
    facts.push_back(edge(n / 2 + 1, n / 2));
    delta_minimizer dm(s);
    for (auto _ : st)
        benchmark::DoNotOptimize(dm.minimize(facts));
    st.SetItemsProcessed(n * st.iterations());
}
BENCHMARK(BM_MinimizeCycle)->RangeMultiplier(2)->Range(8, 64);

BENCHMARK_MAIN();
