#include <algorithm>
#include <climits>
#include <map>
#include <memory>
#include <span>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "stratalog/solver.hpp"

using namespace stratalog;

namespace {
fact ints(std::initializer_list<int> xs) {
    fact f;
    for (int x : xs)
        f.push_back(value::int32(x));
    return f;
}

ground_fact gf(std::string sym, std::initializer_list<int> xs) {
    return {std::move(sym), ints(xs)};
}

term num(int x) { return lit(value::int32(x)); }

constraint rule(std::string name, atom_head h, std::vector<literal> body) {
    return {std::move(name), std::move(h), std::move(body)};
}

function_table test_functions() {
    function_table fns;
    fns.add("add", [](std::span<const value> a) {
        return value::int32(a[0].as_int32() + a[1].as_int32());
    });
    fns.add_predicate("lt", [](std::span<const value> a) {
        return a[0].as_int32() < a[1].as_int32();
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
    fns.add("boom", [](std::span<const value> a) -> value {
        if (a[0].as_int32() == 2)
            throw std::domain_error("two is not allowed");
        return value::boolean(true);
    });
    fns.freeze();
    return fns;
}

program closure_program(bool reversed = false) {
    program p;
    p.add_relation("Edge", 2, 0, {"src", "dst"});
    p.add_relation("Path", 2, 0, {"src", "dst"});
    constraint base = rule("path-edge", {"Path", {var("x"), var("y")}},
                           {positive_atom{"Edge", {var("x"), var("y")}}});
    constraint step = rule("path-step", {"Path", {var("x"), var("z")}},
                           {positive_atom{"Path", {var("x"), var("y")}},
                            positive_atom{"Edge", {var("y"), var("z")}}});
    if (reversed)
        std::swap(base, step);
    p.add_constraint(base);
    p.add_constraint(step);
    return p;
}

// Reach(y) from Reach(1) along Edge; Unreached = Node \ Reach.
program reach_program(int unreached_stratum = 1) {
    program p;
    p.add_relation("Node", 1);
    p.add_relation("Edge", 2);
    p.add_relation("Reach", 1);
    p.add_relation("Unreached", 1, unreached_stratum);
    p.add_constraint(rule("reach", {"Reach", {var("y")}},
                          {positive_atom{"Reach", {var("x")}},
                           positive_atom{"Edge", {var("x"), var("y")}}}));
    p.add_constraint(rule("unreached", {"Unreached", {var("x")}},
                          {positive_atom{"Node", {var("x")}},
                           negative_atom{"Reach", {var("x")}}}));
    return p;
}

lattice_ops dist_ops() {
    return {value::int32(INT_MAX), "dist_leq", "dist_lub", "dist_glb"};
}

program shortest_path_program() {
    program p;
    p.add_relation("Node", 1);
    p.add_relation("Edge", 3, 0, {"src", "dst", "w"});
    p.add_lattice("Dist", 2, dist_ops(), 0, {"node", "d"});
    p.add_relation("Near", 1, 1);
    p.add_relation("Reached", 1, 1);
    p.add_relation("Unreached", 1, 1);
    p.add_constraint(rule("relax", {"Dist", {var("y"), call("add", {var("d"), var("w")})}},
                          {positive_atom{"Dist", {var("x"), var("d")}},
                           positive_atom{"Edge", {var("x"), var("y"), var("w")}}}));
    p.add_constraint(rule("near", {"Near", {var("x")}},
                          {positive_atom{"Dist", {var("x"), var("d")}},
                           filter_call{"lt", {var("d"), num(2)}}}));
    p.add_constraint(rule("reached", {"Reached", {var("x")}},
                          {positive_atom{"Node", {var("x")}},
                           positive_atom{"Dist", {var("x"), num(0)}}}));
    p.add_constraint(rule("unreached", {"Unreached", {var("x")}},
                          {positive_atom{"Node", {var("x")}},
                           negative_atom{"Dist", {var("x"), var("_")}}}));
    return p;
}

std::vector<ground_fact> shortest_path_facts() {
    std::vector<ground_fact> facts = {gf("Dist", {1, 0}),    gf("Edge", {1, 2, 4}),
                                      gf("Edge", {1, 3, 1}), gf("Edge", {3, 2, 1}),
                                      gf("Edge", {2, 4, 1})};
    for (int i = 1; i <= 5; ++i)
        facts.push_back(gf("Node", {i}));
    return facts;
}

std::vector<fact> unary(std::initializer_list<int> xs) {
    std::vector<fact> out;
    for (int x : xs)
        out.push_back(ints({x}));
    return out;
}
}

TEST(Solver, TransitiveClosureWithCycle) {
    auto fns = test_functions();
    auto p = closure_program();
    solver s(p, fns);

    solve_stats stats;
    model m = s.solve({gf("Edge", {1, 2}), gf("Edge", {2, 3}), gf("Edge", {3, 4}),
                       gf("Edge", {4, 2})},
                      &stats);

    std::vector<fact> expected = {ints({1, 2}), ints({1, 3}), ints({1, 4}),
                                  ints({2, 2}), ints({2, 3}), ints({2, 4}),
                                  ints({3, 2}), ints({3, 3}), ints({3, 4}),
                                  ints({4, 2}), ints({4, 3}), ints({4, 4})};
    EXPECT_EQ(m.relation("Path"), expected);
    EXPECT_EQ(stats.inserted, expected.size());
    ASSERT_EQ(stats.rounds.size(), 1u);
    EXPECT_GE(stats.rounds[0], 3u);
}

TEST(Solver, EmptyInputGivesEmptyModel) {
    auto fns = test_functions();
    auto p = closure_program();
    solver s(p, fns);
    model m = s.solve({});
    EXPECT_TRUE(m.relation("Path").empty());
    EXPECT_EQ(m.size(), 0u);
}

TEST(Solver, NegationSeesFinalizedExtent) {
    auto fns = test_functions();
    auto p = reach_program();
    solver s(p, fns);

    std::vector<ground_fact> facts = {gf("Reach", {1}), gf("Edge", {1, 2}),
                                      gf("Edge", {3, 4})};
    for (int i = 1; i <= 4; ++i)
        facts.push_back(gf("Node", {i}));
    EXPECT_EQ(s.solve(facts).relation("Unreached"), unary({3, 4}));

    facts.push_back(gf("Edge", {2, 3}));
    EXPECT_TRUE(s.solve(facts).relation("Unreached").empty());
}

TEST(Solver, NegationWithinStratumIsRejected) {
    auto fns = test_functions();
    auto p = reach_program(0);
    EXPECT_THROW((solver{p, fns}), stratification_invariant_violation);
}

TEST(Solver, PositiveReadOfLaterStratumIsRejected) {
    auto fns = test_functions();
    program p;
    p.add_relation("A", 1, 1);
    p.add_relation("B", 1, 0);
    p.add_constraint(rule("b", {"B", {var("x")}}, {positive_atom{"A", {var("x")}}}));
    try {
        solver s(p, fns);
        FAIL() << "expected a stratification error";
    } catch (const stratification_invariant_violation &e) {
        EXPECT_EQ(e.constraint(), "b");
        EXPECT_EQ(e.symbol(), "A");
    }
}

TEST(Solver, ShortestPathLattice) {
    auto fns = test_functions();
    auto p = shortest_path_program();
    solver s(p, fns);
    model m = s.solve(shortest_path_facts());

    std::vector<model::entry> expected = {{ints({1}), value::int32(0)},
                                          {ints({2}), value::int32(2)},
                                          {ints({3}), value::int32(1)},
                                          {ints({4}), value::int32(3)}};
    EXPECT_EQ(m.lattice("Dist"), expected);
    EXPECT_EQ(m.relation("Near"), unary({1, 3}));
    EXPECT_EQ(m.relation("Reached"), unary({1, 2, 3, 4}));
    EXPECT_EQ(m.relation("Unreached"), unary({5}));
}

TEST(Solver, LatticeInputsAreMerged) {
    auto fns = test_functions();
    auto p = shortest_path_program();
    solver s(p, fns);
    model m = s.solve({gf("Dist", {7, 5}), gf("Dist", {7, 3}), gf("Dist", {7, 10})});
    ASSERT_EQ(m.lattice("Dist").size(), 1u);
    EXPECT_EQ(m.lattice("Dist")[0].second, value::int32(3));
}

TEST(Solver, LoopBindsEachElement) {
    auto fns = test_functions();
    program p;
    p.add_relation("Bag", 1);
    p.add_relation("Node", 1);
    p.add_relation("Member", 1);
    p.add_relation("Both", 1);
    p.add_constraint(rule("member", {"Member", {var("x")}},
                          {positive_atom{"Bag", {var("s")}}, loop_literal{"x", var("s")}}));
    p.add_constraint(rule("both", {"Both", {var("x")}},
                          {positive_atom{"Node", {var("x")}},
                           positive_atom{"Bag", {var("s")}}, loop_literal{"x", var("s")}}));
    solver s(p, fns);

    model m = s.solve(
        {{"Bag", {value::set({value::int32(1), value::int32(2)})}},
         {"Bag", {value::list({value::int32(2), value::int32(3), value::int32(3)})}},
         gf("Node", {3}), gf("Node", {5})});
    EXPECT_EQ(m.relation("Member"), unary({1, 2, 3}));
    EXPECT_EQ(m.relation("Both"), unary({3}));
}

TEST(Solver, LoopOverScalarIsRejected) {
    auto fns = test_functions();
    program p;
    p.add_relation("Bag", 1);
    p.add_relation("Member", 1);
    p.add_constraint(rule("member", {"Member", {var("x")}},
                          {positive_atom{"Bag", {var("s")}}, loop_literal{"x", var("s")}}));
    solver s(p, fns);
    EXPECT_THROW(s.solve({gf("Bag", {1})}), std::invalid_argument);
    EXPECT_THROW(s.solve({{"Bag", {value::tuple({value::int32(1), value::int32(2)})}}}),
                 std::invalid_argument);
}

TEST(Solver, GuardRequiresDistinctValues) {
    auto fns = test_functions();
    program p;
    p.add_relation("Node", 1);
    p.add_relation("Pair", 2);
    p.add_constraint(rule("pair", {"Pair", {var("x"), var("y")}},
                          {positive_atom{"Node", {var("x")}},
                           positive_atom{"Node", {var("y")}},
                           inequality{var("x"), var("y")}}));
    solver s(p, fns);
    model m = s.solve({gf("Node", {1}), gf("Node", {2})});
    EXPECT_EQ(m.relation("Pair"), (std::vector<fact>{ints({1, 2}), ints({2, 1})}));
}

TEST(Solver, ConstantsAndApplicationsInAtoms) {
    auto fns = test_functions();
    program p;
    p.add_relation("Node", 1);
    p.add_relation("Edge", 2);
    p.add_relation("Succ", 1);
    p.add_relation("FromOne", 1);
    p.add_relation("SelfLoop", 1);
    p.add_constraint(rule("succ", {"Succ", {var("x")}},
                          {positive_atom{"Node", {var("x")}},
                           positive_atom{"Edge", {var("x"), call("add", {var("x"), num(1)})}}}));
    p.add_constraint(rule("from-one", {"FromOne", {var("y")}},
                          {positive_atom{"Edge", {num(1), var("y")}}}));
    p.add_constraint(rule("self-loop", {"SelfLoop", {var("x")}},
                          {positive_atom{"Edge", {var("x"), var("x")}}}));
    solver s(p, fns);

    model m = s.solve({gf("Node", {1}), gf("Node", {2}), gf("Node", {3}),
                       gf("Edge", {1, 2}), gf("Edge", {2, 4}), gf("Edge", {3, 4}),
                       gf("Edge", {1, 5}), gf("Edge", {4, 4})});
    EXPECT_EQ(m.relation("Succ"), unary({1, 3}));
    EXPECT_EQ(m.relation("FromOne"), unary({2, 5}));
    EXPECT_EQ(m.relation("SelfLoop"), unary({4}));
}

TEST(Solver, FalseHeadAbortsWithBindings) {
    auto fns = test_functions();
    auto p = closure_program();
    p.add_constraint({"no-self-loop", false_head{},
                      {positive_atom{"Path", {var("x"), var("x")}}}});
    solver s(p, fns);

    EXPECT_NO_THROW(s.solve({gf("Edge", {1, 2})}));
    try {
        s.solve({gf("Edge", {1, 2}), gf("Edge", {2, 1})});
        FAIL() << "expected an unsatisfiable constraint";
    } catch (const unsatisfiable_constraint &e) {
        EXPECT_EQ(e.constraint(), "no-self-loop");
        ASSERT_EQ(e.env().size(), 1u);
        EXPECT_EQ(e.env()[0].variable, "x");
        EXPECT_EQ(e.env()[0].val, value::int32(1));
        EXPECT_EQ(kind_of(e), failure_kind::unsatisfiable_constraint);
    }
}

TEST(Solver, TrueHeadIsANoOp) {
    auto fns = test_functions();
    auto p = closure_program();
    p.add_constraint({"ordered", true_head{},
                      {positive_atom{"Edge", {var("x"), var("y")}},
                       filter_call{"lt", {var("x"), var("y")}}}});
    solver s(p, fns);
    EXPECT_EQ(s.solve({gf("Edge", {1, 2})}).relation("Path").size(), 1u);
}

TEST(Solver, ChecksRunAfterTheirStratum) {
    auto fns = test_functions();
    auto p = reach_program();
    p.add_constraint({"all-reached", false_head{},
                      {positive_atom{"Unreached", {var("x")}}}});
    solver s(p, fns);
    ASSERT_EQ(s.plan().strata.size(), 2u);
    EXPECT_EQ(s.plan().strata[1].checks.size(), 1u);

    std::vector<ground_fact> facts = {gf("Reach", {1}), gf("Node", {1}),
                                      gf("Node", {2}), gf("Edge", {1, 2})};
    EXPECT_NO_THROW(s.solve(facts));
    facts.push_back(gf("Node", {3}));
    EXPECT_THROW(s.solve(facts), unsatisfiable_constraint);
}

TEST(Solver, FilterExceptionIsNested) {
    auto fns = test_functions();
    program p;
    p.add_relation("Node", 1);
    p.add_relation("Ok", 1);
    p.add_constraint(rule("ok", {"Ok", {var("x")}},
                          {positive_atom{"Node", {var("x")}},
                           filter_call{"boom", {var("x")}}}));
    solver s(p, fns);
    EXPECT_EQ(s.solve({gf("Node", {1})}).relation("Ok"), unary({1}));

    bool nested = false;
    try {
        s.solve({gf("Node", {1}), gf("Node", {2})});
    } catch (const scalar_function_failure &e) {
        EXPECT_EQ(e.function(), "boom");
        EXPECT_EQ(e.constraint(), "ok");
        EXPECT_EQ(kind_of(e), failure_kind::scalar_function_failure);
        try {
            std::rethrow_if_nested(e);
        } catch (const std::domain_error &inner) {
            nested = std::string(inner.what()) == "two is not allowed";
        }
    }
    EXPECT_TRUE(nested);
}

TEST(Solver, NonBooleanFilterFails) {
    auto fns = test_functions();
    program p;
    p.add_relation("Node", 1);
    p.add_relation("Ok", 1);
    p.add_constraint(rule("ok", {"Ok", {var("x")}},
                          {positive_atom{"Node", {var("x")}},
                           filter_call{"add", {var("x"), num(1)}}}));
    solver s(p, fns);
    EXPECT_THROW(s.solve({gf("Node", {1})}), scalar_function_failure);
}

TEST(Solver, RequiresFrozenTableAndKnownFunctions) {
    auto p = closure_program();
    function_table open;
    EXPECT_THROW((solver{p, open}), configuration_error);

    auto fns = test_functions();
    p.add_constraint({"odd", true_head{},
                      {positive_atom{"Edge", {var("x"), var("y")}},
                       filter_call{"missing", {var("x")}}}});
    EXPECT_THROW((solver{p, fns}), configuration_error);
}

TEST(Solver, MalformedConstraintsAreRejected) {
    auto fns = test_functions();
    auto unbound = closure_program();
    unbound.add_constraint(rule("unbound", {"Path", {var("x"), var("q")}},
                                {positive_atom{"Edge", {var("x"), var("y")}}}));
    EXPECT_THROW((solver{unbound, fns}), std::invalid_argument);

    auto arity = closure_program();
    arity.add_constraint(rule("arity", {"Path", {var("x")}},
                              {positive_atom{"Edge", {var("x"), var("y")}}}));
    EXPECT_THROW((solver{arity, fns}), std::invalid_argument);

    auto unknown = closure_program();
    unknown.add_constraint(rule("unknown", {"Path", {var("x"), var("y")}},
                                {positive_atom{"Nope", {var("x"), var("y")}}}));
    EXPECT_THROW((solver{unknown, fns}), std::invalid_argument);
}

TEST(Solver, MalformedInputFactsAreRejected) {
    auto fns = test_functions();
    auto p = closure_program();
    solver s(p, fns);
    EXPECT_THROW(s.solve({gf("Nope", {1, 2})}), std::invalid_argument);
    EXPECT_THROW(s.solve({gf("Edge", {1})}), std::invalid_argument);
}

TEST(Solver, FixpointIsIdempotent) {
    auto fns = test_functions();
    auto p = shortest_path_program();
    solver s(p, fns);
    model m = s.solve(shortest_path_facts());
    model again = s.solve(m.facts());
    EXPECT_TRUE(m == again);

    auto q = closure_program();
    solver c(q, fns);
    model cm = c.solve({gf("Edge", {1, 2}), gf("Edge", {2, 3})});
    EXPECT_TRUE(cm == c.solve(cm.facts()));
}

TEST(Solver, NonLinearClosureOnChain) {
    auto fns = test_functions();
    program p;
    p.add_relation("Edge", 2);
    p.add_relation("Path", 2);
    p.add_constraint(rule("path-edge", {"Path", {var("x"), var("y")}},
                          {positive_atom{"Edge", {var("x"), var("y")}}}));
    p.add_constraint(rule("path-join", {"Path", {var("x"), var("z")}},
                          {positive_atom{"Path", {var("x"), var("y")}},
                           positive_atom{"Path", {var("y"), var("z")}}}));
    solver s(p, fns);

    std::vector<ground_fact> facts;
    for (int i = 0; i < 9; ++i)
        facts.push_back(gf("Edge", {i, i + 1}));
    solve_stats stats;
    model m = s.solve(facts, &stats);

    const auto &paths = m.relation("Path");
    EXPECT_EQ(paths.size(), 45u);
    EXPECT_EQ(stats.inserted, 45u);
    for (int x = 0; x < 10; ++x)
        for (int y = 0; y < 10; ++y)
            EXPECT_EQ(std::binary_search(paths.begin(), paths.end(), ints({x, y}), fact_less),
                      x < y);
}

TEST(Solver, ExtentsOnlyGrowBetweenRounds) {
    options opts;
    opts.allow_impure = true;
    function_table fns(opts);
    auto seen = std::make_shared<std::map<int, std::vector<int>>>();
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
    fns.add_predicate(
        "record",
        [seen](std::span<const value> a) {
            (*seen)[a[0].as_int32()].push_back(a[1].as_int32());
            return true;
        },
        purity::impure);
    fns.freeze();

    program p;
    p.add_relation("Edge", 3);
    p.add_relation("Path", 2);
    p.add_lattice("Dist", 2, dist_ops());
    p.add_relation("Seen", 2);
    p.add_constraint(rule("path-edge", {"Path", {var("x"), var("y")}},
                          {positive_atom{"Edge", {var("x"), var("y"), var("_")}}}));
    p.add_constraint(rule("path-step", {"Path", {var("x"), var("z")}},
                          {positive_atom{"Path", {var("x"), var("y")}},
                           positive_atom{"Edge", {var("y"), var("z"), var("_")}}}));
    p.add_constraint(rule("relax", {"Dist", {var("y"), call("add", {var("d"), var("w")})}},
                          {positive_atom{"Dist", {var("x"), var("d")}},
                           positive_atom{"Edge", {var("x"), var("y"), var("w")}}}));
    p.add_constraint(rule("seen", {"Seen", {var("x"), var("d")}},
                          {positive_atom{"Dist", {var("x"), var("d")}},
                           filter_call{"record", {var("x"), var("d")}}}));
    solver s(p, fns, opts);

    solve_stats stats;
    model m = s.solve({gf("Dist", {1, 0}), gf("Edge", {1, 2, 4}), gf("Edge", {1, 3, 1}),
                       gf("Edge", {3, 2, 1}), gf("Edge", {2, 4, 1})},
                      &stats);

    ASSERT_GE(stats.extents.size(), 3u);
    for (size_t r = 1; r < stats.extents.size(); ++r)
        for (size_t sym = 0; sym < stats.extents[r].size(); ++sym)
            EXPECT_LE(stats.extents[r - 1][sym], stats.extents[r][sym]);

    // Every observed value of a key is leq-below the next one.
    ASSERT_EQ(seen->size(), 4u);
    for (const auto &[node, ds] : *seen)
        for (size_t i = 1; i < ds.size(); ++i)
            EXPECT_GE(ds[i - 1], ds[i]) << "node " << node;
    EXPECT_EQ((*seen)[2].front(), 4);
    EXPECT_EQ((*seen)[2].back(), 2);
    EXPECT_EQ((*seen)[4].back(), 3);
    EXPECT_EQ(m.relation("Path").size(), 6u);
}

TEST(Solver, ConstraintOrderDoesNotMatter) {
    auto fns = test_functions();
    auto forward = closure_program(false);
    auto backward = closure_program(true);
    solver a(forward, fns);
    solver b(backward, fns);
    std::vector<ground_fact> facts = {gf("Edge", {3, 1}), gf("Edge", {1, 2}),
                                      gf("Edge", {2, 3}), gf("Edge", {5, 6})};
    EXPECT_TRUE(a.solve(facts) == b.solve(facts));

    std::reverse(facts.begin(), facts.end());
    EXPECT_TRUE(a.solve(facts) == b.solve(facts));
}

TEST(Solver, HeadlessChecksWithoutSymbols) {
    auto fns = test_functions();
    program p;
    p.add_constraint({"always", false_head{}, {}});
    solver s(p, fns);
    EXPECT_TRUE(s.plan().strata.empty());
    EXPECT_EQ(s.plan().final_checks.size(), 1u);
    EXPECT_THROW(s.solve({}), unsatisfiable_constraint);
}
