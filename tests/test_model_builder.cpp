/*
===============================================================================
TEST MODEL BUILDER — Tests for model_builder.h
===============================================================================

OVERVIEW
--------
Validates the ModelBuilder template: hook order, one-shot build, rollback
when a hook throws, sealing, solving through the Solver interface and the
solution accessors.

TEST ORGANIZATION
-----------------
• Section A: Orchestration and lifecycle
• Section B: Failure during build
• Section C: Solving and solution accessors
• Section D: DataStore integration

TEST STRATEGY
-------------
• A small knapsack-style builder records the hooks it sees
• Solutions come from CannedSolver, so no backend is needed

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• model_builder.h - System under test
• test_support.h - CannedSolver

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <blend_planner/indexing.h>
#include <blend_planner/model_builder.h>

#include "test_support.h"

#include <stdexcept>
#include <string>
#include <vector>

using namespace blend;
using blend::testing::CannedSolver;

// ============================================================================
// TEST UTILITIES AND FIXTURES
// ============================================================================

DECLARE_ENUM_WITH_COUNT(TestVars, X);
DECLARE_ENUM_WITH_COUNT(TestCons, Cap);

/**
 * @class TrackingBuilder
 * @brief Three binaries, one capacity row, maximize; records hook order
 */
class TrackingBuilder : public ModelBuilder<TestVars, TestCons>
{
public:
    std::vector<std::string> calls;
    bool failInConstraints = false;
    int n = 3;

protected:
    void validate() override
    {
        calls.push_back("validate");
        store_["n"] = n;
    }

    void addVariables() override
    {
        calls.push_back("addVariables");
        vars_.set(TestVars::X, VariableFactory::addIndexed(
            model(), VarDomain::Binary, 0.0, 1.0, "X", range(0, n)));
    }

    void addConstraints() override
    {
        calls.push_back("addConstraints");
        if (failInConstraints)
            throw std::runtime_error("constraint generation failed");

        const auto& X = vars_.get(TestVars::X);
        cons_.set(TestCons::Cap, ConstraintFactory::addScalar(model(), "Cap",
            sum(range(0, n), [&](int i) { return (i + 1.0) * LinExpr(X(i)); }) <= 4.0));
    }

    void addObjective() override
    {
        calls.push_back("addObjective");
        const auto& X = vars_.get(TestVars::X);
        maximize(sum(range(0, n), [&](int i) { return LinExpr(X(i)); }));
    }

    void beforeSolve() override { calls.push_back("beforeSolve"); }
    void afterSolve() override { calls.push_back("afterSolve"); }
};

inline Solution optimalOf(std::vector<double> values, double objective)
{
    Solution s;
    s.status = SolveStatus::Optimal;
    s.values = std::move(values);
    s.objective = objective;
    s.runtimeSeconds = 0.25;
    return s;
}

// ============================================================================
// SECTION A: ORCHESTRATION AND LIFECYCLE
// ============================================================================

/**
 * @test Orchestration::HookOrder
 * @brief build() runs validate, variables, constraints, objective once
 *
 * @scenario build() called twice
 * @given A fresh TrackingBuilder
 * @when Calling build() twice
 * @then Hooks ran once in order and the model is sealed
 *
 * @covers ModelBuilder::build()
 */
TEST_CASE("A1: Orchestration::HookOrder", "[ModelBuilder][lifecycle]")
{
    TrackingBuilder b;
    REQUIRE_FALSE(b.built());
    REQUIRE_THROWS_AS(b.builtModel(), std::logic_error);

    const LinearModel& m = b.build();
    b.build();

    REQUIRE(b.calls == std::vector<std::string>{
        "validate", "addVariables", "addConstraints", "addObjective" });
    REQUIRE(b.built());
    REQUIRE(m.sealed());
    REQUIRE(m.numVars() == 3);
    REQUIRE(m.numConstrs() == 1);
    REQUIRE(m.objective().sense == ObjectiveSense::Maximize);
    REQUIRE(&b.builtModel() == &m);
}

/**
 * @test Orchestration::TablesPopulated
 * @covers ModelBuilder::variables()
 * @covers ModelBuilder::constraints()
 */
TEST_CASE("A2: Orchestration::TablesPopulated", "[ModelBuilder][tables]")
{
    TrackingBuilder b;
    b.n = 5;
    b.build();
    REQUIRE(b.variables().get(TestVars::X).size() == 5);
    REQUIRE(b.constraints().has(TestCons::Cap));
    REQUIRE(b.constraints().totalRows() == 1);
}

// ============================================================================
// SECTION B: FAILURE DURING BUILD
// ============================================================================

/**
 * @test Failure::PartialModelDiscarded
 * @brief A throwing hook leaves the builder unbuilt with empty tables
 */
TEST_CASE("B1: Failure::PartialModelDiscarded", "[ModelBuilder][errors]")
{
    TrackingBuilder b;
    b.failInConstraints = true;

    REQUIRE_THROWS_AS(b.build(), std::runtime_error);
    REQUIRE_FALSE(b.built());
    REQUIRE_FALSE(b.variables().has(TestVars::X));
    REQUIRE_THROWS_AS(b.builtModel(), std::logic_error);

    b.failInConstraints = false;
    b.calls.clear();
    REQUIRE(b.build().numVars() == 3);
}

// ============================================================================
// SECTION C: SOLVING AND SOLUTION ACCESSORS
// ============================================================================

/**
 * @test Solve::OptimalSolution
 * @covers ModelBuilder::solve()
 * @covers ModelBuilder::objVal()
 * @covers ModelBuilder::value()
 */
TEST_CASE("C1: Solve::OptimalSolution", "[ModelBuilder][solve]")
{
    TrackingBuilder b;
    CannedSolver solver(optimalOf({ 1.0, 0.0, 1.0 }, 2.0));

    REQUIRE_FALSE(b.hasSolution());
    REQUIRE_THROWS_AS(b.status(), std::logic_error);

    const Solution& s = b.solve(solver);
    REQUIRE(solver.calls == 1);
    REQUIRE(s.isOptimal());
    REQUIRE(b.hasSolution());
    REQUIRE(b.isOptimal());
    REQUIRE(b.objVal() == 2.0);
    REQUIRE(b.runtime() == 0.25);
    REQUIRE(b.value(TestVars::X, 2) == 1.0);
    REQUIRE(b.value(TestVars::X, 1) == 0.0);

    REQUIRE(b.calls.back() == "afterSolve");
    REQUIRE(b.calls[b.calls.size() - 2] == "beforeSolve");
}

/**
 * @test Solve::NonOptimalOutcomes
 * @brief Infeasible is reported through status, value access throws
 */
TEST_CASE("C2: Solve::NonOptimalOutcomes", "[ModelBuilder][solve]")
{
    TrackingBuilder b;
    CannedSolver solver(Solution::failure(SolveStatus::Infeasible, "no plan"));

    b.solve(solver);
    REQUIRE_FALSE(b.hasSolution());
    REQUIRE(b.isInfeasible());
    REQUIRE_FALSE(b.isUnbounded());
    REQUIRE(b.solution().message == "no plan");
    REQUIRE_THROWS_AS(b.objVal(), std::logic_error);
    REQUIRE_THROWS_AS(b.value(TestVars::X, 0), std::logic_error);
}

// ============================================================================
// SECTION D: DATASTORE INTEGRATION
// ============================================================================

/**
 * @test DataStore::WrittenByHooks
 * @covers ModelBuilder::store()
 */
TEST_CASE("D1: DataStore::WrittenByHooks", "[ModelBuilder][store]")
{
    TrackingBuilder b;
    b.n = 4;
    b.build();
    REQUIRE(b.store().at("n").get<int>() == 4);

    b.store()["note"] = std::string("checked");
    REQUIRE(b.store().at("note").is<std::string>());
}
