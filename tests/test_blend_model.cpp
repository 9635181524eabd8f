/*
===============================================================================
TEST BLEND MODEL — Tests for blend_model.h and the constraint families
===============================================================================

OVERVIEW
--------
Validates the structure of the blending model without a solver backend:
variable and row counts per mode, the canonical form of each family, the
Big-M derivation, empty categories, determinism, and feasibility of known
plans checked with checkFeasibility().

TEST ORGANIZATION
-----------------
• Section A: Model shape per mode
• Section B: Core families
• Section C: Discrete families
• Section D: Objective
• Section E: Determinism and validation
• Section F: Known plans against the feasibility checker

TEST STRATEGY
-------------
• The reference scenario is 5 oils x 6 months:
    continuous: 96 columns (Buy, Use, Stock 30 each, Produce 6), 65 rows
    discrete:   +30 IsUsed binaries, +78 rows (Link 30, MinThreshold 30,
                MaxIngredients 6, Logic 12)
• Hand plans are evaluated through PlanSolver from test_support.h

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• blend_model.h - System under test
• diagnostics.h, reference_scenario.h, test_support.h

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <blend_planner/blend_model.h>
#include <blend_planner/diagnostics.h>
#include <blend_planner/reference_scenario.h>

#include "test_support.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace blend;
using Catch::Approx;
using blend::testing::handPlanSolver;
using blend::testing::handPlanValue;
using blend::testing::PlanSolver;

namespace {

    /// Coefficient of v in a row, 0 when absent
    double coefOf(const ConstraintDecl& row, Var v)
    {
        double c = 0.0;
        for (const auto& t : row.expr.terms())
            if (t.var == v.id())
                c += t.coef;
        return c;
    }

} // namespace

// ============================================================================
// SECTION A: MODEL SHAPE PER MODE
// ============================================================================

/**
 * @test Shape::ContinuousCounts
 * @covers BlendModelBuilder::addVariables()
 * @covers BlendModelBuilder::addConstraints()
 */
TEST_CASE("A1: Shape::ContinuousCounts", "[blend][shape]")
{
    BlendModelBuilder b(reference::scenario(), BlendMode::Continuous);
    const LinearModel& m = b.build();

    REQUIRE(m.numVars() == 96);
    REQUIRE(m.numConstrs() == 65);
    REQUIRE_FALSE(m.isMIP());
    REQUIRE(m.objective().sense == ObjectiveSense::Maximize);

    REQUIRE(b.variables().get(BlendVar::Buy).size() == 30);
    REQUIRE(b.variables().get(BlendVar::Produce).size() == 6);
    REQUIRE_FALSE(b.variables().has(BlendVar::IsUsed));

    REQUIRE(b.constraints().get(BlendCon::Balance).size() == 30);
    REQUIRE(b.constraints().get(BlendCon::FinalStock).size() == 5);
    REQUIRE(b.constraints().get(BlendCon::Capacity).size() == 12);
    REQUIRE(b.constraints().get(BlendCon::ProductionDef).size() == 6);
    REQUIRE(b.constraints().get(BlendCon::HardnessMin).size() == 6);
    REQUIRE(b.constraints().get(BlendCon::HardnessMax).size() == 6);
    REQUIRE_FALSE(b.constraints().has(BlendCon::Link));

    REQUIRE(b.periods() == range(1, 7));
    REQUIRE(b.oilPositions() == range(0, 5));
}

/**
 * @test Shape::DiscreteCounts
 */
TEST_CASE("A2: Shape::DiscreteCounts", "[blend][shape][discrete]")
{
    BlendModelBuilder b(reference::scenario(), BlendMode::Discrete);
    const LinearModel& m = b.build();

    REQUIRE(m.numVars() == 126);
    REQUIRE(m.numConstrs() == 143);
    REQUIRE(m.isMIP());

    auto stats = computeStatistics(m);
    REQUIRE(stats.numBinary == 30);
    REQUIRE(stats.numContinuous == 96);

    REQUIRE(b.constraints().get(BlendCon::Link).size() == 30);
    REQUIRE(b.constraints().get(BlendCon::MinThreshold).size() == 30);
    REQUIRE(b.constraints().get(BlendCon::MaxIngredients).size() == 6);
    REQUIRE(b.constraints().get(BlendCon::Logic).size() == 12);
}

/**
 * @test Shape::VariableBoundsAndNames
 * @brief Stock is capped by storage capacity, flows are unbounded above
 */
TEST_CASE("A3: Shape::VariableBoundsAndNames", "[blend][shape]")
{
    BlendModelBuilder b(reference::scenario(), BlendMode::Discrete);
    const LinearModel& m = b.build();
    const auto& vars = b.variables();

    REQUIRE(m.variable(vars.var(BlendVar::Stock, 2, 3)).ub == 1000.0);
    REQUIRE(m.variable(vars.var(BlendVar::Buy, 2, 3)).ub == kInfinity);
    REQUIRE(m.variable(vars.var(BlendVar::Use, 0, 1)).lb == 0.0);
    REQUIRE(m.variable(vars.var(BlendVar::IsUsed, 4, 6)).domain == VarDomain::Binary);
    REQUIRE(m.variable(vars.var(BlendVar::Use, 1, 4)).index == std::vector<int>{ 1, 4 });

    if (naming_enabled()) {
        REQUIRE(m.variable(vars.var(BlendVar::Buy, 0, 1)).name == "Buy[VEG1,1]");
        REQUIRE(m.constraint(b.constraints().row(BlendCon::Logic, 1, 2)).name == "Logic[VEG2->OIL3,2]");
        REQUIRE(m.constraint(b.constraints().row(BlendCon::Capacity, 0, 5)).name == "Capacity[Vegetable,5]");
    }
    else {
        REQUIRE(m.variable(vars.var(BlendVar::Buy, 0, 1)).name.empty());
    }

    REQUIRE(b.store().at("mode").get<std::string>() == "discrete");
    REQUIRE(b.store().at("periods").get<int>() == 6);
}

// ============================================================================
// SECTION B: CORE FAMILIES
// ============================================================================

/**
 * @test Core::BalanceBoundaryAndChaining
 * @brief First period uses initial stock, later periods chain to t-1
 *
 * @covers addBalanceConstraints()
 * @covers addFinalStockConstraints()
 */
TEST_CASE("B1: Core::BalanceBoundaryAndChaining", "[blend][core][balance]")
{
    BlendModelBuilder b(reference::scenario(), BlendMode::Continuous);
    const LinearModel& m = b.build();
    const auto& v = b.variables();
    const auto& c = b.constraints();

    const auto& first = m.constraint(c.row(BlendCon::Balance, 1, 1));
    REQUIRE(first.sense == Sense::Equal);
    REQUIRE(first.rhs == 500.0);
    REQUIRE(first.expr.size() == 3);
    REQUIRE(coefOf(first, v.var(BlendVar::Stock, 1, 1)) == 1.0);
    REQUIRE(coefOf(first, v.var(BlendVar::Buy, 1, 1)) == -1.0);
    REQUIRE(coefOf(first, v.var(BlendVar::Use, 1, 1)) == 1.0);

    const auto& later = m.constraint(c.row(BlendCon::Balance, 1, 4));
    REQUIRE(later.rhs == 0.0);
    REQUIRE(later.expr.size() == 4);
    REQUIRE(coefOf(later, v.var(BlendVar::Stock, 1, 3)) == -1.0);
    REQUIRE(coefOf(later, v.var(BlendVar::Stock, 1, 4)) == 1.0);

    const auto& target = m.constraint(c.row(BlendCon::FinalStock, 3));
    REQUIRE(target.sense == Sense::Equal);
    REQUIRE(target.rhs == 500.0);
    REQUIRE(coefOf(target, v.var(BlendVar::Stock, 3, 6)) == 1.0);
}

/**
 * @test Core::CapacityAndProduction
 * @covers addCapacityConstraints()
 * @covers addProductionConstraints()
 */
TEST_CASE("B2: Core::CapacityAndProduction", "[blend][core][capacity]")
{
    BlendModelBuilder b(reference::scenario(), BlendMode::Continuous);
    const LinearModel& m = b.build();
    const auto& v = b.variables();
    const auto& c = b.constraints();

    const auto& veg = m.constraint(c.row(BlendCon::Capacity, 0, 2));
    REQUIRE(veg.sense == Sense::LessEqual);
    REQUIRE(veg.rhs == 200.0);
    REQUIRE(veg.expr.size() == 2);
    REQUIRE(coefOf(veg, v.var(BlendVar::Use, 0, 2)) == 1.0);
    REQUIRE(coefOf(veg, v.var(BlendVar::Use, 1, 2)) == 1.0);

    const auto& nonVeg = m.constraint(c.row(BlendCon::Capacity, 1, 2));
    REQUIRE(nonVeg.rhs == 250.0);
    REQUIRE(nonVeg.expr.size() == 3);

    const auto& prod = m.constraint(c.row(BlendCon::ProductionDef, 5));
    REQUIRE(prod.sense == Sense::Equal);
    REQUIRE(prod.expr.size() == 6);
    REQUIRE(coefOf(prod, v.var(BlendVar::Produce, 5)) == 1.0);
    REQUIRE(coefOf(prod, v.var(BlendVar::Use, 4, 5)) == -1.0);
}

/**
 * @test Core::HardnessLinearized
 * @brief sum h*Use - hmin*Produce >= 0 and sum h*Use - hmax*Produce <= 0
 *
 * @covers addHardnessConstraints()
 */
TEST_CASE("B3: Core::HardnessLinearized", "[blend][core][hardness]")
{
    BlendModelBuilder b(reference::scenario(), BlendMode::Continuous);
    const LinearModel& m = b.build();
    const auto& v = b.variables();
    const auto& c = b.constraints();

    const auto& lo = m.constraint(c.row(BlendCon::HardnessMin, 3));
    REQUIRE(lo.sense == Sense::GreaterEqual);
    REQUIRE(lo.rhs == 0.0);
    REQUIRE(coefOf(lo, v.var(BlendVar::Use, 0, 3)) == Approx(8.8));
    REQUIRE(coefOf(lo, v.var(BlendVar::Use, 2, 3)) == Approx(2.0));
    REQUIRE(coefOf(lo, v.var(BlendVar::Produce, 3)) == Approx(-3.0));

    const auto& hi = m.constraint(c.row(BlendCon::HardnessMax, 3));
    REQUIRE(hi.sense == Sense::LessEqual);
    REQUIRE(coefOf(hi, v.var(BlendVar::Produce, 3)) == Approx(-6.0));
}

/**
 * @test Core::EmptyCategoryKeepsRows
 * @brief A category without oils still gets its capacity rows (0 <= cap)
 */
TEST_CASE("B4: Core::EmptyCategoryKeepsRows", "[blend][core][edge]")
{
    BlendData data = reference::scenario();
    data.oils = OilCatalog({
        { "OIL1", OilCategory::NonVegetable, 2.0 },
        { "OIL2", OilCategory::NonVegetable, 4.2 },
        { "OIL3", OilCategory::NonVegetable, 5.0 },
    });
    for (const char* id : { "VEG1", "VEG2" })
        for (int t = 1; t <= 6; ++t)
            data.prices.erase(id, t);

    BlendModelBuilder b(data, BlendMode::Continuous);
    const LinearModel& m = b.build();

    REQUIRE(b.constraints().get(BlendCon::Capacity).size() == 12);
    const auto& veg = m.constraint(b.constraints().row(BlendCon::Capacity, 0, 1));
    REQUIRE(veg.expr.isConstant());
    REQUIRE(veg.rhs == 200.0);
}

// ============================================================================
// SECTION C: DISCRETE FAMILIES
// ============================================================================

/**
 * @test Discrete::BigMFromCategoryCap
 * @covers linkBigM()
 * @covers addLinkConstraints()
 * @covers addMinThresholdConstraints()
 */
TEST_CASE("C1: Discrete::BigMFromCategoryCap", "[blend][discrete][bigm]")
{
    BlendData data = reference::scenario();
    REQUIRE(linkBigM(data, 0) == 200.0);
    REQUIRE(linkBigM(data, 3) == 250.0);

    BlendModelBuilder b(data, BlendMode::Discrete);
    const LinearModel& m = b.build();
    const auto& v = b.variables();
    const auto& c = b.constraints();

    const auto& vegLink = m.constraint(c.row(BlendCon::Link, 1, 2));
    REQUIRE(vegLink.sense == Sense::LessEqual);
    REQUIRE(coefOf(vegLink, v.var(BlendVar::IsUsed, 1, 2)) == -200.0);

    const auto& oilLink = m.constraint(c.row(BlendCon::Link, 3, 2));
    REQUIRE(coefOf(oilLink, v.var(BlendVar::IsUsed, 3, 2)) == -250.0);

    const auto& threshold = m.constraint(c.row(BlendCon::MinThreshold, 3, 2));
    REQUIRE(threshold.sense == Sense::GreaterEqual);
    REQUIRE(coefOf(threshold, v.var(BlendVar::IsUsed, 3, 2)) == -20.0);

    SECTION("Big-M follows a changed cap") {
        data.params[param_keys::kMaxVegRefine] = 180.0;
        REQUIRE(linkBigM(data, 0) == 180.0);
        LinearModel changed = buildBlendModel(data, BlendMode::Discrete);
        REQUIRE(coefOf(changed.constraint(c.row(BlendCon::Link, 0, 1)),
            v.var(BlendVar::IsUsed, 0, 1)) == -180.0);
    }
}

/**
 * @test Discrete::IngredientsAndLogic
 * @covers addMaxIngredientsConstraints()
 * @covers addLogicConstraints()
 */
TEST_CASE("C2: Discrete::IngredientsAndLogic", "[blend][discrete][logic]")
{
    BlendModelBuilder b(reference::scenario(), BlendMode::Discrete);
    const LinearModel& m = b.build();
    const auto& v = b.variables();
    const auto& c = b.constraints();

    const auto& k = m.constraint(c.row(BlendCon::MaxIngredients, 6));
    REQUIRE(k.rhs == 3.0);
    REQUIRE(k.expr.size() == 5);

    // Pair 0 is VEG1 -> OIL3
    const auto& logic = m.constraint(c.row(BlendCon::Logic, 0, 4));
    REQUIRE(logic.sense == Sense::LessEqual);
    REQUIRE(logic.rhs == 0.0);
    REQUIRE(coefOf(logic, v.var(BlendVar::IsUsed, 0, 4)) == 1.0);
    REQUIRE(coefOf(logic, v.var(BlendVar::IsUsed, 4, 4)) == -1.0);
}

/**
 * @test Discrete::NoDependencies
 * @brief An empty dependency list yields no Logic rows but a registered family
 */
TEST_CASE("C3: Discrete::NoDependencies", "[blend][discrete][edge]")
{
    BlendData data = reference::scenario();
    data.params[param_keys::kDependencies] = DependencyList{};

    BlendModelBuilder b(data, BlendMode::Discrete);
    const LinearModel& m = b.build();
    REQUIRE(b.constraints().has(BlendCon::Logic));
    REQUIRE(b.constraints().get(BlendCon::Logic).empty());
    REQUIRE(m.numConstrs() == 131);
}

// ============================================================================
// SECTION D: OBJECTIVE
// ============================================================================

/**
 * @test Objective::ProfitCoefficients
 * @brief Revenue on Produce, purchase price on Buy, storage cost on Stock
 *
 * @covers profitExpression()
 */
TEST_CASE("D1: Objective::ProfitCoefficients", "[blend][objective]")
{
    BlendModelBuilder b(reference::scenario(), BlendMode::Discrete);
    const LinearModel& m = b.build();
    const auto& v = b.variables();

    std::vector<double> unit(m.numVars(), 0.0);
    auto coefficient = [&](Var x) {
        std::fill(unit.begin(), unit.end(), 0.0);
        unit[x.id()] = 1.0;
        return evaluateObjective(m, unit);
    };

    REQUIRE(coefficient(v.var(BlendVar::Produce, 2)) == 150.0);
    REQUIRE(coefficient(v.var(BlendVar::Buy, 0, 1)) == -110.0);
    REQUIRE(coefficient(v.var(BlendVar::Buy, 3, 6)) == -80.0);
    REQUIRE(coefficient(v.var(BlendVar::Stock, 4, 4)) == -5.0);
    REQUIRE(coefficient(v.var(BlendVar::Use, 4, 4)) == 0.0);
    REQUIRE(coefficient(v.var(BlendVar::IsUsed, 4, 4)) == 0.0);
}

// ============================================================================
// SECTION E: DETERMINISM AND VALIDATION
// ============================================================================

/**
 * @test Build::Deterministic
 * @brief Two builds from the same inputs compare equal
 *
 * @covers buildBlendModel()
 */
TEST_CASE("E1: Build::Deterministic", "[blend][determinism]")
{
    const BlendData data = reference::scenario();
    REQUIRE(buildBlendModel(data, BlendMode::Continuous) == buildBlendModel(data, BlendMode::Continuous));
    REQUIRE(buildBlendModel(data, BlendMode::Discrete) == buildBlendModel(data, BlendMode::Discrete));
    REQUIRE_FALSE(buildBlendModel(data, BlendMode::Continuous) == buildBlendModel(data, BlendMode::Discrete));
}

/**
 * @test Build::ValidationBeforeDeclaration
 * @brief Invalid data throws and leaves nothing declared
 */
TEST_CASE("E2: Build::ValidationBeforeDeclaration", "[blend][validation]")
{
    BlendData data = reference::scenario();
    data.prices.erase("OIL1", 3);

    BlendModelBuilder b(data, BlendMode::Continuous);
    REQUIRE_THROWS_AS(b.build(), ValidationError);
    REQUIRE_FALSE(b.built());
    REQUIRE_FALSE(b.variables().has(BlendVar::Buy));

    BlendData discrete = reference::scenario();
    discrete.params.erase(param_keys::kMaxIngredients);
    REQUIRE_NOTHROW(buildBlendModel(discrete, BlendMode::Continuous));
    REQUIRE_THROWS_AS(buildBlendModel(discrete, BlendMode::Discrete), ValidationError);
}

// ============================================================================
// SECTION F: KNOWN PLANS
// ============================================================================

/**
 * @test Plans::HandPlanFeasibleInBothModes
 * @brief VEG2 100, OIL2 50, OIL3 50 each month with stock held at 500
 *
 * @scenario A hand-made plan that satisfies every family
 * @given The reference data in each mode
 * @when Evaluating the plan with checkFeasibility
 * @then No violations and profit -32000
 */
TEST_CASE("F1: Plans::HandPlanFeasibleInBothModes", "[blend][plans]")
{
    for (BlendMode mode : { BlendMode::Continuous, BlendMode::Discrete }) {
        LinearModel m = buildBlendModel(reference::scenario(), mode);
        std::vector<double> values;
        for (const auto& v : m.variables())
            values.push_back(handPlanValue(v));

        auto report = checkFeasibility(m, values);
        INFO("mode " << modeName(mode));
        REQUIRE(report.feasible());
        REQUIRE(evaluateObjective(m, values) == Approx(blend::testing::kHandPlanProfit));
    }
}

/**
 * @test Plans::ZeroUsageIsFeasible
 * @brief Produce = 0 satisfies hardness rows (0 >= 0, 0 <= 0)
 */
TEST_CASE("F2: Plans::ZeroUsageIsFeasible", "[blend][plans][edge]")
{
    auto idle = [](const VariableDecl& v) { return v.family == "Stock" ? 500.0 : 0.0; };
    PlanSolver<decltype(idle)> solver(idle);

    BlendModelBuilder b(reference::scenario(), BlendMode::Discrete);
    const Solution& s = b.solve(solver);
    REQUIRE(s.isOptimal());
    REQUIRE(s.objective == Approx(-5.0 * 500.0 * 5 * 6));
}

/**
 * @test Plans::ViolationsReportedByFamily
 * @brief Plans that break one family are flagged in that family
 */
TEST_CASE("F3: Plans::ViolationsReportedByFamily", "[blend][plans][violations]")
{
    LinearModel m = buildBlendModel(reference::scenario(), BlendMode::Discrete);

    SECTION("Too soft: only OIL1 is refined") {
        std::vector<double> values;
        for (const auto& v : m.variables()) {
            double x = handPlanValue(v);
            if (v.family == "Use" || v.family == "Buy")
                x = v.index[0] == 2 ? 100.0 : 0.0;
            if (v.family == "Produce")
                x = 100.0;
            if (v.family == "IsUsed")
                x = v.index[0] == 2 ? 1.0 : 0.0;
            values.push_back(x);
        }
        auto report = checkFeasibility(m, values);
        REQUIRE(report.inFamily("HardnessMin").size() == 6);
        REQUIRE(report.inFamily("HardnessMax").empty());
        REQUIRE(report.inFamily("Balance").empty());
    }

    SECTION("Vegetable refining above the cap") {
        std::vector<double> values;
        for (const auto& v : m.variables()) {
            double x = handPlanValue(v);
            if ((v.family == "Use" || v.family == "Buy") && v.index[0] == 1)
                x = 210.0;
            if (v.family == "Produce")
                x = 310.0;
            values.push_back(x);
        }
        auto report = checkFeasibility(m, values);
        REQUIRE(report.inFamily("Capacity").size() == 6);
        REQUIRE(report.inFamily("Link").size() == 6);
    }

    SECTION("VEG2 used without OIL3") {
        std::vector<double> values;
        for (const auto& v : m.variables()) {
            double x = handPlanValue(v);
            if (v.family == "IsUsed" && v.index[0] == 4)
                x = 0.0;
            values.push_back(x);
        }
        auto report = checkFeasibility(m, values);
        REQUIRE(report.inFamily("Logic").size() == 6);
        REQUIRE(report.inFamily("Link").size() == 6);
    }

    SECTION("Missed final stock target") {
        BlendData data = reference::scenario();
        data.params[param_keys::kTargetFinalStock] = 1500.0;
        auto solver = handPlanSolver();
        BlendModelBuilder b(data, BlendMode::Continuous);
        REQUIRE(b.solve(solver).status == SolveStatus::Infeasible);
        REQUIRE(b.isInfeasible());
    }
}
