/*
===============================================================================
TEST CONSTRAINTS — Tests for constraints.h
===============================================================================

OVERVIEW
--------
Validates ConstraintSet, ConstraintFactory and ConstraintTable: one row per
domain element, recorded family and index, lookup by index tuple, and rows
with an empty left-hand side.

TEST ORGANIZATION
-----------------
• Section A: ConstraintFactory over domains
• Section B: ConstraintSet lookup
• Section C: ConstraintTable

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• constraints.h - System under test
• variables.h, linear_model.h, indexing.h - Supporting components

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <blend_planner/constraints.h>
#include <blend_planner/enum_utils.h>
#include <blend_planner/indexing.h>
#include <blend_planner/linear_model.h>
#include <blend_planner/variables.h>

#include <stdexcept>
#include <vector>

using namespace blend;

DECLARE_ENUM_WITH_COUNT(TestCons, Cap, Link);

// ============================================================================
// SECTION A: CONSTRAINTFACTORY
// ============================================================================

/**
 * @test ConstraintFactory::OneRowPerElement
 * @brief The generator receives the unpacked index and rows keep domain order
 *
 * @covers ConstraintFactory::addIndexed()
 */
TEST_CASE("A1: ConstraintFactory::OneRowPerElement", "[ConstraintFactory]")
{
    LinearModel m;
    auto X = VariableFactory::addIndexed(m, VarDomain::Continuous, 0.0, kInfinity, "X",
        range(0, 2) * range(1, 4));

    std::vector<std::pair<int, int>> calls;
    auto Cap = ConstraintFactory::addIndexed(m, "Cap", range(0, 2) * range(1, 4),
        [&](int i, int t) {
            calls.emplace_back(i, t);
            return LinExpr(X(i, t)) <= 10.0 * t;
        });

    REQUIRE(Cap.size() == 6);
    REQUIRE(m.numConstrs() == 6);
    REQUIRE(calls.front() == std::pair<int, int>{ 0, 1 });
    REQUIRE(calls.back() == std::pair<int, int>{ 1, 3 });

    const auto& row = m.constraint(Cap.at(1, 2));
    REQUIRE(row.family == "Cap");
    REQUIRE(row.index == std::vector<int>{ 1, 2 });
    REQUIRE(row.rhs == 20.0);
    REQUIRE(row.sense == Sense::LessEqual);
}

/**
 * @test ConstraintFactory::EmptyLeftHandSideKept
 * @brief A row whose sum is over no members is still added
 */
TEST_CASE("A2: ConstraintFactory::EmptyLeftHandSideKept", "[ConstraintFactory][edge]")
{
    LinearModel m;
    const std::vector<int> noMembers;
    auto Cap = ConstraintFactory::addIndexed(m, "Cap", IndexList{ 1, 2 },
        [&](int) {
            LinExpr used;
            for (int o : noMembers)
                used += Var(static_cast<std::size_t>(o));
            return used <= 200.0;
        });

    REQUIRE(Cap.size() == 2);
    REQUIRE(m.constraint(Cap.at(2)).expr.isConstant());
    REQUIRE(m.constraint(Cap.at(2)).rhs == 200.0);
}

/**
 * @test ConstraintFactory::ScalarAndNamer
 * @covers ConstraintFactory::addScalar()
 */
TEST_CASE("A3: ConstraintFactory::ScalarAndNamer", "[ConstraintFactory]")
{
    LinearModel m;
    Var x = m.addVar(VarDomain::Continuous, 0.0, kInfinity, "x");

    auto Budget = ConstraintFactory::addScalar(m, "Budget", LinExpr(x) <= 5.0);
    REQUIRE(Budget.size() == 1);
    REQUIRE(m.constraint(Budget.at(std::vector<int>{})).family == "Budget");

    auto Named = ConstraintFactory::addIndexed(m, "Lb", IndexList{ 3 },
        [&](int t) { return LinExpr(x) >= static_cast<double>(t); },
        [](const std::vector<int>& idx) { return force_name::math("Lb", "month", idx[0]); });
    REQUIRE(m.constraint(Named.at(3)).name == "Lb[month,3]");
}

// ============================================================================
// SECTION B: CONSTRAINTSET
// ============================================================================

/**
 * @test ConstraintSet::LookupAndDuplicates
 * @covers ConstraintSet::at()
 * @covers ConstraintSet::add()
 */
TEST_CASE("B1: ConstraintSet::LookupAndDuplicates", "[ConstraintSet]")
{
    ConstraintSet cs("Balance");
    cs.add(7, { 0, 1 });
    REQUIRE(cs.at(0, 1) == 7);
    REQUIRE(cs(0, 1) == 7);
    REQUIRE(cs.contains({ 0, 1 }));
    REQUIRE_THROWS_AS(cs.at(1, 0), std::out_of_range);
    REQUIRE_THROWS_AS(cs.add(8, { 0, 1 }), std::invalid_argument);
}

// ============================================================================
// SECTION C: CONSTRAINTTABLE
// ============================================================================

/**
 * @test ConstraintTable::RegistryAndTotals
 * @covers ConstraintTable::set()
 * @covers ConstraintTable::get()
 * @covers ConstraintTable::totalRows()
 */
TEST_CASE("C1: ConstraintTable::RegistryAndTotals", "[ConstraintTable]")
{
    LinearModel m;
    Var x = m.addVar(VarDomain::Continuous, 0.0, kInfinity, "x");
    ConstraintTable<TestCons> table;

    REQUIRE(table.totalRows() == 0);
    REQUIRE_THROWS_AS(table.get(TestCons::Link), std::runtime_error);

    table.set(TestCons::Cap, ConstraintFactory::addIndexed(m, "Cap", range(0, 4),
        [&](int i) { return LinExpr(x) <= static_cast<double>(i); }));
    REQUIRE(table.has(TestCons::Cap));
    REQUIRE_FALSE(table.has(TestCons::Link));
    REQUIRE(table.totalRows() == 4);
    REQUIRE(table.row(TestCons::Cap, 3) == 3);

    table.clear();
    REQUIRE(table.totalRows() == 0);
}
