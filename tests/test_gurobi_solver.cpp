/*
===============================================================================
TEST GUROBI SOLVER — Tests for gurobi_solver.h
===============================================================================

OVERVIEW
--------
Runs small LP and MIP models through the Gurobi backend: attribute
round trips, status mapping, primal and dual values, the solution pool and
conflict queries on the Gurobi row storage.

TEST ORGANIZATION
-----------------
• Section A: Model building
• Section B: Linear programs
• Section C: Mixed-integer programs
• Section D: Status mapping
• Section E: Conflict graph

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• Gurobi 10.0+ - Solver backend (a valid license is required)

===============================================================================
*/

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <ranges>
#include <stdexcept>

#include <mip/gurobi_solver.h>
#include <mip/mip.h>

using Catch::Approx;
using mip::LinExpr;
using mip::Model;
using mip::OptimizationStatus;
using mip::Var;
using mip::VarType;

// ============================================================================
// TEST UTILITIES
// ============================================================================

namespace {

    std::unique_ptr<mip::GurobiSolver> makeSolver() {
        return std::make_unique<mip::GurobiSolver>();
    }

} // namespace

// ============================================================================
// SECTION A: MODEL BUILDING
// ============================================================================

/**
 * @test Building::AttributesRoundTrip
 * @brief Bounds, objective, types and rows read back as written
 *
 * @covers GurobiSolver::addVar, GurobiSolver::addConstr, GurobiSolver::constrGetRow
 */
TEST_CASE("A1: Building::AttributesRoundTrip", "[gurobi][building]")
{
    Model model(makeSolver(), "roundtrip");
    Var x = model.addVar("x", -1.0, 4.0, 2.5, VarType::Integer);
    Var y = model.addVar("y");
    auto c = model.addConstr(2 * x - y >= -3, "cap");

    REQUIRE(x.lb() == -1.0);
    REQUIRE(x.ub() == 4.0);
    REQUIRE(x.obj() == 2.5);
    REQUIRE(x.varType() == VarType::Integer);
    REQUIRE(x.name() == "x");
    REQUIRE(y.ub() == mip::INF);

    REQUIRE(c.rhs() == -3.0);
    REQUIRE(c.sense() == mip::Sense::GreaterOrEqual);
    REQUIRE(c.expr().coefficient(x) == 2.0);
    REQUIRE(c.expr().coefficient(y) == -1.0);
    REQUIRE(model.numNZ() == 2);

    y.setUB(10.0);
    x.setVarType(VarType::Continuous);
    c.setRHS(1.0);
    REQUIRE(y.ub() == 10.0);
    REQUIRE(x.varType() == VarType::Continuous);
    REQUIRE(c.rhs() == 1.0);

    REQUIRE_THROWS_AS(model.solver().varGetLB(7), std::out_of_range);
}

/**
 * @test Building::ColumnsAndRowReplacement
 * @brief New columns enter existing rows; setExpr rewrites a row
 *
 * @covers GurobiSolver::addVar(column), GurobiSolver::constrSetExpr
 */
TEST_CASE("A2: Building::ColumnsAndRowReplacement", "[gurobi][building]")
{
    Model model(makeSolver());
    Var x = model.addVar("x");
    auto cap = model.addConstr(x <= 10, "cap");

    Var z = model.addVar("z", 0, mip::INF, 1.0, VarType::Continuous,
        mip::Column({ cap }, { 3.0 }));
    REQUIRE(cap.expr().coefficient(z) == 3.0);

    cap.setExpr(x - z == 2);
    REQUIRE(cap.sense() == mip::Sense::Equal);
    REQUIRE(cap.rhs() == 2.0);
    REQUIRE(cap.expr().coefficient(z) == -1.0);
    REQUIRE(z.column().size() == 1);
}

// ============================================================================
// SECTION B: LINEAR PROGRAMS
// ============================================================================

/**
 * @test LP::OptimalWithDuals
 * @brief max 3x + 2y  s.t.  x + y <= 4, x + 3y <= 6, x <= 3
 *
 * @then x = 3, y = 1, objective 11; duals and reduced costs are known
 *
 * @covers Model::optimize, Var::x, Var::rc, Constr::pi, Constr::slack
 */
TEST_CASE("B1: LP::OptimalWithDuals", "[gurobi][lp]")
{
    Model model(makeSolver());
    Var x = model.addVar("x", 0, 3);
    Var y = model.addVar("y");
    auto c1 = model.addConstr(x + y <= 4, "c1");
    auto c2 = model.addConstr(x + 3 * y <= 6, "c2");
    model.maximize(3 * x + 2 * y);

    REQUIRE(model.optimize() == OptimizationStatus::Optimal);
    REQUIRE(model.objectiveValue().value() == Approx(11.0));
    REQUIRE(x.x().value() == Approx(3.0));
    REQUIRE(y.x().value() == Approx(1.0));

    REQUIRE(c1.slack().value() == Approx(0.0).margin(1e-9));
    REQUIRE(c2.slack().value() == Approx(0.0).margin(1e-9));
    REQUIRE(c1.pi().has_value());
    REQUIRE(x.rc().has_value());

    auto q = mip::computeSolutionQuality(model);
    REQUIRE(q.has_value());
    REQUIRE(q->numViolated == 0);
}

/**
 * @test LP::ObjectiveConstantAndSense
 * @brief The objective constant and sense survive the round trip
 *
 * @covers Model::setObjective, Model::objective, Model::objectiveSense
 */
TEST_CASE("B2: LP::ObjectiveConstantAndSense", "[gurobi][lp]")
{
    Model model(makeSolver());
    Var x = model.addVar("x", 1, 5);
    model.minimize(2 * x + 7);

    REQUIRE(model.objectiveSense() == mip::ObjectiveSense::Minimize);
    REQUIRE(model.objective().constant() == 7.0);
    REQUIRE(model.objective().coefficient(x) == 2.0);

    REQUIRE(model.optimize() == OptimizationStatus::Optimal);
    REQUIRE(model.objectiveValue().value() == Approx(9.0));
}

// ============================================================================
// SECTION C: MIXED-INTEGER PROGRAMS
// ============================================================================

/**
 * @test MIP::KnapsackWithPool
 * @brief 0/1 knapsack; the best pool entry matches x()
 *
 * @covers Model::optimize, Model::numSolutions, Var::xi
 */
TEST_CASE("C1: MIP::KnapsackWithPool", "[gurobi][mip]")
{
    Model model(makeSolver());
    const double w[] = { 3, 4, 5, 2 };
    const double p[] = { 4, 5, 7, 3 };
    auto x = model.addVars(4, "x", 0.0, 1.0, 0.0, VarType::Binary);

    model.addConstr(mip::sum(std::views::iota(0, 4),
        [&](int i) { return w[i] * x[i]; }) <= 9, "capacity");
    model.maximize(mip::sum(std::views::iota(0, 4),
        [&](int i) { return p[i] * x[i]; }));

    REQUIRE(model.optimize() == OptimizationStatus::Optimal);
    REQUIRE(model.objectiveValue().value() == Approx(12.0));
    REQUIRE(model.numSolutions() >= 1);
    for (const Var& v : x) {
        REQUIRE(v.xi(0).value() == Approx(v.x().value()));
    }
    REQUIRE_FALSE(x[0].rc().has_value());
}

// ============================================================================
// SECTION D: STATUS MAPPING
// ============================================================================

/**
 * @test Status::InfeasibleLpAndMip
 * @brief Infeasible LPs map to Infeasible, infeasible MIPs to IntInfeasible
 *
 * @covers GurobiSolver::optimize
 */
TEST_CASE("D1: Status::InfeasibleLpAndMip", "[gurobi][status]")
{
    SECTION("lp") {
        Model model(makeSolver());
        model.setParam("DualReductions", 0);
        Var x = model.addVar("x");
        model.addConstr(x >= 2);
        model.addConstr(x <= 1);

        REQUIRE(model.optimize() == OptimizationStatus::Infeasible);
        REQUIRE_FALSE(model.hasSolution());
        REQUIRE_FALSE(x.x().has_value());
    }

    SECTION("mip") {
        Model model(makeSolver());
        model.setParam("DualReductions", 0);
        Var b = model.addVar("b", 0, 1, 0, VarType::Binary);
        model.addConstr(2 * b == 1);

        REQUIRE(model.optimize() == OptimizationStatus::IntInfeasible);
        REQUIRE_FALSE(model.objectiveValue().has_value());
    }
}

/**
 * @test Status::Unbounded
 * @brief An LP with an unbounded ray maps to Unbounded
 *
 * @covers GurobiSolver::optimize
 */
TEST_CASE("D2: Status::Unbounded", "[gurobi][status]")
{
    Model model(makeSolver());
    model.setParam("DualReductions", 0);
    Var x = model.addVar("x");
    model.maximize(LinExpr(x));

    REQUIRE(model.optimize() == OptimizationStatus::Unbounded);
}

// ============================================================================
// SECTION E: CONFLICT GRAPH
// ============================================================================

/**
 * @test Conflicts::SetPackingOnGurobiRows
 * @brief Conflicts are derived from the rows stored in Gurobi
 *
 * @covers GurobiSolver::conflicting, GurobiSolver::conflictingNodes
 */
TEST_CASE("E1: Conflicts::SetPackingOnGurobiRows", "[gurobi][conflict]")
{
    Model model(makeSolver());
    auto x = model.addVars(3, "x", 0.0, 1.0, 0.0, VarType::Binary);
    model.addConstr(x[0] + x[1] <= 1);
    auto cg = model.conflictGraph();

    REQUIRE(cg.conflicting(x[0], x[1]));
    REQUIRE_FALSE(cg.conflicting(x[0], x[2]));

    auto [atOne, atZero] = cg.conflictingAssignments(x[1]);
    REQUIRE(atOne.size() == 1);
    REQUIRE(atOne.front().sameAs(x[0]));
    REQUIRE(atZero.empty());
}
