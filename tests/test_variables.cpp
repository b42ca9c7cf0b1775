/*
===============================================================================
TEST VARIABLES — Tests for variables.h
===============================================================================

OVERVIEW
--------
Validates the Var handle: creation through the Model, attribute delegation
to the Solver, type validation, columns, solution values gated by the model
status, rendering, and identity-based hashing.

TEST ORGANIZATION
-----------------
• Section A: Creation and attributes
• Section B: Variable type
• Section C: Columns
• Section D: Solution values
• Section E: Identity and rendering

TEST STRATEGY
-------------
• Every read is checked against the MemorySolver tables, so the tests show
  that the handle itself stores nothing but its index
• Solution values are scripted through the solver's pool

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• test_support.h - In-memory solver

BUILD CONFIGURATION NOTES
-------------------------
Naming tests adapt to debug/release mode via naming_enabled().

===============================================================================
*/

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <map>
#include <set>
#include <sstream>
#include <unordered_map>

#include "test_support.h"

using Catch::Approx;
using mip::OptimizationStatus;
using mip::Var;
using mip::VarType;
using mip_test::TestModel;

// ============================================================================
// SECTION A: CREATION AND ATTRIBUTES
// ============================================================================

/**
 * @test Attributes::CreationDefaults
 * @brief addVar() defaults to a continuous variable in [0, INF) with objective 0
 *
 * @covers Model::addVar, Var::lb, Var::ub, Var::obj, Var::varType
 */
TEST_CASE("A1: Attributes::CreationDefaults", "[variables][attributes]")
{
    TestModel t;
    Var x = t.model.addVar("x");

    REQUIRE(x.idx() == 0);
    REQUIRE(x.name() == "x");
    REQUIRE(x.lb() == 0.0);
    REQUIRE(x.ub() == mip::INF);
    REQUIRE(x.obj() == 0.0);
    REQUIRE(x.varType() == VarType::Continuous);
    REQUIRE(&x.model() == &t.model);
}

/**
 * @test Attributes::SettersDelegate
 * @brief Setters write through to the solver; a copied handle sees the change
 *
 * @covers Var::setLB, Var::setUB, Var::setObj, Var::setName
 */
TEST_CASE("A2: Attributes::SettersDelegate", "[variables][attributes]")
{
    TestModel t;
    Var x = t.model.addVar("x", -1.0, 4.0, 2.0, VarType::Integer);
    Var alias = x;

    x.setLB(-3.0);
    x.setUB(7.5);
    x.setObj(-1.0);
    x.setName("renamed");

    REQUIRE(t.solver.varGetLB(0) == -3.0);
    REQUIRE(alias.ub() == 7.5);
    REQUIRE(alias.obj() == -1.0);
    REQUIRE(alias.name() == "renamed");
}

/**
 * @test Attributes::AddVarsNaming
 * @brief addVars() creates n consecutive variables, named in debug builds
 *
 * @covers Model::addVars
 */
TEST_CASE("A3: Attributes::AddVarsNaming", "[variables][attributes][naming]")
{
    TestModel t;
    auto X = t.model.addVars(3, "x", 0.0, 1.0, 0.0, VarType::Binary);

    REQUIRE(X.size() == 3);
    for (int i = 0; i < 3; ++i) {
        REQUIRE(X[i].idx() == i);
        REQUIRE(X[i].varType() == VarType::Binary);
        REQUIRE(X[i].ub() == 1.0);
    }

    if (mip::naming_enabled()) {
        REQUIRE(X[2].name() == "x_2");
    }
    else {
        REQUIRE(X[2].name().empty());
        REQUIRE(X[2].toString() == "var(2)");
    }
}

// ============================================================================
// SECTION B: VARIABLE TYPE
// ============================================================================

/**
 * @test VarType::ChangeAndParse
 * @brief setVarType accepts enumerators and the codes 'B', 'C', 'I'
 *
 * @covers Var::setVarType
 */
TEST_CASE("B1: VarType::ChangeAndParse", "[variables][type]")
{
    TestModel t;
    Var x = t.model.addVar("x");

    x.setVarType(VarType::Binary);
    REQUIRE(x.varType() == VarType::Binary);

    x.setVarType('I');
    REQUIRE(x.varType() == VarType::Integer);

    x.setVarType('C');
    REQUIRE(x.varType() == VarType::Continuous);
}

/**
 * @test VarType::InvalidRejectedBeforeSolver
 * @brief Invalid types raise InvalidVariableType and never reach the solver
 *
 * @covers Var::setVarType, mip::toVarType
 */
TEST_CASE("B2: VarType::InvalidRejectedBeforeSolver", "[variables][type][error]")
{
    TestModel t;
    Var x = t.model.addVar("x", 0, 1, 0, VarType::Integer);

    REQUIRE_THROWS_AS(x.setVarType('X'), mip::InvalidVariableType);
    REQUIRE_THROWS_AS(x.setVarType(static_cast<VarType>('Z')), mip::InvalidVariableType);
    REQUIRE_THROWS_AS(t.model.addVar("y", 0, 1, 0, static_cast<VarType>('q')),
        mip::InvalidVariableType);

    REQUIRE(x.varType() == VarType::Integer);
    REQUIRE(t.model.numCols() == 1);
}

// ============================================================================
// SECTION C: COLUMNS
// ============================================================================

/**
 * @test Column::ReadFromRows
 * @brief column() lists every constraint holding the variable
 *
 * @covers Var::column
 */
TEST_CASE("C1: Column::ReadFromRows", "[variables][column]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    Var y = t.model.addVar("y");

    auto c1 = t.model.addConstr(2 * x + y <= 4, "c1");
    t.model.addConstr(y >= 1, "c2");
    auto c3 = t.model.addConstr(x - y == 0, "c3");

    mip::Column col = x.column();
    REQUIRE(col.size() == 2);
    REQUIRE(col.constrs()[0] == c1);
    REQUIRE(col.coeffs()[0] == 2.0);
    REQUIRE(col.constrs()[1] == c3);
    REQUIRE(col.coeffs()[1] == 1.0);
}

/**
 * @test Column::NewVariableEntersRows
 * @brief A variable created with a column appears in the given rows
 *
 * @covers Model::addVar(column), Var::setColumn
 */
TEST_CASE("C2: Column::NewVariableEntersRows", "[variables][column]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    auto cap = t.model.addConstr(x <= 10, "cap");
    auto dem = t.model.addConstr(x >= 2, "dem");

    Var z = t.model.addVar("z", 0, mip::INF, 3.0, VarType::Continuous,
        mip::Column({ cap, dem }, { 1.0, -2.0 }));

    REQUIRE(cap.expr().coefficient(z) == 1.0);
    REQUIRE(dem.expr().coefficient(z) == -2.0);

    z.setColumn(mip::Column({ dem }, { 5.0 }));
    REQUIRE_FALSE(cap.expr().contains(z));
    REQUIRE(dem.expr().coefficient(z) == 5.0);
}

/**
 * @test Column::ForeignConstraintRejected
 * @brief A column referring to another model's constraint raises ModelMismatch
 *
 * @covers Model::addVar(column)
 */
TEST_CASE("C3: Column::ForeignConstraintRejected", "[variables][column][error]")
{
    TestModel t1;
    TestModel t2;
    Var x = t2.model.addVar("x");
    auto foreign = t2.model.addConstr(x <= 1);

    REQUIRE_THROWS_AS(t1.model.addVar("z", 0, 1, 0, VarType::Continuous,
        mip::Column({ foreign }, { 1.0 })), mip::ModelMismatch);
    REQUIRE(t1.model.numCols() == 0);
}

// ============================================================================
// SECTION D: SOLUTION VALUES
// ============================================================================

/**
 * @test Solution::UnknownBeforeSolve
 * @brief x(), rc() and xi() are unknown before any solution exists
 *
 * @covers Var::x, Var::rc, Var::xi
 */
TEST_CASE("D1: Solution::UnknownBeforeSolve", "[variables][solution]")
{
    TestModel t;
    Var x = t.model.addVar("x");

    REQUIRE_FALSE(x.x().has_value());
    REQUIRE_FALSE(x.rc().has_value());
    REQUIRE_FALSE(x.xi(0).has_value());
}

/**
 * @test Solution::PoolValues
 * @brief xi(i) reads the i-th pool solution once the model is Optimal or Feasible
 *
 * @covers Var::x, Var::xi
 */
TEST_CASE("D2: Solution::PoolValues", "[variables][solution]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    Var y = t.model.addVar("y");
    t.solver.pool = { { 1.0, 2.0 }, { 3.0, 4.0 } };

    SECTION("status gate") {
        // Values exist in the pool but the model has not been optimized
        REQUIRE_FALSE(y.xi(1).has_value());
    }

    SECTION("optimal") {
        t.model.optimize();
        REQUIRE(x.x().value() == Approx(1.0));
        REQUIRE(y.xi(0).value() == Approx(2.0));
        REQUIRE(y.xi(1).value() == Approx(4.0));
        REQUIRE_FALSE(y.xi(2).has_value());
    }

    SECTION("feasible") {
        t.solver.scriptedStatus = OptimizationStatus::Feasible;
        t.model.optimize();
        REQUIRE(x.xi(1).value() == Approx(3.0));
    }

    SECTION("infeasible") {
        t.solver.scriptedStatus = OptimizationStatus::Infeasible;
        t.model.optimize();
        REQUIRE_FALSE(x.xi(0).has_value());
    }
}

/**
 * @test Solution::ReducedCost
 * @brief rc() reports what the solver provides and nothing else
 *
 * @covers Var::rc
 */
TEST_CASE("D3: Solution::ReducedCost", "[variables][solution]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    Var y = t.model.addVar("y");
    t.solver.reducedCosts[1] = -0.5;

    REQUIRE_FALSE(x.rc().has_value());
    REQUIRE(y.rc().value() == Approx(-0.5));
}

// ============================================================================
// SECTION E: IDENTITY AND RENDERING
// ============================================================================

/**
 * @test Identity::HashAndOrderByIndex
 * @brief Handles to the same index are interchangeable keys
 *
 * @covers std::hash<Var>, std::equal_to<Var>, std::less<Var>, Var::sameAs
 */
TEST_CASE("E1: Identity::HashAndOrderByIndex", "[variables][identity]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    Var y = t.model.addVar("y");
    Var x2 = t.model.var(0);

    REQUIRE(x.sameAs(x2));
    REQUIRE_FALSE(x.sameAs(y));

    std::unordered_map<Var, double> weights;
    weights[x] = 2.0;
    weights[x2] += 1.0;
    weights[y] = 5.0;
    REQUIRE(weights.size() == 2);
    REQUIRE(weights[x] == 3.0);

    std::set<Var> ordered = { y, x };
    REQUIRE(ordered.begin()->sameAs(x));
}

/**
 * @test Rendering::NameOrIndex
 * @brief toString() and operator<< print the name, or var(idx) if unnamed
 *
 * @covers Var::toString, operator<<(ostream, Var)
 */
TEST_CASE("E2: Rendering::NameOrIndex", "[variables][rendering]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    Var anon = t.model.addVar();

    std::ostringstream os;
    os << x << " " << anon;
    REQUIRE(os.str() == "x var(1)");
}
