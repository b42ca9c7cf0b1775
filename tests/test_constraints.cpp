/*
===============================================================================
TEST CONSTRAINTS — Tests for constraints.h
===============================================================================

OVERVIEW
--------
Validates the Constr handle and the Column value type: registration of
sensed expressions, right-hand side and row access, row replacement,
slack and dual values, rendering, and Column construction.

TEST ORGANIZATION
-----------------
• Section A: Registration and attributes
• Section B: Row access and replacement
• Section C: Solution values
• Section D: Rendering
• Section E: Column

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• test_support.h - In-memory solver

===============================================================================
*/

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <unordered_set>

#include "test_support.h"

using Catch::Approx;
using mip::Constr;
using mip::LinExpr;
using mip::Sense;
using mip::Var;
using mip_test::TestModel;

// ============================================================================
// SECTION A: REGISTRATION AND ATTRIBUTES
// ============================================================================

/**
 * @test Registration::RhsIsNegatedConstant
 * @brief "x + y + 2 <= 10" is stored as the row "x + y <= 8"
 *
 * @covers Model::addConstr, Constr::rhs, Constr::sense
 */
TEST_CASE("A1: Registration::RhsIsNegatedConstant", "[constraints][registration]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    Var y = t.model.addVar("y");

    Constr c = t.model.addConstr(x + y + 2 <= 10, "cap");

    REQUIRE(c.idx() == 0);
    REQUIRE(c.name() == "cap");
    REQUIRE(c.rhs() == 8.0);
    REQUIRE(c.sense() == Sense::LessOrEqual);
    REQUIRE(t.model.numRows() == 1);
    REQUIRE(t.model.numNZ() == 2);
}

/**
 * @test Registration::SenseRequired
 * @brief Registering an expression without a sense raises InvalidSense
 *
 * @covers Model::addConstr
 */
TEST_CASE("A2: Registration::SenseRequired", "[constraints][registration][error]")
{
    TestModel t;
    Var x = t.model.addVar("x");

    REQUIRE_THROWS_AS(t.model.addConstr(x + 1), mip::InvalidSense);
    REQUIRE(t.model.numRows() == 0);
}

/**
 * @test Registration::ForeignVariablesRejected
 * @brief A constraint over another model's variables raises ModelMismatch
 *
 * @covers Model::addConstr
 */
TEST_CASE("A3: Registration::ForeignVariablesRejected", "[constraints][registration][error]")
{
    TestModel t1;
    TestModel t2;
    Var y = t2.model.addVar("y");

    REQUIRE_THROWS_AS(t1.model.addConstr(y <= 1), mip::ModelMismatch);
    REQUIRE(t1.model.numRows() == 0);
}

/**
 * @test Registration::SetRhs
 * @brief setRHS() changes only the right-hand side
 *
 * @covers Constr::setRHS
 */
TEST_CASE("A4: Registration::SetRhs", "[constraints][registration]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    Constr c = t.model.addConstr(2 * x >= 3);

    c.setRHS(5.0);
    REQUIRE(c.rhs() == 5.0);
    REQUIRE(c.expr().coefficient(x) == 2.0);
    REQUIRE(c.sense() == Sense::GreaterOrEqual);
}

/**
 * @test Registration::IdentityByIndex
 * @brief Handles compare and hash by index
 *
 * @covers operator==(Constr, Constr), std::hash<Constr>
 */
TEST_CASE("A5: Registration::IdentityByIndex", "[constraints][registration]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    Constr a = t.model.addConstr(x <= 1);
    Constr b = t.model.addConstr(x >= 0);

    REQUIRE(a == t.model.constr(0));
    REQUIRE_FALSE(a == b);

    std::unordered_set<Constr> seen = { a, b, t.model.constr(1) };
    REQUIRE(seen.size() == 2);

    REQUIRE_THROWS_AS(t.model.constr(2), std::out_of_range);
}

// ============================================================================
// SECTION B: ROW ACCESS AND REPLACEMENT
// ============================================================================

/**
 * @test Row::ExprRoundTrip
 * @brief expr() rebuilds the registered expression with constant = -rhs
 *
 * @covers Constr::expr
 */
TEST_CASE("B1: Row::ExprRoundTrip", "[constraints][row]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    Var y = t.model.addVar("y");

    LinExpr original = (3 * x - y == 4);
    Constr c = t.model.addConstr(original);

    LinExpr e = c.expr();
    REQUIRE(e.equals(original));
    REQUIRE(e.sense() == Sense::Equal);
    REQUIRE(e.constant() == -4.0);
    REQUIRE(e.model() == &t.model);
}

/**
 * @test Row::SetExprReplacesRow
 * @brief setExpr() replaces terms, sense and right-hand side
 *
 * @covers Constr::setExpr
 */
TEST_CASE("B2: Row::SetExprReplacesRow", "[constraints][row]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    Var y = t.model.addVar("y");
    Constr c = t.model.addConstr(x + y <= 10);

    c.setExpr(2 * y >= 1);

    REQUIRE_FALSE(c.expr().contains(x));
    REQUIRE(c.expr().coefficient(y) == 2.0);
    REQUIRE(c.sense() == Sense::GreaterOrEqual);
    REQUIRE(c.rhs() == 1.0);
    REQUIRE(x.column().empty());
}

/**
 * @test Row::SetExprValidation
 * @brief setExpr() rejects senseless and foreign expressions untouched
 *
 * @covers Constr::setExpr
 */
TEST_CASE("B3: Row::SetExprValidation", "[constraints][row][error]")
{
    TestModel t;
    TestModel other;
    Var x = t.model.addVar("x");
    Var z = other.model.addVar("z");
    Constr c = t.model.addConstr(x <= 10);

    REQUIRE_THROWS_AS(c.setExpr(x + 1), mip::InvalidSense);
    REQUIRE_THROWS_AS(c.setExpr(z <= 1), mip::ModelMismatch);
    REQUIRE(c.rhs() == 10.0);
    REQUIRE(c.expr().coefficient(x) == 1.0);
}

// ============================================================================
// SECTION C: SOLUTION VALUES
// ============================================================================

/**
 * @test Solution::SlackAndDual
 * @brief slack() follows the solution; pi() reports the solver's dual
 *
 * @covers Constr::slack, Constr::pi
 */
TEST_CASE("C1: Solution::SlackAndDual", "[constraints][solution]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    Var y = t.model.addVar("y");
    Constr c = t.model.addConstr(x + 2 * y <= 10);

    REQUIRE_FALSE(c.slack().has_value());
    REQUIRE_FALSE(c.pi().has_value());

    t.solver.pool = { { 2.0, 3.0 } };
    t.solver.duals[0] = 1.5;

    REQUIRE(c.slack().value() == Approx(2.0));
    REQUIRE(c.pi().value() == Approx(1.5));
}

// ============================================================================
// SECTION D: RENDERING
// ============================================================================

/**
 * @test Rendering::NamedConstraint
 * @brief "name: +c x ... <= rhs"
 *
 * @covers Constr::toString, operator<<(ostream, Constr)
 */
TEST_CASE("D1: Rendering::NamedConstraint", "[constraints][rendering]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    Var y = t.model.addVar("y");

    Constr c = t.model.addConstr(x - 2 * y >= -3, "lim");
    REQUIRE(c.toString() == "lim: +1 x -2 y >= -3");

    std::ostringstream os;
    os << t.model.addConstr(x == 1);
    REQUIRE(os.str() == "constr(2):  +1 x = 1");
}

/**
 * @test Rendering::LongRowsWrap
 * @brief Rows are broken into lines once 75 characters have been written
 *
 * @covers Constr::toString
 */
TEST_CASE("D2: Rendering::LongRowsWrap", "[constraints][rendering]")
{
    TestModel t;
    auto X = t.model.addVars(30);
    for (auto& v : X) {
        v.setName("long_variable_" + std::to_string(v.idx()));
    }

    Constr c = t.model.addConstr(mip::xsum(X) <= 1, "big");
    const std::string s = c.toString();

    REQUIRE(s.starts_with("big:"));
    REQUIRE(s.find("\n\t") != std::string::npos);
    REQUIRE(s.ends_with(" <= 1"));
}

// ============================================================================
// SECTION E: COLUMN
// ============================================================================

/**
 * @test Column::LengthMismatch
 * @brief Constraints and coefficients must pair up
 *
 * @covers Column::Column
 */
TEST_CASE("E1: Column::LengthMismatch", "[constraints][column][error]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    Constr c = t.model.addConstr(x <= 1);

    REQUIRE_THROWS_AS(mip::Column({ c }, { 1.0, 2.0 }), mip::LengthMismatch);
    REQUIRE_THROWS_AS(mip::Column({ c, c }, {}), mip::LengthMismatch);
    REQUIRE_NOTHROW(mip::Column({ c }, { 1.0 }));
}

/**
 * @test Column::BuildAndRender
 * @brief addTerm() appends pairs; toString() lists "coeff name"
 *
 * @covers Column::addTerm, Column::toString
 */
TEST_CASE("E2: Column::BuildAndRender", "[constraints][column]")
{
    TestModel t;
    Var x = t.model.addVar("x");
    Constr a = t.model.addConstr(x <= 1, "a");
    Constr b = t.model.addConstr(x >= 0, "b");

    mip::Column col;
    REQUIRE(col.empty());
    col.addTerm(a, 2.5);
    col.addTerm(b, -1.0);

    REQUIRE(col.size() == 2);
    REQUIRE(col.toString() == "[2.5 a, -1 b]");
}
