#pragma once
/*
===============================================================================
MIP MODELING DSL — Unified Include Header
===============================================================================

OVERVIEW
--------
Single include for the algebraic modeling layer: linear expressions,
variable and constraint handles, columns, the conflict graph and the Model
that hands everything to an optimization engine through the Solver
interface.

WHAT'S INCLUDED
---------------
• constants.h          — tolerances, VarType, Sense, OptimizationStatus
• errors.h             — exception types
• naming.h             — debug/release generated names
• data_store.h         — type-erased key-value storage
• solver.h             — abstract backend interface
• variables.h          — Var handle
• constraints.h        — Constr handle, Column
• expressions.h        — LinExpr, Operand, operators, xsum(), sum()
• conflict_detection.h — row-based conflict detection for backends
• conflict_graph.h     — ConflictGraph queries
• model.h              — Model
• diagnostics.h        — statistics, solution quality, summaries

The Gurobi backend is not included here; include <mip/gurobi_solver.h> and
link mip_dsl_gurobi to use it.

QUICK START
-----------
    #include <mip/mip.h>
    #include <mip/gurobi_solver.h>

    int main() {
        mip::Model model(std::make_unique<mip::GurobiSolver>());

        mip::Var x1 = model.addVar("x1", 0, 10);
        mip::Var x2 = model.addVar("x2", 0, 10);

        model += x1 + 2 * x2 <= 14;
        model += 3 * x1 - x2 >= 0;
        model.maximize(3 * x1 + 2 * x2);

        if (model.optimize() == mip::OptimizationStatus::Optimal) {
            std::cout << x1 << " = " << *x1.x() << "\n";
        }
        return 0;
    }

REQUIREMENTS
------------
• C++20 compiler (GCC 13+, Clang 17+, MSVC 19.29+) for <format> and <ranges>
• Gurobi Optimizer 10.0+ with C++ API (backend only)

CONFIGURATION
-------------
• MIP_DEBUG (or _DEBUG): human-readable names for Model::addVars()

===============================================================================
*/

// ============================================================================
// CORE COMPONENTS (order matters for dependencies)
// ============================================================================

// Tolerances, enums and exceptions (no dependencies)
#include "errors.h"
#include "constants.h"

// Naming and data store (no dependencies)
#include "naming.h"
#include "data_store.h"

// Backend interface (depends on constants)
#include "solver.h"

// Handles and expressions
#include "variables.h"
#include "constraints.h"
#include "expressions.h"

// ============================================================================
// MODEL LAYER
// ============================================================================

#include "conflict_detection.h"
#include "conflict_graph.h"

// Model (completes Var, Constr, Column and ConflictGraph)
#include "model.h"

// Diagnostics (operates on Model)
#include "diagnostics.h"
