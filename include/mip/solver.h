#pragma once
/*
===============================================================================
SOLVER — Abstract capability every model delegates its state to
===============================================================================

OVERVIEW
--------
The modeling layer stores no bounds, names, types or solution values of its
own. Variable and constraint handles forward every read and write to the
Solver owned by their model, keyed by the stable integer index of the
variable or constraint. Backends (see gurobi_solver.h) implement this
interface on top of a concrete optimization engine.

KEY COMPONENTS
--------------
• SparseVector   — (indices, values) pair carrying a row or a column
• ConflictNodes  — variables conflicting with a literal, split by value
• Solver         — pure virtual interface

CONVENTIONS
-----------
• Variables and constraints are numbered 0, 1, 2, ... in insertion order
• A row stores constraint "Σ values[k]·x[indices[k]] (sense) rhs"
• Values that may be unavailable (no solve yet, LP-only duals, pool index
  out of range) are returned as std::optional and never as 0.0
• Conflict queries address a binary literal as (variable index, value)

THREAD SAFETY
-------------
• Implementations are not required to be thread-safe

===============================================================================
*/

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "constants.h"

namespace mip {

    /**
     * @struct SparseVector
     * @brief Positional pairing of indices and coefficients
     *
     * @invariant indices.size() == values.size()
     */
    struct SparseVector {
        std::vector<int> indices;
        std::vector<double> values;

        [[nodiscard]] std::size_t size() const noexcept { return indices.size(); }
        [[nodiscard]] bool empty() const noexcept { return indices.empty(); }

        void add(int index, double value) {
            indices.push_back(index);
            values.push_back(value);
        }
    };

    /// Variables conflicting with a literal: first when set to one, second when set to zero
    using ConflictNodes = std::pair<std::vector<int>, std::vector<int>>;

    /**
     * @class Solver
     * @brief Index-keyed storage and optimization engine behind a Model
     */
    class Solver {
    public:
        virtual ~Solver() = default;

        /// @brief Human-readable backend name ("gurobi", ...)
        virtual std::string solverName() const = 0;

        // --------------------------------------------------------------------
        // Model building
        // --------------------------------------------------------------------

        /// @brief Appends a variable; returns its index
        virtual int addVar(const std::string& name, double lb, double ub,
            double obj, VarType type, const SparseVector& column) = 0;

        /// @brief Appends a constraint "row (sense) rhs"; returns its index
        virtual int addConstr(const SparseVector& row, Sense sense, double rhs,
            const std::string& name) = 0;

        /// @brief Replaces the objective; variables not in row get coefficient 0
        virtual void setObjective(const SparseVector& row, double constant,
            ObjectiveSense sense) = 0;

        virtual double objectiveConst() = 0;
        virtual ObjectiveSense objectiveSense() = 0;

        virtual int numVars() = 0;
        virtual int numConstrs() = 0;

        /// @brief Sets an engine parameter by name (e.g. "TimeLimit", "10")
        virtual void setParam(const std::string& name, const std::string& value) = 0;

        // --------------------------------------------------------------------
        // Optimization
        // --------------------------------------------------------------------

        virtual OptimizationStatus optimize() = 0;
        virtual std::optional<double> objectiveValue() = 0;
        virtual int numSolutions() = 0;

        // --------------------------------------------------------------------
        // Variables
        // --------------------------------------------------------------------

        virtual std::string varGetName(int idx) = 0;
        virtual void varSetName(int idx, const std::string& name) = 0;
        virtual double varGetLB(int idx) = 0;
        virtual void varSetLB(int idx, double value) = 0;
        virtual double varGetUB(int idx) = 0;
        virtual void varSetUB(int idx, double value) = 0;
        virtual double varGetObj(int idx) = 0;
        virtual void varSetObj(int idx, double value) = 0;
        virtual VarType varGetType(int idx) = 0;
        virtual void varSetType(int idx, VarType type) = 0;

        /// @brief Constraint indices and coefficients of the variable's column
        virtual SparseVector varGetColumn(int idx) = 0;

        /// @brief Replaces every coefficient of the variable's column
        virtual void varSetColumn(int idx, const SparseVector& column) = 0;

        virtual std::optional<double> varGetRC(int idx) = 0;
        virtual std::optional<double> varGetX(int idx) = 0;

        /// @brief Value in the i-th pool solution
        virtual std::optional<double> varGetXi(int idx, int solution) = 0;

        // --------------------------------------------------------------------
        // Constraints
        // --------------------------------------------------------------------

        virtual double constrGetRHS(int idx) = 0;
        virtual void constrSetRHS(int idx, double rhs) = 0;
        virtual Sense constrGetSense(int idx) = 0;
        virtual SparseVector constrGetRow(int idx) = 0;

        /// @brief Replaces row, sense and right-hand side of a constraint
        virtual void constrSetRow(int idx, const SparseVector& row, Sense sense,
            double rhs) = 0;

        virtual std::string constrGetName(int idx) = 0;
        virtual std::optional<double> constrGetSlack(int idx) = 0;
        virtual std::optional<double> constrGetPi(int idx) = 0;

        // --------------------------------------------------------------------
        // Conflict graph
        // --------------------------------------------------------------------

        /// @brief True if "x[var1] = value1" and "x[var2] = value2" cannot both hold
        virtual bool conflicting(int var1, bool value1, int var2, bool value2) = 0;

        virtual ConflictNodes conflictingNodes(int var, bool value) = 0;
    };

} // namespace mip
