#pragma once
/*
===============================================================================
CONFLICT DETECTION — Pairwise conflicts between binary literals
===============================================================================

OVERVIEW
--------
Derives the conflict graph of a model directly from its constraint rows, in
the spirit of the static conflict graphs built by branch-and-cut codes. A
literal is a binary variable fixed to one or to zero. Two literals conflict
when some row holding both variables can no longer be satisfied once the two
are fixed, even with every other variable of the row at its most favourable
bound.

Backends implement Solver::conflicting() / conflictingNodes() by forwarding
to a ConflictDetector built over themselves; the detector only reads the
model through the Solver accessors.

RULES
-----
• "x = 1" and "x = 0" always conflict
• A variable is binary if its type is Binary, or Integer with bounds in [0,1]
• Literals of non-binary variables never conflict
• For a row "a·x (<=) rhs" the minimum activity of the unfixed part is used,
  for ">=" the maximum, for "=" both; a row is violated when it misses the
  rhs by more than kFeasibilityTolerance
• Bounds with magnitude >= kInfiniteBound are treated as infinite

USAGE EXAMPLES
--------------
    mip::ConflictDetector detector(solver);
    detector.conflicting(0, true, 1, true);      // x0 = 1 and x1 = 1 ?
    auto [ones, zeros] = detector.conflictingNodes(0, true);

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <set>
#include <vector>

#include "constants.h"
#include "solver.h"

namespace mip {

    /// Bound magnitude from which a bound counts as infinite (Gurobi uses 1e100)
    inline constexpr double kInfiniteBound = 1e20;

    /**
     * @class ConflictDetector
     * @brief Answers conflict queries by inspecting the solver's rows
     *
     * @note Stateless apart from the solver reference; nothing is cached, so
     *       answers always reflect the current rows and bounds.
     */
    class ConflictDetector {
    private:
        Solver& solver_;

        struct Fixing {
            int var;
            double value;
        };

    public:
        explicit ConflictDetector(Solver& solver)
            : solver_(solver) {
        }

        /// @brief True if var has a binary domain
        [[nodiscard]] bool isBinary(int var) const {
            const VarType type = solver_.varGetType(var);
            if (type == VarType::Binary) {
                return true;
            }
            if (type != VarType::Integer) {
                return false;
            }
            return solver_.varGetLB(var) >= -kFeasibilityTolerance &&
                   solver_.varGetUB(var) <= 1.0 + kFeasibilityTolerance;
        }

        /**
         * @brief True if "x[var1] = value1" and "x[var2] = value2" cannot both hold
         */
        [[nodiscard]] bool conflicting(int var1, bool value1, int var2, bool value2) const {
            if (!isBinary(var1) || !isBinary(var2)) {
                return false;
            }
            if (var1 == var2) {
                return value1 != value2;
            }

            const Fixing fixed[2] = {
                { var1, value1 ? 1.0 : 0.0 },
                { var2, value2 ? 1.0 : 0.0 }
            };

            const SparseVector column = solver_.varGetColumn(var1);
            for (int row : column.indices) {
                const SparseVector entries = solver_.constrGetRow(row);
                bool holdsBoth = false;
                for (int j : entries.indices) {
                    if (j == var2) {
                        holdsBoth = true;
                        break;
                    }
                }
                if (holdsBoth && rowViolated(row, entries, fixed)) {
                    return true;
                }
            }
            return false;
        }

        /**
         * @brief Variables whose literals conflict with "x[var] = value"
         * @return (conflicts at one, conflicts at zero), each sorted by index,
         *         never containing var itself
         */
        [[nodiscard]] ConflictNodes conflictingNodes(int var, bool value) const {
            ConflictNodes result;
            if (!isBinary(var)) {
                return result;
            }

            std::set<int> neighbours;
            const SparseVector column = solver_.varGetColumn(var);
            for (int row : column.indices) {
                for (int j : solver_.constrGetRow(row).indices) {
                    if (j != var) {
                        neighbours.insert(j);
                    }
                }
            }

            for (int j : neighbours) {
                if (!isBinary(j)) {
                    continue;
                }
                if (conflicting(var, value, j, true)) {
                    result.first.push_back(j);
                }
                if (conflicting(var, value, j, false)) {
                    result.second.push_back(j);
                }
            }
            return result;
        }

    private:
        static bool isInfinite(double bound) noexcept {
            return std::abs(bound) >= kInfiniteBound;
        }

        // Activity bounds of a row with two variables fixed; an infinite
        // bound makes the corresponding side unbounded.
        bool rowViolated(int row, const SparseVector& entries, const Fixing (&fixed)[2]) const {
            double minActivity = 0.0;
            double maxActivity = 0.0;
            bool minFinite = true;
            bool maxFinite = true;

            for (std::size_t k = 0; k < entries.size(); ++k) {
                const int j = entries.indices[k];
                const double a = entries.values[k];

                if (j == fixed[0].var || j == fixed[1].var) {
                    const double v = j == fixed[0].var ? fixed[0].value : fixed[1].value;
                    minActivity += a * v;
                    maxActivity += a * v;
                    continue;
                }

                const double lb = solver_.varGetLB(j);
                const double ub = solver_.varGetUB(j);
                const double low = a > 0 ? lb : ub;
                const double high = a > 0 ? ub : lb;

                if (isInfinite(low)) minFinite = false;
                else minActivity += a * low;

                if (isInfinite(high)) maxFinite = false;
                else maxActivity += a * high;
            }

            const double rhs = solver_.constrGetRHS(row);
            const Sense sense = solver_.constrGetSense(row);

            const bool aboveRhs = minFinite && minActivity > rhs + kFeasibilityTolerance;
            const bool belowRhs = maxFinite && maxActivity < rhs - kFeasibilityTolerance;

            switch (sense) {
                case Sense::LessOrEqual:    return aboveRhs;
                case Sense::GreaterOrEqual: return belowRhs;
                case Sense::Equal:          return aboveRhs || belowRhs;
                default:                    return false;
            }
        }
    };

} // namespace mip
