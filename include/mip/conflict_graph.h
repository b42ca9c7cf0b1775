#pragma once
/*
===============================================================================
CONFLICT GRAPH — Queries on conflicting binary assignments
===============================================================================

OVERVIEW
--------
Read-only view of the conflicts the model's Solver derives from its rows.
Arguments are literals given as Operands:

    x               the positive literal  "x = 1"
    x == 0          the negative literal  "x = 0"

Any other argument is rejected with TypeMismatch before the solver is
consulted. Results are not cached; each query goes to the Solver.

USAGE EXAMPLES
--------------
    mip::ConflictGraph cg = model.conflictGraph();

    if (cg.conflicting(x, y)) { ... }          // x = 1 and y = 1 ?
    if (cg.conflicting(x, y == 0)) { ... }     // x = 1 and y = 0 ?

    auto [atOne, atZero] = cg.conflictingAssignments(x);

EXCEPTION SAFETY
----------------
• TypeMismatch for arguments that are neither a Var nor "x == 0"
• ModelMismatch for literals over variables of another model

INCLUDING
---------
• ConflictGraph members are defined in model.h; include <mip/model.h> or
  <mip/mip.h>.

===============================================================================
*/

#include <cmath>
#include <format>
#include <utility>
#include <vector>

#include "constants.h"
#include "errors.h"
#include "expressions.h"
#include "variables.h"

namespace mip {

    /**
     * @struct Literal
     * @brief A binary variable together with the value it is fixed to
     */
    struct Literal {
        Var var;
        bool value;

        /**
         * @brief Interprets an Operand as a literal
         * @throws TypeMismatch unless op is a Var or an expression "x == 0"
         */
        static Literal from(const Operand& op) {
            if (const Var* v = op.var()) {
                return { *v, true };
            }
            if (const LinExpr* e = op.expr()) {
                if (e->sense() == Sense::Equal && e->size() == 1 &&
                    e->constant() == 0.0)
                {
                    const auto& [idx, coeff] = *e->terms().begin();
                    if (std::abs(coeff - 1.0) <= kCoefTolerance) {
                        return { Var(e->model(), idx), false };
                    }
                }
                // Built from the expression alone; the solver is not consulted
                throw TypeMismatch(std::format(
                    "A linear expression may only encode the complement of a "
                    "variable (x == 0), got {} with {} term(s), sense code {} "
                    "and constant {}", op.kindName(), e->size(),
                    static_cast<int>(e->sense()), e->constant()));
            }
            throw TypeMismatch(std::format(
                "type {} not supported as a conflict graph literal", op.kindName()));
        }
    };

    /**
     * @class ConflictGraph
     * @brief Conflict queries on the binary variables of one Model
     */
    class ConflictGraph {
    private:
        Model* model_;

    public:
        explicit ConflictGraph(Model& model) noexcept
            : model_(&model) {
        }

        [[nodiscard]] Model& model() const noexcept { return *model_; }

        /// @brief True if both assignments cannot hold at the same time
        bool conflicting(const Operand& e1, const Operand& e2) const;

        /**
         * @brief All assignments conflicting with e
         * @return (variables that conflict when set to one,
         *          variables that conflict when set to zero)
         */
        std::pair<std::vector<Var>, std::vector<Var>>
            conflictingAssignments(const Operand& e) const;

    private:
        Literal literal(const Operand& op) const;
    };

} // namespace mip
