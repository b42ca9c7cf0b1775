#pragma once
/*
===============================================================================
CONSTRAINTS — Constraint handles and sparse columns
===============================================================================

OVERVIEW
--------
Mirrors the variable system. A Constr is an index-based reference into the
constraint table of a Model; right-hand side, sense, row, name, slack and
dual value are all read from (and written to) the model's Solver. A Column
is the transposed view of the constraint matrix for one variable: the
constraints it appears in, paired positionally with its coefficients.

KEY COMPONENTS
--------------
• Constr            — constraint handle, identity by index
• Column            — parallel (constrs, coeffs) sequences
• std::hash<Constr> — hashes the index

USAGE EXAMPLES
--------------
    mip::Constr cap = model.addConstr(x + y <= 10, "cap");
    cap.setRHS(12);
    std::cout << cap << "\n";            // cap: +1 x +1 y <= 12

    // A new variable entering existing rows
    mip::Column col({cap, demand}, {1.0, -2.0});
    mip::Var z = model.addVar("z", 0, mip::INF, 3.0,
                              mip::VarType::Continuous, col);

EXCEPTION SAFETY
----------------
• Column(constrs, coeffs): throws LengthMismatch on different sizes
• Constr::toString(): throws InvalidSense for a senseless row
• Constr::setExpr(): throws InvalidSense / ModelMismatch before delegation

INCLUDING
---------
• Constr accessors are defined in model.h; include <mip/model.h> or
  <mip/mip.h>.

===============================================================================
*/

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "constants.h"
#include "variables.h"

namespace mip {

    class LinExpr;

    // ============================================================================
    // CONSTRAINT HANDLE
    // ============================================================================
    /**
     * @class Constr
     * @brief A row of the constraint matrix, identified by its index
     *
     * @details Constraints are created by Model::addConstr() from a linear
     *          expression carrying a sense. The stored form is
     *          "expr (sense) rhs" with rhs == -expr.constant().
     */
    class Constr {
    private:
        Model* model_;
        int    idx_;

    public:
        Constr(Model* model, int idx) noexcept
            : model_(model), idx_(idx) {
        }

        [[nodiscard]] int idx() const noexcept { return idx_; }
        [[nodiscard]] Model& model() const noexcept { return *model_; }

        friend bool operator==(const Constr& a, const Constr& b) noexcept {
            return a.idx_ == b.idx_;
        }

        // ---------------------------------------------------------------------
        // Attributes
        // ---------------------------------------------------------------------

        double rhs() const;
        void setRHS(double rhs);

        Sense sense() const;

        /// @brief Linear expression defining the constraint (constant == -rhs)
        LinExpr expr() const;

        /**
         * @brief Replaces the whole row, sense and right-hand side
         * @throws InvalidSense if expr carries no sense
         * @throws ModelMismatch if expr uses variables of another model
         */
        void setExpr(const LinExpr& expr);

        std::string name() const;

        // ---------------------------------------------------------------------
        // Solution values (read-only)
        // ---------------------------------------------------------------------

        /// @brief Slack in the current solution; nullopt when unavailable
        std::optional<double> slack() const;

        /// @brief Dual value; only for LPs (all continuous) solved to optimality
        std::optional<double> pi() const;

        /// @brief "name: +c x +c y <= rhs", wrapped after 75 characters
        std::string toString() const;
    };

    std::ostream& operator<<(std::ostream& os, const Constr& c);

    // ============================================================================
    // COLUMN
    // ============================================================================
    /**
     * @class Column
     * @brief Non-zero entries of one variable in the constraint matrix
     *
     * @invariant constrs().size() == coeffs().size()
     */
    class Column {
    private:
        std::vector<Constr> constrs_;
        std::vector<double> coeffs_;

    public:
        Column() = default;

        /// @throws LengthMismatch if the two sequences differ in length
        Column(std::vector<Constr> constrs, std::vector<double> coeffs);

        void addTerm(const Constr& constr, double coeff) {
            constrs_.push_back(constr);
            coeffs_.push_back(coeff);
        }

        [[nodiscard]] const std::vector<Constr>& constrs() const noexcept { return constrs_; }
        [[nodiscard]] const std::vector<double>& coeffs() const noexcept { return coeffs_; }

        [[nodiscard]] std::size_t size() const noexcept { return constrs_.size(); }
        [[nodiscard]] bool empty() const noexcept { return constrs_.empty(); }

        /// @brief "[coeff name, coeff name, ...]"
        std::string toString() const;
    };

    std::ostream& operator<<(std::ostream& os, const Column& col);

} // namespace mip

template<>
struct std::hash<mip::Constr> {
    std::size_t operator()(const mip::Constr& c) const noexcept {
        return std::hash<int>{}(c.idx());
    }
};
