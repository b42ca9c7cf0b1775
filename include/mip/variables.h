#pragma once
/*
===============================================================================
VARIABLES — Index-based decision variable handles
===============================================================================

OVERVIEW
--------
A Var is a lightweight reference into the variable table of a Model: a
non-owning back-pointer to the model plus the variable's stable index. It
carries no other state. Every attribute read or write (bounds, name, type,
objective coefficient, column, solution values) is forwarded to the model's
Solver.

KEY COMPONENTS
--------------
• Var                     — handle with delegating accessors
• std::hash<Var>          — hashes the index
• std::equal_to<Var>      — compares indices (== is reserved for algebra)
• std::less<Var>          — orders by index

USAGE EXAMPLES
--------------
    mip::Var x = model.addVar("x", 0, 10);
    x.setUB(5);
    x.setVarType(mip::VarType::Integer);

    model.optimize();
    if (auto v = x.x()) {
        std::cout << x << " = " << *v << "\n";
    }

    std::unordered_map<mip::Var, double> weights;   // keyed by index
    weights[x] = 2.0;

DESIGN NOTES
------------
• operator==, <= and >= on Var build constraint expressions (expressions.h);
  identity comparison goes through sameAs() or std::equal_to<Var>.
• Handles are cheap to copy; they stay valid for the lifetime of the model.
• Accessor bodies live in model.h, after Model is complete. Include
  <mip/mip.h> to get the full definitions.

EXCEPTION SAFETY
----------------
• setVarType(): InvalidVariableType before the solver is reached
• Other accessors propagate backend exceptions

INCLUDING
---------
• The accessors forward to the Model and are defined in model.h. Include
  <mip/model.h> or <mip/mip.h>; this header alone does not link.

===============================================================================
*/

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include "constants.h"

namespace mip {

class Model;
class Column;

// ============================================================================
// VARIABLE HANDLE
// ============================================================================
/**
 * @class Var
 * @brief Decision variable of a Model, identified by its index
 *
 * @note Variables are created with Model::addVar(); they are never
 *       destroyed individually.
 */
class Var {
    private:
        Model* model_;  ///< Owning model (non-owning pointer)
        int    idx_;    ///< Position in the model's variable table

    public:
        Var(Model* model, int idx) noexcept
            : model_(model), idx_(idx) {
        }

        // ========================================================================
        // IDENTITY
        // ========================================================================

        [[nodiscard]] int idx() const noexcept { return idx_; }

        /// @brief Model this variable belongs to
        [[nodiscard]] Model& model() const noexcept { return *model_; }

        /// @brief Pointer form of model(), used for ownership checks
        [[nodiscard]] Model* modelPtr() const noexcept { return model_; }

        /// @brief Identity comparison (same index)
        [[nodiscard]] bool sameAs(const Var& other) const noexcept {
            return idx_ == other.idx_;
        }

        // ========================================================================
        // ATTRIBUTES (delegated to the solver)
        // ========================================================================

        std::string name() const;
        void setName(const std::string& name);

        double lb() const;
        void setLB(double value);

        double ub() const;
        void setUB(double value);

        /// @brief Coefficient in the objective function
        double obj() const;
        void setObj(double value);

        VarType varType() const;

        /**
         * @brief Changes the variable domain
         * @throws InvalidVariableType if type is not Binary, Continuous or Integer
         */
        void setVarType(VarType type);

        /// @brief Parses 'B', 'C' or 'I' and forwards to setVarType(VarType)
        void setVarType(char code);

        /// @brief Coefficients of this variable in every constraint
        Column column() const;
        void setColumn(const Column& column);

        // ========================================================================
        // SOLUTION VALUES (read-only)
        // ========================================================================

        /// @brief Reduced cost; only after an LP (all continuous) was solved
        std::optional<double> rc() const;

        /// @brief Value in the best solution; nullopt without solution
        std::optional<double> x() const;

        /**
         * @brief Value in the i-th solution of the solution pool
         * @return nullopt unless the model status is Optimal or Feasible and
         *         the solver holds solution i
         */
        std::optional<double> xi(int i) const;

        // ========================================================================
        // RENDERING
        // ========================================================================

        /// @brief Variable name, or "var(idx)" when unnamed
        std::string toString() const;
};

std::ostream& operator<<(std::ostream& os, const Var& v);

} // namespace mip

// ============================================================================
// STANDARD LIBRARY INTEGRATION
// ============================================================================

template<>
struct std::hash<mip::Var> {
    std::size_t operator()(const mip::Var& v) const noexcept {
        return std::hash<int>{}(v.idx());
    }
};

template<>
struct std::equal_to<mip::Var> {
    bool operator()(const mip::Var& a, const mip::Var& b) const noexcept {
        return a.sameAs(b);
    }
};

template<>
struct std::less<mip::Var> {
    bool operator()(const mip::Var& a, const mip::Var& b) const noexcept {
        return a.idx() < b.idx();
    }
};
