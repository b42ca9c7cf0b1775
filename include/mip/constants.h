#pragma once
/*
===============================================================================
CONSTANTS — Tolerances and enumerations shared by the MIP modeling DSL
===============================================================================

OVERVIEW
--------
Central definitions used by every other header: numerical tolerances,
variable types, relational senses, objective senses and the optimization
status reported by a solver backend.

KEY COMPONENTS
--------------
• kCoefTolerance, kFeasibilityTolerance, INF
• VarType            — Binary / Continuous / Integer (single-letter codes)
• Sense              — None / Equal / LessOrEqual / GreaterOrEqual
• ObjectiveSense     — Minimize / Maximize
• OptimizationStatus — Outcome of Model::optimize()

CONVERSIONS
-----------
    mip::toVarType('B');          // VarType::Binary
    mip::toSense("<");            // Sense::LessOrEqual
    mip::senseSymbol(Sense::Equal) // "="

EXCEPTION SAFETY
----------------
• toVarType(): throws InvalidVariableType on unknown codes
• toSense(): throws InvalidSense on unknown symbols
• All other functions are noexcept

===============================================================================
*/

#include <limits>
#include <string_view>
#include <format>

#include "errors.h"

namespace mip {

    // ========================================================================
    // TOLERANCES
    // ========================================================================

    /// Coefficients with magnitude at or below this value are never stored
    inline constexpr double kCoefTolerance = 1e-12;

    /// Row activity slack accepted before a fixing is declared infeasible
    inline constexpr double kFeasibilityTolerance = 1e-6;

    /// Unbounded value used for default upper bounds
    inline constexpr double INF = std::numeric_limits<double>::infinity();

    // ========================================================================
    // VARIABLE TYPE
    // ========================================================================

    /**
     * @enum VarType
     * @brief Domain of a decision variable
     *
     * @details Underlying values are the single-letter codes used by the
     *          solver backends ('B', 'C', 'I').
     */
    enum class VarType : char {
        Binary = 'B',
        Continuous = 'C',
        Integer = 'I'
    };

    /// @brief True if v is one of the three declared enumerators
    [[nodiscard]] constexpr bool isValid(VarType v) noexcept {
        return v == VarType::Binary || v == VarType::Continuous ||
            v == VarType::Integer;
    }

    /**
     * @brief Parses a single-letter variable type code
     * @throws InvalidVariableType if code is not 'B', 'C' or 'I'
     */
    inline VarType toVarType(char code) {
        switch (code) {
            case 'B': return VarType::Binary;
            case 'C': return VarType::Continuous;
            case 'I': return VarType::Integer;
            default:
                throw InvalidVariableType(std::format(
                    "Expected one of ('B', 'C', 'I'), but got '{}'", code));
        }
    }

    // ========================================================================
    // SENSE
    // ========================================================================

    /**
     * @enum Sense
     * @brief Relational operator attached to a linear expression
     *
     * @details None marks a plain affine expression (objective, intermediate
     *          sums). The remaining values turn an expression into the body
     *          of a constraint "expr (sense) 0".
     */
    enum class Sense : char {
        None = '\0',
        Equal = '=',
        LessOrEqual = '<',
        GreaterOrEqual = '>'
    };

    /// @brief True if s is one of the four declared enumerators
    [[nodiscard]] constexpr bool isValid(Sense s) noexcept {
        return s == Sense::None || s == Sense::Equal ||
            s == Sense::LessOrEqual || s == Sense::GreaterOrEqual;
    }

    /**
     * @brief Short symbol of a sense: "", "=", "<" or ">"
     * @throws InvalidSense for values outside the enumeration
     */
    inline std::string_view senseSymbol(Sense s) {
        switch (s) {
            case Sense::None:           return "";
            case Sense::Equal:          return "=";
            case Sense::LessOrEqual:    return "<";
            case Sense::GreaterOrEqual: return ">";
        }
        throw InvalidSense(std::format("Invalid sense code {}",
            static_cast<int>(s)));
    }

    /**
     * @brief Parses "", "=", "<" or ">" (also "==", "<=", ">=")
     * @throws InvalidSense on any other text
     */
    inline Sense toSense(std::string_view symbol) {
        if (symbol.empty()) return Sense::None;
        if (symbol == "=" || symbol == "==") return Sense::Equal;
        if (symbol == "<" || symbol == "<=") return Sense::LessOrEqual;
        if (symbol == ">" || symbol == ">=") return Sense::GreaterOrEqual;
        throw InvalidSense(std::format("Invalid sense {}", symbol));
    }

    // ========================================================================
    // OBJECTIVE SENSE AND STATUS
    // ========================================================================

    enum class ObjectiveSense { Minimize, Maximize };

    /**
     * @enum OptimizationStatus
     * @brief Outcome of the last optimization
     *
     * @note Loaded means the problem was built but never optimized.
     */
    enum class OptimizationStatus : int {
        Error = -1,
        Optimal = 0,
        Infeasible = 1,
        Unbounded = 2,
        Feasible = 3,
        IntInfeasible = 4,
        NoSolutionFound = 5,
        Loaded = 6,
        Cutoff = 7,
        Other = 10000
    };

} // namespace mip
