#pragma once
/*
===============================================================================
DIAGNOSTICS — Model analysis and solution checking utilities
===============================================================================

Overview
--------
Free functions that inspect a Model through its handles and its Solver:

    * Human-readable status names
    * Model statistics (variables by type, rows, non-zeros, row senses)
    * Solution quality (constraint, bound and integrality violations)
    * One-line model summaries

Together with the stream operators of LinExpr, Var, Constr and Column these
are the reporting layer of the library; solver output itself is switched
with Model::quiet() / Model::verbose().

Design Philosophy
-----------------
1. Free functions operating on a const Model, independent of the backend
2. Lightweight result structs
3. Unknown solution values propagate as std::nullopt, never as 0.0

Typical Usage
-------------
    model.optimize();
    std::cout << mip::statusString(model.status()) << "\n";
    std::cout << mip::modelSummary(model) << "\n";

    if (auto q = mip::computeSolutionQuality(model)) {
        std::cout << "Max violation: " << q->maxConstrViolation << "\n";
    }

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

#include "constants.h"
#include "model.h"

namespace mip {

// =============================================================================
// STATUS STRING CONVERSION
// =============================================================================

/**
 * @brief Convert an optimization status to its upper-case name
 *
 * @example
 *     std::cout << statusString(model.status()) << "\n";   // "OPTIMAL"
 */
inline std::string statusString(OptimizationStatus status) {
    switch (status) {
        case OptimizationStatus::Error:           return "ERROR";
        case OptimizationStatus::Optimal:         return "OPTIMAL";
        case OptimizationStatus::Infeasible:      return "INFEASIBLE";
        case OptimizationStatus::Unbounded:       return "UNBOUNDED";
        case OptimizationStatus::Feasible:        return "FEASIBLE";
        case OptimizationStatus::IntInfeasible:   return "INT_INFEASIBLE";
        case OptimizationStatus::NoSolutionFound: return "NO_SOLUTION_FOUND";
        case OptimizationStatus::Loaded:          return "LOADED";
        case OptimizationStatus::Cutoff:          return "CUTOFF";
        case OptimizationStatus::Other:           return "OTHER";
    }
    return "UNKNOWN(" + std::to_string(static_cast<int>(status)) + ")";
}

// =============================================================================
// MODEL STATISTICS
// =============================================================================

/**
 * @brief Snapshot of model size and composition
 */
struct ModelStatistics {
    int numVars = 0;          ///< Total number of variables
    int numConstrs = 0;       ///< Total number of linear constraints
    int numBinary = 0;        ///< Number of binary variables
    int numInteger = 0;       ///< Number of general integer variables
    int numContinuous = 0;    ///< Number of continuous variables
    int numNonZeros = 0;      ///< Non-zero coefficients in the constraint matrix
    int numEquality = 0;      ///< Rows with sense "="
    int numLessEqual = 0;     ///< Rows with sense "<="
    int numGreaterEqual = 0;  ///< Rows with sense ">="
};

/**
 * @brief Compute statistics for a model
 *
 * @example
 *     auto stats = computeStatistics(model);
 *     std::cout << "Vars: " << stats.numVars
 *               << ", Binary: " << stats.numBinary << "\n";
 */
inline ModelStatistics computeStatistics(const Model& model) {
    ModelStatistics stats;
    stats.numVars = model.numCols();
    stats.numConstrs = model.numRows();

    for (const Var& v : model.vars()) {
        switch (v.varType()) {
            case VarType::Binary:     ++stats.numBinary; break;
            case VarType::Integer:    ++stats.numInteger; break;
            case VarType::Continuous: ++stats.numContinuous; break;
        }
    }

    for (const Constr& c : model.constrs()) {
        stats.numNonZeros += static_cast<int>(model.solver().constrGetRow(c.idx()).size());
        switch (c.sense()) {
            case Sense::Equal:          ++stats.numEquality; break;
            case Sense::LessOrEqual:    ++stats.numLessEqual; break;
            case Sense::GreaterOrEqual: ++stats.numGreaterEqual; break;
            default: break;
        }
    }
    return stats;
}

// =============================================================================
// SOLUTION QUALITY
// =============================================================================

/**
 * @brief Violation metrics of the current solution
 */
struct SolutionQuality {
    double maxConstrViolation = 0.0;  ///< Maximum constraint violation
    double sumConstrViolation = 0.0;  ///< Sum of all constraint violations
    int numViolated = 0;              ///< Rows violated beyond the tolerance
    double maxBoundViolation = 0.0;   ///< Maximum variable bound violation
    double maxIntViolation = 0.0;     ///< Maximum integrality violation
};

/**
 * @brief Evaluate every row and bound at the current solution
 * @param tolerance Violation above which a row counts as violated
 * @return nullopt if any variable value is unknown
 *
 * @example
 *     if (auto q = computeSolutionQuality(model); q && q->numViolated > 0) {
 *         std::cout << "Warning: constraint violation detected\n";
 *     }
 */
inline std::optional<SolutionQuality> computeSolutionQuality(const Model& model,
    double tolerance = kFeasibilityTolerance)
{
    SolutionQuality quality;

    for (const Constr& c : model.constrs()) {
        std::optional<double> violation = c.expr().violation();
        if (!violation) {
            return std::nullopt;
        }
        quality.maxConstrViolation = std::max(quality.maxConstrViolation, *violation);
        quality.sumConstrViolation += *violation;
        if (*violation > tolerance) {
            ++quality.numViolated;
        }
    }

    for (const Var& v : model.vars()) {
        std::optional<double> x = v.x();
        if (!x) {
            return std::nullopt;
        }
        const double boundViolation = std::max({ v.lb() - *x, *x - v.ub(), 0.0 });
        quality.maxBoundViolation = std::max(quality.maxBoundViolation, boundViolation);

        if (v.varType() != VarType::Continuous) {
            quality.maxIntViolation = std::max(quality.maxIntViolation,
                std::abs(*x - std::round(*x)));
        }
    }

    return quality;
}

// =============================================================================
// CONVENIENCE FUNCTIONS
// =============================================================================

/// @brief True if the model has no binary or integer variables
inline bool isLP(const Model& model) {
    return std::ranges::all_of(model.vars(), [](const Var& v) {
        return v.varType() == VarType::Continuous;
    });
}

inline bool isMIP(const Model& model) {
    return !isLP(model);
}

/**
 * @brief Brief summary of model statistics
 * @return Summary string like "100 vars (50 bin, 10 int), 200 constrs, 640 nz"
 */
inline std::string modelSummary(const Model& model) {
    auto stats = computeStatistics(model);

    std::string result = std::to_string(stats.numVars) + " vars";

    if (stats.numBinary > 0 || stats.numInteger > 0) {
        result += " (";
        if (stats.numBinary > 0) {
            result += std::to_string(stats.numBinary) + " bin";
            if (stats.numInteger > 0) result += ", ";
        }
        if (stats.numInteger > 0) {
            result += std::to_string(stats.numInteger) + " int";
        }
        result += ")";
    }

    result += ", " + std::to_string(stats.numConstrs) + " constrs";
    result += ", " + std::to_string(stats.numNonZeros) + " nz";

    return result;
}

} // namespace mip
