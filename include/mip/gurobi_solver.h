#pragma once
/*
===============================================================================
GUROBI SOLVER — Solver backend on top of the Gurobi C++ API
===============================================================================

OVERVIEW
--------
Implements mip::Solver with a GRBModel. Variables and constraints are kept
in insertion order in parallel GRBVar / GRBConstr tables, so the indices
used by the modeling layer are positions in these tables.

ENVIRONMENT
-----------
• GurobiSolver()          creates and owns a quiet environment
                          (OutputFlag = 0, started after configuration)
• GurobiSolver(GRBEnv&)   borrows a caller-managed environment, which must
                          outlive the solver

Gurobi applies modifications lazily; the backend calls update() before any
attribute read that follows a modification.

STATUS MAPPING
--------------
    GRB_OPTIMAL                          Optimal
    GRB_INFEASIBLE                       Infeasible (IntInfeasible for MIPs)
    GRB_INF_OR_UNBD                      Infeasible
    GRB_UNBOUNDED                        Unbounded
    GRB_CUTOFF                           Cutoff
    limits, interruption, suboptimal     Feasible if a solution exists,
                                         NoSolutionFound otherwise
    GRB_NUMERIC                          Error
    GRB_LOADED                           Loaded

USAGE EXAMPLES
--------------
    mip::Model model(std::make_unique<mip::GurobiSolver>());

    GRBEnv env(true);
    env.set(GRB_StringParam_LogFile, "run.log");
    env.start();
    mip::Model logged(std::make_unique<mip::GurobiSolver>(env));

EXCEPTION SAFETY
----------------
• GRBException propagates unchanged (license, invalid parameter, ...)
• Index arguments are range-checked: std::out_of_range

===============================================================================
*/

#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "gurobi_c++.h"

#include "conflict_detection.h"
#include "constants.h"
#include "solver.h"

namespace mip {

    /**
     * @class GurobiSolver
     * @brief Solver backed by a GRBModel
     */
    class GurobiSolver : public Solver {
    private:
        std::unique_ptr<GRBEnv> ownedEnv_;    ///< null when the env is borrowed
        GRBModel model_;
        std::vector<GRBVar> vars_;
        std::vector<GRBConstr> constrs_;
        bool pending_ = false;                ///< modifications not yet applied

    public:
        GurobiSolver()
            : ownedEnv_(makeQuietEnv()), model_(*ownedEnv_) {
        }

        explicit GurobiSolver(GRBEnv& env)
            : model_(env) {
        }

        GurobiSolver(const GurobiSolver&) = delete;
        GurobiSolver& operator=(const GurobiSolver&) = delete;

        /// @brief Underlying Gurobi model, for features outside the Solver interface
        GRBModel& grbModel() {
            sync();
            return model_;
        }

        std::string solverName() const override { return "gurobi"; }

        // ---------------------------------------------------------------------
        // Model building
        // ---------------------------------------------------------------------

        int addVar(const std::string& name, double lb, double ub, double obj,
            VarType type, const SparseVector& column) override
        {
            GRBColumn col;
            for (std::size_t k = 0; k < column.size(); ++k) {
                col.addTerm(column.values[k], constrAt(column.indices[k]));
            }
            vars_.push_back(model_.addVar(toGurobiBound(lb), toGurobiBound(ub), obj,
                static_cast<char>(type), col, name));
            pending_ = true;
            return static_cast<int>(vars_.size()) - 1;
        }

        int addConstr(const SparseVector& row, Sense sense, double rhs,
            const std::string& name) override
        {
            constrs_.push_back(model_.addConstr(toGurobiExpr(row),
                toGurobiSense(sense), rhs, name));
            pending_ = true;
            return static_cast<int>(constrs_.size()) - 1;
        }

        void setObjective(const SparseVector& row, double constant,
            ObjectiveSense sense) override
        {
            GRBLinExpr obj = toGurobiExpr(row);
            obj += constant;
            model_.setObjective(obj, sense == ObjectiveSense::Maximize
                ? GRB_MAXIMIZE : GRB_MINIMIZE);
            pending_ = true;
        }

        double objectiveConst() override {
            sync();
            return model_.get(GRB_DoubleAttr_ObjCon);
        }

        ObjectiveSense objectiveSense() override {
            sync();
            return model_.get(GRB_IntAttr_ModelSense) == GRB_MAXIMIZE
                ? ObjectiveSense::Maximize : ObjectiveSense::Minimize;
        }

        int numVars() override { return static_cast<int>(vars_.size()); }
        int numConstrs() override { return static_cast<int>(constrs_.size()); }

        void setParam(const std::string& name, const std::string& value) override {
            model_.set(name, value);
        }

        // ---------------------------------------------------------------------
        // Optimization
        // ---------------------------------------------------------------------

        OptimizationStatus optimize() override {
            sync();
            model_.optimize();

            switch (model_.get(GRB_IntAttr_Status)) {
                case GRB_LOADED:
                    return OptimizationStatus::Loaded;
                case GRB_OPTIMAL:
                    return OptimizationStatus::Optimal;
                case GRB_INFEASIBLE:
                    return isMIP() ? OptimizationStatus::IntInfeasible
                                   : OptimizationStatus::Infeasible;
                case GRB_INF_OR_UNBD:
                    return OptimizationStatus::Infeasible;
                case GRB_UNBOUNDED:
                    return OptimizationStatus::Unbounded;
                case GRB_CUTOFF:
                    return OptimizationStatus::Cutoff;
                case GRB_ITERATION_LIMIT:
                case GRB_NODE_LIMIT:
                case GRB_TIME_LIMIT:
                case GRB_SOLUTION_LIMIT:
                case GRB_INTERRUPTED:
                case GRB_SUBOPTIMAL:
                case GRB_USER_OBJ_LIMIT:
                    return numSolutions() > 0 ? OptimizationStatus::Feasible
                                              : OptimizationStatus::NoSolutionFound;
                case GRB_NUMERIC:
                    return OptimizationStatus::Error;
                default:
                    return OptimizationStatus::Other;
            }
        }

        std::optional<double> objectiveValue() override {
            if (numSolutions() == 0) return std::nullopt;
            return model_.get(GRB_DoubleAttr_ObjVal);
        }

        int numSolutions() override {
            sync();
            return model_.get(GRB_IntAttr_SolCount);
        }

        // ---------------------------------------------------------------------
        // Variables
        // ---------------------------------------------------------------------

        std::string varGetName(int idx) override {
            sync();
            return varAt(idx).get(GRB_StringAttr_VarName);
        }

        void varSetName(int idx, const std::string& name) override {
            varAt(idx).set(GRB_StringAttr_VarName, name);
            pending_ = true;
        }

        double varGetLB(int idx) override {
            sync();
            return fromGurobiBound(varAt(idx).get(GRB_DoubleAttr_LB));
        }

        void varSetLB(int idx, double value) override {
            varAt(idx).set(GRB_DoubleAttr_LB, toGurobiBound(value));
            pending_ = true;
        }

        double varGetUB(int idx) override {
            sync();
            return fromGurobiBound(varAt(idx).get(GRB_DoubleAttr_UB));
        }

        void varSetUB(int idx, double value) override {
            varAt(idx).set(GRB_DoubleAttr_UB, toGurobiBound(value));
            pending_ = true;
        }

        double varGetObj(int idx) override {
            sync();
            return varAt(idx).get(GRB_DoubleAttr_Obj);
        }

        void varSetObj(int idx, double value) override {
            varAt(idx).set(GRB_DoubleAttr_Obj, value);
            pending_ = true;
        }

        VarType varGetType(int idx) override {
            sync();
            return toVarType(varAt(idx).get(GRB_CharAttr_VType));
        }

        void varSetType(int idx, VarType type) override {
            varAt(idx).set(GRB_CharAttr_VType, static_cast<char>(type));
            pending_ = true;
        }

        SparseVector varGetColumn(int idx) override {
            sync();
            const GRBColumn col = model_.getCol(varAt(idx));
            SparseVector out;
            for (unsigned int k = 0; k < col.size(); ++k) {
                out.add(constrIndex(col.getConstr(k)), col.getCoeff(k));
            }
            return out;
        }

        void varSetColumn(int idx, const SparseVector& column) override {
            GRBVar v = varAt(idx);
            for (int i : varGetColumn(idx).indices) {
                model_.chgCoeff(constrAt(i), v, 0.0);
            }
            for (std::size_t k = 0; k < column.size(); ++k) {
                model_.chgCoeff(constrAt(column.indices[k]), v, column.values[k]);
            }
            pending_ = true;
        }

        std::optional<double> varGetRC(int idx) override {
            if (!hasLPDuals()) return std::nullopt;
            return varAt(idx).get(GRB_DoubleAttr_RC);
        }

        std::optional<double> varGetX(int idx) override {
            if (numSolutions() == 0) return std::nullopt;
            return varAt(idx).get(GRB_DoubleAttr_X);
        }

        std::optional<double> varGetXi(int idx, int solution) override {
            if (solution < 0 || solution >= numSolutions()) return std::nullopt;
            model_.set(GRB_IntParam_SolutionNumber, solution);
            return varAt(idx).get(GRB_DoubleAttr_Xn);
        }

        // ---------------------------------------------------------------------
        // Constraints
        // ---------------------------------------------------------------------

        double constrGetRHS(int idx) override {
            sync();
            return constrAt(idx).get(GRB_DoubleAttr_RHS);
        }

        void constrSetRHS(int idx, double rhs) override {
            constrAt(idx).set(GRB_DoubleAttr_RHS, rhs);
            pending_ = true;
        }

        Sense constrGetSense(int idx) override {
            sync();
            return fromGurobiSense(constrAt(idx).get(GRB_CharAttr_Sense));
        }

        SparseVector constrGetRow(int idx) override {
            sync();
            const GRBLinExpr row = model_.getRow(constrAt(idx));
            SparseVector out;
            for (unsigned int k = 0; k < row.size(); ++k) {
                out.add(varIndex(row.getVar(k)), row.getCoeff(k));
            }
            return out;
        }

        void constrSetRow(int idx, const SparseVector& row, Sense sense,
            double rhs) override
        {
            GRBConstr c = constrAt(idx);
            for (int j : constrGetRow(idx).indices) {
                model_.chgCoeff(c, varAt(j), 0.0);
            }
            for (std::size_t k = 0; k < row.size(); ++k) {
                model_.chgCoeff(c, varAt(row.indices[k]), row.values[k]);
            }
            c.set(GRB_CharAttr_Sense, toGurobiSense(sense));
            c.set(GRB_DoubleAttr_RHS, rhs);
            pending_ = true;
        }

        std::string constrGetName(int idx) override {
            sync();
            return constrAt(idx).get(GRB_StringAttr_ConstrName);
        }

        std::optional<double> constrGetSlack(int idx) override {
            if (numSolutions() == 0) return std::nullopt;
            return constrAt(idx).get(GRB_DoubleAttr_Slack);
        }

        std::optional<double> constrGetPi(int idx) override {
            if (!hasLPDuals()) return std::nullopt;
            return constrAt(idx).get(GRB_DoubleAttr_Pi);
        }

        // ---------------------------------------------------------------------
        // Conflict graph
        // ---------------------------------------------------------------------

        bool conflicting(int var1, bool value1, int var2, bool value2) override {
            return ConflictDetector(*this).conflicting(var1, value1, var2, value2);
        }

        ConflictNodes conflictingNodes(int var, bool value) override {
            return ConflictDetector(*this).conflictingNodes(var, value);
        }

    private:
        static std::unique_ptr<GRBEnv> makeQuietEnv() {
            auto env = std::make_unique<GRBEnv>(true);
            env->set(GRB_IntParam_OutputFlag, 0);
            env->start();
            return env;
        }

        void sync() {
            if (pending_) {
                model_.update();
                pending_ = false;
            }
        }

        bool isMIP() {
            return model_.get(GRB_IntAttr_IsMIP) != 0;
        }

        // Duals and reduced costs exist only for continuous models at optimality
        bool hasLPDuals() {
            sync();
            return model_.get(GRB_IntAttr_Status) == GRB_OPTIMAL && !isMIP();
        }

        GRBVar& varAt(int idx) {
            if (idx < 0 || idx >= static_cast<int>(vars_.size())) {
                throw std::out_of_range(std::format("GurobiSolver: no variable {}", idx));
            }
            return vars_[static_cast<std::size_t>(idx)];
        }

        GRBConstr& constrAt(int idx) {
            if (idx < 0 || idx >= static_cast<int>(constrs_.size())) {
                throw std::out_of_range(std::format("GurobiSolver: no constraint {}", idx));
            }
            return constrs_[static_cast<std::size_t>(idx)];
        }

        // Insertion order equals Gurobi's internal order once update() ran
        int varIndex(GRBVar v) { return v.index(); }
        int constrIndex(GRBConstr c) { return c.index(); }

        GRBLinExpr toGurobiExpr(const SparseVector& row) {
            GRBLinExpr expr;
            for (std::size_t k = 0; k < row.size(); ++k) {
                expr.addTerms(&row.values[k], &varAt(row.indices[k]), 1);
            }
            return expr;
        }

        static double toGurobiBound(double b) noexcept {
            if (b >= INF) return GRB_INFINITY;
            if (b <= -INF) return -GRB_INFINITY;
            return b;
        }

        static double fromGurobiBound(double b) noexcept {
            if (b >= GRB_INFINITY) return INF;
            if (b <= -GRB_INFINITY) return -INF;
            return b;
        }

        static char toGurobiSense(Sense s) {
            switch (s) {
                case Sense::Equal:          return GRB_EQUAL;
                case Sense::LessOrEqual:    return GRB_LESS_EQUAL;
                case Sense::GreaterOrEqual: return GRB_GREATER_EQUAL;
                default:
                    throw InvalidSense(std::format(
                        "GurobiSolver: sense code {} is not a row sense",
                        static_cast<int>(s)));
            }
        }

        static Sense fromGurobiSense(char s) {
            switch (s) {
                case GRB_EQUAL:         return Sense::Equal;
                case GRB_LESS_EQUAL:    return Sense::LessOrEqual;
                case GRB_GREATER_EQUAL: return Sense::GreaterOrEqual;
                default:
                    throw InvalidSense(std::format(
                        "GurobiSolver: unexpected row sense '{}'", s));
            }
        }
    };

} // namespace mip
