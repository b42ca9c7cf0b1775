#pragma once
/*
===============================================================================
MODEL — Registration of variables, constraints and objective
===============================================================================

OVERVIEW
--------
A Model owns a Solver and the tables of Var / Constr handles created through
it. It is the only place where expressions are turned into solver rows, and
the object every handle points back to. Besides model building it exposes
the solve cycle (optimize(), status(), objectiveValue()), a conflict graph
view, and named parameter setters that are forwarded to the solver and
recorded in store().

This header also completes the handle classes: the accessor bodies of Var,
Constr and Column need the full Model definition and therefore live here.

USAGE EXAMPLES
--------------
    mip::Model model(std::make_unique<mip::GurobiSolver>(), "knapsack");

    auto x = model.addVars(n, "x", 0.0, 1.0, 0.0, mip::VarType::Binary);
    model += mip::sum(I, [&](int i) { return w[i] * x[i]; }) <= capacity;
    model.maximize(mip::sum(I, [&](int i) { return p[i] * x[i]; }));

    model.timeLimit(30);
    model.quiet();

    if (model.optimize() == mip::OptimizationStatus::Optimal) {
        std::cout << *model.objectiveValue() << "\n";
    }

DESIGN NOTES
------------
• Not copyable or movable: handles keep a raw pointer to their model.
• model += expr adds a constraint when expr carries a sense, otherwise it
  replaces the objective (keeping the current objective sense).
• Parameters are recorded as "param:<Name>" in store(); presets record
  "param:Preset".

EXCEPTION SAFETY
----------------
• addConstr(): InvalidSense without a sense, ModelMismatch for foreign variables
• setObjective(): InvalidSense if the expression carries a sense
• var(i) / constr(i): std::out_of_range
• Solver exceptions propagate unchanged

===============================================================================
*/

#include <cmath>
#include <format>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "conflict_graph.h"
#include "constants.h"
#include "constraints.h"
#include "data_store.h"
#include "errors.h"
#include "expressions.h"
#include "naming.h"
#include "solver.h"
#include "variables.h"

namespace mip {

    // ============================================================================
    // MODEL
    // ============================================================================
    /**
     * @class Model
     * @brief Owner of a Solver and of the handles referring into it
     */
    class Model {
    public:
        /// Parameter bundles applied by applyPreset()
        enum class Preset {
            Fast,        ///< 60s limit, 5% gap, automatic threads
            Accurate,    ///< 1h limit, 0.01% gap
            Feasibility, ///< MIPFocus = 1
            Quiet,       ///< no solver output
            Debug        ///< solver output, presolve off
        };

    private:
        std::unique_ptr<Solver> solver_;
        std::string name_;
        std::vector<Var> vars_;
        std::vector<Constr> constrs_;
        OptimizationStatus status_ = OptimizationStatus::Loaded;
        DataStore store_;

    public:
        /// @throws std::invalid_argument if solver is null
        explicit Model(std::unique_ptr<Solver> solver, std::string name = "")
            : solver_(std::move(solver)), name_(std::move(name))
        {
            if (!solver_) {
                throw std::invalid_argument("Model: a solver is required");
            }
        }

        Model(const Model&) = delete;
        Model& operator=(const Model&) = delete;
        Model(Model&&) = delete;
        Model& operator=(Model&&) = delete;

        [[nodiscard]] const std::string& name() const noexcept { return name_; }

        /// @brief Backend holding the model data
        [[nodiscard]] Solver& solver() const noexcept { return *solver_; }

        DataStore& store() noexcept { return store_; }
        const DataStore& store() const noexcept { return store_; }

        // =========================================================================
        // VARIABLES
        // =========================================================================

        /**
         * @brief Creates a variable
         * @param column Coefficients of the new variable in existing constraints
         * @throws InvalidVariableType for a corrupt type
         * @throws ModelMismatch if column refers to constraints of another model
         */
        Var addVar(const std::string& name = "", double lb = 0.0, double ub = INF,
            double obj = 0.0, VarType type = VarType::Continuous,
            const Column& column = Column())
        {
            checkVarType(type);
            const int idx = solver_->addVar(name, lb, ub, obj, type, toSparse(column));
            vars_.emplace_back(this, idx);
            return vars_.back();
        }

        /**
         * @brief Creates n variables named base_0, base_1, ... (debug builds)
         * @see make_name::index
         */
        std::vector<Var> addVars(int n, std::string_view base = "", double lb = 0.0,
            double ub = INF, double obj = 0.0, VarType type = VarType::Continuous)
        {
            std::vector<Var> created;
            created.reserve(n > 0 ? static_cast<std::size_t>(n) : 0);
            for (int i = 0; i < n; ++i) {
                const std::string name = base.empty() ? std::string() : make_name::index(base, i);
                created.push_back(addVar(name, lb, ub, obj, type));
            }
            return created;
        }

        [[nodiscard]] const std::vector<Var>& vars() const noexcept { return vars_; }

        Var var(int idx) const {
            if (idx < 0 || idx >= static_cast<int>(vars_.size())) {
                throw std::out_of_range(std::format(
                    "Model: variable index {} out of range [0, {})", idx, vars_.size()));
            }
            return vars_[static_cast<std::size_t>(idx)];
        }

        std::optional<Var> varByName(const std::string& name) const {
            for (const Var& v : vars_) {
                if (v.name() == name) return v;
            }
            return std::nullopt;
        }

        [[nodiscard]] int numCols() const noexcept { return static_cast<int>(vars_.size()); }

        // =========================================================================
        // CONSTRAINTS
        // =========================================================================

        /**
         * @brief Registers "expr (sense) 0" as the row "terms (sense) -constant"
         * @throws InvalidSense if expr carries no sense
         * @throws ModelMismatch if expr uses variables of another model
         */
        Constr addConstr(const LinExpr& expr, const std::string& name = "") {
            if (expr.sense() == Sense::None || !isValid(expr.sense())) {
                throw InvalidSense(
                    "A constraint requires a sense (==, <= or >=)");
            }
            checkOwnership(expr);

            const int idx = solver_->addConstr(toSparse(expr), expr.sense(),
                rhsOf(expr), name);
            constrs_.emplace_back(this, idx);
            return constrs_.back();
        }

        /// @brief Adds a constraint (sensed expr) or sets the objective
        Model& operator+=(const LinExpr& expr) {
            if (expr.sense() == Sense::None) {
                setObjective(expr, objectiveSense());
            }
            else {
                addConstr(expr);
            }
            return *this;
        }

        [[nodiscard]] const std::vector<Constr>& constrs() const noexcept { return constrs_; }

        Constr constr(int idx) const {
            if (idx < 0 || idx >= static_cast<int>(constrs_.size())) {
                throw std::out_of_range(std::format(
                    "Model: constraint index {} out of range [0, {})", idx, constrs_.size()));
            }
            return constrs_[static_cast<std::size_t>(idx)];
        }

        std::optional<Constr> constrByName(const std::string& name) const {
            for (const Constr& c : constrs_) {
                if (c.name() == name) return c;
            }
            return std::nullopt;
        }

        [[nodiscard]] int numRows() const noexcept { return static_cast<int>(constrs_.size()); }

        /// @brief Non-zero coefficients over all rows
        int numNZ() const {
            int nz = 0;
            for (const Constr& c : constrs_) {
                nz += static_cast<int>(solver_->constrGetRow(c.idx()).size());
            }
            return nz;
        }

        // =========================================================================
        // OBJECTIVE
        // =========================================================================

        /**
         * @throws InvalidSense if expr carries a sense
         * @throws ModelMismatch if expr uses variables of another model
         */
        void setObjective(const LinExpr& expr, ObjectiveSense sense = ObjectiveSense::Minimize) {
            if (expr.sense() != Sense::None) {
                throw InvalidSense(std::format(
                    "The objective function cannot carry a sense, got '{}'",
                    expr.toString()));
            }
            checkOwnership(expr);
            solver_->setObjective(toSparse(expr), expr.constant(), sense);
        }

        void minimize(const LinExpr& expr) { setObjective(expr, ObjectiveSense::Minimize); }
        void maximize(const LinExpr& expr) { setObjective(expr, ObjectiveSense::Maximize); }

        /// @brief Objective rebuilt from the variables' objective coefficients
        LinExpr objective() const {
            LinExpr obj(solver_->objectiveConst());
            for (const Var& v : vars_) {
                obj.addVar(v, solver_->varGetObj(v.idx()));
            }
            return obj;
        }

        ObjectiveSense objectiveSense() const { return solver_->objectiveSense(); }

        /// @brief Objective of the best solution; nullopt without solution
        std::optional<double> objectiveValue() const {
            if (!hasSolution()) return std::nullopt;
            return solver_->objectiveValue();
        }

        // =========================================================================
        // OPTIMIZATION
        // =========================================================================

        OptimizationStatus optimize() {
            status_ = solver_->optimize();
            return status_;
        }

        [[nodiscard]] OptimizationStatus status() const noexcept { return status_; }

        int numSolutions() const { return solver_->numSolutions(); }

        [[nodiscard]] bool hasSolution() const noexcept {
            return status_ == OptimizationStatus::Optimal ||
                   status_ == OptimizationStatus::Feasible;
        }

        [[nodiscard]] bool isOptimal() const noexcept {
            return status_ == OptimizationStatus::Optimal;
        }

        ConflictGraph conflictGraph() { return ConflictGraph(*this); }

        // =========================================================================
        // PARAMETERS
        // =========================================================================

        /**
         * @brief Forwards a solver parameter and records it as "param:<name>"
         *
         * @example
         *     model.setParam("Heuristics", 0.5);
         *     model.store().get<double>("param:Heuristics");
         */
        template<typename Val>
            requires std::is_arithmetic_v<Val>
        void setParam(const std::string& name, Val value) {
            solver_->setParam(name, std::format("{}", value));
            store_["param:" + name] = value;
        }

        void setParam(const std::string& name, const std::string& value) {
            solver_->setParam(name, value);
            store_["param:" + name] = value;
        }

        /// @brief Time limit in seconds
        void timeLimit(double seconds) { setParam("TimeLimit", seconds); }

        /// @brief Relative MIP gap, e.g. 0.01 for 1%
        void mipGapLimit(double gap) { setParam("MIPGap", gap); }

        /// @brief Thread count, 0 for automatic
        void threads(int n) { setParam("Threads", n); }

        void quiet() { setParam("OutputFlag", 0); }
        void verbose() { setParam("OutputFlag", 1); }

        /// @brief -1 auto, 0 off, 1 conservative, 2 aggressive
        void presolve(int level) { setParam("Presolve", level); }

        /// @brief 0 balanced, 1 feasibility, 2 optimality, 3 bound
        void mipFocus(int focus) { setParam("MIPFocus", focus); }

        void applyPreset(Preset p) {
            switch (p) {
                case Preset::Fast:
                    timeLimit(60.0);
                    mipGapLimit(0.05);
                    threads(0);
                    store_["param:Preset"] = std::string("Fast");
                    break;
                case Preset::Accurate:
                    timeLimit(3600.0);
                    mipGapLimit(0.0001);
                    store_["param:Preset"] = std::string("Accurate");
                    break;
                case Preset::Feasibility:
                    mipFocus(1);
                    store_["param:Preset"] = std::string("Feasibility");
                    break;
                case Preset::Quiet:
                    quiet();
                    store_["param:Preset"] = std::string("Quiet");
                    break;
                case Preset::Debug:
                    verbose();
                    presolve(0);
                    store_["param:Preset"] = std::string("Debug");
                    break;
            }
        }

    private:
        friend class Var;
        friend class Constr;

        static void checkVarType(VarType type) {
            if (!isValid(type)) {
                throw InvalidVariableType(std::format(
                    "Expected one of ('B', 'C', 'I'), but got code {}",
                    static_cast<int>(static_cast<char>(type))));
            }
        }

        void checkOwnership(const LinExpr& expr) const {
            if (expr.model() != nullptr && expr.model() != this) {
                throw ModelMismatch(std::format(
                    "Expression '{}' refers to variables of another model", expr.toString()));
            }
        }

        static double rhsOf(const LinExpr& expr) noexcept {
            return expr.constant() == 0.0 ? 0.0 : -expr.constant();
        }

        static SparseVector toSparse(const LinExpr& expr) {
            SparseVector row;
            row.indices.reserve(expr.size());
            row.values.reserve(expr.size());
            for (const auto& [idx, coeff] : expr.terms()) {
                row.add(idx, coeff);
            }
            return row;
        }

        SparseVector toSparse(const Column& column) const {
            SparseVector col;
            for (std::size_t k = 0; k < column.size(); ++k) {
                const Constr& c = column.constrs()[k];
                if (&c.model() != this) {
                    throw ModelMismatch(
                        "Column refers to constraints of another model");
                }
                col.add(c.idx(), column.coeffs()[k]);
            }
            return col;
        }
    };

    // ============================================================================
    // VAR ACCESSORS
    // ============================================================================

    inline std::string Var::name() const { return model_->solver().varGetName(idx_); }
    inline void Var::setName(const std::string& name) { model_->solver().varSetName(idx_, name); }

    inline double Var::lb() const { return model_->solver().varGetLB(idx_); }
    inline void Var::setLB(double value) { model_->solver().varSetLB(idx_, value); }

    inline double Var::ub() const { return model_->solver().varGetUB(idx_); }
    inline void Var::setUB(double value) { model_->solver().varSetUB(idx_, value); }

    inline double Var::obj() const { return model_->solver().varGetObj(idx_); }
    inline void Var::setObj(double value) { model_->solver().varSetObj(idx_, value); }

    inline VarType Var::varType() const { return model_->solver().varGetType(idx_); }

    inline void Var::setVarType(VarType type) {
        Model::checkVarType(type);
        model_->solver().varSetType(idx_, type);
    }

    inline void Var::setVarType(char code) { setVarType(toVarType(code)); }

    inline Column Var::column() const {
        const SparseVector sv = model_->solver().varGetColumn(idx_);
        Column col;
        for (std::size_t k = 0; k < sv.size(); ++k) {
            col.addTerm(Constr(model_, sv.indices[k]), sv.values[k]);
        }
        return col;
    }

    inline void Var::setColumn(const Column& column) {
        model_->solver().varSetColumn(idx_, model_->toSparse(column));
    }

    inline std::optional<double> Var::rc() const { return model_->solver().varGetRC(idx_); }
    inline std::optional<double> Var::x() const { return model_->solver().varGetX(idx_); }

    inline std::optional<double> Var::xi(int i) const {
        if (!model_->hasSolution()) {
            return std::nullopt;
        }
        return model_->solver().varGetXi(idx_, i);
    }

    inline std::string Var::toString() const {
        std::string n = name();
        return n.empty() ? std::format("var({})", idx_) : n;
    }

    inline std::ostream& operator<<(std::ostream& os, const Var& v) {
        return os << v.toString();
    }

    // ============================================================================
    // CONSTR ACCESSORS
    // ============================================================================

    inline double Constr::rhs() const { return model_->solver().constrGetRHS(idx_); }
    inline void Constr::setRHS(double rhs) { model_->solver().constrSetRHS(idx_, rhs); }

    inline Sense Constr::sense() const { return model_->solver().constrGetSense(idx_); }

    inline LinExpr Constr::expr() const {
        Solver& s = model_->solver();
        const SparseVector row = s.constrGetRow(idx_);
        LinExpr e;
        for (std::size_t k = 0; k < row.size(); ++k) {
            e.addVar(Var(model_, row.indices[k]), row.values[k]);
        }
        const double rhs = s.constrGetRHS(idx_);
        e.addConst(rhs == 0.0 ? 0.0 : -rhs);
        e.setSense(s.constrGetSense(idx_));
        return e;
    }

    inline void Constr::setExpr(const LinExpr& expr) {
        if (expr.sense() == Sense::None || !isValid(expr.sense())) {
            throw InvalidSense("A constraint requires a sense (==, <= or >=)");
        }
        model_->checkOwnership(expr);
        model_->solver().constrSetRow(idx_, Model::toSparse(expr), expr.sense(),
            Model::rhsOf(expr));
    }

    inline std::string Constr::name() const { return model_->solver().constrGetName(idx_); }

    inline std::optional<double> Constr::slack() const {
        return model_->solver().constrGetSlack(idx_);
    }

    inline std::optional<double> Constr::pi() const {
        return model_->solver().constrGetPi(idx_);
    }

    inline std::string Constr::toString() const {
        const std::string n = name();
        std::string out = n.empty() ? std::format("constr({}): ", idx_ + 1) : n + ":";

        const LinExpr e = expr();
        std::size_t lineLength = 0;
        for (const auto& [var, coeff] : e.expr()) {
            const std::string term = std::format(" {:+} {}", coeff, var.toString());
            out += term;
            lineLength += term.size();
            if (lineLength > 75) {
                out += "\n\t";
                lineLength = 0;
            }
        }

        const double rhs = e.constant() == 0.0 ? 0.0 : -e.constant();
        switch (e.sense()) {
            case Sense::Equal:          out += std::format(" = {}", rhs); break;
            case Sense::LessOrEqual:    out += std::format(" <= {}", rhs); break;
            case Sense::GreaterOrEqual: out += std::format(" >= {}", rhs); break;
            default:
                throw InvalidSense(std::format("Invalid sense code {} in constraint {}",
                    static_cast<int>(e.sense()), idx_));
        }
        return out;
    }

    inline std::ostream& operator<<(std::ostream& os, const Constr& c) {
        return os << c.toString();
    }

    // ============================================================================
    // COLUMN
    // ============================================================================

    inline Column::Column(std::vector<Constr> constrs, std::vector<double> coeffs)
        : constrs_(std::move(constrs)), coeffs_(std::move(coeffs))
    {
        if (constrs_.size() != coeffs_.size()) {
            throw LengthMismatch(std::format(
                "Column: {} constraints but {} coefficients",
                constrs_.size(), coeffs_.size()));
        }
    }

    inline std::string Column::toString() const {
        std::string out = "[";
        for (std::size_t k = 0; k < constrs_.size(); ++k) {
            if (k > 0) out += ", ";
            out += std::format("{} {}", coeffs_[k], constrs_[k].name());
        }
        out += "]";
        return out;
    }

    inline std::ostream& operator<<(std::ostream& os, const Column& col) {
        return os << col.toString();
    }

    // ============================================================================
    // CONFLICT GRAPH
    // ============================================================================

    inline Literal ConflictGraph::literal(const Operand& op) const {
        Literal lit = Literal::from(op);
        if (lit.var.modelPtr() != model_) {
            throw ModelMismatch(std::format(
                "Variable {} does not belong to the model of this conflict graph",
                lit.var.idx()));
        }
        return lit;
    }

    inline bool ConflictGraph::conflicting(const Operand& e1, const Operand& e2) const {
        const Literal a = literal(e1);
        const Literal b = literal(e2);
        return model_->solver().conflicting(a.var.idx(), a.value, b.var.idx(), b.value);
    }

    inline std::pair<std::vector<Var>, std::vector<Var>>
        ConflictGraph::conflictingAssignments(const Operand& e) const
    {
        const Literal lit = literal(e);
        const ConflictNodes nodes = model_->solver().conflictingNodes(lit.var.idx(), lit.value);

        std::pair<std::vector<Var>, std::vector<Var>> result;
        result.first.reserve(nodes.first.size());
        result.second.reserve(nodes.second.size());
        for (int j : nodes.first) result.first.emplace_back(model_, j);
        for (int j : nodes.second) result.second.emplace_back(model_, j);
        return result;
    }

} // namespace mip
