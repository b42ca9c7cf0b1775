#pragma once
/*
===============================================================================
EXPRESSIONS — Sparse linear expressions over decision variables
===============================================================================

OVERVIEW
--------
LinExpr is the value type used to state objectives and constraints. It holds
a sparse map from variable index to coefficient, a constant term and an
optional relational sense. Arithmetic over {Var, LinExpr, double} builds new
expressions; ==, <= and >= produce sense-tagged expressions that become
constraints once registered with a Model.

KEY COMPONENTS
--------------
• Operand      — non-owning tagged view of a Var, a LinExpr or a real
• LinExpr      — coefficient map + constant + sense
• combine()    — single dispatch point used by every arithmetic operator
• operators    — + - * / unary-, += -= *= /=, == <= >=
• xsum()       — sum of a range of Vars / LinExprs / reals
• sum()        — sum_{i in I} f(i) over any iterable index domain
• std::hash / std::equal_to<LinExpr> — exact content, for unordered containers

USAGE EXAMPLES
--------------
    mip::LinExpr e = 3 * x1 - 2 * x2 + 5;
    e.constant();                 // 5
    e.coefficient(x1);            // 3

    auto e2 = e + 2 * x2;         // x2 cancels out
    e2.contains(x2);              // false

    model += x + y <= 10;         // constraint
    model += mip::xsum(X) >= 1;   // sum over a container of variables

    auto cost = mip::sum(I, [&](int i) { return c[i] * X[i]; });

INVARIANTS
----------
• No stored coefficient has magnitude <= kCoefTolerance (1e-12). Near-zero
  contributions are dropped on insertion, cancelled entries are erased, and
  entries pushed below the tolerance by scaling are pruned.
• All variables of an expression belong to one model; model() is nullptr
  when the expression holds no variable.
• Terms are ordered by variable index, which makes rendering deterministic.

EXCEPTION SAFETY
----------------
• LinExpr(vars, coeffs, ...): LengthMismatch on different sizes
• combine()/addTerm(): TypeMismatch on an empty Operand
• multiply()/divide(): TypeMismatch if the operand is not a real
• divide()/operator/: std::domain_error on division by zero
• addVar()/addExpr(): ModelMismatch when models are mixed
• violation()/toString(): InvalidSense on a corrupt sense
• Failed operations leave the receiver unchanged

THREAD SAFETY
-------------
• LinExpr is a value type; in-place operations mutate only the receiver

INCLUDING
---------
• x(), violation() and toString() read variables through Var members that
  model.h defines. Include <mip/model.h> or <mip/mip.h>.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "constants.h"
#include "errors.h"
#include "variables.h"

namespace mip {

    class Operand;

    // ========================================================================
    // LINEAR EXPRESSION
    // ========================================================================
    /**
     * @class LinExpr
     * @brief Σ coeff·var + constant, optionally tagged with a sense
     *
     * @details With a sense, the expression reads "Σ coeff·var + constant
     *          (sense) 0", i.e. the right-hand side of the constraint is
     *          -constant().
     */
    class LinExpr {
    private:
        std::map<int, double> terms_;   ///< variable index -> coefficient
        double constant_ = 0.0;
        Sense  sense_ = Sense::None;
        Model* model_ = nullptr;        ///< model of the stored variables

    public:
        // --------------------------------------------------------------------
        // Construction
        // --------------------------------------------------------------------

        LinExpr() = default;

        /// @brief Constant expression
        explicit LinExpr(double constant)
            : constant_(constant) {
        }

        /// @brief Single term coeff·var
        explicit LinExpr(const Var& var, double coeff = 1.0) {
            addVar(var, coeff);
        }

        /**
         * @brief Builds Σ coeffs[i]·vars[i] + constant
         * @throws LengthMismatch if vars.size() != coeffs.size()
         *
         * @note Repeated variables are accumulated; near-zero coefficients skipped
         */
        LinExpr(const std::vector<Var>& vars, const std::vector<double>& coeffs,
            double constant = 0.0, Sense sense = Sense::None)
            : constant_(constant), sense_(sense)
        {
            if (vars.size() != coeffs.size()) {
                throw LengthMismatch(std::format(
                    "Coefficients and variables must be same length ({} != {})",
                    coeffs.size(), vars.size()));
            }
            for (std::size_t i = 0; i < vars.size(); ++i) {
                addVar(vars[i], coeffs[i]);
            }
        }

        // --------------------------------------------------------------------
        // In-place building blocks
        // --------------------------------------------------------------------

        /// @brief Adds val to the constant term
        void addConst(double val) { constant_ += val; }

        /**
         * @brief Adds coeff·var
         *
         * @details An existing entry is accumulated and erased when the sum
         *          falls within ±kCoefTolerance. A new entry is stored only if
         *          |coeff| > kCoefTolerance.
         *
         * @throws ModelMismatch if var belongs to another model
         */
        void addVar(const Var& var, double coeff = 1.0) {
            bindModel(var.modelPtr());

            auto it = terms_.find(var.idx());
            if (it != terms_.end()) {
                const double merged = it->second + coeff;
                if (std::abs(merged) <= kCoefTolerance) {
                    terms_.erase(it);
                }
                else {
                    it->second = merged;
                }
            }
            else if (std::abs(coeff) > kCoefTolerance) {
                terms_.emplace(var.idx(), coeff);
            }

            if (terms_.empty()) {
                model_ = nullptr;
            }
        }

        /**
         * @brief Adds coeff·expr (terms and constant); the sense of *this is kept
         * @throws ModelMismatch if expr uses variables of another model
         */
        void addExpr(const LinExpr& expr, double coeff = 1.0) {
            if (&expr == this) {
                scale(1.0 + coeff);
                return;
            }
            if (!terms_.empty() && !expr.terms_.empty() && expr.model_ != model_) {
                throw ModelMismatch(
                    "LinExpr: variables of different models cannot be combined");
            }
            constant_ += expr.constant_ * coeff;
            for (const auto& [idx, c] : expr.terms_) {
                addVar(Var(expr.model_, idx), c * coeff);
            }
        }

        /// @brief Adds coeff·term for a Var, a LinExpr or a real
        void addTerm(const Operand& term, double coeff = 1.0);

        /**
         * @brief Single dispatch point of the expression algebra
         *
         * @details Var -> addVar(var, coeff); LinExpr -> addExpr(expr, coeff);
         *          real r -> addConst(coeff * r).
         *
         * @throws TypeMismatch if term holds nothing
         */
        void combine(const Operand& term, double coeff);

        /// @brief Multiplies every coefficient and the constant by factor
        LinExpr& scale(double factor) {
            constant_ *= factor;
            for (auto it = terms_.begin(); it != terms_.end();) {
                it->second *= factor;
                if (std::abs(it->second) <= kCoefTolerance) {
                    it = terms_.erase(it);
                }
                else {
                    ++it;
                }
            }
            if (terms_.empty()) {
                model_ = nullptr;
            }
            return *this;
        }

        /// @brief scale() for a dynamically typed factor
        /// @throws TypeMismatch unless factor holds a real
        LinExpr& multiply(const Operand& factor);

        /// @throws TypeMismatch unless divisor holds a real
        /// @throws std::domain_error if divisor is zero
        LinExpr& divide(const Operand& divisor);

        LinExpr& operator+=(const LinExpr& rhs);
        LinExpr& operator+=(const Var& rhs);
        LinExpr& operator+=(double rhs);
        LinExpr& operator-=(const LinExpr& rhs);
        LinExpr& operator-=(const Var& rhs);
        LinExpr& operator-=(double rhs);

        LinExpr& operator*=(double factor) { return scale(factor); }

        LinExpr& operator/=(double divisor) {
            if (divisor == 0.0) {
                throw std::domain_error("LinExpr: division by zero");
            }
            return scale(1.0 / divisor);
        }

        // --------------------------------------------------------------------
        // Copy and comparison
        // --------------------------------------------------------------------

        /// @brief Independent copy (terms, constant and sense)
        [[nodiscard]] LinExpr copy() const { return *this; }

        /**
         * @brief Structural equality within kCoefTolerance
         *
         * @details Same sense, same set of variables, coefficients and
         *          constants differing by at most 1e-12. Order independent.
         */
        [[nodiscard]] bool equals(const LinExpr& other) const {
            if (sense_ != other.sense_) return false;
            if (terms_.size() != other.terms_.size()) return false;
            if (std::abs(constant_ - other.constant_) > kCoefTolerance) return false;

            for (const auto& [idx, c] : terms_) {
                auto it = other.terms_.find(idx);
                if (it == other.terms_.end()) return false;
                if (std::abs(c - it->second) > kCoefTolerance) return false;
            }
            return true;
        }

        /**
         * @brief Hash of the exact stored content (sense, terms, constant)
         *
         * @details Pairs with std::equal_to<LinExpr>, which compares exactly.
         *          Expressions that are equals() only within the tolerance may
         *          hash differently.
         */
        [[nodiscard]] std::size_t hash() const noexcept {
            std::size_t seed = std::hash<int>{}(static_cast<int>(sense_));
            auto mix = [&seed](std::size_t h) {
                seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
            };
            for (const auto& [idx, c] : terms_) {
                mix(std::hash<int>{}(idx));
                mix(std::hash<double>{}(c));
            }
            mix(std::hash<double>{}(constant_ == 0.0 ? 0.0 : constant_));
            return seed;
        }

        // --------------------------------------------------------------------
        // Views
        // --------------------------------------------------------------------

        [[nodiscard]] double constant() const noexcept { return constant_; }

        [[nodiscard]] Sense sense() const noexcept { return sense_; }
        void setSense(Sense s) noexcept { sense_ = s; }

        /// @brief Coefficients keyed by variable index (sorted)
        [[nodiscard]] const std::map<int, double>& terms() const noexcept { return terms_; }

        /// @brief (variable, coefficient) pairs in index order
        [[nodiscard]] std::vector<std::pair<Var, double>> expr() const {
            std::vector<std::pair<Var, double>> out;
            out.reserve(terms_.size());
            for (const auto& [idx, c] : terms_) {
                out.emplace_back(Var(model_, idx), c);
            }
            return out;
        }

        /// @brief Coefficient of var, 0.0 when absent
        [[nodiscard]] double coefficient(const Var& var) const {
            auto it = terms_.find(var.idx());
            return it == terms_.end() ? 0.0 : it->second;
        }

        [[nodiscard]] bool contains(const Var& var) const {
            return terms_.contains(var.idx());
        }

        [[nodiscard]] std::size_t size() const noexcept { return terms_.size(); }
        [[nodiscard]] bool empty() const noexcept { return terms_.empty(); }

        /// @brief Model owning the variables, nullptr if there are none
        [[nodiscard]] Model* model() const noexcept { return model_; }

        // --------------------------------------------------------------------
        // Solution-dependent values
        // --------------------------------------------------------------------

        /// @brief Value in the current solution; nullopt if any variable value is unknown
        [[nodiscard]] std::optional<double> x() const {
            double total = constant_;
            for (const auto& [idx, c] : terms_) {
                std::optional<double> v = Var(model_, idx).x();
                if (!v) {
                    return std::nullopt;
                }
                total += c * *v;
            }
            return total;
        }

        /**
         * @brief Amount by which the current solution violates this constraint
         *
         * @details With lhs = Σ coeff·value and rhs = -constant():
         *          "=" -> |lhs - rhs|, "<" -> max(lhs - rhs, 0),
         *          ">" -> max(rhs - lhs, 0).
         *
         * @return nullopt if any variable value is unknown
         * @throws InvalidSense if the expression has no (or a corrupt) sense
         */
        [[nodiscard]] std::optional<double> violation() const {
            if (sense_ == Sense::None || !isValid(sense_)) {
                throw InvalidSense(std::format("Invalid sense '{}' for violation",
                    isValid(sense_) ? senseSymbol(sense_) : std::string_view("?")));
            }

            double lhs = 0.0;
            for (const auto& [idx, c] : terms_) {
                std::optional<double> v = Var(model_, idx).x();
                if (!v) {
                    return std::nullopt;
                }
                lhs += c * *v;
            }
            const double rhs = -constant_;

            switch (sense_) {
                case Sense::Equal:          return std::abs(lhs - rhs);
                case Sense::LessOrEqual:    return std::max(lhs - rhs, 0.0);
                case Sense::GreaterOrEqual: return std::max(rhs - lhs, 0.0);
                default:                    break;
            }
            throw InvalidSense("Invalid sense for violation");
        }

        // --------------------------------------------------------------------
        // Rendering
        // --------------------------------------------------------------------

        /**
         * @brief Diagnostic text such as "+ 3 x1 - x2 + 5" or "+ x + y <= 10"
         * @throws InvalidSense for a corrupt sense
         */
        [[nodiscard]] std::string toString() const {
            std::string out;
            for (const auto& [idx, c] : terms_) {
                if (!out.empty()) out += ' ';
                out += c < 0 ? "- " : "+ ";
                const double mag = std::abs(c);
                if (mag != 1.0) {
                    out += std::format("{} ", mag);
                }
                out += Var(model_, idx).toString();
            }

            const double rhs = constant_ == 0.0 ? 0.0 : -constant_;
            std::string_view rel;
            switch (sense_) {
                case Sense::None:
                    if (constant_ != 0.0) {
                        if (!out.empty()) out += ' ';
                        out += std::format("{} {}", constant_ < 0 ? '-' : '+',
                            std::abs(constant_));
                    }
                    return out.empty() ? std::string("0") : out;
                case Sense::Equal:          rel = " = ";  break;
                case Sense::LessOrEqual:    rel = " <= "; break;
                case Sense::GreaterOrEqual: rel = " >= "; break;
                default:
                    throw InvalidSense(std::format("Invalid sense code {}",
                        static_cast<int>(sense_)));
            }
            if (out.empty()) out = "0";
            out += rel;
            out += std::format("{}", rhs);
            return out;
        }

    private:
        void bindModel(Model* m) {
            if (model_ == nullptr || terms_.empty()) {
                model_ = m;
            }
            else if (model_ != m) {
                throw ModelMismatch(
                    "LinExpr: variables of different models cannot be combined");
            }
        }
    };

    inline std::ostream& operator<<(std::ostream& os, const LinExpr& e) {
        return os << e.toString();
    }

    // ========================================================================
    // OPERAND
    // ========================================================================
    /**
     * @class Operand
     * @brief Non-owning tagged view over the closed set {Var, LinExpr, real}
     *
     * @details Used as a parameter type where the kind of a term is only
     *          known at run time. A LinExpr operand refers to the caller's
     *          object, which must outlive the Operand (as with string_view).
     *          A default-constructed Operand is empty and is rejected with
     *          TypeMismatch by every consumer.
     */
    class Operand {
    private:
        std::variant<std::monostate, Var, const LinExpr*, double> value_;

    public:
        Operand() = default;
        Operand(const Var& v) : value_(v) {}
        Operand(const LinExpr& e) : value_(&e) {}

        template<typename T>
            requires std::is_arithmetic_v<T>
        Operand(T c) : value_(static_cast<double>(c)) {}

        [[nodiscard]] bool isEmpty() const noexcept { return value_.index() == 0; }
        [[nodiscard]] bool isVar() const noexcept { return value_.index() == 1; }
        [[nodiscard]] bool isExpr() const noexcept { return value_.index() == 2; }
        [[nodiscard]] bool isReal() const noexcept { return value_.index() == 3; }

        [[nodiscard]] const Var* var() const noexcept { return std::get_if<Var>(&value_); }

        [[nodiscard]] const LinExpr* expr() const noexcept {
            auto p = std::get_if<const LinExpr*>(&value_);
            return p ? *p : nullptr;
        }

        [[nodiscard]] std::optional<double> real() const noexcept {
            if (auto p = std::get_if<double>(&value_)) return *p;
            return std::nullopt;
        }

        /// @brief "empty", "Var", "LinExpr" or "real" (for error messages)
        [[nodiscard]] std::string_view kindName() const noexcept {
            switch (value_.index()) {
                case 1: return "Var";
                case 2: return "LinExpr";
                case 3: return "real";
                default: return "empty";
            }
        }
    };

    // ------------------------------------------------------------------------
    // LinExpr members depending on Operand
    // ------------------------------------------------------------------------

    inline void LinExpr::combine(const Operand& term, double coeff) {
        if (const Var* v = term.var()) {
            addVar(*v, coeff);
        }
        else if (const LinExpr* e = term.expr()) {
            addExpr(*e, coeff);
        }
        else if (std::optional<double> r = term.real()) {
            addConst(coeff * *r);
        }
        else {
            throw TypeMismatch(std::format("type {} not supported", term.kindName()));
        }
    }

    inline void LinExpr::addTerm(const Operand& term, double coeff) {
        combine(term, coeff);
    }

    inline LinExpr& LinExpr::multiply(const Operand& factor) {
        std::optional<double> r = factor.real();
        if (!r) {
            throw TypeMismatch(std::format("Can not multiply with type {}",
                factor.kindName()));
        }
        return scale(*r);
    }

    inline LinExpr& LinExpr::divide(const Operand& divisor) {
        std::optional<double> r = divisor.real();
        if (!r) {
            throw TypeMismatch(std::format("Can not divide with type {}",
                divisor.kindName()));
        }
        return *this /= *r;
    }

    inline LinExpr& LinExpr::operator+=(const LinExpr& rhs) { combine(rhs, 1.0); return *this; }
    inline LinExpr& LinExpr::operator+=(const Var& rhs) { combine(rhs, 1.0); return *this; }
    inline LinExpr& LinExpr::operator+=(double rhs) { combine(rhs, 1.0); return *this; }
    inline LinExpr& LinExpr::operator-=(const LinExpr& rhs) { combine(rhs, -1.0); return *this; }
    inline LinExpr& LinExpr::operator-=(const Var& rhs) { combine(rhs, -1.0); return *this; }
    inline LinExpr& LinExpr::operator-=(double rhs) { combine(rhs, -1.0); return *this; }

    // ========================================================================
    // ARITHMETIC OPERATORS
    // ========================================================================
    // Left LinExpr operands are taken by value so chains such as
    // a + b + c + d reuse one buffer.

    inline LinExpr operator+(LinExpr lhs, const LinExpr& rhs) { lhs.combine(rhs, 1.0); return lhs; }
    inline LinExpr operator+(LinExpr lhs, const Var& rhs) { lhs.combine(rhs, 1.0); return lhs; }
    inline LinExpr operator+(LinExpr lhs, double rhs) { lhs.combine(rhs, 1.0); return lhs; }
    inline LinExpr operator+(const Var& lhs, LinExpr rhs) { rhs.combine(lhs, 1.0); return rhs; }
    inline LinExpr operator+(double lhs, LinExpr rhs) { rhs.combine(lhs, 1.0); return rhs; }

    inline LinExpr operator+(const Var& lhs, const Var& rhs) {
        LinExpr r(lhs);
        r.combine(rhs, 1.0);
        return r;
    }

    inline LinExpr operator+(const Var& lhs, double rhs) {
        LinExpr r(lhs);
        r.combine(rhs, 1.0);
        return r;
    }

    inline LinExpr operator+(double lhs, const Var& rhs) { return rhs + lhs; }

    inline LinExpr operator-(LinExpr lhs, const LinExpr& rhs) { lhs.combine(rhs, -1.0); return lhs; }
    inline LinExpr operator-(LinExpr lhs, const Var& rhs) { lhs.combine(rhs, -1.0); return lhs; }
    inline LinExpr operator-(LinExpr lhs, double rhs) { lhs.combine(rhs, -1.0); return lhs; }

    inline LinExpr operator-(const Var& lhs, LinExpr rhs) {
        rhs.scale(-1.0);
        rhs.combine(lhs, 1.0);
        return rhs;
    }

    inline LinExpr operator-(double lhs, LinExpr rhs) {
        rhs.scale(-1.0);
        rhs.combine(lhs, 1.0);
        return rhs;
    }

    inline LinExpr operator-(const Var& lhs, const Var& rhs) {
        LinExpr r(lhs);
        r.combine(rhs, -1.0);
        return r;
    }

    inline LinExpr operator-(const Var& lhs, double rhs) {
        LinExpr r(lhs);
        r.combine(rhs, -1.0);
        return r;
    }

    inline LinExpr operator-(double lhs, const Var& rhs) {
        LinExpr r(rhs, -1.0);
        r.combine(lhs, 1.0);
        return r;
    }

    inline LinExpr operator*(LinExpr lhs, double rhs) { return std::move(lhs.scale(rhs)); }
    inline LinExpr operator*(double lhs, LinExpr rhs) { return std::move(rhs.scale(lhs)); }
    inline LinExpr operator*(const Var& lhs, double rhs) { return LinExpr(lhs, rhs); }
    inline LinExpr operator*(double lhs, const Var& rhs) { return LinExpr(rhs, lhs); }

    inline LinExpr operator/(LinExpr lhs, double rhs) { return std::move(lhs /= rhs); }

    inline LinExpr operator/(const Var& lhs, double rhs) {
        if (rhs == 0.0) {
            throw std::domain_error("Var: division by zero");
        }
        return LinExpr(lhs, 1.0 / rhs);
    }

    inline LinExpr operator-(LinExpr e) { return std::move(e.scale(-1.0)); }
    inline LinExpr operator-(const Var& v) { return LinExpr(v, -1.0); }

    // ========================================================================
    // RELATIONAL OPERATORS
    // ========================================================================
    // a (op) b  ->  (a - b) tagged with the corresponding sense.

    namespace expr_detail {

        inline LinExpr relation(LinExpr lhs, const Operand& rhs, Sense sense) {
            lhs.combine(rhs, -1.0);
            lhs.setSense(sense);
            return lhs;
        }

    } // namespace expr_detail

#define MIP_DEFINE_RELATION(OP, SENSE)                                                 \
    inline LinExpr operator OP(LinExpr lhs, const LinExpr& rhs) {                      \
        return expr_detail::relation(std::move(lhs), rhs, SENSE);                      \
    }                                                                                  \
    inline LinExpr operator OP(LinExpr lhs, const Var& rhs) {                          \
        return expr_detail::relation(std::move(lhs), rhs, SENSE);                      \
    }                                                                                  \
    inline LinExpr operator OP(LinExpr lhs, double rhs) {                              \
        return expr_detail::relation(std::move(lhs), rhs, SENSE);                      \
    }                                                                                  \
    inline LinExpr operator OP(const Var& lhs, const LinExpr& rhs) {                   \
        return expr_detail::relation(LinExpr(lhs), rhs, SENSE);                        \
    }                                                                                  \
    inline LinExpr operator OP(const Var& lhs, const Var& rhs) {                       \
        return expr_detail::relation(LinExpr(lhs), rhs, SENSE);                        \
    }                                                                                  \
    inline LinExpr operator OP(const Var& lhs, double rhs) {                           \
        return expr_detail::relation(LinExpr(lhs), rhs, SENSE);                        \
    }                                                                                  \
    inline LinExpr operator OP(double lhs, const LinExpr& rhs) {                       \
        return expr_detail::relation(LinExpr(lhs), rhs, SENSE);                        \
    }                                                                                  \
    inline LinExpr operator OP(double lhs, const Var& rhs) {                           \
        return expr_detail::relation(LinExpr(lhs), rhs, SENSE);                        \
    }

    MIP_DEFINE_RELATION(==, Sense::Equal)
    MIP_DEFINE_RELATION(<=, Sense::LessOrEqual)
    MIP_DEFINE_RELATION(>=, Sense::GreaterOrEqual)

#undef MIP_DEFINE_RELATION

    // ========================================================================
    // SUMMATION
    // ========================================================================
    namespace expr_detail {

        template<typename T, typename = void>
        struct is_tuple_like : std::false_type {};

        template<typename T>
        struct is_tuple_like<T, std::void_t<decltype(std::tuple_size<T>::value)>>
            : std::true_type {
        };

        template<typename T>
        inline constexpr bool is_tuple_like_v = is_tuple_like<std::remove_cvref_t<T>>::value;

        /**
         * @brief Calls f(i) for scalar indices or f(i, j, ...) for tuple indices
         */
        template<typename Func, typename Idx>
        decltype(auto) invoke_on_index(Func&& f, Idx&& idx) {
            if constexpr (is_tuple_like_v<Idx>) {
                return std::apply(std::forward<Func>(f), std::forward<Idx>(idx));
            }
            else {
                return std::invoke(std::forward<Func>(f), std::forward<Idx>(idx));
            }
        }

    } // namespace expr_detail

    /**
     * @brief Sum of every element of a range of Vars, LinExprs or reals
     *
     * @example
     *     std::vector<mip::Var> X = model.addVars(5, "x", 0, 1, 0, mip::VarType::Binary);
     *     model += mip::xsum(X) <= 2;
     */
    template<typename Range>
    LinExpr xsum(const Range& terms) {
        LinExpr expr;
        for (const auto& t : terms) {
            expr.combine(t, 1.0);
        }
        return expr;
    }

    /**
     * @brief Builds sum_{idx in rng} func(idx...)
     *
     * @tparam Range Iterable yielding integers or tuple-like indices
     * @tparam Func  Callable returning Var, LinExpr or a real
     *
     * @example
     *     auto e = mip::sum(std::views::iota(0, n), [&](int i) { return w[i] * X[i]; });
     */
    template<typename Range, typename Func>
    LinExpr sum(const Range& rng, Func&& func) {
        LinExpr expr;
        for (const auto& idx : rng) {
            expr.combine(expr_detail::invoke_on_index(func, idx), 1.0);
        }
        return expr;
    }

} // namespace mip

template<>
struct std::hash<mip::LinExpr> {
    std::size_t operator()(const mip::LinExpr& e) const noexcept {
        return e.hash();
    }
};

// == on LinExpr builds a constraint; containers compare the stored content.
template<>
struct std::equal_to<mip::LinExpr> {
    bool operator()(const mip::LinExpr& a, const mip::LinExpr& b) const noexcept {
        return a.sense() == b.sense() && a.constant() == b.constant() &&
            a.terms() == b.terms();
    }
};
