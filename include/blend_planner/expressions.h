#pragma once
/*
===============================================================================
EXPRESSIONS — Solver-neutral linear expressions and constraint builders
===============================================================================

OVERVIEW
--------
A model is assembled once and may be handed to any solver backend, so its
rows cannot be written in a backend's own expression type. This header
defines the small algebra the builder needs instead:

• Var        — Handle to a declared variable (its column id in a LinearModel)
• LinExpr    — sum_k coef_k * var_k + constant
• TempConstr — LinExpr <sense> rhs, produced by <=, >= and ==
• sum(...)   — sum_{idx in Domain} f(idx...) over any index domain

The relational operators mirror the usual modelling notation:

    Stock(o, t) == prev + Buy(o, t) - Use(o, t)
    sum(O, [&](int o) { return h[o] * Use(o, t); }) >= hmin * Produce(t)

CANONICAL FORM
--------------
A TempConstr always moves every variable to the left and every constant to
the right, and merges repeated variables (first-appearance order is kept):

    x + 3 <= y + 5   ->   x - y <= 2

This makes two rows built from the same data compare equal term by term.

EXCEPTION SAFETY
----------------
• Arithmetic is strong-guarantee (std::vector growth only)
• sum(): propagates exceptions from the user callable
• evaluate(): throws std::out_of_range when a variable id has no value

===============================================================================
*/

#include <cstddef>
#include <format>
#include <functional>
#include <limits>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace blend {

    /// @brief Value used for absent variable bounds
    inline constexpr double kInfinity = std::numeric_limits<double>::infinity();

    // ============================================================================
    // VARIABLE HANDLE
    // ============================================================================
    /**
     * @class Var
     * @brief Column handle issued by LinearModel::addVar
     *
     * @note A default-constructed Var is invalid and cannot appear in a LinExpr.
     */
    class Var {
    private:
        static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();
        std::size_t id_ = npos;

    public:
        Var() = default;
        explicit Var(std::size_t id) noexcept : id_(id) {}

        [[nodiscard]] std::size_t id() const noexcept { return id_; }
        [[nodiscard]] bool valid() const noexcept { return id_ != npos; }
    };

    // ============================================================================
    // LINEAR EXPRESSION
    // ============================================================================
    struct Term {
        std::size_t var;
        double      coef;

        bool operator==(const Term&) const = default;
    };

    class LinExpr {
    private:
        std::vector<Term> terms_;
        double            constant_ = 0.0;

    public:
        LinExpr() = default;

        LinExpr(double constant) : constant_(constant) {}

        LinExpr(const Var& v) {
            addTerm(v, 1.0);
        }

        /// @brief Appends coef * v; throws std::invalid_argument for an invalid Var
        void addTerm(const Var& v, double coef) {
            if (!v.valid()) {
                throw std::invalid_argument("LinExpr::addTerm: invalid variable handle");
            }
            terms_.push_back(Term{ v.id(), coef });
        }

        void addConstant(double c) noexcept { constant_ += c; }

        [[nodiscard]] const std::vector<Term>& terms() const noexcept { return terms_; }
        [[nodiscard]] double constant() const noexcept { return constant_; }
        [[nodiscard]] std::size_t size() const noexcept { return terms_.size(); }
        [[nodiscard]] bool isConstant() const noexcept { return terms_.empty(); }

        LinExpr& operator+=(const LinExpr& other) {
            terms_.insert(terms_.end(), other.terms_.begin(), other.terms_.end());
            constant_ += other.constant_;
            return *this;
        }

        LinExpr& operator-=(const LinExpr& other) {
            terms_.reserve(terms_.size() + other.terms_.size());
            for (const auto& t : other.terms_)
                terms_.push_back(Term{ t.var, -t.coef });
            constant_ -= other.constant_;
            return *this;
        }

        LinExpr& operator*=(double k) noexcept {
            for (auto& t : terms_)
                t.coef *= k;
            constant_ *= k;
            return *this;
        }

        /**
         * @brief Merges repeated variables and drops zero coefficients
         * @note Keeps the order in which each variable first appears.
         */
        [[nodiscard]] LinExpr merged() const {
            LinExpr out;
            out.constant_ = constant_;
            std::unordered_map<std::size_t, std::size_t> slot;
            for (const auto& t : terms_) {
                auto [it, inserted] = slot.emplace(t.var, out.terms_.size());
                if (inserted)
                    out.terms_.push_back(t);
                else
                    out.terms_[it->second].coef += t.coef;
            }
            std::erase_if(out.terms_, [](const Term& t) { return t.coef == 0.0; });
            return out;
        }

        /**
         * @brief Evaluates the expression at values[var id]
         * @throws std::out_of_range if a referenced id is outside values
         */
        [[nodiscard]] double evaluate(const std::vector<double>& values) const {
            double total = constant_;
            for (const auto& t : terms_) {
                if (t.var >= values.size()) {
                    throw std::out_of_range(std::format(
                        "LinExpr::evaluate: variable {} has no value ({} given)",
                        t.var, values.size()));
                }
                total += t.coef * values[t.var];
            }
            return total;
        }

        /// @brief Structural equality (same terms in the same order, same constant)
        [[nodiscard]] bool sameAs(const LinExpr& other) const noexcept {
            return constant_ == other.constant_ && terms_ == other.terms_;
        }
    };

    inline LinExpr operator+(LinExpr a, const LinExpr& b) { return a += b; }
    inline LinExpr operator-(LinExpr a, const LinExpr& b) { return a -= b; }
    inline LinExpr operator-(LinExpr a) { return a *= -1.0; }
    inline LinExpr operator*(LinExpr a, double k) { return a *= k; }
    inline LinExpr operator*(double k, LinExpr a) { return a *= k; }

    // ============================================================================
    // CONSTRAINTS IN CANONICAL FORM
    // ============================================================================
    enum class Sense { LessEqual, GreaterEqual, Equal };

    /**
     * @struct TempConstr
     * @brief A row in canonical form: expr <sense> rhs, expr has no constant
     */
    struct TempConstr {
        LinExpr expr;
        Sense   sense = Sense::LessEqual;
        double  rhs = 0.0;
    };

    namespace expr_detail {

        inline TempConstr make_constr(const LinExpr& lhs, const LinExpr& rhs, Sense sense) {
            LinExpr diff = (lhs - rhs).merged();
            double  c = diff.constant();
            diff.addConstant(-c);
            return TempConstr{ std::move(diff), sense, -c };
        }

    } // namespace expr_detail

    inline TempConstr operator<=(const LinExpr& lhs, const LinExpr& rhs) {
        return expr_detail::make_constr(lhs, rhs, Sense::LessEqual);
    }

    inline TempConstr operator>=(const LinExpr& lhs, const LinExpr& rhs) {
        return expr_detail::make_constr(lhs, rhs, Sense::GreaterEqual);
    }

    inline TempConstr operator==(const LinExpr& lhs, const LinExpr& rhs) {
        return expr_detail::make_constr(lhs, rhs, Sense::Equal);
    }

    /// @brief "<=", ">=" or "="
    constexpr const char* senseSymbol(Sense s) noexcept {
        switch (s) {
            case Sense::LessEqual:    return "<=";
            case Sense::GreaterEqual: return ">=";
            case Sense::Equal:        return "=";
        }
        return "?";
    }

    // ============================================================================
    // SUMMATION OVER INDEX DOMAINS
    // ============================================================================
    namespace expr_detail {

        template<typename T, typename = void>
        struct is_tuple_like : std::false_type {};

        template<typename T>
        struct is_tuple_like<T, std::void_t<decltype(std::tuple_size<T>::value)>>
            : std::true_type {};

        template<typename T>
        inline constexpr bool is_tuple_like_v = is_tuple_like<T>::value;

        /// @brief Calls f(i) for scalar indices and f(i, j, ...) for tuples
        template<typename Func, typename Idx>
        decltype(auto) invoke_on_index(Func&& f, Idx&& idx) {
            using Raw = std::remove_cvref_t<Idx>;
            if constexpr (is_tuple_like_v<Raw>) {
                return std::apply(std::forward<Func>(f), std::forward<Idx>(idx));
            }
            else {
                return std::invoke(std::forward<Func>(f), std::forward<Idx>(idx));
            }
        }

    } // namespace expr_detail

    /**
     * @brief sum_{idx in rng} func(idx...)
     *
     * @details func may return a Var, a LinExpr or a number. An empty domain
     *          yields the zero expression, which still forms a valid row.
     *
     * @example
     *     auto produced = sum(O, [&](int o) { return Use(o, t); });
     *     auto cost = sum(O * T, [&](int o, int t) { return price(o, t) * Buy(o, t); });
     */
    template<typename Range, typename Func>
    LinExpr sum(const Range& rng, Func&& func) {
        LinExpr expr;
        for (const auto& idx : rng) {
            expr += LinExpr(expr_detail::invoke_on_index(func, idx));
        }
        return expr;
    }

} // namespace blend
