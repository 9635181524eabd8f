#pragma once
/*
===============================================================================
LINEAR MODEL — Solver-neutral record of variables, rows and objective
===============================================================================

OVERVIEW
--------
LinearModel is what a builder produces and a Solver consumes. It holds plain
declarations only:

• VariableDecl   — family, index tuple, name, domain, bounds
• ConstraintDecl — family, index tuple, name, expr <sense> rhs
• Objective      — expression and sense

Columns are numbered in declaration order; a Var handle is that number. A
Solution carries one value per column in the same order.

LIFECYCLE
---------
A model is open while its builder declares elements. seal() closes it, after
which addVar/addConstr/setObjective throw std::logic_error. Builders seal
the model before handing it out, so a solver only ever sees a finished model.

EQUALITY
--------
operator== compares every declaration in order (families, indices, names,
domains, bounds, terms, senses, right-hand sides, objective). Two builds from
the same inputs are expected to compare equal.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "expressions.h"

namespace blend {

    enum class VarDomain { Continuous, Binary, Integer };

    enum class ObjectiveSense { Minimize, Maximize };

    constexpr const char* domainName(VarDomain d) noexcept {
        switch (d) {
            case VarDomain::Continuous: return "continuous";
            case VarDomain::Binary:     return "binary";
            case VarDomain::Integer:    return "integer";
        }
        return "unknown";
    }

    struct VariableDecl {
        std::string      family;
        std::vector<int> index;
        std::string      name;
        VarDomain        domain = VarDomain::Continuous;
        double           lb = 0.0;
        double           ub = kInfinity;

        bool operator==(const VariableDecl&) const = default;
    };

    struct ConstraintDecl {
        std::string      family;
        std::vector<int> index;
        std::string      name;
        LinExpr          expr;
        Sense            sense = Sense::LessEqual;
        double           rhs = 0.0;

        bool operator==(const ConstraintDecl& o) const {
            return family == o.family && index == o.index && name == o.name
                && sense == o.sense && rhs == o.rhs && expr.sameAs(o.expr);
        }
    };

    struct Objective {
        LinExpr        expr;
        ObjectiveSense sense = ObjectiveSense::Minimize;
    };

    // ============================================================================
    // LINEAR MODEL
    // ============================================================================
    class LinearModel {
    private:
        std::vector<VariableDecl>   vars_;
        std::vector<ConstraintDecl> cons_;
        Objective                   objective_;
        bool                        hasObjective_ = false;
        bool                        sealed_ = false;

        void requireOpen(const char* op) const {
            if (sealed_) {
                throw std::logic_error(
                    std::format("LinearModel::{}: model is sealed", op));
            }
        }

        void requireKnown(const LinExpr& expr, const char* op) const {
            for (const auto& t : expr.terms()) {
                if (t.var >= vars_.size()) {
                    throw std::out_of_range(std::format(
                        "LinearModel::{}: variable {} is not declared ({} columns)",
                        op, t.var, vars_.size()));
                }
            }
        }

    public:
        LinearModel() = default;

        /**
         * @brief Declares a column and returns its handle
         * @throws std::invalid_argument if lb > ub or a bound is NaN
         * @throws std::logic_error if the model is sealed
         */
        Var addVar(VarDomain domain, double lb, double ub,
            std::string family, std::vector<int> index = {}, std::string name = {})
        {
            requireOpen("addVar");
            if (std::isnan(lb) || std::isnan(ub) || lb > ub) {
                throw std::invalid_argument(std::format(
                    "LinearModel::addVar: invalid bounds [{}, {}] for family {}",
                    lb, ub, family));
            }
            if (domain == VarDomain::Binary) {
                lb = std::max(lb, 0.0);
                ub = std::min(ub, 1.0);
            }
            vars_.push_back(VariableDecl{ std::move(family), std::move(index),
                std::move(name), domain, lb, ub });
            return Var(vars_.size() - 1);
        }

        /**
         * @brief Declares a row and returns its position
         * @throws std::out_of_range if the row references an undeclared column
         * @throws std::logic_error if the model is sealed
         */
        std::size_t addConstr(const TempConstr& c,
            std::string family, std::vector<int> index = {}, std::string name = {})
        {
            requireOpen("addConstr");
            requireKnown(c.expr, "addConstr");
            cons_.push_back(ConstraintDecl{ std::move(family), std::move(index),
                std::move(name), c.expr, c.sense, c.rhs });
            return cons_.size() - 1;
        }

        /// @brief Replaces the objective; repeated terms are merged
        void setObjective(const LinExpr& expr, ObjectiveSense sense) {
            requireOpen("setObjective");
            requireKnown(expr, "setObjective");
            objective_ = Objective{ expr.merged(), sense };
            hasObjective_ = true;
        }

        void seal() noexcept { sealed_ = true; }
        [[nodiscard]] bool sealed() const noexcept { return sealed_; }

        // ------------------------------------------------------------------
        // Accessors
        // ------------------------------------------------------------------
        const std::vector<VariableDecl>& variables() const noexcept { return vars_; }
        const std::vector<ConstraintDecl>& constraints() const noexcept { return cons_; }

        const VariableDecl& variable(Var v) const {
            if (!v.valid() || v.id() >= vars_.size()) {
                throw std::out_of_range(std::format(
                    "LinearModel::variable: handle {} out of range", v.id()));
            }
            return vars_[v.id()];
        }

        const ConstraintDecl& constraint(std::size_t row) const {
            if (row >= cons_.size()) {
                throw std::out_of_range(std::format(
                    "LinearModel::constraint: row {} out of range ({} rows)",
                    row, cons_.size()));
            }
            return cons_[row];
        }

        [[nodiscard]] bool hasObjective() const noexcept { return hasObjective_; }

        /// @throws std::logic_error if no objective was set
        const Objective& objective() const {
            if (!hasObjective_)
                throw std::logic_error("LinearModel::objective: no objective set");
            return objective_;
        }

        [[nodiscard]] std::size_t numVars() const noexcept { return vars_.size(); }
        [[nodiscard]] std::size_t numConstrs() const noexcept { return cons_.size(); }

        /// @brief True if any column is binary or integer
        [[nodiscard]] bool isMIP() const noexcept {
            for (const auto& v : vars_)
                if (v.domain != VarDomain::Continuous)
                    return true;
            return false;
        }

        bool operator==(const LinearModel& o) const {
            if (vars_ != o.vars_ || cons_ != o.cons_ || hasObjective_ != o.hasObjective_)
                return false;
            if (!hasObjective_)
                return true;
            return objective_.sense == o.objective_.sense
                && objective_.expr.sameAs(o.objective_.expr);
        }
    };

} // namespace blend
