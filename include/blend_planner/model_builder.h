#pragma once
/*
===============================================================================
MODEL BUILDER — Template-method orchestration for building and solving models
===============================================================================

Overview
--------
ModelBuilder coordinates:

    * Input validation
    * Variable declaration (via VariableTable)
    * Constraint declaration (via ConstraintTable)
    * Objective construction
    * Handing the finished model to a Solver and keeping its Solution

It implements the "template method" pattern:

    build() {
        validate();
        addVariables();
        addConstraints();
        addObjective();
        seal model;
    }
    solve(solver) {
        build();
        beforeSolve();
        solution = solver.solve(model);
        afterSolve();
    }

Derived builders override the hooks; the workflow itself is fixed.

Key Features
------------
1. Build once:
       - build() runs the hooks exactly once; later calls return the same model.
       - The model is sealed afterwards, so nothing can change it while a
         solver holds it.

2. Solver independence:
       - The builder produces a LinearModel; any Solver can consume it.
       - Tests substitute a deterministic stub solver.

3. Fully generic:
       - ModelBuilder is templated on two enums:
           VarEnum: variable registry keys
           ConEnum: constraint registry keys

4. Solution accessors:
       - status(), isOptimal(), isInfeasible(), objVal(), runtime(),
         value(key, idx...) after solve().

5. Objective helpers:
       - minimize(expr) and maximize(expr).

Typical Usage
-------------
    DECLARE_ENUM_WITH_COUNT(Vars, X);
    DECLARE_ENUM_WITH_COUNT(Cons, Cap);

    class MyBuilder : public blend::ModelBuilder<Vars, Cons> {
        void addVariables() override {
            variables().set(Vars::X, VariableFactory::addIndexed(model(),
                VarDomain::Continuous, 0.0, 10.0, "X", range(0, 5)));
        }
        void addConstraints() override {
            constraints().set(Cons::Cap, ConstraintFactory::addScalar(model(), "Cap",
                sum(range(0, 5), [&](int i) { return variables().var(Vars::X, i); }) <= 20.0));
        }
        void addObjective() override {
            maximize(sum(range(0, 5), [&](int i) { return variables().var(Vars::X, i); }));
        }
    };

    MyBuilder b;
    b.solve(solver);
    double z = b.objVal();

===============================================================================
*/

#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "constraints.h"
#include "indexing.h"
#include "linear_model.h"
#include "parameters.h"
#include "solver.h"
#include "variables.h"

namespace blend {

    template <typename VarEnum, typename ConEnum>
    class ModelBuilder {
    public:
        using VarTable = VariableTable<VarEnum>;
        using ConTable = ConstraintTable<ConEnum>;

    private:
        LinearModel             model_;
        bool                    built_ = false;
        std::optional<Solution> solution_;

        const Solution& requireSolution(const char* who) const {
            if (!solution_) {
                throw std::logic_error(
                    std::format("ModelBuilder::{}: solve() has not been called", who));
            }
            return *solution_;
        }

    protected:
        VarTable  vars_;
        ConTable  cons_;
        DataStore store_;

        /// @brief Mutable model, only for use inside the build hooks
        LinearModel& model() noexcept { return model_; }

        // -------------------------------------------------------------------------
        // Objective helpers
        // -------------------------------------------------------------------------
        void minimize(const LinExpr& expr) {
            model_.setObjective(expr, ObjectiveSense::Minimize);
        }

        void maximize(const LinExpr& expr) {
            model_.setObjective(expr, ObjectiveSense::Maximize);
        }

        // -------------------------------------------------------------------------
        // Template-method hooks for derived classes
        // -------------------------------------------------------------------------

        /// @brief Check inputs; throw before anything is declared
        virtual void validate() {}

        /// @brief Declare decision variables into vars_
        virtual void addVariables() {}

        /// @brief Declare constraint families into cons_
        virtual void addConstraints() {}

        /// @brief Attach the objective (min or max)
        virtual void addObjective() {}

        /// @brief Runs after build(), right before the solver is called
        virtual void beforeSolve() {}

        /// @brief Runs after the solver returns (solution inspection, logging)
        virtual void afterSolve() {}

    public:
        ModelBuilder() = default;
        virtual ~ModelBuilder() = default;

        ModelBuilder(const ModelBuilder&) = delete;
        ModelBuilder& operator=(const ModelBuilder&) = delete;

        // -------------------------------------------------------------------------
        // Main orchestration
        // -------------------------------------------------------------------------

        /**
         * @brief Runs validate, addVariables, addConstraints, addObjective once
         *
         * @return The sealed model
         * @note If a hook throws, the partial model is discarded, the builder
         *       stays unbuilt and the exception propagates.
         */
        const LinearModel& build() {
            if (built_)
                return model_;

            try {
                validate();
                addVariables();
                addConstraints();
                addObjective();
            }
            catch (...) {
                model_ = LinearModel{};
                vars_.clear();
                cons_.clear();
                throw;
            }

            model_.seal();
            built_ = true;
            return model_;
        }

        /**
         * @brief build(), then hand the model to solver once
         * @return The solver's Solution, also kept for the accessors below
         */
        const Solution& solve(Solver& solver) {
            build();
            beforeSolve();
            solution_ = solver.solve(model_);
            afterSolve();
            return *solution_;
        }

        // -------------------------------------------------------------------------
        // Accessors
        // -------------------------------------------------------------------------
        [[nodiscard]] bool built() const noexcept { return built_; }

        /// @throws std::logic_error before build()
        const LinearModel& builtModel() const {
            if (!built_)
                throw std::logic_error("ModelBuilder::builtModel: build() has not been called");
            return model_;
        }

        VarTable& variables() noexcept { return vars_; }
        const VarTable& variables() const noexcept { return vars_; }

        ConTable& constraints() noexcept { return cons_; }
        const ConTable& constraints() const noexcept { return cons_; }

        DataStore& store() noexcept { return store_; }
        const DataStore& store() const noexcept { return store_; }

        // -------------------------------------------------------------------------
        // Solution accessors (require solve())
        // -------------------------------------------------------------------------
        [[nodiscard]] bool hasSolution() const noexcept {
            return solution_.has_value() && solution_->isOptimal();
        }

        const Solution& solution() const { return requireSolution("solution"); }

        SolveStatus status() const { return requireSolution("status").status; }

        bool isOptimal() const { return status() == SolveStatus::Optimal; }
        bool isInfeasible() const { return status() == SolveStatus::Infeasible; }
        bool isUnbounded() const { return status() == SolveStatus::Unbounded; }

        /// @throws std::logic_error unless the last solve was optimal
        double objVal() const {
            const auto& s = requireSolution("objVal");
            s.requireOptimal("ModelBuilder::objVal");
            return s.objective;
        }

        double runtime() const { return requireSolution("runtime").runtimeSeconds; }

        /// @brief Value of one variable of the last optimal solution
        template <typename... I>
        double value(VarEnum key, I... idx) const {
            const auto& s = requireSolution("value");
            s.requireOptimal("ModelBuilder::value");
            return blend::value(s.values, vars_.var(key, idx...));
        }
    };

} // namespace blend
