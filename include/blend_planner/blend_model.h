#pragma once
/*
===============================================================================
BLEND MODEL — Multi-period oil blending model (continuous and discrete)
===============================================================================

OVERVIEW
--------
BlendModelBuilder turns a BlendData bundle into a LinearModel that maximizes
profit over periods 1..N:

    validate()        validateBlendData(data, mode); fix O and T
    addVariables()    Buy, Use, Stock (ub = storage capacity) over O x T,
                      Produce over T, IsUsed (binary) over O x T if Discrete
    addConstraints()  core families; discrete families if Discrete
    addObjective()    maximize profitExpression()

Building twice from the same inputs yields equal models. BlendMode::Discrete
adds exactly the IsUsed family and the four discrete constraint families.

USAGE
-----
    BlendModelBuilder lp(reference::scenario(), BlendMode::Continuous);
    const Solution& s = lp.solve(solver);
    double profit = lp.objVal();

    LinearModel m = buildBlendModel(reference::scenario(), BlendMode::Discrete);

===============================================================================
*/

#include <string>
#include <utility>

#include "absl/log/log.h"

#include "blend_constraints.h"
#include "blend_discrete.h"
#include "blend_families.h"
#include "blend_objective.h"
#include "enum_utils.h"
#include "expressions.h"
#include "indexing.h"
#include "linear_model.h"
#include "model_builder.h"
#include "reference_data.h"
#include "validation.h"
#include "variables.h"

namespace blend {

    class BlendModelBuilder : public ModelBuilder<BlendVar, BlendCon> {
    private:
        BlendData data_;
        BlendMode mode_;
        IndexList O_;
        IndexList T_;

        BlendContext context() {
            return BlendContext{ model(), data_, vars_, cons_, O_, T_ };
        }

    public:
        BlendModelBuilder(BlendData data, BlendMode mode)
            : data_(std::move(data)), mode_(mode)
        {
        }

        const BlendData& data() const noexcept { return data_; }
        BlendMode mode() const noexcept { return mode_; }

        /// @brief Oil positions 0..n-1 (valid after build())
        const IndexList& oilPositions() const noexcept { return O_; }

        /// @brief Periods 1..N (valid after build())
        const IndexList& periods() const noexcept { return T_; }

    protected:
        void validate() override {
            validateBlendData(data_, mode_);
            O_ = data_.oils.positions();
            T_ = data_.prices.periods();
            store_["mode"] = std::string(modeName(mode_));
            store_["periods"] = static_cast<int>(T_.size());
        }

        void addVariables() override {
            LinearModel& m = model();
            const auto& oils = data_.oils;
            const double capacity = data_.params.requireNumber(param_keys::kStorageCapacity);

            vars_.set(BlendVar::Buy, VariableFactory::addIndexed(m, VarDomain::Continuous,
                0.0, kInfinity, "Buy", O_ * T_, oilPeriodNamer("Buy", oils)));
            vars_.set(BlendVar::Use, VariableFactory::addIndexed(m, VarDomain::Continuous,
                0.0, kInfinity, "Use", O_ * T_, oilPeriodNamer("Use", oils)));
            vars_.set(BlendVar::Stock, VariableFactory::addIndexed(m, VarDomain::Continuous,
                0.0, capacity, "Stock", O_ * T_, oilPeriodNamer("Stock", oils)));
            vars_.set(BlendVar::Produce, VariableFactory::addIndexed(m, VarDomain::Continuous,
                0.0, kInfinity, "Produce", T_));

            if (mode_ == BlendMode::Discrete) {
                vars_.set(BlendVar::IsUsed, VariableFactory::addIndexed(m, VarDomain::Binary,
                    0.0, 1.0, "IsUsed", O_ * T_, oilPeriodNamer("IsUsed", oils)));
            }
        }

        void addConstraints() override {
            BlendContext ctx = context();
            addCoreConstraints(ctx);
            if (mode_ == BlendMode::Discrete)
                addDiscreteConstraints(ctx);

            for_each_enum<BlendCon>([&](BlendCon c) {
                if (cons_.has(c))
                    VLOG(1) << "  " << enum_name(c) << ": " << cons_.get(c).size() << " rows";
            });
        }

        void addObjective() override {
            maximize(profitExpression(context()));
        }

        void beforeSolve() override {
            const LinearModel& m = builtModel();
            LOG(INFO) << "Solving " << modeName(mode_) << " blend model: "
                      << m.numVars() << " variables, " << m.numConstrs() << " constraints";
        }

        void afterSolve() override {
            const Solution& s = solution();
            if (s.isOptimal()) {
                LOG(INFO) << modeName(mode_) << " blend model: " << statusName(s.status)
                          << ", profit " << s.objective << " (" << s.runtimeSeconds << "s)";
            }
            else {
                LOG(WARNING) << modeName(mode_) << " blend model: " << statusName(s.status)
                             << (s.message.empty() ? "" : ": ") << s.message;
            }
        }
    };

    /// @brief Builds the model for data in the given mode
    /// @throws ValidationError on invalid inputs
    inline LinearModel buildBlendModel(const BlendData& data, BlendMode mode) {
        BlendModelBuilder builder(data, mode);
        return builder.build();
    }

} // namespace blend
