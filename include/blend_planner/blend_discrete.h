#pragma once
/*
===============================================================================
BLEND DISCRETE — Used/not-used logic on top of the core blending model
===============================================================================

Requires the IsUsed[o,t] binaries to be declared. Adds:

    Family          Index             Row
    --------------  ----------------  -------------------------------------------
    Link            (o, t)            Use[o,t] <= M[o] IsUsed[o,t]
    MinThreshold    (o, t)            Use[o,t] >= min_usage_if_used IsUsed[o,t]
    MaxIngredients  t                 sum_o IsUsed[o,t] <= max_ingredients_per_month
    Logic           (pair k, t)       IsUsed[dep_k,t] <= IsUsed[pre_k,t]

M[o] is the refining cap of the oil's category: Use[o,t] can never exceed it,
so the link row is inactive when IsUsed is one and forces Use to zero when it
is zero. Logic pairs come from the logical_dependencies parameter in list
order; an empty list adds an empty family.

===============================================================================
*/

#include <cstddef>
#include <string>
#include <vector>

#include "blend_families.h"
#include "constraints.h"
#include "expressions.h"
#include "indexing.h"
#include "naming.h"
#include "parameters.h"

namespace blend {

    /// @brief Big-M of the link row for oil position o
    inline double linkBigM(const BlendData& data, int o) {
        return data.params.requireNumber(capacityKey(data.oils[o].category));
    }

    inline void addLinkConstraints(BlendContext& ctx) {
        ctx.cons.set(BlendCon::Link, ConstraintFactory::addIndexed(ctx.model, "Link",
            ctx.O * ctx.T,
            [&](int o, int t) {
                return LinExpr(ctx.use(o, t)) <= linkBigM(ctx.data, o) * LinExpr(ctx.isUsed(o, t));
            },
            oilPeriodNamer("Link", ctx.data.oils)));
    }

    inline void addMinThresholdConstraints(BlendContext& ctx) {
        const double threshold = ctx.param(param_keys::kMinUsageIfUsed);

        ctx.cons.set(BlendCon::MinThreshold, ConstraintFactory::addIndexed(ctx.model, "MinThreshold",
            ctx.O * ctx.T,
            [&](int o, int t) {
                return LinExpr(ctx.use(o, t)) >= threshold * LinExpr(ctx.isUsed(o, t));
            },
            oilPeriodNamer("MinThreshold", ctx.data.oils)));
    }

    inline void addMaxIngredientsConstraints(BlendContext& ctx) {
        const double limit = static_cast<double>(
            ctx.data.params.requireInt(param_keys::kMaxIngredients));

        ctx.cons.set(BlendCon::MaxIngredients, ConstraintFactory::addIndexed(ctx.model, "MaxIngredients",
            ctx.T,
            [&](int t) {
                return sum(ctx.O, [&](int o) { return ctx.isUsed(o, t); }) <= limit;
            }));
    }

    inline void addLogicConstraints(BlendContext& ctx) {
        const auto& deps = ctx.data.params.require<DependencyList>(param_keys::kDependencies);
        const auto pairs = range(0, static_cast<int>(deps.size()));

        ctx.cons.set(BlendCon::Logic, ConstraintFactory::addIndexed(ctx.model, "Logic",
            pairs * ctx.T,
            [&](int k, int t) {
                int dependent = ctx.data.oils.position(deps[k].first);
                int prerequisite = ctx.data.oils.position(deps[k].second);
                return LinExpr(ctx.isUsed(dependent, t)) <= ctx.isUsed(prerequisite, t);
            },
            [&deps](const std::vector<int>& idx) {
                const auto& [dep, pre] = deps[idx[0]];
                return make_name::math("Logic", dep + "->" + pre, idx[1]);
            }));
    }

    /// @brief Adds the four discrete families, in a fixed order
    inline void addDiscreteConstraints(BlendContext& ctx) {
        addLinkConstraints(ctx);
        addMinThresholdConstraints(ctx);
        addMaxIngredientsConstraints(ctx);
        addLogicConstraints(ctx);
    }

} // namespace blend
