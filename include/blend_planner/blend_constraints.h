#pragma once
/*
===============================================================================
BLEND CONSTRAINTS — Core constraint families of the blending model
===============================================================================

One function per family. Each adds one row per element of its index set and
files the set under its BlendCon key.

    Family         Index          Row
    -------------  -------------  ---------------------------------------------
    Balance        (o, t)         Stock[o,t] = prev + Buy[o,t] - Use[o,t]
                                  prev = initial_stock at t = first,
                                         Stock[o,t-1] otherwise
    FinalStock     o              Stock[o,last] = target_final_stock
    Capacity       (c, t)         sum_{o in c} Use[o,t] <= cap(c)
    ProductionDef  t              Produce[t] = sum_o Use[o,t]
    HardnessMin    t              sum_o h[o] Use[o,t] >= min_hardness Produce[t]
    HardnessMax    t              sum_o h[o] Use[o,t] <= max_hardness Produce[t]

The hardness rows are the weighted-average bounds
    min <= sum_o h[o] Use[o,t] / Produce[t] <= max
multiplied through by Produce[t]; with Produce[t] = 0 they read 0 >= 0 and
0 <= 0. A category without oils still gets its Capacity rows (0 <= cap).

===============================================================================
*/

#include <cstddef>
#include <string>

#include "blend_families.h"
#include "constraints.h"
#include "expressions.h"
#include "indexing.h"
#include "naming.h"

namespace blend {

    inline void addBalanceConstraints(BlendContext& ctx) {
        const int first = ctx.T.first();
        const double initial = ctx.param(param_keys::kInitialStock);

        ctx.cons.set(BlendCon::Balance, ConstraintFactory::addIndexed(ctx.model, "Balance",
            ctx.O * ctx.T,
            [&](int o, int t) {
                LinExpr prev = (t == first) ? LinExpr(initial) : LinExpr(ctx.stock(o, t - 1));
                return ctx.stock(o, t) == prev + ctx.buy(o, t) - ctx.use(o, t);
            },
            oilPeriodNamer("Balance", ctx.data.oils)));
    }

    inline void addFinalStockConstraints(BlendContext& ctx) {
        const int last = ctx.T.last();
        const double target = ctx.param(param_keys::kTargetFinalStock);

        ctx.cons.set(BlendCon::FinalStock, ConstraintFactory::addIndexed(ctx.model, "FinalStock",
            ctx.O,
            [&](int o) { return LinExpr(ctx.stock(o, last)) == target; },
            oilNamer("FinalStock", ctx.data.oils)));
    }

    inline void addCapacityConstraints(BlendContext& ctx) {
        const auto categories = range(0, static_cast<int>(OilCategory_COUNT));

        ctx.cons.set(BlendCon::Capacity, ConstraintFactory::addIndexed(ctx.model, "Capacity",
            categories * ctx.T,
            [&](int c, int t) {
                auto category = static_cast<OilCategory>(c);
                LinExpr used;
                for (int o : ctx.data.oils.members(category))
                    used += ctx.use(o, t);
                return used <= ctx.param(capacityKey(category));
            },
            [](const std::vector<int>& idx) {
                return make_name::math("Capacity", enum_name(static_cast<OilCategory>(idx[0])), idx[1]);
            }));
    }

    inline void addProductionConstraints(BlendContext& ctx) {
        ctx.cons.set(BlendCon::ProductionDef, ConstraintFactory::addIndexed(ctx.model, "ProductionDef",
            ctx.T,
            [&](int t) {
                return LinExpr(ctx.produce(t)) == sum(ctx.O, [&](int o) { return ctx.use(o, t); });
            }));
    }

    namespace blend_detail {

        inline LinExpr weightedHardness(const BlendContext& ctx, int t) {
            return sum(ctx.O, [&](int o) {
                return ctx.data.oils[o].hardness * LinExpr(ctx.use(o, t));
            });
        }

    } // namespace blend_detail

    inline void addHardnessConstraints(BlendContext& ctx) {
        const double hmin = ctx.param(param_keys::kMinHardness);
        const double hmax = ctx.param(param_keys::kMaxHardness);

        ctx.cons.set(BlendCon::HardnessMin, ConstraintFactory::addIndexed(ctx.model, "HardnessMin",
            ctx.T,
            [&](int t) {
                return blend_detail::weightedHardness(ctx, t) >= hmin * LinExpr(ctx.produce(t));
            }));

        ctx.cons.set(BlendCon::HardnessMax, ConstraintFactory::addIndexed(ctx.model, "HardnessMax",
            ctx.T,
            [&](int t) {
                return blend_detail::weightedHardness(ctx, t) <= hmax * LinExpr(ctx.produce(t));
            }));
    }

    /// @brief Adds every family that both modes share, in a fixed order
    inline void addCoreConstraints(BlendContext& ctx) {
        addBalanceConstraints(ctx);
        addFinalStockConstraints(ctx);
        addCapacityConstraints(ctx);
        addProductionConstraints(ctx);
        addHardnessConstraints(ctx);
    }

} // namespace blend
