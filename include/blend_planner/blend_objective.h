#pragma once
/*
===============================================================================
BLEND OBJECTIVE — Profit of a blending plan
===============================================================================

    profit = sum_t   sales_price   * Produce[t]
           - sum_o,t price[o,t]    * Buy[o,t]
           - sum_o,t storage_cost  * Stock[o,t]

Storage is charged on every period's closing stock, including the last.

===============================================================================
*/

#include "blend_families.h"
#include "expressions.h"

namespace blend {

    inline LinExpr profitExpression(const BlendContext& ctx) {
        const double salesPrice = ctx.param(param_keys::kSalesPrice);
        const double storageCost = ctx.param(param_keys::kStorageCost);

        LinExpr revenue = sum(ctx.T, [&](int t) {
            return salesPrice * LinExpr(ctx.produce(t));
        });

        LinExpr purchase = sum(ctx.O * ctx.T, [&](int o, int t) {
            return ctx.data.prices.at(ctx.data.oils[o].id, t) * LinExpr(ctx.buy(o, t));
        });

        LinExpr storage = sum(ctx.O * ctx.T, [&](int o, int t) {
            return storageCost * LinExpr(ctx.stock(o, t));
        });

        return revenue - purchase - storage;
    }

} // namespace blend
