#pragma once
/*
===============================================================================
BLEND FAMILIES — Variable/constraint keys and the context shared by families
===============================================================================

Every constraint function of the blending model receives a BlendContext: the
model being built, the inputs, the declared variables, the constraint
registry and the two base index sets

    O = range(0, n)   oil positions in catalog order
    T = {1, ..., N}   planning periods

Element names follow "Family[oil,period]" (oil ids, not positions) when
naming is enabled.

===============================================================================
*/

#include <string>
#include <vector>

#include "constraints.h"
#include "enum_utils.h"
#include "indexing.h"
#include "linear_model.h"
#include "naming.h"
#include "reference_data.h"
#include "variables.h"

namespace blend {

    DECLARE_ENUM_WITH_COUNT(BlendVar, Buy, Use, Stock, Produce, IsUsed);

    DECLARE_ENUM_WITH_COUNT(BlendCon,
        Balance, FinalStock, Capacity, ProductionDef, HardnessMin, HardnessMax,
        Link, MinThreshold, MaxIngredients, Logic);

    using BlendVarTable = VariableTable<BlendVar>;
    using BlendConTable = ConstraintTable<BlendCon>;

    struct BlendContext {
        LinearModel&         model;
        const BlendData&     data;
        const BlendVarTable& vars;
        BlendConTable&       cons;
        IndexList            O;
        IndexList            T;

        Var buy(int o, int t) const { return vars.var(BlendVar::Buy, o, t); }
        Var use(int o, int t) const { return vars.var(BlendVar::Use, o, t); }
        Var stock(int o, int t) const { return vars.var(BlendVar::Stock, o, t); }
        Var produce(int t) const { return vars.var(BlendVar::Produce, t); }
        Var isUsed(int o, int t) const { return vars.var(BlendVar::IsUsed, o, t); }

        double param(const char* key) const { return data.params.requireNumber(key); }
    };

    /// @brief Names "family[oil id,period]" for (oil position, period) indices
    inline VariableFactory::Namer oilPeriodNamer(const std::string& family, const OilCatalog& oils) {
        if constexpr (naming_disabled()) {
            return {};
        }
        else {
            return [family, &oils](const std::vector<int>& idx) {
                return make_name::math(family, oils[idx[0]].id, idx[1]);
            };
        }
    }

    /// @brief Names "family[oil id]" for single oil-position indices
    inline VariableFactory::Namer oilNamer(const std::string& family, const OilCatalog& oils) {
        if constexpr (naming_disabled()) {
            return {};
        }
        else {
            return [family, &oils](const std::vector<int>& idx) {
                return make_name::math(family, oils[idx[0]].id);
            };
        }
    }

} // namespace blend
