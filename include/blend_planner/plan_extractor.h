#pragma once
/*
===============================================================================
PLAN EXTRACTOR — Flattens an optimal solution into per-(period, oil) records
===============================================================================

extractPlan() reads Buy, Use and Stock of every (oil, period) through the
builder's VariableTable and returns one PlanRecord per pair, ordered by
period first and catalog order second:

    (1, VEG1) (1, VEG2) ... (1, OIL3) (2, VEG1) ...

It only reads; calling it twice on the same solution returns equal records.

===============================================================================
*/

#include <format>
#include <stdexcept>
#include <string>
#include <vector>

#include "blend_families.h"
#include "blend_model.h"
#include "solver.h"
#include "variables.h"

namespace blend {

    struct PlanRecord {
        int         period = 0;
        std::string oil;
        double      buy = 0.0;
        double      use = 0.0;
        double      stock = 0.0;

        bool operator==(const PlanRecord&) const = default;
    };

    /**
     * @brief Plan records of an optimal solution of builder's model
     * @throws std::logic_error unless solution is Optimal or before build()
     */
    inline std::vector<PlanRecord> extractPlan(const BlendModelBuilder& builder,
        const Solution& solution)
    {
        solution.requireOptimal("extractPlan");
        const LinearModel& model = builder.builtModel();
        if (solution.values.size() != model.numVars()) {
            throw std::logic_error(std::format(
                "extractPlan: solution has {} values, model has {} variables",
                solution.values.size(), model.numVars()));
        }

        const auto& vars = builder.variables();
        const auto& oils = builder.data().oils;

        std::vector<PlanRecord> records;
        records.reserve(builder.periods().size() * builder.oilPositions().size());
        for (int t : builder.periods()) {
            for (int o : builder.oilPositions()) {
                records.push_back(PlanRecord{
                    t,
                    oils[o].id,
                    value(solution.values, vars.var(BlendVar::Buy, o, t)),
                    value(solution.values, vars.var(BlendVar::Use, o, t)),
                    value(solution.values, vars.var(BlendVar::Stock, o, t)),
                });
            }
        }
        return records;
    }

} // namespace blend
