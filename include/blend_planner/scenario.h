#pragma once
/*
===============================================================================
SCENARIO — One build, one solve, one extraction
===============================================================================

runScenario() builds a fresh BlendModelBuilder for the given mode, solves it
once with the given solver and collects what a report needs. Non-optimal
outcomes come back in ScenarioResult::status; only invalid inputs throw
(ValidationError). Scenarios share no state, so the continuous and discrete
runs may use separate solvers on separate threads.

===============================================================================
*/

#include <string>
#include <vector>

#include "absl/log/log.h"

#include "blend_model.h"
#include "diagnostics.h"
#include "plan_extractor.h"
#include "reference_data.h"
#include "solver.h"
#include "validation.h"

namespace blend {

    struct ScenarioResult {
        BlendMode               mode = BlendMode::Continuous;
        SolveStatus             status = SolveStatus::Error;
        double                  objective = 0.0;
        std::vector<PlanRecord> records;
        ModelStatistics         statistics;
        std::string             message;
        double                  runtimeSeconds = 0.0;

        bool isOptimal() const noexcept { return status == SolveStatus::Optimal; }
    };

    /**
     * @brief Builds, solves and extracts one scenario
     * @throws ValidationError on invalid inputs
     */
    inline ScenarioResult runScenario(const BlendData& data, BlendMode mode, Solver& solver) {
        LOG(INFO) << "Scenario " << modeName(mode) << ": building model";

        BlendModelBuilder builder(data, mode);
        const LinearModel& model = builder.build();

        ScenarioResult result;
        result.mode = mode;
        result.statistics = computeStatistics(model);
        VLOG(1) << "Scenario " << modeName(mode) << ": " << modelSummary(result.statistics);

        const Solution& solution = builder.solve(solver);
        result.status = solution.status;
        result.message = solution.message;
        result.runtimeSeconds = solution.runtimeSeconds;

        if (solution.isOptimal()) {
            result.objective = solution.objective;
            result.records = extractPlan(builder, solution);
        }

        LOG(INFO) << "Scenario " << modeName(mode) << " finished with "
                  << statusString(result.status) << " using " << solver.name();
        return result;
    }

} // namespace blend
