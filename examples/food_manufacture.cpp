/*
================================================================================
FOOD MANUFACTURE - Multi-period Oil Blending
================================================================================
PROBLEM TYPE: Linear Programming (LP) and Mixed-Integer Programming (MIP)

PROBLEM DESCRIPTION
-------------------
A manufacturer refines five raw oils (two vegetable, three non-vegetable) into
a single food product over six months. Oils can be bought at monthly prices,
stored up to a capacity per oil, and refined subject to per-category refining
limits. The product must meet a hardness window. The goal is the plan that
maximizes revenue minus purchase and storage cost.

The MIP variant (Food Manufacture 2) adds:
    - at most three oils per month
    - an oil that is used must be used at least 20 tons
    - using VEG1 or VEG2 in a month forces OIL3 to be used that month

MATHEMATICAL MODEL
------------------
Sets:
    O = oils,  T = {1..6} months

Variables:
    buy[o,t], use[o,t] >= 0,  0 <= stock[o,t] <= C,  produce[t] >= 0
    isUsed[o,t] in {0,1}                                    (MIP only)

Objective:
    max  sum_t price*produce[t] - sum_o,t cost[o,t]*buy[o,t]
                                - sum_o,t storage*stock[o,t]

Constraints:
    Balance[o,t]:      stock[o,t-1] + buy[o,t] - use[o,t] = stock[o,t]
    FinalStock[o]:     stock[o,|T|] = target
    Capacity[c,t]:     sum_{o in c} use[o,t] <= cap[c]
    ProductionDef[t]:  sum_o use[o,t] = produce[t]
    HardnessMin/Max:   hmin*produce[t] <= sum_o h[o]*use[o,t] <= hmax*produce[t]
    (MIP) Link, MinThreshold, MaxIngredients, Logic

USAGE
-----
    food_manufacture --mode=both --mip_gap=0 --threads=4 --verbose=1

================================================================================
*/

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"

#include <blend_planner/blend_planner.h>
#include <blend_planner/gurobi_solver.h>

ABSL_FLAG(std::string, mode, "both", "Which model to solve: lp, mip or both.");
ABSL_FLAG(double, time_limit, 0.0, "Solver time limit in seconds, 0 for none.");
ABSL_FLAG(double, mip_gap, -1.0, "Relative MIP gap, negative for the solver default.");
ABSL_FLAG(int, threads, 0, "Solver threads, 0 for the solver default.");
ABSL_FLAG(int, verbose, 0, "VLOG level; 1 or more also enables solver output.");
ABSL_FLAG(std::string, export_lp, "", "Write each model to this path before solving.");

namespace {

    blend::SolverConfig configFromFlags() {
        blend::SolverConfig config = blend::SolverConfig::fromPreset(
            absl::GetFlag(FLAGS_verbose) > 0 ? blend::SolverConfig::Preset::Debug
                                             : blend::SolverConfig::Preset::Quiet);
        if (absl::GetFlag(FLAGS_time_limit) > 0.0)
            config.timeLimitSeconds = absl::GetFlag(FLAGS_time_limit);
        if (absl::GetFlag(FLAGS_mip_gap) >= 0.0)
            config.mipGap = absl::GetFlag(FLAGS_mip_gap);
        if (absl::GetFlag(FLAGS_threads) > 0)
            config.threads = absl::GetFlag(FLAGS_threads);
        if (!absl::GetFlag(FLAGS_export_lp).empty())
            config.exportPath = absl::GetFlag(FLAGS_export_lp);
        return config;
    }

    bool runOne(const blend::BlendData& data, blend::BlendMode mode,
        const blend::SolverConfig& config, const std::string& title)
    {
        blend::GurobiSolver solver(config);
        auto result = blend::runScenario(data, mode, solver);
        blend::printScenario(std::cout, title, result);
        return result.isOptimal();
    }

} // namespace

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main(int argc, char** argv) {
    absl::SetProgramUsageMessage("Solves the Food Manufacture blending LP and MIP.");
    absl::ParseCommandLine(argc, argv);
    absl::InitializeLog();
    absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
    absl::SetGlobalVLogLevel(absl::GetFlag(FLAGS_verbose));

    const std::string mode = absl::GetFlag(FLAGS_mode);
    if (mode != "lp" && mode != "mip" && mode != "both") {
        LOG(ERROR) << "--mode must be lp, mip or both, got '" << mode << "'";
        return EXIT_FAILURE;
    }

    std::cout << "================================================================\n";
    std::cout << "FOOD MANUFACTURE - Multi-period Oil Blending\n";
    std::cout << "================================================================\n";

    try {
        const blend::BlendData data = blend::reference::scenario();
        const blend::SolverConfig config = configFromFlags();
        bool ok = true;

        if (mode == "lp" || mode == "both")
            ok = runOne(data, blend::BlendMode::Continuous, config,
                "LP Results (Food Manufacture 1)") && ok;

        if (mode == "both")
            std::cout << "\n" << std::string(64, '=') << "\n";

        if (mode == "mip" || mode == "both")
            ok = runOne(data, blend::BlendMode::Discrete, config,
                "MIP Results (Food Manufacture 2)") && ok;

        return ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const blend::ValidationError& e) {
        LOG(ERROR) << "Invalid input: " << e.what();
    }
    catch (const std::exception& e) {
        LOG(ERROR) << "Error: " << e.what();
    }
    return EXIT_FAILURE;
}
