#pragma once
/*
===============================================================================
BLEND PLANNER — Unified Include Header
===============================================================================

OVERVIEW
--------
Single include for the multi-period oil blending planner. It provides the
solver-neutral modelling layer, the blending model itself and the reporting
helpers. The Gurobi backend is included only when the build defines
BLEND_WITH_GUROBI (the blend_planner_gurobi CMake target does).

WHAT'S INCLUDED
---------------
• naming.h, enum_utils.h, indexing.h  — Names, enum keys, index domains
• expressions.h, linear_model.h       — LinExpr, TempConstr, LinearModel
• variables.h, constraints.h          — Indexed sets and enum-keyed tables
• parameters.h, errors.h              — ParameterSet, ValidationError
• solver.h, model_builder.h           — Solver interface, ModelBuilder
• reference_data.h, validation.h      — Oils, prices, input checks
• blend_model.h                       — BlendModelBuilder (LP and MIP)
• diagnostics.h, plan_extractor.h     — Statistics, feasibility, records
• scenario.h, plan_report.h           — One-shot runs and text reports
• reference_scenario.h                — The five-oil six-month data set
• gurobi_solver.h                     — Gurobi backend (optional)

QUICK START
-----------
    blend::GurobiSolver solver;
    auto lp  = blend::runScenario(blend::reference::scenario(),
                                  blend::BlendMode::Continuous, solver);
    blend::printScenario(std::cout, "LP Results", lp);

NAMESPACE
---------
Everything lives in `blend::`, including `blend::make_name` and
`blend::force_name`. Reference data is in `blend::reference`.

===============================================================================
*/

// ============================================================================
// CORE COMPONENTS (order matters for dependencies)
// ============================================================================

#include "naming.h"
#include "enum_utils.h"
#include "indexing.h"
#include "expressions.h"
#include "linear_model.h"
#include "variables.h"
#include "constraints.h"
#include "errors.h"
#include "parameters.h"
#include "solver.h"
#include "model_builder.h"
#include "diagnostics.h"

// ============================================================================
// BLENDING MODEL
// ============================================================================

#include "reference_data.h"
#include "validation.h"
#include "blend_families.h"
#include "blend_constraints.h"
#include "blend_discrete.h"
#include "blend_objective.h"
#include "blend_model.h"
#include "plan_extractor.h"
#include "scenario.h"
#include "plan_report.h"
#include "reference_scenario.h"

// ============================================================================
// BACKENDS
// ============================================================================

#ifdef BLEND_WITH_GUROBI
#include "gurobi_solver.h"
#endif
