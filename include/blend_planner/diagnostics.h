#pragma once
/*
===============================================================================
DIAGNOSTICS — Model statistics and solution checking utilities
===============================================================================

Overview
--------
Utilities that work on the solver-neutral LinearModel, so they run the same
with any backend and without one:

    * Human-readable status strings
    * Model statistics (variable counts per domain, rows per sense, non-zeros)
    * Feasibility checking of an assignment (bounds, rows, integrality)
    * Objective evaluation

Design Philosophy
-----------------
1. Free functions on LinearModel, not tied to ModelBuilder
2. Lightweight result structs
3. Violations name the element by family and index, so a report reads
   "Balance[2,4]" even in release builds where element names are empty

Typical Usage
-------------
    auto stats = blend::computeStatistics(model);
    LOG(INFO) << blend::modelSummary(stats);

    auto report = blend::checkFeasibility(model, solution.values, 1e-6);
    if (!report.feasible()) {
        for (const auto& v : report.violations)
            std::cerr << v.describe() << "\n";
    }

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "linear_model.h"
#include "solver.h"
#include "variables.h"

namespace blend {

// =============================================================================
// STATUS STRING CONVERSION
// =============================================================================

/**
 * @brief Convert a SolveStatus to a human-readable string
 * @example statusString(SolveStatus::Infeasible)   // "INFEASIBLE"
 */
inline std::string statusString(SolveStatus status) {
    return statusName(status);
}

// =============================================================================
// MODEL STATISTICS
// =============================================================================

struct ModelStatistics {
    std::size_t numVars = 0;
    std::size_t numConstrs = 0;
    std::size_t numContinuous = 0;
    std::size_t numBinary = 0;
    std::size_t numInteger = 0;
    std::size_t numLessEqual = 0;
    std::size_t numGreaterEqual = 0;
    std::size_t numEqual = 0;
    std::size_t numNonZeros = 0;   ///< Non-zero coefficients over all rows

    bool operator==(const ModelStatistics&) const = default;
};

inline ModelStatistics computeStatistics(const LinearModel& model) {
    ModelStatistics stats;
    stats.numVars = model.numVars();
    stats.numConstrs = model.numConstrs();

    for (const auto& v : model.variables()) {
        switch (v.domain) {
            case VarDomain::Continuous: ++stats.numContinuous; break;
            case VarDomain::Binary:     ++stats.numBinary; break;
            case VarDomain::Integer:    ++stats.numInteger; break;
        }
    }

    for (const auto& c : model.constraints()) {
        switch (c.sense) {
            case Sense::LessEqual:    ++stats.numLessEqual; break;
            case Sense::GreaterEqual: ++stats.numGreaterEqual; break;
            case Sense::Equal:        ++stats.numEqual; break;
        }
        stats.numNonZeros += c.expr.size();
    }
    return stats;
}

/**
 * @brief Brief summary string
 * @return e.g. "150 vars (30 bin), 120 constrs, 580 nz"
 */
inline std::string modelSummary(const ModelStatistics& stats) {
    std::string result = std::to_string(stats.numVars) + " vars";

    if (stats.numBinary > 0 || stats.numInteger > 0) {
        result += " (";
        if (stats.numBinary > 0) {
            result += std::to_string(stats.numBinary) + " bin";
            if (stats.numInteger > 0) result += ", ";
        }
        if (stats.numInteger > 0) {
            result += std::to_string(stats.numInteger) + " int";
        }
        result += ")";
    }

    result += ", " + std::to_string(stats.numConstrs) + " constrs";
    result += ", " + std::to_string(stats.numNonZeros) + " nz";
    return result;
}

inline std::string modelSummary(const LinearModel& model) {
    return modelSummary(computeStatistics(model));
}

// =============================================================================
// FEASIBILITY CHECKING
// =============================================================================

struct Violation {
    enum class Kind { LowerBound, UpperBound, Integrality, Row };

    Kind             kind = Kind::Row;
    std::string      family;
    std::vector<int> index;
    double           amount = 0.0;   ///< How far outside the feasible set

    std::string describe() const {
        const char* what = "row";
        switch (kind) {
            case Kind::LowerBound:  what = "lower bound"; break;
            case Kind::UpperBound:  what = "upper bound"; break;
            case Kind::Integrality: what = "integrality"; break;
            case Kind::Row:         break;
        }
        return std::format("{}{} {} violated by {}",
            family, index_detail::describe(index), what, amount);
    }
};

struct FeasibilityReport {
    std::vector<Violation> violations;
    double                 maxViolation = 0.0;

    bool feasible() const noexcept { return violations.empty(); }

    /// @brief Violations of one family only
    std::vector<Violation> inFamily(const std::string& family) const {
        std::vector<Violation> out;
        std::copy_if(violations.begin(), violations.end(), std::back_inserter(out),
            [&](const Violation& v) { return v.family == family; });
        return out;
    }
};

/**
 * @brief Checks bounds, integrality and every row against an assignment
 *
 * @param values One value per column, indexed by Var::id()
 * @param tol    Absolute tolerance
 * @throws std::invalid_argument if values.size() != model.numVars()
 */
inline FeasibilityReport checkFeasibility(const LinearModel& model,
    const std::vector<double>& values, double tol = 1e-6)
{
    if (values.size() != model.numVars()) {
        throw std::invalid_argument(std::format(
            "checkFeasibility: {} values for {} variables", values.size(), model.numVars()));
    }

    FeasibilityReport report;
    auto record = [&](Violation::Kind kind, const std::string& family,
        const std::vector<int>& index, double amount)
    {
        report.violations.push_back(Violation{ kind, family, index, amount });
        report.maxViolation = std::max(report.maxViolation, amount);
    };

    for (std::size_t j = 0; j < values.size(); ++j) {
        const auto& v = model.variables()[j];
        double x = values[j];
        if (x < v.lb - tol)
            record(Violation::Kind::LowerBound, v.family, v.index, v.lb - x);
        if (x > v.ub + tol)
            record(Violation::Kind::UpperBound, v.family, v.index, x - v.ub);
        if (v.domain != VarDomain::Continuous && std::abs(x - std::round(x)) > tol)
            record(Violation::Kind::Integrality, v.family, v.index, std::abs(x - std::round(x)));
    }

    for (const auto& c : model.constraints()) {
        double lhs = c.expr.evaluate(values);
        double amount = 0.0;
        switch (c.sense) {
            case Sense::LessEqual:    amount = lhs - c.rhs; break;
            case Sense::GreaterEqual: amount = c.rhs - lhs; break;
            case Sense::Equal:        amount = std::abs(lhs - c.rhs); break;
        }
        if (amount > tol)
            record(Violation::Kind::Row, c.family, c.index, amount);
    }

    return report;
}

/// @brief Objective value of an assignment
/// @throws std::logic_error if the model has no objective
inline double evaluateObjective(const LinearModel& model, const std::vector<double>& values) {
    return model.objective().expr.evaluate(values);
}

} // namespace blend
