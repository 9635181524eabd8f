#pragma once
/*
===============================================================================
SOLVER — Backend-neutral solve interface, configuration and solution record
===============================================================================

OVERVIEW
--------
The model layer never talks to a solver library directly. A Solver takes a
finished LinearModel and returns a Solution; everything backend-specific
(environment, licence, parameter names, status codes) stays behind it.

KEY COMPONENTS
--------------
• SolveStatus   — Optimal | Infeasible | Unbounded | Error
• Solution      — Status, per-column values, objective, message, runtime
• SolverConfig  — Optional time limit, MIP gap, threads, output, presolve,
                  MIP focus, LP export path; presets Fast/Accurate/...
• Solver        — Abstract solve(model) + name()

CONTRACT
--------
• solve() never throws for solver-side failures; it reports them as
  SolveStatus::Error with the backend's message
• Values are only meaningful when status == Optimal; they are indexed by
  Var::id() and have exactly model.numVars() entries
• solve() does not retry and does not modify the model

===============================================================================
*/

#include <cstddef>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "linear_model.h"

namespace blend {

    enum class SolveStatus { Optimal, Infeasible, Unbounded, Error };

    /// @brief "OPTIMAL", "INFEASIBLE", "UNBOUNDED" or "ERROR"
    constexpr const char* statusName(SolveStatus s) noexcept {
        switch (s) {
            case SolveStatus::Optimal:    return "OPTIMAL";
            case SolveStatus::Infeasible: return "INFEASIBLE";
            case SolveStatus::Unbounded:  return "UNBOUNDED";
            case SolveStatus::Error:      return "ERROR";
        }
        return "UNKNOWN";
    }

    // ============================================================================
    // SOLUTION
    // ============================================================================
    struct Solution {
        SolveStatus         status = SolveStatus::Error;
        std::vector<double> values;
        double              objective = 0.0;
        std::string         message;
        double              runtimeSeconds = 0.0;

        [[nodiscard]] bool isOptimal() const noexcept {
            return status == SolveStatus::Optimal;
        }

        /// @throws std::logic_error unless the solution is optimal
        void requireOptimal(const char* who) const {
            if (!isOptimal()) {
                throw std::logic_error(std::format(
                    "{}: solution is {}, values are only available for OPTIMAL",
                    who, statusName(status)));
            }
        }

        static Solution failure(SolveStatus status, std::string message) {
            Solution s;
            s.status = status;
            s.message = std::move(message);
            return s;
        }
    };

    // ============================================================================
    // SOLVER CONFIG
    // ============================================================================
    /**
     * @struct SolverConfig
     * @brief Backend settings; unset fields keep the backend's default
     */
    struct SolverConfig {
        std::optional<double>      timeLimitSeconds;
        std::optional<double>      mipGap;
        std::optional<int>         threads;
        std::optional<bool>        outputFlag;
        std::optional<int>         presolve;     ///< -1 auto, 0 off, 1 conservative, 2 aggressive
        std::optional<int>         mipFocus;     ///< 0 balanced, 1 feasibility, 2 optimality, 3 bound
        std::optional<std::string> exportPath;   ///< Write the translated model here before solving

        enum class Preset {
            Fast,        ///< 60s limit, 5% gap, automatic threads
            Accurate,    ///< 1h limit, 0.01% gap
            Feasibility, ///< MIPFocus=1
            Quiet,       ///< No solver output
            Debug        ///< Solver output on, presolve off
        };

        /// @brief Overlays a preset on the current settings
        SolverConfig& apply(Preset p) {
            switch (p) {
                case Preset::Fast:
                    timeLimitSeconds = 60.0;
                    mipGap = 0.05;
                    threads = 0;
                    break;
                case Preset::Accurate:
                    timeLimitSeconds = 3600.0;
                    mipGap = 0.0001;
                    break;
                case Preset::Feasibility:
                    mipFocus = 1;
                    break;
                case Preset::Quiet:
                    outputFlag = false;
                    break;
                case Preset::Debug:
                    outputFlag = true;
                    presolve = 0;
                    break;
            }
            return *this;
        }

        static SolverConfig fromPreset(Preset p) {
            SolverConfig c;
            c.apply(p);
            return c;
        }
    };

    constexpr const char* presetName(SolverConfig::Preset p) noexcept {
        switch (p) {
            case SolverConfig::Preset::Fast:        return "Fast";
            case SolverConfig::Preset::Accurate:    return "Accurate";
            case SolverConfig::Preset::Feasibility: return "Feasibility";
            case SolverConfig::Preset::Quiet:       return "Quiet";
            case SolverConfig::Preset::Debug:       return "Debug";
        }
        return "Unknown";
    }

    // ============================================================================
    // SOLVER INTERFACE
    // ============================================================================
    class Solver {
    public:
        virtual ~Solver() = default;

        /// @brief Solves a sealed model once
        virtual Solution solve(const LinearModel& model) = 0;

        virtual std::string name() const = 0;
    };

} // namespace blend
