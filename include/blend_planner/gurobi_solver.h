#pragma once
/*
===============================================================================
GUROBI SOLVER — Solver backend on the Gurobi C++ API
===============================================================================

OVERVIEW
--------
GurobiSolver translates a LinearModel into a GRBModel, applies SolverConfig,
optimizes once and maps the result back into a Solution.

    LinearModel            GRBModel
    ---------------------  ------------------------------------------
    VariableDecl           addVar(lb, ub, 0, GRB_CONTINUOUS|BINARY|INTEGER)
    +/- kInfinity bound    +/- GRB_INFINITY
    ConstraintDecl         addConstr(expr, GRB_LESS_EQUAL|..., rhs, name)
    Objective              setObjective(expr, GRB_MINIMIZE|GRB_MAXIMIZE)

STATUS MAPPING
--------------
    GRB_OPTIMAL      -> Optimal (values + objective)
    GRB_INFEASIBLE   -> Infeasible
    GRB_UNBOUNDED    -> Unbounded
    GRB_INF_OR_UNBD  -> re-optimized with DualReductions=0, then mapped again
    anything else    -> Error ("status TIME_LIMIT (9)", ...)
    GRBException     -> Error with the exception message and code

The environment is created on first use and reused by later solves. A licence
or environment failure surfaces as an Error solution, never as an exception.

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <format>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "gurobi_c++.h"

#include "absl/log/log.h"

#include "linear_model.h"
#include "solver.h"

namespace blend {

    namespace gurobi_detail {

        inline char vtype(VarDomain d) noexcept {
            switch (d) {
                case VarDomain::Binary:  return GRB_BINARY;
                case VarDomain::Integer: return GRB_INTEGER;
                case VarDomain::Continuous: break;
            }
            return GRB_CONTINUOUS;
        }

        inline char sense(Sense s) noexcept {
            switch (s) {
                case Sense::LessEqual:    return GRB_LESS_EQUAL;
                case Sense::GreaterEqual: return GRB_GREATER_EQUAL;
                case Sense::Equal:        break;
            }
            return GRB_EQUAL;
        }

        inline double bound(double b) noexcept {
            if (std::isinf(b))
                return b > 0 ? GRB_INFINITY : -GRB_INFINITY;
            return b;
        }

        inline GRBLinExpr translate(const LinExpr& expr, const std::vector<GRBVar>& cols) {
            GRBLinExpr out(expr.constant());
            for (const auto& t : expr.terms())
                out += t.coef * cols[t.var];
            return out;
        }

        /// @brief Name of a Gurobi status code, e.g. "TIME_LIMIT"
        inline const char* statusCodeName(int status) noexcept {
            switch (status) {
                case GRB_LOADED:          return "LOADED";
                case GRB_OPTIMAL:         return "OPTIMAL";
                case GRB_INFEASIBLE:      return "INFEASIBLE";
                case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
                case GRB_UNBOUNDED:       return "UNBOUNDED";
                case GRB_CUTOFF:          return "CUTOFF";
                case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
                case GRB_NODE_LIMIT:      return "NODE_LIMIT";
                case GRB_TIME_LIMIT:      return "TIME_LIMIT";
                case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
                case GRB_INTERRUPTED:     return "INTERRUPTED";
                case GRB_NUMERIC:         return "NUMERIC";
                case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
                case GRB_INPROGRESS:      return "INPROGRESS";
                case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
                default:                  return "UNKNOWN";
            }
        }

    } // namespace gurobi_detail

    class GurobiSolver : public Solver {
    private:
        SolverConfig             config_;
        std::unique_ptr<GRBEnv>  env_;

        GRBEnv& environment() {
            if (!env_) {
                auto env = std::make_unique<GRBEnv>(true);  // defer licence check
                if (config_.outputFlag)
                    env->set(GRB_IntParam_OutputFlag, *config_.outputFlag ? 1 : 0);
                env->start();
                env_ = std::move(env);
            }
            return *env_;
        }

        void applyConfig(GRBModel& m) const {
            if (config_.timeLimitSeconds) m.set(GRB_DoubleParam_TimeLimit, *config_.timeLimitSeconds);
            if (config_.mipGap)           m.set(GRB_DoubleParam_MIPGap, *config_.mipGap);
            if (config_.threads)          m.set(GRB_IntParam_Threads, *config_.threads);
            if (config_.outputFlag)       m.set(GRB_IntParam_OutputFlag, *config_.outputFlag ? 1 : 0);
            if (config_.presolve)         m.set(GRB_IntParam_Presolve, *config_.presolve);
            if (config_.mipFocus)         m.set(GRB_IntParam_MIPFocus, *config_.mipFocus);
        }

        static std::vector<GRBVar> translateModel(const LinearModel& model, GRBModel& grb) {
            std::vector<GRBVar> cols;
            cols.reserve(model.numVars());
            for (const auto& v : model.variables()) {
                cols.push_back(grb.addVar(gurobi_detail::bound(v.lb), gurobi_detail::bound(v.ub),
                    0.0, gurobi_detail::vtype(v.domain), v.name));
            }

            for (const auto& c : model.constraints()) {
                grb.addConstr(gurobi_detail::translate(c.expr, cols),
                    gurobi_detail::sense(c.sense), c.rhs, c.name);
            }

            if (model.hasObjective()) {
                const auto& obj = model.objective();
                grb.setObjective(gurobi_detail::translate(obj.expr, cols),
                    obj.sense == ObjectiveSense::Maximize ? GRB_MAXIMIZE : GRB_MINIMIZE);
            }
            return cols;
        }

    public:
        GurobiSolver() = default;

        explicit GurobiSolver(SolverConfig config)
            : config_(std::move(config))
        {
        }

        const SolverConfig& config() const noexcept { return config_; }

        std::string name() const override { return "gurobi"; }

        Solution solve(const LinearModel& model) override {
            try {
                GRBModel grb(environment());
                applyConfig(grb);
                std::vector<GRBVar> cols = translateModel(model, grb);

                if (config_.exportPath) {
                    grb.update();
                    grb.write(*config_.exportPath);
                    LOG(INFO) << "Wrote model to " << *config_.exportPath;
                }

                grb.optimize();
                int status = grb.get(GRB_IntAttr_Status);
                double runtime = grb.get(GRB_DoubleAttr_Runtime);

                if (status == GRB_INF_OR_UNBD) {
                    VLOG(1) << "INF_OR_UNBD, re-solving with DualReductions=0";
                    grb.set(GRB_IntParam_DualReductions, 0);
                    grb.reset();
                    grb.optimize();
                    status = grb.get(GRB_IntAttr_Status);
                    runtime += grb.get(GRB_DoubleAttr_Runtime);
                }

                Solution out;
                out.runtimeSeconds = runtime;
                switch (status) {
                    case GRB_OPTIMAL:
                        out.status = SolveStatus::Optimal;
                        out.objective = grb.get(GRB_DoubleAttr_ObjVal);
                        out.values.reserve(cols.size());
                        for (const auto& v : cols)
                            out.values.push_back(v.get(GRB_DoubleAttr_X));
                        break;
                    case GRB_INFEASIBLE:
                        out.status = SolveStatus::Infeasible;
                        out.message = "model is infeasible";
                        break;
                    case GRB_UNBOUNDED:
                        out.status = SolveStatus::Unbounded;
                        out.message = "model is unbounded";
                        break;
                    default:
                        out.status = SolveStatus::Error;
                        out.message = std::format("solver stopped with status {} ({})",
                            gurobi_detail::statusCodeName(status), status);
                        break;
                }
                return out;
            }
            catch (const GRBException& e) {
                LOG(WARNING) << "Gurobi error " << e.getErrorCode() << ": " << e.getMessage();
                return Solution::failure(SolveStatus::Error, std::format(
                    "Gurobi error {}: {}", e.getErrorCode(), e.getMessage()));
            }
        }
    };

} // namespace blend
