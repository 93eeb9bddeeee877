#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "solver_base.hpp"
#include "timetable_search.hpp"
#include "opencl_evaluator.hpp"
#include <atomic>
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Timetable solver that offloads refinement scoring to OpenCL.
 *
 * Builds a feasible timetable on the CPU, then refines it in rounds: each
 * round draws `batchSize` neighbour schedules, scores all of them at once on
 * the device, and re-checks the most promising one on the CPU before
 * applying the usual acceptance rule.
 */
class OpenCLRefinementSolver : public ISolver {
public:
    /**
     * @brief Create the solver and its OpenCL context.
     *
     * @throws std::runtime_error if no OpenCL device can be set up.
     */
    OpenCLRefinementSolver() = default;

    /**
     * @brief Solve the given timetable instance using CPU search + device scoring.
     *
     * @throws ModelError if the instance or configuration is malformed.
     * @throws std::runtime_error on OpenCL failures.
     */
    SolveResult solve(const ProblemInstance& inst, const SolverConfig& config) override;

    /// Ask a running solve() to stop at its next step. Safe from any thread.
    void stop() { stop_ = true; }

private:
    /// OpenCL context and kernel used for batched scoring.
    ScheduleOpenCLContext clctx_;

    /// Raised by stop().
    std::atomic<bool> stop_{false};

    /**
     * @brief Batched refinement of a feasible timetable.
     */
    TimetableSolution refine(const SearchContext& ctx, const SolverConfig& config,
                             const std::vector<Assignment>& start, const SearchBudget& budget, SolverStats& stats);
};
