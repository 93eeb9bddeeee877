#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "solver_base.hpp"
#include <atomic>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Single-threaded timetable solver.
 *
 * Runs the constructive backtracking phase once with the configured seed,
 * then refines the first feasible timetable by local search.
 */
class SequentialTimetableSolver : public ISolver {
public:
    /**
     * @brief Solve the given timetable problem instance.
     *
     * Validates the input, builds the search context, constructs a
     * clash-free timetable and refines it within the remaining budget.
     *
     * @throws ModelError if the instance or configuration is malformed.
     */
    SolveResult solve(const ProblemInstance& inst, const SolverConfig& config) override;

    /**
     * @brief Ask a running solve() to stop at its next step. Safe from any thread.
     */
    void stop() { stop_ = true; }

private:
    /// Raised by stop(); cleared when a new solve starts.
    std::atomic<bool> stop_{false};
};
