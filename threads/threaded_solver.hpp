#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "solver_base.hpp"
#include "timetable_search.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <vector>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Multithreaded timetable solver.
 *
 * Races `numThreads` constructive branches with distinct seeds on std::async
 * tasks. The lowest-indexed branch that succeeds wins and cancels every
 * higher-indexed branch, so the winner does not depend on thread timing.
 * Refinement then evaluates batches of moves in parallel and commits the
 * best of each batch.
 */
class ThreadedTimetableSolver : public ISolver {
public:
    /**
     * @brief Solve the given timetable problem.
     *
     * @throws ModelError if the instance or configuration is malformed.
     */
    SolveResult solve(const ProblemInstance& inst, const SolverConfig& config) override;

    /// Ask a running solve() to stop at its next step. Safe from any thread.
    void stop() { stop_ = true; }

    /// Seed used by constructive branch `index`.
    static std::uint64_t branchSeed(std::uint64_t seed, int index);

private:
    std::atomic<bool> stop_{false}; ///< Raised by stop().

    /**
     * @brief Outcome of one constructive branch.
     */
    struct Branch {
        std::optional<std::vector<Assignment>> assignments; ///< Timetable on success.
        Infeasibility failure; ///< Diagnosis on failure.
        SolverStats stats; ///< Branch counters.
    };

    /**
     * @brief Parallel refinement: serial move generation, parallel evaluation.
     */
    TimetableSolution refine(const SearchContext& ctx, const SolverConfig& config,
                             const std::vector<Assignment>& start, const SearchBudget& budget, SolverStats& stats);
};
