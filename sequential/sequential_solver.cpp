///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_solver.hpp"
#include "timetable_search.hpp"
#include "validation.hpp"
#include <iostream>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct then refine a timetable on the calling thread.
 *
 * Returns a feasible solution with its soft cost, or a diagnosis when the
 * constructive phase fails. Refinement running out of time is not a failure.
 */
SolveResult SequentialTimetableSolver::solve(const ProblemInstance& inst, const SolverConfig& config) {
    validateInstance(inst);
    validateConfig(config);

    stop_ = false;
    SearchBudget budget(config.timeBudget, &stop_);
    SearchContext ctx(inst, config.maxFacultyDailySections);
    SolveResult result;

    if (config.verbose) {
        std::cerr << "[sequential] " << inst.sections.size() << " sections, " << inst.rooms.size()
                  << " rooms, " << inst.faculty.size() << " faculty, seed " << config.seed << "\n";
    }

    // Constructive phase.
    Infeasibility failure;
    std::optional<std::vector<Assignment>> constructed =
            constructTimetable(ctx, config, config.seed, budget, result.stats, failure);
    if (!constructed) {
        result.failure = failure;
        if (config.verbose) {
            std::cerr << "[sequential] " << failureKindName(failure.kind) << " (" << failure.constraint
                      << "): " << failure.reason << "\n";
        }
        return result;
    }

    if (config.verbose) {
        std::cerr << "[sequential] constructed after " << result.stats.decisions << " decisions, "
                  << result.stats.deadEnds << " dead ends, " << budget.elapsedMs() << " ms\n";
    }

    // Refinement phase.
    LocalSearch refiner(ctx, config);
    result.solution = refiner.run(*constructed, budget, result.stats);

    if (config.verbose) {
        std::cerr << "[sequential] refined " << result.stats.initialCost << " -> " << result.stats.finalCost
                  << " in " << result.stats.movesTried << " moves (" << result.stats.movesAccepted
                  << " accepted)\n";
    }
    return result;
}
