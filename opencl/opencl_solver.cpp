///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "opencl_solver.hpp"
#include "validation.hpp"
#include <algorithm>
#include <iostream>
#include <optional>
#include <random>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Construct on the CPU, then refine with device-scored batches.
 */
SolveResult OpenCLRefinementSolver::solve(const ProblemInstance& inst, const SolverConfig& config) {
    validateInstance(inst);
    validateConfig(config);

    stop_ = false;
    SearchBudget budget(config.timeBudget, &stop_);
    SearchContext ctx(inst, config.maxFacultyDailySections);
    SolveResult result;

    Infeasibility failure;
    std::optional<std::vector<Assignment>> constructed =
            constructTimetable(ctx, config, config.seed, budget, result.stats, failure);
    if (!constructed) {
        result.failure = failure;
        if (config.verbose) {
            std::cerr << "[opencl] " << failureKindName(failure.kind) << " (" << failure.constraint
                      << "): " << failure.reason << "\n";
        }
        return result;
    }

    result.solution = refine(ctx, config, *constructed, budget, result.stats);

    if (config.verbose) {
        std::cerr << "[opencl] refined " << result.stats.initialCost << " -> " << result.stats.finalCost
                  << " in " << result.stats.movesTried << " moves, " << budget.elapsedMs() << " ms\n";
    }
    return result;
}

/**
 * @brief Send batches of neighbours to the device and commit the best one.
 *
 * The device counts gaps, breaks, self-study and load balance to rank the
 * batch. The chosen neighbour is re-evaluated on the CPU with every term,
 * which also confirms it has no hard violation.
 */
TimetableSolution OpenCLRefinementSolver::refine(const SearchContext& ctx, const SolverConfig& config,
                                                 const std::vector<Assignment>& start, const SearchBudget& budget,
                                                 SolverStats& stats) {
    LocalSearch search(ctx, config);
    std::mt19937_64 rng(config.seed);
    int numFaculty = (int)ctx.inst.faculty.size();

    std::vector<Assignment> current = start;
    double currentCost = search.evaluate(current).softCost;
    TimetableSolution best;
    best.assignments = current;
    best.softCost = currentCost;
    stats.initialCost = currentCost;

    long move = 0;
    while (move < config.moveBudget && !budget.exhausted()) {
        int batchSize = (int)std::min<long>(config.batchSize, config.moveBudget - move);

        // Draw the batch on the CPU.
        std::vector<std::vector<Assignment>> batch;
        for (int k = 0; k < batchSize; ++k) {
            std::optional<Proposal> p = search.propose(current, rng);
            if (p) batch.push_back(std::move(p->assignments));
        }
        stats.movesTried += batchSize;

        if (!batch.empty()) {
            std::vector<SoftTermCounts> counts;
            clctx_.evaluateBatch(ctx.inst, config.selfStudyPeriods, batch, counts);

            int bestIndex = 0;
            for (int i = 1; i < (int)batch.size(); ++i) {
                if (counts[i].cost(config.weights, numFaculty) < counts[bestIndex].cost(config.weights, numFaculty))
                    bestIndex = i;
            }

            Evaluation ev = search.evaluate(batch[bestIndex]);
            if (ev.feasible() && search.accepts(currentCost, ev.softCost, rng)) {
                current = std::move(batch[bestIndex]);
                currentCost = ev.softCost;
                ++stats.movesAccepted;
                if (config.recordTrace) stats.trace.push_back({move + bestIndex, 0, currentCost});
                if (currentCost < best.softCost) {
                    best.assignments = current;
                    best.softCost = currentCost;
                }
            }
        }
        move += batchSize;
    }

    stats.finalCost = best.softCost;
    return best;
}
