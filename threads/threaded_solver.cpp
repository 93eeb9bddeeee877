///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_solver.hpp"
#include "validation.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <random>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
std::uint64_t ThreadedTimetableSolver::branchSeed(std::uint64_t seed, int index) {
    return seed + (std::uint64_t)index * 0x9E3779B97F4A7C15ULL;
}

/**
 * @brief Race constructive branches, then refine the winner in parallel.
 */
SolveResult ThreadedTimetableSolver::solve(const ProblemInstance& inst, const SolverConfig& config) {
    validateInstance(inst);
    validateConfig(config);

    stop_ = false;
    SearchBudget budget(config.timeBudget, &stop_);
    SearchContext ctx(inst, config.maxFacultyDailySections);
    SolveResult result;
    int threads = config.numThreads;

    if (config.verbose) {
        std::cerr << "[threads] " << inst.sections.size() << " sections, " << threads << " branches\n";
    }

    // Per-branch cancel flags, all false; branch i cancels every branch above it on success.
    std::vector<std::atomic<bool>> cancel(threads);

    std::vector<Branch> branches(threads);
    std::vector<std::future<void>> tasks;
    for (int i = 0; i < threads; ++i) {
        tasks.push_back(std::async(std::launch::async, [&, i]() {
            SearchBudget branchBudget(budget, &cancel[i]);
            Branch& branch = branches[i];
            branch.assignments = constructTimetable(ctx, config, branchSeed(config.seed, i), branchBudget,
                                                    branch.stats, branch.failure);
            if (branch.assignments) {
                for (int j = i + 1; j < threads; ++j) cancel[j] = true;
            }
        }));
    }
    for (auto& t : tasks) t.wait();

    // Lowest-indexed success wins; merge constructive counters.
    int winner = -1;
    for (int i = 0; i < threads; ++i) {
        const SolverStats& s = branches[i].stats;
        result.stats.decisions += s.decisions;
        result.stats.deadEnds += s.deadEnds;
        result.stats.backjumps += s.backjumps;
        result.stats.chronologicalSteps += s.chronologicalSteps;
        if (winner < 0 && branches[i].assignments) winner = i;
    }

    if (winner < 0) {
        result.failure = branches[0].failure;
        if (config.verbose) {
            std::cerr << "[threads] " << failureKindName(result.failure.kind) << " ("
                      << result.failure.constraint << "): " << result.failure.reason << "\n";
        }
        return result;
    }

    if (config.verbose) {
        std::cerr << "[threads] branch " << winner << " constructed a timetable after " << budget.elapsedMs()
                  << " ms\n";
    }

    result.solution = refine(ctx, config, *branches[winner].assignments, budget, result.stats);

    if (config.verbose) {
        std::cerr << "[threads] refined " << result.stats.initialCost << " -> " << result.stats.finalCost
                  << " in " << result.stats.movesTried << " moves\n";
    }
    return result;
}

/**
 * @brief Refine a timetable with batches of moves evaluated concurrently.
 *
 * Each batch draws numThreads proposals from the master RNG on this thread,
 * evaluates them on worker tasks (every proposal owns its schedule copy),
 * and commits at most the best feasible one. Workers publish their result
 * under a mutex; ties go to the lowest index so runs are reproducible.
 */
TimetableSolution ThreadedTimetableSolver::refine(const SearchContext& ctx, const SolverConfig& config,
                                                  const std::vector<Assignment>& start, const SearchBudget& budget,
                                                  SolverStats& stats) {
    LocalSearch search(ctx, config);
    std::mt19937_64 master(config.seed);

    std::vector<Assignment> current = start;
    double currentCost = search.evaluate(current).softCost;
    TimetableSolution best;
    best.assignments = current;
    best.softCost = currentCost;
    stats.initialCost = currentCost;

    long move = 0;
    while (move < config.moveBudget && !budget.exhausted()) {
        int batch = (int)std::min<long>(config.numThreads, config.moveBudget - move);

        std::vector<std::optional<Proposal>> proposals;
        for (int k = 0; k < batch; ++k) proposals.push_back(search.propose(current, master));

        std::mutex bestMutex;
        int bestIndex = -1;
        double bestCost = 0.0;
        int bestViolations = 0;

        std::vector<std::future<void>> workers;
        for (int k = 0; k < batch; ++k) {
            if (!proposals[k]) continue;
            workers.push_back(std::async(std::launch::async, [&, k]() {
                Evaluation ev = search.evaluate(proposals[k]->assignments);
                if (!ev.feasible()) return;
                std::lock_guard<std::mutex> lock(bestMutex);
                if (bestIndex < 0 || ev.softCost < bestCost || (ev.softCost == bestCost && k < bestIndex)) {
                    bestIndex = k;
                    bestCost = ev.softCost;
                    bestViolations = (int)ev.violations.size();
                }
            }));
        }
        for (auto& w : workers) w.wait();
        stats.movesTried += batch;

        if (bestIndex >= 0 && search.accepts(currentCost, bestCost, master)) {
            current = std::move(proposals[bestIndex]->assignments);
            currentCost = bestCost;
            ++stats.movesAccepted;
            if (config.recordTrace) stats.trace.push_back({move + bestIndex, bestViolations, currentCost});
            if (currentCost < best.softCost) {
                best.assignments = current;
                best.softCost = currentCost;
            }
        }
        move += batch;
    }

    stats.finalCost = best.softCost;
    return best;
}
