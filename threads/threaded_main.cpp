///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../threads/threaded_solver.hpp"
#include "model.hpp"
#include "config.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include <iostream>
#include <chrono>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the threaded timetable solver.
 *
 * Runs parallel constructive branches and parallel move evaluation on a demo
 * instance, then prints the timetable if one is found.
 */
int main(int argc, char** argv) {
    // No command-line handling yet.
    (void)argc;
    (void)argv;

    ProblemInstance inst = makeDemoInstance(DemoSize::L);

    // Four branches / workers, larger move budget since moves are scored in parallel.
    SolverConfig config;
    config.numThreads = 4;
    config.moveBudget = 8000;
    config.verbose = true;

    ThreadedTimetableSolver solver;

    auto start = std::chrono::high_resolution_clock::now();
    SolveResult result = solver.solve(inst, config);
    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();

    std::cout << "========================================\n";
    std::cout << "THREADED TIMETABLE SOLVER\n";
    std::cout << "Sections: " << inst.sections.size() << "\n";
    std::cout << "Threads: " << config.numThreads << "\n";
    std::cout << "Time: " << ms << " ms\n";

    if (!result.feasible()) {
        std::cout << "No valid timetable found (threaded).\n";
        printFailure(result.failure);
    } else {
        const TimetableSolution& sol = *result.solution;
        std::cout << "Valid timetable found (threaded), soft cost = " << sol.softCost << "\n";
        std::cout << "Moves: " << result.stats.movesAccepted << " accepted of " << result.stats.movesTried << "\n\n";

        std::cout << "Raw assignments (threaded):\n";
        printAssignments(inst, sol);

        std::cout << "\nPer-faculty schedules (threaded):\n";
        printFacultySchedules(inst, sol);
    }

    std::cout << "========================================\n";
    return result.feasible() ? 0 : 1;
}
