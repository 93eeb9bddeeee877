///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "../sequential/sequential_solver.hpp"
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
 * @brief Demo entry point for the sequential timetable solver.
 *
 * Builds a demo instance, constructs and refines a timetable on one thread,
 * measures the runtime and prints the raw assignments followed by per-faculty
 * tables and the week of the first student.
 */
int main(int argc, char** argv) {
    // No command-line handling yet.
    (void)argc;
    (void)argv;

    ProblemInstance inst = makeDemoInstance(DemoSize::M);

    SolverConfig config;
    config.moveBudget = 3000;
    config.maxFacultyDailySections = 3;
    config.verbose = true;

    SequentialTimetableSolver solver;

    auto start = std::chrono::high_resolution_clock::now();
    SolveResult result = solver.solve(inst, config);
    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();

    std::cout << "========================================\n";
    std::cout << "SEQUENTIAL TIMETABLE SOLVER\n";
    std::cout << "Sections: " << inst.sections.size() << "\n";
    std::cout << "Time: " << ms << " ms\n";

    if (!result.feasible()) {
        std::cout << "No valid timetable found (sequential).\n";
        printFailure(result.failure);
    } else {
        const TimetableSolution& sol = *result.solution;
        std::cout << "Valid timetable found (sequential), soft cost = " << sol.softCost << "\n\n";

        std::cout << "Raw assignments (sequential):\n";
        printAssignments(inst, sol);

        std::cout << "\nPer-faculty schedules (sequential):\n";
        printFacultySchedules(inst, sol);
        printStudentSchedule(inst, sol, 0);
    }

    std::cout << "========================================\n";
    return result.feasible() ? 0 : 1;
}
