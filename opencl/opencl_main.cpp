///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "formatting.hpp"
#include "demo_instances.hpp"
#include "opencl_solver.hpp"
#include <iostream>
#include <chrono>
#include <stdexcept>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Demo entry point for the OpenCL refinement solver.
 *
 * Builds a demo instance, constructs a timetable on the CPU, refines it with
 * device-scored batches and prints the result.
 */
int main(int argc, char** argv) {
    // No command-line handling yet.
    (void)argc;
    (void)argv;

    ProblemInstance inst = makeDemoInstance(DemoSize::L);

    //  - batchSize:  neighbour schedules scored per kernel launch,
    //  - moveBudget: total neighbours drawn.
    SolverConfig config;
    config.batchSize = 256;
    config.moveBudget = 20000;
    config.verbose = true;

    std::cout << "========================================\n";
    std::cout << "OPENCL REFINEMENT TIMETABLE SOLVER\n";
    std::cout << "Sections: " << inst.sections.size() << "\n";
    std::cout << "Device batch size: " << config.batchSize << "\n";
    std::cout << "========================================\n";

    try {
        OpenCLRefinementSolver solver;

        auto start = std::chrono::high_resolution_clock::now();
        SolveResult result = solver.solve(inst, config);
        auto end = std::chrono::high_resolution_clock::now();
        double elapsedMs = std::chrono::duration<double, std::milli>(end - start).count();

        std::cout << "OpenCL solver time: " << elapsedMs << " ms\n";

        if (!result.feasible()) {
            std::cout << "No timetable found.\n";
            printFailure(result.failure);
        } else {
            std::cout << "Best soft cost = " << result.solution->softCost << "\n\n";
            printFacultySchedules(inst, *result.solution);
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "OpenCL error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "========================================\n";
    return 0;
}
