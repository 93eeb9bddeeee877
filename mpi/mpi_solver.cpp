///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_solver.hpp"
#include "validation.hpp"
#include <mpi.h>
#include <iostream>
#include <limits>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
void MPITimetableSolver::serializeAssignments(const std::vector<Assignment>& assignments, std::vector<int>& buffer) {
    buffer.clear();
    buffer.reserve(5 * assignments.size());
    for (const Assignment& a : assignments) {
        buffer.push_back(a.sectionId);
        buffer.push_back(a.day);
        buffer.push_back(a.startPeriod);
        buffer.push_back(a.roomId);
        buffer.push_back(a.facultyId);
    }
}

void MPITimetableSolver::deserializeAssignments(const std::vector<int>& buffer, std::vector<Assignment>& assignments) {
    size_t count = buffer.size() / 5;
    assignments.resize(count);
    for (size_t i = 0; i < count; ++i) {
        assignments[i].sectionId   = buffer[5 * i + 0];
        assignments[i].day         = buffer[5 * i + 1];
        assignments[i].startPeriod = buffer[5 * i + 2];
        assignments[i].roomId      = buffer[5 * i + 3];
        assignments[i].facultyId   = buffer[5 * i + 4];
    }
}

/**
 * @brief Multi-start solve: one threaded solve per rank, best cost wins.
 *
 * The winner is the lowest rank among those reaching the global minimum
 * cost, which keeps the result independent of MPI timing.
 */
SolveResult MPITimetableSolver::solve(const ProblemInstance& inst, const SolverConfig& config) {
    validateInstance(inst);
    validateConfig(config);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    // Each rank explores a different region through its own seed.
    SolverConfig localConfig = config;
    localConfig.seed = config.seed + (std::uint64_t)rank;

    ThreadedTimetableSolver threadedSolver;
    SolveResult local = threadedSolver.solve(inst, localConfig);

    const double kNoSolution = std::numeric_limits<double>::infinity();
    double localCost = local.feasible() ? local.solution->softCost : kNoSolution;
    double globalCost = kNoSolution;
    MPI_Allreduce(&localCost, &globalCost, 1, MPI_DOUBLE, MPI_MIN, MPI_COMM_WORLD);

    if (config.verbose) {
        std::cerr << "[mpi " << rank << "/" << size << "] local cost " << localCost << ", global " << globalCost
                  << "\n";
    }

    if (globalCost == kNoSolution) return local;

    // Lowest rank holding the global best.
    int candidate = (localCost == globalCost) ? rank : std::numeric_limits<int>::max();
    int winner = std::numeric_limits<int>::max();
    MPI_Allreduce(&candidate, &winner, 1, MPI_INT, MPI_MIN, MPI_COMM_WORLD);

    std::vector<int> buffer;
    if (rank == winner) serializeAssignments(local.solution->assignments, buffer);
    int len = (int)buffer.size();
    MPI_Bcast(&len, 1, MPI_INT, winner, MPI_COMM_WORLD);
    buffer.resize(len);
    if (len > 0) MPI_Bcast(buffer.data(), len, MPI_INT, winner, MPI_COMM_WORLD);

    SolveResult result;
    result.stats = local.stats;
    result.failure = Infeasibility();
    TimetableSolution best;
    deserializeAssignments(buffer, best.assignments);
    best.softCost = globalCost;
    result.solution = best;
    result.stats.finalCost = globalCost;
    return result;
}
