#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "solver_base.hpp"
#include "../threads/threaded_solver.hpp"
#include <vector>


///////////////////////////
///       SOLVER        ///
///////////////////////////
/**
 * @brief MPI multi-start wrapper around the threaded timetable solver.
 *
 * Every rank solves the same instance with its seed offset by the rank, using
 * a ThreadedTimetableSolver for intra-node parallelism. The lowest soft cost
 * is agreed on with MPI_Allreduce and the winning rank broadcasts its
 * assignments, so every rank returns the same timetable.
 */
class MPITimetableSolver : public ISolver {
public:
    /**
     * @brief Solve cooperatively across all ranks of MPI_COMM_WORLD.
     *
     * Must be called on every rank between MPI_Init and MPI_Finalize. If no
     * rank finds a timetable, each rank returns its own diagnosis.
     *
     * @throws ModelError if the instance or configuration is malformed.
     */
    SolveResult solve(const ProblemInstance& inst, const SolverConfig& config) override;

    /**
     * @brief Serialize assignments into a flat integer buffer.
     *
     * Encodes (sectionId, day, startPeriod, roomId, facultyId) for each
     * assignment in order, so it can be sent via MPI as one array of ints.
     */
    static void serializeAssignments(const std::vector<Assignment>& assignments, std::vector<int>& buffer);

    /**
     * @brief Rebuild assignments from a buffer made by serializeAssignments().
     */
    static void deserializeAssignments(const std::vector<int>& buffer, std::vector<Assignment>& assignments);
};
