///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <catch2/catch.hpp>
#include "mpi_solver.hpp"
#include "test_helpers.hpp"


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_CASE("assignments travel as five ints each", "[mpi]") {
    std::vector<Assignment> assignments = {makeAssignment(0, 1, 2, 3, 4), Assignment()};
    std::vector<int> buffer;
    MPITimetableSolver::serializeAssignments(assignments, buffer);
    REQUIRE(buffer == std::vector<int>{0, 1, 2, 3, 4, -1, 0, 0, -1, -1});

    std::vector<Assignment> decoded;
    MPITimetableSolver::deserializeAssignments(buffer, decoded);
    REQUIRE(decoded == assignments);
    REQUIRE_FALSE(decoded[1].assigned());
}
