///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <catch2/catch.hpp>
#include "constraints.hpp"
#include "test_helpers.hpp"
#include <algorithm>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_CASE("schedule state tracks rooms, faculty and clashes", "[constraints]") {
    TimeGrid grid;
    grid.days = 2;
    grid.periodsPerDay = 4;
    ClashGraph clashes(3);
    clashes.addClash(0, 1, 5);

    ScheduleState state(grid, 2, 2, clashes);
    Booking first{0, 0, 1, 2, {0}, {0}};
    REQUIRE(state.canBook(first));
    state.book(first);

    REQUIRE_FALSE(state.roomFree(0, 0, 2, 1));
    REQUIRE(state.roomFree(0, 0, 3, 1));
    REQUIRE(state.roomFree(0, 1, 1, 2));
    REQUIRE_FALSE(state.facultyFree(0, 0, 0, 2));
    REQUIRE(state.facultyLoad(0) == 2);
    REQUIRE(state.facultyDayCount(0, 0) == 1);
    REQUIRE(state.facultyDayCount(0, 1) == 0);
    REQUIRE(state.roomOccupant(0, grid.slotIndex(0, 1)) == 0);

    // Section 1 clashes with section 0; section 2 does not.
    REQUIRE_FALSE(state.clashFree(1, 0, 2, 1));
    REQUIRE(state.clashFree(2, 0, 2, 1));
    REQUIRE(state.canBook({2, 0, 2, 1, {1}, {1}}));

    std::vector<int> blockers;
    state.blockers({1, 0, 2, 1, {0}, {1}}, blockers);
    REQUIRE_FALSE(blockers.empty());
    REQUIRE(std::all_of(blockers.begin(), blockers.end(), [](int b) { return b == 0; }));

    state.release(first);
    REQUIRE(state.roomFree(0, 0, 1, 2));
    REQUIRE(state.facultyLoad(0) == 0);
    REQUIRE(state.facultyDayCount(0, 0) == 0);
    REQUIRE(state.activitiesAt(grid.slotIndex(0, 1)).empty());
}

TEST_CASE("blocked cells stay unavailable and are not blamed", "[constraints]") {
    TimeGrid grid;
    grid.days = 1;
    grid.periodsPerDay = 3;
    ClashGraph clashes(1);
    ScheduleState state(grid, 1, 1, clashes);

    state.blockRoom(0, 1);
    state.blockFaculty(0, 2);
    REQUIRE_FALSE(state.roomFree(0, 0, 0, 2));
    REQUIRE(state.roomOccupant(0, 1) == ScheduleState::kBlocked);
    REQUIRE_FALSE(state.facultyFree(0, 0, 2, 1));
    REQUIRE(state.facultyLoad(0) == 0);

    std::vector<int> blockers;
    state.blockers({0, 0, 0, 3, {0}, {0}}, blockers);
    REQUIRE(blockers.empty());
}

TEST_CASE("blocks leaving the day are never free", "[constraints]") {
    TimeGrid grid;
    grid.days = 1;
    grid.periodsPerDay = 3;
    ClashGraph clashes(1);
    ScheduleState state(grid, 1, 1, clashes);
    REQUIRE_FALSE(state.roomFree(0, 0, 2, 2));
    REQUIRE_FALSE(state.facultyFree(0, 1, 0, 1));
    REQUIRE_FALSE(state.clashFree(0, 0, -1, 1));
}
