///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <catch2/catch.hpp>
#include "sequential_solver.hpp"
#include "timetable_search.hpp"
#include "evaluator.hpp"
#include "demo_instances.hpp"
#include "test_helpers.hpp"


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Three single-period sections of one faculty member on a two-period day.
static ProblemInstance overbookedFaculty() {
    ProblemInstance inst = makeGrid(1, 2);
    addRoom(inst, "R1", 30);
    int course = addCourse(inst, "C1");
    addFaculty(inst, "F1", 10, {course});
    addSection(inst, course, "C1-A", 0);
    addSection(inst, course, "C1-B", 0);
    addSection(inst, course, "C1-C", 0);
    return inst;
}


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_CASE("sequential solver separates sections of one faculty member", "[solver]") {
    ProblemInstance inst = makeGrid(1, 3);
    addRoom(inst, "R1", 30);
    int course = addCourse(inst, "C1");
    addFaculty(inst, "F1", 10, {course});
    int a = addSection(inst, course, "C1-A", 1);
    int b = addSection(inst, course, "C1-B", 1);
    addStudents(inst, 1, {a, b});

    SequentialTimetableSolver solver;
    SolveResult result = solver.solve(inst, SolverConfig());
    REQUIRE(result.feasible());
    const TimetableSolution& sol = *result.solution;
    REQUIRE(sol.complete());
    REQUIRE(sol.assignedCount() == 2);
    REQUIRE(sol.assignments[a].startPeriod != sol.assignments[b].startPeriod);
    REQUIRE(evaluate(sol, inst, SolverConfig()).feasible());
}

TEST_CASE("two sections share the only room and faculty member in separate slots", "[solver]") {
    ProblemInstance inst = makeGrid(1, 2);
    int room = addRoom(inst, "R1", 30);
    int course = addCourse(inst, "C1");
    int faculty = addFaculty(inst, "F1", 10, {course});
    int a = addSection(inst, course, "C1-A", 1);
    int b = addSection(inst, course, "C1-B", 1);
    addStudents(inst, 1, {a});
    addStudents(inst, 1, {b});

    SolveResult result = SequentialTimetableSolver().solve(inst, SolverConfig());
    REQUIRE(result.feasible());
    const Assignment& first = result.solution->assignments[a];
    const Assignment& second = result.solution->assignments[b];
    REQUIRE(first.assigned());
    REQUIRE(second.assigned());
    REQUIRE(first.startPeriod != second.startPeriod);
    REQUIRE(first.roomId == room);
    REQUIRE(second.roomId == room);
    REQUIRE(first.facultyId == faculty);
    REQUIRE(second.facultyId == faculty);
    REQUIRE(evaluate(*result.solution, inst, SolverConfig()).feasible());
}

TEST_CASE("sequential solver solves the demo instance", "[solver]") {
    ProblemInstance inst = makeDemoInstance(DemoSize::S);
    SolverConfig config;
    config.moveBudget = 200;

    SequentialTimetableSolver solver;
    SolveResult result = solver.solve(inst, config);
    REQUIRE(result.feasible());
    REQUIRE(result.solution->complete());

    Evaluation ev = evaluate(*result.solution, inst, config);
    REQUIRE(ev.violations.empty());
    REQUIRE(result.solution->softCost == Approx(ev.softCost));
    REQUIRE(result.stats.finalCost <= result.stats.initialCost);
    REQUIRE(result.stats.movesTried == 200);
}

TEST_CASE("same seed gives the same timetable", "[solver]") {
    ProblemInstance inst = makeDemoInstance(DemoSize::S);
    SolverConfig config;
    config.moveBudget = 200;

    SequentialTimetableSolver solver;
    SolveResult first = solver.solve(inst, config);
    SolveResult second = solver.solve(inst, config);
    REQUIRE(first.feasible());
    REQUIRE(second.feasible());
    REQUIRE(first.solution->assignments == second.solution->assignments);
    REQUIRE(first.solution->softCost == second.solution->softCost);
}

TEST_CASE("greedy refinement only records improvements", "[solver]") {
    ProblemInstance inst = makeDemoInstance(DemoSize::S);
    SolverConfig config;
    config.moveBudget = 300;
    config.acceptWorseProbability = 0.0;
    config.recordTrace = true;

    SequentialTimetableSolver solver;
    SolveResult result = solver.solve(inst, config);
    REQUIRE(result.feasible());
    REQUIRE((long)result.stats.trace.size() == result.stats.movesAccepted);

    double previous = result.stats.initialCost;
    for (const SolverStats::TraceEntry& entry : result.stats.trace) {
        REQUIRE(entry.violations == 0);
        REQUIRE(entry.softCost < previous);
        previous = entry.softCost;
    }
    REQUIRE(result.stats.finalCost == Approx(previous));
}

TEST_CASE("static diagnosis names the blocking constraint", "[solver]") {
    ProblemInstance inst = makeGrid(1, 4);
    addRoom(inst, "R1", 30, {"projector"});
    int course = addCourse(inst, "C1");
    addFaculty(inst, "F1", 10, {course});
    int s = addSection(inst, course, "C1-A", 0);
    SequentialTimetableSolver solver;

    SECTION("room capacity") {
        inst.sections[s].enrolled = 40;
        SolveResult result = solver.solve(inst, SolverConfig());
        REQUIRE_FALSE(result.feasible());
        REQUIRE(result.failure.kind == FailureKind::INFEASIBLE);
        REQUIRE(result.failure.constraint == "room-capacity");
        REQUIRE(result.failure.sectionIds == std::vector<int>{s});
    }

    SECTION("room capability") {
        inst.sections[s].requiredTags = {"lab-equipped"};
        REQUIRE(solver.solve(inst, SolverConfig()).failure.constraint == "room-capability");
    }

    SECTION("faculty qualification") {
        inst.faculty[0].qualifiedCourses.clear();
        REQUIRE(solver.solve(inst, SolverConfig()).failure.constraint == "faculty-qualification");
    }

    SECTION("faculty load") {
        inst.faculty[0].maxLoad = 1;
        inst.sections[s].duration = 2;
        REQUIRE(solver.solve(inst, SolverConfig()).failure.constraint == "faculty-load");
    }

    SECTION("availability") {
        inst.faculty[0].unavailableSlots = {0, 1, 2, 3};
        REQUIRE(solver.solve(inst, SolverConfig()).failure.constraint == "availability");
    }
}

TEST_CASE("search reports exhaustion and budgets", "[solver]") {
    ProblemInstance inst = overbookedFaculty();
    SequentialTimetableSolver solver;

    SECTION("no timetable exists") {
        SolveResult result = solver.solve(inst, SolverConfig());
        REQUIRE_FALSE(result.feasible());
        REQUIRE(result.failure.kind == FailureKind::INFEASIBLE);
        REQUIRE(result.failure.constraint == "search-exhausted");
        REQUIRE(result.failure.facultyIds == std::vector<int>{0});
        REQUIRE(result.stats.deadEnds > 0);
    }

    SECTION("backtrack budget") {
        SolverConfig config;
        config.backtrackBudget = 1;
        SolveResult result = solver.solve(inst, config);
        REQUIRE(result.failure.kind == FailureKind::BUDGET_EXCEEDED);
        REQUIRE(result.failure.constraint == "budget");
        REQUIRE_THAT(result.failure.reason, Catch::StartsWith("backtrack budget exhausted"));
    }
}

TEST_CASE("the daily section cap spreads a faculty member over days", "[solver]") {
    SolverConfig config;
    config.maxFacultyDailySections = 1;
    SequentialTimetableSolver solver;

    SECTION("two days give room for both sections") {
        ProblemInstance inst = makeGrid(2, 2);
        addRoom(inst, "R1", 30);
        int course = addCourse(inst, "C1");
        addFaculty(inst, "F1", 10, {course});
        int a = addSection(inst, course, "C1-A", 0);
        int b = addSection(inst, course, "C1-B", 0);

        SolveResult result = solver.solve(inst, config);
        REQUIRE(result.feasible());
        REQUIRE(result.solution->assignments[a].day != result.solution->assignments[b].day);
        REQUIRE(evaluate(*result.solution, inst, config).feasible());
    }

    SECTION("a single day cannot hold both") {
        ProblemInstance inst = makeGrid(1, 2);
        addRoom(inst, "R1", 30);
        int course = addCourse(inst, "C1");
        addFaculty(inst, "F1", 10, {course});
        addSection(inst, course, "C1-A", 0);
        addSection(inst, course, "C1-B", 0);

        SolveResult result = solver.solve(inst, config);
        REQUIRE_FALSE(result.feasible());
        REQUIRE(result.failure.kind == FailureKind::INFEASIBLE);
        REQUIRE(result.failure.constraint == "search-exhausted");
    }
}

TEST_CASE("refinement moves teaching into preferred slots", "[solver]") {
    ProblemInstance inst = makeGrid(1, 4);
    addRoom(inst, "R1", 30);
    int course = addCourse(inst, "C1");
    addFaculty(inst, "F1", 10, {course});
    int s = addSection(inst, course, "C1-A", 0);
    inst.faculty[0].preferredSlots = {3};

    SolverConfig config;
    config.moveBudget = 200;
    config.acceptWorseProbability = 0.0;

    SolveResult result = SequentialTimetableSolver().solve(inst, config);
    REQUIRE(result.feasible());
    REQUIRE(result.solution->assignments[s].startPeriod == 3);
    REQUIRE(result.solution->softCost == Approx(0.0));
}

TEST_CASE("malformed input is rejected", "[solver]") {
    ProblemInstance inst = overbookedFaculty();
    inst.sections[1].courseId = 9;
    SequentialTimetableSolver solver;
    REQUIRE_THROWS_AS(solver.solve(inst, SolverConfig()), ModelError);

    SolverConfig config;
    config.moveBudget = -1;
    REQUIRE_THROWS_AS(solver.solve(overbookedFaculty(), config), ModelError);
}
