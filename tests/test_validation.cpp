///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <catch2/catch.hpp>
#include "validation.hpp"
#include "demo_instances.hpp"
#include "test_helpers.hpp"


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_CASE("demo instances are well formed", "[validation]") {
    for (DemoSize size : {DemoSize::S, DemoSize::M, DemoSize::L, DemoSize::XL}) {
        ProblemInstance inst = makeDemoInstance(size);
        REQUIRE_NOTHROW(validateInstance(inst));
        REQUIRE_NOTHROW(validateExamProblem(inst, makeDemoExamProblem(inst), nullptr));
    }
}

TEST_CASE("malformed instances are rejected before solving", "[validation]") {
    ProblemInstance inst = makeGrid(1, 4);
    addRoom(inst, "R1", 30);
    int course = addCourse(inst, "C1");
    addFaculty(inst, "F1", 10, {course});
    int s0 = addSection(inst, course, "C1-A", 2);
    addStudents(inst, 2, {s0});
    REQUIRE_NOTHROW(validateInstance(inst));

    SECTION("ids must be dense") {
        inst.rooms[0].id = 5;
        REQUIRE_THROWS_AS(validateInstance(inst), ModelError);
    }
    SECTION("sections must reference known courses") {
        inst.sections[0].courseId = 3;
        REQUIRE_THROWS_AS(validateInstance(inst), ModelError);
    }
    SECTION("capacity must be positive") {
        inst.rooms[0].capacity = 0;
        REQUIRE_THROWS_AS(validateInstance(inst), ModelError);
    }
    SECTION("students may not exceed the enrolled count") {
        addStudents(inst, 1, {s0});
        REQUIRE_THROWS_WITH(validateInstance(inst), Catch::Contains("enrolled is 2"));
    }
    SECTION("students may not enroll twice in one section") {
        inst.students[0].sectionIds.push_back(s0);
        REQUIRE_THROWS_AS(validateInstance(inst), ModelError);
    }
    SECTION("calendars must lie inside the grid") {
        inst.faculty[0].unavailableSlots = {4};
        REQUIRE_THROWS_AS(validateInstance(inst), ModelError);
    }
    SECTION("preferred slots must lie inside the grid") {
        inst.faculty[0].preferredSlots = {0, 4};
        REQUIRE_THROWS_AS(validateInstance(inst), ModelError);
    }
    SECTION("break periods must lie inside the day") {
        inst.grid.breakPeriods = {7};
        REQUIRE_THROWS_AS(validateInstance(inst), ModelError);
    }
}

TEST_CASE("exam problems are checked against the instance", "[validation]") {
    ProblemInstance inst = makeGrid(1, 4);
    addRoom(inst, "R1", 30);
    int course = addCourse(inst, "C1");
    addFaculty(inst, "F1", 10, {course});
    int s0 = addSection(inst, course, "C1-A", 2);
    addStudents(inst, 2, {s0});

    ExamProblem problem;
    Exam exam;
    exam.id = 0;
    exam.courseId = course;
    exam.name = "C1 exam";
    exam.studentIds = {0, 1};
    problem.exams.push_back(exam);
    REQUIRE_NOTHROW(validateExamProblem(inst, problem, nullptr));

    SECTION("seats per bench is one or two") {
        problem.exams[0].seatsPerBench = 3;
        REQUIRE_THROWS_AS(validateExamProblem(inst, problem, nullptr), ModelError);
    }
    SECTION("students must exist") {
        problem.exams[0].studentIds.push_back(9);
        REQUIRE_THROWS_AS(validateExamProblem(inst, problem, nullptr), ModelError);
    }
    SECTION("committed timetable covers every section") {
        TimetableSolution committed;
        REQUIRE_THROWS_AS(validateExamProblem(inst, problem, &committed), ModelError);
    }
    SECTION("committed assignments lie inside the grid") {
        TimetableSolution committed;
        committed.assignments = {makeAssignment(0, 0, 4, 0, 0)};
        REQUIRE_THROWS_AS(validateExamProblem(inst, problem, &committed), ModelError);
    }
}

TEST_CASE("configurations are range checked", "[validation]") {
    SolverConfig config;
    REQUIRE_NOTHROW(validateConfig(config));

    SECTION("negative weights") {
        config.weights.gapPenalty = -1.0;
        REQUIRE_THROWS_AS(validateConfig(config), ModelError);
    }
    SECTION("acceptance probability above one") {
        config.acceptWorseProbability = 1.5;
        REQUIRE_THROWS_AS(validateConfig(config), ModelError);
    }
    SECTION("zero threads") {
        config.numThreads = 0;
        REQUIRE_THROWS_AS(validateConfig(config), ModelError);
    }
    SECTION("negative spacing weight") {
        config.weights.spacingPenalty = -0.5;
        REQUIRE_THROWS_AS(validateConfig(config), ModelError);
    }
    SECTION("negative daily cap") {
        config.maxFacultyDailySections = -1;
        REQUIRE_THROWS_AS(validateConfig(config), ModelError);
    }

    ExamConfig examConfig;
    REQUIRE_NOTHROW(validateConfig(examConfig));
    examConfig.studentsPerInvigilator = -4;
    REQUIRE_THROWS_AS(validateConfig(examConfig), ModelError);
}
