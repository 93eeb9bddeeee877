///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <catch2/catch.hpp>
#include "exam_scheduler.hpp"
#include "evaluator.hpp"
#include "test_helpers.hpp"
#include <algorithm>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static Exam makeExam(int id, int courseId, std::vector<int> students, int duration = 1) {
    Exam e;
    e.id = id;
    e.courseId = courseId;
    e.name = "E" + std::to_string(id);
    e.duration = duration;
    e.studentIds = std::move(students);
    return e;
}

/**
 * @brief Two days of two periods, two rooms of ten benches, four students.
 *
 * Course 0 is taught by faculty 0, course 1 by faculty 1. Course 2 has two
 * sections of two students each. Faculty 2 and 3 teach nothing.
 */
static ProblemInstance examInstance() {
    ProblemInstance inst = makeGrid(2, 2);
    addRoom(inst, "A1", 20);
    addRoom(inst, "A2", 20);
    int c0 = addCourse(inst, "C1", {0});
    int c1 = addCourse(inst, "C2", {1});
    int c2 = addCourse(inst, "C3");
    addFaculty(inst, "F0", 10, {c0});
    addFaculty(inst, "F1", 10, {c1});
    addFaculty(inst, "F2", 10, {});
    addFaculty(inst, "F3", 10, {});
    int s0 = addSection(inst, c0, "C1-A", 4);
    int s1 = addSection(inst, c1, "C2-A", 4);
    int s2 = addSection(inst, c2, "C3-A", 2);
    int s3 = addSection(inst, c2, "C3-B", 2);
    addStudents(inst, 2, {s0, s1, s2});
    addStudents(inst, 2, {s0, s1, s3});
    return inst;
}

static ExamProblem twoExams() {
    ExamProblem problem;
    problem.exams.push_back(makeExam(0, 0, {0, 1, 2, 3}));
    problem.exams.push_back(makeExam(1, 1, {0, 1, 2, 3}));
    return problem;
}

static bool dutiesOf(const ExamSchedule& schedule, int examId, int facultyId) {
    return std::any_of(schedule.invigilators.begin(), schedule.invigilators.end(),
                       [&](const InvigilatorAssignment& d) { return d.examId == examId && d.facultyId == facultyId; });
}


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_CASE("exams sharing students get different slots", "[exam]") {
    ProblemInstance inst = examInstance();
    ExamProblem problem = twoExams();
    ExamConfig config;

    ExamScheduler scheduler;
    ExamResult result = scheduler.schedule(inst, problem, nullptr, config);
    REQUIRE(result.feasible());
    const ExamSchedule& schedule = *result.schedule;
    REQUIRE(schedule.complete());
    REQUIRE(evaluateExams(schedule, inst, problem, nullptr, config).feasible());

    const ExamPlacement& a = schedule.placements[0];
    const ExamPlacement& b = schedule.placements[1];
    REQUIRE_FALSE((a.day == b.day && a.startPeriod == b.startPeriod));

    REQUIRE(schedule.seats.size() == 8);
    REQUIRE(schedule.seatingReports.size() == 2);
    REQUIRE_FALSE(dutiesOf(schedule, 0, 0));
    REQUIRE_FALSE(dutiesOf(schedule, 1, 1));
    REQUIRE(schedule.invigilators.size() == 2);
}

TEST_CASE("the daily limit spreads exams over days", "[exam]") {
    ProblemInstance inst = examInstance();
    ExamProblem problem = twoExams();
    ExamConfig config;
    config.maxExamsPerStudentPerDay = 1;

    ExamResult result = ExamScheduler().schedule(inst, problem, nullptr, config);
    REQUIRE(result.feasible());
    REQUIRE(result.schedule->placements[0].day != result.schedule->placements[1].day);
    Evaluation ev = evaluateExams(*result.schedule, inst, problem, nullptr, config);
    REQUIRE(result.schedule->softCost == Approx(ev.softCost));
}

TEST_CASE("the slot cap separates exams without common students", "[exam]") {
    ProblemInstance inst = examInstance();
    ExamProblem problem;
    problem.exams.push_back(makeExam(0, 2, {0, 1}));
    problem.exams.push_back(makeExam(1, 2, {2, 3}));
    ExamConfig config;
    config.maxStudentsPerSlot = 2;

    ExamResult result = ExamScheduler().schedule(inst, problem, nullptr, config);
    REQUIRE(result.feasible());
    const ExamPlacement& a = result.schedule->placements[0];
    const ExamPlacement& b = result.schedule->placements[1];
    REQUIRE_FALSE((a.day == b.day && a.startPeriod == b.startPeriod));
    REQUIRE(evaluateExams(*result.schedule, inst, problem, nullptr, config).feasible());
}

TEST_CASE("exams sharing a slot spread over the rooms that fit", "[exam]") {
    ProblemInstance inst = makeGrid(1, 1);
    int small = addRoom(inst, "Small", 10);
    int big = addRoom(inst, "Big", 20);
    int course = addCourse(inst, "C1");
    addFaculty(inst, "F0", 10, {});
    addFaculty(inst, "F1", 10, {});
    addStudents(inst, 20, {});

    ExamProblem problem;
    problem.exams.push_back(makeExam(0, course, studentRange(0, 10)));
    problem.exams.push_back(makeExam(1, course, studentRange(10, 10)));
    ExamConfig config;
    config.antiCheatAdjacency = false;

    ExamResult result = ExamScheduler().schedule(inst, problem, nullptr, config);
    REQUIRE(result.feasible());
    std::vector<int> used = {result.schedule->placements[0].roomIds.at(0),
                             result.schedule->placements[1].roomIds.at(0)};
    std::sort(used.begin(), used.end());
    REQUIRE(used == std::vector<int>{small, big});
    REQUIRE(evaluateExams(*result.schedule, inst, problem, nullptr, config).feasible());
}

TEST_CASE("room combinations avoid a taken room", "[exam]") {
    ProblemInstance inst = makeGrid(1, 1);
    for (int r = 0; r < 4; ++r) addRoom(inst, "R" + std::to_string(r), 8);
    int course = addCourse(inst, "C1");
    for (int f = 0; f < 4; ++f) addFaculty(inst, "F" + std::to_string(f), 10, {});
    addStudents(inst, 32, {});

    ExamProblem problem;
    problem.exams.push_back(makeExam(0, course, studentRange(0, 16)));
    problem.exams.push_back(makeExam(1, course, studentRange(16, 16)));
    ExamConfig config;
    config.antiCheatAdjacency = false;

    ExamResult result = ExamScheduler().schedule(inst, problem, nullptr, config);
    REQUIRE(result.feasible());
    std::vector<int> used = result.schedule->placements[0].roomIds;
    const std::vector<int>& second = result.schedule->placements[1].roomIds;
    REQUIRE(used.size() == 2);
    REQUIRE(second.size() == 2);
    used.insert(used.end(), second.begin(), second.end());
    std::sort(used.begin(), used.end());
    REQUIRE(used == std::vector<int>{0, 1, 2, 3});
}

TEST_CASE("instructor exclusion against the staffing minimum", "[exam]") {
    ProblemInstance inst = examInstance();
    ExamProblem problem = twoExams();
    problem.invigilatorPool = {0};
    ExamConfig config;

    SECTION("exclusion first fails for lack of invigilators") {
        ExamResult result = ExamScheduler().schedule(inst, problem, nullptr, config);
        REQUIRE_FALSE(result.feasible());
        REQUIRE(result.failure.kind == FailureKind::INFEASIBLE);
        REQUIRE(result.failure.constraint == "search-exhausted");
        REQUIRE_THAT(result.failure.reason, Catch::Contains("not enough invigilators"));
        REQUIRE(result.failure.facultyIds == std::vector<int>{0});
    }

    SECTION("minimum first lets the instructor cover the room") {
        config.precedence = ExclusionPrecedence::MINIMUM_FIRST;
        ExamResult result = ExamScheduler().schedule(inst, problem, nullptr, config);
        REQUIRE(result.feasible());
        REQUIRE(dutiesOf(*result.schedule, 0, 0));
        REQUIRE(dutiesOf(*result.schedule, 1, 0));
    }

    SECTION("allowing instructors lifts the exclusion") {
        config.allowInstructorInvigilation = true;
        REQUIRE(ExamScheduler().schedule(inst, problem, nullptr, config).feasible());
    }
}

TEST_CASE("static exam failures are diagnosed", "[exam]") {
    ProblemInstance inst = examInstance();
    ExamProblem problem = twoExams();

    SECTION("no room with the tags") {
        problem.exams[0].requiredTags = {"lab-equipped"};
        ExamResult result = ExamScheduler().schedule(inst, problem, nullptr, ExamConfig());
        REQUIRE(result.failure.kind == FailureKind::INFEASIBLE);
        REQUIRE(result.failure.constraint == "room-capability");
        REQUIRE(result.failure.sectionIds == std::vector<int>{0});
    }

    SECTION("too few benches") {
        inst.rooms[0].capacity = 2;
        inst.rooms[1].capacity = 2;
        ExamResult result = ExamScheduler().schedule(inst, problem, nullptr, ExamConfig());
        REQUIRE(result.failure.constraint == "seat-capacity");
    }

    SECTION("malformed problem") {
        problem.exams[1].studentIds.push_back(17);
        REQUIRE_THROWS_AS(ExamScheduler().schedule(inst, problem, nullptr, ExamConfig()), ModelError);
    }
}

TEST_CASE("committed teaching blocks rooms outside exam-only slots", "[exam]") {
    ProblemInstance inst = makeGrid(1, 2);
    addRoom(inst, "A1", 20);
    addRoom(inst, "A2", 40);
    int course = addCourse(inst, "C1", {0});
    addFaculty(inst, "F0", 10, {course});
    addFaculty(inst, "F1", 10, {});
    int s0 = addSection(inst, course, "C1-A", 4);
    addSection(inst, course, "C1-B", 0);
    addStudents(inst, 4, {s0});

    TimetableSolution teaching;
    teaching.assignments = {makeAssignment(0, 0, 0, 0, 0), makeAssignment(1, 0, 1, 0, 0)};

    ExamProblem problem;
    problem.exams.push_back(makeExam(0, course, {0, 1, 2, 3}));
    ExamConfig config;

    SECTION("the smaller room is taught in all day") {
        ExamResult result = ExamScheduler().schedule(inst, problem, &teaching, config);
        REQUIRE(result.feasible());
        REQUIRE(result.schedule->placements[0].roomIds == std::vector<int>{1});
        REQUIRE(dutiesOf(*result.schedule, 0, 1));
        REQUIRE(evaluateExams(*result.schedule, inst, problem, &teaching, config).feasible());
    }

    SECTION("exam-only slots free the smaller room") {
        problem.examOnlySlots = {0, 1};
        ExamResult result = ExamScheduler().schedule(inst, problem, &teaching, config);
        REQUIRE(result.feasible());
        REQUIRE(result.schedule->placements[0].roomIds == std::vector<int>{0});
        REQUIRE(evaluateExams(*result.schedule, inst, problem, &teaching, config).feasible());
    }
}

TEST_CASE("anti-cheating pairs students of different sections", "[exam][seating]") {
    ProblemInstance inst = examInstance();
    ExamProblem problem;
    problem.exams.push_back(makeExam(0, 2, {0, 1, 2, 3}));
    ExamConfig config;

    ExamResult result = ExamScheduler().schedule(inst, problem, nullptr, config);
    REQUIRE(result.feasible());
    const ExamSchedule& schedule = *result.schedule;

    int mates = 0;
    for (const SeatAssignment& s : schedule.seats) {
        if (s.seat == 1) ++mates;
    }
    REQUIRE(mates == 2);
    REQUIRE(schedule.seatingReports[0].seated == 4);
    REQUIRE(schedule.seatingReports[0].emptySeats == 16);

    Evaluation ev = evaluateExams(schedule, inst, problem, nullptr, config);
    REQUIRE(std::none_of(ev.violations.begin(), ev.violations.end(), [](const HardViolation& v) {
        return v.kind == ConstraintKind::BENCH_ADJACENCY;
    }));
}
