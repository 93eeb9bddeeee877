///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <catch2/catch.hpp>
#include "evaluator.hpp"
#include "test_helpers.hpp"
#include <algorithm>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// One student taking two single-period sections taught by one faculty member.
static ProblemInstance twoSectionDay() {
    ProblemInstance inst = makeGrid(1, 4);
    addRoom(inst, "R1", 30);
    int course = addCourse(inst, "C1");
    addFaculty(inst, "F1", 10, {course});
    int a = addSection(inst, course, "C1-A", 1);
    int b = addSection(inst, course, "C1-B", 1);
    addStudents(inst, 1, {a, b});
    return inst;
}

static bool hasKind(const Evaluation& ev, ConstraintKind kind) {
    return std::any_of(ev.violations.begin(), ev.violations.end(),
                       [kind](const HardViolation& v) { return v.kind == kind; });
}

static double termCount(const Evaluation& ev, ConstraintKind kind) {
    for (const SoftTerm& t : ev.terms) {
        if (t.kind == kind) return t.count;
    }
    return -1.0;
}


///////////////////////////
///      TIMETABLE      ///
///////////////////////////
TEST_CASE("soft cost counts gaps and missing self-study", "[evaluator]") {
    ProblemInstance inst = twoSectionDay();
    TimetableSolution sol;
    sol.assignments = {makeAssignment(0, 0, 0, 0, 0), makeAssignment(1, 0, 2, 0, 0)};

    Evaluation ev = evaluate(sol, inst, SolverConfig());
    REQUIRE(ev.feasible());
    REQUIRE(termCount(ev, ConstraintKind::STUDENT_GAPS) == Approx(1.0));
    REQUIRE(termCount(ev, ConstraintKind::FACULTY_GAPS) == Approx(1.0));
    REQUIRE(termCount(ev, ConstraintKind::MISSING_SELF_STUDY) == Approx(1.0));
    REQUIRE(termCount(ev, ConstraintKind::MISSING_BREAK) == Approx(0.0));
    REQUIRE(termCount(ev, ConstraintKind::COURSE_SPACING) == Approx(1.0));
    REQUIRE(termCount(ev, ConstraintKind::FACULTY_PREFERENCE) == Approx(0.0));
    REQUIRE(ev.softCost == Approx(4.0));
}

TEST_CASE("back-to-back classes miss a break", "[evaluator]") {
    ProblemInstance inst = twoSectionDay();
    TimetableSolution sol;
    sol.assignments = {makeAssignment(0, 0, 0, 0, 0), makeAssignment(1, 0, 1, 0, 0)};

    Evaluation ev = evaluate(sol, inst, SolverConfig());
    REQUIRE(ev.feasible());
    REQUIRE(termCount(ev, ConstraintKind::MISSING_BREAK) == Approx(1.0));
    REQUIRE(ev.softCost == Approx(1.5));
}

TEST_CASE("zero weights drop every soft term", "[evaluator]") {
    ProblemInstance inst = twoSectionDay();
    TimetableSolution sol;
    sol.assignments = {makeAssignment(0, 0, 0, 0, 0), makeAssignment(1, 0, 2, 0, 0)};

    SolverConfig config;
    config.weights = SoftWeights{0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    Evaluation ev = evaluate(sol, inst, config);
    REQUIRE(ev.terms.empty());
    REQUIRE(ev.softCost == 0.0);
}

TEST_CASE("same-course sections on different days are spaced", "[evaluator]") {
    ProblemInstance inst = makeGrid(2, 4);
    addRoom(inst, "R1", 30);
    int course = addCourse(inst, "C1");
    int other = addCourse(inst, "C2");
    addFaculty(inst, "F1", 10, {course, other});
    int a = addSection(inst, course, "C1-A", 1);
    int b = addSection(inst, course, "C1-B", 1);
    int c = addSection(inst, other, "C2-A", 1);
    addStudents(inst, 1, {a, b, c});

    TimetableSolution sol;
    sol.assignments = {makeAssignment(a, 0, 0, 0, 0), makeAssignment(b, 1, 0, 0, 0), makeAssignment(c, 0, 2, 0, 0)};
    REQUIRE(termCount(evaluate(sol, inst, SolverConfig()), ConstraintKind::COURSE_SPACING) == Approx(0.0));

    sol.assignments[b] = makeAssignment(b, 0, 3, 0, 0);
    REQUIRE(termCount(evaluate(sol, inst, SolverConfig()), ConstraintKind::COURSE_SPACING) == Approx(1.0));
}

TEST_CASE("periods outside preferred slots are penalised", "[evaluator]") {
    ProblemInstance inst = twoSectionDay();
    inst.faculty[0].preferredSlots = {0, 1};
    inst.sections[1].duration = 2;
    TimetableSolution sol;
    sol.assignments = {makeAssignment(0, 0, 0, 0, 0), makeAssignment(1, 0, 1, 0, 0)};

    SolverConfig config;
    Evaluation ev = evaluate(sol, inst, config);
    REQUIRE(ev.feasible());
    REQUIRE(termCount(ev, ConstraintKind::FACULTY_PREFERENCE) == Approx(1.0));

    inst.faculty[0].preferredSlots.clear();
    REQUIRE(termCount(evaluate(sol, inst, config), ConstraintKind::FACULTY_PREFERENCE) == Approx(0.0));
}

TEST_CASE("daily section cap per faculty member", "[evaluator]") {
    ProblemInstance inst = twoSectionDay();
    TimetableSolution sol;
    sol.assignments = {makeAssignment(0, 0, 0, 0, 0), makeAssignment(1, 0, 2, 0, 0)};

    SolverConfig config;
    REQUIRE(evaluate(sol, inst, config).feasible());

    config.maxFacultyDailySections = 1;
    Evaluation ev = evaluate(sol, inst, config);
    REQUIRE(ev.violations.size() == 1);
    REQUIRE(ev.violations[0].kind == ConstraintKind::FACULTY_DAILY_LIMIT);
    REQUIRE(ev.violations[0].activityIds == std::vector<int>{0, 1});
    REQUIRE(ev.violations[0].facultyId == 0);
    REQUIRE(ev.violations[0].day == 0);

    config.maxFacultyDailySections = 2;
    REQUIRE(evaluate(sol, inst, config).feasible());
}

TEST_CASE("hard violations are reported with their resources", "[evaluator]") {
    ProblemInstance inst = twoSectionDay();
    TimetableSolution sol;

    SECTION("double booking of room, faculty and student") {
        sol.assignments = {makeAssignment(0, 0, 1, 0, 0), makeAssignment(1, 0, 1, 0, 0)};
        Evaluation ev = evaluate(sol, inst, SolverConfig());
        REQUIRE(ev.violations.size() == 3);
        REQUIRE(hasKind(ev, ConstraintKind::ROOM_DOUBLE_BOOKED));
        REQUIRE(hasKind(ev, ConstraintKind::FACULTY_DOUBLE_BOOKED));
        REQUIRE(hasKind(ev, ConstraintKind::STUDENT_CLASH));
        for (const HardViolation& v : ev.violations) {
            REQUIRE(v.activityIds == std::vector<int>{0, 1});
            REQUIRE(v.period == 1);
        }
    }

    SECTION("room too small") {
        inst.rooms[0].capacity = 1;
        inst.sections[1].enrolled = 2;
        addStudents(inst, 1, {1});
        sol.assignments = {makeAssignment(0, 0, 0, 0, 0), makeAssignment(1, 0, 2, 0, 0)};
        Evaluation ev = evaluate(sol, inst, SolverConfig());
        REQUIRE(ev.violations.size() == 1);
        REQUIRE(ev.violations[0].kind == ConstraintKind::ROOM_CAPACITY);
        REQUIRE(ev.violations[0].describe() == "room-capacity: activities [1] room 0 day 0 period 2");
    }

    SECTION("break periods and calendars") {
        inst.grid.breakPeriods = {2};
        inst.faculty[0].unavailableSlots = {0};
        sol.assignments = {makeAssignment(0, 0, 0, 0, 0), makeAssignment(1, 0, 2, 0, 0)};
        Evaluation ev = evaluate(sol, inst, SolverConfig());
        REQUIRE(ev.violations.size() == 2);
        REQUIRE(ev.violations[0].kind == ConstraintKind::AVAILABILITY);
        REQUIRE(ev.violations[1].kind == ConstraintKind::AVAILABILITY);
    }

    SECTION("unqualified faculty and overload") {
        int other = addCourse(inst, "C2");
        addFaculty(inst, "F2", 1, {other});
        sol.assignments = {makeAssignment(0, 0, 0, 0, 1), makeAssignment(1, 0, 2, 0, 1)};
        Evaluation ev = evaluate(sol, inst, SolverConfig());
        REQUIRE(hasKind(ev, ConstraintKind::FACULTY_UNQUALIFIED));
        REQUIRE(hasKind(ev, ConstraintKind::FACULTY_OVERLOAD));
    }
}

TEST_CASE("evaluation is repeatable", "[evaluator]") {
    ProblemInstance inst = twoSectionDay();
    TimetableSolution sol;
    sol.assignments = {makeAssignment(0, 0, 1, 0, 0), makeAssignment(1, 0, 1, 0, 0)};

    Evaluation first = evaluate(sol, inst, SolverConfig());
    Evaluation second = evaluate(sol, inst, SolverConfig());
    REQUIRE(first.violations == second.violations);
    REQUIRE(first.softCost == second.softCost);
    REQUIRE(std::is_sorted(first.violations.begin(), first.violations.end()));
}

TEST_CASE("partial timetables skip unassigned sections", "[evaluator]") {
    ProblemInstance inst = twoSectionDay();
    TimetableSolution sol;
    sol.assignments = {makeAssignment(0, 0, 1, 0, 0), Assignment()};
    REQUIRE(evaluate(sol, inst, SolverConfig()).feasible());
}

TEST_CASE("elective siblings clash without a shared student", "[evaluator]") {
    ProblemInstance inst = makeGrid(1, 2);
    addRoom(inst, "R1", 30);
    addRoom(inst, "R2", 30);
    int course = addCourse(inst, "C1");
    addFaculty(inst, "F1", 10, {course});
    addFaculty(inst, "F2", 10, {course});
    addSection(inst, course, "E1", 0);
    addSection(inst, course, "E2", 0);
    inst.sections[0].electiveGroup = 1;
    inst.sections[1].electiveGroup = 1;

    TimetableSolution sol;
    sol.assignments = {makeAssignment(0, 0, 0, 0, 0), makeAssignment(1, 0, 0, 1, 1)};
    Evaluation ev = evaluate(sol, inst, SolverConfig());
    REQUIRE(ev.violations.size() == 1);
    REQUIRE(ev.violations[0].kind == ConstraintKind::ELECTIVE_CLASH);
    REQUIRE(ev.violations[0].studentId == -1);
}

TEST_CASE("load variance and invigilator requirements", "[evaluator]") {
    REQUIRE(loadVariance({}) == 0.0);
    REQUIRE(loadVariance({2, 2, 2}) == Approx(0.0));
    REQUIRE(loadVariance({0, 4}) == Approx(4.0));

    ExamConfig config;
    REQUIRE(requiredInvigilators(config, 81) == 1);
    config.studentsPerInvigilator = 40;
    REQUIRE(requiredInvigilators(config, 81) == 3);
    REQUIRE(requiredInvigilators(config, 0) == 1);
}


///////////////////////////
///        EXAMS        ///
///////////////////////////
TEST_CASE("instructors invigilating their own exam", "[evaluator][exam]") {
    ProblemInstance inst = makeGrid(1, 2);
    addRoom(inst, "R1", 10);
    int course = addCourse(inst, "C1", {0});
    addFaculty(inst, "F1", 10, {course});
    addFaculty(inst, "F2", 10, {});
    int s0 = addSection(inst, course, "C1-A", 1);
    addStudents(inst, 1, {s0});

    ExamProblem problem;
    Exam exam;
    exam.id = 0;
    exam.courseId = course;
    exam.name = "C1 exam";
    exam.studentIds = {0};
    problem.exams.push_back(exam);

    ExamSchedule schedule;
    ExamPlacement p;
    p.examId = 0;
    p.day = 0;
    p.startPeriod = 0;
    p.roomIds = {0};
    p.seatCounts = {1};
    schedule.placements.push_back(p);
    schedule.seats.push_back({0, 0, "R1-R1-LA", 0, 0, 0, 0});
    schedule.invigilators.push_back({0, 0, 0, 0, 1, 0});

    ExamConfig config;
    Evaluation strict = evaluateExams(schedule, inst, problem, nullptr, config);
    REQUIRE(strict.violations.size() == 1);
    REQUIRE(strict.violations[0].kind == ConstraintKind::SELF_INVIGILATION);
    REQUIRE(strict.violations[0].facultyId == 0);

    config.precedence = ExclusionPrecedence::MINIMUM_FIRST;
    REQUIRE(evaluateExams(schedule, inst, problem, nullptr, config).feasible());

    config.precedence = ExclusionPrecedence::EXCLUSION_FIRST;
    schedule.invigilators[0].facultyId = 1;
    Evaluation fixed = evaluateExams(schedule, inst, problem, nullptr, config);
    REQUIRE(fixed.feasible());

    schedule.invigilators.clear();
    REQUIRE(evaluateExams(schedule, inst, problem, nullptr, config).violations[0].kind ==
            ConstraintKind::INVIGILATOR_SHORTAGE);
}

TEST_CASE("committed teaching counts as instructing the course", "[evaluator][exam]") {
    ProblemInstance inst = makeGrid(1, 2);
    int course = addCourse(inst, "C1");
    addFaculty(inst, "F1", 10, {course});
    addFaculty(inst, "F2", 10, {course});
    addSection(inst, course, "C1-A", 0);

    REQUIRE(courseInstructors(inst, course, nullptr).empty());
    TimetableSolution committed;
    committed.assignments = {makeAssignment(0, 0, 0, 0, 1)};
    REQUIRE(courseInstructors(inst, course, &committed) == std::vector<int>{1});
}
