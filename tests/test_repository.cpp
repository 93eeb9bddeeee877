///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <catch2/catch.hpp>
#include "repository.hpp"
#include "exam_scheduler.hpp"
#include "test_helpers.hpp"
#include <future>
#include <set>
#include <stdexcept>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief One student taking two sections of one faculty member on a three-period day.
 */
static ProblemInstance smallInstance() {
    ProblemInstance inst = makeGrid(1, 3);
    addRoom(inst, "R1", 30);
    int course = addCourse(inst, "C1");
    addFaculty(inst, "F1", 10, {course});
    addFaculty(inst, "F2", 10, {});
    int a = addSection(inst, course, "C1-A", 1);
    int b = addSection(inst, course, "C1-B", 1);
    addStudents(inst, 1, {a, b});
    return inst;
}

static TimetableSolution timetable(int startA, int startB) {
    TimetableSolution sol;
    sol.assignments = {makeAssignment(0, 0, startA, 0, 0), makeAssignment(1, 0, startB, 0, 0)};
    return sol;
}


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_CASE("commits receive increasing ids", "[repository]") {
    ProblemInstance inst = smallInstance();
    ScheduleRepository repository;
    REQUIRE(repository.latestCycle() == -1);

    long first = repository.commit(inst, timetable(2, 0));
    long second = repository.commit(inst, timetable(0, 2));
    REQUIRE(first == 1);
    REQUIRE(second == 2);
    REQUIRE(repository.latestCycle() == 2);
    REQUIRE(repository.cycleIds() == std::vector<long>{1, 2});

    std::shared_ptr<const CommittedCycle> stored = repository.cycle(first);
    REQUIRE(stored->id == first);
    REQUIRE(stored->timetable.assignments == timetable(2, 0).assignments);
    REQUIRE_FALSE(stored->exams.has_value());
}

TEST_CASE("only complete clash-free timetables are committed", "[repository]") {
    ProblemInstance inst = smallInstance();
    ScheduleRepository repository;

    TimetableSolution partial = timetable(0, 2);
    partial.assignments[1] = Assignment();
    REQUIRE_THROWS_AS(repository.commit(inst, partial), std::invalid_argument);

    REQUIRE_THROWS_AS(repository.commit(inst, timetable(1, 1)), std::invalid_argument);
    REQUIRE(repository.latestCycle() == -1);
}

TEST_CASE("committed timetables answer queries", "[repository]") {
    ProblemInstance inst = smallInstance();
    ScheduleRepository repository;
    long id = repository.commit(inst, timetable(2, 0));

    REQUIRE(repository.assignmentsForFaculty(id, 0).size() == 2);
    REQUIRE(repository.assignmentsForFaculty(id, 1).empty());
    REQUIRE(repository.assignmentsForRoom(id, 0).size() == 2);

    std::vector<Assignment> student = repository.assignmentsForStudent(id, 0);
    REQUIRE(student.size() == 2);
    REQUIRE(student[0].sectionId == 0);
    REQUIRE(repository.assignmentsForStudent(id, 7).empty());

    std::vector<Assignment> day = repository.assignmentsForDay(id, 0);
    REQUIRE(day.size() == 2);
    REQUIRE(day[0].sectionId == 1);
    REQUIRE(day[1].sectionId == 0);

    REQUIRE(repository.seatsForStudent(id, 0).empty());
    REQUIRE(repository.dutiesForFaculty(id, 1).empty());
}

TEST_CASE("unknown cycles are reported", "[repository]") {
    ScheduleRepository repository;
    REQUIRE_THROWS_AS(repository.cycle(3), std::out_of_range);
    REQUIRE_THROWS_AS(repository.assignmentsForDay(3, 0), std::out_of_range);
    REQUIRE_THROWS_AS(repository.diffCycles(1, 2), std::out_of_range);
}

TEST_CASE("diffs list added, removed and moved assignments", "[repository]") {
    TimetableSolution before = timetable(0, 2);
    TimetableSolution after = timetable(1, 2);
    after.assignments[1] = Assignment();

    AssignmentDiff d = diff(before, after);
    REQUIRE(d.added.empty());
    REQUIRE(d.removed.size() == 1);
    REQUIRE(d.removed[0].sectionId == 1);
    REQUIRE(d.moved.size() == 1);
    REQUIRE(d.moved[0].first.startPeriod == 0);
    REQUIRE(d.moved[0].second.startPeriod == 1);

    AssignmentDiff back = diff(after, before);
    REQUIRE(back.added.size() == 1);
    REQUIRE(back.removed.empty());

    REQUIRE(diff(before, before).empty());
}

TEST_CASE("cycles are compared section by section", "[repository]") {
    ProblemInstance inst = smallInstance();
    ScheduleRepository repository;
    long first = repository.commit(inst, timetable(0, 2));
    long second = repository.commit(inst, timetable(1, 2));

    CycleDiff d = repository.diffCycles(first, second);
    REQUIRE(d.timetable.moved.size() == 1);
    REQUIRE(d.timetable.moved[0].first.sectionId == 0);
    REQUIRE(d.timetable.added.empty());
    REQUIRE(d.exams.empty());
    REQUIRE(repository.diffCycles(second, second).timetable.empty());
}

TEST_CASE("exam schedules are committed with their timetable", "[repository][exam]") {
    ProblemInstance inst = smallInstance();
    TimetableSolution teaching = timetable(0, 2);

    ExamProblem problem;
    Exam exam;
    exam.id = 0;
    exam.courseId = 0;
    exam.name = "C1 exam";
    exam.studentIds = {0};
    problem.exams.push_back(exam);

    ExamConfig config;
    ExamResult result = ExamScheduler().schedule(inst, problem, &teaching, config);
    REQUIRE(result.feasible());
    REQUIRE(result.schedule->placements[0].startPeriod == 1);

    ScheduleRepository repository;
    long id = repository.commit(inst, teaching, problem, *result.schedule, config);
    REQUIRE(repository.cycle(id)->exams.has_value());

    std::vector<SeatAssignment> seats = repository.seatsForStudent(id, 0);
    REQUIRE(seats.size() == 1);
    REQUIRE(seats[0].seatLabel == "R1-R1-LA");
    REQUIRE(repository.dutiesForFaculty(id, 1).size() == 1);
    REQUIRE(repository.dutiesForFaculty(id, 0).empty());

    ExamSchedule incomplete = *result.schedule;
    incomplete.placements[0] = ExamPlacement();
    REQUIRE_THROWS_AS(repository.commit(inst, teaching, problem, incomplete, config), std::invalid_argument);
}

TEST_CASE("concurrent commits get distinct ids", "[repository]") {
    ProblemInstance inst = smallInstance();
    ScheduleRepository repository;

    std::vector<std::future<long>> commits;
    for (int i = 0; i < 8; ++i) {
        commits.push_back(std::async(std::launch::async, [&repository, &inst, i]() {
            return repository.commit(inst, timetable(i % 2 == 0 ? 0 : 2, i % 2 == 0 ? 2 : 0));
        }));
    }
    std::set<long> ids;
    for (auto& c : commits) ids.insert(c.get());

    REQUIRE(ids.size() == 8);
    REQUIRE(*ids.begin() == 1);
    REQUIRE(*ids.rbegin() == 8);
    REQUIRE(repository.latestCycle() == 8);
}
