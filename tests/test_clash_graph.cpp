///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <catch2/catch.hpp>
#include "clash_graph.hpp"
#include "test_helpers.hpp"


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_CASE("sections sharing a student clash", "[clash]") {
    ProblemInstance inst = makeGrid(1, 4);
    int course = addCourse(inst, "C1");
    int a = addSection(inst, course, "A", 2);
    int b = addSection(inst, course, "B", 2);
    int c = addSection(inst, course, "C", 1);
    addStudents(inst, 1, {a, b});
    addStudents(inst, 1, {a, b});
    addStudents(inst, 1, {c});

    ClashGraph graph = ClashGraph::forSections(inst);
    REQUIRE(graph.size() == 3);
    REQUIRE(graph.clashes(a, b));
    REQUIRE(graph.clashes(b, a));
    REQUIRE_FALSE(graph.clashes(a, c));
    REQUIRE(graph.witness(a, b) == 0);
    REQUIRE(graph.neighbours(a) == std::vector<int>{b});
    REQUIRE(graph.degree(c) == 0);
}

TEST_CASE("elective siblings clash without a witness", "[clash]") {
    ProblemInstance inst = makeGrid(1, 4);
    int course = addCourse(inst, "C1");
    int a = addSection(inst, course, "A", 0);
    int b = addSection(inst, course, "B", 0);
    int c = addSection(inst, course, "C", 0);
    inst.sections[a].electiveGroup = 7;
    inst.sections[c].electiveGroup = 7;

    ClashGraph graph = ClashGraph::forSections(inst);
    REQUIRE(graph.clashes(a, c));
    REQUIRE(graph.witness(a, c) == ClashGraph::kNoStudent);
    REQUIRE_FALSE(graph.clashes(a, b));
}

TEST_CASE("a student witness upgrades an elective edge", "[clash]") {
    ClashGraph graph(3);
    graph.addClash(0, 2, ClashGraph::kNoStudent);
    graph.addClash(2, 0, 11);
    graph.addClash(0, 0, 4);
    REQUIRE(graph.witness(0, 2) == 11);
    REQUIRE(graph.neighbours(0) == std::vector<int>{2});
    REQUIRE_FALSE(graph.clashes(0, 0));
}

TEST_CASE("exams sharing a student clash", "[clash]") {
    ExamProblem problem;
    for (int i = 0; i < 3; ++i) {
        Exam e;
        e.id = i;
        e.courseId = i;
        e.name = "E" + std::to_string(i);
        problem.exams.push_back(e);
    }
    problem.exams[0].studentIds = {1, 2};
    problem.exams[1].studentIds = {2, 3};
    problem.exams[2].studentIds = {4};

    ClashGraph graph = ClashGraph::forExams(problem);
    REQUIRE(graph.clashes(0, 1));
    REQUIRE(graph.witness(0, 1) == 2);
    REQUIRE_FALSE(graph.clashes(1, 2));
}
