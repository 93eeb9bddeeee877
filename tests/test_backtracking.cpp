///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <catch2/catch.hpp>
#include "backtracking.hpp"
#include <atomic>
#include <chrono>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Graph colouring in node order, the smallest search problem with real dead ends.
 */
struct ColoringProblem {
    using Candidate = int;

    std::vector<std::vector<int>> adjacency;
    int colors;
    std::vector<int> color;

    ColoringProblem(std::vector<std::vector<int>> adj, int k)
            : adjacency(std::move(adj)), colors(k), color(adjacency.size(), -1) {}

    int activityCount() const { return (int)adjacency.size(); }
    int activityAt(int depth) const { return depth; }
    void openFrame(int) {}
    void closeFrame(int) {}

    std::vector<int> liveCandidates(int id) {
        std::vector<int> result;
        for (int c = 0; c < colors; ++c) {
            bool free = true;
            for (int n : adjacency[id]) {
                if (color[n] == c) free = false;
            }
            if (free) result.push_back(c);
        }
        return result;
    }

    void place(int id, const int& c) { color[id] = c; }
    void unplace(int id, const int&) { color[id] = -1; }

    void culprits(int id, std::vector<int>& out) const {
        for (int n : adjacency[id]) {
            if (color[n] >= 0) out.push_back(n);
        }
    }
};


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST_CASE("backtracking colours a path with two colours", "[backtracking]") {
    ColoringProblem problem({{1}, {0, 2}, {1}}, 2);
    SearchBudget budget(std::chrono::milliseconds(10000));
    SolverStats stats;
    BacktrackingSearch<ColoringProblem> search(problem, 100, 100, budget, stats);

    BacktrackingSearch<ColoringProblem>::Outcome out = search.run();
    REQUIRE(out.failure == FailureKind::NONE);
    REQUIRE(problem.color == std::vector<int>{0, 1, 0});
    REQUIRE(search.stack().size() == 3);
    REQUIRE(stats.deadEnds == 0);
    REQUIRE(stats.decisions == 3);
}

TEST_CASE("backtracking proves a triangle needs three colours", "[backtracking]") {
    std::vector<std::vector<int>> triangle = {{1, 2}, {0, 2}, {0, 1}};
    SearchBudget budget(std::chrono::milliseconds(10000));
    SolverStats stats;

    SECTION("two colours fail with the last node as hardest") {
        ColoringProblem problem(triangle, 2);
        BacktrackingSearch<ColoringProblem> search(problem, 100, 100, budget, stats);
        BacktrackingSearch<ColoringProblem>::Outcome out = search.run();
        REQUIRE(out.failure == FailureKind::INFEASIBLE);
        REQUIRE(out.hardestActivity == 2);
        REQUIRE(out.culprits == std::vector<int>{0, 1});
        REQUIRE(stats.deadEnds == 2);
        REQUIRE(stats.backjumps == 2);
        REQUIRE(problem.color == std::vector<int>{-1, -1, -1});
    }

    SECTION("three colours succeed") {
        ColoringProblem problem(triangle, 3);
        BacktrackingSearch<ColoringProblem> search(problem, 100, 100, budget, stats);
        REQUIRE(search.run().failure == FailureKind::NONE);
        REQUIRE(problem.color == std::vector<int>{0, 1, 2});
    }

    SECTION("chronological steps once the retry budget is spent") {
        ColoringProblem problem(triangle, 2);
        BacktrackingSearch<ColoringProblem> search(problem, 100, 0, budget, stats);
        REQUIRE(search.run().failure == FailureKind::INFEASIBLE);
        REQUIRE(stats.backjumps == 0);
        REQUIRE(stats.chronologicalSteps > 0);
    }
}

TEST_CASE("backtracking stops when a budget runs out", "[backtracking]") {
    std::vector<std::vector<int>> triangle = {{1, 2}, {0, 2}, {0, 1}};
    SolverStats stats;

    SECTION("dead-end budget") {
        SearchBudget budget(std::chrono::milliseconds(10000));
        ColoringProblem problem(triangle, 2);
        BacktrackingSearch<ColoringProblem> search(problem, 1, 100, budget, stats);
        BacktrackingSearch<ColoringProblem>::Outcome out = search.run();
        REQUIRE(out.failure == FailureKind::BUDGET_EXCEEDED);
        REQUIRE(out.budgetReason == "backtrack budget exhausted");
    }

    SECTION("stop flag") {
        std::atomic<bool> stop{true};
        SearchBudget budget(std::chrono::milliseconds(10000), &stop);
        ColoringProblem problem(triangle, 3);
        BacktrackingSearch<ColoringProblem> search(problem, 100, 100, budget, stats);
        BacktrackingSearch<ColoringProblem>::Outcome out = search.run();
        REQUIRE(out.failure == FailureKind::BUDGET_EXCEEDED);
        REQUIRE(out.budgetReason == "time budget exhausted");
    }
}
