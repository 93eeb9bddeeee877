#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "errors.hpp"
#include "solver_base.hpp"
#include <algorithm>
#include <string>
#include <vector>


///////////////////////////
///     BACKTRACKING    ///
///////////////////////////
/**
 * @brief Backtracking search over an explicit stack of decision points.
 *
 * The search frontier lives in `stack_` rather than on the call stack, so a
 * run can be budget-checked between every step and inspected afterwards.
 *
 * `Problem` supplies the domain:
 *  - `using Candidate = ...;`
 *  - `int activityCount() const;` and `int activityAt(int depth) const;`
 *    giving the fixed processing order,
 *  - `void openFrame(int id);` / `void closeFrame(int id);` called when a
 *    decision point for `id` is pushed / popped,
 *  - `std::vector<Candidate> liveCandidates(int id);` ranked best first,
 *  - `void place(int id, const Candidate&);` / `void unplace(int id, const Candidate&);`
 *  - `void culprits(int id, std::vector<int>& out) const;` appending the
 *    placed activities that block every candidate of `id`.
 *
 * On a fresh dead end the search jumps back to the most recent culprit
 * (conflict-directed). Once `retryBudget` jumps have been spent it steps
 * back one decision at a time. A decision point whose alternatives run out
 * is always undone chronologically.
 */
template <typename Problem>
class BacktrackingSearch {
public:
    using Candidate = typename Problem::Candidate;

    /**
     * @brief One decision: an activity, its ranked candidates and the next one to try.
     */
    struct DecisionPoint {
        int activityId; ///< Activity decided at this depth.
        std::vector<Candidate> ranked; ///< Live candidates, best first.
        size_t next = 0; ///< Index of the next alternative.
        bool placed = false; ///< True while ranked[next - 1] is committed.

        const Candidate& current() const { return ranked[next - 1]; }
    };

    /**
     * @brief Result of a run. failure == NONE means every activity is placed.
     */
    struct Outcome {
        FailureKind failure = FailureKind::NONE; ///< Failure category.
        std::string budgetReason; ///< Which budget ran out, for BUDGET_EXCEEDED.
        int hardestActivity = -1; ///< Activity that hit the most dead ends.
        std::vector<int> culprits; ///< Last culprits of hardestActivity.
    };

    BacktrackingSearch(Problem& problem, long backtrackBudget, long retryBudget,
                       const SearchBudget& budget, SolverStats& stats)
            : problem_(problem),
              backtrackBudget_(backtrackBudget),
              retryBudget_(retryBudget),
              budget_(budget),
              stats_(stats) {}

    /**
     * @brief Run the search until every activity is placed or a budget runs out.
     */
    Outcome run() {
        int n = problem_.activityCount();
        depthOf_.assign(n, -1);
        failCount_.assign(n, 0);
        lastCulprits_.assign(n, {});
        stack_.clear();
        deadEnds_ = 0;
        jumps_ = 0;

        Outcome out;
        bool advance = false; // Top frame failed below: move it to its next alternative.
        while (true) {
            if (budget_.exhausted()) {
                out.failure = FailureKind::BUDGET_EXCEEDED;
                out.budgetReason = "time budget exhausted";
                break;
            }

            // Top decision is committed: open the next one, or finish.
            if (!advance && (stack_.empty() || stack_.back().placed)) {
                if ((int)stack_.size() == n) return out;

                int id = problem_.activityAt((int)stack_.size());
                problem_.openFrame(id);
                DecisionPoint dp;
                dp.activityId = id;
                dp.ranked = problem_.liveCandidates(id);
                depthOf_[id] = (int)stack_.size();
                stack_.push_back(std::move(dp));

                if (stack_.back().ranked.empty()) {
                    if (!handleDeadEnd(out)) break;
                    advance = true;
                    continue;
                }
            }
            advance = false;

            DecisionPoint& top = stack_.back();
            if (top.placed) {
                problem_.unplace(top.activityId, top.current());
                top.placed = false;
            }
            if (top.next < top.ranked.size()) {
                problem_.place(top.activityId, top.ranked[top.next]);
                ++top.next;
                top.placed = true;
                ++stats_.decisions;
                continue;
            }

            // Alternatives exhausted: undo this decision point.
            popFrame();
            ++stats_.chronologicalSteps;
            if (stack_.empty()) {
                out.failure = FailureKind::INFEASIBLE;
                break;
            }
            advance = true;
        }

        fillDiagnosis(out);
        return out;
    }

    /// Decision stack; after a successful run it holds one placed frame per activity.
    const std::vector<DecisionPoint>& stack() const { return stack_; }

private:
    Problem& problem_; ///< Domain callbacks.
    long backtrackBudget_; ///< Maximum dead ends.
    long retryBudget_; ///< Conflict-directed jumps before chronological fallback.
    const SearchBudget& budget_; ///< Deadline and stop flags.
    SolverStats& stats_; ///< Counters updated during the run.

    std::vector<DecisionPoint> stack_; ///< Explicit search frontier.
    std::vector<int> depthOf_; ///< Stack depth per activity, or -1.
    std::vector<int> failCount_; ///< Dead ends per activity.
    std::vector<std::vector<int>> lastCulprits_; ///< Culprits at the last dead end per activity.
    long deadEnds_ = 0; ///< Dead ends in this run.
    long jumps_ = 0; ///< Conflict-directed jumps in this run.

    void popFrame() {
        DecisionPoint& top = stack_.back();
        if (top.placed) problem_.unplace(top.activityId, top.current());
        problem_.closeFrame(top.activityId);
        depthOf_[top.activityId] = -1;
        stack_.pop_back();
    }

    /**
     * @brief Handle a freshly opened decision point without candidates.
     *
     * @return false if the search must stop (budget or proven infeasibility).
     */
    bool handleDeadEnd(Outcome& out) {
        int id = stack_.back().activityId;
        ++deadEnds_;
        ++stats_.deadEnds;
        ++failCount_[id];

        std::vector<int> culprits;
        problem_.culprits(id, culprits);
        std::sort(culprits.begin(), culprits.end());
        culprits.erase(std::unique(culprits.begin(), culprits.end()), culprits.end());
        lastCulprits_[id] = culprits;

        popFrame();

        if (deadEnds_ > backtrackBudget_) {
            out.failure = FailureKind::BUDGET_EXCEEDED;
            out.budgetReason = "backtrack budget exhausted";
            return false;
        }
        if (stack_.empty()) {
            out.failure = FailureKind::INFEASIBLE;
            return false;
        }

        int target = (int)stack_.size() - 1;
        if (jumps_ < retryBudget_) {
            int mostRecent = -1;
            for (int c : culprits) {
                if (c >= 0 && c < (int)depthOf_.size()) mostRecent = std::max(mostRecent, depthOf_[c]);
            }
            // No placed activity blocks it: no earlier decision can help.
            if (mostRecent < 0) {
                out.failure = FailureKind::INFEASIBLE;
                return false;
            }
            target = mostRecent;
            ++jumps_;
            ++stats_.backjumps;
        } else {
            ++stats_.chronologicalSteps;
        }

        while ((int)stack_.size() - 1 > target) popFrame();
        return true;
    }

    void fillDiagnosis(Outcome& out) const {
        int hardest = -1;
        for (int i = 0; i < (int)failCount_.size(); ++i) {
            if (failCount_[i] > 0 && (hardest < 0 || failCount_[i] > failCount_[hardest]))
                hardest = i;
        }
        out.hardestActivity = hardest;
        if (hardest >= 0) out.culprits = lastCulprits_[hardest];
    }
};
