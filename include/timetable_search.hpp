#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "clash_graph.hpp"
#include "constraints.hpp"
#include "evaluator.hpp"
#include "solver_base.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <vector>


///////////////////////////
///      CANDIDATES     ///
///////////////////////////
/**
 * @brief One way to place a section: a start slot, a room and a faculty member.
 */
struct Candidate {
    int day; ///< Day index.
    int startPeriod; ///< First period of the block.
    int roomId; ///< Room.
    int facultyId; ///< Faculty member.
};

/**
 * @brief Everything about an instance that does not change during search.
 *
 * Built once per solve and shared read-only by every search branch, thread
 * or refinement worker.
 */
class SearchContext {
public:
    /**
     * @brief Precompute clash graph, static candidates and processing order.
     *
     * The instance must have passed validateInstance() and must outlive the context.
     * A positive `maxDailySections` caps the sections a faculty member teaches per day.
     */
    explicit SearchContext(const ProblemInstance& inst, int maxDailySections = 0);

    const ProblemInstance& inst; ///< Instance being solved.
    int maxDailySections; ///< Per-faculty daily section cap (0 = unlimited).
    ClashGraph clashes; ///< Section clash graph.
    std::vector<std::vector<int>> eligible; ///< Eligible faculty per section.
    /// Candidates passing capacity, tags, qualification, availability and break checks, per section.
    std::vector<std::vector<Candidate>> staticCandidates;
    std::vector<int> order; ///< Most-constrained-first processing order.

    /**
     * @brief First section (in processing order) with no static candidate, diagnosed.
     */
    std::optional<Infeasibility> staticInfeasibility() const;

    /// Booking of a section placed on a candidate.
    Booking booking(int sectionId, const Candidate& c) const;

    /// Assignment record of a section placed on a candidate.
    Assignment assignment(int sectionId, const Candidate& c) const;

    /// True if the candidate is free in the state and keeps the faculty within max load and the daily cap.
    bool live(const ScheduleState& state, int sectionId, const Candidate& c) const;

    /// Fresh state with every assigned section except those in `skip` booked.
    ScheduleState stateFor(const std::vector<Assignment>& assignments, const std::vector<int>& skip) const;

private:
    /**
     * @brief Name the static constraint that eliminates every candidate of a section.
     */
    Infeasibility diagnose(int sectionId) const;
};


///////////////////////////
///    CONSTRUCTIVE     ///
///////////////////////////
/**
 * @brief Adapter exposing timetable construction to BacktrackingSearch.
 *
 * Owns the forward-checking bookkeeping: the remaining demand of sections not
 * yet decided on each room and faculty member, and the slots each section
 * could still start in.
 */
class TimetableSearchProblem {
public:
    using Candidate = ::Candidate;

    TimetableSearchProblem(const SearchContext& ctx, std::uint64_t seed);

    int activityCount() const { return (int)ctx_.order.size(); }
    int activityAt(int depth) const { return ctx_.order[depth]; }

    void openFrame(int sectionId);
    void closeFrame(int sectionId);

    /**
     * @brief Live candidates of a section, best forward-checking score first.
     *
     * Ties are broken by a seeded random key, then by (day, period, room, faculty).
     */
    std::vector<Candidate> liveCandidates(int sectionId);

    void place(int sectionId, const Candidate& c);
    void unplace(int sectionId, const Candidate& c);

    /**
     * @brief Placed sections blocking any static candidate of a section.
     *
     * A candidate refused for faculty load blames every section the faculty
     * member currently teaches; one refused for the daily cap blames that day's sections.
     */
    void culprits(int sectionId, std::vector<int>& out) const;

    /// Current assignments indexed by section id.
    const std::vector<Assignment>& assignments() const { return assignments_; }

private:
    const SearchContext& ctx_;
    ScheduleState state_;
    std::mt19937_64 rng_;

    std::vector<Assignment> assignments_; ///< Placed sections.
    std::vector<char> decided_; ///< Sections whose decision point is open.
    std::vector<int> roomDemand_; ///< Undecided sections that could use each room.
    std::vector<int> facultyDemand_; ///< Undecided sections that could use each faculty member.
    std::vector<std::vector<int>> roomsOf_; ///< Distinct rooms among a section's static candidates.
    std::vector<std::vector<int>> facultyOf_; ///< Distinct faculty among a section's static candidates.
    std::vector<std::vector<char>> covers_; ///< covers_[section][slot]: some static start covers the slot.

    void adjustDemand(int sectionId, int delta);
};

/**
 * @brief Run the constructive phase.
 *
 * @param failure Filled with a diagnosis when no complete timetable is returned.
 * @return Assignments indexed by section id, or std::nullopt.
 */
std::optional<std::vector<Assignment>> constructTimetable(const SearchContext& ctx, const SolverConfig& config,
                                                          std::uint64_t seed, const SearchBudget& budget,
                                                          SolverStats& stats, Infeasibility& failure);


///////////////////////////
///    LOCAL SEARCH     ///
///////////////////////////
/**
 * @brief Refinement moves.
 */
enum class MoveKind {
    RELOCATE, ///< One section to another live candidate.
    FACULTY_BLOCK ///< Re-place every section taught by one faculty member.
};

/**
 * @brief A proposed neighbour schedule.
 */
struct Proposal {
    MoveKind kind; ///< Move that produced it.
    int target; ///< Section or faculty moved.
    std::vector<Assignment> assignments; ///< Resulting schedule.
};

/**
 * @brief Soft-cost refinement of a feasible timetable.
 *
 * Neighbours are generated from live candidates only, then re-evaluated in
 * full: any hard violation rejects the move.
 */
class LocalSearch {
public:
    LocalSearch(const SearchContext& ctx, const SolverConfig& config);

    /**
     * @brief Refine a feasible schedule until the move or time budget runs out.
     *
     * @return The best schedule seen, with its soft cost.
     */
    TimetableSolution run(const std::vector<Assignment>& start, const SearchBudget& budget, SolverStats& stats);

    /**
     * @brief Draw one neighbour of `current`, or std::nullopt if the drawn move has no option.
     */
    std::optional<Proposal> propose(const std::vector<Assignment>& current, std::mt19937_64& rng) const;

    /// Acceptance rule: strict improvement, or a worse move with the configured probability.
    bool accepts(double currentCost, double proposedCost, std::mt19937_64& rng) const;

    /// Full evaluation of a schedule.
    Evaluation evaluate(const std::vector<Assignment>& assignments) const;

private:
    const SearchContext& ctx_;
    SolverConfig config_;
    ConstraintEvaluator evaluator_;
    std::mt19937_64 rng_;

    std::optional<Proposal> relocate(const std::vector<Assignment>& current, std::mt19937_64& rng) const;
    std::optional<Proposal> facultyBlock(const std::vector<Assignment>& current, std::mt19937_64& rng) const;
};
