#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <optional>
#include <vector>

///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Full timetable and its associated soft cost.
 *
 * Holds one Assignment per section, indexed by section id, together with the
 * value of the soft-constraint objective (lower is better).
 */
struct TimetableSolution {
    /// Assignments indexed by section id; sectionId == -1 marks an unassigned section.
    std::vector<Assignment> assignments;

    /// Soft-constraint cost for this timetable; lower values are preferred.
    double softCost = 0.0;

    /// True when every section has an assignment.
    bool complete() const;

    /// Number of assigned sections.
    int assignedCount() const;
};

/**
 * @brief Complete exam schedule: placements, seats and invigilators.
 */
struct ExamSchedule {
    std::vector<ExamPlacement> placements; ///< Placements indexed by exam id.
    std::vector<SeatAssignment> seats; ///< One seat per student per exam.
    std::vector<InvigilatorAssignment> invigilators; ///< Invigilation duties.
    std::vector<SeatingReport> seatingReports; ///< One report per (exam, room).
    double softCost = 0.0; ///< Exam soft cost (lower is better).

    /// True when every exam has a placement.
    bool complete() const;
};

/**
 * @brief Counters collected during one solver run.
 */
struct SolverStats {
    long decisions = 0; ///< Candidates committed in the constructive phase.
    long deadEnds = 0; ///< Sections found without a live candidate.
    long backjumps = 0; ///< Conflict-directed jumps taken.
    long chronologicalSteps = 0; ///< Chronological backtracking steps.
    long movesTried = 0; ///< Refinement moves evaluated.
    long movesAccepted = 0; ///< Refinement moves accepted.
    double initialCost = 0.0; ///< Soft cost after the constructive phase.
    double finalCost = 0.0; ///< Soft cost of the returned schedule.

    /// One entry per accepted refinement move when tracing is enabled.
    struct TraceEntry {
        long move; ///< Index of the move.
        int violations; ///< Hard violations of the accepted schedule.
        double softCost; ///< Soft cost of the accepted schedule.
    };
    std::vector<TraceEntry> trace;
};

/**
 * @brief Outcome of a timetable solve.
 *
 * Either `solution` holds a complete, violation-free timetable, or `failure`
 * explains why none was produced.
 */
struct SolveResult {
    std::optional<TimetableSolution> solution; ///< Schedule on success.
    Infeasibility failure; ///< Diagnostic on failure.
    SolverStats stats; ///< Search counters.

    bool feasible() const { return solution.has_value(); }
};

/**
 * @brief Outcome of an exam scheduling run.
 */
struct ExamResult {
    std::optional<ExamSchedule> schedule; ///< Schedule on success.
    Infeasibility failure; ///< Diagnostic on failure.
    SolverStats stats; ///< Search counters.

    bool feasible() const { return schedule.has_value(); }
};


///////////////////////////
///       BUDGET        ///
///////////////////////////
/**
 * @brief Cooperative cancellation: a wall-clock deadline plus an optional stop flag.
 *
 * Checked between search steps; never blocks.
 */
class SearchBudget {
public:
    /**
     * @param timeBudget Allowed wall-clock time, starting now.
     * @param stopFlag   External stop flag (may be null).
     */
    SearchBudget(std::chrono::milliseconds timeBudget, const std::atomic<bool>* stopFlag = nullptr);

    /**
     * @brief Derive a budget sharing the parent's deadline and stop flag.
     *
     * @param cancelFlag Additional flag that cancels only the derived budget.
     */
    SearchBudget(const SearchBudget& parent, const std::atomic<bool>* cancelFlag);

    /// True once the deadline passed or a stop/cancel flag was raised.
    bool exhausted() const;

    /// Milliseconds elapsed since construction.
    double elapsedMs() const;

private:
    std::chrono::steady_clock::time_point start_; ///< Construction time.
    std::chrono::steady_clock::time_point deadline_; ///< Start plus time budget.
    const std::atomic<bool>* stopFlags_[2]; ///< Optional stop and cancel flags.
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for timetable solvers.
 *
 * Implementations may be sequential, multithreaded, GPU-accelerated,
 * or distributed via MPI, but all expose the same solve() contract.
 */
class ISolver {
public:
    virtual ~ISolver() = default;

    /**
     * @brief Solve the given problem instance and return a timetable.
     *
     * Implementations either return a complete TimetableSolution with zero
     * hard violations, or an Infeasibility explaining why none was found
     * within their budget.
     *
     * @throws ModelError if the instance or configuration is malformed.
     */
    virtual SolveResult solve(const ProblemInstance& inst, const SolverConfig& config) = 0;
};
