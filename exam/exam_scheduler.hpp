#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "clash_graph.hpp"
#include "constraints.hpp"
#include "solver_base.hpp"
#include "seating.hpp"
#include <atomic>
#include <cstdint>
#include <random>
#include <vector>


///////////////////////////
///     CANDIDATES      ///
///////////////////////////
/**
 * @brief One way to sit an exam: a start slot and a set of rooms.
 *
 * `invigilators` is filled when the candidate is found live, one list per room.
 */
struct ExamCandidate {
    int day; ///< Day index.
    int startPeriod; ///< First period of the sitting.
    std::vector<int> roomIds; ///< Rooms, in seating order.
    std::vector<int> seatCounts; ///< Students seated per room.
    int benches = 0; ///< Total benches offered by the rooms.
    std::vector<std::vector<int>> invigilators; ///< Invigilators per room.
};


///////////////////////////
///    EXAM PLACEMENT   ///
///////////////////////////
/**
 * @brief Adapter exposing exam placement to BacktrackingSearch.
 *
 * Holds the occupancy of rooms and invigilators, per-student daily exam
 * counts and per-slot seated totals for the exams placed so far.
 */
class ExamSearchProblem {
public:
    using Candidate = ExamCandidate;

    /**
     * @brief Precompute static candidates and block committed teaching.
     *
     * Inputs must have passed validation and must outlive the problem.
     */
    ExamSearchProblem(const ProblemInstance& inst, const ExamProblem& problem, const TimetableSolution* committed,
                      const ExamConfig& config);

    int activityCount() const { return (int)order_.size(); }
    int activityAt(int depth) const { return order_[depth]; }

    void openFrame(int) {}
    void closeFrame(int) {}

    /**
     * @brief Static candidates still free and staffable, fewest same-day exams first.
     *
     * Ties prefer fewer benches, then a seeded random key, then (day, start).
     */
    std::vector<ExamCandidate> liveCandidates(int examId);

    void place(int examId, const ExamCandidate& c);
    void unplace(int examId, const ExamCandidate& c);

    /**
     * @brief Placed exams that may block a static candidate of an exam.
     *
     * When a candidate could not be staffed every placed exam is blamed.
     */
    void culprits(int examId, std::vector<int>& out) const;

    /// Exam without any static candidate, diagnosed; kind NONE if every exam has one.
    Infeasibility staticInfeasibility() const;

    /// Static candidates of an exam, before occupancy is considered.
    const std::vector<ExamCandidate>& staticCandidates(int examId) const { return static_[examId]; }

    /// Placements indexed by exam id.
    const std::vector<ExamPlacement>& placements() const { return placements_; }

    /// Duties of one placed exam.
    const std::vector<InvigilatorAssignment>& duties(int examId) const { return duties_[examId]; }

    /// True if a candidate of the exam was last refused for lack of invigilators.
    bool staffingFailed(int examId) const { return staffingFailed_[examId] != 0; }

    /// Faculty that may invigilate (the pool, or everyone).
    const std::vector<int>& pool() const { return pool_; }

    const ClashGraph& clashes() const { return clashes_; }

private:
    const ProblemInstance& inst_;
    const ExamProblem& problem_;
    const ExamConfig& config_;
    ClashGraph clashes_;
    ScheduleState state_;
    SeatingPlanner planner_;
    std::mt19937_64 rng_;

    std::vector<SeatingNeed> needs_; ///< Bench requirement per exam.
    std::vector<std::vector<ExamCandidate>> static_; ///< Static candidates per exam.
    std::vector<int> order_; ///< Most-constrained-first processing order.
    std::vector<int> pool_; ///< Eligible invigilators, by id.
    std::vector<std::vector<int>> instructors_; ///< Course instructors per exam.
    std::vector<std::vector<char>> facultyAway_; ///< facultyAway_[f][slot]: declared unavailable.

    std::vector<ExamPlacement> placements_; ///< Placed exams.
    std::vector<std::vector<InvigilatorAssignment>> duties_; ///< Duties per placed exam.
    std::vector<std::vector<int>> studentDay_; ///< Exams per (student, day).
    std::vector<int> slotSeated_; ///< Students sitting exams per flat slot.
    std::vector<char> staffingFailed_; ///< Per exam, see staffingFailed().

    void buildStaticCandidates(int examId);

    /// Occupancy, clash, daily limit and slot cap checks.
    bool slotOpen(int examId, const ExamCandidate& c) const;

    /**
     * @brief Pick invigilators for every room of a candidate.
     *
     * @return false if some room cannot be staffed.
     */
    bool staff(int examId, ExamCandidate& c) const;

    Booking booking(int examId, const ExamCandidate& c) const;
};


///////////////////////////
///      SCHEDULER      ///
///////////////////////////
/**
 * @brief Exam timetabling: slots, rooms, seats and invigilators.
 *
 * Places exams around a committed teaching timetable with the same
 * backtracking policy as the timetable solvers, then seats every student and
 * checks the result with the exam evaluator.
 */
class ExamScheduler {
public:
    /**
     * @brief Schedule every exam of the problem.
     *
     * @param committed Committed teaching timetable blocking rooms and faculty, or nullptr.
     * @throws ModelError if the inputs or configuration are malformed.
     */
    ExamResult schedule(const ProblemInstance& inst, const ExamProblem& problem, const TimetableSolution* committed,
                        const ExamConfig& config);

    /// Ask a running schedule() to stop at its next step. Safe from any thread.
    void stop() { stop_ = true; }

private:
    /// Raised by stop().
    std::atomic<bool> stop_{false};
};
