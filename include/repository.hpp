#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "solver_base.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief One committed planning cycle. Immutable once stored.
 */
struct CommittedCycle {
    long id; ///< Cycle id, increasing with every commit.
    ProblemInstance instance; ///< Snapshot of the model the schedule was built for.
    TimetableSolution timetable; ///< Teaching timetable.
    std::optional<ExamProblem> examProblem; ///< Exams of the cycle, if scheduled.
    std::optional<ExamSchedule> exams; ///< Exam schedule, if any.
};

/**
 * @brief Changes between two timetables, keyed by section id.
 */
struct AssignmentDiff {
    std::vector<Assignment> added; ///< Assigned only in the later timetable.
    std::vector<Assignment> removed; ///< Assigned only in the earlier timetable.
    std::vector<std::pair<Assignment, Assignment>> moved; ///< (before, after) with a different slot, room or faculty.

    bool empty() const { return added.empty() && removed.empty() && moved.empty(); }
};

/**
 * @brief Changes between two exam schedules, keyed by exam id.
 */
struct ExamDiff {
    std::vector<ExamPlacement> added; ///< Placed only in the later schedule.
    std::vector<ExamPlacement> removed; ///< Placed only in the earlier schedule.
    std::vector<std::pair<ExamPlacement, ExamPlacement>> moved; ///< (before, after) with a different time or rooms.

    bool empty() const { return added.empty() && removed.empty() && moved.empty(); }
};

/**
 * @brief Differences between two committed cycles.
 */
struct CycleDiff {
    AssignmentDiff timetable; ///< Teaching changes.
    ExamDiff exams; ///< Exam changes (a missing schedule counts as empty).
};


///////////////////////////
///     REPOSITORY      ///
///////////////////////////
/**
 * @brief Store of committed schedules with read-only queries.
 *
 * Commits are serialized by a mutex and receive increasing cycle ids. Stored
 * cycles are shared immutably, so queries only hold the lock while looking
 * the cycle up.
 */
class ScheduleRepository {
public:
    /**
     * @brief Commit a teaching timetable.
     *
     * @return The new cycle id.
     * @throws ModelError if the instance is malformed.
     * @throws std::invalid_argument if the timetable is incomplete or breaks a hard constraint.
     */
    long commit(const ProblemInstance& inst, const TimetableSolution& timetable);

    /**
     * @brief Commit a teaching timetable together with its exam schedule.
     *
     * @throws std::invalid_argument if either schedule is incomplete or breaks a hard constraint.
     */
    long commit(const ProblemInstance& inst, const TimetableSolution& timetable, const ExamProblem& problem,
                const ExamSchedule& exams, const ExamConfig& config);

    /**
     * @brief A stored cycle.
     *
     * @throws std::out_of_range for an unknown id.
     */
    std::shared_ptr<const CommittedCycle> cycle(long id) const;

    /// Id of the most recent commit, or -1 if nothing was committed.
    long latestCycle() const;

    /// Ids of all stored cycles, ascending.
    std::vector<long> cycleIds() const;

    std::vector<Assignment> assignmentsForFaculty(long cycleId, int facultyId) const;
    std::vector<Assignment> assignmentsForRoom(long cycleId, int roomId) const;
    std::vector<Assignment> assignmentsForStudent(long cycleId, int studentId) const;
    std::vector<Assignment> assignmentsForDay(long cycleId, int day) const;

    /// Exam seats of a student, in exam order. Empty if the cycle has no exams.
    std::vector<SeatAssignment> seatsForStudent(long cycleId, int studentId) const;

    /// Invigilation duties of a faculty member. Empty if the cycle has no exams.
    std::vector<InvigilatorAssignment> dutiesForFaculty(long cycleId, int facultyId) const;

    /**
     * @brief Differences from cycle `before` to cycle `after`.
     *
     * @throws std::out_of_range for an unknown id.
     */
    CycleDiff diffCycles(long before, long after) const;

private:
    mutable std::mutex mutex_;
    std::map<long, std::shared_ptr<const CommittedCycle>> cycles_;
    long nextId_ = 1;

    long store(std::shared_ptr<CommittedCycle> cycle);
};

/**
 * @brief Added, removed and moved assignments from `before` to `after`.
 */
AssignmentDiff diff(const TimetableSolution& before, const TimetableSolution& after);

/**
 * @brief Added, removed and moved exam placements from `before` to `after`.
 */
ExamDiff diffExams(const ExamSchedule& before, const ExamSchedule& after);
