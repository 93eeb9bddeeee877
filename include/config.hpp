#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <chrono>
#include <cstdint>


///////////////////////////
///    CONFIGURATION    ///
///////////////////////////
/**
 * @brief Weights of the soft-cost terms. Zero disables a term.
 */
struct SoftWeights {
    double gapPenalty = 1.0; ///< Idle periods inside a student's or faculty's day.
    double imbalancePenalty = 0.5; ///< Variance of assigned slots across faculty.
    double selfStudyBonus = 1.0; ///< Student-days without a free self-study run.
    double breakBonus = 0.5; ///< Class blocks immediately followed by another class.
    double spacingPenalty = 1.0; ///< Sections of one course sharing students on the same day.
    double preferencePenalty = 0.5; ///< Periods taught outside the faculty member's preferred slots.
};

/**
 * @brief Configuration of one timetable solver run.
 *
 * Passed explicitly to every solver; nothing here is global.
 */
struct SolverConfig {
    SoftWeights weights; ///< Soft-cost weights.
    int selfStudyPeriods = 2; ///< Length of the free run that counts as self-study.
    int maxFacultyDailySections = 0; ///< Sections one faculty member teaches per day (0 = unlimited).

    long backtrackBudget = 200000; ///< Maximum dead ends in the constructive phase.
    long retryBudget = 2000; ///< Conflict-directed jumps before chronological backtracking.
    std::chrono::milliseconds timeBudget{10000}; ///< Wall-clock budget for the whole run.

    long moveBudget = 2000; ///< Refinement moves (0 disables refinement).
    double acceptWorseProbability = 0.05; ///< Chance to accept an equal or worse move.

    std::uint64_t seed = 42; ///< Tie-break seed.
    int numThreads = 4; ///< Worker threads (threaded solver only).
    int batchSize = 32; ///< Candidate schedules per device batch (OpenCL solver only).
    bool recordTrace = false; ///< Keep accepted refinement moves in the statistics.
    bool verbose = false; ///< Print progress to std::cerr.
};

/**
 * @brief Who wins when the instructor exclusion and the invigilator minimum collide.
 */
enum class ExclusionPrecedence {
    EXCLUSION_FIRST, ///< Never use an instructor; fail the candidate instead.
    MINIMUM_FIRST ///< Use an instructor only when nobody else can cover the room.
};

/**
 * @brief Configuration of one exam scheduler run.
 */
struct ExamConfig {
    double sameDayPenalty = 1.0; ///< Per student with two exams on one day.
    double imbalancePenalty = 0.5; ///< Variance of invigilation slots across the pool.

    bool antiCheatAdjacency = true; ///< No two students of one section on the same bench.
    int minInvigilatorsPerRoom = 1; ///< Minimum invigilators in every exam room.
    int studentsPerInvigilator = 0; ///< One extra invigilator per N students (0 = off).
    bool allowInstructorInvigilation = false; ///< Let instructors invigilate their own course.
    ExclusionPrecedence precedence = ExclusionPrecedence::EXCLUSION_FIRST; ///< See ExclusionPrecedence.

    int maxExamsPerStudentPerDay = 2; ///< Daily exam limit per student (0 = unlimited).
    int maxStudentsPerSlot = 0; ///< Students sitting exams in one slot (0 = unlimited).

    long backtrackBudget = 100000; ///< Maximum dead ends during placement.
    long retryBudget = 1000; ///< Conflict-directed jumps before chronological backtracking.
    std::chrono::milliseconds timeBudget{10000}; ///< Wall-clock budget.

    std::uint64_t seed = 42; ///< Tie-break seed.
    bool verbose = false; ///< Print progress to std::cerr.
};
