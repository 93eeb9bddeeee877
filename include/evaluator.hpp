#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "clash_graph.hpp"
#include "solver_base.hpp"
#include <algorithm>
#include <functional>
#include <string>
#include <vector>


///////////////////////////
///     VIOLATIONS      ///
///////////////////////////
/**
 * @brief Every constraint the evaluator knows about, hard kinds first.
 */
enum class ConstraintKind {
    // Timetable hard constraints.
    ROOM_CAPACITY,
    ROOM_CAPABILITY,
    ROOM_DOUBLE_BOOKED,
    FACULTY_DOUBLE_BOOKED,
    FACULTY_OVERLOAD,
    FACULTY_UNQUALIFIED,
    STUDENT_CLASH,
    ELECTIVE_CLASH,
    AVAILABILITY,
    FACULTY_DAILY_LIMIT,
    // Exam hard constraints.
    STUDENT_DAILY_LIMIT,
    SLOT_STUDENT_CAP,
    SEAT_CAPACITY,
    SEAT_COUNT,
    DOUBLE_SEATED,
    BENCH_ADJACENCY,
    INVIGILATOR_SHORTAGE,
    SELF_INVIGILATION,
    TEACHING_CONFLICT,
    // Soft terms.
    STUDENT_GAPS,
    FACULTY_GAPS,
    FACULTY_IMBALANCE,
    MISSING_SELF_STUDY,
    MISSING_BREAK,
    COURSE_SPACING,
    FACULTY_PREFERENCE,
    EXAM_SAME_DAY,
    INVIGILATION_IMBALANCE
};

/// Stable kebab-case name of a constraint kind (e.g. "room-capacity").
std::string constraintKindName(ConstraintKind kind);

/**
 * @brief One broken hard constraint.
 *
 * Fields that do not apply to the kind stay at -1.
 */
struct HardViolation {
    ConstraintKind kind; ///< Broken constraint.
    std::vector<int> activityIds; ///< Sections or exams involved, sorted.
    int roomId = -1; ///< Room involved.
    int facultyId = -1; ///< Faculty member involved.
    int studentId = -1; ///< Student involved.
    int day = -1; ///< Day of the conflict.
    int period = -1; ///< First period of the conflict.

    /// One-line human-readable description.
    std::string describe() const;
};

bool operator<(const HardViolation& a, const HardViolation& b);
bool operator==(const HardViolation& a, const HardViolation& b);

/**
 * @brief Contribution of one soft term to the cost.
 */
struct SoftTerm {
    ConstraintKind kind; ///< Soft term.
    double count; ///< Unweighted amount (gaps, variance, days...).
    double weight; ///< Weight applied.
    double cost; ///< count * weight.
};

/**
 * @brief Result of evaluating a schedule.
 */
struct Evaluation {
    std::vector<HardViolation> violations; ///< Canonically sorted hard violations.
    double softCost = 0.0; ///< Sum of weighted soft terms.
    std::vector<SoftTerm> terms; ///< Per-term breakdown.

    bool feasible() const { return violations.empty(); }
};


///////////////////////////
///   CONSTRAINT SET    ///
///////////////////////////
/**
 * @brief Ordered list of constraints evaluated against a context.
 *
 * Built once per configuration and passed explicitly. Hard entries append
 * violations; soft entries return an unweighted amount that is multiplied by
 * the entry weight. Soft entries with zero weight are never registered.
 */
template <typename Context>
class ConstraintSet {
public:
    using HardCheck = std::function<void(const Context&, std::vector<HardViolation>&)>;
    using SoftMeasure = std::function<double(const Context&)>;

    struct Entry {
        ConstraintKind kind; ///< Constraint kind.
        bool hard; ///< Hard check or soft term.
        double weight; ///< Soft weight (1 for hard checks).
        HardCheck check; ///< Set for hard entries.
        SoftMeasure measure; ///< Set for soft entries.
    };

    void addHard(ConstraintKind kind, HardCheck check) {
        entries_.push_back({kind, true, 1.0, std::move(check), nullptr});
    }

    void addSoft(ConstraintKind kind, double weight, SoftMeasure measure) {
        if (weight == 0.0) return;
        entries_.push_back({kind, false, weight, nullptr, std::move(measure)});
    }

    /**
     * @brief Run every entry in registration order.
     */
    Evaluation evaluate(const Context& ctx) const {
        Evaluation ev;
        for (const Entry& e : entries_) {
            if (e.hard) {
                e.check(ctx, ev.violations);
            } else {
                double count = e.measure(ctx);
                double cost = count * e.weight;
                ev.terms.push_back({e.kind, count, e.weight, cost});
                ev.softCost += cost;
            }
        }
        std::sort(ev.violations.begin(), ev.violations.end());
        ev.violations.erase(std::unique(ev.violations.begin(), ev.violations.end()), ev.violations.end());
        return ev;
    }

    const std::vector<Entry>& entries() const { return entries_; }

private:
    std::vector<Entry> entries_;
};


///////////////////////////
///      TIMETABLE      ///
///////////////////////////
/**
 * @brief Read-only view of a timetable with occupancy indexes precomputed.
 */
struct TimetableContext {
    const ProblemInstance& inst;
    const ClashGraph& clashes;
    const std::vector<Assignment>& assignments;
    int selfStudyPeriods;

    std::vector<std::vector<int>> slotSections; ///< Flat slot -> assigned sections covering it.
    std::vector<int> facultyLoad; ///< Assigned periods per faculty member.
    std::vector<std::vector<int>> studentSections; ///< Student -> assigned sections.

    TimetableContext(const ProblemInstance& inst, const ClashGraph& clashes,
                     const std::vector<Assignment>& assignments, int selfStudyPeriods);

    /// True if the assignment references existing entities and fits one day of the grid.
    bool wellFormed(const Assignment& a) const;
};

/**
 * @brief Hard-constraint checker and soft-cost function for timetables.
 */
class ConstraintEvaluator {
public:
    explicit ConstraintEvaluator(const SolverConfig& config);

    /**
     * @brief Evaluate a (possibly partial) timetable. Unassigned sections are skipped.
     */
    Evaluation evaluate(const ProblemInstance& inst, const ClashGraph& clashes,
                        const std::vector<Assignment>& assignments) const;

    const ConstraintSet<TimetableContext>& constraints() const { return set_; }

private:
    int selfStudyPeriods_;
    ConstraintSet<TimetableContext> set_;
};

/**
 * @brief Convenience wrapper building the clash graph and evaluator on the fly.
 */
Evaluation evaluate(const TimetableSolution& schedule, const ProblemInstance& inst, const SolverConfig& config);


///////////////////////////
///        EXAMS        ///
///////////////////////////
/**
 * @brief Read-only view of an exam schedule with its committed timetable.
 */
struct ExamContext {
    const ProblemInstance& inst;
    const ExamProblem& problem;
    const ClashGraph& clashes;
    const ExamSchedule& schedule;
    const TimetableSolution* committed; ///< Committed teaching, or nullptr.
    const ExamConfig& config;

    std::vector<char> examOnlySlot; ///< Flat slot -> teaching suspended.
    std::vector<int> invigilationLoad; ///< Invigilated periods per faculty member.

    ExamContext(const ProblemInstance& inst, const ExamProblem& problem, const ClashGraph& clashes,
                const ExamSchedule& schedule, const TimetableSolution* committed, const ExamConfig& config);

    /// True if the placement references existing rooms and fits one day of the grid.
    bool wellFormed(const ExamPlacement& p) const;
};

/**
 * @brief Hard-constraint checker and soft-cost function for exam schedules.
 */
class ExamEvaluator {
public:
    explicit ExamEvaluator(const ExamConfig& config);

    Evaluation evaluate(const ProblemInstance& inst, const ExamProblem& problem, const ClashGraph& clashes,
                        const ExamSchedule& schedule, const TimetableSolution* committed) const;

private:
    ExamConfig config_;
    ConstraintSet<ExamContext> set_;
};

/**
 * @brief Convenience wrapper building the exam clash graph and evaluator on the fly.
 */
Evaluation evaluateExams(const ExamSchedule& schedule, const ProblemInstance& inst, const ExamProblem& problem,
                         const TimetableSolution* committed, const ExamConfig& config);

/**
 * @brief Instructors of a course: declared ones plus faculty teaching one of
 * its sections in the committed timetable. Sorted, unique.
 */
std::vector<int> courseInstructors(const ProblemInstance& inst, int courseId, const TimetableSolution* committed);

/**
 * @brief Invigilators a room needs for a given number of seated students.
 */
int requiredInvigilators(const ExamConfig& config, int seated);

/**
 * @brief Population variance of a list of loads (0 for an empty list).
 */
double loadVariance(const std::vector<int>& loads);
