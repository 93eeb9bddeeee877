///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "repository.hpp"
#include "evaluator.hpp"
#include "validation.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Keyed comparison of two id-indexed lists.
 *
 * `present` tells whether an entry is set; entries are compared with operator==.
 */
template <typename T, typename Present>
static void diffIndexed(const std::vector<T>& before, const std::vector<T>& after, Present present,
                        std::vector<T>& added, std::vector<T>& removed, std::vector<std::pair<T, T>>& moved) {
    size_t n = std::max(before.size(), after.size());
    for (size_t i = 0; i < n; ++i) {
        bool inBefore = i < before.size() && present(before[i]);
        bool inAfter = i < after.size() && present(after[i]);
        if (inBefore && inAfter) {
            if (!(before[i] == after[i])) moved.push_back({before[i], after[i]});
        } else if (inAfter) {
            added.push_back(after[i]);
        } else if (inBefore) {
            removed.push_back(before[i]);
        }
    }
}

static std::string firstViolation(const Evaluation& ev) {
    return ev.violations.front().describe();
}


///////////////////////////
///        DIFFS        ///
///////////////////////////
AssignmentDiff diff(const TimetableSolution& before, const TimetableSolution& after) {
    AssignmentDiff d;
    diffIndexed(before.assignments, after.assignments, [](const Assignment& a) { return a.assigned(); },
                d.added, d.removed, d.moved);
    return d;
}

ExamDiff diffExams(const ExamSchedule& before, const ExamSchedule& after) {
    ExamDiff d;
    diffIndexed(before.placements, after.placements, [](const ExamPlacement& p) { return p.placed(); },
                d.added, d.removed, d.moved);
    return d;
}


///////////////////////////
///     REPOSITORY      ///
///////////////////////////
long ScheduleRepository::store(std::shared_ptr<CommittedCycle> cycle) {
    std::lock_guard<std::mutex> lock(mutex_);
    cycle->id = nextId_++;
    long id = cycle->id;
    cycles_[id] = std::move(cycle);
    return id;
}

long ScheduleRepository::commit(const ProblemInstance& inst, const TimetableSolution& timetable) {
    validateInstance(inst);
    if (timetable.assignments.size() != inst.sections.size() || !timetable.complete())
        throw std::invalid_argument("cannot commit an incomplete timetable");

    // Hard constraints do not depend on the soft weights.
    Evaluation ev = evaluate(timetable, inst, SolverConfig());
    if (!ev.feasible()) throw std::invalid_argument("cannot commit a violating timetable: " + firstViolation(ev));

    auto cycle = std::make_shared<CommittedCycle>();
    cycle->instance = inst;
    cycle->timetable = timetable;
    return store(std::move(cycle));
}

long ScheduleRepository::commit(const ProblemInstance& inst, const TimetableSolution& timetable,
                                const ExamProblem& problem, const ExamSchedule& exams, const ExamConfig& config) {
    validateInstance(inst);
    validateExamProblem(inst, problem, &timetable);
    if (timetable.assignments.size() != inst.sections.size() || !timetable.complete())
        throw std::invalid_argument("cannot commit an incomplete timetable");
    if (exams.placements.size() != problem.exams.size() || !exams.complete())
        throw std::invalid_argument("cannot commit an incomplete exam schedule");

    Evaluation ev = evaluate(timetable, inst, SolverConfig());
    if (!ev.feasible()) throw std::invalid_argument("cannot commit a violating timetable: " + firstViolation(ev));
    Evaluation examEv = evaluateExams(exams, inst, problem, &timetable, config);
    if (!examEv.feasible())
        throw std::invalid_argument("cannot commit a violating exam schedule: " + firstViolation(examEv));

    auto cycle = std::make_shared<CommittedCycle>();
    cycle->instance = inst;
    cycle->timetable = timetable;
    cycle->examProblem = problem;
    cycle->exams = exams;
    return store(std::move(cycle));
}

std::shared_ptr<const CommittedCycle> ScheduleRepository::cycle(long id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cycles_.find(id);
    if (it == cycles_.end()) throw std::out_of_range("unknown cycle " + std::to_string(id));
    return it->second;
}

long ScheduleRepository::latestCycle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cycles_.empty() ? -1 : cycles_.rbegin()->first;
}

std::vector<long> ScheduleRepository::cycleIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<long> ids;
    for (const auto& entry : cycles_) ids.push_back(entry.first);
    return ids;
}

std::vector<Assignment> ScheduleRepository::assignmentsForFaculty(long cycleId, int facultyId) const {
    std::shared_ptr<const CommittedCycle> c = cycle(cycleId);
    std::vector<Assignment> result;
    for (const Assignment& a : c->timetable.assignments) {
        if (a.assigned() && a.facultyId == facultyId) result.push_back(a);
    }
    return result;
}

std::vector<Assignment> ScheduleRepository::assignmentsForRoom(long cycleId, int roomId) const {
    std::shared_ptr<const CommittedCycle> c = cycle(cycleId);
    std::vector<Assignment> result;
    for (const Assignment& a : c->timetable.assignments) {
        if (a.assigned() && a.roomId == roomId) result.push_back(a);
    }
    return result;
}

std::vector<Assignment> ScheduleRepository::assignmentsForStudent(long cycleId, int studentId) const {
    std::shared_ptr<const CommittedCycle> c = cycle(cycleId);
    std::vector<Assignment> result;
    if (studentId < 0 || studentId >= (int)c->instance.students.size()) return result;

    std::vector<int> sections = c->instance.students[studentId].sectionIds;
    std::sort(sections.begin(), sections.end());
    for (int sid : sections) {
        const Assignment& a = c->timetable.assignments[sid];
        if (a.assigned()) result.push_back(a);
    }
    return result;
}

std::vector<Assignment> ScheduleRepository::assignmentsForDay(long cycleId, int day) const {
    std::shared_ptr<const CommittedCycle> c = cycle(cycleId);
    std::vector<Assignment> result;
    for (const Assignment& a : c->timetable.assignments) {
        if (a.assigned() && a.day == day) result.push_back(a);
    }
    std::stable_sort(result.begin(), result.end(), [](const Assignment& a, const Assignment& b) {
        return a.startPeriod < b.startPeriod;
    });
    return result;
}

std::vector<SeatAssignment> ScheduleRepository::seatsForStudent(long cycleId, int studentId) const {
    std::shared_ptr<const CommittedCycle> c = cycle(cycleId);
    std::vector<SeatAssignment> result;
    if (!c->exams) return result;
    for (const SeatAssignment& s : c->exams->seats) {
        if (s.studentId == studentId) result.push_back(s);
    }
    std::stable_sort(result.begin(), result.end(), [](const SeatAssignment& a, const SeatAssignment& b) {
        return a.examId < b.examId;
    });
    return result;
}

std::vector<InvigilatorAssignment> ScheduleRepository::dutiesForFaculty(long cycleId, int facultyId) const {
    std::shared_ptr<const CommittedCycle> c = cycle(cycleId);
    std::vector<InvigilatorAssignment> result;
    if (!c->exams) return result;
    for (const InvigilatorAssignment& d : c->exams->invigilators) {
        if (d.facultyId == facultyId) result.push_back(d);
    }
    return result;
}

CycleDiff ScheduleRepository::diffCycles(long before, long after) const {
    std::shared_ptr<const CommittedCycle> a = cycle(before);
    std::shared_ptr<const CommittedCycle> b = cycle(after);

    CycleDiff d;
    d.timetable = diff(a->timetable, b->timetable);
    ExamSchedule none;
    d.exams = diffExams(a->exams ? *a->exams : none, b->exams ? *b->exams : none);
    return d;
}
