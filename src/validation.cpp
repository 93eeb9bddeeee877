///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "validation.hpp"
#include <set>
#include <string>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static void fail(const std::string& what) {
    throw ModelError(what);
}

/**
 * @brief Entity k must carry id k.
 */
template <typename T>
static void requireDenseIds(const std::vector<T>& entities, const std::string& kind) {
    for (size_t i = 0; i < entities.size(); ++i) {
        if (entities[i].id != (int)i)
            fail(kind + " at index " + std::to_string(i) + " has id " + std::to_string(entities[i].id) +
                 " (ids must be dense)");
    }
}

static void requireSlots(const TimeGrid& grid, const std::vector<int>& slots, const std::string& owner) {
    for (int slot : slots) {
        if (slot < 0 || slot >= grid.slotCount())
            fail(owner + " references slot " + std::to_string(slot) + " outside the grid");
    }
}


///////////////////////////
///     VALIDATION      ///
///////////////////////////
void validateInstance(const ProblemInstance& inst) {
    const TimeGrid& grid = inst.grid;
    if (grid.days <= 0 || grid.periodsPerDay <= 0) fail("time grid is empty");
    for (int p : grid.breakPeriods) {
        if (p < 0 || p >= grid.periodsPerDay) fail("break period " + std::to_string(p) + " outside the day");
    }

    requireDenseIds(inst.rooms, "room");
    requireDenseIds(inst.faculty, "faculty");
    requireDenseIds(inst.courses, "course");
    requireDenseIds(inst.sections, "section");
    requireDenseIds(inst.students, "student");

    for (const Room& r : inst.rooms) {
        if (r.capacity <= 0) fail("room " + r.name + " has non-positive capacity");
        requireSlots(grid, r.unavailableSlots, "room " + r.name);
    }

    int numCourses = (int)inst.courses.size();
    for (const Faculty& f : inst.faculty) {
        if (f.maxLoad < 0) fail("faculty " + f.name + " has negative max load");
        requireSlots(grid, f.unavailableSlots, "faculty " + f.name);
        requireSlots(grid, f.preferredSlots, "faculty " + f.name);
        for (int c : f.qualifiedCourses) {
            if (c < 0 || c >= numCourses)
                fail("faculty " + f.name + " is qualified for unknown course " + std::to_string(c));
        }
    }

    int numFaculty = (int)inst.faculty.size();
    for (const Course& c : inst.courses) {
        for (int f : c.instructorIds) {
            if (f < 0 || f >= numFaculty)
                fail("course " + c.code + " names unknown instructor " + std::to_string(f));
        }
    }

    for (const Section& s : inst.sections) {
        if (s.courseId < 0 || s.courseId >= numCourses)
            fail("section " + s.name + " references unknown course " + std::to_string(s.courseId));
        if (s.duration <= 0) fail("section " + s.name + " has non-positive duration");
        if (s.duration > grid.periodsPerDay) fail("section " + s.name + " is longer than a day");
        if (s.enrolled < 0) fail("section " + s.name + " has a negative enrollment count");
        for (int f : s.qualifiedFaculty) {
            if (f < 0 || f >= numFaculty)
                fail("section " + s.name + " names unknown faculty " + std::to_string(f));
        }
    }

    // Students listed per section may not exceed the declared count.
    std::vector<int> listed(inst.sections.size(), 0);
    int numSections = (int)inst.sections.size();
    for (const Student& st : inst.students) {
        std::set<int> seen;
        for (int sid : st.sectionIds) {
            if (sid < 0 || sid >= numSections)
                fail("student " + st.name + " is enrolled in unknown section " + std::to_string(sid));
            if (!seen.insert(sid).second)
                fail("student " + st.name + " is enrolled twice in section " + inst.sections[sid].name);
            ++listed[sid];
        }
    }
    for (const Section& s : inst.sections) {
        if (listed[s.id] > s.enrolled)
            fail("section " + s.name + " lists " + std::to_string(listed[s.id]) + " students but enrolled is " +
                 std::to_string(s.enrolled));
    }
}

void validateExamProblem(const ProblemInstance& inst, const ExamProblem& problem,
                         const TimetableSolution* committed) {
    requireDenseIds(problem.exams, "exam");
    int numStudents = (int)inst.students.size();
    for (const Exam& e : problem.exams) {
        if (e.courseId < 0 || e.courseId >= (int)inst.courses.size())
            fail("exam " + e.name + " references unknown course " + std::to_string(e.courseId));
        if (e.duration <= 0) fail("exam " + e.name + " has non-positive duration");
        if (e.duration > inst.grid.periodsPerDay) fail("exam " + e.name + " is longer than a day");
        if (e.seatsPerBench != 1 && e.seatsPerBench != 2)
            fail("exam " + e.name + " must seat 1 or 2 students per bench");
        std::set<int> seen;
        for (int st : e.studentIds) {
            if (st < 0 || st >= numStudents)
                fail("exam " + e.name + " lists unknown student " + std::to_string(st));
            if (!seen.insert(st).second)
                fail("exam " + e.name + " lists student " + inst.students[st].name + " twice");
        }
    }
    for (int f : problem.invigilatorPool) {
        if (f < 0 || f >= (int)inst.faculty.size())
            fail("invigilator pool names unknown faculty " + std::to_string(f));
    }
    requireSlots(inst.grid, problem.examOnlySlots, "exam-only slot list");

    if (committed && committed->assignments.size() != inst.sections.size())
        fail("committed timetable has " + std::to_string(committed->assignments.size()) +
             " assignments for " + std::to_string(inst.sections.size()) + " sections");
    if (!committed) return;
    for (size_t i = 0; i < committed->assignments.size(); ++i) {
        const Assignment& a = committed->assignments[i];
        if (!a.assigned()) continue;
        if (a.sectionId != (int)i)
            fail("committed assignment at index " + std::to_string(i) + " is for section " +
                 std::to_string(a.sectionId));
        const Section& s = inst.sections[i];
        if (a.roomId < 0 || a.roomId >= (int)inst.rooms.size() || a.facultyId < 0 ||
            a.facultyId >= (int)inst.faculty.size())
            fail("committed assignment of section " + s.name + " references an unknown room or faculty");
        if (a.day < 0 || a.day >= inst.grid.days || a.startPeriod < 0 ||
            a.startPeriod + s.duration > inst.grid.periodsPerDay)
            fail("committed assignment of section " + s.name + " lies outside the grid");
    }
}

void validateConfig(const SolverConfig& config) {
    const SoftWeights& w = config.weights;
    if (w.gapPenalty < 0 || w.imbalancePenalty < 0 || w.selfStudyBonus < 0 || w.breakBonus < 0 ||
        w.spacingPenalty < 0 || w.preferencePenalty < 0)
        fail("soft weights must be non-negative");
    if (config.selfStudyPeriods <= 0) fail("selfStudyPeriods must be positive");
    if (config.maxFacultyDailySections < 0) fail("maxFacultyDailySections must be non-negative");
    if (config.backtrackBudget <= 0) fail("backtrackBudget must be positive");
    if (config.retryBudget < 0) fail("retryBudget must be non-negative");
    if (config.timeBudget.count() <= 0) fail("timeBudget must be positive");
    if (config.moveBudget < 0) fail("moveBudget must be non-negative");
    if (config.acceptWorseProbability < 0.0 || config.acceptWorseProbability > 1.0)
        fail("acceptWorseProbability must lie in [0, 1]");
    if (config.numThreads <= 0) fail("numThreads must be positive");
    if (config.batchSize <= 0) fail("batchSize must be positive");
}

void validateConfig(const ExamConfig& config) {
    if (config.sameDayPenalty < 0 || config.imbalancePenalty < 0) fail("exam weights must be non-negative");
    if (config.minInvigilatorsPerRoom < 0) fail("minInvigilatorsPerRoom must be non-negative");
    if (config.studentsPerInvigilator < 0) fail("studentsPerInvigilator must be non-negative");
    if (config.maxExamsPerStudentPerDay < 0) fail("maxExamsPerStudentPerDay must be non-negative");
    if (config.maxStudentsPerSlot < 0) fail("maxStudentsPerSlot must be non-negative");
    if (config.backtrackBudget <= 0) fail("backtrackBudget must be positive");
    if (config.retryBudget < 0) fail("retryBudget must be non-negative");
    if (config.timeBudget.count() <= 0) fail("timeBudget must be positive");
}
