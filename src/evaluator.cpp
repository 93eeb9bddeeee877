///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "evaluator.hpp"
#include <map>
#include <set>
#include <sstream>
#include <tuple>


///////////////////////////
///     VIOLATIONS      ///
///////////////////////////
std::string constraintKindName(ConstraintKind kind) {
    switch (kind) {
        case ConstraintKind::ROOM_CAPACITY:          return "room-capacity";
        case ConstraintKind::ROOM_CAPABILITY:        return "room-capability";
        case ConstraintKind::ROOM_DOUBLE_BOOKED:     return "room-double-booked";
        case ConstraintKind::FACULTY_DOUBLE_BOOKED:  return "faculty-double-booked";
        case ConstraintKind::FACULTY_OVERLOAD:       return "faculty-load";
        case ConstraintKind::FACULTY_UNQUALIFIED:    return "faculty-qualification";
        case ConstraintKind::STUDENT_CLASH:          return "student-clash";
        case ConstraintKind::ELECTIVE_CLASH:         return "elective-clash";
        case ConstraintKind::AVAILABILITY:           return "availability";
        case ConstraintKind::FACULTY_DAILY_LIMIT:    return "faculty-daily-limit";
        case ConstraintKind::STUDENT_DAILY_LIMIT:    return "student-daily-limit";
        case ConstraintKind::SLOT_STUDENT_CAP:       return "slot-student-cap";
        case ConstraintKind::SEAT_CAPACITY:          return "seat-capacity";
        case ConstraintKind::SEAT_COUNT:             return "seat-count";
        case ConstraintKind::DOUBLE_SEATED:          return "double-seated";
        case ConstraintKind::BENCH_ADJACENCY:        return "bench-adjacency";
        case ConstraintKind::INVIGILATOR_SHORTAGE:   return "invigilator-shortage";
        case ConstraintKind::SELF_INVIGILATION:      return "self-invigilation";
        case ConstraintKind::TEACHING_CONFLICT:      return "teaching-conflict";
        case ConstraintKind::STUDENT_GAPS:           return "student-gaps";
        case ConstraintKind::FACULTY_GAPS:           return "faculty-gaps";
        case ConstraintKind::FACULTY_IMBALANCE:      return "faculty-imbalance";
        case ConstraintKind::MISSING_SELF_STUDY:     return "missing-self-study";
        case ConstraintKind::MISSING_BREAK:          return "missing-break";
        case ConstraintKind::COURSE_SPACING:         return "course-spacing";
        case ConstraintKind::FACULTY_PREFERENCE:     return "faculty-preference";
        case ConstraintKind::EXAM_SAME_DAY:          return "exam-same-day";
        case ConstraintKind::INVIGILATION_IMBALANCE: return "invigilation-imbalance";
    }
    return "unknown";
}

std::string HardViolation::describe() const {
    std::ostringstream out;
    out << constraintKindName(kind) << ": activities [";
    for (size_t i = 0; i < activityIds.size(); ++i) {
        if (i) out << ", ";
        out << activityIds[i];
    }
    out << "]";
    if (roomId >= 0) out << " room " << roomId;
    if (facultyId >= 0) out << " faculty " << facultyId;
    if (studentId >= 0) out << " student " << studentId;
    if (day >= 0) out << " day " << day;
    if (period >= 0) out << " period " << period;
    return out.str();
}

bool operator<(const HardViolation& a, const HardViolation& b) {
    return std::tie(a.kind, a.activityIds, a.roomId, a.facultyId, a.studentId, a.day, a.period) <
           std::tie(b.kind, b.activityIds, b.roomId, b.facultyId, b.studentId, b.day, b.period);
}

bool operator==(const HardViolation& a, const HardViolation& b) {
    return std::tie(a.kind, a.activityIds, a.roomId, a.facultyId, a.studentId, a.day, a.period) ==
           std::tie(b.kind, b.activityIds, b.roomId, b.facultyId, b.studentId, b.day, b.period);
}

/**
 * @brief Build a violation with its activity list in canonical order.
 */
static HardViolation makeViolation(ConstraintKind kind, std::vector<int> ids, int day = -1, int period = -1) {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    HardViolation v;
    v.kind = kind;
    v.activityIds = std::move(ids);
    v.day = day;
    v.period = period;
    return v;
}

static bool contains(const std::vector<int>& list, int value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

/**
 * @brief Do two blocks on one day overlap?
 */
static bool overlaps(int dayA, int startA, int durA, int dayB, int startB, int durB) {
    return dayA == dayB && startA < startB + durB && startB < startA + durA;
}

double loadVariance(const std::vector<int>& loads) {
    if (loads.empty()) return 0.0;
    double mean = 0.0;
    for (int l : loads) mean += l;
    mean /= (double)loads.size();
    double var = 0.0;
    for (int l : loads) var += (l - mean) * (l - mean);
    return var / (double)loads.size();
}


///////////////////////////
///      TIMETABLE      ///
///////////////////////////
TimetableContext::TimetableContext(const ProblemInstance& inst, const ClashGraph& clashes,
                                   const std::vector<Assignment>& assignments, int selfStudyPeriods)
        : inst(inst), clashes(clashes), assignments(assignments), selfStudyPeriods(selfStudyPeriods) {
    slotSections.assign(inst.grid.slotCount(), {});
    facultyLoad.assign(inst.faculty.size(), 0);

    // sectionId -> students, to derive each student's assigned sections.
    std::vector<std::vector<int>> studentsOf(inst.sections.size());
    for (const Student& st : inst.students) {
        for (int sid : st.sectionIds) {
            if (sid >= 0 && sid < (int)studentsOf.size()) studentsOf[sid].push_back(st.id);
        }
    }
    studentSections.assign(inst.students.size(), {});

    for (const Assignment& a : assignments) {
        if (!a.assigned() || !wellFormed(a)) continue;
        int duration = inst.sections[a.sectionId].duration;
        int base = inst.grid.slotIndex(a.day, a.startPeriod);
        for (int k = 0; k < duration; ++k) slotSections[base + k].push_back(a.sectionId);
        facultyLoad[a.facultyId] += duration;
        for (int st : studentsOf[a.sectionId]) {
            if (st >= 0 && st < (int)studentSections.size()) studentSections[st].push_back(a.sectionId);
        }
    }
}

bool TimetableContext::wellFormed(const Assignment& a) const {
    if (a.sectionId < 0 || a.sectionId >= (int)inst.sections.size()) return false;
    // Assignments are indexed by section id.
    if (a.sectionId >= (int)assignments.size() || &assignments[a.sectionId] != &a) return false;
    if (a.roomId < 0 || a.roomId >= (int)inst.rooms.size()) return false;
    if (a.facultyId < 0 || a.facultyId >= (int)inst.faculty.size()) return false;
    int duration = inst.sections[a.sectionId].duration;
    return a.day >= 0 && a.day < inst.grid.days && a.startPeriod >= 0 &&
           a.startPeriod + duration <= inst.grid.periodsPerDay;
}

static void checkRoomCapacity(const TimetableContext& ctx, std::vector<HardViolation>& out) {
    for (const Assignment& a : ctx.assignments) {
        if (!a.assigned() || !ctx.wellFormed(a)) continue;
        if (ctx.inst.rooms[a.roomId].capacity < ctx.inst.sections[a.sectionId].enrolled) {
            HardViolation v = makeViolation(ConstraintKind::ROOM_CAPACITY, {a.sectionId}, a.day, a.startPeriod);
            v.roomId = a.roomId;
            out.push_back(v);
        }
    }
}

static void checkRoomCapability(const TimetableContext& ctx, std::vector<HardViolation>& out) {
    for (const Assignment& a : ctx.assignments) {
        if (!a.assigned() || !ctx.wellFormed(a)) continue;
        const Room& room = ctx.inst.rooms[a.roomId];
        if (room.examOnly || !hasAllTags(room.tags, ctx.inst.sections[a.sectionId].requiredTags)) {
            HardViolation v = makeViolation(ConstraintKind::ROOM_CAPABILITY, {a.sectionId}, a.day, a.startPeriod);
            v.roomId = a.roomId;
            out.push_back(v);
        }
    }
}

static void checkQualification(const TimetableContext& ctx, std::vector<HardViolation>& out) {
    for (const Assignment& a : ctx.assignments) {
        if (!a.assigned() || !ctx.wellFormed(a)) continue;
        if (!contains(eligibleFaculty(ctx.inst, ctx.inst.sections[a.sectionId]), a.facultyId)) {
            HardViolation v = makeViolation(ConstraintKind::FACULTY_UNQUALIFIED, {a.sectionId}, a.day, a.startPeriod);
            v.facultyId = a.facultyId;
            out.push_back(v);
        }
    }
}

/**
 * @brief Grid bounds, break periods and room/faculty calendars.
 */
static void checkAvailability(const TimetableContext& ctx, std::vector<HardViolation>& out) {
    const TimeGrid& grid = ctx.inst.grid;
    for (const Assignment& a : ctx.assignments) {
        if (!a.assigned()) continue;
        if (!ctx.wellFormed(a)) {
            HardViolation v = makeViolation(ConstraintKind::AVAILABILITY, {a.sectionId}, a.day, a.startPeriod);
            v.roomId = a.roomId;
            v.facultyId = a.facultyId;
            out.push_back(v);
            continue;
        }
        const Room& room = ctx.inst.rooms[a.roomId];
        const Faculty& fac = ctx.inst.faculty[a.facultyId];
        int duration = ctx.inst.sections[a.sectionId].duration;
        for (int k = 0; k < duration; ++k) {
            int period = a.startPeriod + k;
            int slot = grid.slotIndex(a.day, period);
            if (grid.isBreak(period))
                out.push_back(makeViolation(ConstraintKind::AVAILABILITY, {a.sectionId}, a.day, period));
            if (contains(room.unavailableSlots, slot)) {
                HardViolation v = makeViolation(ConstraintKind::AVAILABILITY, {a.sectionId}, a.day, period);
                v.roomId = a.roomId;
                out.push_back(v);
            }
            if (contains(fac.unavailableSlots, slot)) {
                HardViolation v = makeViolation(ConstraintKind::AVAILABILITY, {a.sectionId}, a.day, period);
                v.facultyId = a.facultyId;
                out.push_back(v);
            }
        }
    }
}

/**
 * @brief Visit pairs of sections sharing a slot; `match` returns true once it reported the pair.
 *
 * Each pair is reported once, at the first slot where it overlaps.
 */
template <typename Match>
static void forOverlappingPairs(const TimetableContext& ctx, Match match) {
    std::set<std::pair<int, int>> seen;
    for (int slot = 0; slot < (int)ctx.slotSections.size(); ++slot) {
        const std::vector<int>& secs = ctx.slotSections[slot];
        for (size_t i = 0; i < secs.size(); ++i) {
            for (size_t j = i + 1; j < secs.size(); ++j) {
                int a = std::min(secs[i], secs[j]);
                int b = std::max(secs[i], secs[j]);
                if (seen.count({a, b})) continue;
                if (match(a, b, slot)) seen.insert({a, b});
            }
        }
    }
}

static void checkRoomDoubleBooking(const TimetableContext& ctx, std::vector<HardViolation>& out) {
    forOverlappingPairs(ctx, [&](int a, int b, int slot) {
        int room = ctx.assignments[a].roomId;
        if (room != ctx.assignments[b].roomId) return false;
        TimeSlot ts = ctx.inst.grid.slotAt(slot);
        HardViolation v = makeViolation(ConstraintKind::ROOM_DOUBLE_BOOKED, {a, b}, ts.day, ts.period);
        v.roomId = room;
        out.push_back(v);
        return true;
    });
}

static void checkFacultyDoubleBooking(const TimetableContext& ctx, std::vector<HardViolation>& out) {
    forOverlappingPairs(ctx, [&](int a, int b, int slot) {
        int fac = ctx.assignments[a].facultyId;
        if (fac != ctx.assignments[b].facultyId) return false;
        TimeSlot ts = ctx.inst.grid.slotAt(slot);
        HardViolation v = makeViolation(ConstraintKind::FACULTY_DOUBLE_BOOKED, {a, b}, ts.day, ts.period);
        v.facultyId = fac;
        out.push_back(v);
        return true;
    });
}

/**
 * @brief Overlapping clash neighbours: shared students or elective siblings.
 */
static void checkStudentClashes(const TimetableContext& ctx, std::vector<HardViolation>& out) {
    forOverlappingPairs(ctx, [&](int a, int b, int slot) {
        if (!ctx.clashes.clashes(a, b)) return false;
        int witness = ctx.clashes.witness(a, b);
        ConstraintKind kind = witness == ClashGraph::kNoStudent ? ConstraintKind::ELECTIVE_CLASH
                                                                : ConstraintKind::STUDENT_CLASH;
        TimeSlot ts = ctx.inst.grid.slotAt(slot);
        HardViolation v = makeViolation(kind, {a, b}, ts.day, ts.period);
        v.studentId = witness;
        out.push_back(v);
        return true;
    });
}

static void checkFacultyLoad(const TimetableContext& ctx, std::vector<HardViolation>& out) {
    for (const Faculty& f : ctx.inst.faculty) {
        if (ctx.facultyLoad[f.id] <= f.maxLoad) continue;
        std::vector<int> taught;
        for (const Assignment& a : ctx.assignments) {
            if (a.assigned() && ctx.wellFormed(a) && a.facultyId == f.id) taught.push_back(a.sectionId);
        }
        HardViolation v = makeViolation(ConstraintKind::FACULTY_OVERLOAD, taught);
        v.facultyId = f.id;
        out.push_back(v);
    }
}

/**
 * @brief Faculty members teaching more than `limit` sections on one day.
 */
static void checkFacultyDailyLimit(const TimetableContext& ctx, int limit, std::vector<HardViolation>& out) {
    std::map<std::pair<int, int>, std::vector<int>> byDay;
    for (const Assignment& a : ctx.assignments) {
        if (a.assigned() && ctx.wellFormed(a)) byDay[{a.facultyId, a.day}].push_back(a.sectionId);
    }
    for (const auto& entry : byDay) {
        if ((int)entry.second.size() <= limit) continue;
        HardViolation v = makeViolation(ConstraintKind::FACULTY_DAILY_LIMIT, entry.second, entry.first.second);
        v.facultyId = entry.first.first;
        out.push_back(v);
    }
}

/**
 * @brief Per-day occupancy of a set of sections: occ[day][period].
 */
static std::vector<std::vector<char>> dayOccupancy(const TimetableContext& ctx, const std::vector<int>& sectionIds) {
    const TimeGrid& grid = ctx.inst.grid;
    std::vector<std::vector<char>> occ(grid.days, std::vector<char>(grid.periodsPerDay, 0));
    for (int sid : sectionIds) {
        const Assignment& a = ctx.assignments[sid];
        int duration = ctx.inst.sections[sid].duration;
        for (int k = 0; k < duration; ++k) occ[a.day][a.startPeriod + k] = 1;
    }
    return occ;
}

/**
 * @brief Idle non-break periods between the first and last class of each day.
 */
static int countGaps(const TimeGrid& grid, const std::vector<std::vector<char>>& occ) {
    int gaps = 0;
    for (const std::vector<char>& day : occ) {
        int first = -1, last = -1;
        for (int p = 0; p < (int)day.size(); ++p) {
            if (!day[p]) continue;
            if (first < 0) first = p;
            last = p;
        }
        for (int p = first + 1; first >= 0 && p < last; ++p) {
            if (!day[p] && !grid.isBreak(p)) ++gaps;
        }
    }
    return gaps;
}

static double measureStudentGaps(const TimetableContext& ctx) {
    double total = 0.0;
    for (const std::vector<int>& secs : ctx.studentSections) {
        if (secs.empty()) continue;
        total += countGaps(ctx.inst.grid, dayOccupancy(ctx, secs));
    }
    return total;
}

static double measureFacultyGaps(const TimetableContext& ctx) {
    std::vector<std::vector<int>> taught(ctx.inst.faculty.size());
    for (const Assignment& a : ctx.assignments) {
        if (a.assigned() && ctx.wellFormed(a)) taught[a.facultyId].push_back(a.sectionId);
    }
    double total = 0.0;
    for (const std::vector<int>& secs : taught) {
        if (secs.empty()) continue;
        total += countGaps(ctx.inst.grid, dayOccupancy(ctx, secs));
    }
    return total;
}

static double measureFacultyImbalance(const TimetableContext& ctx) {
    return loadVariance(ctx.facultyLoad);
}

/**
 * @brief Student-days with classes but no free run of selfStudyPeriods non-break periods.
 */
static double measureMissingSelfStudy(const TimetableContext& ctx) {
    const TimeGrid& grid = ctx.inst.grid;
    double days = 0.0;
    for (const std::vector<int>& secs : ctx.studentSections) {
        if (secs.empty()) continue;
        std::vector<std::vector<char>> occ = dayOccupancy(ctx, secs);
        for (const std::vector<char>& day : occ) {
            if (std::find(day.begin(), day.end(), 1) == day.end()) continue;
            int run = 0, longest = 0;
            for (int p = 0; p < grid.periodsPerDay; ++p) {
                if (day[p] || grid.isBreak(p)) {
                    run = 0;
                } else {
                    longest = std::max(longest, ++run);
                }
            }
            if (longest < ctx.selfStudyPeriods) days += 1.0;
        }
    }
    return days;
}

/**
 * @brief Student class blocks immediately followed by another class.
 */
static double measureMissingBreaks(const TimetableContext& ctx) {
    double blocks = 0.0;
    for (const std::vector<int>& secs : ctx.studentSections) {
        if (secs.size() < 2) continue;
        std::vector<std::vector<char>> occ = dayOccupancy(ctx, secs);
        for (int sid : secs) {
            const Assignment& a = ctx.assignments[sid];
            int end = a.startPeriod + ctx.inst.sections[sid].duration;
            if (end < ctx.inst.grid.periodsPerDay && occ[a.day][end]) blocks += 1.0;
        }
    }
    return blocks;
}

/**
 * @brief Pairs of same-course sections sharing a student on one day.
 */
static double measureCourseSpacing(const TimetableContext& ctx) {
    std::map<std::pair<int, int>, std::vector<int>> byCourseDay;
    for (const Assignment& a : ctx.assignments) {
        if (a.assigned() && ctx.wellFormed(a))
            byCourseDay[{ctx.inst.sections[a.sectionId].courseId, a.day}].push_back(a.sectionId);
    }
    double pairs = 0.0;
    for (const auto& entry : byCourseDay) {
        const std::vector<int>& secs = entry.second;
        for (size_t i = 0; i < secs.size(); ++i) {
            for (size_t j = i + 1; j < secs.size(); ++j) {
                if (ctx.clashes.clashes(secs[i], secs[j]) &&
                    ctx.clashes.witness(secs[i], secs[j]) != ClashGraph::kNoStudent)
                    pairs += 1.0;
            }
        }
    }
    return pairs;
}

/**
 * @brief Periods taught outside the faculty member's preferred slots.
 *
 * Faculty without preferences never count.
 */
static double measureFacultyPreference(const TimetableContext& ctx) {
    double periods = 0.0;
    for (const Assignment& a : ctx.assignments) {
        if (!a.assigned() || !ctx.wellFormed(a)) continue;
        const std::vector<int>& preferred = ctx.inst.faculty[a.facultyId].preferredSlots;
        if (preferred.empty()) continue;
        int base = ctx.inst.grid.slotIndex(a.day, a.startPeriod);
        for (int k = 0; k < ctx.inst.sections[a.sectionId].duration; ++k) {
            if (!contains(preferred, base + k)) periods += 1.0;
        }
    }
    return periods;
}

/**
 * @brief Register the timetable constraints with the configured weights.
 */
ConstraintEvaluator::ConstraintEvaluator(const SolverConfig& config)
        : selfStudyPeriods_(config.selfStudyPeriods) {
    set_.addHard(ConstraintKind::AVAILABILITY, checkAvailability);
    set_.addHard(ConstraintKind::ROOM_CAPACITY, checkRoomCapacity);
    set_.addHard(ConstraintKind::ROOM_CAPABILITY, checkRoomCapability);
    set_.addHard(ConstraintKind::FACULTY_UNQUALIFIED, checkQualification);
    set_.addHard(ConstraintKind::ROOM_DOUBLE_BOOKED, checkRoomDoubleBooking);
    set_.addHard(ConstraintKind::FACULTY_DOUBLE_BOOKED, checkFacultyDoubleBooking);
    set_.addHard(ConstraintKind::FACULTY_OVERLOAD, checkFacultyLoad);
    set_.addHard(ConstraintKind::STUDENT_CLASH, checkStudentClashes);
    int dailyLimit = config.maxFacultyDailySections;
    if (dailyLimit > 0) {
        set_.addHard(ConstraintKind::FACULTY_DAILY_LIMIT,
                     [dailyLimit](const TimetableContext& ctx, std::vector<HardViolation>& out) {
                         checkFacultyDailyLimit(ctx, dailyLimit, out);
                     });
    }

    const SoftWeights& w = config.weights;
    set_.addSoft(ConstraintKind::STUDENT_GAPS, w.gapPenalty, measureStudentGaps);
    set_.addSoft(ConstraintKind::FACULTY_GAPS, w.gapPenalty, measureFacultyGaps);
    set_.addSoft(ConstraintKind::FACULTY_IMBALANCE, w.imbalancePenalty, measureFacultyImbalance);
    set_.addSoft(ConstraintKind::MISSING_SELF_STUDY, w.selfStudyBonus, measureMissingSelfStudy);
    set_.addSoft(ConstraintKind::MISSING_BREAK, w.breakBonus, measureMissingBreaks);
    set_.addSoft(ConstraintKind::COURSE_SPACING, w.spacingPenalty, measureCourseSpacing);
    set_.addSoft(ConstraintKind::FACULTY_PREFERENCE, w.preferencePenalty, measureFacultyPreference);
}

Evaluation ConstraintEvaluator::evaluate(const ProblemInstance& inst, const ClashGraph& clashes,
                                         const std::vector<Assignment>& assignments) const {
    TimetableContext ctx(inst, clashes, assignments, selfStudyPeriods_);
    return set_.evaluate(ctx);
}

Evaluation evaluate(const TimetableSolution& schedule, const ProblemInstance& inst, const SolverConfig& config) {
    ClashGraph clashes = ClashGraph::forSections(inst);
    ConstraintEvaluator evaluator(config);
    return evaluator.evaluate(inst, clashes, schedule.assignments);
}


///////////////////////////
///        EXAMS        ///
///////////////////////////
std::vector<int> courseInstructors(const ProblemInstance& inst, int courseId, const TimetableSolution* committed) {
    std::vector<int> result;
    if (courseId >= 0 && courseId < (int)inst.courses.size())
        result = inst.courses[courseId].instructorIds;
    if (committed) {
        for (const Assignment& a : committed->assignments) {
            if (!a.assigned() || a.sectionId >= (int)inst.sections.size()) continue;
            if (inst.sections[a.sectionId].courseId == courseId) result.push_back(a.facultyId);
        }
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

int requiredInvigilators(const ExamConfig& config, int seated) {
    int needed = config.minInvigilatorsPerRoom;
    if (config.studentsPerInvigilator > 0) {
        int byStudents = (seated + config.studentsPerInvigilator - 1) / config.studentsPerInvigilator;
        needed = std::max(needed, byStudents);
    }
    return needed;
}

ExamContext::ExamContext(const ProblemInstance& inst, const ExamProblem& problem, const ClashGraph& clashes,
                         const ExamSchedule& schedule, const TimetableSolution* committed, const ExamConfig& config)
        : inst(inst), problem(problem), clashes(clashes), schedule(schedule), committed(committed), config(config) {
    examOnlySlot.assign(inst.grid.slotCount(), 0);
    for (int slot : problem.examOnlySlots) {
        if (slot >= 0 && slot < (int)examOnlySlot.size()) examOnlySlot[slot] = 1;
    }
    invigilationLoad.assign(inst.faculty.size(), 0);
    for (const InvigilatorAssignment& d : schedule.invigilators) {
        if (d.facultyId >= 0 && d.facultyId < (int)invigilationLoad.size())
            invigilationLoad[d.facultyId] += d.duration;
    }
}

bool ExamContext::wellFormed(const ExamPlacement& p) const {
    if (p.examId < 0 || p.examId >= (int)problem.exams.size()) return false;
    if (p.roomIds.empty() || p.roomIds.size() != p.seatCounts.size()) return false;
    for (int r : p.roomIds) {
        if (r < 0 || r >= (int)inst.rooms.size()) return false;
    }
    int duration = problem.exams[p.examId].duration;
    return p.day >= 0 && p.day < inst.grid.days && p.startPeriod >= 0 &&
           p.startPeriod + duration <= inst.grid.periodsPerDay;
}

/**
 * @brief Placed, well-formed exam placements.
 */
static std::vector<const ExamPlacement*> placedExams(const ExamContext& ctx) {
    std::vector<const ExamPlacement*> result;
    for (const ExamPlacement& p : ctx.schedule.placements) {
        if (p.placed() && ctx.wellFormed(p)) result.push_back(&p);
    }
    return result;
}

static int examDuration(const ExamContext& ctx, int examId) {
    return ctx.problem.exams[examId].duration;
}

static void checkExamAvailability(const ExamContext& ctx, std::vector<HardViolation>& out) {
    const TimeGrid& grid = ctx.inst.grid;
    for (const ExamPlacement& p : ctx.schedule.placements) {
        if (!p.placed()) continue;
        if (!ctx.wellFormed(p)) {
            out.push_back(makeViolation(ConstraintKind::AVAILABILITY, {p.examId}, p.day, p.startPeriod));
            continue;
        }
        for (int r : p.roomIds) {
            for (int k = 0; k < examDuration(ctx, p.examId); ++k) {
                if (contains(ctx.inst.rooms[r].unavailableSlots, grid.slotIndex(p.day, p.startPeriod + k))) {
                    HardViolation v = makeViolation(ConstraintKind::AVAILABILITY, {p.examId}, p.day, p.startPeriod + k);
                    v.roomId = r;
                    out.push_back(v);
                }
            }
        }
    }
    for (const InvigilatorAssignment& d : ctx.schedule.invigilators) {
        if (d.facultyId < 0 || d.facultyId >= (int)ctx.inst.faculty.size()) continue;
        for (int k = 0; k < d.duration; ++k) {
            int period = d.startPeriod + k;
            if (period >= grid.periodsPerDay) break;
            if (contains(ctx.inst.faculty[d.facultyId].unavailableSlots, grid.slotIndex(d.day, period))) {
                HardViolation v = makeViolation(ConstraintKind::AVAILABILITY, {d.examId}, d.day, period);
                v.facultyId = d.facultyId;
                out.push_back(v);
            }
        }
    }
}

static void checkExamRoomCapability(const ExamContext& ctx, std::vector<HardViolation>& out) {
    for (const ExamPlacement* p : placedExams(ctx)) {
        const Exam& exam = ctx.problem.exams[p->examId];
        for (size_t i = 0; i < p->roomIds.size(); ++i) {
            const Room& room = ctx.inst.rooms[p->roomIds[i]];
            if (!hasAllTags(room.tags, exam.requiredTags)) {
                HardViolation v = makeViolation(ConstraintKind::ROOM_CAPABILITY, {exam.id}, p->day, p->startPeriod);
                v.roomId = room.id;
                out.push_back(v);
            }
            if (p->seatCounts[i] > examSeatCapacity(room, exam.seatsPerBench)) {
                HardViolation v = makeViolation(ConstraintKind::SEAT_CAPACITY, {exam.id}, p->day, p->startPeriod);
                v.roomId = room.id;
                out.push_back(v);
            }
        }
    }
}

/**
 * @brief Pairs of overlapping exams sharing a room or a student.
 */
static void checkExamOverlaps(const ExamContext& ctx, std::vector<HardViolation>& out) {
    std::vector<const ExamPlacement*> placed = placedExams(ctx);
    for (size_t i = 0; i < placed.size(); ++i) {
        for (size_t j = i + 1; j < placed.size(); ++j) {
            const ExamPlacement& a = *placed[i];
            const ExamPlacement& b = *placed[j];
            if (!overlaps(a.day, a.startPeriod, examDuration(ctx, a.examId),
                          b.day, b.startPeriod, examDuration(ctx, b.examId)))
                continue;
            int period = std::max(a.startPeriod, b.startPeriod);
            for (int r : a.roomIds) {
                if (!contains(b.roomIds, r)) continue;
                HardViolation v = makeViolation(ConstraintKind::ROOM_DOUBLE_BOOKED, {a.examId, b.examId}, a.day, period);
                v.roomId = r;
                out.push_back(v);
            }
            if (ctx.clashes.clashes(a.examId, b.examId)) {
                HardViolation v = makeViolation(ConstraintKind::STUDENT_CLASH, {a.examId, b.examId}, a.day, period);
                v.studentId = ctx.clashes.witness(a.examId, b.examId);
                out.push_back(v);
            }
        }
    }
}

static void checkDailyLimit(const ExamContext& ctx, std::vector<HardViolation>& out) {
    int limit = ctx.config.maxExamsPerStudentPerDay;
    if (limit <= 0) return;
    // (student, day) -> exams
    std::map<std::pair<int, int>, std::vector<int>> perDay;
    for (const ExamPlacement* p : placedExams(ctx)) {
        for (int st : ctx.problem.exams[p->examId].studentIds) perDay[{st, p->day}].push_back(p->examId);
    }
    for (const auto& entry : perDay) {
        if ((int)entry.second.size() <= limit) continue;
        HardViolation v = makeViolation(ConstraintKind::STUDENT_DAILY_LIMIT, entry.second, entry.first.second);
        v.studentId = entry.first.first;
        out.push_back(v);
    }
}

static void checkSlotCap(const ExamContext& ctx, std::vector<HardViolation>& out) {
    int cap = ctx.config.maxStudentsPerSlot;
    if (cap <= 0) return;
    std::vector<int> seated(ctx.inst.grid.slotCount(), 0);
    std::vector<std::vector<int>> exams(ctx.inst.grid.slotCount());
    for (const ExamPlacement* p : placedExams(ctx)) {
        const Exam& exam = ctx.problem.exams[p->examId];
        int base = ctx.inst.grid.slotIndex(p->day, p->startPeriod);
        for (int k = 0; k < exam.duration; ++k) {
            seated[base + k] += (int)exam.studentIds.size();
            exams[base + k].push_back(exam.id);
        }
    }
    for (int slot = 0; slot < (int)seated.size(); ++slot) {
        if (seated[slot] <= cap) continue;
        TimeSlot ts = ctx.inst.grid.slotAt(slot);
        out.push_back(makeViolation(ConstraintKind::SLOT_STUDENT_CAP, exams[slot], ts.day, ts.period));
    }
}

/**
 * @brief Seat totals per exam and per room, enrolment of seated students,
 * and double use of a student or a seat.
 */
static void checkSeating(const ExamContext& ctx, std::vector<HardViolation>& out) {
    int numExams = (int)ctx.problem.exams.size();
    std::vector<std::vector<const SeatAssignment*>> seatsOf(numExams);
    for (const SeatAssignment& s : ctx.schedule.seats) {
        if (s.examId >= 0 && s.examId < numExams) seatsOf[s.examId].push_back(&s);
    }

    for (const ExamPlacement* p : placedExams(ctx)) {
        const Exam& exam = ctx.problem.exams[p->examId];
        const std::vector<const SeatAssignment*>& seats = seatsOf[exam.id];

        int total = 0;
        for (int c : p->seatCounts) total += c;
        if (total != (int)exam.studentIds.size() || seats.size() != exam.studentIds.size())
            out.push_back(makeViolation(ConstraintKind::SEAT_COUNT, {exam.id}, p->day, p->startPeriod));

        for (size_t i = 0; i < p->roomIds.size(); ++i) {
            int inRoom = 0;
            for (const SeatAssignment* s : seats) {
                if (s->roomId == p->roomIds[i]) ++inRoom;
            }
            if (inRoom != p->seatCounts[i]) {
                HardViolation v = makeViolation(ConstraintKind::SEAT_COUNT, {exam.id}, p->day, p->startPeriod);
                v.roomId = p->roomIds[i];
                out.push_back(v);
            }
        }

        std::set<int> students;
        std::set<std::pair<int, std::string>> labels;
        for (const SeatAssignment* s : seats) {
            if (!contains(exam.studentIds, s->studentId) || !contains(p->roomIds, s->roomId)) {
                HardViolation v = makeViolation(ConstraintKind::SEAT_COUNT, {exam.id}, p->day, p->startPeriod);
                v.roomId = s->roomId;
                v.studentId = s->studentId;
                out.push_back(v);
            }
            if (!students.insert(s->studentId).second) {
                HardViolation v = makeViolation(ConstraintKind::DOUBLE_SEATED, {exam.id}, p->day, p->startPeriod);
                v.studentId = s->studentId;
                out.push_back(v);
            }
            if (!labels.insert({s->roomId, s->seatLabel}).second) {
                HardViolation v = makeViolation(ConstraintKind::DOUBLE_SEATED, {exam.id}, p->day, p->startPeriod);
                v.roomId = s->roomId;
                out.push_back(v);
            }
        }
    }
}

/**
 * @brief Bench mates of one section, and second seats used at single density.
 */
static void checkBenches(const ExamContext& ctx, std::vector<HardViolation>& out) {
    // (exam, room, bench) -> seated students
    std::map<std::tuple<int, int, int>, std::vector<int>> benches;
    for (const SeatAssignment& s : ctx.schedule.seats) {
        if (s.examId < 0 || s.examId >= (int)ctx.problem.exams.size()) continue;
        benches[std::make_tuple(s.examId, s.roomId, s.bench)].push_back(s.studentId);
    }
    for (const auto& entry : benches) {
        int examId = std::get<0>(entry.first);
        int roomId = std::get<1>(entry.first);
        const std::vector<int>& mates = entry.second;
        const Exam& exam = ctx.problem.exams[examId];
        if (mates.size() < 2) continue;
        if (exam.seatsPerBench == 1) {
            HardViolation v = makeViolation(ConstraintKind::SEAT_CAPACITY, {examId});
            v.roomId = roomId;
            out.push_back(v);
        }
        if (!ctx.config.antiCheatAdjacency) continue;
        for (size_t i = 0; i < mates.size(); ++i) {
            for (size_t j = i + 1; j < mates.size(); ++j) {
                int a = sectionForCourse(ctx.inst, mates[i], exam.courseId);
                int b = sectionForCourse(ctx.inst, mates[j], exam.courseId);
                if (a < 0 || a != b) continue;
                HardViolation v = makeViolation(ConstraintKind::BENCH_ADJACENCY, {examId});
                v.roomId = roomId;
                v.studentId = std::max(mates[i], mates[j]);
                out.push_back(v);
            }
        }
    }
}

/**
 * @brief Staffing levels, instructor exclusion, double duties and invigilation load.
 */
static void checkInvigilation(const ExamContext& ctx, std::vector<HardViolation>& out) {
    const std::vector<InvigilatorAssignment>& duties = ctx.schedule.invigilators;

    for (const ExamPlacement* p : placedExams(ctx)) {
        for (size_t i = 0; i < p->roomIds.size(); ++i) {
            int staffed = 0;
            for (const InvigilatorAssignment& d : duties) {
                if (d.examId == p->examId && d.roomId == p->roomIds[i]) ++staffed;
            }
            if (staffed < requiredInvigilators(ctx.config, p->seatCounts[i])) {
                HardViolation v = makeViolation(ConstraintKind::INVIGILATOR_SHORTAGE, {p->examId}, p->day, p->startPeriod);
                v.roomId = p->roomIds[i];
                out.push_back(v);
            }
        }
    }

    // Under MINIMUM_FIRST an instructor may cover a room nobody else can.
    if (!ctx.config.allowInstructorInvigilation && ctx.config.precedence == ExclusionPrecedence::EXCLUSION_FIRST) {
        for (const InvigilatorAssignment& d : duties) {
            if (d.examId < 0 || d.examId >= (int)ctx.problem.exams.size()) continue;
            int course = ctx.problem.exams[d.examId].courseId;
            if (contains(courseInstructors(ctx.inst, course, ctx.committed), d.facultyId)) {
                HardViolation v = makeViolation(ConstraintKind::SELF_INVIGILATION, {d.examId}, d.day, d.startPeriod);
                v.facultyId = d.facultyId;
                v.roomId = d.roomId;
                out.push_back(v);
            }
        }
    }

    for (size_t i = 0; i < duties.size(); ++i) {
        for (size_t j = i + 1; j < duties.size(); ++j) {
            const InvigilatorAssignment& a = duties[i];
            const InvigilatorAssignment& b = duties[j];
            if (a.facultyId != b.facultyId) continue;
            if (!overlaps(a.day, a.startPeriod, a.duration, b.day, b.startPeriod, b.duration)) continue;
            HardViolation v = makeViolation(ConstraintKind::FACULTY_DOUBLE_BOOKED, {a.examId, b.examId},
                                            a.day, std::max(a.startPeriod, b.startPeriod));
            v.facultyId = a.facultyId;
            out.push_back(v);
        }
    }

    for (const Faculty& f : ctx.inst.faculty) {
        if (ctx.invigilationLoad[f.id] <= f.maxLoad) continue;
        std::vector<int> exams;
        for (const InvigilatorAssignment& d : duties) {
            if (d.facultyId == f.id) exams.push_back(d.examId);
        }
        HardViolation v = makeViolation(ConstraintKind::FACULTY_OVERLOAD, exams);
        v.facultyId = f.id;
        out.push_back(v);
    }
}

/**
 * @brief Exam rooms or invigilators already used by committed teaching.
 *
 * Exam-only slots are exempt: teaching is suspended there.
 */
static void checkTeachingConflicts(const ExamContext& ctx, std::vector<HardViolation>& out) {
    if (!ctx.committed) return;
    const TimeGrid& grid = ctx.inst.grid;

    // Flat slot -> (room, faculty) pairs of committed teaching.
    std::vector<std::vector<std::pair<int, int>>> teaching(grid.slotCount());
    for (const Assignment& a : ctx.committed->assignments) {
        if (!a.assigned() || a.sectionId >= (int)ctx.inst.sections.size()) continue;
        int duration = ctx.inst.sections[a.sectionId].duration;
        for (int k = 0; k < duration && a.startPeriod + k < grid.periodsPerDay; ++k) {
            int slot = grid.slotIndex(a.day, a.startPeriod + k);
            if (!ctx.examOnlySlot[slot]) teaching[slot].push_back({a.roomId, a.facultyId});
        }
    }

    for (const ExamPlacement* p : placedExams(ctx)) {
        for (int k = 0; k < examDuration(ctx, p->examId); ++k) {
            int slot = grid.slotIndex(p->day, p->startPeriod + k);
            for (const auto& use : teaching[slot]) {
                if (!contains(p->roomIds, use.first)) continue;
                HardViolation v = makeViolation(ConstraintKind::TEACHING_CONFLICT, {p->examId}, p->day, p->startPeriod + k);
                v.roomId = use.first;
                out.push_back(v);
            }
        }
    }
    for (const InvigilatorAssignment& d : ctx.schedule.invigilators) {
        for (int k = 0; k < d.duration && d.startPeriod + k < grid.periodsPerDay; ++k) {
            if (d.day < 0 || d.day >= grid.days) break;
            int slot = grid.slotIndex(d.day, d.startPeriod + k);
            for (const auto& use : teaching[slot]) {
                if (use.second != d.facultyId) continue;
                HardViolation v = makeViolation(ConstraintKind::TEACHING_CONFLICT, {d.examId}, d.day, d.startPeriod + k);
                v.facultyId = d.facultyId;
                out.push_back(v);
            }
        }
    }
}

/**
 * @brief Pairs of exams a student sits on the same day.
 */
static double measureSameDayPairs(const ExamContext& ctx) {
    std::map<std::pair<int, int>, int> perDay;
    for (const ExamPlacement* p : placedExams(ctx)) {
        for (int st : ctx.problem.exams[p->examId].studentIds) ++perDay[{st, p->day}];
    }
    double pairs = 0.0;
    for (const auto& entry : perDay) pairs += entry.second * (entry.second - 1) / 2;
    return pairs;
}

static double measureInvigilationImbalance(const ExamContext& ctx) {
    std::vector<int> loads;
    if (ctx.problem.invigilatorPool.empty()) {
        loads = ctx.invigilationLoad;
    } else {
        for (int f : ctx.problem.invigilatorPool) {
            if (f >= 0 && f < (int)ctx.invigilationLoad.size()) loads.push_back(ctx.invigilationLoad[f]);
        }
    }
    return loadVariance(loads);
}

ExamEvaluator::ExamEvaluator(const ExamConfig& config) : config_(config) {
    set_.addHard(ConstraintKind::AVAILABILITY, checkExamAvailability);
    set_.addHard(ConstraintKind::ROOM_CAPABILITY, checkExamRoomCapability);
    set_.addHard(ConstraintKind::ROOM_DOUBLE_BOOKED, checkExamOverlaps);
    set_.addHard(ConstraintKind::STUDENT_DAILY_LIMIT, checkDailyLimit);
    set_.addHard(ConstraintKind::SLOT_STUDENT_CAP, checkSlotCap);
    set_.addHard(ConstraintKind::SEAT_COUNT, checkSeating);
    set_.addHard(ConstraintKind::BENCH_ADJACENCY, checkBenches);
    set_.addHard(ConstraintKind::INVIGILATOR_SHORTAGE, checkInvigilation);
    set_.addHard(ConstraintKind::TEACHING_CONFLICT, checkTeachingConflicts);

    set_.addSoft(ConstraintKind::EXAM_SAME_DAY, config.sameDayPenalty, measureSameDayPairs);
    set_.addSoft(ConstraintKind::INVIGILATION_IMBALANCE, config.imbalancePenalty, measureInvigilationImbalance);
}

Evaluation ExamEvaluator::evaluate(const ProblemInstance& inst, const ExamProblem& problem, const ClashGraph& clashes,
                                   const ExamSchedule& schedule, const TimetableSolution* committed) const {
    ExamContext ctx(inst, problem, clashes, schedule, committed, config_);
    return set_.evaluate(ctx);
}

Evaluation evaluateExams(const ExamSchedule& schedule, const ProblemInstance& inst, const ExamProblem& problem,
                         const TimetableSolution* committed, const ExamConfig& config) {
    ClashGraph clashes = ClashGraph::forExams(problem);
    ExamEvaluator evaluator(config);
    return evaluator.evaluate(inst, problem, clashes, schedule, committed);
}
