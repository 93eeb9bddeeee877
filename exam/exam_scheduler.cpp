///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "exam_scheduler.hpp"
#include "backtracking.hpp"
#include "evaluator.hpp"
#include "validation.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <tuple>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static bool contains(const std::vector<int>& values, int value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}


///////////////////////////
///    EXAM PLACEMENT   ///
///////////////////////////
ExamSearchProblem::ExamSearchProblem(const ProblemInstance& inst, const ExamProblem& problem,
                                     const TimetableSolution* committed, const ExamConfig& config)
        : inst_(inst),
          problem_(problem),
          config_(config),
          clashes_(ClashGraph::forExams(problem)),
          state_(inst.grid, (int)inst.rooms.size(), (int)inst.faculty.size(), clashes_),
          planner_(inst, config.antiCheatAdjacency),
          rng_(config.seed) {
    const TimeGrid& grid = inst.grid;
    int numExams = (int)problem.exams.size();

    // Committed teaching keeps its rooms and faculty outside exam-only slots.
    if (committed) {
        std::vector<char> examOnly(grid.slotCount(), 0);
        for (int slot : problem.examOnlySlots) examOnly[slot] = 1;
        for (const Assignment& a : committed->assignments) {
            if (!a.assigned()) continue;
            int duration = inst.sections[a.sectionId].duration;
            for (int k = 0; k < duration; ++k) {
                int slot = grid.slotIndex(a.day, a.startPeriod + k);
                if (examOnly[slot]) continue;
                state_.blockRoom(a.roomId, slot);
                state_.blockFaculty(a.facultyId, slot);
            }
        }
    }

    if (problem.invigilatorPool.empty()) {
        for (const Faculty& f : inst.faculty) pool_.push_back(f.id);
    } else {
        std::set<int> unique(problem.invigilatorPool.begin(), problem.invigilatorPool.end());
        pool_.assign(unique.begin(), unique.end());
    }

    facultyAway_.assign(inst.faculty.size(), std::vector<char>(grid.slotCount(), 0));
    for (const Faculty& f : inst.faculty) {
        for (int slot : f.unavailableSlots) facultyAway_[f.id][slot] = 1;
    }

    needs_.resize(numExams);
    static_.resize(numExams);
    instructors_.resize(numExams);
    for (const Exam& exam : problem.exams) {
        needs_[exam.id] = planner_.need(exam);
        instructors_[exam.id] = courseInstructors(inst, exam.courseId, committed);
        buildStaticCandidates(exam.id);
    }

    // Fewest start slots first, then larger exams, then id.
    std::vector<int> slots(numExams, 0);
    for (int e = 0; e < numExams; ++e) {
        std::set<std::pair<int, int>> starts;
        for (const ExamCandidate& c : static_[e]) starts.insert({c.day, c.startPeriod});
        slots[e] = (int)starts.size();
        order_.push_back(e);
    }
    std::sort(order_.begin(), order_.end(), [&](int a, int b) {
        int sa = (int)problem.exams[a].studentIds.size();
        int sb = (int)problem.exams[b].studentIds.size();
        return std::make_tuple(slots[a], -sa, a) < std::make_tuple(slots[b], -sb, b);
    });

    placements_.assign(numExams, ExamPlacement());
    duties_.assign(numExams, {});
    studentDay_.assign(inst.students.size(), std::vector<int>(grid.days, 0));
    slotSeated_.assign(grid.slotCount(), 0);
    staffingFailed_.assign(numExams, 0);
}

/**
 * @brief Per start slot: every single room that fits, and largest-first
 * combinations when more than one room is needed.
 *
 * A combination is grown from each usable room in turn, so a taken room
 * still leaves combinations without it. Live ranking puts the best fit first.
 */
void ExamSearchProblem::buildStaticCandidates(int examId) {
    const Exam& exam = problem_.exams[examId];
    const TimeGrid& grid = inst_.grid;
    int needed = needs_[examId].benches();

    auto addCandidate = [&](int day, int start, const std::vector<int>& rooms) {
        std::vector<int> counts = planner_.distribute(needs_[examId], rooms);
        if (counts.empty()) return;
        ExamCandidate c;
        c.day = day;
        c.startPeriod = start;
        c.roomIds = rooms;
        c.seatCounts = counts;
        for (int r : rooms) c.benches += benchCount(inst_.rooms[r]);
        static_[examId].push_back(std::move(c));
    };

    for (int day = 0; day < grid.days; ++day) {
        for (int start = 0; start + exam.duration <= grid.periodsPerDay; ++start) {
            std::vector<int> rooms;
            for (const Room& room : inst_.rooms) {
                if (!hasAllTags(room.tags, exam.requiredTags)) continue;
                bool usable = true;
                for (int k = 0; k < exam.duration && usable; ++k) {
                    int slot = grid.slotIndex(day, start + k);
                    if (contains(room.unavailableSlots, slot) ||
                        state_.roomOccupant(room.id, slot) == ScheduleState::kBlocked)
                        usable = false;
                }
                if (usable) rooms.push_back(room.id);
            }
            if (rooms.empty()) continue;

            std::vector<int> bySize = rooms;
            std::stable_sort(bySize.begin(), bySize.end(), [&](int a, int b) {
                return benchCount(inst_.rooms[a]) > benchCount(inst_.rooms[b]);
            });

            for (int r : rooms) {
                if (benchCount(inst_.rooms[r]) >= needed) addCandidate(day, start, {r});
            }

            std::set<std::vector<int>> seen;
            for (size_t anchor = 0; anchor < bySize.size(); ++anchor) {
                std::vector<int> combo;
                int total = 0;
                for (size_t i = anchor; i < bySize.size() && total < needed; ++i) {
                    combo.push_back(bySize[i]);
                    total += benchCount(inst_.rooms[bySize[i]]);
                }
                if (total < needed) break;
                if (combo.size() < 2) continue;
                std::vector<int> key = combo;
                std::sort(key.begin(), key.end());
                if (seen.insert(key).second) addCandidate(day, start, combo);
            }
        }
    }
}

Infeasibility ExamSearchProblem::staticInfeasibility() const {
    Infeasibility inf;
    for (int e : order_) {
        if (!static_[e].empty()) continue;
        const Exam& exam = problem_.exams[e];
        int needed = needs_[e].benches();

        std::vector<int> tagged;
        int benches = 0;
        for (const Room& room : inst_.rooms) {
            if (!hasAllTags(room.tags, exam.requiredTags)) continue;
            tagged.push_back(room.id);
            benches += benchCount(room);
        }

        inf.kind = FailureKind::INFEASIBLE;
        inf.sectionIds = {e};
        inf.roomIds = tagged;
        if (tagged.empty()) {
            inf.constraint = "room-capability";
            inf.reason = "no room offers the tags exam " + exam.name + " needs";
        } else if (benches < needed) {
            inf.constraint = "seat-capacity";
            inf.reason = "suitable rooms offer " + std::to_string(benches) + " benches, exam " + exam.name +
                         " needs " + std::to_string(needed);
        } else {
            inf.constraint = "availability";
            inf.reason = "no slot has enough suitable rooms free for exam " + exam.name;
        }
        return inf;
    }
    return inf;
}

bool ExamSearchProblem::slotOpen(int examId, const ExamCandidate& c) const {
    const Exam& exam = problem_.exams[examId];
    for (int r : c.roomIds) {
        if (!state_.roomFree(r, c.day, c.startPeriod, exam.duration)) return false;
    }
    if (!state_.clashFree(examId, c.day, c.startPeriod, exam.duration)) return false;

    int limit = config_.maxExamsPerStudentPerDay;
    if (limit > 0) {
        for (int st : exam.studentIds) {
            if (studentDay_[st][c.day] + 1 > limit) return false;
        }
    }

    int cap = config_.maxStudentsPerSlot;
    if (cap > 0) {
        int base = inst_.grid.slotIndex(c.day, c.startPeriod);
        for (int k = 0; k < exam.duration; ++k) {
            if (slotSeated_[base + k] + (int)exam.studentIds.size() > cap) return false;
        }
    }
    return true;
}

/**
 * @brief Fill each room with the least-loaded free invigilators.
 *
 * Instructors of the course are held back. Under MINIMUM_FIRST they cover
 * what nobody else can.
 */
bool ExamSearchProblem::staff(int examId, ExamCandidate& c) const {
    const Exam& exam = problem_.exams[examId];
    int base = inst_.grid.slotIndex(c.day, c.startPeriod);

    std::vector<int> regular, reserve;
    for (int f : pool_) {
        bool away = false;
        for (int k = 0; k < exam.duration; ++k) {
            if (facultyAway_[f][base + k]) away = true;
        }
        if (away || !state_.facultyFree(f, c.day, c.startPeriod, exam.duration)) continue;
        if (state_.facultyLoad(f) + exam.duration > inst_.faculty[f].maxLoad) continue;
        if (!config_.allowInstructorInvigilation && contains(instructors_[examId], f))
            reserve.push_back(f);
        else
            regular.push_back(f);
    }

    auto byLoad = [&](int a, int b) {
        int la = state_.facultyLoad(a);
        int lb = state_.facultyLoad(b);
        return la != lb ? la < lb : a < b;
    };
    std::sort(regular.begin(), regular.end(), byLoad);
    std::sort(reserve.begin(), reserve.end(), byLoad);

    bool useReserve = config_.precedence == ExclusionPrecedence::MINIMUM_FIRST;
    size_t nextRegular = 0, nextReserve = 0;
    c.invigilators.assign(c.roomIds.size(), {});
    for (size_t i = 0; i < c.roomIds.size(); ++i) {
        int needed = requiredInvigilators(config_, c.seatCounts[i]);
        while ((int)c.invigilators[i].size() < needed) {
            if (nextRegular < regular.size())
                c.invigilators[i].push_back(regular[nextRegular++]);
            else if (useReserve && nextReserve < reserve.size())
                c.invigilators[i].push_back(reserve[nextReserve++]);
            else
                return false;
        }
    }
    return true;
}

std::vector<ExamCandidate> ExamSearchProblem::liveCandidates(int examId) {
    const Exam& exam = problem_.exams[examId];
    staffingFailed_[examId] = 0;

    struct Ranked {
        int sameDay;
        std::uint64_t key;
        ExamCandidate c;
    };
    std::vector<Ranked> ranked;
    for (const ExamCandidate& c : static_[examId]) {
        if (!slotOpen(examId, c)) continue;
        ExamCandidate live = c;
        if (!staff(examId, live)) {
            staffingFailed_[examId] = 1;
            continue;
        }
        int sameDay = 0;
        for (int st : exam.studentIds) sameDay += studentDay_[st][c.day];
        ranked.push_back({sameDay, rng_(), std::move(live)});
    }

    std::sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        return std::make_tuple(a.sameDay, a.c.benches, a.key, a.c.day, a.c.startPeriod) <
               std::make_tuple(b.sameDay, b.c.benches, b.key, b.c.day, b.c.startPeriod);
    });

    std::vector<ExamCandidate> result;
    result.reserve(ranked.size());
    for (Ranked& r : ranked) result.push_back(std::move(r.c));
    return result;
}

Booking ExamSearchProblem::booking(int examId, const ExamCandidate& c) const {
    Booking b{examId, c.day, c.startPeriod, problem_.exams[examId].duration, c.roomIds, {}};
    for (const std::vector<int>& room : c.invigilators) b.facultyIds.insert(b.facultyIds.end(), room.begin(), room.end());
    return b;
}

void ExamSearchProblem::place(int examId, const ExamCandidate& c) {
    const Exam& exam = problem_.exams[examId];
    state_.book(booking(examId, c));

    for (int st : exam.studentIds) ++studentDay_[st][c.day];
    int base = inst_.grid.slotIndex(c.day, c.startPeriod);
    for (int k = 0; k < exam.duration; ++k) slotSeated_[base + k] += (int)exam.studentIds.size();

    ExamPlacement& p = placements_[examId];
    p.examId = examId;
    p.day = c.day;
    p.startPeriod = c.startPeriod;
    p.roomIds = c.roomIds;
    p.seatCounts = c.seatCounts;

    duties_[examId].clear();
    for (size_t i = 0; i < c.roomIds.size(); ++i) {
        for (int f : c.invigilators[i])
            duties_[examId].push_back({examId, c.roomIds[i], c.day, c.startPeriod, exam.duration, f});
    }
}

void ExamSearchProblem::unplace(int examId, const ExamCandidate& c) {
    const Exam& exam = problem_.exams[examId];
    state_.release(booking(examId, c));

    for (int st : exam.studentIds) --studentDay_[st][c.day];
    int base = inst_.grid.slotIndex(c.day, c.startPeriod);
    for (int k = 0; k < exam.duration; ++k) slotSeated_[base + k] -= (int)exam.studentIds.size();

    placements_[examId] = ExamPlacement();
    duties_[examId].clear();
}

void ExamSearchProblem::culprits(int examId, std::vector<int>& out) const {
    // Invigilator availability depends on every placed exam.
    if (staffingFailed_[examId]) {
        for (const ExamPlacement& p : placements_) {
            if (p.placed()) out.push_back(p.examId);
        }
        return;
    }

    const Exam& exam = problem_.exams[examId];
    for (const ExamCandidate& c : static_[examId]) {
        Booking b{examId, c.day, c.startPeriod, exam.duration, c.roomIds, {}};
        state_.blockers(b, out);
        if (config_.maxStudentsPerSlot > 0) {
            int base = inst_.grid.slotIndex(c.day, c.startPeriod);
            for (int k = 0; k < exam.duration; ++k) {
                for (int other : state_.activitiesAt(base + k)) out.push_back(other);
            }
        }
    }
    if (config_.maxExamsPerStudentPerDay > 0) {
        for (int n : clashes_.neighbours(examId)) {
            if (placements_[n].placed()) out.push_back(n);
        }
    }
}


///////////////////////////
///      SCHEDULER      ///
///////////////////////////
/**
 * @brief Validate, place exams, then seat students and staff rooms.
 */
ExamResult ExamScheduler::schedule(const ProblemInstance& inst, const ExamProblem& problem,
                                   const TimetableSolution* committed, const ExamConfig& config) {
    validateInstance(inst);
    validateExamProblem(inst, problem, committed);
    validateConfig(config);

    stop_ = false;
    SearchBudget budget(config.timeBudget, &stop_);
    ExamResult result;

    ExamSearchProblem search(inst, problem, committed, config);
    Infeasibility inf = search.staticInfeasibility();
    if (inf.kind != FailureKind::NONE) {
        result.failure = inf;
        if (config.verbose) std::cerr << "[exam] " << inf.constraint << ": " << inf.reason << "\n";
        return result;
    }

    BacktrackingSearch<ExamSearchProblem> bt(search, config.backtrackBudget, config.retryBudget, budget,
                                             result.stats);
    BacktrackingSearch<ExamSearchProblem>::Outcome outcome = bt.run();
    if (outcome.failure != FailureKind::NONE) {
        Infeasibility& failure = result.failure;
        failure.kind = outcome.failure;
        if (outcome.failure == FailureKind::BUDGET_EXCEEDED) {
            failure.constraint = "budget";
            failure.reason = outcome.budgetReason;
        } else {
            failure.constraint = "search-exhausted";
            failure.reason = "no clash-free exam schedule exists";
        }

        int hardest = outcome.hardestActivity;
        if (hardest >= 0) {
            failure.reason += "; exam " + problem.exams[hardest].name + " failed most often";
            if (search.staffingFailed(hardest)) failure.reason += " (not enough invigilators)";
            failure.sectionIds.push_back(hardest);
            for (int c : outcome.culprits) {
                if (c != hardest) failure.sectionIds.push_back(c);
            }
            std::set<int> rooms;
            for (const ExamCandidate& c : search.staticCandidates(hardest)) rooms.insert(c.roomIds.begin(), c.roomIds.end());
            failure.roomIds.assign(rooms.begin(), rooms.end());
            if (search.staffingFailed(hardest)) failure.facultyIds = search.pool();
        }
        if (config.verbose) {
            std::cerr << "[exam] " << failureKindName(failure.kind) << " (" << failure.constraint
                      << "): " << failure.reason << "\n";
        }
        return result;
    }

    ExamSchedule schedule;
    schedule.placements = search.placements();
    SeatingPlanner planner(inst, config.antiCheatAdjacency);
    for (const Exam& exam : problem.exams) {
        const std::vector<InvigilatorAssignment>& duties = search.duties(exam.id);
        schedule.invigilators.insert(schedule.invigilators.end(), duties.begin(), duties.end());
        planner.seat(exam, schedule.placements[exam.id].roomIds, schedule.seats, schedule.seatingReports);
    }

    ExamEvaluator evaluator(config);
    Evaluation ev = evaluator.evaluate(inst, problem, search.clashes(), schedule, committed);
    if (!ev.feasible()) {
        const HardViolation& v = ev.violations.front();
        result.failure.kind = FailureKind::INFEASIBLE;
        result.failure.constraint = constraintKindName(v.kind);
        result.failure.reason = v.describe();
        result.failure.sectionIds = v.activityIds;
        if (v.roomId >= 0) result.failure.roomIds.push_back(v.roomId);
        if (v.facultyId >= 0) result.failure.facultyIds.push_back(v.facultyId);
        if (config.verbose) std::cerr << "[exam] placed schedule rejected: " << v.describe() << "\n";
        return result;
    }

    schedule.softCost = ev.softCost;
    result.stats.initialCost = ev.softCost;
    result.stats.finalCost = ev.softCost;
    if (config.verbose) {
        std::cerr << "[exam] placed " << problem.exams.size() << " exams, " << schedule.seats.size()
                  << " seats, " << schedule.invigilators.size() << " duties, cost " << ev.softCost << " in "
                  << budget.elapsedMs() << " ms\n";
    }
    result.schedule = std::move(schedule);
    return result;
}
