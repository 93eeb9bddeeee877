///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "timetable_search.hpp"
#include "backtracking.hpp"
#include <algorithm>
#include <numeric>
#include <set>
#include <tuple>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief True if none of the block's slots is listed as unavailable.
 */
static bool blockAvailable(const TimeGrid& grid, const std::vector<int>& unavailable, int day, int start, int duration) {
    for (int k = 0; k < duration; ++k) {
        int slot = grid.slotIndex(day, start + k);
        if (std::find(unavailable.begin(), unavailable.end(), slot) != unavailable.end())
            return false;
    }
    return true;
}

static bool blockAvoidsBreaks(const TimeGrid& grid, int start, int duration) {
    for (int k = 0; k < duration; ++k) {
        if (grid.isBreak(start + k)) return false;
    }
    return true;
}

/**
 * @brief Rooms a section may be taught in, ignoring time.
 */
static std::vector<int> suitableRooms(const ProblemInstance& inst, const Section& s) {
    std::vector<int> rooms;
    for (const Room& r : inst.rooms) {
        if (!r.examOnly && r.capacity >= s.enrolled && hasAllTags(r.tags, s.requiredTags))
            rooms.push_back(r.id);
    }
    return rooms;
}


///////////////////////////
///   SEARCH CONTEXT    ///
///////////////////////////
/**
 * @brief Enumerate static candidates of every section and derive the processing order.
 *
 * Candidates are generated in (day, period, room, faculty) order. The order
 * puts sections with fewer candidates first, then higher clash degree, longer
 * duration and lower id.
 */
SearchContext::SearchContext(const ProblemInstance& inst, int maxDailySections)
        : inst(inst), maxDailySections(maxDailySections), clashes(ClashGraph::forSections(inst)) {
    const TimeGrid& grid = inst.grid;
    int n = (int)inst.sections.size();
    eligible.resize(n);
    staticCandidates.resize(n);

    for (const Section& s : inst.sections) {
        eligible[s.id] = eligibleFaculty(inst, s);
        std::vector<int> rooms = suitableRooms(inst, s);

        std::vector<Candidate>& out = staticCandidates[s.id];
        for (int day = 0; day < grid.days; ++day) {
            for (int start = 0; start + s.duration <= grid.periodsPerDay; ++start) {
                if (!blockAvoidsBreaks(grid, start, s.duration)) continue;

                for (int r : rooms) {
                    if (!blockAvailable(grid, inst.rooms[r].unavailableSlots, day, start, s.duration)) continue;

                    for (int f : eligible[s.id]) {
                        const Faculty& fac = inst.faculty[f];
                        if (fac.maxLoad < s.duration) continue;
                        if (!blockAvailable(grid, fac.unavailableSlots, day, start, s.duration)) continue;
                        out.push_back({day, start, r, f});
                    }
                }
            }
        }
    }

    order.resize(n);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](int a, int b) {
        size_t ca = staticCandidates[a].size();
        size_t cb = staticCandidates[b].size();
        if (ca != cb) return ca < cb;
        if (clashes.degree(a) != clashes.degree(b)) return clashes.degree(a) > clashes.degree(b);
        if (inst.sections[a].duration != inst.sections[b].duration)
            return inst.sections[a].duration > inst.sections[b].duration;
        return a < b;
    });
}

std::optional<Infeasibility> SearchContext::staticInfeasibility() const {
    for (int sid : order) {
        if (staticCandidates[sid].empty()) return diagnose(sid);
    }
    return std::nullopt;
}

/**
 * @brief Replay the static filters one at a time to find the one that empties the set.
 */
Infeasibility SearchContext::diagnose(int sectionId) const {
    const Section& s = inst.sections[sectionId];
    Infeasibility inf;
    inf.kind = FailureKind::INFEASIBLE;
    inf.sectionIds = {sectionId};

    std::vector<int> bigEnough;
    int largest = 0;
    for (const Room& r : inst.rooms) {
        if (r.examOnly) continue;
        largest = std::max(largest, r.capacity);
        if (r.capacity >= s.enrolled) bigEnough.push_back(r.id);
    }
    if (bigEnough.empty()) {
        inf.constraint = "room-capacity";
        inf.reason = "section " + s.name + " has " + std::to_string(s.enrolled) +
                     " students but the largest teaching room seats " + std::to_string(largest);
        for (const Room& r : inst.rooms) {
            if (!r.examOnly) inf.roomIds.push_back(r.id);
        }
        return inf;
    }

    std::vector<int> rooms = suitableRooms(inst, s);
    if (rooms.empty()) {
        inf.constraint = "room-capability";
        inf.reason = "no room large enough for section " + s.name + " offers its required tags";
        inf.roomIds = bigEnough;
        return inf;
    }

    const std::vector<int>& qualified = eligible[sectionId];
    if (qualified.empty()) {
        inf.constraint = "faculty-qualification";
        inf.reason = "no faculty member is qualified to teach section " + s.name;
        return inf;
    }

    std::vector<int> withLoad;
    for (int f : qualified) {
        if (inst.faculty[f].maxLoad >= s.duration) withLoad.push_back(f);
    }
    if (withLoad.empty()) {
        inf.constraint = "faculty-load";
        inf.reason = "every qualified faculty member of section " + s.name + " has a max load below " +
                     std::to_string(s.duration);
        inf.facultyIds = qualified;
        return inf;
    }

    inf.constraint = "availability";
    inf.reason = "no start slot of section " + s.name +
                 " has a suitable room and a qualified faculty member both available";
    inf.roomIds = rooms;
    inf.facultyIds = withLoad;
    return inf;
}

Booking SearchContext::booking(int sectionId, const Candidate& c) const {
    return {sectionId, c.day, c.startPeriod, inst.sections[sectionId].duration, {c.roomId}, {c.facultyId}};
}

Assignment SearchContext::assignment(int sectionId, const Candidate& c) const {
    Assignment a;
    a.sectionId = sectionId;
    a.day = c.day;
    a.startPeriod = c.startPeriod;
    a.roomId = c.roomId;
    a.facultyId = c.facultyId;
    return a;
}

bool SearchContext::live(const ScheduleState& state, int sectionId, const Candidate& c) const {
    int duration = inst.sections[sectionId].duration;
    if (state.facultyLoad(c.facultyId) + duration > inst.faculty[c.facultyId].maxLoad) return false;
    if (maxDailySections > 0 && state.facultyDayCount(c.facultyId, c.day) >= maxDailySections) return false;
    return state.canBook(booking(sectionId, c));
}

ScheduleState SearchContext::stateFor(const std::vector<Assignment>& assignments, const std::vector<int>& skip) const {
    ScheduleState state(inst.grid, (int)inst.rooms.size(), (int)inst.faculty.size(), clashes);
    for (const Assignment& a : assignments) {
        if (!a.assigned()) continue;
        if (std::find(skip.begin(), skip.end(), a.sectionId) != skip.end()) continue;
        Candidate c{a.day, a.startPeriod, a.roomId, a.facultyId};
        state.book(booking(a.sectionId, c));
    }
    return state;
}


///////////////////////////
///    CONSTRUCTIVE     ///
///////////////////////////
TimetableSearchProblem::TimetableSearchProblem(const SearchContext& ctx, std::uint64_t seed)
        : ctx_(ctx),
          state_(ctx.inst.grid, (int)ctx.inst.rooms.size(), (int)ctx.inst.faculty.size(), ctx.clashes),
          rng_(seed) {
    int n = (int)ctx.inst.sections.size();
    int slots = ctx.inst.grid.slotCount();
    assignments_.assign(n, Assignment());
    decided_.assign(n, 0);
    roomDemand_.assign(ctx.inst.rooms.size(), 0);
    facultyDemand_.assign(ctx.inst.faculty.size(), 0);
    roomsOf_.resize(n);
    facultyOf_.resize(n);
    covers_.assign(n, std::vector<char>(slots, 0));

    for (int sid = 0; sid < n; ++sid) {
        std::set<int> rooms, faculty;
        int duration = ctx.inst.sections[sid].duration;
        for (const Candidate& c : ctx.staticCandidates[sid]) {
            rooms.insert(c.roomId);
            faculty.insert(c.facultyId);
            int base = ctx.inst.grid.slotIndex(c.day, c.startPeriod);
            for (int k = 0; k < duration; ++k) covers_[sid][base + k] = 1;
        }
        roomsOf_[sid].assign(rooms.begin(), rooms.end());
        facultyOf_[sid].assign(faculty.begin(), faculty.end());
        adjustDemand(sid, +1);
    }
}

void TimetableSearchProblem::adjustDemand(int sectionId, int delta) {
    for (int r : roomsOf_[sectionId]) roomDemand_[r] += delta;
    for (int f : facultyOf_[sectionId]) facultyDemand_[f] += delta;
}

void TimetableSearchProblem::openFrame(int sectionId) {
    decided_[sectionId] = 1;
    adjustDemand(sectionId, -1);
}

void TimetableSearchProblem::closeFrame(int sectionId) {
    decided_[sectionId] = 0;
    adjustDemand(sectionId, +1);
}

/**
 * @brief Filter static candidates against the partial schedule and rank them.
 *
 * Score = demand of undecided sections on the room + on the faculty member +
 * slots of the block that undecided clash neighbours could still start over.
 * Lower scores leave more room for the sections still to come.
 */
std::vector<Candidate> TimetableSearchProblem::liveCandidates(int sectionId) {
    struct Ranked {
        long score;
        std::uint64_t key;
        Candidate c;
    };

    const TimeGrid& grid = ctx_.inst.grid;
    int duration = ctx_.inst.sections[sectionId].duration;
    const std::vector<int>& neighbours = ctx_.clashes.neighbours(sectionId);

    std::vector<Ranked> ranked;
    for (const Candidate& c : ctx_.staticCandidates[sectionId]) {
        if (!ctx_.live(state_, sectionId, c)) continue;

        long score = roomDemand_[c.roomId] + facultyDemand_[c.facultyId];
        int base = grid.slotIndex(c.day, c.startPeriod);
        for (int n : neighbours) {
            if (decided_[n]) continue;
            for (int k = 0; k < duration; ++k) score += covers_[n][base + k];
        }
        ranked.push_back({score, rng_(), c});
    }

    std::sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        return std::tie(a.score, a.key, a.c.day, a.c.startPeriod, a.c.roomId, a.c.facultyId) <
               std::tie(b.score, b.key, b.c.day, b.c.startPeriod, b.c.roomId, b.c.facultyId);
    });

    std::vector<Candidate> result;
    result.reserve(ranked.size());
    for (const Ranked& r : ranked) result.push_back(r.c);
    return result;
}

void TimetableSearchProblem::place(int sectionId, const Candidate& c) {
    state_.book(ctx_.booking(sectionId, c));
    assignments_[sectionId] = ctx_.assignment(sectionId, c);
}

void TimetableSearchProblem::unplace(int sectionId, const Candidate& c) {
    state_.release(ctx_.booking(sectionId, c));
    assignments_[sectionId] = Assignment();
}

void TimetableSearchProblem::culprits(int sectionId, std::vector<int>& out) const {
    int duration = ctx_.inst.sections[sectionId].duration;
    std::set<int> saturated;
    std::set<std::pair<int, int>> fullDays;
    for (const Candidate& c : ctx_.staticCandidates[sectionId]) {
        state_.blockers(ctx_.booking(sectionId, c), out);
        if (state_.facultyLoad(c.facultyId) + duration > ctx_.inst.faculty[c.facultyId].maxLoad)
            saturated.insert(c.facultyId);
        if (ctx_.maxDailySections > 0 && state_.facultyDayCount(c.facultyId, c.day) >= ctx_.maxDailySections)
            fullDays.insert({c.facultyId, c.day});
    }
    for (const Assignment& a : assignments_) {
        if (!a.assigned()) continue;
        if (saturated.count(a.facultyId) || fullDays.count({a.facultyId, a.day})) out.push_back(a.sectionId);
    }
}

std::optional<std::vector<Assignment>> constructTimetable(const SearchContext& ctx, const SolverConfig& config,
                                                          std::uint64_t seed, const SearchBudget& budget,
                                                          SolverStats& stats, Infeasibility& failure) {
    if (std::optional<Infeasibility> inf = ctx.staticInfeasibility()) {
        failure = *inf;
        return std::nullopt;
    }

    TimetableSearchProblem problem(ctx, seed);
    BacktrackingSearch<TimetableSearchProblem> search(problem, config.backtrackBudget, config.retryBudget,
                                                      budget, stats);
    BacktrackingSearch<TimetableSearchProblem>::Outcome outcome = search.run();
    if (outcome.failure == FailureKind::NONE) return problem.assignments();

    failure = Infeasibility();
    failure.kind = outcome.failure;
    if (outcome.failure == FailureKind::BUDGET_EXCEEDED) {
        failure.constraint = "budget";
        failure.reason = outcome.budgetReason;
    } else {
        failure.constraint = "search-exhausted";
        failure.reason = "no clash-free timetable exists";
    }

    int hardest = outcome.hardestActivity;
    if (hardest >= 0) {
        const Section& s = ctx.inst.sections[hardest];
        failure.reason += "; section " + s.name + " failed most often";
        failure.sectionIds.push_back(hardest);
        for (int c : outcome.culprits) {
            if (c != hardest) failure.sectionIds.push_back(c);
        }
        std::set<int> rooms;
        for (const Candidate& c : ctx.staticCandidates[hardest]) rooms.insert(c.roomId);
        failure.roomIds.assign(rooms.begin(), rooms.end());
        failure.facultyIds = ctx.eligible[hardest];
    }
    return std::nullopt;
}


///////////////////////////
///    LOCAL SEARCH     ///
///////////////////////////
LocalSearch::LocalSearch(const SearchContext& ctx, const SolverConfig& config)
        : ctx_(ctx), config_(config), evaluator_(config), rng_(config.seed) {}

Evaluation LocalSearch::evaluate(const std::vector<Assignment>& assignments) const {
    return evaluator_.evaluate(ctx_.inst, ctx_.clashes, assignments);
}

bool LocalSearch::accepts(double currentCost, double proposedCost, std::mt19937_64& rng) const {
    if (proposedCost < currentCost - 1e-9) return true;
    if (config_.acceptWorseProbability <= 0.0) return false;
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    return coin(rng) < config_.acceptWorseProbability;
}

std::optional<Proposal> LocalSearch::propose(const std::vector<Assignment>& current, std::mt19937_64& rng) const {
    std::uniform_int_distribution<int> pick(0, 1);
    if (pick(rng) == 0) return relocate(current, rng);
    return facultyBlock(current, rng);
}

/**
 * @brief Move one random section to a different live candidate.
 */
std::optional<Proposal> LocalSearch::relocate(const std::vector<Assignment>& current, std::mt19937_64& rng) const {
    int n = (int)current.size();
    if (n == 0) return std::nullopt;
    int sid = std::uniform_int_distribution<int>(0, n - 1)(rng);

    ScheduleState state = ctx_.stateFor(current, {sid});
    std::vector<Candidate> options;
    for (const Candidate& c : ctx_.staticCandidates[sid]) {
        if (ctx_.assignment(sid, c) == current[sid]) continue;
        if (ctx_.live(state, sid, c)) options.push_back(c);
    }
    if (options.empty()) return std::nullopt;

    const Candidate& c = options[std::uniform_int_distribution<size_t>(0, options.size() - 1)(rng)];
    Proposal p{MoveKind::RELOCATE, sid, current};
    p.assignments[sid] = ctx_.assignment(sid, c);
    return p;
}

/**
 * @brief Lift every section of one faculty member and put them back one by one.
 *
 * Each section keeps its faculty member. Candidates touching another block
 * of the same person are preferred, which tends to close faculty gaps.
 */
std::optional<Proposal> LocalSearch::facultyBlock(const std::vector<Assignment>& current, std::mt19937_64& rng) const {
    std::vector<int> teaching;
    for (const Faculty& f : ctx_.inst.faculty) {
        for (const Assignment& a : current) {
            if (a.assigned() && a.facultyId == f.id) {
                teaching.push_back(f.id);
                break;
            }
        }
    }
    if (teaching.empty()) return std::nullopt;
    int fid = teaching[std::uniform_int_distribution<size_t>(0, teaching.size() - 1)(rng)];

    std::vector<int> moved;
    for (const Assignment& a : current) {
        if (a.assigned() && a.facultyId == fid) moved.push_back(a.sectionId);
    }
    std::shuffle(moved.begin(), moved.end(), rng);

    ScheduleState state = ctx_.stateFor(current, moved);
    Proposal p{MoveKind::FACULTY_BLOCK, fid, current};
    const TimeGrid& grid = ctx_.inst.grid;

    for (int sid : moved) {
        int duration = ctx_.inst.sections[sid].duration;
        std::vector<Candidate> options, touching;
        for (const Candidate& c : ctx_.staticCandidates[sid]) {
            if (c.facultyId != fid || !ctx_.live(state, sid, c)) continue;
            options.push_back(c);
            int before = c.startPeriod - 1;
            int after = c.startPeriod + duration;
            bool touches = (before >= 0 && state.facultyOccupant(fid, grid.slotIndex(c.day, before)) >= 0) ||
                           (after < grid.periodsPerDay && state.facultyOccupant(fid, grid.slotIndex(c.day, after)) >= 0);
            if (touches) touching.push_back(c);
        }
        if (options.empty()) return std::nullopt;

        const std::vector<Candidate>& pool = touching.empty() ? options : touching;
        const Candidate& c = pool[std::uniform_int_distribution<size_t>(0, pool.size() - 1)(rng)];
        state.book(ctx_.booking(sid, c));
        p.assignments[sid] = ctx_.assignment(sid, c);
    }
    return p;
}

/**
 * @brief Hill climbing with occasional acceptance of non-improving moves.
 *
 * Tracks the best schedule seen; running out of moves or time simply ends
 * the refinement.
 */
TimetableSolution LocalSearch::run(const std::vector<Assignment>& start, const SearchBudget& budget,
                                   SolverStats& stats) {
    std::vector<Assignment> current = start;
    double currentCost = evaluate(current).softCost;

    TimetableSolution best;
    best.assignments = current;
    best.softCost = currentCost;
    stats.initialCost = currentCost;

    for (long move = 0; move < config_.moveBudget; ++move) {
        if (budget.exhausted()) break;
        ++stats.movesTried;

        std::optional<Proposal> proposal = propose(current, rng_);
        if (!proposal) continue;

        Evaluation next = evaluate(proposal->assignments);
        if (!next.feasible()) continue;
        if (!accepts(currentCost, next.softCost, rng_)) continue;

        current = std::move(proposal->assignments);
        currentCost = next.softCost;
        ++stats.movesAccepted;
        if (config_.recordTrace) stats.trace.push_back({move, (int)next.violations.size(), currentCost});

        if (currentCost < best.softCost) {
            best.assignments = current;
            best.softCost = currentCost;
        }
    }

    stats.finalCost = best.softCost;
    return best;
}
