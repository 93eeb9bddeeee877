///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "seating.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>


///////////////////////////
///       SEATING       ///
///////////////////////////
SeatingPlanner::SeatingPlanner(const ProblemInstance& inst, bool antiCheat)
        : inst_(inst), antiCheat_(antiCheat) {}

std::string SeatingPlanner::seatLabel(const Room& room, int bench, int seat) {
    std::string label = room.name + "-R" + std::to_string(bench / 2 + 1) + "-";
    label += (bench % 2 == 0) ? 'L' : 'R';
    label += (seat == 0) ? 'A' : 'B';
    return label;
}

std::vector<std::vector<int>> SeatingPlanner::groups(const Exam& exam) const {
    // Section id -> students; students outside every section get a private key.
    std::map<int, std::vector<int>> bySection;
    std::vector<int> students = exam.studentIds;
    std::sort(students.begin(), students.end());
    for (int st : students) {
        int key = sectionForCourse(inst_, st, exam.courseId);
        if (key < 0) key = -2 - st;
        bySection[key].push_back(st);
    }

    std::vector<std::vector<int>> result;
    for (auto& entry : bySection) result.push_back(std::move(entry.second));
    std::stable_sort(result.begin(), result.end(), [](const std::vector<int>& a, const std::vector<int>& b) {
        return a.size() > b.size();
    });
    return result;
}

SeatingNeed SeatingPlanner::need(const Exam& exam) const {
    SeatingNeed need;
    int n = (int)exam.studentIds.size();
    if (exam.seatsPerBench == 1) {
        need.singles = n;
        return need;
    }
    if (!antiCheat_) {
        need.pairs = n / 2;
        need.singles = n % 2;
        return need;
    }
    std::vector<std::vector<int>> g = groups(exam);
    int largest = g.empty() ? 0 : (int)g.front().size();
    need.pairs = std::min(n / 2, n - largest);
    need.singles = n - 2 * need.pairs;
    return need;
}

std::vector<BenchUnit> SeatingPlanner::benchUnits(const Exam& exam) const {
    std::vector<BenchUnit> units;
    std::vector<int> students = exam.studentIds;
    std::sort(students.begin(), students.end());

    if (exam.seatsPerBench == 1) {
        for (int st : students) units.push_back({st, -1});
        return units;
    }

    if (!antiCheat_) {
        for (size_t i = 0; i + 1 < students.size(); i += 2) units.push_back({students[i], students[i + 1]});
        if (students.size() % 2 == 1) units.push_back({students.back(), -1});
        return units;
    }

    // Remaining students per group, consumed from the front (lowest id first).
    std::vector<std::vector<int>> g = groups(exam);
    std::vector<size_t> next(g.size(), 0);
    auto remaining = [&](size_t i) { return g[i].size() - next[i]; };

    std::vector<int> singles;
    while (true) {
        // Largest and next-largest non-empty groups; ties keep the earlier group.
        int a = -1, b = -1;
        for (size_t i = 0; i < g.size(); ++i) {
            if (remaining(i) == 0) continue;
            if (a < 0 || remaining(i) > remaining(a)) {
                b = a;
                a = (int)i;
            } else if (b < 0 || remaining(i) > remaining(b)) {
                b = (int)i;
            }
        }
        if (a < 0) break;
        if (b < 0) {
            // A lone group is left: its students sit alone.
            while (remaining(a) > 0) singles.push_back(g[a][next[a]++]);
            break;
        }
        int first = g[a][next[a]++];
        int second = g[b][next[b]++];
        units.push_back({std::min(first, second), std::max(first, second)});
    }
    std::sort(singles.begin(), singles.end());
    for (int st : singles) units.push_back({st, -1});
    return units;
}

std::vector<int> SeatingPlanner::distribute(const SeatingNeed& need, const std::vector<int>& roomIds) const {
    std::vector<int> counts;
    int pairsLeft = need.pairs;
    int singlesLeft = need.singles;
    for (int r : roomIds) {
        int benches = benchCount(inst_.rooms[r]);
        int pairs = std::min(benches, pairsLeft);
        int singles = std::min(benches - pairs, singlesLeft);
        pairsLeft -= pairs;
        singlesLeft -= singles;
        counts.push_back(2 * pairs + singles);
    }
    if (pairsLeft > 0 || singlesLeft > 0) return {};
    return counts;
}

/**
 * @brief Fill benches room by room, bench by bench, in unit order.
 */
void SeatingPlanner::seat(const Exam& exam, const std::vector<int>& roomIds, std::vector<SeatAssignment>& seats,
                          std::vector<SeatingReport>& reports) const {
    std::vector<BenchUnit> units = benchUnits(exam);
    size_t next = 0;

    for (int r : roomIds) {
        const Room& room = inst_.rooms[r];
        int benches = benchCount(room);
        int seated = 0;
        for (int b = 0; b < benches && next < units.size(); ++b, ++next) {
            const BenchUnit& unit = units[next];
            seats.push_back({exam.id, r, seatLabel(room, b, 0), unit.first, b / 2, b, 0});
            ++seated;
            if (unit.second >= 0) {
                seats.push_back({exam.id, r, seatLabel(room, b, 1), unit.second, b / 2, b, 1});
                ++seated;
            }
        }
        int physical = benches * 2;
        reports.push_back({exam.id, r, seated, physical - seated, 100.0 * seated / physical});
    }

    if (next < units.size())
        throw std::invalid_argument("rooms of exam " + exam.name + " offer too few benches");
}
