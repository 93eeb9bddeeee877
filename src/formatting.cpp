///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include <algorithm>
#include <iomanip>
#include <string>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Lightweight view of one placed section, with its references resolved.
 */
struct SlotView {
    int day; ///< Day index.
    int period; ///< First period.
    const Section* section; ///< Section taught (non-owning).
    const Faculty* faculty; ///< Faculty teaching (may be null).
    const Room* room; ///< Room used (may be null).
};

static SlotView makeView(const ProblemInstance& inst, const Assignment& a) {
    SlotView view;
    view.day = a.day;
    view.period = a.startPeriod;
    view.section = &inst.sections[a.sectionId];
    view.faculty = (a.facultyId >= 0 && a.facultyId < (int)inst.faculty.size()) ? &inst.faculty[a.facultyId] : nullptr;
    view.room = (a.roomId >= 0 && a.roomId < (int)inst.rooms.size()) ? &inst.rooms[a.roomId] : nullptr;
    return view;
}

/**
 * @brief Time range covered by a section, e.g. "08:00-09:00 +1".
 */
static std::string timeLabel(const TimeGrid& grid, int period, int duration) {
    std::string label = grid.periodLabel(period);
    if (duration > 1) label += " +" + std::to_string(duration - 1);
    return label;
}

/**
 * @brief Print the header row for a per-day schedule table.
 */
static void printDayTableHeader(std::ostream& out) {
    out << "    "
        << std::left << std::setw(14) << "Time"
        << " | " << std::left << std::setw(12) << "Section"
        << " | " << std::left << std::setw(8) << "Type"
        << " | " << std::left << std::setw(14) << "Faculty"
        << " | " << std::left << std::setw(8) << "Room"
        << "\n";

    out << "    "
        << std::string(14, '-')
        << "-+-" << std::string(12, '-')
        << "-+-" << std::string(8, '-')
        << "-+-" << std::string(14, '-')
        << "-+-" << std::string(8, '-')
        << "\n";
}

/**
 * @brief Print views grouped by day and ordered by period, one table per day.
 */
static void printDayTables(const TimeGrid& grid, std::vector<SlotView> slots, std::ostream& out) {
    std::sort(slots.begin(), slots.end(), [](const SlotView& a, const SlotView& b) {
        if (a.day != b.day) return a.day < b.day;
        return a.period < b.period;
    });

    if (slots.empty()) {
        out << "  (no classes)\n";
        return;
    }

    int currentDay = -1;
    for (const SlotView& s : slots) {
        if (s.day != currentDay) {
            currentDay = s.day;
            out << "\n  " << grid.dayName(s.day) << ":\n";
            printDayTableHeader(out);
        }
        out << "    "
            << std::left << std::setw(14) << timeLabel(grid, s.period, s.section->duration)
            << " | " << std::left << std::setw(12) << s.section->name
            << " | " << std::left << std::setw(8) << sectionKindName(s.section->kind)
            << " | " << std::left << std::setw(14) << (s.faculty ? s.faculty->name : "UnknownFaculty")
            << " | " << std::left << std::setw(8) << (s.room ? s.room->name : "UnknownRoom")
            << "\n";
    }
    out << "\n";
}

void printAssignments(const ProblemInstance& inst, const TimetableSolution& sol, std::ostream& out) {
    for (const Assignment& a : sol.assignments) {
        if (!a.assigned()) continue;
        const Section& s = inst.sections[a.sectionId];
        out << "Section " << s.id
            << " | " << s.name
            << " | Course=" << inst.courses[s.courseId].code
            << " | Faculty=" << inst.faculty[a.facultyId].name
            << " | Day=" << a.day
            << " Period=" << a.startPeriod
            << " Room=" << inst.rooms[a.roomId].name
            << "\n";
    }
}

void printFacultySchedules(const ProblemInstance& inst, const TimetableSolution& sol, std::ostream& out) {
    for (const Faculty& f : inst.faculty) {
        out << "----------------------------------------\n";
        out << "Schedule for " << f.name << ":\n";

        std::vector<SlotView> slots;
        for (const Assignment& a : sol.assignments) {
            if (a.assigned() && a.facultyId == f.id) slots.push_back(makeView(inst, a));
        }
        printDayTables(inst.grid, slots, out);
    }
}

void printStudentSchedule(const ProblemInstance& inst, const TimetableSolution& sol, int studentId, std::ostream& out) {
    if (studentId < 0 || studentId >= (int)inst.students.size()) return;
    const Student& st = inst.students[studentId];
    out << "----------------------------------------\n";
    out << "Schedule for " << st.name << ":\n";

    std::vector<SlotView> slots;
    for (int sid : st.sectionIds) {
        if (sid < 0 || sid >= (int)sol.assignments.size()) continue;
        const Assignment& a = sol.assignments[sid];
        if (a.assigned()) slots.push_back(makeView(inst, a));
    }
    printDayTables(inst.grid, slots, out);
}

void printExamSchedule(const ProblemInstance& inst, const ExamProblem& problem, const ExamSchedule& schedule,
                       std::ostream& out) {
    for (const ExamPlacement& p : schedule.placements) {
        if (!p.placed()) continue;
        const Exam& exam = problem.exams[p.examId];
        out << "----------------------------------------\n";
        out << exam.name << " (" << exam.studentIds.size() << " students, "
            << (exam.seatsPerBench == 1 ? "one" : "two") << " per bench)\n";
        out << "  " << inst.grid.dayName(p.day) << " " << timeLabel(inst.grid, p.startPeriod, exam.duration) << "\n";

        for (size_t i = 0; i < p.roomIds.size(); ++i) {
            const Room& room = inst.rooms[p.roomIds[i]];
            out << "    " << std::left << std::setw(8) << room.name << " seated " << std::setw(4) << p.seatCounts[i];

            for (const SeatingReport& r : schedule.seatingReports) {
                if (r.examId != exam.id || r.roomId != room.id) continue;
                out << " empty " << std::setw(4) << r.emptySeats
                    << " efficiency " << std::fixed << std::setprecision(1) << r.efficiency << "%";
                out.unsetf(std::ios::fixed);
            }

            out << " | invigilators:";
            for (const InvigilatorAssignment& d : schedule.invigilators) {
                if (d.examId == exam.id && d.roomId == room.id) out << " " << inst.faculty[d.facultyId].name;
            }
            out << "\n";
        }
    }
}

void printFailure(const Infeasibility& failure, std::ostream& out) {
    out << "Failure: " << failureKindName(failure.kind);
    if (!failure.constraint.empty()) out << " (" << failure.constraint << ")";
    out << "\n  " << failure.reason << "\n";

    auto printIds = [&](const char* label, const std::vector<int>& ids) {
        if (ids.empty()) return;
        out << "  " << label << ":";
        for (int id : ids) out << " " << id;
        out << "\n";
    };
    printIds("activities", failure.sectionIds);
    printIds("rooms", failure.roomIds);
    printIds("faculty", failure.facultyIds);
}
