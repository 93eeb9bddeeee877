///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "errors.hpp"
#include <algorithm>


///////////////////////////
///      TIME GRID      ///
///////////////////////////
bool TimeGrid::isBreak(int period) const {
    return std::find(breakPeriods.begin(), breakPeriods.end(), period) != breakPeriods.end();
}

std::string TimeGrid::dayName(int day) const {
    if (day >= 0 && day < (int)dayNames.size()) return dayNames[day];
    return "Day " + std::to_string(day + 1);
}

std::string TimeGrid::periodLabel(int period) const {
    if (period >= 0 && period < (int)periodLabels.size()) return periodLabels[period];
    return "P" + std::to_string(period + 1);
}


///////////////////////////
///     ASSIGNMENTS     ///
///////////////////////////
bool operator==(const Assignment& a, const Assignment& b) {
    return a.sectionId == b.sectionId && a.day == b.day && a.startPeriod == b.startPeriod &&
           a.roomId == b.roomId && a.facultyId == b.facultyId;
}

bool operator!=(const Assignment& a, const Assignment& b) {
    return !(a == b);
}

bool operator==(const ExamPlacement& a, const ExamPlacement& b) {
    return a.examId == b.examId && a.day == b.day && a.startPeriod == b.startPeriod &&
           a.roomIds == b.roomIds && a.seatCounts == b.seatCounts;
}

bool operator!=(const ExamPlacement& a, const ExamPlacement& b) {
    return !(a == b);
}


///////////////////////////
///       HELPERS       ///
///////////////////////////
std::string sectionKindName(SectionKind kind) {
    switch (kind) {
        case SectionKind::LECTURE:  return "Lecture";
        case SectionKind::TUTORIAL: return "Tutorial";
        case SectionKind::LAB:      return "Lab";
    }
    return "Unknown";
}

std::string failureKindName(FailureKind kind) {
    switch (kind) {
        case FailureKind::NONE:            return "none";
        case FailureKind::INFEASIBLE:      return "infeasible";
        case FailureKind::BUDGET_EXCEEDED: return "budget_exceeded";
    }
    return "unknown";
}

bool hasAllTags(const std::vector<std::string>& offered, const std::vector<std::string>& required) {
    for (const std::string& tag : required) {
        if (std::find(offered.begin(), offered.end(), tag) == offered.end())
            return false;
    }
    return true;
}

/**
 * @brief Resolve the faculty allowed to teach a section.
 *
 * An explicit list on the section wins; otherwise course qualifications
 * decide. The result is sorted so candidate enumeration stays deterministic.
 */
std::vector<int> eligibleFaculty(const ProblemInstance& inst, const Section& section) {
    std::vector<int> result;
    if (!section.qualifiedFaculty.empty()) {
        result = section.qualifiedFaculty;
    } else {
        for (const Faculty& f : inst.faculty) {
            if (std::find(f.qualifiedCourses.begin(), f.qualifiedCourses.end(), section.courseId) !=
                f.qualifiedCourses.end()) {
                result.push_back(f.id);
            }
        }
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

int sectionForCourse(const ProblemInstance& inst, int studentId, int courseId) {
    if (studentId < 0 || studentId >= (int)inst.students.size()) return -1;
    int best = -1;
    for (int sid : inst.students[studentId].sectionIds) {
        if (sid < 0 || sid >= (int)inst.sections.size() || inst.sections[sid].courseId != courseId) continue;
        // The smallest section is the student's own group (tutorial or lab rather than the lecture).
        if (best < 0 || inst.sections[sid].enrolled < inst.sections[best].enrolled ||
            (inst.sections[sid].enrolled == inst.sections[best].enrolled && sid < best))
            best = sid;
    }
    return best;
}
