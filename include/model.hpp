#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <string>
#include <vector>


///////////////////////////
///      TIME GRID      ///
///////////////////////////
/**
 * @brief A single (day, period) cell of the time grid.
 *
 * Slots are totally ordered within a day by their period index.
 */
struct TimeSlot {
    int day; ///< Day index (0..days-1).
    int period; ///< Period index within the day (0..periodsPerDay-1).
};

/**
 * @brief Fixed weekly grid of teaching periods.
 *
 * Built once per planning cycle and never mutated afterwards. Every
 * resource calendar in the model refers to slots through their flat index
 * (day * periodsPerDay + period).
 */
struct TimeGrid {
    int days = 5; ///< Number of teaching days.
    int periodsPerDay = 8; ///< Number of periods per day.
    std::vector<std::string> dayNames; ///< Optional display names, one per day.
    std::vector<std::string> periodLabels; ///< Optional display labels, one per period.
    std::vector<int> breakPeriods; ///< Periods (e.g. lunch) where no teaching may be placed.

    int slotCount() const { return days * periodsPerDay; }
    int slotIndex(int day, int period) const { return day * periodsPerDay + period; }
    TimeSlot slotAt(int index) const { return {index / periodsPerDay, index % periodsPerDay}; }

    /// True if the period is a break period (same on every day).
    bool isBreak(int period) const;

    /// Display name of a day, falling back to "Day N".
    std::string dayName(int day) const;

    /// Display label of a period, falling back to "P N".
    std::string periodLabel(int period) const;
};


///////////////////////////
///       MODELS        ///
///////////////////////////
/**
 * @brief A teaching or examination room.
 */
struct Room {
    int id; ///< Unique room identifier (equals its index in ProblemInstance::rooms).
    std::string name; ///< Room name/label (e.g., "C301").
    int capacity; ///< Number of seats at normal (two per bench) density.
    std::vector<std::string> tags; ///< Capability tags (e.g., "lab-equipped", "projector").
    std::vector<int> unavailableSlots; ///< Flat slot indices where the room cannot be used.
    bool examOnly = false; ///< Reserved for exams, never used for teaching.
};

/**
 * @brief Faculty member who can teach sections and invigilate exams.
 */
struct Faculty {
    int id; ///< Unique faculty identifier.
    std::string name; ///< Faculty member's name.
    int maxLoad; ///< Maximum number of slots per week (teaching or invigilation).
    std::vector<int> unavailableSlots; ///< Flat slot indices where this person is unavailable.
    std::vector<int> qualifiedCourses; ///< Course ids this person may teach.
    std::vector<int> preferredSlots; ///< Flat slot indices this person prefers to teach in (empty = no preference).
};

/**
 * @brief A course offered in the planning cycle.
 */
struct Course {
    int id; ///< Unique course identifier.
    std::string code; ///< Short course code (e.g., "CS301").
    std::string name; ///< Human-readable course name.
    std::vector<int> instructorIds; ///< Declared instructors (used by invigilation exclusion).
};

/**
 * @brief Kinds of teaching sections.
 */
enum class SectionKind { LECTURE, TUTORIAL, LAB };

/**
 * @brief One teachable instance of a course requiring a contiguous block.
 *
 * A section of duration k is placed on k consecutive periods of one day, in
 * one room, with one faculty member.
 */
struct Section {
    int id; ///< Unique section identifier.
    int courseId; ///< Parent course.
    std::string name; ///< Display label (e.g., "CS301-L1").
    SectionKind kind = SectionKind::LECTURE; ///< Lecture, tutorial or lab.
    int duration = 1; ///< Number of contiguous periods required.
    std::vector<std::string> requiredTags; ///< Room tags the section needs.
    int enrolled = 0; ///< Number of enrolled students.
    /**
     * Faculty allowed to teach this section. When empty, every faculty member
     * qualified for the parent course is allowed.
     */
    std::vector<int> qualifiedFaculty;
    /// Elective group id, or -1. Sections of one group never overlap.
    int electiveGroup = -1;
};

/**
 * @brief A student and the sections they are enrolled in.
 */
struct Student {
    int id; ///< Unique student identifier.
    std::string name; ///< Student name or roll number.
    std::vector<int> sectionIds; ///< Enrolled sections.
};

/**
 * @brief Complete problem instance for one planning cycle.
 *
 * Populated by the data-loading collaborator and read-only afterwards.
 */
struct ProblemInstance {
    TimeGrid grid; ///< Weekly time grid.
    std::vector<Room> rooms; ///< All rooms.
    std::vector<Faculty> faculty; ///< All faculty members.
    std::vector<Course> courses; ///< All courses.
    std::vector<Section> sections; ///< All sections to be scheduled.
    std::vector<Student> students; ///< Students with their enrollments.
};


///////////////////////////
///     ASSIGNMENTS     ///
///////////////////////////
/**
 * @brief Placement of a single section in the timetable.
 *
 * Covers `duration` consecutive periods starting at (day, startPeriod).
 */
struct Assignment {
    int sectionId = -1; ///< Section being scheduled (or -1 if unassigned).
    int day = 0; ///< Day index.
    int startPeriod = 0; ///< First period of the block.
    int roomId = -1; ///< Assigned room.
    int facultyId = -1; ///< Assigned faculty member.

    bool assigned() const { return sectionId >= 0; }
};

bool operator==(const Assignment& a, const Assignment& b);
bool operator!=(const Assignment& a, const Assignment& b);


///////////////////////////
///        EXAMS        ///
///////////////////////////
/**
 * @brief One exam sitting for a course.
 */
struct Exam {
    int id; ///< Unique exam identifier.
    int courseId; ///< Course being examined.
    std::string name; ///< Display label.
    int duration = 1; ///< Number of contiguous periods.
    std::vector<int> studentIds; ///< Students sitting the exam.
    int seatsPerBench = 2; ///< Seating density: 1 for strict exams, 2 otherwise.
    std::vector<std::string> requiredTags; ///< Room tags the exam needs.
};

/**
 * @brief Exam problem layered on top of a ProblemInstance.
 *
 * Uses the instance's grid, rooms, faculty, courses and students.
 */
struct ExamProblem {
    std::vector<Exam> exams; ///< Exams to schedule.
    std::vector<int> invigilatorPool; ///< Faculty eligible to invigilate (empty = all).
    /// Slots where teaching is suspended; committed teaching does not block them.
    std::vector<int> examOnlySlots;
};

/**
 * @brief Time and rooms chosen for one exam.
 */
struct ExamPlacement {
    int examId = -1; ///< Exam being placed (or -1 if unplaced).
    int day = 0; ///< Day index.
    int startPeriod = 0; ///< First period of the sitting.
    std::vector<int> roomIds; ///< Rooms used by the sitting.
    std::vector<int> seatCounts; ///< Students seated per room (parallel to roomIds).

    bool placed() const { return examId >= 0; }
};

bool operator==(const ExamPlacement& a, const ExamPlacement& b);
bool operator!=(const ExamPlacement& a, const ExamPlacement& b);

/**
 * @brief One student's seat in an exam room.
 */
struct SeatAssignment {
    int examId; ///< Exam being sat.
    int roomId; ///< Room of the seat.
    std::string seatLabel; ///< Physical seat label (room, row, bench, seat).
    int studentId; ///< Seated student.
    int row; ///< Row index (0-based).
    int bench; ///< Bench index within the room (0-based, two benches per row).
    int seat; ///< Seat on the bench (0 or 1).
};

/**
 * @brief One invigilation duty.
 */
struct InvigilatorAssignment {
    int examId; ///< Exam being invigilated.
    int roomId; ///< Room being invigilated.
    int day; ///< Day index.
    int startPeriod; ///< First period of the duty.
    int duration; ///< Number of periods.
    int facultyId; ///< Invigilator.
};

/**
 * @brief Per-room seating statistics.
 */
struct SeatingReport {
    int examId; ///< Exam.
    int roomId; ///< Room.
    int seated; ///< Students seated in the room.
    int emptySeats; ///< Seats left empty (density or anti-cheating).
    double efficiency; ///< seated / physical seats (two per bench), in percent.
};


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Convert a SectionKind to a short label.
std::string sectionKindName(SectionKind kind);

/// True if every tag in `required` is present in `offered`.
bool hasAllTags(const std::vector<std::string>& offered, const std::vector<std::string>& required);

/**
 * @brief Qualified faculty of a section, resolved against course qualifications.
 *
 * Returns Section::qualifiedFaculty when non-empty, otherwise every faculty
 * member whose qualifiedCourses contain the section's course. Sorted by id.
 */
std::vector<int> eligibleFaculty(const ProblemInstance& inst, const Section& section);

/**
 * @brief Smallest section of a course a student is enrolled in, or -1 if none.
 *
 * Ties go to the lowest id. Used to keep students of one section apart when
 * seating exams.
 */
int sectionForCourse(const ProblemInstance& inst, int studentId, int courseId);

/// Number of two-seat benches in a room (capacity rounded up to whole benches).
inline int benchCount(const Room& room) { return (room.capacity + 1) / 2; }

/// Exam seats available in a room at the given density.
inline int examSeatCapacity(const Room& room, int seatsPerBench) { return benchCount(room) * seatsPerBench; }
