///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include <algorithm>
#include <string>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Shape of a generated instance.
 */
struct DemoShape {
    int years; ///< Study years.
    int coursesPerYear; ///< Courses taught to each year.
    int groupsPerYear; ///< Tutorial groups per year.
};

static const int kGroupSize = 25;

static const std::vector<std::string> kSubjects = {
        "Algebra", "Programming", "Physics", "Databases", "Networks", "Algorithms",
        "Statistics", "Compilers", "Graphics", "Security", "Logic", "Geometry"
};

static const std::vector<std::string> kSurnames = {
        "Popescu", "Ionescu", "Marin", "Stan", "Dumitru", "Constantin", "Rusu", "Munteanu",
        "Matei", "Lazar", "Moldovan", "Florea", "Ilie", "Toma", "Barbu", "Nistor"
};

static DemoShape shapeOf(DemoSize size) {
    switch (size) {
        case DemoSize::S:  return {1, 3, 2};
        case DemoSize::M:  return {2, 4, 2};
        case DemoSize::L:  return {3, 5, 3};
        case DemoSize::XL: return {4, 6, 4};
    }
    return {1, 3, 2};
}

static std::string padded(int value, int width) {
    std::string s = std::to_string(value);
    while ((int)s.size() < width) s = "0" + s;
    return s;
}


///////////////////////////
///    DEMO FACTORY     ///
///////////////////////////
ProblemInstance makeDemoInstance(DemoSize size) {
    DemoShape shape = shapeOf(size);
    ProblemInstance inst;

    // Five days of eight one-hour periods, lunch at 12:00.
    inst.grid.days = 5;
    inst.grid.periodsPerDay = 8;
    inst.grid.dayNames = {"Monday", "Tuesday", "Wednesday", "Thursday", "Friday"};
    for (int p = 0; p < inst.grid.periodsPerDay; ++p)
        inst.grid.periodLabels.push_back(padded(8 + p, 2) + ":00-" + padded(9 + p, 2) + ":00");
    inst.grid.breakPeriods = {4};

    // Rooms: one hall per year, seminar rooms for tutorials, labs.
    int halls = shape.years;
    int seminars = std::max(2, shape.years * shape.groupsPerYear / 2);
    int labs = shape.years + 1;
    for (int i = 0; i < halls; ++i) {
        Room r{(int)inst.rooms.size(), "H" + std::to_string(i + 1), 120, {"projector"}, {}};
        inst.rooms.push_back(r);
    }
    for (int i = 0; i < seminars; ++i) {
        Room r{(int)inst.rooms.size(), "S" + std::to_string(101 + i), 40, {"projector"}, {}};
        inst.rooms.push_back(r);
    }
    for (int i = 0; i < labs; ++i) {
        Room r{(int)inst.rooms.size(), "L" + std::to_string(201 + i), 30, {"lab-equipped", "projector"}, {}};
        inst.rooms.push_back(r);
    }

    for (int y = 0; y < shape.years; ++y) {
        // Courses of the year, each with its lecturer.
        std::vector<int> courseIds, lecturerIds;
        for (int c = 0; c < shape.coursesPerYear; ++c) {
            Course course;
            course.id = (int)inst.courses.size();
            course.code = "CS" + std::to_string(y + 1) + padded(c + 1, 2);
            course.name = kSubjects[(y * shape.coursesPerYear + c) % kSubjects.size()];

            Faculty lecturer;
            lecturer.id = (int)inst.faculty.size();
            lecturer.name = "Dr. " + kSurnames[lecturer.id % kSurnames.size()];
            lecturer.maxLoad = 12;
            lecturer.qualifiedCourses = {course.id};
            course.instructorIds = {lecturer.id};

            inst.courses.push_back(course);
            inst.faculty.push_back(lecturer);
            courseIds.push_back(course.id);
            lecturerIds.push_back(lecturer.id);
        }

        // Teaching assistants cover tutorials and labs of every course of the year.
        for (int g = 0; g < shape.groupsPerYear; ++g) {
            Faculty ta;
            ta.id = (int)inst.faculty.size();
            ta.name = "TA " + kSurnames[ta.id % kSurnames.size()];
            ta.maxLoad = 12;
            ta.qualifiedCourses = courseIds;
            inst.faculty.push_back(ta);
        }

        // Students of the year, one block of kGroupSize per group.
        int firstStudent = (int)inst.students.size();
        int yearStudents = shape.groupsPerYear * kGroupSize;
        for (int s = 0; s < yearStudents; ++s) {
            Student st;
            st.id = (int)inst.students.size();
            st.name = "S" + padded(st.id + 1, 4);
            inst.students.push_back(st);
        }

        for (int c = 0; c < shape.coursesPerYear; ++c) {
            int courseId = courseIds[c];
            const std::string& code = inst.courses[courseId].code;

            Section lecture;
            lecture.id = (int)inst.sections.size();
            lecture.courseId = courseId;
            lecture.name = code + "-L";
            lecture.kind = SectionKind::LECTURE;
            lecture.duration = 2;
            lecture.requiredTags = {"projector"};
            lecture.enrolled = yearStudents;
            lecture.qualifiedFaculty = {lecturerIds[c]};
            inst.sections.push_back(lecture);
            for (int s = 0; s < yearStudents; ++s) inst.students[firstStudent + s].sectionIds.push_back(lecture.id);

            for (int g = 0; g < shape.groupsPerYear; ++g) {
                Section tutorial;
                tutorial.id = (int)inst.sections.size();
                tutorial.courseId = courseId;
                tutorial.name = code + "-T" + std::to_string(g + 1);
                tutorial.kind = SectionKind::TUTORIAL;
                tutorial.duration = 1;
                tutorial.enrolled = kGroupSize;
                inst.sections.push_back(tutorial);

                Section lab;
                bool hasLab = c % 2 == 1;
                if (hasLab) {
                    lab.id = (int)inst.sections.size();
                    lab.courseId = courseId;
                    lab.name = code + "-P" + std::to_string(g + 1);
                    lab.kind = SectionKind::LAB;
                    lab.duration = 2;
                    lab.requiredTags = {"lab-equipped"};
                    lab.enrolled = kGroupSize;
                    inst.sections.push_back(lab);
                }

                for (int s = 0; s < kGroupSize; ++s) {
                    Student& st = inst.students[firstStudent + g * kGroupSize + s];
                    st.sectionIds.push_back(tutorial.id);
                    if (hasLab) st.sectionIds.push_back(lab.id);
                }
            }
        }
    }

    // The first lecturer keeps Friday afternoon free.
    Faculty& first = inst.faculty.front();
    for (int p = 6; p < inst.grid.periodsPerDay; ++p) first.unavailableSlots.push_back(inst.grid.slotIndex(4, p));

    // The second lecturer prefers to teach before lunch.
    Faculty& second = inst.faculty[1];
    for (int d = 0; d < inst.grid.days; ++d) {
        for (int p = 0; p < 4; ++p) second.preferredSlots.push_back(inst.grid.slotIndex(d, p));
    }

    return inst;
}

ExamProblem makeDemoExamProblem(const ProblemInstance& inst) {
    ExamProblem problem;
    for (const Course& course : inst.courses) {
        Exam exam;
        exam.id = (int)problem.exams.size();
        exam.courseId = course.id;
        exam.name = course.code + " " + course.name;
        exam.duration = 2;

        // Everyone attending the lecture sits the exam.
        for (const Section& s : inst.sections) {
            if (s.courseId != course.id || s.kind != SectionKind::LECTURE) continue;
            for (const Student& st : inst.students) {
                for (int sid : st.sectionIds) {
                    if (sid == s.id) exam.studentIds.push_back(st.id);
                }
            }
        }

        // Strict seating for the first course of each year.
        exam.seatsPerBench = (course.code.size() >= 2 && course.code.substr(course.code.size() - 2) == "01") ? 1 : 2;
        problem.exams.push_back(exam);
    }

    int lastDay = inst.grid.days - 1;
    for (int p = 0; p < inst.grid.periodsPerDay; ++p) problem.examOnlySlots.push_back(inst.grid.slotIndex(lastDay, p));
    return problem;
}
