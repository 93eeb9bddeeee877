#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "errors.hpp"
#include "solver_base.hpp"
#include <iostream>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// One line per assigned section: section, course, faculty, day, period and room.
void printAssignments(const ProblemInstance& inst, const TimetableSolution& sol, std::ostream& out = std::cout);

/**
 * @brief Per-day tables for each faculty member's teaching.
 */
void printFacultySchedules(const ProblemInstance& inst, const TimetableSolution& sol, std::ostream& out = std::cout);

/**
 * @brief Per-day tables of the classes one student attends.
 */
void printStudentSchedule(const ProblemInstance& inst, const TimetableSolution& sol, int studentId,
                          std::ostream& out = std::cout);

/**
 * @brief Exam sittings with their rooms, invigilators and seating statistics.
 */
void printExamSchedule(const ProblemInstance& inst, const ExamProblem& problem, const ExamSchedule& schedule,
                       std::ostream& out = std::cout);

/// Failure category, constraint, reason and the entities involved.
void printFailure(const Infeasibility& failure, std::ostream& out = std::cout);
