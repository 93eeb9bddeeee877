#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "solver_base.hpp"


///////////////////////////
///     VALIDATION      ///
///////////////////////////
/**
 * @brief Check referential integrity and value ranges of a problem instance.
 *
 * Ids must be dense (entity k stored at index k), every reference must
 * resolve, capacities and durations must be positive, loads and enrollment
 * counts non-negative, calendars inside the grid, and no student may be
 * enrolled twice in the same section or push a section above its count.
 *
 * @throws ModelError naming the first offending entity.
 */
void validateInstance(const ProblemInstance& inst);

/**
 * @brief Check an exam problem against its instance and committed timetable.
 *
 * @param committed Committed teaching timetable, or nullptr if none.
 * @throws ModelError naming the first offending entity.
 */
void validateExamProblem(const ProblemInstance& inst, const ExamProblem& problem,
                         const TimetableSolution* committed);

/**
 * @brief Check weights and budgets of a solver configuration.
 *
 * @throws ModelError on negative weights or non-positive budgets.
 */
void validateConfig(const SolverConfig& config);

/**
 * @brief Check weights, invigilation rules and budgets of an exam configuration.
 *
 * @throws ModelError on invalid values.
 */
void validateConfig(const ExamConfig& config);
