#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"


///////////////////////////
///        DEMOS        ///
///////////////////////////
/**
 * @brief Sizes of the synthetic demo instances.
 */
enum class DemoSize {
    S, ///< One year, three courses, two groups.
    M, ///< Two years, four courses each, two groups each.
    L, ///< Three years, five courses each, three groups each.
    XL ///< Four years, six courses each, four groups each.
};

/**
 * @brief Build a synthetic faculty: lectures per course, tutorials and labs per group.
 *
 * Every course has one two-period lecture for its whole year, one tutorial per
 * group and, for every second course, a two-period lab per group. Groups hold
 * 25 students. The instances are feasible.
 */
ProblemInstance makeDemoInstance(DemoSize size);

/**
 * @brief One two-period exam per course of a demo instance.
 *
 * The first course of each year is examined at one student per bench. Every
 * slot of the last day is exam-only.
 */
ExamProblem makeDemoExamProblem(const ProblemInstance& inst);
