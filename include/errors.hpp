#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <stdexcept>
#include <string>
#include <vector>


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief Thrown when the input model or configuration is malformed.
 *
 * Raised before any search starts; no partial solve is attempted.
 */
class ModelError : public std::runtime_error {
public:
    explicit ModelError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Why a solver could not return a schedule.
 */
enum class FailureKind {
    NONE, ///< No failure.
    INFEASIBLE, ///< The search space was exhausted or a constraint cannot be met.
    BUDGET_EXCEEDED ///< Time, stop flag or backtrack budget ran out; a retry may succeed.
};

/**
 * @brief Diagnostic attached to an unsuccessful solve.
 *
 * Lists, where it can be determined, the entities taking part in the
 * conflict so the caller can relax the right input.
 */
struct Infeasibility {
    FailureKind kind = FailureKind::NONE; ///< Failure category.
    std::string constraint; ///< Constraint that could not be met (e.g., "room-capacity").
    std::string reason; ///< Human-readable explanation.
    std::vector<int> sectionIds; ///< Sections (or exams) involved.
    std::vector<int> roomIds; ///< Rooms involved.
    std::vector<int> facultyIds; ///< Faculty involved.
};

/// Short label for a FailureKind.
std::string failureKindName(FailureKind kind);
