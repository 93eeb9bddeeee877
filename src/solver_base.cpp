///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "solver_base.hpp"


///////////////////////////
///        TYPES        ///
///////////////////////////
bool TimetableSolution::complete() const {
    for (const Assignment& a : assignments) {
        if (!a.assigned()) return false;
    }
    return true;
}

int TimetableSolution::assignedCount() const {
    int count = 0;
    for (const Assignment& a : assignments) {
        if (a.assigned()) ++count;
    }
    return count;
}

bool ExamSchedule::complete() const {
    for (const ExamPlacement& p : placements) {
        if (!p.placed()) return false;
    }
    return true;
}


///////////////////////////
///       BUDGET        ///
///////////////////////////
SearchBudget::SearchBudget(std::chrono::milliseconds timeBudget, const std::atomic<bool>* stopFlag)
        : start_(std::chrono::steady_clock::now()),
          deadline_(start_ + timeBudget),
          stopFlags_{stopFlag, nullptr} {}

SearchBudget::SearchBudget(const SearchBudget& parent, const std::atomic<bool>* cancelFlag)
        : start_(parent.start_),
          deadline_(parent.deadline_),
          stopFlags_{parent.stopFlags_[0], cancelFlag} {}

bool SearchBudget::exhausted() const {
    for (const std::atomic<bool>* flag : stopFlags_) {
        if (flag && flag->load(std::memory_order_relaxed)) return true;
    }
    return std::chrono::steady_clock::now() >= deadline_;
}

double SearchBudget::elapsedMs() const {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
}
