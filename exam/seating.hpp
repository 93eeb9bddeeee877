#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <string>
#include <vector>


///////////////////////////
///       SEATING       ///
///////////////////////////
/**
 * @brief Benches an exam occupies: shared benches plus benches with one student.
 */
struct SeatingNeed {
    int pairs = 0; ///< Benches seating two students.
    int singles = 0; ///< Benches seating one student.

    int benches() const { return pairs + singles; }
};

/**
 * @brief Occupants of one bench; `second` is -1 when the mate seat stays empty.
 */
struct BenchUnit {
    int first; ///< Student on seat A.
    int second; ///< Student on seat B, or -1.
};

/**
 * @brief Plans exam seating on two-seat benches.
 *
 * Rows hold two benches (left and right). With the anti-cheating rule two
 * students of the same section never share a bench; students enrolled in no
 * section of the course count as a group of their own.
 */
class SeatingPlanner {
public:
    SeatingPlanner(const ProblemInstance& inst, bool antiCheat);

    /**
     * @brief Bench requirement of an exam.
     *
     * With one seat per bench every student sits alone. Otherwise students
     * pair up; under the anti-cheating rule at most n - (largest group) pairs
     * can be formed.
     */
    SeatingNeed need(const Exam& exam) const;

    /**
     * @brief Form benches: pairs first, then singles.
     *
     * Under the anti-cheating rule each pair takes the lowest-id remaining
     * student of the largest remaining group and of the next-largest group.
     */
    std::vector<BenchUnit> benchUnits(const Exam& exam) const;

    /**
     * @brief Students seated per room when benches are filled in room order.
     *
     * @return Seat counts parallel to roomIds, or an empty vector if the rooms
     *         do not offer enough benches.
     */
    std::vector<int> distribute(const SeatingNeed& need, const std::vector<int>& roomIds) const;

    /**
     * @brief Seat an exam in its rooms and append seats and per-room reports.
     *
     * @throws std::invalid_argument if the rooms offer too few benches.
     */
    void seat(const Exam& exam, const std::vector<int>& roomIds, std::vector<SeatAssignment>& seats,
              std::vector<SeatingReport>& reports) const;

    /// Seat label "<room>-R<row>-<L|R><A|B>" of a bench seat.
    static std::string seatLabel(const Room& room, int bench, int seat);

private:
    const ProblemInstance& inst_;
    bool antiCheat_;

    /// Students of an exam grouped by their section of the course, largest group first.
    std::vector<std::vector<int>> groups(const Exam& exam) const;
};
