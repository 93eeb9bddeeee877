#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "clash_graph.hpp"
#include <vector>


///////////////////////////
///     CONSTRAINTS     ///
///////////////////////////
/**
 * @brief One activity occupying rooms and people over a block of periods.
 *
 * A timetable section books one room and one faculty member; an exam books
 * several rooms and all of their invigilators.
 */
struct Booking {
    int activityId; ///< Section or exam id.
    int day; ///< Day index.
    int startPeriod; ///< First period.
    int duration; ///< Number of periods.
    std::vector<int> roomIds; ///< Rooms occupied.
    std::vector<int> facultyIds; ///< Faculty occupied.
};

/**
 * @brief Incremental occupancy of a candidate schedule during search.
 *
 * Tracks room, faculty and activity occupancy over the time grid, answering
 * the dynamic hard-constraint questions in O(duration) per resource:
 *  - no room double-booking,
 *  - no faculty double-booking, plus running faculty load and bookings per day,
 *  - no overlap between activities adjacent in the clash graph.
 * Static constraints (capacity, tags, qualification, availability) are
 * filtered before candidates ever reach this state.
 */
class ScheduleState {
public:
    /// Sentinel for a free cell.
    static constexpr int kNone = -1;

    /// Sentinel for a cell blocked by commitments outside the search.
    static constexpr int kBlocked = -2;

    /**
     * @brief Construct an empty state.
     *
     * @param grid       Time grid (must outlive the state).
     * @param numRooms   Number of rooms.
     * @param numFaculty Number of faculty members.
     * @param clashes    Clash graph over activity ids (must outlive the state).
     */
    ScheduleState(const TimeGrid& grid, int numRooms, int numFaculty, const ClashGraph& clashes);

    /// True if the room is free on every period of the block.
    bool roomFree(int roomId, int day, int start, int duration) const;

    /// True if the faculty member is free on every period of the block.
    bool facultyFree(int facultyId, int day, int start, int duration) const;

    /// True if no clash neighbour of the activity occupies any period of the block.
    bool clashFree(int activityId, int day, int start, int duration) const;

    /// All dynamic checks for a booking (rooms, faculty, clash neighbours).
    bool canBook(const Booking& booking) const;

    /**
     * @brief Commit a booking. The caller checks canBook() first.
     *
     * Faculty load grows by the booking duration for each faculty member.
     */
    void book(const Booking& booking);

    /**
     * @brief Undo a previously committed booking.
     */
    void release(const Booking& booking);

    /// Mark a room as unavailable to the search at a flat slot index.
    void blockRoom(int roomId, int slot);

    /// Mark a faculty member as unavailable to the search at a flat slot index.
    void blockFaculty(int facultyId, int slot);

    /// Occupant of a room at a flat slot index (activity id, kNone or kBlocked).
    int roomOccupant(int roomId, int slot) const { return roomSlots_[roomId][slot]; }

    /// Occupant of a faculty member at a flat slot index.
    int facultyOccupant(int facultyId, int slot) const { return facultySlots_[facultyId][slot]; }

    /// Slots booked so far for a faculty member.
    int facultyLoad(int facultyId) const { return facultyLoad_[facultyId]; }

    /// Bookings of a faculty member on one day.
    int facultyDayCount(int facultyId, int day) const { return facultyDay_[facultyId][day]; }

    /// Activities occupying a flat slot index.
    const std::vector<int>& activitiesAt(int slot) const { return slotActivities_[slot]; }

    /**
     * @brief Collect the activities blocking a booking, for conflict diagnosis.
     *
     * Appends room occupants, faculty occupants and clashing neighbours that
     * overlap the block. Blocked cells are not reported.
     */
    void blockers(const Booking& booking, std::vector<int>& out) const;

    /// Access the grid this state was built for.
    const TimeGrid& grid() const { return *grid_; }

private:
    /// Grid the state covers (owned externally).
    const TimeGrid* grid_;

    /// Clash graph over activity ids (owned externally).
    const ClashGraph* clashes_;

    /// roomSlots_[room][slot] = activity id, kNone or kBlocked.
    std::vector<std::vector<int>> roomSlots_;

    /// facultySlots_[faculty][slot] = activity id, kNone or kBlocked.
    std::vector<std::vector<int>> facultySlots_;

    /// Booked periods per faculty member.
    std::vector<int> facultyLoad_;

    /// facultyDay_[faculty][day] = bookings on that day.
    std::vector<std::vector<int>> facultyDay_;

    /// slotActivities_[slot] = activities covering the slot.
    std::vector<std::vector<int>> slotActivities_;

    /**
     * @brief Check a block lies inside one day of the grid.
     */
    bool inGrid(int day, int start, int duration) const;
};
