///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include <algorithm>


///////////////////////////
///     CONSTRAINTS     ///
///////////////////////////
/**
 * @brief Initialize an empty schedule state for a grid and resource counts.
 *
 * Allocates room and faculty schedules and zeroes faculty load counters.
 */
ScheduleState::ScheduleState(const TimeGrid& grid, int numRooms, int numFaculty, const ClashGraph& clashes)
        : grid_(&grid), clashes_(&clashes) {
    int slots = grid.slotCount();

    // Schedules are stored as [resource][slot] = activityId / kNone / kBlocked.
    roomSlots_.assign(numRooms, std::vector<int>(slots, kNone));
    facultySlots_.assign(numFaculty, std::vector<int>(slots, kNone));
    facultyLoad_.assign(numFaculty, 0);
    facultyDay_.assign(numFaculty, std::vector<int>(grid.days, 0));
    slotActivities_.assign(slots, {});
}

bool ScheduleState::inGrid(int day, int start, int duration) const {
    return day >= 0 && day < grid_->days && start >= 0 && duration > 0 &&
           start + duration <= grid_->periodsPerDay;
}

bool ScheduleState::roomFree(int roomId, int day, int start, int duration) const {
    if (roomId < 0 || roomId >= (int)roomSlots_.size()) return false;
    if (!inGrid(day, start, duration)) return false;
    const std::vector<int>& row = roomSlots_[roomId];
    int base = grid_->slotIndex(day, start);
    for (int k = 0; k < duration; ++k) {
        if (row[base + k] != kNone) return false;
    }
    return true;
}

bool ScheduleState::facultyFree(int facultyId, int day, int start, int duration) const {
    if (facultyId < 0 || facultyId >= (int)facultySlots_.size()) return false;
    if (!inGrid(day, start, duration)) return false;
    const std::vector<int>& row = facultySlots_[facultyId];
    int base = grid_->slotIndex(day, start);
    for (int k = 0; k < duration; ++k) {
        if (row[base + k] != kNone) return false;
    }
    return true;
}

/**
 * @brief Check that no clash neighbour overlaps the block.
 *
 * Scans the activities present in each covered slot, which is cheaper than
 * scanning the neighbour list for dense graphs.
 */
bool ScheduleState::clashFree(int activityId, int day, int start, int duration) const {
    if (!inGrid(day, start, duration)) return false;
    int base = grid_->slotIndex(day, start);
    for (int k = 0; k < duration; ++k) {
        for (int other : slotActivities_[base + k]) {
            if (other != activityId && clashes_->clashes(activityId, other))
                return false;
        }
    }
    return true;
}

bool ScheduleState::canBook(const Booking& booking) const {
    for (int r : booking.roomIds) {
        if (!roomFree(r, booking.day, booking.startPeriod, booking.duration))
            return false;
    }
    for (int f : booking.facultyIds) {
        if (!facultyFree(f, booking.day, booking.startPeriod, booking.duration))
            return false;
    }
    return clashFree(booking.activityId, booking.day, booking.startPeriod, booking.duration);
}

void ScheduleState::book(const Booking& booking) {
    int base = grid_->slotIndex(booking.day, booking.startPeriod);
    for (int k = 0; k < booking.duration; ++k) {
        int slot = base + k;
        for (int r : booking.roomIds) roomSlots_[r][slot] = booking.activityId;
        for (int f : booking.facultyIds) facultySlots_[f][slot] = booking.activityId;
        slotActivities_[slot].push_back(booking.activityId);
    }
    for (int f : booking.facultyIds) {
        facultyLoad_[f] += booking.duration;
        ++facultyDay_[f][booking.day];
    }
}

void ScheduleState::release(const Booking& booking) {
    int base = grid_->slotIndex(booking.day, booking.startPeriod);
    for (int k = 0; k < booking.duration; ++k) {
        int slot = base + k;
        for (int r : booking.roomIds) {
            if (roomSlots_[r][slot] == booking.activityId) roomSlots_[r][slot] = kNone;
        }
        for (int f : booking.facultyIds) {
            if (facultySlots_[f][slot] == booking.activityId) facultySlots_[f][slot] = kNone;
        }
        std::vector<int>& list = slotActivities_[slot];
        auto it = std::find(list.begin(), list.end(), booking.activityId);
        if (it != list.end()) list.erase(it);
    }
    for (int f : booking.facultyIds) {
        facultyLoad_[f] -= booking.duration;
        --facultyDay_[f][booking.day];
    }
}

void ScheduleState::blockRoom(int roomId, int slot) {
    if (roomSlots_[roomId][slot] == kNone) roomSlots_[roomId][slot] = kBlocked;
}

void ScheduleState::blockFaculty(int facultyId, int slot) {
    if (facultySlots_[facultyId][slot] == kNone) facultySlots_[facultyId][slot] = kBlocked;
}

void ScheduleState::blockers(const Booking& booking, std::vector<int>& out) const {
    if (!inGrid(booking.day, booking.startPeriod, booking.duration)) return;
    int base = grid_->slotIndex(booking.day, booking.startPeriod);
    for (int k = 0; k < booking.duration; ++k) {
        int slot = base + k;
        for (int r : booking.roomIds) {
            int occ = roomSlots_[r][slot];
            if (occ >= 0) out.push_back(occ);
        }
        for (int f : booking.facultyIds) {
            int occ = facultySlots_[f][slot];
            if (occ >= 0) out.push_back(occ);
        }
        for (int other : slotActivities_[slot]) {
            if (other != booking.activityId && clashes_->clashes(booking.activityId, other))
                out.push_back(other);
        }
    }
}
