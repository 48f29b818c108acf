///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include <algorithm>
#include <map>
#include <utility>


///////////////////////////
///     CONSTRAINTS     ///
///////////////////////////
AvailabilityOracle::AvailabilityOracle(const ProblemContext& ctx, const TimetableGrid& grid)
        : ctx_(ctx), grid_(grid) {}

/**
 * @brief Check that a batch cell is empty (or holds the excluded assignment).
 *
 * Non-working days are never free.
 */
bool AvailabilityOracle::batchFree(int batchId, int day, int slot, int excludeId) const {
    int b = ctx_.batchIndex(batchId);
    if (b < 0 || !grid_.inBounds(b, day, slot)) return false;
    if (!ctx_.isWorkingDay(day)) return false;
    const ClassAssignment* a = grid_.at(b, day, slot);
    return a == nullptr || a->id == excludeId;
}

/**
 * @brief Check the availability record of a faculty member.
 *
 * No record means unrestricted; a record without the day means the faculty
 * member does not teach that day.
 */
bool AvailabilityOracle::facultyAvailable(int facultyId, int day, int slot) const {
    const FacultyAvailability* avail = ctx_.availabilityFor(facultyId);
    if (!avail) return true;
    auto it = avail->allowedSlots.find(day);
    if (it == avail->allowedSlots.end()) return false;
    return std::find(it->second.begin(), it->second.end(), slot) != it->second.end();
}

bool AvailabilityOracle::facultyFree(int facultyId, int day, int slot, int excludeId) const {
    if (!ctx_.faculty(facultyId)) return false;
    if (!facultyAvailable(facultyId, day, slot)) return false;

    // A faculty member may appear in any batch row at this time.
    for (const ClassAssignment* a : grid_.assignmentsAt(day, slot)) {
        if (a->id == excludeId) continue;
        if (std::find(a->facultyIds.begin(), a->facultyIds.end(), facultyId) != a->facultyIds.end())
            return false;
    }
    return true;
}

bool AvailabilityOracle::roomSuitable(int roomId, int batchId, int subjectId) const {
    const Room* room = ctx_.room(roomId);
    const Batch* batch = ctx_.batch(batchId);
    const Subject* subject = ctx_.subject(subjectId);
    if (!room || !batch || !subject) return false;

    if (room->type != subject->requiredRoomType()) return false;
    if (room->capacity < batch->studentCount) return false;

    // An empty restriction list means the batch may use any room.
    if (!batch->allocatedRoomIds.empty() &&
        std::find(batch->allocatedRoomIds.begin(), batch->allocatedRoomIds.end(), roomId) ==
        batch->allocatedRoomIds.end()) {
        return false;
    }
    return true;
}

bool AvailabilityOracle::roomFree(int roomId, int day, int slot, int batchId, int subjectId,
                                  int excludeId) const {
    if (!roomSuitable(roomId, batchId, subjectId)) return false;
    for (const ClassAssignment* a : grid_.assignmentsAt(day, slot)) {
        if (a->id == excludeId) continue;
        if (a->roomId == roomId) return false;
    }
    return true;
}

/**
 * @brief Greedy staff selection from the (batch, subject) candidate list.
 *
 * Candidates are taken in list order so allocated faculty are preferred
 * whenever they are free.
 */
std::optional<std::vector<int>> AvailabilityOracle::selectFaculty(int batchId, int subjectId, int day, int slot,
                                                                  int excludeId) const {
    const Subject* subject = ctx_.subject(subjectId);
    if (!subject) return std::nullopt;
    int needed = subject->requiredFacultyCount();

    std::vector<int> chosen;
    for (int fid : ctx_.facultyCandidates(batchId, subjectId)) {
        if (!facultyFree(fid, day, slot, excludeId)) continue;
        chosen.push_back(fid);
        if ((int)chosen.size() == needed) return chosen;
    }
    return std::nullopt;
}

std::optional<int> AvailabilityOracle::selectRoom(int batchId, int subjectId, int day, int slot, std::mt19937& rng,
                                                  int excludeId) const {
    std::vector<int> freeRooms;
    for (const Room& room : ctx_.instance().rooms) {
        if (roomFree(room.id, day, slot, batchId, subjectId, excludeId))
            freeRooms.push_back(room.id);
    }
    if (freeRooms.empty()) return std::nullopt;
    std::uniform_int_distribution<int> pick(0, (int)freeRooms.size() - 1);
    return freeRooms[pick(rng)];
}

std::optional<ClassAssignment> drawPlacement(const ProblemContext& ctx, const TimetableGrid& grid,
                                             int batchId, int subjectId, std::mt19937& rng) {
    const auto& days = ctx.geometry().workingDays;
    std::uniform_int_distribution<int> pickDay(0, (int)days.size() - 1);
    std::uniform_int_distribution<int> pickSlot(0, ctx.geometry().slotsPerDay - 1);
    int day = days[pickDay(rng)];
    int slot = pickSlot(rng);

    AvailabilityOracle oracle(ctx, grid);
    if (!oracle.batchFree(batchId, day, slot)) return std::nullopt;
    auto staff = oracle.selectFaculty(batchId, subjectId, day, slot);
    if (!staff) return std::nullopt;
    auto room = oracle.selectRoom(batchId, subjectId, day, slot, rng);
    if (!room) return std::nullopt;

    ClassAssignment a;
    a.id = 0;
    a.subjectId = subjectId;
    a.facultyIds = *staff;
    a.roomId = *room;
    a.batchId = batchId;
    a.day = day;
    a.slot = slot;
    a.pinned = false;
    return a;
}


///////////////////////////
///      CONFLICTS      ///
///////////////////////////
namespace {

std::string batchName(const ProblemContext& ctx, int batchId) {
    const Batch* b = ctx.batch(batchId);
    return b ? b->name : "Unknown";
}

} // namespace

std::vector<Conflict> detectConflicts(const ProblemContext& ctx, const TimetableGrid& grid) {
    std::vector<Conflict> conflicts;

    // Capacity checks, one per session.
    std::vector<ClassAssignment> all = grid.assignments();
    for (const ClassAssignment& a : all) {
        const Batch* batch = ctx.batch(a.batchId);
        const Room* room = ctx.room(a.roomId);
        if (batch && room && batch->studentCount > room->capacity) {
            conflicts.push_back({ConflictType::CAPACITY,
                                 "Room " + room->name + " (" + std::to_string(room->capacity) +
                                 ") is too small for " + batch->name + " (" +
                                 std::to_string(batch->studentCount) + " students)",
                                 {a.id}});
        }
    }

    // Overlap checks, pairwise within each (day, slot).
    std::map<std::pair<int, int>, std::vector<const ClassAssignment*>> bySlot;
    for (const ClassAssignment& a : all) bySlot[{a.day, a.slot}].push_back(&a);

    for (const auto& entry : bySlot) {
        const auto& inSlot = entry.second;
        for (size_t i = 0; i < inSlot.size(); ++i) {
            for (size_t j = i + 1; j < inSlot.size(); ++j) {
                const ClassAssignment& x = *inSlot[i];
                const ClassAssignment& y = *inSlot[j];

                if (x.roomId == y.roomId) {
                    const Room* room = ctx.room(x.roomId);
                    conflicts.push_back({ConflictType::ROOM,
                                         "Room " + (room ? room->name : std::string("Unknown")) +
                                         " double booked (" + batchName(ctx, x.batchId) + " vs " +
                                         batchName(ctx, y.batchId) + ")",
                                         {x.id, y.id}});
                }

                std::string shared;
                for (int fid : x.facultyIds) {
                    if (std::find(y.facultyIds.begin(), y.facultyIds.end(), fid) == y.facultyIds.end())
                        continue;
                    const Faculty* f = ctx.faculty(fid);
                    if (!shared.empty()) shared += ", ";
                    shared += f ? f->name : "Unknown";
                }
                if (!shared.empty()) {
                    conflicts.push_back({ConflictType::FACULTY,
                                         "Faculty " + shared + " double booked (" + batchName(ctx, x.batchId) +
                                         " vs " + batchName(ctx, y.batchId) + ")",
                                         {x.id, y.id}});
                }

                // Only reachable for grids whose cells disagree with their batch row.
                if (x.batchId == y.batchId) {
                    conflicts.push_back({ConflictType::BATCH,
                                         "Batch " + batchName(ctx, x.batchId) + " has concurrent classes scheduled",
                                         {x.id, y.id}});
                }
            }
        }
    }
    return conflicts;
}

std::string toString(ConflictType type) {
    switch (type) {
        case ConflictType::FACULTY:  return "FACULTY";
        case ConflictType::ROOM:     return "ROOM";
        case ConflictType::BATCH:    return "BATCH";
        case ConflictType::CAPACITY: return "CAPACITY";
    }
    return "UNKNOWN";
}
