#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "problem_context.hpp"
#include "timetable.hpp"
#include <optional>
#include <random>
#include <string>
#include <vector>


///////////////////////////
///     CONSTRAINTS     ///
///////////////////////////
/**
 * @brief Read-only availability queries over a timetable.
 *
 * The oracle keeps references to the problem context and to a live grid;
 * every query is re-evaluated against the grid's current contents, so the
 * same oracle can be used while the grid is being edited. All queries take
 * an optional assignment id to ignore, which lets an assignment be checked
 * against "everything but itself".
 */
class AvailabilityOracle {
public:
    /// Sentinel for "exclude nothing".
    static constexpr int kNoExclusion = -1;

    AvailabilityOracle(const ProblemContext& ctx, const TimetableGrid& grid);

    /**
     * @brief Check that a batch has nothing scheduled at (day, slot).
     *
     * Returns false for unknown batches and out-of-range coordinates.
     */
    bool batchFree(int batchId, int day, int slot, int excludeId = kNoExclusion) const;

    /**
     * @brief Check that a faculty member can teach at (day, slot).
     *
     * The faculty must not teach any other session at that time and, if an
     * availability record exists, the slot must be in its allowed set for
     * that day.
     */
    bool facultyFree(int facultyId, int day, int slot, int excludeId = kNoExclusion) const;

    /**
     * @brief Check the faculty availability record only (no booking check).
     */
    bool facultyAvailable(int facultyId, int day, int slot) const;

    /**
     * @brief Check that a room can host a session of subject for batch at (day, slot).
     *
     * The room must be unbooked at that time, match the subject's required
     * room type, seat the whole batch and be allowed by the batch's room
     * restriction.
     */
    bool roomFree(int roomId, int day, int slot, int batchId, int subjectId,
                  int excludeId = kNoExclusion) const;

    /// Static part of roomFree(): type, capacity and batch restriction.
    bool roomSuitable(int roomId, int batchId, int subjectId) const;

    /**
     * @brief Pick the staff for a session at (day, slot).
     *
     * Walks the (batch, subject) candidate list in order and keeps free
     * faculty until the subject's minimum headcount is reached.
     *
     * @return The chosen faculty ids, or std::nullopt if the headcount cannot be met.
     */
    std::optional<std::vector<int>> selectFaculty(int batchId, int subjectId, int day, int slot,
                                                  int excludeId = kNoExclusion) const;

    /**
     * @brief Pick a room uniformly at random among rooms free for the session.
     */
    std::optional<int> selectRoom(int batchId, int subjectId, int day, int slot, std::mt19937& rng,
                                  int excludeId = kNoExclusion) const;

private:
    const ProblemContext& ctx_;
    const TimetableGrid& grid_;
};

/**
 * @brief Draw one random working (day, slot) and try to host a session there.
 *
 * The batch must be free at the drawn time, the subject's minimum headcount
 * must be available and a suitable room must be free. On success returns
 * the assignment (id 0, not yet stored in the grid).
 */
std::optional<ClassAssignment> drawPlacement(const ProblemContext& ctx, const TimetableGrid& grid,
                                             int batchId, int subjectId, std::mt19937& rng);

/**
 * @brief Category of a detected hard-constraint violation.
 */
enum class ConflictType { FACULTY, ROOM, BATCH, CAPACITY };

/**
 * @brief One hard-constraint violation among placed assignments.
 */
struct Conflict {
    ConflictType type;
    std::string description;
    std::vector<int> involvedIds; ///< Assignment ids taking part in the clash.
};

/**
 * @brief List every hard conflict in a timetable.
 *
 * Reports a CAPACITY conflict for each session whose room is too small for
 * its batch, and for every pair of sessions sharing a (day, slot) a ROOM,
 * FACULTY and/or BATCH conflict when they share a room, a faculty member or
 * a batch.
 */
std::vector<Conflict> detectConflicts(const ProblemContext& ctx, const TimetableGrid& grid);

/// Human-readable label of a conflict type.
std::string toString(ConflictType type);
