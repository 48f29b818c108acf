#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <optional>
#include <vector>


///////////////////////////
///      TIMETABLE      ///
///////////////////////////
/**
 * @brief One placed session in a timetable.
 *
 * The (batchId, day, slot) triple always matches the grid cell holding it.
 */
struct ClassAssignment {
    int id; ///< Unique within the owning grid.
    int subjectId; ///< Subject being taught.
    std::vector<int> facultyIds; ///< Staff teaching the session (2+ for practicals).
    int roomId; ///< Room the session takes place in.
    int batchId; ///< Batch attending the session.
    int day; ///< Day index (one of the working days).
    int slot; ///< Slot index within the day.
    bool pinned = false; ///< Placed from a PinnedAssignment; never moved by operators.

    /// Same placement and staffing, ignoring the id.
    bool sameContent(const ClassAssignment& other) const;
};

/**
 * @brief Per-batch timetable stored as a flat arena.
 *
 * Cells are keyed by (batchIndex, day, slot), where batchIndex is the
 * position of the batch in ProblemInstance::batches. Copying a grid is a
 * plain value copy, so every candidate owns its timetable outright.
 */
class TimetableGrid {
public:
    TimetableGrid() = default;

    /**
     * @brief Create an empty grid.
     *
     * @param numBatches  Number of batches (first dimension).
     * @param numDays     Number of day rows (TimetableGeometry::dayCount()).
     * @param slotsPerDay Number of slots per day.
     */
    TimetableGrid(int numBatches, int numDays, int slotsPerDay);

    int numBatches() const { return numBatches_; }
    int numDays() const { return numDays_; }
    int slotsPerDay() const { return slotsPerDay_; }

    /// True if (batchIndex, day, slot) lies inside the grid.
    bool inBounds(int batchIndex, int day, int slot) const;

    /// Assignment stored at a cell, or nullptr if the cell is empty.
    const ClassAssignment* at(int batchIndex, int day, int slot) const;

    /// True if the cell holds an assignment.
    bool occupied(int batchIndex, int day, int slot) const { return at(batchIndex, day, slot) != nullptr; }

    /**
     * @brief Store an assignment in the cell named by its own (day, slot).
     *
     * Overwrites whatever the cell held before. Returns false (and stores
     * nothing) if the coordinates are out of bounds.
     */
    bool put(int batchIndex, const ClassAssignment& assignment);

    /// Empty a cell. Returns the assignment that was removed, if any.
    std::optional<ClassAssignment> clear(int batchIndex, int day, int slot);

    /// Hand out a fresh assignment id, unique within this grid.
    int nextAssignmentId() { return nextId_++; }

    /// Locate an assignment by id. Returns false if it is not in the grid.
    bool locate(int assignmentId, int& batchIndex, int& day, int& slot) const;

    /// Number of placed assignments.
    int size() const;

    /// All assignments in (batch, day, slot) order.
    std::vector<ClassAssignment> assignments() const;

    /// All assignments at a given (day, slot) across every batch.
    std::vector<const ClassAssignment*> assignmentsAt(int day, int slot) const;

    /// Cell-by-cell comparison ignoring assignment ids.
    bool sameContent(const TimetableGrid& other) const;

    /**
     * @brief Copy all cells of one batch with day in [fromDay, toDay) from another grid.
     *
     * Both grids must have the same shape. Used by day-wise crossover.
     */
    void copyDays(const TimetableGrid& source, int batchIndex, int fromDay, int toDay);

    /// Give every assignment a fresh id 1..size() in (batch, day, slot) order.
    void renumber();

    /**
     * @brief Flatten the grid into an integer buffer.
     *
     * Layout: numBatches, numDays, slotsPerDay, nextId, count, then per
     * assignment: batchIndex, id, subjectId, roomId, batchId, day, slot,
     * pinned, nFaculty, facultyIds...
     */
    std::vector<int> encode() const;

    /**
     * @brief Rebuild a grid from a buffer produced by encode().
     *
     * Throws std::invalid_argument on a truncated or inconsistent buffer.
     */
    static TimetableGrid decode(const std::vector<int>& buffer);

private:
    int numBatches_ = 0;
    int numDays_ = 0;
    int slotsPerDay_ = 0;
    int nextId_ = 1;

    /// cells_[(batchIndex * numDays_ + day) * slotsPerDay_ + slot]
    std::vector<std::optional<ClassAssignment>> cells_;

    int cellIndex(int batchIndex, int day, int slot) const {
        return (batchIndex * numDays_ + day) * slotsPerDay_ + slot;
    }
};

/**
 * @brief Score and soft/hard constraint breakdown of a timetable.
 */
struct TimetableMetrics {
    double score = 0.0; ///< 0..1000, higher is better.
    int hardConflicts = 0; ///< Double bookings and capacity clashes among placed sessions.
    int studentGaps = 0; ///< Idle slots inside batch days.
    int facultyGaps = 0; ///< Idle slots inside faculty days.
    double facultyWorkloadStdDev = 0.0; ///< Spread of weekly taught slots across faculty.
    int preferenceViolations = 0; ///< Taught slots outside faculty preferences.
    int unplacedSessions = 0; ///< Required sessions missing from the timetable.
};

/**
 * @brief One member of the population: a timetable plus its latest metrics.
 */
struct Candidate {
    TimetableGrid timetable;
    TimetableMetrics metrics;
};
