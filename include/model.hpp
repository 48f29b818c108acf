#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <map>
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///       MODELS        ///
///////////////////////////
/**
 * @brief Physical category of a teaching room.
 */
enum class RoomType { LECTURE_HALL, LAB, WORKSHOP };

/**
 * @brief Teaching category of a subject.
 *
 * The category decides which room type a session needs and how many
 * faculty members must be present.
 */
enum class SubjectType { THEORY, PRACTICAL, WORKSHOP };

/// day index -> list of slot indices.
using DaySlotMap = std::map<int, std::vector<int>>;

/**
 * @brief A subject with a required number of weekly teaching hours.
 *
 * Each weekly hour becomes one session (one timetable cell) for every batch
 * that takes the subject.
 */
struct Subject {
    int id; ///< Unique subject identifier.
    std::string name; ///< Human-readable subject name.
    std::string code; ///< Short code (e.g., "CS101").
    SubjectType type; ///< Theory / Practical / Workshop.
    int hoursPerWeek; ///< Number of one-slot sessions per week.

    /// Room type a session of this subject must be held in.
    RoomType requiredRoomType() const {
        switch (type) {
            case SubjectType::PRACTICAL: return RoomType::LAB;
            case SubjectType::WORKSHOP:  return RoomType::WORKSHOP;
            case SubjectType::THEORY:    break;
        }
        return RoomType::LECTURE_HALL;
    }

    /// Minimum number of faculty members that must staff one session.
    int requiredFacultyCount() const { return type == SubjectType::PRACTICAL ? 2 : 1; }
};

/**
 * @brief Faculty member with teaching qualifications and optional preferences.
 */
struct Faculty {
    int id; ///< Unique faculty identifier.
    std::string name; ///< Faculty member's name.
    std::vector<int> subjectIds; ///< Subject ids this faculty member is qualified to teach.
    /**
     * Preferred (day -> slots) map. When present, every taught slot outside
     * the map counts as a preference violation; a present but empty map
     * means no slot is preferred.
     */
    std::optional<DaySlotMap> preferredSlots;
};

/**
 * @brief A single teaching room.
 */
struct Room {
    int id; ///< Unique room identifier.
    std::string name; ///< Room name/label (e.g., "C301").
    int capacity; ///< Maximum number of students the room can hold.
    RoomType type; ///< Room category, matched against Subject::requiredRoomType().
};

/**
 * @brief A student batch that attends a fixed set of subjects.
 *
 * A batch is treated as an atomic unit in scheduling: all students in the
 * batch share the same timetable.
 */
struct Batch {
    int id; ///< Unique batch identifier.
    std::string name; ///< Human-readable batch name/label.
    int studentCount; ///< Number of students, checked against room capacity.
    std::vector<int> subjectIds; ///< Subject ids required by this batch.
    std::vector<int> allocatedRoomIds; ///< Rooms this batch is restricted to (empty = any room).
};

/**
 * @brief Hard-anchored placement that generated timetables must keep.
 *
 * Expands to one session for every (day, startSlot + k) with day in days,
 * startSlot in startSlots and 0 <= k < duration.
 */
struct PinnedAssignment {
    int id;
    std::string name;
    int subjectId;
    int facultyId;
    int roomId;
    int batchId;
    std::vector<int> days;
    std::vector<int> startSlots;
    int duration; ///< Length in slots.
};

/**
 * @brief Allowed teaching slots of one faculty member.
 *
 * Faculty without a record are unrestricted; a day missing from the map is
 * a day the faculty member cannot teach.
 */
struct FacultyAvailability {
    int facultyId;
    DaySlotMap allowedSlots;
};

/**
 * @brief Preferred faculty for a specific (batch, subject) pair.
 */
struct FacultyAllocation {
    int batchId;
    int subjectId;
    std::vector<int> facultyIds;
};

/**
 * @brief Penalty weights of the soft constraints (higher = stronger penalty).
 */
struct ConstraintWeights {
    double studentGap = 10.0;
    double facultyGap = 5.0;
    double facultyWorkload = 2.0;
    double facultyPreference = 3.0;
};

/**
 * @brief Working days and number of slots per day.
 *
 * Day values are week-day indices in [0, 7); the grid is sized up to the
 * largest working day index.
 */
struct TimetableGeometry {
    std::vector<int> workingDays{0, 1, 2, 3, 4};
    int slotsPerDay = 6;

    /// Number of day rows a grid needs to hold every working day.
    int dayCount() const {
        int count = 0;
        for (int d : workingDays) {
            if (d + 1 > count) count = d + 1;
        }
        return count;
    }
};

/**
 * @brief Complete problem instance describing the timetabling task.
 *
 * Immutable snapshot handed to solvers; nothing in the engine writes to it.
 */
struct ProblemInstance {
    std::vector<Subject> subjects; ///< All subjects referenced by batches.
    std::vector<Faculty> faculty; ///< All faculty members.
    std::vector<Room> rooms; ///< All rooms available for teaching.
    std::vector<Batch> batches; ///< Batches to schedule.
    std::vector<PinnedAssignment> pinnedAssignments; ///< Fixed placements.
    std::vector<FacultyAvailability> facultyAvailability; ///< Per-faculty slot restrictions.
    std::vector<FacultyAllocation> facultyAllocations; ///< Preferred staffing per (batch, subject).
    ConstraintWeights weights; ///< Soft-constraint weights used by the evaluator.
    TimetableGeometry geometry; ///< Working days and slots per day.
};

/**
 * @brief One rating left by a faculty member on an approved timetable.
 *
 * Used only as input for advisory weight tuning.
 */
struct TimetableFeedback {
    int facultyId;
    int rating; ///< 1..5
    std::string comment;
};

/// Human-readable label of a room type.
std::string toString(RoomType type);

/// Human-readable label of a subject type.
std::string toString(SubjectType type);
