#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "timetable.hpp"
#include <unordered_map>
#include <vector>


///////////////////////////
///       CONTEXT       ///
///////////////////////////
/**
 * @brief Number of sessions a batch needs for one subject.
 */
struct SessionRequirement {
    int batchIndex; ///< Position of the batch in ProblemInstance::batches.
    int batchId;
    int subjectId;
    int sessions; ///< Subject::hoursPerWeek.
};

/**
 * @brief Validated, indexed read-only view over a ProblemInstance.
 *
 * Resolves ids to entities in O(1), expands pinned assignments into concrete
 * placements and precomputes per-(batch, subject) requirements and faculty
 * candidate lists. The referenced instance must outlive the context; it is
 * never modified, so a context may be shared between worker threads.
 */
class ProblemContext {
public:
    /**
     * @brief Index and validate an instance.
     *
     * Throws std::invalid_argument with a descriptive message if the
     * geometry is invalid, ids are duplicated, or any entity refers to an
     * unknown batch, subject, faculty member or room.
     */
    explicit ProblemContext(const ProblemInstance& inst);

    const ProblemInstance& instance() const { return inst_; }
    const TimetableGeometry& geometry() const { return inst_.geometry; }

    /// 0-based index in inst.batches, or -1 if the id is unknown.
    int batchIndex(int batchId) const;

    /// 0-based index in inst.faculty, or -1 if the id is unknown.
    int facultyIndex(int facultyId) const;

    /// Entity lookups; return nullptr for unknown ids.
    const Batch* batch(int batchId) const;
    const Subject* subject(int subjectId) const;
    const Faculty* faculty(int facultyId) const;
    const Room* room(int roomId) const;

    /// Availability record of a faculty member, or nullptr if unrestricted.
    const FacultyAvailability* availabilityFor(int facultyId) const;

    /**
     * @brief Faculty ids eligible to teach a subject to a batch.
     *
     * Returns the (batch, subject) allocation when one exists and is
     * non-empty; otherwise every faculty member qualified for the subject,
     * in snapshot order.
     */
    const std::vector<int>& facultyCandidates(int batchId, int subjectId) const;

    /// All (batch, subject) requirements in batch order.
    const std::vector<SessionRequirement>& requirements() const { return requirements_; }

    /// Required weekly sessions of a subject for a batch (0 if not required).
    int requiredSessions(int batchIndex, int subjectId) const;

    /// Sum of all required sessions.
    int totalSessions() const { return totalSessions_; }

    /// Pinned assignments expanded to single-slot placements (ids unset).
    const std::vector<ClassAssignment>& pinnedPlacements() const { return pinnedPlacements_; }

    /// Empty grid with the dimensions of this instance.
    TimetableGrid emptyGrid() const;

    /**
     * @brief Check that a caller-supplied grid fits this instance.
     *
     * Verifies the grid shape, that every assignment sits in its own batch
     * row on a working day, and that it refers to known entities. Throws
     * std::invalid_argument otherwise.
     */
    void validateGrid(const TimetableGrid& grid) const;

    /// True if day is one of the configured working days.
    bool isWorkingDay(int day) const;

private:
    const ProblemInstance& inst_;

    std::unordered_map<int, int> batchIndex_;
    std::unordered_map<int, int> subjectIndex_;
    std::unordered_map<int, int> facultyIndex_;
    std::unordered_map<int, int> roomIndex_;
    std::unordered_map<int, int> availabilityIndex_;

    std::vector<SessionRequirement> requirements_;
    /// requiredSessions_[batchIndex][subjectId]
    std::vector<std::unordered_map<int, int>> requiredSessions_;
    int totalSessions_ = 0;

    /// candidates_[batchIndex][subjectId]
    std::vector<std::unordered_map<int, std::vector<int>>> candidates_;
    std::vector<ClassAssignment> pinnedPlacements_;

    void indexEntities();
    void validateReferences() const;
    void buildRequirements();
    void buildFacultyCandidates();
    void expandPinnedAssignments();
};
