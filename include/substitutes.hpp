#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "problem_context.hpp"
#include "timetable.hpp"
#include <string>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief A faculty member who could cover a session, with ranking inputs.
 */
struct SubstituteCandidate {
    int facultyId;
    std::string name;
    std::vector<int> suitableSubjectIds; ///< Known subjects the candidate is qualified for.
    int workload;          ///< Sessions already taught this week.
    int gapCount;          ///< Idle slots inside the candidate's teaching days.
    bool canTeachSubject;  ///< Qualified for the session's own subject.
    bool allocatedToBatch; ///< Named in a faculty allocation of the session's batch.
};

/**
 * @brief A candidate with a 0..100 suitability score and short reasons.
 */
struct RankedSubstitute {
    SubstituteCandidate candidate;
    int score;
    std::vector<std::string> reasons;
};

/**
 * @brief Everything a ranking needs to know about one uncovered session.
 */
struct SubstituteRequest {
    int assignmentId;
    int subjectId;
    int batchId;
    std::string subjectName;
    std::string batchName;
    std::vector<SubstituteCandidate> candidates;
};


///////////////////////////
///     SUBSTITUTES     ///
///////////////////////////
/**
 * @brief Collect the faculty who could take over a placed session.
 *
 * Keeps every faculty member not already staffing the session who is free
 * at its (day, slot), respecting availability records, and who is qualified
 * for at least one known subject. Throws std::invalid_argument if the
 * assignment id is not in the timetable.
 */
SubstituteRequest buildSubstituteRequest(const ProblemContext& ctx, const TimetableGrid& grid, int assignmentId);

/**
 * @brief Weighted-priority ranking, best first.
 *
 * Qualification for the subject counts 40 points, an existing allocation
 * to the batch 25, a light workload up to 20 and a compact week up to 15.
 * Ties keep the candidate order.
 */
std::vector<RankedSubstitute> rankByPriorities(const SubstituteRequest& request);

/// Unranked list (score 50, "Availability confirmed.") in candidate order.
std::vector<RankedSubstitute> unrankedSubstitutes(const std::vector<SubstituteCandidate>& candidates);
