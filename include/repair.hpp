#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "problem_context.hpp"
#include "timetable.hpp"
#include <random>


///////////////////////////
///       REPAIR        ///
///////////////////////////
/**
 * @brief Outcome of one repair pass.
 */
struct RepairReport {
    int conflictsRemoved = 0; ///< Sessions cleared because of a clash, bad staffing or an unusable room.
    int surplusRemoved = 0;   ///< Sessions cleared because the (batch, subject) quota was already full.
    int placed = 0;           ///< Missing sessions that were placed again.
    int unplaced = 0;         ///< Missing sessions still absent after the pass.
};

/**
 * @brief Greedy conflict removal followed by re-placement of missing sessions.
 *
 * Pinned sessions are kept as they are and claim their resources first.
 * Every other session is then checked, in (batch, day, slot) order, against
 * what has been kept so far; clashing, under-staffed and surplus sessions are
 * dropped. Finally each (batch, subject) shortfall is filled with up to 100
 * random placement attempts per missing session.
 */
class RepairEngine {
public:
    /// Default number of random (day, slot) draws per missing session.
    static constexpr int kDefaultAttempts = 100;

    explicit RepairEngine(const ProblemContext& ctx, int attemptsPerSession = kDefaultAttempts);

    /**
     * @brief Repair a timetable in place.
     *
     * Never throws on infeasible input; what cannot be fixed is reported.
     */
    RepairReport repair(TimetableGrid& grid, std::mt19937& rng) const;

private:
    const ProblemContext& ctx_;
    int attemptsPerSession_;

    /// True if a movable session can stay given the sessions already kept.
    bool canKeep(const ClassAssignment& a, const TimetableGrid& kept) const;
};
