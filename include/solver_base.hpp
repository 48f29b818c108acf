#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "timetable.hpp"
#include <atomic>
#include <optional>
#include <vector>

///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Per-call options of a solve.
 */
struct SolveRequest {
    /// Maximum number of distinct timetables to return.
    int candidateCount = 3;

    /// Existing timetable to re-optimize; seeds individual 0 when present.
    std::optional<TimetableGrid> baseline;

    /// Faculty feedback used for advisory weight tuning.
    std::vector<TimetableFeedback> feedback;

    /// Caller-owned cancellation flag, polled between generations (may be null).
    const std::atomic<bool>* cancel = nullptr;
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for timetable solvers.
 *
 * Implementations may run on one thread, a worker pool, an OpenCL device
 * or several MPI ranks, but all expose the same solve() contract.
 */
class ISolver {
public:
    virtual ~ISolver() = default;

    /**
     * @brief Optimize the given problem instance.
     *
     * Returns up to request.candidateCount pairwise-distinct timetables in
     * descending score order. Throws std::invalid_argument if the instance
     * or the request is malformed.
     */
    virtual std::vector<Candidate> solve(const ProblemInstance& inst, const SolveRequest& request) = 0;
};
