#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "optimizer.hpp"
#include "solver_base.hpp"
#include <memory>
#include <vector>


///////////////////////////
///       SOLVER        ///
///////////////////////////
/**
 * @brief MPI island model around the threaded optimizer.
 *
 * Each MPI rank runs its own Optimizer on the same instance with seed
 * config.seed + rank (multi-start), using config.numThreads worker threads
 * for intra-node parallelism. Rank 0 gathers every rank's candidates,
 * rescores them and returns the best distinct ones, while non-root ranks
 * return an empty list.
 */
class MPIIslandSolver : public ISolver {
public:
    /**
     * @brief Construct an MPI island solver.
     *
     * @param config  Optimizer configuration shared by every rank (seed is offset per rank).
     * @param advisor Optional advisory service used by every rank.
     */
    MPIIslandSolver(OptimizerConfig config, std::shared_ptr<AdvisoryService> advisor = nullptr);

    /**
     * @brief Solve the problem cooperatively across all MPI ranks.
     *
     * Must be called on every MPI rank with the same instance and request.
     *
     * @return Up to request.candidateCount candidates on rank 0, empty elsewhere.
     */
    std::vector<Candidate> solve(const ProblemInstance& inst, const SolveRequest& request) override;

    /// Best score over all ranks of the last solve() (valid on every rank).
    double globalBestScore() const { return globalBestScore_; }

    /**
     * @brief Serialize candidate timetables into a flat integer buffer.
     *
     * Layout: count, then per candidate its encoded length followed by
     * TimetableGrid::encode().
     */
    static std::vector<int> serializeCandidates(const std::vector<Candidate>& candidates);

    /**
     * @brief Rebuild timetables from concatenated serializeCandidates() buffers.
     *
     * Metrics are left default-initialized; the caller rescores.
     */
    static std::vector<Candidate> deserializeCandidates(const std::vector<int>& buffer);

private:
    OptimizerConfig config_;
    std::shared_ptr<AdvisoryService> advisor_;
    double globalBestScore_ = 0.0;
};
