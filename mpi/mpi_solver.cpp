///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_solver.hpp"
#include "fitness.hpp"
#include "problem_context.hpp"
#include <mpi.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>


///////////////////////////
///       SOLVERS       ///
///////////////////////////
MPIIslandSolver::MPIIslandSolver(OptimizerConfig config, std::shared_ptr<AdvisoryService> advisor)
        : config_(std::move(config)),
          advisor_(std::move(advisor)) {}

std::vector<int> MPIIslandSolver::serializeCandidates(const std::vector<Candidate>& candidates) {
    std::vector<int> buffer;
    buffer.push_back((int)candidates.size());
    for (const Candidate& c : candidates) {
        std::vector<int> encoded = c.timetable.encode();
        buffer.push_back((int)encoded.size());
        buffer.insert(buffer.end(), encoded.begin(), encoded.end());
    }
    return buffer;
}

/**
 * @brief Decode a sequence of per-rank buffers laid end to end.
 *
 * Throws std::invalid_argument if a length prefix runs past the buffer.
 */
std::vector<Candidate> MPIIslandSolver::deserializeCandidates(const std::vector<int>& buffer) {
    std::vector<Candidate> out;
    size_t pos = 0;
    while (pos < buffer.size()) {
        int count = buffer[pos++];
        for (int i = 0; i < count; ++i) {
            if (pos >= buffer.size()) throw std::invalid_argument("candidate buffer truncated");
            int len = buffer[pos++];
            if (len < 0 || pos + (size_t)len > buffer.size())
                throw std::invalid_argument("candidate buffer truncated");
            std::vector<int> encoded(buffer.begin() + pos, buffer.begin() + pos + len);
            pos += len;
            out.push_back({TimetableGrid::decode(encoded), TimetableMetrics()});
        }
    }
    return out;
}

/**
 * @brief Multi-start across ranks, candidates gathered on rank 0.
 *
 * Every rank optimizes locally; the best score is combined with
 * MPI_Allreduce, then rank 0 collects all serialized candidates with
 * MPI_Gather (lengths) and MPI_Gatherv (payloads).
 */
std::vector<Candidate> MPIIslandSolver::solve(const ProblemInstance& inst, const SolveRequest& request) {
    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    // Independent multi-start: every rank gets its own seed.
    OptimizerConfig local = config_;
    local.seed = config_.seed + (unsigned)rank;
    Optimizer optimizer(local, advisor_);
    std::vector<Candidate> localCandidates = optimizer.solve(inst, request);

    double localBest = localCandidates.empty() ? 0.0 : localCandidates.front().metrics.score;
    MPI_Allreduce(&localBest, &globalBestScore_, 1, MPI_DOUBLE, MPI_MAX, MPI_COMM_WORLD);
    spdlog::info("rank {} best score {} (global best {})", rank, localBest, globalBestScore_);

    // Gather payload lengths, then the payloads themselves, on rank 0.
    std::vector<int> sendBuf = serializeCandidates(localCandidates);
    int sendLen = (int)sendBuf.size();
    std::vector<int> lengths(rank == 0 ? size : 0);
    MPI_Gather(&sendLen, 1, MPI_INT, lengths.data(), 1, MPI_INT, 0, MPI_COMM_WORLD);

    std::vector<int> displs;
    std::vector<int> recvBuf;
    if (rank == 0) {
        displs.resize(size);
        int total = 0;
        for (int r = 0; r < size; ++r) {
            displs[r] = total;
            total += lengths[r];
        }
        recvBuf.resize(total);
    }
    MPI_Gatherv(sendBuf.data(), sendLen, MPI_INT,
                recvBuf.data(), lengths.data(), displs.data(), MPI_INT, 0, MPI_COMM_WORLD);

    if (rank != 0) return {};

    // Rescore everything with the weights rank 0 actually used.
    ProblemContext ctx(inst);
    FitnessEvaluator fitness(ctx, optimizer.lastReport().weights);
    std::vector<Candidate> pooled = deserializeCandidates(recvBuf);
    CpuPopulationEvaluator evaluator(fitness, local.numThreads);
    evaluator.evaluate(pooled);
    sortByScore(pooled);
    spdlog::info("gathered {} candidates from {} ranks", pooled.size(), size);
    return selectDistinct(pooled, request.candidateCount);
}
