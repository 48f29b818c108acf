#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "problem_context.hpp"
#include "timetable.hpp"
#include <vector>


///////////////////////////
///       FITNESS       ///
///////////////////////////
/// Best possible score; every soft-constraint penalty is subtracted from it.
constexpr double kMaxScore = 1000.0;

/**
 * @brief Idle slots between the first and last occupied slot of one day.
 *
 * @param occupied Occupancy flags of a single day, indexed by slot.
 */
int countGaps(const std::vector<bool>& occupied);

/**
 * @brief Population standard deviation of per-faculty weekly loads.
 *
 * Returns 0 when fewer than two loads are given.
 */
double workloadStdDev(const std::vector<int>& loads);

/**
 * @brief Combine metric counts into a score in [0, 1000].
 *
 * score = max(0, 1000 - studentGaps*w1 - facultyGaps*w2 - stdDev*w3 - violations*w4)
 */
double combineScore(const ConstraintWeights& weights, int studentGaps, int facultyGaps,
                    double facultyWorkloadStdDev, int preferenceViolations);

/**
 * @brief Scores timetables against the soft constraints of one instance.
 *
 * Stateless apart from the context and the weights, so one evaluator may be
 * shared by any number of threads.
 */
class FitnessEvaluator {
public:
    FitnessEvaluator(const ProblemContext& ctx, const ConstraintWeights& weights);

    /**
     * @brief Compute the score and full metric breakdown of a timetable.
     */
    TimetableMetrics evaluate(const TimetableGrid& grid) const;

    /// Score only; skips conflict detection and the unplaced count.
    double score(const TimetableGrid& grid) const;

    /// Sum over all (batch, subject) requirements of the missing sessions.
    int countUnplaced(const TimetableGrid& grid) const;

    /// Number of hard conflicts reported by detectConflicts().
    int countHardConflicts(const TimetableGrid& grid) const;

    /// True if a faculty member's preferences exclude teaching at (day, slot).
    bool violatesPreference(int facultyId, int day, int slot) const;

    const ConstraintWeights& weights() const { return weights_; }
    const ProblemContext& context() const { return ctx_; }

private:
    const ProblemContext& ctx_;
    ConstraintWeights weights_;

    /// Gaps, workload spread, preference violations and score.
    TimetableMetrics softMetrics(const TimetableGrid& grid) const;
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Rescoring of a whole population in one call.
 *
 * Implementations write fresh metrics into every candidate and leave the
 * timetables untouched.
 */
class PopulationEvaluator {
public:
    virtual ~PopulationEvaluator() = default;

    /// Overwrite the metrics of every candidate in the population.
    virtual void evaluate(std::vector<Candidate>& population) = 0;
};

/**
 * @brief Scores individuals concurrently on the worker pool.
 */
class CpuPopulationEvaluator : public PopulationEvaluator {
public:
    CpuPopulationEvaluator(const FitnessEvaluator& fitness, int numThreads);

    void evaluate(std::vector<Candidate>& population) override;

private:
    const FitnessEvaluator& fitness_;
    int numThreads_;
};
