#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "advisory.hpp"
#include "fitness.hpp"
#include "operators.hpp"
#include "problem_context.hpp"
#include "repair.hpp"
#include "solver_base.hpp"
#include "strategy.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <random>
#include <utility>
#include <vector>


///////////////////////////
///       CONFIG        ///
///////////////////////////
/**
 * @brief Tunables of the genetic hyper-heuristic.
 */
struct OptimizerConfig {
    int populationSize = 20;
    int targetGenerations = 25;          ///< Budget split across the phases.
    int elitismCount = 2;                ///< Best individuals carried over unchanged.
    int tournamentSize = 5;
    int stagnationLimitExit = 8;         ///< Unchanged-best streak that ends a phase.
    int stagnationLimitIntervention = 5; ///< Unchanged-best streak that triggers advisory help.
    double nearPerfectThreshold = 990.0; ///< Best score that ends the run.
    double mutationRate = 0.1;           ///< Probability that swap/move mutation changes anything.
    AnnealingSchedule annealing;
    std::chrono::milliseconds advisoryTimeout{15000};
    int numThreads = 1;                  ///< Worker threads; <= 0 uses the hardware concurrency.
    unsigned seed = 42;

    /// Throw std::invalid_argument if any value is out of range.
    void validate() const;
};

/**
 * @brief Best score of one generation, for progress reports and tests.
 */
struct GenerationRecord {
    int phase;
    int generation; ///< 0-based within the phase.
    double bestScore;
};

/**
 * @brief What happened during the last solve() call.
 */
struct RunReport {
    std::vector<Phase> phases;
    ConstraintWeights weights;
    std::vector<GenerationRecord> history;
    int interventionsApplied = 0;
    bool reachedThreshold = false;
    bool cancelled = false;
};


///////////////////////////
///       SOLVERS       ///
///////////////////////////
/**
 * @brief Multi-phase genetic hyper-heuristic timetable optimizer.
 *
 * Each phase runs a generational loop with elitism, tournament selection,
 * one phase-weighted low-level heuristic per offspring and a repair pass.
 * Offspring and fitness evaluations run on a bounded worker pool, while
 * every random decision is drawn on the calling thread, so a given seed
 * produces the same result for any thread count.
 */
class Optimizer : public ISolver {
public:
    /// Builds the population evaluator used for a run.
    using EvaluatorFactory = std::function<std::unique_ptr<PopulationEvaluator>(const FitnessEvaluator&)>;

    /**
     * @param config  Tunables; validated on every solve().
     * @param advisor Optional advisory service (nullptr: built-in defaults only).
     */
    explicit Optimizer(OptimizerConfig config, std::shared_ptr<AdvisoryService> advisor = nullptr);

    /**
     * @brief Replace the CPU evaluator (e.g. with an OpenCL one).
     */
    void setEvaluatorFactory(EvaluatorFactory factory) { evaluatorFactory_ = std::move(factory); }

    std::vector<Candidate> solve(const ProblemInstance& inst, const SolveRequest& request) override;

    /// Report of the most recent solve().
    const RunReport& lastReport() const { return report_; }

    const OptimizerConfig& config() const { return config_; }

private:
    OptimizerConfig config_;
    std::shared_ptr<AdvisoryService> advisor_;
    EvaluatorFactory evaluatorFactory_;
    RunReport report_;

    /// Random choices for one offspring, drawn on the coordinating thread.
    struct OffspringPlan {
        int parentA;
        int parentB; ///< -1 unless the heuristic is crossover.
        Heuristic heuristic;
        unsigned seed;
    };

    /// Build one offspring from the current population according to its plan.
    TimetableGrid breed(const OffspringPlan& plan, const std::vector<Candidate>& population,
                        const ProblemContext& ctx, const FitnessEvaluator& fitness,
                        const RepairEngine& repair) const;

    /**
     * @brief Ask the advisor for a swap on the best individual.
     *
     * On success a repaired copy of the best timetable replaces the weakest
     * member (population must be sorted). Returns true if anything changed.
     */
    bool intervene(GuardedAdvisor& guard, const ProblemContext& ctx, const FitnessEvaluator& fitness,
                   const RepairEngine& repair, std::vector<Candidate>& population, std::mt19937& rng) const;
};

/**
 * @brief Sort a population by descending score (stable).
 */
void sortByScore(std::vector<Candidate>& population);

/**
 * @brief Up to count candidates with pairwise-distinct timetables, in the given order.
 */
std::vector<Candidate> selectDistinct(const std::vector<Candidate>& sorted, int count);
