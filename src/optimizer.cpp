///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "optimizer.hpp"
#include "population.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>


///////////////////////////
///       CONFIG        ///
///////////////////////////
void OptimizerConfig::validate() const {
    auto fail = [](const std::string& what) {
        throw std::invalid_argument("invalid optimizer configuration: " + what);
    };
    if (populationSize < 2) fail("populationSize must be at least 2");
    if (targetGenerations < 1) fail("targetGenerations must be positive");
    if (elitismCount < 0 || elitismCount >= populationSize) fail("elitismCount must be in [0, populationSize)");
    if (tournamentSize < 1) fail("tournamentSize must be positive");
    if (stagnationLimitExit < 1) fail("stagnationLimitExit must be positive");
    if (stagnationLimitIntervention < 1) fail("stagnationLimitIntervention must be positive");
    if (!(mutationRate >= 0.0 && mutationRate <= 1.0)) fail("mutationRate must be in [0, 1]");
    if (!(annealing.initialTemperature > 0.0)) fail("annealing initial temperature must be positive");
    if (!(annealing.minTemperature > 0.0)) fail("annealing minimum temperature must be positive");
    if (!(annealing.coolingRate > 0.0 && annealing.coolingRate < 1.0)) fail("annealing cooling rate must be in (0, 1)");
    if (annealing.iterationsPerTemperature < 1) fail("annealing iterations per temperature must be positive");
    if (advisoryTimeout.count() < 0) fail("advisoryTimeout must not be negative");
}


///////////////////////////
///       HELPERS       ///
///////////////////////////
void sortByScore(std::vector<Candidate>& population) {
    std::stable_sort(population.begin(), population.end(), [](const Candidate& a, const Candidate& b) {
        return a.metrics.score > b.metrics.score;
    });
}

std::vector<Candidate> selectDistinct(const std::vector<Candidate>& sorted, int count) {
    std::vector<Candidate> out;
    for (const Candidate& c : sorted) {
        if ((int)out.size() >= count) break;
        bool duplicate = std::any_of(out.begin(), out.end(), [&](const Candidate& kept) {
            return kept.timetable.sameContent(c.timetable);
        });
        if (!duplicate) out.push_back(c);
    }
    return out;
}


///////////////////////////
///       SOLVERS       ///
///////////////////////////
Optimizer::Optimizer(OptimizerConfig config, std::shared_ptr<AdvisoryService> advisor)
        : config_(std::move(config)),
          advisor_(std::move(advisor)) {}

/**
 * @brief Apply one low-level heuristic and repair the result.
 *
 * Runs on a worker thread; only reads the population and the shared
 * read-only context.
 */
TimetableGrid Optimizer::breed(const OffspringPlan& plan, const std::vector<Candidate>& population,
                               const ProblemContext& ctx, const FitnessEvaluator& fitness,
                               const RepairEngine& repair) const {
    std::mt19937 rng(plan.seed);
    const TimetableGrid& parent = population[plan.parentA].timetable;

    TimetableGrid child;
    switch (plan.heuristic) {
        case Heuristic::DAY_WISE_CROSSOVER:
            child = dayWiseCrossover(parent, population[plan.parentB].timetable, rng);
            break;
        case Heuristic::SWAP_MUTATE:
            child = swapMutate(parent, config_.mutationRate, rng);
            break;
        case Heuristic::MOVE_MUTATE:
            child = moveMutate(ctx, parent, config_.mutationRate, rng);
            break;
        case Heuristic::SIMULATED_ANNEALING:
            child = simulatedAnnealing(fitness, parent, config_.annealing, rng);
            break;
    }
    repair.repair(child, rng);
    return child;
}

bool Optimizer::intervene(GuardedAdvisor& guard, const ProblemContext& ctx, const FitnessEvaluator& fitness,
                          const RepairEngine& repair, std::vector<Candidate>& population, std::mt19937& rng) const {
    auto suggestion = guard.intervention(describeTimetable(ctx, population.front().timetable));
    if (!suggestion) return false;

    TimetableGrid modified = population.front().timetable;
    if (!swapAssignments(modified, suggestion->assignmentIdA, suggestion->assignmentIdB)) {
        spdlog::warn("advisory intervention named sessions {} and {} that cannot be swapped; ignoring it",
                     suggestion->assignmentIdA, suggestion->assignmentIdB);
        return false;
    }
    std::mt19937 local(rng());
    repair.repair(modified, local);

    Candidate& weakest = population.back();
    weakest.metrics = fitness.evaluate(modified);
    weakest.timetable = std::move(modified);
    return true;
}

/**
 * @brief Run the full multi-phase search.
 *
 * Steps:
 *  1. Validate configuration, instance and baseline.
 *  2. Resolve weights (advisory tuning) and the phase plan.
 *  3. Build the initial population.
 *  4. Per phase and generation: rescore, sort, check early exits and
 *     stagnation, then refill the population around the elite.
 *  5. Rescore and return the best distinct candidates.
 */
std::vector<Candidate> Optimizer::solve(const ProblemInstance& inst, const SolveRequest& request) {
    config_.validate();
    if (request.candidateCount < 1) {
        throw std::invalid_argument("candidateCount must be positive");
    }
    if (!validWeights(inst.weights)) {
        throw std::invalid_argument("constraint weights must be finite and non-negative");
    }
    ProblemContext ctx(inst);
    if (request.baseline) ctx.validateGrid(*request.baseline);

    report_ = RunReport();
    const int threads = resolveThreadCount(config_.numThreads);
    GuardedAdvisor guard(advisor_, config_.advisoryTimeout);

    report_.weights = guard.tunedWeights(inst.weights, request.feedback);
    FitnessEvaluator fitness(ctx, report_.weights);
    std::unique_ptr<PopulationEvaluator> evaluator;
    if (evaluatorFactory_) evaluator = evaluatorFactory_(fitness);
    if (!evaluator) evaluator = std::make_unique<CpuPopulationEvaluator>(fitness, threads);
    RepairEngine repair(ctx);

    report_.phases = guard.phaseStrategy(summarize(ctx, config_.targetGenerations));

    std::mt19937 rng(config_.seed);
    PopulationInitializer initializer(ctx, threads);
    std::vector<Candidate> population;
    for (TimetableGrid& grid : initializer.initialize(config_.populationSize, rng(),
                                                      request.baseline ? &*request.baseline : nullptr)) {
        population.push_back({std::move(grid), TimetableMetrics()});
    }

    auto cancelled = [&]() { return request.cancel && request.cancel->load(); };

    StagnationTracker stagnation(config_.stagnationLimitExit, config_.stagnationLimitIntervention);
    bool stop = false;
    for (int p = 0; p < (int)report_.phases.size() && !stop; ++p) {
        const Phase& phase = report_.phases[p];
        stagnation.startPhase();
        spdlog::info("phase {}/{} ({}): {} generations",
                     p + 1, report_.phases.size(), phase.name, phase.generations);

        for (int gen = 0; gen < phase.generations; ++gen) {
            if (cancelled()) {
                spdlog::info("cancellation requested; returning the best timetables so far");
                report_.cancelled = true;
                stop = true;
                break;
            }

            evaluator->evaluate(population);
            sortByScore(population);
            double best = population.front().metrics.score;
            report_.history.push_back({p, gen, best});
            spdlog::info("generation {}/{}, best score: {}", gen + 1, phase.generations, best);

            if (best >= config_.nearPerfectThreshold) {
                spdlog::info("near-perfect timetable found, stopping early");
                report_.reachedThreshold = true;
                stop = true;
                break;
            }

            stagnation.record(best);
            if (stagnation.shouldExit()) {
                spdlog::info("best score unchanged for {} generations, ending phase", stagnation.streak());
                break;
            }
            if (stagnation.shouldIntervene(gen)) {
                spdlog::info("stagnation detected, asking the advisory service for an intervention");
                stagnation.markAttempted();
                if (intervene(guard, ctx, fitness, repair, population, rng)) {
                    ++report_.interventionsApplied;
                    stagnation.resetStreak();
                }
            }

            // Every random decision of this generation is made here.
            const int elite = config_.elitismCount;
            std::vector<OffspringPlan> plans;
            for (int i = elite; i < config_.populationSize; ++i) {
                OffspringPlan plan;
                plan.parentA = tournamentSelect(population, config_.tournamentSize, rng);
                plan.heuristic = sampleHeuristic(phase.weights, rng);
                plan.parentB = plan.heuristic == Heuristic::DAY_WISE_CROSSOVER
                               ? tournamentSelect(population, config_.tournamentSize, rng)
                               : -1;
                plan.seed = rng();
                plans.push_back(plan);
            }

            std::vector<Candidate> next(config_.populationSize);
            for (int i = 0; i < elite; ++i) next[i] = population[i];
            parallelFor((int)plans.size(), threads, [&](int i) {
                next[elite + i].timetable = breed(plans[i], population, ctx, fitness, repair);
            });
            population = std::move(next);
        }
    }

    evaluator->evaluate(population);
    sortByScore(population);
    std::vector<Candidate> result = selectDistinct(population, request.candidateCount);
    if (!result.empty()) {
        const TimetableMetrics& top = result.front().metrics;
        spdlog::info("best score {} (hard conflicts: {}, unplaced sessions: {})",
                     top.score, top.hardConflicts, top.unplacedSessions);
    }
    return result;
}
