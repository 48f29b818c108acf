#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "operators.hpp"
#include <string>
#include <vector>


///////////////////////////
///      STRATEGY       ///
///////////////////////////
/**
 * @brief One phase of the search: a generation budget and a heuristic mix.
 */
struct Phase {
    std::string name;
    int generations = 0;
    HeuristicWeights weights;
};

/**
 * @brief Built-in three-phase plan used when no advisory plan is available.
 *
 * Exploration (crossover and move heavy), balanced, then exploitation
 * (swap and annealing heavy), splitting totalGenerations 40/40/20. Every
 * phase gets at least one generation.
 */
std::vector<Phase> defaultPhases(int totalGenerations);

/**
 * @brief Clean up a phase plan coming from outside the engine.
 *
 * Drops phases with a non-positive generation count or with a negative or
 * non-finite weight, drops phases whose weights sum to zero, and normalizes
 * the remaining distributions to sum to 1. May return an empty list.
 */
std::vector<Phase> sanitizePhases(const std::vector<Phase>& phases);

/**
 * @brief Tracks how long the best score has stayed unchanged.
 *
 * The streak runs across phase boundaries; only the one-intervention-per-phase
 * allowance is renewed by startPhase().
 */
class StagnationTracker {
public:
    /**
     * @param exitLimit         Streak length that ends the phase.
     * @param interventionLimit Streak length (and minimum generation index) that allows an intervention.
     */
    StagnationTracker(int exitLimit, int interventionLimit);

    /// Forget all history.
    void reset();

    /// Allow one more intervention; the streak carries over.
    void startPhase();

    /// Record the best score of the current generation.
    void record(double bestScore);

    /// Number of consecutive generations (current one included) with the same best score.
    int streak() const { return streak_; }

    /// True once the streak has reached the exit limit.
    bool shouldExit() const;

    /// True if an intervention may be attempted at this generation of the phase.
    bool shouldIntervene(int generationInPhase) const;

    /// Note that an intervention was attempted in this phase.
    void markAttempted();

    /// Restart the streak after an intervention changed the population.
    void resetStreak();

private:
    int exitLimit_;
    int interventionLimit_;
    int streak_ = 0;
    double lastBest_ = -1.0;
    bool intervened_ = false;
};
