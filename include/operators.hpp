#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "fitness.hpp"
#include "problem_context.hpp"
#include "timetable.hpp"
#include <random>
#include <string>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Low-level heuristics the hyper-heuristic chooses between.
 */
enum class Heuristic { SWAP_MUTATE, MOVE_MUTATE, SIMULATED_ANNEALING, DAY_WISE_CROSSOVER };

/**
 * @brief Relative weights of the heuristics within one phase.
 */
struct HeuristicWeights {
    double crossover = 0.0;
    double move = 0.0;
    double swap = 0.0;
    double annealing = 0.0;
};

/**
 * @brief Cooling schedule of the simulated annealing operator.
 */
struct AnnealingSchedule {
    double initialTemperature = 80.0;
    double coolingRate = 0.98;
    double minTemperature = 0.1;
    int iterationsPerTemperature = 1;
};

/// Human-readable heuristic name.
std::string toString(Heuristic h);


///////////////////////////
///      OPERATORS      ///
///////////////////////////
/**
 * @brief Sample a heuristic according to the phase weights.
 *
 * Falls back to SWAP_MUTATE when every weight is zero.
 */
Heuristic sampleHeuristic(const HeuristicWeights& weights, std::mt19937& rng);

/**
 * @brief Tournament selection with replacement.
 *
 * Samples k members and returns the index of the highest-scoring one
 * (ties keep the first drawn). The population must not be empty.
 */
int tournamentSelect(const std::vector<Candidate>& population, int k, std::mt19937& rng);

/**
 * @brief Day-wise crossover of two parents.
 *
 * For every batch the child takes all days before a random cut day from
 * parentA and the remaining days from parentB. Feasibility is not checked.
 * Assignment ids are renumbered in the child.
 */
TimetableGrid dayWiseCrossover(const TimetableGrid& parentA, const TimetableGrid& parentB, std::mt19937& rng);

/**
 * @brief Exchange the (day, slot) of two assignments identified by id, in place.
 *
 * Refuses (returns false) when either id is missing or pinned, when both
 * ids are the same, or when a cross-batch swap would land on an occupied
 * cell.
 */
bool swapAssignments(TimetableGrid& grid, int idA, int idB);

/**
 * @brief Exchange the (day, slot) of two random non-pinned assignments in place.
 *
 * Same-batch pairs trade cells. A cross-batch swap is only made when both
 * target cells are empty in the respective batch rows.
 *
 * @return true if the grid was changed.
 */
bool swapRandomPair(TimetableGrid& grid, std::mt19937& rng);

/**
 * @brief With probability rate, swap two random non-pinned assignments.
 */
TimetableGrid swapMutate(const TimetableGrid& individual, double rate, std::mt19937& rng);

/**
 * @brief With probability rate, relocate one random non-pinned assignment.
 *
 * Tries up to 50 random (day, slot) draws where the batch and every
 * assigned faculty member are free and some suitable room is free (the room
 * may change). Leaves the assignment where it was if no draw succeeds.
 */
TimetableGrid moveMutate(const ProblemContext& ctx, const TimetableGrid& individual, double rate, std::mt19937& rng);

/**
 * @brief Simulated annealing over random pairwise swaps.
 *
 * Improvements are always accepted, deteriorations with probability
 * exp(delta / temperature). Returns the best timetable visited.
 */
TimetableGrid simulatedAnnealing(const FitnessEvaluator& fitness, const TimetableGrid& individual,
                                 const AnnealingSchedule& schedule, std::mt19937& rng);
