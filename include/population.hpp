#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "problem_context.hpp"
#include "timetable.hpp"
#include <random>
#include <vector>


///////////////////////////
///     POPULATION      ///
///////////////////////////
/**
 * @brief Builds the random initial population of the genetic search.
 *
 * Every individual starts from the pinned placements, then receives the
 * remaining required sessions one weekly hour at a time at random feasible
 * (day, slot) positions. Sessions that cannot be placed within the attempt
 * budget are left out for the repair engine.
 */
class PopulationInitializer {
public:
    /**
     * @param ctx        Validated problem context.
     * @param numThreads Worker threads used to build individuals concurrently.
     */
    PopulationInitializer(const ProblemContext& ctx, int numThreads);

    /**
     * @brief Empty grid holding only the expanded pinned assignments.
     *
     * Pins that land on the same batch cell keep the later one.
     */
    TimetableGrid pinnedGrid() const;

    /**
     * @brief Overlay the pinned placements onto an existing timetable.
     *
     * Whatever occupied a pinned cell is replaced.
     */
    void applyPins(TimetableGrid& grid) const;

    /**
     * @brief Build one individual with its own random stream.
     */
    TimetableGrid buildIndividual(std::mt19937& rng) const;

    /**
     * @brief Build a whole population.
     *
     * Per-individual seeds are drawn from seed up front, so the result does
     * not depend on the number of threads.
     *
     * @param size     Number of individuals.
     * @param seed     Run seed.
     * @param baseline Optional timetable used verbatim (plus pins) as individual 0.
     */
    std::vector<TimetableGrid> initialize(int size, unsigned seed, const TimetableGrid* baseline = nullptr) const;

private:
    const ProblemContext& ctx_;
    int numThreads_;
};
