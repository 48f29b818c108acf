///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "population.hpp"
#include "constraints.hpp"
#include "worker_pool.hpp"
#include <algorithm>
#include <deque>
#include <spdlog/spdlog.h>
#include <utility>


///////////////////////////
///     POPULATION      ///
///////////////////////////
PopulationInitializer::PopulationInitializer(const ProblemContext& ctx, int numThreads)
        : ctx_(ctx), numThreads_(numThreads) {}

void PopulationInitializer::applyPins(TimetableGrid& grid) const {
    for (const ClassAssignment& pin : ctx_.pinnedPlacements()) {
        int b = ctx_.batchIndex(pin.batchId);
        ClassAssignment placed = pin;
        placed.id = grid.nextAssignmentId();
        if (grid.occupied(b, pin.day, pin.slot)) {
            spdlog::debug("pinned session for batch {} replaces cell (day {}, slot {})",
                         pin.batchId, pin.day, pin.slot);
        }
        grid.put(b, placed);
    }
}

TimetableGrid PopulationInitializer::pinnedGrid() const {
    TimetableGrid grid = ctx_.emptyGrid();
    applyPins(grid);
    return grid;
}

/**
 * @brief Randomized constructive placement of one individual.
 *
 * Each queued session gets one random draw per attempt and is requeued on
 * failure; the total number of attempts is bounded by
 * sessions * slotsPerDay * workingDays.
 */
TimetableGrid PopulationInitializer::buildIndividual(std::mt19937& rng) const {
    TimetableGrid grid = pinnedGrid();

    // Required tally minus what the pins already cover.
    struct Pending { int batchId; int subjectId; };
    std::deque<Pending> queue;
    for (const SessionRequirement& req : ctx_.requirements()) {
        int pinned = 0;
        for (const ClassAssignment& pin : ctx_.pinnedPlacements()) {
            if (pin.batchId == req.batchId && pin.subjectId == req.subjectId) ++pinned;
        }
        for (int h = pinned; h < req.sessions; ++h) queue.push_back({req.batchId, req.subjectId});
    }
    std::shuffle(queue.begin(), queue.end(), rng);

    const long long budget = (long long)queue.size() * ctx_.geometry().slotsPerDay *
                             (long long)ctx_.geometry().workingDays.size();
    long long attempts = 0;
    while (!queue.empty() && attempts < budget) {
        Pending next = queue.front();
        queue.pop_front();
        ++attempts;

        auto placement = drawPlacement(ctx_, grid, next.batchId, next.subjectId, rng);
        if (!placement) {
            queue.push_back(next);
            continue;
        }
        placement->id = grid.nextAssignmentId();
        grid.put(ctx_.batchIndex(next.batchId), *placement);
    }

    if (!queue.empty()) {
        spdlog::debug("initializer left {} session(s) unplaced after {} attempts", queue.size(), attempts);
    }
    return grid;
}

std::vector<TimetableGrid> PopulationInitializer::initialize(int size, unsigned seed,
                                                             const TimetableGrid* baseline) const {
    std::vector<TimetableGrid> population(std::max(size, 0));
    if (population.empty()) return population;

    // Draw every stream seed on the calling thread.
    std::mt19937 master(seed);
    std::vector<unsigned> seeds(population.size());
    for (auto& s : seeds) s = master();

    int first = 0;
    if (baseline) {
        population[0] = *baseline;
        applyPins(population[0]);
        first = 1;
    }

    parallelFor((int)population.size() - first, numThreads_, [&](int i) {
        std::mt19937 rng(seeds[first + i]);
        population[first + i] = buildIndividual(rng);
    });
    return population;
}
