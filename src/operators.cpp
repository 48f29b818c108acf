///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "operators.hpp"
#include "constraints.hpp"
#include <cmath>
#include <utility>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

/// Movable assignments with their batch row.
struct Movable {
    int batchIndex;
    ClassAssignment assignment;
};

std::vector<Movable> movableAssignments(const TimetableGrid& grid) {
    std::vector<Movable> out;
    for (int b = 0; b < grid.numBatches(); ++b) {
        for (int d = 0; d < grid.numDays(); ++d) {
            for (int s = 0; s < grid.slotsPerDay(); ++s) {
                const ClassAssignment* a = grid.at(b, d, s);
                if (a && !a->pinned) out.push_back({b, *a});
            }
        }
    }
    return out;
}

bool chance(double rate, std::mt19937& rng) {
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    return coin(rng) < rate;
}

} // namespace

std::string toString(Heuristic h) {
    switch (h) {
        case Heuristic::SWAP_MUTATE:         return "swap";
        case Heuristic::MOVE_MUTATE:         return "move";
        case Heuristic::SIMULATED_ANNEALING: return "annealing";
        case Heuristic::DAY_WISE_CROSSOVER:  return "crossover";
    }
    return "unknown";
}


///////////////////////////
///      OPERATORS      ///
///////////////////////////
Heuristic sampleHeuristic(const HeuristicWeights& weights, std::mt19937& rng) {
    // Order must match the Heuristic enumerators.
    std::vector<double> w{weights.swap, weights.move, weights.annealing, weights.crossover};
    double total = 0.0;
    for (double x : w) total += x;
    if (!(total > 0.0)) return Heuristic::SWAP_MUTATE;

    std::discrete_distribution<int> pick(w.begin(), w.end());
    return static_cast<Heuristic>(pick(rng));
}

int tournamentSelect(const std::vector<Candidate>& population, int k, std::mt19937& rng) {
    std::uniform_int_distribution<int> pick(0, (int)population.size() - 1);
    int best = pick(rng);
    for (int i = 1; i < k; ++i) {
        int challenger = pick(rng);
        if (population[challenger].metrics.score > population[best].metrics.score)
            best = challenger;
    }
    return best;
}

TimetableGrid dayWiseCrossover(const TimetableGrid& parentA, const TimetableGrid& parentB, std::mt19937& rng) {
    TimetableGrid child = parentA;
    if (parentA.numDays() == 0) return child;
    std::uniform_int_distribution<int> pickCut(0, parentA.numDays() - 1);
    int cut = pickCut(rng);
    for (int b = 0; b < child.numBatches(); ++b)
        child.copyDays(parentB, b, cut, child.numDays());
    // Ids from the two parents may collide.
    child.renumber();
    return child;
}

bool swapAssignments(TimetableGrid& grid, int idA, int idB) {
    if (idA == idB) return false;
    int bx, dx, sx, by, dy, sy;
    if (!grid.locate(idA, bx, dx, sx) || !grid.locate(idB, by, dy, sy)) return false;

    ClassAssignment a = *grid.at(bx, dx, sx);
    ClassAssignment b = *grid.at(by, dy, sy);
    if (a.pinned || b.pinned) return false;
    if (bx != by) {
        // Each session moves within its own batch row; the target cells must be empty.
        if (grid.occupied(bx, dy, sy) || grid.occupied(by, dx, sx)) return false;
    }

    grid.clear(bx, dx, sx);
    grid.clear(by, dy, sy);
    std::swap(a.day, b.day);
    std::swap(a.slot, b.slot);
    grid.put(bx, a);
    grid.put(by, b);
    return true;
}

bool swapRandomPair(TimetableGrid& grid, std::mt19937& rng) {
    std::vector<Movable> movable = movableAssignments(grid);
    if (movable.size() < 2) return false;

    std::uniform_int_distribution<int> pick(0, (int)movable.size() - 1);
    int idA = movable[pick(rng)].assignment.id;
    int idB = movable[pick(rng)].assignment.id;
    return swapAssignments(grid, idA, idB);
}

TimetableGrid swapMutate(const TimetableGrid& individual, double rate, std::mt19937& rng) {
    TimetableGrid child = individual;
    if (!chance(rate, rng)) return child;
    swapRandomPair(child, rng);
    return child;
}

TimetableGrid moveMutate(const ProblemContext& ctx, const TimetableGrid& individual, double rate, std::mt19937& rng) {
    TimetableGrid child = individual;
    if (!chance(rate, rng)) return child;

    std::vector<Movable> movable = movableAssignments(child);
    if (movable.empty()) return child;
    std::uniform_int_distribution<int> pick(0, (int)movable.size() - 1);
    Movable target = movable[pick(rng)];
    ClassAssignment moving = target.assignment;

    // Lift it out so it does not block its own new position.
    child.clear(target.batchIndex, moving.day, moving.slot);

    const auto& days = ctx.geometry().workingDays;
    std::uniform_int_distribution<int> pickDay(0, (int)days.size() - 1);
    std::uniform_int_distribution<int> pickSlot(0, ctx.geometry().slotsPerDay - 1);
    AvailabilityOracle oracle(ctx, child);

    for (int attempt = 0; attempt < 50; ++attempt) {
        int day = days[pickDay(rng)];
        int slot = pickSlot(rng);
        if (!oracle.batchFree(moving.batchId, day, slot)) continue;

        bool staffFree = true;
        for (int fid : moving.facultyIds) {
            if (!oracle.facultyFree(fid, day, slot)) {
                staffFree = false;
                break;
            }
        }
        if (!staffFree) continue;

        auto room = oracle.selectRoom(moving.batchId, moving.subjectId, day, slot, rng);
        if (!room) continue;

        moving.day = day;
        moving.slot = slot;
        moving.roomId = *room;
        child.put(target.batchIndex, moving);
        return child;
    }

    // No spot found: put it back untouched.
    child.put(target.batchIndex, target.assignment);
    return child;
}

/**
 * @brief Geometric-cooling annealing over pairwise swaps.
 *
 * A draw that cannot produce a swap (pinned-only grids, blocked cross-batch
 * cells) still consumes its iteration. Scoring uses the soft constraints
 * only; hard feasibility is left to the repair pass that follows.
 */
TimetableGrid simulatedAnnealing(const FitnessEvaluator& fitness, const TimetableGrid& individual,
                                 const AnnealingSchedule& schedule, std::mt19937& rng) {
    TimetableGrid current = individual;
    double currentScore = fitness.score(current);
    TimetableGrid best = current;
    double bestScore = currentScore;

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    double temperature = schedule.initialTemperature;
    while (temperature > schedule.minTemperature) {
        for (int i = 0; i < schedule.iterationsPerTemperature; ++i) {
            TimetableGrid next = current;
            if (!swapRandomPair(next, rng)) continue;

            double nextScore = fitness.score(next);
            double delta = nextScore - currentScore;
            if (delta > 0 || std::exp(delta / temperature) > coin(rng)) {
                current = std::move(next);
                currentScore = nextScore;
                if (currentScore > bestScore) {
                    best = current;
                    bestScore = currentScore;
                }
            }
        }
        temperature *= schedule.coolingRate;
    }
    return best;
}
