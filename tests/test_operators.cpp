///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "constraints.hpp"
#include "fitness.hpp"
#include "operators.hpp"
#include "problem_context.hpp"
#include "test_fixtures.hpp"
#include <gtest/gtest.h>
#include <random>
#include <set>


///////////////////////////
///       HELPERS       ///
///////////////////////////
namespace {

/// Three B10 sessions (one a pinned lab) and two B20 sessions on Monday and Tuesday.
TimetableGrid makeBusyGrid(const ProblemContext& ctx) {
    TimetableGrid grid = ctx.emptyGrid();
    grid.put(0, makeAssignment(1, 1, {1}, 1, 10, 0, 0));
    grid.put(0, makeAssignment(2, 1, {1}, 1, 10, 0, 3));
    grid.put(0, makeAssignment(3, 3, {2, 3}, 3, 10, 1, 1, true));
    grid.put(1, makeAssignment(4, 1, {1}, 2, 20, 1, 0));
    grid.put(1, makeAssignment(5, 1, {1}, 2, 20, 1, 2));
    return grid;
}

} // namespace


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(HeuristicSamplingTest, AllZeroWeightsFallBackToSwap) {
    std::mt19937 rng(1);
    EXPECT_EQ(sampleHeuristic(HeuristicWeights(), rng), Heuristic::SWAP_MUTATE);
}

TEST(HeuristicSamplingTest, SingleWeightAlwaysWins) {
    std::mt19937 rng(1);
    HeuristicWeights onlyCrossover{1.0, 0.0, 0.0, 0.0};
    HeuristicWeights onlyAnnealing{0.0, 0.0, 0.0, 2.0};
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(sampleHeuristic(onlyCrossover, rng), Heuristic::DAY_WISE_CROSSOVER);
        EXPECT_EQ(sampleHeuristic(onlyAnnealing, rng), Heuristic::SIMULATED_ANNEALING);
    }
    EXPECT_EQ(toString(Heuristic::MOVE_MUTATE), "move");
}

TEST(TournamentSelectTest, LargeTournamentFindsTheBest) {
    std::vector<Candidate> population(3);
    population[0].metrics.score = 100.0;
    population[1].metrics.score = 500.0;
    population[2].metrics.score = 300.0;
    std::mt19937 rng(4);

    EXPECT_EQ(tournamentSelect(population, 60, rng), 1);
    int single = tournamentSelect(population, 1, rng);
    EXPECT_GE(single, 0);
    EXPECT_LT(single, 3);
}

TEST(SwapAssignmentsTest, SameBatchSessionsTradeCells) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    TimetableGrid grid = makeBusyGrid(ctx);

    ASSERT_TRUE(swapAssignments(grid, 1, 2));
    EXPECT_EQ(grid.at(0, 0, 0)->id, 2);
    EXPECT_EQ(grid.at(0, 0, 3)->id, 1);
    EXPECT_EQ(grid.at(0, 0, 3)->slot, 3);
    EXPECT_EQ(grid.size(), 5);
}

TEST(SwapAssignmentsTest, RefusesPinnedMissingAndIdenticalIds) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    TimetableGrid grid = makeBusyGrid(ctx);
    TimetableGrid before = grid;

    EXPECT_FALSE(swapAssignments(grid, 1, 3));
    EXPECT_FALSE(swapAssignments(grid, 1, 42));
    EXPECT_FALSE(swapAssignments(grid, 2, 2));
    EXPECT_TRUE(grid.sameContent(before));
}

TEST(SwapAssignmentsTest, CrossBatchNeedsFreeTargetCells) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    TimetableGrid grid = makeBusyGrid(ctx);

    // B10 is free at (1, 0) and B20 is free at (0, 0).
    ASSERT_TRUE(swapAssignments(grid, 1, 4));
    ASSERT_NE(grid.at(0, 1, 0), nullptr);
    EXPECT_EQ(grid.at(0, 1, 0)->id, 1);
    EXPECT_EQ(grid.at(0, 1, 0)->batchId, 10);
    ASSERT_NE(grid.at(1, 0, 0), nullptr);
    EXPECT_EQ(grid.at(1, 0, 0)->id, 4);

    // Session 2 would land on B20's (0, 3), which is now taken.
    grid.put(1, makeAssignment(6, 1, {1}, 2, 20, 0, 3));
    EXPECT_FALSE(swapAssignments(grid, 2, 5));
}

TEST(DayWiseCrossoverTest, ChildTakesWholeDaysFromOneParentThenTheOther) {
    ProblemInstance inst = makeTinyInstance();
    ProblemContext ctx(inst);
    TimetableGrid a = ctx.emptyGrid();
    TimetableGrid b = ctx.emptyGrid();
    for (int d = 0; d < 5; ++d) {
        a.put(0, makeAssignment(d + 1, 1, {1}, 1, 1, d, 0));
        b.put(0, makeAssignment(d + 1, 2, {2}, 1, 1, d, 3));
    }

    std::mt19937 rng(21);
    for (int trial = 0; trial < 10; ++trial) {
        TimetableGrid child = dayWiseCrossover(a, b, rng);
        bool fromB = false;
        for (int d = 0; d < 5; ++d) {
            bool dayFromA = child.occupied(0, d, 0) && !child.occupied(0, d, 3);
            bool dayFromB = child.occupied(0, d, 3) && !child.occupied(0, d, 0);
            ASSERT_TRUE(dayFromA || dayFromB);
            if (dayFromB) fromB = true;
            EXPECT_FALSE(fromB && dayFromA);
        }
        EXPECT_TRUE(fromB);  // the cut day itself always comes from parent B

        std::set<int> ids;
        for (const ClassAssignment& x : child.assignments()) ids.insert(x.id);
        EXPECT_EQ((int)ids.size(), child.size());
    }
}

TEST(MutationTest, ZeroRateLeavesIndividualUnchanged) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    TimetableGrid grid = makeBusyGrid(ctx);
    std::mt19937 rng(2);

    EXPECT_TRUE(swapMutate(grid, 0.0, rng).sameContent(grid));
    EXPECT_TRUE(moveMutate(ctx, grid, 0.0, rng).sameContent(grid));
}

TEST(MutationTest, MutationsNeverTouchPinnedSessions) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    TimetableGrid grid = makeBusyGrid(ctx);
    std::mt19937 rng(6);

    for (int i = 0; i < 50; ++i) {
        grid = swapMutate(grid, 1.0, rng);
        grid = moveMutate(ctx, grid, 1.0, rng);
        const ClassAssignment* pin = grid.at(0, 1, 1);
        ASSERT_NE(pin, nullptr);
        EXPECT_EQ(pin->id, 3);
        EXPECT_EQ(grid.size(), 5);
    }
}

TEST(MutationTest, MoveKeepsTimetableConflictFree) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    TimetableGrid grid = makeBusyGrid(ctx);
    ASSERT_TRUE(detectConflicts(ctx, grid).empty());
    std::mt19937 rng(10);

    for (int i = 0; i < 30; ++i) {
        grid = moveMutate(ctx, grid, 1.0, rng);
        EXPECT_TRUE(detectConflicts(ctx, grid).empty());
        for (const ClassAssignment& a : grid.assignments()) {
            if (a.subjectId == 1) EXPECT_EQ(a.facultyIds, (std::vector<int>{1}));
        }
    }
}

TEST(SimulatedAnnealingTest, NeverReturnsSomethingWorseThanItsInput) {
    ProblemInstance inst = makeSharedInstance();
    ProblemContext ctx(inst);
    FitnessEvaluator fitness(ctx, inst.weights);
    TimetableGrid grid = makeBusyGrid(ctx);
    std::mt19937 rng(12);

    TimetableGrid result = simulatedAnnealing(fitness, grid, AnnealingSchedule(), rng);
    EXPECT_GE(fitness.score(result), fitness.score(grid));
    EXPECT_EQ(result.size(), grid.size());
    ASSERT_NE(result.at(0, 1, 1), nullptr);
    EXPECT_TRUE(result.at(0, 1, 1)->pinned);
}
